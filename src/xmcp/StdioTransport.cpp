//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioTransport.cpp
// Purpose: stdio-based transport implementation
//==========================================================================================================

#include <unistd.h>
#include <fcntl.h>
#include <errno.h>
#include <poll.h>
#include <cstring>
#ifdef __linux__
#  include <sys/eventfd.h>
#endif

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <future>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "logging/Logger.h"
#include "env/EnvVars.h"
#include "xmcp/ContentFramer.h"
#include "xmcp/JSONRPCTypes.h"
#include "xmcp/StdioTransport.hpp"

namespace xmcp {

class StdioTransport::Impl {
public:
    std::atomic<bool> connected{false};
    std::atomic<bool> readerExited{false};
    std::atomic<bool> writerExited{false};
    std::string sessionId;
    ITransport::NotificationHandler notificationHandler;
    ITransport::RequestHandler requestHandler;
    ITransport::ErrorHandler errorHandler;
    std::thread readerThread;
    std::thread timeoutThread;
    std::thread writerThread;
    std::mutex requestMutex;
    std::mutex writeMutex; // protects writeQueue and queuedBytes
    std::condition_variable cvWrite;
    std::unordered_map<std::string, std::promise<std::unique_ptr<JSONRPCResponse>>> pendingRequests;
    std::unordered_map<std::string, std::chrono::steady_clock::time_point> requestDeadlines;
    std::atomic<unsigned int> requestCounter{0u};

#ifdef __linux__
    int wakeEventFd{-1};
#else
    int wakePipe[2]{-1, -1};
#endif

    std::size_t maxContentLength{4 * 1024 * 1024};
    std::chrono::milliseconds requestTimeout{30000};
    std::chrono::milliseconds idleReadTimeout{0}; // 0 = disabled
    std::chrono::steady_clock::time_point lastReadTs{std::chrono::steady_clock::now()};
    std::atomic<StdioFraming> framing{StdioFraming::Ndjson};

    // Write queue/backpressure
    std::deque<std::string> writeQueue;
    std::size_t queuedBytes{0};
    std::size_t writeQueueMaxBytes{8 * 1024 * 1024};

    Impl() {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(1000, 9999);
        sessionId = "stdio-" + std::to_string(dis(gen));

#ifdef __linux__
        wakeEventFd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
        if (wakeEventFd < 0) {
            LOG_ERROR("StdioTransport: failed to create eventfd (errno={} msg={})", errno, ::strerror(errno));
        }
#else
        if (::pipe(wakePipe) != 0) {
            LOG_ERROR("StdioTransport: failed to create self-pipe (errno={} msg={})", errno, ::strerror(errno));
        } else {
            for (int fd : wakePipe) {
                int fl = ::fcntl(fd, F_GETFL, 0);
                if (fl >= 0) { (void)::fcntl(fd, F_SETFL, fl | O_NONBLOCK); }
            }
        }
#endif
    }

    ~Impl() {
        connected = false;
        cvWrite.notify_all();
        wake();
        if (readerThread.joinable()) {
            if (readerExited.load()) { readerThread.join(); }
            else { readerThread.detach(); }
        }
        if (writerThread.joinable()) {
            writerThread.join();
        }
        if (timeoutThread.joinable()) {
            timeoutThread.join();
        }
#ifdef __linux__
        if (wakeEventFd >= 0) { ::close(wakeEventFd); wakeEventFd = -1; }
#else
        if (wakePipe[0] >= 0) { ::close(wakePipe[0]); wakePipe[0] = -1; }
        if (wakePipe[1] >= 0) { ::close(wakePipe[1]); wakePipe[1] = -1; }
#endif
    }

    int wakeReadFd() const {
#ifdef __linux__
        return wakeEventFd;
#else
        return wakePipe[0];
#endif
    }

    void wake() {
#ifdef __linux__
        if (wakeEventFd < 0) return;
        uint64_t one = 1;
        ssize_t wr;
        do { wr = ::write(wakeEventFd, &one, sizeof(one)); } while (wr < 0 && errno == EINTR);
#else
        if (wakePipe[1] < 0) return;
        char b = 'x';
        ssize_t wr;
        do { wr = ::write(wakePipe[1], &b, 1); } while (wr < 0 && errno == EINTR);
#endif
        if (wr < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
            LOG_WARN("StdioTransport: wake write failed (errno={} msg={})", errno, ::strerror(errno));
        }
    }

    void drainWake() {
        std::array<char, 64> b{};
        ssize_t r;
        do { r = ::read(wakeReadFd(), b.data(), b.size()); } while (r > 0 || (r < 0 && errno == EINTR));
    }

    void reportError(const std::string& msg) {
        if (!errorHandler) return;
        try {
            errorHandler(msg);
        } catch (const std::exception& e) {
            LOG_ERROR("StdioTransport: error handler threw: {}", e.what());
        }
    }

    std::string makeFrame(const std::string& payload) {
        if (framing.load() == StdioFraming::ContentLength) {
            return MakeContentLengthFramer(maxContentLength)->encode(payload);
        }
        return MakeNewlineFramer(maxContentLength)->encode(payload);
    }

    bool enqueueFrame(const std::string& payload) {
        std::string frame = makeFrame(payload);
        {
            std::unique_lock<std::mutex> lk(writeMutex);
            if (queuedBytes + frame.size() > writeQueueMaxBytes) {
                LOG_ERROR("StdioTransport: write queue overflow (queued={} add={} max={})", queuedBytes, frame.size(), writeQueueMaxBytes);
                lk.unlock();
                reportError("StdioTransport: write queue overflow");
                connected = false;
                wake();
                cvWrite.notify_all();
                return false;
            }
            queuedBytes += frame.size();
            writeQueue.emplace_back(std::move(frame));
        }
        cvWrite.notify_one();
        return true;
    }

    //==========================================================================================================
    // Extracts and dispatches every complete frame at the front of buffer. Each frame is framed
    // independently so a peer may switch between newline and Content-Length framing.
    //==========================================================================================================
    void drainFrames(std::string& buffer) {
        auto clFramer = MakeContentLengthFramer(maxContentLength);
        auto nlFramer = MakeNewlineFramer(maxContentLength);
        while (connected) {
            std::size_t ws = 0;
            while (ws < buffer.size() && std::isspace(static_cast<unsigned char>(buffer[ws]))) ++ws;
            buffer.erase(0, ws);
            if (buffer.empty()) break;

            const bool isContentLength = LooksLikeContentLengthFrame(buffer);
            IContentFramer& framer = isContentLength ? *clFramer : *nlFramer;
            auto r = framer.tryDecodeEx(buffer);
            if (r.status == IContentFramer::DecodeStatus::Incomplete) {
                break;
            }
            buffer.erase(0, std::min(r.bytesConsumed, buffer.size()));
            if (r.status == IContentFramer::DecodeStatus::InvalidHeader) {
                LOG_WARN("StdioTransport: dropping frame with invalid header");
                continue;
            }
            if (r.status == IContentFramer::DecodeStatus::BodyTooLarge) {
                reportError("StdioTransport: body too large");
                connected = false;
                break;
            }
            if (isContentLength && framing.load() != StdioFraming::ContentLength) {
                LOG_INFO("StdioTransport: peer uses Content-Length framing; switching outbound framing");
                framing = StdioFraming::ContentLength;
            }
            if (r.payload.has_value() && !r.payload->empty()) {
                processMessage(r.payload.value());
            }
        }
    }

    void startReader() {
        readerThread = std::thread([this]() {
            std::string buffer;
            constexpr int waitTimeoutMs = 100;
            lastReadTs = std::chrono::steady_clock::now();

            int fd = STDIN_FILENO;
            int flags = ::fcntl(fd, F_GETFL, 0);
            if (flags >= 0) { (void)::fcntl(fd, F_SETFL, flags | O_NONBLOCK); }

            std::vector<char> tmp(64 * 1024);
            while (connected) {
                struct pollfd pfds[2];
                pfds[0].fd = fd; pfds[0].events = POLLIN; pfds[0].revents = 0;
                pfds[1].fd = wakeReadFd(); pfds[1].events = POLLIN; pfds[1].revents = 0;
                const nfds_t nfds = (pfds[1].fd >= 0) ? 2 : 1;
                int rc = ::poll(pfds, nfds, waitTimeoutMs);
                if (rc < 0) {
                    if (errno == EINTR) continue;
                    LOG_ERROR("StdioTransport: poll failed (errno={} msg={})", errno, ::strerror(errno));
                    reportError("StdioTransport: poll failed");
                    break;
                }
                if (nfds == 2 && (pfds[1].revents & POLLIN)) {
                    drainWake();
                    if (!connected) break;
                }
                bool hadData = false;
                if (pfds[0].revents & (POLLIN | POLLHUP | POLLERR)) {
                    ssize_t n = ::read(fd, tmp.data(), tmp.size());
                    if (n > 0) {
                        buffer.append(tmp.data(), static_cast<std::size_t>(n));
                        hadData = true;
                    } else if (n == 0) {
                        LOG_INFO("StdioTransport: EOF on stdin");
                        // A final line without a trailing newline still counts as a message
                        if (!buffer.empty() && !LooksLikeContentLengthFrame(buffer)) buffer.push_back('\n');
                        drainFrames(buffer);
                        reportError("StdioTransport: EOF on stdin");
                        break;
                    } else if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                        LOG_ERROR("StdioTransport: read error (errno={} msg={})", errno, ::strerror(errno));
                        reportError("StdioTransport: read error");
                        break;
                    }
                }
                if (hadData) {
                    lastReadTs = std::chrono::steady_clock::now();
                    drainFrames(buffer);
                }
                if (idleReadTimeout.count() > 0 && std::chrono::steady_clock::now() - lastReadTs >= idleReadTimeout) {
                    LOG_ERROR("StdioTransport: idle read timeout ({} ms)", static_cast<long long>(idleReadTimeout.count()));
                    reportError("StdioTransport: idle read timeout");
                    break;
                }
            }
            connected = false;
            cvWrite.notify_all();
            readerExited.store(true);
        });
    }

    void startWriter() {
        writerThread = std::thread([this]() {
            writerExited.store(false);
            for (;;) {
                std::string frame;
                {
                    std::unique_lock<std::mutex> lk(writeMutex);
                    cvWrite.wait_for(lk, std::chrono::milliseconds(50), [&]{ return !connected || !writeQueue.empty(); });
                    if (writeQueue.empty()) {
                        if (!connected) break;
                        continue;
                    }
                    frame = std::move(writeQueue.front());
                    writeQueue.pop_front();
                }
                std::size_t total = 0;
                while (total < frame.size()) {
                    ssize_t w = ::write(STDOUT_FILENO, frame.data() + total, frame.size() - total);
                    if (w > 0) {
                        total += static_cast<std::size_t>(w);
                    } else if (w < 0 && errno == EINTR) {
                        continue;
                    } else if (w < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                        std::this_thread::sleep_for(std::chrono::milliseconds(5));
                    } else {
                        LOG_ERROR("StdioTransport: write error (errno={} msg={})", errno, ::strerror(errno));
                        reportError("StdioTransport: write error");
                        connected = false;
                        break;
                    }
                }
                {
                    std::lock_guard<std::mutex> lk(writeMutex);
                    queuedBytes = (queuedBytes >= frame.size()) ? queuedBytes - frame.size() : 0;
                }
                if (total < frame.size()) break;
            }
            writerExited.store(true);
        });
    }

    void startTimeouts() {
        timeoutThread = std::thread([this]() {
            using clock = std::chrono::steady_clock;
            while (connected) {
                auto now = clock::now();
                {
                    std::lock_guard<std::mutex> lock(requestMutex);
                    std::vector<std::string> expired;
                    for (const auto& kv : requestDeadlines) {
                        if (kv.second <= now) expired.push_back(kv.first);
                    }
                    for (const auto& idStr : expired) {
                        auto it = pendingRequests.find(idStr);
                        if (it != pendingRequests.end()) {
                            it->second.set_value(CreateErrorResponse(idStr, JSONRPCErrorCodes::InternalError, "Request timeout"));
                            pendingRequests.erase(it);
                        }
                        requestDeadlines.erase(idStr);
                    }
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
            }
        });
    }

    void processMessage(const std::string& message) {
        LOG_DEBUG("Received message: {}", message);
        switch (ClassifyJSONRPCMessage(message)) {
            case JSONRPCMessageKind::Request: {
                JSONRPCRequest request;
                if (!request.Deserialize(message)) break;
                if (!requestHandler) {
                    (void)enqueueFrame(CreateErrorResponse(request.id, JSONRPCErrorCodes::MethodNotFound, "No request handler")->Serialize());
                    return;
                }
                // Requests run off the reader thread so cancellations can still be read
                std::thread([this, req = std::move(request)]() {
                    std::unique_ptr<JSONRPCResponse> resp;
                    try {
                        resp = requestHandler(req);
                    } catch (const std::exception& e) {
                        LOG_ERROR("Request handler exception: {}", e.what());
                        resp = CreateErrorResponse(req.id, JSONRPCErrorCodes::InternalError, e.what());
                    }
                    if (!resp) {
                        resp = CreateErrorResponse(req.id, JSONRPCErrorCodes::InternalError, "Null response from handler");
                    }
                    resp->id = req.id;
                    (void)enqueueFrame(resp->Serialize());
                }).detach();
                return;
            }
            case JSONRPCMessageKind::Notification: {
                auto note = std::make_unique<JSONRPCNotification>();
                if (!note->Deserialize(message)) break;
                if (notificationHandler) {
                    try {
                        notificationHandler(std::move(note));
                    } catch (const std::exception& e) {
                        LOG_ERROR("Notification handler exception: {}", e.what());
                    }
                }
                return;
            }
            case JSONRPCMessageKind::Response: {
                JSONRPCResponse response;
                if (!response.Deserialize(message)) break;
                handleResponse(std::move(response));
                return;
            }
            case JSONRPCMessageKind::Unknown:
                break;
        }
        LOG_WARN("Failed to parse message: {}", message);
        (void)enqueueFrame(CreateErrorResponse(nullptr, JSONRPCErrorCodes::ParseError, "Parse error")->Serialize());
    }

    void handleResponse(JSONRPCResponse response) {
        const std::string idStr = IdToString(response.id);
        std::lock_guard<std::mutex> lock(requestMutex);
        auto it = pendingRequests.find(idStr);
        if (it != pendingRequests.end()) {
            it->second.set_value(std::make_unique<JSONRPCResponse>(std::move(response)));
            pendingRequests.erase(it);
        } else {
            LOG_DEBUG("StdioTransport: response for unknown id {}", idStr);
        }
        requestDeadlines.erase(idStr);
    }

    std::string generateRequestId() { return "req-" + std::to_string(++requestCounter); }
};

StdioTransport::StdioTransport() : pImpl(std::make_unique<Impl>()) {
    FUNC_SCOPE();
}

StdioTransport::~StdioTransport() {
    FUNC_SCOPE();
}

std::future<void> StdioTransport::Start() {
    FUNC_SCOPE();
    LOG_INFO("Starting StdioTransport ({} framing)",
             pImpl->framing.load() == StdioFraming::ContentLength ? "content-length" : "ndjson");
    pImpl->connected = true;
    pImpl->startReader();
    pImpl->startWriter();
    pImpl->startTimeouts();
    std::promise<void> promise; promise.set_value(); return promise.get_future();
}

std::future<void> StdioTransport::Close() {
    FUNC_SCOPE();
    LOG_INFO("Closing StdioTransport");
    pImpl->connected = false;
    pImpl->wake();
    pImpl->cvWrite.notify_all();

    auto waitFor = [](std::thread& th, const std::atomic<bool>& exited, const char* name) {
        if (!th.joinable()) return;
        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(500);
        while (!exited.load() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        if (exited.load()) {
            th.join();
        } else {
            LOG_WARN("StdioTransport: {} thread appears blocked; detaching to avoid hang", name);
            th.detach();
        }
    };
    waitFor(pImpl->readerThread, pImpl->readerExited, "reader");
    waitFor(pImpl->writerThread, pImpl->writerExited, "writer");
    if (pImpl->timeoutThread.joinable()) {
        pImpl->timeoutThread.join();
    }
    {
        std::lock_guard<std::mutex> lock(pImpl->requestMutex);
        for (auto& [idStr, prom] : pImpl->pendingRequests) {
            prom.set_value(CreateErrorResponse(idStr, JSONRPCErrorCodes::InternalError, "Transport closed"));
        }
        pImpl->pendingRequests.clear();
        pImpl->requestDeadlines.clear();
    }
    std::promise<void> promise; promise.set_value(); return promise.get_future();
}

bool StdioTransport::IsConnected() const {
    FUNC_SCOPE();
    return pImpl->connected;
}

std::string StdioTransport::GetSessionId() const {
    FUNC_SCOPE();
    return pImpl->sessionId;
}

std::future<std::unique_ptr<JSONRPCResponse>> StdioTransport::SendRequest(
    std::unique_ptr<JSONRPCRequest> request) {
    FUNC_SCOPE();
    std::promise<std::unique_ptr<JSONRPCResponse>> promise;
    auto future = promise.get_future();
    if (!pImpl->connected.load()) {
        LOG_DEBUG("StdioTransport: SendRequest called while disconnected; returning error");
        promise.set_value(CreateErrorResponse(request->id, JSONRPCErrorCodes::InternalError, "Transport not connected"));
        return future;
    }
    std::string requestId = IdToString(request->id);
    if (requestId.empty()) {
        requestId = pImpl->generateRequestId();
        request->id = requestId;
    }
    {
        std::lock_guard<std::mutex> lock(pImpl->requestMutex);
        pImpl->pendingRequests[requestId] = std::move(promise);
        if (pImpl->requestTimeout.count() > 0) {
            pImpl->requestDeadlines[requestId] = std::chrono::steady_clock::now() + pImpl->requestTimeout;
        }
    }
    std::string serialized = request->Serialize();
    LOG_DEBUG("Sending request ({} bytes)", serialized.size());
    (void)pImpl->enqueueFrame(serialized);
    return future;
}

std::future<void> StdioTransport::SendNotification(
    std::unique_ptr<JSONRPCNotification> notification) {
    FUNC_SCOPE();
    if (pImpl->connected.load()) {
        std::string serialized = notification->Serialize();
        LOG_DEBUG("Sending notification ({} bytes)", serialized.size());
        (void)pImpl->enqueueFrame(serialized);
    } else {
        LOG_DEBUG("StdioTransport: SendNotification called while disconnected; ignoring");
    }
    std::promise<void> promise; promise.set_value(); return promise.get_future();
}

void StdioTransport::SetNotificationHandler(NotificationHandler handler) { FUNC_SCOPE(); pImpl->notificationHandler = std::move(handler); }
void StdioTransport::SetRequestHandler(RequestHandler handler) { FUNC_SCOPE(); pImpl->requestHandler = std::move(handler); }
void StdioTransport::SetErrorHandler(ErrorHandler handler) { FUNC_SCOPE(); pImpl->errorHandler = std::move(handler); }

void StdioTransport::SetRequestTimeoutMs(uint64_t timeoutMs) {
    FUNC_SCOPE();
    pImpl->requestTimeout = std::chrono::milliseconds(timeoutMs);
}

void StdioTransport::SetIdleReadTimeoutMs(uint64_t timeoutMs) {
    FUNC_SCOPE();
    pImpl->idleReadTimeout = std::chrono::milliseconds(timeoutMs);
}

void StdioTransport::SetWriteQueueMaxBytes(std::size_t maxBytes) {
    FUNC_SCOPE();
    if (maxBytes == 0) { maxBytes = 1; }
    pImpl->writeQueueMaxBytes = maxBytes;
}

void StdioTransport::SetMaxContentLength(std::size_t maxBytes) {
    FUNC_SCOPE();
    pImpl->maxContentLength = maxBytes;
}

void StdioTransport::SetFraming(StdioFraming framing) {
    FUNC_SCOPE();
    pImpl->framing = framing;
}

StdioFraming StdioTransport::GetFraming() const {
    return pImpl->framing.load();
}

std::unique_ptr<ITransport> StdioTransportFactory::CreateTransport(const std::string& config) {
    auto t = std::make_unique<StdioTransport>();
    auto parseUint = [](const std::string& key, const std::string& s) -> uint64_t {
        try {
            std::size_t used = 0;
            unsigned long long v = std::stoull(s, &used);
            if (used != s.size()) throw std::invalid_argument(s);
            return static_cast<uint64_t>(v);
        } catch (const std::exception&) {
            throw std::invalid_argument("StdioTransport: invalid value for " + key + ": " + s);
        }
    };
    // key=value pairs separated by ';' or whitespace
    for (std::size_t i = 0; i < config.size();) {
        while (i < config.size() && (config[i] == ';' || config[i] == ' ' || config[i] == '\t')) ++i;
        if (i >= config.size()) break;
        std::size_t start = i;
        while (i < config.size() && config[i] != ';' && config[i] != ' ' && config[i] != '\t') ++i;
        std::string token = config.substr(start, i - start);
        auto eq = token.find('=');
        if (eq == std::string::npos) continue;
        auto key = token.substr(0, eq);
        auto val = token.substr(eq + 1);
        if (key == "timeout_ms") {
            t->SetRequestTimeoutMs(parseUint(key, val));
        } else if (key == "idle_read_timeout_ms") {
            t->SetIdleReadTimeoutMs(parseUint(key, val));
        } else if (key == "write_queue_max_bytes") {
            t->SetWriteQueueMaxBytes(static_cast<std::size_t>(parseUint(key, val)));
        } else if (key == "max_content_length") {
            t->SetMaxContentLength(static_cast<std::size_t>(parseUint(key, val)));
        } else if (key == "framing") {
            if (val == "ndjson") t->SetFraming(StdioFraming::Ndjson);
            else if (val == "content-length") t->SetFraming(StdioFraming::ContentLength);
            else throw std::invalid_argument("StdioTransport: unknown framing: " + val);
        } else {
            LOG_WARN("StdioTransport: ignoring unknown option '{}'", key);
        }
    }
    return t;
}

////////////////////////////////////////// Test hooks //////////////////////////////////////////
void StdioTransportTestHooks::drainFrames(StdioTransport& t, std::string& buffer) {
    t.pImpl->drainFrames(buffer);
}

void StdioTransportTestHooks::setConnected(StdioTransport& t, bool v) {
    t.pImpl->connected = v;
}

bool StdioTransportTestHooks::isConnected(const StdioTransport& t) {
    return t.pImpl->connected.load();
}

std::vector<std::string> StdioTransportTestHooks::queuedFrames(StdioTransport& t) {
    std::lock_guard<std::mutex> lk(t.pImpl->writeMutex);
    return std::vector<std::string>(t.pImpl->writeQueue.begin(), t.pImpl->writeQueue.end());
}

} // namespace xmcp
