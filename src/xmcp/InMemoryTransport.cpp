//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryTransport.cpp
// Purpose: In-memory transport implementation
//==========================================================================================================

#include <atomic>
#include <condition_variable>
#include <future>
#include <mutex>
#include <queue>
#include <random>
#include <stop_token>
#include <string>
#include <thread>
#include <unordered_map>

#include "logging/Logger.h"
#include "xmcp/JSONRPCTypes.h"
#include "xmcp/InMemoryTransport.hpp"

namespace xmcp {

class InMemoryTransport::Impl : public std::enable_shared_from_this<InMemoryTransport::Impl> {
public:
    std::atomic<bool> connected{false};
    std::string sessionId;
    ITransport::NotificationHandler notificationHandler;
    ITransport::RequestHandler requestHandler;
    ITransport::ErrorHandler errorHandler;
    std::weak_ptr<Impl> peer;
    std::mutex peerMutex;
    std::queue<std::string> messageQueue;
    std::mutex queueMutex;
    std::condition_variable_any queueCondition;
    std::jthread processingThread;
    std::atomic<unsigned int> requestCounter{0u};
    std::mutex requestMutex;
    std::unordered_map<std::string, std::promise<std::unique_ptr<JSONRPCResponse>>> pendingRequests;

    Impl() {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(1000, 9999);
        sessionId = "memory-" + std::to_string(dis(gen));
    }

    void stopProcessing() {
        connected = false;
        if (processingThread.joinable()) {
            processingThread.request_stop();
            queueCondition.notify_all();
            if (processingThread.get_id() != std::this_thread::get_id()) {
                processingThread.join();
            } else {
                processingThread.detach();
            }
        }
    }

    void startProcessing() {
        processingThread = std::jthread([this](std::stop_token st) {
            std::unique_lock<std::mutex> lock(queueMutex);
            while (!st.stop_requested()) {
                queueCondition.wait(lock, st, [this]() { return !messageQueue.empty() || !connected; });
                if (st.stop_requested() || !connected) {
                    break;
                }
                while (!messageQueue.empty() && connected) {
                    std::string message = std::move(messageQueue.front());
                    messageQueue.pop();
                    lock.unlock();
                    processMessage(message);
                    lock.lock();
                }
            }
        });
    }

    void processMessage(const std::string& message) {
        LOG_DEBUG("Processing in-memory message: {}", message);
        switch (ClassifyJSONRPCMessage(message)) {
            case JSONRPCMessageKind::Response: {
                JSONRPCResponse response;
                if (response.Deserialize(message)) {
                    handleResponse(std::move(response));
                    return;
                }
                break;
            }
            case JSONRPCMessageKind::Request: {
                JSONRPCRequest request;
                if (!request.Deserialize(message)) break;
                if (!requestHandler) {
                    sendToPeer(CreateErrorResponse(request.id, JSONRPCErrorCodes::MethodNotFound, "No request handler")->Serialize());
                    return;
                }
                // The worker holds a reference so the Impl outlives a request still running at Close()
                std::thread([self = shared_from_this(), req = std::move(request)]() {
                    std::unique_ptr<JSONRPCResponse> resp;
                    try {
                        resp = self->requestHandler(req);
                    } catch (const std::exception& e) {
                        LOG_ERROR("InMemory request handler exception: {}", e.what());
                        resp = CreateErrorResponse(req.id, JSONRPCErrorCodes::InternalError, e.what());
                    }
                    if (!resp) {
                        resp = CreateErrorResponse(req.id, JSONRPCErrorCodes::InternalError, "Null response from handler");
                    }
                    resp->id = req.id;
                    self->sendToPeer(resp->Serialize());
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
                        LOG_ERROR("InMemory notification handler exception: {}", e.what());
                    }
                }
                return;
            }
            case JSONRPCMessageKind::Unknown:
                break;
        }
        LOG_WARN("InMemoryTransport: dropping unparseable message: {}", message);
    }

    void handleResponse(JSONRPCResponse response) {
        const std::string idStr = IdToString(response.id);
        std::lock_guard<std::mutex> lock(requestMutex);
        auto it = pendingRequests.find(idStr);
        if (it != pendingRequests.end()) {
            it->second.set_value(std::make_unique<JSONRPCResponse>(std::move(response)));
            pendingRequests.erase(it);
        }
    }

    void enqueueMessage(const std::string& message) {
        {
            std::lock_guard<std::mutex> lock(queueMutex);
            messageQueue.push(message);
        }
        queueCondition.notify_one();
    }

    bool sendToPeer(const std::string& message) {
        std::shared_ptr<Impl> p;
        {
            std::lock_guard<std::mutex> lock(peerMutex);
            p = peer.lock();
        }
        if (!p || !p->connected.load()) {
            LOG_WARN("InMemoryTransport: peer not connected; dropping message");
            return false;
        }
        p->enqueueMessage(message);
        return true;
    }

    void failPending(const std::string& reason) {
        std::lock_guard<std::mutex> lock(requestMutex);
        for (auto& [idStr, prom] : pendingRequests) {
            prom.set_value(CreateErrorResponse(idStr, JSONRPCErrorCodes::InternalError, reason));
        }
        pendingRequests.clear();
    }

    std::string generateRequestId() { return "mem-req-" + std::to_string(++requestCounter); }
};

InMemoryTransport::InMemoryTransport() : pImpl(std::make_shared<Impl>()) {
    FUNC_SCOPE();
}

InMemoryTransport::~InMemoryTransport() {
    FUNC_SCOPE();
    pImpl->stopProcessing();
    pImpl->failPending("Transport closed");
}

std::pair<std::unique_ptr<InMemoryTransport>, std::unique_ptr<InMemoryTransport>> InMemoryTransport::CreatePair() {
    FUNC_SCOPE();
    auto first = std::make_unique<InMemoryTransport>();
    auto second = std::make_unique<InMemoryTransport>();
    first->pImpl->peer = second->pImpl;
    second->pImpl->peer = first->pImpl;
    return std::make_pair(std::move(first), std::move(second));
}

std::future<void> InMemoryTransport::Start() {
    FUNC_SCOPE();
    LOG_INFO("Starting InMemoryTransport {}", pImpl->sessionId);
    pImpl->connected = true;
    pImpl->startProcessing();
    std::promise<void> promise; promise.set_value(); return promise.get_future();
}

std::future<void> InMemoryTransport::Close() {
    FUNC_SCOPE();
    LOG_INFO("Closing InMemoryTransport {}", pImpl->sessionId);
    pImpl->stopProcessing();
    pImpl->failPending("Transport closed");
    std::promise<void> promise; promise.set_value(); return promise.get_future();
}

bool InMemoryTransport::IsConnected() const {
    FUNC_SCOPE();
    return pImpl->connected;
}

std::string InMemoryTransport::GetSessionId() const {
    FUNC_SCOPE();
    return pImpl->sessionId;
}

std::future<std::unique_ptr<JSONRPCResponse>> InMemoryTransport::SendRequest(
    std::unique_ptr<JSONRPCRequest> request) {
    FUNC_SCOPE();
    std::string requestId = IdToString(request->id);
    if (requestId.empty()) {
        requestId = pImpl->generateRequestId();
        request->id = requestId;
    }
    std::promise<std::unique_ptr<JSONRPCResponse>> promise;
    auto future = promise.get_future();
    {
        std::lock_guard<std::mutex> lock(pImpl->requestMutex);
        pImpl->pendingRequests[requestId] = std::move(promise);
    }
    std::string serialized = request->Serialize();
    LOG_DEBUG("Sending in-memory request: {}", serialized);
    if (!pImpl->sendToPeer(serialized)) {
        std::lock_guard<std::mutex> lock(pImpl->requestMutex);
        auto it = pImpl->pendingRequests.find(requestId);
        if (it != pImpl->pendingRequests.end()) {
            it->second.set_value(CreateErrorResponse(request->id, JSONRPCErrorCodes::InternalError, "Peer not connected"));
            pImpl->pendingRequests.erase(it);
        }
    }
    return future;
}

std::future<void> InMemoryTransport::SendNotification(
    std::unique_ptr<JSONRPCNotification> notification) {
    FUNC_SCOPE();
    std::string serialized = notification->Serialize();
    LOG_DEBUG("Sending in-memory notification: {}", serialized);
    if (!pImpl->sendToPeer(serialized) && pImpl->errorHandler) {
        pImpl->errorHandler("Peer not connected");
    }
    std::promise<void> promise; promise.set_value(); return promise.get_future();
}

void InMemoryTransport::SetNotificationHandler(NotificationHandler handler) {
    FUNC_SCOPE();
    pImpl->notificationHandler = std::move(handler);
}

void InMemoryTransport::SetErrorHandler(ErrorHandler handler) {
    FUNC_SCOPE();
    pImpl->errorHandler = std::move(handler);
}

void InMemoryTransport::SetRequestHandler(RequestHandler handler) {
    FUNC_SCOPE();
    pImpl->requestHandler = std::move(handler);
}

} // namespace xmcp
