//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Server.cpp
// Purpose: MCP server implementation (initialize, ping, tools, cancellation)
//==========================================================================================================
#include <algorithm>
#include <atomic>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <stop_token>
#include <unordered_map>
#include <unordered_set>

#include "logging/Logger.h"
#include "xmcp/Protocol.h"
#include "xmcp/Server.h"
#include "xmcp/errors/Errors.h"
#include "xmcp/typed/JsonFields.h"
#include "xmcp/version.h"

namespace xmcp {

class Server::Impl {
public:
    std::unique_ptr<ITransport> transport;
    ServerCapabilities capabilities;
    Implementation serverInfo;
    std::atomic<bool> initialized{false};
    IServer::ErrorHandler errorCallback;

    // Registry
    std::mutex registryMutex;
    std::unordered_map<std::string, ToolHandler> toolHandlers;
    std::unordered_map<std::string, Tool> toolMetadata;

    // Cancellation: stop_sources of in-flight tool calls, ids cancelled while in flight,
    // and two bounded FIFOs: cancels that arrived before their request, and recently completed ids
    static constexpr std::size_t kCancelHistory = 256;
    std::mutex cancelMutex;
    std::unordered_set<std::string> cancelledIds;
    std::unordered_map<std::string, std::shared_ptr<std::stop_source>> stopSources;
    std::deque<std::string> earlyCancels;
    std::deque<std::string> completedIds;

    explicit Impl(const Implementation& info) : serverInfo(info) {
        capabilities.tools = ToolsCapability{true};
    }

    // RAII registration of a stop_source for the lifetime of one request
    struct StopSourceGuard {
        Impl* self;
        std::string id;
        std::shared_ptr<std::stop_source> src;
        StopSourceGuard(Impl* s, std::string requestId) : self(s), id(std::move(requestId)) {
            src = self->registerStopSource(id);
        }
        ~StopSourceGuard() { self->unregisterStopSource(id); }
        StopSourceGuard(const StopSourceGuard&) = delete;
        StopSourceGuard& operator=(const StopSourceGuard&) = delete;
    };

    static bool contains(const std::deque<std::string>& q, const std::string& id) {
        return std::find(q.begin(), q.end(), id) != q.end();
    }

    static void eraseAll(std::deque<std::string>& q, const std::string& id) {
        q.erase(std::remove(q.begin(), q.end(), id), q.end());
    }

    static void pushBounded(std::deque<std::string>& q, const std::string& id) {
        q.push_back(id);
        while (q.size() > kCancelHistory) q.pop_front();
    }

    std::shared_ptr<std::stop_source> registerStopSource(const std::string& idStr) {
        auto src = std::make_shared<std::stop_source>();
        if (idStr.empty()) return src;
        std::lock_guard<std::mutex> lk(cancelMutex);
        stopSources[idStr] = src;
        eraseAll(completedIds, idStr);
        // A cancellation that raced ahead of the request is honoured immediately
        if (contains(earlyCancels, idStr)) {
            eraseAll(earlyCancels, idStr);
            cancelledIds.insert(idStr);
            src->request_stop();
        }
        return src;
    }

    void unregisterStopSource(const std::string& idStr) {
        if (idStr.empty()) return;
        std::lock_guard<std::mutex> lk(cancelMutex);
        stopSources.erase(idStr);
        cancelledIds.erase(idStr);
        pushBounded(completedIds, idStr);
    }

    bool isCancelled(const std::string& idStr) {
        std::lock_guard<std::mutex> lk(cancelMutex);
        return cancelledIds.count(idStr) != 0;
    }

    // Returns false when the id belongs to a call that already finished.
    bool cancelById(const std::string& idStr) {
        std::lock_guard<std::mutex> lk(cancelMutex);
        auto it = stopSources.find(idStr);
        if (it != stopSources.end()) {
            cancelledIds.insert(idStr);
            if (it->second) it->second->request_stop();
            return true;
        }
        if (contains(completedIds, idStr)) return false;
        if (!contains(earlyCancels, idStr)) pushBounded(earlyCancels, idStr);
        return true;
    }

    static std::unique_ptr<JSONRPCResponse> makeResult(const JSONRPCId& id, JSONValue result) {
        auto resp = std::make_unique<JSONRPCResponse>();
        resp->id = id;
        resp->result = std::move(result);
        return resp;
    }

    static std::unique_ptr<JSONRPCResponse> makeError(const JSONRPCId& id, int code, const std::string& message) {
        return errors::makeErrorResponse(id, errors::makeError(code, message));
    }

    static JSONValue serializeToolResult(ToolResult&& tr) {
        JSONValue::Object obj;
        JSONValue::Array content;
        for (auto& v : tr.content) content.push_back(std::make_shared<JSONValue>(std::move(v)));
        obj["content"] = std::make_shared<JSONValue>(std::move(content));
        obj["isError"] = std::make_shared<JSONValue>(tr.isError);
        return JSONValue{std::move(obj)};
    }

    static JSONValue::Object makeToolObj(const Tool& t) {
        JSONValue::Object to;
        to["name"] = std::make_shared<JSONValue>(t.name);
        to["description"] = std::make_shared<JSONValue>(t.description);
        to["inputSchema"] = std::make_shared<JSONValue>(t.inputSchema);
        return to;
    }

    std::vector<Tool> sortedTools() {
        std::vector<Tool> tools;
        {
            std::lock_guard<std::mutex> lock(registryMutex);
            tools.reserve(toolMetadata.size());
            for (const auto& [name, meta] : toolMetadata) tools.push_back(meta);
        }
        std::sort(tools.begin(), tools.end(), [](const Tool& a, const Tool& b){ return a.name < b.name; });
        return tools;
    }

    ToolHandler findHandler(const std::string& name) {
        std::lock_guard<std::mutex> lock(registryMutex);
        auto it = toolHandlers.find(name);
        if (it == toolHandlers.end()) return ToolHandler{};
        return it->second;
    }

    void notifyToolsChanged() {
        if (!transport || !transport->IsConnected() || !initialized.load()) return;
        auto n = std::make_unique<JSONRPCNotification>();
        n->method = Methods::ToolListChanged;
        n->params = JSONValue{JSONValue::Object{}};
        (void)transport->SendNotification(std::move(n));
    }

    /////////////////////////////////////////// Request handlers ///////////////////////////////////////////
    std::unique_ptr<JSONRPCResponse> handleInitialize(const JSONRPCRequest& request) {
        std::string clientName = "unknown";
        if (request.params.has_value()) {
            if (const JSONValue* ci = typed::getObject(request.params.value(), "clientInfo")) {
                clientName = typed::getString(*ci, "name").value_or(clientName);
            }
        }
        LOG_INFO("Handling initialize request from client '{}'", clientName);

        JSONValue::Object caps;
        if (capabilities.tools.has_value()) {
            JSONValue::Object toolsObj;
            toolsObj["listChanged"] = std::make_shared<JSONValue>(capabilities.tools->listChanged);
            caps["tools"] = std::make_shared<JSONValue>(std::move(toolsObj));
        }
        JSONValue::Object serverInfoObj;
        serverInfoObj["name"] = std::make_shared<JSONValue>(serverInfo.name);
        serverInfoObj["version"] = std::make_shared<JSONValue>(serverInfo.version.empty() ? getVersionString() : serverInfo.version);

        JSONValue::Object resultObj;
        resultObj["protocolVersion"] = std::make_shared<JSONValue>(PROTOCOL_VERSION);
        resultObj["capabilities"] = std::make_shared<JSONValue>(std::move(caps));
        resultObj["serverInfo"] = std::make_shared<JSONValue>(std::move(serverInfoObj));
        initialized = true;
        return makeResult(request.id, JSONValue{std::move(resultObj)});
    }

    std::unique_ptr<JSONRPCResponse> handleToolsList(const JSONRPCRequest& req) {
        LOG_DEBUG("Handling tools/list request");
        std::size_t start = 0;
        std::optional<std::size_t> limit;
        if (req.params.has_value()) {
            if (auto cursor = typed::getString(req.params.value(), "cursor")) {
                try {
                    start = static_cast<std::size_t>(std::stoull(cursor.value()));
                } catch (const std::exception&) {
                    return makeError(req.id, JSONRPCErrorCodes::InvalidParams, "Invalid cursor");
                }
            }
            if (auto lim = typed::getInt(req.params.value(), "limit"); lim.has_value() && lim.value() > 0) {
                limit = static_cast<std::size_t>(lim.value());
            }
        }
        std::vector<Tool> tools = sortedTools();
        const std::size_t total = tools.size();
        if (start > total) start = total;
        const std::size_t end = limit.has_value() ? std::min(total, start + limit.value()) : total;

        JSONValue::Array arr;
        for (std::size_t i = start; i < end; ++i) {
            arr.push_back(std::make_shared<JSONValue>(makeToolObj(tools[i])));
        }
        JSONValue::Object resultObj;
        resultObj["tools"] = std::make_shared<JSONValue>(std::move(arr));
        if (end < total) {
            resultObj["nextCursor"] = std::make_shared<JSONValue>(std::to_string(end));
        }
        return makeResult(req.id, JSONValue{std::move(resultObj)});
    }

    std::unique_ptr<JSONRPCResponse> handleToolsCall(const JSONRPCRequest& req) {
        std::string name;
        JSONValue arguments{JSONValue::Object{}};
        if (req.params.has_value()) {
            name = typed::getString(req.params.value(), "name").value_or("");
            if (const JSONValue* a = typed::findField(req.params.value(), "arguments")) {
                if (!a->isNull()) arguments = *a;
            }
        }
        if (name.empty()) {
            return makeError(req.id, JSONRPCErrorCodes::InvalidParams, "Invalid params: missing tool name");
        }
        if (!arguments.isObject()) {
            return makeError(req.id, JSONRPCErrorCodes::InvalidParams, "Invalid params: arguments must be an object");
        }
        ToolHandler handler = findHandler(name);
        if (!handler) {
            return makeError(req.id, JSONRPCErrorCodes::ToolNotFound, "Tool not found: " + name);
        }
        LOG_DEBUG("Handling tools/call request for '{}'", name);

        const std::string idStr = IdToString(req.id);
        StopSourceGuard guard{this, idStr};
        ToolResult tr;
        try {
            auto fut = handler(arguments, guard.src->get_token());
            tr = fut.get();
        } catch (const std::exception& e) {
            LOG_ERROR("Tool '{}' threw: {}", name, e.what());
            return makeError(req.id, JSONRPCErrorCodes::InternalError, e.what());
        }
        if (isCancelled(idStr)) {
            LOG_INFO("Tool call '{}' (id={}) cancelled", name, idStr);
            return makeError(req.id, JSONRPCErrorCodes::RequestCancelled, "Cancelled");
        }
        return makeResult(req.id, serializeToolResult(std::move(tr)));
    }

    std::unique_ptr<JSONRPCResponse> dispatchRequest(const JSONRPCRequest& req) {
        try {
            if (req.method == Methods::Initialize) {
                return handleInitialize(req);
            } else if (req.method == Methods::Ping) {
                return makeResult(req.id, JSONValue{JSONValue::Object{}});
            } else if (req.method == Methods::ListTools) {
                return handleToolsList(req);
            } else if (req.method == Methods::CallTool) {
                return handleToolsCall(req);
            }
            LOG_WARN("Method not found: {}", req.method);
            return makeError(req.id, JSONRPCErrorCodes::MethodNotFound, "Method not found: " + req.method);
        } catch (const std::exception& e) {
            return makeError(req.id, JSONRPCErrorCodes::InternalError, e.what());
        }
    }

    void handleNotification(std::unique_ptr<JSONRPCNotification> notification) {
        LOG_DEBUG("Received notification: {}", notification->method);
        if (notification->method == Methods::Initialized) {
            initialized = true;
            LOG_INFO("MCP session initialized by client");
        } else if (notification->method == Methods::Cancelled) {
            std::string idStr;
            if (notification->params.has_value()) {
                if (const JSONValue* v = typed::findField(notification->params.value(), "requestId")) {
                    if (std::holds_alternative<std::string>(v->value)) idStr = std::get<std::string>(v->value);
                    else if (std::holds_alternative<int64_t>(v->value)) idStr = std::to_string(std::get<int64_t>(v->value));
                } else if (auto s = typed::getString(notification->params.value(), "id")) {
                    idStr = s.value();
                } else if (auto n = typed::getInt(notification->params.value(), "id")) {
                    idStr = std::to_string(n.value());
                }
            }
            if (!idStr.empty()) {
                if (cancelById(idStr)) {
                    LOG_INFO("Cancellation received for id={}", idStr);
                } else {
                    LOG_DEBUG("Ignoring cancellation for completed id={}", idStr);
                }
            } else {
                LOG_WARN("Cancellation notification missing request id");
            }
        } else {
            LOG_DEBUG("Ignoring notification: {}", notification->method);
        }
    }
};

Server::Server(const Implementation& serverInfo)
    : pImpl(std::make_unique<Impl>(serverInfo)) {
    FUNC_SCOPE();
}

Server::~Server() {
    FUNC_SCOPE();
}

std::future<void> Server::Start(std::unique_ptr<ITransport> transport) {
    FUNC_SCOPE();
    LOG_INFO("Starting MCP server '{}'", pImpl->serverInfo.name);
    pImpl->transport = std::move(transport);
    pImpl->transport->SetNotificationHandler([this](std::unique_ptr<JSONRPCNotification> n){
        if (!n) return;
        try { pImpl->handleNotification(std::move(n)); }
        catch (const std::exception& e) { LOG_ERROR("Server notification handler exception: {}", e.what()); }
    });
    pImpl->transport->SetErrorHandler([this](const std::string& err){
        LOG_ERROR("Transport error: {}", err);
        if (pImpl->errorCallback) {
            try { pImpl->errorCallback(err); }
            catch (const std::exception& e) { LOG_ERROR("Server error callback exception: {}", e.what()); }
        }
    });
    pImpl->transport->SetRequestHandler([this](const JSONRPCRequest& req) -> std::unique_ptr<JSONRPCResponse> {
        return pImpl->dispatchRequest(req);
    });
    return pImpl->transport->Start();
}

std::future<void> Server::Stop() {
    FUNC_SCOPE();
    LOG_INFO("Stopping MCP server");
    pImpl->initialized = false;
    if (pImpl->transport) {
        return pImpl->transport->Close();
    }
    std::promise<void> done; done.set_value(); return done.get_future();
}

bool Server::IsRunning() const {
    FUNC_SCOPE();
    bool val = pImpl->initialized.load();
    if (pImpl->transport) {
        val = val && pImpl->transport->IsConnected();
    }
    return val;
}

void Server::RegisterTool(const Tool& tool, ToolHandler handler) {
    FUNC_SCOPE();
    LOG_DEBUG("Registering tool: {}", tool.name);
    {
        std::lock_guard<std::mutex> lock(pImpl->registryMutex);
        pImpl->toolHandlers[tool.name] = std::move(handler);
        pImpl->toolMetadata[tool.name] = tool;
    }
    pImpl->notifyToolsChanged();
}

void Server::UnregisterTool(const std::string& name) {
    FUNC_SCOPE();
    LOG_DEBUG("Unregistering tool: {}", name);
    {
        std::lock_guard<std::mutex> lock(pImpl->registryMutex);
        pImpl->toolHandlers.erase(name);
        pImpl->toolMetadata.erase(name);
    }
    pImpl->notifyToolsChanged();
}

std::vector<Tool> Server::ListTools() {
    FUNC_SCOPE();
    return pImpl->sortedTools();
}

std::future<ToolResult> Server::CallTool(const std::string& name, const JSONValue& arguments) {
    FUNC_SCOPE();
    ToolHandler handler = pImpl->findHandler(name);
    if (!handler) {
        std::promise<ToolResult> failed;
        failed.set_exception(std::make_exception_ptr(std::out_of_range("Tool not found: " + name)));
        return failed.get_future();
    }
    std::stop_source src;
    return handler(arguments, src.get_token());
}

std::unique_ptr<JSONRPCResponse> Server::HandleRequest(const JSONRPCRequest& request) {
    FUNC_SCOPE();
    return pImpl->dispatchRequest(request);
}

void Server::SetErrorHandler(ErrorHandler handler) {
    FUNC_SCOPE();
    pImpl->errorCallback = std::move(handler);
}

ServerCapabilities Server::GetCapabilities() const {
    FUNC_SCOPE();
    return pImpl->capabilities;
}

std::unique_ptr<IServer> ServerFactory::CreateServer(const Implementation& serverInfo) {
    FUNC_SCOPE();
    return std::make_unique<Server>(serverInfo);
}

} // namespace xmcp
