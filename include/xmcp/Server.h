//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Server.h
// Purpose: MCP server interface and the standard tools-only server implementation
//==========================================================================================================

#pragma once

#include "Protocol.h"
#include "Transport.h"
#include <memory>
#include <functional>
#include <future>
#include <stop_token>
#include <vector>

namespace xmcp {

using ToolResult = CallToolResult;

// Async, cancellable tool handler. The stop_token is signalled by notifications/cancelled.
using ToolHandler = std::function<std::future<ToolResult>(const JSONValue&, std::stop_token)>;

//==========================================================================================================
// IServer
// Purpose: MCP server surface used by the application and tests.
//==========================================================================================================
class IServer {
public:
    virtual ~IServer() = default;

    /////////////////////////////////////////// Connection management //////////////////////////////////////////
    //==========================================================================================================
    // Starts the server using the provided transport and wires request/notification handlers.
    // Args:
    //   transport: Transport implementation to own and use for JSON-RPC.
    // Returns:
    //   A future that completes once the transport receiver loop is running.
    //==========================================================================================================
    virtual std::future<void> Start(std::unique_ptr<ITransport> transport) = 0;

    //==========================================================================================================
    // Stops the server and closes the underlying transport.
    //==========================================================================================================
    virtual std::future<void> Stop() = 0;

    // True once a client has initialized and the transport is still connected.
    virtual bool IsRunning() const = 0;

    ////////////////////////////////////////////// Tool management /////////////////////////////////////////////
    //==========================================================================================================
    // Registers a tool with metadata and handler. Re-registering a name replaces the previous entry.
    // Args:
    //   tool: Tool metadata (name, description, inputSchema).
    //   handler: Async callback receiving a std::stop_token to cooperatively cancel work.
    //==========================================================================================================
    virtual void RegisterTool(const Tool& tool, ToolHandler handler) = 0;

    virtual void UnregisterTool(const std::string& name) = 0;

    // Registered tools sorted by name.
    virtual std::vector<Tool> ListTools() = 0;

    //==========================================================================================================
    // Invokes a registered tool directly (without a transport).
    // Args:
    //   name: Tool name.
    //   arguments: Tool arguments object.
    // Returns:
    //   Future with the tool result; throws std::out_of_range through the future for unknown tools.
    //==========================================================================================================
    virtual std::future<ToolResult> CallTool(const std::string& name, const JSONValue& arguments) = 0;

    /////////////////////////////////////////////// Error handling //////////////////////////////////////////////
    using ErrorHandler = std::function<void(const std::string& error)>;
    virtual void SetErrorHandler(ErrorHandler handler) = 0;

    virtual ServerCapabilities GetCapabilities() const = 0;
};

//==========================================================================================================
// Server
// Purpose: Standard MCP server handling initialize, ping, tools/list, tools/call and cancellation.
//==========================================================================================================
class Server : public IServer {
public:
    //==========================================================================================================
    // Constructs a standard MCP Server.
    // Args:
    //   serverInfo: Name and version reported in the initialize result.
    //==========================================================================================================
    explicit Server(const Implementation& serverInfo);
    virtual ~Server();

    std::future<void> Start(std::unique_ptr<ITransport> transport) override;
    std::future<void> Stop() override;
    bool IsRunning() const override;

    void RegisterTool(const Tool& tool, ToolHandler handler) override;
    void UnregisterTool(const std::string& name) override;
    std::vector<Tool> ListTools() override;
    std::future<ToolResult> CallTool(const std::string& name, const JSONValue& arguments) override;

    void SetErrorHandler(ErrorHandler handler) override;
    ServerCapabilities GetCapabilities() const override;

    //==========================================================================================================
    // Dispatches one JSON-RPC request synchronously. Used by transports through the request handler and
    // directly by tests.
    //==========================================================================================================
    std::unique_ptr<JSONRPCResponse> HandleRequest(const JSONRPCRequest& request);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

class IServerFactory {
public:
    virtual ~IServerFactory() = default;
    virtual std::unique_ptr<IServer> CreateServer(const Implementation& serverInfo) = 0;
};

class ServerFactory : public IServerFactory {
public:
    std::unique_ptr<IServer> CreateServer(const Implementation& serverInfo) override;
};

} // namespace xmcp
