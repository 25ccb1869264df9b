//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioTransport.hpp
// Purpose: Concrete stdio-based transport
//==========================================================================================================
#pragma once

#include "xmcp/Transport.h"
#include <memory>
#include <cstdint>
#include <string>
#include <vector>

namespace xmcp {

// Outbound framing. Inbound frames of either kind are always accepted.
enum class StdioFraming {
    Ndjson,
    ContentLength
};

//==========================================================================================================
// StdioTransport
// Purpose: JSON-RPC transport over stdin/stdout for local MCP hosts. Newline-delimited JSON is the
//          default; once the peer sends a Content-Length frame, replies use Content-Length as well.
//==========================================================================================================
class StdioTransport : public ITransport {
public:
    StdioTransport();
    virtual ~StdioTransport();

    ////////////////////////////////////////// ITransport //////////////////////////////////////////
    //==========================================================================================================
    // Starts the stdio transport reader/writer loops.
    // Returns:
    //   Future that completes when loops are running.
    //==========================================================================================================
    std::future<void> Start() override;

    //==========================================================================================================
    // Closes the transport and stops reader/writer loops. Pending requests resolve with InternalError.
    //==========================================================================================================
    std::future<void> Close() override;

    bool IsConnected() const override;
    std::string GetSessionId() const override;

    std::future<std::unique_ptr<JSONRPCResponse>> SendRequest(
        std::unique_ptr<JSONRPCRequest> request) override;
    std::future<void> SendNotification(
        std::unique_ptr<JSONRPCNotification> notification) override;

    void SetNotificationHandler(NotificationHandler handler) override;
    void SetRequestHandler(RequestHandler handler) override;
    void SetErrorHandler(ErrorHandler handler) override;

    //==========================================================================================================
    // SetRequestTimeoutMs
    // Purpose: Configure maximum time to wait for a single outbound request/response pair.
    // Args:
    //   timeoutMs: Timeout in milliseconds (0 disables the timeout).
    //==========================================================================================================
    void SetRequestTimeoutMs(uint64_t timeoutMs);

    // If > 0, emit an error and close when no bytes arrive for the given duration.
    void SetIdleReadTimeoutMs(uint64_t timeoutMs);

    //==========================================================================================================
    // SetWriteQueueMaxBytes
    // Purpose: Backpressure clamp for pending write buffers.
    // Args:
    //   maxBytes: Maximum allowed bytes in write queue before emitting an error and closing.
    //==========================================================================================================
    void SetWriteQueueMaxBytes(std::size_t maxBytes);

    void SetMaxContentLength(std::size_t maxBytes);

    void SetFraming(StdioFraming framing);
    StdioFraming GetFraming() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
    friend struct StdioTransportTestHooks;
};

//==========================================================================================================
// StdioTransportFactory
// Purpose: Creates stdio transports from "key=value;..." options:
//   timeout_ms, idle_read_timeout_ms, write_queue_max_bytes, max_content_length, framing=ndjson|content-length
//==========================================================================================================
class StdioTransportFactory : public ITransportFactory {
public:
    std::unique_ptr<ITransport> CreateTransport(const std::string& config) override;
};

struct StdioTransportTestHooks {
    static void drainFrames(StdioTransport& t, std::string& buffer);
    static void setConnected(StdioTransport& t, bool v);
    static bool isConnected(const StdioTransport& t);
    // Frames queued for stdout and not yet written (the writer thread is not running in tests).
    static std::vector<std::string> queuedFrames(StdioTransport& t);
};

} // namespace xmcp
