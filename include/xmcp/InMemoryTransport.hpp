//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryTransport.hpp
// Purpose: In-process transport pair used by end-to-end tests
//==========================================================================================================
#pragma once

#include "xmcp/Transport.h"
#include <memory>
#include <utility>

namespace xmcp {

//==========================================================================================================
// InMemoryTransport
// Purpose: Delivers serialized JSON-RPC messages to a paired instance through a queue drained by a
//          worker thread. Inbound requests are handled on their own threads so a cancellation
//          notification can overtake a long-running tools/call.
//==========================================================================================================
class InMemoryTransport : public ITransport {
public:
    InMemoryTransport();
    virtual ~InMemoryTransport();

    //==========================================================================================================
    // CreatePair
    // Purpose: Creates two transports wired to each other.
    // Returns:
    //   pair(client, server) where sending on one delivers to the other.
    //==========================================================================================================
    static std::pair<std::unique_ptr<InMemoryTransport>, std::unique_ptr<InMemoryTransport>> CreatePair();

    std::future<void> Start() override;

    // Closes this side and fails its pending requests with InternalError "Transport closed".
    std::future<void> Close() override;

    bool IsConnected() const override;
    std::string GetSessionId() const override;

    std::future<std::unique_ptr<JSONRPCResponse>> SendRequest(
        std::unique_ptr<JSONRPCRequest> request) override;
    std::future<void> SendNotification(
        std::unique_ptr<JSONRPCNotification> notification) override;

    void SetNotificationHandler(NotificationHandler handler) override;
    void SetErrorHandler(ErrorHandler handler) override;
    void SetRequestHandler(RequestHandler handler) override;

private:
    class Impl;
    std::shared_ptr<Impl> pImpl;
};

} // namespace xmcp
