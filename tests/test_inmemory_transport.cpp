//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_inmemory_transport.cpp
// Purpose: InMemoryTransport routing, disconnect and concurrency tests
//==========================================================================================================

#include <gtest/gtest.h>
#include "xmcp/Transport.h"
#include "xmcp/InMemoryTransport.hpp"
#include "xmcp/JSONRPCTypes.h"
#include "xmcp/Protocol.h"
#include "xmcp/errors/Errors.h"
#include <future>
#include <chrono>
#include <memory>
#include <string>

using namespace xmcp;

TEST(InMemoryTransport, RequestResponseRoutes) {
    auto pair = InMemoryTransport::CreatePair();
    auto client = std::move(pair.first);
    auto server = std::move(pair.second);

    // Server: handle any request with { message: "ok" }
    server->SetRequestHandler([](const JSONRPCRequest& req) -> std::unique_ptr<JSONRPCResponse> {
        (void)req;
        auto resp = std::make_unique<JSONRPCResponse>();
        JSONValue::Object obj; obj["message"] = std::make_shared<JSONValue>(std::string("ok"));
        resp->result = JSONValue{obj};
        return resp;
    });

    // Start both ends
    client->Start().get();
    server->Start().get();

    // Client sends request
    auto req = std::make_unique<JSONRPCRequest>();
    req->method = "test/echo";
    req->params.emplace(JSONValue::Object{});

    auto fut = client->SendRequest(std::move(req));
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    auto resp = fut.get();
    ASSERT_TRUE(resp != nullptr);
    ASSERT_FALSE(resp->IsError());
    ASSERT_TRUE(resp->result.has_value());
    ASSERT_TRUE(std::holds_alternative<JSONValue::Object>(resp->result->value));
    const auto& obj = std::get<JSONValue::Object>(resp->result->value);
    auto it = obj.find("message");
    ASSERT_TRUE(it != obj.end());
    ASSERT_TRUE(std::holds_alternative<std::string>(it->second->value));
    EXPECT_EQ(std::get<std::string>(it->second->value), "ok");

    // Close
    client->Close().get();
    server->Close().get();
}

TEST(InMemoryTransport, ErrorWhenPeerDisconnected) {
    auto pair = InMemoryTransport::CreatePair();
    auto client = std::move(pair.first);
    auto server = std::move(pair.second);

    client->Start().get();
    server->Start().get();

    // Disconnect server first
    server->Close().get();

    // Attempt to send request should immediately return error response
    auto req = std::make_unique<JSONRPCRequest>();
    req->method = "test/any";
    auto fut = client->SendRequest(std::move(req));
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    auto resp = fut.get();
    ASSERT_TRUE(resp != nullptr);
    ASSERT_TRUE(resp->IsError());

    client->Close().get();
}

TEST(InMemoryTransport, NotificationRouting) {
    auto pair = InMemoryTransport::CreatePair();
    auto client = std::move(pair.first);
    auto server = std::move(pair.second);

    std::promise<std::string> methodPromise;
    auto methodFuture = methodPromise.get_future();

    server->SetNotificationHandler([&](std::unique_ptr<JSONRPCNotification> note){
        methodPromise.set_value(note->method);
    });

    client->Start().get();
    server->Start().get();

    auto n = std::make_unique<JSONRPCNotification>();
    n->method = "notify/ping";
    JSONValue::Object obj; obj["x"] = std::make_shared<JSONValue>(static_cast<int64_t>(1));
    n->params.emplace(obj);
    client->SendNotification(std::move(n)).get();

    ASSERT_EQ(methodFuture.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_EQ(methodFuture.get(), std::string("notify/ping"));

    client->Close().get();
    server->Close().get();
}

TEST(InMemoryTransport, RequestWithoutHandlerIsMethodNotFound) {
    auto pair = InMemoryTransport::CreatePair();
    auto client = std::move(pair.first);
    auto server = std::move(pair.second);

    client->Start().get();
    server->Start().get();

    auto req = std::make_unique<JSONRPCRequest>();
    req->method = "test/unrouted";
    auto fut = client->SendRequest(std::move(req));
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    auto resp = fut.get();
    ASSERT_TRUE(resp != nullptr);
    auto parsed = errors::mcpErrorFromResponse(*resp);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->code, JSONRPCErrorCodes::MethodNotFound);

    client->Close().get();
    server->Close().get();
}

TEST(InMemoryTransport, PendingRequestsFailOnClose) {
    auto pair = InMemoryTransport::CreatePair();
    auto client = std::move(pair.first);
    auto server = std::move(pair.second);

    // Server handler blocks until released so the client's request stays pending
    auto gate = std::make_shared<std::promise<void>>();
    std::shared_future<void> release = gate->get_future().share();
    server->SetRequestHandler([release](const JSONRPCRequest&) -> std::unique_ptr<JSONRPCResponse> {
        release.wait();
        auto resp = std::make_unique<JSONRPCResponse>();
        resp->result = JSONValue{JSONValue::Object{}};
        return resp;
    });

    client->Start().get();
    server->Start().get();

    auto req = std::make_unique<JSONRPCRequest>();
    req->method = "test/wait";
    auto fut = client->SendRequest(std::move(req));

    // Close client to fail pending requests
    client->Close().get();

    ASSERT_EQ(fut.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    auto resp = fut.get();
    ASSERT_TRUE(resp != nullptr);
    ASSERT_TRUE(resp->IsError());

    gate->set_value();
    server->Close().get();
}

TEST(InMemoryTransport, NotificationWhileRequestProcessing) {
    auto pair = InMemoryTransport::CreatePair();
    auto server = std::move(pair.first);
    auto client = std::move(pair.second);

    auto requestStarted = std::make_shared<std::promise<void>>();
    auto started = requestStarted->get_future();
    auto gate = std::make_shared<std::promise<void>>();
    std::shared_future<void> allowFinish = gate->get_future().share();

    server->SetRequestHandler([requestStarted, allowFinish](const JSONRPCRequest& req) -> std::unique_ptr<JSONRPCResponse> {
        (void)req;
        requestStarted->set_value();
        allowFinish.wait();
        auto resp = std::make_unique<JSONRPCResponse>();
        resp->result = JSONValue(static_cast<int64_t>(1));
        return resp;
    });

    auto notifiedPromise = std::make_shared<std::promise<void>>();
    std::shared_future<void> notified = notifiedPromise->get_future().share();
    server->SetNotificationHandler([notifiedPromise](std::unique_ptr<JSONRPCNotification> note) {
        (void)note;
        notifiedPromise->set_value();
    });

    ASSERT_NO_THROW({ server->Start().get(); });
    ASSERT_NO_THROW({ client->Start().get(); });

    auto req = std::make_unique<JSONRPCRequest>();
    req->method = std::string("long");
    auto fut = client->SendRequest(std::move(req));

    ASSERT_EQ(started.wait_for(std::chrono::seconds(2)), std::future_status::ready);

    auto note = std::make_unique<JSONRPCNotification>();
    note->method = std::string("n");
    (void)client->SendNotification(std::move(note));

    // The notification is delivered while the request handler is still blocked
    ASSERT_EQ(notified.wait_for(std::chrono::seconds(2)), std::future_status::ready);

    gate->set_value();
    auto resp = std::move(fut).get();
    ASSERT_TRUE(resp);
    ASSERT_TRUE(resp->result.has_value());
    const auto& v = resp->result->get();
    ASSERT_TRUE(std::holds_alternative<int64_t>(v));
    EXPECT_EQ(std::get<int64_t>(v), 1);

    ASSERT_NO_THROW({ client->Close().get(); });
    ASSERT_NO_THROW({ server->Close().get(); });
}
