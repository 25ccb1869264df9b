//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_cancellation.cpp
// Purpose: notifications/cancelled reaching in-flight tools/call requests through their stop tokens
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <thread>

#include "xmcp/InMemoryTransport.hpp"
#include "xmcp/JSONRPCTypes.h"
#include "xmcp/Protocol.h"
#include "xmcp/Server.h"
#include "xmcp/errors/Errors.h"

using namespace xmcp;

namespace {

class CancellationTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto pair = InMemoryTransport::CreatePair();
        client = std::move(pair.first);
        serverTransport = std::move(pair.second);
    }

    void TearDown() override {
        client->Close().get();
        server.Stop().get();
    }

    void start() {
        server.Start(std::move(serverTransport)).get();
        client->Start().get();
    }

    std::future<std::unique_ptr<JSONRPCResponse>> callTool(JSONRPCId id, const std::string& name) {
        auto req = std::make_unique<JSONRPCRequest>();
        req->id = std::move(id);
        req->method = Methods::CallTool;
        JSONValue::Object params;
        params["name"] = std::make_shared<JSONValue>(name);
        params["arguments"] = std::make_shared<JSONValue>(JSONValue::Object{});
        req->params.emplace(params);
        return client->SendRequest(std::move(req));
    }

    void cancel(const std::string& field, JSONValue id) {
        auto note = std::make_unique<JSONRPCNotification>();
        note->method = Methods::Cancelled;
        JSONValue::Object params;
        params[field] = std::make_shared<JSONValue>(std::move(id));
        params["reason"] = std::make_shared<JSONValue>(std::string("user abort"));
        note->params.emplace(params);
        (void)client->SendNotification(std::move(note));
    }

    // Requests and notifications share one inbound queue, so a ping answered means
    // every earlier notification has been handled.
    void drain() {
        auto req = std::make_unique<JSONRPCRequest>();
        req->method = Methods::Ping;
        auto fut = client->SendRequest(std::move(req));
        ASSERT_EQ(fut.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    }

    static void expectCancelled(std::future<std::unique_ptr<JSONRPCResponse>>& fut) {
        ASSERT_EQ(fut.wait_for(std::chrono::seconds(2)), std::future_status::ready);
        auto resp = fut.get();
        ASSERT_TRUE(resp != nullptr);
        auto err = errors::mcpErrorFromResponse(*resp);
        ASSERT_TRUE(err.has_value());
        EXPECT_EQ(err->code, JSONRPCErrorCodes::RequestCancelled);
        EXPECT_EQ(err->message, "Cancelled");
    }

    Server server{Implementation{"TestServer", "1.0"}};
    std::unique_ptr<InMemoryTransport> client;
    std::unique_ptr<InMemoryTransport> serverTransport;
};

ToolHandler quickTool() {
    return [](const JSONValue&, std::stop_token) {
        std::promise<ToolResult> p;
        p.set_value(ToolResult{});
        return p.get_future();
    };
}

// Spins until its stop token fires, then reports through `observed`.
ToolHandler cooperativeTool(std::shared_ptr<std::promise<void>> observed) {
    return [observed](const JSONValue&, std::stop_token st) {
        return std::async(std::launch::async, [observed, st]() {
            while (!st.stop_requested()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
            observed->set_value();
            return ToolResult{};
        });
    };
}

} // namespace

TEST_F(CancellationTest, LongRunningToolAnswersCancelled) {
    // Ignores its stop token; the reply is still replaced by the cancellation error
    server.RegisterTool(Tool{"upload_video", "Slow upload"}, [](const JSONValue&, std::stop_token) {
        return std::async(std::launch::async, []() {
            std::this_thread::sleep_for(std::chrono::milliseconds(300));
            return ToolResult{};
        });
    });
    start();

    auto fut = callTool(std::string("cancel-1"), "upload_video");
    cancel("requestId", JSONValue{std::string("cancel-1")});
    expectCancelled(fut);
}

TEST_F(CancellationTest, CooperativeToolObservesStopToken) {
    auto observed = std::make_shared<std::promise<void>>();
    auto observedFut = observed->get_future();
    server.RegisterTool(Tool{"cooperative", "Spins until cancelled"}, cooperativeTool(observed));
    start();

    auto fut = callTool(std::string("cancel-2"), "cooperative");
    cancel("requestId", JSONValue{std::string("cancel-2")});
    expectCancelled(fut);
    EXPECT_EQ(observedFut.wait_for(std::chrono::seconds(2)), std::future_status::ready);
}

TEST_F(CancellationTest, LegacyIdFieldAndNumericIds) {
    auto observed = std::make_shared<std::promise<void>>();
    server.RegisterTool(Tool{"cooperative", "Spins until cancelled"}, cooperativeTool(observed));
    start();

    auto fut = callTool(static_cast<int64_t>(42), "cooperative");
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    cancel("id", JSONValue{static_cast<int64_t>(42)});
    expectCancelled(fut);
}

TEST_F(CancellationTest, CancellingAnotherIdLeavesCallRunning) {
    std::atomic<bool> stopSeen{false};
    server.RegisterTool(Tool{"get_me", "Quick"}, [&stopSeen](const JSONValue&, std::stop_token st) {
        return std::async(std::launch::async, [&stopSeen, st]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            stopSeen = st.stop_requested();
            return ToolResult{};
        });
    });
    start();

    auto fut = callTool(std::string("keep-me"), "get_me");
    cancel("requestId", JSONValue{std::string("someone-else")});
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    auto resp = fut.get();
    ASSERT_TRUE(resp != nullptr);
    EXPECT_FALSE(resp->IsError());
    EXPECT_FALSE(stopSeen.load());
}

TEST_F(CancellationTest, CancelBeforeRequestIsHonoured) {
    auto observed = std::make_shared<std::promise<void>>();
    server.RegisterTool(Tool{"cooperative", "Spins until cancelled"}, cooperativeTool(observed));
    start();

    cancel("requestId", JSONValue{std::string("early-1")});
    drain();
    auto fut = callTool(std::string("early-1"), "cooperative");
    expectCancelled(fut);
}

TEST_F(CancellationTest, LateCancelDoesNotPoisonReusedId) {
    server.RegisterTool(Tool{"get_me", "Quick"}, quickTool());
    start();

    auto first = callTool(static_cast<int64_t>(7), "get_me");
    ASSERT_EQ(first.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    auto firstResp = first.get();
    ASSERT_TRUE(firstResp != nullptr);
    EXPECT_FALSE(firstResp->IsError());

    // Arrives after the call has already answered
    cancel("requestId", JSONValue{static_cast<int64_t>(7)});
    drain();

    auto second = callTool(static_cast<int64_t>(7), "get_me");
    ASSERT_EQ(second.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    auto secondResp = second.get();
    ASSERT_TRUE(secondResp != nullptr);
    EXPECT_FALSE(errors::mcpErrorFromResponse(*secondResp).has_value());
}
