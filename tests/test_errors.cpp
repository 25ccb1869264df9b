//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_errors.cpp
// Purpose: Typed JSON-RPC errors: code mapping, parsing from wire objects and server error replies
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>

#include "xmcp/InMemoryTransport.hpp"
#include "xmcp/JSONRPCTypes.h"
#include "xmcp/Protocol.h"
#include "xmcp/Server.h"
#include "xmcp/errors/Errors.h"
#include "xmcp/typed/Content.h"

using namespace xmcp;
using xmcp::errors::ErrorCategory;

TEST(Errors, CategoryMapping) {
    struct Case { int code; ErrorCategory category; };
    const Case cases[] = {
        {JSONRPCErrorCodes::ParseError, ErrorCategory::JsonRpcParse},
        {JSONRPCErrorCodes::InvalidRequest, ErrorCategory::JsonRpcInvalidRequest},
        {JSONRPCErrorCodes::MethodNotFound, ErrorCategory::JsonRpcMethodNotFound},
        {JSONRPCErrorCodes::InvalidParams, ErrorCategory::JsonRpcInvalidParams},
        {JSONRPCErrorCodes::InternalError, ErrorCategory::JsonRpcInternal},
        {JSONRPCErrorCodes::InvalidRequestId, ErrorCategory::McpInvalidRequestId},
        {JSONRPCErrorCodes::RequestCancelled, ErrorCategory::McpRequestCancelled},
        {JSONRPCErrorCodes::ToolNotFound, ErrorCategory::McpToolNotFound},
        {-32002, ErrorCategory::Unknown},
        {429, ErrorCategory::Unknown},
    };
    for (const auto& c : cases) {
        EXPECT_EQ(errors::errorCategoryFromCode(c.code), c.category) << "code " << c.code;
    }
}

TEST(Errors, ParsesWireErrorWithData) {
    JSONValue v = ParseJSON(R"({"code":-32003,"message":"Tool not found: post_twitter","data":{"tool":"post_twitter"}})");
    auto parsed = errors::mcpErrorFromErrorValue(v);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->code, JSONRPCErrorCodes::ToolNotFound);
    EXPECT_EQ(parsed->category, ErrorCategory::McpToolNotFound);
    EXPECT_EQ(parsed->message, "Tool not found: post_twitter");
    ASSERT_TRUE(parsed->data.has_value());
    ASSERT_TRUE(parsed->data->isObject());
    const auto& o = std::get<JSONValue::Object>(parsed->data->value);
    auto it = o.find("tool");
    ASSERT_TRUE(it != o.end());
    EXPECT_EQ(std::get<std::string>(it->second->value), "post_twitter");
}

TEST(Errors, RejectsMalformedErrorObjects) {
    EXPECT_FALSE(errors::mcpErrorFromErrorValue(JSONValue{nullptr}).has_value());
    EXPECT_FALSE(errors::mcpErrorFromErrorValue(ParseJSON(R"({"message":"m"})")).has_value());
    EXPECT_FALSE(errors::mcpErrorFromErrorValue(ParseJSON(R"({"code":-1})")).has_value());
    EXPECT_FALSE(errors::mcpErrorFromErrorValue(ParseJSON(R"({"code":"-32601","message":123})")).has_value());

    JSONRPCResponse ok;
    ok.result = JSONValue{JSONValue::Object{}};
    EXPECT_FALSE(errors::mcpErrorFromResponse(ok).has_value());
}

TEST(Errors, MakeErrorResponseRoundTripsThroughTheWire) {
    auto e = errors::makeError(JSONRPCErrorCodes::InvalidParams, "Invalid params: missing tool name");
    EXPECT_EQ(e.category, ErrorCategory::JsonRpcInvalidParams);
    auto resp = errors::makeErrorResponse(static_cast<int64_t>(7), e);
    ASSERT_TRUE(resp != nullptr);
    EXPECT_TRUE(resp->IsError());

    JSONRPCResponse back;
    ASSERT_TRUE(back.Deserialize(resp->Serialize()));
    ASSERT_TRUE(std::holds_alternative<int64_t>(back.id));
    EXPECT_EQ(std::get<int64_t>(back.id), 7);
    auto parsed = errors::mcpErrorFromResponse(back);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->code, e.code);
    EXPECT_EQ(parsed->message, e.message);
    EXPECT_FALSE(parsed->data.has_value());
}

//=============================== Server error replies over a transport =================================

namespace {

class ServerErrorsE2E : public ::testing::Test {
protected:
    void SetUp() override {
        auto pair = InMemoryTransport::CreatePair();
        client = std::move(pair.first);
        server.RegisterTool(Tool{"get_me", "Returns the authenticated user"}, [](const JSONValue&, std::stop_token) {
            std::promise<ToolResult> p;
            p.set_value(typed::makeTextResult("{}"));
            return p.get_future();
        });
        ASSERT_NO_THROW(server.Start(std::move(pair.second)).get());
        ASSERT_NO_THROW(client->Start().get());
    }

    void TearDown() override {
        client->Close().get();
        server.Stop().get();
    }

    std::optional<errors::McpError> send(const std::string& method, std::optional<JSONValue> params) {
        auto req = std::make_unique<JSONRPCRequest>();
        req->method = method;
        req->params = std::move(params);
        auto fut = client->SendRequest(std::move(req));
        if (fut.wait_for(std::chrono::seconds(2)) != std::future_status::ready) {
            ADD_FAILURE() << method << " timed out";
            return std::nullopt;
        }
        auto resp = fut.get();
        if (!resp) return std::nullopt;
        return errors::mcpErrorFromResponse(*resp);
    }

    Server server{Implementation{"ErrServer", "1.0"}};
    std::unique_ptr<InMemoryTransport> client;
};

} // namespace

TEST_F(ServerErrorsE2E, ToolsCallWithoutParamsIsInvalidParams) {
    auto err = send(Methods::CallTool, std::nullopt);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->code, JSONRPCErrorCodes::InvalidParams);
    EXPECT_FALSE(err->data.has_value());
}

TEST_F(ServerErrorsE2E, UnknownToolIsToolNotFound) {
    auto err = send(Methods::CallTool, ParseJSON(R"({"name":"get_you","arguments":{}})"));
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->category, ErrorCategory::McpToolNotFound);
    EXPECT_EQ(err->message, "Tool not found: get_you");
}

TEST_F(ServerErrorsE2E, UnknownMethodIsMethodNotFound) {
    auto err = send("prompts/list", ParseJSON("{}"));
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->code, JSONRPCErrorCodes::MethodNotFound);
}

TEST_F(ServerErrorsE2E, KnownToolAnswersWithoutError) {
    auto err = send(Methods::CallTool, ParseJSON(R"({"name":"get_me"})"));
    EXPECT_FALSE(err.has_value());
}
