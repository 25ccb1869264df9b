//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_x_tools.cpp
// Purpose: Tests for the X tool set, direct and over an in-memory JSON-RPC session
//==========================================================================================================

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <initializer_list>
#include <string>

#include "FakeHttpClient.h"
#include "xmcp/InMemoryTransport.hpp"
#include "xmcp/Server.h"
#include "xmcp/tools/XTools.h"
#include "xmcp/typed/Content.h"
#include "xmcp/typed/JsonFields.h"

using namespace xmcp;
using xmcp::testing::FakeHttpClient;

namespace {

const char* kMe = R"({"data":{"id":"100","name":"Me","username":"me_handle"}})";

JSONValue args(std::initializer_list<std::pair<const char*, JSONValue>> kv) {
    JSONValue::Object o;
    for (const auto& [k, v] : kv) o[k] = std::make_shared<JSONValue>(v);
    return JSONValue{o};
}

JSONValue str(const char* s) {
    return JSONValue{std::string(s)};
}

class XToolsTest : public ::testing::Test {
protected:
    XToolsTest()
        : api(http, x::XApiOptions{"https://api.example/2", "tok"}),
          uploader(http, media::UploaderOptions{"https://api.example/2", "tok", 4}),
          server(Implementation{"xmcp-test", "0.0.0"}) {
        tools::RegisterXTools(server, tools::XToolsContext{api, uploader, http});
    }

    ToolResult call(const std::string& name, const JSONValue& arguments) {
        auto fut = server.CallTool(name, arguments);
        EXPECT_EQ(fut.wait_for(std::chrono::seconds(5)), std::future_status::ready);
        return fut.get();
    }

    static JSONValue resultJson(const ToolResult& r) {
        auto text = typed::firstText(r);
        EXPECT_TRUE(text.has_value());
        return ParseJSON(text.value_or("null"));
    }

    FakeHttpClient http;
    x::XApiClient api;
    media::MediaUploader uploader;
    Server server;
};

} // namespace

TEST_F(XToolsTest, RegistersEveryToolSortedWithSchemas) {
    auto tools = server.ListTools();
    ASSERT_EQ(tools.size(), tools::XToolNames().size());
    ASSERT_EQ(tools.size(), 19u);
    for (std::size_t i = 1; i < tools.size(); ++i) {
        EXPECT_LT(tools[i - 1].name, tools[i].name);
    }
    for (const auto& t : tools) {
        EXPECT_FALSE(t.description.empty()) << t.name;
        EXPECT_EQ(typed::getString(t.inputSchema, "type"), std::optional<std::string>("object")) << t.name;
    }
    auto it = std::find_if(tools.begin(), tools.end(), [](const Tool& t) { return t.name == "post_twitter"; });
    ASSERT_NE(it, tools.end());
    const auto* required = typed::getArray(it->inputSchema, "required");
    ASSERT_NE(required, nullptr);
    ASSERT_EQ(required->size(), 1u);
    EXPECT_EQ(std::get<std::string>((*required)[0]->value), "post");
    const JSONValue* props = typed::getObject(it->inputSchema, "properties");
    ASSERT_NE(props, nullptr);
    EXPECT_NE(typed::getObject(*props, "media_url"), nullptr);
}

TEST_F(XToolsTest, GetMeReturnsUserJson) {
    http.reply(200, kMe);
    ToolResult r = call("get_me", JSONValue{JSONValue::Object{}});
    EXPECT_FALSE(r.isError);
    ASSERT_EQ(r.content.size(), 1u);
    JSONValue me = resultJson(r);
    EXPECT_EQ(typed::getString(me, "id"), std::optional<std::string>("100"));
    EXPECT_EQ(typed::getString(me, "username"), std::optional<std::string>("me_handle"));
}

TEST_F(XToolsTest, MissingArgumentNamesIt) {
    ToolResult r = call("like_tweet", JSONValue{JSONValue::Object{}});
    EXPECT_TRUE(r.isError);
    auto text = typed::firstText(r);
    ASSERT_TRUE(text.has_value());
    EXPECT_NE(text->find("tweet_id"), std::string::npos);
    EXPECT_EQ(http.requestCount(), 0u);
}

TEST_F(XToolsTest, MistypedArgumentIsErrorResult) {
    ToolResult r = call("search_tweets", args({{"query", str("x")}, {"max_results", str("ten")}}));
    EXPECT_TRUE(r.isError);
    EXPECT_NE(typed::firstText(r).value_or("").find("max_results"), std::string::npos);
    EXPECT_EQ(http.requestCount(), 0u);
}

TEST_F(XToolsTest, OversizedCountIsErrorResult) {
    ToolResult r = call("get_timeline", args({{"count", ParseJSON("99999999999999999999")}}));
    EXPECT_TRUE(r.isError);
    EXPECT_NE(typed::firstText(r).value_or("").find("count"), std::string::npos);
    EXPECT_EQ(http.requestCount(), 0u);
}

TEST_F(XToolsTest, PostWithMediaUrlUploadsThenTweets) {
    http.reply(200, "PNGDATA", "image/png");
    http.reply(200, R"({"data":{"id":"mid-1"}})");
    http.reply(204, "");
    http.reply(204, "");
    http.reply(200, R"({"data":{"id":"mid-1"}})");
    http.reply(201, R"({"data":{"id":"t1","text":"look"}})");

    ToolResult r = call("post_twitter", args({{"post", str("look")}, {"media_url", str("https://cdn.example/a.png")}}));
    ASSERT_FALSE(r.isError) << typed::firstText(r).value_or("");
    EXPECT_EQ(typed::getString(resultJson(r), "id"), std::optional<std::string>("t1"));

    auto reqs = http.requests();
    ASSERT_EQ(reqs.size(), 6u);
    EXPECT_EQ(reqs[0].method, "GET");
    EXPECT_EQ(reqs[0].url, "https://cdn.example/a.png");
    EXPECT_FALSE(reqs[0].header("Authorization").has_value());
    JSONValue init = ParseJSON(reqs[1].body.value());
    EXPECT_EQ(typed::getString(init, "media_type"), std::optional<std::string>("image/png"));
    EXPECT_EQ(typed::getInt(init, "total_bytes"), std::optional<int64_t>(7));
    EXPECT_EQ(reqs[2].file->data, "PNGD");
    EXPECT_EQ(reqs[3].file->data, "ATA");
    EXPECT_EQ(reqs[5].url, "https://api.example/2/tweets");
    JSONValue tweet = ParseJSON(reqs[5].body.value());
    const JSONValue* media = typed::getObject(tweet, "media");
    ASSERT_NE(media, nullptr);
    const auto* ids = typed::getArray(*media, "media_ids");
    ASSERT_NE(ids, nullptr);
    ASSERT_EQ(ids->size(), 1u);
    EXPECT_EQ(std::get<std::string>((*ids)[0]->value), "mid-1");
}

TEST_F(XToolsTest, DownloadWithoutContentTypeDefaultsToJpeg) {
    http.reply(200, "JPG", "");
    http.reply(200, R"({"data":{"id":"m2"}})");
    http.reply(204, "");
    http.reply(200, R"({"data":{"id":"m2"}})");
    http.reply(201, R"({"data":{"id":"t2","text":"x"}})");

    ToolResult r = call("post_twitter", args({{"post", str("x")}, {"media_url", str("https://cdn.example/raw")}}));
    ASSERT_FALSE(r.isError) << typed::firstText(r).value_or("");
    JSONValue init = ParseJSON(http.requests()[1].body.value());
    EXPECT_EQ(typed::getString(init, "media_type"), std::optional<std::string>("image/jpeg"));
    EXPECT_EQ(typed::getString(init, "media_category"), std::optional<std::string>("tweet_image"));
}

TEST_F(XToolsTest, FailedDownloadDoesNotTweet) {
    http.reply(404, "missing", "text/plain");
    ToolResult r = call("post_twitter", args({{"post", str("x")}, {"media_url", str("https://cdn.example/404")}}));
    EXPECT_TRUE(r.isError);
    EXPECT_NE(typed::firstText(r).value_or("").find("404"), std::string::npos);
    EXPECT_EQ(http.requestCount(), 1u);
}

TEST_F(XToolsTest, FailedUploadDoesNotTweet) {
    http.reply(200, "GIF", "image/gif");
    http.reply(403, "forbidden");
    ToolResult r = call("post_twitter", args({{"post", str("x")}, {"media_url", str("https://cdn.example/a.gif")}}));
    EXPECT_TRUE(r.isError);
    EXPECT_NE(typed::firstText(r).value_or("").find("Media upload failed"), std::string::npos);
    EXPECT_EQ(http.requestCount(), 2u);
}

TEST_F(XToolsTest, PostWithoutMediaTweetsText) {
    http.reply(201, R"({"data":{"id":"t3","text":"just text"}})");
    ToolResult r = call("post_twitter", args({{"post", str("just text")}}));
    ASSERT_FALSE(r.isError);
    auto reqs = http.requests();
    ASSERT_EQ(reqs.size(), 1u);
    JSONValue tweet = ParseJSON(reqs[0].body.value());
    EXPECT_EQ(typed::findField(tweet, "media"), nullptr);
}

TEST_F(XToolsTest, ReplyQuotesAndRepliesToSameTweet) {
    http.reply(201, R"({"data":{"id":"t4","text":"re"}})");
    ToolResult r = call("reply_twitter", args({{"post", str("re")}, {"tweet_id", str("77")}}));
    ASSERT_FALSE(r.isError);
    JSONValue tweet = ParseJSON(http.requests()[0].body.value());
    EXPECT_EQ(typed::getString(tweet, "quote_tweet_id"), std::optional<std::string>("77"));
    const JSONValue* reply = typed::getObject(tweet, "reply");
    ASSERT_NE(reply, nullptr);
    EXPECT_EQ(typed::getString(*reply, "in_reply_to_tweet_id"), std::optional<std::string>("77"));
}

TEST_F(XToolsTest, ListToolsUseDefaultsAndAcceptNumericStrings) {
    http.reply(200, R"({"data":[{"id":"1","text":"a"}]})");
    http.reply(200, R"({"data":[]})");
    ToolResult a = call("search_tweets", args({{"query", str("cats")}}));
    ToolResult b = call("get_lasest_tweets_from_user", args({{"user_id", str("9")}, {"max_results", str("7")}}));
    ASSERT_FALSE(a.isError);
    ASSERT_FALSE(b.isError);
    EXPECT_TRUE(resultJson(a).isArray());
    auto reqs = http.requests();
    EXPECT_EQ(reqs[0].url, "https://api.example/2/tweets/search/recent?query=cats&max_results=10");
    EXPECT_EQ(reqs[1].url, "https://api.example/2/users/9/tweets?max_results=7");
}

TEST_F(XToolsTest, TimelinePassesCountAndBounds) {
    http.reply(200, kMe);
    http.reply(200, R"({"data":[]})");
    ToolResult r = call("get_timeline", args({{"count", JSONValue{static_cast<int64_t>(3)}},
                                              {"end_time", str("2024-02-01T00:00:00Z")}}));
    ASSERT_FALSE(r.isError) << typed::firstText(r).value_or("");
    EXPECT_EQ(http.requests()[1].url,
              "https://api.example/2/users/100/timelines/reverse_chronological"
              "?max_results=3&end_time=2024-02-01T00%3A00%3A00Z");
}

TEST_F(XToolsTest, ApiErrorBecomesErrorResult) {
    http.reply(404, R"({"title":"Not Found Error"})");
    ToolResult r = call("get_tweet_by_id", args({{"tweet_id", str("1")}}));
    EXPECT_TRUE(r.isError);
    EXPECT_NE(typed::firstText(r).value_or("").find("HTTP 404"), std::string::npos);
}

TEST_F(XToolsTest, FollowAndUnfollow) {
    http.reply(200, kMe);
    http.reply(200, R"({"data":{"following":true,"pending_follow":false}})");
    http.reply(200, R"({"data":{"following":false}})");
    JSONValue followed = resultJson(call("follow_user", args({{"user_id", str("5")}})));
    EXPECT_EQ(typed::getBool(followed, "following"), std::optional<bool>(true));
    EXPECT_EQ(typed::getBool(followed, "pending_follow"), std::optional<bool>(false));
    JSONValue unfollowed = resultJson(call("unfollow_user", args({{"user_id", str("5")}})));
    EXPECT_EQ(typed::getBool(unfollowed, "following"), std::optional<bool>(false));
}

TEST_F(XToolsTest, EndToEndOverInMemoryTransport) {
    auto pair = InMemoryTransport::CreatePair();
    auto client = std::move(pair.first);
    auto serverTrans = std::move(pair.second);
    server.Start(std::move(serverTrans)).get();
    client->Start().get();

    auto init = std::make_unique<JSONRPCRequest>();
    init->id = static_cast<int64_t>(1);
    init->method = Methods::Initialize;
    init->params.emplace(JSONValue::Object{});
    auto initFut = client->SendRequest(std::move(init));
    ASSERT_EQ(initFut.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    auto initResp = initFut.get();
    ASSERT_TRUE(initResp && initResp->result.has_value());

    http.reply(200, R"({"data":{"id":"12","name":"Jack","username":"jack"}})");
    auto req = std::make_unique<JSONRPCRequest>();
    req->id = static_cast<int64_t>(2);
    req->method = Methods::CallTool;
    JSONValue::Object params;
    params["name"] = std::make_shared<JSONValue>(std::string("get_user_by_username"));
    params["arguments"] = std::make_shared<JSONValue>(args({{"username", str("jack")}}));
    req->params.emplace(params);
    auto fut = client->SendRequest(std::move(req));
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    auto resp = fut.get();
    ASSERT_TRUE(resp != nullptr);
    ASSERT_FALSE(resp->IsError());
    ASSERT_TRUE(resp->result.has_value());
    EXPECT_EQ(typed::getBool(*resp->result, "isError"), std::optional<bool>(false));
    const auto* content = typed::getArray(*resp->result, "content");
    ASSERT_NE(content, nullptr);
    ASSERT_EQ(content->size(), 1u);
    auto text = typed::getText(*(*content)[0]);
    ASSERT_TRUE(text.has_value());
    JSONValue user = ParseJSON(*text);
    EXPECT_EQ(typed::getString(user, "username"), std::optional<std::string>("jack"));
    EXPECT_EQ(http.requests()[0].url, "https://api.example/2/users/by/username/jack");

    client->Close().get();
    server.Stop().get();
}
