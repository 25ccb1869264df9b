//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/xmcp/x/XApiClient.cpp
// Purpose: X API v2 client
//==========================================================================================================

#include "xmcp/x/XApiClient.h"

#include <stdexcept>

#include "logging/Logger.h"
#include "xmcp/http/Url.h"
#include "xmcp/typed/JsonFields.h"

namespace xmcp::x {

namespace {
const std::string& checked(const XApiOptions& o) {
    if (o.baseUrl.empty()) {
        throw std::invalid_argument("X API base URL must not be empty");
    }
    return o.bearerToken;
}

JSONValue::Object single(const char* key, const std::string& value) {
    JSONValue::Object o;
    o[key] = std::make_shared<JSONValue>(value);
    return o;
}
}

XApiClient::XApiClient(http::IHttpClient& client, XApiOptions options)
    : client(client), opts(std::move(options)), auth(checked(opts)) {
    while (opts.baseUrl.size() > 1 && opts.baseUrl.back() == '/') {
        opts.baseUrl.pop_back();
    }
}

std::string XApiClient::url(const std::string& path, const Query& query) const {
    return opts.baseUrl + path + http::buildQuery(query);
}

http::Headers XApiClient::headers() const {
    http::Headers h = auth.headers();
    h.push_back({"Accept", "application/json"});
    return h;
}

http::HttpResponse XApiClient::get(const std::string& u) {
    return client.Get(u, headers());
}

http::HttpResponse XApiClient::post(const std::string& u, const JSONValue& body) {
    return client.Post(u, headers(), SerializeJSON(body));
}

http::HttpResponse XApiClient::del(const std::string& u) {
    return client.Delete(u, headers());
}

JSONValue XApiClient::parseBody(const http::HttpResponse& res, const std::string& context) const {
    if (!res.ok()) {
        LOG_WARN("X API {} returned HTTP {}", context, res.status);
        throw XApiError(res.status, res.body, context);
    }
    try {
        return ParseJSON(res.body);
    } catch (const std::runtime_error& e) {
        LOG_WARN("X API {} returned malformed JSON: {}", context, e.what());
        throw XApiError(res.status, res.body, context);
    }
}

JSONValue XApiClient::dataOf(const http::HttpResponse& res, const std::string& context) const {
    JSONValue root = parseBody(res, context);
    const JSONValue* data = typed::findField(root, "data");
    if (!data || data->isNull()) {
        throw XApiError(res.status, res.body, context);
    }
    return *data;
}

bool XApiClient::dataFlag(const http::HttpResponse& res, const std::string& context, const char* key) const {
    JSONValue data = dataOf(res, context);
    auto flag = typed::getBool(data, key);
    if (!flag.has_value()) {
        throw XApiError(res.status, res.body, context);
    }
    return flag.value();
}

// Decoder failures on a 2xx body are reported as XApiError so callers see a single error type.
template <typename F>
auto decodeOr(const http::HttpResponse& res, const std::string& context, F&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const std::invalid_argument& e) {
        LOG_WARN("X API {} returned an unexpected shape: {}", context, e.what());
        throw XApiError(res.status, res.body, context);
    }
}

std::string XApiClient::MyUserId() {
    {
        std::lock_guard<std::mutex> lk(meMutex);
        if (myUserId.has_value()) return myUserId.value();
    }
    User me = GetMe();
    return me.id;
}

User XApiClient::GetMe() {
    FUNC_SCOPE();
    auto res = get(url("/users/me"));
    User me = decodeOr(res, "get me", [&] { return userFromJson(dataOf(res, "get me")); });
    std::lock_guard<std::mutex> lk(meMutex);
    myUserId = me.id;
    return me;
}

User XApiClient::GetUserByUsername(const std::string& username) {
    FUNC_SCOPE();
    auto res = get(url("/users/by/username/" + http::percentEncode(username)));
    return decodeOr(res, "get user by username", [&] { return userFromJson(dataOf(res, "get user by username")); });
}

User XApiClient::GetUserById(const std::string& userId) {
    FUNC_SCOPE();
    auto res = get(url("/users/" + http::percentEncode(userId)));
    return decodeOr(res, "get user by id", [&] { return userFromJson(dataOf(res, "get user by id")); });
}

UserList XApiClient::GetFollowers(const std::string& userId, int maxResults) {
    FUNC_SCOPE();
    auto res = get(url("/users/" + http::percentEncode(userId) + "/followers",
                       {{"max_results", std::to_string(maxResults)}}));
    return decodeOr(res, "get followers", [&] { return userListFromJson(parseBody(res, "get followers")); });
}

UserList XApiClient::GetFollowing(const std::string& userId, int maxResults) {
    FUNC_SCOPE();
    auto res = get(url("/users/" + http::percentEncode(userId) + "/following",
                       {{"max_results", std::to_string(maxResults)}}));
    return decodeOr(res, "get following", [&] { return userListFromJson(parseBody(res, "get following")); });
}

PostedTweet XApiClient::CreateTweet(const CreateTweetParams& params) {
    FUNC_SCOPE();
    JSONValue::Object body;
    body["text"] = std::make_shared<JSONValue>(params.text);
    if (!params.mediaIds.empty()) {
        JSONValue::Array ids;
        for (const auto& id : params.mediaIds) ids.push_back(std::make_shared<JSONValue>(id));
        JSONValue::Object media;
        media["media_ids"] = std::make_shared<JSONValue>(std::move(ids));
        body["media"] = std::make_shared<JSONValue>(std::move(media));
    }
    if (params.inReplyToTweetId.has_value()) {
        body["reply"] = std::make_shared<JSONValue>(single("in_reply_to_tweet_id", params.inReplyToTweetId.value()));
    }
    if (params.quoteTweetId.has_value()) {
        body["quote_tweet_id"] = std::make_shared<JSONValue>(params.quoteTweetId.value());
    }
    auto res = post(url("/tweets"), JSONValue{std::move(body)});
    PostedTweet t = decodeOr(res, "create tweet", [&] { return postedTweetFromJson(dataOf(res, "create tweet")); });
    LOG_INFO("Created tweet {}", t.id);
    return t;
}

Tweet XApiClient::GetTweet(const std::string& tweetId) {
    FUNC_SCOPE();
    auto res = get(url("/tweets/" + http::percentEncode(tweetId)));
    return decodeOr(res, "get tweet", [&] { return tweetFromJson(dataOf(res, "get tweet")); });
}

DeleteResult XApiClient::DeleteTweet(const std::string& tweetId) {
    FUNC_SCOPE();
    auto res = del(url("/tweets/" + http::percentEncode(tweetId)));
    return DeleteResult{dataFlag(res, "delete tweet", "deleted")};
}

TweetList XApiClient::GetHomeTimeline(int maxResults, const std::optional<std::string>& startTime,
                                      const std::optional<std::string>& endTime) {
    FUNC_SCOPE();
    Query q{{"max_results", std::to_string(maxResults)}};
    if (startTime.has_value()) q.emplace_back("start_time", startTime.value());
    if (endTime.has_value()) q.emplace_back("end_time", endTime.value());
    const std::string me = MyUserId();
    auto res = get(url("/users/" + http::percentEncode(me) + "/timelines/reverse_chronological", q));
    return decodeOr(res, "get home timeline", [&] { return tweetListFromJson(parseBody(res, "get home timeline")); });
}

TweetList XApiClient::GetUserTweets(const std::string& userId, int maxResults) {
    FUNC_SCOPE();
    auto res = get(url("/users/" + http::percentEncode(userId) + "/tweets",
                       {{"max_results", std::to_string(maxResults)}}));
    return decodeOr(res, "get user tweets", [&] { return tweetListFromJson(parseBody(res, "get user tweets")); });
}

TweetList XApiClient::SearchRecent(const std::string& query, int maxResults) {
    FUNC_SCOPE();
    auto res = get(url("/tweets/search/recent", {{"query", query}, {"max_results", std::to_string(maxResults)}}));
    return decodeOr(res, "search recent", [&] { return tweetListFromJson(parseBody(res, "search recent")); });
}

TweetList XApiClient::SearchAll(const std::string& query, int maxResults) {
    FUNC_SCOPE();
    auto res = get(url("/tweets/search/all", {{"query", query}, {"max_results", std::to_string(maxResults)}}));
    return decodeOr(res, "search all", [&] { return tweetListFromJson(parseBody(res, "search all")); });
}

LikeResult XApiClient::Like(const std::string& tweetId) {
    FUNC_SCOPE();
    const std::string me = MyUserId();
    auto res = post(url("/users/" + http::percentEncode(me) + "/likes"), JSONValue{single("tweet_id", tweetId)});
    return LikeResult{dataFlag(res, "like", "liked")};
}

LikeResult XApiClient::Unlike(const std::string& tweetId) {
    FUNC_SCOPE();
    const std::string me = MyUserId();
    auto res = del(url("/users/" + http::percentEncode(me) + "/likes/" + http::percentEncode(tweetId)));
    return LikeResult{dataFlag(res, "unlike", "liked")};
}

RetweetResult XApiClient::Retweet(const std::string& tweetId) {
    FUNC_SCOPE();
    const std::string me = MyUserId();
    auto res = post(url("/users/" + http::percentEncode(me) + "/retweets"), JSONValue{single("tweet_id", tweetId)});
    return RetweetResult{dataFlag(res, "retweet", "retweeted")};
}

RetweetResult XApiClient::Unretweet(const std::string& tweetId) {
    FUNC_SCOPE();
    const std::string me = MyUserId();
    auto res = del(url("/users/" + http::percentEncode(me) + "/retweets/" + http::percentEncode(tweetId)));
    return RetweetResult{dataFlag(res, "unretweet", "retweeted")};
}

FollowResult XApiClient::Follow(const std::string& targetUserId) {
    FUNC_SCOPE();
    const std::string me = MyUserId();
    auto res = post(url("/users/" + http::percentEncode(me) + "/following"),
                    JSONValue{single("target_user_id", targetUserId)});
    JSONValue data = dataOf(res, "follow");
    auto following = typed::getBool(data, "following");
    if (!following.has_value()) {
        throw XApiError(res.status, res.body, "follow");
    }
    return FollowResult{following.value(), typed::getBool(data, "pending_follow")};
}

FollowResult XApiClient::Unfollow(const std::string& targetUserId) {
    FUNC_SCOPE();
    const std::string me = MyUserId();
    auto res = del(url("/users/" + http::percentEncode(me) + "/following/" + http::percentEncode(targetUserId)));
    return FollowResult{dataFlag(res, "unfollow", "following"), std::nullopt};
}

} // namespace xmcp::x
