//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/xmcp/x/XApiTypes.cpp
// Purpose: JSON mapping of X API v2 results
//==========================================================================================================

#include "xmcp/x/XApiTypes.h"

#include <format>

#include "xmcp/typed/JsonFields.h"

namespace xmcp::x {

using typed::getArray;
using typed::getBool;
using typed::getInt;
using typed::getObject;
using typed::getString;

XApiError::XApiError(int status, std::string body, const std::string& context)
    : std::runtime_error(std::format("X API {} failed (HTTP {}): {}", context, status, body)),
      status_(status), body_(std::move(body)) {}

namespace {

std::string requireString(const JSONValue& v, const char* key, const char* type) {
    auto s = getString(v, key);
    if (!s.has_value()) {
        throw std::invalid_argument(std::format("{} is missing string field '{}'", type, key));
    }
    return s.value();
}

void requireObject(const JSONValue& v, const char* type) {
    if (!v.isObject()) {
        throw std::invalid_argument(std::format("{} is not a JSON object", type));
    }
}

std::vector<std::string> stringArray(const JSONValue& v, const char* key) {
    std::vector<std::string> out;
    if (const auto* arr = getArray(v, key)) {
        for (const auto& item : *arr) {
            if (item && item->isString()) out.push_back(std::get<std::string>(item->value));
        }
    }
    return out;
}

template <typename T>
void put(JSONValue::Object& o, const char* key, const T& value) {
    o[key] = std::make_shared<JSONValue>(value);
}

template <typename T>
void putOpt(JSONValue::Object& o, const char* key, const std::optional<T>& value) {
    if (value.has_value()) o[key] = std::make_shared<JSONValue>(value.value());
}

JSONValue stringsToJson(const std::vector<std::string>& v) {
    JSONValue::Array arr;
    for (const auto& s : v) arr.push_back(std::make_shared<JSONValue>(s));
    return JSONValue{std::move(arr)};
}

void readMeta(const JSONValue& root, std::optional<int64_t>& count, std::optional<std::string>& next) {
    if (const JSONValue* meta = getObject(root, "meta")) {
        count = getInt(*meta, "result_count");
        next = getString(*meta, "next_token");
    }
}

} // namespace

User userFromJson(const JSONValue& v) {
    requireObject(v, "user");
    User u;
    u.id = requireString(v, "id", "user");
    u.name = requireString(v, "name", "user");
    u.username = requireString(v, "username", "user");
    u.description = getString(v, "description");
    u.createdAt = getString(v, "created_at");
    u.location = getString(v, "location");
    u.profileImageUrl = getString(v, "profile_image_url");
    u.url = getString(v, "url");
    u.isProtected = getBool(v, "protected");
    u.verified = getBool(v, "verified");
    if (const JSONValue* m = getObject(v, "public_metrics")) {
        u.publicMetrics = UserPublicMetrics{
            getInt(*m, "followers_count"), getInt(*m, "following_count"),
            getInt(*m, "tweet_count"), getInt(*m, "listed_count")};
    }
    return u;
}

Tweet tweetFromJson(const JSONValue& v) {
    requireObject(v, "tweet");
    Tweet t;
    t.id = requireString(v, "id", "tweet");
    t.text = requireString(v, "text", "tweet");
    t.authorId = getString(v, "author_id");
    t.createdAt = getString(v, "created_at");
    t.conversationId = getString(v, "conversation_id");
    t.inReplyToUserId = getString(v, "in_reply_to_user_id");
    t.editHistoryTweetIds = stringArray(v, "edit_history_tweet_ids");
    return t;
}

PostedTweet postedTweetFromJson(const JSONValue& v) {
    requireObject(v, "created tweet");
    PostedTweet t;
    t.id = requireString(v, "id", "created tweet");
    t.text = getString(v, "text").value_or("");
    t.editHistoryTweetIds = stringArray(v, "edit_history_tweet_ids");
    return t;
}

TweetList tweetListFromJson(const JSONValue& root) {
    requireObject(root, "tweet list");
    TweetList l;
    if (const auto* data = getArray(root, "data")) {
        for (const auto& item : *data) {
            if (item) l.tweets.push_back(tweetFromJson(*item));
        }
    }
    readMeta(root, l.resultCount, l.nextToken);
    return l;
}

UserList userListFromJson(const JSONValue& root) {
    requireObject(root, "user list");
    UserList l;
    if (const auto* data = getArray(root, "data")) {
        for (const auto& item : *data) {
            if (item) l.users.push_back(userFromJson(*item));
        }
    }
    readMeta(root, l.resultCount, l.nextToken);
    return l;
}

JSONValue toJson(const User& u) {
    JSONValue::Object o;
    put(o, "id", u.id);
    put(o, "name", u.name);
    put(o, "username", u.username);
    putOpt(o, "description", u.description);
    putOpt(o, "created_at", u.createdAt);
    putOpt(o, "location", u.location);
    putOpt(o, "profile_image_url", u.profileImageUrl);
    putOpt(o, "url", u.url);
    putOpt(o, "protected", u.isProtected);
    putOpt(o, "verified", u.verified);
    if (u.publicMetrics.has_value()) {
        JSONValue::Object m;
        putOpt(m, "followers_count", u.publicMetrics->followersCount);
        putOpt(m, "following_count", u.publicMetrics->followingCount);
        putOpt(m, "tweet_count", u.publicMetrics->tweetCount);
        putOpt(m, "listed_count", u.publicMetrics->listedCount);
        o["public_metrics"] = std::make_shared<JSONValue>(std::move(m));
    }
    return JSONValue{std::move(o)};
}

JSONValue toJson(const Tweet& t) {
    JSONValue::Object o;
    put(o, "id", t.id);
    put(o, "text", t.text);
    putOpt(o, "author_id", t.authorId);
    putOpt(o, "created_at", t.createdAt);
    putOpt(o, "conversation_id", t.conversationId);
    putOpt(o, "in_reply_to_user_id", t.inReplyToUserId);
    if (!t.editHistoryTweetIds.empty()) {
        o["edit_history_tweet_ids"] = std::make_shared<JSONValue>(stringsToJson(t.editHistoryTweetIds));
    }
    return JSONValue{std::move(o)};
}

JSONValue toJson(const PostedTweet& t) {
    JSONValue::Object o;
    put(o, "id", t.id);
    put(o, "text", t.text);
    if (!t.editHistoryTweetIds.empty()) {
        o["edit_history_tweet_ids"] = std::make_shared<JSONValue>(stringsToJson(t.editHistoryTweetIds));
    }
    return JSONValue{std::move(o)};
}

JSONValue toJson(const LikeResult& r) {
    JSONValue::Object o;
    put(o, "liked", r.liked);
    return JSONValue{std::move(o)};
}

JSONValue toJson(const RetweetResult& r) {
    JSONValue::Object o;
    put(o, "retweeted", r.retweeted);
    return JSONValue{std::move(o)};
}

JSONValue toJson(const DeleteResult& r) {
    JSONValue::Object o;
    put(o, "deleted", r.deleted);
    return JSONValue{std::move(o)};
}

JSONValue toJson(const FollowResult& r) {
    JSONValue::Object o;
    put(o, "following", r.following);
    putOpt(o, "pending_follow", r.pendingFollow);
    return JSONValue{std::move(o)};
}

JSONValue toJson(const TweetList& l) {
    JSONValue::Array arr;
    for (const auto& t : l.tweets) arr.push_back(std::make_shared<JSONValue>(toJson(t)));
    return JSONValue{std::move(arr)};
}

JSONValue toJson(const UserList& l) {
    JSONValue::Array arr;
    for (const auto& u : l.users) arr.push_back(std::make_shared<JSONValue>(toJson(u)));
    return JSONValue{std::move(arr)};
}

} // namespace xmcp::x
