//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/xmcp/x/XApiTypes.h
// Purpose: Typed results of the X API v2 operations and their JSON mapping
//==========================================================================================================
#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "xmcp/JSONRPCTypes.h"

namespace xmcp::x {

//==========================================================================================================
// XApiError
// Purpose: Non-2xx response, or a 2xx response whose body does not have the documented shape.
//==========================================================================================================
class XApiError : public std::runtime_error {
public:
    XApiError(int status, std::string body, const std::string& context);
    int status() const { return status_; }
    const std::string& body() const { return body_; }
private:
    int status_;
    std::string body_;
};

struct UserPublicMetrics {
    std::optional<int64_t> followersCount;
    std::optional<int64_t> followingCount;
    std::optional<int64_t> tweetCount;
    std::optional<int64_t> listedCount;
};

struct User {
    std::string id;
    std::string name;
    std::string username;
    std::optional<std::string> description;
    std::optional<std::string> createdAt;
    std::optional<std::string> location;
    std::optional<std::string> profileImageUrl;
    std::optional<std::string> url;
    std::optional<bool> isProtected;
    std::optional<bool> verified;
    std::optional<UserPublicMetrics> publicMetrics;
};

struct Tweet {
    std::string id;
    std::string text;
    std::optional<std::string> authorId;
    std::optional<std::string> createdAt;
    std::optional<std::string> conversationId;
    std::optional<std::string> inReplyToUserId;
    std::vector<std::string> editHistoryTweetIds;
};

struct TweetList {
    std::vector<Tweet> tweets;
    std::optional<int64_t> resultCount;
    std::optional<std::string> nextToken;
};

struct UserList {
    std::vector<User> users;
    std::optional<int64_t> resultCount;
    std::optional<std::string> nextToken;
};

struct PostedTweet {
    std::string id;
    std::string text;
    std::vector<std::string> editHistoryTweetIds;
};

struct LikeResult { bool liked{false}; };
struct RetweetResult { bool retweeted{false}; };
struct DeleteResult { bool deleted{false}; };

struct FollowResult {
    bool following{false};
    std::optional<bool> pendingFollow;
};

////////////////////////////////////////// Decoding //////////////////////////////////////////
// Each decoder takes the "data" member (object or array) of a response and throws std::invalid_argument
// when a required field is missing or mistyped.
User userFromJson(const JSONValue& v);
Tweet tweetFromJson(const JSONValue& v);
PostedTweet postedTweetFromJson(const JSONValue& v);
// Whole response body: {"data":[...]?, "meta":{result_count,next_token}?}. Missing data means empty.
TweetList tweetListFromJson(const JSONValue& root);
UserList userListFromJson(const JSONValue& root);

////////////////////////////////////////// Encoding //////////////////////////////////////////
// X API field names; absent optionals are omitted.
JSONValue toJson(const User& u);
JSONValue toJson(const Tweet& t);
JSONValue toJson(const PostedTweet& t);
JSONValue toJson(const LikeResult& r);
JSONValue toJson(const RetweetResult& r);
JSONValue toJson(const DeleteResult& r);
JSONValue toJson(const FollowResult& r);
// Lists encode as a bare JSON array of their elements.
JSONValue toJson(const TweetList& l);
JSONValue toJson(const UserList& l);

} // namespace xmcp::x
