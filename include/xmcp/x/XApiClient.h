//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/xmcp/x/XApiClient.h
// Purpose: Blocking X API v2 client returning typed results
//==========================================================================================================
#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "xmcp/auth/BearerAuth.hpp"
#include "xmcp/http/HttpClient.hpp"
#include "xmcp/x/XApiTypes.h"

namespace xmcp::x {

struct XApiOptions {
    std::string baseUrl{"https://api.twitter.com/2"};
    std::string bearerToken;
};

struct CreateTweetParams {
    std::string text;
    std::vector<std::string> mediaIds;
    std::optional<std::string> inReplyToTweetId;
    std::optional<std::string> quoteTweetId;
};

//==========================================================================================================
// XApiClient
// Purpose: One client per credential set. Every call sends "Authorization: Bearer <token>" and
//          "Accept: application/json" and throws XApiError on a non-2xx status or an unexpected body.
//          Transport failures surface as http::HttpError. The authenticated user's id ({me} in the
//          endpoint paths) is fetched once through GetMe and cached.
//==========================================================================================================
class XApiClient {
public:
    // Throws std::invalid_argument for an empty token or base URL.
    XApiClient(http::IHttpClient& client, XApiOptions options);

    ///////////////////////////////////////////// Users /////////////////////////////////////////////
    User GetMe();
    User GetUserByUsername(const std::string& username);
    User GetUserById(const std::string& userId);
    UserList GetFollowers(const std::string& userId, int maxResults);
    UserList GetFollowing(const std::string& userId, int maxResults);

    ///////////////////////////////////////////// Tweets /////////////////////////////////////////////
    PostedTweet CreateTweet(const CreateTweetParams& params);
    Tweet GetTweet(const std::string& tweetId);
    DeleteResult DeleteTweet(const std::string& tweetId);

    //==========================================================================================================
    // GetHomeTimeline
    // Purpose: Reverse-chronological home timeline of the authenticated user.
    // Args:
    //   startTime/endTime: Optional ISO 8601 bounds passed through unchanged.
    //==========================================================================================================
    TweetList GetHomeTimeline(int maxResults, const std::optional<std::string>& startTime,
                              const std::optional<std::string>& endTime);
    TweetList GetUserTweets(const std::string& userId, int maxResults);
    TweetList SearchRecent(const std::string& query, int maxResults);
    TweetList SearchAll(const std::string& query, int maxResults);

    //////////////////////////////////////////// Engagement ////////////////////////////////////////////
    LikeResult Like(const std::string& tweetId);
    LikeResult Unlike(const std::string& tweetId);
    RetweetResult Retweet(const std::string& tweetId);
    RetweetResult Unretweet(const std::string& tweetId);
    FollowResult Follow(const std::string& targetUserId);
    FollowResult Unfollow(const std::string& targetUserId);

    // Cached id of the authenticated user (calls GetMe on first use).
    std::string MyUserId();

private:
    using Query = std::vector<std::pair<std::string, std::string>>;

    std::string url(const std::string& path, const Query& query = {}) const;
    http::Headers headers() const;
    JSONValue parseBody(const http::HttpResponse& res, const std::string& context) const;
    // "data" member of a successful response; XApiError when missing.
    JSONValue dataOf(const http::HttpResponse& res, const std::string& context) const;
    bool dataFlag(const http::HttpResponse& res, const std::string& context, const char* key) const;

    http::HttpResponse get(const std::string& u);
    http::HttpResponse post(const std::string& u, const JSONValue& body);
    http::HttpResponse del(const std::string& u);

    http::IHttpClient& client;
    XApiOptions opts;
    auth::BearerAuth auth;
    std::mutex meMutex;
    std::optional<std::string> myUserId;
};

} // namespace xmcp::x
