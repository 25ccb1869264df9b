//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/xmcp/tools/XTools.cpp
// Purpose: X (Twitter) tool definitions, argument handling and result rendering
//==========================================================================================================

#include "xmcp/tools/XTools.h"

#include <charconv>
#include <climits>
#include <format>
#include <future>
#include <initializer_list>
#include <stdexcept>

#include "logging/Logger.h"
#include "xmcp/media/UploadErrors.h"
#include "xmcp/typed/Content.h"
#include "xmcp/typed/JsonFields.h"

namespace xmcp::tools {

namespace {

// Raised for missing or mistyped tool arguments; rendered as an isError result.
class ToolArgumentError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

//------------------------------ Schema ------------------------------
struct Param {
    const char* name;
    const char* type;  // "string" or "integer"
    const char* description;
    bool required;
    int64_t defaultValue{0};
};

JSONValue makeSchema(std::initializer_list<Param> params) {
    JSONValue::Object properties;
    JSONValue::Array required;
    for (const auto& p : params) {
        JSONValue::Object prop;
        prop["type"] = std::make_shared<JSONValue>(std::string(p.type));
        prop["description"] = std::make_shared<JSONValue>(std::string(p.description));
        if (!p.required && std::string(p.type) == "integer") {
            prop["default"] = std::make_shared<JSONValue>(p.defaultValue);
        }
        properties[p.name] = std::make_shared<JSONValue>(prop);
        if (p.required) {
            required.push_back(std::make_shared<JSONValue>(std::string(p.name)));
        }
    }
    JSONValue::Object schema;
    schema["type"] = std::make_shared<JSONValue>(std::string("object"));
    schema["properties"] = std::make_shared<JSONValue>(properties);
    schema["required"] = std::make_shared<JSONValue>(required);
    return JSONValue{schema};
}

//------------------------------ Arguments ------------------------------
bool isAbsent(const JSONValue& args, const std::string& key) {
    const JSONValue* f = typed::findField(args, key);
    return f == nullptr || f->isNull();
}

std::string requireString(const JSONValue& args, const std::string& key) {
    if (isAbsent(args, key)) {
        throw ToolArgumentError("Missing required argument: " + key);
    }
    auto v = typed::getString(args, key);
    if (!v.has_value()) {
        throw ToolArgumentError("Argument " + key + " must be a string");
    }
    if (v->empty()) {
        throw ToolArgumentError("Missing required argument: " + key);
    }
    return *v;
}

std::optional<std::string> optionalString(const JSONValue& args, const std::string& key) {
    if (isAbsent(args, key)) return std::nullopt;
    auto v = typed::getString(args, key);
    if (!v.has_value()) {
        throw ToolArgumentError("Argument " + key + " must be a string");
    }
    if (v->empty()) return std::nullopt;
    return v;
}

// Integers may also arrive as decimal strings from loosely typed clients.
int intArg(const JSONValue& args, const std::string& key, int defaultValue) {
    if (isAbsent(args, key)) return defaultValue;
    std::optional<int64_t> v = typed::getInt(args, key);
    if (!v.has_value()) {
        if (auto s = typed::getString(args, key)) {
            int64_t parsed = 0;
            auto [ptr, ec] = std::from_chars(s->data(), s->data() + s->size(), parsed);
            if (ec == std::errc{} && ptr == s->data() + s->size()) v = parsed;
        }
    }
    if (!v.has_value() || *v < INT_MIN || *v > INT_MAX) {
        throw ToolArgumentError("Argument " + key + " must be an integer");
    }
    return static_cast<int>(*v);
}

//------------------------------ Registration ------------------------------
using ToolBody = std::function<JSONValue(const JSONValue&, std::stop_token)>;

ToolResult runTool(const std::string& name, const ToolBody& body, const JSONValue& args, std::stop_token st) {
    try {
        return typed::makeTextResult(SerializeJSON(body(args, st)));
    } catch (const ToolArgumentError& e) {
        LOG_WARN("Tool {}: {}", name, e.what());
        return typed::makeErrorResult(e.what());
    } catch (const x::XApiError& e) {
        LOG_ERROR("Tool {}: {}", name, e.what());
        return typed::makeErrorResult(e.what());
    } catch (const media::UploadError& e) {
        LOG_ERROR("Tool {}: media upload failed: {}", name, e.what());
        return typed::makeErrorResult(std::string("Media upload failed: ") + e.what());
    } catch (const http::HttpError& e) {
        LOG_ERROR("Tool {}: transport error: {}", name, e.what());
        return typed::makeErrorResult(e.what());
    } catch (const std::exception& e) {
        LOG_ERROR("Tool {}: {}", name, e.what());
        return typed::makeErrorResult(e.what());
    }
}

void addTool(IServer& server, const char* name, const char* description, JSONValue schema, ToolBody body) {
    Tool tool{name, description, std::move(schema)};
    std::string toolName{name};
    server.RegisterTool(tool, [toolName, body = std::move(body)](const JSONValue& args, std::stop_token st)
                                  -> std::future<ToolResult> {
        return std::async(std::launch::async, [toolName, body, args, st]() {
            return runTool(toolName, body, args, st);
        });
    });
}

//------------------------------ post_twitter media ------------------------------
std::string uploadFromUrl(const XToolsContext& ctx, const std::string& mediaUrl, std::stop_token st) {
    LOG_INFO("Downloading media from {}", mediaUrl);
    http::HttpResponse res = ctx.downloader.Get(mediaUrl, {});
    if (!res.ok()) {
        throw std::runtime_error(std::format("Media download from {} failed (HTTP {})", mediaUrl, res.status));
    }
    std::string contentType = res.contentType.empty() ? std::string(kDefaultDownloadMimeType) : res.contentType;
    LOG_DEBUG("Downloaded {} bytes of {}", res.body.size(), contentType);
    return ctx.uploader.UploadMedia(std::string_view(res.body), contentType, st);
}

} // namespace

std::vector<std::string> XToolNames() {
    return {"get_me", "post_twitter", "reply_twitter", "get_timeline", "like_tweet", "unlike_tweet",
            "retweet_tweet", "unretweet_tweet", "get_user_by_username", "get_user_by_id", "search_tweets",
            "get_lasest_tweets_from_user", "delete_tweet", "get_tweet_by_id", "follow_user", "unfollow_user",
            "get_followers", "get_following", "search_all_twitter"};
}

void RegisterXTools(IServer& server, const XToolsContext& ctx) {
    FUNC_SCOPE();

    addTool(server, "get_me", "Get my X/Twitter user info", makeSchema({}),
            [ctx](const JSONValue&, std::stop_token) { return x::toJson(ctx.api.GetMe()); });

    addTool(server, "post_twitter", "Create new X/Twitter post",
            makeSchema({{"post", "string", "The content of the Twitter post to be created.", true},
                        {"media_url", "string", "URL of media to attach to the post.", false}}),
            [ctx](const JSONValue& args, std::stop_token st) {
                x::CreateTweetParams params;
                params.text = requireString(args, "post");
                if (auto mediaUrl = optionalString(args, "media_url")) {
                    params.mediaIds.push_back(uploadFromUrl(ctx, *mediaUrl, st));
                }
                return x::toJson(ctx.api.CreateTweet(params));
            });

    addTool(server, "reply_twitter", "Reply to an existing X/Twitter post",
            makeSchema({{"post", "string", "The content of the reply post.", true},
                        {"tweet_id", "string", "The ID of the tweet to reply to.", true}}),
            [ctx](const JSONValue& args, std::stop_token) {
                x::CreateTweetParams params;
                params.text = requireString(args, "post");
                std::string tweetId = requireString(args, "tweet_id");
                params.inReplyToTweetId = tweetId;
                params.quoteTweetId = tweetId;
                return x::toJson(ctx.api.CreateTweet(params));
            });

    addTool(server, "get_timeline", "Get recent tweets from my X/Twitter timeline",
            makeSchema({{"count", "integer", "Number of tweets to retrieve from timeline.", false, 5},
                        {"start_time", "string", "ISO 8601 start time for fetching tweets.", false},
                        {"end_time", "string", "ISO 8601 end time for fetching tweets.", false}}),
            [ctx](const JSONValue& args, std::stop_token) {
                return x::toJson(ctx.api.GetHomeTimeline(intArg(args, "count", 5), optionalString(args, "start_time"),
                                                     optionalString(args, "end_time")));
            });

    addTool(server, "like_tweet", "Like a tweet on X/Twitter",
            makeSchema({{"tweet_id", "string", "The ID of the tweet to like.", true}}),
            [ctx](const JSONValue& args, std::stop_token) {
                return x::toJson(ctx.api.Like(requireString(args, "tweet_id")));
            });

    addTool(server, "unlike_tweet", "Unlike a tweet on X/Twitter",
            makeSchema({{"tweet_id", "string", "The ID of the tweet to unlike.", true}}),
            [ctx](const JSONValue& args, std::stop_token) {
                return x::toJson(ctx.api.Unlike(requireString(args, "tweet_id")));
            });

    addTool(server, "retweet_tweet", "Retweet a tweet on X/Twitter",
            makeSchema({{"tweet_id", "string", "The ID of the tweet to retweet.", true}}),
            [ctx](const JSONValue& args, std::stop_token) {
                return x::toJson(ctx.api.Retweet(requireString(args, "tweet_id")));
            });

    addTool(server, "unretweet_tweet", "Unretweet a tweet on X/Twitter",
            makeSchema({{"tweet_id", "string", "The ID of the tweet to unretweet.", true}}),
            [ctx](const JSONValue& args, std::stop_token) {
                return x::toJson(ctx.api.Unretweet(requireString(args, "tweet_id")));
            });

    addTool(server, "get_user_by_username", "Get user info by username on X/Twitter",
            makeSchema({{"username", "string", "The username of the Twitter user.", true}}),
            [ctx](const JSONValue& args, std::stop_token) {
                return x::toJson(ctx.api.GetUserByUsername(requireString(args, "username")));
            });

    addTool(server, "get_user_by_id", "Get user info by user ID on X/Twitter",
            makeSchema({{"user_id", "string", "The user ID of the Twitter user.", true}}),
            [ctx](const JSONValue& args, std::stop_token) {
                return x::toJson(ctx.api.GetUserById(requireString(args, "user_id")));
            });

    addTool(server, "search_tweets", "Search recent tweets on X/Twitter",
            makeSchema({{"query", "string", "The search query string.", true},
                        {"max_results", "integer", "Maximum number of tweets to return.", false, 10}}),
            [ctx](const JSONValue& args, std::stop_token) {
                std::string query = requireString(args, "query");
                return x::toJson(ctx.api.SearchRecent(query, intArg(args, "max_results", 10)));
            });

    addTool(server, "get_lasest_tweets_from_user", "Get latest tweets from a user on X/Twitter",
            makeSchema({{"user_id", "string", "The user ID of the Twitter user.", true},
                        {"max_results", "integer", "Maximum number of tweets to return.", false, 5}}),
            [ctx](const JSONValue& args, std::stop_token) {
                std::string userId = requireString(args, "user_id");
                return x::toJson(ctx.api.GetUserTweets(userId, intArg(args, "max_results", 5)));
            });

    addTool(server, "delete_tweet", "Delete a tweet on X/Twitter",
            makeSchema({{"tweet_id", "string", "The ID of the tweet to delete.", true}}),
            [ctx](const JSONValue& args, std::stop_token) {
                return x::toJson(ctx.api.DeleteTweet(requireString(args, "tweet_id")));
            });

    addTool(server, "get_tweet_by_id", "Get tweet by ID on X/Twitter",
            makeSchema({{"tweet_id", "string", "The ID of the tweet to retrieve.", true}}),
            [ctx](const JSONValue& args, std::stop_token) {
                return x::toJson(ctx.api.GetTweet(requireString(args, "tweet_id")));
            });

    addTool(server, "follow_user", "Follow a user on X/Twitter",
            makeSchema({{"user_id", "string", "The user ID of the Twitter user to follow.", true}}),
            [ctx](const JSONValue& args, std::stop_token) {
                return x::toJson(ctx.api.Follow(requireString(args, "user_id")));
            });

    addTool(server, "unfollow_user", "Unfollow a user on X/Twitter",
            makeSchema({{"user_id", "string", "The user ID of the Twitter user to unfollow.", true}}),
            [ctx](const JSONValue& args, std::stop_token) {
                return x::toJson(ctx.api.Unfollow(requireString(args, "user_id")));
            });

    addTool(server, "get_followers", "Get followers of a user on X/Twitter",
            makeSchema({{"user_id", "string", "The user ID of the Twitter user.", true},
                        {"max_results", "integer", "Maximum number of followers to return.", false, 10}}),
            [ctx](const JSONValue& args, std::stop_token) {
                std::string userId = requireString(args, "user_id");
                return x::toJson(ctx.api.GetFollowers(userId, intArg(args, "max_results", 10)));
            });

    addTool(server, "get_following", "Get following of a user on X/Twitter",
            makeSchema({{"user_id", "string", "The user ID of the Twitter user.", true},
                        {"max_results", "integer", "Maximum number of following to return.", false, 10}}),
            [ctx](const JSONValue& args, std::stop_token) {
                std::string userId = requireString(args, "user_id");
                return x::toJson(ctx.api.GetFollowing(userId, intArg(args, "max_results", 10)));
            });

    addTool(server, "search_all_twitter", "Search all tweets on X/Twitter",
            makeSchema({{"query", "string", "The search query string.", true},
                        {"max_results", "integer", "Maximum number of tweets to return.", false, 10}}),
            [ctx](const JSONValue& args, std::stop_token) {
                std::string query = requireString(args, "query");
                return x::toJson(ctx.api.SearchAll(query, intArg(args, "max_results", 10)));
            });

    LOG_INFO("Registered {} X tools", XToolNames().size());
}

} // namespace xmcp::tools
