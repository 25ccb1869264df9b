//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_media_uploader.cpp
// Purpose: End-to-end tests for MediaUploader against a scripted HTTP client
//==========================================================================================================

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <stop_token>
#include <string>

#include "FakeHttpClient.h"
#include "xmcp/JSONRPCTypes.h"
#include "xmcp/media/MediaUploader.h"
#include "xmcp/media/UploadErrors.h"
#include "xmcp/typed/JsonFields.h"

using namespace xmcp;
using namespace xmcp::media;
using xmcp::testing::FakeHttpClient;

namespace {

UploaderOptions options(std::size_t chunkSize = kDefaultChunkSize) {
    UploaderOptions o;
    o.baseUrl = "https://api.example/2";
    o.bearerToken = "secret";
    o.chunkSize = chunkSize;
    return o;
}

void scriptSuccess(FakeHttpClient& http, const std::string& id, std::size_t appends) {
    http.reply(200, R"({"data":{"id":")" + id + R"("}})");
    for (std::size_t i = 0; i < appends; ++i) http.reply(204, "");
    http.reply(200, R"({"data":{"id":")" + id + R"(","processing_info":{"state":"succeeded"}}})");
}

// Announces one size and then yields a different number of bytes, like a file rewritten mid-upload.
class ResizedSource : public IChunkSource {
public:
    ResizedSource(std::uint64_t announced, std::size_t chunks) : announced(announced), remaining(chunks) {}

    std::optional<Chunk> next() override {
        if (remaining == 0) return std::nullopt;
        --remaining;
        return Chunk{index++, std::string(4, 'r')};
    }
    std::uint64_t totalBytes() const override { return announced; }

private:
    std::uint64_t announced;
    std::size_t remaining;
    std::size_t index{0};
};

} // namespace

TEST(MediaUploader, SplitsPayloadIntoDefaultChunks) {
    FakeHttpClient http;
    scriptSuccess(http, "777", 3);
    MediaUploader uploader(http, options());
    std::string bytes(2500000, '\x5a');

    EXPECT_EQ(uploader.UploadMedia(std::string_view(bytes), "video/mp4"), "777");

    auto reqs = http.requests();
    ASSERT_EQ(reqs.size(), 5u);
    JSONValue init = ParseJSON(reqs[0].body.value());
    EXPECT_EQ(typed::getInt(init, "total_bytes"), std::optional<int64_t>(2500000));
    EXPECT_EQ(typed::getString(init, "media_category"), std::optional<std::string>("tweet_video"));
    ASSERT_TRUE(reqs[1].file.has_value());
    EXPECT_EQ(reqs[1].file->data.size(), 1048576u);
    EXPECT_EQ(reqs[2].file->data.size(), 1048576u);
    EXPECT_EQ(reqs[3].file->data.size(), 402848u);
    EXPECT_EQ(reqs[1].fields[0].value, "0");
    EXPECT_EQ(reqs[2].fields[0].value, "1");
    EXPECT_EQ(reqs[3].fields[0].value, "2");
    EXPECT_EQ(reqs[4].url, "https://api.example/2/media/upload/777/finalize");
    for (const auto& r : reqs) {
        EXPECT_EQ(r.header("Authorization"), std::optional<std::string>("Bearer secret"));
    }
}

TEST(MediaUploader, UploadsFileWithInferredType) {
    auto path = std::filesystem::temp_directory_path() / "xmcp_uploader_test.gif";
    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << "GIF89a-some-bytes";
    }
    FakeHttpClient http;
    scriptSuccess(http, "g1", 2);
    MediaUploader uploader(http, options(10));

    EXPECT_EQ(uploader.UploadMedia(path.string()), "g1");
    auto reqs = http.requests();
    ASSERT_EQ(reqs.size(), 4u);
    JSONValue init = ParseJSON(reqs[0].body.value());
    EXPECT_EQ(typed::getString(init, "media_type"), std::optional<std::string>("image/gif"));
    EXPECT_EQ(typed::getString(init, "media_category"), std::optional<std::string>("tweet_gif"));
    EXPECT_EQ(reqs[1].file->data + reqs[2].file->data, "GIF89a-some-bytes");
    std::filesystem::remove(path);
}

TEST(MediaUploader, InitializeRejectedSendsNoAppend) {
    FakeHttpClient http;
    http.reply(401, "unauthorized");
    MediaUploader uploader(http, options());
    EXPECT_THROW((void)uploader.UploadMedia(std::string_view("abc"), "image/png"), InitializationError);
    EXPECT_EQ(http.requestCount(), 1u);
}

TEST(MediaUploader, AppendFailureStopsUpload) {
    FakeHttpClient http;
    http.reply(200, R"({"data":{"id":"m5"}})");
    http.reply(204, "");
    http.reply(204, "");
    http.reply(500, "oops");
    MediaUploader uploader(http, options(2));
    try {
        (void)uploader.UploadMedia(std::string_view("abcdefghij"), "image/png");
        FAIL() << "expected AppendError";
    } catch (const AppendError& e) {
        EXPECT_EQ(e.segmentIndex(), 2u);
        EXPECT_EQ(e.status(), 500);
    }
    EXPECT_EQ(http.requestCount(), 4u);
    EXPECT_EQ(http.pendingReplies(), 0u);
}

TEST(MediaUploader, EmptyPayloadStillFinalizes) {
    FakeHttpClient http;
    scriptSuccess(http, "e0", 0);
    MediaUploader uploader(http, options());
    EXPECT_EQ(uploader.UploadMedia(std::string_view(), "image/png"), "e0");
    auto reqs = http.requests();
    ASSERT_EQ(reqs.size(), 2u);
    EXPECT_EQ(reqs[1].url, "https://api.example/2/media/upload/e0/finalize");
}

TEST(MediaUploader, MissingFileSendsNothing) {
    FakeHttpClient http;
    MediaUploader uploader(http, options());
    auto path = std::filesystem::temp_directory_path() / "xmcp_no_such_media.png";
    std::filesystem::remove(path);
    EXPECT_THROW((void)uploader.UploadMedia(path.string()), SourceNotFoundError);
    EXPECT_EQ(http.requestCount(), 0u);
}

TEST(MediaUploader, CancelledBeforeStartSendsNothing) {
    FakeHttpClient http;
    MediaUploader uploader(http, options());
    std::stop_source src;
    src.request_stop();
    EXPECT_THROW((void)uploader.UploadMedia(std::string_view("abc"), "image/png", src.get_token()),
                 UploadCancelledError);
    EXPECT_EQ(http.requestCount(), 0u);
}

TEST(MediaUploader, InvalidOptionsRejected) {
    FakeHttpClient http;
    auto noToken = options();
    noToken.bearerToken.clear();
    EXPECT_THROW(MediaUploader(http, noToken), std::invalid_argument);
    EXPECT_THROW(MediaUploader(http, options(0)), std::invalid_argument);
    auto noBase = options();
    noBase.baseUrl.clear();
    EXPECT_THROW(MediaUploader(http, noBase), std::invalid_argument);
}

TEST(MediaUploader, SourceThatGrowsIsReadError) {
    FakeHttpClient http;
    scriptSuccess(http, "grow", 2);
    MediaUploader uploader(http, options(4));
    ResizedSource source(8, 3);

    EXPECT_THROW(uploader.Upload(source, MediaTypeResolver::resolve("image/png", std::nullopt)), SourceReadError);
    auto reqs = http.requests();
    ASSERT_EQ(reqs.size(), 3u);
    for (const auto& r : reqs) EXPECT_EQ(r.url.find("/finalize"), std::string::npos);
}

TEST(MediaUploader, SourceThatShrinksIsReadError) {
    FakeHttpClient http;
    scriptSuccess(http, "shrink", 1);
    MediaUploader uploader(http, options(4));
    ResizedSource source(8, 1);

    EXPECT_THROW(uploader.Upload(source, MediaTypeResolver::resolve("image/png", std::nullopt)), SourceReadError);
    EXPECT_EQ(http.requests().size(), 2u);
}
