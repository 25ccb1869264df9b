//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_upload_session.cpp
// Purpose: Tests for the initialize/append/finalize upload state machine
//==========================================================================================================

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include "FakeHttpClient.h"
#include "xmcp/JSONRPCTypes.h"
#include "xmcp/media/UploadErrors.h"
#include "xmcp/media/UploadSession.h"
#include "xmcp/typed/JsonFields.h"

using namespace xmcp;
using namespace xmcp::media;
using xmcp::testing::FakeHttpClient;

namespace {

const char* kBase = "https://upload.example/2";

http::Headers auth() {
    return {{"Authorization", "Bearer t0k"}};
}

Chunk chunk(std::size_t index, std::string bytes) {
    Chunk c;
    c.segmentIndex = index;
    c.bytes = std::move(bytes);
    return c;
}

} // namespace

TEST(UploadSession, FullLifecycle) {
    FakeHttpClient http;
    http.reply(200, R"({"data":{"id":"m-42","expires_after_secs":86400}})");
    http.reply(204, "");
    http.reply(204, "");
    http.reply(200, R"({"data":{"id":"m-42"}})");

    UploadSession s(http, std::string(kBase) + "/", auth());
    EXPECT_EQ(s.state(), UploadState::Uninitialized);
    s.initialize(MediaDescriptor{"video/mp4", MediaCategory::Video, 7});
    EXPECT_EQ(s.state(), UploadState::Initialized);
    EXPECT_EQ(s.remoteId(), "m-42");

    s.append(chunk(0, "abcd"));
    EXPECT_EQ(s.state(), UploadState::Appending);
    s.append(chunk(1, "efg"));
    EXPECT_EQ(s.nextSegmentIndex(), 2u);
    EXPECT_EQ(s.bytesAppended(), 7u);

    EXPECT_EQ(s.finalize(), "m-42");
    EXPECT_EQ(s.state(), UploadState::Finalized);

    auto reqs = http.requests();
    ASSERT_EQ(reqs.size(), 4u);
    EXPECT_EQ(reqs[0].method, "POST");
    EXPECT_EQ(reqs[0].url, "https://upload.example/2/media/upload/initialize");
    ASSERT_TRUE(reqs[0].body.has_value());
    JSONValue init = ParseJSON(reqs[0].body.value());
    EXPECT_EQ(typed::getString(init, "media_type"), std::optional<std::string>("video/mp4"));
    EXPECT_EQ(typed::getInt(init, "total_bytes"), std::optional<int64_t>(7));
    EXPECT_EQ(typed::getString(init, "media_category"), std::optional<std::string>("tweet_video"));
    EXPECT_EQ(reqs[0].header("Authorization"), std::optional<std::string>("Bearer t0k"));

    EXPECT_EQ(reqs[1].url, "https://upload.example/2/media/upload/m-42/append");
    ASSERT_EQ(reqs[1].fields.size(), 1u);
    EXPECT_EQ(reqs[1].fields[0].name, "segment_index");
    EXPECT_EQ(reqs[1].fields[0].value, "0");
    ASSERT_TRUE(reqs[1].file.has_value());
    EXPECT_EQ(reqs[1].file->fieldName, "media");
    EXPECT_EQ(reqs[1].file->fileName, "blob");
    EXPECT_EQ(reqs[1].file->contentType, "application/octet-stream");
    EXPECT_EQ(reqs[1].file->data, "abcd");
    EXPECT_EQ(reqs[2].fields[0].value, "1");

    EXPECT_EQ(reqs[3].url, "https://upload.example/2/media/upload/m-42/finalize");
    EXPECT_FALSE(reqs[3].body.has_value());
    EXPECT_EQ(reqs[3].header("Authorization"), std::optional<std::string>("Bearer t0k"));
}

TEST(UploadSession, NumericIdAccepted) {
    FakeHttpClient http;
    http.reply(201, R"({"data":{"id":1234567890123}})");
    UploadSession s(http, kBase, auth());
    s.initialize(MediaDescriptor{"image/png", MediaCategory::Image, 1});
    EXPECT_EQ(s.remoteId(), "1234567890123");
}

TEST(UploadSession, InitializeRejectedCarriesStatusAndBody) {
    FakeHttpClient http;
    http.reply(401, R"({"title":"Unauthorized"})");
    UploadSession s(http, kBase, auth());
    try {
        s.initialize(MediaDescriptor{"image/png", MediaCategory::Image, 3});
        FAIL() << "expected InitializationError";
    } catch (const InitializationError& e) {
        EXPECT_EQ(e.status(), 401);
        EXPECT_EQ(e.body(), R"({"title":"Unauthorized"})");
    }
    EXPECT_EQ(s.state(), UploadState::Failed);
    EXPECT_THROW(s.append(chunk(0, "abc")), std::logic_error);
    EXPECT_EQ(http.requestCount(), 1u);
}

TEST(UploadSession, InitializeWithoutIdFails) {
    FakeHttpClient http;
    http.reply(200, R"({"data":{}})");
    UploadSession s(http, kBase, auth());
    EXPECT_THROW(s.initialize(MediaDescriptor{"image/png", MediaCategory::Image, 3}), InitializationError);
    EXPECT_EQ(s.state(), UploadState::Failed);
}

TEST(UploadSession, InitializeMalformedJsonFails) {
    FakeHttpClient http;
    http.reply(200, "not json");
    UploadSession s(http, kBase, auth());
    EXPECT_THROW(s.initialize(MediaDescriptor{"image/png", MediaCategory::Image, 3}), InitializationError);
}

TEST(UploadSession, TransportFailureBecomesPhaseErrorWithStatusZero) {
    FakeHttpClient http;
    http.fail(std::make_exception_ptr(xmcp::http::HttpError("connect timed out")));
    UploadSession s(http, kBase, auth());
    try {
        s.initialize(MediaDescriptor{"image/png", MediaCategory::Image, 3});
        FAIL() << "expected InitializationError";
    } catch (const InitializationError& e) {
        EXPECT_EQ(e.status(), 0);
        EXPECT_EQ(e.body(), "connect timed out");
    }
}

TEST(UploadSession, AppendRejectedReportsSegment) {
    FakeHttpClient http;
    http.reply(200, R"({"data":{"id":"m1"}})");
    http.reply(204, "");
    http.reply(503, "busy");
    UploadSession s(http, kBase, auth());
    s.initialize(MediaDescriptor{"image/png", MediaCategory::Image, 6});
    s.append(chunk(0, "abc"));
    try {
        s.append(chunk(1, "def"));
        FAIL() << "expected AppendError";
    } catch (const AppendError& e) {
        EXPECT_EQ(e.segmentIndex(), 1u);
        EXPECT_EQ(e.status(), 503);
        EXPECT_EQ(e.body(), "busy");
    }
    EXPECT_EQ(s.state(), UploadState::Failed);
    EXPECT_THROW((void)s.finalize(), std::logic_error);
    EXPECT_EQ(http.requestCount(), 3u);
}

TEST(UploadSession, FinalizeRejected) {
    FakeHttpClient http;
    http.reply(200, R"({"data":{"id":"m1"}})");
    http.reply(200, "");
    http.reply(400, "bad media");
    UploadSession s(http, kBase, auth());
    s.initialize(MediaDescriptor{"image/gif", MediaCategory::Gif, 2});
    s.append(chunk(0, "gi"));
    try {
        (void)s.finalize();
        FAIL() << "expected FinalizationError";
    } catch (const FinalizationError& e) {
        EXPECT_EQ(e.status(), 400);
    }
    EXPECT_EQ(s.state(), UploadState::Failed);
}

TEST(UploadSession, ContractViolationsSendNothing) {
    FakeHttpClient http;
    UploadSession s(http, kBase, auth());
    EXPECT_THROW(s.append(chunk(0, "a")), std::logic_error);
    EXPECT_THROW((void)s.finalize(), std::logic_error);
    EXPECT_THROW(s.initialize(MediaDescriptor{"", MediaCategory::Image, 1}), std::logic_error);
    EXPECT_EQ(http.requestCount(), 0u);

    http.reply(200, R"({"data":{"id":"m1"}})");
    s.initialize(MediaDescriptor{"image/png", MediaCategory::Image, 4});
    EXPECT_THROW(s.initialize(MediaDescriptor{"image/png", MediaCategory::Image, 4}), std::logic_error);
    EXPECT_THROW(s.append(chunk(1, "ab")), std::logic_error);
    EXPECT_THROW(s.append(chunk(0, "")), std::logic_error);
    EXPECT_THROW(s.append(chunk(0, "abcde")), std::logic_error);
    EXPECT_THROW((void)s.finalize(), std::logic_error);
    EXPECT_EQ(http.requestCount(), 1u);
    EXPECT_EQ(s.state(), UploadState::Initialized);
}

TEST(UploadSession, EmptyPayloadFinalizesWithoutAppend) {
    FakeHttpClient http;
    http.reply(200, R"({"data":{"id":"m0"}})");
    http.reply(200, "");
    UploadSession s(http, kBase, auth());
    s.initialize(MediaDescriptor{"image/png", MediaCategory::Image, 0});
    EXPECT_EQ(s.finalize(), "m0");
}

TEST(UploadSession, StateNames) {
    EXPECT_STREQ(uploadStateName(UploadState::Uninitialized), "UNINITIALIZED");
    EXPECT_STREQ(uploadStateName(UploadState::Appending), "APPENDING");
    EXPECT_STREQ(uploadStateName(UploadState::Failed), "FAILED");
}
