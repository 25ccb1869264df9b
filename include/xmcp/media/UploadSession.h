//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/xmcp/media/UploadSession.h
// Purpose: State machine of one remote chunked upload (initialize -> append* -> finalize)
//==========================================================================================================
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "xmcp/http/HttpClient.hpp"
#include "xmcp/media/ChunkSource.h"
#include "xmcp/media/MediaType.h"

namespace xmcp::media {

enum class UploadState {
    Uninitialized,
    Initialized,
    Appending,
    Finalized,
    Failed
};

const char* uploadStateName(UploadState state);

//==========================================================================================================
// UploadSession
// Purpose: Owns one remote upload id and drives it through the protocol, one blocking request per
//          phase or segment. Used once and discarded; never shared between threads.
//
// Transitions:
//   Uninitialized --initialize--> Initialized | Failed
//   Initialized/Appending --append--> Appending | Failed
//   Initialized/Appending --finalize--> Finalized | Failed   (from Initialized only for empty payloads)
// Any call in another state, an append whose segment index is not the next expected one, an append past
// the announced size, or a finalize before the announced size was sent throws std::logic_error before
// any request is sent.
//==========================================================================================================
class UploadSession {
public:
    //==========================================================================================================
    // Args:
    //   client: HTTP boundary; must outlive the session.
    //   baseUrl: API base, e.g. https://api.twitter.com/2 (no trailing slash required).
    //   authHeaders: Headers sent with every request (Authorization: Bearer ...).
    //==========================================================================================================
    UploadSession(http::IHttpClient& client, std::string baseUrl, http::Headers authHeaders);

    UploadSession(const UploadSession&) = delete;
    UploadSession& operator=(const UploadSession&) = delete;

    //==========================================================================================================
    // initialize
    // Purpose: POST {base}/media/upload/initialize with media_type, total_bytes and media_category.
    // Throws:
    //   InitializationError on a non-2xx status, a body that is not JSON, or a missing data.id.
    //==========================================================================================================
    void initialize(const MediaDescriptor& descriptor);

    //==========================================================================================================
    // append
    // Purpose: POST {base}/media/upload/{id}/append as multipart: segment_index plus the "media" file part.
    // Throws:
    //   std::logic_error on a contract violation, AppendError on failure.
    //==========================================================================================================
    void append(const Chunk& chunk);

    //==========================================================================================================
    // finalize
    // Purpose: POST {base}/media/upload/{id}/finalize without a body.
    // Returns:
    //   The media id to attach to a post.
    // Throws:
    //   std::logic_error on a contract violation, FinalizationError on failure.
    //==========================================================================================================
    std::string finalize();

    UploadState state() const { return state_; }
    const std::string& remoteId() const { return remoteId_; }
    std::size_t nextSegmentIndex() const { return nextSegmentIndex_; }
    std::uint64_t bytesAppended() const { return bytesAppended_; }

private:
    void requireState(bool allowed, const char* operation) const;
    std::string uploadUrl(const std::string& phase) const;

    http::IHttpClient& client;
    std::string baseUrl;
    http::Headers authHeaders;
    UploadState state_{UploadState::Uninitialized};
    std::string remoteId_;
    std::size_t nextSegmentIndex_{0};
    std::uint64_t totalBytes_{0};
    std::uint64_t bytesAppended_{0};
};

} // namespace xmcp::media
