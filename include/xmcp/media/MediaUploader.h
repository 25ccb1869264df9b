//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/xmcp/media/MediaUploader.h
// Purpose: upload_media entry point composing type resolution, chunking and the upload session
//==========================================================================================================
#pragma once

#include <cstddef>
#include <stop_token>
#include <string>
#include <string_view>

#include "xmcp/auth/BearerAuth.hpp"
#include "xmcp/http/HttpClient.hpp"
#include "xmcp/media/ChunkSource.h"
#include "xmcp/media/MediaType.h"

namespace xmcp::media {

constexpr std::size_t kDefaultChunkSize = 1048576;

struct UploaderOptions {
    std::string baseUrl{"https://api.twitter.com/2"};
    std::string bearerToken;
    std::size_t chunkSize{kDefaultChunkSize};
};

//==========================================================================================================
// MediaUploader
// Purpose: Uploads one payload per call, strictly sequentially on the calling thread. Independent calls
//          share no mutable state and may run concurrently. No retry, no resume, no remote cleanup.
//==========================================================================================================
class MediaUploader {
public:
    //==========================================================================================================
    // Throws:
    //   std::invalid_argument for an empty token or base URL, or a chunk size of 0.
    //==========================================================================================================
    MediaUploader(http::IHttpClient& client, UploaderOptions options);

    //==========================================================================================================
    // UploadMedia (file)
    // Purpose: Uploads an on-disk file; the MIME type is inferred from its extension.
    // Returns:
    //   The media id.
    // Throws:
    //   SourceNotFoundError before any request when the path does not exist, other UploadError subclasses
    //   on protocol failure, UploadCancelledError when stop is requested between segments.
    //==========================================================================================================
    std::string UploadMedia(const std::string& path, std::stop_token stop = {});

    //==========================================================================================================
    // UploadMedia (bytes)
    // Purpose: Uploads an in-memory payload with the caller's declared content type (empty means
    //          application/octet-stream).
    //==========================================================================================================
    std::string UploadMedia(std::string_view bytes, const std::string& declaredMimeType, std::stop_token stop = {});

    //==========================================================================================================
    // Upload
    // Purpose: Drives initialize, one append per chunk in order, then finalize.
    //==========================================================================================================
    std::string Upload(IChunkSource& source, const ResolvedMediaType& type, std::stop_token stop = {});

    const UploaderOptions& options() const { return opts; }

private:
    http::IHttpClient& client;
    UploaderOptions opts;
    auth::BearerAuth auth;
};

} // namespace xmcp::media
