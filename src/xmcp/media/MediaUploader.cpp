//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/xmcp/media/MediaUploader.cpp
// Purpose: upload_media entry point
//==========================================================================================================

#include "xmcp/media/MediaUploader.h"

#include <cstdint>
#include <format>
#include <stdexcept>

#include "logging/Logger.h"
#include "xmcp/media/UploadErrors.h"
#include "xmcp/media/UploadSession.h"

namespace xmcp::media {

namespace {
const std::string& validated(const UploaderOptions& o) {
    if (o.baseUrl.empty()) {
        throw std::invalid_argument("media uploader base URL must not be empty");
    }
    if (o.chunkSize == 0) {
        throw std::invalid_argument("media uploader chunk size must be positive");
    }
    return o.bearerToken;
}
}

MediaUploader::MediaUploader(http::IHttpClient& client, UploaderOptions options)
    : client(client), opts(std::move(options)), auth(validated(opts)) {
}

std::string MediaUploader::UploadMedia(const std::string& path, std::stop_token stop) {
    FUNC_SCOPE();
    FileChunkSource source(path, opts.chunkSize);
    return Upload(source, MediaTypeResolver::resolve(std::nullopt, path), stop);
}

std::string MediaUploader::UploadMedia(std::string_view bytes, const std::string& declaredMimeType, std::stop_token stop) {
    FUNC_SCOPE();
    MemoryChunkSource source(bytes, opts.chunkSize);
    return Upload(source, MediaTypeResolver::resolve(declaredMimeType, std::nullopt), stop);
}

std::string MediaUploader::Upload(IChunkSource& source, const ResolvedMediaType& type, std::stop_token stop) {
    FUNC_SCOPE();
    const MediaDescriptor descriptor{type.mimeType, type.category, source.totalBytes()};
    if (stop.stop_requested()) {
        throw UploadCancelledError(0);
    }

    UploadSession session(client, opts.baseUrl, auth.headers());
    session.initialize(descriptor);
    std::uint64_t produced = 0;
    while (auto chunk = source.next()) {
        if (stop.stop_requested()) {
            LOG_INFO("Media upload {} cancelled before segment {}", session.remoteId(), chunk->segmentIndex);
            throw UploadCancelledError(session.nextSegmentIndex());
        }
        // The source changed size after it was measured
        produced += chunk->length();
        if (produced > descriptor.totalBytes) {
            throw SourceReadError(std::format("media source grew beyond the announced {} bytes", descriptor.totalBytes));
        }
        session.append(chunk.value());
    }
    if (produced != descriptor.totalBytes) {
        throw SourceReadError(std::format("media source shrank to {} of the announced {} bytes", produced, descriptor.totalBytes));
    }
    if (stop.stop_requested()) {
        LOG_INFO("Media upload {} cancelled before finalize", session.remoteId());
        throw UploadCancelledError(session.nextSegmentIndex());
    }
    return session.finalize();
}

} // namespace xmcp::media
