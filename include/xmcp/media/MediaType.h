//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/xmcp/media/MediaType.h
// Purpose: MIME type inference and X upload category mapping
//==========================================================================================================
#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace xmcp::media {

enum class MediaCategory {
    Image,
    Gif,
    Video
};

// Wire name sent as media_category: tweet_image, tweet_gif or tweet_video.
const char* categoryWireName(MediaCategory category);

struct ResolvedMediaType {
    std::string mimeType;
    MediaCategory category{MediaCategory::Image};
};

//==========================================================================================================
// MediaDescriptor
// Purpose: What initialize announces. totalBytes always equals the sum of the chunk lengths produced
//          for the same payload.
//==========================================================================================================
struct MediaDescriptor {
    std::string mimeType;
    MediaCategory category{MediaCategory::Image};
    std::uint64_t totalBytes{0};
};

//==========================================================================================================
// MediaTypeResolver
// Purpose: Pure mapping from a declared content type or a file name to (mime type, category).
//==========================================================================================================
class MediaTypeResolver {
public:
    static constexpr const char* kOctetStream = "application/octet-stream";

    //==========================================================================================================
    // resolve
    // Purpose: A non-empty declared type is used verbatim; otherwise the type is inferred from the file
    //          name extension. Never fails.
    // Args:
    //   declaredType: Content type supplied by the caller (may be empty or absent).
    //   fileName: Path or name whose extension is used for inference.
    //==========================================================================================================
    static ResolvedMediaType resolve(const std::optional<std::string>& declaredType,
                                     const std::optional<std::string>& fileName);

    // Case-insensitive extension lookup; application/octet-stream when unknown.
    static std::string mimeTypeForFileName(const std::string& fileName);

    // Category of a MIME type, ignoring case and parameters.
    static MediaCategory categoryForMimeType(const std::string& mimeType);
};

} // namespace xmcp::media
