//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/xmcp/media/MediaType.cpp
// Purpose: MIME type inference and X upload category mapping
//==========================================================================================================

#include "xmcp/media/MediaType.h"

#include <algorithm>
#include <cctype>
#include <string_view>
#include <unordered_map>

namespace xmcp::media {

namespace {

std::string toLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

const std::unordered_map<std::string, std::string>& extensionTable() {
    static const std::unordered_map<std::string, std::string> table = {
        {"jpg", "image/jpeg"}, {"jpeg", "image/jpeg"}, {"jpe", "image/jpeg"},
        {"png", "image/png"},
        {"gif", "image/gif"},
        {"webp", "image/webp"},
        {"bmp", "image/bmp"},
        {"tif", "image/tiff"}, {"tiff", "image/tiff"},
        {"svg", "image/svg+xml"},
        {"ico", "image/vnd.microsoft.icon"},
        {"mp4", "video/mp4"},
        {"m4v", "video/mp4"},
        {"mov", "video/quicktime"}, {"qt", "video/quicktime"},
        {"mpeg", "video/mpeg"}, {"mpg", "video/mpeg"},
        {"webm", "video/webm"},
        {"avi", "video/x-msvideo"},
    };
    return table;
}

} // namespace

const char* categoryWireName(MediaCategory category) {
    switch (category) {
        case MediaCategory::Gif: return "tweet_gif";
        case MediaCategory::Video: return "tweet_video";
        case MediaCategory::Image: break;
    }
    return "tweet_image";
}

std::string MediaTypeResolver::mimeTypeForFileName(const std::string& fileName) {
    std::string_view name(fileName);
    if (auto slash = name.find_last_of("/\\"); slash != std::string_view::npos) {
        name.remove_prefix(slash + 1);
    }
    auto dot = name.rfind('.');
    if (dot == std::string_view::npos || dot + 1 >= name.size()) {
        return kOctetStream;
    }
    const auto& table = extensionTable();
    auto it = table.find(toLower(name.substr(dot + 1)));
    return it == table.end() ? std::string(kOctetStream) : it->second;
}

MediaCategory MediaTypeResolver::categoryForMimeType(const std::string& mimeType) {
    std::string_view essence(mimeType);
    if (auto semi = essence.find(';'); semi != std::string_view::npos) {
        essence = essence.substr(0, semi);
    }
    const std::string key = toLower(trim(essence));
    if (key == "image/gif") return MediaCategory::Gif;
    if (key == "video/mp4" || key == "video/quicktime") return MediaCategory::Video;
    return MediaCategory::Image;
}

ResolvedMediaType MediaTypeResolver::resolve(const std::optional<std::string>& declaredType,
                                             const std::optional<std::string>& fileName) {
    ResolvedMediaType out;
    if (declaredType.has_value() && !declaredType->empty()) {
        out.mimeType = declaredType.value();
    } else if (fileName.has_value()) {
        out.mimeType = mimeTypeForFileName(fileName.value());
    } else {
        out.mimeType = kOctetStream;
    }
    out.category = categoryForMimeType(out.mimeType);
    return out;
}

} // namespace xmcp::media
