//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ContentFramer.h
// Purpose: Interface for message framing on the stdio transport (newline and Content-Length)
//========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <memory>

namespace xmcp {

class IContentFramer {
public:
    virtual ~IContentFramer() = default;
    enum class DecodeStatus {
        Ok,
        Incomplete,
        InvalidHeader,
        BodyTooLarge
    };
    struct DecodeResult {
        DecodeStatus status;
        std::optional<std::string> payload; // present when status==Ok
        std::size_t bytesConsumed{0};       // bytes to drop from the front of the buffer
    };
    virtual std::string encode(const std::string& payload) = 0;
    virtual std::optional<std::string> tryDecode(std::string& buffer) = 0;
    virtual DecodeResult tryDecodeEx(const std::string& buffer) = 0;
};

// "Content-Length: N\r\n\r\n<body>" frames.
std::unique_ptr<IContentFramer> MakeContentLengthFramer(std::size_t maxContentLength = 4 * 1024 * 1024);

// One JSON document per line; a trailing '\r' is stripped.
std::unique_ptr<IContentFramer> MakeNewlineFramer(std::size_t maxLineLength = 4 * 1024 * 1024);

// True when the buffer (after leading whitespace) begins with a Content-Length header name.
bool LooksLikeContentLengthFrame(const std::string& buffer);

} // namespace xmcp
