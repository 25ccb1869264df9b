//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ContentFramer.cpp
// Purpose: Content-Length and newline-delimited framers for the stdio transport
//========================================================================================================

#include <algorithm>
#include <cctype>
#include <limits>
#include <optional>
#include <string>

#include "logging/Logger.h"
#include "xmcp/ContentFramer.h"

namespace xmcp {

namespace {

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

class ContentLengthFramer : public IContentFramer {
public:
    explicit ContentLengthFramer(std::size_t maxLen) : maxContentLength(maxLen) {}

    std::string encode(const std::string& payload) override {
        std::string header = "Content-Length: " + std::to_string(payload.size()) + "\r\n\r\n";
        std::string frame; frame.reserve(header.size() + payload.size());
        frame.append(header);
        frame.append(payload);
        return frame;
    }

    DecodeResult tryDecodeEx(const std::string& buffer) override {
        const std::string sep = "\r\n\r\n";
        std::size_t headerEnd = buffer.find(sep);
        if (headerEnd == std::string::npos) {
            return { DecodeStatus::Incomplete, std::nullopt, 0 };
        }
        const std::size_t headerAndSep = headerEnd + sep.size();

        // Headers may be preceded by blank lines left over from a previous newline-framed message
        std::size_t pos = 0;
        while (pos < headerEnd && std::isspace(static_cast<unsigned char>(buffer[pos]))) ++pos;

        std::size_t contentLength = 0;
        bool haveLength = false;
        while (pos < headerEnd) {
            std::size_t eol = buffer.find("\r\n", pos);
            if (eol == std::string::npos || eol > headerEnd) {
                eol = headerEnd;
            }
            std::string line = buffer.substr(pos, eol - pos);
            auto colon = line.find(':');
            if (colon != std::string::npos) {
                std::string name = toLower(line.substr(0, colon));
                std::string value = line.substr(colon + 1);
                value.erase(value.begin(), std::find_if(value.begin(), value.end(), [](unsigned char ch){ return !std::isspace(ch); }));
                if (name == "content-length") {
                    unsigned long long v64 = 0;
                    try {
                        std::size_t used = 0;
                        v64 = std::stoull(value, &used);
                        if (used == 0) throw std::invalid_argument("empty");
                    } catch (const std::exception&) {
                        LOG_WARN("Invalid Content-Length header: {}", value);
                        return { DecodeStatus::InvalidHeader, std::nullopt, headerAndSep };
                    }
                    if (v64 > maxContentLength || v64 > std::numeric_limits<std::size_t>::max() - headerAndSep) {
                        LOG_WARN("Content-Length {} exceeds limits (max={})", v64, maxContentLength);
                        return { DecodeStatus::BodyTooLarge, std::nullopt, headerAndSep };
                    }
                    contentLength = static_cast<std::size_t>(v64);
                    haveLength = true;
                }
            }
            pos = eol + 2;
        }

        if (!haveLength) {
            LOG_WARN("Missing Content-Length header");
            return { DecodeStatus::InvalidHeader, std::nullopt, headerAndSep };
        }

        std::size_t frameTotal = headerAndSep + contentLength;
        if (buffer.size() < frameTotal) {
            return { DecodeStatus::Incomplete, std::nullopt, 0 };
        }
        return { DecodeStatus::Ok, buffer.substr(headerAndSep, contentLength), frameTotal };
    }

    std::optional<std::string> tryDecode(std::string& buffer) override {
        DecodeResult r = tryDecodeEx(buffer);
        if (r.status == DecodeStatus::Ok && r.payload.has_value()) {
            buffer.erase(0, std::min(r.bytesConsumed, buffer.size()));
            return r.payload;
        }
        return std::nullopt;
    }

private:
    std::size_t maxContentLength;
};

class NewlineFramer : public IContentFramer {
public:
    explicit NewlineFramer(std::size_t maxLen) : maxLineLength(maxLen) {}

    std::string encode(const std::string& payload) override {
        std::string frame; frame.reserve(payload.size() + 1);
        frame.append(payload);
        frame.push_back('\n');
        return frame;
    }

    DecodeResult tryDecodeEx(const std::string& buffer) override {
        std::size_t eol = buffer.find('\n');
        if (eol == std::string::npos) {
            if (buffer.size() > maxLineLength) {
                LOG_WARN("Line of {} bytes exceeds max {}", buffer.size(), maxLineLength);
                return { DecodeStatus::BodyTooLarge, std::nullopt, buffer.size() };
            }
            return { DecodeStatus::Incomplete, std::nullopt, 0 };
        }
        if (eol > maxLineLength) {
            LOG_WARN("Line of {} bytes exceeds max {}", eol, maxLineLength);
            return { DecodeStatus::BodyTooLarge, std::nullopt, eol + 1 };
        }
        std::string line = buffer.substr(0, eol);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        return { DecodeStatus::Ok, std::move(line), eol + 1 };
    }

    std::optional<std::string> tryDecode(std::string& buffer) override {
        DecodeResult r = tryDecodeEx(buffer);
        if (r.status == DecodeStatus::Ok && r.payload.has_value()) {
            buffer.erase(0, std::min(r.bytesConsumed, buffer.size()));
            return r.payload;
        }
        return std::nullopt;
    }

private:
    std::size_t maxLineLength;
};

} // namespace

std::unique_ptr<IContentFramer> MakeContentLengthFramer(std::size_t maxContentLength) {
    return std::make_unique<ContentLengthFramer>(maxContentLength);
}

std::unique_ptr<IContentFramer> MakeNewlineFramer(std::size_t maxLineLength) {
    return std::make_unique<NewlineFramer>(maxLineLength);
}

bool LooksLikeContentLengthFrame(const std::string& buffer) {
    static const std::string kHeader = "content-length";
    std::size_t pos = 0;
    while (pos < buffer.size() && std::isspace(static_cast<unsigned char>(buffer[pos]))) ++pos;
    if (buffer.size() - pos < kHeader.size()) {
        // Not enough bytes to decide; only a prefix of the header name counts as a match
        return !buffer.empty() && pos < buffer.size() &&
               kHeader.compare(0, buffer.size() - pos, toLower(buffer.substr(pos))) == 0;
    }
    return toLower(buffer.substr(pos, kHeader.size())) == kHeader;
}

} // namespace xmcp
