//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/xmcp/media/ChunkSource.cpp
// Purpose: File and memory chunk sources
//==========================================================================================================

#include "xmcp/media/ChunkSource.h"

#include <algorithm>
#include <filesystem>
#include <stdexcept>
#include <system_error>

#include "logging/Logger.h"
#include "xmcp/media/UploadErrors.h"

namespace xmcp::media {

namespace fs = std::filesystem;

FileChunkSource::FileChunkSource(const std::string& path, std::size_t maxChunkSize)
    : path(path), maxChunkSize(maxChunkSize) {
    if (maxChunkSize == 0) {
        throw std::invalid_argument("chunk size must be positive");
    }
    std::error_code ec;
    if (!fs::exists(path, ec) || ec) {
        throw SourceNotFoundError(path);
    }
    if (!fs::is_regular_file(path, ec) || ec) {
        throw SourceReadError("media source is not a regular file: " + path);
    }
    size = static_cast<std::uint64_t>(fs::file_size(path, ec));
    if (ec) {
        throw SourceReadError("cannot stat media source " + path + ": " + ec.message());
    }
    in.open(path, std::ios::binary);
    if (!in.is_open()) {
        throw SourceReadError("cannot open media source: " + path);
    }
    LOG_DEBUG("FileChunkSource: {} ({} bytes, chunk size {})", path, size, maxChunkSize);
}

std::optional<Chunk> FileChunkSource::next() {
    if (exhausted) {
        return std::nullopt;
    }
    Chunk chunk;
    chunk.segmentIndex = nextIndex;
    chunk.bytes.resize(maxChunkSize);
    in.read(chunk.bytes.data(), static_cast<std::streamsize>(maxChunkSize));
    const std::streamsize got = in.gcount();
    if (in.bad()) {
        exhausted = true;
        throw SourceReadError("read failed on media source: " + path);
    }
    if (got <= 0) {
        // A zero-byte read terminates the sequence
        exhausted = true;
        return std::nullopt;
    }
    chunk.bytes.resize(static_cast<std::size_t>(got));
    if (in.eof()) {
        exhausted = true;
    }
    ++nextIndex;
    return chunk;
}

MemoryChunkSource::MemoryChunkSource(std::string_view data, std::size_t maxChunkSize)
    : data(data), maxChunkSize(maxChunkSize) {
    if (maxChunkSize == 0) {
        throw std::invalid_argument("chunk size must be positive");
    }
}

std::optional<Chunk> MemoryChunkSource::next() {
    if (offset >= data.size()) {
        return std::nullopt;
    }
    const std::size_t len = std::min(maxChunkSize, data.size() - offset);
    Chunk chunk{nextIndex++, std::string(data.substr(offset, len))};
    offset += len;
    return chunk;
}

} // namespace xmcp::media
