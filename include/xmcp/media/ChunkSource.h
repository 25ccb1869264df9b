//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/xmcp/media/ChunkSource.h
// Purpose: Lazy, ordered segmentation of an upload payload into bounded chunks
//==========================================================================================================
#pragma once

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace xmcp::media {

//==========================================================================================================
// Chunk
// Purpose: One append payload. 1 <= bytes.size() <= max chunk size; segmentIndex counts from 0 in
//          payload byte order.
//==========================================================================================================
struct Chunk {
    std::size_t segmentIndex{0};
    std::string bytes;

    std::size_t length() const { return bytes.size(); }
};

//==========================================================================================================
// IChunkSource
// Purpose: Single-pass producer of chunks covering the payload exactly once. A fresh source is needed
//          to start over. Not safe for concurrent use.
//==========================================================================================================
class IChunkSource {
public:
    virtual ~IChunkSource() = default;

    // Next chunk, or std::nullopt once the payload is exhausted. Throws SourceReadError on I/O failure.
    virtual std::optional<Chunk> next() = 0;

    // Payload size in bytes (equals the sum of all chunk lengths).
    virtual std::uint64_t totalBytes() const = 0;
};

//==========================================================================================================
// FileChunkSource
// Purpose: Sequential reads of up to maxChunkSize bytes from an on-disk file.
// Throws (constructor):
//   std::invalid_argument for maxChunkSize == 0, SourceNotFoundError when the path does not exist,
//   SourceReadError when it cannot be opened.
//==========================================================================================================
class FileChunkSource : public IChunkSource {
public:
    FileChunkSource(const std::string& path, std::size_t maxChunkSize);

    std::optional<Chunk> next() override;
    std::uint64_t totalBytes() const override { return size; }

private:
    std::string path;
    std::ifstream in;
    std::uint64_t size{0};
    std::size_t maxChunkSize;
    std::size_t nextIndex{0};
    bool exhausted{false};
};

//==========================================================================================================
// MemoryChunkSource
// Purpose: Slices a caller-owned buffer at 0, C, 2C, ...; the buffer must outlive the source.
//==========================================================================================================
class MemoryChunkSource : public IChunkSource {
public:
    MemoryChunkSource(std::string_view data, std::size_t maxChunkSize);

    std::optional<Chunk> next() override;
    std::uint64_t totalBytes() const override { return data.size(); }

private:
    std::string_view data;
    std::size_t maxChunkSize;
    std::size_t offset{0};
    std::size_t nextIndex{0};
};

} // namespace xmcp::media
