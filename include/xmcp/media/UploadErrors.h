//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/xmcp/media/UploadErrors.h
// Purpose: Exception taxonomy of the chunked media upload
//==========================================================================================================
#pragma once

#include <cstddef>
#include <format>
#include <stdexcept>
#include <string>

namespace xmcp::media {

// Common base of every upload failure. Nothing derived from it is retried.
class UploadError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Source path does not exist; raised before any network call.
class SourceNotFoundError : public UploadError {
public:
    explicit SourceNotFoundError(const std::string& path)
        : UploadError("media source not found: " + path), path_(path) {}
    const std::string& path() const { return path_; }
private:
    std::string path_;
};

// Source exists but could not be opened or read.
class SourceReadError : public UploadError {
public:
    using UploadError::UploadError;
};

//==========================================================================================================
// Protocol phase failures. status is the HTTP status, or 0 when the request never produced a response
// (the transport error text is then carried as body).
//==========================================================================================================
class PhaseError : public UploadError {
public:
    PhaseError(const std::string& what, int status, std::string body)
        : UploadError(what), status_(status), body_(std::move(body)) {}
    int status() const { return status_; }
    const std::string& body() const { return body_; }
private:
    int status_;
    std::string body_;
};

class InitializationError : public PhaseError {
public:
    InitializationError(int status, std::string body)
        : PhaseError(std::format("media upload initialize failed (HTTP {}): {}", status, body), status, body) {}
};

class AppendError : public PhaseError {
public:
    AppendError(std::size_t segmentIndex, int status, std::string body)
        : PhaseError(std::format("media upload append of segment {} failed (HTTP {}): {}", segmentIndex, status, body), status, body),
          segmentIndex_(segmentIndex) {}
    std::size_t segmentIndex() const { return segmentIndex_; }
private:
    std::size_t segmentIndex_;
};

class FinalizationError : public PhaseError {
public:
    FinalizationError(int status, std::string body)
        : PhaseError(std::format("media upload finalize failed (HTTP {}): {}", status, body), status, body) {}
};

// The enclosing tool call was cancelled between segments; the remote upload is left unfinalized.
class UploadCancelledError : public UploadError {
public:
    explicit UploadCancelledError(std::size_t segmentsSent)
        : UploadError(std::format("media upload cancelled after {} segment(s)", segmentsSent)) {}
};

} // namespace xmcp::media
