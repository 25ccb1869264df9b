//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/xmcp/media/UploadSession.cpp
// Purpose: Chunked upload protocol state machine
//==========================================================================================================

#include "xmcp/media/UploadSession.h"

#include <format>
#include <stdexcept>

#include "logging/Logger.h"
#include "xmcp/JSONRPCTypes.h"
#include "xmcp/http/Url.h"
#include "xmcp/media/UploadErrors.h"
#include "xmcp/typed/JsonFields.h"

namespace xmcp::media {

namespace {

// data.id as a string; numeric ids are rendered in decimal.
std::string extractDataId(const JSONValue& root) {
    const JSONValue* data = typed::getObject(root, "data");
    if (!data) return {};
    if (auto s = typed::getString(*data, "id")) return s.value();
    if (auto n = typed::getInt(*data, "id")) return std::to_string(n.value());
    return {};
}

} // namespace

const char* uploadStateName(UploadState state) {
    switch (state) {
        case UploadState::Uninitialized: return "UNINITIALIZED";
        case UploadState::Initialized: return "INITIALIZED";
        case UploadState::Appending: return "APPENDING";
        case UploadState::Finalized: return "FINALIZED";
        case UploadState::Failed: return "FAILED";
    }
    return "UNKNOWN";
}

UploadSession::UploadSession(http::IHttpClient& client, std::string baseUrl, http::Headers authHeaders)
    : client(client), baseUrl(std::move(baseUrl)), authHeaders(std::move(authHeaders)) {
    while (!this->baseUrl.empty() && this->baseUrl.back() == '/') {
        this->baseUrl.pop_back();
    }
}

void UploadSession::requireState(bool allowed, const char* operation) const {
    if (!allowed) {
        throw std::logic_error(std::format("UploadSession::{} not allowed in state {}", operation, uploadStateName(state_)));
    }
}

std::string UploadSession::uploadUrl(const std::string& phase) const {
    return baseUrl + "/media/upload/" + http::percentEncode(remoteId_) + "/" + phase;
}

void UploadSession::initialize(const MediaDescriptor& descriptor) {
    requireState(state_ == UploadState::Uninitialized, "initialize");
    if (descriptor.mimeType.empty()) {
        throw std::logic_error("UploadSession::initialize requires a media type");
    }

    JSONValue::Object body;
    body["media_type"] = std::make_shared<JSONValue>(descriptor.mimeType);
    body["total_bytes"] = std::make_shared<JSONValue>(static_cast<int64_t>(descriptor.totalBytes));
    body["media_category"] = std::make_shared<JSONValue>(categoryWireName(descriptor.category));

    http::HttpResponse res;
    try {
        res = client.Post(baseUrl + "/media/upload/initialize", authHeaders, SerializeJSON(JSONValue{std::move(body)}));
    } catch (const http::HttpError& e) {
        state_ = UploadState::Failed;
        throw InitializationError(0, e.what());
    }
    if (!res.ok()) {
        state_ = UploadState::Failed;
        LOG_WARN("Media initialize rejected with HTTP {}", res.status);
        throw InitializationError(res.status, res.body);
    }
    std::string id;
    try {
        id = extractDataId(ParseJSON(res.body));
    } catch (const std::runtime_error& e) {
        state_ = UploadState::Failed;
        LOG_WARN("Media initialize returned malformed JSON: {}", e.what());
        throw InitializationError(res.status, res.body);
    }
    if (id.empty()) {
        state_ = UploadState::Failed;
        LOG_WARN("Media initialize response carries no data.id");
        throw InitializationError(res.status, res.body);
    }
    remoteId_ = std::move(id);
    totalBytes_ = descriptor.totalBytes;
    state_ = UploadState::Initialized;
    LOG_INFO("Media upload {} initialized ({} {} bytes, {})", remoteId_, descriptor.mimeType,
             descriptor.totalBytes, categoryWireName(descriptor.category));
}

void UploadSession::append(const Chunk& chunk) {
    requireState(state_ == UploadState::Initialized || state_ == UploadState::Appending, "append");
    if (chunk.segmentIndex != nextSegmentIndex_) {
        throw std::logic_error(std::format("UploadSession::append expected segment {} but got {}",
                                           nextSegmentIndex_, chunk.segmentIndex));
    }
    if (chunk.bytes.empty()) {
        throw std::logic_error("UploadSession::append requires a non-empty chunk");
    }
    if (bytesAppended_ + chunk.length() > totalBytes_) {
        throw std::logic_error(std::format("UploadSession::append of segment {} exceeds the announced {} bytes",
                                           chunk.segmentIndex, totalBytes_));
    }

    const std::vector<http::FormField> fields{ {"segment_index", std::to_string(chunk.segmentIndex)} };
    const http::FilePart file{"media", "blob", "application/octet-stream", chunk.bytes};
    http::HttpResponse res;
    try {
        res = client.PostMultipart(uploadUrl("append"), authHeaders, fields, file);
    } catch (const http::HttpError& e) {
        state_ = UploadState::Failed;
        throw AppendError(chunk.segmentIndex, 0, e.what());
    }
    if (!res.ok()) {
        state_ = UploadState::Failed;
        LOG_WARN("Media append of segment {} rejected with HTTP {}", chunk.segmentIndex, res.status);
        throw AppendError(chunk.segmentIndex, res.status, res.body);
    }
    LOG_DEBUG("Media upload {} segment {} ({} bytes) appended", remoteId_, chunk.segmentIndex, chunk.length());
    ++nextSegmentIndex_;
    bytesAppended_ += chunk.length();
    state_ = UploadState::Appending;
}

std::string UploadSession::finalize() {
    requireState(state_ == UploadState::Initialized || state_ == UploadState::Appending, "finalize");
    if (bytesAppended_ != totalBytes_) {
        throw std::logic_error(std::format("UploadSession::finalize after {} of {} announced bytes",
                                           bytesAppended_, totalBytes_));
    }

    http::HttpResponse res;
    try {
        res = client.Post(uploadUrl("finalize"), authHeaders, std::nullopt);
    } catch (const http::HttpError& e) {
        state_ = UploadState::Failed;
        throw FinalizationError(0, e.what());
    }
    if (!res.ok()) {
        state_ = UploadState::Failed;
        LOG_WARN("Media finalize rejected with HTTP {}", res.status);
        throw FinalizationError(res.status, res.body);
    }
    state_ = UploadState::Finalized;
    LOG_INFO("Media upload {} finalized after {} segment(s)", remoteId_, nextSegmentIndex_);
    return remoteId_;
}

} // namespace xmcp::media
