//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/xmcp/tools/XTools.h
// Purpose: Registers the X (Twitter) tool set on an MCP server
//==========================================================================================================
#pragma once

#include <string>
#include <vector>

#include "xmcp/Server.h"
#include "xmcp/http/HttpClient.hpp"
#include "xmcp/media/MediaUploader.h"
#include "xmcp/x/XApiClient.h"

namespace xmcp::tools {

// Content type assumed for a downloaded media_url that does not declare one.
constexpr const char* kDefaultDownloadMimeType = "image/jpeg";

//==========================================================================================================
// XToolsContext
// Purpose: Collaborators shared by the tool handlers; all must outlive the server.
//   api: X API client.
//   uploader: Chunked media uploader used by post_twitter.
//   downloader: HTTP client used to fetch post_twitter's media_url.
//==========================================================================================================
struct XToolsContext {
    x::XApiClient& api;
    media::MediaUploader& uploader;
    http::IHttpClient& downloader;
};

//==========================================================================================================
// RegisterXTools
// Purpose: Registers every X tool. Each tool answers with one text item holding the JSON of its result;
//          missing arguments, API failures and upload failures produce isError results instead.
//==========================================================================================================
void RegisterXTools(IServer& server, const XToolsContext& ctx);

// Names of the tools RegisterXTools registers, in registration order.
std::vector<std::string> XToolNames();

} // namespace xmcp::tools
