//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/xmcp/http/Url.h
// Purpose: URL splitting, percent-encoding and redirect resolution helpers
//==========================================================================================================
#pragma once

#include <string>
#include <utility>
#include <vector>

namespace xmcp::http {

struct UrlParts {
    std::string scheme;     // "http" or "https"
    std::string host;
    std::string port;       // defaulted from scheme when absent
    std::string target;     // path plus query, always starts with '/'
    std::string serverName; // SNI / certificate host name
};

//==========================================================================================================
// parseUrl
// Purpose: Splits an absolute http(s) URL. Bracketed IPv6 hosts are accepted; fragments are dropped.
// Throws:
//   std::invalid_argument for a missing or unsupported scheme or an empty host.
//==========================================================================================================
UrlParts parseUrl(const std::string& url);

// RFC 3986 percent-encoding; unreserved characters pass through.
std::string percentEncode(const std::string& s);

// "?k=v&k2=v2" with percent-encoded keys and values; empty string when params is empty.
std::string buildQuery(const std::vector<std::pair<std::string, std::string>>& params);

//==========================================================================================================
// resolveLocation
// Purpose: Resolves a redirect Location header against the URL that produced it (absolute URLs,
//          scheme-relative "//host/..", absolute paths and relative paths).
//==========================================================================================================
std::string resolveLocation(const std::string& baseUrl, const std::string& location);

} // namespace xmcp::http
