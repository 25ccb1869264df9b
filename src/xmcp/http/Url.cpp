//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/xmcp/http/Url.cpp
// Purpose: URL helpers
//==========================================================================================================

#include "xmcp/http/Url.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace xmcp::http {

namespace {
std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}
}

UrlParts parseUrl(const std::string& url) {
    UrlParts parts;
    std::size_t schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        throw std::invalid_argument("URL has no scheme: " + url);
    }
    parts.scheme = lower(url.substr(0, schemeEnd));
    if (parts.scheme != "http" && parts.scheme != "https") {
        throw std::invalid_argument("Unsupported URL scheme: " + parts.scheme);
    }
    std::size_t pos = schemeEnd + 3;

    std::size_t authEnd = url.find_first_of("/?#", pos);
    std::string hostPort = url.substr(pos, authEnd == std::string::npos ? std::string::npos : authEnd - pos);
    if (authEnd == std::string::npos || url[authEnd] == '#') {
        parts.target = "/";
    } else if (url[authEnd] == '?') {
        parts.target = "/" + url.substr(authEnd);
    } else {
        parts.target = url.substr(authEnd);
    }
    if (auto hash = parts.target.find('#'); hash != std::string::npos) {
        parts.target.erase(hash);
    }

    // userinfo is not supported and dropped
    if (auto at = hostPort.rfind('@'); at != std::string::npos) {
        hostPort.erase(0, at + 1);
    }

    if (!hostPort.empty() && hostPort.front() == '[') {
        std::size_t close = hostPort.find(']');
        if (close == std::string::npos) {
            throw std::invalid_argument("Malformed IPv6 host in URL: " + url);
        }
        parts.host = hostPort.substr(1, close - 1);
        if (close + 1 < hostPort.size() && hostPort[close + 1] == ':') {
            parts.port = hostPort.substr(close + 2);
        }
    } else {
        std::size_t colon = hostPort.find(':');
        parts.host = hostPort.substr(0, colon);
        if (colon != std::string::npos) {
            parts.port = hostPort.substr(colon + 1);
        }
    }
    if (parts.host.empty()) {
        throw std::invalid_argument("URL has no host: " + url);
    }
    if (parts.port.empty()) {
        parts.port = (parts.scheme == "https") ? "443" : "80";
    }
    parts.serverName = parts.host;
    return parts;
}

std::string percentEncode(const std::string& s) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size() * 3);
    for (unsigned char c : s) {
        if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
            c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(hex[(c >> 4) & 0xFu]);
            out.push_back(hex[c & 0xFu]);
        }
    }
    return out;
}

std::string buildQuery(const std::vector<std::pair<std::string, std::string>>& params) {
    std::string q;
    for (const auto& [k, v] : params) {
        q += q.empty() ? "?" : "&";
        q += percentEncode(k);
        q += "=";
        q += percentEncode(v);
    }
    return q;
}

std::string resolveLocation(const std::string& baseUrl, const std::string& location) {
    if (location.find("://") != std::string::npos) {
        return location;
    }
    UrlParts base = parseUrl(baseUrl);
    const bool defaultPort = (base.scheme == "https" && base.port == "443") ||
                             (base.scheme == "http" && base.port == "80");
    std::string host = base.host.find(':') != std::string::npos ? "[" + base.host + "]" : base.host;
    std::string origin = base.scheme + "://" + host + (defaultPort ? "" : ":" + base.port);
    if (location.rfind("//", 0) == 0) {
        return base.scheme + ":" + location;
    }
    if (!location.empty() && location.front() == '/') {
        return origin + location;
    }
    std::string path = base.target.substr(0, base.target.find('?'));
    path.erase(path.rfind('/') + 1);
    return origin + path + location;
}

} // namespace xmcp::http
