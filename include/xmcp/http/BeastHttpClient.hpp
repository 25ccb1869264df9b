//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/xmcp/http/BeastHttpClient.hpp
// Purpose: IHttpClient implementation over Boost.Beast with OpenSSL (HTTP/1.1, TLS 1.2+)
//==========================================================================================================
#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include "xmcp/http/HttpClient.hpp"

namespace xmcp::http {

//==========================================================================================================
// BeastHttpClient
// Purpose: Blocking facade over coroutines running on a private io_context thread. One connection per
//          request ("Connection: close").
//==========================================================================================================
class BeastHttpClient : public IHttpClient {
public:
    struct Options {
        unsigned int connectTimeoutMs{10000};
        unsigned int readTimeoutMs{30000};   // idle time allowed between reads of one response
        std::string caFile;                  // optional CA bundle; system defaults otherwise
        std::string caPath;
        std::size_t maxResponseBytes{512u * 1024u * 1024u};
        int maxRedirects{5};
        std::string userAgent{"xmcp"};
    };

    //==========================================================================================================
    // Constructs the client and starts its I/O thread.
    // Throws:
    //   std::invalid_argument when a user-provided CA file/path cannot be loaded.
    //==========================================================================================================
    explicit BeastHttpClient(const Options& opts);
    ~BeastHttpClient() override;

    BeastHttpClient(const BeastHttpClient&) = delete;
    BeastHttpClient& operator=(const BeastHttpClient&) = delete;

    HttpResponse Get(const std::string& url, const Headers& headers) override;
    HttpResponse Post(const std::string& url, const Headers& headers,
                      const std::optional<std::string>& jsonBody) override;
    HttpResponse PostMultipart(const std::string& url, const Headers& headers,
                               const std::vector<FormField>& fields, const FilePart& file) override;
    HttpResponse Delete(const std::string& url, const Headers& headers) override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace xmcp::http
