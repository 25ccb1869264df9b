//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/xmcp/http/HttpClient.hpp
// Purpose: Blocking HTTP client interface used by the media uploader and the X API client
//==========================================================================================================
#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace xmcp::http {

struct HeaderKV {
    std::string name;
    std::string value;
};

using Headers = std::vector<HeaderKV>;

// Plain form field of a multipart/form-data body.
struct FormField {
    std::string name;
    std::string value;
};

// File part of a multipart/form-data body.
struct FilePart {
    std::string fieldName;
    std::string fileName;
    std::string contentType;
    std::string data; // raw bytes
};

struct HttpResponse {
    int status{0};
    std::string body;
    std::string contentType; // Content-Type header value, empty when absent

    bool ok() const { return status >= 200 && status < 300; }
};

//==========================================================================================================
// HttpError
// Purpose: Transport-level failure (DNS, connect, TLS, timeout, malformed response). HTTP error statuses
//          are not exceptions; they come back in HttpResponse::status.
//==========================================================================================================
class HttpError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

//==========================================================================================================
// IHttpClient
// Purpose: Request/response boundary. Every call blocks the calling thread until the full response
//          has been read. Implementations must be safe to call from several threads at once.
//==========================================================================================================
class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    //==========================================================================================================
    // Get
    // Purpose: GET a URL, following up to 5 redirects (301, 302, 303, 307, 308).
    // Throws:
    //   HttpError on transport failure or a redirect loop.
    //==========================================================================================================
    virtual HttpResponse Get(const std::string& url, const Headers& headers) = 0;

    //==========================================================================================================
    // Post
    // Purpose: POST with an optional JSON body. std::nullopt sends no body (Content-Length: 0).
    //==========================================================================================================
    virtual HttpResponse Post(const std::string& url, const Headers& headers,
                              const std::optional<std::string>& jsonBody) = 0;

    //==========================================================================================================
    // PostMultipart
    // Purpose: POST a multipart/form-data body made of the form fields followed by one file part.
    //==========================================================================================================
    virtual HttpResponse PostMultipart(const std::string& url, const Headers& headers,
                                       const std::vector<FormField>& fields, const FilePart& file) = 0;

    virtual HttpResponse Delete(const std::string& url, const Headers& headers) = 0;
};

} // namespace xmcp::http
