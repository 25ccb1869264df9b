//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/xmcp/http/Multipart.h
// Purpose: multipart/form-data body encoder
//==========================================================================================================
#pragma once

#include <string>
#include <vector>

#include "xmcp/http/HttpClient.hpp"

namespace xmcp::http {

struct MultipartBody {
    std::string contentType; // "multipart/form-data; boundary=..."
    std::string body;
};

// Random boundary of the form "----xmcp<hex>".
std::string makeBoundary();

//==========================================================================================================
// encodeMultipart
// Purpose: Encodes the form fields in order, then the file part, using CRLF line endings.
// Args:
//   boundary: Boundary token; must not occur inside any part.
//==========================================================================================================
MultipartBody encodeMultipart(const std::vector<FormField>& fields, const FilePart& file,
                              const std::string& boundary);

} // namespace xmcp::http
