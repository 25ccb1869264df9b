//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/xmcp/http/Multipart.cpp
// Purpose: multipart/form-data body encoder
//==========================================================================================================

#include "xmcp/http/Multipart.h"

#include <format>
#include <random>

namespace xmcp::http {

namespace {
// Quotes in a disposition parameter are escaped the way browsers do it.
std::string quoteParam(const std::string& v) {
    std::string out;
    out.reserve(v.size());
    for (char c : v) {
        if (c == '"') out += "%22";
        else if (c == '\r') out += "%0D";
        else if (c == '\n') out += "%0A";
        else out.push_back(c);
    }
    return out;
}
}

std::string makeBoundary() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    return std::format("----xmcp{:016x}{:016x}", gen(), gen());
}

MultipartBody encodeMultipart(const std::vector<FormField>& fields, const FilePart& file,
                              const std::string& boundary) {
    MultipartBody out;
    out.contentType = "multipart/form-data; boundary=" + boundary;

    std::size_t reserve = file.data.size() + 256;
    for (const auto& f : fields) reserve += f.name.size() + f.value.size() + 96;
    out.body.reserve(reserve);

    for (const auto& f : fields) {
        out.body += "--" + boundary + "\r\n";
        out.body += "Content-Disposition: form-data; name=\"" + quoteParam(f.name) + "\"\r\n\r\n";
        out.body += f.value;
        out.body += "\r\n";
    }
    out.body += "--" + boundary + "\r\n";
    out.body += "Content-Disposition: form-data; name=\"" + quoteParam(file.fieldName) +
                "\"; filename=\"" + quoteParam(file.fileName) + "\"\r\n";
    out.body += "Content-Type: " + (file.contentType.empty() ? std::string("application/octet-stream") : file.contentType) + "\r\n\r\n";
    out.body += file.data;
    out.body += "\r\n--" + boundary + "--\r\n";
    return out;
}

} // namespace xmcp::http
