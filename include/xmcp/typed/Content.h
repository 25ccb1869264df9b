//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Content.h
// Purpose: Helpers for constructing and extracting text content of tool results
//==========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "xmcp/Protocol.h"
#include "xmcp/typed/JsonFields.h"

namespace xmcp {
namespace typed {

//------------------------------ Builders ------------------------------
inline JSONValue makeText(const std::string& text) {
    JSONValue::Object obj;
    obj["type"] = std::make_shared<JSONValue>(std::string("text"));
    obj["text"] = std::make_shared<JSONValue>(text);
    return JSONValue{obj};
}

inline CallToolResult makeTextResult(const std::string& text) {
    CallToolResult r;
    r.content.push_back(makeText(text));
    r.isError = false;
    return r;
}

inline CallToolResult makeErrorResult(const std::string& message) {
    CallToolResult r;
    r.content.push_back(makeText(message));
    r.isError = true;
    return r;
}

//------------------------------ Inspectors ------------------------------
inline std::optional<std::string> getText(const JSONValue& v) {
    if (getString(v, "type") != std::optional<std::string>("text")) return std::nullopt;
    return getString(v, "text");
}

inline std::vector<std::string> collectText(const CallToolResult& r) {
    std::vector<std::string> out;
    out.reserve(r.content.size());
    for (const auto& v : r.content) {
        auto t = getText(v);
        if (t.has_value()) out.push_back(t.value());
    }
    return out;
}

inline std::optional<std::string> firstText(const CallToolResult& r) {
    auto v = collectText(r);
    if (v.empty()) return std::nullopt;
    return v.front();
}

} // namespace typed
} // namespace xmcp
