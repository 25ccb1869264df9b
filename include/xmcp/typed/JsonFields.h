//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JsonFields.h
// Purpose: Checked accessors for fields of JSONValue objects
//==========================================================================================================

#pragma once

#include <cmath>
#include <cstdint>
#include <optional>
#include <string>

#include "xmcp/JSONRPCTypes.h"

namespace xmcp {
namespace typed {

// Returns the member `key` of an object value, or nullptr when v is not an object or lacks the key.
inline const JSONValue* findField(const JSONValue& v, const std::string& key) {
    if (!std::holds_alternative<JSONValue::Object>(v.value)) return nullptr;
    const auto& o = std::get<JSONValue::Object>(v.value);
    auto it = o.find(key);
    if (it == o.end() || !it->second) return nullptr;
    return it->second.get();
}

inline std::optional<std::string> getString(const JSONValue& v, const std::string& key) {
    const JSONValue* f = findField(v, key);
    if (!f || !std::holds_alternative<std::string>(f->value)) return std::nullopt;
    return std::get<std::string>(f->value);
}

// Integers may arrive as int64 or as an integral double (e.g. 10.0 from some clients).
inline std::optional<int64_t> getInt(const JSONValue& v, const std::string& key) {
    const JSONValue* f = findField(v, key);
    if (!f) return std::nullopt;
    if (std::holds_alternative<int64_t>(f->value)) return std::get<int64_t>(f->value);
    if (std::holds_alternative<double>(f->value)) {
        double d = std::get<double>(f->value);
        // 2^63 is exact as a double; anything outside [-2^63, 2^63) does not fit
        constexpr double kTwo63 = 9223372036854775808.0;
        if (std::isfinite(d) && std::floor(d) == d && d >= -kTwo63 && d < kTwo63) return static_cast<int64_t>(d);
    }
    return std::nullopt;
}

inline std::optional<bool> getBool(const JSONValue& v, const std::string& key) {
    const JSONValue* f = findField(v, key);
    if (!f || !std::holds_alternative<bool>(f->value)) return std::nullopt;
    return std::get<bool>(f->value);
}

inline const JSONValue::Array* getArray(const JSONValue& v, const std::string& key) {
    const JSONValue* f = findField(v, key);
    if (!f || !std::holds_alternative<JSONValue::Array>(f->value)) return nullptr;
    return &std::get<JSONValue::Array>(f->value);
}

inline const JSONValue* getObject(const JSONValue& v, const std::string& key) {
    const JSONValue* f = findField(v, key);
    if (!f || !f->isObject()) return nullptr;
    return f;
}

} // namespace typed
} // namespace xmcp
