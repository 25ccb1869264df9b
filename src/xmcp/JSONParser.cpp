//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONParser.cpp
// Purpose: Recursive-descent JSON codec and JSON-RPC message (de)serialization
//==========================================================================================================

#include <cctype>
#include <cmath>
#include <format>
#include <stdexcept>
#include <string>

#include "xmcp/JSONRPCTypes.h"
#include "logging/Logger.h"

namespace xmcp {

//----------------------------------------------------------------------------------------------------------
// JSONValue special members (out-of-line definitions)
//----------------------------------------------------------------------------------------------------------
JSONValue::JSONValue() : value(nullptr) {}
JSONValue::JSONValue(const JSONValue&) = default;
JSONValue::JSONValue(JSONValue&&) = default;
JSONValue& JSONValue::operator=(const JSONValue&) = default;
JSONValue& JSONValue::operator=(JSONValue&&) = default;
JSONValue::~JSONValue() {}

JSONValue::JSONValue(std::nullptr_t) : value(nullptr) {}
JSONValue::JSONValue(bool v) : value(v) {}
JSONValue::JSONValue(int64_t v) : value(v) {}
JSONValue::JSONValue(double v) : value(v) {}
JSONValue::JSONValue(const char* s) : value(std::string(s ? s : "")) {}
JSONValue::JSONValue(const std::string& s) : value(s) {}
JSONValue::JSONValue(std::string&& s) : value(std::move(s)) {}
JSONValue::JSONValue(const Array& a) : value(a) {}
JSONValue::JSONValue(Array&& a) : value(std::move(a)) {}
JSONValue::JSONValue(const Object& o) : value(o) {}
JSONValue::JSONValue(Object&& o) : value(std::move(o)) {}

namespace {

// Nesting limit for untrusted input (API bodies, stdin frames)
constexpr unsigned int kMaxDepth = 256;

struct JsonParser {
    const std::string& s;
    std::size_t i{0};
    unsigned int depth{0};

    explicit JsonParser(const std::string& str) : s(str) {}

    [[noreturn]] void fail(const char* what) const {
        throw std::runtime_error(std::format("JSON parse error at offset {}: {}", i, what));
    }

    void skipWs() {
        while (i < s.size()) {
            char c = s[i];
            if (c == ' ' || c == '\t' || c == '\r' || c == '\n') { ++i; } else { break; }
        }
    }

    bool match(char c) {
        skipWs();
        if (i < s.size() && s[i] == c) { ++i; return true; }
        return false;
    }

    unsigned int parseHex4() {
        if (i + 4 > s.size()) fail("truncated unicode escape");
        unsigned int code = 0;
        for (int k = 0; k < 4; ++k) {
            char h = s[i++];
            code <<= 4;
            if (h >= '0' && h <= '9') code += static_cast<unsigned int>(h - '0');
            else if (h >= 'a' && h <= 'f') code += 10u + static_cast<unsigned int>(h - 'a');
            else if (h >= 'A' && h <= 'F') code += 10u + static_cast<unsigned int>(h - 'A');
            else fail("invalid hex digit in unicode escape");
        }
        return code;
    }

    static void appendUtf8(std::string& out, unsigned int code) {
        if (code <= 0x7F) {
            out.push_back(static_cast<char>(code));
        } else if (code <= 0x7FF) {
            out.push_back(static_cast<char>(0xC0 | ((code >> 6) & 0x1F)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        } else if (code <= 0xFFFF) {
            out.push_back(static_cast<char>(0xE0 | ((code >> 12) & 0x0F)));
            out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | ((code >> 18) & 0x07)));
            out.push_back(static_cast<char>(0x80 | ((code >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        }
    }

    std::string parseString() {
        skipWs();
        if (i >= s.size() || s[i] != '"') fail("expected '\"'");
        ++i;
        std::string out;
        while (true) {
            if (i >= s.size()) fail("unterminated string");
            char c = s[i++];
            if (c == '"') break;
            if (c != '\\') {
                out.push_back(c);
                continue;
            }
            if (i >= s.size()) fail("unterminated escape");
            char e = s[i++];
            switch (e) {
                case '"': out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                case '/': out.push_back('/'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 't': out.push_back('\t'); break;
                case 'u': {
                    unsigned int code = parseHex4();
                    // Surrogate pair (emoji and other astral-plane text)
                    if (code >= 0xD800 && code <= 0xDBFF && i + 1 < s.size() && s[i] == '\\' && s[i + 1] == 'u') {
                        i += 2;
                        unsigned int low = parseHex4();
                        if (low >= 0xDC00 && low <= 0xDFFF) {
                            code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
                        } else {
                            appendUtf8(out, code);
                            code = low;
                        }
                    }
                    appendUtf8(out, code);
                    break;
                }
                default: fail("unknown escape");
            }
        }
        return out;
    }

    JSONValue parseNumber() {
        skipWs();
        std::size_t start = i;
        if (i < s.size() && s[i] == '-') ++i;
        std::size_t digitsStart = i;
        while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        if (i == digitsStart) fail("unexpected character");
        bool isFloat = false;
        if (i < s.size() && s[i] == '.') {
            isFloat = true; ++i;
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        }
        if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
            isFloat = true; ++i;
            if (i < s.size() && (s[i] == '-' || s[i] == '+')) ++i;
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        }
        std::string num = s.substr(start, i - start);
        if (!isFloat) {
            try {
                return JSONValue(static_cast<int64_t>(std::stoll(num)));
            } catch (const std::out_of_range&) {
                // Fall through to double for integers beyond int64
            }
        }
        try {
            return JSONValue(std::stod(num));
        } catch (const std::exception&) {
            fail("invalid number");
        }
    }

    JSONValue parseArray() {
        if (!match('[')) fail("expected '['");
        if (++depth > kMaxDepth) fail("nesting too deep");
        JSONValue::Array arr;
        if (!match(']')) {
            while (true) {
                arr.push_back(std::make_shared<JSONValue>(parseValue()));
                if (match(']')) break;
                if (!match(',')) fail("expected ',' in array");
            }
        }
        --depth;
        return JSONValue(std::move(arr));
    }

    JSONValue parseObject() {
        if (!match('{')) fail("expected '{'");
        if (++depth > kMaxDepth) fail("nesting too deep");
        JSONValue::Object obj;
        if (!match('}')) {
            while (true) {
                std::string key = parseString();
                if (!match(':')) fail("expected ':' after key");
                obj[key] = std::make_shared<JSONValue>(parseValue());
                if (match('}')) break;
                if (!match(',')) fail("expected ',' in object");
            }
        }
        --depth;
        return JSONValue(std::move(obj));
    }

    JSONValue parseValue() {
        skipWs();
        if (i >= s.size()) fail("unexpected end of input");
        char c = s[i];
        if (c == '"') return JSONValue(parseString());
        if (c == '{') return parseObject();
        if (c == '[') return parseArray();
        if (s.compare(i, 4, "true") == 0) { i += 4; return JSONValue(true); }
        if (s.compare(i, 5, "false") == 0) { i += 5; return JSONValue(false); }
        if (s.compare(i, 4, "null") == 0) { i += 4; return JSONValue(nullptr); }
        return parseNumber();
    }

    JSONValue parseDocument() {
        JSONValue v = parseValue();
        skipWs();
        if (i != s.size()) fail("trailing characters");
        return v;
    }
};

void appendEscaped(std::string& out, const std::string& v) {
    out.push_back('"');
    for (char c : v) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += std::format("\\u{:04x}", static_cast<unsigned int>(static_cast<unsigned char>(c)));
                } else {
                    out.push_back(c);
                }
                break;
        }
    }
    out.push_back('"');
}

void appendValue(std::string& out, const JSONValue& value) {
    std::visit([&out](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            out += "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            out += v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            out += std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            if (std::isfinite(v)) {
                out += std::format("{}", v);
            } else {
                out += "null";
            }
        } else if constexpr (std::is_same_v<T, std::string>) {
            appendEscaped(out, v);
        } else if constexpr (std::is_same_v<T, JSONValue::Array>) {
            out.push_back('[');
            bool first = true;
            for (const auto& item : v) {
                if (!first) out.push_back(',');
                first = false;
                if (item) { appendValue(out, *item); } else { out += "null"; }
            }
            out.push_back(']');
        } else if constexpr (std::is_same_v<T, JSONValue::Object>) {
            out.push_back('{');
            bool first = true;
            for (const auto& [key, item] : v) {
                if (!first) out.push_back(',');
                first = false;
                appendEscaped(out, key);
                out.push_back(':');
                if (item) { appendValue(out, *item); } else { out += "null"; }
            }
            out.push_back('}');
        }
    }, value.get());
}

void appendId(std::string& out, const JSONRPCId& id) {
    std::visit([&out](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
            appendEscaped(out, v);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            out += std::to_string(v);
        } else {
            out += "null";
        }
    }, id);
}

// Parses json and returns its top-level object, or nullptr when the text is not an object.
std::optional<JSONValue::Object> parseTopLevelObject(const std::string& json, const char* what) {
    try {
        JSONValue root = ParseJSON(json);
        if (!root.isObject()) {
            LOG_WARN("{}: top-level JSON value is not an object", what);
            return std::nullopt;
        }
        return std::get<JSONValue::Object>(std::move(root.value));
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to deserialize {}: {}", what, e.what());
        return std::nullopt;
    }
}

const JSONValue* findKey(const JSONValue::Object& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->second) return nullptr;
    return it->second.get();
}

bool readId(const JSONValue::Object& obj, JSONRPCId& id) {
    const JSONValue* v = findKey(obj, "id");
    if (!v) return false;
    if (std::holds_alternative<std::string>(v->value)) { id = std::get<std::string>(v->value); return true; }
    if (std::holds_alternative<int64_t>(v->value)) { id = std::get<int64_t>(v->value); return true; }
    if (v->isNull()) { id = nullptr; return true; }
    return false;
}

bool readMethod(const JSONValue::Object& obj, std::string& method) {
    const JSONValue* v = findKey(obj, "method");
    if (!v || !std::holds_alternative<std::string>(v->value)) return false;
    method = std::get<std::string>(v->value);
    return !method.empty();
}

} // namespace

JSONValue ParseJSON(const std::string& text) {
    JsonParser p(text);
    return p.parseDocument();
}

std::string SerializeJSON(const JSONValue& value) {
    std::string out;
    appendValue(out, value);
    return out;
}

std::string IdToString(const JSONRPCId& id) {
    std::string idStr;
    std::visit([&](const auto& v){
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) { idStr = v; }
        else if constexpr (std::is_same_v<T, int64_t>) { idStr = std::to_string(v); }
    }, id);
    return idStr;
}

JSONRPCMessageKind ClassifyJSONRPCMessage(const std::string& json) {
    JSONValue root;
    try {
        root = ParseJSON(json);
    } catch (const std::exception& e) {
        LOG_DEBUG("Classify: unparseable message ({})", e.what());
        return JSONRPCMessageKind::Unknown;
    }
    if (!root.isObject()) {
        return JSONRPCMessageKind::Unknown;
    }
    const auto& obj = std::get<JSONValue::Object>(root.value);
    const bool hasId = obj.find("id") != obj.end();
    if (obj.find("method") != obj.end()) {
        return hasId ? JSONRPCMessageKind::Request : JSONRPCMessageKind::Notification;
    }
    if (hasId && (obj.find("result") != obj.end() || obj.find("error") != obj.end())) {
        return JSONRPCMessageKind::Response;
    }
    return JSONRPCMessageKind::Unknown;
}

// JSONRPCRequest implementation
std::string JSONRPCRequest::Serialize() const {
    FUNC_SCOPE();
    std::string out = "{\"jsonrpc\":\"" + jsonrpc + "\",\"id\":";
    appendId(out, id);
    out += ",\"method\":";
    appendEscaped(out, method);
    if (params.has_value()) {
        out += ",\"params\":";
        appendValue(out, params.value());
    }
    out.push_back('}');
    return out;
}

bool JSONRPCRequest::Deserialize(const std::string& json) {
    FUNC_SCOPE();
    auto obj = parseTopLevelObject(json, "JSONRPCRequest");
    if (!obj.has_value()) return false;
    if (!readMethod(*obj, method)) return false;
    if (!readId(*obj, id)) return false;
    if (const JSONValue* p = findKey(*obj, "params")) {
        params = *p;
    }
    return true;
}

// JSONRPCResponse implementation
std::string JSONRPCResponse::Serialize() const {
    FUNC_SCOPE();
    std::string out = "{\"jsonrpc\":\"" + jsonrpc + "\",\"id\":";
    appendId(out, id);
    if (result.has_value()) {
        out += ",\"result\":";
        appendValue(out, result.value());
    }
    if (error.has_value()) {
        out += ",\"error\":";
        appendValue(out, error.value());
    }
    out.push_back('}');
    return out;
}

bool JSONRPCResponse::Deserialize(const std::string& json) {
    FUNC_SCOPE();
    auto obj = parseTopLevelObject(json, "JSONRPCResponse");
    if (!obj.has_value()) return false;
    if (!readId(*obj, id)) return false;
    if (const JSONValue* r = findKey(*obj, "result")) {
        result = *r;
    }
    if (const JSONValue* e = findKey(*obj, "error")) {
        error = *e;
    }
    return result.has_value() || error.has_value();
}

// JSONRPCNotification implementation
std::string JSONRPCNotification::Serialize() const {
    FUNC_SCOPE();
    std::string out = "{\"jsonrpc\":\"" + jsonrpc + "\",\"method\":";
    appendEscaped(out, method);
    if (params.has_value()) {
        out += ",\"params\":";
        appendValue(out, params.value());
    }
    out.push_back('}');
    return out;
}

bool JSONRPCNotification::Deserialize(const std::string& json) {
    FUNC_SCOPE();
    auto obj = parseTopLevelObject(json, "JSONRPCNotification");
    if (!obj.has_value()) return false;
    if (!readMethod(*obj, method)) return false;
    if (const JSONValue* p = findKey(*obj, "params")) {
        params = *p;
    }
    return true;
}

JSONValue CreateErrorObject(int code, const std::string& message,
                           const std::optional<JSONValue>& data) {
    FUNC_SCOPE();
    JSONValue::Object errorObj;
    errorObj["code"] = std::make_shared<JSONValue>(static_cast<int64_t>(code));
    errorObj["message"] = std::make_shared<JSONValue>(message);
    if (data.has_value()) {
        errorObj["data"] = std::make_shared<JSONValue>(data.value());
    }
    return JSONValue(std::move(errorObj));
}

std::unique_ptr<JSONRPCResponse> CreateErrorResponse(
    const JSONRPCId& id, int code, const std::string& message,
    const std::optional<JSONValue>& data) {
    FUNC_SCOPE();
    auto response = std::make_unique<JSONRPCResponse>();
    response->id = id;
    response->error = CreateErrorObject(code, message, data);
    return response;
}

} // namespace xmcp
