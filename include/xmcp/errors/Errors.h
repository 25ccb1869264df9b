//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Typed JSON-RPC error structure and mapping helpers used by the server dispatcher
//==========================================================================================================

#pragma once

#include <optional>
#include <string>

#include "xmcp/JSONRPCTypes.h"

namespace xmcp {
namespace errors {

// Categorization of the JSON-RPC and MCP error codes the server emits.
enum class ErrorCategory {
    JsonRpcParse,
    JsonRpcInvalidRequest,
    JsonRpcMethodNotFound,
    JsonRpcInvalidParams,
    JsonRpcInternal,
    McpInvalidRequestId,
    McpRequestCancelled,
    McpToolNotFound,
    Unknown
};

// Typed error representation.
struct McpError {
    int code{0};
    std::string message;
    std::optional<JSONValue> data;
    ErrorCategory category{ErrorCategory::Unknown};
};

// Map a numeric error code to an ErrorCategory (Unknown when unmapped).
inline ErrorCategory errorCategoryFromCode(int code) {
    switch (code) {
        case JSONRPCErrorCodes::ParseError: return ErrorCategory::JsonRpcParse;
        case JSONRPCErrorCodes::InvalidRequest: return ErrorCategory::JsonRpcInvalidRequest;
        case JSONRPCErrorCodes::MethodNotFound: return ErrorCategory::JsonRpcMethodNotFound;
        case JSONRPCErrorCodes::InvalidParams: return ErrorCategory::JsonRpcInvalidParams;
        case JSONRPCErrorCodes::InternalError: return ErrorCategory::JsonRpcInternal;
        case JSONRPCErrorCodes::InvalidRequestId: return ErrorCategory::McpInvalidRequestId;
        case JSONRPCErrorCodes::RequestCancelled: return ErrorCategory::McpRequestCancelled;
        case JSONRPCErrorCodes::ToolNotFound: return ErrorCategory::McpToolNotFound;
        default: return ErrorCategory::Unknown;
    }
}

// Build an McpError with its category filled in from the code.
inline McpError makeError(int code, std::string message, std::optional<JSONValue> data = std::nullopt) {
    McpError e;
    e.code = code;
    e.message = std::move(message);
    e.data = std::move(data);
    e.category = errorCategoryFromCode(code);
    return e;
}

// Convert a JSON-RPC error object ({ code, message, data? }) to McpError.
// Returns std::nullopt when the input is not a valid error object.
inline std::optional<McpError> mcpErrorFromErrorValue(const JSONValue& errVal) {
    if (!std::holds_alternative<JSONValue::Object>(errVal.value)) {
        return std::nullopt;
    }
    const auto& obj = std::get<JSONValue::Object>(errVal.value);
    auto itCode = obj.find("code");
    auto itMsg = obj.find("message");
    if (itCode == obj.end() || itMsg == obj.end() || !itCode->second || !itMsg->second) {
        return std::nullopt;
    }
    if (!std::holds_alternative<int64_t>(itCode->second->value) ||
        !std::holds_alternative<std::string>(itMsg->second->value)) {
        return std::nullopt;
    }
    std::optional<JSONValue> data;
    auto itData = obj.find("data");
    if (itData != obj.end() && itData->second) {
        data = *(itData->second);
    }
    return makeError(static_cast<int>(std::get<int64_t>(itCode->second->value)),
                     std::get<std::string>(itMsg->second->value),
                     std::move(data));
}

// Extract McpError from a JSONRPCResponse if it carries an error.
inline std::optional<McpError> mcpErrorFromResponse(const JSONRPCResponse& response) {
    if (!response.error.has_value()) {
        return std::nullopt;
    }
    return mcpErrorFromErrorValue(response.error.value());
}

// Create a JSONRPCResponse error from McpError and id.
inline std::unique_ptr<JSONRPCResponse> makeErrorResponse(const JSONRPCId& id, const McpError& err) {
    return CreateErrorResponse(id, err.code, err.message, err.data);
}

} // namespace errors
} // namespace xmcp
