//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/xmcp/auth/BearerAuth.hpp
// Purpose: Static bearer token credentials applied to every outgoing X API request
//==========================================================================================================
#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "xmcp/http/HttpClient.hpp"

namespace xmcp::auth {

class IAuth {
public:
    virtual ~IAuth() = default;

    // Headers to apply to an outgoing HTTP request
    virtual std::vector<http::HeaderKV> headers() const = 0;
};

class BearerAuth final : public IAuth {
public:
    // Throws std::invalid_argument for an empty token.
    explicit BearerAuth(std::string token) : token(std::move(token)) {
        if (this->token.empty()) {
            throw std::invalid_argument("bearer token must not be empty");
        }
    }

    std::vector<http::HeaderKV> headers() const override {
        return { http::HeaderKV{ "Authorization", std::string("Bearer ") + token } };
    }

private:
    std::string token;
};

using BearerAuthPtr = std::shared_ptr<BearerAuth>;

} // namespace xmcp::auth
