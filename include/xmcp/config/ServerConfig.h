//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/xmcp/config/ServerConfig.h
// Purpose: Server configuration assembled from the environment and command-line overrides
//==========================================================================================================
#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "xmcp/StdioTransport.hpp"

namespace xmcp::config {

struct ServerConfig {
    std::string accessToken;
    std::string apiBaseUrl{"https://api.twitter.com/2"};
    std::size_t chunkSize{1048576};
    uint64_t connectTimeoutMs{10000};
    uint64_t readTimeoutMs{30000};
    std::string logLevel{"INFO"};
    std::optional<std::string> logFile;
    StdioFraming framing{StdioFraming::Ndjson};
    bool showHelp{false};
    bool showVersion{false};
};

// Environment lookup returning the value of a set, non-empty variable.
using EnvLookup = std::function<std::optional<std::string>(const char*)>;

//==========================================================================================================
// ParseServerConfig
// Purpose: Builds the configuration from environment variables, then applies command-line overrides.
// Args:
//   args: Command-line arguments without the program name. Options take the form --key=value or
//         --key value; --help and --version are flags.
//   env: Environment lookup (GetEnvOptional by default).
// Environment:
//   ACCESS_TOKEN, XMCP_API_BASE_URL, XMCP_CHUNK_SIZE, XMCP_CONNECT_TIMEOUT_MS, XMCP_READ_TIMEOUT_MS,
//   XMCP_LOG_LEVEL, XMCP_LOG_FILE, XMCP_FRAMING
// Throws:
//   std::invalid_argument for unknown options, malformed or non-positive numbers, an unknown framing,
//   or a missing access token (unless --help or --version was given).
//==========================================================================================================
ServerConfig ParseServerConfig(const std::vector<std::string>& args, const EnvLookup& env);
ServerConfig ParseServerConfig(const std::vector<std::string>& args);

// Text printed for --help.
std::string UsageText(const std::string& program);

} // namespace xmcp::config
