//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/xmcp/config/ServerConfig.cpp
// Purpose: Environment and command-line parsing for the server configuration
//==========================================================================================================

#include "xmcp/config/ServerConfig.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include "env/EnvVars.h"
#include "logging/Logger.h"

namespace xmcp::config {

namespace {

uint64_t parsePositive(const std::string& name, const std::string& value) {
    bool digits = !value.empty() &&
                  std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
    if (!digits) {
        throw std::invalid_argument(name + " must be a positive integer, got '" + value + "'");
    }
    unsigned long long v = 0;
    try {
        v = std::stoull(value);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument(name + " is out of range: " + value);
    }
    if (v == 0) {
        throw std::invalid_argument(name + " must be greater than zero");
    }
    return static_cast<uint64_t>(v);
}

StdioFraming parseFraming(const std::string& value) {
    std::string v = value;
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "ndjson") return StdioFraming::Ndjson;
    if (v == "content-length") return StdioFraming::ContentLength;
    throw std::invalid_argument("framing must be ndjson or content-length, got '" + value + "'");
}

void applySetting(ServerConfig& cfg, const std::string& key, const std::string& value) {
    if (key == "access-token") {
        cfg.accessToken = value;
    } else if (key == "api-base-url") {
        if (value.empty()) throw std::invalid_argument("api-base-url must not be empty");
        cfg.apiBaseUrl = value;
    } else if (key == "chunk-size") {
        cfg.chunkSize = static_cast<std::size_t>(parsePositive("chunk-size", value));
    } else if (key == "connect-timeout-ms") {
        cfg.connectTimeoutMs = parsePositive("connect-timeout-ms", value);
    } else if (key == "read-timeout-ms") {
        cfg.readTimeoutMs = parsePositive("read-timeout-ms", value);
    } else if (key == "log-level") {
        cfg.logLevel = value;
    } else if (key == "log-file") {
        cfg.logFile = value.empty() ? std::nullopt : std::optional<std::string>(value);
    } else if (key == "framing") {
        cfg.framing = parseFraming(value);
    } else {
        throw std::invalid_argument("Unknown option: --" + key);
    }
}

struct EnvBinding {
    const char* variable;
    const char* key;
};

constexpr EnvBinding kEnvBindings[] = {
    {"ACCESS_TOKEN", "access-token"},
    {"XMCP_API_BASE_URL", "api-base-url"},
    {"XMCP_CHUNK_SIZE", "chunk-size"},
    {"XMCP_CONNECT_TIMEOUT_MS", "connect-timeout-ms"},
    {"XMCP_READ_TIMEOUT_MS", "read-timeout-ms"},
    {"XMCP_LOG_LEVEL", "log-level"},
    {"XMCP_LOG_FILE", "log-file"},
    {"XMCP_FRAMING", "framing"},
};

} // namespace

ServerConfig ParseServerConfig(const std::vector<std::string>& args, const EnvLookup& env) {
    ServerConfig cfg;
    for (const auto& b : kEnvBindings) {
        if (auto v = env(b.variable); v.has_value()) {
            try {
                applySetting(cfg, b.key, *v);
            } catch (const std::invalid_argument& e) {
                throw std::invalid_argument(std::string(b.variable) + ": " + e.what());
            }
        }
    }

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& a = args[i];
        if (a == "--help" || a == "-h") {
            cfg.showHelp = true;
            continue;
        }
        if (a == "--version") {
            cfg.showVersion = true;
            continue;
        }
        if (a.rfind("--", 0) != 0 || a.size() == 2) {
            throw std::invalid_argument("Unexpected argument: " + a);
        }
        std::string key;
        std::string value;
        std::size_t eq = a.find('=');
        if (eq != std::string::npos) {
            key = a.substr(2, eq - 2);
            value = a.substr(eq + 1);
        } else {
            key = a.substr(2);
            if (i + 1 >= args.size()) {
                throw std::invalid_argument("Missing value for --" + key);
            }
            value = args[++i];
        }
        applySetting(cfg, key, value);
    }

    if (cfg.accessToken.empty() && !cfg.showHelp && !cfg.showVersion) {
        throw std::invalid_argument("ACCESS_TOKEN is required (environment or --access-token)");
    }
    LOG_DEBUG("Config: base={} chunkSize={} connectTimeoutMs={} readTimeoutMs={}", cfg.apiBaseUrl, cfg.chunkSize,
              cfg.connectTimeoutMs, cfg.readTimeoutMs);
    return cfg;
}

ServerConfig ParseServerConfig(const std::vector<std::string>& args) {
    return ParseServerConfig(args, [](const char* name) { return GetEnvOptional(name); });
}

std::string UsageText(const std::string& program) {
    return "Usage: " + program + " [options]\n"
           "  --access-token=TOKEN        X API bearer token (env ACCESS_TOKEN, required)\n"
           "  --api-base-url=URL          X API base URL (env XMCP_API_BASE_URL)\n"
           "  --chunk-size=BYTES          Media upload chunk size (env XMCP_CHUNK_SIZE, default 1048576)\n"
           "  --connect-timeout-ms=MS     HTTP connect timeout (env XMCP_CONNECT_TIMEOUT_MS, default 10000)\n"
           "  --read-timeout-ms=MS        HTTP read timeout (env XMCP_READ_TIMEOUT_MS, default 30000)\n"
           "  --log-level=LEVEL           DEBUG|INFO|WARN|ERROR (env XMCP_LOG_LEVEL)\n"
           "  --log-file=PATH             Also write logs to PATH (env XMCP_LOG_FILE)\n"
           "  --framing=MODE              ndjson|content-length (env XMCP_FRAMING, default ndjson)\n"
           "  --version                   Print the version and exit\n"
           "  --help                      Print this help and exit\n";
}

} // namespace xmcp::config
