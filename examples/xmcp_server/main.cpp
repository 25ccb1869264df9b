//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: examples/xmcp_server/main.cpp
// Purpose: X (Twitter) MCP server over stdio
//==========================================================================================================

#include <cstdlib>
#include <exception>
#include <future>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "xmcp/Server.h"
#include "xmcp/StdioTransport.hpp"
#include "xmcp/config/ServerConfig.h"
#include "xmcp/http/BeastHttpClient.hpp"
#include "xmcp/media/MediaUploader.h"
#include "xmcp/tools/XTools.h"
#include "xmcp/version.h"
#include "xmcp/x/XApiClient.h"

using namespace xmcp;

int main(int argc, char** argv) {
    // stdout carries the protocol; route all logging to stderr.
    ::setenv("XMCP_STDIO_MODE", "1", 1);
    FUNC_SCOPE();

    std::vector<std::string> args(argv + 1, argv + argc);
    config::ServerConfig cfg;
    try {
        cfg = config::ParseServerConfig(args);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Configuration error: " << e.what() << "\n" << config::UsageText(argv[0]);
        return 1;
    }
    if (cfg.showHelp) {
        std::cerr << config::UsageText(argv[0]);
        return 0;
    }
    if (cfg.showVersion) {
        std::cerr << "xmcp " << getVersionString() << "\n";
        return 0;
    }

    Logger::setLogLevelFromString(cfg.logLevel);
    if (cfg.logFile.has_value()) {
        Logger::setLogFile(cfg.logFile.value());
    }

    http::BeastHttpClient::Options httpOpts;
    httpOpts.connectTimeoutMs = static_cast<unsigned int>(cfg.connectTimeoutMs);
    httpOpts.readTimeoutMs = static_cast<unsigned int>(cfg.readTimeoutMs);
    httpOpts.caFile = GetEnvOrDefault("XMCP_CA_FILE", "");
    httpOpts.caPath = GetEnvOrDefault("XMCP_CA_PATH", "");

    std::unique_ptr<http::BeastHttpClient> httpClient;
    std::unique_ptr<x::XApiClient> api;
    std::unique_ptr<media::MediaUploader> uploader;
    try {
        httpClient = std::make_unique<http::BeastHttpClient>(httpOpts);
        api = std::make_unique<x::XApiClient>(*httpClient, x::XApiOptions{cfg.apiBaseUrl, cfg.accessToken});
        uploader = std::make_unique<media::MediaUploader>(
            *httpClient, media::UploaderOptions{cfg.apiBaseUrl, cfg.accessToken, cfg.chunkSize});
    } catch (const std::invalid_argument& e) {
        LOG_ERROR("Startup failed: {}", e.what());
        return 1;
    }

    Implementation info{"xmcp", getVersionString()};
    ServerFactory factory;
    auto server = factory.CreateServer(info);
    tools::RegisterXTools(*server, tools::XToolsContext{*api, *uploader, *httpClient});

    // Fires on EOF or a fatal transport error.
    std::promise<void> stopped;
    std::once_flag stopOnce;
    server->SetErrorHandler([&stopped, &stopOnce](const std::string& err) {
        LOG_INFO("Server stopping: {}", err);
        std::call_once(stopOnce, [&stopped]() { stopped.set_value(); });
    });

    std::string transportCfg = cfg.framing == StdioFraming::ContentLength ? "framing=content-length"
                                                                          : "framing=ndjson";
    StdioTransportFactory tFactory;
    auto transport = tFactory.CreateTransport(transportCfg);
    LOG_INFO("xmcp {} starting on stdio ({}), api={}", getVersionString(), transportCfg, cfg.apiBaseUrl);
    server->Start(std::move(transport)).get();
    stopped.get_future().wait();
    server->Stop().get();
    LOG_INFO("xmcp stopped");
    return 0;
}
