//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.cpp
// Purpose: Logger static state, level parsing, log file handling and line output.
//==========================================================================================================

#include "logging/Logger.h"

#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

#include "env/EnvVars.h"

LogLevel Logger::sLogLevel = LogLevel::LOG_INFO_LEVEL;
std::ofstream Logger::sLogFile;
std::mutex Logger::sLogMutex;

namespace {

bool envFlag(const char* name, const char* fallback) {
    const std::string v = GetEnvOrDefault(name, fallback);
    return (v == "1" || v == "true" || v == "TRUE");
}

} // namespace

LogLevel Logger::levelFromString(const std::string& lvl, LogLevel fallback) {
    std::string s; s.reserve(lvl.size());
    for (char c : lvl) s.push_back(static_cast<char>(::toupper(static_cast<unsigned char>(c))));
    if (s == "DEBUG") return LogLevel::LOG_DEBUG_LEVEL;
    if (s == "INFO")  return LogLevel::LOG_INFO_LEVEL;
    if (s == "WARN" || s == "WARNING")  return LogLevel::LOG_WARN_LEVEL;
    if (s == "ERROR") return LogLevel::LOG_ERROR_LEVEL;
    if (s == "FATAL") return LogLevel::LOG_FATAL_LEVEL;
    return fallback;
}

void Logger::setLogFile(const std::string& filePath) {
    std::lock_guard<std::mutex> lock(sLogMutex);
    if (sLogFile.is_open()) {
        sLogFile.close();
    }
    sLogFile.open(filePath, std::ios::out | std::ios::app);
    if (!sLogFile.is_open()) {
        std::cerr << "[ERROR] Failed to open log file: " << filePath << " (" << ::strerror(errno) << ")" << std::endl;
        return;
    }
    auto now = std::chrono::system_clock::now();
    std::time_t now_time = std::chrono::system_clock::to_time_t(now);
    std::tm buf{};
    ::localtime_r(&now_time, &buf);
    sLogFile << "\n=== xmcp log opened at " << std::put_time(&buf, "%Y-%m-%d %H:%M:%S") << " ===\n";
    sLogFile.flush();
}

bool Logger::stdioMode() {
    return envFlag("XMCP_STDIO_MODE", "0");
}

void Logger::log(const char* level, const std::string& msg, const char* file, unsigned int line) {
    // Label colour is controlled by XMCP_LOG_COLOR (on by default)
    static const bool colorEnabled = envFlag("XMCP_LOG_COLOR", "1");

    std::ostringstream body;
    body << file << ":" << line << ": " << msg << "\n";
    const std::string tail = body.str();

    std::string consoleLine;
    if (colorEnabled) {
        const char* labelColor = (::strncmp(level, "ERROR", 5) == 0 || ::strncmp(level, "FATAL", 5) == 0)
                                     ? "\033[38;5;88m" /* burgundy */ : "\033[35m" /* purple */;
        consoleLine = std::string("[") + labelColor + level + "\033[0m] " + tail;
    } else {
        consoleLine = std::string("[") + level + "] " + tail;
    }

    std::lock_guard<std::mutex> lock(sLogMutex);
    // stderr in stdio mode so stdout carries JSON-RPC frames only
    if (stdioMode()) {
        std::cerr << consoleLine << std::flush;
    } else {
        std::cout << consoleLine << std::flush;
    }
    if (sLogFile.is_open()) {
        sLogFile << "[" << level << "] " << tail;
        sLogFile.flush();
    }
}
