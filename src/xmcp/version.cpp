//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.cpp
// Purpose: Server version taken from the CMake project version (XMCP_VERSION_* definitions).
//==========================================================================================================

#include "xmcp/version.h"

#include <format>

namespace xmcp {

VersionInfo getVersion() {
    return VersionInfo{XMCP_VERSION_MAJOR, XMCP_VERSION_MINOR, XMCP_VERSION_PATCH};
}

std::string getVersionString() {
    const auto v = getVersion();
    return std::format("{}.{}.{}", v.major, v.minor, v.patch);
}

} // namespace xmcp
