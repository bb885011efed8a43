//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.h
// Purpose: Public version API for sysmon-mcp (server identity and semantic version helpers).
//==========================================================================================================
#pragma once

#include <string>

namespace sysmon {

//==========================================================================================================
// VersionInfo
// Purpose: Semantic version components.
//==========================================================================================================
struct VersionInfo {
    int major;
    int minor;
    int patch;
};

// Server name reported in serverInfo and the discovery document.
constexpr const char* SERVER_NAME = "sysmon-mcp";

//==========================================================================================================
// getVersion
// Purpose: Returns the server semantic version components.
//==========================================================================================================
VersionInfo getVersion();

//==========================================================================================================
// getVersionString
// Purpose: Returns the semantic version string formatted as "MAJOR.MINOR.PATCH".
//==========================================================================================================
std::string getVersionString();

} // namespace sysmon
