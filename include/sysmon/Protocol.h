//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: MCP protocol data structures and constants served by the gateway
//==========================================================================================================

#pragma once

#include "sysmon/JSONRPCTypes.h"
#include <array>
#include <string>
#include <vector>
#include <optional>

namespace sysmon {

///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
// Protocol revisions the server speaks, preferred first. The first entry is the fallback when the
// client offers a revision not in this list.
constexpr std::array<const char*, 3> SUPPORTED_PROTOCOL_VERSIONS = {
    "2025-06-18",
    "2025-03-26",
    "2024-11-05"
};
constexpr const char* DEFAULT_PROTOCOL_VERSION = SUPPORTED_PROTOCOL_VERSIONS[0];

///////////////////////////////////////// Capabilities ///////////////////////////////////////////
struct ToolsCapability {
    bool listChanged = false;
};

struct ResourcesCapability {
    bool subscribe = false;
    bool listChanged = false;
};

// Only features with implemented methods are present; prompts are never advertised.
struct ServerCapabilities {
    std::optional<ToolsCapability> tools;
    std::optional<ResourcesCapability> resources;
};

///////////////////////////////////////// Tools ///////////////////////////////////////////
struct ToolDefinition {
    std::string name;
    std::string description;
    JSONValue inputSchema;   // JSON Schema for arguments
    JSONValue outputSchema;  // JSON Schema for structuredContent
};

///////////////////////////////////////// Resources ///////////////////////////////////////////
struct ResourceDefinition {
    std::string uri;
    std::string name;
    std::string description;
    std::string mimeType{"application/json"};
};

///////////////////////////////////////// Method names ///////////////////////////////////////////
namespace Methods {
    constexpr const char* Initialize = "initialize";
    constexpr const char* Initialized = "notifications/initialized";
    constexpr const char* Ping = "ping";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";
    constexpr const char* ListResources = "resources/list";
    constexpr const char* ReadResource = "resources/read";
}

namespace ToolNames {
    constexpr const char* ListServices = "list_services";
    constexpr const char* ListLogs = "list_logs";
}

namespace ResourceUris {
    constexpr const char* ServicesSnapshot = "resource://services/snapshot";
    constexpr const char* ServicesFailed = "resource://services/failed";
    constexpr const char* LogsRecent = "resource://logs/recent";
}

} // namespace sysmon
