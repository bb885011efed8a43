//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Registry.h
// Purpose: Static method table: MCP methods, tool and resource sub-registries and their schemas
//==========================================================================================================

#pragma once

#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "sysmon/JSONRPCTypes.h"
#include "sysmon/Protocol.h"
#include "sysmon/query/Queries.h"

namespace sysmon {

//==========================================================================================================
// MethodRegistry
// Purpose: Maps method names to handlers. The table is built once in the constructor and never changes.
// Methods served:
//   initialize, notifications/initialized, ping, tools/list, tools/call, resources/list, resources/read.
// Notes:
//   - Handlers return the result member of the response or throw errors::RpcException; adapter failures
//     propagate as adapters::AdapterError for the dispatcher to map.
//   - Safe to call concurrently: nothing in the registry is mutated after construction.
//==========================================================================================================
class MethodRegistry {
public:
    using Handler = std::function<JSONValue(const std::optional<JSONValue>& params)>;

    MethodRegistry(const query::ServiceQuery& services, const query::LogQuery& logs);

    MethodRegistry(const MethodRegistry&) = delete;
    MethodRegistry& operator=(const MethodRegistry&) = delete;

    bool Has(const std::string& method) const;

    //==========================================================================================================
    // Invoke
    // Args:
    //   method: JSON-RPC method name.
    //   params: params member of the request, when present.
    // Returns:
    //   The result value.
    // Throws:
    //   errors::RpcException (-32601 unknown method/tool/resource, -32602 invalid params);
    //   adapters::AdapterError.
    //==========================================================================================================
    JSONValue Invoke(const std::string& method, const std::optional<JSONValue>& params) const;

    // Tool definitions with strict input/output schemas.
    static const std::vector<ToolDefinition>& Tools();

    // Capabilities advertised by initialize; mirrors the served methods exactly.
    static ServerCapabilities Capabilities();

    // The requested revision when supported, else DEFAULT_PROTOCOL_VERSION.
    static std::string NegotiateProtocolVersion(const std::string& requested);

private:
    JSONValue handleInitialize(const std::optional<JSONValue>& params) const;
    JSONValue handleToolsList() const;
    JSONValue handleToolsCall(const std::optional<JSONValue>& params) const;
    JSONValue handleResourcesList() const;
    JSONValue handleResourcesRead(const std::optional<JSONValue>& params) const;

    const query::ServiceQuery& services_;
    const query::LogQuery& logs_;
    query::ResourceCatalog resources_;
    std::unordered_map<std::string, Handler> handlers_;
};

} // namespace sysmon
