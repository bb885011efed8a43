//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/sysmon/Registry.cpp
// Purpose: Static method table, tool schemas and the initialize handshake
//==========================================================================================================

#include <algorithm>
#include <format>

#include "sysmon/Registry.h"
#include "sysmon/errors/Errors.h"
#include "sysmon/version.h"
#include "logging/Logger.h"

namespace sysmon {

namespace {
    constexpr const char* kListServicesInput = R"json({
        "type": "object",
        "additionalProperties": false,
        "properties": {
            "state": {
                "type": "string",
                "description": "Filter by active state: active, inactive, failed, activating, deactivating, reloading (case-insensitive)"
            },
            "name_contains": {"type": "string", "description": "Substring the unit name must contain"},
            "limit": {"type": "integer", "minimum": 1, "maximum": 1000, "default": 200}
        }
    })json";

    constexpr const char* kListServicesOutput = R"({
        "type": "object",
        "additionalProperties": false,
        "required": ["services", "total", "returned", "truncated", "generated_at_utc"],
        "properties": {
            "services": {
                "type": "array",
                "items": {
                    "type": "object",
                    "additionalProperties": false,
                    "required": ["unit", "description", "load_state", "active_state", "sub_state"],
                    "properties": {
                        "unit": {"type": "string"},
                        "description": {"type": "string"},
                        "load_state": {"type": "string"},
                        "active_state": {"type": "string"},
                        "sub_state": {"type": "string"},
                        "unit_file_state": {"type": "string"},
                        "since_utc": {"type": "string", "format": "date-time"},
                        "main_pid": {"type": "integer"},
                        "exec_main_status": {"type": "integer"},
                        "result": {"type": "string"}
                    }
                }
            },
            "total": {"type": "integer", "minimum": 0},
            "returned": {"type": "integer", "minimum": 0},
            "truncated": {"type": "boolean"},
            "generated_at_utc": {"type": "string", "format": "date-time"}
        }
    })";

    constexpr const char* kListLogsInput = R"({
        "type": "object",
        "additionalProperties": false,
        "required": ["start_utc", "end_utc"],
        "properties": {
            "priority": {
                "type": ["integer", "string"],
                "description": "Severity threshold 0-7 or emerg, alert, crit, err, warning, notice, info, debug"
            },
            "unit": {"type": "string", "pattern": "^[A-Za-z0-9._@:-]+$"},
            "start_utc": {"type": "string", "format": "date-time", "description": "RFC3339 UTC ending with Z"},
            "end_utc": {"type": "string", "format": "date-time", "description": "RFC3339 UTC ending with Z"},
            "grep": {"type": "string", "maxLength": 512, "description": "Substring, or /regex/"},
            "exclude_units": {"type": "array", "items": {"type": "string", "pattern": "^[A-Za-z0-9._@:-]+$"}},
            "order": {"type": "string", "enum": ["asc", "desc"], "default": "desc"},
            "allow_large_window": {"type": "boolean", "default": false},
            "limit": {"type": "integer", "minimum": 1, "maximum": 1000, "default": 200}
        }
    })";

    constexpr const char* kListLogsOutput = R"({
        "type": "object",
        "additionalProperties": false,
        "required": ["entries", "returned", "truncated", "generated_at_utc", "window"],
        "properties": {
            "entries": {
                "type": "array",
                "items": {
                    "type": "object",
                    "additionalProperties": false,
                    "required": ["timestamp_utc", "priority"],
                    "properties": {
                        "timestamp_utc": {"type": "string", "format": "date-time"},
                        "unit": {"type": "string"},
                        "priority": {"type": "integer", "minimum": 0, "maximum": 7},
                        "hostname": {"type": "string"},
                        "pid": {"type": "integer"},
                        "message": {"type": "string"},
                        "cursor": {"type": "string"}
                    }
                }
            },
            "total_scanned": {"type": "integer", "minimum": 0},
            "returned": {"type": "integer", "minimum": 0},
            "truncated": {"type": "boolean"},
            "generated_at_utc": {"type": "string", "format": "date-time"},
            "window": {
                "type": "object",
                "additionalProperties": false,
                "required": ["start_utc", "end_utc"],
                "properties": {
                    "start_utc": {"type": "string", "format": "date-time"},
                    "end_utc": {"type": "string", "format": "date-time"}
                }
            }
        }
    })";

    const JSONValue::Object& paramsObject(const std::optional<JSONValue>& params) {
        static const JSONValue::Object kEmpty;
        if (!params.has_value() || !params->isObject()) {
            return kEmpty;
        }
        return std::get<JSONValue::Object>(params->value);
    }

    std::optional<std::string> stringParam(const JSONValue::Object& obj, const char* key) {
        const JSONValue* v = FindMember(obj, key);
        if (v == nullptr || !v->isString()) {
            return std::nullopt;
        }
        return std::get<std::string>(v->value);
    }

    JSONValue missingParam(const char* name) {
        JSONValue::Object d;
        SetMember(d, "param", JSONValue(name));
        return JSONValue(std::move(d));
    }

    JSONValue toolResult(query::QueryOutput output) {
        JSONValue::Object text;
        SetMember(text, "type", JSONValue("text"));
        SetMember(text, "text", JSONValue(std::move(output.summary)));
        JSONValue::Array content;
        content.push_back(std::make_shared<JSONValue>(std::move(text)));

        JSONValue::Object result;
        SetMember(result, "content", JSONValue(std::move(content)));
        SetMember(result, "structuredContent", std::move(output.structured));
        SetMember(result, "isError", JSONValue(false));
        return JSONValue(std::move(result));
    }
}

MethodRegistry::MethodRegistry(const query::ServiceQuery& services, const query::LogQuery& logs)
    : services_(services), logs_(logs), resources_(services, logs) {
    handlers_[Methods::Initialize] = [this](const std::optional<JSONValue>& p){ return handleInitialize(p); };
    handlers_[Methods::Initialized] = [](const std::optional<JSONValue>&){ return JSONValue(JSONValue::Object{}); };
    handlers_[Methods::Ping] = [](const std::optional<JSONValue>&){ return JSONValue(JSONValue::Object{}); };
    handlers_[Methods::ListTools] = [this](const std::optional<JSONValue>&){ return handleToolsList(); };
    handlers_[Methods::CallTool] = [this](const std::optional<JSONValue>& p){ return handleToolsCall(p); };
    handlers_[Methods::ListResources] = [this](const std::optional<JSONValue>&){ return handleResourcesList(); };
    handlers_[Methods::ReadResource] = [this](const std::optional<JSONValue>& p){ return handleResourcesRead(p); };
}

bool MethodRegistry::Has(const std::string& method) const {
    return handlers_.find(method) != handlers_.end();
}

JSONValue MethodRegistry::Invoke(const std::string& method, const std::optional<JSONValue>& params) const {
    auto it = handlers_.find(method);
    if (it == handlers_.end()) {
        throw errors::methodNotFound(method);
    }
    return it->second(params);
}

const std::vector<ToolDefinition>& MethodRegistry::Tools() {
    static const std::vector<ToolDefinition> kTools = [] {
        std::vector<ToolDefinition> tools(2);
        tools[0].name = ToolNames::ListServices;
        tools[0].description = "List systemd service units and their current state";
        tools[0].inputSchema = ParseJSON(kListServicesInput);
        tools[0].outputSchema = ParseJSON(kListServicesOutput);
        tools[1].name = ToolNames::ListLogs;
        tools[1].description = "List journald log entries inside a UTC window with filters and bounds";
        tools[1].inputSchema = ParseJSON(kListLogsInput);
        tools[1].outputSchema = ParseJSON(kListLogsOutput);
        return tools;
    }();
    return kTools;
}

ServerCapabilities MethodRegistry::Capabilities() {
    ServerCapabilities caps;
    caps.tools = ToolsCapability{};
    caps.resources = ResourcesCapability{};
    return caps;
}

std::string MethodRegistry::NegotiateProtocolVersion(const std::string& requested) {
    auto it = std::find_if(SUPPORTED_PROTOCOL_VERSIONS.begin(), SUPPORTED_PROTOCOL_VERSIONS.end(),
                           [&requested](const char* v){ return requested == v; });
    if (it != SUPPORTED_PROTOCOL_VERSIONS.end()) {
        return *it;
    }
    return DEFAULT_PROTOCOL_VERSION;
}

JSONValue MethodRegistry::handleInitialize(const std::optional<JSONValue>& params) const {
    const auto& obj = paramsObject(params);
    const auto version = stringParam(obj, "protocolVersion");
    if (!version.has_value()) {
        throw errors::invalidParams(errors::DomainCodes::InvalidParams, "protocolVersion is required",
                                    missingParam("protocolVersion"));
    }
    const JSONValue* clientInfo = FindMember(obj, "clientInfo");
    if (clientInfo == nullptr || !clientInfo->isObject()) {
        throw errors::invalidParams(errors::DomainCodes::InvalidParams, "clientInfo is required",
                                    missingParam("clientInfo"));
    }
    const JSONValue* capabilities = FindMember(obj, "capabilities");
    if (capabilities == nullptr || !capabilities->isObject()) {
        throw errors::invalidParams(errors::DomainCodes::InvalidParams, "capabilities is required",
                                    missingParam("capabilities"));
    }

    const std::string negotiated = NegotiateProtocolVersion(*version);
    const auto& info = std::get<JSONValue::Object>(clientInfo->value);
    LOG_INFO("initialize from client {} {} (requested protocol {}, using {})",
             SerializeJSON(JSONValue(stringParam(info, "name").value_or("<unnamed>"))),
             SerializeJSON(JSONValue(stringParam(info, "version").value_or("?"))),
             SerializeJSON(JSONValue(*version)), negotiated);

    const ServerCapabilities caps = Capabilities();
    JSONValue::Object capsObj;
    if (caps.tools) {
        JSONValue::Object t;
        SetMember(t, "listChanged", JSONValue(caps.tools->listChanged));
        SetMember(capsObj, "tools", JSONValue(std::move(t)));
    }
    if (caps.resources) {
        JSONValue::Object r;
        SetMember(r, "subscribe", JSONValue(caps.resources->subscribe));
        SetMember(r, "listChanged", JSONValue(caps.resources->listChanged));
        SetMember(capsObj, "resources", JSONValue(std::move(r)));
    }

    JSONValue::Object serverInfo;
    SetMember(serverInfo, "name", JSONValue(SERVER_NAME));
    SetMember(serverInfo, "version", JSONValue(getVersionString()));

    JSONValue::Object result;
    SetMember(result, "protocolVersion", JSONValue(negotiated));
    SetMember(result, "serverInfo", JSONValue(std::move(serverInfo)));
    SetMember(result, "capabilities", JSONValue(std::move(capsObj)));
    return JSONValue(std::move(result));
}

JSONValue MethodRegistry::handleToolsList() const {
    JSONValue::Array tools;
    for (const auto& t : Tools()) {
        JSONValue::Object o;
        SetMember(o, "name", JSONValue(t.name));
        SetMember(o, "description", JSONValue(t.description));
        SetMember(o, "inputSchema", t.inputSchema);
        SetMember(o, "outputSchema", t.outputSchema);
        tools.push_back(std::make_shared<JSONValue>(std::move(o)));
    }
    JSONValue::Object result;
    SetMember(result, "tools", JSONValue(std::move(tools)));
    return JSONValue(std::move(result));
}

JSONValue MethodRegistry::handleToolsCall(const std::optional<JSONValue>& params) const {
    if (!params.has_value()) {
        throw errors::invalidParams(errors::DomainCodes::InvalidParams, "name is required", missingParam("name"));
    }
    const auto& obj = paramsObject(params);
    const auto name = stringParam(obj, "name");
    if (!name.has_value()) {
        throw errors::invalidParams(errors::DomainCodes::InvalidParams, "name is required", missingParam("name"));
    }
    const JSONValue* arguments = FindMember(obj, "arguments");
    LOG_DEBUG("Handling tools/call for {}", SerializeJSON(JSONValue(*name)));

    if (*name == ToolNames::ListServices) {
        return toolResult(services_.Run(query::ParseServiceQueryParams(arguments)));
    }
    if (*name == ToolNames::ListLogs) {
        return toolResult(logs_.Run(query::ParseLogQueryParams(arguments)));
    }
    throw errors::toolNotFound(*name);
}

JSONValue MethodRegistry::handleResourcesList() const {
    JSONValue::Array resources;
    for (const auto& r : query::ResourceCatalog::Definitions()) {
        JSONValue::Object o;
        SetMember(o, "uri", JSONValue(r.uri));
        SetMember(o, "name", JSONValue(r.name));
        SetMember(o, "description", JSONValue(r.description));
        SetMember(o, "mimeType", JSONValue(r.mimeType));
        resources.push_back(std::make_shared<JSONValue>(std::move(o)));
    }
    JSONValue::Object result;
    SetMember(result, "resources", JSONValue(std::move(resources)));
    return JSONValue(std::move(result));
}

JSONValue MethodRegistry::handleResourcesRead(const std::optional<JSONValue>& params) const {
    const auto uri = stringParam(paramsObject(params), "uri");
    if (!uri.has_value()) {
        throw errors::invalidParams(errors::DomainCodes::InvalidParams, "uri is required", missingParam("uri"));
    }
    return resources_.Read(*uri);
}

} // namespace sysmon
