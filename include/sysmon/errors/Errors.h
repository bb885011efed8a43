//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Typed protocol errors, stable domain error codes and JSON-RPC error mapping helpers
//==========================================================================================================

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include "sysmon/JSONRPCTypes.h"

namespace sysmon {
namespace errors {

// Typed error representation carried through the dispatcher.
struct McpError {
    int code{0};
    std::string message;
    std::optional<JSONValue> data;
};

//==========================================================================================================
// Stable string identifiers carried in error.data.code. Clients match on these, never on message text.
//==========================================================================================================
namespace DomainCodes {
    constexpr const char* InvalidLimit = "invalid_limit";
    constexpr const char* InvalidPriority = "invalid_priority";
    constexpr const char* InvalidUnit = "invalid_unit";
    constexpr const char* InvalidState = "invalid_state";
    constexpr const char* InvalidOrder = "invalid_order";
    constexpr const char* InvalidGrep = "invalid_grep";
    constexpr const char* InvalidArguments = "invalid_arguments";
    constexpr const char* InvalidParams = "invalid_params";
    constexpr const char* MissingTimeRange = "missing_time_range";
    constexpr const char* InvalidTimeRange = "invalid_time_range";
    constexpr const char* InvalidUtcTime = "invalid_utc_time";
    constexpr const char* WindowTooLarge = "window_too_large";
    constexpr const char* ToolNotFound = "tool_not_found";
    constexpr const char* ResourceNotFound = "resource_not_found";
    constexpr const char* InternalError = "internal_error";
}

// Build the structured data payload { code, message, details }.
//
// Args:
//   code: Stable string identifier (see DomainCodes).
//   message: Human readable explanation, safe to show to clients.
//   details: Object with extra context; defaults to {}.
inline JSONValue makeDomainData(const std::string& code, const std::string& message,
                                JSONValue details = JSONValue(JSONValue::Object{})) {
    JSONValue::Object obj;
    SetMember(obj, "code", JSONValue(code));
    SetMember(obj, "message", JSONValue(message));
    SetMember(obj, "details", std::move(details));
    return JSONValue(std::move(obj));
}

// Convenience: Create a JSONRPCResponse error from McpError and id.
inline std::unique_ptr<JSONRPCResponse> makeErrorResponse(const JSONRPCId& id, const McpError& err) {
    return CreateErrorResponse(id, err.code, err.message, err.data);
}

//==========================================================================================================
// RpcException
// Purpose: Carries an McpError out of a handler. The dispatcher converts it into the error member of the
//          response for the request being handled.
//==========================================================================================================
class RpcException : public std::runtime_error {
public:
    explicit RpcException(McpError err)
        : std::runtime_error(err.message), error_(std::move(err)) {}

    const McpError& error() const noexcept { return error_; }

private:
    McpError error_;
};

// -32602 "Invalid params" with data { code, message, details }.
inline RpcException invalidParams(const std::string& code, const std::string& message,
                                  JSONValue details = JSONValue(JSONValue::Object{})) {
    McpError e;
    e.code = JSONRPCErrorCodes::InvalidParams;
    e.message = "Invalid params";
    e.data = makeDomainData(code, message, std::move(details));
    return RpcException(std::move(e));
}

// -32601 "Method not found"; data.method echoes the requested name.
inline RpcException methodNotFound(const std::string& method) {
    McpError e;
    e.code = JSONRPCErrorCodes::MethodNotFound;
    e.message = "Method not found";
    JSONValue::Object details;
    SetMember(details, "method", JSONValue(method));
    e.data = JSONValue(std::move(details));
    return RpcException(std::move(e));
}

// -32601 for an unknown tool name, data.code = tool_not_found.
inline RpcException toolNotFound(const std::string& name) {
    McpError e;
    e.code = JSONRPCErrorCodes::MethodNotFound;
    e.message = "Method not found";
    JSONValue::Object details;
    SetMember(details, "name", JSONValue(name));
    e.data = makeDomainData(DomainCodes::ToolNotFound, "tool not found", JSONValue(std::move(details)));
    return RpcException(std::move(e));
}

// -32601 for an unknown resource URI, data.code = resource_not_found.
inline RpcException resourceNotFound(const std::string& uri) {
    McpError e;
    e.code = JSONRPCErrorCodes::MethodNotFound;
    e.message = "Method not found";
    JSONValue::Object details;
    SetMember(details, "uri", JSONValue(uri));
    e.data = makeDomainData(DomainCodes::ResourceNotFound, "resource not found", JSONValue(std::move(details)));
    return RpcException(std::move(e));
}

// -32603 "Internal error" that only exposes an opaque correlation id.
inline McpError internalError(const std::string& errorId) {
    McpError e;
    e.code = JSONRPCErrorCodes::InternalError;
    e.message = "Internal error";
    JSONValue::Object details;
    SetMember(details, "error_id", JSONValue(errorId));
    e.data = makeDomainData(DomainCodes::InternalError, "internal server error", JSONValue(std::move(details)));
    return e;
}

} // namespace errors
} // namespace sysmon
