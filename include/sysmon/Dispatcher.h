//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Dispatcher.h
// Purpose: JSON-RPC dispatch engine: decode, route through the registry, map failures, aggregate batches
//==========================================================================================================

#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include <boost/asio/thread_pool.hpp>

#include "sysmon/EnvelopeCodec.h"
#include "sysmon/JSONRPCTypes.h"
#include "sysmon/Registry.h"

namespace sysmon {

//==========================================================================================================
// IsSensitiveKey
// Purpose: True for object keys whose values must never reach the logs (tokens, passwords, secrets,
//          credentials, API keys, authorization values). Case-insensitive.
//==========================================================================================================
bool IsSensitiveKey(const std::string& key);

// Deep copy of value with every sensitive key's value replaced by "[REDACTED]".
JSONValue RedactSensitive(const JSONValue& value);

//==========================================================================================================
// Dispatcher
// Purpose: Handles one POST /mcp body end to end.
// Notes:
//   - Batch members run concurrently on an internal pool; each member is isolated, so one failing call
//     never changes a sibling's response. Responses are emitted in member order.
//   - errors::RpcException becomes the response error as-is. adapters::AdapterError and any other
//     std::exception become -32603 with an opaque error_id; the detail is logged at ERROR.
//   - One audit line per handled call: method, redacted params and outcome (success|failure).
//==========================================================================================================
class Dispatcher {
public:
    //==========================================================================================================
    // Args:
    //   registry: Method table; must outlive the dispatcher.
    //   maxBatch: Largest accepted batch.
    //   batchWorkers: Threads used to fan out batch members.
    //==========================================================================================================
    Dispatcher(const MethodRegistry& registry, std::size_t maxBatch, std::size_t batchWorkers);
    ~Dispatcher();

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    //==========================================================================================================
    // Handle
    // Args:
    //   payload: Raw request body.
    // Returns:
    //   Response body, or std::nullopt when every call was a notification.
    //==========================================================================================================
    std::optional<std::string> Handle(const std::string& payload);

    //==========================================================================================================
    // HandleRequest
    // Purpose: Executes one structurally valid request.
    // Returns:
    //   The response, or std::nullopt for a notification.
    //==========================================================================================================
    std::optional<JSONRPCResponse> HandleRequest(const JSONRPCRequest& request) const;

private:
    std::optional<JSONRPCResponse> handleCall(const DecodedCall& call) const;

    const MethodRegistry& registry_;
    EnvelopeCodec codec_;
    boost::asio::thread_pool pool_;
};

} // namespace sysmon
