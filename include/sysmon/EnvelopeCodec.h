//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvelopeCodec.h
// Purpose: Decodes raw JSON-RPC payloads (single, batch, notification) and assembles response bodies
//==========================================================================================================

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "sysmon/JSONRPCTypes.h"

namespace sysmon {

//==========================================================================================================
// DecodedCall
// Purpose: One member of a decoded payload: either a well-formed request or the -32600 response it earns.
//==========================================================================================================
struct DecodedCall {
    std::optional<JSONRPCRequest> request;
    std::optional<JSONRPCResponse> invalid;
};

//==========================================================================================================
// DecodedEnvelope
// Purpose: Result of EnvelopeCodec::Decode.
// Fields:
//   isBatch: True when the payload was a JSON array.
//   calls: Members in payload order (empty when fatal is set).
//   fatal: Single response that replaces the whole payload (parse error, empty or oversized batch,
//          top-level value that is neither object nor array).
//==========================================================================================================
struct DecodedEnvelope {
    bool isBatch{false};
    std::vector<DecodedCall> calls;
    std::optional<JSONRPCResponse> fatal;
};

//==========================================================================================================
// EnvelopeCodec
// Purpose: Structural JSON-RPC 2.0 validation. Method routing and params semantics live elsewhere.
// Rules:
//   - Malformed JSON -> single -32700 with id null.
//   - Top-level value other than object/array -> single -32600 with id null.
//   - Empty array, or more than maxBatch members -> single -32600 with id null.
//   - Per member: must be an object with jsonrpc == "2.0", a non-empty string method, an id (when
//     present) that is a string, integer or null, and params (when present) that is an object.
//     Failing members produce -32600 carrying their id when it was usable, else null.
//==========================================================================================================
class EnvelopeCodec {
public:
    explicit EnvelopeCodec(std::size_t maxBatch = 100) : maxBatch_(maxBatch) {}

    DecodedEnvelope Decode(const std::string& payload) const;

    // Validates one already-parsed member.
    DecodedCall DecodeMember(const JSONValue& member) const;

    //==========================================================================================================
    // Encode
    // Purpose: Serializes the responses for one payload. Notification slots hold std::nullopt.
    // Returns:
    //   Body text: a single object for a non-batch payload, an array in member order for a batch.
    //   std::nullopt when no response is due (every member was a notification).
    //==========================================================================================================
    static std::optional<std::string> Encode(bool isBatch, const std::vector<std::optional<JSONRPCResponse>>& responses);

private:
    std::size_t maxBatch_;
};

} // namespace sysmon
