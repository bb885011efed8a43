//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvelopeCodec.cpp
// Purpose: JSON-RPC envelope classification and response assembly
//==========================================================================================================

#include "sysmon/EnvelopeCodec.h"
#include "env/EnvVars.h"
#include "logging/Logger.h"

namespace sysmon {

namespace {
    JSONRPCResponse invalidRequest(const JSONRPCId& id) {
        return *CreateErrorResponse(id, JSONRPCErrorCodes::InvalidRequest, "Invalid Request");
    }

    // Reads a usable id (string | integer | null) from a member; sets ok=false for any other type.
    std::optional<JSONRPCId> readId(const JSONValue::Object& obj, bool& ok) {
        ok = true;
        const JSONValue* v = FindMember(obj, "id");
        if (!v) {
            return std::nullopt;
        }
        if (std::holds_alternative<std::string>(v->value)) return JSONRPCId{std::get<std::string>(v->value)};
        if (std::holds_alternative<int64_t>(v->value)) return JSONRPCId{std::get<int64_t>(v->value)};
        if (v->isNull()) return JSONRPCId{nullptr};
        ok = false;
        return std::nullopt;
    }
}

DecodedCall EnvelopeCodec::DecodeMember(const JSONValue& member) const {
    DecodedCall call;
    if (!member.isObject()) {
        call.invalid = invalidRequest(nullptr);
        return call;
    }
    const auto& obj = std::get<JSONValue::Object>(member.value);

    bool idOk = true;
    auto id = readId(obj, idOk);
    const JSONRPCId replyId = (idOk && id.has_value()) ? id.value() : JSONRPCId{nullptr};
    if (!idOk) {
        call.invalid = invalidRequest(nullptr);
        return call;
    }

    const JSONValue* ver = FindMember(obj, "jsonrpc");
    if (!ver || !ver->isString() || std::get<std::string>(ver->value) != "2.0") {
        call.invalid = invalidRequest(replyId);
        return call;
    }
    const JSONValue* method = FindMember(obj, "method");
    if (!method || !method->isString() || TrimAscii(std::get<std::string>(method->value)).empty()) {
        call.invalid = invalidRequest(replyId);
        return call;
    }
    const JSONValue* params = FindMember(obj, "params");
    if (params && !params->isObject()) {
        call.invalid = invalidRequest(replyId);
        return call;
    }

    JSONRPCRequest req;
    req.id = id;
    req.method = std::get<std::string>(method->value);
    if (params) {
        req.params = *params;
    }
    call.request = std::move(req);
    return call;
}

DecodedEnvelope EnvelopeCodec::Decode(const std::string& payload) const {
    DecodedEnvelope env;
    JSONValue root;
    try {
        root = ParseJSON(payload);
    } catch (const JSONParseError& e) {
        LOG_DEBUG("Envelope parse error: {}", e.what());
        env.fatal = *CreateErrorResponse(nullptr, JSONRPCErrorCodes::ParseError, "Parse error");
        return env;
    }

    if (root.isArray()) {
        env.isBatch = true;
        const auto& arr = std::get<JSONValue::Array>(root.value);
        if (arr.empty()) {
            env.fatal = invalidRequest(nullptr);
            return env;
        }
        if (arr.size() > maxBatch_) {
            LOG_WARN("Rejecting batch of {} members (limit {})", arr.size(), maxBatch_);
            env.fatal = invalidRequest(nullptr);
            return env;
        }
        env.calls.reserve(arr.size());
        for (const auto& member : arr) {
            env.calls.push_back(member ? DecodeMember(*member) : DecodeMember(JSONValue()));
        }
        return env;
    }

    if (root.isObject()) {
        env.calls.push_back(DecodeMember(root));
        return env;
    }

    env.fatal = invalidRequest(nullptr);
    return env;
}

std::optional<std::string> EnvelopeCodec::Encode(bool isBatch, const std::vector<std::optional<JSONRPCResponse>>& responses) {
    JSONValue::Array out;
    for (const auto& r : responses) {
        if (r.has_value()) {
            out.push_back(std::make_shared<JSONValue>(r->ToJSON()));
        }
    }
    if (out.empty()) {
        return std::nullopt;
    }
    if (!isBatch) {
        return SerializeJSON(*out.front());
    }
    return SerializeJSON(JSONValue(std::move(out)));
}

} // namespace sysmon
