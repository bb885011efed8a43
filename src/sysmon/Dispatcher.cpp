//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/sysmon/Dispatcher.cpp
// Purpose: JSON-RPC dispatch engine with batch fan-out, error mapping and audit logging
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <exception>
#include <format>
#include <future>
#include <memory>
#include <random>
#include <vector>

#include <boost/asio/post.hpp>

#include "sysmon/Dispatcher.h"
#include "sysmon/adapters/AdapterTypes.h"
#include "sysmon/errors/Errors.h"
#include "logging/Logger.h"

namespace sysmon {

namespace {
    constexpr const char* kRedacted = "[REDACTED]";

    std::string newErrorId() {
        thread_local std::mt19937_64 gen{std::random_device{}()};
        return std::format("{:016x}", gen());
    }

    // Client-supplied text is logged as a JSON string literal: one line, no raw control bytes.
    std::string logQuoted(const std::string& text) {
        return SerializeJSON(JSONValue(text));
    }

    void audit(const JSONRPCRequest& request, bool success) {
        const std::string params = request.params.has_value() ? SerializeJSON(RedactSensitive(*request.params))
                                                             : std::string("null");
        LOG_INFO("mcp action audited method={} params={} outcome={}", logQuoted(request.method), params,
                 success ? "success" : "failure");
    }
}

bool IsSensitiveKey(const std::string& key) {
    std::string k;
    k.reserve(key.size());
    for (unsigned char c : key) {
        k.push_back(static_cast<char>(std::tolower(c)));
    }
    static const char* const kExact[] = {
        "token", "api_token", "access_token", "refresh_token", "authorization", "bearer", "password",
        "secret", "credentials", "credential", "api_key", "apikey"
    };
    for (const char* s : kExact) {
        if (k == s) {
            return true;
        }
    }
    return k.find("token") != std::string::npos || k.find("secret") != std::string::npos ||
           k.find("password") != std::string::npos || k.find("credential") != std::string::npos;
}

JSONValue RedactSensitive(const JSONValue& value) {
    if (value.isObject()) {
        JSONValue::Object out;
        for (const auto& [key, member] : std::get<JSONValue::Object>(value.value)) {
            if (IsSensitiveKey(key)) {
                SetMember(out, key, JSONValue(kRedacted));
            } else {
                SetMember(out, key, member ? RedactSensitive(*member) : JSONValue());
            }
        }
        return JSONValue(std::move(out));
    }
    if (value.isArray()) {
        JSONValue::Array out;
        for (const auto& item : std::get<JSONValue::Array>(value.value)) {
            out.push_back(std::make_shared<JSONValue>(item ? RedactSensitive(*item) : JSONValue()));
        }
        return JSONValue(std::move(out));
    }
    return value;
}

Dispatcher::Dispatcher(const MethodRegistry& registry, std::size_t maxBatch, std::size_t batchWorkers)
    : registry_(registry), codec_(maxBatch), pool_(std::max<std::size_t>(1, batchWorkers)) {}

Dispatcher::~Dispatcher() {
    pool_.stop();
    pool_.join();
}

std::optional<JSONRPCResponse> Dispatcher::HandleRequest(const JSONRPCRequest& request) const {
    const JSONRPCId id = request.id.value_or(JSONRPCId(nullptr));
    std::optional<JSONRPCResponse> response;
    try {
        response = JSONRPCResponse(id, registry_.Invoke(request.method, request.params));
    } catch (const errors::RpcException& e) {
        response = *errors::makeErrorResponse(id, e.error());
    } catch (const adapters::AdapterError& e) {
        const std::string errorId = newErrorId();
        LOG_ERROR("adapter failure in {} (error_id={}): {}", logQuoted(request.method), errorId, e.what());
        response = *errors::makeErrorResponse(id, errors::internalError(errorId));
    } catch (const std::exception& e) {
        const std::string errorId = newErrorId();
        LOG_ERROR("unexpected failure in {} (error_id={}): {}", logQuoted(request.method), errorId, e.what());
        response = *errors::makeErrorResponse(id, errors::internalError(errorId));
    }

    audit(request, !response->IsError());
    if (request.IsNotification()) {
        return std::nullopt;
    }
    return response;
}

std::optional<JSONRPCResponse> Dispatcher::handleCall(const DecodedCall& call) const {
    if (call.invalid.has_value()) {
        LOG_DEBUG("rejecting malformed request (id={})", IdToString(call.invalid->id));
        return call.invalid;
    }
    return HandleRequest(*call.request);
}

std::optional<std::string> Dispatcher::Handle(const std::string& payload) {
    FUNC_SCOPE();
    DecodedEnvelope envelope = codec_.Decode(payload);
    if (envelope.fatal.has_value()) {
        LOG_DEBUG("rejecting payload: {}", envelope.fatal->Serialize());
        return envelope.fatal->Serialize();
    }

    std::vector<std::optional<JSONRPCResponse>> responses;
    responses.reserve(envelope.calls.size());

    if (envelope.calls.size() == 1) {
        responses.push_back(handleCall(envelope.calls.front()));
        return EnvelopeCodec::Encode(envelope.isBatch, responses);
    }

    std::vector<std::future<std::optional<JSONRPCResponse>>> pending;
    pending.reserve(envelope.calls.size());
    for (const auto& call : envelope.calls) {
        auto promise = std::make_shared<std::promise<std::optional<JSONRPCResponse>>>();
        pending.push_back(promise->get_future());
        boost::asio::post(pool_, [this, promise, &call]() {
            try {
                promise->set_value(handleCall(call));
            } catch (...) {
                promise->set_exception(std::current_exception());
            }
        });
    }
    // Every task references envelope.calls; all of them must finish before an error may unwind this frame.
    std::exception_ptr firstFailure;
    for (auto& f : pending) {
        try {
            responses.push_back(f.get());
        } catch (...) {
            if (!firstFailure) {
                firstFailure = std::current_exception();
            }
        }
    }
    if (firstFailure) {
        std::rethrow_exception(firstFailure);
    }
    LOG_DEBUG("batch of {} call(s) handled", envelope.calls.size());
    return EnvelopeCodec::Encode(envelope.isBatch, responses);
}

} // namespace sysmon
