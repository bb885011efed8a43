//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_envelope_codec.cpp
// Purpose: GoogleTests for JSON-RPC envelope classification and response assembly
//==========================================================================================================

#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <vector>

#include "sysmon/EnvelopeCodec.h"

using namespace sysmon;

namespace {

int errorCode(const JSONRPCResponse& r) {
    const auto& err = std::get<JSONValue::Object>(r.error->value);
    return static_cast<int>(std::get<int64_t>(FindMember(err, "code")->value));
}

} // namespace

TEST(EnvelopeCodec, SingleRequestIsDecoded) {
    EnvelopeCodec codec;
    auto env = codec.Decode(R"({"jsonrpc":"2.0","id":"a1","method":"tools/list","params":{}})");
    EXPECT_FALSE(env.fatal.has_value());
    EXPECT_FALSE(env.isBatch);
    ASSERT_EQ(env.calls.size(), 1u);
    ASSERT_TRUE(env.calls[0].request.has_value());
    EXPECT_EQ(env.calls[0].request->method, "tools/list");
    EXPECT_EQ(std::get<std::string>(*env.calls[0].request->id), "a1");
    EXPECT_TRUE(env.calls[0].request->params.has_value());
}

TEST(EnvelopeCodec, NotificationHasNoId) {
    EnvelopeCodec codec;
    auto env = codec.Decode(R"({"jsonrpc":"2.0","method":"notifications/initialized"})");
    ASSERT_EQ(env.calls.size(), 1u);
    ASSERT_TRUE(env.calls[0].request.has_value());
    EXPECT_TRUE(env.calls[0].request->IsNotification());
}

TEST(EnvelopeCodec, ExplicitNullIdIsARequest) {
    EnvelopeCodec codec;
    auto env = codec.Decode(R"({"jsonrpc":"2.0","id":null,"method":"ping"})");
    ASSERT_TRUE(env.calls[0].request.has_value());
    EXPECT_FALSE(env.calls[0].request->IsNotification());
}

TEST(EnvelopeCodec, MalformedJsonIsParseError) {
    EnvelopeCodec codec;
    auto env = codec.Decode("{\"jsonrpc\":\"2.0\",");
    ASSERT_TRUE(env.fatal.has_value());
    EXPECT_EQ(errorCode(*env.fatal), JSONRPCErrorCodes::ParseError);
    EXPECT_TRUE(std::holds_alternative<std::nullptr_t>(env.fatal->id));
}

TEST(EnvelopeCodec, EmptyBatchAndScalarsAreInvalidRequest) {
    EnvelopeCodec codec;
    for (const char* payload : {"[]", "42", "\"ping\"", "null"}) {
        auto env = codec.Decode(payload);
        ASSERT_TRUE(env.fatal.has_value()) << payload;
        EXPECT_EQ(errorCode(*env.fatal), JSONRPCErrorCodes::InvalidRequest) << payload;
    }
}

TEST(EnvelopeCodec, OversizedBatchIsRejectedWhole) {
    EnvelopeCodec codec(2);
    auto env = codec.Decode(R"([{"jsonrpc":"2.0","id":1,"method":"ping"},
                               {"jsonrpc":"2.0","id":2,"method":"ping"},
                               {"jsonrpc":"2.0","id":3,"method":"ping"}])");
    ASSERT_TRUE(env.fatal.has_value());
    EXPECT_EQ(errorCode(*env.fatal), JSONRPCErrorCodes::InvalidRequest);
}

TEST(EnvelopeCodec, InvalidBatchMembersKeepTheirIds) {
    EnvelopeCodec codec;
    auto env = codec.Decode(R"([{"jsonrpc":"1.0","id":5,"method":"ping"},
                               {"jsonrpc":"2.0","id":6},
                               {"jsonrpc":"2.0","id":7,"method":"ping","params":[1]},
                               {"jsonrpc":"2.0","id":{"x":1},"method":"ping"},
                               3,
                               {"jsonrpc":"2.0","id":8,"method":"ping"}])");
    ASSERT_FALSE(env.fatal.has_value());
    EXPECT_TRUE(env.isBatch);
    ASSERT_EQ(env.calls.size(), 6u);

    ASSERT_TRUE(env.calls[0].invalid.has_value());
    EXPECT_EQ(std::get<int64_t>(env.calls[0].invalid->id), 5);
    ASSERT_TRUE(env.calls[1].invalid.has_value());
    EXPECT_EQ(std::get<int64_t>(env.calls[1].invalid->id), 6);
    ASSERT_TRUE(env.calls[2].invalid.has_value());
    EXPECT_EQ(std::get<int64_t>(env.calls[2].invalid->id), 7);
    ASSERT_TRUE(env.calls[3].invalid.has_value());
    EXPECT_TRUE(std::holds_alternative<std::nullptr_t>(env.calls[3].invalid->id));
    ASSERT_TRUE(env.calls[4].invalid.has_value());
    EXPECT_EQ(errorCode(*env.calls[4].invalid), JSONRPCErrorCodes::InvalidRequest);
    ASSERT_TRUE(env.calls[5].request.has_value());
}

TEST(EnvelopeCodec, EncodeSingleAndBatch) {
    std::vector<std::optional<JSONRPCResponse>> one;
    one.emplace_back(JSONRPCResponse(JSONRPCId(static_cast<int64_t>(1)), JSONValue(JSONValue::Object{})));
    auto single = EnvelopeCodec::Encode(false, one);
    ASSERT_TRUE(single.has_value());
    EXPECT_EQ(*single, R"({"id":1,"jsonrpc":"2.0","result":{}})");

    std::vector<std::optional<JSONRPCResponse>> batch;
    batch.emplace_back(JSONRPCResponse(JSONRPCId(std::string("b")), JSONValue(true)));
    batch.emplace_back(std::nullopt);
    batch.emplace_back(JSONRPCResponse(JSONRPCId(std::string("a")), JSONValue(false)));
    auto arr = EnvelopeCodec::Encode(true, batch);
    ASSERT_TRUE(arr.has_value());
    EXPECT_EQ(*arr, R"([{"id":"b","jsonrpc":"2.0","result":true},{"id":"a","jsonrpc":"2.0","result":false}])");
}

TEST(EnvelopeCodec, AllNotificationsEncodeToNothing) {
    std::vector<std::optional<JSONRPCResponse>> none(3);
    EXPECT_FALSE(EnvelopeCodec::Encode(true, none).has_value());
    EXPECT_FALSE(EnvelopeCodec::Encode(false, {std::nullopt}).has_value());
}
