//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_dispatcher.cpp
// Purpose: GoogleTests for the JSON-RPC dispatcher (batches, notifications, error mapping, audit log)
//==========================================================================================================

#include <gtest/gtest.h>

#include <algorithm>
#include <map>
#include <optional>
#include <string>

#include "FakeAdapters.h"
#include "sysmon/Dispatcher.h"
#include "logging/Logger.h"

using namespace sysmon;
using sysmon::fakes::FakeLogReader;
using sysmon::fakes::FakeUnitLister;
using sysmon::fakes::makeEntry;
using sysmon::fakes::makeService;

namespace {

const JSONValue* memberOf(const JSONValue& v, const char* key) {
    if (!v.isObject()) {
        return nullptr;
    }
    return FindMember(std::get<JSONValue::Object>(v.value), key);
}

int64_t errorCode(const JSONValue& response) {
    const JSONValue* err = memberOf(response, "error");
    if (err == nullptr) {
        return 0;
    }
    return std::get<int64_t>(memberOf(*err, "code")->value);
}

// Batch responses keyed by their serialized id; position in the array is not relied upon.
std::map<std::string, JSONValue> byId(const JSONValue& batch) {
    std::map<std::string, JSONValue> out;
    for (const auto& r : std::get<JSONValue::Array>(batch.value)) {
        const JSONValue* id = memberOf(*r, "id");
        EXPECT_NE(id, nullptr);
        if (id != nullptr) {
            EXPECT_TRUE(out.emplace(SerializeJSON(*id), *r).second) << "duplicate id " << SerializeJSON(*id);
        }
    }
    return out;
}

// Thrown by ExplodingLister; deliberately not derived from std::exception.
struct UnexpectedFault {};

class ExplodingLister : public adapters::IUnitLister {
public:
    std::vector<adapters::ServiceRecord> ListUnits() override { throw UnexpectedFault{}; }
};

class DispatcherFixture : public ::testing::Test {
protected:
    DispatcherFixture()
        : services(lister), logs(reader, 1000), registry(services, logs), dispatcher(registry, 100, 4) {
        lister.units = {makeService("nginx.service", "active"), makeService("backup.service", "failed", "failed")};
    }

    JSONValue handle(const std::string& payload) {
        auto body = dispatcher.Handle(payload);
        EXPECT_TRUE(body.has_value()) << payload;
        return body ? ParseJSON(*body) : JSONValue();
    }

    FakeUnitLister lister;
    FakeLogReader reader;
    query::ServiceQuery services;
    query::LogQuery logs;
    MethodRegistry registry;
    Dispatcher dispatcher;
};

} // namespace

TEST_F(DispatcherFixture, SingleRequestEchoesId) {
    JSONValue r = handle(R"({"jsonrpc":"2.0","id":"req-1","method":"ping"})");
    EXPECT_EQ(std::get<std::string>(memberOf(r, "id")->value), "req-1");
    EXPECT_EQ(std::get<std::string>(memberOf(r, "jsonrpc")->value), "2.0");
    EXPECT_NE(memberOf(r, "result"), nullptr);
    EXPECT_EQ(memberOf(r, "error"), nullptr);
}

TEST_F(DispatcherFixture, NumericIdIsPreserved) {
    JSONValue r = handle(R"({"jsonrpc":"2.0","id":77,"method":"tools/list"})");
    EXPECT_EQ(std::get<int64_t>(memberOf(r, "id")->value), 77);
}

TEST_F(DispatcherFixture, NotificationProducesNoBody) {
    EXPECT_FALSE(dispatcher.Handle(R"({"jsonrpc":"2.0","method":"notifications/initialized"})").has_value());
    // Failing notifications stay silent too.
    EXPECT_FALSE(dispatcher.Handle(R"({"jsonrpc":"2.0","method":"no/such/method"})").has_value());
}

TEST_F(DispatcherFixture, ParseErrorHasNullId) {
    JSONValue r = handle("{not json");
    EXPECT_EQ(errorCode(r), JSONRPCErrorCodes::ParseError);
    EXPECT_TRUE(memberOf(r, "id")->isNull());
}

TEST_F(DispatcherFixture, UnknownMethod) {
    JSONValue r = handle(R"({"jsonrpc":"2.0","id":3,"method":"sampling/createMessage"})");
    EXPECT_EQ(errorCode(r), JSONRPCErrorCodes::MethodNotFound);
    EXPECT_EQ(std::get<int64_t>(memberOf(r, "id")->value), 3);
    const JSONValue* data = memberOf(*memberOf(r, "error"), "data");
    ASSERT_NE(data, nullptr);
    EXPECT_EQ(std::get<std::string>(memberOf(*data, "method")->value), "sampling/createMessage");
}

TEST_F(DispatcherFixture, DomainErrorsCarryCodeMessageDetails) {
    JSONValue r = handle(R"({"jsonrpc":"2.0","id":4,"method":"tools/call",
                            "params":{"name":"list_services","arguments":{"limit":5000}}})");
    EXPECT_EQ(errorCode(r), JSONRPCErrorCodes::InvalidParams);
    const JSONValue* data = memberOf(*memberOf(r, "error"), "data");
    ASSERT_NE(data, nullptr);
    EXPECT_EQ(std::get<std::string>(memberOf(*data, "code")->value), "invalid_limit");
    EXPECT_TRUE(memberOf(*data, "message")->isString());
    EXPECT_TRUE(memberOf(*data, "details")->isObject());
}

TEST_F(DispatcherFixture, AdapterFailureIsOpaque) {
    lister.failWith = std::string("systemctl: /run/secret/socket unreachable");
    const auto body = dispatcher.Handle(R"({"jsonrpc":"2.0","id":9,"method":"tools/call","params":{"name":"list_services"}})");
    ASSERT_TRUE(body.has_value());
    EXPECT_EQ(body->find("/run/secret/socket"), std::string::npos);

    JSONValue r = ParseJSON(*body);
    EXPECT_EQ(errorCode(r), JSONRPCErrorCodes::InternalError);
    const JSONValue* data = memberOf(*memberOf(r, "error"), "data");
    ASSERT_NE(data, nullptr);
    EXPECT_EQ(std::get<std::string>(memberOf(*data, "code")->value), "internal_error");
    const JSONValue* errorId = memberOf(*memberOf(*data, "details"), "error_id");
    ASSERT_NE(errorId, nullptr);
    EXPECT_EQ(std::get<std::string>(errorId->value).size(), 16u);
}

TEST_F(DispatcherFixture, BatchAnswersEveryIdAndSkipsNotifications) {
    JSONValue r = handle(R"([
        {"jsonrpc":"2.0","id":1,"method":"ping"},
        {"jsonrpc":"2.0","method":"notifications/initialized"},
        {"jsonrpc":"2.0","id":"two","method":"nope"},
        {"jsonrpc":"1.0","id":3,"method":"ping"},
        {"jsonrpc":"2.0","id":4,"method":"tools/call","params":{"name":"list_services"}}
    ])");
    ASSERT_TRUE(r.isArray());
    auto responses = byId(r);
    ASSERT_EQ(responses.size(), 4u);
    ASSERT_EQ(responses.count("1"), 1u);
    EXPECT_EQ(errorCode(responses["1"]), 0);
    ASSERT_EQ(responses.count("\"two\""), 1u);
    EXPECT_EQ(errorCode(responses["\"two\""]), JSONRPCErrorCodes::MethodNotFound);
    ASSERT_EQ(responses.count("3"), 1u);
    EXPECT_EQ(errorCode(responses["3"]), JSONRPCErrorCodes::InvalidRequest);
    ASSERT_EQ(responses.count("4"), 1u);
    EXPECT_EQ(errorCode(responses["4"]), 0);
}

TEST_F(DispatcherFixture, LargeBatchAnswersEveryId) {
    std::string payload = "[";
    for (int i = 0; i < 50; ++i) {
        if (i) payload += ",";
        payload += R"({"jsonrpc":"2.0","id":)" + std::to_string(i) + R"(,"method":"tools/call","params":{"name":"list_services"}})";
    }
    payload += "]";
    auto responses = byId(handle(payload));
    ASSERT_EQ(responses.size(), 50u);
    for (int i = 0; i < 50; ++i) {
        ASSERT_EQ(responses.count(std::to_string(i)), 1u) << i;
        EXPECT_EQ(errorCode(responses[std::to_string(i)]), 0);
    }
    EXPECT_EQ(lister.calls.load(), 50);
}

TEST_F(DispatcherFixture, FailingMemberDoesNotAffectSiblings) {
    lister.failWith = std::string("systemctl timed out");
    reader.entries = {makeEntry("2025-01-01T00:10:00Z", "nginx.service", 3, "upstream timed out")};
    auto responses = byId(handle(R"([
        {"jsonrpc":"2.0","id":"svc","method":"tools/call","params":{"name":"list_services"}},
        {"jsonrpc":"2.0","id":"logs","method":"tools/call","params":{"name":"list_logs","arguments":
            {"start_utc":"2025-01-01T00:00:00Z","end_utc":"2025-01-01T01:00:00Z"}}},
        {"jsonrpc":"2.0","id":"ping","method":"ping"}
    ])"));
    ASSERT_EQ(responses.size(), 3u);
    EXPECT_EQ(errorCode(responses["\"svc\""]), JSONRPCErrorCodes::InternalError);
    EXPECT_EQ(errorCode(responses["\"ping\""]), 0);

    const JSONValue& logsResponse = responses["\"logs\""];
    ASSERT_EQ(errorCode(logsResponse), 0);
    const JSONValue* structured = memberOf(*memberOf(logsResponse, "result"), "structuredContent");
    ASSERT_NE(structured, nullptr);
    EXPECT_EQ(std::get<JSONValue::Array>(memberOf(*structured, "entries")->value).size(), 1u);
}

TEST(Dispatcher, EscapedNonStandardExceptionWaitsForWholeBatch) {
    ExplodingLister lister;
    FakeLogReader reader;
    query::ServiceQuery services(lister);
    query::LogQuery logs(reader, 100);
    MethodRegistry registry(services, logs);
    Dispatcher dispatcher(registry, 100, 4);

    std::string payload = "[";
    for (int i = 0; i < 20; ++i) {
        if (i) payload += ",";
        payload += (i == 10)
            ? std::string(R"({"jsonrpc":"2.0","id":10,"method":"tools/call","params":{"name":"list_services"}})")
            : R"({"jsonrpc":"2.0","id":)" + std::to_string(i) + R"(,"method":"ping"})";
    }
    payload += "]";
    EXPECT_THROW(dispatcher.Handle(payload), UnexpectedFault);

    // The pool is still usable afterwards.
    auto body = dispatcher.Handle(R"([{"jsonrpc":"2.0","id":1,"method":"ping"},{"jsonrpc":"2.0","id":2,"method":"ping"}])");
    ASSERT_TRUE(body.has_value());
    EXPECT_EQ(std::get<JSONValue::Array>(ParseJSON(*body).value).size(), 2u);
}

TEST(Dispatcher, FailedStateScenarioEndToEnd) {
    FakeUnitLister lister;
    lister.units = {makeService("nginx.service", "active"), makeService("backup.service", "failed", "failed"),
                    makeService("sshd.service", "active")};
    FakeLogReader reader;
    query::ServiceQuery services(lister);
    query::LogQuery logs(reader, 100);
    MethodRegistry registry(services, logs);
    Dispatcher dispatcher(registry, 100, 2);

    auto body = dispatcher.Handle(R"({"jsonrpc":"2.0","id":1,"method":"tools/call",
                                      "params":{"name":"list_services","arguments":{"state":"failed"}}})");
    ASSERT_TRUE(body.has_value());
    JSONValue r = ParseJSON(*body);
    ASSERT_EQ(errorCode(r), 0);
    const JSONValue* structured = memberOf(*memberOf(r, "result"), "structuredContent");
    ASSERT_NE(structured, nullptr);
    const auto& list = std::get<JSONValue::Array>(memberOf(*structured, "services")->value);
    ASSERT_EQ(list.size(), 1u);
    EXPECT_EQ(std::get<std::string>(memberOf(*list[0], "unit")->value), "backup.service");
    EXPECT_EQ(std::get<int64_t>(memberOf(*structured, "total")->value), 1);
    EXPECT_EQ(std::get<int64_t>(memberOf(*structured, "returned")->value), 1);
    EXPECT_FALSE(std::get<bool>(memberOf(*structured, "truncated")->value));
}

TEST_F(DispatcherFixture, MalformedUtf8IsParseError) {
    JSONValue r = handle("{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"tools/call\",\"params\":{\"name\":\"\xFF\xFE\"}}");
    EXPECT_EQ(errorCode(r), JSONRPCErrorCodes::ParseError);
    EXPECT_TRUE(memberOf(r, "id")->isNull());
}

TEST_F(DispatcherFixture, AllNotificationBatchHasNoBody) {
    EXPECT_FALSE(dispatcher.Handle(R"([{"jsonrpc":"2.0","method":"ping"},{"jsonrpc":"2.0","method":"ping"}])").has_value());
}

TEST_F(DispatcherFixture, EmptyBatchIsInvalidRequest) {
    JSONValue r = handle("[]");
    ASSERT_TRUE(r.isObject());
    EXPECT_EQ(errorCode(r), JSONRPCErrorCodes::InvalidRequest);
}

TEST_F(DispatcherFixture, AuditLineRedactsSecrets) {
    Logger::setLogLevel(LogLevel::LOG_INFO_LEVEL);
    ::testing::internal::CaptureStderr();
    dispatcher.Handle(R"({"jsonrpc":"2.0","id":1,"method":"tools/call",
                         "params":{"name":"list_services","arguments":{"api_token":"s3cr3t-value"}}})");
    const std::string log = ::testing::internal::GetCapturedStderr();
    EXPECT_NE(log.find("mcp action audited method=\"tools/call\""), std::string::npos);
    EXPECT_NE(log.find("[REDACTED]"), std::string::npos);
    EXPECT_NE(log.find("outcome=failure"), std::string::npos);
    EXPECT_EQ(log.find("s3cr3t-value"), std::string::npos);
}

TEST_F(DispatcherFixture, AuditLineMarksSuccess) {
    Logger::setLogLevel(LogLevel::LOG_INFO_LEVEL);
    ::testing::internal::CaptureStderr();
    dispatcher.Handle(R"({"jsonrpc":"2.0","id":1,"method":"ping"})");
    const std::string log = ::testing::internal::GetCapturedStderr();
    EXPECT_NE(log.find("method=\"ping\" params=null outcome=success"), std::string::npos);
}

TEST_F(DispatcherFixture, AuditLineCannotBeSplitByMethodName) {
    Logger::setLogLevel(LogLevel::LOG_INFO_LEVEL);
    ::testing::internal::CaptureStderr();
    dispatcher.Handle(R"({"jsonrpc":"2.0","id":1,"method":"nope\n2025-01-01T00:00:00.000Z [INFO] x.cpp:1: mcp action audited method=tools/call params=null outcome=success"})");
    const std::string log = ::testing::internal::GetCapturedStderr();
    EXPECT_EQ(std::count(log.begin(), log.end(), '\n'), 1);
    EXPECT_NE(log.find("method=\"nope\\n2025"), std::string::npos);
    EXPECT_NE(log.find("outcome=failure"), std::string::npos);
}

TEST(RedactSensitive, NestedKeys) {
    JSONValue v = ParseJSON(R"({"user":"bob","Password":"x","nested":{"refresh_token":"y","list":[{"client_secret":"z"}]}})");
    const std::string out = SerializeJSON(RedactSensitive(v));
    EXPECT_EQ(out, R"({"Password":"[REDACTED]","nested":{"list":[{"client_secret":"[REDACTED]"}],"refresh_token":"[REDACTED]"},"user":"bob"})");
}

TEST(RedactSensitive, KeyClassification) {
    EXPECT_TRUE(IsSensitiveKey("Authorization"));
    EXPECT_TRUE(IsSensitiveKey("api_key"));
    EXPECT_TRUE(IsSensitiveKey("db_credentials"));
    EXPECT_FALSE(IsSensitiveKey("unit"));
    EXPECT_FALSE(IsSensitiveKey("grep"));
}
