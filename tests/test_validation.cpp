//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_validation.cpp
// Purpose: GoogleTests for list_services / list_logs argument validation and normalization
//==========================================================================================================

#include <gtest/gtest.h>

#include <string>

#include "sysmon/errors/Errors.h"
#include "sysmon/query/Validation.h"

using namespace sysmon;
using namespace sysmon::query;

namespace {

//==========================================================================================================
// domainCode
// Purpose: Runs fn, expects an invalid-params RpcException and returns its data.code.
//==========================================================================================================
template <typename Fn>
std::string domainCode(Fn&& fn) {
    try {
        fn();
    } catch (const errors::RpcException& e) {
        EXPECT_EQ(e.error().code, JSONRPCErrorCodes::InvalidParams);
        if (!e.error().data.has_value()) {
            return "<no data>";
        }
        const auto& data = std::get<JSONValue::Object>(e.error().data->value);
        return std::get<std::string>(FindMember(data, "code")->value);
    }
    return "<no error>";
}

std::string serviceError(const std::string& json) {
    const JSONValue args = ParseJSON(json);
    return domainCode([&]{ ParseServiceQueryParams(&args); });
}

std::string logError(const std::string& json) {
    const JSONValue args = ParseJSON(json);
    return domainCode([&]{ ParseLogQueryParams(&args); });
}

LogQueryParams logParams(const std::string& json) {
    const JSONValue args = ParseJSON(json);
    return ParseLogQueryParams(&args);
}

const char* kWindow = R"("start_utc":"2025-01-01T00:00:00Z","end_utc":"2025-01-01T01:00:00Z")";

std::string withWindow(const std::string& extra) {
    return std::string("{") + kWindow + (extra.empty() ? "" : "," + extra) + "}";
}

} // namespace

TEST(ServiceQueryParams, DefaultsWhenArgumentsAbsent) {
    ServiceQueryParams p = ParseServiceQueryParams(nullptr);
    EXPECT_FALSE(p.state.has_value());
    EXPECT_FALSE(p.nameContains.has_value());
    EXPECT_EQ(p.limit, kDefaultLimit);

    const JSONValue nullArgs(nullptr);
    EXPECT_EQ(ParseServiceQueryParams(&nullArgs).limit, kDefaultLimit);
}

TEST(ServiceQueryParams, LimitBoundaries) {
    EXPECT_EQ(serviceError(R"({"limit":0})"), errors::DomainCodes::InvalidLimit);
    EXPECT_EQ(serviceError(R"({"limit":1001})"), errors::DomainCodes::InvalidLimit);
    EXPECT_EQ(serviceError(R"({"limit":"10"})"), errors::DomainCodes::InvalidLimit);
    EXPECT_EQ(serviceError(R"({"limit":2.5})"), errors::DomainCodes::InvalidLimit);

    const JSONValue max = ParseJSON(R"({"limit":1000})");
    EXPECT_EQ(ParseServiceQueryParams(&max).limit, 1000u);
    const JSONValue min = ParseJSON(R"({"limit":1})");
    EXPECT_EQ(ParseServiceQueryParams(&min).limit, 1u);
}

TEST(ServiceQueryParams, LimitErrorCarriesDetails) {
    const JSONValue args = ParseJSON(R"({"limit":1001})");
    try {
        ParseServiceQueryParams(&args);
        FAIL() << "expected invalid_limit";
    } catch (const errors::RpcException& e) {
        const auto& data = std::get<JSONValue::Object>(e.error().data->value);
        const auto& details = std::get<JSONValue::Object>(FindMember(data, "details")->value);
        EXPECT_EQ(std::get<int64_t>(FindMember(details, "limit")->value), 1001);
        EXPECT_EQ(std::get<int64_t>(FindMember(details, "max")->value), 1000);
    }
}

TEST(ServiceQueryParams, StateIsNormalized) {
    const JSONValue args = ParseJSON(R"({"state":"  FAILED "})");
    EXPECT_EQ(ParseServiceQueryParams(&args).state.value_or(""), "failed");
    EXPECT_EQ(serviceError(R"({"state":"exploded"})"), errors::DomainCodes::InvalidState);
    EXPECT_EQ(serviceError(R"({"state":""})"), errors::DomainCodes::InvalidState);
    EXPECT_EQ(serviceError(R"({"state":3})"), errors::DomainCodes::InvalidState);
}

TEST(ServiceQueryParams, BlankNameFilterIsIgnored) {
    const JSONValue blank = ParseJSON(R"({"name_contains":"   "})");
    EXPECT_FALSE(ParseServiceQueryParams(&blank).nameContains.has_value());
    const JSONValue ssh = ParseJSON(R"({"name_contains":" ssh "})");
    EXPECT_EQ(ParseServiceQueryParams(&ssh).nameContains.value_or(""), "ssh");
}

TEST(ServiceQueryParams, UnknownArgumentsAreRejected) {
    EXPECT_EQ(serviceError(R"({"limt":5})"), errors::DomainCodes::InvalidArguments);
    EXPECT_EQ(serviceError(R"([1,2])"), errors::DomainCodes::InvalidArguments);
}

TEST(LogQueryParams, WindowIsRequiredAndOrdered) {
    EXPECT_EQ(logError("{}"), errors::DomainCodes::MissingTimeRange);
    EXPECT_EQ(logError(R"({"start_utc":"2025-01-01T00:00:00Z"})"), errors::DomainCodes::MissingTimeRange);
    EXPECT_EQ(logError(R"({"start_utc":"2025-01-01T01:00:00Z","end_utc":"2025-01-01T01:00:00Z"})"),
              errors::DomainCodes::InvalidTimeRange);
    EXPECT_EQ(logError(R"({"start_utc":"2025-01-02T00:00:00Z","end_utc":"2025-01-01T00:00:00Z"})"),
              errors::DomainCodes::InvalidTimeRange);
}

TEST(LogQueryParams, TimestampsMustBeUtc) {
    EXPECT_EQ(logError(R"({"start_utc":"2025-01-01T00:00:00+02:00","end_utc":"2025-01-01T01:00:00Z"})"),
              errors::DomainCodes::InvalidUtcTime);
    EXPECT_EQ(logError(R"({"start_utc":"2025-01-01T00:00:00Z","end_utc":12345})"),
              errors::DomainCodes::InvalidUtcTime);
}

TEST(LogQueryParams, LargeWindowNeedsOptIn) {
    const std::string eightDays = R"("start_utc":"2025-01-01T00:00:00Z","end_utc":"2025-01-09T00:00:00Z")";
    EXPECT_EQ(logError("{" + eightDays + "}"), errors::DomainCodes::WindowTooLarge);
    EXPECT_EQ(logError("{" + eightDays + R"(,"allow_large_window":"yes"})"), errors::DomainCodes::InvalidArguments);

    auto p = logParams("{" + eightDays + R"(,"allow_large_window":true})");
    EXPECT_TRUE(p.allowLargeWindow);

    // Exactly seven days is allowed.
    auto seven = logParams(R"({"start_utc":"2025-01-01T00:00:00Z","end_utc":"2025-01-08T00:00:00Z"})");
    EXPECT_EQ(seven.end - seven.start, kMaxWindow);
}

TEST(LogQueryParams, DefaultsAndOrder) {
    auto p = logParams(withWindow(""));
    EXPECT_EQ(p.order, LogOrder::Desc);
    EXPECT_EQ(p.limit, kDefaultLimit);
    EXPECT_FALSE(p.priority.has_value());
    EXPECT_FALSE(p.unit.has_value());
    EXPECT_FALSE(p.grep.has_value());

    EXPECT_EQ(logParams(withWindow(R"("order":"ASC")")).order, LogOrder::Asc);
    EXPECT_EQ(logParams(withWindow(R"("order":"")")).order, LogOrder::Desc);
    EXPECT_EQ(logError(withWindow(R"("order":"sideways")")), errors::DomainCodes::InvalidOrder);
}

TEST(LogQueryParams, PriorityAcceptsNumbersAndNames) {
    EXPECT_EQ(logParams(withWindow(R"("priority":3)")).priority.value_or(-1), 3);
    EXPECT_EQ(logParams(withWindow(R"("priority":"err")")).priority.value_or(-1), 3);
    EXPECT_EQ(logParams(withWindow(R"("priority":"Warning")")).priority.value_or(-1), 4);
    EXPECT_EQ(logParams(withWindow(R"("priority":"7")")).priority.value_or(-1), 7);
    EXPECT_EQ(logError(withWindow(R"("priority":8)")), errors::DomainCodes::InvalidPriority);
    EXPECT_EQ(logError(withWindow(R"("priority":"loud")")), errors::DomainCodes::InvalidPriority);
    EXPECT_EQ(logError(withWindow(R"("priority":"")")), errors::DomainCodes::InvalidPriority);
}

TEST(LogQueryParams, UnitCharset) {
    EXPECT_TRUE(IsValidUnitName("sshd_service-01@host:prod"));
    EXPECT_TRUE(IsValidUnitName("nginx.service"));
    EXPECT_FALSE(IsValidUnitName("sshd.service/x"));
    EXPECT_FALSE(IsValidUnitName("a b"));
    EXPECT_FALSE(IsValidUnitName(""));

    EXPECT_EQ(logParams(withWindow(R"("unit":" nginx.service ")")).unit.value_or(""), "nginx.service");
    EXPECT_EQ(logError(withWindow(R"("unit":"sshd.service/x")")), errors::DomainCodes::InvalidUnit);
    EXPECT_EQ(logError(withWindow(R"("exclude_units":["ok.service","bad unit"])")), errors::DomainCodes::InvalidUnit);
    EXPECT_EQ(logError(withWindow(R"("exclude_units":"ok.service")")), errors::DomainCodes::InvalidArguments);
}

TEST(LogQueryParams, GrepSubstringAndRegex) {
    auto plain = logParams(withWindow(R"("grep":"  timeout  ")"));
    ASSERT_TRUE(plain.grep.has_value());
    EXPECT_FALSE(plain.grep->pattern.has_value());
    EXPECT_TRUE(plain.grep->Matches("connection timeout after 5s"));
    EXPECT_FALSE(plain.grep->Matches("Connection Timeout"));

    auto re = logParams(withWindow(R"("grep":"/fail(ed|ure)\\s+\\d+/")"));
    ASSERT_TRUE(re.grep.has_value());
    ASSERT_TRUE(re.grep->pattern.has_value());
    EXPECT_TRUE(re.grep->Matches("unit failed 3 times"));
    EXPECT_FALSE(re.grep->Matches("unit failed"));

    EXPECT_FALSE(logParams(withWindow(R"("grep":"   ")")).grep.has_value());
}

TEST(LogQueryParams, GrepRejectsBadPatternsAndLength) {
    EXPECT_EQ(logError(withWindow(R"("grep":"/([a-z/")")), errors::DomainCodes::InvalidGrep);
    EXPECT_EQ(logError(withWindow(R"("grep":42)")), errors::DomainCodes::InvalidGrep);
    const std::string longGrep = "\"grep\":\"" + std::string(kMaxGrepLength + 1, 'a') + "\"";
    EXPECT_EQ(logError(withWindow(longGrep)), errors::DomainCodes::InvalidGrep);
}

TEST(LogQueryParams, UnknownArgumentIsRejected) {
    EXPECT_EQ(logError(withWindow(R"("since":"yesterday")")), errors::DomainCodes::InvalidArguments);
}

TEST(ParsePriority, Aliases) {
    EXPECT_EQ(ParsePriority("emerg").value_or(-1), 0);
    EXPECT_EQ(ParsePriority("panic").value_or(-1), 0);
    EXPECT_EQ(ParsePriority("CRIT").value_or(-1), 2);
    EXPECT_EQ(ParsePriority(" error ").value_or(-1), 3);
    EXPECT_EQ(ParsePriority("informational").value_or(-1), 6);
    EXPECT_FALSE(ParsePriority("trace").has_value());
}
