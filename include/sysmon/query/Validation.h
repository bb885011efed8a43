//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Validation.h
// Purpose: Argument parsing and normalization for the list_services and list_logs tools
//==========================================================================================================

#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <boost/regex.hpp>

#include "sysmon/JSONRPCTypes.h"
#include "sysmon/TimeFormat.h"

namespace sysmon {
namespace query {

constexpr std::size_t kDefaultLimit = 200;
constexpr std::size_t kMaxLimit = 1000;
constexpr std::size_t kMaxGrepLength = 512;
constexpr EpochMicros kMaxWindow = 7 * kMicrosPerDay;

// Accepted values of list_services.state, already lower-case.
constexpr std::array<const char*, 6> kServiceStates = {
    "active", "inactive", "failed", "activating", "deactivating", "reloading"
};

enum class LogOrder { Asc, Desc };

//==========================================================================================================
// GrepFilter
// Purpose: Message filter. Plain text is a substring match; text written as /pattern/ is a regular
//          expression searched anywhere in the message.
//==========================================================================================================
struct GrepFilter {
    std::string text;
    std::optional<boost::regex> pattern;

    bool Matches(const std::string& message) const;
};

//==========================================================================================================
// ServiceQueryParams
// Fields:
//   state: Lower-cased member of kServiceStates, or absent for no state filter.
//   nameContains: Trimmed substring, absent when empty.
//   limit: [1, kMaxLimit], default kDefaultLimit.
//==========================================================================================================
struct ServiceQueryParams {
    std::optional<std::string> state;
    std::optional<std::string> nameContains;
    std::size_t limit{kDefaultLimit};
};

//==========================================================================================================
// LogQueryParams
// Fields:
//   start/end: Validated window, start < end.
//   priority: Severity threshold; entries with priority <= this value are kept.
//   unit: Exact unit filter.
//   grep: Message filter.
//   excludeUnits: Units dropped from the result (ASCII case-insensitive).
//==========================================================================================================
struct LogQueryParams {
    EpochMicros start{0};
    EpochMicros end{0};
    std::optional<int> priority;
    std::optional<std::string> unit;
    std::optional<GrepFilter> grep;
    std::vector<std::string> excludeUnits;
    LogOrder order{LogOrder::Desc};
    bool allowLargeWindow{false};
    std::size_t limit{kDefaultLimit};
};

//==========================================================================================================
// ParseServiceQueryParams / ParseLogQueryParams
// Purpose: Validate and normalize tool arguments.
// Args:
//   arguments: The tools/call arguments value; nullptr or JSON null reads as {}.
// Throws:
//   errors::RpcException (-32602) whose data.code names the offending argument class
//   (invalid_arguments, invalid_limit, invalid_state, invalid_priority, invalid_unit, invalid_order,
//   invalid_grep, missing_time_range, invalid_utc_time, invalid_time_range, window_too_large).
//==========================================================================================================
ServiceQueryParams ParseServiceQueryParams(const JSONValue* arguments);
LogQueryParams ParseLogQueryParams(const JSONValue* arguments);

// Syslog priority from a name (emerg..debug with common aliases) or a numeric string "0".."7".
std::optional<int> ParsePriority(const std::string& text);

// True for non-empty names made of ASCII alphanumerics and . - _ @ :
bool IsValidUnitName(const std::string& unit);

// Builds a grep filter from raw text. Returns std::nullopt for blank text.
// Throws errors::RpcException(invalid_grep) for an over-long or malformed pattern.
std::optional<GrepFilter> MakeGrepFilter(const std::string& raw);

} // namespace query
} // namespace sysmon
