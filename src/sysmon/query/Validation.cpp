//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/sysmon/query/Validation.cpp
// Purpose: Argument parsing and normalization for the list_services and list_logs tools
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <format>
#include <unordered_map>
#include <unordered_set>

#include "sysmon/query/Validation.h"
#include "sysmon/errors/Errors.h"
#include "env/EnvVars.h"
#include "logging/Logger.h"

namespace sysmon {
namespace query {

namespace {
    const std::unordered_set<std::string> kServiceArgs = {"state", "name_contains", "limit"};
    const std::unordered_set<std::string> kLogArgs = {
        "priority", "unit", "start_utc", "end_utc", "grep", "exclude_units", "order", "allow_large_window", "limit"
    };

    constexpr const char* kPriorityHelp =
        "priority must be one of 0-7 or: emerg, alert, crit, err, warning, notice, info, debug";
    constexpr const char* kUnitHelp =
        "unit must contain only alphanumeric characters, dashes, underscores, dots, @, and :";
    constexpr const char* kUtcHelp = "timestamps must be RFC3339 UTC format ending with Z";

    std::string toLowerAscii(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
        return s;
    }

    JSONValue argumentDetails(const std::string& name) {
        JSONValue::Object d;
        SetMember(d, "argument", JSONValue(name));
        return JSONValue(std::move(d));
    }

    // Resolves the arguments object and rejects keys outside the tool's schema.
    const JSONValue::Object& argumentsObject(const JSONValue* arguments, const std::unordered_set<std::string>& allowed) {
        static const JSONValue::Object kEmpty;
        if (arguments == nullptr || arguments->isNull()) {
            return kEmpty;
        }
        if (!arguments->isObject()) {
            throw errors::invalidParams(errors::DomainCodes::InvalidArguments, "arguments must be an object");
        }
        const auto& obj = std::get<JSONValue::Object>(arguments->value);
        for (const auto& [key, _] : obj) {
            if (allowed.find(key) == allowed.end()) {
                throw errors::invalidParams(errors::DomainCodes::InvalidArguments,
                                            std::format("unknown argument: {}", key), argumentDetails(key));
            }
        }
        return obj;
    }

    // Present and not JSON null.
    const JSONValue* presentMember(const JSONValue::Object& obj, const char* key) {
        const JSONValue* v = FindMember(obj, key);
        if (v == nullptr || v->isNull()) {
            return nullptr;
        }
        return v;
    }

    std::optional<std::string> stringArgument(const JSONValue::Object& obj, const char* key, const char* code) {
        const JSONValue* v = presentMember(obj, key);
        if (v == nullptr) {
            return std::nullopt;
        }
        if (!v->isString()) {
            throw errors::invalidParams(code, std::format("{} must be a string", key), argumentDetails(key));
        }
        return std::get<std::string>(v->value);
    }

    std::size_t parseLimit(const JSONValue::Object& obj) {
        const JSONValue* v = presentMember(obj, "limit");
        if (v == nullptr) {
            return kDefaultLimit;
        }
        if (!std::holds_alternative<int64_t>(v->value)) {
            throw errors::invalidParams(errors::DomainCodes::InvalidLimit, "limit must be an integer between 1 and 1000");
        }
        const int64_t limit = std::get<int64_t>(v->value);
        if (limit < 1 || limit > static_cast<int64_t>(kMaxLimit)) {
            JSONValue::Object d;
            SetMember(d, "limit", JSONValue(limit));
            SetMember(d, "max", JSONValue(static_cast<int64_t>(kMaxLimit)));
            throw errors::invalidParams(errors::DomainCodes::InvalidLimit, "limit must be between 1 and 1000",
                                        JSONValue(std::move(d)));
        }
        return static_cast<std::size_t>(limit);
    }

    std::string normalizeUnit(const std::string& raw) {
        const std::string unit = TrimAscii(raw);
        if (!IsValidUnitName(unit)) {
            JSONValue::Object d;
            SetMember(d, "unit", JSONValue(raw));
            throw errors::invalidParams(errors::DomainCodes::InvalidUnit, kUnitHelp, JSONValue(std::move(d)));
        }
        return unit;
    }

    std::optional<int> parsePriorityArgument(const JSONValue::Object& obj) {
        const JSONValue* v = presentMember(obj, "priority");
        if (v == nullptr) {
            return std::nullopt;
        }
        std::optional<int> p;
        if (std::holds_alternative<int64_t>(v->value)) {
            const int64_t n = std::get<int64_t>(v->value);
            if (n >= 0 && n <= 7) {
                p = static_cast<int>(n);
            }
        } else if (v->isString()) {
            p = ParsePriority(std::get<std::string>(v->value));
        }
        if (!p.has_value()) {
            throw errors::invalidParams(errors::DomainCodes::InvalidPriority, kPriorityHelp);
        }
        return p;
    }

    std::optional<EpochMicros> parseTimeArgument(const JSONValue::Object& obj, const char* key) {
        const JSONValue* v = presentMember(obj, key);
        if (v == nullptr) {
            return std::nullopt;
        }
        if (!v->isString()) {
            throw errors::invalidParams(errors::DomainCodes::InvalidUtcTime, kUtcHelp, argumentDetails(key));
        }
        auto t = ParseUtcTimestamp(std::get<std::string>(v->value));
        if (!t.has_value()) {
            throw errors::invalidParams(errors::DomainCodes::InvalidUtcTime, kUtcHelp, argumentDetails(key));
        }
        return t;
    }
}

bool GrepFilter::Matches(const std::string& message) const {
    if (pattern.has_value()) {
        return boost::regex_search(message, *pattern);
    }
    return message.find(text) != std::string::npos;
}

std::optional<int> ParsePriority(const std::string& text) {
    static const std::unordered_map<std::string, int> kNames = {
        {"0", 0}, {"emerg", 0}, {"panic", 0},
        {"1", 1}, {"alert", 1},
        {"2", 2}, {"crit", 2}, {"critical", 2},
        {"3", 3}, {"err", 3}, {"error", 3},
        {"4", 4}, {"warning", 4}, {"warn", 4},
        {"5", 5}, {"notice", 5},
        {"6", 6}, {"info", 6}, {"informational", 6},
        {"7", 7}, {"debug", 7}
    };
    auto it = kNames.find(toLowerAscii(TrimAscii(text)));
    if (it == kNames.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool IsValidUnitName(const std::string& unit) {
    if (unit.empty()) {
        return false;
    }
    return std::all_of(unit.begin(), unit.end(), [](unsigned char c) {
        return std::isalnum(c) != 0 || c == '.' || c == '-' || c == '_' || c == '@' || c == ':';
    });
}

std::optional<GrepFilter> MakeGrepFilter(const std::string& raw) {
    const std::string trimmed = TrimAscii(raw);
    if (trimmed.empty()) {
        return std::nullopt;
    }
    if (trimmed.size() > kMaxGrepLength) {
        throw errors::invalidParams(errors::DomainCodes::InvalidGrep,
                                    std::format("grep must be at most {} characters", kMaxGrepLength));
    }
    GrepFilter filter;
    filter.text = trimmed;
    if (trimmed.size() >= 2 && trimmed.front() == '/' && trimmed.back() == '/') {
        try {
            filter.pattern.emplace(trimmed.substr(1, trimmed.size() - 2), boost::regex::perl);
        } catch (const boost::regex_error& e) {
            LOG_DEBUG("rejecting grep pattern: {}", SerializeJSON(JSONValue(std::string(e.what()))));
            throw errors::invalidParams(errors::DomainCodes::InvalidGrep, "grep regex pattern is invalid");
        }
    }
    return filter;
}

ServiceQueryParams ParseServiceQueryParams(const JSONValue* arguments) {
    const auto& obj = argumentsObject(arguments, kServiceArgs);
    ServiceQueryParams params;

    if (auto state = stringArgument(obj, "state", errors::DomainCodes::InvalidState)) {
        const std::string normalized = toLowerAscii(TrimAscii(*state));
        const bool known = std::any_of(kServiceStates.begin(), kServiceStates.end(),
                                       [&normalized](const char* s){ return normalized == s; });
        if (!known) {
            throw errors::invalidParams(errors::DomainCodes::InvalidState,
                "state must be one of: active, inactive, failed, activating, deactivating, reloading");
        }
        params.state = normalized;
    }

    if (auto name = stringArgument(obj, "name_contains", errors::DomainCodes::InvalidArguments)) {
        std::string trimmed = TrimAscii(*name);
        if (!trimmed.empty()) {
            params.nameContains = std::move(trimmed);
        }
    }

    params.limit = parseLimit(obj);
    return params;
}

LogQueryParams ParseLogQueryParams(const JSONValue* arguments) {
    const auto& obj = argumentsObject(arguments, kLogArgs);
    LogQueryParams params;

    auto start = parseTimeArgument(obj, "start_utc");
    auto end = parseTimeArgument(obj, "end_utc");
    if (!start.has_value() || !end.has_value()) {
        throw errors::invalidParams(errors::DomainCodes::MissingTimeRange, "start_utc and end_utc are required");
    }
    if (*start >= *end) {
        throw errors::invalidParams(errors::DomainCodes::InvalidTimeRange, "start_utc must be strictly less than end_utc");
    }

    if (const JSONValue* v = presentMember(obj, "allow_large_window")) {
        if (!std::holds_alternative<bool>(v->value)) {
            throw errors::invalidParams(errors::DomainCodes::InvalidArguments, "allow_large_window must be a boolean",
                                        argumentDetails("allow_large_window"));
        }
        params.allowLargeWindow = std::get<bool>(v->value);
    }
    if (!params.allowLargeWindow && (*end - *start) > kMaxWindow) {
        JSONValue::Object d;
        SetMember(d, "max_days", JSONValue(static_cast<int64_t>(kMaxWindow / kMicrosPerDay)));
        throw errors::invalidParams(errors::DomainCodes::WindowTooLarge,
                                    "time window must not exceed 7 days unless allow_large_window is true",
                                    JSONValue(std::move(d)));
    }
    params.start = *start;
    params.end = *end;

    params.limit = parseLimit(obj);

    if (auto order = stringArgument(obj, "order", errors::DomainCodes::InvalidOrder)) {
        const std::string normalized = toLowerAscii(TrimAscii(*order));
        if (normalized == "asc") {
            params.order = LogOrder::Asc;
        } else if (normalized.empty() || normalized == "desc") {
            params.order = LogOrder::Desc;
        } else {
            throw errors::invalidParams(errors::DomainCodes::InvalidOrder, "order must be one of: asc, desc");
        }
    }

    if (const JSONValue* v = presentMember(obj, "grep")) {
        if (!v->isString()) {
            throw errors::invalidParams(errors::DomainCodes::InvalidGrep, "grep must be a string");
        }
        params.grep = MakeGrepFilter(std::get<std::string>(v->value));
    }

    params.priority = parsePriorityArgument(obj);

    if (auto unit = stringArgument(obj, "unit", errors::DomainCodes::InvalidUnit)) {
        params.unit = normalizeUnit(*unit);
    }

    if (const JSONValue* v = presentMember(obj, "exclude_units")) {
        if (!v->isArray()) {
            throw errors::invalidParams(errors::DomainCodes::InvalidArguments, "exclude_units must be an array of strings",
                                        argumentDetails("exclude_units"));
        }
        for (const auto& item : std::get<JSONValue::Array>(v->value)) {
            if (!item || !item->isString()) {
                throw errors::invalidParams(errors::DomainCodes::InvalidArguments, "exclude_units must be an array of strings",
                                            argumentDetails("exclude_units"));
            }
            params.excludeUnits.push_back(normalizeUnit(std::get<std::string>(item->value)));
        }
    }

    return params;
}

} // namespace query
} // namespace sysmon
