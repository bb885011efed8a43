//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/sysmon/query/LogQuery.cpp
// Purpose: list_logs execution, message sanitizing and log entry shaping
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <format>

#include "sysmon/query/Queries.h"
#include "env/EnvVars.h"
#include "logging/Logger.h"

namespace sysmon {
namespace query {

namespace {
    bool equalsIgnoreCase(const std::string& a, const std::string& b) {
        return a.size() == b.size() &&
               std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
                   return std::tolower(x) == std::tolower(y);
               });
    }

    bool isExcluded(const adapters::LogEntry& entry, const std::vector<std::string>& excludeUnits) {
        if (!entry.unit) {
            return false;
        }
        return std::any_of(excludeUnits.begin(), excludeUnits.end(),
                           [&entry](const std::string& u){ return equalsIgnoreCase(u, *entry.unit); });
    }
}

std::optional<std::string> SanitizeMessage(const std::string& message) {
    const std::string trimmed = TrimAscii(message);
    std::string out;
    out.reserve(trimmed.size());
    for (std::size_t i = 0; i < trimmed.size(); ++i) {
        const auto c = static_cast<unsigned char>(trimmed[i]);
        if (c == '\n' || c == '\r' || c == '\t') {
            out.push_back(static_cast<char>(c));
        } else if (c < 0x20 || c == 0x7F) {
            out.push_back(' ');
        } else if (c == 0xC2 && i + 1 < trimmed.size() &&
                   static_cast<unsigned char>(trimmed[i + 1]) >= 0x80 &&
                   static_cast<unsigned char>(trimmed[i + 1]) <= 0x9F) {
            // C1 control U+0080..U+009F
            out.push_back(' ');
            ++i;
        } else {
            out.push_back(static_cast<char>(c));
        }
    }
    std::string result = TrimAscii(out);
    if (result.empty()) {
        return std::nullopt;
    }
    return result;
}

JSONValue LogEntryToJSON(const adapters::LogEntry& entry) {
    JSONValue::Object o;
    SetMember(o, "timestamp_utc", JSONValue(FormatUtcMillis(entry.timestamp)));
    if (entry.unit) SetMember(o, "unit", JSONValue(*entry.unit));
    SetMember(o, "priority", JSONValue(static_cast<int64_t>(entry.priority)));
    if (entry.hostname) SetMember(o, "hostname", JSONValue(*entry.hostname));
    if (entry.pid) SetMember(o, "pid", JSONValue(*entry.pid));
    if (entry.message) SetMember(o, "message", JSONValue(*entry.message));
    if (entry.cursor) SetMember(o, "cursor", JSONValue(*entry.cursor));
    return JSONValue(std::move(o));
}

QueryOutput LogQuery::Run(const LogQueryParams& params) const {
    FUNC_SCOPE();
    adapters::LogReadRequest request;
    request.start = params.start;
    request.end = params.end;
    request.maxPriority = params.priority;
    request.unit = params.unit;
    request.newestFirst = (params.order == LogOrder::Desc);
    request.scanLimit = scanLimit_;

    adapters::LogReadResult read = reader_.Read(request);

    std::vector<adapters::LogEntry> matched;
    matched.reserve(read.entries.size());
    for (auto& entry : read.entries) {
        if (entry.timestamp < params.start || entry.timestamp > params.end) {
            continue;
        }
        if (params.priority && entry.priority > *params.priority) {
            continue;
        }
        if (params.unit && entry.unit != params.unit) {
            continue;
        }
        if (isExcluded(entry, params.excludeUnits)) {
            continue;
        }
        if (entry.message) {
            entry.message = SanitizeMessage(*entry.message);
        }
        if (params.grep) {
            if (!entry.message || !params.grep->Matches(*entry.message)) {
                continue;
            }
        }
        matched.push_back(std::move(entry));
    }

    if (params.order == LogOrder::Asc) {
        std::stable_sort(matched.begin(), matched.end(),
                         [](const adapters::LogEntry& a, const adapters::LogEntry& b){ return a.timestamp < b.timestamp; });
    } else {
        std::stable_sort(matched.begin(), matched.end(),
                         [](const adapters::LogEntry& a, const adapters::LogEntry& b){ return a.timestamp > b.timestamp; });
    }

    const std::size_t returned = std::min(matched.size(), params.limit);
    JSONValue::Array entries;
    entries.reserve(returned);
    for (std::size_t i = 0; i < returned; ++i) {
        entries.push_back(std::make_shared<JSONValue>(LogEntryToJSON(matched[i])));
    }

    JSONValue::Object window;
    SetMember(window, "start_utc", JSONValue(FormatUtcMillis(params.start)));
    SetMember(window, "end_utc", JSONValue(FormatUtcMillis(params.end)));

    JSONValue::Object out;
    SetMember(out, "entries", JSONValue(std::move(entries)));
    if (read.totalScanned) {
        SetMember(out, "total_scanned", JSONValue(static_cast<int64_t>(*read.totalScanned)));
    }
    SetMember(out, "returned", JSONValue(static_cast<int64_t>(returned)));
    SetMember(out, "truncated", JSONValue(matched.size() > returned));
    SetMember(out, "generated_at_utc", JSONValue(FormatUtcMillis(NowMicros())));
    SetMember(out, "window", JSONValue(std::move(window)));

    LOG_DEBUG("list_logs matched {} entr(ies), returning {}", matched.size(), returned);
    return QueryOutput{JSONValue(std::move(out)), std::format("Returned {} log entries", returned)};
}

} // namespace query
} // namespace sysmon
