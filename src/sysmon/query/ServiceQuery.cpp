//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/sysmon/query/ServiceQuery.cpp
// Purpose: list_services execution and service record shaping
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <format>

#include "sysmon/query/Queries.h"
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
}

JSONValue ServiceRecordToJSON(const adapters::ServiceRecord& record) {
    JSONValue::Object o;
    SetMember(o, "unit", JSONValue(record.unit));
    SetMember(o, "description", JSONValue(record.description));
    SetMember(o, "load_state", JSONValue(record.loadState));
    SetMember(o, "active_state", JSONValue(record.activeState));
    SetMember(o, "sub_state", JSONValue(record.subState));
    if (record.unitFileState) SetMember(o, "unit_file_state", JSONValue(*record.unitFileState));
    if (record.sinceUtc) SetMember(o, "since_utc", JSONValue(*record.sinceUtc));
    if (record.mainPid) SetMember(o, "main_pid", JSONValue(*record.mainPid));
    if (record.execMainStatus) SetMember(o, "exec_main_status", JSONValue(*record.execMainStatus));
    if (record.result) SetMember(o, "result", JSONValue(*record.result));
    return JSONValue(std::move(o));
}

void SortServices(std::vector<adapters::ServiceRecord>& services, bool failedFirst) {
    if (!failedFirst) {
        std::sort(services.begin(), services.end(),
                  [](const adapters::ServiceRecord& a, const adapters::ServiceRecord& b){ return a.unit < b.unit; });
        return;
    }
    std::sort(services.begin(), services.end(), [](const adapters::ServiceRecord& a, const adapters::ServiceRecord& b) {
        const bool af = equalsIgnoreCase(a.activeState, "failed");
        const bool bf = equalsIgnoreCase(b.activeState, "failed");
        if (af != bf) {
            return af;
        }
        return a.unit < b.unit;
    });
}

QueryOutput ServiceQuery::Run(const ServiceQueryParams& params) const {
    FUNC_SCOPE();
    std::vector<adapters::ServiceRecord> all = lister_.ListUnits();

    std::vector<adapters::ServiceRecord> matched;
    matched.reserve(all.size());
    for (auto& rec : all) {
        if (params.state && !equalsIgnoreCase(rec.activeState, *params.state)) {
            continue;
        }
        if (params.nameContains && rec.unit.find(*params.nameContains) == std::string::npos) {
            continue;
        }
        matched.push_back(std::move(rec));
    }

    SortServices(matched, params.state.has_value() && *params.state == "failed");

    const std::size_t total = matched.size();
    const std::size_t returned = std::min(total, params.limit);

    JSONValue::Array services;
    services.reserve(returned);
    for (std::size_t i = 0; i < returned; ++i) {
        services.push_back(std::make_shared<JSONValue>(ServiceRecordToJSON(matched[i])));
    }

    JSONValue::Object out;
    SetMember(out, "services", JSONValue(std::move(services)));
    SetMember(out, "total", JSONValue(static_cast<int64_t>(total)));
    SetMember(out, "returned", JSONValue(static_cast<int64_t>(returned)));
    SetMember(out, "truncated", JSONValue(total > returned));
    SetMember(out, "generated_at_utc", JSONValue(FormatUtcMillis(NowMicros())));

    LOG_DEBUG("list_services matched {} of {} unit(s), returning {}", total, all.size(), returned);
    return QueryOutput{JSONValue(std::move(out)), std::format("Returned {} of {} services", returned, total)};
}

} // namespace query
} // namespace sysmon
