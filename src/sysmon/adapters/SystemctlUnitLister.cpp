//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/sysmon/adapters/SystemctlUnitLister.cpp
// Purpose: Service unit enumeration through systemctl
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <charconv>
#include <format>
#include <sstream>
#include <unordered_map>

#include "sysmon/adapters/SystemctlUnitLister.hpp"
#include "sysmon/JSONRPCTypes.h"
#include "sysmon/TimeFormat.h"
#include "env/EnvVars.h"
#include "logging/Logger.h"

namespace sysmon::adapters {

namespace {
    constexpr std::size_t kShowChunk = 200;
    constexpr const char* kShowProperties = "--property=Id,UnitFileState,ActiveEnterTimestamp,MainPID,ExecMainStatus,Result";

    bool endsWith(const std::string& s, const std::string& suffix) {
        return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
    }

    std::string stringMember(const JSONValue::Object& obj, const char* key) {
        const JSONValue* v = FindMember(obj, key);
        if (v && v->isString()) {
            return std::get<std::string>(v->value);
        }
        return std::string();
    }

    std::optional<int64_t> parseInteger(const std::string& s) {
        int64_t v = 0;
        const char* first = s.data();
        const char* last = s.data() + s.size();
        auto [ptr, ec] = std::from_chars(first, last, v);
        if (ec != std::errc() || ptr != last || s.empty()) {
            return std::nullopt;
        }
        return v;
    }

    // "@<seconds>" as printed with --timestamp=unix; empty or zero means never entered.
    std::optional<std::string> unixTimestampToUtc(const std::string& value) {
        if (value.size() < 2 || value[0] != '@') {
            return std::nullopt;
        }
        auto secs = parseInteger(value.substr(1));
        if (!secs.has_value() || *secs <= 0) {
            return std::nullopt;
        }
        return FormatUtcMillis(*secs * kMicrosPerSecond);
    }

    void applyProperties(const std::unordered_map<std::string, std::string>& props, ServiceRecord& rec) {
        auto get = [&props](const char* key) -> std::optional<std::string> {
            auto it = props.find(key);
            if (it == props.end() || TrimAscii(it->second).empty()) {
                return std::nullopt;
            }
            return TrimAscii(it->second);
        };
        rec.unitFileState = get("UnitFileState");
        rec.result = get("Result");
        if (auto ts = get("ActiveEnterTimestamp")) {
            rec.sinceUtc = unixTimestampToUtc(*ts);
        }
        if (auto pid = get("MainPID")) {
            auto v = parseInteger(*pid);
            if (v.has_value() && *v > 0) rec.mainPid = v;
        }
        if (auto st = get("ExecMainStatus")) {
            rec.execMainStatus = parseInteger(*st);
        }
    }
}

SystemctlUnitLister::SystemctlUnitLister(ICommandRunner& runner, std::chrono::milliseconds timeout)
    : runner_(runner), timeout_(timeout) {}

std::vector<ServiceRecord> SystemctlUnitLister::ParseListUnits(const std::string& json) {
    JSONValue root;
    try {
        root = ParseJSON(json);
    } catch (const JSONParseError& e) {
        throw AdapterError(std::format("systemctl list-units produced invalid JSON: {}", e.what()));
    }
    if (!root.isArray()) {
        throw AdapterError("systemctl list-units output is not a JSON array");
    }
    std::vector<ServiceRecord> units;
    for (const auto& item : std::get<JSONValue::Array>(root.value)) {
        if (!item || !item->isObject()) {
            continue;
        }
        const auto& obj = std::get<JSONValue::Object>(item->value);
        ServiceRecord rec;
        rec.unit = stringMember(obj, "unit");
        if (!endsWith(rec.unit, ".service")) {
            continue;
        }
        rec.loadState = stringMember(obj, "load");
        rec.activeState = stringMember(obj, "active");
        rec.subState = stringMember(obj, "sub");
        rec.description = stringMember(obj, "description");
        units.push_back(std::move(rec));
    }
    std::sort(units.begin(), units.end(), [](const ServiceRecord& a, const ServiceRecord& b){ return a.unit < b.unit; });
    return units;
}

void SystemctlUnitLister::ApplyShowOutput(const std::string& text, std::vector<ServiceRecord>& units) {
    std::unordered_map<std::string, ServiceRecord*> byName;
    for (auto& u : units) {
        byName[u.unit] = &u;
    }

    std::unordered_map<std::string, std::string> block;
    auto flush = [&]() {
        auto id = block.find("Id");
        if (id != block.end()) {
            auto target = byName.find(id->second);
            if (target != byName.end()) {
                applyProperties(block, *target->second);
            }
        }
        block.clear();
    };

    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            flush();
            continue;
        }
        const auto eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        block[line.substr(0, eq)] = line.substr(eq + 1);
    }
    flush();
}

void SystemctlUnitLister::enrich(std::vector<ServiceRecord>& units) {
    for (std::size_t start = 0; start < units.size(); start += kShowChunk) {
        const std::size_t end = std::min(units.size(), start + kShowChunk);
        CommandSpec spec;
        spec.program = "systemctl";
        spec.timeout = timeout_;
        spec.args = {"show", "--no-pager", "--timestamp=unix", kShowProperties, "--"};
        for (std::size_t i = start; i < end; ++i) {
            spec.args.push_back(units[i].unit);
        }
        try {
            const CommandResult res = runner_.Run(spec);
            if (res.exitCode != 0) {
                LOG_WARN("systemctl show exited with {}: {}", res.exitCode, TrimAscii(res.stderrText));
                continue;
            }
            ApplyShowOutput(res.stdoutText, units);
        } catch (const AdapterError& e) {
            LOG_WARN("failed to enrich service details from systemd: {}", e.what());
        }
    }
}

std::vector<ServiceRecord> SystemctlUnitLister::ListUnits() {
    FUNC_SCOPE();
    CommandSpec spec;
    spec.program = "systemctl";
    spec.timeout = timeout_;
    spec.args = {"list-units", "--type=service", "--all", "--no-legend", "--no-pager", "--plain", "--output=json"};
    const CommandResult res = runner_.Run(spec);
    if (res.exitCode != 0) {
        throw AdapterError(std::format("systemctl list-units exited with {}: {}", res.exitCode, TrimAscii(res.stderrText)));
    }
    auto units = ParseListUnits(res.stdoutText);
    enrich(units);
    LOG_DEBUG("systemctl listed {} service unit(s)", units.size());
    return units;
}

} // namespace sysmon::adapters
