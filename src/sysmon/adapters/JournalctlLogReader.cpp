//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/sysmon/adapters/JournalctlLogReader.cpp
// Purpose: Journal record retrieval through journalctl's JSON export
//==========================================================================================================

#include <charconv>
#include <format>
#include <sstream>

#include "sysmon/adapters/JournalctlLogReader.hpp"
#include "sysmon/JSONRPCTypes.h"
#include "env/EnvVars.h"
#include "logging/Logger.h"

namespace sysmon::adapters {

namespace {
    std::optional<int64_t> parseInteger(const std::string& s) {
        int64_t v = 0;
        const char* last = s.data() + s.size();
        auto [ptr, ec] = std::from_chars(s.data(), last, v);
        if (s.empty() || ec != std::errc() || ptr != last) {
            return std::nullopt;
        }
        return v;
    }

    // journalctl renders a field as a string, as a byte array for binary/non-UTF-8 data, or as an array
    // of those when the field repeats. The first occurrence wins.
    std::optional<std::string> fieldText(const JSONValue::Object& obj, const char* key) {
        const JSONValue* v = FindMember(obj, key);
        if (!v || v->isNull()) {
            return std::nullopt;
        }
        if (v->isString()) {
            return std::get<std::string>(v->value);
        }
        if (!v->isArray()) {
            return std::nullopt;
        }
        const auto& arr = std::get<JSONValue::Array>(v->value);
        if (arr.empty()) {
            return std::string();
        }
        if (arr.front() && (arr.front()->isString() || arr.front()->isArray())) {
            JSONValue::Object single;
            single[key] = arr.front();
            return fieldText(single, key);
        }
        std::string bytes;
        bytes.reserve(arr.size());
        for (const auto& b : arr) {
            if (!b || !std::holds_alternative<int64_t>(b->value)) {
                return std::nullopt;
            }
            bytes.push_back(static_cast<char>(static_cast<unsigned char>(std::get<int64_t>(b->value) & 0xFF)));
        }
        return DecodeUtf8Lossy(bytes);
    }

    int64_t floorSeconds(EpochMicros us) {
        return (us >= 0) ? us / kMicrosPerSecond : -((-us + kMicrosPerSecond - 1) / kMicrosPerSecond);
    }

    int64_t ceilSeconds(EpochMicros us) {
        return -floorSeconds(-us);
    }
}

JournalctlLogReader::JournalctlLogReader(ICommandRunner& runner, std::chrono::milliseconds timeout)
    : runner_(runner), timeout_(timeout) {}

std::vector<std::string> JournalctlLogReader::BuildArgs(const LogReadRequest& request) {
    std::vector<std::string> args = {
        "--utc", "--no-pager", "--quiet", "--output=json",
        std::format("--since=@{}", floorSeconds(request.start)),
        std::format("--until=@{}", ceilSeconds(request.end))
    };
    if (request.newestFirst) {
        args.emplace_back("--reverse");
    }
    if (request.maxPriority.has_value()) {
        args.push_back(std::format("--priority=0..{}", request.maxPriority.value()));
    }
    if (request.unit.has_value()) {
        // Exact field match, the same as filtering on _SYSTEMD_UNIT.
        args.push_back(std::format("_SYSTEMD_UNIT={}", request.unit.value()));
    }
    return args;
}

std::optional<LogEntry> JournalctlLogReader::ParseRecord(const std::string& line) {
    JSONValue root;
    try {
        root = ParseJSON(line);
    } catch (const JSONParseError& e) {
        LOG_DEBUG("skipping unparseable journal line: {}", e.what());
        return std::nullopt;
    }
    if (!root.isObject()) {
        return std::nullopt;
    }
    const auto& obj = std::get<JSONValue::Object>(root.value);

    auto ts = fieldText(obj, "__REALTIME_TIMESTAMP");
    std::optional<int64_t> tsValue;
    if (ts.has_value()) {
        tsValue = parseInteger(*ts);
    }
    if (!tsValue.has_value()) {
        return std::nullopt;
    }

    LogEntry entry;
    entry.timestamp = *tsValue;
    entry.unit = fieldText(obj, "_SYSTEMD_UNIT");
    if (auto prio = fieldText(obj, "PRIORITY")) {
        auto p = parseInteger(*prio);
        if (p.has_value() && *p >= 0 && *p <= 7) {
            entry.priority = static_cast<int>(*p);
        }
    }
    entry.hostname = fieldText(obj, "_HOSTNAME");
    if (auto pid = fieldText(obj, "_PID")) {
        entry.pid = parseInteger(*pid);
    }
    entry.message = fieldText(obj, "MESSAGE");
    entry.cursor = fieldText(obj, "__CURSOR");
    return entry;
}

LogReadResult JournalctlLogReader::Read(const LogReadRequest& request) {
    FUNC_SCOPE();
    CommandSpec spec;
    spec.program = "journalctl";
    spec.timeout = timeout_;
    spec.args = BuildArgs(request);
    spec.maxLines = request.scanLimit;

    const CommandResult res = runner_.Run(spec);
    if (!res.stoppedEarly && res.exitCode != 0) {
        throw AdapterError(std::format("journalctl exited with {}: {}", res.exitCode, TrimAscii(res.stderrText)));
    }

    LogReadResult out;
    std::size_t scanned = 0;
    std::istringstream in(res.stdoutText);
    std::string line;
    while (std::getline(in, line) && scanned < request.scanLimit) {
        if (TrimAscii(line).empty()) {
            continue;
        }
        ++scanned;
        auto entry = ParseRecord(line);
        if (!entry.has_value()) {
            continue;
        }
        if (entry->timestamp < request.start || entry->timestamp > request.end) {
            continue;
        }
        out.entries.push_back(std::move(*entry));
    }
    out.totalScanned = scanned;
    LOG_DEBUG("journalctl scanned {} record(s), {} inside window", scanned, out.entries.size());
    return out;
}

} // namespace sysmon::adapters
