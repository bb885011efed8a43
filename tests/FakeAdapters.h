//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/FakeAdapters.h
// Purpose: In-memory host adapters and record builders shared by the GoogleTest suites
//==========================================================================================================

#pragma once

#include <atomic>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "sysmon/TimeFormat.h"
#include "sysmon/adapters/AdapterTypes.h"
#include "sysmon/adapters/CommandRunner.hpp"

namespace sysmon::fakes {

//==========================================================================================================
// FakeUnitLister
// Purpose: Returns a fixed unit list, or throws AdapterError when failWith is set.
//==========================================================================================================
class FakeUnitLister : public adapters::IUnitLister {
public:
    std::vector<adapters::ServiceRecord> units;
    std::optional<std::string> failWith;
    std::atomic<int> calls{0};

    std::vector<adapters::ServiceRecord> ListUnits() override {
        ++calls;
        if (failWith) {
            throw adapters::AdapterError(*failWith);
        }
        return units;
    }
};

//==========================================================================================================
// FakeLogReader
// Purpose: Returns a fixed entry set (unfiltered) and records the last request it was given.
//==========================================================================================================
class FakeLogReader : public adapters::ILogReader {
public:
    std::vector<adapters::LogEntry> entries;
    std::optional<std::size_t> totalScanned;
    std::optional<std::string> failWith;

    adapters::LogReadResult Read(const adapters::LogReadRequest& request) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            lastRequest_ = request;
        }
        if (failWith) {
            throw adapters::AdapterError(*failWith);
        }
        adapters::LogReadResult r;
        r.entries = entries;
        r.totalScanned = totalScanned;
        return r;
    }

    std::optional<adapters::LogReadRequest> LastRequest() {
        std::lock_guard<std::mutex> lock(mutex_);
        return lastRequest_;
    }

private:
    std::mutex mutex_;
    std::optional<adapters::LogReadRequest> lastRequest_;
};

//==========================================================================================================
// ScriptedRunner
// Purpose: ICommandRunner that answers each invocation from a queue of canned results.
//==========================================================================================================
class ScriptedRunner : public adapters::ICommandRunner {
public:
    std::vector<adapters::CommandResult> results;
    std::vector<adapters::CommandSpec> seen;

    adapters::CommandResult Run(const adapters::CommandSpec& spec) override {
        seen.push_back(spec);
        if (next_ >= results.size()) {
            throw adapters::AdapterError("no scripted result left");
        }
        return results[next_++];
    }

private:
    std::size_t next_{0};
};

inline adapters::ServiceRecord makeService(const std::string& unit, const std::string& active,
                                           const std::string& sub = "running") {
    adapters::ServiceRecord r;
    r.unit = unit;
    r.description = unit + " daemon";
    r.loadState = "loaded";
    r.activeState = active;
    r.subState = sub;
    return r;
}

inline adapters::LogEntry makeEntry(const std::string& utc, const std::string& unit, int priority,
                                    const std::string& message) {
    adapters::LogEntry e;
    e.timestamp = ParseUtcTimestamp(utc).value_or(0);
    e.unit = unit;
    e.priority = priority;
    e.hostname = std::string("host-a");
    e.message = message;
    return e;
}

} // namespace sysmon::fakes
