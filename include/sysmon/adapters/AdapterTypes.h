//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: AdapterTypes.h
// Purpose: Records produced by the host adapters and the interfaces the query layer consumes
//==========================================================================================================

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "sysmon/TimeFormat.h"

namespace sysmon::adapters {

//==========================================================================================================
// AdapterError
// Purpose: Transport failure talking to the service manager or log store (spawn failure, non-zero exit,
//          timeout, unparseable output). Surfaced to clients only as an opaque internal error.
//==========================================================================================================
class AdapterError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

//==========================================================================================================
// ServiceRecord
// Purpose: Status of one *.service unit. Optional members are absent when the service manager has no value.
//==========================================================================================================
struct ServiceRecord {
    std::string unit;
    std::string description;
    std::string loadState;
    std::string activeState;
    std::string subState;
    std::optional<std::string> unitFileState;
    std::optional<std::string> sinceUtc;
    std::optional<int64_t> mainPid;
    std::optional<int64_t> execMainStatus;
    std::optional<std::string> result;
};

//==========================================================================================================
// LogEntry
// Purpose: One journal record.
// Fields:
//   timestamp: Realtime timestamp in epoch microseconds (ordering and window checks use this).
//   priority: Syslog priority 0 (emerg) .. 7 (debug); 6 when the record carries none.
//==========================================================================================================
struct LogEntry {
    EpochMicros timestamp{0};
    std::optional<std::string> unit;
    int priority{6};
    std::optional<std::string> hostname;
    std::optional<int64_t> pid;
    std::optional<std::string> message;
    std::optional<std::string> cursor;
};

//==========================================================================================================
// LogReadRequest
// Purpose: Filters pushed down to the log store.
// Fields:
//   start/end: Inclusive window [start, end] in epoch microseconds.
//   maxPriority: Keep records with priority <= this value.
//   unit: Exact unit name.
//   newestFirst: Scan from the end of the window (the scan limit then keeps the newest records).
//   scanLimit: Max records read from the store.
//==========================================================================================================
struct LogReadRequest {
    EpochMicros start{0};
    EpochMicros end{0};
    std::optional<int> maxPriority;
    std::optional<std::string> unit;
    bool newestFirst{true};
    std::size_t scanLimit{20000};
};

struct LogReadResult {
    std::vector<LogEntry> entries;
    std::optional<std::size_t> totalScanned;
};

//==========================================================================================================
// IUnitLister
// Purpose: Enumerates service units. Implementations return only *.service units.
// Throws:
//   AdapterError on transport failure.
//==========================================================================================================
class IUnitLister {
public:
    virtual ~IUnitLister() = default;
    virtual std::vector<ServiceRecord> ListUnits() = 0;
};

//==========================================================================================================
// ILogReader
// Purpose: Reads journal records inside a window with optional priority/unit filters.
// Throws:
//   AdapterError on transport failure.
//==========================================================================================================
class ILogReader {
public:
    virtual ~ILogReader() = default;
    virtual LogReadResult Read(const LogReadRequest& request) = 0;
};

} // namespace sysmon::adapters
