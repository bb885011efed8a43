//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JournalctlLogReader.hpp
// Purpose: ILogReader backed by `journalctl --output=json`
//==========================================================================================================

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "sysmon/adapters/AdapterTypes.h"
#include "sysmon/adapters/CommandRunner.hpp"

namespace sysmon::adapters {

//==========================================================================================================
// JournalctlLogReader
// Purpose: Reads journal records for a window. The window is pushed down to journalctl at whole-second
//          granularity and then applied exactly; priority and unit are pushed down as well.
//          At most request.scanLimit records are read.
//==========================================================================================================
class JournalctlLogReader : public ILogReader {
public:
    JournalctlLogReader(ICommandRunner& runner, std::chrono::milliseconds timeout);

    LogReadResult Read(const LogReadRequest& request) override;

    // journalctl argument list for a request.
    static std::vector<std::string> BuildArgs(const LogReadRequest& request);

    //==========================================================================================================
    // ParseRecord
    // Purpose: Maps one JSON export line to a LogEntry. Byte-array field values are decoded as lossy UTF-8.
    // Returns:
    //   std::nullopt when the line is not a JSON object or has no usable __REALTIME_TIMESTAMP.
    //==========================================================================================================
    static std::optional<LogEntry> ParseRecord(const std::string& line);

private:
    ICommandRunner& runner_;
    std::chrono::milliseconds timeout_;
};

} // namespace sysmon::adapters
