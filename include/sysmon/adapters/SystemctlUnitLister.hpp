//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SystemctlUnitLister.hpp
// Purpose: IUnitLister backed by `systemctl list-units` and `systemctl show`
//==========================================================================================================

#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "sysmon/adapters/AdapterTypes.h"
#include "sysmon/adapters/CommandRunner.hpp"

namespace sysmon::adapters {

//==========================================================================================================
// SystemctlUnitLister
// Purpose: Lists loaded *.service units (all states) and enriches them with unit-file state, activation
//          time, main PID, exit status and result.
// Notes:
//   - Enrichment failure is logged at WARN and leaves the optional fields absent; listing failure throws.
//   - Units are returned in ascending name order.
//==========================================================================================================
class SystemctlUnitLister : public IUnitLister {
public:
    SystemctlUnitLister(ICommandRunner& runner, std::chrono::milliseconds timeout);

    std::vector<ServiceRecord> ListUnits() override;

    //==========================================================================================================
    // ParseListUnits
    // Purpose: Parses `systemctl list-units --output=json` output, keeping *.service entries only.
    // Throws:
    //   AdapterError when the text is not a JSON array.
    //==========================================================================================================
    static std::vector<ServiceRecord> ParseListUnits(const std::string& json);

    //==========================================================================================================
    // ApplyShowOutput
    // Purpose: Merges `systemctl show --timestamp=unix` property blocks (separated by blank lines and keyed
    //          by Id) into the matching records.
    //==========================================================================================================
    static void ApplyShowOutput(const std::string& text, std::vector<ServiceRecord>& units);

private:
    void enrich(std::vector<ServiceRecord>& units);

    ICommandRunner& runner_;
    std::chrono::milliseconds timeout_;
};

} // namespace sysmon::adapters
