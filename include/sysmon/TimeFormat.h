//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: TimeFormat.h
// Purpose: UTC timestamp parsing/formatting on microsecond epoch values
//==========================================================================================================

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace sysmon {

// Microseconds since the Unix epoch, UTC. This is journald's native resolution.
using EpochMicros = int64_t;

constexpr EpochMicros kMicrosPerSecond = 1000000;
constexpr EpochMicros kMicrosPerHour = 3600 * kMicrosPerSecond;
constexpr EpochMicros kMicrosPerDay = 24 * kMicrosPerHour;

//==========================================================================================================
// ParseUtcTimestamp
// Purpose: Parses an RFC3339 timestamp whose offset is the literal "Z", e.g. 2025-01-31T12:00:00Z or
//          2025-01-31T12:00:00.250Z. Fractions beyond microseconds are truncated.
// Returns:
//   Epoch microseconds, or std::nullopt for any other form (numeric offsets included) or an impossible date.
//==========================================================================================================
std::optional<EpochMicros> ParseUtcTimestamp(const std::string& text);

//==========================================================================================================
// FormatUtcMillis
// Purpose: Formats epoch microseconds as YYYY-MM-DDTHH:MM:SS.mmmZ.
//==========================================================================================================
std::string FormatUtcMillis(EpochMicros micros);

// Current wall-clock time in epoch microseconds.
EpochMicros NowMicros();

} // namespace sysmon
