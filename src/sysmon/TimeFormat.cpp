//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: TimeFormat.cpp
// Purpose: UTC timestamp parsing/formatting using the C++20 civil calendar types
//==========================================================================================================

#include <chrono>
#include <format>

#include "sysmon/TimeFormat.h"

namespace sysmon {

namespace {
    bool readDigits(const std::string& s, std::size_t pos, std::size_t count, int& out) {
        if (pos + count > s.size()) {
            return false;
        }
        int v = 0;
        for (std::size_t k = 0; k < count; ++k) {
            const char c = s[pos + k];
            if (c < '0' || c > '9') {
                return false;
            }
            v = v * 10 + (c - '0');
        }
        out = v;
        return true;
    }

    // Floor division for negative epoch values.
    EpochMicros floorDiv(EpochMicros a, EpochMicros b) {
        EpochMicros q = a / b;
        if ((a % b != 0) && ((a < 0) != (b < 0))) {
            --q;
        }
        return q;
    }
}

std::optional<EpochMicros> ParseUtcTimestamp(const std::string& text) {
    // YYYY-MM-DDTHH:MM:SS[.f{1,9}]Z
    const std::string& s = text;
    if (s.size() < 20 || s.back() != 'Z') {
        return std::nullopt;
    }
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    if (!readDigits(s, 0, 4, year) || s[4] != '-' ||
        !readDigits(s, 5, 2, month) || s[7] != '-' ||
        !readDigits(s, 8, 2, day) || (s[10] != 'T' && s[10] != 't') ||
        !readDigits(s, 11, 2, hour) || s[13] != ':' ||
        !readDigits(s, 14, 2, minute) || s[16] != ':' ||
        !readDigits(s, 17, 2, second)) {
        return std::nullopt;
    }
    std::size_t pos = 19;
    EpochMicros fracMicros = 0;
    if (s[pos] == '.') {
        ++pos;
        std::size_t digits = 0;
        EpochMicros scale = 100000;
        while (pos < s.size() && s[pos] >= '0' && s[pos] <= '9') {
            if (digits < 6) {
                fracMicros += static_cast<EpochMicros>(s[pos] - '0') * scale;
                scale /= 10;
            }
            ++digits;
            ++pos;
        }
        if (digits == 0 || digits > 9) {
            return std::nullopt;
        }
    }
    if (pos != s.size() - 1) {
        return std::nullopt;
    }
    if (hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }

    using namespace std::chrono;
    const year_month_day ymd{std::chrono::year{year}, std::chrono::month{static_cast<unsigned>(month)},
                             std::chrono::day{static_cast<unsigned>(day)}};
    if (!ymd.ok()) {
        return std::nullopt;
    }
    const EpochMicros dayNumber = sys_days{ymd}.time_since_epoch().count();
    // A leap second (":60") is folded into the following second.
    return dayNumber * kMicrosPerDay +
           static_cast<EpochMicros>(hour) * kMicrosPerHour +
           static_cast<EpochMicros>(minute) * 60 * kMicrosPerSecond +
           static_cast<EpochMicros>(second) * kMicrosPerSecond +
           fracMicros;
}

std::string FormatUtcMillis(EpochMicros micros) {
    using namespace std::chrono;
    const EpochMicros dayCount = floorDiv(micros, kMicrosPerDay);
    EpochMicros rem = micros - dayCount * kMicrosPerDay;
    const year_month_day ymd{sys_days{days{dayCount}}};
    const EpochMicros h = rem / kMicrosPerHour; rem %= kMicrosPerHour;
    const EpochMicros m = rem / (60 * kMicrosPerSecond); rem %= 60 * kMicrosPerSecond;
    const EpochMicros sec = rem / kMicrosPerSecond; rem %= kMicrosPerSecond;
    const EpochMicros ms = rem / 1000;
    return std::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z",
                       static_cast<int>(ymd.year()), static_cast<unsigned>(ymd.month()),
                       static_cast<unsigned>(ymd.day()), h, m, sec, ms);
}

EpochMicros NowMicros() {
    using namespace std::chrono;
    return duration_cast<microseconds>(system_clock::now().time_since_epoch()).count();
}

} // namespace sysmon
