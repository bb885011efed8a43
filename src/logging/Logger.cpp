//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.cpp
// Purpose: Logger sinks (stderr, optional append-only file) and static state.
//==========================================================================================================

#include "logging/Logger.h"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

#include "env/EnvVars.h"

// Default level is INFO; the daemon overrides it from SYSMON_LOG_LEVEL at startup.
LogLevel Logger::sLogLevel = LogLevel::LOG_INFO_LEVEL;
std::ofstream Logger::sLogFile;
std::mutex Logger::sLogMutex;

namespace {
    // Label colors are decided once per process from SYSMON_LOG_COLOR.
    bool colorEnabled() {
        static const bool enabled = [] {
            const std::string v = GetEnvOrDefault("SYSMON_LOG_COLOR", "1");
            return v == "1" || v == "true" || v == "TRUE";
        }();
        return enabled;
    }

    const char* labelColor(const char* level) {
        if (::strncmp(level, "ERROR", 5) == 0 || ::strncmp(level, "FATAL", 5) == 0) {
            return "\033[38;5;88m"; // burgundy
        }
        if (::strncmp(level, "WARN", 4) == 0) {
            return "\033[33m";
        }
        return "\033[35m";
    }
}

std::string Logger::utcTimestamp() {
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    const std::time_t nowTime = std::chrono::system_clock::to_time_t(now);
    std::tm buf{};
    ::gmtime_r(&nowTime, &buf);
    std::ostringstream oss;
    oss << std::put_time(&buf, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << ms << 'Z';
    return oss.str();
}

void Logger::setLogFile(const std::string& filePath) {
    std::lock_guard<std::mutex> lock(sLogMutex);
    if (sLogFile.is_open()) {
        sLogFile.close();
    }
    sLogFile.open(filePath, std::ios::out | std::ios::app);
    if (!sLogFile.is_open()) {
        std::cerr << "[ERROR] Failed to open log file: " << filePath << " (errno=" << errno << ")" << std::endl;
        return;
    }
    sLogFile << "\n=== Log opened at " << utcTimestamp() << " ===\n";
    sLogFile.flush();
}

void Logger::log(const char* level, const std::string& msg, const char* file, unsigned int line) {
    const char* base = ::strrchr(file, '/');
    base = base ? base + 1 : file;

    const std::string stamp = utcTimestamp();
    const std::string tail = std::format("{}:{}: {}\n", base, line, msg);
    const std::string plain = std::format("{} [{}] {}", stamp, level, tail);
    const std::string colored = colorEnabled()
        ? std::format("{} [{}{}\033[0m] {}", stamp, labelColor(level), level, tail)
        : plain;

    std::lock_guard<std::mutex> lock(sLogMutex);
    // Console output goes to stderr; stdout stays free for tooling that wraps the daemon.
    std::cerr << colored;
    if (sLogFile.is_open()) {
        sLogFile << plain;
        sLogFile.flush();
    }
}
