//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Config.h
// Purpose: Immutable process configuration loaded once from the environment at startup
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "sysmon/auth/AccessControl.hpp"

namespace sysmon {

//==========================================================================================================
// ConfigError
// Purpose: Raised when a configuration value is missing or invalid. The binary exits non-zero on it.
//==========================================================================================================
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

//==========================================================================================================
// Config
// Purpose: Startup configuration. Constructed once, then passed by const reference.
// Fields:
//   apiToken: MCP_API_TOKEN (trimmed, at least 16 characters).
//   bindAddr/bindPort: BIND_ADDR (default 127.0.0.1) / BIND_PORT (default 8080).
//   allowedCidr: MCP_ALLOWED_CIDR; when absent no IP filtering happens.
//   trustedProxies: MCP_TRUSTED_PROXIES comma-separated addresses/ranges.
//   tlsCertFile/tlsKeyFile: SYSMON_TLS_CERT / SYSMON_TLS_KEY; both set enables HTTPS.
//   workerThreads: SYSMON_WORKER_THREADS, size of the blocking-work pool.
//   adapterTimeout: SYSMON_ADAPTER_TIMEOUT_MS, bound on each systemctl/journalctl run.
//   logScanLimit: SYSMON_LOG_SCAN_LIMIT, max journal records read per query.
//   maxBodyBytes: SYSMON_MAX_BODY_BYTES, request body cap.
//   maxBatch: SYSMON_MAX_BATCH, max members in one JSON-RPC batch.
//   logLevel/logFile: SYSMON_LOG_LEVEL / SYSMON_LOG_FILE.
//==========================================================================================================
struct Config {
    static constexpr std::size_t kMinTokenLength = 16;

    std::string apiToken;
    std::string bindAddr{"127.0.0.1"};
    uint16_t bindPort{8080};
    std::optional<auth::CidrRule> allowedCidr;
    std::vector<auth::CidrRule> trustedProxies;
    std::optional<std::string> tlsCertFile;
    std::optional<std::string> tlsKeyFile;
    std::size_t workerThreads{4};
    std::chrono::milliseconds adapterTimeout{10000};
    std::size_t logScanLimit{20000};
    std::size_t maxBodyBytes{1048576};
    std::size_t maxBatch{100};
    std::string logLevel{"info"};
    std::optional<std::string> logFile;

    using Lookup = std::function<std::optional<std::string>(const char*)>;

    //==========================================================================================================
    // Load
    // Purpose: Builds a Config from a variable lookup (unset or whitespace-only values read as absent).
    // Throws:
    //   ConfigError naming the offending variable.
    //==========================================================================================================
    static Config Load(const Lookup& lookup);

    // Load from the process environment.
    static Config LoadFromEnv();

    bool TlsEnabled() const { return tlsCertFile.has_value() && tlsKeyFile.has_value(); }

    // Gate policy derived from the token, allow-list and proxy settings.
    auth::AccessPolicy GatePolicy() const;

    // One-line summary for the startup log; never includes the token.
    std::string Describe() const;
};

} // namespace sysmon
