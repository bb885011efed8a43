//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Config.cpp
// Purpose: Environment-driven configuration loading and validation
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <format>

#include "sysmon/Config.h"
#include "env/EnvVars.h"

namespace sysmon {

namespace {
    // Parses a decimal integer in [lo, hi]; throws ConfigError naming the variable otherwise.
    uint64_t parseBounded(const char* name, const std::string& text, uint64_t lo, uint64_t hi) {
        const bool allDigits = !text.empty() && text.size() <= 12 &&
            std::all_of(text.begin(), text.end(), [](unsigned char ch){ return std::isdigit(ch) != 0; });
        if (!allDigits) {
            throw ConfigError(std::format("{} must be an integer, got '{}'", name, text));
        }
        const uint64_t v = std::stoull(text);
        if (v < lo || v > hi) {
            throw ConfigError(std::format("{} must be within [{}, {}], got {}", name, lo, hi, v));
        }
        return v;
    }

    template <typename T>
    void readBounded(const Config::Lookup& lookup, const char* name, uint64_t lo, uint64_t hi, T& out) {
        if (auto v = lookup(name)) {
            out = static_cast<T>(parseBounded(name, *v, lo, hi));
        }
    }
}

Config Config::Load(const Lookup& lookup) {
    Config cfg;

    auto token = lookup("MCP_API_TOKEN");
    if (!token.has_value()) {
        throw ConfigError("MCP_API_TOKEN is required");
    }
    if (token->size() < kMinTokenLength) {
        throw ConfigError(std::format("MCP_API_TOKEN must be at least {} characters", kMinTokenLength));
    }
    cfg.apiToken = *token;

    if (auto addr = lookup("BIND_ADDR")) {
        if (!auth::ParseAddress(*addr).has_value()) {
            throw ConfigError(std::format("BIND_ADDR is not an IP address: '{}'", *addr));
        }
        cfg.bindAddr = *addr;
    }
    readBounded(lookup, "BIND_PORT", 1, 65535, cfg.bindPort);

    if (auto cidr = lookup("MCP_ALLOWED_CIDR")) {
        auto rule = auth::ParseCidr(*cidr);
        if (!rule.has_value()) {
            throw ConfigError(std::format("MCP_ALLOWED_CIDR is not a valid CIDR: '{}'", *cidr));
        }
        cfg.allowedCidr = *rule;
    }
    if (auto proxies = lookup("MCP_TRUSTED_PROXIES")) {
        std::string bad;
        auto rules = auth::ParseCidrList(*proxies, bad);
        if (!rules.has_value()) {
            throw ConfigError(std::format("MCP_TRUSTED_PROXIES contains an invalid entry: '{}'", bad));
        }
        cfg.trustedProxies = std::move(*rules);
    }

    cfg.tlsCertFile = lookup("SYSMON_TLS_CERT");
    cfg.tlsKeyFile = lookup("SYSMON_TLS_KEY");
    if (cfg.tlsCertFile.has_value() != cfg.tlsKeyFile.has_value()) {
        throw ConfigError("SYSMON_TLS_CERT and SYSMON_TLS_KEY must be set together");
    }

    readBounded(lookup, "SYSMON_WORKER_THREADS", 1, 64, cfg.workerThreads);
    uint64_t timeoutMs = static_cast<uint64_t>(cfg.adapterTimeout.count());
    readBounded(lookup, "SYSMON_ADAPTER_TIMEOUT_MS", 100, 300000, timeoutMs);
    cfg.adapterTimeout = std::chrono::milliseconds(timeoutMs);
    readBounded(lookup, "SYSMON_LOG_SCAN_LIMIT", 1, 1000000, cfg.logScanLimit);
    readBounded(lookup, "SYSMON_MAX_BODY_BYTES", 1024, 67108864, cfg.maxBodyBytes);
    readBounded(lookup, "SYSMON_MAX_BATCH", 1, 10000, cfg.maxBatch);

    if (auto lvl = lookup("SYSMON_LOG_LEVEL")) {
        std::string lower = *lvl;
        std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
        if (lower != "debug" && lower != "info" && lower != "warn" && lower != "warning" && lower != "error") {
            throw ConfigError(std::format("SYSMON_LOG_LEVEL must be debug|info|warn|error, got '{}'", *lvl));
        }
        cfg.logLevel = lower;
    }
    cfg.logFile = lookup("SYSMON_LOG_FILE");
    return cfg;
}

Config Config::LoadFromEnv() {
    return Load([](const char* name) { return GetEnvTrimmed(name); });
}

auth::AccessPolicy Config::GatePolicy() const {
    auth::AccessPolicy p;
    p.token = apiToken;
    p.allowedCidr = allowedCidr;
    p.trustedProxies = trustedProxies;
    return p;
}

std::string Config::Describe() const {
    std::string proxies;
    for (const auto& r : trustedProxies) {
        if (!proxies.empty()) proxies += ',';
        proxies += r.ToString();
    }
    return std::format("bind={}:{} tls={} allowed_cidr={} trusted_proxies=[{}] workers={} adapter_timeout_ms={} "
                       "log_scan_limit={} max_body_bytes={} max_batch={}",
                       bindAddr, bindPort, TlsEnabled() ? "on" : "off",
                       allowedCidr ? allowedCidr->ToString() : std::string("any"), proxies,
                       workerThreads, adapterTimeout.count(), logScanLimit, maxBodyBytes, maxBatch);
}

} // namespace sysmon
