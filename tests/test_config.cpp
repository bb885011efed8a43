//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_config.cpp
// Purpose: GoogleTests for environment-driven configuration loading
//==========================================================================================================

#include <gtest/gtest.h>

#include <map>
#include <optional>
#include <string>

#include "sysmon/Config.h"

using namespace sysmon;

namespace {

//==========================================================================================================
// lookupFrom
// Purpose: Builds a Config::Lookup over a fixed variable map.
//==========================================================================================================
Config::Lookup lookupFrom(std::map<std::string, std::string> vars) {
    return [vars = std::move(vars)](const char* name) -> std::optional<std::string> {
        auto it = vars.find(name);
        if (it == vars.end()) {
            return std::nullopt;
        }
        return it->second;
    };
}

const char* kGoodToken = "abcdefghijklmnop";

} // namespace

TEST(Config, DefaultsWithOnlyToken) {
    Config cfg = Config::Load(lookupFrom({{"MCP_API_TOKEN", kGoodToken}}));
    EXPECT_EQ(cfg.apiToken, kGoodToken);
    EXPECT_EQ(cfg.bindAddr, "127.0.0.1");
    EXPECT_EQ(cfg.bindPort, 8080);
    EXPECT_FALSE(cfg.allowedCidr.has_value());
    EXPECT_TRUE(cfg.trustedProxies.empty());
    EXPECT_FALSE(cfg.TlsEnabled());
    EXPECT_EQ(cfg.workerThreads, 4u);
    EXPECT_EQ(cfg.adapterTimeout.count(), 10000);
    EXPECT_EQ(cfg.logScanLimit, 20000u);
    EXPECT_EQ(cfg.maxBatch, 100u);
    EXPECT_EQ(cfg.logLevel, "info");
}

TEST(Config, TokenIsRequiredAndLongEnough) {
    EXPECT_THROW(Config::Load(lookupFrom({})), ConfigError);
    EXPECT_THROW(Config::Load(lookupFrom({{"MCP_API_TOKEN", "short"}})), ConfigError);
}

TEST(Config, ParsesNetworkSettings) {
    Config cfg = Config::Load(lookupFrom({
        {"MCP_API_TOKEN", kGoodToken},
        {"BIND_ADDR", "0.0.0.0"},
        {"BIND_PORT", "9443"},
        {"MCP_ALLOWED_CIDR", "10.0.0.0/8"},
        {"MCP_TRUSTED_PROXIES", "127.0.0.1, ::1"},
        {"SYSMON_TLS_CERT", "/etc/sysmon/cert.pem"},
        {"SYSMON_TLS_KEY", "/etc/sysmon/key.pem"},
    }));
    EXPECT_EQ(cfg.bindAddr, "0.0.0.0");
    EXPECT_EQ(cfg.bindPort, 9443);
    ASSERT_TRUE(cfg.allowedCidr.has_value());
    EXPECT_EQ(cfg.allowedCidr->ToString(), "10.0.0.0/8");
    EXPECT_EQ(cfg.trustedProxies.size(), 2u);
    EXPECT_TRUE(cfg.TlsEnabled());

    auto policy = cfg.GatePolicy();
    EXPECT_EQ(policy.token, kGoodToken);
    EXPECT_TRUE(policy.allowedCidr.has_value());
    EXPECT_EQ(policy.trustedProxies.size(), 2u);
}

TEST(Config, RejectsInvalidValues) {
    const std::map<std::string, std::string> bad[] = {
        {{"BIND_ADDR", "localhost"}},
        {{"BIND_PORT", "0"}},
        {{"BIND_PORT", "70000"}},
        {{"BIND_PORT", "80a"}},
        {{"MCP_ALLOWED_CIDR", "10.0.0.0/40"}},
        {{"MCP_TRUSTED_PROXIES", "127.0.0.1,nope"}},
        {{"SYSMON_TLS_CERT", "/tmp/cert.pem"}},
        {{"SYSMON_WORKER_THREADS", "0"}},
        {{"SYSMON_ADAPTER_TIMEOUT_MS", "5"}},
        {{"SYSMON_LOG_LEVEL", "verbose"}},
    };
    for (auto vars : bad) {
        const std::string which = vars.begin()->first + "=" + vars.begin()->second;
        vars["MCP_API_TOKEN"] = kGoodToken;
        EXPECT_THROW(Config::Load(lookupFrom(vars)), ConfigError) << which;
    }
}

TEST(Config, DescribeNeverLeaksTheToken) {
    Config cfg = Config::Load(lookupFrom({{"MCP_API_TOKEN", kGoodToken}, {"MCP_ALLOWED_CIDR", "192.168.0.0/16"}}));
    const std::string d = cfg.Describe();
    EXPECT_EQ(d.find(kGoodToken), std::string::npos);
    EXPECT_NE(d.find("192.168.0.0/16"), std::string::npos);
    EXPECT_NE(d.find("tls=off"), std::string::npos);
}

TEST(Config, LogLevelIsNormalized) {
    Config cfg = Config::Load(lookupFrom({{"MCP_API_TOKEN", kGoodToken}, {"SYSMON_LOG_LEVEL", "DEBUG"}}));
    EXPECT_EQ(cfg.logLevel, "debug");
}
