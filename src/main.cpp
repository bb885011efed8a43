//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/main.cpp
// Purpose: sysmon-mcp daemon entry point: configuration, wiring and signal-driven shutdown
//==========================================================================================================

#include <csignal>
#include <exception>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "sysmon/Config.h"
#include "sysmon/Dispatcher.h"
#include "sysmon/HTTPServer.hpp"
#include "sysmon/Registry.h"
#include "sysmon/adapters/CommandRunner.hpp"
#include "sysmon/adapters/JournalctlLogReader.hpp"
#include "sysmon/adapters/SystemctlUnitLister.hpp"
#include "sysmon/auth/AccessControl.hpp"
#include "sysmon/query/Queries.h"
#include "sysmon/version.h"

int main() {
    using namespace sysmon;

    // Level from the environment first so configuration errors are reported consistently.
    Logger::setLogLevelFromString(GetEnvOrDefault("SYSMON_LOG_LEVEL", "INFO"));

    Config config;
    try {
        config = Config::LoadFromEnv();
    } catch (const ConfigError& e) {
        LOG_ERROR("configuration error: {}", e.what());
        return 1;
    }
    Logger::setLogLevelFromString(config.logLevel);
    if (config.logFile) {
        Logger::setLogFile(*config.logFile);
    }
    LOG_INFO("{} {} starting: {}", SERVER_NAME, getVersionString(), config.Describe());

    adapters::ProcessCommandRunner runner;
    adapters::SystemctlUnitLister lister(runner, config.adapterTimeout);
    adapters::JournalctlLogReader reader(runner, config.adapterTimeout);
    query::ServiceQuery services(lister);
    query::LogQuery logs(reader, config.logScanLimit);
    MethodRegistry registry(services, logs);
    Dispatcher dispatcher(registry, config.maxBatch, config.workerThreads);

    HTTPServer::Options opts;
    opts.address = config.bindAddr;
    opts.port = config.bindPort;
    opts.tls = config.TlsEnabled();
    opts.certFile = config.tlsCertFile.value_or("");
    opts.keyFile = config.tlsKeyFile.value_or("");
    opts.maxBodyBytes = config.maxBodyBytes;
    opts.workerThreads = config.workerThreads;

    try {
        auth::AccessGate gate(config.GatePolicy());
        HTTPServer server(opts, gate, dispatcher);
        server.Start().get();

        boost::asio::io_context signals;
        boost::asio::signal_set set(signals, SIGINT, SIGTERM);
        set.async_wait([](const boost::system::error_code& ec, int signo) {
            if (!ec) {
                LOG_INFO("received signal {}, shutting down", signo);
            }
        });
        signals.run();

        server.Stop().get();
    } catch (const std::exception& e) {
        LOG_ERROR("fatal: {}", e.what());
        return 1;
    }
    LOG_INFO("{} stopped", SERVER_NAME);
    return 0;
}
