//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/sysmon/adapters/ProcessCommandRunner.cpp
// Purpose: Boost.Process child execution with async stdout/stderr capture, line cap and deadline
//==========================================================================================================

#include <algorithm>
#include <array>
#include <format>
#include <functional>
#include <system_error>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/process/async_pipe.hpp>
#include <boost/process/args.hpp>
#include <boost/process/child.hpp>
#include <boost/process/exe.hpp>
#include <boost/process/io.hpp>
#include <boost/process/search_path.hpp>

#include "sysmon/adapters/CommandRunner.hpp"
#include "sysmon/adapters/AdapterTypes.h"
#include "logging/Logger.h"

namespace sysmon::adapters {
namespace bp = boost::process;
namespace net = boost::asio;

namespace {
    constexpr std::size_t kMaxStderrBytes = 64 * 1024;
}

CommandResult ProcessCommandRunner::Run(const CommandSpec& spec) {
    FUNC_SCOPE();
    const auto exe = bp::search_path(spec.program);
    if (exe.empty()) {
        throw AdapterError(std::format("{} not found in PATH", spec.program));
    }
    LOG_DEBUG("Running {} with {} argument(s)", exe.string(), spec.args.size());

    net::io_context ioc;
    bp::async_pipe outPipe(ioc);
    bp::async_pipe errPipe(ioc);
    bp::child child;
    try {
        child = bp::child(bp::exe = exe, bp::args = spec.args,
                          bp::std_out > outPipe, bp::std_err > errPipe, bp::std_in < bp::null);
    } catch (const bp::process_error& e) {
        throw AdapterError(std::format("failed to start {}: {}", spec.program, e.what()));
    }

    CommandResult result;
    bool timedOut = false;
    bool outDone = false;
    bool errDone = false;
    std::size_t lines = 0;
    std::array<char, 16384> outBuf{};
    std::array<char, 4096> errBuf{};
    net::steady_timer deadline(ioc, spec.timeout);

    auto stop = [&]() {
        std::error_code ec;
        child.terminate(ec);
        if (ec) {
            LOG_DEBUG("terminate {} reported: {}", spec.program, ec.message());
        }
        boost::system::error_code closeEc;
        outPipe.close(closeEc);
        errPipe.close(closeEc);
        deadline.cancel();
    };

    std::function<void()> readOut = [&]() {
        outPipe.async_read_some(net::buffer(outBuf), [&](const boost::system::error_code& ec, std::size_t n) {
            if (n > 0) {
                const std::size_t before = result.stdoutText.size();
                result.stdoutText.append(outBuf.data(), n);
                if (spec.maxLines.has_value()) {
                    for (std::size_t k = before; k < result.stdoutText.size(); ++k) {
                        if (result.stdoutText[k] == '\n' && ++lines >= spec.maxLines.value()) {
                            result.stdoutText.resize(k + 1);
                            result.stoppedEarly = true;
                            stop();
                            return;
                        }
                    }
                }
            }
            if (ec) {
                outDone = true;
                if (errDone) deadline.cancel();
                return;
            }
            readOut();
        });
    };

    std::function<void()> readErr = [&]() {
        errPipe.async_read_some(net::buffer(errBuf), [&](const boost::system::error_code& ec, std::size_t n) {
            if (n > 0 && result.stderrText.size() < kMaxStderrBytes) {
                result.stderrText.append(errBuf.data(), std::min(n, kMaxStderrBytes - result.stderrText.size()));
            }
            if (ec) {
                errDone = true;
                if (outDone) deadline.cancel();
                return;
            }
            readErr();
        });
    };

    deadline.async_wait([&](const boost::system::error_code& ec) {
        if (ec) {
            return; // cancelled: output complete or stopped early
        }
        timedOut = true;
        stop();
    });

    readOut();
    readErr();
    ioc.run();

    std::error_code waitEc;
    child.wait(waitEc);
    if (timedOut) {
        throw AdapterError(std::format("{} timed out after {} ms", spec.program, spec.timeout.count()));
    }
    if (waitEc && !result.stoppedEarly) {
        throw AdapterError(std::format("waiting for {} failed: {}", spec.program, waitEc.message()));
    }
    result.exitCode = result.stoppedEarly ? 0 : child.exit_code();
    LOG_DEBUG("{} finished exit={} stdout_bytes={} stopped_early={}", spec.program, result.exitCode,
              result.stdoutText.size(), result.stoppedEarly);
    return result;
}

} // namespace sysmon::adapters
