//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CommandRunner.hpp
// Purpose: Runs host tools (systemctl, journalctl) as child processes with output capture and a deadline
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace sysmon::adapters {

//==========================================================================================================
// CommandSpec
// Purpose: One invocation.
// Fields:
//   program: Executable name, resolved through PATH.
//   args: Arguments, passed without a shell.
//   timeout: Wall-clock bound; the child is killed when it expires.
//   maxLines: When set, the child is stopped once this many stdout lines were read.
//==========================================================================================================
struct CommandSpec {
    std::string program;
    std::vector<std::string> args;
    std::chrono::milliseconds timeout{10000};
    std::optional<std::size_t> maxLines;
};

//==========================================================================================================
// CommandResult
// Fields:
//   exitCode: Child exit status (meaningless when stoppedEarly).
//   stdoutText: Captured stdout; with maxLines it holds at most that many complete lines.
//   stderrText: First 64 KiB of stderr.
//   stoppedEarly: True when maxLines cut the output short.
//==========================================================================================================
struct CommandResult {
    int exitCode{0};
    std::string stdoutText;
    std::string stderrText;
    bool stoppedEarly{false};
};

//==========================================================================================================
// ICommandRunner
// Purpose: Process execution seam; tests substitute canned output.
// Throws:
//   AdapterError when the program cannot be found or started, or the deadline expires.
//==========================================================================================================
class ICommandRunner {
public:
    virtual ~ICommandRunner() = default;
    virtual CommandResult Run(const CommandSpec& spec) = 0;
};

//==========================================================================================================
// ProcessCommandRunner
// Purpose: ICommandRunner backed by Boost.Process with asynchronous pipes and a steady_timer deadline.
//==========================================================================================================
class ProcessCommandRunner : public ICommandRunner {
public:
    CommandResult Run(const CommandSpec& spec) override;
};

} // namespace sysmon::adapters
