#pragma once

#include <span>
#include <string>

#include "shellrunner/core/result.hpp"
#include "shellrunner/runner/errors.hpp"
#include "shellrunner/runner/options.hpp"

namespace shellrunner::runner {

// Runs the command list through options.shell_path_ and reports the stage statuses of the last command.
//
// Fails with ErrorKind::Command (carrying the full result) when check is on and any stage of the
// last command failed, with ErrorKind::Internal when the shell never completed a status report,
// and with ErrorKind::InvalidArgument for an empty command list.
auto execute(std::span<std::string const> commands, ExecuteOptions const& options)
    -> core::Result<ShellCommandResult, ShellRunnerError>;

// Resolves options (argument, then SHELLRUNNER_* variable, then default) and executes.
auto run(std::span<std::string const> commands, RunOptions const& options = {})
    -> core::Result<ShellCommandResult, ShellRunnerError>;
auto run(std::string command, RunOptions const& options = {}) -> core::Result<ShellCommandResult, ShellRunnerError>;

// "shellrunner: <commands>" as printed before execution.
void print_commands(std::FILE* stream, std::span<std::string const> commands);

} // namespace shellrunner::runner
