#include "shellrunner/runner/errors.hpp"

#include <utility>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace shellrunner::runner {

auto to_string(ErrorKind kind) noexcept -> std::string_view {
  switch (kind) {
    case ErrorKind::InvalidArgument: return "invalid argument";
    case ErrorKind::Resolution: return "resolution error";
    case ErrorKind::EnvironmentVariable: return "environment variable error";
    case ErrorKind::Command: return "command error";
    case ErrorKind::Internal: return "internal error";
  }
  return "unknown error";
}

ShellRunnerError::ShellRunnerError(ErrorKind kind, std::string message)
    : kind_(kind), message_(std::move(message)) {}

ShellRunnerError::ShellRunnerError(std::string message, ShellCommandResult result)
    : kind_(ErrorKind::Command), message_(std::move(message)), result_(std::move(result)) {}

auto ShellRunnerError::command_failed(ShellCommandResult result) -> ShellRunnerError {
  auto message = fmt::format("Command exited with non-zero status: [{}]", fmt::join(result.pipestatus_, ", "));
  return ShellRunnerError{std::move(message), std::move(result)};
}

} // namespace shellrunner::runner
