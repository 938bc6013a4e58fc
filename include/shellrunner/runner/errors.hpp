#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace shellrunner::runner {

struct ShellCommandResult {
  std::string      out_;
  int              status_ = 0;
  std::vector<int> pipestatus_;

  friend auto operator==(ShellCommandResult const&, ShellCommandResult const&) -> bool = default;
};

enum class ErrorKind {
  InvalidArgument,     // empty command list
  Resolution,          // shell or status reporter not found, not executable, or not a shell
  EnvironmentVariable, // malformed SHELLRUNNER_* value
  Command,             // a pipeline stage exited non-zero while check is on
  Internal             // the status report protocol broke down
};

[[nodiscard]] auto to_string(ErrorKind kind) noexcept -> std::string_view;

struct ShellRunnerError {
  ErrorKind                         kind_;
  std::string                       message_;
  std::optional<ShellCommandResult> result_; // set for ErrorKind::Command

  ShellRunnerError(ErrorKind kind, std::string message);
  ShellRunnerError(std::string message, ShellCommandResult result);

  [[nodiscard]] static auto command_failed(ShellCommandResult result) -> ShellRunnerError;

  [[nodiscard]] auto kind() const noexcept -> ErrorKind {
    return kind_;
  }
  [[nodiscard]] auto message() const noexcept -> std::string const& {
    return message_;
  }
  [[nodiscard]] auto result() const noexcept -> std::optional<ShellCommandResult> const& {
    return result_;
  }
  [[nodiscard]] auto is_command_error() const noexcept -> bool {
    return kind_ == ErrorKind::Command;
  }
};

} // namespace shellrunner::runner
