#include "shellrunner/runner/options.hpp"

#include <expected>
#include <utility>

#include <fmt/core.h>

#include "shellrunner/core/constant.hpp"
#include "shellrunner/core/env.hpp"
#include "shellrunner/core/util.hpp"
#include "shellrunner/runner/resolve.hpp"

namespace shellrunner::runner {

namespace constant = core::constant;

auto env_bool(std::string_view name) -> core::Result<std::optional<bool>, ShellRunnerError> {
  auto value = core::env::get(name);
  if (!value) {
    return std::nullopt;
  }
  if (core::util::iequals(*value, "true")) {
    return true;
  }
  if (core::util::iequals(*value, "false")) {
    return false;
  }
  return std::unexpected(ShellRunnerError{
      ErrorKind::EnvironmentVariable,
      fmt::format(
          "Received invalid value for environment variable {}: \"{}\"\nExpected \"True\" or \"False\" "
          "(case-insensitive).",
          name,
          *value
      )
  });
}

auto env_string(std::string_view name) -> std::optional<std::string> {
  return core::env::get(name);
}

auto resolve_options(RunOptions const& options) -> core::Result<ExecuteOptions, ShellRunnerError> {
  ExecuteOptions resolved;
  resolved.stream_ = options.stream_;

  auto shell = resolve_option(options.shell_, env_string(constant::ENV_SHELL), std::string{});
  auto shell_path = shell.empty() ? parent_shell_path() : resolve_shell_path(shell);
  if (!shell_path) {
    return std::unexpected(std::move(shell_path.error()));
  }
  resolved.shell_path_ = std::move(*shell_path);

  auto check = env_bool(constant::ENV_CHECK);
  if (!check) {
    return std::unexpected(std::move(check.error()));
  }
  resolved.check_ = resolve_option(options.check_, *check, true);

  auto show_output = env_bool(constant::ENV_SHOW_OUTPUT);
  if (!show_output) {
    return std::unexpected(std::move(show_output.error()));
  }
  resolved.show_output_ = resolve_option(options.show_output_, *show_output, true);

  auto show_command = env_bool(constant::ENV_SHOW_COMMAND);
  if (show_command && !show_command->has_value()) {
    show_command = env_bool(constant::ENV_SHOW_COMMANDS);
  }
  if (!show_command) {
    return std::unexpected(std::move(show_command.error()));
  }
  resolved.show_command_ = resolve_option(options.show_command_, *show_command, true);

  auto reporter = resolve_reporter_path(options.reporter_);
  if (!reporter) {
    return std::unexpected(std::move(reporter.error()));
  }
  resolved.reporter_path_ = std::move(*reporter);

  return resolved;
}

} // namespace shellrunner::runner
