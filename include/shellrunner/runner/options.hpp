#pragma once

#include <cstdio>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "shellrunner/core/result.hpp"
#include "shellrunner/runner/errors.hpp"

namespace shellrunner::runner {

// Call-site options; anything left unset falls back to SHELLRUNNER_* and then to the defaults.
struct RunOptions {
  std::optional<std::string>           shell_;
  std::optional<bool>                  check_;
  std::optional<bool>                  show_output_;
  std::optional<bool>                  show_command_;
  std::optional<std::filesystem::path> reporter_;
  std::FILE*                           stream_ = stdout;
};

// Fully resolved inputs of one execution.
struct ExecuteOptions {
  std::filesystem::path shell_path_;
  std::filesystem::path reporter_path_;
  bool                  check_        = true;
  bool                  show_output_  = true;
  bool                  show_command_ = true;
  std::FILE*            stream_       = stdout;
};

template<typename T>
[[nodiscard]] auto resolve_option(std::optional<T> argument, std::optional<T> environment, T fallback) -> T {
  if (argument) {
    return *argument;
  }
  if (environment) {
    return *environment;
  }
  return fallback;
}

// "True" / "False" in any letter case; anything else is an error.
[[nodiscard]] auto env_bool(std::string_view name) -> core::Result<std::optional<bool>, ShellRunnerError>;

[[nodiscard]] auto env_string(std::string_view name) -> std::optional<std::string>;

[[nodiscard]] auto resolve_options(RunOptions const& options) -> core::Result<ExecuteOptions, ShellRunnerError>;

} // namespace shellrunner::runner
