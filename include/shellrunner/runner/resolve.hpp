#pragma once

#include <filesystem>
#include <optional>
#include <string_view>

#include "shellrunner/core/result.hpp"
#include "shellrunner/runner/errors.hpp"

namespace shellrunner::runner {

// First executable regular file called `name` on PATH.
[[nodiscard]] auto find_in_path(std::string_view name) -> std::optional<std::filesystem::path>;

// Accepts a path ("/bin/bash") or a name looked up on PATH ("bash").
[[nodiscard]] auto resolve_shell_path(std::string_view shell) -> core::Result<std::filesystem::path, ShellRunnerError>;

// The executable of the process that started us, normally the user's shell.
[[nodiscard]] auto parent_shell_path() -> core::Result<std::filesystem::path, ShellRunnerError>;

// Rejects executables that are known not to be shells (interpreters, shellrunner itself).
[[nodiscard]] auto ensure_is_shell(std::filesystem::path path) -> core::Result<std::filesystem::path, ShellRunnerError>;

// Explicit path, then $SHELLRUNNER_REPORTER, then next to the running executable,
// then the install libexec directory, then PATH.
[[nodiscard]] auto resolve_reporter_path(std::optional<std::filesystem::path> const& explicit_path)
    -> core::Result<std::filesystem::path, ShellRunnerError>;

} // namespace shellrunner::runner
