#include "shellrunner/runner/resolve.hpp"

#include <expected>
#include <string>
#include <system_error>

#include <fmt/core.h>

#include "shellrunner/core/constant.hpp"
#include "shellrunner/core/env.hpp"
#include "shellrunner/core/syscall.hpp"

namespace shellrunner::runner {

namespace fs = std::filesystem;

namespace {

auto is_executable_file(fs::path const& path) -> bool {
  std::error_code ec;
  return fs::is_regular_file(path, ec) && core::syscall::is_executable(path.native());
}

auto unresolved(std::string_view shell) -> ShellRunnerError {
  return ShellRunnerError{
      ErrorKind::Resolution,
      fmt::format(
          "Unable to resolve the path to shell \"{}\". It is either not on your PATH or the specified file does not "
          "exist.",
          shell
      )
  };
}

} // namespace

auto find_in_path(std::string_view name) -> std::optional<fs::path> {
  auto path_var = core::env::get(core::constant::PATH_VAR);
  if (!path_var || name.empty()) {
    return std::nullopt;
  }

  std::string_view dirs{*path_var};
  while (true) {
    auto             colon = dirs.find(':');
    std::string_view dir   = dirs.substr(0, colon);
    // An empty PATH entry means the current directory.
    auto candidate = (dir.empty() ? fs::path{"."} : fs::path{dir}) / name;
    if (is_executable_file(candidate)) {
      return candidate;
    }
    if (colon == std::string_view::npos) {
      break;
    }
    dirs.remove_prefix(colon + 1);
  }
  return std::nullopt;
}

auto resolve_shell_path(std::string_view shell) -> core::Result<fs::path, ShellRunnerError> {
  if (shell.empty()) {
    return std::unexpected(unresolved(shell));
  }

  if (shell.find('/') == std::string_view::npos) {
    auto found = find_in_path(shell);
    if (!found) {
      return std::unexpected(unresolved(shell));
    }
    return ensure_is_shell(fs::absolute(*found));
  }

  fs::path        path{shell};
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    return std::unexpected(unresolved(shell));
  }
  if (!core::syscall::is_executable(path.native())) {
    return std::unexpected(
        ShellRunnerError{ErrorKind::Resolution, fmt::format("The file at \"{}\" is not executable.", path.native())}
    );
  }
  return ensure_is_shell(fs::absolute(path));
}

auto parent_shell_path() -> core::Result<fs::path, ShellRunnerError> {
  auto link = fmt::format("/proc/{}/exe", core::syscall::get_parent_pid());
  auto exe  = core::syscall::read_link(link);
  if (!exe) {
    return std::unexpected(
        ShellRunnerError{ErrorKind::Resolution, "An error occurred when trying to get the path of the parent shell."}
    );
  }
  return ensure_is_shell(fs::path{*exe});
}

auto ensure_is_shell(fs::path path) -> core::Result<fs::path, ShellRunnerError> {
  auto name = path.filename().native();
  if (name.starts_with("python") || name == core::constant::EXE_NAME) {
    return std::unexpected(ShellRunnerError{
        ErrorKind::Resolution, fmt::format("Process \"{}\" is not a shell. Please provide a shell name or path.", name)
    });
  }
  return path;
}

auto resolve_reporter_path(std::optional<fs::path> const& explicit_path) -> core::Result<fs::path, ShellRunnerError> {
  auto not_executable = [](fs::path const& path) {
    return ShellRunnerError{
        ErrorKind::Resolution, fmt::format("The status reporter at \"{}\" is not executable.", path.native())
    };
  };

  if (explicit_path) {
    if (!is_executable_file(*explicit_path)) {
      return std::unexpected(not_executable(*explicit_path));
    }
    return fs::absolute(*explicit_path);
  }

  if (auto from_env = core::env::get(core::constant::ENV_REPORTER); from_env && !from_env->empty()) {
    fs::path path{*from_env};
    if (!is_executable_file(path)) {
      return std::unexpected(not_executable(path));
    }
    return fs::absolute(path);
  }

  if (auto self = core::env::self_executable()) {
    auto sibling = fs::path{*self}.parent_path() / core::constant::REPORTER_NAME;
    if (is_executable_file(sibling)) {
      return sibling;
    }
  }

#ifdef SHELLRUNNER_LIBEXEC_DIR
  if (auto installed = fs::path{SHELLRUNNER_LIBEXEC_DIR} / core::constant::REPORTER_NAME; is_executable_file(installed)) {
    return installed;
  }
#endif

  if (auto found = find_in_path(core::constant::REPORTER_NAME)) {
    return fs::absolute(*found);
  }

  return std::unexpected(ShellRunnerError{
      ErrorKind::Resolution,
      fmt::format(
          "Unable to find the status reporter \"{}\". Set {} to its path.",
          core::constant::REPORTER_NAME,
          core::constant::ENV_REPORTER
      )
  });
}

} // namespace shellrunner::runner
