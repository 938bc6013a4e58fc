#pragma once

#include <filesystem>
#include <string_view>

namespace shellrunner::script {

enum class DialectKind {
  Bash,
  Zsh,
  Fish,
  Posix // anything without per-stage statuses, including sh
};

struct Dialect {
  DialectKind      kind_;
  std::string_view name_;
  std::string_view last_status_expr_;
  std::string_view pipe_status_expr_;

  // False when only the final stage of a pipeline is observable.
  [[nodiscard]] constexpr auto has_pipe_status() const noexcept -> bool {
    return pipe_status_expr_ != last_status_expr_;
  }
};

// Unknown shells fall back to the POSIX dialect.
[[nodiscard]] auto dialect_for(std::string_view shell_base_name) noexcept -> Dialect const&;
[[nodiscard]] auto dialect_for_path(std::filesystem::path const& shell_path) -> Dialect const&;
[[nodiscard]] auto dialect_of(DialectKind kind) noexcept -> Dialect const&;

} // namespace shellrunner::script
