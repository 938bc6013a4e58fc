#include "shellrunner/script/dialect.hpp"

#include <algorithm>
#include <array>

namespace shellrunner::script {

namespace {

// clang-format off
constexpr std::array<Dialect, 4> DIALECTS{{
  {DialectKind::Bash,  "bash", "$?",      "${PIPESTATUS[*]}"},
  {DialectKind::Zsh,   "zsh",  "$status", "$pipestatus"},
  {DialectKind::Fish,  "fish", "$status", "$pipestatus"},
  {DialectKind::Posix, "sh",   "$?",      "$?"},
}};
// clang-format on

} // namespace

auto dialect_for(std::string_view shell_base_name) noexcept -> Dialect const& {
  auto it = std::ranges::find(DIALECTS, shell_base_name, &Dialect::name_);
  if (it == DIALECTS.end()) {
    return dialect_of(DialectKind::Posix);
  }
  return *it;
}

auto dialect_for_path(std::filesystem::path const& shell_path) -> Dialect const& {
  return dialect_for(shell_path.filename().native());
}

auto dialect_of(DialectKind kind) noexcept -> Dialect const& {
  return *std::ranges::find(DIALECTS, kind, &Dialect::kind_);
}

} // namespace shellrunner::script
