#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace shellrunner::core::util {

[[nodiscard]] auto is_space(char c) noexcept -> bool;

// Strips trailing whitespace (space, \t, \n, \r, \f, \v).
[[nodiscard]] auto trim_right(std::string_view sv) -> std::string;

[[nodiscard]] auto split_whitespace(std::string_view sv) -> std::vector<std::string_view>;

// ASCII case-insensitive comparison.
[[nodiscard]] auto iequals(std::string_view lhs, std::string_view rhs) noexcept -> bool;

// Wraps a word in single quotes so every POSIX-like shell (and fish) reads it literally.
[[nodiscard]] auto single_quote(std::string_view word) -> std::string;

} // namespace shellrunner::core::util
