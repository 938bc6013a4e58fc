#include "shellrunner/core/util.hpp"

#include <algorithm>

namespace shellrunner::core::util {

auto is_space(char c) noexcept -> bool {
  switch (c) {
    case ' ':
    case '\t':
    case '\n':
    case '\r':
    case '\f':
    case '\v': return true;
    default: return false;
  }
}

auto trim_right(std::string_view sv) -> std::string {
  while (!sv.empty() && is_space(sv.back())) {
    sv.remove_suffix(1);
  }
  return std::string{sv};
}

auto split_whitespace(std::string_view sv) -> std::vector<std::string_view> {
  std::vector<std::string_view> words;

  size_t pos = 0;
  while (pos < sv.size()) {
    while (pos < sv.size() && is_space(sv[pos])) {
      ++pos;
    }
    size_t start = pos;
    while (pos < sv.size() && !is_space(sv[pos])) {
      ++pos;
    }
    if (pos > start) {
      words.push_back(sv.substr(start, pos - start));
    }
  }

  return words;
}

auto iequals(std::string_view lhs, std::string_view rhs) noexcept -> bool {
  auto lower = [](char c) {
    return c >= 'A' && c <= 'Z' ? static_cast<char>(c - 'A' + 'a') : c;
  };
  return std::ranges::equal(lhs, rhs, [&](char a, char b) { return lower(a) == lower(b); });
}

auto single_quote(std::string_view word) -> std::string {
  std::string quoted;
  quoted.reserve(word.size() + 2);
  quoted.push_back('\'');
  for (char c : word) {
    if (c == '\'') {
      quoted += R"('\'')";
    } else {
      quoted.push_back(c);
    }
  }
  quoted.push_back('\'');
  return quoted;
}

} // namespace shellrunner::core::util
