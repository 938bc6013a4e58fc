#include "shellrunner/status/report.hpp"

#include <charconv>
#include <expected>
#include <optional>
#include <system_error>

#include <fmt/core.h>

#include "shellrunner/core/constant.hpp"
#include "shellrunner/core/util.hpp"

namespace shellrunner::status {

namespace {

auto parse_int(std::string_view word) -> std::optional<int> {
  int value = 0;
  auto [ptr, ec] = std::from_chars(word.data(), word.data() + word.size(), value);
  if (ec != std::errc{} || ptr != word.data() + word.size()) {
    return std::nullopt;
  }
  return value;
}

} // namespace

auto format_report(std::string_view raw_pipe_status) -> std::string {
  return fmt::format(
      "{}{}{}{}{}",
      core::constant::OPEN_MARKER,
      FIELD_SEPARATOR,
      raw_pipe_status,
      FIELD_SEPARATOR,
      core::constant::CLOSE_MARKER
  );
}

auto report_exit_code(std::string_view raw_pipe_status) -> int {
  for (auto word : core::util::split_whitespace(raw_pipe_status)) {
    auto value = parse_int(word);
    if (!value || *value == 0) {
      continue;
    }
    // Only the low byte survives exit(); keep a failure a failure.
    int code = *value & 0xFF;
    return code == 0 ? 1 : code;
  }
  return 0;
}

auto parse_payload(std::string_view payload) -> core::Result<std::vector<int>> {
  auto first = payload.find(FIELD_SEPARATOR);
  auto last  = payload.rfind(FIELD_SEPARATOR);
  if (first == std::string_view::npos || last == first) {
    return std::unexpected(fmt::format("malformed status report \"{}\"", payload));
  }

  auto body  = payload.substr(first + FIELD_SEPARATOR.size(), last - first - FIELD_SEPARATOR.size());
  auto words = core::util::split_whitespace(body);
  if (words.empty()) {
    return std::unexpected(fmt::format("status report \"{}\" holds no exit status", payload));
  }

  std::vector<int> statuses;
  statuses.reserve(words.size());
  for (auto word : words) {
    auto value = parse_int(word);
    if (!value) {
      return std::unexpected(fmt::format("status report holds a non-numeric exit status \"{}\"", word));
    }
    statuses.push_back(*value);
  }
  return statuses;
}

} // namespace shellrunner::status
