#pragma once

#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "shellrunner/core/result.hpp"

namespace shellrunner::status {

inline constexpr std::string_view FIELD_SEPARATOR = " : ";

// OPEN + " : " + raw + " : " + CLOSE, exactly what the reporter program prints.
[[nodiscard]] auto format_report(std::string_view raw_pipe_status) -> std::string;

// Exit code of the reporter: the first non-zero status, or 0. Tokens that are not integers are skipped.
[[nodiscard]] auto report_exit_code(std::string_view raw_pipe_status) -> int;

// Parses the text captured between the markers (" : 0 1 : ") into one status per pipeline stage.
[[nodiscard]] auto parse_payload(std::string_view payload) -> core::Result<std::vector<int>>;

} // namespace shellrunner::status
