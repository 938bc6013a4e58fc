#pragma once

#include <filesystem>
#include <span>
#include <string>

#include "shellrunner/core/result.hpp"
#include "shellrunner/script/dialect.hpp"

namespace shellrunner::script {

inline constexpr std::string_view STATEMENT_SEPARATOR = "; ";

// The status report invocation that follows every command:
//   'reporter' "<pipe status expr>"[ || exit "<last status expr>"]
[[nodiscard]] auto status_report_invocation(Dialect const& dialect, std::filesystem::path const& reporter, bool check)
    -> std::string;

// Interleaves each command with its status report invocation. Fails on an empty command list.
[[nodiscard]] auto assemble(
    std::span<std::string const> commands,
    Dialect const&               dialect,
    std::filesystem::path const& reporter,
    bool                         check
) -> core::Result<std::string>;

} // namespace shellrunner::script
