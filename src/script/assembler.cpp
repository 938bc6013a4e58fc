#include "shellrunner/script/assembler.hpp"

#include <expected>

#include <fmt/core.h>

#include "shellrunner/core/util.hpp"

namespace shellrunner::script {

auto status_report_invocation(Dialect const& dialect, std::filesystem::path const& reporter, bool check)
    -> std::string {
  auto invocation = fmt::format("{} \"{}\"", core::util::single_quote(reporter.native()), dialect.pipe_status_expr_);
  if (check) {
    // The reporter exits with the first failing stage, so the shell stops right after the report is flushed.
    invocation += fmt::format(" || exit \"{}\"", dialect.last_status_expr_);
  }
  return invocation;
}

auto assemble(
    std::span<std::string const> commands,
    Dialect const&               dialect,
    std::filesystem::path const& reporter,
    bool                         check
) -> core::Result<std::string> {
  if (commands.empty()) {
    return std::unexpected("cannot assemble an empty command list");
  }

  auto const report = status_report_invocation(dialect, reporter, check);

  std::string script;
  for (auto const& command : commands) {
    if (!script.empty()) {
      script += STATEMENT_SEPARATOR;
    }
    script += command;
    script += STATEMENT_SEPARATOR;
    script += report;
  }
  return script;
}

} // namespace shellrunner::script
