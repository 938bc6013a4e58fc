#include <cstdio>
#include <string_view>

#include <fmt/core.h>

#include "shellrunner/core/constant.hpp"
#include "shellrunner/status/report.hpp"

// Invoked by the assembled script after every command with the shell's pipe status
// ("0 1 0") as its only argument.
int main(int argc, char* argv[]) {
  if (argc != 2) {
    fmt::print(stderr, "usage: {} <pipe status>\n", shellrunner::core::constant::REPORTER_NAME);
    return 2;
  }

  std::string_view raw{argv[1]};
  auto             report = shellrunner::status::format_report(raw);

  // No trailing newline; the report must reach the pipe before the shell can exit.
  std::fwrite(report.data(), 1, report.size(), stdout);
  std::fflush(stdout);

  return shellrunner::status::report_exit_code(raw);
}
