#include <cstdio>
#include <string>
#include <vector>

#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include "shellrunner/cli/arg_parser.hpp"
#include "shellrunner/core/constant.hpp"
#include "shellrunner/runner/errors.hpp"
#include "shellrunner/runner/options.hpp"
#include "shellrunner/runner/runner.hpp"
#include "shellrunner/script/dialect.hpp"

namespace {

constexpr int USAGE_EXIT_CODE = 2;

void print_error(shellrunner::runner::ShellRunnerError const& error, bool verbose) {
  fmt::print(stderr, "{}: error: {}\n", shellrunner::core::constant::EXE_NAME, error.message());
  if (verbose) {
    fmt::print(stderr, "error kind: {}\n", shellrunner::runner::to_string(error.kind()));
  }
}

} // namespace

int main(int argc, char const* argv[]) {
  namespace runner = shellrunner::runner;

  auto parser = shellrunner::cli::create_default_arg_parser();
  auto args   = parser.parse(argc, argv);

  if (!args) {
    fmt::print(stderr, "Error: {}\n\n", args.error());
    parser.print_help(stderr);
    return USAGE_EXIT_CODE;
  }

  if (args->has("help")) {
    parser.print_help();
    return 0;
  }
  if (args->has("version")) {
    shellrunner::cli::ArgumentParser::print_version();
    return 0;
  }

  if (args->positional_.empty()) {
    fmt::print(stderr, "Error: no command given\n\n");
    parser.print_help(stderr);
    return USAGE_EXIT_CODE;
  }

  runner::RunOptions options;
  options.shell_ = args->get<std::string>("shell");
  if (args->has("no-check")) {
    options.check_ = false;
  }
  if (args->has("quiet")) {
    options.show_output_ = false;
  }
  if (args->has("no-echo")) {
    options.show_command_ = false;
  }
  if (auto reporter = args->get<std::string>("reporter")) {
    options.reporter_ = *reporter;
  }
  bool const verbose = args->has("verbose");

  // The invoking shell is looked up once here and handed to every execution.
  auto resolved = runner::resolve_options(options);
  if (!resolved) {
    print_error(resolved.error(), verbose);
    return 1;
  }

  if (verbose) {
    auto const& dialect = shellrunner::script::dialect_for_path(resolved->shell_path_);
    fmt::print(stderr, "shell: {} (dialect: {})\n", resolved->shell_path_.native(), dialect.name_);
    fmt::print(stderr, "reporter: {}\n", resolved->reporter_path_.native());
  }

  auto result = runner::execute(args->positional_, *resolved);
  if (!result) {
    auto const& error = result.error();
    print_error(error, verbose);
    if (auto const& partial = error.result()) {
      return partial->status_;
    }
    return 1;
  }

  if (verbose) {
    fmt::print(stderr, "status: {} pipestatus: [{}]\n", result->status_, fmt::join(result->pipestatus_, ", "));
  }
  return result->status_;
}
