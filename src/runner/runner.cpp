#include "shellrunner/runner/runner.hpp"

#include <algorithm>
#include <array>
#include <cstdio>
#include <expected>
#include <utility>

#include <unistd.h>

#include <fmt/color.h>
#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include "shellrunner/core/constant.hpp"
#include "shellrunner/core/util.hpp"
#include "shellrunner/process/shell_process.hpp"
#include "shellrunner/script/assembler.hpp"
#include "shellrunner/script/dialect.hpp"
#include "shellrunner/status/aggregator.hpp"
#include "shellrunner/stream/code_point_source.hpp"
#include "shellrunner/stream/demuxer.hpp"

namespace shellrunner::runner {

namespace {

auto internal(std::string message) -> ShellRunnerError {
  return ShellRunnerError{ErrorKind::Internal, std::move(message)};
}

} // namespace

void print_commands(std::FILE* stream, std::span<std::string const> commands) {
  if (isatty(fileno(stream)) == 1) {
    fmt::print(
        stream,
        "{}: {}\n",
        fmt::styled(core::constant::EXE_NAME, fmt::fg(fmt::color::cyan) | fmt::emphasis::bold),
        fmt::join(commands, script::STATEMENT_SEPARATOR)
    );
  } else {
    fmt::print(stream, "{}: {}\n", core::constant::EXE_NAME, fmt::join(commands, script::STATEMENT_SEPARATOR));
  }
  std::fflush(stream);
}

auto execute(std::span<std::string const> commands, ExecuteOptions const& options)
    -> core::Result<ShellCommandResult, ShellRunnerError> {
  auto const& dialect = script::dialect_for_path(options.shell_path_);

  auto script = script::assemble(commands, dialect, options.reporter_path_, options.check_);
  if (!script) {
    return std::unexpected(ShellRunnerError{ErrorKind::InvalidArgument, std::move(script.error())});
  }

  if (options.show_command_) {
    print_commands(options.stream_, commands);
  }

  auto shell = process::ShellProcess::spawn(options.shell_path_, *script);
  if (!shell) {
    return std::unexpected(internal(std::move(shell.error())));
  }

  stream::StreamDemuxer::EchoSink echo;
  if (options.show_output_) {
    echo = [stream = options.stream_](std::string_view code_point) {
      fmt::print(stream, "{}", code_point);
      std::fflush(stream);
    };
  }
  stream::StreamDemuxer demuxer{std::move(echo)};

  stream::FdCodePointSource source{shell->output_fd()};
  if (auto drained = demuxer.drain(source); !drained) {
    return std::unexpected(internal(std::move(drained.error())));
  }
  shell->close_output();

  auto exit = shell->wait();
  if (!exit) {
    return std::unexpected(internal(std::move(exit.error())));
  }

  auto summary = status::aggregate(demuxer.payloads());
  if (!summary) {
    if (exit->status_ == process::ProcessStatus::Terminated) {
      return std::unexpected(internal(fmt::format("{} (shell killed by signal {})", summary.error(), exit->signal_)));
    }
    return std::unexpected(internal(std::move(summary.error())));
  }

  ShellCommandResult result{
      .out_        = core::util::trim_right(demuxer.output()),
      .status_     = summary->status_,
      .pipestatus_ = std::move(summary->pipestatus_),
  };

  if (options.check_ && std::ranges::any_of(result.pipestatus_, [](int s) { return s != 0; })) {
    return std::unexpected(ShellRunnerError::command_failed(std::move(result)));
  }
  return result;
}

auto run(std::span<std::string const> commands, RunOptions const& options)
    -> core::Result<ShellCommandResult, ShellRunnerError> {
  auto resolved = resolve_options(options);
  if (!resolved) {
    return std::unexpected(std::move(resolved.error()));
  }
  return execute(commands, *resolved);
}

auto run(std::string command, RunOptions const& options) -> core::Result<ShellCommandResult, ShellRunnerError> {
  std::array<std::string, 1> commands{std::move(command)};
  return run(std::span<std::string const>{commands}, options);
}

} // namespace shellrunner::runner
