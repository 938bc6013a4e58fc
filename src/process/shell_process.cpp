#include "shellrunner/process/shell_process.hpp"

#include <csignal>
#include <cstring>
#include <expected>
#include <utility>
#include <vector>

#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include <fmt/core.h>

#include "shellrunner/core/constant.hpp"
#include "shellrunner/core/env.hpp"
#include "shellrunner/core/syscall.hpp"

namespace shellrunner::process {

namespace {

class SpawnFileActions {
  posix_spawn_file_actions_t actions_{};
  bool                       initialized_ = false;

public:
  SpawnFileActions() = default;
  ~SpawnFileActions() {
    if (initialized_) {
      posix_spawn_file_actions_destroy(&actions_);
    }
  }

  SpawnFileActions(SpawnFileActions const&)            = delete;
  SpawnFileActions& operator=(SpawnFileActions const&) = delete;

  auto init() -> core::Result<void> {
    if (int err = posix_spawn_file_actions_init(&actions_)) {
      return std::unexpected(fmt::format("posix_spawn_file_actions_init failed: {}", std::strerror(err)));
    }
    initialized_ = true;
    return {};
  }

  auto dup2(int fd, int target) -> core::Result<void> {
    if (int err = posix_spawn_file_actions_adddup2(&actions_, fd, target)) {
      return std::unexpected(fmt::format("posix_spawn_file_actions_adddup2 ({}) failed: {}", target, std::strerror(err)));
    }
    return {};
  }

  [[nodiscard]] auto get() const noexcept -> posix_spawn_file_actions_t const* {
    return &actions_;
  }
};

} // namespace

ShellProcess::ShellProcess(pid_t pid, core::FileDescriptor output) noexcept
    : pid_(pid), output_(std::move(output)) {}

auto ShellProcess::spawn(std::filesystem::path const& shell, std::string const& script) -> core::Result<ShellProcess> {
  auto pipe = core::make_pipe();
  if (!pipe) {
    return std::unexpected(std::move(pipe.error()));
  }
  auto [read_end, write_end] = std::move(*pipe);

  SpawnFileActions actions;
  if (auto ok = actions.init(); !ok) {
    return std::unexpected(std::move(ok.error()));
  }
  // Both pipe ends are O_CLOEXEC; only the duplicates survive exec.
  if (auto ok = actions.dup2(write_end.get(), STDOUT_FILENO); !ok) {
    return std::unexpected(std::move(ok.error()));
  }
  if (auto ok = actions.dup2(write_end.get(), STDERR_FILENO); !ok) {
    return std::unexpected(std::move(ok.error()));
  }

  std::vector<std::string> args{"-c", script};

  auto pid = core::syscall::spawn_process(shell.native(), args, core::env::environ(), actions.get());
  if (!pid) {
    return std::unexpected(fmt::format("Failed to start shell \"{}\": {}", shell.native(), std::strerror(pid.error())));
  }

  // The child holds the only write end now; EOF on read_end means every writer is gone.
  write_end.reset();
  return ShellProcess{*pid, std::move(read_end)};
}

ShellProcess::~ShellProcess() {
  cleanup();
}

ShellProcess::ShellProcess(ShellProcess&& other) noexcept
    : pid_(std::exchange(other.pid_, -1))
    , output_(std::move(other.output_))
    , exit_(std::exchange(other.exit_, std::nullopt)) {}

ShellProcess& ShellProcess::operator=(ShellProcess&& other) noexcept {
  if (this != &other) {
    cleanup();
    pid_    = std::exchange(other.pid_, -1);
    output_ = std::move(other.output_);
    exit_   = std::exchange(other.exit_, std::nullopt);
  }
  return *this;
}

auto ShellProcess::wait() -> core::Result<ExitInfo> {
  if (exit_) {
    return *exit_;
  }
  if (pid_ <= 0) {
    return std::unexpected("wait() on a process that was never started");
  }

  auto info = core::syscall::wait_for_process(pid_);
  if (!info) {
    return std::unexpected(fmt::format("waitpid() failed: {}", std::strerror(info.error())));
  }
  exit_ = exit_info_from_status(info->status_);
  return *exit_;
}

void ShellProcess::cleanup() noexcept {
  output_.reset();
  if (is_running()) {
    [[maybe_unused]] auto killed = core::syscall::kill_process(pid_, SIGKILL);
    if (auto info = core::syscall::wait_for_process(pid_)) {
      exit_ = exit_info_from_status(info->status_);
    }
  }
  pid_ = -1;
}

auto exit_info_from_status(int wait_status) noexcept -> ExitInfo {
  if (WIFEXITED(wait_status)) {
    return ExitInfo{WEXITSTATUS(wait_status), ProcessStatus::Completed};
  }
  if (WIFSIGNALED(wait_status)) {
    int signal = WTERMSIG(wait_status);
    return ExitInfo{core::constant::SIGNAL_EXIT_CODE_OFFSET + signal, ProcessStatus::Terminated, signal};
  }
  return ExitInfo{0, ProcessStatus::Running};
}

} // namespace shellrunner::process
