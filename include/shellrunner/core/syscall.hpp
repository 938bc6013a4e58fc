#pragma once

#include <array>
#include <expected>
#include <string>
#include <vector>

#include <spawn.h>
#include <sys/types.h>

namespace shellrunner::core::syscall {

// errno on failure
template<typename T>
using Result = std::expected<T, int>;

struct ProcessInfo {
  pid_t pid_;
  int   status_;
};

auto get_parent_pid() noexcept -> pid_t;
auto kill_process(pid_t pid, int signal) -> Result<void>;
auto wait_for_process(pid_t pid) -> Result<ProcessInfo>;
auto spawn_process(
    std::string const&                program,
    std::vector<std::string> const&   args,
    char* const*                      env,
    posix_spawn_file_actions_t const* file_actions = nullptr,
    posix_spawnattr_t const*          attr         = nullptr
) -> Result<pid_t>;

auto close_fd(int fd) -> Result<void>;
auto create_pipe() -> Result<std::array<int, 2>>;
auto read_fd(int fd, char* buffer, size_t size) -> Result<size_t>;
auto read_link(std::string const& path) -> Result<std::string>;
auto is_executable(std::string const& path) noexcept -> bool;

} // namespace shellrunner::core::syscall
