#include "shellrunner/core/syscall.hpp"

#include <cerrno>
#include <csignal>

#include <fcntl.h>
#include <linux/limits.h>
#include <sys/wait.h>
#include <unistd.h>

namespace shellrunner::core::syscall {

auto get_parent_pid() noexcept -> pid_t {
  return getppid();
}

auto kill_process(pid_t pid, int signal) -> Result<void> {
  if (kill(pid, signal) == -1) {
    return std::unexpected(errno);
  }
  return {};
}

auto wait_for_process(pid_t pid) -> Result<ProcessInfo> {
  int   status     = 0;
  pid_t result_pid = -1;
  do {
    result_pid = waitpid(pid, &status, 0);
  } while (result_pid == -1 && errno == EINTR);

  if (result_pid == -1) {
    return std::unexpected(errno);
  }
  return ProcessInfo{result_pid, status};
}

auto spawn_process(
    std::string const&                program,
    std::vector<std::string> const&   args,
    char* const*                      env,
    posix_spawn_file_actions_t const* file_actions,
    posix_spawnattr_t const*          attr
) -> Result<pid_t> {
  std::vector<char*> argv;
  argv.reserve(args.size() + 2);
  argv.push_back(const_cast<char*>(program.c_str()));

  for (auto const& arg : args) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  argv.push_back(nullptr);

  pid_t pid = 0;
  if (int result = posix_spawnp(&pid, program.c_str(), file_actions, attr, argv.data(), env)) {
    return std::unexpected(result);
  }
  return pid;
}

auto close_fd(int fd) -> Result<void> {
  if (close(fd) == -1) {
    return std::unexpected(errno);
  }
  return {};
}

auto create_pipe() -> Result<std::array<int, 2>> {
  std::array<int, 2> fds{};
  if (pipe2(fds.data(), O_CLOEXEC) == -1) {
    return std::unexpected(errno);
  }
  return fds;
}

auto read_fd(int fd, char* buffer, size_t size) -> Result<size_t> {
  ssize_t result = -1;
  do {
    result = read(fd, buffer, size);
  } while (result == -1 && errno == EINTR);

  if (result == -1) {
    return std::unexpected(errno);
  }
  return static_cast<size_t>(result);
}

auto read_link(std::string const& path) -> Result<std::string> {
  std::string buffer(PATH_MAX, '\0');
  ssize_t     length = readlink(path.c_str(), buffer.data(), buffer.size());
  if (length == -1) {
    return std::unexpected(errno);
  }
  buffer.resize(static_cast<size_t>(length));
  return buffer;
}

auto is_executable(std::string const& path) noexcept -> bool {
  return access(path.c_str(), X_OK) == 0;
}

} // namespace shellrunner::core::syscall
