#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include <sys/types.h>

#include "shellrunner/core/file_descriptor.hpp"
#include "shellrunner/core/result.hpp"

namespace shellrunner::process {

enum class ProcessStatus {
  Running,
  Completed,
  Terminated
};

struct ExitInfo {
  int           exit_code_;
  ProcessStatus status_;
  int           signal_ = 0;
};

// A shell running `<shell> -c <script>` with stdout and stderr merged into one pipe.
// stdin is inherited so commands can still prompt the user.
class ShellProcess {
  pid_t                   pid_ = -1;
  core::FileDescriptor    output_;
  std::optional<ExitInfo> exit_;

  ShellProcess(pid_t pid, core::FileDescriptor output) noexcept;

public:
  [[nodiscard]] static auto spawn(std::filesystem::path const& shell, std::string const& script)
      -> core::Result<ShellProcess>;

  // A child that was never reaped is killed and reaped here.
  ~ShellProcess();

  ShellProcess(ShellProcess const&)            = delete;
  ShellProcess& operator=(ShellProcess const&) = delete;
  ShellProcess(ShellProcess&& other) noexcept;
  ShellProcess& operator=(ShellProcess&& other) noexcept;

  [[nodiscard]] auto pid() const noexcept -> pid_t {
    return pid_;
  }

  // Read end of the merged stdout/stderr pipe.
  [[nodiscard]] auto output_fd() const noexcept -> int {
    return output_.get();
  }

  void close_output() noexcept {
    output_.reset();
  }

  [[nodiscard]] auto is_running() const noexcept -> bool {
    return pid_ > 0 && !exit_;
  }

  auto wait() -> core::Result<ExitInfo>;

private:
  void cleanup() noexcept;
};

[[nodiscard]] auto exit_info_from_status(int wait_status) noexcept -> ExitInfo;

} // namespace shellrunner::process
