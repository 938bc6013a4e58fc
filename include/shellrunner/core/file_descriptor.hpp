#pragma once

#include <string>
#include <utility>

#include "shellrunner/core/result.hpp"

namespace shellrunner::core {

class FileDescriptor {
  int  fd_;
  bool owning_;

public:
  explicit FileDescriptor(int fd = -1, bool owning = true) noexcept;
  ~FileDescriptor() noexcept;

  FileDescriptor(FileDescriptor const&)            = delete;
  FileDescriptor& operator=(FileDescriptor const&) = delete;

  FileDescriptor(FileDescriptor&& other) noexcept;
  FileDescriptor& operator=(FileDescriptor&& other) noexcept;

  [[nodiscard]] auto get() const noexcept -> int;
  void               reset(int fd = -1, bool owning = true) noexcept;
  [[nodiscard]] auto valid() const noexcept -> bool;

  explicit operator bool() const noexcept {
    return valid();
  }
};

// Both ends are created with O_CLOEXEC.
auto make_pipe() -> Result<std::pair<FileDescriptor, FileDescriptor>>;

} // namespace shellrunner::core
