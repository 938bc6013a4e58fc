#include "shellrunner/core/file_descriptor.hpp"

#include <cstring>
#include <expected>

#include <fmt/core.h>

#include "shellrunner/core/syscall.hpp"

namespace shellrunner::core {

FileDescriptor::FileDescriptor(int fd, bool owning) noexcept
    : fd_(fd), owning_(owning) {}

FileDescriptor::~FileDescriptor() noexcept {
  reset();
}

FileDescriptor::FileDescriptor(FileDescriptor&& other) noexcept
    : fd_(other.fd_), owning_(other.owning_) {
  other.fd_     = -1;
  other.owning_ = false;
}

FileDescriptor& FileDescriptor::operator=(FileDescriptor&& other) noexcept {
  if (this != &other) {
    reset(other.fd_, other.owning_);
    other.fd_     = -1;
    other.owning_ = false;
  }
  return *this;
}

auto FileDescriptor::get() const noexcept -> int {
  return fd_;
}

void FileDescriptor::reset(int fd, bool owning) noexcept {
  if (owning_ && fd_ >= 0) {
    // close(2) releases the descriptor even when it reports an error
    [[maybe_unused]] auto _ = syscall::close_fd(fd_);
  }
  fd_     = fd;
  owning_ = owning;
}

auto FileDescriptor::valid() const noexcept -> bool {
  return fd_ >= 0;
}

auto make_pipe() -> Result<std::pair<FileDescriptor, FileDescriptor>> {
  auto pipe_result = syscall::create_pipe();
  if (!pipe_result) {
    return std::unexpected(fmt::format("Failed to create pipe: {}", std::strerror(pipe_result.error())));
  }
  auto fds = *pipe_result;
  return std::make_pair(FileDescriptor(fds[0]), FileDescriptor(fds[1]));
}

} // namespace shellrunner::core
