#include "shellrunner/stream/code_point_source.hpp"

#include <algorithm>
#include <cstring>
#include <expected>

#include <fmt/core.h>

#include "shellrunner/core/syscall.hpp"

namespace shellrunner::stream {

namespace {

constexpr auto is_continuation(unsigned char byte) noexcept -> bool {
  return (byte & 0xC0U) == 0x80U;
}

} // namespace

auto Utf8Decoder::sequence_length(unsigned char lead) noexcept -> size_t {
  if (lead < 0x80U) {
    return 1;
  }
  if ((lead & 0xE0U) == 0xC0U) {
    return 2;
  }
  if ((lead & 0xF0U) == 0xE0U) {
    return 3;
  }
  if ((lead & 0xF8U) == 0xF0U) {
    return 4;
  }
  return 0;
}

void Utf8Decoder::feed(std::string_view bytes) {
  if (pos_ > 0) {
    pending_.erase(0, pos_);
    pos_ = 0;
  }
  pending_.append(bytes);
}

auto Utf8Decoder::next() -> std::optional<std::string> {
  if (buffered() == 0) {
    return std::nullopt;
  }

  auto const lead   = static_cast<unsigned char>(pending_[pos_]);
  size_t     length = sequence_length(lead);

  if (length > 1) {
    size_t available = std::min(length, buffered());
    for (size_t i = 1; i < available; ++i) {
      if (!is_continuation(static_cast<unsigned char>(pending_[pos_ + i]))) {
        length = 0;
        break;
      }
    }
    if (length != 0 && available < length) {
      return std::nullopt;
    }
  }

  if (length == 0) {
    length = 1;
  }

  auto code_point = pending_.substr(pos_, length);
  pos_ += length;
  return code_point;
}

auto Utf8Decoder::flush() -> std::optional<std::string> {
  if (auto code_point = next()) {
    return code_point;
  }
  if (buffered() == 0) {
    return std::nullopt;
  }
  return std::string(1, pending_[pos_++]);
}

auto DecodingCodePointSource::next() -> core::Result<std::optional<std::string>> {
  while (true) {
    if (auto code_point = decoder_.next()) {
      return code_point;
    }
    if (exhausted_) {
      return decoder_.flush();
    }

    auto filled = fill(decoder_);
    if (!filled) {
      return std::unexpected(std::move(filled.error()));
    }
    exhausted_ = !*filled;
  }
}

auto FdCodePointSource::fill(Utf8Decoder& decoder) -> core::Result<bool> {
  auto count = core::syscall::read_fd(fd_, buffer_.data(), buffer_.size());
  if (!count) {
    return std::unexpected(fmt::format("Failed to read shell output: {}", std::strerror(count.error())));
  }
  if (*count == 0) {
    return false;
  }
  decoder.feed(std::string_view{buffer_.data(), *count});
  return true;
}

auto ChunkedCodePointSource::fill(Utf8Decoder& decoder) -> core::Result<bool> {
  if (index_ >= chunks_.size()) {
    return false;
  }
  decoder.feed(chunks_[index_++]);
  return true;
}

} // namespace shellrunner::stream
