#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "shellrunner/core/constant.hpp"
#include "shellrunner/core/result.hpp"

namespace shellrunner::stream {

// Incremental UTF-8 decoder. Code points split across feed() calls are reassembled;
// bytes that cannot start or continue a sequence come out one at a time, unchanged.
class Utf8Decoder {
  std::string pending_;
  size_t      pos_ = 0;

public:
  void feed(std::string_view bytes);

  // Next complete code point, or nullopt when more input is needed.
  [[nodiscard]] auto next() -> std::optional<std::string>;

  // Once the input has ended: the bytes of an incomplete tail, one per call.
  [[nodiscard]] auto flush() -> std::optional<std::string>;

  [[nodiscard]] auto buffered() const noexcept -> size_t {
    return pending_.size() - pos_;
  }

  // Sequence length announced by a lead byte, 0 if the byte cannot start a sequence.
  [[nodiscard]] static auto sequence_length(unsigned char lead) noexcept -> size_t;
};

// A stream of whole code points, each held UTF-8 encoded in its own string.
class CodePointSource {
public:
  CodePointSource()          = default;
  virtual ~CodePointSource() = default;

  CodePointSource(CodePointSource const&)            = delete;
  CodePointSource& operator=(CodePointSource const&) = delete;
  CodePointSource(CodePointSource&&)                 = default;
  CodePointSource& operator=(CodePointSource&&)      = default;

  // nullopt at end of stream
  virtual auto next() -> core::Result<std::optional<std::string>> = 0;
};

class DecodingCodePointSource : public CodePointSource {
  Utf8Decoder decoder_;
  bool        exhausted_ = false;

public:
  auto next() -> core::Result<std::optional<std::string>> final;

protected:
  // Feeds the next bytes into the decoder; false once the input is exhausted.
  virtual auto fill(Utf8Decoder& decoder) -> core::Result<bool> = 0;
};

// Reads from a descriptor it does not own.
class FdCodePointSource : public DecodingCodePointSource {
  int                                                       fd_;
  std::array<char, core::constant::DEFAULT_PIPE_BUFFER_SIZE> buffer_{};

public:
  explicit FdCodePointSource(int fd) noexcept
      : fd_(fd) {}

protected:
  auto fill(Utf8Decoder& decoder) -> core::Result<bool> override;
};

// Replays in-memory chunks, each delivered as one read.
class ChunkedCodePointSource : public DecodingCodePointSource {
  std::vector<std::string> chunks_;
  size_t                   index_ = 0;

public:
  explicit ChunkedCodePointSource(std::vector<std::string> chunks)
      : chunks_(std::move(chunks)) {}

protected:
  auto fill(Utf8Decoder& decoder) -> core::Result<bool> override;
};

} // namespace shellrunner::stream
