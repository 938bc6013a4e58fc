#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "shellrunner/core/result.hpp"
#include "shellrunner/stream/code_point_source.hpp"

namespace shellrunner::stream {

// Splits the merged output of the shell into the text the user sees and the status
// reports framed by OPEN/CLOSE markers. Markers themselves are never kept.
class StreamDemuxer {
public:
  enum class State {
    CapturingOutput,
    CapturingStatus
  };

  // Receives every visible code point as soon as it is read.
  using EchoSink = std::function<void(std::string_view)>;

private:
  EchoSink                 echo_;
  State                    state_ = State::CapturingOutput;
  std::string              output_;
  std::string              pending_;
  std::vector<std::string> payloads_;

public:
  explicit StreamDemuxer(EchoSink echo = {});

  void feed(std::string_view code_point);

  // Feeds every code point of the source, then finish().
  auto drain(CodePointSource& source) -> core::Result<void>;

  // End of stream: a report that was opened but never closed is dropped.
  void finish() noexcept;

  [[nodiscard]] auto state() const noexcept -> State {
    return state_;
  }
  [[nodiscard]] auto output() const noexcept -> std::string const& {
    return output_;
  }
  [[nodiscard]] auto payloads() const noexcept -> std::vector<std::string> const& {
    return payloads_;
  }
};

} // namespace shellrunner::stream
