#include "shellrunner/stream/demuxer.hpp"

#include <expected>
#include <utility>

#include "shellrunner/core/constant.hpp"

namespace shellrunner::stream {

StreamDemuxer::StreamDemuxer(EchoSink echo)
    : echo_(std::move(echo)) {}

void StreamDemuxer::feed(std::string_view code_point) {
  switch (state_) {
    case State::CapturingOutput:
      if (code_point == core::constant::OPEN_MARKER) {
        state_ = State::CapturingStatus;
        return;
      }
      output_ += code_point;
      if (echo_) {
        echo_(code_point);
      }
      break;

    case State::CapturingStatus:
      if (code_point == core::constant::CLOSE_MARKER) {
        payloads_.push_back(std::exchange(pending_, {}));
        state_ = State::CapturingOutput;
        return;
      }
      pending_ += code_point;
      break;
  }
}

auto StreamDemuxer::drain(CodePointSource& source) -> core::Result<void> {
  while (true) {
    auto code_point = source.next();
    if (!code_point) {
      finish();
      return std::unexpected(std::move(code_point.error()));
    }
    if (!code_point->has_value()) {
      break;
    }
    feed(**code_point);
  }
  finish();
  return {};
}

void StreamDemuxer::finish() noexcept {
  pending_.clear();
  state_ = State::CapturingOutput;
}

} // namespace shellrunner::stream
