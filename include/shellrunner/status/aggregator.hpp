#pragma once

#include <span>
#include <string>
#include <vector>

#include "shellrunner/core/result.hpp"

namespace shellrunner::status {

struct PipeStatusSummary {
  int              status_ = 0;
  std::vector<int> pipestatus_;
};

// The rightmost non-zero stage status, or the final stage status if every stage succeeded.
[[nodiscard]] auto overall_status(std::span<int const> pipestatus) noexcept -> int;

// Only the last payload (the last command of the list) is kept.
// Fails when no payload was captured or the last one is malformed.
[[nodiscard]] auto aggregate(std::span<std::string const> payloads) -> core::Result<PipeStatusSummary>;

} // namespace shellrunner::status
