#include "shellrunner/status/aggregator.hpp"

#include <algorithm>
#include <expected>
#include <ranges>
#include <utility>

#include "shellrunner/status/report.hpp"

namespace shellrunner::status {

auto overall_status(std::span<int const> pipestatus) noexcept -> int {
  if (pipestatus.empty()) {
    return 0;
  }
  auto reversed = pipestatus | std::views::reverse;
  auto failing  = std::ranges::find_if(reversed, [](int s) { return s != 0; });
  if (failing == reversed.end()) {
    return pipestatus.back();
  }
  return *failing;
}

auto aggregate(std::span<std::string const> payloads) -> core::Result<PipeStatusSummary> {
  if (payloads.empty()) {
    return std::unexpected("Failed to capture an exit status: the shell never completed a status report");
  }

  auto pipestatus = parse_payload(payloads.back());
  if (!pipestatus) {
    return std::unexpected(std::move(pipestatus.error()));
  }

  PipeStatusSummary summary;
  summary.status_     = overall_status(*pipestatus);
  summary.pipestatus_ = std::move(*pipestatus);
  return summary;
}

} // namespace shellrunner::status
