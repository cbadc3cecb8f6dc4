#include "RetryPolicy.hpp"

#include <algorithm>
#include <limits>

namespace isofetch {

namespace {
// 2^30 base units is already decades at one second.
constexpr uint32_t kMaxShift = 30;
}  // namespace

RetryPolicy::RetryPolicy()
    : RetryPolicy(kDefaultMaxRetries, std::chrono::seconds(1)) {}

RetryPolicy::RetryPolicy(uint32_t maxRetries,
                         std::chrono::milliseconds baseDelay)
    : maxRetries_(maxRetries),
      baseDelay_(std::max(baseDelay, std::chrono::milliseconds(0))) {}

RetryDecision RetryPolicy::shouldRetry(uint32_t attempt,
                                       const TransferError& error) const {
  if (!error.retryable() || attempt >= maxRetries_) {
    return RetryDecision::giveUp();
  }

  const uint64_t factor = uint64_t{1} << std::min(attempt, kMaxShift);
  const auto base = static_cast<uint64_t>(baseDelay_.count());
  const uint64_t limit =
      static_cast<uint64_t>(std::numeric_limits<std::chrono::milliseconds::rep>::max());
  const uint64_t delay = base > limit / factor ? limit : base * factor;
  return RetryDecision::retryAfter(std::chrono::milliseconds(
      static_cast<std::chrono::milliseconds::rep>(delay)));
}

}  // namespace isofetch
