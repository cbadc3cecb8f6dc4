#ifndef ISOFETCH_TRANSFER_RETRY_POLICY_HPP_
#define ISOFETCH_TRANSFER_RETRY_POLICY_HPP_

#include <chrono>
#include <cstdint>

#include "TransferTypes.hpp"

namespace isofetch {

struct RetryDecision {
  bool retry = false;
  std::chrono::milliseconds delay{0};

  static RetryDecision giveUp() { return RetryDecision{}; }
  static RetryDecision retryAfter(std::chrono::milliseconds delay) {
    return RetryDecision{true, delay};
  }
};

/**
 * @brief Exponential backoff: base * 2^attempt while attempt < maxRetries.
 *
 * attempt is the number of failures already recorded for the URL before the
 * current one, so a URL is tried at most maxRetries + 1 times.
 */
class RetryPolicy {
 public:
  static constexpr uint32_t kDefaultMaxRetries = 3;

  RetryPolicy();
  RetryPolicy(uint32_t maxRetries, std::chrono::milliseconds baseDelay);

  RetryDecision shouldRetry(uint32_t attempt, const TransferError& error) const;

  uint32_t maxRetries() const { return maxRetries_; }
  std::chrono::milliseconds baseDelay() const { return baseDelay_; }

 private:
  uint32_t maxRetries_;
  std::chrono::milliseconds baseDelay_;
};

}  // namespace isofetch

#endif  // ISOFETCH_TRANSFER_RETRY_POLICY_HPP_
