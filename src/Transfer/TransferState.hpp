#ifndef ISOFETCH_TRANSFER_TRANSFER_STATE_HPP_
#define ISOFETCH_TRANSFER_TRANSFER_STATE_HPP_

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "TransferTypes.hpp"

namespace isofetch {

/**
 * @brief Queue and bookkeeping shared by the workers of one manager.
 *
 * Every URL is in exactly one of: queued (including backing off before a
 * retry), active, completed (downloaded or skipped), failed. All transitions
 * and snapshot() go through one mutex, so a snapshot never sees a URL in two
 * places or in none.
 *
 * Local file names are claimed along with URLs: a request whose file name is
 * already being written by another URL stays queued until that transfer ends,
 * and one whose file name was already downloaded in this run is settled as
 * skipped without a transfer.
 */
class TransferState {
 public:
  explicit TransferState(bool isRemote);

  TransferState(const TransferState&) = delete;
  TransferState& operator=(const TransferState&) = delete;

  // False when the URL is already known in any state.
  bool enqueue(const TransferRequest& request);

  // Pops the oldest queued request whose file name is free and marks it
  // active under the same lock. Waits at most `wait`; returns nullopt on
  // timeout or after close().
  std::optional<TransferRequest> claimNext(std::chrono::milliseconds wait);

  void recordProgress(const std::string& url, uint64_t bytesTransferred,
                      uint64_t bytesTotal);
  void recordCompleted(const std::string& url, const std::string& localPath);
  void recordSkipped(const std::string& url);
  void recordForwardFailed(const std::string& url, const std::string& message);
  void recordFailed(const std::string& url, const std::string& message);
  // Active -> backing off. Returns the new failure count for the URL.
  uint32_t recordRetry(const std::string& url, const std::string& message);
  // Backing off -> tail of the queue. No-op for unknown URLs.
  void requeue(const TransferRequest& request);
  // Active -> head of the queue, for a transfer cancelled by stop(). Does not
  // count as an attempt.
  void recordInterrupted(const TransferRequest& request);

  uint32_t retryCount(const std::string& url) const;

  // Wakes claimNext() callers and makes further claims return nullopt.
  void close();
  bool waitUntilIdle(std::chrono::milliseconds timeout) const;

  StatusSnapshot snapshot() const;
  bool isRemote() const { return isRemote_; }

 private:
  bool knownLocked(const std::string& url) const;
  bool idleLocked() const;
  // Settles queued requests whose file name is already downloaded and
  // returns the first one that may be claimed (or queue_.end()).
  std::deque<TransferRequest>::iterator nextClaimableLocked(bool& settled);
  // Removes the URL from active_ and frees its file name.
  std::string releaseLocked(const std::string& url);

  const bool isRemote_;

  mutable std::mutex mutex_;
  std::condition_variable queueCv_;
  mutable std::condition_variable idleCv_;
  bool closed_ = false;

  std::deque<TransferRequest> queue_;
  std::set<std::string> queuedUrls_;
  std::set<std::string> backingOff_;
  std::map<std::string, ActiveTransfer> active_;
  std::set<std::string> activeNames_;
  std::set<std::string> downloadedNames_;
  std::set<std::string> completedUrls_;
  size_t completedCount_ = 0;
  size_t skippedCount_ = 0;
  std::set<std::string> failed_;
  std::map<std::string, uint32_t> retryCounts_;
  std::vector<std::string> downloadedFiles_;
  std::map<std::string, std::string> urlByFile_;
  std::set<std::string> forwardFailed_;
  std::map<std::string, std::string> lastErrors_;
};

}  // namespace isofetch

#endif  // ISOFETCH_TRANSFER_TRANSFER_STATE_HPP_
