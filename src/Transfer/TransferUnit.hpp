#ifndef ISOFETCH_TRANSFER_TRANSFER_UNIT_HPP_
#define ISOFETCH_TRANSFER_TRANSFER_UNIT_HPP_

#include <atomic>
#include <string>

#include "TransferTypes.hpp"

namespace isofetch {

struct TransferOptions {
  // Report Skipped instead of fetching when the destination exists.
  bool skipExisting = true;
  // When set, the transfer stops at the next chunk boundary once it reads
  // true and fails with ErrorKind::Cancelled.
  const std::atomic<bool>* cancelled = nullptr;
};

/**
 * @brief Streams one URL into one local file.
 *
 * Implementations are called concurrently from several workers and must not
 * keep per-transfer state in members. On failure no file is left at
 * destination.
 */
class TransferUnit {
 public:
  virtual ~TransferUnit() = default;

  virtual TransferResult transfer(const std::string& url,
                                  const std::string& destination,
                                  const TransferOptions& options,
                                  const ProgressCallback& progress) = 0;
};

}  // namespace isofetch

#endif  // ISOFETCH_TRANSFER_TRANSFER_UNIT_HPP_
