#ifndef ISOFETCH_TRANSFER_TRANSFER_TYPES_HPP_
#define ISOFETCH_TRANSFER_TRANSFER_TYPES_HPP_

#include <cstdint>
#include <functional>
#include <map>
#include <set>
#include <string>
#include <vector>

#include "result.hpp"

namespace isofetch {

struct TransferRequest {
  std::string url;
  // Overrides the file name derived from the URL when non-empty.
  std::string destinationHint;
};

// Final path segment of the URL, query and fragment stripped. Empty when the
// URL names no file (e.g. "https://host/").
std::string filenameFromUrl(const std::string& url);
// destinationHint when set, otherwise filenameFromUrl(url).
std::string resolveFilename(const TransferRequest& request);

struct ActiveTransfer {
  std::string url;
  std::string filename;
  uint64_t bytesTransferred = 0;
  uint64_t bytesTotal = 0;  // 0 = unknown
};

enum class ErrorKind {
  Network,       // connect/reset/DNS/TLS failures
  Timeout,       // connect or stall timeout, HTTP 408
  HttpServer,    // 5xx, 429
  HttpClient,    // remaining 4xx
  Truncated,     // body shorter than announced
  MalformedUrl,  // unparsable URL, unsupported scheme, no file name
  Filesystem,    // cannot create/write/rename the destination
  Cancelled,     // aborted by stop()
};

const char* errorKindName(ErrorKind kind);

struct TransferError {
  ErrorKind kind = ErrorKind::Network;
  std::string message;
  long httpStatus = 0;

  bool retryable() const;
  std::string describe() const;
};

enum class TransferOutcome { Downloaded, Skipped };

struct TransferSuccess {
  TransferOutcome outcome = TransferOutcome::Downloaded;
  uint64_t bytesWritten = 0;
};

using TransferResult = utils::Result<TransferSuccess, TransferError>;

struct ForwardError {
  std::string target;  // host:path/filename
  int exitCode = -1;
  std::string diagnostic;
};

using ForwardResult = utils::Result<utils::Ok, ForwardError>;

// (bytesTransferred, bytesTotal) after each chunk reaches the destination.
using ProgressCallback = std::function<void(uint64_t, uint64_t)>;

/**
 * @brief Point-in-time copy of the manager state. Owns every container.
 */
struct StatusSnapshot {
  std::map<std::string, ActiveTransfer> active;
  size_t completed = 0;
  std::set<std::string> completedUrls;
  size_t failed = 0;
  std::set<std::string> failedUrls;
  std::map<std::string, uint32_t> retryCounts;
  size_t queued = 0;
  size_t skipped = 0;
  std::vector<std::string> downloadedFiles;
  // downloadedFiles entry -> the URL it came from
  std::map<std::string, std::string> urlByFile;
  std::set<std::string> forwardFailed;
  std::map<std::string, std::string> lastErrors;
  bool isRemote = false;

  bool idle() const { return active.empty() && queued == 0; }
};

}  // namespace isofetch

#endif  // ISOFETCH_TRANSFER_TRANSFER_TYPES_HPP_
