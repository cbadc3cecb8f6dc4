#ifndef ISOFETCH_TRANSFER_CURL_TRANSFER_HPP_
#define ISOFETCH_TRANSFER_CURL_TRANSFER_HPP_

#include <curl/curl.h>

#include <cstddef>
#include <string>

#include "TransferUnit.hpp"

namespace isofetch {

/**
 * @brief TransferUnit backed by a libcurl easy handle per call.
 *
 * The body is written in fixed-size chunks to a partial file unique to the
 * call ("<destination>.<pid>-<seq>.part") and renamed into place once
 * complete, so an interrupted download never shows up under the final name.
 */
class CurlTransfer final : public TransferUnit {
 public:
  struct Options {
    long connectTimeoutSeconds = 30;
    // Abort when fewer than 1 byte/s arrives for this long.
    long stallTimeoutSeconds = 30;
    size_t chunkSize = 64 * 1024;
    std::string userAgent = "isofetch/1.0";
  };

  CurlTransfer();
  explicit CurlTransfer(Options options);

  TransferResult transfer(const std::string& url,
                          const std::string& destination,
                          const TransferOptions& options,
                          const ProgressCallback& progress) override;

  static constexpr size_t kMinChunkSize = 8 * 1024;

 private:
  Options options_;
};

// Maps a failed curl_easy_perform (and the HTTP status, if any) to an error.
TransferError classifyCurlFailure(CURLcode code, long httpStatus,
                                  const std::string& detail);

}  // namespace isofetch

#endif  // ISOFETCH_TRANSFER_CURL_TRANSFER_HPP_
