#include "CurlTransfer.hpp"

#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <memory>
#include <utility>
#include <vector>

#include "curl_global.hpp"
#include "logger.hpp"

namespace isofetch {

namespace {

struct FileDeleter {
  void operator()(FILE* fp) const noexcept {
    if (fp) {
      std::fclose(fp);
    }
  }
};

using FilePtr = std::unique_ptr<FILE, FileDeleter>;
using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

struct WriteContext {
  CURL* curl = nullptr;
  FILE* file = nullptr;
  std::vector<char> buffer;
  size_t chunkSize = 0;
  uint64_t written = 0;
  uint64_t total = 0;
  const ProgressCallback* progress = nullptr;
  int writeErrno = 0;
};

bool flushChunk(WriteContext& ctx) {
  if (ctx.buffer.empty()) return true;
  errno = 0;
  const size_t n = std::fwrite(ctx.buffer.data(), 1, ctx.buffer.size(), ctx.file);
  if (n != ctx.buffer.size()) {
    ctx.writeErrno = errno != 0 ? errno : EIO;
    return false;
  }
  ctx.written += n;
  ctx.buffer.clear();
  if (ctx.progress && *ctx.progress) {
    (*ctx.progress)(ctx.written, ctx.total);
  }
  return true;
}

size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* ctx = static_cast<WriteContext*>(userdata);
  const size_t total = size * nmemb;
  if (!ctx || !ctx->file) {
    return 0;
  }

  if (ctx->total == 0) {
    curl_off_t length = -1;
    if (curl_easy_getinfo(ctx->curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T,
                          &length) == CURLE_OK &&
        length > 0) {
      ctx->total = static_cast<uint64_t>(length);
    }
  }

  size_t offset = 0;
  while (offset < total) {
    const size_t room = ctx->chunkSize - ctx->buffer.size();
    const size_t take = std::min(room, total - offset);
    ctx->buffer.insert(ctx->buffer.end(), ptr + offset, ptr + offset + take);
    offset += take;
    if (ctx->buffer.size() == ctx->chunkSize && !flushChunk(*ctx)) {
      return 0;  // CURLE_WRITE_ERROR
    }
  }
  return total;
}

int xferInfoCallback(void* userdata, curl_off_t, curl_off_t, curl_off_t,
                     curl_off_t) {
  const auto* cancelled = static_cast<const std::atomic<bool>*>(userdata);
  return cancelled->load() ? 1 : 0;
}

// Unique per transfer so that two writers never share one partial file.
std::string partPathFor(const std::string& destination) {
  static std::atomic<uint64_t> sequence{0};
  return destination + "." + std::to_string(::getpid()) + "-" +
         std::to_string(++sequence) + ".part";
}

bool isHttpScheme(const std::string& url) {
  return url.rfind("http://", 0) == 0 || url.rfind("https://", 0) == 0;
}

void removeQuietly(const std::filesystem::path& path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
  if (ec) {
    LOG(WARN) << "Could not remove partial file " << path.string() << ": "
              << ec.message();
  }
}

}  // namespace

TransferError classifyCurlFailure(CURLcode code, long httpStatus,
                                  const std::string& detail) {
  TransferError error;
  error.httpStatus = httpStatus;
  error.message = detail.empty() ? curl_easy_strerror(code) : detail;

  switch (code) {
    case CURLE_HTTP_RETURNED_ERROR:
      if (httpStatus == 408) {
        error.kind = ErrorKind::Timeout;
      } else if (httpStatus == 429 || httpStatus >= 500) {
        error.kind = ErrorKind::HttpServer;
      } else if (httpStatus >= 400) {
        error.kind = ErrorKind::HttpClient;
      } else {
        error.kind = ErrorKind::Network;
      }
      break;
    case CURLE_OPERATION_TIMEDOUT:
      error.kind = ErrorKind::Timeout;
      break;
    case CURLE_PARTIAL_FILE:
      error.kind = ErrorKind::Truncated;
      break;
    case CURLE_URL_MALFORMAT:
    case CURLE_UNSUPPORTED_PROTOCOL:
      error.kind = ErrorKind::MalformedUrl;
      break;
    case CURLE_WRITE_ERROR:
      error.kind = ErrorKind::Filesystem;
      break;
    case CURLE_ABORTED_BY_CALLBACK:
      error.kind = ErrorKind::Cancelled;
      break;
    case CURLE_FILE_COULDNT_READ_FILE:
    case CURLE_REMOTE_FILE_NOT_FOUND:
    case CURLE_REMOTE_ACCESS_DENIED:
    case CURLE_LOGIN_DENIED:
    case CURLE_TOO_MANY_REDIRECTS:
      error.kind = ErrorKind::HttpClient;
      break;
    default:
      // Resolve/connect/send/recv/TLS and anything unknown: worth another try.
      error.kind = ErrorKind::Network;
      break;
  }
  return error;
}

CurlTransfer::CurlTransfer() : CurlTransfer(Options()) {}

CurlTransfer::CurlTransfer(Options options) : options_(std::move(options)) {
  options_.chunkSize = std::max(options_.chunkSize, kMinChunkSize);
  utils::ensureCurlInitialized();
}

TransferResult CurlTransfer::transfer(const std::string& url,
                                      const std::string& destination,
                                      const TransferOptions& options,
                                      const ProgressCallback& progress) {
  namespace fs = std::filesystem;

  if (url.empty()) {
    return utils::makeUnexpected(
        TransferError{ErrorKind::MalformedUrl, "empty URL", 0});
  }

  const fs::path final_path(destination);
  std::error_code ec;
  if (options.skipExisting && fs::exists(final_path, ec)) {
    LOG(INFO) << "Skipping " << final_path.filename().string()
              << ", already exists.";
    return TransferSuccess{TransferOutcome::Skipped, 0};
  }

  const fs::path part_path = partPathFor(final_path.string());
  FilePtr file(std::fopen(part_path.c_str(), "wb"));
  if (!file) {
    return utils::makeUnexpected(TransferError{
        ErrorKind::Filesystem,
        "cannot create " + part_path.string() + ": " + std::strerror(errno),
        0});
  }

  CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
  if (!curl) {
    file.reset();
    removeQuietly(part_path);
    return utils::makeUnexpected(
        TransferError{ErrorKind::Network, "failed to allocate curl handle", 0});
  }

  WriteContext ctx;
  ctx.curl = curl.get();
  ctx.file = file.get();
  ctx.chunkSize = options_.chunkSize;
  ctx.buffer.reserve(options_.chunkSize);
  ctx.progress = &progress;

  char error_buffer[CURL_ERROR_SIZE] = {0};
  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &writeCallback);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ctx);
  curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);
  curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, 10L);
  curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
  if (options.cancelled) {
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, &xferInfoCallback);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA,
                     const_cast<std::atomic<bool>*>(options.cancelled));
  } else {
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 1L);
  }
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_BUFFERSIZE,
                   static_cast<long>(std::min<size_t>(options_.chunkSize,
                                                      CURL_MAX_READ_SIZE)));
  curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT,
                   options_.connectTimeoutSeconds);
  curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_LIMIT, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_TIME,
                   options_.stallTimeoutSeconds);
  curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, options_.userAgent.c_str());

  LOG(DEBUG) << "GET " << url << " -> " << part_path.string();
  const CURLcode res = curl_easy_perform(curl.get());

  long http_status = 0;
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_status);

  auto fail = [&](TransferError error) -> TransferResult {
    file.reset();
    removeQuietly(part_path);
    return utils::makeUnexpected(std::move(error));
  };

  if (res != CURLE_OK) {
    if (res == CURLE_WRITE_ERROR && ctx.writeErrno != 0) {
      return fail(TransferError{ErrorKind::Filesystem,
                                "write to " + part_path.string() +
                                    " failed: " + std::strerror(ctx.writeErrno),
                                http_status});
    }
    return fail(classifyCurlFailure(res, http_status, error_buffer));
  }
  if (isHttpScheme(url) && (http_status < 200 || http_status >= 300)) {
    return fail(TransferError{ErrorKind::HttpClient,
                              "unexpected HTTP status", http_status});
  }

  if (!flushChunk(ctx)) {
    return fail(TransferError{ErrorKind::Filesystem,
                              "write to " + part_path.string() +
                                  " failed: " + std::strerror(ctx.writeErrno),
                              http_status});
  }
  if (ctx.total > 0 && ctx.written != ctx.total) {
    return fail(TransferError{ErrorKind::Truncated,
                              "received " + std::to_string(ctx.written) +
                                  " of " + std::to_string(ctx.total) + " bytes",
                              http_status});
  }

  FILE* raw = file.release();
  if (std::fclose(raw) != 0) {
    const int err = errno;
    removeQuietly(part_path);
    return utils::makeUnexpected(TransferError{
        ErrorKind::Filesystem,
        "closing " + part_path.string() + " failed: " + std::strerror(err),
        http_status});
  }

  fs::rename(part_path, final_path, ec);
  if (ec) {
    removeQuietly(part_path);
    return utils::makeUnexpected(TransferError{
        ErrorKind::Filesystem,
        "rename to " + final_path.string() + " failed: " + ec.message(),
        http_status});
  }

  if (ctx.total == 0 && progress) {
    // Size was never announced; report the final count once.
    progress(ctx.written, ctx.written);
  }
  return TransferSuccess{TransferOutcome::Downloaded, ctx.written};
}

}  // namespace isofetch
