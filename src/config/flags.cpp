#include "flags.hpp"

#include <chrono>
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>

DEFINE_string(target_dir, ".", "Local directory that receives downloads");
DEFINE_string(remote, "",
              "Relay downloads to [user@]host:path with scp instead of "
              "keeping them locally");
DEFINE_string(staging_dir, "",
              "Where remote-mode downloads are staged (default: <tmp>/isofetch)");
DEFINE_int32(max_workers, 3,
             "Number of download workers (0 for TBB default concurrency)");
DEFINE_int32(max_retries, 3, "Retries per URL for transient failures");
DEFINE_int64(backoff_base_ms, 1000,
             "Backoff base; retry n waits base * 2^n milliseconds");
DEFINE_int64(stop_timeout_ms, 1000,
             "How long stop() waits for each worker before abandoning it");
DEFINE_int32(connect_timeout_s, 30, "Connection timeout in seconds");
DEFINE_int32(stall_timeout_s, 30,
             "Abort a transfer that receives nothing for this many seconds");
DEFINE_string(url_file, "",
              "File with one 'Name: URL' entry or bare URL per line");
DEFINE_int64(status_interval_ms, 500, "Progress rendering interval");
DEFINE_string(log_dir, "logs", "Directory for isofetch.log");
DEFINE_string(log_level, "INFO", "DEBUG, INFO, WARN, ERROR or FATAL");
DEFINE_bool(log_to_file, true, "Write log lines to --log_dir as well");

namespace {

bool ValidateNonNegative32(const char* flagname, int32_t value) {
  if (value >= 0) return true;
  std::cerr << "--" << flagname << " must be >= 0, got " << value << std::endl;
  return false;
}

bool ValidatePositive32(const char* flagname, int32_t value) {
  if (value > 0) return true;
  std::cerr << "--" << flagname << " must be > 0, got " << value << std::endl;
  return false;
}

bool ValidateNonNegative64(const char* flagname, int64_t value) {
  if (value >= 0) return true;
  std::cerr << "--" << flagname << " must be >= 0, got " << value << std::endl;
  return false;
}

bool ValidatePositive64(const char* flagname, int64_t value) {
  if (value > 0) return true;
  std::cerr << "--" << flagname << " must be > 0, got " << value << std::endl;
  return false;
}

bool ValidateLogLevel(const char* flagname, const std::string& value) {
  if (isofetch::utils::parseLogLevel(value)) return true;
  std::cerr << "--" << flagname << ": unknown log level '" << value << "'"
            << std::endl;
  return false;
}

bool ValidateRemote(const char* flagname, const std::string& value) {
  if (value.empty() || isofetch::RemoteTarget::parse(value)) return true;
  std::cerr << "--" << flagname << " must look like [user@]host:path, got '"
            << value << "'" << std::endl;
  return false;
}

}  // namespace

DEFINE_validator(max_workers, &ValidateNonNegative32);
DEFINE_validator(max_retries, &ValidateNonNegative32);
DEFINE_validator(backoff_base_ms, &ValidateNonNegative64);
DEFINE_validator(stop_timeout_ms, &ValidateNonNegative64);
DEFINE_validator(connect_timeout_s, &ValidatePositive32);
DEFINE_validator(stall_timeout_s, &ValidatePositive32);
DEFINE_validator(status_interval_ms, &ValidatePositive64);
DEFINE_validator(log_level, &ValidateLogLevel);
DEFINE_validator(remote, &ValidateRemote);

namespace isofetch {

TransferManagerConfig configFromFlags() {
  TransferManagerConfig config;
  config.maxWorkers = static_cast<uint32_t>(FLAGS_max_workers);
  config.maxRetries = static_cast<uint32_t>(FLAGS_max_retries);
  config.backoffBase = std::chrono::milliseconds(FLAGS_backoff_base_ms);
  config.stopTimeout = std::chrono::milliseconds(FLAGS_stop_timeout_ms);
  config.targetDir = FLAGS_target_dir;
  config.stagingDir = FLAGS_staging_dir;
  return config;
}

CurlTransfer::Options curlOptionsFromFlags() {
  CurlTransfer::Options options;
  options.connectTimeoutSeconds = FLAGS_connect_timeout_s;
  options.stallTimeoutSeconds = FLAGS_stall_timeout_s;
  return options;
}

utils::LogConfig logConfigFromFlags() {
  utils::LogConfig config;
  config.logDir = FLAGS_log_dir;
  config.toFile = FLAGS_log_to_file;
  if (auto level = utils::parseLogLevel(FLAGS_log_level)) {
    config.minLevel = *level;
  }
  return config;
}

std::optional<RemoteTarget> remoteTargetFromFlags() {
  if (FLAGS_remote.empty()) return std::nullopt;
  auto target = RemoteTarget::parse(FLAGS_remote);
  if (!target) {
    throw std::invalid_argument("Invalid --remote value: " + FLAGS_remote);
  }
  return target;
}

}  // namespace isofetch
