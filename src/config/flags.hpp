#ifndef ISOFETCH_CONFIG_FLAGS_HPP_
#define ISOFETCH_CONFIG_FLAGS_HPP_

#include <gflags/gflags.h>

#include <optional>

#include "Remote/RemoteForwarder.hpp"
#include "Transfer/CurlTransfer.hpp"
#include "Transfer/TransferManager.hpp"
#include "logger.hpp"

DECLARE_string(target_dir);
DECLARE_string(remote);
DECLARE_string(staging_dir);
DECLARE_int32(max_workers);
DECLARE_int32(max_retries);
DECLARE_int64(backoff_base_ms);
DECLARE_int64(stop_timeout_ms);
DECLARE_int32(connect_timeout_s);
DECLARE_int32(stall_timeout_s);
DECLARE_string(url_file);
DECLARE_int64(status_interval_ms);
DECLARE_string(log_dir);
DECLARE_string(log_level);
DECLARE_bool(log_to_file);

namespace isofetch {

// Snapshot of the parsed flags. Validators have already rejected bad values.
TransferManagerConfig configFromFlags();
CurlTransfer::Options curlOptionsFromFlags();
utils::LogConfig logConfigFromFlags();
// Parsed --remote, nullopt in local mode. Throws std::invalid_argument when
// the flag is set but is not "[user@]host:path".
std::optional<RemoteTarget> remoteTargetFromFlags();

}  // namespace isofetch

#endif  // ISOFETCH_CONFIG_FLAGS_HPP_
