#ifndef ISOFETCH_REMOTE_REMOTE_FORWARDER_HPP_
#define ISOFETCH_REMOTE_REMOTE_FORWARDER_HPP_

#include <optional>
#include <string>

#include "Transfer/TransferTypes.hpp"

namespace isofetch {

struct RemoteTarget {
  std::string host;  // may carry "user@"
  std::string path;  // empty = remote login directory

  // "[user@]host:path". nullopt when there is no ':' or the host is empty.
  static std::optional<RemoteTarget> parse(const std::string& text);

  // host:path/filename as understood by scp.
  std::string fileSpec(const std::string& filename) const;
  std::string toString() const;
};

/**
 * @brief Relays a downloaded file to another host.
 *
 * Only forward() is on the transfer path; probe() and prepare() are run once
 * by the front end before workers start.
 */
class RemoteForwarder {
 public:
  virtual ~RemoteForwarder() = default;

  virtual ForwardResult forward(const std::string& localPath,
                                const std::string& filename) = 0;
  // Non-interactive reachability check.
  virtual ForwardResult probe() = 0;
  // Makes sure the destination directory exists.
  virtual ForwardResult prepare() = 0;
  // False for names forward() would refuse. Checked before downloading.
  virtual bool acceptsFilename(const std::string& filename) const {
    return !filename.empty();
  }
  virtual std::string describe() const = 0;
};

}  // namespace isofetch

#endif  // ISOFETCH_REMOTE_REMOTE_FORWARDER_HPP_
