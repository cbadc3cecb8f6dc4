#include "RemoteForwarder.hpp"

namespace isofetch {

std::optional<RemoteTarget> RemoteTarget::parse(const std::string& text) {
  const auto colon = text.find(':');
  if (colon == std::string::npos || colon == 0) return std::nullopt;

  RemoteTarget target;
  target.host = text.substr(0, colon);
  // "./dir:x" or "/mnt/a:b" are local paths, not hosts.
  if (target.host.find('/') != std::string::npos) return std::nullopt;

  target.path = text.substr(colon + 1);
  while (target.path.size() > 1 && target.path.back() == '/') {
    target.path.pop_back();
  }
  return target;
}

std::string RemoteTarget::fileSpec(const std::string& filename) const {
  if (path.empty()) return host + ":" + filename;
  if (path == "/") return host + ":/" + filename;
  return host + ":" + path + "/" + filename;
}

std::string RemoteTarget::toString() const { return host + ":" + path; }

}  // namespace isofetch
