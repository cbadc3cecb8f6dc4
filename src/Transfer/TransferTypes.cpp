#include "TransferTypes.hpp"

#include <sstream>

namespace isofetch {

std::string filenameFromUrl(const std::string& url) {
  std::string path = url.substr(0, url.find_first_of("?#"));
  const auto scheme = path.find("://");
  if (scheme != std::string::npos) {
    const auto path_start = path.find('/', scheme + 3);
    if (path_start == std::string::npos) return "";
    path = path.substr(path_start);
  }
  const auto slash = path.find_last_of('/');
  std::string name =
      slash == std::string::npos ? path : path.substr(slash + 1);
  if (name == "." || name == "..") return "";
  return name;
}

std::string resolveFilename(const TransferRequest& request) {
  if (!request.destinationHint.empty()) return request.destinationHint;
  return filenameFromUrl(request.url);
}

const char* errorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::Network:
      return "network";
    case ErrorKind::Timeout:
      return "timeout";
    case ErrorKind::HttpServer:
      return "http-server";
    case ErrorKind::HttpClient:
      return "http-client";
    case ErrorKind::Truncated:
      return "truncated";
    case ErrorKind::MalformedUrl:
      return "malformed-url";
    case ErrorKind::Filesystem:
      return "filesystem";
    case ErrorKind::Cancelled:
      return "cancelled";
  }
  return "unknown";
}

bool TransferError::retryable() const {
  switch (kind) {
    case ErrorKind::Network:
    case ErrorKind::Timeout:
    case ErrorKind::HttpServer:
    case ErrorKind::Truncated:
      return true;
    case ErrorKind::HttpClient:
    case ErrorKind::MalformedUrl:
    case ErrorKind::Filesystem:
    case ErrorKind::Cancelled:
      return false;
  }
  return false;
}

std::string TransferError::describe() const {
  std::ostringstream oss;
  oss << errorKindName(kind);
  if (httpStatus != 0) oss << " (HTTP " << httpStatus << ")";
  if (!message.empty()) oss << ": " << message;
  return oss.str();
}

}  // namespace isofetch
