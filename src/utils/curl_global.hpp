#ifndef ISOFETCH_UTILS_CURL_GLOBAL_HPP_
#define ISOFETCH_UTILS_CURL_GLOBAL_HPP_

namespace isofetch {
namespace utils {

// curl_global_init is not thread-safe; every curl user calls this first.
void ensureCurlInitialized();

}  // namespace utils
}  // namespace isofetch

#endif  // ISOFETCH_UTILS_CURL_GLOBAL_HPP_
