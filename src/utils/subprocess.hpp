#ifndef ISOFETCH_UTILS_SUBPROCESS_HPP_
#define ISOFETCH_UTILS_SUBPROCESS_HPP_

#include <string>
#include <vector>

namespace isofetch {
namespace utils {

struct ProcessResult {
  int exitCode = -1;   // 127 when the program could not be executed
  std::string output;  // stdout and stderr, interleaved
};

// Runs argv[0] (PATH lookup) without a shell and waits for it.
// Throws std::system_error if the process cannot be spawned.
ProcessResult runProcess(const std::vector<std::string>& argv);

std::string joinCommand(const std::vector<std::string>& argv);

}  // namespace utils
}  // namespace isofetch

#endif  // ISOFETCH_UTILS_SUBPROCESS_HPP_
