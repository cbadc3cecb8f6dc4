#ifndef ISOFETCH_CONSOLE_STATUS_RENDERER_HPP_
#define ISOFETCH_CONSOLE_STATUS_RENDERER_HPP_

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>

#include "Transfer/TransferTypes.hpp"

namespace isofetch {

std::string formatSize(uint64_t bytes);

/**
 * @brief Text views of a StatusSnapshot for the terminal front end.
 */
class StatusRenderer {
 public:
  explicit StatusRenderer(std::ostream& out, size_t barWidth = 30);

  // Multi-line panel: counters, then one line per active transfer.
  std::string buildPanel(const StatusSnapshot& status, size_t total) const;
  std::string formatActiveLine(const ActiveTransfer& transfer) const;
  // Replaces the previously drawn panel in place (ANSI cursor movement).
  void redraw(const StatusSnapshot& status, size_t total);
  // Final report; `remoteTarget` is only used in remote mode.
  std::string buildSummary(const StatusSnapshot& status,
                           const std::string& remoteTarget) const;

 private:
  std::ostream& out_;
  size_t barWidth_;
  size_t previousLines_ = 0;
};

}  // namespace isofetch

#endif  // ISOFETCH_CONSOLE_STATUS_RENDERER_HPP_
