#include "StatusRenderer.hpp"

#include <algorithm>
#include <filesystem>
#include <iomanip>
#include <sstream>

namespace isofetch {

namespace {
constexpr size_t kNameWidth = 24;
}  // namespace

std::string formatSize(uint64_t bytes) {
  constexpr double KB = 1024.0;
  constexpr double MB = KB * 1024.0;
  constexpr double GB = MB * 1024.0;

  const double value = static_cast<double>(bytes);
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(1);
  if (bytes >= static_cast<uint64_t>(GB)) {
    oss << value / GB << " GB";
  } else if (bytes >= static_cast<uint64_t>(MB)) {
    oss << value / MB << " MB";
  } else if (bytes >= static_cast<uint64_t>(KB)) {
    oss << value / KB << " KB";
  } else {
    oss << bytes << " B";
  }
  return oss.str();
}

StatusRenderer::StatusRenderer(std::ostream& out, size_t barWidth)
    : out_(out), barWidth_(std::max<size_t>(barWidth, 1)) {}

std::string StatusRenderer::formatActiveLine(
    const ActiveTransfer& transfer) const {
  std::string name = transfer.filename.empty() ? "(unnamed)" : transfer.filename;
  if (name.size() > kNameWidth) name = name.substr(0, kNameWidth);

  std::ostringstream line;
  line << std::left << std::setw(static_cast<int>(kNameWidth)) << name << " ";
  if (transfer.bytesTotal == 0) {
    if (transfer.bytesTransferred == 0) {
      line << "Starting...";
    } else {
      line << "[" << formatSize(transfer.bytesTransferred) << "]";
    }
    return line.str();
  }

  const double ratio =
      std::min(1.0, static_cast<double>(transfer.bytesTransferred) /
                        static_cast<double>(transfer.bytesTotal));
  const auto filled = static_cast<size_t>(ratio * static_cast<double>(barWidth_));
  std::string bar;
  for (size_t i = 0; i < barWidth_; ++i) {
    bar += i < filled ? "#" : ".";
  }
  line << "[" << bar << "] " << std::right << std::setw(3)
       << static_cast<int>(ratio * 100.0) << "% ("
       << formatSize(transfer.bytesTransferred) << "/"
       << formatSize(transfer.bytesTotal) << ")";
  return line.str();
}

std::string StatusRenderer::buildPanel(const StatusSnapshot& status,
                                       size_t total) const {
  std::ostringstream panel;
  panel << "Total: " << total << " | Done: " << status.completed;
  if (status.skipped > 0) panel << " | Skipped: " << status.skipped;
  if (status.queued > 0) panel << " | Queued: " << status.queued;
  if (status.failed > 0) panel << " | Failed: " << status.failed;
  panel << "\n";
  for (const auto& entry : status.active) {
    panel << "  " << formatActiveLine(entry.second);
    auto retry = status.retryCounts.find(entry.first);
    if (retry != status.retryCounts.end()) {
      panel << "  (retry " << retry->second << ")";
    }
    panel << "\n";
  }
  return panel.str();
}

void StatusRenderer::redraw(const StatusSnapshot& status, size_t total) {
  const std::string panel = buildPanel(status, total);
  if (previousLines_ > 0) {
    out_ << "\033[" << previousLines_ << "F\033[J";
  }
  out_ << panel << std::flush;
  previousLines_ =
      static_cast<size_t>(std::count(panel.begin(), panel.end(), '\n'));
}

std::string StatusRenderer::buildSummary(
    const StatusSnapshot& status, const std::string& remoteTarget) const {
  std::ostringstream summary;
  summary << "Completed: " << status.completed
          << ", skipped: " << status.skipped << ", failed: " << status.failed
          << "\n";

  for (const auto& path : status.downloadedFiles) {
    if (status.isRemote) {
      const std::string name = std::filesystem::path(path).filename().string();
      auto url = status.urlByFile.find(path);
      const bool relay_failed = url != status.urlByFile.end() &&
                                status.forwardFailed.count(url->second) > 0;
      if (relay_failed) {
        summary << "  " << name << ": relay to " << remoteTarget
                << " failed, kept at " << path << "\n";
      } else {
        summary << "  " << name << ": relayed to " << remoteTarget << "\n";
      }
    } else {
      std::error_code ec;
      const auto size = std::filesystem::file_size(path, ec);
      summary << "  " << path;
      if (!ec) summary << " (" << formatSize(size) << ")";
      summary << "\n";
    }
  }

  for (const auto& url : status.failedUrls) {
    summary << "  FAILED " << url;
    auto err = status.lastErrors.find(url);
    if (err != status.lastErrors.end()) summary << ": " << err->second;
    summary << "\n";
  }
  return summary.str();
}

}  // namespace isofetch
