#include <gflags/gflags.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "Catalog/CatalogEntries.hpp"
#include "Console/StatusRenderer.hpp"
#include "Remote/ScpForwarder.hpp"
#include "Transfer/CurlTransfer.hpp"
#include "Transfer/TransferManager.hpp"
#include "config/flags.hpp"
#include "utils/logger.hpp"
#include "utils/timer.hpp"

namespace {

std::atomic<bool> interrupted{false};

void onSignal(int) { interrupted = true; }

std::vector<isofetch::CatalogEntry> collectEntries(int argc, char* argv[]) {
  std::vector<isofetch::CatalogEntry> entries;
  if (!FLAGS_url_file.empty()) {
    entries = isofetch::loadCatalogFile(FLAGS_url_file);
  }
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (!isofetch::looksLikeUrl(arg)) {
      LOG(WARN) << "Ignoring argument that is not a URL: " << arg;
      continue;
    }
    entries.push_back(
        isofetch::CatalogEntry{isofetch::filenameFromUrl(arg), arg});
  }
  return entries;
}

std::shared_ptr<isofetch::ScpForwarder> makeForwarder() {
  auto target = isofetch::remoteTargetFromFlags();
  if (!target) return nullptr;

  auto forwarder = std::make_shared<isofetch::ScpForwarder>(*target);
  LOG(INFO) << "Testing SSH connection to " << target->host << "...";
  auto probe = forwarder->probe();
  if (!probe) {
    throw std::runtime_error("SSH connection to " + target->host +
                             " failed: " + probe.error().diagnostic);
  }
  auto prepared = forwarder->prepare();
  if (!prepared) {
    LOG(WARN) << "Could not create remote directory " << target->path << ": "
              << prepared.error().diagnostic;
  }
  return forwarder;
}

}  // namespace

int main(int argc, char* argv[]) {
  gflags::SetUsageMessage(
      "isofetch [--target_dir=DIR | --remote=host:path] [--url_file=FILE] "
      "URL...");
  gflags::ParseCommandLineFlags(&argc, &argv, true);

  isofetch::utils::Logger::initialize(isofetch::logConfigFromFlags());

  try {
    const auto entries = collectEntries(argc, argv);
    if (entries.empty()) {
      std::cout << "No ISOs selected, exiting." << std::endl;
      return 0;
    }

    auto forwarder = makeForwarder();
    const std::string remote_target = forwarder ? forwarder->describe() : "";

    auto transfer = std::make_shared<isofetch::CurlTransfer>(
        isofetch::curlOptionsFromFlags());
    isofetch::TransferManager manager(isofetch::configFromFlags(), transfer,
                                      forwarder);
    manager.start();

    size_t accepted = 0;
    for (const auto& entry : entries) {
      if (manager.submit(entry.toRequest())) {
        LOG(INFO) << "Queued " << entry.displayName;
        ++accepted;
      }
    }

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    // Redraw only while something is moving.
    isofetch::StatusRenderer renderer(std::cout);
    isofetch::utils::Timer render_timer;
    const auto interval = std::chrono::milliseconds(FLAGS_status_interval_ms);
    render_timer.addPeriodicTask(interval, interval, [&manager, &renderer,
                                                      accepted]() {
      const auto status = manager.snapshot();
      if (!status.active.empty()) renderer.redraw(status, accepted);
    });
    render_timer.start();

    while (!manager.waitUntilIdle(interval)) {
      if (interrupted) {
        LOG(WARN) << "Interrupted, waiting for in-flight downloads to stop";
        break;
      }
    }
    render_timer.stop();
    manager.stop();

    const auto status = manager.snapshot();
    std::cout << renderer.buildSummary(status, remote_target);
    if (!status.isRemote && status.completed > 0) {
      std::cout << "Files saved in " << manager.destinationDir() << std::endl;
    }
    const int code = status.failed == 0 && !interrupted ? 0 : 1;
    if (manager.abandonedWorkers() > 0) {
      // A detached worker may still be inside libcurl or the logger, so skip
      // curl_global_cleanup and the static destructors.
      LOG(WARN) << manager.abandonedWorkers()
                << " download worker(s) still running at exit";
      isofetch::utils::Logger::shutdown();
      std::cout.flush();
      std::quick_exit(1);
    }
    isofetch::utils::Logger::shutdown();
    return code;
  } catch (const std::exception& ex) {
    LOG(FATAL) << ex.what();
    isofetch::utils::Logger::shutdown();
    return 1;
  }
}
