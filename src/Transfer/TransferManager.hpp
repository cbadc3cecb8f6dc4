#ifndef ISOFETCH_TRANSFER_TRANSFER_MANAGER_HPP_
#define ISOFETCH_TRANSFER_TRANSFER_MANAGER_HPP_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "Remote/RemoteForwarder.hpp"
#include "RetryPolicy.hpp"
#include "TransferState.hpp"
#include "TransferTypes.hpp"
#include "TransferUnit.hpp"
#include "timer.hpp"

namespace isofetch {

struct TransferManagerConfig {
  // 0 = tbb::info::default_concurrency()
  uint32_t maxWorkers = 3;
  uint32_t maxRetries = RetryPolicy::kDefaultMaxRetries;
  std::chrono::milliseconds backoffBase{1000};
  // How long an idle worker blocks on the queue before re-checking stop().
  std::chrono::milliseconds dequeueWait{500};
  // Per-worker join timeout in stop(); laggards are detached.
  std::chrono::milliseconds stopTimeout{1000};
  // Local destination directory (local mode).
  std::string targetDir = ".";
  // Where files are staged before relay (remote mode). Empty = temp dir.
  std::string stagingDir;
};

/**
 * @brief Fixed-size worker pool that downloads submitted URLs.
 *
 * With a RemoteForwarder the manager runs in remote mode: files are staged
 * under stagingDir, relayed, and the staged copy is removed once the relay
 * succeeds. Retry backoff is served by a timer, so a worker never sleeps on
 * behalf of a failed URL.
 */
class TransferManager {
 public:
  TransferManager(TransferManagerConfig config,
                  std::shared_ptr<TransferUnit> transferUnit,
                  std::shared_ptr<RemoteForwarder> forwarder = nullptr);
  ~TransferManager();

  TransferManager(const TransferManager&) = delete;
  TransferManager& operator=(const TransferManager&) = delete;

  // Starts `workers` threads; 0 uses config.maxWorkers.
  void start(uint32_t workers = 0);
  // Safe from any thread, before or after start(). False for known URLs.
  bool submit(const TransferRequest& request);
  bool submit(const std::string& url);
  // Lets in-flight transfers finish, joining each worker for at most
  // config.stopTimeout. Transfers still running after that are cancelled and
  // given one more stopTimeout; workers that still do not exit are detached.
  // Pending backoff timers are dropped.
  void stop();

  bool waitUntilIdle(std::chrono::milliseconds timeout) const;
  StatusSnapshot snapshot() const;

  bool isRemote() const { return isRemote_; }
  bool running() const { return ctx_->running.load(); }
  size_t workerCount() const { return workers_.size(); }
  // Workers detached by stop() that may still be running.
  size_t abandonedWorkers() const { return abandoned_; }
  const std::string& destinationDir() const { return destinationDir_; }

 private:
  // Shared with the worker threads; outlives the manager if a worker is
  // abandoned by stop().
  struct Context {
    TransferManagerConfig config;
    std::string destinationDir;
    bool isRemote = false;
    std::shared_ptr<TransferUnit> transferUnit;
    std::shared_ptr<RemoteForwarder> forwarder;
    RetryPolicy retryPolicy;
    TransferState state;
    utils::Timer backoffTimer;
    std::atomic<bool> running{false};
    std::atomic<bool> cancelled{false};

    Context(TransferManagerConfig cfg, std::string dir, bool remote,
            std::shared_ptr<TransferUnit> unit,
            std::shared_ptr<RemoteForwarder> fwd);
  };

  struct Worker {
    std::thread thread;
    std::future<void> exited;
  };

  static void workerLoop(const std::shared_ptr<Context>& ctx, int index);
  static void processRequest(const std::shared_ptr<Context>& ctx,
                             const TransferRequest& request);
  static void handleFailure(const std::shared_ptr<Context>& ctx,
                            const TransferRequest& request,
                            const TransferError& error);
  static void relayStagedFile(Context& ctx, const std::string& url,
                              const std::string& localPath,
                              const std::string& filename);

  const bool isRemote_;
  const std::string destinationDir_;
  std::shared_ptr<Context> ctx_;
  bool started_ = false;
  std::vector<Worker> workers_;
  size_t abandoned_ = 0;
};

}  // namespace isofetch

#endif  // ISOFETCH_TRANSFER_TRANSFER_MANAGER_HPP_
