#include "TransferManager.hpp"

#include <tbb/info.h>

#include <filesystem>
#include <stdexcept>
#include <utility>

#include "logger.hpp"

namespace isofetch {

namespace fs = std::filesystem;

namespace {

std::string resolveDestinationDir(const TransferManagerConfig& config,
                                  bool isRemote) {
  fs::path dir;
  if (isRemote) {
    dir = config.stagingDir.empty()
              ? fs::temp_directory_path() / "isofetch"
              : fs::path(config.stagingDir);
  } else {
    dir = config.targetDir.empty() ? fs::path(".") : fs::path(config.targetDir);
  }

  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec) {
    throw std::runtime_error("Failed to create directory " + dir.string() +
                             ": " + ec.message());
  }
  return dir.string();
}

bool isPlainFilename(const std::string& name) {
  return !name.empty() && name != "." && name != ".." &&
         name.find('/') == std::string::npos;
}

}  // namespace

TransferManager::Context::Context(TransferManagerConfig cfg, std::string dir,
                                  bool remote,
                                  std::shared_ptr<TransferUnit> unit,
                                  std::shared_ptr<RemoteForwarder> fwd)
    : config(std::move(cfg)),
      destinationDir(std::move(dir)),
      isRemote(remote),
      transferUnit(std::move(unit)),
      forwarder(std::move(fwd)),
      retryPolicy(config.maxRetries, config.backoffBase),
      state(remote) {}

TransferManager::TransferManager(TransferManagerConfig config,
                                 std::shared_ptr<TransferUnit> transferUnit,
                                 std::shared_ptr<RemoteForwarder> forwarder)
    : isRemote_(forwarder != nullptr),
      destinationDir_(resolveDestinationDir(config, forwarder != nullptr)) {
  if (!transferUnit) {
    throw std::invalid_argument("TransferManager requires a transfer unit");
  }
  ctx_ = std::make_shared<Context>(std::move(config), destinationDir_,
                                   isRemote_, std::move(transferUnit),
                                   std::move(forwarder));
  if (isRemote_) {
    LOG(INFO) << "Staging downloads in " << destinationDir_
              << " for relay to " << ctx_->forwarder->describe();
  } else {
    LOG(INFO) << "Downloading into " << destinationDir_;
  }
}

TransferManager::~TransferManager() {
  stop();
  ctx_->backoffTimer.stop();
}

void TransferManager::start(uint32_t workers) {
  if (started_) {
    LOG(WARN) << "Transfer manager already started";
    return;
  }
  started_ = true;

  uint32_t count = workers > 0 ? workers : ctx_->config.maxWorkers;
  if (count == 0) {
    count = static_cast<uint32_t>(tbb::info::default_concurrency());
  }

  ctx_->running = true;
  ctx_->backoffTimer.start();

  workers_.reserve(count);
  for (uint32_t i = 0; i < count; ++i) {
    std::promise<void> exited;
    Worker worker;
    worker.exited = exited.get_future();
    auto ctx = ctx_;
    const int index = static_cast<int>(i);
    worker.thread = std::thread(
        [ctx, index](std::promise<void> done) {
          workerLoop(ctx, index);
          done.set_value_at_thread_exit();
        },
        std::move(exited));
    workers_.push_back(std::move(worker));
  }
  LOG(INFO) << "Started " << count << " download workers (max retries "
            << ctx_->retryPolicy.maxRetries() << ", backoff base "
            << ctx_->retryPolicy.baseDelay().count() << " ms)";
}

bool TransferManager::submit(const TransferRequest& request) {
  if (request.url.empty()) {
    LOG(WARN) << "Ignoring empty URL";
    return false;
  }
  const bool accepted = ctx_->state.enqueue(request);
  if (accepted) {
    LOG(DEBUG) << "Queued " << request.url;
  }
  return accepted;
}

bool TransferManager::submit(const std::string& url) {
  return submit(TransferRequest{url, ""});
}

void TransferManager::stop() {
  if (!ctx_->running.exchange(false)) {
    return;
  }
  ctx_->state.close();

  std::vector<Worker*> lagging;
  for (auto& worker : workers_) {
    if (worker.exited.wait_for(ctx_->config.stopTimeout) ==
        std::future_status::ready) {
      worker.thread.join();
    } else {
      lagging.push_back(&worker);
    }
  }

  if (!lagging.empty()) {
    LOG(WARN) << lagging.size() << " download worker(s) still busy after "
              << ctx_->config.stopTimeout.count()
              << " ms, cancelling their transfers";
    ctx_->cancelled = true;
    for (Worker* worker : lagging) {
      if (worker->exited.wait_for(ctx_->config.stopTimeout) ==
          std::future_status::ready) {
        worker->thread.join();
      } else {
        // It keeps its own reference to the context.
        LOG(WARN) << "Download worker ignored cancellation, abandoning it";
        worker->thread.detach();
        ++abandoned_;
      }
    }
  }
  workers_.clear();

  ctx_->backoffTimer.stop();
  LOG(INFO) << "Transfer manager stopped";
}

bool TransferManager::waitUntilIdle(std::chrono::milliseconds timeout) const {
  return ctx_->state.waitUntilIdle(timeout);
}

StatusSnapshot TransferManager::snapshot() const {
  return ctx_->state.snapshot();
}

void TransferManager::workerLoop(const std::shared_ptr<Context>& ctx,
                                 int index) {
  LOG(DEBUG) << "Worker " << index << " started";
  while (ctx->running) {
    auto request = ctx->state.claimNext(ctx->config.dequeueWait);
    if (!request) {
      continue;
    }
    try {
      processRequest(ctx, *request);
    } catch (const std::exception& e) {
      LOG(ERROR) << "Worker " << index << " failed on " << request->url << ": "
                 << e.what();
      ctx->state.recordFailed(request->url, e.what());
    }
  }
  LOG(DEBUG) << "Worker " << index << " exiting";
}

void TransferManager::processRequest(const std::shared_ptr<Context>& ctx,
                                     const TransferRequest& request) {
  const std::string& url = request.url;
  const std::string filename = resolveFilename(request);
  if (!isPlainFilename(filename)) {
    handleFailure(ctx, request,
                  TransferError{ErrorKind::MalformedUrl,
                                "cannot derive a file name from the URL", 0});
    return;
  }

  if (ctx->forwarder && !ctx->forwarder->acceptsFilename(filename)) {
    handleFailure(ctx, request,
                  TransferError{ErrorKind::MalformedUrl,
                                "file name " + filename +
                                    " cannot be relayed to " +
                                    ctx->forwarder->describe(),
                                0});
    return;
  }

  const std::string local_path =
      (fs::path(ctx->destinationDir) / filename).string();
  TransferOptions options;
  options.skipExisting = !ctx->isRemote;
  options.cancelled = &ctx->cancelled;

  LOG(INFO) << "Downloading " << filename << " from " << url;
  const auto result = ctx->transferUnit->transfer(
      url, local_path, options, [&ctx, &url](uint64_t done, uint64_t total) {
        ctx->state.recordProgress(url, done, total);
      });

  if (!result) {
    if (result.error().kind == ErrorKind::Cancelled) {
      LOG(WARN) << "Cancelled " << filename << ", left queued";
      ctx->state.recordInterrupted(request);
      return;
    }
    handleFailure(ctx, request, result.error());
    return;
  }

  if (result.value().outcome == TransferOutcome::Skipped) {
    ctx->state.recordSkipped(url);
    return;
  }

  LOG(INFO) << "Downloaded " << filename << " (" << result.value().bytesWritten
            << " bytes)";
  if (ctx->forwarder) {
    relayStagedFile(*ctx, url, local_path, filename);
  }
  ctx->state.recordCompleted(url, local_path);
}

void TransferManager::handleFailure(const std::shared_ptr<Context>& ctx,
                                    const TransferRequest& request,
                                    const TransferError& error) {
  const std::string& url = request.url;
  const uint32_t attempts = ctx->state.retryCount(url);
  const RetryDecision decision = ctx->retryPolicy.shouldRetry(attempts, error);

  if (!decision.retry) {
    LOG(ERROR) << "Giving up on " << url << " after " << attempts + 1
               << " attempt(s): " << error.describe();
    ctx->state.recordFailed(url, error.describe());
    return;
  }

  const uint32_t count = ctx->state.recordRetry(url, error.describe());
  LOG(WARN) << "Retry " << count << "/" << ctx->retryPolicy.maxRetries()
            << " for " << url << " in " << decision.delay.count()
            << " ms: " << error.describe();

  std::weak_ptr<Context> weak = ctx;
  ctx->backoffTimer.addOnceTask(decision.delay, [weak, request]() {
    if (auto alive = weak.lock()) {
      alive->state.requeue(request);
    }
  });
}

void TransferManager::relayStagedFile(Context& ctx, const std::string& url,
                                      const std::string& localPath,
                                      const std::string& filename) {
  ForwardError failure;
  bool forwarded = false;
  try {
    const auto result = ctx.forwarder->forward(localPath, filename);
    if (result) {
      forwarded = true;
    } else {
      failure = result.error();
    }
  } catch (const std::exception& e) {
    failure = ForwardError{ctx.forwarder->describe(), -1, e.what()};
  }

  if (!forwarded) {
    LOG(WARN) << "Error transferring " << filename << " to " << failure.target
              << " (exit " << failure.exitCode << "): " << failure.diagnostic
              << "; keeping " << localPath;
    ctx.state.recordForwardFailed(
        url, "relay to " + failure.target + " failed: " + failure.diagnostic);
    return;
  }

  std::error_code ec;
  fs::remove(localPath, ec);
  if (ec) {
    LOG(WARN) << "Could not remove staged file " << localPath << ": "
              << ec.message();
  }
}

}  // namespace isofetch
