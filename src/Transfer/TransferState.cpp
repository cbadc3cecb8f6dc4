#include "TransferState.hpp"

#include "logger.hpp"

namespace isofetch {

TransferState::TransferState(bool isRemote) : isRemote_(isRemote) {}

bool TransferState::knownLocked(const std::string& url) const {
  return queuedUrls_.count(url) > 0 || backingOff_.count(url) > 0 ||
         active_.count(url) > 0 || completedUrls_.count(url) > 0 ||
         failed_.count(url) > 0;
}

bool TransferState::idleLocked() const {
  return queue_.empty() && backingOff_.empty() && active_.empty();
}

bool TransferState::enqueue(const TransferRequest& request) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (knownLocked(request.url)) {
      LOG(DEBUG) << "Ignoring duplicate submission of " << request.url;
      return false;
    }
    queue_.push_back(request);
    queuedUrls_.insert(request.url);
  }
  queueCv_.notify_one();
  return true;
}

std::deque<TransferRequest>::iterator TransferState::nextClaimableLocked(
    bool& settled) {
  auto it = queue_.begin();
  while (it != queue_.end()) {
    const std::string name = resolveFilename(*it);
    if (!name.empty() && downloadedNames_.count(name) > 0) {
      LOG(INFO) << "Skipping " << it->url << ", " << name
                << " was already downloaded from another URL";
      queuedUrls_.erase(it->url);
      retryCounts_.erase(it->url);
      completedUrls_.insert(it->url);
      ++skippedCount_;
      it = queue_.erase(it);
      settled = true;
      continue;
    }
    if (name.empty() || activeNames_.count(name) == 0) {
      return it;
    }
    ++it;
  }
  return it;
}

std::optional<TransferRequest> TransferState::claimNext(
    std::chrono::milliseconds wait) {
  std::unique_lock<std::mutex> lock(mutex_);
  bool settled = false;
  auto next = queue_.end();
  const bool ready = queueCv_.wait_for(lock, wait, [this, &settled, &next]() {
    if (closed_) return true;
    next = nextClaimableLocked(settled);
    return next != queue_.end();
  });
  if (settled) idleCv_.notify_all();
  if (!ready || closed_) return std::nullopt;

  TransferRequest request = std::move(*next);
  queue_.erase(next);
  queuedUrls_.erase(request.url);

  ActiveTransfer info;
  info.url = request.url;
  info.filename = resolveFilename(request);
  if (!info.filename.empty()) activeNames_.insert(info.filename);
  active_[request.url] = std::move(info);
  return request;
}

std::string TransferState::releaseLocked(const std::string& url) {
  auto it = active_.find(url);
  if (it == active_.end()) return "";
  std::string name = std::move(it->second.filename);
  activeNames_.erase(name);
  active_.erase(it);
  return name;
}

void TransferState::recordProgress(const std::string& url,
                                   uint64_t bytesTransferred,
                                   uint64_t bytesTotal) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = active_.find(url);
  if (it == active_.end()) return;
  it->second.bytesTransferred = bytesTransferred;
  it->second.bytesTotal = bytesTotal;
}

void TransferState::recordCompleted(const std::string& url,
                                    const std::string& localPath) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string name = releaseLocked(url);
    if (!name.empty()) downloadedNames_.insert(name);
    retryCounts_.erase(url);
    completedUrls_.insert(url);
    ++completedCount_;
    downloadedFiles_.push_back(localPath);
    urlByFile_[localPath] = url;
  }
  queueCv_.notify_all();
  idleCv_.notify_all();
}

void TransferState::recordSkipped(const std::string& url) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    releaseLocked(url);
    retryCounts_.erase(url);
    completedUrls_.insert(url);
    ++skippedCount_;
  }
  queueCv_.notify_all();
  idleCv_.notify_all();
}

void TransferState::recordForwardFailed(const std::string& url,
                                        const std::string& message) {
  std::lock_guard<std::mutex> lock(mutex_);
  forwardFailed_.insert(url);
  lastErrors_[url] = message;
}

void TransferState::recordFailed(const std::string& url,
                                 const std::string& message) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    releaseLocked(url);
    retryCounts_.erase(url);
    failed_.insert(url);
    lastErrors_[url] = message;
  }
  queueCv_.notify_all();
  idleCv_.notify_all();
}

uint32_t TransferState::recordRetry(const std::string& url,
                                    const std::string& message) {
  uint32_t count = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    releaseLocked(url);
    backingOff_.insert(url);
    lastErrors_[url] = message;
    count = ++retryCounts_[url];
  }
  queueCv_.notify_all();
  return count;
}

void TransferState::requeue(const TransferRequest& request) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (backingOff_.erase(request.url) == 0) return;
    queue_.push_back(request);
    queuedUrls_.insert(request.url);
  }
  queueCv_.notify_one();
}

void TransferState::recordInterrupted(const TransferRequest& request) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (active_.count(request.url) == 0) return;
    releaseLocked(request.url);
    queue_.push_front(request);
    queuedUrls_.insert(request.url);
  }
  queueCv_.notify_all();
}

uint32_t TransferState::retryCount(const std::string& url) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = retryCounts_.find(url);
  return it == retryCounts_.end() ? 0 : it->second;
}

void TransferState::close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
  }
  queueCv_.notify_all();
  idleCv_.notify_all();
}

bool TransferState::waitUntilIdle(std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(mutex_);
  return idleCv_.wait_for(lock, timeout, [this]() { return idleLocked(); });
}

StatusSnapshot TransferState::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  StatusSnapshot status;
  status.active = active_;
  status.completed = completedCount_;
  status.completedUrls = completedUrls_;
  status.failed = failed_.size();
  status.failedUrls = failed_;
  status.retryCounts = retryCounts_;
  status.queued = queue_.size() + backingOff_.size();
  status.skipped = skippedCount_;
  status.downloadedFiles = downloadedFiles_;
  status.urlByFile = urlByFile_;
  status.forwardFailed = forwardFailed_;
  status.lastErrors = lastErrors_;
  status.isRemote = isRemote_;
  return status;
}

}  // namespace isofetch
