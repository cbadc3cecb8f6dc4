/**
 * @file test_transfer_state.cpp
 * @brief Unit tests for the shared queue and bookkeeping
 */

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "Transfer/TransferState.hpp"

namespace isofetch {
namespace test {

using std::chrono::milliseconds;

class TransferStateTest : public ::testing::Test {
 protected:
  TransferState state_{false};

  TransferRequest request(const std::string& name) {
    return TransferRequest{"https://mirror.example.org/iso/" + name, ""};
  }
};

TEST_F(TransferStateTest, EnqueueRejectsKnownUrls) {
  auto req = request("a.iso");
  EXPECT_TRUE(state_.enqueue(req));
  EXPECT_FALSE(state_.enqueue(req));

  auto claimed = state_.claimNext(milliseconds(10));
  ASSERT_TRUE(claimed);
  EXPECT_FALSE(state_.enqueue(req));  // active

  state_.recordCompleted(req.url, "/tmp/a.iso");
  EXPECT_FALSE(state_.enqueue(req));  // completed
}

TEST_F(TransferStateTest, FailedUrlsAreNotRequeued) {
  auto req = request("a.iso");
  state_.enqueue(req);
  state_.claimNext(milliseconds(10));
  state_.recordFailed(req.url, "http-client (HTTP 404)");
  EXPECT_FALSE(state_.enqueue(req));
}

TEST_F(TransferStateTest, ClaimMovesQueuedToActiveAtomically) {
  auto req = request("a.iso");
  state_.enqueue(req);

  auto before = state_.snapshot();
  EXPECT_EQ(before.queued, 1u);
  EXPECT_TRUE(before.active.empty());

  auto claimed = state_.claimNext(milliseconds(10));
  ASSERT_TRUE(claimed);
  EXPECT_EQ(claimed->url, req.url);

  auto after = state_.snapshot();
  EXPECT_EQ(after.queued, 0u);
  ASSERT_EQ(after.active.count(req.url), 1u);
  EXPECT_EQ(after.active.at(req.url).filename, "a.iso");
  EXPECT_EQ(after.active.at(req.url).bytesTransferred, 0u);
}

TEST_F(TransferStateTest, ClaimIsFifo) {
  state_.enqueue(request("a.iso"));
  state_.enqueue(request("b.iso"));
  EXPECT_EQ(state_.claimNext(milliseconds(10))->url, request("a.iso").url);
  EXPECT_EQ(state_.claimNext(milliseconds(10))->url, request("b.iso").url);
}

TEST_F(TransferStateTest, ClaimTimesOutOnEmptyQueue) {
  EXPECT_FALSE(state_.claimNext(milliseconds(20)));
}

TEST_F(TransferStateTest, CloseWakesBlockedClaimers) {
  std::atomic<bool> returned{false};
  std::thread waiter([this, &returned]() {
    auto claimed = state_.claimNext(milliseconds(5000));
    EXPECT_FALSE(claimed);
    returned = true;
  });
  std::this_thread::sleep_for(milliseconds(50));
  state_.close();
  waiter.join();
  EXPECT_TRUE(returned);
}

TEST_F(TransferStateTest, ProgressOnlyUpdatesActiveEntries) {
  auto req = request("a.iso");
  state_.recordProgress(req.url, 10, 100);
  EXPECT_TRUE(state_.snapshot().active.empty());

  state_.enqueue(req);
  state_.claimNext(milliseconds(10));
  state_.recordProgress(req.url, 10, 100);
  auto snap = state_.snapshot();
  EXPECT_EQ(snap.active.at(req.url).bytesTransferred, 10u);
  EXPECT_EQ(snap.active.at(req.url).bytesTotal, 100u);
}

TEST_F(TransferStateTest, SnapshotIsIndependentCopy) {
  auto req = request("a.iso");
  state_.enqueue(req);
  state_.claimNext(milliseconds(10));

  auto snap = state_.snapshot();
  snap.active.clear();
  snap.completedUrls.insert("bogus");
  snap.retryCounts["bogus"] = 9;
  snap.completed = 42;

  auto fresh = state_.snapshot();
  EXPECT_EQ(fresh.active.size(), 1u);
  EXPECT_TRUE(fresh.completedUrls.empty());
  EXPECT_TRUE(fresh.retryCounts.empty());
  EXPECT_EQ(fresh.completed, 0u);
}

TEST_F(TransferStateTest, RetryBacksOffAndRequeues) {
  auto req = request("a.iso");
  state_.enqueue(req);
  state_.claimNext(milliseconds(10));

  EXPECT_EQ(state_.recordRetry(req.url, "network: reset"), 1u);
  auto backing_off = state_.snapshot();
  EXPECT_TRUE(backing_off.active.empty());
  EXPECT_EQ(backing_off.queued, 1u);  // counted as queued while waiting
  EXPECT_EQ(backing_off.retryCounts.at(req.url), 1u);
  EXPECT_FALSE(backing_off.idle());
  EXPECT_FALSE(state_.enqueue(req));

  // Not claimable until the backoff expires.
  EXPECT_FALSE(state_.claimNext(milliseconds(10)));

  state_.requeue(req);
  auto claimed = state_.claimNext(milliseconds(10));
  ASSERT_TRUE(claimed);
  EXPECT_EQ(claimed->url, req.url);
  EXPECT_EQ(state_.retryCount(req.url), 1u);
}

TEST_F(TransferStateTest, RequeueIgnoresUrlsNotBackingOff) {
  state_.requeue(request("a.iso"));
  EXPECT_EQ(state_.snapshot().queued, 0u);
}

TEST_F(TransferStateTest, CompletionClearsRetryCount) {
  auto req = request("a.iso");
  state_.enqueue(req);
  state_.claimNext(milliseconds(10));
  state_.recordRetry(req.url, "timeout");
  state_.requeue(req);
  state_.claimNext(milliseconds(10));
  state_.recordCompleted(req.url, "/tmp/a.iso");

  auto snap = state_.snapshot();
  EXPECT_EQ(snap.completed, 1u);
  EXPECT_EQ(snap.completedUrls.count(req.url), 1u);
  EXPECT_EQ(snap.retryCounts.count(req.url), 0u);
  ASSERT_EQ(snap.downloadedFiles.size(), 1u);
  EXPECT_EQ(snap.downloadedFiles[0], "/tmp/a.iso");
  EXPECT_TRUE(snap.idle());
}

TEST_F(TransferStateTest, FailureClearsRetryCountAndKeepsLastError) {
  auto req = request("a.iso");
  state_.enqueue(req);
  state_.claimNext(milliseconds(10));
  state_.recordRetry(req.url, "network: reset");
  state_.requeue(req);
  state_.claimNext(milliseconds(10));
  state_.recordFailed(req.url, "network: reset again");

  auto snap = state_.snapshot();
  EXPECT_EQ(snap.failed, 1u);
  EXPECT_EQ(snap.failedUrls.count(req.url), 1u);
  EXPECT_EQ(snap.retryCounts.count(req.url), 0u);
  EXPECT_EQ(snap.lastErrors.at(req.url), "network: reset again");
  EXPECT_TRUE(snap.active.empty());
}

TEST_F(TransferStateTest, SameFileNameWaitsWhileAnotherUrlWritesIt) {
  const TransferRequest first{"https://mirror-a.example/pub/x.iso", ""};
  const TransferRequest second{"https://mirror-b.example/pub/x.iso", ""};
  state_.enqueue(first);
  state_.enqueue(second);
  state_.enqueue(request("other.iso"));

  EXPECT_EQ(state_.claimNext(milliseconds(10))->url, first.url);
  // second is passed over while x.iso is being written.
  EXPECT_EQ(state_.claimNext(milliseconds(10))->url, request("other.iso").url);
  EXPECT_FALSE(state_.claimNext(milliseconds(10)));
  EXPECT_EQ(state_.snapshot().queued, 1u);

  state_.recordFailed(first.url, "http-client (HTTP 404)");
  auto claimed = state_.claimNext(milliseconds(10));
  ASSERT_TRUE(claimed);
  EXPECT_EQ(claimed->url, second.url);
}

TEST_F(TransferStateTest, SameFileNameAlreadyDownloadedIsSkipped) {
  const TransferRequest first{"https://mirror-a.example/pub/x.iso", ""};
  const TransferRequest second{"https://mirror-b.example/pub/x.iso", ""};
  state_.enqueue(first);
  state_.claimNext(milliseconds(10));
  state_.recordCompleted(first.url, "/tmp/x.iso");

  EXPECT_TRUE(state_.enqueue(second));
  EXPECT_FALSE(state_.claimNext(milliseconds(10)));

  auto snap = state_.snapshot();
  EXPECT_EQ(snap.completed, 1u);
  EXPECT_EQ(snap.skipped, 1u);
  EXPECT_EQ(snap.completedUrls.count(second.url), 1u);
  EXPECT_EQ(snap.downloadedFiles.size(), 1u);
  EXPECT_EQ(snap.urlByFile.at("/tmp/x.iso"), first.url);
  EXPECT_TRUE(snap.idle());
}

TEST_F(TransferStateTest, InterruptedTransferReturnsToHeadOfQueue) {
  auto a = request("a.iso");
  auto b = request("b.iso");
  state_.enqueue(a);
  state_.enqueue(b);
  state_.claimNext(milliseconds(10));
  state_.recordInterrupted(a);

  auto snap = state_.snapshot();
  EXPECT_TRUE(snap.active.empty());
  EXPECT_EQ(snap.queued, 2u);
  EXPECT_EQ(state_.claimNext(milliseconds(10))->url, a.url);
  EXPECT_EQ(state_.retryCount(a.url), 0u);
}

TEST_F(TransferStateTest, SkippedCountsSeparately) {
  auto req = request("a.iso");
  state_.enqueue(req);
  state_.claimNext(milliseconds(10));
  state_.recordSkipped(req.url);

  auto snap = state_.snapshot();
  EXPECT_EQ(snap.completed, 0u);
  EXPECT_EQ(snap.skipped, 1u);
  EXPECT_EQ(snap.completedUrls.count(req.url), 1u);
  EXPECT_TRUE(snap.downloadedFiles.empty());
}

TEST_F(TransferStateTest, WaitUntilIdle) {
  EXPECT_TRUE(state_.waitUntilIdle(milliseconds(1)));

  auto req = request("a.iso");
  state_.enqueue(req);
  EXPECT_FALSE(state_.waitUntilIdle(milliseconds(20)));

  std::thread worker([this]() {
    auto claimed = state_.claimNext(milliseconds(1000));
    std::this_thread::sleep_for(milliseconds(20));
    state_.recordCompleted(claimed->url, "/tmp/a.iso");
  });
  EXPECT_TRUE(state_.waitUntilIdle(milliseconds(5000)));
  worker.join();
}

TEST_F(TransferStateTest, ConcurrentClaimsNeverShareAUrl) {
  constexpr int kUrls = 200;
  for (int i = 0; i < kUrls; ++i) {
    state_.enqueue(request("file" + std::to_string(i) + ".iso"));
  }

  std::mutex seen_mutex;
  std::multiset<std::string> seen;
  std::vector<std::thread> workers;
  for (int w = 0; w < 4; ++w) {
    workers.emplace_back([&]() {
      while (auto claimed = state_.claimNext(milliseconds(20))) {
        {
          std::lock_guard<std::mutex> lock(seen_mutex);
          seen.insert(claimed->url);
        }
        auto snap = state_.snapshot();
        EXPECT_EQ(snap.completedUrls.count(claimed->url), 0u);
        state_.recordCompleted(claimed->url, claimed->url);
      }
    });
  }
  for (auto& t : workers) t.join();

  EXPECT_EQ(seen.size(), static_cast<size_t>(kUrls));
  for (const auto& url : seen) EXPECT_EQ(seen.count(url), 1u);
  EXPECT_EQ(state_.snapshot().completed, static_cast<size_t>(kUrls));
}

TEST_F(TransferStateTest, RemoteFlagIsReported) {
  TransferState remote(true);
  EXPECT_TRUE(remote.isRemote());
  EXPECT_TRUE(remote.snapshot().isRemote);
  EXPECT_FALSE(state_.snapshot().isRemote);
}

}  // namespace test
}  // namespace isofetch
