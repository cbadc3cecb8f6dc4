/**
 * @file test_fixtures.hpp
 * @brief Shared fixtures and fakes for the isofetch unit tests
 */

#ifndef ISOFETCH_TESTS_TEST_FIXTURES_HPP_
#define ISOFETCH_TESTS_TEST_FIXTURES_HPP_

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <map>
#include <mutex>
#include <random>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "Remote/RemoteForwarder.hpp"
#include "Transfer/TransferUnit.hpp"

namespace isofetch {
namespace test {

/**
 * @brief Creates a private directory under the system temp dir per test.
 */
class TempDirectoryFixture : public ::testing::Test {
 protected:
  void SetUp() override {
    test_dir_ = std::filesystem::temp_directory_path() /
                ("isofetch_test_" + std::to_string(std::random_device{}()));
    std::filesystem::create_directories(test_dir_);
  }

  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove_all(test_dir_, ec);
  }

  std::filesystem::path writeFile(const std::string& name,
                                  const std::string& content) {
    auto path = test_dir_ / name;
    std::ofstream file(path, std::ios::binary);
    file << content;
    return path;
  }

  static std::string readFile(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(file)),
                       std::istreambuf_iterator<char>());
  }

  std::filesystem::path test_dir_;
};

inline TransferError transientError() {
  return TransferError{ErrorKind::Network, "connection reset", 0};
}

inline TransferError terminalError() {
  return TransferError{ErrorKind::HttpClient, "not found", 404};
}

/**
 * @brief TransferUnit that writes a small body unless a per-URL script says
 * otherwise. Records attempts and how many calls overlap, per URL and per
 * destination.
 */
class FakeTransfer : public TransferUnit {
 public:
  using Script = std::function<TransferResult(int attempt)>;

  TransferResult transfer(const std::string& url,
                          const std::string& destination,
                          const TransferOptions& options,
                          const ProgressCallback& progress) override {
    int attempt = 0;
    Script script;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      attempt = ++attempts_[url];
      if (!inFlight_.insert(url).second) ++duplicateRuns_;
      if (!writing_.insert(destination).second) ++sharedDestinations_;
      maxConcurrent_ = std::max(maxConcurrent_, inFlight_.size());
      auto it = scripts_.find(url);
      if (it != scripts_.end()) script = it->second;
      lastOptions_ = options;
    }

    bool cancelled = false;
    const auto until = std::chrono::steady_clock::now() + delay_;
    while (std::chrono::steady_clock::now() < until) {
      if (cancellable_ && options.cancelled && options.cancelled->load()) {
        cancelled = true;
        break;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }

    TransferResult result = TransferSuccess{TransferOutcome::Downloaded, 0};
    if (cancelled) {
      result = utils::makeUnexpected(
          TransferError{ErrorKind::Cancelled, "cancelled", 0});
    } else if (script) {
      result = script(attempt);
    } else if (options.skipExisting && std::filesystem::exists(destination)) {
      result = TransferSuccess{TransferOutcome::Skipped, 0};
    }

    if (result && result.value().outcome == TransferOutcome::Downloaded) {
      const std::string body = "payload:" + url;
      if (progress) progress(body.size() / 2, body.size());
      std::ofstream out(destination, std::ios::binary);
      out << body;
      out.close();
      if (progress) progress(body.size(), body.size());
      result = TransferSuccess{TransferOutcome::Downloaded, body.size()};
    }

    {
      std::lock_guard<std::mutex> lock(mutex_);
      inFlight_.erase(url);
      writing_.erase(destination);
    }
    return result;
  }

  void setScript(const std::string& url, Script script) {
    std::lock_guard<std::mutex> lock(mutex_);
    scripts_[url] = std::move(script);
  }

  void setDelay(std::chrono::milliseconds delay) { delay_ = delay; }
  // Whether the delay honours TransferOptions::cancelled.
  void setCancellable(bool cancellable) { cancellable_ = cancellable; }

  int attempts(const std::string& url) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = attempts_.find(url);
    return it == attempts_.end() ? 0 : it->second;
  }

  int duplicateRuns() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return duplicateRuns_;
  }

  // Calls that started while another call was writing the same destination.
  int sharedDestinations() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sharedDestinations_;
  }

  size_t maxConcurrent() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return maxConcurrent_;
  }

  TransferOptions lastOptions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastOptions_;
  }

 private:
  mutable std::mutex mutex_;
  std::map<std::string, Script> scripts_;
  std::map<std::string, int> attempts_;
  std::set<std::string> inFlight_;
  std::set<std::string> writing_;
  size_t maxConcurrent_ = 0;
  int duplicateRuns_ = 0;
  int sharedDestinations_ = 0;
  TransferOptions lastOptions_;
  std::chrono::milliseconds delay_{0};
  bool cancellable_ = false;
};

/**
 * @brief RemoteForwarder that records what it was asked to relay.
 */
class FakeForwarder : public RemoteForwarder {
 public:
  explicit FakeForwarder(bool succeed = true) : succeed_(succeed) {}

  ForwardResult forward(const std::string& localPath,
                        const std::string& filename) override {
    std::lock_guard<std::mutex> lock(mutex_);
    // The staged file must still be there while it is relayed.
    sawStagedFile_ = sawStagedFile_ && std::filesystem::exists(localPath);
    forwarded_.push_back(filename);
    if (!succeed_) {
      return utils::makeUnexpected(
          ForwardError{"backup:/isos/" + filename, 1, "Permission denied"});
    }
    return utils::Ok{};
  }

  ForwardResult probe() override { return utils::Ok{}; }
  ForwardResult prepare() override { return utils::Ok{}; }
  bool acceptsFilename(const std::string& filename) const override {
    return filename.find(';') == std::string::npos;
  }
  std::string describe() const override { return "backup:/isos"; }

  std::vector<std::string> forwarded() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return forwarded_;
  }

  bool sawStagedFile() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sawStagedFile_;
  }

 private:
  bool succeed_;
  mutable std::mutex mutex_;
  std::vector<std::string> forwarded_;
  bool sawStagedFile_ = true;
};

}  // namespace test
}  // namespace isofetch

#endif  // ISOFETCH_TESTS_TEST_FIXTURES_HPP_
