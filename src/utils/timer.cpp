#include "timer.hpp"

namespace isofetch {
namespace utils {

Timer::Timer() : nextId_(1), running_(false) {}
Timer::~Timer() { stop(); }

Timer::TaskId Timer::schedule(TimerTask task) {
  const TaskId id = task.id;
  std::lock_guard<std::mutex> lock(tasksMutex_);
  live_.insert(id);
  taskQueue_.push(std::move(task));
  tasksCv_.notify_one();
  return id;
}

Timer::TaskId Timer::addOnceTask(std::chrono::milliseconds delay,
                                 std::function<void()> callback) {
  TaskId id;
  {
    std::lock_guard<std::mutex> lock(tasksMutex_);
    id = nextId_++;
  }
  auto execution_time = std::chrono::steady_clock::now() + delay;
  return schedule(TimerTask(id, execution_time, std::move(callback)));
}

Timer::TaskId Timer::addPeriodicTask(std::chrono::milliseconds delay,
                                     std::chrono::milliseconds period,
                                     std::function<void()> callback) {
  TaskId id;
  {
    std::lock_guard<std::mutex> lock(tasksMutex_);
    id = nextId_++;
  }
  auto execution_time = std::chrono::steady_clock::now() + delay;
  return schedule(
      TimerTask(id, execution_time, std::move(callback), true, period));
}

bool Timer::cancel(TaskId id) {
  std::lock_guard<std::mutex> lock(tasksMutex_);
  if (live_.erase(id) == 0) return false;
  cancelled_.insert(id);
  tasksCv_.notify_one();
  return true;
}

size_t Timer::pendingTasks() const {
  std::lock_guard<std::mutex> lock(tasksMutex_);
  return live_.size();
}

bool Timer::running() const {
  std::lock_guard<std::mutex> lock(tasksMutex_);
  return running_;
}

void Timer::start() {
  {
    std::lock_guard<std::mutex> lock(tasksMutex_);
    if (running_) return;
    running_ = true;
  }
  if (timerThread_.joinable()) timerThread_.join();

  timerThread_ = std::thread([this]() {
    std::unique_lock<std::mutex> lock(tasksMutex_);
    while (running_) {
      if (taskQueue_.empty()) {
        tasksCv_.wait(lock,
                      [this]() { return !taskQueue_.empty() || !running_; });
        continue;
      }

      // Cancelled tasks are discarded lazily when they reach the top.
      if (cancelled_.erase(taskQueue_.top().id) > 0) {
        taskQueue_.pop();
        continue;
      }

      auto now = std::chrono::steady_clock::now();
      auto nextTask = taskQueue_.top();
      if (nextTask.execTimestamp <= now) {
        taskQueue_.pop();
        if (nextTask.isPeriodic) {
          auto again = nextTask;
          again.execTimestamp += again.period;
          taskQueue_.push(std::move(again));
        } else {
          live_.erase(nextTask.id);
        }

        lock.unlock();  // callbacks may schedule or cancel
        nextTask.callback();
        lock.lock();
      } else {
        const auto deadline = nextTask.execTimestamp;
        const auto top_id = nextTask.id;
        tasksCv_.wait_until(lock, deadline, [this, deadline, top_id]() {
          return !running_ || taskQueue_.empty() ||
                 taskQueue_.top().id != top_id ||
                 cancelled_.count(top_id) > 0 ||
                 taskQueue_.top().execTimestamp < deadline;
        });
      }
    }
  });
}

void Timer::stop() {
  {
    std::lock_guard<std::mutex> lock(tasksMutex_);
    running_ = false;
    taskQueue_ = {};
    live_.clear();
    cancelled_.clear();
    tasksCv_.notify_all();
  }

  if (!timerThread_.joinable()) return;
  if (timerThread_.get_id() == std::this_thread::get_id()) {
    // stop() from inside a callback: the loop exits once it returns.
    timerThread_.detach();
  } else {
    timerThread_.join();
  }
}

}  // namespace utils
}  // namespace isofetch
