#ifndef ISOFETCH_UTILS_TIMER_HPP_
#define ISOFETCH_UTILS_TIMER_HPP_

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <unordered_set>
#include <vector>

namespace isofetch {
namespace utils {

/**
 * @brief Single-thread scheduler for delayed and periodic callbacks.
 *
 * Callbacks run on the timer thread without the queue lock held, so they may
 * schedule or cancel other tasks. stop() drops every pending task.
 */
class Timer {
 public:
  using TaskId = uint64_t;

  struct TimerTask {
    TaskId id;
    std::chrono::steady_clock::time_point execTimestamp;
    std::function<void()> callback;
    bool isPeriodic;
    std::chrono::milliseconds period;

    TimerTask(
        TaskId taskId, std::chrono::steady_clock::time_point execTime,
        std::function<void()> cb, bool periodic = false,
        std::chrono::milliseconds periodDuration = std::chrono::milliseconds(0))
        : id(taskId),
          execTimestamp(execTime),
          callback(std::move(cb)),
          isPeriodic(periodic),
          period(periodDuration) {}
    bool operator>(const TimerTask& other) const {
      if (execTimestamp == other.execTimestamp) return id > other.id;
      return execTimestamp > other.execTimestamp;
    }
  };

  Timer();
  ~Timer();

  TaskId addOnceTask(std::chrono::milliseconds delay,
                     std::function<void()> callback);
  TaskId addPeriodicTask(std::chrono::milliseconds delay,
                         std::chrono::milliseconds period,
                         std::function<void()> callback);
  // Returns false when the task already ran (one-shot) or is unknown.
  bool cancel(TaskId id);
  size_t pendingTasks() const;

  void start();
  void stop();
  bool running() const;

 private:
  TaskId schedule(TimerTask task);

  std::priority_queue<TimerTask, std::vector<TimerTask>,
                      std::greater<TimerTask>>
      taskQueue_;
  std::unordered_set<TaskId> live_;
  std::unordered_set<TaskId> cancelled_;
  mutable std::mutex tasksMutex_;
  std::condition_variable tasksCv_;
  std::thread timerThread_;
  TaskId nextId_;
  bool running_;
};

}  // namespace utils
}  // namespace isofetch

#endif  // ISOFETCH_UTILS_TIMER_HPP_
