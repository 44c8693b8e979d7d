#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <unordered_set>
#include <vector>

namespace utils {

// 单线程定时器：回调在定时器线程中串行执行，回调内不要做长时间阻塞操作
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
  // 取消尚未执行（或周期性）的任务；任务不存在时返回 false
  bool cancel(TaskId id);

  void start();
  void stop();

 private:
  TaskId pushTask(std::chrono::milliseconds delay, std::function<void()> cb,
                  bool periodic, std::chrono::milliseconds period);

  std::priority_queue<TimerTask, std::vector<TimerTask>,
                      std::greater<TimerTask>>
      taskQueue_;
  std::unordered_set<TaskId> liveTasks_;
  std::mutex tasksMutex_;
  std::condition_variable tasksCv_;
  std::thread timerThread_;
  TaskId nextId_;
  bool running_;
};
}  // namespace utils
