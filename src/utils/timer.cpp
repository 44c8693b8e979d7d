#include "utils/timer.hpp"

#include "utils/logger.hpp"

namespace utils {

Timer::Timer() : nextId_(1), running_(false) {}
Timer::~Timer() { stop(); }

Timer::TaskId Timer::pushTask(std::chrono::milliseconds delay,
                              std::function<void()> cb, bool periodic,
                              std::chrono::milliseconds period) {
  auto execution_time = std::chrono::steady_clock::now() + delay;
  std::lock_guard<std::mutex> lock(tasksMutex_);
  TaskId id = nextId_++;
  taskQueue_.push(TimerTask(id, execution_time, std::move(cb), periodic, period));
  liveTasks_.insert(id);
  tasksCv_.notify_one();
  return id;
}

Timer::TaskId Timer::addOnceTask(std::chrono::milliseconds delay,
                                 std::function<void()> callback) {
  return pushTask(delay, std::move(callback), false,
                  std::chrono::milliseconds(0));
}

Timer::TaskId Timer::addPeriodicTask(std::chrono::milliseconds delay,
                                     std::chrono::milliseconds period,
                                     std::function<void()> callback) {
  if (period.count() <= 0) period = std::chrono::milliseconds(1);
  return pushTask(delay, std::move(callback), true, period);
}

bool Timer::cancel(TaskId id) {
  std::lock_guard<std::mutex> lock(tasksMutex_);
  // 队列中的条目在出队时被丢弃
  return liveTasks_.erase(id) > 0;
}

void Timer::start() {
  {
    std::lock_guard<std::mutex> lock(tasksMutex_);
    if (running_) return;  // Already running
    running_ = true;
  }

  timerThread_ = std::thread([this]() {
    std::unique_lock<std::mutex> lock(tasksMutex_);
    while (running_) {
      if (taskQueue_.empty()) {
        tasksCv_.wait(lock,
                      [this]() { return !taskQueue_.empty() || !running_; });
        continue;
      }

      auto now = std::chrono::steady_clock::now();
      auto nextTask = taskQueue_.top();
      if (liveTasks_.count(nextTask.id) == 0) {
        taskQueue_.pop();
        continue;
      }

      if (nextTask.execTimestamp <= now) {
        taskQueue_.pop();
        if (nextTask.isPeriodic) {
          nextTask.execTimestamp += nextTask.period;
          taskQueue_.push(nextTask);
        } else {
          liveTasks_.erase(nextTask.id);
        }

        lock.unlock();  // Unlock before executing the callback
        try {
          nextTask.callback();
        } catch (const std::exception& e) {
          LOG(ERROR) << "[Timer] task " << nextTask.id
                     << " threw: " << e.what();
        }
        lock.lock();
      } else {
        auto deadline = nextTask.execTimestamp;
        tasksCv_.wait_until(lock, deadline, [this, deadline]() {
          return !running_ || (!taskQueue_.empty() &&
                               taskQueue_.top().execTimestamp < deadline);
        });
      }
    }
  });
}

void Timer::stop() {
  {
    std::lock_guard<std::mutex> lock(tasksMutex_);
    running_ = false;
    tasksCv_.notify_all();  // Notify the thread to wake up and exit
  }

  if (timerThread_.joinable()) {
    timerThread_.join();
  }
}

}  // namespace utils
