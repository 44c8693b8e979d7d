#ifndef STREAMCAP_TASK_REGISTRY_HPP_
#define STREAMCAP_TASK_REGISTRY_HPP_

#include <cstddef>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "TaskManager/Task.hpp"

namespace streamcap {

/**
 * @brief 任务注册表，分为 active 和 finished 两个分区
 *
 * 注册表独占 Task 记录的生命周期，对外只返回拷贝。所有操作由同一把
 * 读写锁串行化：读操作之间可以并发，写操作独占。
 */
class TaskRegistry {
 public:
  TaskRegistry() = default;
  TaskRegistry(const TaskRegistry&) = delete;
  TaskRegistry& operator=(const TaskRegistry&) = delete;

  // id 已存在于任一分区时抛出 AlreadyExists
  void insertActive(const Task& task);

  // 原子地从 active 移到 finished 并写入最终字段。
  // 任务已不在 active（例如已被删除）时返回 false，不会重新插入。
  bool moveToFinished(const std::string& id, const TaskOutcome& outcome);

  // 只增不减；任务不在 active 时忽略
  void updateProgress(const std::string& id, uint64_t bytesWritten);

  std::optional<Task> get(const std::string& id) const;
  std::vector<Task> listActive() const;
  std::vector<Task> listFinished() const;

  bool isActive(const std::string& id) const;
  bool isFinished(const std::string& id) const;
  size_t activeCount() const;
  size_t finishedCount() const;

  // 不在对应分区时抛出 NotFound，返回被删除的记录
  Task removeActive(const std::string& id);
  Task removeFinished(const std::string& id);

  // 从所在分区删除，两个分区都不存在时返回 false
  bool erase(const std::string& id);

 private:
  static std::vector<Task> snapshot(
      const std::unordered_map<std::string, Task>& partition);

  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, Task> active_;
  std::unordered_map<std::string, Task> finished_;
};

}  // namespace streamcap

#endif  // STREAMCAP_TASK_REGISTRY_HPP_
