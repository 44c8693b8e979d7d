#ifndef STREAMCAP_TASK_MANAGER_HPP_
#define STREAMCAP_TASK_MANAGER_HPP_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "Capture/FileStore.hpp"
#include "Capture/StreamCaptureWorker.hpp"
#include "Capture/StreamClient.hpp"
#include "TaskManager/CancellationRegistry.hpp"
#include "TaskManager/Task.hpp"
#include "TaskManager/TaskRegistry.hpp"

namespace streamcap {

struct TaskManagerOptions {
  std::string dataDir = "./data";
  std::string defaultExtension = kDefaultExtension;
  StreamClientOptions client;
  std::chrono::milliseconds progressInterval{1000};
  // 删除活动任务时等待工作线程确认退出的上限
  std::chrono::milliseconds deleteWaitTimeout{10000};
  int maxConcurrentCaptures = 64;
  std::string arenaName = "capture";
};

/**
 * @brief 录制任务管理器
 *
 * 持有任务注册表和取消注册表，为每个任务在 TBB arena 中启动一个
 * StreamCaptureWorker。所有对外接口都不会等待网络 I/O；失败以
 * errors.hpp 中的异常同步抛出。
 */
class TaskManager {
 public:
  explicit TaskManager(TaskManagerOptions options,
                       StreamClientFactory clientFactory = MakeDefaultClient);
  ~TaskManager();

  TaskManager(const TaskManager&) = delete;
  TaskManager& operator=(const TaskManager&) = delete;

  Task createTask(const std::string& sourceUrl,
                  const std::string& desiredFileName = "");

  // 请求停止活动任务，立即返回，任务由工作线程结束后移入 finished。
  // id 已在 finished 中时什么也不做并正常返回；两个分区都没有才抛 NotFound。
  void stopTask(const std::string& id);
  void deleteActiveTask(const std::string& id);
  void deleteFinishedTask(const std::string& id);

  std::vector<Task> getActiveTasks() const;
  std::vector<Task> getFinishedTasks() const;
  std::optional<Task> getTask(const std::string& id) const;

  // 取消所有活动任务并等待工作线程退出，之后拒绝新建任务
  void shutdown();

  static std::shared_ptr<StreamClient> MakeDefaultClient(
      const StreamClientOptions& options);

 private:
  std::string nextTaskId();

  TaskManagerOptions options_;
  StreamClientFactory clientFactory_;
  FileStore files_;
  TaskRegistry registry_;
  CancellationRegistry cancellations_;
  StreamCaptureWorker worker_;
  std::atomic<int64_t> lastId_{0};
  std::atomic<bool> shuttingDown_{false};
  std::shared_mutex lifecycleMutex_;
};

}  // namespace streamcap

#endif  // STREAMCAP_TASK_MANAGER_HPP_
