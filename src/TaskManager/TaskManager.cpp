#include "TaskManager/TaskManager.hpp"

#include <algorithm>
#include <mutex>
#include <shared_mutex>
#include <utility>

#include "Capture/CurlStreamClient.hpp"
#include "TaskManager/errors.hpp"
#include "utils/logger.hpp"
#include "utils/tbb_manager.hpp"

namespace streamcap {

std::shared_ptr<StreamClient> TaskManager::MakeDefaultClient(
    const StreamClientOptions& options) {
  return MakeCurlStreamClient(options);
}

TaskManager::TaskManager(TaskManagerOptions options,
                         StreamClientFactory clientFactory)
    : options_(std::move(options)),
      clientFactory_(std::move(clientFactory)),
      files_(options_.dataDir),
      worker_(registry_, cancellations_, files_, options_.progressInterval) {
  files_.ensureDirectory();
  utils::TBBManager::GetInstance().SetDefaultConcurrency(
      options_.arenaName, options_.maxConcurrentCaptures);
  LOG(INFO) << "TaskManager ready, data dir: " << files_.dataDir();
}

TaskManager::~TaskManager() { shutdown(); }

std::string TaskManager::nextTaskId() {
  // 纳秒时间戳；同一纳秒内的并发创建顺延 1，保证唯一且递增
  int64_t now = std::chrono::duration_cast<std::chrono::nanoseconds>(
                    Clock::now().time_since_epoch())
                    .count();
  int64_t prev = lastId_.load();
  int64_t next;
  do {
    next = std::max(now, prev + 1);
  } while (!lastId_.compare_exchange_weak(prev, next));
  return std::to_string(next);
}

Task TaskManager::createTask(const std::string& sourceUrl,
                             const std::string& desiredFileName) {
  if (sourceUrl.empty()) {
    throw InvalidArgument("source url must not be empty");
  }
  // shutdown 持有写锁，保证它等待的句柄集合里不会漏掉新建的任务
  std::shared_lock<std::shared_mutex> lifecycle(lifecycleMutex_);
  if (shuttingDown_.load()) {
    throw CaptureError("task manager is shutting down");
  }

  Task task;
  task.id = nextTaskId();
  task.sourceUrl = sourceUrl;
  task.fileName =
      ResolveFileName(task.id, desiredFileName, options_.defaultExtension);
  task.filePath = files_.pathFor(task.fileName);
  task.status = TaskStatus::kDownloading;
  task.startedAt = Clock::now();

  std::shared_ptr<StreamClient> client = clientFactory_(options_.client);
  if (!client) {
    throw RequestFailure("no stream client available for " + sourceUrl);
  }
  auto handle = std::make_shared<CaptureHandle>(task.id, std::move(client));

  // 先登记取消句柄再对外可见，避免 stop 落空
  cancellations_.registerHandle(task.id, handle);
  try {
    registry_.insertActive(task);
  } catch (const AlreadyExists&) {
    cancellations_.unregister(task.id);
    throw;
  }

  LOG(INFO) << "Task " << task.id << " created: " << sourceUrl << " -> "
            << task.filePath;
  utils::TBBManager::GetInstance().Enqueue(
      options_.arenaName,
      [this, task, handle]() { worker_.execute(task, handle); });
  return task;
}

void TaskManager::stopTask(const std::string& id) {
  if (registry_.isActive(id)) {
    bool signalled = cancellations_.cancel(id);
    LOG(INFO) << "Task " << id << " stop requested"
              << (signalled ? "" : " (capture already exiting)");
    return;
  }
  if (registry_.isFinished(id)) {
    LOG(INFO) << "Task " << id << " already finished, stop ignored";
    return;
  }
  throw NotFound("task not found: " + id);
}

void TaskManager::deleteActiveTask(const std::string& id) {
  std::optional<Task> task;
  if (registry_.isActive(id)) task = registry_.get(id);
  if (!task) {
    throw NotFound("active task not found: " + id);
  }

  std::shared_ptr<CaptureHandle> handle = cancellations_.find(id);
  if (handle) {
    handle->cancel();
    if (!handle->waitFinished(options_.deleteWaitTimeout)) {
      LOG(WARN) << "Task " << id << " did not acknowledge cancellation within "
                << options_.deleteWaitTimeout.count()
                << " ms, removing file anyway";
    }
  }

  files_.remove(task->filePath);
  registry_.erase(id);
  LOG(INFO) << "Task " << id << " deleted (was active)";
}

void TaskManager::deleteFinishedTask(const std::string& id) {
  if (!registry_.isFinished(id)) {
    throw NotFound("finished task not found: " + id);
  }
  std::optional<Task> task = registry_.get(id);
  if (!task) {
    throw NotFound("finished task not found: " + id);
  }

  files_.remove(task->filePath);
  registry_.removeFinished(id);
  LOG(INFO) << "Task " << id << " deleted (was finished)";
}

std::vector<Task> TaskManager::getActiveTasks() const {
  return registry_.listActive();
}

std::vector<Task> TaskManager::getFinishedTasks() const {
  return registry_.listFinished();
}

std::optional<Task> TaskManager::getTask(const std::string& id) const {
  return registry_.get(id);
}

void TaskManager::shutdown() {
  std::vector<std::shared_ptr<CaptureHandle>> handles;
  {
    std::unique_lock<std::shared_mutex> lifecycle(lifecycleMutex_);
    if (shuttingDown_.exchange(true)) return;
    handles = cancellations_.cancelAll();
  }
  if (!handles.empty()) {
    LOG(INFO) << "Shutting down, waiting for " << handles.size()
              << " capture(s) to exit";
  }
  // 工作线程引用了本对象，必须全部退出后才能析构
  for (auto& handle : handles) {
    while (!handle->waitFinished(options_.deleteWaitTimeout)) {
      LOG(WARN) << "Still waiting for task " << handle->taskId()
                << " to exit";
    }
  }
  LOG(INFO) << "TaskManager stopped";
}

}  // namespace streamcap
