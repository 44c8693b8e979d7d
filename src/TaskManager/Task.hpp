#ifndef STREAMCAP_TASK_HPP_
#define STREAMCAP_TASK_HPP_

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace streamcap {

enum class TaskStatus { kDownloading, kCompleted, kError };

const char* TaskStatusName(TaskStatus status);

using Clock = std::chrono::system_clock;

// 一个直播流录制任务。id/sourceUrl/文件名/startedAt 创建后不再变化，
// 其余字段仅由当前负责该任务的组件修改。
struct Task {
  std::string id;
  std::string sourceUrl;
  std::string fileName;
  std::string filePath;
  TaskStatus status = TaskStatus::kDownloading;
  uint64_t bytesWritten = 0;
  Clock::time_point startedAt;
  std::optional<Clock::time_point> endedAt;
  std::string errorDetail;
  // 由调用方主动停止时为 true，此时 status 仍为 kCompleted
  bool stoppedByUser = false;

  bool isTerminal() const { return status != TaskStatus::kDownloading; }

  void complete(uint64_t totalBytes, Clock::time_point at,
                bool byUser = false);
  void fail(const std::string& detail, uint64_t totalBytes,
            Clock::time_point at);
};

// 工作线程结束时交给注册表的最终结果
struct TaskOutcome {
  TaskStatus status = TaskStatus::kCompleted;
  uint64_t bytesWritten = 0;
  std::string errorDetail;
  bool stoppedByUser = false;
  Clock::time_point endedAt;

  void applyTo(Task& task) const;
};

// 默认扩展名
constexpr const char* kDefaultExtension = ".flv";

// 未提供文件名时生成 stream_<id><ext>；提供的文件名没有扩展名时补上 ext。
// 文件名包含路径分隔符或为 "."/".." 时抛出 InvalidArgument。
std::string ResolveFileName(const std::string& taskId,
                            const std::string& desired,
                            const std::string& extension = kDefaultExtension);

}  // namespace streamcap

#endif  // STREAMCAP_TASK_HPP_
