#include "TaskManager/Task.hpp"

#include <filesystem>

#include "TaskManager/errors.hpp"

namespace streamcap {

const char* TaskStatusName(TaskStatus status) {
  switch (status) {
    case TaskStatus::kDownloading:
      return "downloading";
    case TaskStatus::kCompleted:
      return "completed";
    case TaskStatus::kError:
      return "error";
  }
  return "unknown";
}

void Task::complete(uint64_t totalBytes, Clock::time_point at, bool byUser) {
  if (isTerminal()) return;
  status = TaskStatus::kCompleted;
  if (totalBytes > bytesWritten) bytesWritten = totalBytes;
  stoppedByUser = byUser;
  endedAt = at;
}

void Task::fail(const std::string& detail, uint64_t totalBytes,
                Clock::time_point at) {
  if (isTerminal()) return;
  status = TaskStatus::kError;
  if (totalBytes > bytesWritten) bytesWritten = totalBytes;
  errorDetail = detail.empty() ? "unknown error" : detail;
  endedAt = at;
}

void TaskOutcome::applyTo(Task& task) const {
  if (status == TaskStatus::kError) {
    task.fail(errorDetail, bytesWritten, endedAt);
  } else {
    task.complete(bytesWritten, endedAt, stoppedByUser);
  }
}

std::string ResolveFileName(const std::string& taskId,
                            const std::string& desired,
                            const std::string& extension) {
  if (desired.empty()) {
    return "stream_" + taskId + extension;
  }
  if (desired == "." || desired == ".." ||
      desired.find('/') != std::string::npos ||
      desired.find('\\') != std::string::npos) {
    throw InvalidArgument("invalid file name: " + desired);
  }
  if (std::filesystem::path(desired).extension().empty()) {
    return desired + extension;
  }
  return desired;
}

}  // namespace streamcap
