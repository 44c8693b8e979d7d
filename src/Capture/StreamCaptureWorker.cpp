#include "Capture/StreamCaptureWorker.hpp"

#include <cstdio>
#include <string>

#include "TaskManager/errors.hpp"
#include "utils/logger.hpp"

namespace streamcap {

StreamCaptureWorker::StreamCaptureWorker(TaskRegistry& registry,
                                         CancellationRegistry& cancellations,
                                         const FileStore& files,
                                         std::chrono::milliseconds progressInterval)
    : registry_(registry),
      cancellations_(cancellations),
      files_(files),
      progressInterval_(progressInterval) {}

TaskOutcome StreamCaptureWorker::capture(const Task& task,
                                         const CaptureHandle& handle) {
  TaskOutcome outcome;
  const CancellationToken& token = handle.token();

  // 排队期间已被取消：不建立连接，也不创建文件
  if (token.isCancelled()) {
    LOG(INFO) << "Task " << task.id << " cancelled before start";
    outcome.status = TaskStatus::kCompleted;
    outcome.stoppedByUser = true;
    return outcome;
  }

  FilePtr file;
  uint64_t totalBytes = 0;
  uint64_t flushedBytes = 0;
  std::string localError;
  auto lastFlush = std::chrono::steady_clock::now();

  auto onOpen = [&]() -> bool {
    try {
      file = files_.createExclusive(task.filePath);
    } catch (const IOFailure& e) {
      localError = e.what();
      return false;
    }
    LOG(INFO) << "Task " << task.id << " stream opened, writing to "
              << task.filePath;
    return true;
  };

  auto onData = [&](const char* data, size_t size) -> bool {
    try {
      FileStore::append(file.get(), data, size, task.filePath);
    } catch (const IOFailure& e) {
      localError = e.what();
      return false;
    }
    totalBytes += size;

    // 按固定间隔刷新进度，而不是每个数据块都加锁
    auto now = std::chrono::steady_clock::now();
    if (now - lastFlush >= progressInterval_) {
      registry_.updateProgress(task.id, totalBytes);
      flushedBytes = totalBytes;
      lastFlush = now;
      LOG(DEBUG) << "Task " << task.id << " progress " << totalBytes
                 << " bytes";
    }
    return true;
  };

  try {
    FetchResult result =
        handle.client()->fetch(task.sourceUrl, token, onOpen, onData);
    switch (result) {
      case FetchResult::kEndOfStream:
        outcome.status = TaskStatus::kCompleted;
        outcome.bytesWritten = totalBytes;
        break;
      case FetchResult::kCancelled:
        // 主动停止视为部分录制成功，保留最后一次刷新的进度
        outcome.status = TaskStatus::kCompleted;
        outcome.stoppedByUser = true;
        outcome.bytesWritten = flushedBytes;
        break;
      case FetchResult::kHandlerAborted:
        outcome.status = TaskStatus::kError;
        outcome.bytesWritten = totalBytes;
        outcome.errorDetail =
            localError.empty() ? "capture aborted" : localError;
        break;
    }
  } catch (const CaptureError& e) {
    outcome.status = TaskStatus::kError;
    outcome.bytesWritten = totalBytes;
    outcome.errorDetail = e.what();
  } catch (const std::exception& e) {
    outcome.status = TaskStatus::kError;
    outcome.bytesWritten = totalBytes;
    outcome.errorDetail = std::string("unexpected failure: ") + e.what();
  }

  if (file) {
    if (std::fflush(file.get()) != 0 &&
        outcome.status != TaskStatus::kError) {
      outcome.status = TaskStatus::kError;
      outcome.stoppedByUser = false;
      outcome.errorDetail = "failed to flush file " + task.filePath;
    }
    file.reset();
  }
  return outcome;
}

void StreamCaptureWorker::execute(const Task& task,
                                  const std::shared_ptr<CaptureHandle>& handle) {
  LOG(INFO) << "Task " << task.id << " capture started: " << task.sourceUrl;

  TaskOutcome outcome = capture(task, *handle);
  outcome.endedAt = Clock::now();

  if (outcome.status == TaskStatus::kError) {
    LOG(ERROR) << "Task " << task.id << " failed: " << outcome.errorDetail;
  } else {
    LOG(INFO) << "Task " << task.id
              << (outcome.stoppedByUser ? " stopped" : " completed") << ", "
              << outcome.bytesWritten << " bytes";
  }

  if (!registry_.moveToFinished(task.id, outcome)) {
    LOG(WARN) << "Task " << task.id
              << " was removed before its capture finished";
  }
  cancellations_.unregister(task.id);
  handle->markFinished();
}

}  // namespace streamcap
