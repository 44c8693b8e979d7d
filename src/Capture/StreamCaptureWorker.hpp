#ifndef STREAMCAP_STREAM_CAPTURE_WORKER_HPP_
#define STREAMCAP_STREAM_CAPTURE_WORKER_HPP_

#include <chrono>
#include <memory>

#include "Capture/FileStore.hpp"
#include "TaskManager/CancellationRegistry.hpp"
#include "TaskManager/Task.hpp"
#include "TaskManager/TaskRegistry.hpp"

namespace streamcap {

/**
 * @brief 单个任务的录制流程
 *
 * 拉取 sourceUrl 的响应体并追加写入目标文件，按 progressInterval 把已写
 * 字节数刷新到注册表。无论以何种方式退出（结束、出错、取消），execute
 * 都恰好执行一次收尾：写入 endedAt、移入 finished 分区、注销取消句柄、
 * 触发完成信号。任何失败都记录为任务的 errorDetail，不向外抛出。
 */
class StreamCaptureWorker {
 public:
  StreamCaptureWorker(TaskRegistry& registry,
                      CancellationRegistry& cancellations,
                      const FileStore& files,
                      std::chrono::milliseconds progressInterval);

  void execute(const Task& task, const std::shared_ptr<CaptureHandle>& handle);

  // 只执行传输部分，不做收尾
  TaskOutcome capture(const Task& task, const CaptureHandle& handle);

 private:
  TaskRegistry& registry_;
  CancellationRegistry& cancellations_;
  const FileStore& files_;
  std::chrono::milliseconds progressInterval_;
};

}  // namespace streamcap

#endif  // STREAMCAP_STREAM_CAPTURE_WORKER_HPP_
