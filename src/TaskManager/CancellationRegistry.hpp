#ifndef STREAMCAP_CANCELLATION_REGISTRY_HPP_
#define STREAMCAP_CANCELLATION_REGISTRY_HPP_

#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "Capture/StreamClient.hpp"
#include "TaskManager/CancellationToken.hpp"

namespace streamcap {

// 一个活动任务的取消句柄：取消标志、该任务使用的传输客户端，
// 以及工作线程退出时触发的完成信号。
class CaptureHandle {
 public:
  CaptureHandle(std::string taskId, std::shared_ptr<StreamClient> client);

  const std::string& taskId() const { return taskId_; }
  const CancellationToken& token() const { return token_; }
  const std::shared_ptr<StreamClient>& client() const { return client_; }

  bool cancel() const { return token_.cancel(); }

  // 由工作线程在退出时调用一次
  void markFinished();
  bool waitFinished(std::chrono::milliseconds timeout) const;

 private:
  std::string taskId_;
  CancellationToken token_;
  std::shared_ptr<StreamClient> client_;
  std::once_flag finishedOnce_;
  std::promise<void> finished_;
  std::shared_future<void> finishedFuture_;
};

class CancellationRegistry {
 public:
  CancellationRegistry() = default;
  CancellationRegistry(const CancellationRegistry&) = delete;
  CancellationRegistry& operator=(const CancellationRegistry&) = delete;

  void registerHandle(const std::string& id,
                      std::shared_ptr<CaptureHandle> handle);

  // 存在句柄时触发取消并返回 true；重复调用无副作用
  bool cancel(const std::string& id);

  void unregister(const std::string& id);

  std::shared_ptr<CaptureHandle> find(const std::string& id) const;

  // 触发全部取消，返回被取消的句柄以便调用方等待
  std::vector<std::shared_ptr<CaptureHandle>> cancelAll();

  size_t size() const;

 private:
  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<CaptureHandle>> handles_;
};

}  // namespace streamcap

#endif  // STREAMCAP_CANCELLATION_REGISTRY_HPP_
