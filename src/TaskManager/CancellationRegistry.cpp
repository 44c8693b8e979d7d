#include "TaskManager/CancellationRegistry.hpp"

#include <utility>

namespace streamcap {

CaptureHandle::CaptureHandle(std::string taskId,
                             std::shared_ptr<StreamClient> client)
    : taskId_(std::move(taskId)),
      client_(std::move(client)),
      finishedFuture_(finished_.get_future().share()) {}

void CaptureHandle::markFinished() {
  std::call_once(finishedOnce_, [this]() { finished_.set_value(); });
}

bool CaptureHandle::waitFinished(std::chrono::milliseconds timeout) const {
  return finishedFuture_.wait_for(timeout) == std::future_status::ready;
}

void CancellationRegistry::registerHandle(
    const std::string& id, std::shared_ptr<CaptureHandle> handle) {
  std::lock_guard<std::mutex> lock(mutex_);
  handles_[id] = std::move(handle);
}

bool CancellationRegistry::cancel(const std::string& id) {
  std::shared_ptr<CaptureHandle> handle = find(id);
  if (!handle) return false;
  handle->cancel();
  return true;
}

void CancellationRegistry::unregister(const std::string& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  handles_.erase(id);
}

std::shared_ptr<CaptureHandle> CancellationRegistry::find(
    const std::string& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = handles_.find(id);
  return it == handles_.end() ? nullptr : it->second;
}

std::vector<std::shared_ptr<CaptureHandle>> CancellationRegistry::cancelAll() {
  std::vector<std::shared_ptr<CaptureHandle>> handles;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    handles.reserve(handles_.size());
    for (auto& kv : handles_) handles.push_back(kv.second);
  }
  for (auto& handle : handles) handle->cancel();
  return handles;
}

size_t CancellationRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return handles_.size();
}

}  // namespace streamcap
