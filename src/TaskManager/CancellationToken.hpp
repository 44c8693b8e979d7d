#ifndef STREAMCAP_CANCELLATION_TOKEN_HPP_
#define STREAMCAP_CANCELLATION_TOKEN_HPP_

#include <atomic>
#include <memory>

namespace streamcap {

// 协作式取消标志。拷贝共享同一状态：管理端持有一份用于触发，
// 工作线程和传输层持有一份用于检查。
class CancellationToken {
 public:
  CancellationToken() : cancelled_(std::make_shared<std::atomic<bool>>(false)) {}

  // 返回本次调用是否真正触发了取消（重复调用返回 false）
  bool cancel() const { return !cancelled_->exchange(true); }
  bool isCancelled() const { return cancelled_->load(); }

 private:
  std::shared_ptr<std::atomic<bool>> cancelled_;
};

}  // namespace streamcap

#endif  // STREAMCAP_CANCELLATION_TOKEN_HPP_
