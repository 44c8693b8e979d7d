#ifndef TBB_MANAGER_HPP_
#define TBB_MANAGER_HPP_

#include <gflags/gflags.h>
#include <tbb/global_control.h>
#include <tbb/task_arena.h>

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>

#include "utils/logger.hpp"

DECLARE_string(custom_tbb_parallel_control);

namespace utils {

struct TBBState {
  bool initialized = false;
  int concurrency = 0;
  std::shared_ptr<tbb::task_arena> arena;
  // 已提交但尚未执行完毕的任务数
  std::shared_ptr<std::atomic<int64_t>> inFlight;
};

/**
 * @brief TBB任务管理器，按名称管理arena
 *
 * 每个名称对应一个独立的 task_arena。并发度优先取自
 * --custom_tbb_parallel_control（如 "capture:64"），其次取
 * SetDefaultConcurrency 登记的默认值，最后回退到 TBB 默认并发度。
 * 当 arena 并发度超过硬件线程数时，会通过 global_control 提高
 * 进程级并行上限，使阻塞型任务（网络读取）不会互相饿死。
 */
class TBBManager {
 public:
  static TBBManager& GetInstance();

  std::shared_ptr<tbb::task_arena> Init(const std::string& tbb_name);

  // 登记某个 arena 的默认并发度，需在该 arena 首次 Init 之前调用
  void SetDefaultConcurrency(const std::string& tbb_name, int concurrency);

  // 提交一个不等待结果的任务，异常会被记录而不会向外传播
  void Enqueue(const std::string& tbb_name, std::function<void()> task);

  int64_t InFlight(const std::string& tbb_name) const;
  int Concurrency(const std::string& tbb_name) const;

  void Release();
  ~TBBManager();

  static std::map<std::string, int> InitTBBParallelCountDefines();
  static std::map<std::string, int>& GetTBBParallelCountDefines();

 private:
  TBBManager() = default;
  TBBManager(const TBBManager&) = delete;
  TBBManager& operator=(const TBBManager&) = delete;

  uint64_t GenerateUniqueTaskId() const;

  void RaiseParallelismLocked(int concurrency);

  std::unordered_map<std::string, TBBState> task_arenas_;
  std::unordered_map<std::string, int> default_concurrency_;
  std::unique_ptr<tbb::global_control> parallelism_;
  int parallelism_limit_ = 0;

  mutable std::mutex arenas_mutex_;
};

}  // namespace utils

#endif  // TBB_MANAGER_HPP_
