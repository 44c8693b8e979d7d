#include "utils/tbb_manager.hpp"

#include <tbb/info.h>

#include <sstream>
#include <utility>

namespace utils {

namespace {
std::atomic<uint64_t> global_task_id{0};
}  // namespace

TBBManager& TBBManager::GetInstance() {
  static TBBManager instance;
  return instance;
}

void TBBManager::SetDefaultConcurrency(const std::string& tbb_name,
                                       int concurrency) {
  std::lock_guard<std::mutex> lock(arenas_mutex_);
  default_concurrency_[tbb_name] = concurrency;
}

std::shared_ptr<tbb::task_arena> TBBManager::Init(const std::string& tbb_name) {
  std::lock_guard<std::mutex> lock(arenas_mutex_);
  auto& state = task_arenas_[tbb_name];
  if (!state.initialized) {
    int concurrency = 0;
    auto& defines = GetTBBParallelCountDefines();
    auto it = defines.find(tbb_name);
    if (it != defines.end()) {
      concurrency = it->second;
    }
    if (concurrency <= 0) {
      auto def = default_concurrency_.find(tbb_name);
      if (def != default_concurrency_.end()) concurrency = def->second;
    }
    if (concurrency <= 0) {
      concurrency = tbb::info::default_concurrency();
    }
    RaiseParallelismLocked(concurrency);
    state.arena = std::make_shared<tbb::task_arena>(concurrency);
    state.concurrency = concurrency;
    state.inFlight = std::make_shared<std::atomic<int64_t>>(0);
    state.initialized = true;
    LOG(INFO) << "[TBBManager] Arena '" << tbb_name
              << "' initialized with concurrency: " << concurrency;
  }
  return state.arena;
}

void TBBManager::RaiseParallelismLocked(int concurrency) {
  // arena 并发度包含提交线程自身的槽位，这里多留一个给外部线程
  int wanted = concurrency + 1;
  if (wanted <= tbb::info::default_concurrency() ||
      wanted <= parallelism_limit_) {
    return;
  }
  // 多个 global_control 同时存在时取最小值，因此先释放旧的
  parallelism_.reset();
  parallelism_ = std::make_unique<tbb::global_control>(
      tbb::global_control::max_allowed_parallelism,
      static_cast<size_t>(wanted));
  parallelism_limit_ = wanted;
  LOG(INFO) << "[TBBManager] max_allowed_parallelism raised to " << wanted;
}

void TBBManager::Enqueue(const std::string& tbb_name,
                         std::function<void()> task) {
  auto arena = Init(tbb_name);
  std::shared_ptr<std::atomic<int64_t>> counter;
  {
    std::lock_guard<std::mutex> lock(arenas_mutex_);
    counter = task_arenas_[tbb_name].inFlight;
  }
  uint64_t task_id = GenerateUniqueTaskId();
  counter->fetch_add(1);
  LOG(DEBUG) << "[TBBManager] Enqueue " << tbb_name << "_" << task_id;
  arena->enqueue([task = std::move(task), counter, tbb_name, task_id]() {
    try {
      task();
    } catch (const std::exception& e) {
      LOG(ERROR) << "[TBBManager] Exception in task " << tbb_name << "_"
                 << task_id << ": " << e.what();
    }
    counter->fetch_sub(1);
  });
}

int64_t TBBManager::InFlight(const std::string& tbb_name) const {
  std::lock_guard<std::mutex> lock(arenas_mutex_);
  auto it = task_arenas_.find(tbb_name);
  if (it == task_arenas_.end() || !it->second.inFlight) return 0;
  return it->second.inFlight->load();
}

int TBBManager::Concurrency(const std::string& tbb_name) const {
  std::lock_guard<std::mutex> lock(arenas_mutex_);
  auto it = task_arenas_.find(tbb_name);
  return it == task_arenas_.end() ? 0 : it->second.concurrency;
}

void TBBManager::Release() {
  std::lock_guard<std::mutex> lock(arenas_mutex_);
  for (auto& kv : task_arenas_) {
    if (kv.second.arena) {
      kv.second.arena->terminate();
      kv.second.arena.reset();
      kv.second.initialized = false;
      LOG(INFO) << "[TBBManager] Arena '" << kv.first << "' released.";
    }
  }
  task_arenas_.clear();
  parallelism_.reset();
  parallelism_limit_ = 0;
}

TBBManager::~TBBManager() { Release(); }

std::map<std::string, int> TBBManager::InitTBBParallelCountDefines() {
  std::map<std::string, int> defines;
  // 解析gflags字符串，格式如 "capture:64,other:8"
  std::string cfg = FLAGS_custom_tbb_parallel_control;
  std::istringstream ss(cfg);
  std::string item;
  while (std::getline(ss, item, ',')) {
    auto pos = item.find(':');
    if (pos == std::string::npos) continue;
    std::string name = item.substr(0, pos);
    try {
      defines[name] = std::stoi(item.substr(pos + 1));
    } catch (const std::exception& e) {
      LOG(WARN) << "[TBBManager] Ignoring bad parallel control entry '"
                << item << "': " << e.what();
    }
  }
  return defines;
}

std::map<std::string, int>& TBBManager::GetTBBParallelCountDefines() {
  static std::map<std::string, int> defines = InitTBBParallelCountDefines();
  return defines;
}

uint64_t TBBManager::GenerateUniqueTaskId() const {
  return global_task_id.fetch_add(1, std::memory_order_relaxed);
}

}  // namespace utils
