#include "TaskManager/TaskRegistry.hpp"

#include <mutex>
#include <utility>

#include "TaskManager/errors.hpp"

namespace streamcap {

void TaskRegistry::insertActive(const Task& task) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  if (active_.count(task.id) || finished_.count(task.id)) {
    throw AlreadyExists("task already exists: " + task.id);
  }
  active_.emplace(task.id, task);
}

bool TaskRegistry::moveToFinished(const std::string& id,
                                  const TaskOutcome& outcome) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  auto it = active_.find(id);
  if (it == active_.end()) return false;
  Task task = std::move(it->second);
  active_.erase(it);
  outcome.applyTo(task);
  finished_[id] = std::move(task);
  return true;
}

void TaskRegistry::updateProgress(const std::string& id,
                                  uint64_t bytesWritten) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  auto it = active_.find(id);
  if (it == active_.end()) return;
  if (bytesWritten > it->second.bytesWritten) {
    it->second.bytesWritten = bytesWritten;
  }
}

std::optional<Task> TaskRegistry::get(const std::string& id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto it = active_.find(id);
  if (it != active_.end()) return it->second;
  it = finished_.find(id);
  if (it != finished_.end()) return it->second;
  return std::nullopt;
}

std::vector<Task> TaskRegistry::snapshot(
    const std::unordered_map<std::string, Task>& partition) {
  std::vector<Task> tasks;
  tasks.reserve(partition.size());
  for (const auto& kv : partition) {
    tasks.push_back(kv.second);
  }
  return tasks;
}

std::vector<Task> TaskRegistry::listActive() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return snapshot(active_);
}

std::vector<Task> TaskRegistry::listFinished() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return snapshot(finished_);
}

bool TaskRegistry::isActive(const std::string& id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return active_.count(id) > 0;
}

bool TaskRegistry::isFinished(const std::string& id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return finished_.count(id) > 0;
}

size_t TaskRegistry::activeCount() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return active_.size();
}

size_t TaskRegistry::finishedCount() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return finished_.size();
}

Task TaskRegistry::removeActive(const std::string& id) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  auto it = active_.find(id);
  if (it == active_.end()) {
    throw NotFound("active task not found: " + id);
  }
  Task task = std::move(it->second);
  active_.erase(it);
  return task;
}

Task TaskRegistry::removeFinished(const std::string& id) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  auto it = finished_.find(id);
  if (it == finished_.end()) {
    throw NotFound("finished task not found: " + id);
  }
  Task task = std::move(it->second);
  finished_.erase(it);
  return task;
}

bool TaskRegistry::erase(const std::string& id) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  return active_.erase(id) > 0 || finished_.erase(id) > 0;
}

}  // namespace streamcap
