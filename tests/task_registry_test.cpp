#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

#include "TaskManager/TaskRegistry.hpp"
#include "TaskManager/errors.hpp"

namespace streamcap {
namespace {

Task MakeTask(const std::string& id) {
  Task task;
  task.id = id;
  task.sourceUrl = "http://example.com/live/" + id + ".flv";
  task.fileName = "stream_" + id + ".flv";
  task.filePath = "/tmp/" + task.fileName;
  task.startedAt = Clock::now();
  return task;
}

TaskOutcome Completed(uint64_t bytes) {
  TaskOutcome outcome;
  outcome.status = TaskStatus::kCompleted;
  outcome.bytesWritten = bytes;
  outcome.endedAt = Clock::now();
  return outcome;
}

TEST(TaskRegistryTest, InsertAndGet) {
  TaskRegistry registry;
  registry.insertActive(MakeTask("1"));

  auto task = registry.get("1");
  ASSERT_TRUE(task.has_value());
  EXPECT_EQ(task->status, TaskStatus::kDownloading);
  EXPECT_FALSE(task->endedAt.has_value());
  EXPECT_TRUE(registry.isActive("1"));
  EXPECT_FALSE(registry.isFinished("1"));
  EXPECT_EQ(registry.activeCount(), 1u);
  EXPECT_FALSE(registry.get("2").has_value());
}

TEST(TaskRegistryTest, DuplicateIdRejected) {
  TaskRegistry registry;
  registry.insertActive(MakeTask("1"));
  EXPECT_THROW(registry.insertActive(MakeTask("1")), AlreadyExists);

  ASSERT_TRUE(registry.moveToFinished("1", Completed(0)));
  EXPECT_THROW(registry.insertActive(MakeTask("1")), AlreadyExists);
}

TEST(TaskRegistryTest, MoveToFinishedAppliesOutcome) {
  TaskRegistry registry;
  registry.insertActive(MakeTask("1"));
  registry.updateProgress("1", 100);

  TaskOutcome outcome;
  outcome.status = TaskStatus::kError;
  outcome.bytesWritten = 150;
  outcome.errorDetail = "failed to read stream: connection reset";
  outcome.endedAt = Clock::now();
  ASSERT_TRUE(registry.moveToFinished("1", outcome));

  EXPECT_FALSE(registry.isActive("1"));
  EXPECT_TRUE(registry.isFinished("1"));
  auto task = registry.get("1");
  ASSERT_TRUE(task.has_value());
  EXPECT_EQ(task->status, TaskStatus::kError);
  EXPECT_EQ(task->bytesWritten, 150u);
  EXPECT_EQ(task->errorDetail, outcome.errorDetail);
  ASSERT_TRUE(task->endedAt.has_value());

  // 第二次移动不会生效
  EXPECT_FALSE(registry.moveToFinished("1", Completed(999)));
  EXPECT_EQ(registry.get("1")->bytesWritten, 150u);
}

TEST(TaskRegistryTest, MoveAfterEraseDoesNotReinsert) {
  TaskRegistry registry;
  registry.insertActive(MakeTask("1"));
  ASSERT_TRUE(registry.erase("1"));

  EXPECT_FALSE(registry.moveToFinished("1", Completed(10)));
  EXPECT_FALSE(registry.get("1").has_value());
  EXPECT_EQ(registry.finishedCount(), 0u);
}

TEST(TaskRegistryTest, ProgressNeverDecreases) {
  TaskRegistry registry;
  registry.insertActive(MakeTask("1"));
  registry.updateProgress("1", 100);
  registry.updateProgress("1", 50);
  EXPECT_EQ(registry.get("1")->bytesWritten, 100u);
  registry.updateProgress("1", 300);
  EXPECT_EQ(registry.get("1")->bytesWritten, 300u);

  // 不在 active 分区时忽略
  registry.updateProgress("missing", 10);
  EXPECT_FALSE(registry.get("missing").has_value());
}

TEST(TaskRegistryTest, RemoveFromWrongPartitionThrows) {
  TaskRegistry registry;
  registry.insertActive(MakeTask("1"));
  registry.insertActive(MakeTask("2"));
  ASSERT_TRUE(registry.moveToFinished("2", Completed(1)));

  EXPECT_THROW(registry.removeFinished("1"), NotFound);
  EXPECT_THROW(registry.removeActive("2"), NotFound);
  EXPECT_THROW(registry.removeActive("3"), NotFound);

  Task removed = registry.removeActive("1");
  EXPECT_EQ(removed.id, "1");
  removed = registry.removeFinished("2");
  EXPECT_EQ(removed.id, "2");
  EXPECT_EQ(registry.activeCount(), 0u);
  EXPECT_EQ(registry.finishedCount(), 0u);
  EXPECT_FALSE(registry.erase("1"));
}

TEST(TaskRegistryTest, ListsReturnSnapshots) {
  TaskRegistry registry;
  registry.insertActive(MakeTask("1"));
  registry.insertActive(MakeTask("2"));
  ASSERT_TRUE(registry.moveToFinished("2", Completed(5)));

  auto active = registry.listActive();
  auto finished = registry.listFinished();
  ASSERT_EQ(active.size(), 1u);
  ASSERT_EQ(finished.size(), 1u);
  EXPECT_EQ(active[0].id, "1");
  EXPECT_EQ(finished[0].id, "2");

  registry.updateProgress("1", 64);
  EXPECT_EQ(active[0].bytesWritten, 0u);
}

TEST(TaskRegistryTest, ConcurrentReadersSeeConsistentRecords) {
  TaskRegistry registry;
  const int kTasks = 8;
  for (int i = 0; i < kTasks; ++i) {
    registry.insertActive(MakeTask(std::to_string(i)));
  }

  std::atomic<bool> violation{false};
  std::atomic<bool> done{false};
  std::thread reader([&]() {
    while (!done.load()) {
      auto active = registry.listActive();
      auto finished = registry.listFinished();
      for (const auto& task : active) {
        if (task.status != TaskStatus::kDownloading || task.endedAt) {
          violation = true;
        }
      }
      for (const auto& task : finished) {
        if (task.status == TaskStatus::kDownloading || !task.endedAt) {
          violation = true;
        }
      }
    }
  });

  std::vector<std::thread> writers;
  for (int i = 0; i < kTasks; ++i) {
    writers.emplace_back([&registry, i]() {
      std::string id = std::to_string(i);
      for (uint64_t bytes = 1; bytes <= 200; ++bytes) {
        registry.updateProgress(id, bytes * 10);
      }
      registry.moveToFinished(id, Completed(2000));
    });
  }
  for (auto& t : writers) t.join();
  done = true;
  reader.join();

  EXPECT_FALSE(violation.load());
  EXPECT_EQ(registry.activeCount(), 0u);
  EXPECT_EQ(registry.finishedCount(), static_cast<size_t>(kTasks));
  for (const auto& task : registry.listFinished()) {
    EXPECT_EQ(task.bytesWritten, 2000u);
  }
}

}  // namespace
}  // namespace streamcap
