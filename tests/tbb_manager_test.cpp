#include <gflags/gflags.h>
#include <gtest/gtest.h>

#include <atomic>
#include <stdexcept>

#include "test_utils.hpp"
#include "utils/tbb_manager.hpp"

namespace utils {
namespace {

TEST(TBBManagerTest, EnqueueRunsTasks) {
  auto& tbb = TBBManager::GetInstance();
  std::atomic<int> done{0};
  for (int i = 0; i < 32; ++i) {
    tbb.Enqueue("enqueue_test", [&done]() { ++done; });
  }
  ASSERT_TRUE(testutil::WaitUntil([&]() { return done.load() == 32; }));
  EXPECT_TRUE(testutil::WaitUntil(
      [&]() { return tbb.InFlight("enqueue_test") == 0; }));
}

TEST(TBBManagerTest, DefaultConcurrencyAppliesOnInit) {
  auto& tbb = TBBManager::GetInstance();
  tbb.SetDefaultConcurrency("blocking_test", 24);
  ASSERT_NE(tbb.Init("blocking_test"), nullptr);
  EXPECT_EQ(tbb.Concurrency("blocking_test"), 24);
  EXPECT_EQ(tbb.Concurrency("never_created"), 0);
}

TEST(TBBManagerTest, BlockingTasksRunConcurrently) {
  auto& tbb = TBBManager::GetInstance();
  tbb.SetDefaultConcurrency("parallel_test", 9);
  const int kTasks = 6;
  std::atomic<int> started{0};
  std::atomic<bool> release{false};
  for (int i = 0; i < kTasks; ++i) {
    tbb.Enqueue("parallel_test", [&]() {
      ++started;
      while (!release.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
      }
    });
  }
  // 全部任务同时阻塞，说明并发度不受硬件线程数限制
  bool allStarted = testutil::WaitUntil([&]() { return started.load() == kTasks; });
  release = true;
  EXPECT_TRUE(allStarted);
  EXPECT_TRUE(testutil::WaitUntil(
      [&]() { return tbb.InFlight("parallel_test") == 0; }));
}

TEST(TBBManagerTest, ThrowingTaskIsContained) {
  auto& tbb = TBBManager::GetInstance();
  std::atomic<bool> after{false};
  tbb.Enqueue("throw_test", []() { throw std::runtime_error("boom"); });
  tbb.Enqueue("throw_test", [&after]() { after = true; });
  EXPECT_TRUE(testutil::WaitUntil([&]() { return after.load(); }));
  EXPECT_TRUE(
      testutil::WaitUntil([&]() { return tbb.InFlight("throw_test") == 0; }));
}

TEST(TBBManagerTest, ParsesParallelControlFlag) {
  gflags::FlagSaver saver;
  FLAGS_custom_tbb_parallel_control = "capture:128,http:8,bad,broken:x";
  auto defines = TBBManager::InitTBBParallelCountDefines();
  EXPECT_EQ(defines.size(), 2u);
  EXPECT_EQ(defines["capture"], 128);
  EXPECT_EQ(defines["http"], 8);
}

}  // namespace
}  // namespace utils
