#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

#include "test_utils.hpp"
#include "utils/timer.hpp"

namespace utils {
namespace {

using std::chrono::milliseconds;

TEST(TimerTest, OnceTaskRunsOnce) {
  Timer timer;
  std::atomic<int> runs{0};
  timer.addOnceTask(milliseconds(10), [&]() { ++runs; });
  timer.start();

  ASSERT_TRUE(testutil::WaitUntil([&]() { return runs.load() == 1; }));
  std::this_thread::sleep_for(milliseconds(50));
  EXPECT_EQ(runs.load(), 1);
  timer.stop();
}

TEST(TimerTest, PeriodicTaskRepeatsUntilCancelled) {
  Timer timer;
  std::atomic<int> runs{0};
  Timer::TaskId id =
      timer.addPeriodicTask(milliseconds(0), milliseconds(5), [&]() { ++runs; });
  timer.start();

  ASSERT_TRUE(testutil::WaitUntil([&]() { return runs.load() >= 3; }));
  EXPECT_TRUE(timer.cancel(id));
  std::this_thread::sleep_for(milliseconds(20));
  int afterCancel = runs.load();
  std::this_thread::sleep_for(milliseconds(50));
  EXPECT_EQ(runs.load(), afterCancel);
  EXPECT_FALSE(timer.cancel(id));
}

TEST(TimerTest, CancelledTaskNeverRuns) {
  Timer timer;
  std::atomic<bool> ran{false};
  std::atomic<bool> marker{false};
  Timer::TaskId id = timer.addOnceTask(milliseconds(20), [&]() { ran = true; });
  timer.addOnceTask(milliseconds(40), [&]() { marker = true; });
  EXPECT_TRUE(timer.cancel(id));
  timer.start();

  ASSERT_TRUE(testutil::WaitUntil([&]() { return marker.load(); }));
  EXPECT_FALSE(ran.load());
}

TEST(TimerTest, ThrowingCallbackDoesNotStopTimer) {
  Timer timer;
  std::atomic<bool> later{false};
  timer.addOnceTask(milliseconds(0),
                    []() { throw std::runtime_error("report failed"); });
  timer.addOnceTask(milliseconds(10), [&]() { later = true; });
  timer.start();

  EXPECT_TRUE(testutil::WaitUntil([&]() { return later.load(); }));
}

TEST(TimerTest, StopIsIdempotent) {
  Timer timer;
  std::atomic<bool> ran{false};
  timer.addOnceTask(milliseconds(200), [&]() { ran = true; });
  timer.start();
  timer.stop();
  timer.stop();
  // 停止后未到期的任务不再执行
  std::this_thread::sleep_for(milliseconds(300));
  EXPECT_FALSE(ran.load());
}

}  // namespace
}  // namespace utils
