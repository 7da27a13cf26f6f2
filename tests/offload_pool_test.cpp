#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

#include "offload_pool.hpp"

namespace fetcher {
namespace utils {
namespace {

TEST(OffloadPoolTest, ParsesParallelControl) {
  auto defines = OffloadPool::ParseParallelControl("offload:4,arena2:8");
  ASSERT_EQ(defines.size(), 2u);
  EXPECT_EQ(defines["offload"], 4);
  EXPECT_EQ(defines["arena2"], 8);
}

TEST(OffloadPoolTest, IgnoresMalformedEntries) {
  auto defines =
      OffloadPool::ParseParallelControl("bad,:3,x:y,,offload:2,tail:");
  ASSERT_EQ(defines.size(), 1u);
  EXPECT_EQ(defines["offload"], 2);
  EXPECT_TRUE(OffloadPool::ParseParallelControl("").empty());
}

TEST(OffloadPoolTest, ExplicitConcurrencyWins) {
  OffloadPool pool("offload_test_explicit", 3);
  EXPECT_EQ(pool.Concurrency(), 3);
  EXPECT_EQ(pool.Name(), "offload_test_explicit");
}

TEST(OffloadPoolTest, WaitBlocksUntilAllTasksRan) {
  OffloadPool pool("offload_test_wait", 4);
  std::atomic<int> done{0};
  for (int i = 0; i < 32; ++i) {
    pool.Submit([&done]() {
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
      done.fetch_add(1);
    });
  }
  pool.Wait();
  EXPECT_EQ(done.load(), 32);
  EXPECT_EQ(pool.Pending(), 0u);
}

TEST(OffloadPoolTest, ConcurrencyIsBounded) {
  OffloadPool pool("offload_test_bound", 2);
  std::atomic<int> active{0};
  std::atomic<int> peak{0};
  for (int i = 0; i < 16; ++i) {
    pool.Submit([&active, &peak]() {
      int now = active.fetch_add(1) + 1;
      int seen = peak.load();
      while (now > seen && !peak.compare_exchange_weak(seen, now)) {
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
      active.fetch_sub(1);
    });
  }
  pool.Wait();
  EXPECT_GE(peak.load(), 1);
  EXPECT_LE(peak.load(), 2);
}

TEST(OffloadPoolTest, ThrowingTaskDoesNotBreakWait) {
  OffloadPool pool("offload_test_throw", 2);
  std::atomic<bool> ran{false};
  pool.Submit([]() { throw std::runtime_error("transfer blew up"); });
  pool.Submit([&ran]() { ran = true; });
  pool.Wait();
  EXPECT_TRUE(ran.load());
}

}  // namespace
}  // namespace utils
}  // namespace fetcher
