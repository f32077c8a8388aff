#include <gtest/gtest.h>

#include "core/cancel_token.h"
#include "core/execution_guard.h"

#include <atomic>
#include <thread>
#include <vector>

using namespace dsa::core;

TEST(CancelTokenTest, OnlyFirstRequestFlipsTheFlag) {
  auto token = CancelToken::create();
  EXPECT_FALSE(token->is_canceled());
  EXPECT_TRUE(token->request_cancel());
  EXPECT_FALSE(token->request_cancel());
  EXPECT_TRUE(token->is_canceled());
}

TEST(CancelTokenTest, ConcurrentRequestsHaveOneWinner) {
  auto token = CancelToken::create();
  std::atomic<int> winners{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&] {
      if (token->request_cancel()) {
        ++winners;
      }
    });
  }
  for (auto &t : threads) {
    t.join();
  }
  EXPECT_EQ(winners.load(), 1);
}

TEST(ExecutionGuardTest, LeaseIsExclusiveAndReleasesOnScopeExit) {
  ExecutionGuard guard;
  {
    ExecutionGuard::Lease first(guard);
    EXPECT_TRUE(first.owns());
    EXPECT_TRUE(guard.is_locked());

    ExecutionGuard::Lease second(guard);
    EXPECT_FALSE(second.owns());
    EXPECT_TRUE(guard.is_locked());
  }
  EXPECT_FALSE(guard.is_locked());
  EXPECT_TRUE(guard.try_acquire());
  EXPECT_FALSE(guard.try_acquire());
  guard.release();
  EXPECT_FALSE(guard.is_locked());
}
