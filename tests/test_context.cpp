/**
 * @file test_context.cpp
 * @brief Tests for Context cancellation and deadlines.
 */
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <thread>

#include "wrpzmq/context.hpp"
#include "wrpzmq/errors.hpp"

using namespace std::chrono_literals;
using wrpzmq::Context;
using wrpzmq::errc;

TEST(Context, BackgroundNeverDone) {
  Context ctx;
  EXPECT_FALSE(ctx.done());
  EXPECT_FALSE(ctx.err());
  EXPECT_FALSE(ctx.deadline().has_value());
  ctx.cancel();
  EXPECT_FALSE(ctx.done());
}

TEST(Context, CancelSharedAcrossCopies) {
  auto a = Context::with_cancel();
  Context b = a;
  int fired = 0;
  b.on_cancel([&fired] { ++fired; });
  a.cancel();
  a.cancel();
  EXPECT_TRUE(b.done());
  EXPECT_EQ(b.err(), errc::canceled);
  EXPECT_EQ(fired, 1);
}

TEST(Context, OnCancel_AfterCancelFiresImmediately) {
  auto ctx = Context::with_cancel();
  ctx.cancel();
  bool fired = false;
  ctx.on_cancel([&fired] { fired = true; });
  EXPECT_TRUE(fired);
}

TEST(Context, OnCancel_Unregistered) {
  auto ctx = Context::with_cancel();
  bool fired = false;
  auto unregister = ctx.on_cancel([&fired] { fired = true; });
  unregister();
  ctx.cancel();
  EXPECT_FALSE(fired);
}

TEST(Context, Deadline) {
  auto ctx = Context::with_timeout(30ms);
  ASSERT_TRUE(ctx.deadline().has_value());
  EXPECT_FALSE(ctx.done());
  EXPECT_TRUE(ctx.wait_for(5s));
  EXPECT_EQ(ctx.err(), errc::deadline_exceeded);
}

TEST(Context, WaitFor_WokenByCancel) {
  auto ctx = Context::with_cancel();
  std::thread canceller([ctx] {
    std::this_thread::sleep_for(20ms);
    ctx.cancel();
  });
  auto start = std::chrono::steady_clock::now();
  EXPECT_TRUE(ctx.wait_for(10s));
  EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
  canceller.join();
}

TEST(Context, WaitFor_TimesOut) {
  auto ctx = Context::with_cancel();
  EXPECT_FALSE(ctx.wait_for(10ms));
}
