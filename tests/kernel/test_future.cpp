/**
 * @file test_future.cpp
 * @brief Unit tests for Poll, Waker, Result, the basic futures and Spinlock
 */

#include "kasync/future.hpp"
#include "kasync/kernel.hpp"
#include "kasync/result.hpp"
#include "kasync/port.h"

#include "kasync_test_support.hpp"

#include <gtest/gtest.h>

#include <string>
#include <thread>
#include <vector>

using namespace kasync;

/* ============================================================================
 * Poll
 * ========================================================================= */

TEST(PollTest, PendingAndReady)
{
   Poll<int> p = pending;
   EXPECT_TRUE(p.is_pending());
   EXPECT_FALSE(p.is_ready());

   Poll<int> r = 42;
   ASSERT_TRUE(r.is_ready());
   EXPECT_EQ(*r, 42);
   EXPECT_EQ(r.take(), 42);
   EXPECT_TRUE(r.is_pending()) << "take() empties the Poll";

   Poll<> unit = pending;
   EXPECT_TRUE(unit.is_pending());
   EXPECT_TRUE(Poll<>::ready().is_ready());
}

/* ============================================================================
 * Waker
 * ========================================================================= */

TEST(WakerTest, EmptyWakerIsNoop)
{
   Waker waker;
   EXPECT_FALSE(waker);
   waker.wake_by_ref();
   waker.wake();
   EXPECT_TRUE(noop_waker().will_wake(Waker{}));
}

TEST(WakerTest, WakeByRefKeepsHandle)
{
   test::CountingWaker cw;

   cw.waker.wake_by_ref();
   cw.waker.wake_by_ref();
   EXPECT_EQ(cw.wakes(), 2);
   EXPECT_TRUE(cw.waker);
}

TEST(WakerTest, WakeConsumesHandle)
{
   test::CountingWaker cw;
   Waker clone = cw.waker;

   clone.wake();
   EXPECT_EQ(cw.wakes(), 1);
   EXPECT_FALSE(clone) << "wake() releases the handle";

   clone.wake();
   EXPECT_EQ(cw.wakes(), 1);
}

TEST(WakerTest, ClonesWakeTheSameTarget)
{
   test::CountingWaker a;
   test::CountingWaker b;
   Waker clone = a.waker;

   EXPECT_TRUE(clone.will_wake(a.waker));
   EXPECT_FALSE(clone.will_wake(b.waker));
}

TEST(WakerTest, ClonesKeepTargetAlive)
{
   std::weak_ptr<test::CountingWakeable> observer;
   Waker survivor;
   {
      test::CountingWaker cw;
      observer = cw.target;
      survivor = cw.waker;
   }
   EXPECT_FALSE(observer.expired());

   survivor = Waker{};
   EXPECT_TRUE(observer.expired());
}

TEST(WakerTest, MakeWakerRunsCallable)
{
   int calls = 0;
   Waker waker = make_waker([&calls] { ++calls; });

   waker.wake_by_ref();
   waker.wake();
   EXPECT_EQ(calls, 2);
}

/* ============================================================================
 * Basic futures
 * ========================================================================= */

TEST(FutureTest, ReadyResolvesImmediately)
{
   auto f = ready(std::string("done"));
   auto polled = poll_once(f);
   ASSERT_TRUE(polled.is_ready());
   EXPECT_EQ(polled.take(), "done");
}

TEST(FutureTest, YieldNowRequestsOneRepoll)
{
   test::CountingWaker cw;
   auto f = yield_now();

   EXPECT_TRUE(test::poll_with(f, cw.waker).is_pending());
   EXPECT_EQ(cw.wakes(), 1);

   EXPECT_TRUE(test::poll_with(f, cw.waker).is_ready());
   EXPECT_EQ(cw.wakes(), 1);
}

TEST(FutureTest, PollFnCountsDown)
{
   int remaining = 3;
   auto f = poll_fn([&remaining](Context&) -> Poll<int> {
      if (--remaining > 0) return pending;
      return 7;
   });

   EXPECT_TRUE(poll_once(f).is_pending());
   EXPECT_TRUE(poll_once(f).is_pending());
   auto last = poll_once(f);
   ASSERT_TRUE(last.is_ready());
   EXPECT_EQ(*last, 7);
}

static_assert(Future<YieldNow>);
static_assert(Future<Ready<int>>);

/* ============================================================================
 * Result
 * ========================================================================= */

struct Failure
{
   int code;
};

TEST(ResultTest, HoldsValueOrError)
{
   Result<int, Failure> good = 5;
   ASSERT_TRUE(good.is_ok());
   EXPECT_EQ(good.value(), 5);
   EXPECT_TRUE(static_cast<bool>(good));

   auto bad = Result<int, Failure>::err(Failure{9});
   ASSERT_TRUE(bad.is_err());
   EXPECT_EQ(bad.error().code, 9);
   EXPECT_EQ(bad.value_or(-1), -1);
}

TEST(ResultTest, VoidResult)
{
   auto ok = Result<void, Failure>::ok();
   EXPECT_TRUE(ok.is_ok());

   Result<void, Failure> bad = Failure{3};
   ASSERT_TRUE(bad.is_err());
   EXPECT_EQ(bad.error().code, 3);
}

TEST(ResultTest, MovesValueOut)
{
   Result<std::vector<int>, Failure> r = std::vector<int>{1, 2, 3};
   auto v = std::move(r).value();
   EXPECT_EQ(v.size(), 3u);
}

/* ============================================================================
 * Spinlock
 * ========================================================================= */

TEST(SpinlockTest, MasksInterruptsWhileHeld)
{
   Spinlock lock;
   EXPECT_TRUE(kasync_port_interrupts_enabled());
   {
      SpinlockGuard guard(lock);
      EXPECT_TRUE(lock.is_locked());
      EXPECT_FALSE(kasync_port_interrupts_enabled());
      EXPECT_FALSE(lock.try_lock());
   }
   EXPECT_FALSE(lock.is_locked());
   EXPECT_TRUE(kasync_port_interrupts_enabled());
}

TEST(SpinlockTest, ExcludesConcurrentThreads)
{
   Spinlock lock;
   long counter = 0;
   constexpr int per_thread = 20000;

   std::vector<std::thread> threads;
   for (int t = 0; t < 4; ++t) {
      threads.emplace_back([&] {
         for (int i = 0; i < per_thread; ++i) {
            SpinlockGuard guard(lock);
            ++counter;
         }
      });
   }
   for (auto& th : threads) th.join();

   EXPECT_EQ(counter, 4L * per_thread);
}
