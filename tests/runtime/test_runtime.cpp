/**
 * @file test_runtime.cpp
 * @brief Runtime singleton, its executors and the timer/reactor idle driver
 */

#include "kasync/backends.hpp"
#include "kasync/port.h"
#include "kasync/runtime.hpp"

#include <gtest/gtest.h>

#include <optional>
#include <thread>

using namespace kasync;

/* ============================================================================
 * Test Fixtures
 * ========================================================================= */

class RuntimeTest : public ::testing::Test
{
protected:
   void SetUp() override
   {
      // The runtime registered its timer ISR when it was created
      Runtime::instance();
      kasync_port_time_reset(0);
   }

   void TearDown() override
   {
      EXPECT_TRUE(timers().empty()) << "Test left timers behind";
      kasync_port_time_reset(0);
   }

   // Drain the global executor, then move virtual time forward
   static void run_then_advance(Duration step)
   {
      kasync::run();
      kasync_port_time_advance(step.value);
   }
};

/* ============================================================================
 * Construction
 * ========================================================================= */

TEST_F(RuntimeTest, InstanceIsCreatedOnce)
{
   EXPECT_TRUE(Runtime::is_initialized());

   Runtime& first = Runtime::instance();
   Runtime& second = Runtime::instance();
   EXPECT_EQ(&first, &second);
}

TEST_F(RuntimeTest, LateInitDiscardsBackend)
{
   Runtime& again = Runtime::init(std::make_unique<io::LoopbackBackend>());
   EXPECT_EQ(&again, &Runtime::instance());
   EXPECT_EQ(dynamic_cast<io::LoopbackBackend*>(&again.reactor().backend()), nullptr)
      << "The default synchronous backend stays in place";
}

TEST_F(RuntimeTest, ConcurrentFirstCallersAgree)
{
   Runtime* seen[4] = {};
   std::thread threads[4];
   for (int i = 0; i < 4; ++i) {
      threads[i] = std::thread([&seen, i] { seen[i] = &Runtime::instance(); });
   }
   for (auto& t : threads) t.join();

   for (auto* rt : seen) EXPECT_EQ(rt, &Runtime::instance());
}

TEST_F(RuntimeTest, OneExecutorPerCore)
{
   Runtime& rt = Runtime::instance();
   EXPECT_NE(&rt.core_executor(0), &rt.core_executor(1));
   EXPECT_NE(&rt.core_executor(0), &rt.global_executor());

   Executor* core1 = nullptr;
   std::thread t([&] {
      kasync_port_set_core_id(1);
      core1 = &Runtime::instance().local_executor();
   });
   t.join();
   EXPECT_EQ(core1, &rt.core_executor(1));
}

TEST_F(RuntimeTest, AccessorsShareTheRuntimeParts)
{
   EXPECT_EQ(&reactor(), &Runtime::instance().reactor());
   EXPECT_EQ(&timers(), &Runtime::instance().timers());
}

/* ============================================================================
 * Spawning
 * ========================================================================= */

TEST_F(RuntimeTest, SpawnedTasksRunOnTheGlobalExecutor)
{
   int ran = 0;
   auto handle = spawn(poll_fn([&](Context&) -> Poll<int> {
      ++ran;
      return 7;
   }));
   EXPECT_EQ(ran, 0);

   kasync::run();
   EXPECT_EQ(ran, 1);

   auto result = kasync::block_on(std::move(handle));
   ASSERT_TRUE(result.is_completed());
   EXPECT_EQ(result.value(), 7);
}

TEST_F(RuntimeTest, SpawnLocalUsesTheCoreExecutor)
{
   bool ran = false;
   (void)spawn_local(poll_fn([&](Context&) -> Poll<> {
      ran = true;
      return Poll<>::ready();
   }));

   kasync::run();
   EXPECT_FALSE(ran) << "The global executor does not see core-local tasks";

   run_local();
   EXPECT_TRUE(ran);
}

/* ============================================================================
 * Timers through the runtime
 * ========================================================================= */

TEST_F(RuntimeTest, SleepResumesWhenTimeAdvances)
{
   bool woke = false;
   (void)spawn(poll_fn([&, nap = std::optional<Sleep>{}](Context& cx) mutable -> Poll<> {
      if (!nap) nap.emplace(kasync::sleep(Duration::from_millis(5)));
      if (nap->poll(cx).is_pending()) return pending;
      woke = true;
      return Poll<>::ready();
   }));

   run_then_advance(Duration::from_millis(4));
   kasync::run();
   EXPECT_FALSE(woke);
   EXPECT_EQ(timers().len(), 1u);

   kasync_port_time_advance(Duration::from_millis(1).value);
   EXPECT_EQ(timers().len(), 0u) << "The alarm ISR expired the entry";

   kasync::run();
   EXPECT_TRUE(woke);
}

TEST_F(RuntimeTest, WakeAtUsesTheRuntimeQueue)
{
   int wakes = 0;
   auto counter = make_waker([&] { ++wakes; });
   EXPECT_TRUE(wake_at(now() + Duration::from_micros(50), counter));

   kasync_port_time_advance(49);
   EXPECT_EQ(wakes, 0);
   kasync_port_time_advance(1);
   EXPECT_EQ(wakes, 1);
}

TEST_F(RuntimeTest, TimeoutExpiresOnNeverReadyFuture)
{
   auto forever = poll_fn([](Context&) -> Poll<int> { return pending; });
   auto handle = spawn(kasync::timeout(forever, Duration::from_millis(10)));

   run_then_advance(Duration::from_millis(10));
   kasync::run();

   auto joined = poll_once(handle);
   ASSERT_TRUE(joined.is_ready());
   auto result = joined.take();
   ASSERT_TRUE(result.is_completed());
   EXPECT_TRUE(result.value().is_err()) << "Deadline reached first";
}

TEST_F(RuntimeTest, DriveExpiresTimersWithoutAnAlarm)
{
   int wakes = 0;
   EXPECT_TRUE(wake_at(now() + Duration::from_millis(1), make_waker([&] { ++wakes; })));

   // Time moves past the deadline without the one-shot being delivered
   kasync_port_time_reset(Duration::from_millis(2).value);
   EXPECT_EQ(wakes, 0);

   Runtime::instance().drive();
   EXPECT_EQ(wakes, 1);
}

/* ============================================================================
 * Reactor through the runtime
 * ========================================================================= */

TEST_F(RuntimeTest, BlockOnDeliversReactorCompletions)
{
   auto fut = reactor().submit_operation(io::WriteOp{nullptr, {1, 2, 3}});
   auto result = kasync::block_on(std::move(fut));
   ASSERT_TRUE(result.is_err());
   EXPECT_EQ(result.error().kind(), io::ErrorKind::InvalidInput);
   EXPECT_EQ(reactor().pending_count(), 0u);
}
