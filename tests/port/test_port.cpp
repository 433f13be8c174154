/**
 * @file test_port.cpp
 * @brief Unit tests for the port layer (Boost.Context simulation)
 */

#include "kasync/port.h"
#include "kasync/port_traits.h"

#include <gtest/gtest.h>

#include <atomic>
#include <cstdint>
#include <thread>
#include <vector>

/* ============================================================================
 * Test Fixtures
 * ========================================================================= */

class PortTest : public ::testing::Test
{
protected:
   static constexpr size_t stack_size = 64 * 1024;

   void SetUp() override
   {
      kasync_port_set_core_id(0);
      kasync_port_time_reset(0);
      kasync_port_time_register_isr_handler(nullptr, nullptr);
   }

   void TearDown() override
   {
      kasync_port_time_register_isr_handler(nullptr, nullptr);
      kasync_port_time_reset(0);
   }
};

struct ContextStorage
{
   alignas(KASYNC_PORT_CONTEXT_ALIGN) uint8_t bytes[KASYNC_PORT_CONTEXT_SIZE];
   kasync_port_context_t* get() { return reinterpret_cast<kasync_port_context_t*>(bytes); }
};

/* ============================================================================
 * Context Switching Tests
 * ========================================================================= */

TEST_F(PortTest, ContextRunsEntryAndFinishes)
{
   std::vector<uint8_t> stack(stack_size);
   ContextStorage storage;
   auto* context = storage.get();

   bool entry_called = false;
   auto entry = [](void* arg) { *static_cast<bool*>(arg) = true; };

   kasync_port_context_init(context, stack.data(), stack_size, entry, &entry_called);
   EXPECT_FALSE(kasync_port_context_finished(context));

   kasync_port_switch(nullptr, context);

   EXPECT_TRUE(entry_called);
   EXPECT_TRUE(kasync_port_context_finished(context));

   kasync_port_context_destroy(context);
}

TEST_F(PortTest, ContextSwitchingInterleaves)
{
   std::vector<uint8_t> stack1(stack_size);
   std::vector<uint8_t> stack2(stack_size);
   ContextStorage s1, s2;
   auto* ctx1 = s1.get();
   auto* ctx2 = s2.get();

   auto entry1 = [](void* arg)
   {
      auto* steps = static_cast<int*>(arg);
      steps[0] = ++steps[2];  // step1 = 1
      kasync_port_yield();
      steps[0] = ++steps[2];  // step1 = 3
   };

   auto entry2 = [](void* arg)
   {
      auto* steps = static_cast<int*>(arg);
      steps[1] = ++steps[2];  // step2 = 2
      kasync_port_yield();
      steps[1] = ++steps[2];  // step2 = 4
   };

   int steps[3] = {0, 0, 0};  // [step1, step2, execution_order]

   kasync_port_context_init(ctx1, stack1.data(), stack_size, entry1, steps);
   kasync_port_context_init(ctx2, stack2.data(), stack_size, entry2, steps);

   kasync_port_switch(nullptr, ctx1);
   EXPECT_EQ(steps[0], 1);

   kasync_port_switch(nullptr, ctx2);
   EXPECT_EQ(steps[1], 2);

   kasync_port_switch(nullptr, ctx1);
   EXPECT_EQ(steps[0], 3);

   kasync_port_switch(nullptr, ctx2);
   EXPECT_EQ(steps[1], 4);

   EXPECT_TRUE(kasync_port_context_finished(ctx1));
   EXPECT_TRUE(kasync_port_context_finished(ctx2));
   kasync_port_context_destroy(ctx1);
   kasync_port_context_destroy(ctx2);
}

TEST_F(PortTest, YieldOutsideContextIsNoop)
{
   kasync_port_yield();
   SUCCEED();
}

/* ============================================================================
 * Block / Unblock Tests
 * ========================================================================= */

TEST_F(PortTest, UnblockBeforeBlockIsNotLost)
{
   auto* self = kasync_port_thread_current();
   ASSERT_NE(self, nullptr);

   kasync_port_thread_unblock(self);
   kasync_port_thread_block();  // Consumes the early unblock and returns

   SUCCEED();
}

TEST_F(PortTest, BlockedFiberResumesAfterUnblock)
{
   std::vector<uint8_t> stack(stack_size);
   ContextStorage storage;
   auto* context = storage.get();

   struct Shared
   {
      kasync_port_thread_t* handle{nullptr};
      int progress{0};
   } shared;

   auto entry = [](void* arg)
   {
      auto* s = static_cast<Shared*>(arg);
      s->handle = kasync_port_thread_current();
      s->progress = 1;
      kasync_port_thread_block();
      s->progress = 2;
   };

   kasync_port_context_init(context, stack.data(), stack_size, entry, &shared);

   // Blocking inside the fiber hands control back to us
   kasync_port_switch(nullptr, context);
   EXPECT_EQ(shared.progress, 1);
   ASSERT_NE(shared.handle, nullptr);
   EXPECT_NE(shared.handle, kasync_port_thread_current()) << "Fiber must have its own park token";

   // Still blocked: resuming without an unblock yields straight back
   kasync_port_switch(nullptr, context);
   EXPECT_EQ(shared.progress, 1);

   kasync_port_thread_unblock(shared.handle);
   kasync_port_switch(nullptr, context);
   EXPECT_EQ(shared.progress, 2);
   EXPECT_TRUE(kasync_port_context_finished(context));

   kasync_port_context_destroy(context);
}

TEST_F(PortTest, UnblockFromAnotherThread)
{
   auto* self = kasync_port_thread_current();

   std::thread waker([self] { kasync_port_thread_unblock(self); });
   kasync_port_thread_block();
   waker.join();

   SUCCEED();
}

/* ============================================================================
 * Core ID Tests
 * ========================================================================= */

TEST_F(PortTest, CoreIdentification)
{
   EXPECT_EQ(kasync_port_get_core_id(), 0u);

   kasync_port_set_core_id(1);
   EXPECT_EQ(kasync_port_get_core_id(), 1u);

   // Core id is per pthread
   uint32_t other = 99;
   std::thread t([&other] { other = kasync_port_get_core_id(); });
   t.join();
   EXPECT_EQ(other, 0u);

   kasync_port_set_core_id(0);
}

/* ============================================================================
 * Interrupt Control Tests
 * ========================================================================= */

TEST_F(PortTest, InterruptSaveRestoreNests)
{
   EXPECT_TRUE(kasync_port_interrupts_enabled());

   uint32_t outer = kasync_port_irq_save();
   EXPECT_FALSE(kasync_port_interrupts_enabled());

   uint32_t inner = kasync_port_irq_save();
   EXPECT_FALSE(kasync_port_interrupts_enabled());

   kasync_port_irq_restore(inner);
   EXPECT_FALSE(kasync_port_interrupts_enabled()) << "Still disabled (nested)";

   kasync_port_irq_restore(outer);
   EXPECT_TRUE(kasync_port_interrupts_enabled());
}

TEST_F(PortTest, IrqDispatchRunsHandlerWithInterruptsMasked)
{
   struct Seen
   {
      int calls{0};
      bool masked{false};
   } seen;

   auto handler = [](void* arg)
   {
      auto* s = static_cast<Seen*>(arg);
      ++s->calls;
      s->masked = !kasync_port_interrupts_enabled();
   };

   constexpr uint32_t irq = 5;
   EXPECT_FALSE(kasync_port_irq_dispatch(irq)) << "No handler registered yet";

   ASSERT_TRUE(kasync_port_irq_register_handler(irq, handler, &seen));
   EXPECT_TRUE(kasync_port_irq_dispatch(irq));
   EXPECT_EQ(seen.calls, 1);
   EXPECT_TRUE(seen.masked);
   EXPECT_TRUE(kasync_port_interrupts_enabled());

   kasync_port_irq_unregister_handler(irq);
   EXPECT_FALSE(kasync_port_irq_dispatch(irq));
   EXPECT_EQ(seen.calls, 1);

   EXPECT_FALSE(kasync_port_irq_register_handler(KASYNC_PORT_IRQ_COUNT, handler, &seen));
}

/* ============================================================================
 * Virtual Time Tests
 * ========================================================================= */

TEST_F(PortTest, TimeAdvancesOnlyWhenTold)
{
   EXPECT_EQ(kasync_port_time_freq_hz(), 1'000'000u);
   EXPECT_EQ(kasync_port_time_now(), 0u);

   kasync_port_time_advance(100);
   EXPECT_EQ(kasync_port_time_now(), 100u);

   kasync_port_time_advance(50);
   EXPECT_EQ(kasync_port_time_now(), 150u);
}

TEST_F(PortTest, ArmedDeadlineFiresOnce)
{
   std::atomic<int> fired{0};
   kasync_port_time_register_isr_handler(
      [](void* arg) { static_cast<std::atomic<int>*>(arg)->fetch_add(1); }, &fired);

   kasync_port_time_arm(100);
   kasync_port_time_advance(99);
   EXPECT_EQ(fired.load(), 0);

   kasync_port_time_advance(1);
   EXPECT_EQ(fired.load(), 1);

   // One-shot: consumed by the delivery
   kasync_port_time_advance(1000);
   EXPECT_EQ(fired.load(), 1);
}

TEST_F(PortTest, ArmKeepsEarliestAndDisarmClears)
{
   std::atomic<int> fired{0};
   kasync_port_time_register_isr_handler(
      [](void* arg) { static_cast<std::atomic<int>*>(arg)->fetch_add(1); }, &fired);

   kasync_port_time_arm(500);
   kasync_port_time_arm(200);
   kasync_port_time_arm(800);

   kasync_port_time_advance(200);
   EXPECT_EQ(fired.load(), 1) << "Earliest armed deadline wins";

   kasync_port_time_arm(300);
   kasync_port_time_disarm();
   kasync_port_time_advance(500);
   EXPECT_EQ(fired.load(), 1);
}
