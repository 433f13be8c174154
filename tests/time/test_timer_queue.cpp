/**
 * @file test_timer_queue.cpp
 * @brief Unit tests for the bounded timer queue and its interrupt driver
 */

#include "kasync/timer_queue.hpp"
#include "kasync/port.h"

#include "kasync_test_support.hpp"

#include <gtest/gtest.h>

#include <vector>

using namespace kasync;

/* ============================================================================
 * Test Fixtures
 * ========================================================================= */

class TimerQueueTest : public test::VirtualTimeTest
{
protected:
   TimerQueue timers;
};

/* ============================================================================
 * Duration / TimePoint
 * ========================================================================= */

TEST(TimeTest, ConversionsUseThePortRate)
{
   EXPECT_EQ(Duration::from_secs(2).value, 2'000'000u);
   EXPECT_EQ(Duration::from_millis(5).value, 5'000u);
   EXPECT_EQ(Duration::from_micros(7).value, 7u);
   EXPECT_EQ(Duration::from_millis(1500).as_millis(), 1500u);
}

TEST(TimeTest, DeadlineArithmeticSaturates)
{
   EXPECT_EQ((TimePoint{10} + Duration{5}).value, 15u);
   EXPECT_EQ(TimePoint::max() + Duration{1}, TimePoint::max());
   EXPECT_EQ((TimePoint{3} - TimePoint{10}).value, 0u);
   EXPECT_EQ((TimePoint{10} - TimePoint{3}).value, 7u);
}

/* ============================================================================
 * Queue behaviour
 * ========================================================================= */

TEST_F(TimerQueueTest, ExpireOnlyReturnsDueEntries)
{
   test::CountingWaker cw;
   EXPECT_TRUE(timers.set(TimePoint{100}, cw.waker));

   EXPECT_FALSE(timers.expire_one(TimePoint{99}).has_value());

   auto entry = timers.expire_one(TimePoint{100});
   ASSERT_TRUE(entry.has_value());
   EXPECT_EQ(entry->deadline, TimePoint{100});

   EXPECT_FALSE(timers.expire_one(TimePoint{1000}).has_value()) << "An entry is returned at most once";
   EXPECT_TRUE(timers.empty());
}

TEST_F(TimerQueueTest, EntriesExpireInDeadlineOrder)
{
   std::vector<int> order;
   for (int d : {300, 100, 200, 100}) {
      EXPECT_TRUE(timers.set(TimePoint(d), make_waker([d, &order] { order.push_back(d); })));
   }
   EXPECT_EQ(timers.len(), 4u);
   ASSERT_TRUE(timers.next_deadline().has_value());
   EXPECT_EQ(*timers.next_deadline(), TimePoint{100});

   EXPECT_EQ(check_timer_events(timers, TimePoint{250}), 3u);
   EXPECT_EQ(order, (std::vector<int>{100, 100, 200}));

   EXPECT_EQ(check_timer_events(timers, TimePoint{300}), 1u);
   EXPECT_TRUE(timers.empty());
}

TEST_F(TimerQueueTest, EqualDeadlinesFireInRegistrationOrder)
{
   std::vector<int> order;
   for (int i = 0; i < 5; ++i) {
      EXPECT_TRUE(timers.set(TimePoint{50}, make_waker([i, &order] { order.push_back(i); })));
   }

   check_timer_events(timers, TimePoint{50});
   EXPECT_EQ(order, (std::vector<int>{0, 1, 2, 3, 4}));
}

TEST_F(TimerQueueTest, FullQueueDropsRegistration)
{
   test::CountingWaker cw;
   for (std::size_t i = 0; i < config::TIMER_QUEUE_CAPACITY; ++i) {
      ASSERT_TRUE(timers.set(TimePoint(1000 + i), cw.waker));
   }

   EXPECT_FALSE(timers.set(TimePoint{1}, cw.waker)) << "Registration beyond capacity is dropped";
   EXPECT_EQ(timers.len(), config::TIMER_QUEUE_CAPACITY);
   EXPECT_EQ(*timers.next_deadline(), TimePoint{1000}) << "Dropped entry never entered the heap";

   EXPECT_EQ(check_timer_events(timers, TimePoint::max()), config::TIMER_QUEUE_CAPACITY);
   EXPECT_EQ(cw.wakes(), static_cast<int>(config::TIMER_QUEUE_CAPACITY));

   EXPECT_TRUE(timers.set(TimePoint{1}, cw.waker)) << "Space is reusable after draining";
}

TEST_F(TimerQueueTest, CheckWithNothingDueFiresNothing)
{
   test::CountingWaker cw;
   EXPECT_TRUE(timers.set(TimePoint{500}, cw.waker));

   EXPECT_EQ(check_timer_events(timers, TimePoint{499}), 0u);
   EXPECT_EQ(cw.wakes(), 0);
   EXPECT_EQ(timers.len(), 1u);
}

TEST_F(TimerQueueTest, WakeAtIsAnAliasOfSet)
{
   test::CountingWaker cw;
   EXPECT_TRUE(wake_at(timers, TimePoint{5}, cw.waker));
   check_timer_events(timers, TimePoint{5});
   EXPECT_EQ(cw.wakes(), 1);
}

/* ============================================================================
 * Port alarm driving
 * ========================================================================= */

class TimerQueueAlarmTest : public test::VirtualTimeTest
{
protected:
   void SetUp() override
   {
      test::VirtualTimeTest::SetUp();
      kasync_port_time_register_isr_handler(&TimerQueue::on_timer_isr, &timers);
   }

   TimerQueue timers{true};
};

TEST_F(TimerQueueAlarmTest, AlarmFiresFromAdvance)
{
   test::CountingWaker cw;
   EXPECT_TRUE(timers.set(TimePoint{100}, cw.waker));

   kasync_port_time_advance(99);
   EXPECT_EQ(cw.wakes(), 0);

   kasync_port_time_advance(1);
   EXPECT_EQ(cw.wakes(), 1);
   EXPECT_TRUE(timers.empty());
}

TEST_F(TimerQueueAlarmTest, AlarmIsRearmedForNextDeadline)
{
   test::CountingWaker early;
   test::CountingWaker late;
   EXPECT_TRUE(timers.set(TimePoint{200}, late.waker));
   EXPECT_TRUE(timers.set(TimePoint{100}, early.waker));

   kasync_port_time_advance(150);
   EXPECT_EQ(early.wakes(), 1);
   EXPECT_EQ(late.wakes(), 0);

   kasync_port_time_advance(50);
   EXPECT_EQ(late.wakes(), 1);
}

TEST_F(TimerQueueAlarmTest, DrainingFromIdlePathLeavesNoStaleAlarm)
{
   test::CountingWaker first;
   test::CountingWaker second;
   EXPECT_TRUE(timers.set(TimePoint{100}, first.waker));

   // Idle path drains the entry before the alarm is delivered
   check_timer_events(timers, TimePoint{100});
   EXPECT_EQ(first.wakes(), 1);

   EXPECT_TRUE(timers.set(TimePoint{300}, second.waker));
   kasync_port_time_advance(200);
   EXPECT_EQ(second.wakes(), 0) << "No alarm left over for the drained deadline";

   kasync_port_time_advance(100);
   EXPECT_EQ(second.wakes(), 1);
}

TEST_F(TimerQueueAlarmTest, TimerIrqDispatchDrivesQueue)
{
   constexpr uint32_t irq = config::TIMER_IRQ;
   ASSERT_TRUE(kasync_port_irq_register_handler(irq, &TimerQueue::on_timer_isr, &timers));

   test::CountingWaker cw;
   EXPECT_TRUE(timers.set(TimePoint{10}, cw.waker));

   kasync_port_time_disarm();
   kasync_port_time_advance(10);
   EXPECT_EQ(cw.wakes(), 0);

   EXPECT_TRUE(kasync_port_irq_dispatch(irq));
   EXPECT_EQ(cw.wakes(), 1);

   kasync_port_irq_unregister_handler(irq);
}
