/**
 * @file test_oneshot.cpp
 * @brief Unit tests for the oneshot channel
 */

#include "kasync/oneshot.hpp"

#include "kasync_test_support.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <thread>

using namespace kasync;

TEST(OneshotTest, SendBeforePollResolvesImmediately)
{
   auto [tx, rx] = oneshot::channel<int>();

   EXPECT_TRUE(tx.send(42).is_ok());
   EXPECT_TRUE(tx.is_complete());

   auto polled = poll_once(rx);
   ASSERT_TRUE(polled.is_ready());
   auto outcome = polled.take();
   ASSERT_TRUE(outcome.is_ok());
   EXPECT_EQ(outcome.value(), 42);
}

TEST(OneshotTest, PendingReceiverIsWokenBySend)
{
   auto [tx, rx] = oneshot::channel<std::string>();
   test::CountingWaker cw;

   EXPECT_TRUE(test::poll_with(rx, cw.waker).is_pending());
   EXPECT_EQ(cw.wakes(), 0);

   EXPECT_TRUE(tx.send("hello").is_ok());
   EXPECT_EQ(cw.wakes(), 1);

   auto polled = test::poll_with(rx, cw.waker);
   ASSERT_TRUE(polled.is_ready());
   EXPECT_EQ(polled.take().value(), "hello");
}

TEST(OneshotTest, LatestRegisteredWakerWins)
{
   auto [tx, rx] = oneshot::channel<int>();
   test::CountingWaker first;
   test::CountingWaker second;

   EXPECT_TRUE(test::poll_with(rx, first.waker).is_pending());
   EXPECT_TRUE(test::poll_with(rx, second.waker).is_pending());

   EXPECT_TRUE(tx.send(1).is_ok());
   EXPECT_EQ(first.wakes(), 0);
   EXPECT_EQ(second.wakes(), 1);
}

TEST(OneshotTest, SecondSendIsRejectedWithTheValue)
{
   auto [tx, rx] = oneshot::channel<std::unique_ptr<int>>();

   EXPECT_TRUE(tx.send(std::make_unique<int>(1)).is_ok());

   auto rejected = tx.send(std::make_unique<int>(2));
   ASSERT_TRUE(rejected.is_err());
   ASSERT_TRUE(rejected.error() != nullptr);
   EXPECT_EQ(*rejected.error(), 2) << "The rejected value is handed back";

   auto polled = poll_once(rx);
   ASSERT_TRUE(polled.is_ready());
   EXPECT_EQ(*polled.take().value(), 1) << "First value is kept";
}

TEST(OneshotTest, DroppedSenderCancelsReceiver)
{
   auto [tx, rx] = oneshot::channel<int>();
   test::CountingWaker cw;

   EXPECT_TRUE(test::poll_with(rx, cw.waker).is_pending());
   {
      auto dropped = std::move(tx);
   }
   EXPECT_EQ(cw.wakes(), 1) << "Closing wakes the receiver";

   auto polled = test::poll_with(rx, cw.waker);
   ASSERT_TRUE(polled.is_ready());
   EXPECT_TRUE(polled.take().is_err());
}

TEST(OneshotTest, DroppedSenderAfterSendStillDelivers)
{
   auto [tx, rx] = oneshot::channel<int>();
   {
      auto sender = std::move(tx);
      EXPECT_TRUE(sender.send(9).is_ok());
   }

   auto polled = poll_once(rx);
   ASSERT_TRUE(polled.is_ready());
   auto outcome = polled.take();
   ASSERT_TRUE(outcome.is_ok());
   EXPECT_EQ(outcome.value(), 9);
}

TEST(OneshotTest, SendToDroppedReceiverSucceeds)
{
   auto [tx, rx] = oneshot::channel<int>();
   {
      auto receiver = std::move(rx);
   }
   EXPECT_TRUE(tx.send(3).is_ok());
}

TEST(OneshotTest, SendFromAnotherThread)
{
   auto [tx, rx] = oneshot::channel<int>();
   std::atomic<bool> woken{false};
   Waker waker = make_waker([&woken] { woken.store(true); });

   EXPECT_TRUE(test::poll_with(rx, waker).is_pending());

   std::thread producer([sender = std::move(tx)]() mutable { (void)sender.send(77); });
   producer.join();

   EXPECT_TRUE(woken.load());
   auto polled = test::poll_with(rx, waker);
   ASSERT_TRUE(polled.is_ready());
   EXPECT_EQ(polled.take().value(), 77);
}
