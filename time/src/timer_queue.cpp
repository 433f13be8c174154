/**
 * @file timer_queue.cpp
 * @brief Timer queue, its interrupt driver and Sleep
 */

#include "kasync/timer_queue.hpp"
#include "kasync/port.h"

#include "DEBUG_PRINT.hpp"

namespace kasync
{

bool TimerQueue::set(TimePoint deadline, Waker waker)
{
   SpinlockGuard guard(lock);

   const bool stored = heap.push(Entry{
      .deadline = deadline,
      .sequence = next_sequence++,
      .waker    = std::move(waker),
   });

   if (!stored) {
      ++dropped;
      LOG_TIMER("TimerQueue @%p full, dropped deadline %llu (%llu dropped so far)",
                static_cast<void*>(this),
                static_cast<unsigned long long>(deadline.value),
                static_cast<unsigned long long>(dropped));
      return false;
   }

   if (drive_port_alarm && heap.top()->deadline == deadline) {
      kasync_port_time_arm(deadline.value);
   }
   return true;
}

std::optional<TimerQueue::Entry> TimerQueue::expire_one(TimePoint now)
{
   SpinlockGuard guard(lock);

   auto const* earliest = heap.top();
   if (!earliest || earliest->deadline > now) return std::nullopt;
   return heap.pop_min();
}

std::size_t TimerQueue::len() const
{
   SpinlockGuard guard(lock);
   return heap.size();
}

bool TimerQueue::empty() const
{
   SpinlockGuard guard(lock);
   return heap.empty();
}

std::optional<TimePoint> TimerQueue::next_deadline() const
{
   SpinlockGuard guard(lock);
   auto const* earliest = heap.top();
   if (!earliest) return std::nullopt;
   return earliest->deadline;
}

void TimerQueue::rearm()
{
   if (!drive_port_alarm) return;

   // arm() only ever moves the alarm earlier; start over from the queue head
   kasync_port_time_disarm();
   if (auto next = next_deadline()) {
      kasync_port_time_arm(next->value);
   }
}

void TimerQueue::on_timer_isr(void* arg) noexcept
{
   auto* timers = static_cast<TimerQueue*>(arg);
   check_timer_events(*timers, now());
}

std::size_t check_timer_events(TimerQueue& timers, TimePoint now)
{
   std::size_t fired = 0;

   // Each entry is popped under the lock and woken outside it
   while (auto entry = timers.expire_one(now)) {
      LOG_TIMER("deadline %llu expired at %llu",
                static_cast<unsigned long long>(entry->deadline.value),
                static_cast<unsigned long long>(now.value));
      entry->waker.wake();
      ++fired;
   }

   timers.rearm();
   return fired;
}

Poll<> Sleep::poll(Context& cx)
{
   if (now() >= wake_deadline) return Poll<>::ready();

   if (!registered || !registered->will_wake(cx.waker())) {
      registered = cx.waker();
      // A full queue drops the registration; the sleep then only completes
      // when something else polls it past the deadline
      (void)timers->set(wake_deadline, cx.waker());
   }
   return pending;
}

} // namespace kasync
