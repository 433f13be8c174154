/**
 * @file timer_queue.hpp
 * @brief Deadline-ordered wake registrations, Sleep and Timeout
 *
 * The TimerQueue is a bounded min-heap of (deadline, waker) entries. When it
 * is full, further registrations are dropped: a caller that needs guaranteed
 * delivery under saturation must apply its own back-pressure.
 *
 * check_timer_events() is the driver: it expires every due entry and wakes
 * it. It runs from the timer interrupt (when the queue drives the port alarm)
 * or from an executor's idle path.
 */

#ifndef KASYNC_TIMER_QUEUE_HPP
#define KASYNC_TIMER_QUEUE_HPP

#include "kasync/future.hpp"
#include "kasync/kernel.hpp"
#include "kasync/result.hpp"
#include "kasync/time.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <type_traits>
#include <utility>

namespace kasync
{

/**
 * @brief Fixed-capacity binary min-heap
 *
 * @tparam Traits Provides Node, CAPACITY and earlier(a, b)
 */
template<typename Traits>
class BoundedMinHeap
{
public:
   using Node      = typename Traits::Node;
   using IndexType = uint16_t;

private:
   static constexpr IndexType CAPACITY = Traits::CAPACITY;
   std::array<Node, CAPACITY> heap_buffer{};
   IndexType size_count{0};

   static IndexType parent(IndexType i) noexcept { return (i - 1u) >> 1; }
   static IndexType left  (IndexType i) noexcept { return (i << 1) + 1u; }
   static IndexType right (IndexType i) noexcept { return (i << 1) + 2u; }

   bool earlier(IndexType a, IndexType b) const noexcept { return Traits::earlier(heap_buffer[a], heap_buffer[b]); }

   void sift_up(IndexType i) noexcept
   {
      while (i > 0) {
         IndexType p = parent(i);
         if (!earlier(i, p)) break;
         std::swap(heap_buffer[i], heap_buffer[p]);
         i = p;
      }
   }

   void sift_down(IndexType i) noexcept
   {
      while (true) {
         IndexType l = left(i), r = right(i), m = i;
         if (l < size_count && earlier(l, m)) m = l;
         if (r < size_count && earlier(r, m)) m = r;
         if (m == i) break;
         std::swap(heap_buffer[i], heap_buffer[m]);
         i = m;
      }
   }

public:
   [[nodiscard]] bool empty() const noexcept { return size_count == 0; }
   [[nodiscard]] bool full()  const noexcept { return size_count == CAPACITY; }
   [[nodiscard]] IndexType size() const noexcept { return size_count; }
   [[nodiscard]] Node const* top() const noexcept { return size_count ? &heap_buffer[0] : nullptr; }

   /**
    * @return false (node not stored) when the heap is full
    */
   bool push(Node node) noexcept
   {
      if (full()) return false;
      IndexType i = size_count++;
      heap_buffer[i] = std::move(node);
      sift_up(i);
      return true;
   }

   std::optional<Node> pop_min() noexcept
   {
      if (!size_count) return std::nullopt;
      Node n = std::move(heap_buffer[0]);
      --size_count;
      if (size_count) {
         heap_buffer[0] = std::move(heap_buffer[size_count]);
         sift_down(0);
      }
      heap_buffer[size_count] = Node{};
      return n;
   }
};

/* ============================================================================
 * TimerQueue
 * ========================================================================= */

class TimerQueue
{
public:
   struct Entry
   {
      TimePoint deadline{};
      uint64_t  sequence{0}; // FIFO among equal deadlines
      Waker     waker{};
   };

   /**
    * @param drive_port_alarm Arm the port one-shot for the earliest deadline
    */
   explicit TimerQueue(bool drive_port_alarm = false) noexcept : drive_port_alarm(drive_port_alarm) {}

   TimerQueue(TimerQueue const&)            = delete;
   TimerQueue& operator=(TimerQueue const&) = delete;

   /**
    * @brief Register a waker to fire at (or after) deadline
    * @return false if the queue is at capacity and the registration was dropped
    */
   bool set(TimePoint deadline, Waker waker);

   /**
    * @brief Remove and return the earliest entry if it is due at now
    */
   std::optional<Entry> expire_one(TimePoint now);

   [[nodiscard]] std::size_t len() const;
   [[nodiscard]] bool empty() const;
   [[nodiscard]] std::optional<TimePoint> next_deadline() const;

   /**
    * @brief Re-arm the port one-shot for the earliest pending deadline
    */
   void rearm();

   /**
    * @brief Port ISR entry point; arg is the TimerQueue
    */
   static void on_timer_isr(void* arg) noexcept;

private:
   struct HeapTraits
   {
      using Node = Entry;
      static constexpr uint16_t CAPACITY = config::TIMER_QUEUE_CAPACITY;
      static bool earlier(Node const& a, Node const& b) noexcept
      {
         return a.deadline < b.deadline || (a.deadline == b.deadline && a.sequence < b.sequence);
      }
   };

   mutable Spinlock lock;
   BoundedMinHeap<HeapTraits> heap;
   uint64_t next_sequence{0};
   uint64_t dropped{0};
   bool drive_port_alarm;
};

/**
 * @brief Expire and wake every entry due at now
 * @return Number of wakers fired
 */
std::size_t check_timer_events(TimerQueue& timers, TimePoint now);

/**
 * @brief Register a waker with the queue (alias of TimerQueue::set)
 */
inline bool wake_at(TimerQueue& timers, TimePoint deadline, Waker waker)
{
   return timers.set(deadline, std::move(waker));
}

/* ============================================================================
 * Sleep / Timeout
 * ========================================================================= */

/**
 * @brief Completes once the port clock reaches the deadline
 *
 * Registers with the timer queue on the first pending poll, and again only if
 * a later poll carries a waker for a different target.
 */
class Sleep
{
public:
   using Output = void;

   Sleep(TimerQueue& timers, TimePoint deadline) noexcept : timers(&timers), wake_deadline(deadline) {}

   Poll<> poll(Context& cx);

   [[nodiscard]] TimePoint deadline() const noexcept { return wake_deadline; }

   /**
    * @brief Rearm for a new deadline; the next pending poll registers again
    *
    * An entry queued for the old deadline still fires, which is a spurious
    * wake: the poll it triggers stays pending until the new deadline.
    */
   void reset_until(TimePoint deadline)
   {
      wake_deadline = deadline;
      registered.reset();
   }

   void reset(Duration duration) { reset_until(now() + duration); }

private:
   TimerQueue* timers;
   TimePoint wake_deadline;
   std::optional<Waker> registered;
};

inline Sleep sleep_until(TimerQueue& timers, TimePoint deadline)
{
   return Sleep(timers, deadline);
}

inline Sleep sleep_for(TimerQueue& timers, Duration duration)
{
   return Sleep(timers, now() + duration);
}

/**
 * @brief Error outcome of a Timeout whose deadline passed first
 */
struct TimedOut {};

/**
 * @brief Race a computation against a deadline
 *
 * The inner computation is polled first, so when both are ready on the same
 * poll the inner result wins.
 */
template<Future F>
class Timeout
{
public:
   using Output = Result<typename F::Output, TimedOut>;

   Timeout(F inner, Sleep deadline) : inner(std::move(inner)), deadline(std::move(deadline)) {}

   Timeout(TimerQueue& timers, F inner, TimePoint deadline)
      : inner(std::move(inner)), deadline(timers, deadline) {}

   Poll<Output> poll(Context& cx)
   {
      auto polled = inner.poll(cx);
      if (polled.is_ready()) {
         if constexpr (std::is_void_v<typename F::Output>) return Output::ok();
         else return Output::ok(polled.take());
      }

      if (deadline.poll(cx).is_ready()) return Output::err(TimedOut{});
      return pending;
   }

private:
   F inner;
   Sleep deadline;
};

/**
 * @brief Timeout expiring duration after this call
 *
 * The deadline is fixed here, not on the first poll: a Timeout built early and
 * first polled after the duration has elapsed reports TimedOut unless inner is
 * already ready.
 */
template<Future F>
Timeout<F> timeout(TimerQueue& timers, F inner, Duration duration)
{
   return Timeout<F>(std::move(inner), sleep_for(timers, duration));
}

template<Future F>
Timeout<F> timeout_at(TimerQueue& timers, F inner, TimePoint deadline)
{
   return Timeout<F>(timers, std::move(inner), deadline);
}

} // namespace kasync

#endif // KASYNC_TIMER_QUEUE_HPP
