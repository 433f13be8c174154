/**
 * @file wait_queue.hpp
 * @brief FIFO queue of suspended lock acquirers
 *
 * Every lock primitive pairs its atomic state with one or more WaitQueues.
 * A suspended acquirer registers its Waker and receives a WaitTicket; the
 * ticket names a slot plus the slot's generation at registration time, so a
 * registration can be refreshed or withdrawn in O(1) and a ticket that was
 * already consumed by a signal is recognised as stale instead of matching a
 * later occupant of the same slot.
 *
 * Wakers are always invoked after the queue's spinlock has been released.
 */

#ifndef KASYNC_WAIT_QUEUE_HPP
#define KASYNC_WAIT_QUEUE_HPP

#include "kasync/future.hpp"
#include "kasync/kernel.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

namespace kasync
{

/**
 * @brief Handle to one registration in a WaitQueue
 */
struct WaitTicket
{
   std::uint32_t slot{0};
   std::uint32_t generation{0};

   bool operator==(WaitTicket const&) const = default;
};

class WaitQueue
{
public:
   WaitQueue();

   WaitQueue(WaitQueue const&)            = delete;
   WaitQueue& operator=(WaitQueue const&) = delete;

   /**
    * @brief Append a registration at the tail
    */
   WaitTicket enqueue(Waker waker);

   /**
    * @brief Replace the waker of a still-queued registration, keeping its place
    * @return false if the ticket is stale (already signalled or removed)
    */
   bool refresh(WaitTicket ticket, Waker const& waker);

   /**
    * @brief Withdraw a registration
    * @return false if the ticket is stale (already signalled or removed)
    */
   bool remove(WaitTicket ticket);

   /**
    * @brief Dequeue and wake the oldest registration
    * @return true if a waiter was woken
    */
   bool signal_one();

   /**
    * @brief Dequeue and wake every registration, oldest first
    * @return Number of waiters woken
    */
   std::size_t signal_all();

   [[nodiscard]] bool empty() const;
   [[nodiscard]] std::size_t len() const;

private:
   static constexpr std::uint32_t NIL = UINT32_MAX;

   struct Slot
   {
      Waker waker{};
      std::uint32_t generation{0};
      std::uint32_t prev{NIL};
      std::uint32_t next{NIL};
      bool occupied{false};
   };

   // Both require the lock to be held
   void unlink(std::uint32_t index);
   Waker release(std::uint32_t index);

   bool live(WaitTicket ticket) const
   {
      return ticket.slot < slots.size()
         && slots[ticket.slot].occupied
         && slots[ticket.slot].generation == ticket.generation;
   }

   mutable Spinlock lock;
   std::vector<Slot> slots;
   std::vector<std::uint32_t> free_slots;
   std::uint32_t head{NIL};
   std::uint32_t tail{NIL};
   std::size_t count{0};
};

/**
 * @brief Register-then-retry acquisition shared by every lock primitive
 *
 * Policy supplies:
 *   using Primitive, using Guard;
 *   static std::optional<Guard> try_acquire(Primitive&);
 *   static WaitQueue& queue(Primitive&);
 *   static void forward_signal(Primitive&);
 *
 * The fast path tries the primitive directly. On failure the caller's waker
 * is registered (or refreshed in place when it still holds a live ticket) and
 * the acquisition is retried once to close the race with a release that
 * happened in between. A registration that is still queued when the future
 * completes or is dropped is withdrawn. If the future is dropped after a
 * release already signalled it, the signal is forwarded so it is not lost.
 */
template<typename Policy>
class AcquireFuture
{
public:
   using Primitive = typename Policy::Primitive;
   using Output    = typename Policy::Guard;

   explicit AcquireFuture(Primitive& primitive) noexcept : primitive(&primitive) {}

   AcquireFuture(AcquireFuture&& other) noexcept
      : primitive(other.primitive), ticket(std::exchange(other.ticket, std::nullopt)) {}
   AcquireFuture& operator=(AcquireFuture&&) = delete;
   AcquireFuture(AcquireFuture const&)            = delete;
   AcquireFuture& operator=(AcquireFuture const&) = delete;

   ~AcquireFuture() { withdraw(false); }

   Poll<Output> poll(Context& cx)
   {
      if (auto guard = Policy::try_acquire(*primitive)) {
         withdraw(true);
         return std::move(*guard);
      }

      auto& queue = Policy::queue(*primitive);
      if (!ticket || !queue.refresh(*ticket, cx.waker())) {
         ticket = queue.enqueue(cx.waker());
      }

      if (auto guard = Policy::try_acquire(*primitive)) {
         withdraw(true);
         return std::move(*guard);
      }
      return pending;
   }

private:
   void withdraw(bool acquired)
   {
      if (!ticket) return;
      const bool was_queued = Policy::queue(*primitive).remove(*ticket);
      ticket.reset();
      if (!was_queued && !acquired) Policy::forward_signal(*primitive);
   }

   Primitive* primitive;
   std::optional<WaitTicket> ticket;
};

} // namespace kasync

#endif // KASYNC_WAIT_QUEUE_HPP
