/**
 * @file wait_queue.cpp
 * @brief Generation-counted FIFO of waiter slots
 */

#include "kasync/wait_queue.hpp"

#include <cassert>

namespace kasync
{

WaitQueue::WaitQueue()
{
   slots.reserve(config::WAIT_QUEUE_RESERVE);
   free_slots.reserve(config::WAIT_QUEUE_RESERVE);
}

WaitTicket WaitQueue::enqueue(Waker waker)
{
   SpinlockGuard guard(lock);

   std::uint32_t index;
   if (!free_slots.empty()) {
      index = free_slots.back();
      free_slots.pop_back();
   } else {
      index = static_cast<std::uint32_t>(slots.size());
      slots.emplace_back();
      // release() must never allocate
      if (free_slots.capacity() < slots.size()) free_slots.reserve(slots.capacity());
   }

   Slot& slot = slots[index];
   assert(!slot.occupied && "Free list handed out an occupied slot");
   slot.waker    = std::move(waker);
   slot.occupied = true;
   slot.prev     = tail;
   slot.next     = NIL;

   if (tail != NIL) slots[tail].next = index; else head = index;
   tail = index;
   ++count;

   return WaitTicket{.slot = index, .generation = slot.generation};
}

bool WaitQueue::refresh(WaitTicket ticket, Waker const& waker)
{
   SpinlockGuard guard(lock);
   if (!live(ticket)) return false;

   Slot& slot = slots[ticket.slot];
   if (!slot.waker.will_wake(waker)) slot.waker = waker;
   return true;
}

bool WaitQueue::remove(WaitTicket ticket)
{
   Waker dropped;
   {
      SpinlockGuard guard(lock);
      if (!live(ticket)) return false;
      unlink(ticket.slot);
      dropped = release(ticket.slot);
   }
   // dropped goes out of scope here, outside the lock
   return true;
}

bool WaitQueue::signal_one()
{
   Waker to_wake;
   {
      SpinlockGuard guard(lock);
      if (head == NIL) return false;
      const std::uint32_t index = head;
      unlink(index);
      to_wake = release(index);
   }
   to_wake.wake();
   return true;
}

std::size_t WaitQueue::signal_all()
{
   std::vector<Waker> to_wake;
   {
      SpinlockGuard guard(lock);
      to_wake.reserve(count);
      while (head != NIL) {
         const std::uint32_t index = head;
         unlink(index);
         to_wake.push_back(release(index));
      }
   }

   for (auto& waker : to_wake) waker.wake();
   return to_wake.size();
}

bool WaitQueue::empty() const
{
   SpinlockGuard guard(lock);
   return count == 0;
}

std::size_t WaitQueue::len() const
{
   SpinlockGuard guard(lock);
   return count;
}

void WaitQueue::unlink(std::uint32_t index)
{
   Slot& slot = slots[index];
   if (slot.prev != NIL) slots[slot.prev].next = slot.next; else head = slot.next;
   if (slot.next != NIL) slots[slot.next].prev = slot.prev; else tail = slot.prev;
   slot.prev = NIL;
   slot.next = NIL;
   --count;
}

Waker WaitQueue::release(std::uint32_t index)
{
   Slot& slot = slots[index];
   Waker waker = std::move(slot.waker);
   slot.waker    = Waker{};
   slot.occupied = false;
   ++slot.generation; // Outstanding tickets for this slot are now stale
   free_slots.push_back(index);
   return waker;
}

} // namespace kasync
