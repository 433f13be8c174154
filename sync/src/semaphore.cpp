/**
 * @file semaphore.cpp
 * @brief Semaphore and Barrier implementation
 */

#include "kasync/semaphore.hpp"

#include "DEBUG_PRINT.hpp"

#include <cassert>

namespace kasync
{

void SemaphorePermit::release()
{
   if (!semaphore) return;
   std::exchange(semaphore, nullptr)->give_back();
}

Semaphore::Semaphore(std::size_t permits, std::size_t max_permits) noexcept
   : permits(permits), max(max_permits)
{
   assert(permits <= max_permits && "Semaphore starts above its capacity");
}

std::optional<SemaphorePermit> Semaphore::try_acquire()
{
   // Never dips below zero, so available_permits() stays within [0, max]
   auto current = permits.load(std::memory_order_acquire);
   while (current > 0) {
      if (permits.compare_exchange_weak(current, current - 1, std::memory_order_acq_rel, std::memory_order_acquire)) {
         return SemaphorePermit(*this);
      }
   }
   return std::nullopt;
}

void Semaphore::give_back()
{
   [[maybe_unused]] const auto prev = permits.fetch_add(1, std::memory_order_acq_rel);
   assert(prev < max && "Semaphore permit released more often than acquired");

   if (waiters.signal_one()) {
      LOG_SYNC("Semaphore @%p permit returned (%zu available), woke one waiter",
               static_cast<void*>(this), prev + 1);
   }
}

std::optional<BarrierGuard> Barrier::try_acquire()
{
   auto permit = gate.try_acquire();
   if (!permit) return std::nullopt;
   return BarrierGuard(std::move(*permit));
}

} // namespace kasync
