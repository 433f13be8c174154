/**
 * @file rwlock.cpp
 * @brief Async reader-writer lock implementation
 */

#include "kasync/rwlock.hpp"

#include "DEBUG_PRINT.hpp"

#include <cassert>

namespace kasync
{

bool RwLockCore::acquire_read() noexcept
{
   auto current = state.load(std::memory_order_acquire);
   while (true) {
      if (current == WRITER) return false;
      assert(current + 1 < WRITER && "RwLock reader count overflow");
      if (state.compare_exchange_weak(current, current + 1, std::memory_order_acquire, std::memory_order_acquire)) {
         return true;
      }
   }
}

bool RwLockCore::acquire_write() noexcept
{
   std::uint32_t expected = 0;
   return state.compare_exchange_strong(expected, WRITER, std::memory_order_acquire, std::memory_order_relaxed);
}

void RwLockCore::release_read()
{
   [[maybe_unused]] const auto prev = state.fetch_sub(1, std::memory_order_acq_rel);
   assert(prev != 0 && prev != WRITER && "Invalid RwLock state on read release");

   if (prev == 1 && writers.signal_one()) {
      LOG_SYNC("RwLock @%p last reader out, woke one writer", static_cast<void*>(this));
   }
}

void RwLockCore::release_write()
{
   [[maybe_unused]] const auto prev = state.exchange(0, std::memory_order_acq_rel);
   assert(prev == WRITER && "Invalid RwLock state on write release");
   hand_over();
}

void RwLockCore::hand_over()
{
   if (writers.signal_one()) {
      LOG_SYNC("RwLock @%p handed over to a writer", static_cast<void*>(this));
      return;
   }
   [[maybe_unused]] const auto woken = readers.signal_all();
   LOG_SYNC("RwLock @%p woke %zu reader(s)", static_cast<void*>(this), woken);
}

} // namespace kasync
