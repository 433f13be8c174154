/**
 * @file mutex.cpp
 * @brief Async mutex implementation
 */

#include "kasync/mutex.hpp"

#include "DEBUG_PRINT.hpp"

#include <cassert>

namespace kasync
{

void MutexCore::release()
{
   [[maybe_unused]] const bool was_locked = locked.exchange(false, std::memory_order_release);
   assert(was_locked && "Mutex released while not locked");

   if (waiters.signal_one()) {
      LOG_SYNC("Mutex @%p released, woke one waiter", static_cast<void*>(this));
   }
}

} // namespace kasync
