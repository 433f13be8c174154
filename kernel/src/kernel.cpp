/**
 * @file kernel.cpp
 * @brief Spinlock implementation on top of the port's interrupt control
 */

#include "kasync/kernel.hpp"
#include "kasync/port.h"

namespace kasync
{

void Spinlock::lock() noexcept
{
   std::uint32_t state = kasync_port_irq_save();
   while (flag.test_and_set(std::memory_order_acquire)) {
      // Busy-wait with CPU yield hint
      kasync_port_cpu_relax();
   }
   irq_state = state;
}

void Spinlock::unlock() noexcept
{
   std::uint32_t state = irq_state;
   flag.clear(std::memory_order_release);
   kasync_port_irq_restore(state);
}

bool Spinlock::try_lock() noexcept
{
   std::uint32_t state = kasync_port_irq_save();
   if (flag.test_and_set(std::memory_order_acquire)) {
      kasync_port_irq_restore(state);
      return false;
   }
   irq_state = state;
   return true;
}

} // namespace kasync
