/**
 * @file kernel.hpp
 * @brief kasync kernel-side primitives
 *
 * Compile-time configuration and the interrupt-safe spinlock every runtime
 * component uses to protect its shared state.
 */

#ifndef KASYNC_KERNEL_HPP
#define KASYNC_KERNEL_HPP

#include "kasync/port_traits.h"

#include <atomic>
#include <cstddef>
#include <cstdint>

namespace kasync
{

namespace config
{
   /**
    * @brief How many cores get a core-local executor
    */
   static constexpr std::size_t CORES = KASYNC_PORT_CORE_COUNT;
   static_assert(1 <= CORES && CORES <= KASYNC_PORT_CORE_COUNT, "Port does not support configured amount of cores.");

   /**
    * @brief Bounded timer queue size; registrations beyond this are dropped
    */
   static constexpr std::size_t TIMER_QUEUE_CAPACITY = 32;
   static_assert(TIMER_QUEUE_CAPACITY > 0 && TIMER_QUEUE_CAPACITY < UINT16_MAX, "Timer heap uses 16-bit indices.");

   /**
    * @brief Default BufReader/BufWriter capacity in bytes
    */
   static constexpr std::size_t IO_BUFFER_CAPACITY = 8 * 1024;

   /**
    * @brief Waiter slots reserved up front by every lock wait queue
    */
   static constexpr std::size_t WAIT_QUEUE_RESERVE = 8;

   /**
    * @brief Interrupt line the runtime's timer queue is driven from
    */
   static constexpr std::uint32_t TIMER_IRQ = 0;
   static_assert(TIMER_IRQ < KASYNC_PORT_IRQ_COUNT, "Timer IRQ outside of the port's dispatch table.");
}  // namespace config

/* ============================================================================
 * Spinlock
 * ========================================================================= */

/**
 * @brief Interrupt-safe spinlock for very short critical sections
 *
 * Local interrupts are disabled for as long as the lock is held, so the same
 * lock may be taken from thread and interrupt context without deadlocking a
 * core against itself. Never suspend (or poll a future) while holding one.
 *
 * Usage:
 *   Spinlock lock;
 *   {
 *       SpinlockGuard guard(lock);
 *       // ... critical section ...
 *   } // Automatically unlocked, interrupts restored
 */
class Spinlock
{
public:
   constexpr Spinlock() = default;
   ~Spinlock() = default;

   Spinlock(Spinlock const&)            = delete;
   Spinlock& operator=(Spinlock const&) = delete;
   Spinlock(Spinlock&&)                 = delete;
   Spinlock& operator=(Spinlock&&)      = delete;

   /**
    * @brief Disable local interrupts and busy-wait for the lock
    */
   void lock() noexcept;

   /**
    * @brief Release the lock and restore the saved interrupt state
    */
   void unlock() noexcept;

   /**
    * @brief Try to acquire the lock without spinning
    * @return true if acquired (interrupts are then disabled until unlock())
    */
   bool try_lock() noexcept;

   /**
    * @brief Check if the spinlock is currently locked
    *
    * Note: This is racy and should only be used for debugging/assertions.
    */
   [[nodiscard]] bool is_locked() const noexcept
   {
      return flag.test(std::memory_order_relaxed);
   }

private:
   std::atomic_flag flag = ATOMIC_FLAG_INIT;
   std::uint32_t irq_state{0}; // Only meaningful to the holder
};

/**
 * @brief RAII guard for spinlocks
 */
class SpinlockGuard
{
public:
   explicit SpinlockGuard(Spinlock& lock) : lock(lock)
   {
      lock.lock();
   }

   ~SpinlockGuard()
   {
      lock.unlock();
   }

   SpinlockGuard(SpinlockGuard const&)            = delete;
   SpinlockGuard& operator=(SpinlockGuard const&) = delete;
   SpinlockGuard(SpinlockGuard&&)                 = delete;
   SpinlockGuard& operator=(SpinlockGuard&&)      = delete;

private:
   Spinlock& lock;
};

} // namespace kasync

#endif // KASYNC_KERNEL_HPP
