/**
 * @file semaphore.hpp
 * @brief Counting semaphore and the binary Barrier built on it
 */

#ifndef KASYNC_SEMAPHORE_HPP
#define KASYNC_SEMAPHORE_HPP

#include "kasync/wait_queue.hpp"

#include <atomic>
#include <cstddef>
#include <optional>
#include <utility>

namespace kasync
{

class Semaphore;

/**
 * @brief One held permit; returned to the semaphore on destruction
 */
class SemaphorePermit
{
public:
   SemaphorePermit(SemaphorePermit&& other) noexcept : semaphore(std::exchange(other.semaphore, nullptr)) {}
   SemaphorePermit& operator=(SemaphorePermit&&)      = delete;
   SemaphorePermit(SemaphorePermit const&)            = delete;
   SemaphorePermit& operator=(SemaphorePermit const&) = delete;

   ~SemaphorePermit() { release(); }

   /**
    * @brief Return the permit early (idempotent)
    */
   void release();

private:
   friend class Semaphore;
   explicit SemaphorePermit(Semaphore& semaphore) noexcept : semaphore(&semaphore) {}

   Semaphore* semaphore;
};

/**
 * @brief Permit counter bounded by [0, max_permits]
 *
 * Usage:
 *   Semaphore slots(2);
 *   {
 *       auto permit = executor.block_on(slots.acquire());
 *       // ... at most two holders here ...
 *   } // Permit returned, one waiter woken
 */
class Semaphore
{
   struct AcquirePolicy;

public:
   using PermitFuture = AcquireFuture<AcquirePolicy>;

   explicit Semaphore(std::size_t permits) noexcept : Semaphore(permits, permits) {}

   /**
    * @brief Start with fewer permits than the semaphore can hold
    */
   Semaphore(std::size_t permits, std::size_t max_permits) noexcept;

   Semaphore(Semaphore const&)            = delete;
   Semaphore& operator=(Semaphore const&) = delete;

   [[nodiscard]] std::optional<SemaphorePermit> try_acquire();
   [[nodiscard]] PermitFuture acquire() { return PermitFuture(*this); }

   [[nodiscard]] std::size_t available_permits() const noexcept { return permits.load(std::memory_order_acquire); }
   [[nodiscard]] std::size_t max_permits() const noexcept { return max; }
   [[nodiscard]] std::size_t waiter_count() const { return waiters.len(); }

private:
   friend class SemaphorePermit;
   friend class Barrier;

   struct AcquirePolicy
   {
      using Primitive = Semaphore;
      using Guard     = SemaphorePermit;

      static std::optional<Guard> try_acquire(Semaphore& s) { return s.try_acquire(); }
      static WaitQueue& queue(Semaphore& s) { return s.waiters; }
      static void forward_signal(Semaphore& s) { s.waiters.signal_one(); }
   };

   void give_back();

   std::atomic<std::size_t> permits;
   const std::size_t max;
   WaitQueue waiters;
};

/* ============================================================================
 * Barrier
 * ========================================================================= */

/**
 * @brief Held barrier permit; release() (or destruction) reopens the barrier
 */
class BarrierGuard
{
public:
   explicit BarrierGuard(SemaphorePermit permit) noexcept : permit(std::move(permit)) {}

   void release() { permit.release(); }

private:
   SemaphorePermit permit;
};

/**
 * @brief Binary gate: a Semaphore of capacity one
 *
 * A locked barrier holds back every acquirer until some guard is released.
 */
class Barrier
{
   struct AcquirePolicy;

public:
   using GuardFuture = AcquireFuture<AcquirePolicy>;

   explicit Barrier(bool locked) noexcept : gate(locked ? 0 : 1, 1) {}

   [[nodiscard]] std::optional<BarrierGuard> try_acquire();
   [[nodiscard]] GuardFuture acquire() { return GuardFuture(*this); }

   /**
    * @brief Whether a permit is available right now
    */
   [[nodiscard]] bool is_released() const noexcept { return gate.available_permits() > 0; }

private:
   struct AcquirePolicy
   {
      using Primitive = Barrier;
      using Guard     = BarrierGuard;

      static std::optional<Guard> try_acquire(Barrier& b) { return b.try_acquire(); }
      static WaitQueue& queue(Barrier& b) { return b.gate_waiters(); }
      static void forward_signal(Barrier& b) { b.gate_waiters().signal_one(); }
   };

   WaitQueue& gate_waiters() { return gate.waiters; }

   Semaphore gate;
};

} // namespace kasync

#endif // KASYNC_SEMAPHORE_HPP
