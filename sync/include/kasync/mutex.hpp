/**
 * @file mutex.hpp
 * @brief Async mutual exclusion lock owning the value it protects
 *
 * lock() never blocks the kernel thread: a contended acquirer suspends and is
 * woken when a guard is released. There is no fairness across the fast
 * path; a try_lock() arriving just after a release may take the lock ahead of
 * a task that registered earlier.
 *
 * Usage:
 *   Mutex<int> counter(0);
 *   {
 *       auto guard = executor.block_on(counter.lock());
 *       *guard += 1;
 *   } // Released, oldest waiter woken
 */

#ifndef KASYNC_MUTEX_HPP
#define KASYNC_MUTEX_HPP

#include "kasync/wait_queue.hpp"

#include <atomic>
#include <optional>
#include <utility>

namespace kasync
{

/**
 * @brief Lock state and wait queue shared by every Mutex<T>
 */
class MutexCore
{
public:
   MutexCore(MutexCore const&)            = delete;
   MutexCore& operator=(MutexCore const&) = delete;

   [[nodiscard]] bool is_locked() const noexcept { return locked.load(std::memory_order_acquire); }

   /**
    * @brief Number of suspended acquirers (diagnostic)
    */
   [[nodiscard]] std::size_t waiter_count() const { return waiters.len(); }

protected:
   MutexCore() = default;
   ~MutexCore() = default;

   // false if already held
   bool acquire() noexcept { return !locked.exchange(true, std::memory_order_acquire); }
   void release();

   WaitQueue& wait_queue() noexcept { return waiters; }

private:
   std::atomic<bool> locked{false};
   WaitQueue waiters;
};

template<typename T>
class Mutex;

/**
 * @brief Proof of ownership and access to the protected value; unlocks on destruction
 */
template<typename T>
class MutexGuard
{
public:
   MutexGuard(MutexGuard&& other) noexcept : mutex(std::exchange(other.mutex, nullptr)) {}
   MutexGuard& operator=(MutexGuard&& other) noexcept
   {
      if (this != &other) {
         unlock();
         mutex = std::exchange(other.mutex, nullptr);
      }
      return *this;
   }
   MutexGuard(MutexGuard const&)            = delete;
   MutexGuard& operator=(MutexGuard const&) = delete;

   ~MutexGuard() { unlock(); }

   T& operator*() noexcept { return mutex->value; }
   T const& operator*() const noexcept { return mutex->value; }
   T* operator->() noexcept { return &mutex->value; }
   T const* operator->() const noexcept { return &mutex->value; }

   /**
    * @brief Release early (idempotent); the guard must not be dereferenced afterwards
    */
   void unlock()
   {
      if (!mutex) return;
      std::exchange(mutex, nullptr)->release();
   }

private:
   friend class Mutex<T>;
   explicit MutexGuard(Mutex<T>& mutex) noexcept : mutex(&mutex) {}

   Mutex<T>* mutex;
};

template<typename T>
class Mutex : public MutexCore
{
   struct LockPolicy
   {
      using Primitive = Mutex;
      using Guard     = MutexGuard<T>;

      static std::optional<Guard> try_acquire(Mutex& m) { return m.try_lock(); }
      static WaitQueue& queue(Mutex& m) { return m.wait_queue(); }
      static void forward_signal(Mutex& m) { m.wait_queue().signal_one(); }
   };

public:
   using LockFuture = AcquireFuture<LockPolicy>;

   Mutex() = default;
   explicit Mutex(T value) : value(std::move(value)) {}

   /**
    * @brief Take the lock if it is free
    */
   [[nodiscard]] std::optional<MutexGuard<T>> try_lock()
   {
      if (!acquire()) return std::nullopt;
      return MutexGuard<T>(*this);
   }

   /**
    * @brief Future resolving to a MutexGuard once the lock is held
    */
   [[nodiscard]] LockFuture lock() { return LockFuture(*this); }

   /**
    * @brief Direct access when the caller has exclusive use of the Mutex itself
    */
   [[nodiscard]] T& get_mut() noexcept { return value; }

private:
   friend class MutexGuard<T>;

   T value{};
};

} // namespace kasync

#endif // KASYNC_MUTEX_HPP
