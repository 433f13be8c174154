/**
 * @file rwlock.hpp
 * @brief Async reader-writer lock with writer priority on release
 *
 * State is a single counter: 0 is free, WRITER is exclusively held, anything
 * else is the number of live readers. Readers and writers wait in separate
 * FIFO queues. Releasing the write lock hands over to one waiting writer if
 * there is one and only otherwise wakes every waiting reader; the last reader
 * out wakes one writer.
 *
 * RwLock<T> owns the protected value: read guards give const access, the
 * write guard gives mutable access.
 */

#ifndef KASYNC_RWLOCK_HPP
#define KASYNC_RWLOCK_HPP

#include "kasync/wait_queue.hpp"

#include <atomic>
#include <cstdint>
#include <optional>
#include <utility>

namespace kasync
{

/**
 * @brief Counter and both wait queues shared by every RwLock<T>
 */
class RwLockCore
{
public:
   static constexpr std::uint32_t WRITER = UINT32_MAX;

   RwLockCore(RwLockCore const&)            = delete;
   RwLockCore& operator=(RwLockCore const&) = delete;

   [[nodiscard]] bool is_write_locked() const noexcept { return state.load(std::memory_order_acquire) == WRITER; }

   /**
    * @brief Live readers (0 when free or write-held)
    */
   [[nodiscard]] std::uint32_t reader_count() const noexcept
   {
      const auto s = state.load(std::memory_order_acquire);
      return s == WRITER ? 0 : s;
   }

   [[nodiscard]] std::size_t waiting_readers() const { return readers.len(); }
   [[nodiscard]] std::size_t waiting_writers() const { return writers.len(); }

protected:
   RwLockCore() = default;
   ~RwLockCore() = default;

   bool acquire_read() noexcept;
   bool acquire_write() noexcept;
   void release_read();
   void release_write();

   // Wake one writer, or every reader when no writer waits
   void hand_over();

   WaitQueue& reader_queue() noexcept { return readers; }
   WaitQueue& writer_queue() noexcept { return writers; }

private:
   std::atomic<std::uint32_t> state{0};
   WaitQueue readers;
   WaitQueue writers;
};

template<typename T>
class RwLock;

template<typename T>
class RwLockReadGuard
{
public:
   RwLockReadGuard(RwLockReadGuard&& other) noexcept : lock(std::exchange(other.lock, nullptr)) {}
   RwLockReadGuard& operator=(RwLockReadGuard&&)      = delete;
   RwLockReadGuard(RwLockReadGuard const&)            = delete;
   RwLockReadGuard& operator=(RwLockReadGuard const&) = delete;

   ~RwLockReadGuard() { unlock(); }

   T const& operator*() const noexcept { return lock->value; }
   T const* operator->() const noexcept { return &lock->value; }

   void unlock()
   {
      if (!lock) return;
      std::exchange(lock, nullptr)->release_read();
   }

private:
   friend class RwLock<T>;
   explicit RwLockReadGuard(RwLock<T>& lock) noexcept : lock(&lock) {}

   RwLock<T>* lock;
};

template<typename T>
class RwLockWriteGuard
{
public:
   RwLockWriteGuard(RwLockWriteGuard&& other) noexcept : lock(std::exchange(other.lock, nullptr)) {}
   RwLockWriteGuard& operator=(RwLockWriteGuard&&)      = delete;
   RwLockWriteGuard(RwLockWriteGuard const&)            = delete;
   RwLockWriteGuard& operator=(RwLockWriteGuard const&) = delete;

   ~RwLockWriteGuard() { unlock(); }

   T& operator*() noexcept { return lock->value; }
   T const& operator*() const noexcept { return lock->value; }
   T* operator->() noexcept { return &lock->value; }
   T const* operator->() const noexcept { return &lock->value; }

   void unlock()
   {
      if (!lock) return;
      std::exchange(lock, nullptr)->release_write();
   }

private:
   friend class RwLock<T>;
   explicit RwLockWriteGuard(RwLock<T>& lock) noexcept : lock(&lock) {}

   RwLock<T>* lock;
};

template<typename T>
class RwLock : public RwLockCore
{
   struct ReadPolicy
   {
      using Primitive = RwLock;
      using Guard     = RwLockReadGuard<T>;

      static std::optional<Guard> try_acquire(RwLock& l) { return l.try_read(); }
      static WaitQueue& queue(RwLock& l) { return l.reader_queue(); }
      // Readers are released in bulk, so a dropped reader holds nothing back
      static void forward_signal(RwLock&) {}
   };

   struct WritePolicy
   {
      using Primitive = RwLock;
      using Guard     = RwLockWriteGuard<T>;

      static std::optional<Guard> try_acquire(RwLock& l) { return l.try_write(); }
      static WaitQueue& queue(RwLock& l) { return l.writer_queue(); }
      static void forward_signal(RwLock& l) { l.hand_over(); }
   };

public:
   using ReadFuture  = AcquireFuture<ReadPolicy>;
   using WriteFuture = AcquireFuture<WritePolicy>;

   RwLock() = default;
   explicit RwLock(T value) : value(std::move(value)) {}

   /**
    * @brief Shared access unless a writer holds the lock
    */
   [[nodiscard]] std::optional<RwLockReadGuard<T>> try_read()
   {
      if (!acquire_read()) return std::nullopt;
      return RwLockReadGuard<T>(*this);
   }

   /**
    * @brief Exclusive access if the lock is completely free
    */
   [[nodiscard]] std::optional<RwLockWriteGuard<T>> try_write()
   {
      if (!acquire_write()) return std::nullopt;
      return RwLockWriteGuard<T>(*this);
   }

   [[nodiscard]] ReadFuture  read()  { return ReadFuture(*this); }
   [[nodiscard]] WriteFuture write() { return WriteFuture(*this); }

   [[nodiscard]] T& get_mut() noexcept { return value; }

private:
   friend class RwLockReadGuard<T>;
   friend class RwLockWriteGuard<T>;

   T value{};
};

} // namespace kasync

#endif // KASYNC_RWLOCK_HPP
