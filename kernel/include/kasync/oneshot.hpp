/**
 * @file oneshot.hpp
 * @brief Single-value, single-producer, single-consumer handoff channel
 *
 * The Sender and Receiver share one reference-counted cell holding the value
 * slot, a completion flag, and the waker most recently registered by the
 * Receiver (latest registration wins). Dropping the Sender without sending
 * closes the channel and resolves the Receiver with Canceled.
 */

#ifndef KASYNC_ONESHOT_HPP
#define KASYNC_ONESHOT_HPP

#include "kasync/future.hpp"
#include "kasync/kernel.hpp"
#include "kasync/result.hpp"

#include <cassert>
#include <memory>
#include <optional>
#include <utility>

namespace kasync::oneshot
{

/**
 * @brief Receiver outcome when the Sender went away without sending
 */
struct Canceled {};

namespace detail
{
   template<typename T>
   struct Inner
   {
      Spinlock lock;
      std::optional<T> value;
      bool complete{false};
      bool closed{false};
      bool taken{false};
      Waker waker;
   };
}  // namespace detail

template<typename T>
class Sender
{
public:
   Sender() = default;
   explicit Sender(std::shared_ptr<detail::Inner<T>> inner) : inner(std::move(inner)) {}

   Sender(Sender&&) noexcept = default;
   Sender& operator=(Sender&& other) noexcept
   {
      if (this != &other) {
         close();
         inner = std::move(other.inner);
      }
      return *this;
   }
   Sender(Sender const&)            = delete;
   Sender& operator=(Sender const&) = delete;

   ~Sender() { close(); }

   /**
    * @brief Deliver the value and wake the receiver
    * @return The value back as the error if the channel already completed
    */
   Result<void, T> send(T value)
   {
      if (!inner) return Result<void, T>::err(std::move(value));

      Waker to_wake;
      {
         SpinlockGuard guard(inner->lock);
         if (inner->complete) return Result<void, T>::err(std::move(value));
         inner->value.emplace(std::move(value));
         inner->complete = true;
         to_wake = std::move(inner->waker);
      }
      to_wake.wake();
      return Result<void, T>::ok();
   }

   [[nodiscard]] bool is_complete() const
   {
      if (!inner) return false;
      SpinlockGuard guard(inner->lock);
      return inner->complete;
   }

private:
   void close()
   {
      if (!inner) return;

      Waker to_wake;
      {
         SpinlockGuard guard(inner->lock);
         if (!inner->complete) {
            inner->closed = true;
            to_wake = std::move(inner->waker);
         }
      }
      to_wake.wake();
      inner.reset();
   }

   std::shared_ptr<detail::Inner<T>> inner;
};

template<typename T>
class Receiver
{
public:
   using Output = Result<T, Canceled>;

   Receiver() = default;
   explicit Receiver(std::shared_ptr<detail::Inner<T>> inner) : inner(std::move(inner)) {}

   Receiver(Receiver&&) noexcept            = default;
   Receiver& operator=(Receiver&&) noexcept = default;
   Receiver(Receiver const&)            = delete;
   Receiver& operator=(Receiver const&) = delete;

   /**
    * @brief Take the value if sent, otherwise register the waker
    *
    * Must not be polled again after it returned ready.
    */
   Poll<Output> poll(Context& cx)
   {
      assert(inner && "Receiver polled without a channel");

      SpinlockGuard guard(inner->lock);
      assert(!inner->taken && "Receiver polled after completion");

      if (inner->complete) {
         inner->taken = true;
         T value = std::move(*inner->value);
         inner->value.reset();
         return Output(std::move(value));
      }
      if (inner->closed) {
         inner->taken = true;
         return Output(Canceled{});
      }

      inner->waker = cx.waker();
      return pending;
   }

private:
   std::shared_ptr<detail::Inner<T>> inner;
};

template<typename T>
std::pair<Sender<T>, Receiver<T>> channel()
{
   auto inner = std::make_shared<detail::Inner<T>>();
   return {Sender<T>(inner), Receiver<T>(inner)};
}

} // namespace kasync::oneshot

#endif // KASYNC_ONESHOT_HPP
