/**
 * @file future.hpp
 * @brief Poll-based computations and the wake protocol
 *
 * A computation (future) is any object with an Output type and a
 * Poll<Output> poll(Context&) member. Polling either completes it or reports
 * pending; a pending computation must first hand the Context's Waker to
 * whatever it waits on (timer queue, lock wait queue, reactor). Invoking that
 * Waker later asks the owner of the computation to poll it again.
 *
 * Wakers are reference counted and may be cloned, dropped and invoked from
 * any core or from interrupt context.
 */

#ifndef KASYNC_FUTURE_HPP
#define KASYNC_FUTURE_HPP

#include <cassert>
#include <concepts>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>

namespace kasync
{

/* ============================================================================
 * Poll
 * ========================================================================= */

struct PendingTag
{
   explicit constexpr PendingTag() = default;
};

/**
 * @brief Tag value returned by pending computations: `return pending;`
 */
inline constexpr PendingTag pending{};

/**
 * @brief Outcome of one poll: ready with a value, or pending
 */
template<typename T = void>
class Poll
{
public:
   using value_type = T;

   constexpr Poll() = default;
   constexpr Poll(PendingTag) noexcept {}
   Poll(T value) : slot(std::move(value)) {}

   [[nodiscard]] bool is_ready()   const noexcept { return slot.has_value(); }
   [[nodiscard]] bool is_pending() const noexcept { return !slot.has_value(); }

   T&       operator*() &      { assert(is_ready()); return *slot; }
   T const& operator*() const& { assert(is_ready()); return *slot; }
   T*       operator->()       { assert(is_ready()); return &*slot; }

   /**
    * @brief Move the ready value out
    */
   T take()
   {
      assert(is_ready() && "take() on a pending Poll");
      T value = std::move(*slot);
      slot.reset();
      return value;
   }

private:
   std::optional<T> slot;
};

template<>
class Poll<void>
{
public:
   using value_type = void;

   constexpr Poll() = default;
   constexpr Poll(PendingTag) noexcept {}

   static constexpr Poll ready() noexcept
   {
      Poll p;
      p.done = true;
      return p;
   }

   [[nodiscard]] constexpr bool is_ready()   const noexcept { return done; }
   [[nodiscard]] constexpr bool is_pending() const noexcept { return !done; }

private:
   bool done{false};
};

/* ============================================================================
 * Waker
 * ========================================================================= */

/**
 * @brief Something that can be asked to re-poll a computation
 *
 * wake() may run concurrently from several cores and from interrupt context;
 * implementations must only use interrupt-safe, non-suspending primitives.
 */
class Wakeable
{
public:
   virtual ~Wakeable() = default;
   virtual void wake() = 0;
};

/**
 * @brief Shared, clonable wake handle
 *
 * Copying a Waker clones it (the target stays alive while any clone exists).
 * An empty Waker is valid and does nothing when woken.
 */
class Waker
{
public:
   Waker() = default;
   explicit Waker(std::shared_ptr<Wakeable> target) noexcept : target(std::move(target)) {}

   /**
    * @brief Wake the target, releasing this handle
    */
   void wake()
   {
      auto t = std::move(target);
      if (t) t->wake();
   }

   /**
    * @brief Wake the target, keeping this handle
    */
   void wake_by_ref() const
   {
      if (target) target->wake();
   }

   /**
    * @brief Check whether both handles wake the same target
    */
   [[nodiscard]] bool will_wake(Waker const& other) const noexcept
   {
      return target == other.target;
   }

   explicit operator bool() const noexcept { return target != nullptr; }

private:
   std::shared_ptr<Wakeable> target;
};

namespace detail
{
   template<typename F>
   class FnWakeable final : public Wakeable
   {
   public:
      explicit FnWakeable(F fn) : fn(std::move(fn)) {}
      void wake() override { fn(); }

   private:
      F fn;
   };
}  // namespace detail

/**
 * @brief Build a Waker that runs a callable when woken
 */
template<typename F>
   requires std::invocable<std::decay_t<F>&>
Waker make_waker(F&& fn)
{
   return Waker{std::make_shared<detail::FnWakeable<std::decay_t<F>>>(std::forward<F>(fn))};
}

/**
 * @brief A Waker that does nothing (manual polling)
 */
inline Waker noop_waker()
{
   return Waker{};
}

/* ============================================================================
 * Context / Future
 * ========================================================================= */

/**
 * @brief Per-poll context: carries the Waker of the computation being polled
 */
class Context
{
public:
   explicit Context(Waker const& waker) noexcept : current(waker) {}

   [[nodiscard]] Waker const& waker() const noexcept { return current; }

private:
   Waker const& current;
};

template<typename F>
concept Future = requires(F& f, Context& cx)
{
   typename F::Output;
   { f.poll(cx) } -> std::same_as<Poll<typename F::Output>>;
};

/* ============================================================================
 * Adapters
 * ========================================================================= */

/**
 * @brief Future whose poll is a callable: Poll<T>(Context&)
 */
template<typename T, typename Fn>
class PollFn
{
public:
   using Output = T;

   explicit PollFn(Fn fn) : fn(std::move(fn)) {}

   Poll<T> poll(Context& cx) { return fn(cx); }

private:
   Fn fn;
};

template<typename Fn>
auto poll_fn(Fn&& fn)
{
   using P = std::invoke_result_t<std::decay_t<Fn>&, Context&>;
   return PollFn<typename P::value_type, std::decay_t<Fn>>(std::forward<Fn>(fn));
}

/**
 * @brief Future that is immediately ready with a value
 */
template<typename T>
class Ready
{
public:
   using Output = T;

   explicit Ready(T value) : value(std::move(value)) {}

   Poll<T> poll(Context&)
   {
      assert(value.has_value() && "Ready polled after completion");
      T v = std::move(*value);
      value.reset();
      return v;
   }

private:
   std::optional<T> value;
};

template<typename T>
Ready<std::decay_t<T>> ready(T&& value)
{
   return Ready<std::decay_t<T>>(std::forward<T>(value));
}

/**
 * @brief Pending once (after requesting a re-poll), then ready
 */
class YieldNow
{
public:
   using Output = void;

   Poll<> poll(Context& cx)
   {
      if (yielded) return Poll<>::ready();
      yielded = true;
      cx.waker().wake_by_ref();
      return pending;
   }

private:
   bool yielded{false};
};

inline YieldNow yield_now()
{
   return YieldNow{};
}

/**
 * @brief Poll a computation once with a no-op waker
 */
template<Future F>
Poll<typename F::Output> poll_once(F& future)
{
   Waker waker = noop_waker();
   Context cx(waker);
   return future.poll(cx);
}

} // namespace kasync

#endif // KASYNC_FUTURE_HPP
