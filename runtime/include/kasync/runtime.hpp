/**
 * @file runtime.hpp
 * @brief Runtime context: executors, timer queue and reactor
 *
 * One Runtime exists per system. It is created on first use through an
 * atomic one-shot flag (concurrent first callers wait for the winner) and
 * lives until the system goes down. It owns:
 *   - the global Executor,
 *   - one core-local Executor per configured core,
 *   - the TimerQueue, armed on the port one-shot and driven from its ISR,
 *   - the Reactor.
 * Every executor's idle hook drives the timer queue and the reactor, so a
 * block_on() that runs out of ready tasks still makes timer and I/O progress.
 *
 * The free functions below forward to Runtime::instance().
 */

#ifndef KASYNC_RUNTIME_HPP
#define KASYNC_RUNTIME_HPP

#include "kasync/executor.hpp"
#include "kasync/reactor.hpp"
#include "kasync/timer_queue.hpp"

#include <array>
#include <cstddef>
#include <memory>
#include <utility>

namespace kasync
{

class Runtime
{
public:
   /**
    * @brief The runtime, created with the default (synchronous device) backend
    */
   static Runtime& instance();

   /**
    * @brief Create the runtime with a specific reactor backend
    *
    * Idempotent: only the first call (or first instance()) constructs the
    * runtime; a backend passed to a later call is discarded.
    */
   static Runtime& init(std::unique_ptr<io::IoBackend> backend);

   [[nodiscard]] static bool is_initialized() noexcept;

   Runtime(Runtime const&)            = delete;
   Runtime& operator=(Runtime const&) = delete;

   [[nodiscard]] Executor& global_executor() noexcept { return global; }

   /**
    * @brief Executor of the calling core
    */
   [[nodiscard]] Executor& local_executor() noexcept;
   [[nodiscard]] Executor& core_executor(std::size_t core) noexcept;

   [[nodiscard]] TimerQueue& timers() noexcept { return timer_queue; }
   [[nodiscard]] io::Reactor& reactor() noexcept { return io_reactor; }

   /**
    * @brief Fire due timers and deliver I/O completions (the idle work)
    */
   void drive();

private:
   explicit Runtime(std::unique_ptr<io::IoBackend> backend);
   ~Runtime() = default;

   Executor global;
   std::array<Executor, config::CORES> per_core;
   TimerQueue timer_queue{true};
   io::Reactor io_reactor;
};

/* ============================================================================
 * Free functions
 * ========================================================================= */

/**
 * @brief Spawn on the global executor
 */
template<Future F>
JoinHandle<typename F::Output> spawn(F future)
{
   return Runtime::instance().global_executor().spawn(std::move(future));
}

/**
 * @brief Spawn on the calling core's executor
 */
template<Future F>
JoinHandle<typename F::Output> spawn_local(F future)
{
   return Runtime::instance().local_executor().spawn(std::move(future));
}

/**
 * @brief Drain the global executor
 */
void run();

/**
 * @brief Drain the calling core's executor
 */
void run_local();

/**
 * @brief Drive a computation to completion on the global executor
 */
template<Future F>
typename F::Output block_on(F future)
{
   return Runtime::instance().global_executor().block_on(std::move(future));
}

Sleep sleep(Duration duration);
Sleep sleep_until(TimePoint deadline);

/**
 * @brief Deadline is now() + duration at the time of this call
 */
template<Future F>
Timeout<F> timeout(F inner, Duration duration)
{
   return kasync::timeout(Runtime::instance().timers(), std::move(inner), duration);
}

template<Future F>
Timeout<F> timeout_at(F inner, TimePoint deadline)
{
   return kasync::timeout_at(Runtime::instance().timers(), std::move(inner), deadline);
}

/**
 * @brief Register a waker with the runtime's timer queue
 */
bool wake_at(TimePoint deadline, Waker waker);

io::Reactor& reactor();
TimerQueue& timers();

} // namespace kasync

#endif // KASYNC_RUNTIME_HPP
