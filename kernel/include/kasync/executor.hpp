/**
 * @file executor.hpp
 * @brief Cooperative task executor
 *
 * Tasks are spawned computations boxed on the heap behind a stable,
 * reference-counted cell. Each task's waker holds a reference to that cell;
 * waking it pushes the cell (never a copy of the computation) onto the
 * executor's spinlock-protected FIFO ready queue, at most once per poll cycle.
 *
 * Ordering: ready tasks are polled FIFO, one poll per step(), no preemption.
 * A task is polled only by the executor it was spawned on.
 */

#ifndef KASYNC_EXECUTOR_HPP
#define KASYNC_EXECUTOR_HPP

#include "kasync/future.hpp"
#include "kasync/kernel.hpp"
#include "kasync/oneshot.hpp"

#include <atomic>
#include <cassert>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <type_traits>
#include <variant>

namespace kasync
{

/* ============================================================================
 * JoinResult / JoinHandle
 * ========================================================================= */

/**
 * @brief Outcome of a spawned computation: completed(value) or abandoned
 *
 * Abandoned means the task was destroyed before producing its output (its
 * executor was torn down with the task still queued or suspended).
 */
template<typename T>
class JoinResult
{
public:
   static JoinResult completed(T value) { return JoinResult(std::move(value)); }
   static JoinResult abandoned()        { return JoinResult(); }

   [[nodiscard]] bool is_completed() const noexcept { return slot.has_value(); }
   [[nodiscard]] bool is_abandoned() const noexcept { return !slot.has_value(); }

   T& value() &
   {
      assert(is_completed() && "JoinResult is abandoned");
      return *slot;
   }
   T&& value() &&
   {
      assert(is_completed() && "JoinResult is abandoned");
      return std::move(*slot);
   }

private:
   JoinResult() = default;
   explicit JoinResult(T value) : slot(std::move(value)) {}

   std::optional<T> slot;
};

template<>
class JoinResult<void>
{
public:
   static JoinResult completed() { return JoinResult(true); }
   static JoinResult abandoned() { return JoinResult(false); }

   [[nodiscard]] bool is_completed() const noexcept { return done; }
   [[nodiscard]] bool is_abandoned() const noexcept { return !done; }

private:
   explicit JoinResult(bool done) : done(done) {}
   bool done;
};

namespace detail
{
   // void outputs travel through the channel as std::monostate
   template<typename T>
   using Carried = std::conditional_t<std::is_void_v<T>, std::monostate, T>;
}

/**
 * @brief Awaitable handle resolving to the output of a spawned task
 *
 * Dropping the handle detaches the task; it still runs to completion.
 */
template<typename T>
class JoinHandle
{
public:
   using Output = JoinResult<T>;

   explicit JoinHandle(oneshot::Receiver<detail::Carried<T>> receiver) : receiver(std::move(receiver)) {}

   Poll<Output> poll(Context& cx)
   {
      auto polled = receiver.poll(cx);
      if (polled.is_pending()) return pending;

      auto outcome = polled.take();
      if (outcome.is_err()) return Output::abandoned();

      if constexpr (std::is_void_v<T>) {
         return Output::completed();
      } else {
         return Output::completed(std::move(outcome).value());
      }
   }

private:
   oneshot::Receiver<detail::Carried<T>> receiver;
};

/* ============================================================================
 * Task / ReadyQueue
 * ========================================================================= */

namespace detail
{
   class ReadyQueue;

   /**
    * @brief Boxed computation of unit output
    */
   class TaskBody
   {
   public:
      virtual ~TaskBody() = default;
      virtual Poll<> poll(Context& cx) = 0;
   };

   // Traces a task output the completion channel refused
   void log_discarded_output(TaskBody const* body) noexcept;

   /**
    * @brief Spawned future plus the sender that publishes its output
    */
   template<Future F>
   class SpawnedBody final : public TaskBody
   {
      using T = typename F::Output;

   public:
      SpawnedBody(F future, oneshot::Sender<Carried<T>> sender)
         : future(std::move(future)), sender(std::move(sender)) {}

      Poll<> poll(Context& cx) override
      {
         auto polled = future.poll(cx);
         if (polled.is_pending()) return pending;

         // A detached task (JoinHandle dropped) still delivers into the
         // channel; the output is freed with it
         bool delivered;
         if constexpr (std::is_void_v<T>) delivered = sender.send(std::monostate{}).is_ok();
         else delivered = sender.send(polled.take()).is_ok();
         if (!delivered) log_discarded_output(this);
         return Poll<>::ready();
      }

   private:
      F future;
      oneshot::Sender<Carried<T>> sender;
   };

   /**
    * @brief Stable identity of a spawned computation
    *
    * Shared between the executor's ready queue and every Waker cloned from
    * it. The body is only touched by the owning executor while the polling
    * flag is held; wakers only touch the queued flag and the queue.
    */
   class Task final : public Wakeable, public std::enable_shared_from_this<Task>
   {
   public:
      Task(std::uint64_t id, std::unique_ptr<TaskBody> body, std::shared_ptr<ReadyQueue> queue) noexcept
         : task_id(id), body(std::move(body)), queue(std::move(queue)) {}

      /**
       * @brief Enqueue this task unless it is already queued (coalescing)
       */
      void wake() override;

      /**
       * @brief Outcome of one attempt to poll the task
       */
      enum class PollOutcome
      {
         Pending,   // Suspended; back in the queue only if woken
         Completed, // Body finished and was released
         Busy,      // Another thread is polling it right now
      };

      PollOutcome poll();

      /**
       * @brief Release the body without completing it (owner executor is gone)
       */
      void abandon() noexcept;

      [[nodiscard]] std::uint64_t id() const noexcept { return task_id; }
      [[nodiscard]] bool is_queued() const noexcept { return queued.load(std::memory_order_acquire); }
      [[nodiscard]] bool is_finished() const noexcept { return finished.load(std::memory_order_acquire); }

   private:
      friend class ReadyQueue;

      std::uint64_t task_id;
      std::unique_ptr<TaskBody> body;
      std::shared_ptr<ReadyQueue> queue;

      std::atomic<bool> queued{false};
      std::atomic<bool> finished{false};
      std::atomic_flag polling = ATOMIC_FLAG_INIT;

      // Intrusive FIFO link; queue_ref keeps the task alive while linked
      Task* next{nullptr};
      std::shared_ptr<Task> queue_ref;
   };

   /**
    * @brief Intrusive FIFO of ready tasks, safe against interrupt-context pushes
    *
    * push_back() never allocates.
    */
   class ReadyQueue
   {
   public:
      ReadyQueue() = default;
      ~ReadyQueue() { clear(); }

      ReadyQueue(ReadyQueue const&)            = delete;
      ReadyQueue& operator=(ReadyQueue const&) = delete;

      /**
       * @brief Append a task
       * @return false if the queue was closed (task is not linked)
       */
      bool push_back(std::shared_ptr<Task> task) noexcept;
      std::shared_ptr<Task> pop_front() noexcept;

      [[nodiscard]] bool empty() const noexcept;
      [[nodiscard]] std::size_t size() const noexcept;

      /**
       * @brief Unlink and release every queued task
       */
      void clear() noexcept;

      /**
       * @brief Refuse all further pushes, then clear()
       */
      void close() noexcept;

   private:
      mutable Spinlock lock;
      Task* head{nullptr};
      Task* tail{nullptr};
      std::size_t count{0};
      bool closed{false};
   };
}  // namespace detail

/* ============================================================================
 * Executor
 * ========================================================================= */

class Executor
{
public:
   /**
    * @brief Called by block_on when no task is ready (drive timers, reactor...)
    */
   using IdleHook = std::function<void()>;

   Executor();
   ~Executor();

   Executor(Executor const&)            = delete;
   Executor& operator=(Executor const&) = delete;
   Executor(Executor&&)                 = delete;
   Executor& operator=(Executor&&)      = delete;

   /**
    * @brief Box a computation as a task and enqueue it
    * @return Handle resolving to the computation's output
    */
   template<Future F>
   JoinHandle<typename F::Output> spawn(F future)
   {
      using T = typename F::Output;
      auto [sender, receiver] = oneshot::channel<detail::Carried<T>>();
      enqueue(std::make_unique<detail::SpawnedBody<F>>(std::move(future), std::move(sender)));
      return JoinHandle<T>(std::move(receiver));
   }

   /**
    * @brief Pop at most one ready task and poll it once
    * @return true if the ready queue is non-empty afterwards
    */
   bool step();

   /**
    * @brief step() until the ready queue is empty
    */
   void run();

   /**
    * @brief Drive a local computation to completion on the calling thread
    *
    * Between polls the executor advances by one step(). When nothing is
    * ready, the idle hook runs and, unless the computation was woken in the
    * meantime, the calling kernel thread yields.
    */
   template<Future F>
   typename F::Output block_on(F future)
   {
      auto signal = std::make_shared<BlockOnSignal>();
      Waker waker{signal};
      Context cx(waker);

      while (true) {
         signal->notified.store(false, std::memory_order_release);

         auto polled = future.poll(cx);
         if (polled.is_ready()) {
            if constexpr (std::is_void_v<typename F::Output>) return;
            else return polled.take();
         }

         step();
         if (empty()) idle(*signal);
      }
   }

   void set_idle_hook(IdleHook hook);

   /**
    * @brief Number of tasks currently waiting in the ready queue
    */
   [[nodiscard]] std::size_t len() const noexcept;
   [[nodiscard]] bool empty() const noexcept;

private:
   struct BlockOnSignal final : Wakeable
   {
      std::atomic<bool> notified{false};
      void wake() override { notified.store(true, std::memory_order_release); }
   };

   void enqueue(std::unique_ptr<detail::TaskBody> body);
   void idle(BlockOnSignal const& signal);

   std::shared_ptr<detail::ReadyQueue> ready;
   std::atomic<std::uint64_t> next_task_id{1};

   Spinlock hook_lock;
   std::shared_ptr<IdleHook> idle_hook;
};

} // namespace kasync

#endif // KASYNC_EXECUTOR_HPP
