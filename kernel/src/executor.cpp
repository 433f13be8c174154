/**
 * @file executor.cpp
 * @brief Task cells, ready queue and executor loop
 */

#include "kasync/executor.hpp"
#include "kasync/port.h"

#include "DEBUG_PRINT.hpp"

namespace kasync
{

namespace detail
{

/* ============================================================================
 * Task
 * ========================================================================= */

void Task::wake()
{
   if (finished.load(std::memory_order_acquire)) return;

   // Coalesce: only the first wake since the last poll enqueues
   if (queued.exchange(true, std::memory_order_acq_rel)) return;

   if (!queue->push_back(shared_from_this())) {
      LOG_EXEC("Task #%llu woken after its executor shut down", static_cast<unsigned long long>(task_id));
      abandon();
   }
}

Task::PollOutcome Task::poll()
{
   if (polling.test_and_set(std::memory_order_acquire)) return PollOutcome::Busy;

   // Wakes arriving from here on re-queue the task for another poll
   queued.store(false, std::memory_order_release);

   if (!body) {
      polling.clear(std::memory_order_release);
      return PollOutcome::Completed;
   }

   Waker waker{shared_from_this()};
   Context cx(waker);

   if (body->poll(cx).is_ready()) {
      finished.store(true, std::memory_order_release);
      body.reset();
      polling.clear(std::memory_order_release);
      return PollOutcome::Completed;
   }

   polling.clear(std::memory_order_release);
   return PollOutcome::Pending;
}

void Task::abandon() noexcept
{
   if (polling.test_and_set(std::memory_order_acquire)) return;
   finished.store(true, std::memory_order_release);
   body.reset();
   polling.clear(std::memory_order_release);
}

/* ============================================================================
 * ReadyQueue
 * ========================================================================= */

bool ReadyQueue::push_back(std::shared_ptr<Task> task) noexcept
{
   SpinlockGuard guard(lock);
   if (closed) return false;

   Task* raw = task.get();
   assert(raw->next == nullptr && !raw->queue_ref && "Task already linked");
   raw->queue_ref = std::move(task);
   if (tail) tail->next = raw; else head = raw;
   tail = raw;
   ++count;
   return true;
}

std::shared_ptr<Task> ReadyQueue::pop_front() noexcept
{
   SpinlockGuard guard(lock);
   if (!head) return nullptr;

   Task* raw = head;
   head = raw->next;
   if (!head) tail = nullptr;
   raw->next = nullptr;
   --count;
   return std::move(raw->queue_ref);
}

bool ReadyQueue::empty() const noexcept
{
   SpinlockGuard guard(lock);
   return head == nullptr;
}

std::size_t ReadyQueue::size() const noexcept
{
   SpinlockGuard guard(lock);
   return count;
}

void ReadyQueue::clear() noexcept
{
   // Released outside the lock: a dying task may wake tasks on this queue
   while (auto task = pop_front()) {
      task->queued.store(false, std::memory_order_release);
   }
}

void ReadyQueue::close() noexcept
{
   {
      SpinlockGuard guard(lock);
      closed = true;
   }
   clear();
}

void log_discarded_output([[maybe_unused]] TaskBody const* body) noexcept
{
   LOG_EXEC("task body @%p finished but its output channel was already complete, output dropped",
            static_cast<void const*>(body));
}

}  // namespace detail

/* ============================================================================
 * Executor
 * ========================================================================= */

Executor::Executor()
   : ready(std::make_shared<detail::ReadyQueue>())
{
}

Executor::~Executor()
{
   LOG_EXEC("Executor @%p shutting down with %zu ready task(s)", static_cast<void*>(this), ready->size());
   ready->close();
}

void Executor::enqueue(std::unique_ptr<detail::TaskBody> body)
{
   auto id = next_task_id.fetch_add(1, std::memory_order_relaxed);
   auto task = std::make_shared<detail::Task>(id, std::move(body), ready);
   LOG_EXEC("spawn task #%llu on executor @%p", static_cast<unsigned long long>(id), static_cast<void*>(this));
   task->wake();
}

bool Executor::step()
{
   auto task = ready->pop_front();
   if (!task) return false;

   switch (task->poll()) {
      case detail::Task::PollOutcome::Completed:
         LOG_EXEC("task #%llu completed", static_cast<unsigned long long>(task->id()));
         break;
      case detail::Task::PollOutcome::Pending:
         break;
      case detail::Task::PollOutcome::Busy:
         // Still marked queued; hand it back for the thread polling it to finish
         if (!ready->push_back(std::move(task))) return false;
         break;
   }

   return !ready->empty();
}

void Executor::run()
{
   while (step()) {}
}

void Executor::set_idle_hook(IdleHook hook)
{
   auto shared = hook ? std::make_shared<IdleHook>(std::move(hook)) : nullptr;
   SpinlockGuard guard(hook_lock);
   idle_hook = std::move(shared);
}

void Executor::idle(BlockOnSignal const& signal)
{
   std::shared_ptr<IdleHook> hook;
   {
      SpinlockGuard guard(hook_lock);
      hook = idle_hook;
   }
   if (hook) (*hook)();

   if (empty() && !signal.notified.load(std::memory_order_acquire)) {
      kasync_port_thread_yield();
   }
}

std::size_t Executor::len() const noexcept
{
   return ready->size();
}

bool Executor::empty() const noexcept
{
   return ready->empty();
}

} // namespace kasync
