/**
 * @file task_waker.cpp
 * @brief Kernel-thread wakers
 */

#include "kasync/task_waker.hpp"

#include "DEBUG_PRINT.hpp"

#include <utility>

namespace kasync
{

void TaskWaker::wake()
{
   LOG_EXEC("unblock kernel thread @%p", static_cast<void*>(thread));
   kasync_port_thread_unblock(thread);
}

Waker TaskWaker::for_thread(kasync_port_thread_t* thread)
{
   return Waker{std::make_shared<TaskWaker>(thread)};
}

Waker current_task_waker()
{
   return TaskWaker::for_thread(kasync_port_thread_current());
}

void AsyncTask::set_waker(Waker const& new_waker)
{
   SpinlockGuard guard(lock);
   if (waker.will_wake(new_waker)) return;
   waker = new_waker;
}

bool AsyncTask::wake()
{
   Waker to_wake;
   {
      SpinlockGuard guard(lock);
      to_wake = std::move(waker);
      waker = Waker{};
   }
   if (!to_wake) return false;
   to_wake.wake();
   return true;
}

bool AsyncTask::has_waker() const
{
   SpinlockGuard guard(lock);
   return static_cast<bool>(waker);
}

} // namespace kasync
