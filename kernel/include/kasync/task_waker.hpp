/**
 * @file task_waker.hpp
 * @brief Wakers that park and unpark kernel threads
 *
 * For code that runs a computation on a kernel thread of its own instead of
 * spawning it on an Executor: the thread blocks between polls and the
 * computation's Waker unblocks it.
 */

#ifndef KASYNC_TASK_WAKER_HPP
#define KASYNC_TASK_WAKER_HPP

#include "kasync/future.hpp"
#include "kasync/kernel.hpp"
#include "kasync/port.h"

#include <cassert>
#include <memory>
#include <type_traits>

namespace kasync
{

/**
 * @brief Wake target that unblocks one kernel thread
 */
class TaskWaker final : public Wakeable
{
public:
   explicit TaskWaker(kasync_port_thread_t* thread) noexcept : thread(thread)
   {
      assert(thread && "TaskWaker needs a thread");
   }

   void wake() override;

   /**
    * @brief Wrap a TaskWaker for thread in a Waker
    */
   static Waker for_thread(kasync_port_thread_t* thread);

   [[nodiscard]] kasync_port_thread_t* target() const noexcept { return thread; }

private:
   kasync_port_thread_t* thread;
};

/**
 * @brief Waker that unblocks the calling kernel thread
 */
Waker current_task_waker();

/**
 * @brief Drive a computation on the calling kernel thread, blocking between polls
 *
 * Unlike Executor::block_on nothing else runs on this thread while it waits;
 * some other thread or an interrupt has to wake the computation.
 */
template<Future F>
typename F::Output block_on_thread(F future)
{
   Waker waker = current_task_waker();
   Context cx(waker);

   while (true) {
      auto polled = future.poll(cx);
      if (polled.is_ready()) {
         if constexpr (std::is_void_v<typename F::Output>) return;
         else return polled.take();
      }
      kasync_port_thread_block();
   }
}

/**
 * @brief Single waker slot for driver code
 *
 * The async side stores its waker with set_waker(); the interrupt side calls
 * wake(), which consumes the stored waker.
 */
class AsyncTask
{
public:
   AsyncTask() = default;
   AsyncTask(AsyncTask const&)            = delete;
   AsyncTask& operator=(AsyncTask const&) = delete;

   /**
    * @brief Store waker unless the stored one already wakes the same target
    */
   void set_waker(Waker const& waker);

   /**
    * @brief Wake and clear the stored waker
    * @return false if no waker was stored
    */
   bool wake();

   [[nodiscard]] bool has_waker() const;

private:
   mutable Spinlock lock;
   Waker waker;
};

} // namespace kasync

#endif // KASYNC_TASK_WAKER_HPP
