/**
 * @file mmio.cpp
 * @brief MMIO waker set and event future
 */

#include "kasync/mmio.hpp"

#include "DEBUG_PRINT.hpp"

#include <utility>
#include <vector>

namespace kasync
{

static MmioEventId next_event_id() noexcept
{
   static std::atomic<MmioEventId> counter{1};
   return counter.fetch_add(1, std::memory_order_relaxed);
}

/* ============================================================================
 * MmioWakerSet
 * ========================================================================= */

bool MmioWakerSet::register_waker(MmioEventId id, Waker waker)
{
   Waker replaced;
   {
      SpinlockGuard guard(lock);
      auto& slot = wakers[id];
      replaced = std::exchange(slot, std::move(waker));
   }
   return true;
}

bool MmioWakerSet::cancel(MmioEventId id)
{
   Waker dropped;
   {
      SpinlockGuard guard(lock);
      auto it = wakers.find(id);
      if (it == wakers.end()) return false;
      dropped = std::move(it->second);
      wakers.erase(it);
   }
   return true;
}

bool MmioWakerSet::wake_event(MmioEventId id)
{
   Waker to_wake;
   {
      SpinlockGuard guard(lock);
      auto it = wakers.find(id);
      if (it == wakers.end()) return false;
      to_wake = std::move(it->second);
      wakers.erase(it);
   }
   to_wake.wake();
   return true;
}

std::size_t MmioWakerSet::wake_matching(std::function<bool(MmioEventId)> const& predicate)
{
   std::vector<Waker> to_wake;
   {
      SpinlockGuard guard(lock);
      for (auto it = wakers.begin(); it != wakers.end();) {
         if (predicate(it->first)) {
            to_wake.push_back(std::move(it->second));
            it = wakers.erase(it);
         } else {
            ++it;
         }
      }
   }

   for (auto& waker : to_wake) waker.wake();
   return to_wake.size();
}

std::size_t MmioWakerSet::len() const
{
   SpinlockGuard guard(lock);
   return wakers.size();
}

/* ============================================================================
 * MmioEvent
 * ========================================================================= */

void MmioEvent::Signal::wake()
{
   fired.store(true, std::memory_order_release);

   Waker to_wake;
   {
      SpinlockGuard guard(lock);
      to_wake = std::move(task);
   }
   to_wake.wake();
}

MmioEvent::MmioEvent(std::shared_ptr<MmioEventHandler> handler)
   : handler(std::move(handler)), signal(std::make_shared<Signal>()), id(next_event_id())
{
}

MmioEvent::MmioEvent(MmioEvent&& other) noexcept
   : handler(std::move(other.handler)),
     signal(std::move(other.signal)),
     id(other.id),
     registered(std::exchange(other.registered, false)),
     completed(other.completed)
{
}

MmioEvent::~MmioEvent()
{
   if (registered && !completed && handler) {
      if (!handler->cancel_event(id)) {
         LOG_REACTOR("MMIO event %llu fired while being dropped", static_cast<unsigned long long>(id));
      }
   }
}

Poll<MmioEvent::Output> MmioEvent::poll(Context& cx)
{
   if (completed) return id;

   if (signal->fired.load(std::memory_order_acquire)) {
      completed = true;
      return id;
   }

   {
      SpinlockGuard guard(signal->lock);
      if (!signal->task.will_wake(cx.waker())) signal->task = cx.waker();
   }

   if (!registered) {
      if (!handler->register_event(id, Waker{signal})) {
         // Nothing would ever fire it; resolve rather than hang
         LOG_REACTOR("MMIO event %llu could not be registered", static_cast<unsigned long long>(id));
         completed = true;
         return id;
      }
      registered = true;
   }

   // The driver may have fired between the check above and the registration
   if (signal->fired.load(std::memory_order_acquire)) {
      completed = true;
      return id;
   }
   return pending;
}

} // namespace kasync
