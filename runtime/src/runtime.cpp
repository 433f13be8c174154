/**
 * @file runtime.cpp
 * @brief One-shot runtime construction and the idle driver
 */

#include "kasync/runtime.hpp"
#include "kasync/backends.hpp"
#include "kasync/port.h"

#include "DEBUG_PRINT.hpp"

#include <atomic>
#include <cstdint>
#include <new>

namespace kasync
{

namespace
{
   enum InitState : std::uint8_t
   {
      Uninitialized,
      Initializing,
      Ready,
   };

   constinit std::atomic<std::uint8_t> init_state{Uninitialized};
   alignas(Runtime) unsigned char runtime_storage[sizeof(Runtime)];

   Runtime* runtime_ptr() noexcept
   {
      return std::launder(reinterpret_cast<Runtime*>(runtime_storage));
   }
}  // namespace

Runtime::Runtime(std::unique_ptr<io::IoBackend> backend)
   : io_reactor(backend ? std::move(backend) : std::make_unique<io::SyncDeviceBackend>())
{
   auto idle = [this] { drive(); };
   global.set_idle_hook(idle);
   for (auto& executor : per_core) executor.set_idle_hook(idle);

   kasync_port_time_register_isr_handler(&TimerQueue::on_timer_isr, &timer_queue);
   if (!kasync_port_irq_register_handler(config::TIMER_IRQ, &TimerQueue::on_timer_isr, &timer_queue)) {
      LOG_TIMER("timer IRQ %u could not be registered, timers run from the idle path only", config::TIMER_IRQ);
   }
}

Runtime& Runtime::instance()
{
   if (init_state.load(std::memory_order_acquire) == InitState::Ready) return *runtime_ptr();
   return init(nullptr);
}

Runtime& Runtime::init(std::unique_ptr<io::IoBackend> backend)
{
   std::uint8_t expected = Uninitialized;
   if (init_state.compare_exchange_strong(expected, Initializing, std::memory_order_acq_rel)) {
      ::new (runtime_storage) Runtime(std::move(backend));
      init_state.store(InitState::Ready, std::memory_order_release);
      LOG_EXEC("runtime initialized (%zu core executor(s))", config::CORES);
      return *runtime_ptr();
   }

   // Lost the race or already up: wait for the winner to finish constructing
   while (init_state.load(std::memory_order_acquire) != InitState::Ready) {
      kasync_port_cpu_relax();
   }
   if (backend) {
      LOG_REACTOR("runtime already initialized, discarding reactor backend");
   }
   return *runtime_ptr();
}

bool Runtime::is_initialized() noexcept
{
   return init_state.load(std::memory_order_acquire) == InitState::Ready;
}

Executor& Runtime::local_executor() noexcept
{
   return core_executor(kasync_port_get_core_id());
}

Executor& Runtime::core_executor(std::size_t core) noexcept
{
   return per_core[core % per_core.size()];
}

void Runtime::drive()
{
   check_timer_events(timer_queue, now());
   io_reactor.poll();
}

/* ============================================================================
 * Free functions
 * ========================================================================= */

void run()
{
   Runtime::instance().global_executor().run();
}

void run_local()
{
   Runtime::instance().local_executor().run();
}

Sleep sleep(Duration duration)
{
   return sleep_for(Runtime::instance().timers(), duration);
}

Sleep sleep_until(TimePoint deadline)
{
   return sleep_until(Runtime::instance().timers(), deadline);
}

bool wake_at(TimePoint deadline, Waker waker)
{
   return wake_at(Runtime::instance().timers(), deadline, std::move(waker));
}

io::Reactor& reactor()
{
   return Runtime::instance().reactor();
}

TimerQueue& timers()
{
   return Runtime::instance().timers();
}

} // namespace kasync
