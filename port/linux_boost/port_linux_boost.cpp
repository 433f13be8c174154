/**
 * @file port_linux_boost.cpp
 * @brief Linux simulation port using Boost.Context
 *
 * Kernel threads are Boost.Context fibers running on caller-provided stacks.
 * A pthread that resumes a fiber acts as that fiber's scheduler: yielding or
 * blocking inside the fiber switches back to it. Code that runs directly on a
 * pthread (no fiber) is treated as a kernel thread of its own and parks by
 * spinning with a short sleep.
 *
 * Each pthread represents a "core"; tests pick the simulated core id with
 * kasync_port_set_core_id(). Interrupt masking is a per-pthread nesting
 * depth and time is a virtual counter advanced explicitly by tests.
 */

#include "kasync/port.h"

#include <boost/context/fiber.hpp>
#include <boost/context/preallocated.hpp>
#include <boost/context/stack_context.hpp>

#include <array>
#include <atomic>
#include <cassert>
#include <cstdint>
#include <cstdlib>
#include <pthread.h>
#include <sched.h>
#include <time.h>

/* ============================================================================
 * Port Context Structure
 * ========================================================================= */

struct kasync_port_thread
{
   std::atomic<bool> unblocked{false};
};

struct kasync_port_context
{
   boost::context::fiber thread;  // Thread fiber (owned by resumer when suspended)
   boost::context::fiber sched;   // Resumer fiber (owned by thread when running)
   void*                 stack_top;
   size_t                stack_size;
   kasync_port_entry_t   entry;
   void*                 arg;
   kasync_port_thread    park;
};

// Verify that port_traits.h constants are correct
static_assert(sizeof(kasync_port_context) == KASYNC_PORT_CONTEXT_SIZE,
              "KASYNC_PORT_CONTEXT_SIZE mismatch - adjust in port_traits.h");
static_assert(alignof(kasync_port_context) == KASYNC_PORT_CONTEXT_ALIGN,
              "KASYNC_PORT_CONTEXT_ALIGN mismatch - adjust in port_traits.h");
static_assert((KASYNC_STACK_ALIGN & (KASYNC_STACK_ALIGN - 1)) == 0,
              "KASYNC_STACK_ALIGN must be a power of two");

/* ============================================================================
 * Thread-Local State
 * ========================================================================= */

// Context currently executing on this pthread (nullptr on the native stack)
static thread_local kasync_port_context* tls_current_context = nullptr;

// Park token for code running directly on the pthread
static thread_local kasync_port_thread tls_native_thread{};

// Simulated core ID
static thread_local uint32_t tls_core_id = 0;

/* ============================================================================
 * Core Identification
 * ========================================================================= */

extern "C" uint32_t kasync_port_get_core_id(void)
{
   return tls_core_id;
}

extern "C" void kasync_port_set_core_id(uint32_t core_id)
{
   assert(core_id < KASYNC_PORT_CORE_COUNT);
   tls_core_id = core_id;
}

/* ============================================================================
 * Context Switching
 * ========================================================================= */

// No-op stack allocator for preallocated memory
struct preallocated_stack_noop
{
   using traits_type = boost::context::stack_traits;
   boost::context::stack_context allocate(size_t) { std::abort(); }
   void deallocate(boost::context::stack_context&) noexcept {}
};

extern "C" void kasync_port_context_init(kasync_port_context_t* context,
                                         void* stack_base,
                                         size_t stack_size,
                                         kasync_port_entry_t entry,
                                         void* arg)
{
   ::new (context) kasync_port_context
   {
      .thread     = {},
      .sched      = {},
      .stack_top  = static_cast<uint8_t*>(stack_base) + stack_size,
      .stack_size = stack_size,
      .entry      = entry,
      .arg        = arg,
   };

   boost::context::stack_context boost_stack_context =
   {
      .size = context->stack_size,
      .sp   = context->stack_top,
   };

   boost::context::preallocated boost_prealloc(
      boost_stack_context.sp,
      boost_stack_context.size,
      boost_stack_context
   );

   context->thread = boost::context::fiber(
      std::allocator_arg,
      boost_prealloc,
      preallocated_stack_noop{},
      [context](boost::context::fiber&& sched_in) mutable -> boost::context::fiber
      {
         context->sched = std::move(sched_in);

         try {
            tls_current_context = context;
            context->entry(context->arg);
            tls_current_context = nullptr;
         } catch (boost::context::detail::forced_unwind const&) {
            tls_current_context = nullptr;
            throw;
         }

         return std::move(context->sched);
      }
   );
}

extern "C" void kasync_port_context_destroy(kasync_port_context_t* context)
{
   // Destroying a live (suspended) thread would leak its stack frames
   if (context->thread) std::abort();

   context->sched = boost::context::fiber{};
   context->~kasync_port_context();
}

extern "C" void kasync_port_switch(kasync_port_context_t* from, kasync_port_context_t* to)
{
   assert(to->thread && "No context to switch to");

   tls_current_context = to;
   to->thread = std::move(to->thread).resume();
   tls_current_context = from;
}

extern "C" bool kasync_port_context_finished(kasync_port_context_t const* context)
{
   return !context->thread;
}

extern "C" void kasync_port_yield(void)
{
   if (!tls_current_context) return;

   auto* current = tls_current_context;
   tls_current_context = nullptr;

   assert(current->sched && "No resumer context to switch to");
   current->sched = std::move(current->sched).resume();
   tls_current_context = current;
}

/* ============================================================================
 * Kernel Thread Primitives
 * ========================================================================= */

extern "C" kasync_port_thread_t* kasync_port_thread_current(void)
{
   return tls_current_context ? &tls_current_context->park : &tls_native_thread;
}

extern "C" void kasync_port_thread_yield(void)
{
   if (tls_current_context) {
      kasync_port_yield();
   } else {
      sched_yield();
   }
}

extern "C" void kasync_port_thread_block(void)
{
   auto* self = kasync_port_thread_current();
   while (!self->unblocked.exchange(false, std::memory_order_acquire)) {
      if (tls_current_context) {
         kasync_port_yield();
      } else {
         struct timespec req = {.tv_sec = 0, .tv_nsec = 50'000};
         nanosleep(&req, nullptr);
      }
   }
}

extern "C" void kasync_port_thread_unblock(kasync_port_thread_t* thread)
{
   thread->unblocked.store(true, std::memory_order_release);
}

/* ============================================================================
 * Critical Sections (Simulated)
 * ========================================================================= */

static thread_local uint32_t interrupt_disable_depth = 0;

extern "C" bool kasync_port_interrupts_enabled(void)
{
   return interrupt_disable_depth == 0;
}

extern "C" uint32_t kasync_port_irq_save(void)
{
   uint32_t prev_enabled = (interrupt_disable_depth == 0) ? 1u : 0u;
   interrupt_disable_depth++;
   return prev_enabled;
}

extern "C" void kasync_port_irq_restore(uint32_t state)
{
   (void)state;
   if (interrupt_disable_depth > 0) {
      interrupt_disable_depth--;
   }
}

extern "C" void kasync_port_cpu_relax(void)
{
#if defined(__x86_64__) || defined(__i386__)
   __builtin_ia32_pause();
#elif defined(__aarch64__) || defined(__arm__)
   __asm__ __volatile__("yield");
#endif
}

/* ============================================================================
 * Interrupt Subsystem (Simulated)
 * ========================================================================= */

struct IrqSlot
{
   std::atomic<kasync_port_isr_handler_t> handler{nullptr};
   std::atomic<void*> arg{nullptr};
};

static std::array<IrqSlot, KASYNC_PORT_IRQ_COUNT> g_irq_table{};

extern "C" bool kasync_port_irq_register_handler(uint32_t irq, kasync_port_isr_handler_t handler, void* arg)
{
   if (irq >= g_irq_table.size()) return false;
   g_irq_table[irq].arg.store(arg, std::memory_order_relaxed);
   g_irq_table[irq].handler.store(handler, std::memory_order_release);
   return true;
}

extern "C" void kasync_port_irq_unregister_handler(uint32_t irq)
{
   if (irq >= g_irq_table.size()) return;
   g_irq_table[irq].handler.store(nullptr, std::memory_order_release);
}

extern "C" bool kasync_port_irq_dispatch(uint32_t irq)
{
   if (irq >= g_irq_table.size()) return false;

   auto handler = g_irq_table[irq].handler.load(std::memory_order_acquire);
   if (!handler) return false;

   uint32_t state = kasync_port_irq_save();
   handler(g_irq_table[irq].arg.load(std::memory_order_relaxed));
   kasync_port_irq_restore(state);
   return true;
}

/* ============================================================================
 * Time Driver Port (Virtual)
 *
 * Time only moves when kasync_port_time_advance() is called. Advancing past
 * the armed one-shot deadline delivers the registered ISR on the caller.
 * ========================================================================= */

static std::atomic<uint64_t> g_port_now{0};

static std::atomic<uint64_t> g_armed_deadline{UINT64_MAX};
static std::atomic<kasync_port_isr_handler_t> g_time_isr{nullptr};
static std::atomic<void*> g_time_isr_arg{nullptr};

extern "C" uint64_t kasync_port_time_now(void)
{
   return g_port_now.load(std::memory_order_acquire);
}

extern "C" uint64_t kasync_port_time_freq_hz(void)
{
   return 1'000'000ull; // 1 tick = 1 us
}

extern "C" void kasync_port_time_reset(uint64_t t)
{
   g_port_now.store(t, std::memory_order_release);
   g_armed_deadline.store(UINT64_MAX, std::memory_order_release);
}

extern "C" void kasync_port_time_register_isr_handler(kasync_port_isr_handler_t h, void* arg)
{
   g_time_isr_arg.store(arg, std::memory_order_relaxed);
   g_time_isr.store(h, std::memory_order_release);
}

extern "C" void kasync_port_time_arm(uint64_t deadline)
{
   // Keep earliest
   uint64_t cur = g_armed_deadline.load(std::memory_order_relaxed);
   while (deadline < cur &&
          !g_armed_deadline.compare_exchange_weak(cur, deadline,
                                                  std::memory_order_release,
                                                  std::memory_order_relaxed))
   {}
}

extern "C" void kasync_port_time_disarm(void)
{
   g_armed_deadline.store(UINT64_MAX, std::memory_order_release);
}

extern "C" void kasync_port_time_advance(uint64_t delta)
{
   const uint64_t now = g_port_now.fetch_add(delta, std::memory_order_acq_rel) + delta;

   uint64_t armed = g_armed_deadline.load(std::memory_order_acquire);
   if (armed > now) return;

   // One-shot: consume the alarm before delivering it
   if (!g_armed_deadline.compare_exchange_strong(armed, UINT64_MAX, std::memory_order_acq_rel)) return;

   auto handler = g_time_isr.load(std::memory_order_acquire);
   if (!handler) return;

   uint32_t state = kasync_port_irq_save();
   handler(g_time_isr_arg.load(std::memory_order_relaxed));
   kasync_port_irq_restore(state);
}
