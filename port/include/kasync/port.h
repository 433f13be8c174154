/**
 * @file port.h
 * @brief kasync Port Layer API (C ABI)
 *
 * This is the boundary between the kasync runtime and the platform. The runtime
 * never programs device or interrupt controller registers itself; everything
 * it needs from the machine (interrupt masking, kernel thread parking, a
 * monotonic clock with a one-shot alarm, IRQ handler registration) is
 * declared here with C linkage so a port can be written in C or assembly.
 *
 * Port implementations must provide all functions declared here.
 */

#ifndef KASYNC_PORT_H
#define KASYNC_PORT_H

#include "kasync/port_traits.h"

#include <stddef.h>
#include <stdint.h>
#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

/* ============================================================================
 * Port Configuration
 * ========================================================================= */
#ifndef KASYNC_PORT_SIMULATION
# define KASYNC_PORT_SIMULATION 0
#endif

/**
 * @brief Opaque context structure (platform-specific size/alignment)
 */
typedef struct kasync_port_context kasync_port_context_t;

/**
 * @brief Opaque kernel thread handle used for block/unblock
 */
typedef struct kasync_port_thread kasync_port_thread_t;

/**
 * @brief Kernel thread entry point signature
 */
typedef void (*kasync_port_entry_t)(void* arg);

/**
 * @brief ISR signature
 */
typedef void (*kasync_port_isr_handler_t)(void* arg);

/* ============================================================================
 * Core Identification
 * ========================================================================= */

/**
 * @brief Get the ID of the current CPU core
 * @return Core ID (0-indexed), always < KASYNC_PORT_CORE_COUNT
 */
uint32_t kasync_port_get_core_id(void);

/* ============================================================================
 * Kernel Thread Contexts
 * ========================================================================= */

/**
 * @brief Initialize a kernel thread context on a caller-provided stack
 *
 * The thread starts executing entry(arg) the first time kasync_port_switch()
 * resumes it.
 */
void kasync_port_context_init(kasync_port_context_t* context,
                              void* stack_base,
                              size_t stack_size,
                              kasync_port_entry_t entry,
                              void* arg);

/**
 * @brief Destroy a context whose entry function has returned
 */
void kasync_port_context_destroy(kasync_port_context_t* context);

/**
 * @brief Resume 'to' until it yields, blocks or finishes
 * @param from Context to save (can be NULL when switching from the native thread)
 */
void kasync_port_switch(kasync_port_context_t* from, kasync_port_context_t* to);

/**
 * @brief Check whether the context's entry function has returned
 */
bool kasync_port_context_finished(kasync_port_context_t const* context);

/**
 * @brief Give the CPU back to whoever resumed the current context
 *
 * No-op when called outside of a port context.
 */
void kasync_port_yield(void);

/* ============================================================================
 * Kernel Thread Primitives
 * ========================================================================= */

/**
 * @brief Handle of the calling kernel thread
 *
 * Valid for as long as the thread (or port context) exists.
 */
kasync_port_thread_t* kasync_port_thread_current(void);

/**
 * @brief Cooperatively deschedule and reschedule the calling thread (yield_now)
 */
void kasync_port_thread_yield(void);

/**
 * @brief Block the calling thread until kasync_port_thread_unblock() is called on it
 *
 * An unblock that arrives before block() is not lost: block() then returns
 * immediately and consumes it.
 */
void kasync_port_thread_block(void);

/**
 * @brief Make a blocked thread runnable again
 *
 * Safe to call from interrupt context and from other cores.
 */
void kasync_port_thread_unblock(kasync_port_thread_t* thread);

/* ============================================================================
 * Critical Sections (Interrupt Control)
 * ========================================================================= */

/**
 * @brief Disable local interrupts and return the previous state
 */
uint32_t kasync_port_irq_save(void);

/**
 * @brief Restore the state returned by kasync_port_irq_save()
 */
void kasync_port_irq_restore(uint32_t state);

/**
 * @brief Check if interrupts are currently enabled on this core
 */
bool kasync_port_interrupts_enabled(void);

void kasync_port_cpu_relax(void);

/* ============================================================================
 * Interrupt Subsystem
 * ========================================================================= */

/**
 * @brief Install the handler for an interrupt line (replaces any previous one)
 * @return false if irq is out of range
 */
bool kasync_port_irq_register_handler(uint32_t irq, kasync_port_isr_handler_t handler, void* arg);

/**
 * @brief Remove the handler for an interrupt line
 */
void kasync_port_irq_unregister_handler(uint32_t irq);

/**
 * @brief Deliver an interrupt: runs the installed handler with interrupts masked
 * @return true if a handler was installed
 */
bool kasync_port_irq_dispatch(uint32_t irq);

/* ============================================================================
 * Time Port
 * ========================================================================= */

/**
 * @brief Monotonic time source in port ticks
 */
uint64_t kasync_port_time_now(void);

/**
 * @brief Tick frequency in Hz (ticks per second)
 */
uint64_t kasync_port_time_freq_hz(void);

/**
 * @brief Arm a one-shot timer interrupt at an absolute deadline
 *
 * If called multiple times before the interrupt fires, the earliest deadline
 * is honoured.
 */
void kasync_port_time_arm(uint64_t deadline);

/**
 * @brief Disable any pending one-shot
 */
void kasync_port_time_disarm(void);

/**
 * @brief Install the handler run when an armed deadline is reached
 */
void kasync_port_time_register_isr_handler(kasync_port_isr_handler_t handler, void* arg);

#if KASYNC_PORT_SIMULATION
/**
 * @brief Set the simulated core id of the calling pthread (tests only)
 */
void kasync_port_set_core_id(uint32_t core_id);

/**
 * @brief Reset simulated time and disarm the one-shot (tests only)
 */
void kasync_port_time_reset(uint64_t time);

/**
 * @brief Advance simulated time, delivering the timer ISR if the armed deadline passed
 */
void kasync_port_time_advance(uint64_t delta);
#endif

#ifdef __cplusplus
}
#endif

#endif /* KASYNC_PORT_H */
