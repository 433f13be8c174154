/**
 * @file port_traits.h
 * @brief Port-specific compile-time constants
 *
 * Each port must provide this header defining:
 * - KASYNC_PORT_CONTEXT_SIZE: Size of kasync_port_context_t in bytes
 * - KASYNC_PORT_CONTEXT_ALIGN: Alignment requirement for kasync_port_context_t
 * - KASYNC_STACK_ALIGN: Stack alignment requirement
 * - KASYNC_PORT_CORE_COUNT: Number of cores the port can run
 * - KASYNC_PORT_IRQ_COUNT: Number of interrupt lines in the dispatch table
 *
 * The port implementation must static_assert that the actual sizes match.
 */

#ifndef KASYNC_PORT_TRAITS_H
#define KASYNC_PORT_TRAITS_H

/* ============================================================================
 * Boost.Context Port (Linux Simulation)
 * ========================================================================= */

#define KASYNC_PORT_CONTEXT_SIZE  56

#define KASYNC_PORT_CONTEXT_ALIGN 8

/**
 * @brief Stack alignment requirement in bytes (power of two)
 */
#define KASYNC_STACK_ALIGN 16

#define KASYNC_PORT_CACHE_LINE 64

#define KASYNC_PORT_CORE_COUNT 2

#define KASYNC_PORT_IRQ_COUNT 32

#define KASYNC_PORT_SIMULATION 1

#endif // KASYNC_PORT_TRAITS_H
