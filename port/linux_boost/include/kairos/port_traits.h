/**
 * @file port_traits.h
 * @brief Port-specific compile-time constants
 *
 * Each port provides this header. The kernel sizes its per-task context
 * storage and validates task stacks against these values; the port
 * static_asserts that they match its real structures.
 */

#ifndef KAIROS_PORT_TRAITS_H
#define KAIROS_PORT_TRAITS_H

/* ============================================================================
 * Boost.Context Port (Linux Simulation)
 * ========================================================================= */

#define KAIROS_PORT_CONTEXT_SIZE  48

#define KAIROS_PORT_CONTEXT_ALIGN 8

/**
 * @brief Stack alignment requirement in bytes (power of two)
 */
#define KAIROS_STACK_ALIGN 16

/**
 * @brief Smallest stack the port can start a task on
 *
 * Covers the fiber control record Boost.Context places at the top of the
 * stack plus one register save frame.
 */
#define KAIROS_PORT_MIN_STACK_SIZE 1024

/**
 * @brief Stack reserved for the kernel's idle task
 *
 * The simulated tick interrupt runs on whichever stack is current, so the
 * idle stack has to hold a printf call chain when logging is enabled.
 */
#define KAIROS_PORT_IDLE_STACK_SIZE (32 * 1024)

#define KAIROS_PORT_SIMULATION 1

#endif // KAIROS_PORT_TRAITS_H
