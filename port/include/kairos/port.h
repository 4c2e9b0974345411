/**
 * @file port.h
 * @brief Kairos Port Layer API (C ABI)
 *
 * Boundary between the Kairos kernel and the architecture. Everything here
 * uses C linkage so a port can be written in C or assembly.
 *
 * Context switches only ever happen at the port's exception boundary
 * (PendSV on Cortex-M, the scheduler hub fiber in the simulation). Kernel code
 * requests one with kairos_port_pend_reschedule() and the port calls back into
 * kairos_kernel_dispatch() to pick the next task.
 */

#ifndef KAIROS_PORT_H
#define KAIROS_PORT_H

#include "kairos/port_traits.h"

#include <stddef.h>
#include <stdint.h>
#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

/* ============================================================================
 * Port Configuration
 * ========================================================================= */
#ifndef KAIROS_PORT_SIMULATION
# define KAIROS_PORT_SIMULATION 0
#endif

/**
 * @brief Opaque context structure (platform-specific size/alignment)
 *
 * Each port defines the actual structure. The kernel reserves
 * KAIROS_PORT_CONTEXT_SIZE bytes per task and treats them as opaque.
 */
typedef struct kairos_port_context kairos_port_context_t;

/**
 * @brief Task entry point signature
 */
typedef void (*kairos_port_entry_t)(void* arg);

/**
 * @brief ISR signature
 */
typedef void (*kairos_port_isr_handler_t)(void* arg);

/* ============================================================================
 * Context Switching
 * ========================================================================= */

/**
 * @brief Prepare the initial context of a task
 * @param context Context storage owned by the kernel
 * @param stack_base Lowest usable address of the stack
 * @param stack_size Usable size in bytes
 * @param entry Function executed on the first switch to this context
 * @param arg Argument passed to entry
 */
void kairos_port_context_init(kairos_port_context_t* context,
                              void* stack_base,
                              size_t stack_size,
                              kairos_port_entry_t entry,
                              void* arg);

/**
 * @brief Release a context that will never be switched to again
 *
 * After this returns the stack memory may be reused by the caller.
 */
void kairos_port_context_destroy(kairos_port_context_t* context);

/**
 * @brief Save the state of @p from and resume @p to
 *
 * Only called from kairos_kernel_dispatch(). @p from is NULL on the very
 * first dispatch and may equal @p to.
 */
void kairos_port_switch(kairos_port_context_t* from, kairos_port_context_t* to);

/**
 * @brief Enter the dispatch loop
 *
 * Hardware ports never return from here. The simulation port returns once
 * kairos_kernel_dispatch() reports that nothing can run any more.
 */
void kairos_port_run_scheduler(void);

/**
 * @brief Request a reschedule at the next exception boundary
 *
 * Safe from interrupt context. Multiple requests coalesce.
 */
void kairos_port_pend_reschedule(void);

/**
 * @brief Take a pending reschedule now
 *
 * No-op in interrupt context, inside a critical section, or when nothing is
 * pending. Kernel code calls this after leaving its critical section.
 */
void kairos_port_yield(void);

/**
 * @brief Leave the current task forever
 */
void kairos_port_thread_exit(void) __attribute__((noreturn));

/* ============================================================================
 * Critical Sections
 * ========================================================================= */

/**
 * @brief Disable interrupts, returning the previous state (nestable)
 */
uint32_t kairos_port_irq_save(void);

/**
 * @brief Restore the state returned by the matching kairos_port_irq_save()
 *
 * Re-enabling interrupts in task context takes a reschedule pended inside the
 * section, the way a pended PendSV fires as soon as PRIMASK is cleared.
 */
void kairos_port_irq_restore(uint32_t state);

/**
 * @brief True while an interrupt handler is executing
 */
bool kairos_port_in_isr(void);

/* ============================================================================
 * Platform
 * ========================================================================= */

void kairos_port_init(void);

/**
 * @brief Called repeatedly by the idle task (WFI on hardware)
 */
void kairos_port_idle(void);

/**
 * @brief Stop the system after an unrecoverable fault
 */
void kairos_port_halt(const char* reason) __attribute__((noreturn));

/* ============================================================================
 * Time
 * ========================================================================= */

/**
 * @brief Configure the periodic tick source
 */
void kairos_port_time_setup(uint32_t tick_hz);

/**
 * @brief Monotonic tick count since the last reset
 */
uint64_t kairos_port_time_now(void);

void kairos_port_time_register_isr_handler(kairos_port_isr_handler_t handler, void* arg);
void kairos_port_time_irq_enable(void);
void kairos_port_time_irq_disable(void);
void kairos_port_time_reset(uint64_t time);

/* ============================================================================
 * Kernel hooks (implemented by the kernel, called by the port)
 * ========================================================================= */

/**
 * @brief Select the next task and switch to it
 * @return false when no task can ever become runnable again
 */
bool kairos_kernel_dispatch(void);

#ifdef __cplusplus
}
#endif

#endif // KAIROS_PORT_H
