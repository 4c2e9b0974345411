/**
 * @file port_sim.h
 * @brief Controls only available on the simulation port
 *
 * Time does not pass on its own in the simulation. Tests advance it one tick
 * at a time and can raise interrupts at precise points.
 */

#ifndef KAIROS_PORT_SIM_H
#define KAIROS_PORT_SIM_H

#include "kairos/port.h"

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Advance time by one tick and deliver the tick interrupt (if enabled)
 *
 * May be called from task context or from outside the scheduler. When called
 * from a task the task can be preempted on interrupt exit.
 */
void kairos_port_sim_tick(void);

/**
 * @brief Run @p handler in interrupt context right now
 */
void kairos_port_sim_raise_irq(kairos_port_isr_handler_t handler, void* arg);

/**
 * @brief Deliver @p handler once, just before the next critical section
 *        entered from task context disables interrupts
 */
void kairos_port_sim_irq_before_next_critical_section(kairos_port_isr_handler_t handler, void* arg);

/**
 * @brief Number of switches back into the scheduler hub
 */
uint64_t kairos_port_sim_switch_count(void);

/**
 * @brief Drop all pending simulation state (interrupts, pended reschedule)
 */
void kairos_port_sim_reset(void);

#ifdef __cplusplus
}
#endif

#endif // KAIROS_PORT_SIM_H
