/**
 * @file futex.hpp
 * @brief Value-gated wait/wake, the kernel's only blocking primitive
 *
 * A futex is identified by the address of a 32-bit cell the caller owns.
 * The kernel keeps a FIFO wait queue per cell while someone is waiting on it
 * and drops the queue again once it empties.
 */

#ifndef KAIROS_FUTEX_HPP
#define KAIROS_FUTEX_HPP

#include "kairos/error.hpp"
#include "kairos/kernel.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>

namespace kairos::futex
{
   using Cell = std::atomic<std::uint32_t>;

   /**
    * @brief Block while @p cell holds @p expected
    * @return Error::None once woken, Error::WouldNotBlock if the cell already
    *         differed, Error::NotPermitted from an interrupt, the idle task
    *         or before the scheduler runs
    *
    * The compare and the enqueue happen in one critical section, so a wake
    * issued after the caller changed the cell can never be missed. Wakeups
    * can be spurious from the waiter's point of view: recheck the condition.
    */
   Error wait(Cell& cell, std::uint32_t expected);

   /**
    * @brief Make up to @p count waiters on @p cell Ready, oldest first
    * @return Number of tasks woken (zero is fine)
    *
    * Callable from interrupts.
    */
   std::size_t wake(Cell& cell, std::size_t count);

   inline std::size_t wake_one(Cell& cell) { return wake(cell, 1); }

   inline std::size_t wake_all(Cell& cell) { return wake(cell, config::MAX_TASKS); }

   /**
    * @brief Number of tasks currently blocked on @p cell
    */
   [[nodiscard]] std::size_t waiter_count(Cell const& cell);

   /**
    * @brief Number of cells that currently have a wait queue
    */
   [[nodiscard]] std::size_t active_queue_count();

}  // namespace kairos::futex

#endif // KAIROS_FUTEX_HPP
