#include "kernel_state.hpp"

#include "kairos/futex.hpp"
#include "kairos/port.h"

#include "DEBUG_PRINT.hpp"

namespace kairos
{

static std::uintptr_t key_of(futex::Cell const& cell) noexcept
{
   return reinterpret_cast<std::uintptr_t>(&cell);
}

/* ============================================================================
 * FutexTable
 * ========================================================================= */

FutexTable::Queue* FutexTable::find(std::uintptr_t key) noexcept
{
   for (auto& q : queues) {
      if (q.key == key) return &q;
   }
   return nullptr;
}

void FutexTable::enqueue(std::uintptr_t key, TaskControlBlock& tcb) noexcept
{
   assert(key != 0);

   Queue* q = find(key);
   if (!q) {
      q = find(0);
      // One queue per waiting task at most, so a free one always exists
      assert(q && "futex table exhausted");
      q->key = key;
   }

   arena.push_back(q->waiters, tcb, QueueTag::Futex);
   tcb.futex_queue = static_cast<std::uint8_t>(q - queues.data());
}

TaskControlBlock* FutexTable::dequeue(std::uintptr_t key) noexcept
{
   Queue* q = find(key);
   if (!q) return nullptr;

   TaskControlBlock* tcb = arena.pop_front(q->waiters);
   tcb->futex_queue = NO_SLOT;
   if (q->waiters.empty()) q->key = 0;
   return tcb;
}

void FutexTable::remove(TaskControlBlock& tcb) noexcept
{
   assert(tcb.queue == QueueTag::Futex && tcb.futex_queue != NO_SLOT);

   Queue& q = queues[tcb.futex_queue];
   arena.remove(q.waiters, tcb);
   tcb.futex_queue = NO_SLOT;
   if (q.waiters.empty()) q.key = 0;
}

std::size_t FutexTable::waiter_count(std::uintptr_t key) const noexcept
{
   for (auto const& q : queues) {
      if (q.key == key) return q.waiters.size();
   }
   return 0;
}

std::size_t FutexTable::active_queues() const noexcept
{
   std::size_t n = 0;
   for (auto const& q : queues) {
      if (q.key != 0) n++;
   }
   return n;
}

void FutexTable::clear() noexcept
{
   queues.fill(Queue{});
}

/* ============================================================================
 * Kernel side
 * ========================================================================= */

std::size_t Kernel::wake_waiters(std::uintptr_t key, std::size_t count) noexcept
{
   std::size_t woken = 0;
   while (woken < count) {
      TaskControlBlock* tcb = futexes.dequeue(key);
      if (!tcb) break;
      make_ready(*tcb);
      woken++;
   }
   return woken;
}

}  // namespace kairos

namespace kairos::futex
{
   Error wait(Cell& cell, std::uint32_t expected)
   {
      auto& k = Kernel::instance();
      if (!k.in_task()) return Error::NotPermitted;

      // Cheap early out before touching interrupts
      if (cell.load(std::memory_order_acquire) != expected) return Error::WouldNotBlock;

      {
         CriticalSection cs;

         // The value may have changed (and its wake been issued) since the check above
         if (cell.load(std::memory_order_acquire) != expected) return Error::WouldNotBlock;

         LOG_FUTEX("task %u waits on %p", k.current->id().value(), static_cast<void*>(&cell));
         k.futexes.enqueue(key_of(cell), *k.current);
         k.block_current(TaskState::Blocked);
      }

      kairos_port_yield();
      return Error::None;
   }

   std::size_t wake(Cell& cell, std::size_t count)
   {
      auto& k = Kernel::instance();
      std::size_t woken;
      {
         CriticalSection cs;
         woken = k.wake_waiters(key_of(cell), count);
      }

      if (woken) LOG_FUTEX("woke %zu on %p", woken, static_cast<void*>(&cell));
      kairos_port_yield();
      return woken;
   }

   std::size_t waiter_count(Cell const& cell)
   {
      auto& k = Kernel::instance();
      CriticalSection cs;
      return k.futexes.waiter_count(key_of(cell));
   }

   std::size_t active_queue_count()
   {
      auto& k = Kernel::instance();
      CriticalSection cs;
      return k.futexes.active_queues();
   }

}  // namespace kairos::futex
