#include "kernel_state.hpp"

#include "kairos/kernel.hpp"
#include "kairos/port.h"

#include "DEBUG_PRINT.hpp"

#include <limits>

namespace kairos
{

/* ============================================================================
 * State transitions
 * ========================================================================= */

void Kernel::make_ready(TaskControlBlock& tcb) noexcept
{
   assert(tcb.queue == QueueTag::None);

   tcb.state = TaskState::Ready;
   ready.enqueue(tcb);

   // Equal priority pends too: the dispatch decides whether a rotation is due
   bool const idle_or_none = !current || current == &idle || current->state != TaskState::Running;
   if (idle_or_none || tcb.priority <= current->priority) {
      kairos_port_pend_reschedule();
   }
}

void Kernel::block_current(TaskState state) noexcept
{
   assert(current && current != &idle);
   assert(state == TaskState::Blocked || state == TaskState::Suspended);

   current->state = state;
   kairos_port_pend_reschedule();
}

void Kernel::unlink(TaskControlBlock& tcb) noexcept
{
   switch (tcb.queue) {
      case QueueTag::Ready: ready.remove(tcb); break;
      case QueueTag::Futex: futexes.remove(tcb); break;
      case QueueTag::Sleep:
         sleepers.remove(&tcb);
         tcb.queue = QueueTag::None;
         break;
      case QueueTag::None: break;
   }
}

void Kernel::terminate(TaskControlBlock& tcb) noexcept
{
   LOG_SCHED("task %u terminated", tcb.id().value());

   unlink(tcb);
   tcb.state = TaskState::Terminated;
   tcb.exit_cell.store(0, std::memory_order_release);
   wake_waiters(reinterpret_cast<std::uintptr_t>(&tcb.exit_cell), config::MAX_TASKS);

   if (&tcb == current) kairos_port_pend_reschedule();
}

/* ============================================================================
 * Dispatch
 * ========================================================================= */

TaskControlBlock* Kernel::select_next(TaskControlBlock* prev) noexcept
{
   bool const prev_runnable = prev && prev != &idle && prev->state == TaskState::Running;

   if (prev_runnable) {
      int const best = ready.best_priority();

      // Nothing better, or a peer is waiting but prev still owns the slice
      if (best < 0 || best > prev->priority) return prev;
      if (best == prev->priority && !slice_expired && !yield_requested) return prev;

      // Round-robin rotation or preemption: prev goes to the tail of its level
      prev->state = TaskState::Ready;
      ready.enqueue(*prev);
   }

   if (auto* next = ready.pop_best()) return next;
   return cfg.idle_task ? &idle : nullptr;
}

bool Kernel::dispatch()
{
   TaskControlBlock* prev;
   TaskControlBlock* next;
   {
      CriticalSection cs;

      prev = current;
      // A task already terminated (possibly by an earlier overflow) is not checked again
      if (prev && prev->state != TaskState::Terminated && !prev->canary_intact()) stack_overflow(*prev);

      next = select_next(prev);

      bool const stop = !next || (next == &idle && quiescent());
      if (stop) {
         if constexpr (!KAIROS_PORT_SIMULATION) {
            if (!next) kairos_port_halt("no runnable task and no idle task");
         }
         if (prev == &idle) idle.state = TaskState::Ready;
         current = nullptr;
         return false;
      }

      Tick const now = kairos_port_time_now();
      if (next != prev || slice_expired) slice_start = now;
      slice_expired   = false;
      yield_requested = false;

      if (prev == &idle && next != &idle) idle.state = TaskState::Ready;
      if (next != prev) {
         stats.context_switches++;
         LOG_SCHED("switch %u -> %u", prev ? prev->id().value() : 0u, next->id().value());
      }

      next->state = TaskState::Running;
      current = next;
   }

   kairos_port_switch(prev ? prev->context() : nullptr, next->context());
   return true;
}

/* ============================================================================
 * Tick
 * ========================================================================= */

void Kernel::on_tick() noexcept
{
   CriticalSection cs;

   stats.ticks++;
   Tick const now = kairos_port_time_now();

   if (cfg.canary_check_on_tick && current && !current->canary_intact()) {
      stack_overflow(*current);
   }

   while (auto* tcb = sleepers.top()) {
      if (tcb->wake_tick > now) break;
      sleepers.pop_min();
      tcb->queue = QueueTag::None;
      LOG_SCHED("task %u woke from sleep", tcb->id().value());
      make_ready(*tcb);
   }

   if (current && current != &idle && current->state == TaskState::Running) {
      if (now - slice_start >= cfg.time_slice_ticks) {
         slice_expired = true;
         if (ready.has_ready_at(current->priority)) kairos_port_pend_reschedule();
      }
   }
}

}  // namespace kairos

/* ============================================================================
 * Calling task
 * ========================================================================= */

namespace kairos::this_task
{
   TaskId id() noexcept
   {
      auto& k = Kernel::instance();
      return k.current ? k.current->id() : TaskId{};
   }

   Priority priority() noexcept
   {
      auto& k = Kernel::instance();
      return (k.current && k.current != &k.idle) ? Priority(k.current->priority)
                                                 : Priority(static_cast<std::uint8_t>(k.cfg.priority_levels));
   }

   void yield()
   {
      auto& k = Kernel::instance();
      {
         CriticalSection cs;
         if (!k.in_task()) return;
         k.yield_requested = true;
         kairos_port_pend_reschedule();
      }
      kairos_port_yield();
   }

   Error sleep_until(Tick deadline)
   {
      auto& k = Kernel::instance();
      {
         CriticalSection cs;
         if (!k.in_task()) return Error::NotPermitted;
         if (deadline <= kairos_port_time_now()) return Error::None;

         auto* tcb = k.current;
         tcb->wake_tick   = deadline;
         tcb->sleep_order = k.sleep_count++;
         tcb->queue     = QueueTag::Sleep;
         k.sleepers.push(tcb);
         k.block_current(TaskState::Blocked);
      }
      kairos_port_yield();
      return Error::None;
   }

   Error sleep_for(Tick ticks)
   {
      constexpr Tick FOREVER = std::numeric_limits<Tick>::max();
      Tick const now = kairos_port_time_now();
      return sleep_until(ticks > FOREVER - now ? FOREVER : now + ticks);
   }

   Error suspend()
   {
      auto& k = Kernel::instance();
      {
         CriticalSection cs;
         if (!k.in_task()) return Error::NotPermitted;
         LOG_SCHED("task %u suspended", k.current->id().value());
         k.block_current(TaskState::Suspended);
      }
      kairos_port_yield();
      return Error::None;
   }

   void exit()
   {
      auto& k = Kernel::instance();
      {
         CriticalSection cs;
         if (!k.in_task()) kairos_port_halt("this_task::exit() called outside a task");
         k.terminate(*k.current);
      }
      kairos_port_thread_exit();
   }

}  // namespace kairos::this_task
