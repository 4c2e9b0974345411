/**
 * @file kernel.cpp
 * @brief Kernel lifecycle, task creation and reclamation, fault handling
 */

#include "kernel_state.hpp"

#include "kairos/futex.hpp"
#include "kairos/kernel.hpp"
#include "kairos/port.h"

#include <cstddef>
#include <cstdint>
#include <cstdio>

#include "DEBUG_PRINT.hpp"

namespace kairos
{

static Kernel k;

Kernel& Kernel::instance() noexcept
{
   return k;
}

static constexpr std::uintptr_t align_down(std::uintptr_t value, std::uintptr_t align) { return value & ~(align - 1); }
static constexpr std::uintptr_t align_up(std::uintptr_t value, std::uintptr_t align)   { return (value + (align - 1)) & ~(align - 1); }

static constexpr std::size_t CANARY_BYTES = align_up(config::STACK_CANARY_WORDS * sizeof(std::uint32_t), KAIROS_STACK_ALIGN);

CriticalSection::CriticalSection() : saved(kairos_port_irq_save()) {}
CriticalSection::~CriticalSection() noexcept(false) { kairos_port_irq_restore(saved); }

/* ============================================================================
 * Faults
 * ========================================================================= */

void Kernel::configuration_fault(const char* what) noexcept
{
   std::fprintf(stderr, "kairos: configuration error: %s\n", what);
   if (fault_hook) {
      (void)fault_hook(Fault{.kind = FaultKind::Configuration, .task = TaskId{}, .what = what});
   }
   kairos_port_halt("configuration error");
}

void Kernel::stack_overflow(TaskControlBlock& tcb) noexcept
{
   LOG_SCHED("stack overflow detected in task %u", tcb.id().value());

   if (&tcb == &idle) kairos_port_halt("stack overflow in idle task");

   Fault const fault{.kind = FaultKind::StackOverflow, .task = tcb.id(), .what = "stack overflow"};
   FaultAction const action = fault_hook ? fault_hook(fault) : FaultAction::Halt;
   if (action == FaultAction::Halt) kairos_port_halt("stack overflow detected");

   // The task's memory can't be trusted, it must never run again
   terminate(tcb);
}

/* ============================================================================
 * Task bodies
 * ========================================================================= */

static void task_launcher(void* arg)
{
   auto* tcb = static_cast<TaskControlBlock*>(arg);
   LOG_TASK("task %u started", tcb->id().value());

   tcb->entry();

   this_task::exit();
}

static void idle_main(void*)
{
   while (true) {
      if constexpr (KAIROS_PORT_SIMULATION) {
         // Nobody will ever wake anything again; hand back to the host
         bool stop;
         {
            CriticalSection cs;
            stop = k.quiescent();
            if (stop) kairos_port_pend_reschedule();
         }
         if (stop) {
            kairos_port_yield();
            continue;
         }
      }
      kairos_port_idle();
   }
}

static void tick_isr(void*)
{
   k.on_tick();
}

}  // namespace kairos

/* ============================================================================
 * Port hooks
 * ========================================================================= */

extern "C" bool kairos_kernel_dispatch(void)
{
   return kairos::k.dispatch();
}

namespace kairos::kernel
{
   void initialise(Config const& cfg)
   {
      if (k.initialised) k.configuration_fault("kernel already initialised");
      if (cfg.priority_levels == 0 || cfg.priority_levels > config::MAX_PRIORITIES) {
         k.configuration_fault("priority_levels must be within 1..MAX_PRIORITIES");
      }
      if (cfg.max_tasks == 0 || cfg.max_tasks > config::MAX_TASKS) {
         k.configuration_fault("max_tasks must be within 1..MAX_TASKS");
      }
      if (cfg.tick_hz == 0) k.configuration_fault("tick_hz must be non-zero");
      if (cfg.time_slice_ticks == 0) k.configuration_fault("time_slice_ticks must be non-zero");

      kairos_port_init();

      k.cfg = cfg;
      k.tasks.reset(cfg.max_tasks);
      k.ready.clear();
      k.futexes.clear();
      k.sleepers.clear();
      k.sleep_count     = 0;
      k.current         = nullptr;
      k.slice_start     = 0;
      k.slice_expired   = false;
      k.yield_requested = false;
      k.stats           = {};

      k.idle.clear();
      k.idle.slot       = NO_SLOT;
      k.idle.generation = 0;
      k.idle.priority   = static_cast<std::uint8_t>(cfg.priority_levels);
      if (cfg.idle_task) {
         auto* base = k.idle_stack.data();
         std::size_t size = k.idle_stack.size();
         if (cfg.stack_canary) {
            k.idle.canary = reinterpret_cast<std::uint32_t*>(base);
            k.idle.write_canary();
            base += CANARY_BYTES;
            size -= CANARY_BYTES;
         }
         kairos_port_context_init(k.idle.context(), base, size, idle_main, nullptr);
         k.idle.context_live = true;
         k.idle.state = TaskState::Ready;
      }

      k.initialised = true;
      LOG_SCHED("kernel initialised: %u priorities, %u tasks, %u Hz",
                cfg.priority_levels, cfg.max_tasks, cfg.tick_hz);
   }

   void start()
   {
      if (!k.initialised) k.configuration_fault("start() before initialise()");
      if (k.started) return;
      if (!k.cfg.idle_task && k.ready.empty()) {
         k.configuration_fault("no runnable task and no idle task configured");
      }

      k.started = true;
      kairos_port_time_register_isr_handler(tick_isr, nullptr);
      kairos_port_time_setup(k.cfg.tick_hz);
      kairos_port_time_irq_enable();

      kairos_port_run_scheduler();

      kairos_port_time_irq_disable();
      k.started = false;
   }

   void shutdown()
   {
      if (k.started || kairos_port_in_isr()) return;

      k.tasks.for_each_allocated([](TaskControlBlock& tcb) {
         if (tcb.context_live) kairos_port_context_destroy(tcb.context());
         TaskArena::retire(tcb);
         tcb.clear();
      });
      if (k.idle.context_live) kairos_port_context_destroy(k.idle.context());
      k.idle.clear();

      k.sleepers.clear();
      k.ready.clear();
      k.futexes.clear();
      k.tasks.reset(config::MAX_TASKS);
      k.current = nullptr;
      k.fault_hook.reset();
      k.stats = {};
      k.initialised = false;

      kairos_port_time_reset(0);
   }

   bool is_running() noexcept
   {
      return k.started;
   }

   Result<TaskId> spawn(Entry&& entry, std::span<std::byte> stack, Priority priority)
   {
      if (!k.initialised) return Error::NotInitialised;
      if (kairos_port_in_isr()) return Error::NotPermitted;
      if (priority >= k.cfg.priority_levels) return Error::InvalidPriority;

      auto const raw_base = reinterpret_cast<std::uintptr_t>(stack.data());
      auto const base = align_up(raw_base, KAIROS_STACK_ALIGN);
      auto const top  = align_down(raw_base + stack.size(), KAIROS_STACK_ALIGN);
      std::size_t const canary_bytes = k.cfg.stack_canary ? CANARY_BYTES : 0;

      if (top <= base || top - base < KAIROS_PORT_MIN_STACK_SIZE + canary_bytes) {
         return Error::StackTooSmall;
      }

      TaskControlBlock* tcb;
      {
         CriticalSection cs;
         tcb = k.tasks.allocate();
         if (!tcb) return Error::TaskLimitExceeded;
         tcb->state = TaskState::Suspended;  // Not schedulable until its context exists
         tcb->exit_cell.store(tcb->generation, std::memory_order_release);
      }

      tcb->entry    = std::move(entry);
      tcb->priority = priority;
      if (canary_bytes) {
         tcb->canary = reinterpret_cast<std::uint32_t*>(base);
         tcb->write_canary();
      }
      kairos_port_context_init(tcb->context(),
                               reinterpret_cast<void*>(base + canary_bytes),
                               top - base - canary_bytes,
                               task_launcher,
                               tcb);
      tcb->context_live = true;

      TaskId const id = tcb->id();
      LOG_TASK("spawned task %u at priority %u", id.value(), static_cast<unsigned>(priority.val));
      {
         CriticalSection cs;
         k.make_ready(*tcb);
      }
      kairos_port_yield();
      return id;
   }

   Error kill(TaskId id)
   {
      {
         CriticalSection cs;
         auto* tcb = k.tasks.lookup(id);
         if (!tcb || tcb->state == TaskState::Terminated) return Error::InvalidTask;
         if (tcb == k.current) return Error::NotPermitted;

         LOG_TASK("killing task %u", id.value());
         k.terminate(*tcb);
      }
      kairos_port_yield();
      return Error::None;
   }

   Error resume(TaskId id)
   {
      {
         CriticalSection cs;
         auto* tcb = k.tasks.lookup(id);
         if (!tcb || tcb->state == TaskState::Terminated) return Error::InvalidTask;
         if (tcb->state != TaskState::Suspended || !tcb->context_live) return Error::InvalidState;

         k.make_ready(*tcb);
      }
      kairos_port_yield();
      return Error::None;
   }

   Error join(TaskId id)
   {
      bool seen_alive = false;
      while (true) {
         futex::Cell*  exit_cell;
         std::uint32_t alive;
         {
            CriticalSection cs;
            auto* tcb = k.tasks.lookup(id);
            // Reaped by someone else after it terminated
            if (!tcb) return seen_alive ? Error::None : Error::InvalidTask;
            if (tcb == k.current) return Error::NotPermitted;
            if (tcb->state == TaskState::Terminated) return Error::None;
            exit_cell  = &tcb->exit_cell;
            alive      = tcb->generation;
            seen_alive = true;
         }

         // Once the task is gone the cell no longer holds its generation, even
         // if the slot has been handed to a new task in the meantime
         Error const err = futex::wait(*exit_cell, alive);
         if (err == Error::NotPermitted) return err;
      }
   }

   Error reap(TaskId id)
   {
      TaskControlBlock* tcb;
      {
         CriticalSection cs;
         tcb = k.tasks.lookup(id);
         if (!tcb) return Error::InvalidTask;
         if (tcb->state != TaskState::Terminated) return Error::InvalidState;
         if (k.futexes.waiter_count(reinterpret_cast<std::uintptr_t>(&tcb->exit_cell)) != 0) {
            return Error::InvalidState;
         }

         // From here on the id is stale, but the slot stays allocated until the context is gone
         TaskArena::retire(*tcb);
      }

      LOG_TASK("reaping task %u", id.value());
      if (tcb->context_live) kairos_port_context_destroy(tcb->context());

      {
         CriticalSection cs;
         k.tasks.release(*tcb);
      }
      return Error::None;
   }

   Result<TaskState> state_of(TaskId id)
   {
      CriticalSection cs;
      if (id.valid() && id == k.idle.id()) return k.idle.state;
      auto* tcb = k.tasks.lookup(id);
      if (!tcb) return Error::InvalidTask;
      return tcb->state;
   }

   std::size_t task_count() noexcept
   {
      return k.tasks.in_use();
   }

   Tick tick_now() noexcept
   {
      return kairos_port_time_now();
   }

   Config const& config() noexcept
   {
      return k.cfg;
   }

   Stats stats() noexcept
   {
      CriticalSection cs;
      return k.stats;
   }

   void set_fault_hook(FaultHook&& hook)
   {
      CriticalSection cs;
      k.fault_hook = std::move(hook);
   }

   Tick ms_to_ticks(std::uint64_t ms) noexcept
   {
      std::uint64_t const hz = k.cfg.tick_hz;
      return (ms * hz + 999) / 1000;
   }

   Tick us_to_ticks(std::uint64_t us) noexcept
   {
      std::uint64_t const hz = k.cfg.tick_hz;
      return (us * hz + 999'999) / 1'000'000;
   }

}  // namespace kairos::kernel
