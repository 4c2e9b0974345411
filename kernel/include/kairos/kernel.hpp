/**
 * @file kernel.hpp
 * @brief Kairos Kernel API
 *
 * Fixed-priority preemptive scheduler with round-robin inside a priority
 * level. Priority 0 is the highest. Everything that blocks is built on the
 * futex in kairos/futex.hpp.
 */

#ifndef KAIROS_KERNEL_HPP
#define KAIROS_KERNEL_HPP

#include "kairos/error.hpp"
#include "kairos/function.hpp"
#include "kairos/port_traits.h"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <span>

namespace kairos
{

namespace config
{
   /**
    * @brief Upper bound for Config::priority_levels (one bit per level in the ready bitmap)
    */
   static constexpr std::size_t MAX_PRIORITIES = 32;
   static_assert(MAX_PRIORITIES <= std::numeric_limits<std::uint32_t>::digits, "Priorities unsupported by kernel implementation.");

   /**
    * @brief Upper bound for Config::max_tasks, excluding the idle task
    */
   static constexpr std::size_t MAX_TASKS = 32;
   static_assert(MAX_TASKS < 0xFF, "Task slots are 8-bit and 0xFF is reserved.");

   static constexpr std::uint32_t STACK_CANARY       = 0xC0DE5AFE;
   static constexpr std::size_t   STACK_CANARY_WORDS = 4;

   static constexpr std::uint32_t DEFAULT_TICK_HZ = 1000;
}  // namespace config

using Tick = std::uint64_t;

/**
 * @brief Handle to a task
 *
 * Encodes the task's slot and the slot's generation, so an id goes stale as
 * soon as its task is reaped and is never confused with a later task in the
 * same slot. The default constructed id is invalid.
 */
class TaskId
{
   std::uint32_t raw{0};

public:
   constexpr TaskId() = default;
   constexpr explicit TaskId(std::uint32_t raw) : raw(raw) {}

   [[nodiscard]] constexpr std::uint32_t value() const noexcept { return raw; }
   [[nodiscard]] constexpr bool valid() const noexcept { return raw != 0; }

   constexpr bool operator==(TaskId const&) const = default;
};

struct Priority
{
   std::uint8_t val;
   constexpr Priority(std::uint8_t v) : val(v) {}     // Intentionally implicit
   constexpr operator std::uint8_t() const { return val; } // Intentionally implicit
};

enum class TaskState : std::uint8_t
{
   Ready,
   Running,
   Blocked,
   Suspended,
   Terminated,
};

[[nodiscard]] constexpr const char* to_string(TaskState state) noexcept
{
   switch (state) {
      case TaskState::Ready:      return "Ready";
      case TaskState::Running:    return "Running";
      case TaskState::Blocked:    return "Blocked";
      case TaskState::Suspended:  return "Suspended";
      case TaskState::Terminated: return "Terminated";
   }
   return "???";
}

/* ============================================================================
 * Faults
 * ========================================================================= */

enum class FaultKind : std::uint8_t
{
   Configuration,
   StackOverflow,
};

enum class FaultAction : std::uint8_t
{
   Halt,           ///< Stop the system (always taken for configuration faults)
   TerminateTask,  ///< Terminate the offending task and keep scheduling the rest
};

struct Fault
{
   FaultKind   kind;
   TaskId      task;  ///< Invalid for configuration faults
   const char* what;
};

/**
 * @brief User fault hook
 *
 * Runs with interrupts disabled, possibly from the tick interrupt. It must not
 * block or call back into the kernel.
 */
using FaultHook = Function<FaultAction(Fault const&), 32, HeapPolicy::NoHeap>;

/* ============================================================================
 * Critical Section
 * ========================================================================= */

/**
 * @brief RAII interrupt-disable guard (nestable, usable from interrupts)
 *
 * Leaving the outermost section in a task takes any reschedule pended inside
 * it, so the destructor may switch tasks (and unwind when the task is
 * destroyed while switched out there).
 */
class CriticalSection
{
   std::uint32_t saved;

public:
   CriticalSection();
   ~CriticalSection() noexcept(false);

   CriticalSection(CriticalSection const&)            = delete;
   CriticalSection& operator=(CriticalSection const&) = delete;
};

namespace kernel
{
   struct Config
   {
      std::uint32_t priority_levels{config::MAX_PRIORITIES};
      std::uint32_t tick_hz{config::DEFAULT_TICK_HZ};
      std::uint32_t max_tasks{config::MAX_TASKS};
      std::uint32_t time_slice_ticks{1};
      bool stack_canary{true};
      bool canary_check_on_tick{false};
      bool idle_task{true};
   };

   struct Stats
   {
      std::uint64_t context_switches{0};  ///< Dispatches that changed the running task
      std::uint64_t ticks{0};             ///< Tick interrupts serviced
   };

   using Entry = Function<void(), 32, HeapPolicy::NoHeap>;

   /**
    * @brief Initialise the kernel
    *
    * Must be called before any task is spawned. An invalid configuration is
    * fatal.
    */
   void initialise(Config const& config = {});

   /**
    * @brief Start scheduling
    *
    * On hardware this never returns. The simulation port returns once no task
    * can run again (everything finished, or blocked with no sleeper left).
    */
   void start();

   /**
    * @brief Tear down every task and return the kernel to its uninitialised state
    *
    * Must be called from outside the scheduler (after start() returned).
    */
   void shutdown();

   [[nodiscard]] bool is_running() noexcept;

   /**
    * @brief Create a task in the Ready state
    * @param entry Task body; returning from it terminates the task
    * @param stack Stack owned by the task until it is reaped
    * @param priority 0 (highest) .. priority_levels-1
    *
    * May be called before start() or from a running task. A higher priority
    * task spawned at runtime preempts the caller immediately.
    */
   Result<TaskId> spawn(Entry&& entry, std::span<std::byte> stack, Priority priority);

   /**
    * @brief Terminate another task
    *
    * The task is pulled out of whichever queue holds it and never runs again.
    * Its stack stays untouched until reap().
    */
   Error kill(TaskId id);

   /**
    * @brief Make a Suspended task Ready again
    */
   Error resume(TaskId id);

   /**
    * @brief Block until the task has terminated
    */
   Error join(TaskId id);

   /**
    * @brief Reclaim a Terminated task: its context is destroyed and the id invalidated
    */
   Error reap(TaskId id);

   Result<TaskState> state_of(TaskId id);

   /**
    * @brief Number of tasks not yet reaped (the idle task is not counted)
    */
   [[nodiscard]] std::size_t task_count() noexcept;

   [[nodiscard]] Tick tick_now() noexcept;

   [[nodiscard]] Config const& config() noexcept;

   [[nodiscard]] Stats stats() noexcept;

   void set_fault_hook(FaultHook&& hook);

   /// Ticks covering at least @p ms milliseconds at the configured tick rate
   [[nodiscard]] Tick ms_to_ticks(std::uint64_t ms) noexcept;

   /// Ticks covering at least @p us microseconds at the configured tick rate
   [[nodiscard]] Tick us_to_ticks(std::uint64_t us) noexcept;

}  // namespace kernel

namespace this_task
{
   [[nodiscard]] TaskId id() noexcept;

   [[nodiscard]] Priority priority() noexcept;

   /**
    * @brief Give the processor to the next task of the same priority
    */
   void yield();

   /**
    * @brief Block until the tick count reaches @p deadline (returns at once if it already has)
    */
   Error sleep_until(Tick deadline);

   Error sleep_for(Tick ticks);

   /**
    * @brief Suspend the calling task until another task resumes it
    */
   Error suspend();

   /**
    * @brief Terminate the calling task
    */
   [[noreturn]] void exit();

}  // namespace this_task

}  // namespace kairos

#endif // KAIROS_KERNEL_HPP
