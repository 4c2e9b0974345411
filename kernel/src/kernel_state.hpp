#ifndef KAIROS_KERNEL_STATE_HPP
#define KAIROS_KERNEL_STATE_HPP

#include "intrusive_min_heap.hpp"
#include "ready_matrix.hpp"
#include "task_control_block.hpp"

#include "kairos/futex.hpp"
#include "kairos/kernel.hpp"
#include "kairos/port.h"

#include <array>
#include <cstddef>
#include <cstdint>

namespace kairos
{

struct SleepHeapTraits
{
   using Node = TaskControlBlock;
   static constexpr std::uint16_t CAPACITY = config::MAX_TASKS;
   static std::uint16_t& index(Node* tcb) noexcept { return tcb->sleep_index; }
   static bool earlier(Node const* a, Node const* b) noexcept
   {
      if (a->wake_tick != b->wake_tick) return a->wake_tick < b->wake_tick;
      return a->sleep_order < b->sleep_order;
   }
};
using SleepMinHeap = IntrusiveMinHeap<SleepHeapTraits>;

/**
 * @brief Wait queues keyed by futex cell address
 *
 * A queue exists only while it has waiters. A task waits on at most one cell,
 * so MAX_TASKS queues can never run out.
 */
class FutexTable
{
   struct Queue
   {
      std::uintptr_t key{0};  // 0 = unused
      TaskQueue      waiters{};
   };

   TaskArena& arena;
   std::array<Queue, config::MAX_TASKS> queues{};

   Queue* find(std::uintptr_t key) noexcept;

public:
   explicit FutexTable(TaskArena& arena) : arena(arena) {}

   void enqueue(std::uintptr_t key, TaskControlBlock& tcb) noexcept;
   TaskControlBlock* dequeue(std::uintptr_t key) noexcept;
   void remove(TaskControlBlock& tcb) noexcept;

   [[nodiscard]] std::size_t waiter_count(std::uintptr_t key) const noexcept;
   [[nodiscard]] std::size_t active_queues() const noexcept;

   void clear() noexcept;
};

/**
 * @brief All scheduler state, one instance for the lifetime of the program
 *
 * Every member is only touched with interrupts disabled (CriticalSection),
 * except where a method says otherwise.
 */
struct Kernel
{
   static Kernel& instance() noexcept;

   bool initialised{false};
   bool started{false};
   kernel::Config cfg{};

   TaskArena    tasks;
   ReadyMatrix  ready{tasks};
   FutexTable   futexes{tasks};
   SleepMinHeap sleepers;
   std::uint64_t sleep_count{0};

   TaskControlBlock  idle;
   TaskControlBlock* current{nullptr};

   Tick slice_start{0};
   bool slice_expired{false};
   bool yield_requested{false};

   FaultHook     fault_hook;
   kernel::Stats stats{};

   alignas(KAIROS_STACK_ALIGN) std::array<std::byte, KAIROS_PORT_IDLE_STACK_SIZE> idle_stack{};

   /* ===== Task context queries ===== */

   /// A spawned task (not idle, not an interrupt) is executing
   [[nodiscard]] bool in_task() const noexcept
   {
      return started && current && current != &idle && !kairos_port_in_isr();
   }

   /// Nothing is ready and nothing can become ready on its own
   [[nodiscard]] bool quiescent() const noexcept
   {
      bool const running = current && current != &idle && current->state == TaskState::Running;
      return !running && ready.empty() && (sleepers.empty() || !cfg.idle_task);
   }

   /* ===== State transitions (scheduler.cpp) ===== */

   void make_ready(TaskControlBlock& tcb) noexcept;
   void block_current(TaskState state) noexcept;
   void unlink(TaskControlBlock& tcb) noexcept;
   void terminate(TaskControlBlock& tcb) noexcept;

   bool dispatch();
   void on_tick() noexcept;

   /* ===== Faults (kernel.cpp) ===== */

   [[noreturn]] void configuration_fault(const char* what) noexcept;
   void stack_overflow(TaskControlBlock& tcb) noexcept;

   /* ===== Futex (futex.cpp) ===== */

   /// Make up to @p count waiters on @p key Ready (caller holds the critical section)
   std::size_t wake_waiters(std::uintptr_t key, std::size_t count) noexcept;

private:
   TaskControlBlock* select_next(TaskControlBlock* prev) noexcept;
};

}  // namespace kairos

#endif // KAIROS_KERNEL_STATE_HPP
