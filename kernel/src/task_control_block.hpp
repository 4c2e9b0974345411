#ifndef KAIROS_TASK_CONTROL_BLOCK_HPP
#define KAIROS_TASK_CONTROL_BLOCK_HPP

#include "kairos/futex.hpp"
#include "kairos/kernel.hpp"
#include "kairos/port.h"

#include <array>
#include <cassert>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <span>

namespace kairos
{

static constexpr std::uint8_t NO_SLOT = 0xFF;

/**
 * @brief The one collection a non-running task currently belongs to
 */
enum class QueueTag : std::uint8_t
{
   None,
   Ready,
   Futex,
   Sleep,
};

struct TaskControlBlock
{
   static constexpr std::uint16_t NOT_SLEEPING = std::numeric_limits<std::uint16_t>::max();

   kernel::Entry entry{};

   std::uint32_t* canary{nullptr};  // Lowest words of the stack, nullptr when checking is off
   Tick           wake_tick{0};
   std::uint64_t  sleep_order{0};   // Breaks ties between equal wake ticks
   futex::Cell    exit_cell{0};     // The generation while alive, 0 once Terminated; joiners wait on it

   std::uint32_t generation{1};
   TaskState     state{TaskState::Terminated};
   QueueTag      queue{QueueTag::None};
   std::uint8_t  slot{NO_SLOT};
   std::uint8_t  priority{0};

   // Links for the ready and futex queues (slot indices into the arena)
   std::uint8_t  next{NO_SLOT};
   std::uint8_t  prev{NO_SLOT};
   std::uint8_t  futex_queue{NO_SLOT};
   std::uint16_t sleep_index{NOT_SLEEPING};

   bool allocated{false};
   bool context_live{false};

   alignas(KAIROS_PORT_CONTEXT_ALIGN) std::array<std::byte, KAIROS_PORT_CONTEXT_SIZE> context_storage{};

   [[nodiscard]] kairos_port_context_t* context() noexcept
   {
      return reinterpret_cast<kairos_port_context_t*>(context_storage.data());
   }

   [[nodiscard]] TaskId id() const noexcept
   {
      return TaskId{(generation << 8) | slot};
   }

   void write_canary() noexcept
   {
      if (!canary) return;
      for (std::size_t i = 0; i < config::STACK_CANARY_WORDS; i++) canary[i] = config::STACK_CANARY;
   }

   [[nodiscard]] bool canary_intact() const noexcept
   {
      if (!canary) return true;
      for (std::size_t i = 0; i < config::STACK_CANARY_WORDS; i++) {
         if (canary[i] != config::STACK_CANARY) return false;
      }
      return true;
   }

   // Everything except the slot identity and its generation
   void clear() noexcept
   {
      entry.reset();
      canary      = nullptr;
      wake_tick   = 0;
      sleep_order = 0;
      exit_cell.store(0, std::memory_order_relaxed);
      state       = TaskState::Terminated;
      queue       = QueueTag::None;
      priority    = 0;
      next        = NO_SLOT;
      prev        = NO_SLOT;
      futex_queue = NO_SLOT;
      sleep_index = NOT_SLEEPING;
      context_live = false;
   }
};

/**
 * @brief FIFO of tasks linked through TaskControlBlock::next/prev
 *
 * Holds slot indices only; all operations go through the TaskArena that
 * owns the blocks.
 */
struct TaskQueue
{
   std::uint8_t head{NO_SLOT};
   std::uint8_t tail{NO_SLOT};
   std::uint8_t count{0};

   [[nodiscard]] constexpr bool empty() const noexcept { return count == 0; }
   [[nodiscard]] constexpr std::size_t size() const noexcept { return count; }
};

/**
 * @brief Fixed pool of task control blocks indexed by slot
 */
class TaskArena
{
   std::array<TaskControlBlock, config::MAX_TASKS> blocks{};
   std::size_t capacity{config::MAX_TASKS};
   std::size_t used{0};

public:
   void reset(std::size_t new_capacity) noexcept
   {
      assert(new_capacity <= blocks.size());
      capacity = new_capacity;
      used     = 0;
      for (std::size_t i = 0; i < blocks.size(); i++) {
         auto& tcb = blocks[i];
         tcb.clear();
         tcb.slot      = static_cast<std::uint8_t>(i);
         tcb.allocated = false;
      }
   }

   [[nodiscard]] std::size_t in_use() const noexcept { return used; }

   TaskControlBlock* allocate() noexcept
   {
      if (used >= capacity) return nullptr;
      for (std::size_t i = 0; i < capacity; i++) {
         auto& tcb = blocks[i];
         if (tcb.allocated) continue;
         tcb.clear();
         tcb.allocated = true;
         used++;
         return &tcb;
      }
      return nullptr;
   }

   /**
    * @brief Invalidate every id handed out for this slot
    */
   static void retire(TaskControlBlock& tcb) noexcept
   {
      tcb.generation = (tcb.generation + 1) & 0x00FF'FFFF;
      if (tcb.generation == 0) tcb.generation = 1;
   }

   void release(TaskControlBlock& tcb) noexcept
   {
      assert(tcb.allocated);
      tcb.clear();
      tcb.allocated = false;
      used--;
   }

   [[nodiscard]] TaskControlBlock* lookup(TaskId id) noexcept
   {
      if (!id.valid()) return nullptr;
      std::uint32_t const slot = id.value() & 0xFF;
      if (slot >= capacity) return nullptr;

      auto& tcb = blocks[slot];
      if (!tcb.allocated || tcb.generation != (id.value() >> 8)) return nullptr;
      return &tcb;
   }

   [[nodiscard]] TaskControlBlock& at(std::uint8_t slot) noexcept
   {
      assert(slot < blocks.size());
      return blocks[slot];
   }

   template<typename Fn>
   void for_each_allocated(Fn&& fn)
   {
      for (auto& tcb : blocks) {
         if (tcb.allocated) fn(tcb);
      }
   }

   /* ===== Queue operations ===== */

   [[nodiscard]] TaskControlBlock* front(TaskQueue const& q) noexcept
   {
      return q.empty() ? nullptr : &at(q.head);
   }

   void push_back(TaskQueue& q, TaskControlBlock& tcb, QueueTag tag) noexcept
   {
      assert(tcb.queue == QueueTag::None && "Task already queued");

      tcb.queue = tag;
      tcb.next  = NO_SLOT;
      tcb.prev  = q.tail;

      if (q.tail != NO_SLOT) at(q.tail).next = tcb.slot;
      else                   q.head = tcb.slot;

      q.tail = tcb.slot;
      q.count++;
   }

   void remove(TaskQueue& q, TaskControlBlock& tcb) noexcept
   {
      if (tcb.prev != NO_SLOT) at(tcb.prev).next = tcb.next;
      else                     q.head = tcb.next;

      if (tcb.next != NO_SLOT) at(tcb.next).prev = tcb.prev;
      else                     q.tail = tcb.prev;

      tcb.next  = NO_SLOT;
      tcb.prev  = NO_SLOT;
      tcb.queue = QueueTag::None;
      q.count--;
   }

   TaskControlBlock* pop_front(TaskQueue& q) noexcept
   {
      auto* tcb = front(q);
      if (tcb) remove(q, *tcb);
      return tcb;
   }
};

}  // namespace kairos

#endif // KAIROS_TASK_CONTROL_BLOCK_HPP
