#ifndef KAIROS_READY_MATRIX_HPP
#define KAIROS_READY_MATRIX_HPP

#include "task_control_block.hpp"

#include <array>
#include <bit>
#include <cstdint>
#include <limits>

namespace kairos
{

/**
 * @brief One FIFO per priority plus a bitmap of the non-empty ones
 *
 * Bit n set means priority n has a ready task. Priority 0 is the highest, so
 * the best level is the lowest set bit.
 */
class ReadyMatrix
{
   static constexpr std::size_t BITMAP_BITS = std::numeric_limits<std::uint32_t>::digits;
   static_assert(config::MAX_PRIORITIES <= BITMAP_BITS, "bitmap cannot hold that many priorities!");

   TaskArena& arena;
   std::array<TaskQueue, config::MAX_PRIORITIES> levels{};
   std::uint32_t bitmap{0};

public:
   explicit ReadyMatrix(TaskArena& arena) : arena(arena) {}

   [[nodiscard]] int  best_priority() const noexcept { return bitmap ? std::countr_zero(bitmap) : -1; }
   [[nodiscard]] bool empty() const noexcept { return bitmap == 0; }
   [[nodiscard]] bool has_ready_at(std::uint32_t priority) const noexcept { return (bitmap >> priority) & 1u; }
   [[nodiscard]] std::size_t size_at(std::uint32_t priority) const noexcept { return levels[priority].size(); }

   void enqueue(TaskControlBlock& tcb) noexcept
   {
      assert(tcb.priority < config::MAX_PRIORITIES);
      arena.push_back(levels[tcb.priority], tcb, QueueTag::Ready);
      bitmap |= (1u << tcb.priority);
   }

   TaskControlBlock* pop_best() noexcept
   {
      if (bitmap == 0) return nullptr;
      auto const priority = std::countr_zero(bitmap);
      TaskControlBlock* tcb = arena.pop_front(levels[priority]);
      if (levels[priority].empty()) bitmap &= ~(1u << priority);
      return tcb;
   }

   void remove(TaskControlBlock& tcb) noexcept
   {
      assert(tcb.queue == QueueTag::Ready);
      auto const priority = tcb.priority;
      arena.remove(levels[priority], tcb);
      if (levels[priority].empty()) bitmap &= ~(1u << priority);
   }

   void clear() noexcept
   {
      levels.fill(TaskQueue{});
      bitmap = 0;
   }
};

}  // namespace kairos

#endif // KAIROS_READY_MATRIX_HPP
