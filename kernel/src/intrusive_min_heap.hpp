#ifndef KAIROS_INTRUSIVE_MIN_HEAP_HPP
#define KAIROS_INTRUSIVE_MIN_HEAP_HPP

#include <array>
#include <cassert>
#include <cstdint>
#include <limits>
#include <utility>

namespace kairos
{

/**
 * @brief Binary min-heap of node pointers, each node stores its own heap index
 *
 * Traits must provide:
 *   using Node;
 *   static constexpr uint16_t CAPACITY;
 *   static uint16_t& index(Node*);                 // NOT_IN_HEAP when detached
 *   static bool earlier(Node const*, Node const*); // strict ordering
 *
 * The stored index makes removal of an arbitrary node O(log n), which is what
 * killing a sleeping task needs.
 */
template<typename Traits>
class IntrusiveMinHeap
{
public:
   using Node      = typename Traits::Node;
   using IndexType = std::uint16_t;

   static constexpr IndexType NOT_IN_HEAP = std::numeric_limits<IndexType>::max();

private:
   static constexpr IndexType CAPACITY = Traits::CAPACITY;
   static_assert(CAPACITY < NOT_IN_HEAP);

   std::array<Node*, CAPACITY> nodes{};
   IndexType count{0};

   static IndexType parent(IndexType i) noexcept { return (i - 1u) >> 1; }
   static IndexType left  (IndexType i) noexcept { return (i << 1) + 1u; }
   static IndexType right (IndexType i) noexcept { return (i << 1) + 2u; }

   bool earlier(IndexType a, IndexType b) const noexcept { return Traits::earlier(nodes[a], nodes[b]); }

   void place(IndexType i, Node* n) noexcept
   {
      nodes[i] = n;
      Traits::index(n) = i;
   }

   void swap_nodes(IndexType a, IndexType b) noexcept
   {
      Node* tmp = nodes[a];
      place(a, nodes[b]);
      place(b, tmp);
   }

   void sift_up(IndexType i) noexcept
   {
      while (i > 0 && earlier(i, parent(i))) {
         swap_nodes(i, parent(i));
         i = parent(i);
      }
   }

   void sift_down(IndexType i) noexcept
   {
      while (true) {
         IndexType l = left(i), r = right(i), m = i;
         if (l < count && earlier(l, m)) m = l;
         if (r < count && earlier(r, m)) m = r;
         if (m == i) return;
         swap_nodes(i, m);
         i = m;
      }
   }

public:
   [[nodiscard]] bool empty() const noexcept { return count == 0; }
   [[nodiscard]] IndexType size() const noexcept { return count; }
   [[nodiscard]] Node* top() const noexcept { return count ? nodes[0] : nullptr; }

   void push(Node* n) noexcept
   {
      assert(count < CAPACITY && "heap full");
      assert(Traits::index(n) == NOT_IN_HEAP && "node already in heap");
      IndexType i = count++;
      place(i, n);
      sift_up(i);
   }

   Node* pop_min() noexcept
   {
      if (!count) return nullptr;
      Node* n = nodes[0];
      remove(n);
      return n;
   }

   void remove(Node* n) noexcept
   {
      IndexType i = Traits::index(n);
      if (i == NOT_IN_HEAP) return;

      Traits::index(n) = NOT_IN_HEAP;
      --count;
      if (i == count) return;

      place(i, nodes[count]);
      if (i > 0 && earlier(i, parent(i))) sift_up(i);
      else sift_down(i);
   }

   void clear() noexcept
   {
      for (IndexType i = 0; i < count; i++) Traits::index(nodes[i]) = NOT_IN_HEAP;
      count = 0;
   }
};

}  // namespace kairos

#endif // KAIROS_INTRUSIVE_MIN_HEAP_HPP
