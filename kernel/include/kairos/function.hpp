/**
 * @file function.hpp
 * @brief Move-only type-erased callable with deterministic storage
 */

#ifndef KAIROS_FUNCTION_HPP
#define KAIROS_FUNCTION_HPP

#include <array>
#include <cstddef>
#include <new>
#include <type_traits>
#include <utility>

namespace kairos
{

/**
 * @brief Heap allocation policy for Function
 */
enum class HeapPolicy
{
   NoHeap,      // Compile error if the callable doesn't fit inline storage
   CanUseHeap,  // Inline if it fits, heap otherwise
   MustUseHeap  // Always heap
};

/**
 * @brief Type-erased callable with explicit control over allocation
 *
 * Kernel objects (task entries, fault hooks, executor slots) live in static
 * storage, so the default policy refuses to touch the heap at all: a lambda
 * that is too big for InlineSize is a compile error rather than a hidden
 * allocation.
 *
 * @tparam Signature Function signature (e.g. void(), int(float))
 * @tparam InlineSize Size of the inline buffer in bytes
 * @tparam Policy Heap allocation policy
 */
template<typename Signature, std::size_t InlineSize = 32, HeapPolicy Policy = HeapPolicy::NoHeap>
class Function;

template<typename Ret, typename... Args, std::size_t InlineSize, HeapPolicy Policy>
class Function<Ret(Args...), InlineSize, Policy>
{
   enum class Op { Move, Destroy };

   using InvokeFn = Ret(*)(Function&, Args&&...);
   using ManageFn = void(*)(Op, Function& self, Function* other);

   union Storage
   {
      alignas(std::max_align_t) std::array<std::byte, InlineSize> bytes;
      void* heap;
   } storage{};

   InvokeFn invoker{nullptr};
   ManageFn manager{nullptr};

public:
   constexpr Function() = default;
   constexpr Function(std::nullptr_t) noexcept {}

   template<typename F>
      requires (!std::is_same_v<std::decay_t<F>, Function>)
   Function(F&& f)
   {
      emplace(std::forward<F>(f));
   }

   ~Function() { reset(); }

   Function(Function&& other) noexcept { take(other); }

   Function& operator=(Function&& other) noexcept
   {
      if (this != &other) {
         reset();
         take(other);
      }
      return *this;
   }

   Function& operator=(std::nullptr_t) noexcept
   {
      reset();
      return *this;
   }

   Function(Function const&)            = delete;
   Function& operator=(Function const&) = delete;

   template<typename F>
   void emplace(F&& f)
   {
      using Callable = std::decay_t<F>;

      static_assert(std::is_invocable_r_v<Ret, Callable&, Args...>,
                    "Callable signature does not match Function signature");

      constexpr bool fits     = sizeof(Callable) <= InlineSize && alignof(Callable) <= alignof(std::max_align_t);
      constexpr bool use_heap = (Policy == HeapPolicy::MustUseHeap) || !fits;

      static_assert(!use_heap || Policy != HeapPolicy::NoHeap,
                    "Callable too large for inline storage. "
                    "Increase InlineSize or allow heap allocation.");

      reset();

      if constexpr (use_heap) {
         storage.heap = new Callable(std::forward<F>(f));
      } else {
         ::new (static_cast<void*>(storage.bytes.data())) Callable(std::forward<F>(f));
      }
      invoker = &Model<Callable, use_heap>::invoke;
      manager = &Model<Callable, use_heap>::manage;
   }

   /**
    * @brief Invoke the stored callable (must not be empty)
    *
    * const because the stored target does not change; the target itself may
    * mutate its captures.
    */
   Ret operator()(Args... args) const
   {
      return invoker(const_cast<Function&>(*this), std::forward<Args>(args)...);
   }

   explicit operator bool() const noexcept { return invoker != nullptr; }

   void reset() noexcept
   {
      if (manager) {
         manager(Op::Destroy, *this, nullptr);
         invoker = nullptr;
         manager = nullptr;
      }
   }

private:
   template<typename F, bool Heap>
   struct Model
   {
      static F& target(Function& self)
      {
         if constexpr (Heap) return *static_cast<F*>(self.storage.heap);
         else return *std::launder(reinterpret_cast<F*>(self.storage.bytes.data()));
      }

      static Ret invoke(Function& self, Args&&... args)
      {
         return target(self)(std::forward<Args>(args)...);
      }

      static void manage(Op op, Function& self, Function* other)
      {
         switch (op) {
            case Op::Move:
               // self is the destination, other the (non-empty) source
               if constexpr (Heap) {
                  self.storage.heap = other->storage.heap;
                  other->storage.heap = nullptr;
               } else {
                  ::new (static_cast<void*>(self.storage.bytes.data())) F(std::move(target(*other)));
                  target(*other).~F();
               }
               break;

            case Op::Destroy:
               if constexpr (Heap) delete static_cast<F*>(self.storage.heap);
               else target(self).~F();
               break;
         }
      }
   };

   void take(Function& other) noexcept
   {
      if (!other.manager) return;

      other.manager(Op::Move, *this, &other);
      invoker = std::exchange(other.invoker, nullptr);
      manager = std::exchange(other.manager, nullptr);
   }
};

}  // namespace kairos

#endif // KAIROS_FUNCTION_HPP
