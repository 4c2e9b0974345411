/**
 * @file async.hpp
 * @brief Running cooperative (poll based) tasks on top of kernel tasks
 *
 * A cooperative task is any object with a `poll(Waker const&)` member that
 * returns Poll<T>. Whoever drives it is a kernel task: block_on() drives one,
 * an Executor multiplexes several. When nothing is ready the driving task
 * blocks on a futex instead of polling again; a Waker wakes it.
 *
 * Nothing in here talks to the scheduler. The only kernel services used are
 * the futex and CriticalSection.
 */

#ifndef KAIROS_ASYNC_HPP
#define KAIROS_ASYNC_HPP

#include "kairos/error.hpp"
#include "kairos/function.hpp"
#include "kairos/futex.hpp"
#include "kairos/kernel.hpp"

#include <array>
#include <atomic>
#include <bit>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <type_traits>
#include <utility>

namespace kairos::async
{

/* ============================================================================
 * Poll
 * ========================================================================= */

/**
 * @brief Result of one poll: not ready yet, or ready with a value
 */
template<typename T>
class Poll
{
   std::optional<T> result;

public:
   using value_type = T;

   static Poll pending() { return Poll{}; }
   static Poll ready(T value)
   {
      Poll p;
      p.result.emplace(std::move(value));
      return p;
   }

   [[nodiscard]] bool is_ready() const noexcept { return result.has_value(); }
   [[nodiscard]] bool is_pending() const noexcept { return !result.has_value(); }

   /// Only valid when is_ready()
   T take() { return std::move(*result); }
};

template<>
class Poll<void>
{
   bool done{false};

public:
   using value_type = void;

   static Poll pending() { return Poll{}; }
   static Poll ready()
   {
      Poll p;
      p.done = true;
      return p;
   }

   [[nodiscard]] bool is_ready() const noexcept { return done; }
   [[nodiscard]] bool is_pending() const noexcept { return !done; }
};

/* ============================================================================
 * Wake plumbing
 * ========================================================================= */

/**
 * @brief Futex cell a driving task sleeps on, plus its pending-wake flag
 */
class WakeSignal
{
public:
   static constexpr std::uint32_t NO_PENDING_WAKE = 0;
   static constexpr std::uint32_t WAKE_PENDING    = 1;

   /**
    * @brief Record a wake and release the sleeping task (interrupt safe)
    */
   void notify();

   /**
    * @brief Consume a pending wake
    * @return true if one was pending
    */
   bool take() noexcept;

   /**
    * @brief Block until notify(), unless a wake is already pending
    */
   Error wait();

   [[nodiscard]] bool pending() const noexcept;

private:
   futex::Cell cell{NO_PENDING_WAKE};
};

/**
 * @brief Handle a cooperative task hands to whatever will make it ready
 *
 * Copyable and cheap. Waking is interrupt safe and never lost: the wake is
 * recorded in the signal's cell before the driving task is released, and the
 * driving task only blocks while the cell says nothing is pending.
 */
class Waker
{
   WakeSignal*                 signal{nullptr};
   std::atomic<std::uint32_t>* ready_mask{nullptr};
   std::uint32_t               ready_bit{0};

public:
   constexpr Waker() = default;
   explicit Waker(WakeSignal& signal) : signal(&signal) {}
   Waker(WakeSignal& signal, std::atomic<std::uint32_t>& ready_mask, std::uint32_t ready_bit)
      : signal(&signal), ready_mask(&ready_mask), ready_bit(ready_bit) {}

   void wake() const;

   [[nodiscard]] bool valid() const noexcept { return signal != nullptr; }

   bool operator==(Waker const&) const = default;
};

template<typename F>
concept Future = requires(F& f, Waker const& waker)
{
   { f.poll(waker).is_ready() } -> std::convertible_to<bool>;
};

template<Future F>
using future_output_t = typename decltype(std::declval<F&>().poll(std::declval<Waker const&>()))::value_type;

/* ============================================================================
 * Drivers
 * ========================================================================= */

template<typename T>
using BlockOnResult = std::conditional_t<std::is_void_v<T>, Error, Result<T>>;

/**
 * @brief Drive a single cooperative task to completion on the calling task
 *
 * Between polls the calling task is Blocked on a futex. Returns
 * Error::NotPermitted when called outside a kernel task.
 */
template<Future F>
BlockOnResult<future_output_t<F>> block_on(F&& future)
{
   using T = future_output_t<F>;

   WakeSignal signal;
   Waker const waker(signal);

   while (true) {
      signal.take();

      auto poll = future.poll(waker);
      if (poll.is_ready()) {
         if constexpr (std::is_void_v<T>) return Error::None;
         else return poll.take();
      }

      Error const err = signal.wait();
      if (err != Error::None) return err;
   }
}

/**
 * @brief Runs up to Capacity cooperative tasks on one kernel task
 *
 * Only tasks that were woken since their last poll are polled again, and a
 * completed task is dropped straight away. run() belongs to one kernel task;
 * spawn() may be called from any task or interrupt, also while run() is going.
 */
template<std::size_t Capacity, std::size_t InlineSize = 64>
class Executor
{
   static_assert(Capacity > 0 && Capacity <= 32, "ready mask is a single 32-bit word");

   using Job = Function<Poll<void>(Waker const&), InlineSize, HeapPolicy::NoHeap>;

   struct Slot
   {
      Job           job{};
      bool          active{false};
      std::uint32_t polls{0};
   };

   std::array<Slot, Capacity> slots{};
   WakeSignal                 signal;
   std::atomic<std::uint32_t> ready_mask{0};
   std::size_t                active_count{0};
   std::size_t                total_polls{0};

public:
   Executor() = default;
   Executor(Executor const&)            = delete;
   Executor& operator=(Executor const&) = delete;

   /**
    * @brief Add a cooperative task; its output (if any) is discarded
    * @return Error::TaskLimitExceeded when every slot is taken
    */
   template<Future F>
   Error spawn(F&& future)
   {
      Job job = [f = std::forward<F>(future)](Waker const& waker) mutable -> Poll<void> {
         return f.poll(waker).is_ready() ? Poll<void>::ready() : Poll<void>::pending();
      };

      std::size_t i = 0;
      {
         CriticalSection cs;
         while (i < Capacity && slots[i].active) i++;
         if (i == Capacity) return Error::TaskLimitExceeded;

         auto& slot = slots[i];
         slot.job    = std::move(job);
         slot.active = true;
         slot.polls  = 0;
         active_count++;
      }

      // Every new task gets its first poll
      Waker(signal, ready_mask, 1u << i).wake();
      return Error::None;
   }

   /**
    * @brief Poll woken tasks until all have completed
    *
    * Must run on a kernel task. Returns Error::NotPermitted otherwise.
    */
   Error run()
   {
      while (active() > 0) {
         signal.take();

         std::uint32_t mask = ready_mask.exchange(0, std::memory_order_acq_rel);
         while (mask) {
            auto const i = static_cast<std::uint32_t>(std::countr_zero(mask));
            mask &= mask - 1;

            // A stale wake for a slot that has since completed
            auto& slot = slots[i];
            {
               CriticalSection cs;
               if (!slot.active) continue;
               slot.polls++;
               total_polls++;
            }

            // Only this task retires an active slot, so the job stays put while it runs
            if (slot.job(Waker(signal, ready_mask, 1u << i)).is_ready()) {
               CriticalSection cs;
               slot.job.reset();
               slot.active = false;
               active_count--;
            }
         }

         if (active() == 0) break;
         if (ready_mask.load(std::memory_order_acquire) != 0) continue;

         Error const err = signal.wait();
         if (err != Error::None) return err;
      }
      return Error::None;
   }

   [[nodiscard]] std::size_t active() const
   {
      CriticalSection cs;
      return active_count;
   }

   [[nodiscard]] std::size_t poll_count() const
   {
      CriticalSection cs;
      return total_polls;
   }

   [[nodiscard]] std::uint32_t poll_count(std::size_t slot) const
   {
      CriticalSection cs;
      return slots[slot].polls;
   }
};

/* ============================================================================
 * Leaf futures
 * ========================================================================= */

/**
 * @brief Flag that cooperative tasks can wait for
 *
 * set() may be called from a task or an interrupt and wakes every
 * cooperative task waiting at that point.
 */
class Event
{
public:
   static constexpr std::size_t MAX_WAITERS = 8;

private:
   bool                            flag{false};
   std::array<Waker, MAX_WAITERS> waiters{};

public:
   class Wait
   {
      Event* event;

   public:
      explicit Wait(Event& event) : event(&event) {}
      Poll<void> poll(Waker const& waker);
   };

   void set();
   void reset();
   [[nodiscard]] bool is_set() const;

   [[nodiscard]] Wait wait() { return Wait(*this); }
};

/**
 * @brief Pending once (waking itself), ready on the next poll
 */
class YieldNow
{
   bool yielded{false};

public:
   Poll<void> poll(Waker const& waker)
   {
      if (yielded) return Poll<void>::ready();
      yielded = true;
      waker.wake();
      return Poll<void>::pending();
   }
};

[[nodiscard]] inline YieldNow yield_now() { return YieldNow{}; }

}  // namespace kairos::async

#endif // KAIROS_ASYNC_HPP
