#include "kairos/async.hpp"

#include "kairos/futex.hpp"
#include "kairos/kernel.hpp"

#include "DEBUG_PRINT.hpp"

namespace kairos::async
{

/* ===== WakeSignal ===== */

void WakeSignal::notify()
{
   cell.store(WAKE_PENDING, std::memory_order_release);
   futex::wake(cell, 1);
}

bool WakeSignal::take() noexcept
{
   return cell.exchange(NO_PENDING_WAKE, std::memory_order_acq_rel) == WAKE_PENDING;
}

Error WakeSignal::wait()
{
   Error const err = futex::wait(cell, NO_PENDING_WAKE);
   // A wake slipped in before we could block, which is just as good
   if (err == Error::WouldNotBlock) return Error::None;
   return err;
}

bool WakeSignal::pending() const noexcept
{
   return cell.load(std::memory_order_acquire) == WAKE_PENDING;
}

/* ===== Waker ===== */

void Waker::wake() const
{
   if (!signal) return;
   if (ready_mask) ready_mask->fetch_or(ready_bit, std::memory_order_acq_rel);
   signal->notify();
}

/* ===== Event ===== */

void Event::set()
{
   std::array<Waker, MAX_WAITERS> to_wake;
   {
      CriticalSection cs;
      flag = true;
      to_wake = std::exchange(waiters, {});
   }

   LOG_ASYNC("event %p set", static_cast<void*>(this));
   for (auto const& waker : to_wake) waker.wake();
}

void Event::reset()
{
   CriticalSection cs;
   flag = false;
}

bool Event::is_set() const
{
   CriticalSection cs;
   return flag;
}

Poll<void> Event::Wait::poll(Waker const& waker)
{
   {
      CriticalSection cs;
      if (event->flag) return Poll<void>::ready();

      Waker* free_slot = nullptr;
      for (auto& registered : event->waiters) {
         if (registered == waker) return Poll<void>::pending();
         if (!registered.valid() && !free_slot) free_slot = &registered;
      }
      if (free_slot) {
         *free_slot = waker;
         return Poll<void>::pending();
      }
   }

   // No room to be remembered: ask to be polled again instead
   waker.wake();
   return Poll<void>::pending();
}

}  // namespace kairos::async
