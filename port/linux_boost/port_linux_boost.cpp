/**
 * @file port_linux_boost.cpp
 * @brief Linux simulation port using Boost.Context
 *
 * Every task runs on its own fiber bound to the task's preallocated stack.
 * kairos_port_run_scheduler() acts as the exception boundary: it is the "hub"
 * that calls kairos_kernel_dispatch() and resumes the chosen fiber until that
 * task takes a pended reschedule and jumps back.
 *
 * Interrupts are simulated. The tick only advances when something calls
 * kairos_port_sim_tick() (tests, or the idle task), and interrupt handlers
 * run synchronously on the stack of whoever delivered them, exactly like a
 * real exception borrows the interrupted task's stack.
 */

#include "kairos/port.h"
#include "kairos/port_sim.h"
#include "kairos/port_traits.h"

#include <boost/context/fiber.hpp>
#include <boost/context/preallocated.hpp>
#include <boost/context/stack_context.hpp>

#include <atomic>
#include <cassert>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <new>

#include "DEBUG_PRINT.hpp"

/* ============================================================================
 * Port Context Structure
 * ========================================================================= */

struct kairos_port_context
{
   boost::context::fiber task;  // Task fiber (held by the hub while the task is switched out)
   boost::context::fiber hub;   // Hub continuation (held by the task while it runs)
   void*                 stack_top;
   size_t                stack_size;
   kairos_port_entry_t   entry;
   void*                 arg;
};

static_assert(sizeof(kairos_port_context) == KAIROS_PORT_CONTEXT_SIZE,
              "KAIROS_PORT_CONTEXT_SIZE mismatch - adjust in port_traits.h");
static_assert(alignof(kairos_port_context) == KAIROS_PORT_CONTEXT_ALIGN,
              "KAIROS_PORT_CONTEXT_ALIGN mismatch - adjust in port_traits.h");
static_assert((KAIROS_STACK_ALIGN & (KAIROS_STACK_ALIGN - 1)) == 0,
              "KAIROS_STACK_ALIGN must be a power of two");

/* ============================================================================
 * Simulated CPU State
 * ========================================================================= */

// Context of the task currently executing (nullptr on the hub / host thread)
static thread_local kairos_port_context* tls_current_context = nullptr;

static thread_local bool     tls_reschedule_pending = false;
static thread_local uint32_t tls_irq_disable_depth = 0;
static thread_local uint32_t tls_isr_depth         = 0;
static thread_local uint64_t tls_switch_count      = 0;

struct PendingIrq
{
   kairos_port_isr_handler_t handler{nullptr};
   void*                     arg{nullptr};
};
static thread_local PendingIrq tls_irq_before_critical_section{};

/* ============================================================================
 * Context Switching
 * ========================================================================= */

// Stacks are owned by the kernel, Boost.Context must never allocate one
struct preallocated_stack_noop
{
   using traits_type = boost::context::stack_traits;
   boost::context::stack_context allocate(size_t) { std::abort(); }
   void deallocate(boost::context::stack_context&) noexcept {}
};

extern "C" void kairos_port_context_init(kairos_port_context_t* context,
                                         void* stack_base,
                                         size_t stack_size,
                                         kairos_port_entry_t entry,
                                         void* arg)
{
   ::new (context) kairos_port_context
   {
      .task       = {},
      .hub        = {},
      .stack_top  = static_cast<uint8_t*>(stack_base) + stack_size,
      .stack_size = stack_size,
      .entry      = entry,
      .arg        = arg,
   };

   boost::context::stack_context boost_stack_context{};
   boost_stack_context.size = context->stack_size;
   boost_stack_context.sp   = context->stack_top;

   boost::context::preallocated boost_prealloc(
      boost_stack_context.sp,
      boost_stack_context.size,
      boost_stack_context
   );

   context->task = boost::context::fiber(
      std::allocator_arg,
      boost_prealloc,
      preallocated_stack_noop{},
      [context](boost::context::fiber&& hub_in) mutable -> boost::context::fiber
      {
         context->hub = std::move(hub_in);

         try {
            context->entry(context->arg);
         } catch (boost::context::detail::forced_unwind const&) {
            // Context destroyed while suspended, let Boost finish the unwind
            throw;
         }

         return std::move(context->hub);
      }
   );
}

extern "C" void kairos_port_context_destroy(kairos_port_context_t* context)
{
   // Resetting a suspended fiber unwinds its stack on that stack. Nothing
   // runs on behalf of the caller's task meanwhile, so no switch may be taken.
   auto* caller = tls_current_context;
   tls_current_context = nullptr;
   context->task = boost::context::fiber{};
   context->hub  = boost::context::fiber{};
   context->~kairos_port_context();
   tls_current_context = caller;
}

extern "C" void kairos_port_switch(kairos_port_context_t* /*from*/, kairos_port_context_t* to)
{
   assert(to->task && "Switching to a context that has already finished");

   tls_switch_count++;
   auto* previous = tls_current_context;
   tls_current_context = to;
   to->task = std::move(to->task).resume();
   tls_current_context = previous;
}

static void yield_to_hub()
{
   auto* current = tls_current_context;
   assert(current && current->hub && "No hub to yield to");

   tls_current_context = nullptr;
   current->hub = std::move(current->hub).resume();
   tls_current_context = current;
}

extern "C" void kairos_port_run_scheduler(void)
{
   LOG_PORT("hub: entering dispatch loop");

   while (true)
   {
      // Whatever was pended is about to be serviced by this dispatch
      tls_reschedule_pending = false;
      if (!kairos_kernel_dispatch()) break;
   }

   LOG_PORT("hub: system quiescent, leaving dispatch loop");
}

extern "C" void kairos_port_pend_reschedule(void)
{
   tls_reschedule_pending = true;
}

extern "C" void kairos_port_yield(void)
{
   if (tls_isr_depth != 0 || tls_irq_disable_depth != 0) return;
   if (!tls_current_context || !tls_reschedule_pending) return;

   tls_reschedule_pending = false;
   yield_to_hub();
}

extern "C" void kairos_port_thread_exit(void)
{
   // The kernel never dispatches a terminated task again; loop in case of misuse
   while (true) {
      tls_reschedule_pending = false;
      yield_to_hub();
   }
}

/* ============================================================================
 * Critical Sections and Interrupts (Simulated)
 * ========================================================================= */

static void deliver_irq(kairos_port_isr_handler_t handler, void* arg)
{
   uint32_t const saved_depth = tls_irq_disable_depth;

   tls_isr_depth++;
   tls_irq_disable_depth++;
   handler(arg);
   tls_irq_disable_depth = saved_depth;
   tls_isr_depth--;
}

extern "C" uint32_t kairos_port_irq_save(void)
{
   if (tls_irq_disable_depth == 0 && tls_isr_depth == 0 && tls_current_context
       && tls_irq_before_critical_section.handler)
   {
      // Interrupt that "arrived" just before this critical section closed the door
      auto irq = tls_irq_before_critical_section;
      tls_irq_before_critical_section = {};
      deliver_irq(irq.handler, irq.arg);
      kairos_port_yield();
   }

   return tls_irq_disable_depth++;
}

extern "C" void kairos_port_irq_restore(uint32_t state)
{
   tls_irq_disable_depth = state;

   // Interrupts back on: a reschedule pended inside the section is taken now
   if (state == 0) kairos_port_yield();
}

extern "C" bool kairos_port_in_isr(void)
{
   return tls_isr_depth != 0;
}

/* ============================================================================
 * Platform
 * ========================================================================= */

extern "C" void kairos_port_init(void)
{
   kairos_port_sim_reset();
}

extern "C" void kairos_port_idle(void)
{
   // Nothing else can make progress, so let simulated time pass
   kairos_port_sim_tick();
}

extern "C" void kairos_port_halt(const char* reason)
{
   std::fprintf(stderr, "kairos: system halted: %s\n", reason ? reason : "unknown");
   std::fflush(stderr);
   std::abort();
}

/* ============================================================================
 * Time
 * ========================================================================= */

static std::atomic<uint64_t> g_port_now{0};
static std::atomic<uint32_t> g_tick_hz{1000};
static std::atomic<bool> g_time_irq_enabled{false};
static std::atomic<kairos_port_isr_handler_t> g_tick_isr{nullptr};
static std::atomic<void*> g_tick_isr_arg{nullptr};

extern "C" void kairos_port_time_setup(uint32_t tick_hz)
{
   g_tick_hz.store(tick_hz, std::memory_order_relaxed);
}

extern "C" uint64_t kairos_port_time_now(void)
{
   return g_port_now.load(std::memory_order_relaxed);
}

extern "C" void kairos_port_time_register_isr_handler(kairos_port_isr_handler_t handler, void* arg)
{
   g_tick_isr_arg.store(arg, std::memory_order_relaxed);
   g_tick_isr.store(handler, std::memory_order_release);
}

extern "C" void kairos_port_time_irq_enable(void)  { g_time_irq_enabled.store(true,  std::memory_order_release); }
extern "C" void kairos_port_time_irq_disable(void) { g_time_irq_enabled.store(false, std::memory_order_release); }

extern "C" void kairos_port_time_reset(uint64_t time)
{
   g_port_now.store(time, std::memory_order_release);
}

/* ============================================================================
 * Simulation Controls
 * ========================================================================= */

extern "C" void kairos_port_sim_tick(void)
{
   g_port_now.fetch_add(1, std::memory_order_release);

   auto* isr = g_tick_isr.load(std::memory_order_acquire);
   if (isr && g_time_irq_enabled.load(std::memory_order_acquire)) {
      kairos_port_sim_raise_irq(isr, g_tick_isr_arg.load(std::memory_order_relaxed));
   }
}

extern "C" void kairos_port_sim_raise_irq(kairos_port_isr_handler_t handler, void* arg)
{
   deliver_irq(handler, arg);

   // Exception return: a reschedule pended by the handler is taken here
   if (tls_isr_depth == 0) kairos_port_yield();
}

extern "C" void kairos_port_sim_irq_before_next_critical_section(kairos_port_isr_handler_t handler, void* arg)
{
   tls_irq_before_critical_section = PendingIrq{.handler = handler, .arg = arg};
}

extern "C" uint64_t kairos_port_sim_switch_count(void)
{
   return tls_switch_count;
}

extern "C" void kairos_port_sim_reset(void)
{
   tls_reschedule_pending = false;
   tls_irq_disable_depth  = 0;
   tls_isr_depth          = 0;
   tls_switch_count       = 0;
   tls_irq_before_critical_section = {};
   g_time_irq_enabled.store(false, std::memory_order_release);
   g_tick_isr.store(nullptr, std::memory_order_release);
   g_tick_isr_arg.store(nullptr, std::memory_order_release);
   g_port_now.store(0, std::memory_order_release);
}
