/**
 * @file test_task.cpp
 * @brief Task lifecycle: spawn, sleep, suspend/resume, kill, join and reap
 */

#include "kairos/futex.hpp"
#include "kairos/kernel.hpp"

#include "kairos/port_sim.h"

#include "kairos_simulation.hpp"

#include <gtest/gtest.h>

#include <array>
#include <limits>
#include <string>
#include <vector>

using namespace kairos;

class TaskTest : public KernelTest
{
protected:
   std::vector<std::string> trace;

   void record(std::string name) { trace.push_back(std::move(name)); }
};

using Trace = std::vector<std::string>;

/* ============================================================================
 * Spawn
 * ========================================================================= */

TEST_F(TaskTest, SpawnRejectsPriorityOutsideConfiguredLevels)
{
   auto result = kernel::spawn([] {}, stack(0), static_cast<std::uint8_t>(config::MAX_PRIORITIES));
   EXPECT_FALSE(result.ok());
   EXPECT_EQ(result.error(), Error::InvalidPriority);
   EXPECT_EQ(kernel::task_count(), 0u);
}

TEST_F(TaskTest, SpawnRejectsStackThatCannotHoldAContext)
{
   alignas(KAIROS_STACK_ALIGN) std::array<std::byte, 64> tiny{};
   auto result = kernel::spawn([] {}, tiny, 1);
   EXPECT_EQ(result.error(), Error::StackTooSmall);
   EXPECT_EQ(kernel::task_count(), 0u);
}

TEST_F(TaskTest, SpawnBeforeInitialiseFails)
{
   kernel::shutdown();
   auto result = kernel::spawn([] {}, stack(0), 1);
   EXPECT_EQ(result.error(), Error::NotInitialised);
}

TEST_F(TaskTest, SpawnFromInterruptIsNotPermitted)
{
   Error from_isr = Error::None;
   spawn([this, &from_isr] {
      sim::interrupt([this, &from_isr] {
         from_isr = kernel::spawn([] {}, stack(1), 1).error();
      });
   }, 0, 1);

   kernel::start();

   EXPECT_EQ(from_isr, Error::NotPermitted);
}

class SmallTaskLimitTest : public TaskTest
{
protected:
   kernel::Config config() const override
   {
      kernel::Config cfg;
      cfg.max_tasks = 2;
      return cfg;
   }
};

TEST_F(SmallTaskLimitTest, SpawnBeyondMaxTasksFails)
{
   spawn([] {}, 0, 1);
   spawn([] {}, 1, 1);

   auto result = kernel::spawn([] {}, stack(2), 1);
   EXPECT_EQ(result.error(), Error::TaskLimitExceeded);
   EXPECT_EQ(kernel::task_count(), 2u);
}

TEST_F(TaskTest, IdentityInsideTheTask)
{
   TaskId seen_id;
   Priority seen_priority = 0;

   TaskId const id = spawn([&seen_id, &seen_priority] {
      seen_id       = this_task::id();
      seen_priority = this_task::priority();
   }, 0, 7);

   EXPECT_TRUE(id.valid());
   kernel::start();

   EXPECT_EQ(seen_id, id);
   EXPECT_EQ(seen_priority.val, 7);
}

TEST_F(TaskTest, StateFollowsLifecycle)
{
   TaskId id;
   TaskState inside = TaskState::Ready;

   id = spawn([&id, &inside] { inside = kernel::state_of(id).value(); }, 0, 1);

   EXPECT_EQ(kernel::state_of(id).value(), TaskState::Ready);
   kernel::start();

   EXPECT_EQ(inside, TaskState::Running);
   EXPECT_EQ(kernel::state_of(id).value(), TaskState::Terminated);
   EXPECT_EQ(kernel::state_of(TaskId{}).error(), Error::InvalidTask);
}

TEST_F(TaskTest, ExitEndsTheTaskEarly)
{
   TaskId id;

   id = spawn([this] {
      record("before exit");
      this_task::exit();
   }, 0, 1);
   spawn([this] { record("next"); }, 1, 1);

   kernel::start();

   EXPECT_EQ(trace, (Trace{"before exit", "next"}));
   EXPECT_EQ(kernel::state_of(id).value(), TaskState::Terminated);
}

/* ============================================================================
 * Sleep
 * ========================================================================= */

TEST_F(TaskTest, SleepForBlocksForTheGivenTicks)
{
   Tick slept = 0;

   spawn([&slept] {
      Tick const start = kernel::tick_now();
      EXPECT_EQ(this_task::sleep_for(5), Error::None);
      slept = kernel::tick_now() - start;
   }, 0, 1);

   kernel::start();

   EXPECT_EQ(slept, 5u);
}

TEST_F(TaskTest, SleepUntilPastDeadlineReturnsImmediately)
{
   spawn([this] {
      sim::tick(3);
      EXPECT_EQ(this_task::sleep_until(2), Error::None);
      EXPECT_EQ(this_task::sleep_for(0), Error::None);
      EXPECT_EQ(kernel::tick_now(), 3u);
      record("done");
   }, 0, 1);

   kernel::start();

   EXPECT_EQ(trace, (Trace{"done"}));
}

TEST_F(TaskTest, SleepersWakeInDeadlineOrder)
{
   spawn([this] {
      (void)this_task::sleep_until(30);
      record("A@" + std::to_string(kernel::tick_now()));
   }, 0, 1);
   spawn([this] {
      (void)this_task::sleep_until(10);
      record("B@" + std::to_string(kernel::tick_now()));
   }, 1, 1);
   spawn([this] {
      (void)this_task::sleep_until(20);
      record("C@" + std::to_string(kernel::tick_now()));
   }, 2, 1);

   kernel::start();

   EXPECT_EQ(trace, (Trace{"B@10", "C@20", "A@30"}));
}

TEST_F(TaskTest, SleepersWithTheSameDeadlineWakeInTheOrderTheySlept)
{
   spawn([this] { (void)this_task::sleep_until(10); record("A"); }, 0, 1);
   spawn([this] { (void)this_task::sleep_until(10); record("B"); }, 1, 1);
   spawn([this] { (void)this_task::sleep_until(10); record("C"); }, 2, 1);
   spawn([this] { (void)this_task::sleep_until(10); record("D"); }, 3, 1);

   kernel::start();

   EXPECT_EQ(trace, (Trace{"A", "B", "C", "D"}));
}

TEST_F(TaskTest, SleepForLongerThanTheClockCanCountNeverWakes)
{
   TaskId sleeper;

   sleeper = spawn([this] {
      sim::tick(3);
      EXPECT_EQ(this_task::sleep_for(std::numeric_limits<Tick>::max()), Error::None);
      record("woke");
   }, 0, 0);

   spawn([&sleeper] {
      EXPECT_EQ(kernel::state_of(sleeper).value(), TaskState::Blocked);
      EXPECT_EQ(kernel::kill(sleeper), Error::None);
   }, 1, 1);

   kernel::start();

   EXPECT_TRUE(trace.empty());
}

TEST_F(TaskTest, SleepOutsideTaskIsNotPermitted)
{
   EXPECT_EQ(this_task::sleep_for(1), Error::NotPermitted);
   EXPECT_EQ(this_task::suspend(), Error::NotPermitted);
}

/* ============================================================================
 * Suspend / resume
 * ========================================================================= */

TEST_F(TaskTest, SuspendedTaskRunsAgainAfterResume)
{
   TaskId sleeper;

   sleeper = spawn([this] {
      record("S-before");
      EXPECT_EQ(this_task::suspend(), Error::None);
      record("S-after");
   }, 0, 1);

   spawn([this, &sleeper] {
      EXPECT_EQ(kernel::state_of(sleeper).value(), TaskState::Suspended);
      record("R");
      EXPECT_EQ(kernel::resume(sleeper), Error::None);
      record("R-after");
   }, 1, 2);

   kernel::start();

   EXPECT_EQ(trace, (Trace{"S-before", "R", "S-after", "R-after"}));
}

TEST_F(TaskTest, ResumeOfNonSuspendedTaskIsInvalidState)
{
   spawn([] { EXPECT_EQ(kernel::resume(this_task::id()), Error::InvalidState); }, 0, 1);
   kernel::start();

   EXPECT_EQ(kernel::resume(TaskId{0x1234}), Error::InvalidTask);
}

/* ============================================================================
 * Kill
 * ========================================================================= */

TEST_F(TaskTest, KillRemovesBlockedTaskFromItsFutexQueue)
{
   futex::Cell cell{0};
   TaskId victim;

   victim = spawn([this, &cell] {
      (void)futex::wait(cell, 0);
      record("victim woke");
   }, 0, 1);

   spawn([&cell, &victim] {
      EXPECT_EQ(futex::waiter_count(cell), 1u);
      EXPECT_EQ(kernel::kill(victim), Error::None);
      EXPECT_EQ(kernel::state_of(victim).value(), TaskState::Terminated);
      EXPECT_EQ(futex::waiter_count(cell), 0u);
      EXPECT_EQ(futex::active_queue_count(), 0u);
      EXPECT_EQ(futex::wake_all(cell), 0u);
   }, 1, 2);

   kernel::start();

   EXPECT_TRUE(trace.empty());
}

TEST_F(TaskTest, KillSleepingTaskCancelsItsWakeup)
{
   TaskId victim;

   victim = spawn([this] {
      (void)this_task::sleep_for(100);
      record("victim woke");
   }, 0, 1);

   spawn([&victim] { EXPECT_EQ(kernel::kill(victim), Error::None); }, 1, 2);

   kernel::start();

   // Nothing left asleep, so the simulation stopped without running the clock out
   EXPECT_TRUE(trace.empty());
   EXPECT_LT(kernel::tick_now(), 100u);
}

TEST_F(TaskTest, KillReadyTaskPreventsItFromRunning)
{
   TaskId victim;

   spawn([&victim] { EXPECT_EQ(kernel::kill(victim), Error::None); }, 0, 1);
   victim = spawn([this] { record("victim ran"); }, 1, 2);

   kernel::start();

   EXPECT_TRUE(trace.empty());
}

TEST_F(TaskTest, KillErrors)
{
   TaskId finished;

   finished = spawn([] {}, 0, 0);
   spawn([&finished] {
      EXPECT_EQ(kernel::kill(this_task::id()), Error::NotPermitted);
      EXPECT_EQ(kernel::kill(finished), Error::InvalidTask);
      EXPECT_EQ(kernel::kill(TaskId{}), Error::InvalidTask);
   }, 1, 1);

   kernel::start();
}

/* ============================================================================
 * Join / reap
 * ========================================================================= */

TEST_F(TaskTest, JoinBlocksUntilTaskTerminates)
{
   TaskId worker;

   worker = spawn([this] {
      (void)this_task::sleep_for(5);
      record("worker done");
   }, 0, 1);

   spawn([this, &worker] {
      EXPECT_EQ(kernel::join(worker), Error::None);
      record("joined@" + std::to_string(kernel::tick_now()));

      // Already terminated: returns straight away
      EXPECT_EQ(kernel::join(worker), Error::None);
      EXPECT_EQ(kernel::join(this_task::id()), Error::NotPermitted);
   }, 1, 2);

   kernel::start();

   EXPECT_EQ(trace, (Trace{"worker done", "joined@5"}));
}

TEST_F(TaskTest, JoinOfKilledTaskReturns)
{
   TaskId worker;

   worker = spawn([] { (void)this_task::suspend(); }, 0, 1);
   spawn([this, &worker] {
      EXPECT_EQ(kernel::join(worker), Error::None);
      record("joined");
   }, 1, 2);
   spawn([&worker] { EXPECT_EQ(kernel::kill(worker), Error::None); }, 2, 3);

   kernel::start();

   EXPECT_EQ(trace, (Trace{"joined"}));
}

TEST_F(TaskTest, JoinIsNotFooledByTheSlotBeingReused)
{
   // The target is killed, reaped and its slot handed to a new task after
   // join() looked it up but before join() started waiting
   struct Race
   {
      futex::Cell go{0};
      TaskId      target;
      TaskId      replacement;
   } race;

   race.target = spawn([] { (void)this_task::suspend(); }, 0, 3);

   spawn([this, &race] {
      EXPECT_EQ(futex::wait(race.go, 0), Error::None);
      EXPECT_EQ(kernel::reap(race.target), Error::None);
      race.replacement = spawn([] { (void)this_task::suspend(); }, 3, 4);
   }, 1, 0);

   spawn([this, &race] {
      sim::interrupt_before_next_critical_section([&race] {
         // Fires as join() looks the target up; this one fires as it starts waiting
         kairos_port_sim_irq_before_next_critical_section([](void* arg) {
            auto* r = static_cast<Race*>(arg);
            EXPECT_EQ(kernel::kill(r->target), Error::None);
            r->go.store(1);
            (void)futex::wake_one(r->go);
         }, &race);
      });
      EXPECT_EQ(kernel::join(race.target), Error::None);
      record("joined");
   }, 2, 2);

   kernel::start();

   EXPECT_EQ(trace, (Trace{"joined"}));
   EXPECT_EQ(kernel::state_of(race.target).error(), Error::InvalidTask);
   EXPECT_EQ(race.replacement.value() & 0xFF, race.target.value() & 0xFF);
   EXPECT_EQ(kernel::state_of(race.replacement).value(), TaskState::Suspended);
}

TEST_F(TaskTest, ReapInvalidatesTheId)
{
   TaskId const id = spawn([] {}, 0, 1);
   EXPECT_EQ(kernel::reap(id), Error::InvalidState);  // Still Ready

   kernel::start();

   EXPECT_EQ(kernel::task_count(), 1u);
   EXPECT_EQ(kernel::reap(id), Error::None);
   EXPECT_EQ(kernel::task_count(), 0u);
   EXPECT_EQ(kernel::state_of(id).error(), Error::InvalidTask);
   EXPECT_EQ(kernel::reap(id), Error::InvalidTask);
}

TEST_F(TaskTest, ReapedSlotIsReusedUnderAFreshId)
{
   TaskId const first = spawn([] {}, 0, 1);
   kernel::start();
   ASSERT_EQ(kernel::reap(first), Error::None);

   bool second_ran = false;
   TaskId const second = spawn([&second_ran] { second_ran = true; }, 1, 1);
   EXPECT_NE(first, second);
   EXPECT_EQ(kernel::state_of(first).error(), Error::InvalidTask);
   EXPECT_EQ(kernel::state_of(second).value(), TaskState::Ready);

   kernel::start();
   EXPECT_TRUE(second_ran);
}

TEST_F(TaskTest, ReapFromInsideATask)
{
   TaskId child;

   spawn([this, &child] {
      child = spawn([this] { record("child"); }, 1, 0);
      EXPECT_EQ(kernel::reap(this_task::id()), Error::InvalidState);
      EXPECT_EQ(kernel::reap(child), Error::None);
      record("reaped");
   }, 0, 1);

   kernel::start();

   EXPECT_EQ(trace, (Trace{"child", "reaped"}));
   EXPECT_EQ(kernel::task_count(), 1u);
}

/* ============================================================================
 * Time and statistics
 * ========================================================================= */

TEST_F(TaskTest, DurationConversionRoundsUp)
{
   EXPECT_EQ(kernel::ms_to_ticks(0), 0u);
   EXPECT_EQ(kernel::ms_to_ticks(5), 5u);
   EXPECT_EQ(kernel::us_to_ticks(1), 1u);
   EXPECT_EQ(kernel::us_to_ticks(1000), 1u);
   EXPECT_EQ(kernel::us_to_ticks(1001), 2u);
}

class SlowTickTest : public TaskTest
{
protected:
   kernel::Config config() const override
   {
      kernel::Config cfg;
      cfg.tick_hz = 100;
      return cfg;
   }
};

TEST_F(SlowTickTest, DurationConversionUsesTickRate)
{
   EXPECT_EQ(kernel::ms_to_ticks(10), 1u);
   EXPECT_EQ(kernel::ms_to_ticks(15), 2u);
   EXPECT_EQ(kernel::ms_to_ticks(1000), 100u);
   EXPECT_EQ(kernel::config().tick_hz, 100u);
}

TEST_F(TaskTest, StatsCountSwitchesAndTicks)
{
   spawn([] { sim::tick(3); }, 0, 1);
   spawn([] {}, 1, 2);

   kernel::start();

   auto const stats = kernel::stats();
   EXPECT_EQ(stats.ticks, 3u);
   EXPECT_EQ(stats.context_switches, 2u);
   EXPECT_EQ(kernel::tick_now(), 3u);
}
