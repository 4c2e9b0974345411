/**
 * @file test_scheduler.cpp
 * @brief Priority ordering, preemption and round-robin on the simulation port
 */

#include "kairos/futex.hpp"
#include "kairos/kernel.hpp"

#include "kairos_simulation.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace kairos;

class SchedulerTest : public KernelTest
{
protected:
   std::vector<std::string> trace;

   void record(std::string name) { trace.push_back(std::move(name)); }
};

using Trace = std::vector<std::string>;

/* ============================================================================
 * Priority
 * ========================================================================= */

TEST_F(SchedulerTest, HighestPriorityRunsFirst)
{
   spawn([this] { record("L"); }, 0, 2);
   spawn([this] { record("M"); }, 1, 1);
   spawn([this] { record("H"); }, 2, 0);

   kernel::start();

   EXPECT_EQ(trace, (Trace{"H", "M", "L"}));
   EXPECT_FALSE(kernel::is_running());
}

TEST_F(SchedulerTest, RuntimeSpawnOfHigherPriorityPreempts)
{
   spawn([this] {
      record("L-before");
      spawn([this] { record("H"); }, 1, 1);
      record("L-after");
   }, 0, 2);

   kernel::start();

   EXPECT_EQ(trace, (Trace{"L-before", "H", "L-after"}));
}

TEST_F(SchedulerTest, RuntimeSpawnOfLowerPriorityWaits)
{
   spawn([this] {
      record("H-before");
      spawn([this] { record("L"); }, 1, 2);
      record("H-after");
   }, 0, 1);

   kernel::start();

   EXPECT_EQ(trace, (Trace{"H-before", "H-after", "L"}));
}

TEST_F(SchedulerTest, EqualPrioritySpawnWaitsForSlice)
{
   spawn([this] {
      record("A-before");
      spawn([this] { record("B"); }, 1, 1);
      record("A-after");
   }, 0, 1);

   kernel::start();

   EXPECT_EQ(trace, (Trace{"A-before", "A-after", "B"}));
}

TEST_F(SchedulerTest, LowerPriorityNeverRunsWhileHigherIsReady)
{
   spawn([this] {
      for (int i = 0; i < 5; i++) {
         record("H");
         sim::tick();
      }
   }, 0, 0);
   spawn([this] { record("L"); }, 1, 1);

   kernel::start();

   EXPECT_EQ(trace, (Trace{"H", "H", "H", "H", "H", "L"}));
}

TEST_F(SchedulerTest, SleepingHigherPriorityPreemptsOnWake)
{
   spawn([this] {
      EXPECT_EQ(this_task::sleep_for(3), Error::None);
      record("H");
   }, 0, 0);
   spawn([this] {
      for (int i = 0; i < 5; i++) {
         record("L" + std::to_string(i));
         sim::tick();
      }
   }, 1, 1);

   kernel::start();

   EXPECT_EQ(trace, (Trace{"L0", "L1", "L2", "H", "L3", "L4"}));
}

/* ============================================================================
 * Round-robin
 * ========================================================================= */

TEST_F(SchedulerTest, EqualPriorityTasksRotateOnTick)
{
   for (std::size_t t = 0; t < 3; t++) {
      char const name = static_cast<char>('A' + t);
      spawn([this, name] {
         for (int i = 0; i < 3; i++) {
            record(std::string(1, name));
            sim::tick();
         }
      }, t, 1);
   }

   kernel::start();

   EXPECT_EQ(trace, (Trace{"A", "B", "C", "A", "B", "C", "A", "B", "C"}));
}

TEST_F(SchedulerTest, YieldAlternatesEqualPriorityTasks)
{
   spawn([this] {
      for (int i = 0; i < 3; i++) {
         record("A");
         this_task::yield();
      }
   }, 0, 1);
   spawn([this] {
      for (int i = 0; i < 3; i++) {
         record("B");
         this_task::yield();
      }
   }, 1, 1);

   kernel::start();

   EXPECT_EQ(trace, (Trace{"A", "B", "A", "B", "A", "B"}));
}

TEST_F(SchedulerTest, YieldWithoutPeersKeepsRunning)
{
   spawn([this] {
      for (int i = 0; i < 3; i++) {
         record("A" + std::to_string(i));
         this_task::yield();
      }
   }, 0, 1);
   spawn([this] { record("L"); }, 1, 2);

   kernel::start();

   EXPECT_EQ(trace, (Trace{"A0", "A1", "A2", "L"}));
   // One switch into A, one into L
   EXPECT_EQ(kernel::stats().context_switches, 2u);
}

class SchedulerSliceTest : public SchedulerTest
{
protected:
   kernel::Config config() const override
   {
      kernel::Config cfg;
      cfg.time_slice_ticks = 2;
      return cfg;
   }
};

TEST_F(SchedulerSliceTest, SliceLastsConfiguredTicks)
{
   spawn([this] {
      for (int i = 0; i < 4; i++) {
         record("A");
         sim::tick();
      }
   }, 0, 1);
   spawn([this] {
      for (int i = 0; i < 4; i++) {
         record("B");
         sim::tick();
      }
   }, 1, 1);

   kernel::start();

   EXPECT_EQ(trace, (Trace{"A", "A", "B", "B", "A", "A", "B", "B"}));
}

/* ============================================================================
 * Preemption by a futex wake
 * ========================================================================= */

TEST_F(SchedulerTest, HighWokenByLowPreemptsAndLowRotates)
{
   futex::Cell cell{0};

   spawn([this, &cell] {
      EXPECT_EQ(futex::wait(cell, 0), Error::None);
      record("H");
   }, 0, 0);

   spawn([this, &cell] {
      for (int i = 0; i < 4; i++) {
         record("L1");
         if (i == 2) {
            cell.store(1);
            EXPECT_EQ(futex::wake(cell, 1), 1u);
            record("L1-after-wake");
         }
         sim::tick();
      }
   }, 1, 1);

   spawn([this] {
      for (int i = 0; i < 4; i++) {
         record("L2");
         sim::tick();
      }
   }, 2, 1);

   kernel::start();

   // The preempted L1 goes to the tail of its level, so L2 runs before it resumes
   EXPECT_EQ(trace, (Trace{"L1", "L2", "L1", "L2", "L1", "H", "L2", "L1-after-wake", "L2", "L1"}));
}
