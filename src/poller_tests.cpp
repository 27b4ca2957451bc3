// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "poller.hpp"

#include "errors.hpp"
#include "testutils.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <thread>

namespace anchorx
{
namespace
{

using namespace std::chrono_literals;

class PollSchedulerTests : public testing::Test
{

protected:

  const std::string account = TestAddress (1);
  const std::string program = TestKey (100);

  EventRegistry registry;
  LogScanner scanner;
  TestTransactionSource source;
  InMemoryEventStore store;
  TransactionProcessor proc;
  AccountIndexer indexer;

  PollSchedulerTests ()
    : scanner(registry), proc(source, scanner, program),
      indexer(source, proc, store, 3)
  {
    TestEvent::Register (registry);
  }

  /**
   * Waits until the scheduler has done at least the given number
   * of passes.
   */
  static void
  WaitForTicks (PollScheduler& sched, const unsigned n)
  {
    while (sched.GetNumTicks () < n)
      SleepSome ();
  }

};

TEST_F (PollSchedulerTests, InvalidAccount)
{
  for (const std::string acc : {"", "invalid!", "StV1DL6CwTryKyV"})
    {
      PollScheduler sched(indexer, acc, 10ms);
      EXPECT_THROW (sched.Run (), InvalidConfiguration) << acc;
      EXPECT_EQ (sched.GetNumTicks (), 0);
    }
}

TEST_F (PollSchedulerTests, PicksUpNewTransactions)
{
  source.AddTransaction (account, "sgn1", {program},
                         {TestEvent::LogLine (registry, TestEvent (1))});

  PollScheduler sched(indexer, account, 10ms);
  std::thread runner([&sched] () { sched.Run (); });

  WaitForTicks (sched, 1);
  source.AddTransaction (account, "sgn2", {program},
                         {TestEvent::LogLine (registry, TestEvent (2))});
  const unsigned ticks = sched.GetNumTicks ();
  WaitForTicks (sched, ticks + 2);

  sched.Stop ();
  runner.join ();

  EXPECT_EQ (store.GetEvents ().size (), 2);
  std::string cursor;
  ASSERT_TRUE (store.GetCursor (account, cursor));
  EXPECT_EQ (cursor, "sgn2");
}

TEST_F (PollSchedulerTests, RecoversFromErrors)
{
  source.AddTransaction (account, "sgn", {program},
                         {TestEvent::LogLine (registry, TestEvent (1))});
  source.SetListFails (true);

  PollScheduler sched(indexer, account, 10ms);
  std::thread runner([&sched] () { sched.Run (); });

  WaitForTicks (sched, 3);
  EXPECT_TRUE (store.GetEvents ().empty ());

  source.SetListFails (false);
  const unsigned ticks = sched.GetNumTicks ();
  WaitForTicks (sched, ticks + 2);

  sched.Stop ();
  runner.join ();

  EXPECT_EQ (store.GetEvents ().size (), 1);
}

TEST_F (PollSchedulerTests, FixedTickRate)
{
  /* Each pass takes 100 ms of the 150 ms interval.  If the interval were
     waited after each pass instead, four passes would take 850 ms.  */
  source.SetListDelay (100ms);

  PollScheduler sched(indexer, account, 150ms);
  const auto start = std::chrono::steady_clock::now ();
  std::thread runner([&sched] () { sched.Run (); });

  WaitForTicks (sched, 4);
  const auto elapsed = std::chrono::steady_clock::now () - start;

  sched.Stop ();
  runner.join ();

  EXPECT_GE (elapsed, 500ms);
  EXPECT_LT (elapsed, 750ms);
}

TEST_F (PollSchedulerTests, StopInterruptsWait)
{
  PollScheduler sched(indexer, account, std::chrono::hours (1));
  std::thread runner([&sched] () { sched.Run (); });

  WaitForTicks (sched, 1);
  sched.Stop ();
  runner.join ();

  EXPECT_EQ (sched.GetNumTicks (), 1);
}

} // anonymous namespace
} // namespace anchorx
