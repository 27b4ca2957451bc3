// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "service.hpp"

#include "testutils.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <thread>

namespace anchorx
{
namespace
{

using namespace std::chrono_literals;

class IndexerServiceTests : public testing::Test
{

protected:

  const std::string program = TestKey (100);

  EventRegistry registry;
  LogScanner scanner;
  TestTransactionSource source;
  InMemoryEventStore store;
  TransactionProcessor proc;
  AccountIndexer indexer;

  IndexerServiceTests ()
    : scanner(registry), proc(source, scanner, program),
      indexer(source, proc, store, 3)
  {
    TestEvent::Register (registry);
  }

  /**
   * Waits until the given account has its cursor set to the given
   * signature.
   */
  void
  WaitForCursor (const std::string& account, const std::string& expected)
  {
    while (true)
      {
        std::string cursor;
        if (store.GetCursor (account, cursor) && cursor == expected)
          return;
        SleepSome ();
      }
  }

};

TEST_F (IndexerServiceTests, IndexesAllAccounts)
{
  const std::vector<std::string> accounts
      = {TestAddress (1), TestAddress (2), TestAddress (3)};
  for (unsigned i = 0; i < accounts.size (); ++i)
    source.AddTransaction (accounts[i], "sgn" + std::to_string (i),
                           {program},
                           {TestEvent::LogLine (registry, TestEvent (i))});

  IndexerService service(indexer, accounts, 10ms);
  bool result = false;
  std::thread runner([&] () { result = service.Run (); });

  for (unsigned i = 0; i < accounts.size (); ++i)
    WaitForCursor (accounts[i], "sgn" + std::to_string (i));

  service.Stop ();
  runner.join ();

  EXPECT_TRUE (result);
  EXPECT_EQ (store.GetEvents ().size (), 3);
}

TEST_F (IndexerServiceTests, FatalErrorStopsEverything)
{
  const std::vector<std::string> accounts
      = {TestAddress (1), "invalid account"};

  IndexerService service(indexer, accounts, 10ms);
  EXPECT_FALSE (service.Run ());
}

TEST_F (IndexerServiceTests, StopBeforeRun)
{
  IndexerService service(indexer, {TestAddress (1)}, std::chrono::hours (1));
  service.Stop ();
  EXPECT_TRUE (service.Run ());
}

} // anonymous namespace
} // namespace anchorx
