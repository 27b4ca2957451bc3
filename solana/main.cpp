// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "config.h"

#include "rpcsource.hpp"

#include "config.hpp"
#include "driftevents.hpp"
#include "errors.hpp"
#include "events.hpp"
#include "indexer.hpp"
#include "logscanner.hpp"
#include "processor.hpp"
#include "service.hpp"
#include "sqlitestore.hpp"

#include <gflags/gflags.h>
#include <glog/logging.h>

#include <pthread.h>
#include <signal.h>

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <thread>

namespace
{

DEFINE_string (accounts, "",
               "comma-separated list of accounts whose transactions"
               " are indexed");
DEFINE_string (db, "anchorx.sqlite",
               "SQLite database file for the indexed events"
               " (overridden by INDEXER_DB_CONN_STR)");
DEFINE_string (rpc, "https://api.mainnet-beta.solana.com",
               "URL of the Solana JSON-RPC interface"
               " (overridden by INDEXER_SOLANA_RPC_URL)");
DEFINE_int32 (poll, 3,
              "seconds between polls of each account");
DEFINE_int32 (page_size, 3,
              "maximum number of new transactions to process per poll");
DEFINE_string (program, "dRiftyHA39MWEi3m9aunc5MzRF1JYuBsbn6VPcn33UH",
               "address of the program whose events are indexed");

/**
 * Blocks SIGINT and SIGTERM for the calling thread and all threads
 * created from it afterwards, so that SignalWaiter can receive them.
 */
void
BlockSignals (sigset_t& signals)
{
  sigemptyset (&signals);
  sigaddset (&signals, SIGINT);
  sigaddset (&signals, SIGTERM);
  CHECK_EQ (pthread_sigmask (SIG_BLOCK, &signals, nullptr), 0);
}

/**
 * Waits on a separate thread for one of the blocked signals, and stops
 * the service when one is received.
 */
class SignalWaiter
{

private:

  const sigset_t& signals;
  std::thread waiter;

public:

  explicit SignalWaiter (const sigset_t& s, anchorx::IndexerService& service)
    : signals(s)
  {
    waiter = std::thread ([this, &service] ()
      {
        int sig;
        CHECK_EQ (sigwait (&signals, &sig), 0);
        LOG (INFO) << "Received signal " << sig << ", shutting down";
        service.Stop ();
      });
  }

  /**
   * Wakes up the waiter thread (if no signal was received yet) and
   * joins it.
   */
  ~SignalWaiter ()
  {
    pthread_kill (waiter.native_handle (), SIGTERM);
    waiter.join ();
  }

  SignalWaiter (const SignalWaiter&) = delete;
  void operator= (const SignalWaiter&) = delete;

};

} // anonymous namespace

int
main (int argc, char* argv[])
{
  google::InitGoogleLogging (argv[0]);

  gflags::SetUsageMessage ("Index Anchor events of a Solana program");
  gflags::SetVersionString (PACKAGE_VERSION);
  gflags::ParseCommandLineFlags (&argc, &argv, true);

  try
    {
      anchorx::IndexerConfig config;
      config.accounts = anchorx::ParseAccountList (FLAGS_accounts);
      config.database = FLAGS_db;
      config.rpcUrl = FLAGS_rpc;
      config.program = FLAGS_program;
      config.pollSeconds = FLAGS_poll;
      config.pageSize = FLAGS_page_size;
      config.ApplyEnvironment ([] (const char* name) -> const char*
        {
          return std::getenv (name);
        });

      std::string programKey;
      config.Validate (programKey);

      sigset_t signals;
      BlockSignals (signals);

      anchorx::EventRegistry registry;
      anchorx::drift::RegisterDriftEvents (registry);
      const anchorx::LogScanner scanner(registry);

      anchorx::SolanaRpcSource source(config.rpcUrl);
      if (!source.Start ())
        LOG (WARNING) << "Starting anyway, indexing retries on each poll";

      anchorx::SqliteEventStore store(config.database);
      const anchorx::TransactionProcessor proc(source, scanner, programKey);
      anchorx::AccountIndexer indexer(source, proc, store, config.pageSize);

      anchorx::IndexerService service(indexer, config.accounts,
                                      std::chrono::seconds (config.pollSeconds));
      SignalWaiter waiter(signals, service);

      if (!service.Run ())
        {
          LOG (ERROR) << "Indexing terminated with a fatal error";
          return EXIT_FAILURE;
        }
    }
  catch (const std::exception& exc)
    {
      std::cerr << "Error: " << exc.what () << std::endl;
      return EXIT_FAILURE;
    }
  catch (...)
    {
      std::cerr << "Exception caught" << std::endl;
      return EXIT_FAILURE;
    }

  return EXIT_SUCCESS;
}
