// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ANCHORX_SERVICE_HPP
#define ANCHORX_SERVICE_HPP

#include "indexer.hpp"
#include "poller.hpp"

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace anchorx
{

/**
 * Runs the polling of a set of accounts, each on its own thread, until
 * it is stopped or one of them fails fatally.
 */
class IndexerService
{

private:

  AccountIndexer& indexer;
  const std::vector<std::string> accounts;
  const std::chrono::milliseconds interval;

  /** Mutex for the fields below.  */
  std::mutex mut;

  /** Notified when Run should return.  */
  std::condition_variable cv;

  /** Set to true when Stop has been called.  */
  bool shouldStop = false;

  /** Set to true when a scheduler has failed fatally.  */
  bool failed = false;

  /** Number of scheduler threads that are still running.  */
  unsigned numRunning = 0;

  /**
   * Runs the given scheduler on the current thread, recording a fatal
   * failure if one happens.
   */
  void RunScheduler (PollScheduler& sched);

public:

  explicit IndexerService (AccountIndexer& i,
                           const std::vector<std::string>& acc,
                           std::chrono::milliseconds iv);

  IndexerService () = delete;
  IndexerService (const IndexerService&) = delete;
  void operator= (const IndexerService&) = delete;

  /**
   * Starts polling all accounts and blocks until Stop is called or a
   * scheduler terminates.  All schedulers are stopped and joined before
   * this returns.  Returns false if a scheduler failed fatally.
   */
  bool Run ();

  /**
   * Signals an active Run call to stop (from another thread).
   */
  void Stop ();

};

} // namespace anchorx

#endif // ANCHORX_SERVICE_HPP
