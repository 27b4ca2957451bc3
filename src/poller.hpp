// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ANCHORX_POLLER_HPP
#define ANCHORX_POLLER_HPP

#include "indexer.hpp"

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>

namespace anchorx
{

/**
 * Runs indexing passes for one account periodically, until it is
 * stopped or a fatal error occurs.
 */
class PollScheduler
{

private:

  AccountIndexer& indexer;

  /** The account being polled (base58).  */
  const std::string account;

  /** Time between the starts of two passes.  */
  const std::chrono::milliseconds interval;

  /** Lock for the condition variable and stop flag.  */
  std::mutex mut;

  /** Notified when the loop should stop.  */
  std::condition_variable cv;

  /** Set to true when Run should return.  */
  bool shouldStop = false;

  /** Number of passes run so far.  */
  unsigned numTicks = 0;

public:

  explicit PollScheduler (AccountIndexer& i, const std::string& acc,
                          std::chrono::milliseconds iv);

  PollScheduler () = delete;
  PollScheduler (const PollScheduler&) = delete;
  void operator= (const PollScheduler&) = delete;

  /**
   * Validates the account and then runs passes until Stop is called.
   * The first pass is run immediately.  Errors of a pass are logged,
   * except fatal ones, which end the loop and are rethrown.
   */
  void Run ();

  /**
   * Requests the Run loop to stop.  A pass that is running is finished
   * first.
   */
  void Stop ();

  /**
   * Returns the number of passes (successful or not) done so far.
   */
  unsigned GetNumTicks ();

};

} // namespace anchorx

#endif // ANCHORX_POLLER_HPP
