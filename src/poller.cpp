// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "poller.hpp"

#include "base58.hpp"
#include "errors.hpp"

#include <glog/logging.h>

#include <chrono>

namespace anchorx
{

PollScheduler::PollScheduler (AccountIndexer& i, const std::string& acc,
                              const std::chrono::milliseconds iv)
  : indexer(i), account(acc), interval(iv)
{}

void
PollScheduler::Run ()
{
  std::string key;
  if (!DecodePubkey (account, key))
    throw InvalidConfiguration ("invalid account address: " + account);

  LOG (INFO)
      << "Polling account " << account
      << " every " << interval.count () << " ms";

  std::unique_lock<std::mutex> lock(mut);
  while (!shouldStop)
    {
      /* Ticks are at a fixed rate.  A pass that takes longer than the
         interval is followed by the next one right away.  */
      const auto deadline = std::chrono::steady_clock::now () + interval;

      lock.unlock ();
      try
        {
          indexer.IndexOnce (account);
        }
      catch (const IndexerError& exc)
        {
          if (exc.IsFatal ())
            {
              LOG (ERROR)
                  << "Polling of " << account << " failed fatally: "
                  << exc.what ();
              throw;
            }
          LOG (WARNING)
              << "Indexing pass for " << account << " failed: " << exc.what ();
        }
      lock.lock ();

      ++numTicks;
      cv.wait_until (lock, deadline, [this] () { return shouldStop; });
    }

  LOG (INFO) << "Stopped polling account " << account;
}

void
PollScheduler::Stop ()
{
  std::lock_guard<std::mutex> lock(mut);
  shouldStop = true;
  cv.notify_all ();
}

unsigned
PollScheduler::GetNumTicks ()
{
  std::lock_guard<std::mutex> lock(mut);
  return numTicks;
}

} // namespace anchorx
