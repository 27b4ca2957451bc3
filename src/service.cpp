// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "service.hpp"

#include <glog/logging.h>

#include <exception>

namespace anchorx
{

IndexerService::IndexerService (AccountIndexer& i,
                                const std::vector<std::string>& acc,
                                const std::chrono::milliseconds iv)
  : indexer(i), accounts(acc), interval(iv)
{}

void
IndexerService::RunScheduler (PollScheduler& sched)
{
  bool fatal = false;
  try
    {
      sched.Run ();
    }
  catch (const std::exception& exc)
    {
      LOG (ERROR) << "Scheduler terminated: " << exc.what ();
      fatal = true;
    }

  std::lock_guard<std::mutex> lock(mut);
  if (fatal)
    failed = true;
  CHECK_GT (numRunning, 0);
  --numRunning;
  cv.notify_all ();
}

bool
IndexerService::Run ()
{
  CHECK (!accounts.empty ()) << "No accounts to index";

  std::vector<std::unique_ptr<PollScheduler>> schedulers;
  for (const auto& a : accounts)
    schedulers.push_back (
        std::make_unique<PollScheduler> (indexer, a, interval));

  std::vector<std::thread> threads;
  {
    std::unique_lock<std::mutex> lock(mut);
    failed = false;
    numRunning = schedulers.size ();

    for (auto& s : schedulers)
      {
        PollScheduler* sched = s.get ();
        threads.emplace_back ([this, sched] ()
          {
            RunScheduler (*sched);
          });
      }
    LOG (INFO) << "Started polling " << schedulers.size () << " accounts";

    cv.wait (lock, [this] ()
      {
        return shouldStop || failed || numRunning == 0;
      });
  }

  LOG (INFO) << "Stopping all schedulers";
  for (auto& s : schedulers)
    s->Stop ();
  for (auto& t : threads)
    t.join ();

  std::lock_guard<std::mutex> lock(mut);
  return !failed;
}

void
IndexerService::Stop ()
{
  std::lock_guard<std::mutex> lock(mut);
  shouldStop = true;
  cv.notify_all ();
}

} // namespace anchorx
