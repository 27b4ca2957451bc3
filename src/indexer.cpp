// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "indexer.hpp"

#include "errors.hpp"

#include <glog/logging.h>

#include <exception>
#include <future>
#include <vector>

namespace anchorx
{

AccountIndexer::AccountIndexer (TransactionSource& src,
                                const TransactionProcessor& p,
                                EventStore& s, const unsigned ps)
  : source(src), processor(p), store(s), pageSize(ps)
{
  CHECK_GT (pageSize, 0) << "Page size must be positive";
}

unsigned
AccountIndexer::IndexOnce (const std::string& account)
{
  std::string cursor;
  if (store.GetCursor (account, cursor))
    VLOG (1) << "Cursor of " << account << " is at " << cursor;
  else
    {
      VLOG (1) << "No cursor yet for " << account;
      cursor.clear ();
    }

  const auto signatures = source.ListSignatures (account, pageSize, cursor);
  if (signatures.empty ())
    {
      VLOG (1) << "No new signatures for " << account;
      return 0;
    }

  LOG (INFO)
      << "Found " << signatures.size () << " new signatures for " << account;
  if (signatures.size () >= pageSize)
    LOG (WARNING)
        << "Got a full page of " << signatures.size ()
        << " signatures for " << account
        << ", older transactions beyond it will not be indexed";

  std::vector<std::future<ProcessedTx>> pending;
  for (const auto& info : signatures)
    {
      /* A failed transaction's effects (including its logs' events)
         were rolled back, so there is nothing to index in it.  */
      if (info.failed)
        {
          VLOG (1) << "Skipping failed transaction " << info.signature;
          continue;
        }

      const std::string sgn = info.signature;
      pending.push_back (std::async (std::launch::async,
          [this, account, sgn] ()
            {
              return processor.Process (account, sgn);
            }));
    }

  std::exception_ptr firstError;
  unsigned stored = 0;
  for (auto& f : pending)
    try
      {
        const ProcessedTx tx = f.get ();
        for (unsigned pos = 0; pos < tx.events.size (); ++pos)
          if (store.InsertEvent (tx.signature, pos, *tx.events[pos]))
            ++stored;
      }
    catch (const IndexerError& exc)
      {
        LOG (WARNING) << "Processing for " << account << " failed: "
                      << exc.what ();
        if (firstError == nullptr)
          firstError = std::current_exception ();
      }

  if (firstError != nullptr)
    {
      LOG (WARNING)
          << "Not advancing the cursor of " << account
          << ", stored " << stored << " events so far";
      std::rethrow_exception (firstError);
    }

  const std::string& newest = signatures.front ().signature;
  store.SetCursor (account, newest);
  LOG (INFO)
      << "Indexed " << stored << " new events for " << account
      << ", cursor advanced to " << newest;

  return stored;
}

} // namespace anchorx
