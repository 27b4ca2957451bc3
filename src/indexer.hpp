// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ANCHORX_INDEXER_HPP
#define ANCHORX_INDEXER_HPP

#include "eventstore.hpp"
#include "processor.hpp"
#include "txsource.hpp"

#include <string>

namespace anchorx
{

/**
 * Runs single indexing passes for accounts:  It looks up the account's
 * cursor, fetches a page of newer signatures, processes the transactions
 * concurrently, stores their events and advances the cursor.
 */
class AccountIndexer
{

private:

  TransactionSource& source;
  const TransactionProcessor& processor;
  EventStore& store;

  /** Maximum number of signatures to process in one pass.  */
  const unsigned pageSize;

public:

  explicit AccountIndexer (TransactionSource& src,
                           const TransactionProcessor& p,
                           EventStore& s, unsigned ps);

  AccountIndexer () = delete;
  AccountIndexer (const AccountIndexer&) = delete;
  void operator= (const AccountIndexer&) = delete;

  /**
   * Runs one indexing pass for the given account.  Returns the number
   * of newly stored events.
   *
   * The cursor is only advanced (to the newest signature of the page)
   * if all transactions of the page were processed and stored
   * successfully.  Otherwise, the events of the transactions that did
   * succeed are kept, and the first error (in page order) is rethrown
   * after all transactions have been handled.
   */
  unsigned IndexOnce (const std::string& account);

};

} // namespace anchorx

#endif // ANCHORX_INDEXER_HPP
