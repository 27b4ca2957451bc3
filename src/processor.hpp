// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ANCHORX_PROCESSOR_HPP
#define ANCHORX_PROCESSOR_HPP

#include "events.hpp"
#include "logscanner.hpp"
#include "txsource.hpp"

#include <memory>
#include <string>
#include <vector>

namespace anchorx
{

/**
 * Result of processing a single transaction.
 */
struct ProcessedTx
{

  /** The signature that was processed.  */
  std::string signature;

  /** The events extracted from it, in log order.  */
  std::vector<std::unique_ptr<Event>> events;

};

/**
 * Fetches transactions by signature and extracts the events that the
 * monitored program emitted in them.  This does not touch the storage.
 * Instances can be used from multiple threads at the same time.
 */
class TransactionProcessor
{

private:

  /** The source of transaction data.  */
  TransactionSource& source;

  /** Scanner used to extract events from the log lines.  */
  const LogScanner& scanner;

  /** The program's address as raw bytes.  */
  const std::string program;

public:

  /**
   * Constructs the processor.  The program key is given as raw
   * 32-byte address.
   */
  explicit TransactionProcessor (TransactionSource& src,
                                 const LogScanner& s,
                                 const std::string& programKey);

  TransactionProcessor () = delete;
  TransactionProcessor (const TransactionProcessor&) = delete;
  void operator= (const TransactionProcessor&) = delete;

  /**
   * Processes the transaction with the given signature, which has been
   * listed for the given account.  Transactions that cannot be decoded or
   * that do not involve the program yield an empty result.  Throws
   * SourceUnavailable if the transaction could not be fetched.
   */
  ProcessedTx Process (const std::string& account,
                       const std::string& signature) const;

};

} // namespace anchorx

#endif // ANCHORX_PROCESSOR_HPP
