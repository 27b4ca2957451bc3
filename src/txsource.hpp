// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ANCHORX_TXSOURCE_HPP
#define ANCHORX_TXSOURCE_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace anchorx
{

/**
 * One entry of the signature listing for an account.
 */
struct SignatureInfo
{

  /** The transaction signature in base58.  */
  std::string signature;

  /** The slot the transaction was processed in.  */
  uint64_t slot = 0;

  /** Estimated production time of the block, if known.  */
  std::optional<int64_t> blockTime;

  /** Whether the transaction failed on chain.  */
  bool failed = false;

};

/**
 * A fetched transaction.
 */
struct RawTransaction
{

  /** The signature (base58) by which it was requested.  */
  std::string signature;

  /** The slot it was processed in.  */
  uint64_t slot = 0;

  /** The transaction in the binary wire format.  */
  std::string raw;

  /** The log lines of the transaction's execution.  */
  std::vector<std::string> logs;

};

/**
 * Interface for the source of transactions (i.e. a blockchain node's RPC
 * interface).  Implementations must be safe to call from multiple threads
 * at the same time.  Failures to reach the source or invalid responses
 * are reported by throwing SourceUnavailable.
 */
class TransactionSource
{

public:

  TransactionSource () = default;
  virtual ~TransactionSource () = default;

  TransactionSource (const TransactionSource&) = delete;
  void operator= (const TransactionSource&) = delete;

  /**
   * Lists up to limit signatures of transactions involving the given
   * account, newest first.  If until is non-empty, the listing stops
   * before that signature (i.e. only strictly newer ones are returned).
   */
  virtual std::vector<SignatureInfo> ListSignatures (
      const std::string& account, unsigned limit,
      const std::string& until) = 0;

  /**
   * Fetches a transaction by its signature.  Returns false if the
   * source does not know it.
   */
  virtual bool GetTransaction (const std::string& signature,
                               RawTransaction& tx) = 0;

};

} // namespace anchorx

#endif // ANCHORX_TXSOURCE_HPP
