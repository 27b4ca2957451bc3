// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ANCHORX_TESTUTILS_HPP
#define ANCHORX_TESTUTILS_HPP

#include "events.hpp"
#include "txsource.hpp"

#include <json/json.h>

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace anchorx
{

/**
 * Parses a string as JSON, for use in testing when JSON values are needed.
 */
Json::Value ParseJson (const std::string& str);

/**
 * Sleeps for a short amount of time (but enough to trigger other threads).
 */
void SleepSome ();

/**
 * Returns a deterministic 32-byte key for testing, based on a number.
 */
std::string TestKey (unsigned n);

/**
 * Returns the base58 form of TestKey(n), e.g. for use as account.
 */
std::string TestAddress (unsigned n);

/**
 * Builds a minimal transaction in the wire format, with one signature
 * and the given static account keys (which must not be empty).
 */
std::string BuildTransaction (const std::vector<std::string>& keys,
                              bool versioned = false);

/**
 * Simple event kind used in tests.
 */
class TestEvent : public Event
{

public:

  static const char* const KIND;

  /** Discriminant used for registering it.  */
  static const char* const DISCRIMINANT;

  uint64_t value = 0;
  bool flag = false;

  TestEvent () = default;
  explicit TestEvent (uint64_t v, bool f = false);

  std::string GetKind () const override;
  Json::Value ToJson () const override;
  std::string Encode () const override;

  static std::unique_ptr<Event> Decode (BorshReader& in);

  /**
   * Registers the TestEvent kind with a registry.
   */
  static void Register (EventRegistry& registry);

  /**
   * Returns a log line (with "Program data: " marker) that carries
   * the given event.
   */
  static std::string LogLine (const EventRegistry& registry, const Event& ev);

};

/**
 * Transaction source with a scripted set of transactions and signature
 * lists per account.  It can also simulate failures.
 */
class TestTransactionSource : public TransactionSource
{

private:

  std::mutex mut;

  /** Signatures of each account, oldest first.  */
  std::map<std::string, std::vector<std::string>> signatures;

  /** Known transactions by signature.  */
  std::map<std::string, RawTransaction> transactions;

  /** Signatures for which GetTransaction should fail.  */
  std::set<std::string> failing;

  /** Signatures listed as failed on chain.  */
  std::set<std::string> failedOnChain;

  /** Time each ListSignatures call takes.  */
  std::chrono::milliseconds listDelay{0};

  /** If true, ListSignatures throws.  */
  bool listFails = false;

  /** Number of GetTransaction calls so far.  */
  unsigned numFetches = 0;

  /** The limits passed to ListSignatures calls.  */
  std::vector<unsigned> requestedLimits;

public:

  TestTransactionSource () = default;

  /**
   * Adds a new (newest) transaction for the given account, with the
   * given static keys and log lines.
   */
  void AddTransaction (const std::string& account, const std::string& sgn,
                       const std::vector<std::string>& keys,
                       const std::vector<std::string>& logs);

  /**
   * Adds a new transaction for the given account with raw wire data
   * given directly.
   */
  void AddRawTransaction (const std::string& account, const std::string& sgn,
                          const std::string& raw,
                          const std::vector<std::string>& logs);

  /**
   * Lists a signature for the account, without the transaction itself
   * being known (so that GetTransaction returns "not found").
   */
  void AddUnknownSignature (const std::string& account,
                            const std::string& sgn);

  /**
   * Makes GetTransaction fail (or no longer fail) for a signature.
   */
  void SetFailing (const std::string& sgn, bool fail);

  /**
   * Marks a signature as failed on chain in the listing.
   */
  void SetFailedOnChain (const std::string& sgn);

  /**
   * Makes each ListSignatures call sleep for the given time first.
   */
  void SetListDelay (std::chrono::milliseconds delay);

  /**
   * Makes ListSignatures fail or not.
   */
  void SetListFails (bool fail);

  unsigned GetNumFetches ();
  std::vector<unsigned> GetRequestedLimits ();

  std::vector<SignatureInfo> ListSignatures (
      const std::string& account, unsigned limit,
      const std::string& until) override;
  bool GetTransaction (const std::string& signature,
                       RawTransaction& tx) override;

};

} // namespace anchorx

#endif // ANCHORX_TESTUTILS_HPP
