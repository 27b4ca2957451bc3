// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ANCHORX_CONFIG_HPP
#define ANCHORX_CONFIG_HPP

#include <functional>
#include <string>
#include <vector>

namespace anchorx
{

/** Environment variable overriding the RPC URL.  */
extern const char* const ENV_RPC_URL;

/** Environment variable overriding the database connection string.  */
extern const char* const ENV_DB;

/**
 * The settings for running the indexer.
 */
struct IndexerConfig
{

  /** Function looking up an environment variable (like std::getenv).  */
  using EnvLookup = std::function<const char* (const char*)>;

  /** The accounts to index, base58 encoded.  */
  std::vector<std::string> accounts;

  /** The SQLite database file.  */
  std::string database;

  /** The Solana JSON-RPC endpoint.  */
  std::string rpcUrl;

  /** The program whose events are indexed (base58).  */
  std::string program;

  /** Seconds between the polls of each account.  */
  int pollSeconds = 0;

  /** Maximum number of signatures processed per poll.  */
  int pageSize = 0;

  /**
   * Overrides the RPC URL and database with the values from the
   * environment, if those are set and non-empty.
   */
  void ApplyEnvironment (const EnvLookup& getEnv);

  /**
   * Checks that the settings are valid, and throws InvalidConfiguration
   * if not.  The program address is returned as raw key.
   */
  void Validate (std::string& programKey) const;

};

/**
 * Removes leading and trailing whitespace (including line breaks).
 */
std::string TrimWhitespace (const std::string& str);

/**
 * Splits a comma-separated list of accounts.  Whitespace around the
 * entries is removed, and empty entries are ignored.
 */
std::vector<std::string> ParseAccountList (const std::string& str);

} // namespace anchorx

#endif // ANCHORX_CONFIG_HPP
