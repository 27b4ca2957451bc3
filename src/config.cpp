// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "config.hpp"

#include "base58.hpp"
#include "errors.hpp"

#include <glog/logging.h>

#include <sstream>

namespace anchorx
{

const char* const ENV_RPC_URL = "INDEXER_SOLANA_RPC_URL";
const char* const ENV_DB = "INDEXER_DB_CONN_STR";

namespace
{

/**
 * Maximum page size supported by getSignaturesForAddress.
 */
constexpr int MAX_PAGE_SIZE = 1'000;

/**
 * Sets the target to the environment variable's value if it is set.
 */
void
Override (const IndexerConfig::EnvLookup& getEnv, const char* name,
          std::string& target)
{
  const char* val = getEnv (name);
  if (val == nullptr || *val == '\0')
    return;

  LOG (INFO) << "Using " << name << " from the environment";
  target = val;
}

} // anonymous namespace

void
IndexerConfig::ApplyEnvironment (const EnvLookup& getEnv)
{
  Override (getEnv, ENV_RPC_URL, rpcUrl);
  Override (getEnv, ENV_DB, database);
}

void
IndexerConfig::Validate (std::string& programKey) const
{
  if (accounts.empty ())
    throw InvalidConfiguration ("no accounts to index are set");

  std::string key;
  for (const auto& a : accounts)
    if (!DecodePubkey (a, key))
      throw InvalidConfiguration ("invalid account address: " + a);

  if (!DecodePubkey (program, programKey))
    throw InvalidConfiguration ("invalid program address: " + program);

  if (database.empty ())
    throw InvalidConfiguration ("no database is set");
  if (rpcUrl.empty ())
    throw InvalidConfiguration ("no RPC URL is set");

  if (pollSeconds <= 0)
    throw InvalidConfiguration ("the poll interval must be positive");
  if (pageSize <= 0 || pageSize > MAX_PAGE_SIZE)
    {
      std::ostringstream msg;
      msg << "the page size must be between 1 and " << MAX_PAGE_SIZE;
      throw InvalidConfiguration (msg.str ());
    }
}

std::string
TrimWhitespace (const std::string& str)
{
  const char* ws = " \t\r\n";
  const auto start = str.find_first_not_of (ws);
  if (start == std::string::npos)
    return "";
  const auto end = str.find_last_not_of (ws);
  return str.substr (start, end - start + 1);
}

std::vector<std::string>
ParseAccountList (const std::string& str)
{
  std::vector<std::string> res;

  std::istringstream in(str);
  std::string entry;
  while (std::getline (in, entry, ','))
    {
      entry = TrimWhitespace (entry);
      if (!entry.empty ())
        res.push_back (entry);
    }

  return res;
}

} // namespace anchorx
