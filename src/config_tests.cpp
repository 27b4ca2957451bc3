// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "config.hpp"

#include "base58.hpp"
#include "errors.hpp"
#include "testutils.hpp"

#include <gtest/gtest.h>

#include <map>

namespace anchorx
{
namespace
{

class IndexerConfigTests : public testing::Test
{

protected:

  IndexerConfig config;

  /** Fake environment for ApplyEnvironment.  */
  std::map<std::string, std::string> env;

  IndexerConfigTests ()
  {
    config.accounts = {TestAddress (1), TestAddress (2)};
    config.database = "test.sqlite";
    config.rpcUrl = "http://localhost:8899";
    config.program = "dRiftyHA39MWEi3m9aunc5MzRF1JYuBsbn6VPcn33UH";
    config.pollSeconds = 3;
    config.pageSize = 3;
  }

  void
  ApplyEnvironment ()
  {
    config.ApplyEnvironment ([this] (const char* name) -> const char*
      {
        const auto mit = env.find (name);
        if (mit == env.end ())
          return nullptr;
        return mit->second.c_str ();
      });
  }

};

TEST_F (IndexerConfigTests, Valid)
{
  std::string key;
  config.Validate (key);
  EXPECT_EQ (EncodeBase58 (key), config.program);
}

TEST_F (IndexerConfigTests, Environment)
{
  ApplyEnvironment ();
  EXPECT_EQ (config.rpcUrl, "http://localhost:8899");
  EXPECT_EQ (config.database, "test.sqlite");

  env["INDEXER_SOLANA_RPC_URL"] = "https://rpc.example.com";
  env["INDEXER_DB_CONN_STR"] = "";
  ApplyEnvironment ();
  EXPECT_EQ (config.rpcUrl, "https://rpc.example.com");
  EXPECT_EQ (config.database, "test.sqlite");

  env["INDEXER_DB_CONN_STR"] = "/var/lib/indexer.sqlite";
  ApplyEnvironment ();
  EXPECT_EQ (config.database, "/var/lib/indexer.sqlite");
}

TEST_F (IndexerConfigTests, InvalidSettings)
{
  std::string key;

  {
    IndexerConfig c = config;
    c.accounts.clear ();
    EXPECT_THROW (c.Validate (key), InvalidConfiguration);
  }
  {
    IndexerConfig c = config;
    c.accounts.push_back ("not a key");
    EXPECT_THROW (c.Validate (key), InvalidConfiguration);
  }
  {
    IndexerConfig c = config;
    c.program = "StV1DL6CwTryKyV";
    EXPECT_THROW (c.Validate (key), InvalidConfiguration);
  }
  {
    IndexerConfig c = config;
    c.database = "";
    EXPECT_THROW (c.Validate (key), InvalidConfiguration);
  }
  {
    IndexerConfig c = config;
    c.rpcUrl = "";
    EXPECT_THROW (c.Validate (key), InvalidConfiguration);
  }
  {
    IndexerConfig c = config;
    c.pollSeconds = 0;
    EXPECT_THROW (c.Validate (key), InvalidConfiguration);
  }
  {
    IndexerConfig c = config;
    c.pageSize = 0;
    EXPECT_THROW (c.Validate (key), InvalidConfiguration);
    c.pageSize = 1'001;
    EXPECT_THROW (c.Validate (key), InvalidConfiguration);
  }
}

TEST_F (IndexerConfigTests, TrimWhitespace)
{
  EXPECT_EQ (TrimWhitespace (""), "");
  EXPECT_EQ (TrimWhitespace (" \t\r\n"), "");
  EXPECT_EQ (TrimWhitespace ("\tabc def \n"), "abc def");
  EXPECT_EQ (TrimWhitespace ("x"), "x");
}

TEST_F (IndexerConfigTests, AccountList)
{
  EXPECT_EQ (ParseAccountList (""), std::vector<std::string> ());
  EXPECT_EQ (ParseAccountList ("abc"), std::vector<std::string> ({"abc"}));
  EXPECT_EQ (ParseAccountList (" abc , def,,ghi "),
             std::vector<std::string> ({"abc", "def", "ghi"}));
}

} // anonymous namespace
} // namespace anchorx
