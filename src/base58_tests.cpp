// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "base58.hpp"

#include <gtest/gtest.h>

namespace anchorx
{
namespace
{

using Base58Tests = testing::Test;

TEST_F (Base58Tests, KnownValues)
{
  EXPECT_EQ (EncodeBase58 (""), "");
  EXPECT_EQ (EncodeBase58 (std::string ("\0\0\x01", 3)), "112");
  EXPECT_EQ (EncodeBase58 ("hello world"), "StV1DL6CwTryKyV");
  EXPECT_EQ (EncodeBase58 (std::string (32, '\0')),
             "11111111111111111111111111111111");

  std::string data;
  ASSERT_TRUE (DecodeBase58 ("StV1DL6CwTryKyV", data));
  EXPECT_EQ (data, "hello world");
  ASSERT_TRUE (DecodeBase58 ("112", data));
  EXPECT_EQ (data, std::string ("\0\0\x01", 3));
}

TEST_F (Base58Tests, InvalidCharacters)
{
  std::string data;
  for (const std::string str : {"0abc", "abcO", "Il", "ab c", "ab+"})
    EXPECT_FALSE (DecodeBase58 (str, data)) << str;
}

TEST_F (Base58Tests, Pubkey)
{
  std::string key;
  ASSERT_TRUE (DecodePubkey ("dRiftyHA39MWEi3m9aunc5MzRF1JYuBsbn6VPcn33UH",
                             key));
  EXPECT_EQ (key.size (), PUBKEY_BYTES);
  EXPECT_EQ (EncodeBase58 (key), "dRiftyHA39MWEi3m9aunc5MzRF1JYuBsbn6VPcn33UH");

  EXPECT_FALSE (DecodePubkey ("StV1DL6CwTryKyV", key));
  EXPECT_FALSE (DecodePubkey ("", key));
  EXPECT_FALSE (DecodePubkey ("not-a-key", key));
}

} // anonymous namespace
} // namespace anchorx
