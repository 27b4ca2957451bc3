// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "rpcutils.hpp"

#include "errors.hpp"

#include <gtest/gtest.h>

namespace anchorx
{
namespace
{

using ParseRpcHeadersTests = testing::Test;

TEST_F (ParseRpcHeadersTests, Empty)
{
  EXPECT_EQ (ParseRpcHeaders (""), RpcHeaders ());
  EXPECT_EQ (ParseRpcHeaders (" ; ;"), RpcHeaders ());
}

TEST_F (ParseRpcHeadersTests, Entries)
{
  EXPECT_EQ (ParseRpcHeaders ("x-api-key=secret"),
             RpcHeaders ({{"x-api-key", "secret"}}));
  EXPECT_EQ (ParseRpcHeaders ("a=1; b = two words ;c=;"),
             RpcHeaders ({{"a", "1"}, {"b", "two words"}, {"c", ""}}));
  EXPECT_EQ (ParseRpcHeaders ("\tx=1\r\n;y=2"),
             RpcHeaders ({{"x", "1"}, {"y", "2"}}));
  EXPECT_EQ (ParseRpcHeaders ("Authorization=Bearer a=b"),
             RpcHeaders ({{"Authorization", "Bearer a=b"}}));
}

TEST_F (ParseRpcHeadersTests, Invalid)
{
  EXPECT_THROW (ParseRpcHeaders ("a=1;foo"), InvalidConfiguration);
  EXPECT_THROW (ParseRpcHeaders ("=abc"), InvalidConfiguration);
  EXPECT_THROW (ParseRpcHeaders ("a=1;a=2"), InvalidConfiguration);
}

} // anonymous namespace
} // namespace anchorx
