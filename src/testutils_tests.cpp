// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "testutils.hpp"

#include "errors.hpp"
#include "txdecoder.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace anchorx
{
namespace
{

using testing::ElementsAre;

/**
 * Returns just the signatures from a listing.
 */
std::vector<std::string>
Signatures (const std::vector<SignatureInfo>& infos)
{
  std::vector<std::string> res;
  for (const auto& i : infos)
    res.push_back (i.signature);
  return res;
}

class TestTransactionSourceTests : public testing::Test
{

protected:

  TestTransactionSource source;

  TestTransactionSourceTests ()
  {
    for (const std::string sgn : {"a", "b", "c", "d"})
      source.AddTransaction ("acc", sgn, {TestKey (1)}, {"log " + sgn});
    source.AddTransaction ("other", "x", {TestKey (2)}, {});
  }

};

TEST_F (TestTransactionSourceTests, Listing)
{
  EXPECT_THAT (Signatures (source.ListSignatures ("acc", 10, "")),
               ElementsAre ("d", "c", "b", "a"));
  EXPECT_THAT (Signatures (source.ListSignatures ("acc", 2, "")),
               ElementsAre ("d", "c"));
  EXPECT_THAT (Signatures (source.ListSignatures ("acc", 10, "b")),
               ElementsAre ("d", "c"));
  EXPECT_THAT (Signatures (source.ListSignatures ("acc", 10, "d")),
               ElementsAre ());
  EXPECT_THAT (Signatures (source.ListSignatures ("unknown", 10, "")),
               ElementsAre ());
  EXPECT_THAT (source.GetRequestedLimits (), ElementsAre (10, 2, 10, 10, 10));
}

TEST_F (TestTransactionSourceTests, FailedOnChain)
{
  source.SetFailedOnChain ("c");

  const auto infos = source.ListSignatures ("acc", 10, "");
  ASSERT_EQ (infos.size (), 4);
  EXPECT_FALSE (infos[0].failed);
  EXPECT_TRUE (infos[1].failed);
  EXPECT_FALSE (infos[2].failed);
}

TEST_F (TestTransactionSourceTests, Fetching)
{
  RawTransaction tx;
  ASSERT_TRUE (source.GetTransaction ("c", tx));
  EXPECT_EQ (tx.signature, "c");
  EXPECT_THAT (tx.logs, ElementsAre ("log c"));

  WireTransaction wire;
  ASSERT_TRUE (DecodeWireTransaction (tx.raw, wire));
  EXPECT_THAT (wire.accountKeys, ElementsAre (TestKey (1)));

  EXPECT_FALSE (source.GetTransaction ("unknown", tx));
  EXPECT_EQ (source.GetNumFetches (), 2);
}

TEST_F (TestTransactionSourceTests, Failures)
{
  source.SetFailing ("b", true);
  RawTransaction tx;
  EXPECT_THROW (source.GetTransaction ("b", tx), SourceUnavailable);
  EXPECT_TRUE (source.GetTransaction ("a", tx));

  source.SetListFails (true);
  EXPECT_THROW (source.ListSignatures ("acc", 1, ""), SourceUnavailable);
}

TEST_F (TestTransactionSourceTests, Keys)
{
  EXPECT_EQ (TestKey (5).size (), 32);
  EXPECT_NE (TestKey (5), TestKey (6));
  EXPECT_EQ (TestKey (7), TestKey (7));
}

} // anonymous namespace
} // namespace anchorx
