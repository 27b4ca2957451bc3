// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "rpcsource.hpp"

#include "errors.hpp"
#include "testutils.hpp"
#include "txdecoder.hpp"

#include <gtest/gtest.h>

#include <chrono>

namespace anchorx
{
namespace
{

using SolanaRpcSourceTests = testing::Test;

TEST_F (SolanaRpcSourceTests, UnreachableNode)
{
  RpcEndpoint ep;
  ep.url = "http://127.0.0.1:1";
  ep.timeout = std::chrono::milliseconds (500);

  SolanaRpcSource source(ep);
  EXPECT_FALSE (source.Start ());

  RawTransaction tx;
  EXPECT_THROW (source.ListSignatures (TestAddress (1), 3, ""),
                SourceUnavailable);
  EXPECT_THROW (source.GetTransaction ("sgn", tx), SourceUnavailable);
}

TEST_F (SolanaRpcSourceTests, ExtractSignatures)
{
  const auto res = SolanaRpcSource::ExtractSignatures (ParseJson (R"([
    {
      "signature": "sgn2",
      "slot": 196000002,
      "err": null,
      "memo": null,
      "blockTime": 1685504150,
      "confirmationStatus": "finalized"
    },
    {
      "signature": "sgn1",
      "slot": 196000001,
      "err": {"InstructionError": [0, {"Custom": 6010}]},
      "memo": null,
      "blockTime": null,
      "confirmationStatus": "finalized"
    }
  ])"));

  ASSERT_EQ (res.size (), 2);
  EXPECT_EQ (res[0].signature, "sgn2");
  EXPECT_EQ (res[0].slot, 196000002);
  EXPECT_EQ (res[0].blockTime, 1685504150);
  EXPECT_FALSE (res[0].failed);
  EXPECT_EQ (res[1].signature, "sgn1");
  EXPECT_FALSE (res[1].blockTime);
  EXPECT_TRUE (res[1].failed);

  EXPECT_TRUE (SolanaRpcSource::ExtractSignatures (ParseJson ("[]")).empty ());
}

TEST_F (SolanaRpcSourceTests, MalformedSignatures)
{
  for (const std::string str : {
          "null",
          "{}",
          "[42]",
          R"([{"slot": 1}])",
          R"([{"signature": "sgn", "slot": -1}])",
          R"([{"signature": "sgn", "slot": 1, "blockTime": "x"}])",
        })
    EXPECT_THROW (SolanaRpcSource::ExtractSignatures (ParseJson (str)),
                  SourceUnavailable)
        << str;
}

TEST_F (SolanaRpcSourceTests, ExtractTransaction)
{
  RawTransaction tx;
  ASSERT_TRUE (SolanaRpcSource::ExtractTransaction ("sgn", ParseJson (R"({
    "slot": 196000001,
    "blockTime": 1685504150,
    "version": 0,
    "transaction": ["YWJjZA==", "base64"],
    "meta": {
      "err": null,
      "logMessages": [
        "Program dRiftyHA39MWEi3m9aunc5MzRF1JYuBsbn6VPcn33UH invoke [1]",
        "Program log: Instruction: FillPerpOrder"
      ]
    }
  })"), tx));

  EXPECT_EQ (tx.signature, "sgn");
  EXPECT_EQ (tx.slot, 196000001);
  EXPECT_EQ (tx.raw, "abcd");
  EXPECT_EQ (tx.logs, std::vector<std::string> ({
    "Program dRiftyHA39MWEi3m9aunc5MzRF1JYuBsbn6VPcn33UH invoke [1]",
    "Program log: Instruction: FillPerpOrder",
  }));
}

TEST_F (SolanaRpcSourceTests, TransactionWithoutLogs)
{
  RawTransaction tx;
  tx.logs = {"stale"};
  ASSERT_TRUE (SolanaRpcSource::ExtractTransaction ("sgn", ParseJson (R"({
    "slot": 1,
    "transaction": ["YWJj", "base64"],
    "meta": {"logMessages": null}
  })"), tx));
  EXPECT_TRUE (tx.logs.empty ());
}

TEST_F (SolanaRpcSourceTests, TransactionWithoutMeta)
{
  RawTransaction tx;
  tx.logs = {"stale"};
  ASSERT_TRUE (SolanaRpcSource::ExtractTransaction ("sgn", ParseJson (R"({
    "slot": 5,
    "transaction": ["YWJj", "base64"],
    "meta": null
  })"), tx));
  EXPECT_EQ (tx.slot, 5);
  EXPECT_EQ (tx.raw, "abc");
  EXPECT_TRUE (tx.logs.empty ());
}

TEST_F (SolanaRpcSourceTests, UndecodableBody)
{
  RawTransaction tx;
  ASSERT_TRUE (SolanaRpcSource::ExtractTransaction ("sgn", ParseJson (R"({
    "slot": 1,
    "transaction": ["!!", "base64"],
    "meta": {"logMessages": ["Program log: x"]}
  })"), tx));
  EXPECT_TRUE (tx.raw.empty ());
  EXPECT_EQ (tx.logs, std::vector<std::string> ({"Program log: x"}));

  WireTransaction wire;
  EXPECT_FALSE (DecodeWireTransaction (tx.raw, wire));
}

TEST_F (SolanaRpcSourceTests, TransactionNotFound)
{
  RawTransaction tx;
  EXPECT_FALSE (SolanaRpcSource::ExtractTransaction ("sgn", ParseJson ("null"),
                                                     tx));
}

TEST_F (SolanaRpcSourceTests, MalformedTransaction)
{
  for (const std::string str : {
          "[]",
          R"({"transaction": ["", "base64"], "meta": {}})",
          R"({"slot": 1, "transaction": "abc", "meta": {}})",
          R"({"slot": 1, "transaction": ["abc", "base58"], "meta": {}})",
          R"({"slot": 1, "transaction": ["", "base64"], "meta": 5})",
          R"({"slot": 1, "transaction": ["", "base64"],
              "meta": {"logMessages": [1]}})",
        })
    {
      RawTransaction tx;
      EXPECT_THROW (
          SolanaRpcSource::ExtractTransaction ("sgn", ParseJson (str), tx),
          SourceUnavailable)
          << str;
    }
}

} // anonymous namespace
} // namespace anchorx
