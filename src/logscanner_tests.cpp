// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "logscanner.hpp"

#include "errors.hpp"
#include "testutils.hpp"

#include <xayautil/base64.hpp>

#include <gtest/gtest.h>

namespace anchorx
{
namespace
{

class LogScannerTests : public testing::Test
{

protected:

  EventRegistry registry;
  LogScanner scanner;

  LogScannerTests ()
    : scanner(registry)
  {
    TestEvent::Register (registry);
  }

  /**
   * Encodes the event with its discriminant and base64.
   */
  std::string
  Encoded (const Event& ev) const
  {
    return xaya::EncodeBase64 (registry.EncodeWithDiscriminant (ev));
  }

};

TEST_F (LogScannerTests, NoMarker)
{
  const TestEvent ev(42);
  for (const std::string line : {
          std::string (""),
          std::string ("Program dRiftyHA39MWEi3m9aunc5MzRF1JYuBsbn6VPcn33UH"
                       " consumed 1234 of 200000 compute units"),
          std::string ("Program return: abc"),
          Encoded (ev),
          " Program data: " + Encoded (ev),
        })
    EXPECT_EQ (scanner.Extract (line), nullptr) << line;
}

TEST_F (LogScannerTests, BothMarkers)
{
  const TestEvent ev(42, true);

  const auto fromLog = scanner.Extract ("Program log: " + Encoded (ev));
  ASSERT_NE (fromLog, nullptr);
  EXPECT_EQ (*fromLog, ev);

  const auto fromData = scanner.Extract ("Program data: " + Encoded (ev));
  ASSERT_NE (fromData, nullptr);
  EXPECT_EQ (*fromData, ev);
}

TEST_F (LogScannerTests, InvalidBase64)
{
  EXPECT_THROW (scanner.Extract ("Program log: Instruction: PlaceOrder"),
                LogParseError);
  EXPECT_THROW (scanner.Extract ("Program data: abc!"), LogParseError);
}

TEST_F (LogScannerTests, TooShortForDiscriminant)
{
  EXPECT_EQ (scanner.Extract ("Program data: "
                                + xaya::EncodeBase64 ("short")),
             nullptr);
}

TEST_F (LogScannerTests, UnknownDiscriminant)
{
  EXPECT_EQ (scanner.Extract ("Program data: "
                                + xaya::EncodeBase64 ("otherevtpayload")),
             nullptr);
}

TEST_F (LogScannerTests, DecodeErrorPropagates)
{
  const std::string data = registry.EncodeWithDiscriminant (TestEvent (5));
  EXPECT_THROW (
      scanner.Extract ("Program data: "
                          + xaya::EncodeBase64 (data.substr (0, 12))),
      DecodeError);
  EXPECT_THROW (
      scanner.Extract ("Program data: " + xaya::EncodeBase64 (data + "x")),
      DecodeError);
}

} // anonymous namespace
} // namespace anchorx
