// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "testutils.hpp"

#include "base58.hpp"
#include "errors.hpp"
#include "logscanner.hpp"
#include "private/jsonutils.hpp"
#include "txdecoder.hpp"

#include <xayautil/base64.hpp>

#include <glog/logging.h>

#include <chrono>
#include <sstream>
#include <thread>

namespace anchorx
{

Json::Value
ParseJson (const std::string& str)
{
  std::istringstream in(str);
  Json::Value res;
  in >> res;
  return res;
}

void
SleepSome ()
{
  std::this_thread::sleep_for (std::chrono::milliseconds (10));
}

std::string
TestKey (const unsigned n)
{
  std::string res(PUBKEY_BYTES, '\x42');
  for (unsigned i = 0; i < 4; ++i)
    res[PUBKEY_BYTES - 1 - i] = static_cast<char> ((n >> (8 * i)) & 0xFF);
  return res;
}

std::string
TestAddress (const unsigned n)
{
  return EncodeBase58 (TestKey (n));
}

std::string
BuildTransaction (const std::vector<std::string>& keys, const bool versioned)
{
  CHECK (!keys.empty ());

  std::string res = EncodeCompactU16 (1);
  res += std::string (SIGNATURE_BYTES, '\x01');

  if (versioned)
    res.push_back ('\x80');
  res += std::string ("\x01\x00\x00", 3);

  res += EncodeCompactU16 (keys.size ());
  for (const auto& k : keys)
    {
      CHECK_EQ (k.size (), PUBKEY_BYTES);
      res += k;
    }

  /* Blockhash and no instructions.  */
  res += std::string (32, '\x02');
  res += EncodeCompactU16 (0);

  if (versioned)
    res += EncodeCompactU16 (0);

  return res;
}

/* ************************************************************************** */

const char* const TestEvent::KIND = "TestEvent";
const char* const TestEvent::DISCRIMINANT = "testevnt";

TestEvent::TestEvent (const uint64_t v, const bool f)
  : value(v), flag(f)
{}

std::string
TestEvent::GetKind () const
{
  return KIND;
}

Json::Value
TestEvent::ToJson () const
{
  Json::Value res(Json::objectValue);
  res["value"] = UintToJson (value);
  res["flag"] = flag;
  return res;
}

std::string
TestEvent::Encode () const
{
  BorshWriter out;
  out.WriteU64 (value);
  out.WriteBool (flag);
  return out.GetData ();
}

std::unique_ptr<Event>
TestEvent::Decode (BorshReader& in)
{
  auto res = std::make_unique<TestEvent> ();
  res->value = in.ReadU64 ();
  res->flag = in.ReadBool ();
  return res;
}

void
TestEvent::Register (EventRegistry& registry)
{
  registry.Register (DISCRIMINANT, KIND, &TestEvent::Decode);
}

std::string
TestEvent::LogLine (const EventRegistry& registry, const Event& ev)
{
  return LogScanner::MARKER_DATA
            + xaya::EncodeBase64 (registry.EncodeWithDiscriminant (ev));
}

/* ************************************************************************** */

void
TestTransactionSource::AddTransaction (const std::string& account,
                                       const std::string& sgn,
                                       const std::vector<std::string>& keys,
                                       const std::vector<std::string>& logs)
{
  AddRawTransaction (account, sgn, BuildTransaction (keys), logs);
}

void
TestTransactionSource::AddRawTransaction (const std::string& account,
                                          const std::string& sgn,
                                          const std::string& raw,
                                          const std::vector<std::string>& logs)
{
  std::lock_guard<std::mutex> lock(mut);

  auto& list = signatures[account];
  list.push_back (sgn);

  RawTransaction tx;
  tx.signature = sgn;
  tx.slot = 1000 + list.size ();
  tx.raw = raw;
  tx.logs = logs;
  transactions[sgn] = tx;
}

void
TestTransactionSource::AddUnknownSignature (const std::string& account,
                                            const std::string& sgn)
{
  std::lock_guard<std::mutex> lock(mut);
  signatures[account].push_back (sgn);
}

void
TestTransactionSource::SetFailing (const std::string& sgn, const bool fail)
{
  std::lock_guard<std::mutex> lock(mut);
  if (fail)
    failing.insert (sgn);
  else
    failing.erase (sgn);
}

void
TestTransactionSource::SetFailedOnChain (const std::string& sgn)
{
  std::lock_guard<std::mutex> lock(mut);
  failedOnChain.insert (sgn);
}

void
TestTransactionSource::SetListDelay (const std::chrono::milliseconds delay)
{
  std::lock_guard<std::mutex> lock(mut);
  listDelay = delay;
}

void
TestTransactionSource::SetListFails (const bool fail)
{
  std::lock_guard<std::mutex> lock(mut);
  listFails = fail;
}

unsigned
TestTransactionSource::GetNumFetches ()
{
  std::lock_guard<std::mutex> lock(mut);
  return numFetches;
}

std::vector<unsigned>
TestTransactionSource::GetRequestedLimits ()
{
  std::lock_guard<std::mutex> lock(mut);
  return requestedLimits;
}

std::vector<SignatureInfo>
TestTransactionSource::ListSignatures (const std::string& account,
                                       const unsigned limit,
                                       const std::string& until)
{
  std::chrono::milliseconds delay;
  {
    std::lock_guard<std::mutex> lock(mut);
    delay = listDelay;
  }
  std::this_thread::sleep_for (delay);

  std::lock_guard<std::mutex> lock(mut);

  requestedLimits.push_back (limit);
  if (listFails)
    throw SourceUnavailable ("listing signatures failed");

  std::vector<SignatureInfo> res;

  const auto mit = signatures.find (account);
  if (mit == signatures.end ())
    return res;

  const auto& list = mit->second;
  for (auto it = list.rbegin (); it != list.rend (); ++it)
    {
      if (*it == until || res.size () >= limit)
        break;

      SignatureInfo info;
      info.signature = *it;
      info.slot = 1000 + (list.rend () - it);
      info.failed = (failedOnChain.count (*it) > 0);
      res.push_back (std::move (info));
    }

  return res;
}

bool
TestTransactionSource::GetTransaction (const std::string& signature,
                                       RawTransaction& tx)
{
  std::lock_guard<std::mutex> lock(mut);

  ++numFetches;
  if (failing.count (signature) > 0)
    throw SourceUnavailable ("fetching " + signature + " failed");

  const auto mit = transactions.find (signature);
  if (mit == transactions.end ())
    return false;

  tx = mit->second;
  return true;
}

} // namespace anchorx
