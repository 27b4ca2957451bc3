// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "processor.hpp"

#include "base58.hpp"
#include "errors.hpp"
#include "txdecoder.hpp"

#include <glog/logging.h>

#include <algorithm>

namespace anchorx
{

TransactionProcessor::TransactionProcessor (TransactionSource& src,
                                            const LogScanner& s,
                                            const std::string& programKey)
  : source(src), scanner(s), program(programKey)
{
  CHECK_EQ (program.size (), PUBKEY_BYTES) << "Invalid program address";
}

ProcessedTx
TransactionProcessor::Process (const std::string& account,
                               const std::string& signature) const
{
  ProcessedTx res;
  res.signature = signature;

  RawTransaction raw;
  if (!source.GetTransaction (signature, raw))
    throw SourceUnavailable ("transaction " + signature + " not found");

  WireTransaction tx;
  if (!DecodeWireTransaction (raw.raw, tx))
    {
      LOG (WARNING)
          << "Transaction " << signature << " for account " << account
          << " has an unsupported encoding, ignoring it";
      return res;
    }

  const auto& keys = tx.accountKeys;
  if (std::find (keys.begin (), keys.end (), program) == keys.end ())
    {
      VLOG (1) << "Transaction " << signature << " does not involve program "
               << EncodeBase58 (program);
      return res;
    }

  for (const auto& line : raw.logs)
    try
      {
        auto ev = scanner.Extract (line);
        if (ev != nullptr)
          res.events.push_back (std::move (ev));
      }
    catch (const LogParseError& exc)
      {
        /* Plain-text msg! output also starts with the log marker.  */
        VLOG (1) << "Skipping log line of " << signature << ": " << exc.what ();
      }
    catch (const DecodeError& exc)
      {
        LOG (WARNING)
            << "Skipping log line of " << signature << ": " << exc.what ();
      }

  VLOG (1)
      << "Extracted " << res.events.size () << " events from " << signature;

  return res;
}

} // namespace anchorx
