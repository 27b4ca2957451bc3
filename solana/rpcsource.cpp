// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "rpcsource.hpp"

#include "errors.hpp"

#include "rpc-stubs/solanarpcclient.h"

#include <xayautil/base64.hpp>

#include <jsonrpccpp/client.h>

#include <gflags/gflags.h>
#include <glog/logging.h>

#include <chrono>

namespace anchorx
{

DEFINE_int32 (rpc_timeout_ms, 10'000,
              "timeout for Solana JSON-RPC requests");
DEFINE_string (rpc_headers, "",
               "extra headers to send with Solana JSON-RPC requests,"
               " as key1=value1;key2=value2");

class SolanaRpcSource::SolanaRpc : public RpcClient<SolanaRpcClient>
{

public:

  explicit SolanaRpc (const SolanaRpcSource& parent)
    : RpcClient(parent.endpoint)
  {}

};

namespace
{

/**
 * Throws SourceUnavailable for a malformed response.
 */
void
Malformed (const std::string& method, const std::string& what,
           const Json::Value& val)
{
  throw SourceUnavailable ("malformed " + method + " response (" + what
                            + "): " + val.toStyledString ());
}

/**
 * Builds the endpoint for a URL with the settings from the flags.
 */
RpcEndpoint
EndpointFromFlags (const std::string& url)
{
  if (FLAGS_rpc_timeout_ms <= 0)
    throw InvalidConfiguration ("--rpc_timeout_ms must be positive");

  RpcEndpoint res;
  res.url = url;
  res.timeout = std::chrono::milliseconds (FLAGS_rpc_timeout_ms);
  res.headers = ParseRpcHeaders (FLAGS_rpc_headers);

  return res;
}

} // anonymous namespace

SolanaRpcSource::SolanaRpcSource (const std::string& url)
  : endpoint(EndpointFromFlags (url))
{}

SolanaRpcSource::SolanaRpcSource (const RpcEndpoint& ep)
  : endpoint(ep)
{}

bool
SolanaRpcSource::Start ()
{
  Json::Value version;
  try
    {
      SolanaRpc rpc(*this);
      version = rpc->getVersion ();
    }
  catch (const jsonrpc::JsonRpcException& exc)
    {
      LOG (WARNING)
          << "Solana RPC at " << endpoint.url << " is not reachable yet: "
          << exc.what ();
      return false;
    }

  LOG (INFO)
      << "Connected to Solana RPC at " << endpoint.url
      << ", node version " << version["solana-core"].asString ();
  return true;
}

std::vector<SignatureInfo>
SolanaRpcSource::ListSignatures (const std::string& account,
                                 const unsigned limit,
                                 const std::string& until)
{
  Json::Value config(Json::objectValue);
  config["limit"] = limit;
  if (!until.empty ())
    config["until"] = until;

  Json::Value result;
  try
    {
      SolanaRpc rpc(*this);
      result = rpc->getSignaturesForAddress (account, config);
    }
  catch (const jsonrpc::JsonRpcException& exc)
    {
      throw SourceUnavailable ("getSignaturesForAddress failed: "
                                + std::string (exc.what ()));
    }

  VLOG (1)
      << "getSignaturesForAddress for " << account
      << " returned " << result.size () << " entries";
  return ExtractSignatures (result);
}

bool
SolanaRpcSource::GetTransaction (const std::string& signature,
                                 RawTransaction& tx)
{
  Json::Value config(Json::objectValue);
  config["encoding"] = "base64";
  config["maxSupportedTransactionVersion"] = 0;

  Json::Value params(Json::arrayValue);
  params.append (signature);
  params.append (config);

  Json::Value result;
  try
    {
      /* The generated stub rejects a null result, which is what we get
         for unknown transactions.  Thus call the method directly.  */
      SolanaRpc rpc(*this);
      result = rpc->CallMethod ("getTransaction", params);
    }
  catch (const jsonrpc::JsonRpcException& exc)
    {
      throw SourceUnavailable ("getTransaction failed for " + signature
                                + ": " + exc.what ());
    }

  return ExtractTransaction (signature, result, tx);
}

std::vector<SignatureInfo>
SolanaRpcSource::ExtractSignatures (const Json::Value& result)
{
  const std::string method = "getSignaturesForAddress";
  if (!result.isArray ())
    Malformed (method, "not an array", result);

  std::vector<SignatureInfo> res;
  for (const auto& entry : result)
    {
      if (!entry.isObject ())
        Malformed (method, "entry is not an object", entry);

      const auto& sgn = entry["signature"];
      if (!sgn.isString ())
        Malformed (method, "invalid signature", entry);
      const auto& slot = entry["slot"];
      if (!slot.isUInt64 ())
        Malformed (method, "invalid slot", entry);

      SignatureInfo info;
      info.signature = sgn.asString ();
      info.slot = slot.asUInt64 ();

      const auto& blockTime = entry["blockTime"];
      if (blockTime.isInt64 ())
        info.blockTime = blockTime.asInt64 ();
      else if (!blockTime.isNull ())
        Malformed (method, "invalid blockTime", entry);

      info.failed = !entry["err"].isNull ();

      res.push_back (std::move (info));
    }

  return res;
}

bool
SolanaRpcSource::ExtractTransaction (const std::string& signature,
                                     const Json::Value& result,
                                     RawTransaction& tx)
{
  const std::string method = "getTransaction";

  if (result.isNull ())
    {
      VLOG (1) << "Transaction " << signature << " is not known";
      return false;
    }
  if (!result.isObject ())
    Malformed (method, "not an object", result);

  const auto& slot = result["slot"];
  if (!slot.isUInt64 ())
    Malformed (method, "invalid slot", result);

  /* With base64 encoding, the transaction is [data, "base64"].  */
  const auto& encoded = result["transaction"];
  if (!encoded.isArray () || encoded.size () != 2
        || !encoded[0].isString () || !encoded[1].isString ()
        || encoded[1].asString () != "base64")
    Malformed (method, "invalid transaction data", result);

  /* Without meta there are no logs to scan.  */
  const auto& meta = result["meta"];
  if (!meta.isNull () && !meta.isObject ())
    Malformed (method, "invalid meta", result);
  const auto& logs = meta["logMessages"];
  if (!logs.isNull () && !logs.isArray ())
    Malformed (method, "invalid logMessages", result);

  tx.signature = signature;
  tx.slot = slot.asUInt64 ();
  tx.logs.clear ();
  for (const auto& line : logs)
    {
      if (!line.isString ())
        Malformed (method, "log line is not a string", result);
      tx.logs.push_back (line.asString ());
    }

  /* An undecodable body is passed on empty, which the processor then
     ignores as unsupported encoding.  */
  if (!xaya::DecodeBase64 (encoded[0].asString (), tx.raw))
    {
      LOG (WARNING)
          << "Transaction " << signature << " has an invalid base64 body";
      tx.raw.clear ();
    }

  return true;
}

} // namespace anchorx
