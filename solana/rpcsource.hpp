// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ANCHORX_SOLANA_RPCSOURCE_HPP
#define ANCHORX_SOLANA_RPCSOURCE_HPP

#include "rpcutils.hpp"
#include "txsource.hpp"

#include <json/json.h>

#include <string>
#include <vector>

namespace anchorx
{

/**
 * Transaction source that talks to a Solana node through its JSON-RPC
 * interface.  A fresh HTTP connection is used for each request.
 */
class SolanaRpcSource : public TransactionSource
{

private:

  class SolanaRpc;

  /** The RPC endpoint.  */
  const RpcEndpoint endpoint;

public:

  /**
   * Constructs the source for the given endpoint.  The timeout and extra
   * headers are taken from --rpc_timeout_ms and --rpc_headers.  Throws
   * InvalidConfiguration if those are invalid.
   */
  explicit SolanaRpcSource (const std::string& url);

  /**
   * Constructs the source for a fully specified endpoint.
   */
  explicit SolanaRpcSource (const RpcEndpoint& ep);

  /**
   * Queries the node's version and logs it.  Returns false (after
   * logging a warning) if the node cannot be reached right now; the
   * source is still usable and later requests retry.
   */
  bool Start ();

  std::vector<SignatureInfo> ListSignatures (
      const std::string& account, unsigned limit,
      const std::string& until) override;
  bool GetTransaction (const std::string& signature,
                       RawTransaction& tx) override;

  /**
   * Parses the result of getSignaturesForAddress.  Throws
   * SourceUnavailable if it is malformed.
   */
  static std::vector<SignatureInfo> ExtractSignatures (
      const Json::Value& result);

  /**
   * Parses the result of getTransaction (with base64 encoding).  Returns
   * false if it is null (transaction not found), and throws
   * SourceUnavailable if it is malformed.
   */
  static bool ExtractTransaction (const std::string& signature,
                                  const Json::Value& result,
                                  RawTransaction& tx);

};

} // namespace anchorx

#endif // ANCHORX_SOLANA_RPCSOURCE_HPP
