// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ANCHORX_RPCUTILS_HPP
#define ANCHORX_RPCUTILS_HPP

#include <jsonrpccpp/client.h>
#include <jsonrpccpp/client/connectors/httpclient.h>

#include <chrono>
#include <map>
#include <string>

namespace anchorx
{

/** Extra HTTP headers sent with each request (e.g. API keys).  */
using RpcHeaders = std::map<std::string, std::string>;

/**
 * Parses headers given as "key1=value1;key2=value2".  Whitespace around
 * keys and values is removed and empty entries are skipped.  Throws
 * InvalidConfiguration for entries without "=" or with an empty key.
 */
RpcHeaders ParseRpcHeaders (const std::string& str);

/**
 * Where and how to connect to a JSON-RPC server over HTTP.
 */
struct RpcEndpoint
{

  std::string url;
  std::chrono::milliseconds timeout{10'000};
  RpcHeaders headers;

};

/**
 * A JSON-RPC client (generated stub class T) connected to an endpoint.
 * Instances are cheap and used for a single request or a few, so that
 * no connection state is shared between threads.
 */
template <typename T>
  class RpcClient
{

private:

  jsonrpc::HttpClient http;
  T rpc;

public:

  explicit RpcClient (const RpcEndpoint& ep)
    : http(ep.url), rpc(http, jsonrpc::JSONRPC_CLIENT_V2)
  {
    http.SetTimeout (ep.timeout.count ());
    for (const auto& h : ep.headers)
      http.AddHeader (h.first, h.second);
  }

  RpcClient () = delete;
  RpcClient (const RpcClient&) = delete;
  void operator= (const RpcClient&) = delete;

  T&
  operator* ()
  {
    return rpc;
  }

  T*
  operator-> ()
  {
    return &rpc;
  }

};

} // namespace anchorx

#endif // ANCHORX_RPCUTILS_HPP
