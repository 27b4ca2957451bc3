// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "rpcutils.hpp"

#include "config.hpp"
#include "errors.hpp"

#include <glog/logging.h>

#include <sstream>

namespace anchorx
{

RpcHeaders
ParseRpcHeaders (const std::string& str)
{
  RpcHeaders res;

  std::istringstream in(str);
  std::string entry;
  while (std::getline (in, entry, ';'))
    {
      entry = TrimWhitespace (entry);
      if (entry.empty ())
        continue;

      const auto eq = entry.find ('=');
      if (eq == std::string::npos)
        throw InvalidConfiguration ("invalid RPC header: " + entry);

      const std::string key = TrimWhitespace (entry.substr (0, eq));
      if (key.empty ())
        throw InvalidConfiguration ("empty RPC header name: " + entry);

      if (!res.emplace (key, TrimWhitespace (entry.substr (eq + 1))).second)
        throw InvalidConfiguration ("duplicate RPC header: " + key);
      VLOG (1) << "Using extra RPC header " << key;
    }

  return res;
}

} // namespace anchorx
