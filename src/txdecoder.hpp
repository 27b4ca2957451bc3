// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ANCHORX_TXDECODER_HPP
#define ANCHORX_TXDECODER_HPP

#include <string>
#include <vector>

namespace anchorx
{

/**
 * The parts of a Solana wire transaction we are interested in.
 */
struct WireTransaction
{

  /** True if this is a versioned (v0) message, false for legacy.  */
  bool versioned = false;

  /** The transaction's signatures as raw bytes.  */
  std::vector<std::string> signatures;

  /**
   * The static account keys of the message, as raw bytes.  Keys loaded
   * from address lookup tables are not included.
   */
  std::vector<std::string> accountKeys;

};

/**
 * Decodes a raw transaction in the Solana wire format (legacy or v0
 * message).  Returns false if the data is malformed, uses an unsupported
 * message version or has trailing bytes.
 */
bool DecodeWireTransaction (const std::string& raw, WireTransaction& tx);

/**
 * Encodes a length in the "compact-u16" format used by the wire format.
 */
std::string EncodeCompactU16 (unsigned val);

} // namespace anchorx

#endif // ANCHORX_TXDECODER_HPP
