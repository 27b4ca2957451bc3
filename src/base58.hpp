// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ANCHORX_BASE58_HPP
#define ANCHORX_BASE58_HPP

#include <cstddef>
#include <string>

namespace anchorx
{

/** Length in bytes of a public key (account or program address).  */
constexpr size_t PUBKEY_BYTES = 32;

/** Length in bytes of a transaction signature.  */
constexpr size_t SIGNATURE_BYTES = 64;

/**
 * Encodes a binary string in base58 with the Bitcoin alphabet, as it is
 * used for Solana public keys and signatures.
 */
std::string EncodeBase58 (const std::string& data);

/**
 * Decodes a base58 string into binary.  Returns false if the string contains
 * characters outside of the alphabet.
 */
bool DecodeBase58 (const std::string& str, std::string& data);

/**
 * Decodes a base58 public key and verifies that it has exactly
 * PUBKEY_BYTES bytes.
 */
bool DecodePubkey (const std::string& str, std::string& key);

} // namespace anchorx

#endif // ANCHORX_BASE58_HPP
