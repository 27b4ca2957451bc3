// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "txdecoder.hpp"

#include "base58.hpp"

#include <glog/logging.h>

#include <cstdint>

namespace anchorx
{

namespace
{

/** Length of the recent blockhash in a message.  */
constexpr size_t BLOCKHASH_BYTES = 32;

/** Bit in the first message byte that marks a versioned message.  */
constexpr uint8_t VERSION_PREFIX = 0x80;

/**
 * Helper class to read the wire format.  All methods return false
 * if there is not enough data left.
 */
class WireReader
{

private:

  const std::string& data;
  size_t pos = 0;

public:

  explicit WireReader (const std::string& d)
    : data(d)
  {}

  bool
  AtEnd () const
  {
    return pos == data.size ();
  }

  bool
  PeekU8 (uint8_t& res) const
  {
    if (pos >= data.size ())
      return false;
    res = static_cast<uint8_t> (data[pos]);
    return true;
  }

  bool
  ReadU8 (uint8_t& res)
  {
    if (!PeekU8 (res))
      return false;
    ++pos;
    return true;
  }

  bool
  ReadBytes (const size_t len, std::string& res)
  {
    if (data.size () - pos < len)
      return false;
    res = data.substr (pos, len);
    pos += len;
    return true;
  }

  bool
  Skip (const size_t len)
  {
    if (data.size () - pos < len)
      return false;
    pos += len;
    return true;
  }

  /**
   * Reads a compact-u16 value.  This is at most three bytes with seven
   * bits each, where the highest bit flags continuation.  Non-canonical
   * encodings are rejected.
   */
  bool
  ReadCompactU16 (unsigned& res)
  {
    res = 0;
    for (unsigned i = 0; i < 3; ++i)
      {
        uint8_t byte;
        if (!ReadU8 (byte))
          return false;

        if (i == 2 && byte > 0x03)
          return false;
        if (i > 0 && byte == 0)
          return false;

        res |= static_cast<unsigned> (byte & 0x7F) << (7 * i);
        if ((byte & 0x80) == 0)
          return true;
      }

    return false;
  }

  /**
   * Reads a compact-u16 length followed by that many bytes (skipping
   * them).
   */
  bool
  SkipCompactArray ()
  {
    unsigned len;
    return ReadCompactU16 (len) && Skip (len);
  }

};

} // anonymous namespace

bool
DecodeWireTransaction (const std::string& raw, WireTransaction& tx)
{
  WireReader in(raw);

  unsigned numSignatures;
  if (!in.ReadCompactU16 (numSignatures))
    return false;
  tx.signatures.clear ();
  for (unsigned i = 0; i < numSignatures; ++i)
    {
      std::string sgn;
      if (!in.ReadBytes (SIGNATURE_BYTES, sgn))
        return false;
      tx.signatures.push_back (std::move (sgn));
    }

  uint8_t first;
  if (!in.PeekU8 (first))
    return false;
  tx.versioned = (first & VERSION_PREFIX) != 0;
  if (tx.versioned)
    {
      const uint8_t version = first & ~VERSION_PREFIX;
      if (version != 0)
        {
          VLOG (1) << "Unsupported transaction version " << int (version);
          return false;
        }
      CHECK (in.Skip (1));
    }

  uint8_t numRequiredSignatures;
  if (!in.ReadU8 (numRequiredSignatures) || !in.Skip (2))
    return false;
  if (numRequiredSignatures != numSignatures)
    return false;

  unsigned numKeys;
  if (!in.ReadCompactU16 (numKeys))
    return false;
  if (numKeys < numRequiredSignatures)
    return false;
  tx.accountKeys.clear ();
  for (unsigned i = 0; i < numKeys; ++i)
    {
      std::string key;
      if (!in.ReadBytes (PUBKEY_BYTES, key))
        return false;
      tx.accountKeys.push_back (std::move (key));
    }

  if (!in.Skip (BLOCKHASH_BYTES))
    return false;

  unsigned numInstructions;
  if (!in.ReadCompactU16 (numInstructions))
    return false;
  for (unsigned i = 0; i < numInstructions; ++i)
    {
      uint8_t programIndex;
      if (!in.ReadU8 (programIndex))
        return false;
      if (!in.SkipCompactArray () || !in.SkipCompactArray ())
        return false;
    }

  if (tx.versioned)
    {
      unsigned numLookups;
      if (!in.ReadCompactU16 (numLookups))
        return false;
      for (unsigned i = 0; i < numLookups; ++i)
        if (!in.Skip (PUBKEY_BYTES)
              || !in.SkipCompactArray () || !in.SkipCompactArray ())
          return false;
    }

  return in.AtEnd ();
}

std::string
EncodeCompactU16 (unsigned val)
{
  CHECK_LE (val, 0xFFFF);

  std::string res;
  while (true)
    {
      const uint8_t byte = val & 0x7F;
      val >>= 7;
      if (val == 0)
        {
          res.push_back (static_cast<char> (byte));
          return res;
        }
      res.push_back (static_cast<char> (byte | 0x80));
    }
}

} // namespace anchorx
