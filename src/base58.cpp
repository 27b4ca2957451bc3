// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "base58.hpp"

#include <glog/logging.h>

#include <cstdint>
#include <vector>

namespace anchorx
{

namespace
{

const std::string ALPHABET
    = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

/**
 * Returns the value of a base58 digit, or -1 if the character is not
 * part of the alphabet.
 */
int
DigitValue (const char c)
{
  const auto pos = ALPHABET.find (c);
  if (pos == std::string::npos)
    return -1;
  return static_cast<int> (pos);
}

} // anonymous namespace

std::string
EncodeBase58 (const std::string& data)
{
  size_t zeros = 0;
  while (zeros < data.size () && data[zeros] == '\0')
    ++zeros;

  /* Digits in base 58, least significant first.  */
  std::vector<uint8_t> digits;
  for (size_t i = zeros; i < data.size (); ++i)
    {
      unsigned carry = static_cast<uint8_t> (data[i]);
      for (auto& d : digits)
        {
          carry += static_cast<unsigned> (d) << 8;
          d = carry % 58;
          carry /= 58;
        }
      while (carry > 0)
        {
          digits.push_back (carry % 58);
          carry /= 58;
        }
    }

  std::string res(zeros, ALPHABET[0]);
  for (auto it = digits.rbegin (); it != digits.rend (); ++it)
    res.push_back (ALPHABET[*it]);

  return res;
}

bool
DecodeBase58 (const std::string& str, std::string& data)
{
  size_t zeros = 0;
  while (zeros < str.size () && str[zeros] == ALPHABET[0])
    ++zeros;

  /* Bytes of the result, least significant first.  */
  std::vector<uint8_t> bytes;
  for (size_t i = zeros; i < str.size (); ++i)
    {
      const int val = DigitValue (str[i]);
      if (val < 0)
        return false;

      unsigned carry = val;
      for (auto& b : bytes)
        {
          carry += static_cast<unsigned> (b) * 58;
          b = carry & 0xFF;
          carry >>= 8;
        }
      while (carry > 0)
        {
          bytes.push_back (carry & 0xFF);
          carry >>= 8;
        }
    }

  data.assign (zeros, '\0');
  for (auto it = bytes.rbegin (); it != bytes.rend (); ++it)
    data.push_back (static_cast<char> (*it));

  return true;
}

bool
DecodePubkey (const std::string& str, std::string& key)
{
  std::string decoded;
  if (!DecodeBase58 (str, decoded))
    return false;

  if (decoded.size () != PUBKEY_BYTES)
    {
      VLOG (1)
          << "Base58 key " << str << " has " << decoded.size () << " bytes";
      return false;
    }

  key = std::move (decoded);
  return true;
}

} // namespace anchorx
