// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "borsh.hpp"

#include "base58.hpp"
#include "errors.hpp"

#include <glog/logging.h>

#include <sstream>

namespace anchorx
{

/* ************************************************************************** */

uint64_t
BorshReader::ReadLittleEndian (const size_t len)
{
  CHECK_LE (len, sizeof (uint64_t));
  if (Remaining () < len)
    {
      std::ostringstream msg;
      msg << "expected " << len << " more bytes at offset " << pos
          << ", but only " << Remaining () << " are left";
      throw DecodeError (msg.str ());
    }

  uint64_t res = 0;
  for (size_t i = 0; i < len; ++i)
    {
      const uint64_t byte = static_cast<uint8_t> (data[pos + i]);
      res |= byte << (8 * i);
    }
  pos += len;

  return res;
}

uint8_t
BorshReader::ReadU8 ()
{
  return ReadLittleEndian (1);
}

uint16_t
BorshReader::ReadU16 ()
{
  return ReadLittleEndian (2);
}

uint32_t
BorshReader::ReadU32 ()
{
  return ReadLittleEndian (4);
}

int32_t
BorshReader::ReadI32 ()
{
  return static_cast<int32_t> (ReadU32 ());
}

uint64_t
BorshReader::ReadU64 ()
{
  return ReadLittleEndian (8);
}

int64_t
BorshReader::ReadI64 ()
{
  return static_cast<int64_t> (ReadU64 ());
}

bool
BorshReader::ReadBool ()
{
  const uint8_t val = ReadU8 ();
  if (val > 1)
    {
      std::ostringstream msg;
      msg << "invalid bool value " << static_cast<int> (val)
          << " at offset " << (pos - 1);
      throw DecodeError (msg.str ());
    }
  return val == 1;
}

std::string
BorshReader::ReadBytes (const size_t len)
{
  if (Remaining () < len)
    {
      std::ostringstream msg;
      msg << "expected " << len << " bytes at offset " << pos
          << ", but only " << Remaining () << " are left";
      throw DecodeError (msg.str ());
    }

  std::string res = data.substr (pos, len);
  pos += len;

  return res;
}

std::string
BorshReader::ReadPubkey ()
{
  return ReadBytes (PUBKEY_BYTES);
}

bool
BorshReader::ReadOptionTag ()
{
  const uint8_t tag = ReadU8 ();
  switch (tag)
    {
    case 0:
      return false;
    case 1:
      return true;
    default:
      {
        std::ostringstream msg;
        msg << "invalid option tag " << static_cast<int> (tag)
            << " at offset " << (pos - 1);
        throw DecodeError (msg.str ());
      }
    }
}

uint8_t
BorshReader::ReadEnum (const char* name, const uint8_t numVariants)
{
  const uint8_t variant = ReadU8 ();
  if (variant >= numVariants)
    {
      std::ostringstream msg;
      msg << "invalid variant " << static_cast<int> (variant)
          << " for enum " << name;
      throw DecodeError (msg.str ());
    }
  return variant;
}

void
BorshReader::Finish () const
{
  if (Remaining () > 0)
    {
      std::ostringstream msg;
      msg << Remaining () << " trailing bytes after the last field";
      throw DecodeError (msg.str ());
    }
}

/* ************************************************************************** */

void
BorshWriter::WriteLittleEndian (uint64_t val, const size_t len)
{
  CHECK_LE (len, sizeof (uint64_t));
  for (size_t i = 0; i < len; ++i)
    {
      data.push_back (static_cast<char> (val & 0xFF));
      val >>= 8;
    }
}

void
BorshWriter::WriteU8 (const uint8_t val)
{
  WriteLittleEndian (val, 1);
}

void
BorshWriter::WriteU16 (const uint16_t val)
{
  WriteLittleEndian (val, 2);
}

void
BorshWriter::WriteU32 (const uint32_t val)
{
  WriteLittleEndian (val, 4);
}

void
BorshWriter::WriteI32 (const int32_t val)
{
  WriteU32 (static_cast<uint32_t> (val));
}

void
BorshWriter::WriteU64 (const uint64_t val)
{
  WriteLittleEndian (val, 8);
}

void
BorshWriter::WriteI64 (const int64_t val)
{
  WriteU64 (static_cast<uint64_t> (val));
}

void
BorshWriter::WriteBool (const bool val)
{
  WriteU8 (val ? 1 : 0);
}

void
BorshWriter::WriteBytes (const std::string& bytes)
{
  data += bytes;
}

void
BorshWriter::WritePubkey (const std::string& key)
{
  CHECK_EQ (key.size (), PUBKEY_BYTES) << "Invalid public key size";
  WriteBytes (key);
}

/* ************************************************************************** */

} // namespace anchorx
