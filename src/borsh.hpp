// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ANCHORX_BORSH_HPP
#define ANCHORX_BORSH_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace anchorx
{

/**
 * Helper class for reading fields from a Borsh-encoded byte string, which
 * is the layout Anchor programs use for their event structs.  All integers
 * are little endian.  Reading beyond the end of the data or hitting an
 * invalid tag throws DecodeError.
 */
class BorshReader
{

private:

  /** The data being read.  */
  const std::string data;

  /** Current read position.  */
  size_t pos = 0;

  /**
   * Reads a little-endian unsigned integer with the given number of bytes.
   */
  uint64_t ReadLittleEndian (size_t len);

public:

  explicit BorshReader (const std::string& d)
    : data(d)
  {}

  BorshReader (const BorshReader&) = delete;
  void operator= (const BorshReader&) = delete;

  uint8_t ReadU8 ();
  uint16_t ReadU16 ();
  uint32_t ReadU32 ();
  int32_t ReadI32 ();
  uint64_t ReadU64 ();
  int64_t ReadI64 ();
  bool ReadBool ();

  /**
   * Reads the given number of raw bytes.
   */
  std::string ReadBytes (size_t len);

  /**
   * Reads a 32-byte public key.  It is returned as raw bytes.
   */
  std::string ReadPubkey ();

  /**
   * Reads the tag of an Option<T>.  Returns true if a value follows.
   */
  bool ReadOptionTag ();

  /**
   * Reads an enum variant index (which is a single byte) and verifies
   * that it is below the given number of variants.
   */
  uint8_t ReadEnum (const char* name, uint8_t numVariants);

  /**
   * Reads an optional value using the given reader member function.
   */
  template <typename T>
    std::optional<T>
    ReadOption (T (BorshReader::*fcn) ())
  {
    if (!ReadOptionTag ())
      return std::nullopt;
    return (this->*fcn) ();
  }

  /**
   * Returns the number of bytes not yet read.
   */
  size_t
  Remaining () const
  {
    return data.size () - pos;
  }

  /**
   * Verifies that all data has been consumed.  Throws DecodeError if
   * there are trailing bytes.
   */
  void Finish () const;

};

/**
 * Helper class for writing Borsh-encoded data.  This is the inverse
 * of BorshReader.
 */
class BorshWriter
{

private:

  /** The data written so far.  */
  std::string data;

  /**
   * Writes a little-endian unsigned integer with the given number of bytes.
   */
  void WriteLittleEndian (uint64_t val, size_t len);

public:

  BorshWriter () = default;

  void WriteU8 (uint8_t val);
  void WriteU16 (uint16_t val);
  void WriteU32 (uint32_t val);
  void WriteI32 (int32_t val);
  void WriteU64 (uint64_t val);
  void WriteI64 (int64_t val);
  void WriteBool (bool val);
  void WriteBytes (const std::string& bytes);
  void WritePubkey (const std::string& key);

  /**
   * Writes an optional value with the given writer member function.
   */
  template <typename T, typename A>
    void
    WriteOption (const std::optional<T>& val, void (BorshWriter::*fcn) (A))
  {
    if (!val)
      {
        WriteU8 (0);
        return;
      }
    WriteU8 (1);
    (this->*fcn) (*val);
  }

  const std::string&
  GetData () const
  {
    return data;
  }

};

} // namespace anchorx

#endif // ANCHORX_BORSH_HPP
