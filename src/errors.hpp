// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ANCHORX_ERRORS_HPP
#define ANCHORX_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace anchorx
{

/**
 * Base class for all runtime errors the indexer reports.  Violations of
 * internal invariants are not reported through this (they CHECK-fail
 * instead); this is for things going wrong with external data, the
 * transaction source or the storage.
 */
class IndexerError : public std::runtime_error
{

public:

  explicit IndexerError (const std::string& msg)
    : std::runtime_error(msg)
  {}

  /**
   * Returns true if the error should terminate the poll loop it occurs
   * in, rather than just aborting the current tick.
   */
  virtual bool
  IsFatal () const
  {
    return false;
  }

};

/**
 * The transaction source could not be reached or returned an invalid
 * response.  The current tick is aborted and retried later.
 */
class SourceUnavailable : public IndexerError
{

public:

  explicit SourceUnavailable (const std::string& msg)
    : IndexerError("transaction source unavailable: " + msg)
  {}

};

/**
 * An event payload with a known discriminant does not match the field
 * layout of its event kind.
 */
class DecodeError : public IndexerError
{

public:

  explicit DecodeError (const std::string& msg)
    : IndexerError("failed to decode event: " + msg)
  {}

};

/**
 * A log line carries a known marker, but its payload is not a valid
 * encoding envelope (e.g. invalid base64).
 */
class LogParseError : public IndexerError
{

public:

  explicit LogParseError (const std::string& msg)
    : IndexerError("failed to parse log line: " + msg)
  {}

};

/**
 * Reading or writing the persistent state failed.
 */
class StorageError : public IndexerError
{

public:

  explicit StorageError (const std::string& msg)
    : IndexerError("storage error: " + msg)
  {}

};

/**
 * The configuration (e.g. an account identifier) is invalid.  This is
 * the only kind of error that is fatal.
 */
class InvalidConfiguration : public IndexerError
{

public:

  explicit InvalidConfiguration (const std::string& msg)
    : IndexerError("invalid configuration: " + msg)
  {}

  bool
  IsFatal () const override
  {
    return true;
  }

};

} // namespace anchorx

#endif // ANCHORX_ERRORS_HPP
