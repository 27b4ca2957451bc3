// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ANCHORX_LOGSCANNER_HPP
#define ANCHORX_LOGSCANNER_HPP

#include "events.hpp"

#include <memory>
#include <string>

namespace anchorx
{

/**
 * Extracts encoded events from the log lines of a transaction.  Programs
 * emit events as base64 data behind a fixed marker prefix; everything
 * else in the logs is ignored.
 */
class LogScanner
{

private:

  /** The registry used to resolve extracted payloads.  */
  const EventRegistry& registry;

public:

  /** Marker prefix of events emitted through msg!.  */
  static const char* const MARKER_LOG;

  /** Marker prefix of events emitted through sol_log_data.  */
  static const char* const MARKER_DATA;

  explicit LogScanner (const EventRegistry& r)
    : registry(r)
  {}

  LogScanner () = delete;
  LogScanner (const LogScanner&) = delete;
  void operator= (const LogScanner&) = delete;

  /**
   * Tries to extract an event from a single log line.  Returns null if the
   * line does not carry an event of a known kind.  Throws LogParseError
   * if the line has a marker but the payload is not valid base64, and
   * DecodeError if the event's data does not match its kind's layout.
   */
  std::unique_ptr<Event> Extract (const std::string& line) const;

};

} // namespace anchorx

#endif // ANCHORX_LOGSCANNER_HPP
