// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "logscanner.hpp"

#include "errors.hpp"

#include <xayautil/base64.hpp>

#include <glog/logging.h>

namespace anchorx
{

const char* const LogScanner::MARKER_LOG = "Program log: ";
const char* const LogScanner::MARKER_DATA = "Program data: ";

namespace
{

/**
 * Checks if the line starts with the given marker.  If it does, the
 * remainder is returned in rest.
 */
bool
StripMarker (const std::string& line, const std::string& marker,
             std::string& rest)
{
  if (line.compare (0, marker.size (), marker) != 0)
    return false;

  rest = line.substr (marker.size ());
  return true;
}

} // anonymous namespace

std::unique_ptr<Event>
LogScanner::Extract (const std::string& line) const
{
  std::string encoded;
  if (!StripMarker (line, MARKER_LOG, encoded)
        && !StripMarker (line, MARKER_DATA, encoded))
    return nullptr;

  std::string data;
  if (!xaya::DecodeBase64 (encoded, data))
    throw LogParseError ("invalid base64 payload: " + encoded);

  if (data.size () < DISCRIMINANT_BYTES)
    {
      VLOG (1) << "Payload of " << data.size ()
               << " bytes is too short for an event";
      return nullptr;
    }

  auto res = registry.Resolve (data.substr (0, DISCRIMINANT_BYTES),
                               data.substr (DISCRIMINANT_BYTES));
  if (res == nullptr)
    VLOG (1) << "Unknown event discriminant in log line";
  else
    VLOG (1) << "Extracted event: " << *res;

  return res;
}

} // namespace anchorx
