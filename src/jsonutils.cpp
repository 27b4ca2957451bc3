// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "private/jsonutils.hpp"

#include "errors.hpp"

#include <memory>
#include <sstream>

namespace anchorx
{

namespace
{

/**
 * Builds the writer used for stored fields:  no whitespace, no comments
 * and nulls kept explicitly (optional event fields are null when absent).
 */
std::unique_ptr<Json::StreamWriter>
CompactWriter ()
{
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "";
  builder["commentStyle"] = "None";
  builder["dropNullPlaceholders"] = false;
  builder["useSpecialFloats"] = false;
  builder["enableYAMLCompatibility"] = false;

  return std::unique_ptr<Json::StreamWriter> (builder.newStreamWriter ());
}

std::unique_ptr<Json::CharReader>
StrictReader ()
{
  Json::CharReaderBuilder builder;
  Json::CharReaderBuilder::strictMode (&builder.settings_);
  /* Stored fields are always objects, but plain values are fine too.  */
  builder["strictRoot"] = false;

  return std::unique_ptr<Json::CharReader> (builder.newCharReader ());
}

} // anonymous namespace

std::string
StoreJson (const Json::Value& val)
{
  std::ostringstream out;
  CompactWriter ()->write (val, &out);
  return out.str ();
}

Json::Value
LoadJson (const std::string& str)
{
  const char* begin = str.data ();
  const char* end = begin + str.size ();

  Json::Value res;
  std::string errs;
  if (!StrictReader ()->parse (begin, end, &res, &errs))
    throw StorageError ("stored event data is not valid JSON: " + errs);

  return res;
}

Json::Value
IntToJson (const int64_t val)
{
  return static_cast<Json::Int64> (val);
}

Json::Value
UintToJson (const uint64_t val)
{
  return static_cast<Json::UInt64> (val);
}

} // namespace anchorx
