// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ANCHORX_JSONUTILS_HPP
#define ANCHORX_JSONUTILS_HPP

#include <json/json.h>

#include <cstdint>
#include <string>

namespace anchorx
{

/**
 * Serialises decoded event fields to a single-line string.  This is the
 * form in which they end up in the event store and the log.
 */
std::string StoreJson (const Json::Value& val);

/**
 * Parses event fields back from the stored string.  Anything that is
 * not a single valid JSON document is reported as StorageError, since
 * it means the store has been tampered with.
 */
Json::Value LoadJson (const std::string& str);

/* Event fields use the full 64-bit range, which jsoncpp keeps exact
   only if the value is constructed with its explicit 64-bit types.  */
Json::Value IntToJson (int64_t val);
Json::Value UintToJson (uint64_t val);

} // namespace anchorx

#endif // ANCHORX_JSONUTILS_HPP
