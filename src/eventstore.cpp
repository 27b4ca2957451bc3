// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "eventstore.hpp"

#include <glog/logging.h>

namespace anchorx
{

bool
InMemoryEventStore::GetCursor (const std::string& account,
                               std::string& signature)
{
  std::lock_guard<std::mutex> lock(mut);

  const auto mit = cursors.find (account);
  if (mit == cursors.end ())
    return false;

  signature = mit->second;
  return true;
}

void
InMemoryEventStore::SetCursor (const std::string& account,
                               const std::string& signature)
{
  std::lock_guard<std::mutex> lock(mut);
  cursors[account] = signature;
}

bool
InMemoryEventStore::InsertEvent (const std::string& signature,
                                 const unsigned position, const Event& ev)
{
  std::lock_guard<std::mutex> lock(mut);

  if (!eventKeys.emplace (signature, position).second)
    {
      VLOG (1)
          << "Event " << position << " of " << signature
          << " is already stored";
      return false;
    }

  StoredEvent entry;
  entry.signature = signature;
  entry.position = position;
  entry.kind = ev.GetKind ();
  entry.data = ev.ToJson ();
  events.push_back (std::move (entry));

  return true;
}

std::vector<StoredEvent>
InMemoryEventStore::GetEvents ()
{
  std::lock_guard<std::mutex> lock(mut);
  return events;
}

} // namespace anchorx
