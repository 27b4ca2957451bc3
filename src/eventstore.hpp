// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ANCHORX_EVENTSTORE_HPP
#define ANCHORX_EVENTSTORE_HPP

#include "events.hpp"

#include <json/json.h>

#include <map>
#include <mutex>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace anchorx
{

/**
 * An event as it is persisted.
 */
struct StoredEvent
{

  /** The signature of the transaction that emitted it.  */
  std::string signature;

  /** Index of the event within the transaction's events.  */
  unsigned position = 0;

  /** The event kind.  */
  std::string kind;

  /** The event fields as JSON.  */
  Json::Value data;

};

/**
 * Interface for the persistent state of the indexer: the per-account
 * cursors and the indexed events.  Implementations must be safe to use
 * from multiple threads at the same time.  Failures are reported by
 * throwing StorageError.
 */
class EventStore
{

public:

  EventStore () = default;
  virtual ~EventStore () = default;

  EventStore (const EventStore&) = delete;
  void operator= (const EventStore&) = delete;

  /**
   * Retrieves the cursor (last fully processed signature) of an account.
   * Returns false if none is set yet.
   */
  virtual bool GetCursor (const std::string& account,
                          std::string& signature) = 0;

  /**
   * Sets (or replaces) the cursor of an account.
   */
  virtual void SetCursor (const std::string& account,
                          const std::string& signature) = 0;

  /**
   * Inserts an event that was emitted by the given transaction at the
   * given position.  If an event at that position was already stored,
   * nothing is changed and false is returned.
   */
  virtual bool InsertEvent (const std::string& signature, unsigned position,
                            const Event& ev) = 0;

  /**
   * Returns all stored events in the order of insertion.
   */
  virtual std::vector<StoredEvent> GetEvents () = 0;

};

/**
 * Event store that just keeps everything in memory.
 */
class InMemoryEventStore : public EventStore
{

private:

  std::mutex mut;

  std::map<std::string, std::string> cursors;
  std::vector<StoredEvent> events;

  /** The (signature, position) keys of all stored events.  */
  std::set<std::pair<std::string, unsigned>> eventKeys;

public:

  InMemoryEventStore () = default;

  bool GetCursor (const std::string& account,
                  std::string& signature) override;
  void SetCursor (const std::string& account,
                  const std::string& signature) override;
  bool InsertEvent (const std::string& signature, unsigned position,
                    const Event& ev) override;
  std::vector<StoredEvent> GetEvents () override;

};

} // namespace anchorx

#endif // ANCHORX_EVENTSTORE_HPP
