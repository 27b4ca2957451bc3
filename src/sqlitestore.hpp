// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ANCHORX_SQLITESTORE_HPP
#define ANCHORX_SQLITESTORE_HPP

#include "eventstore.hpp"

#include <memory>
#include <mutex>
#include <string>

namespace anchorx
{

class Database;

/**
 * Event store backed by an SQLite database file.
 */
class SqliteEventStore : public EventStore
{

private:

  /** Lock for the database connection.  */
  std::mutex mut;

  std::unique_ptr<Database> db;

  /**
   * Creates the schema if it does not exist yet.
   */
  void SetupSchema ();

public:

  /**
   * Opens the database at the given file.  The special name ":memory:"
   * creates a temporary in-memory database.  Throws StorageError if it
   * cannot be opened.
   */
  explicit SqliteEventStore (const std::string& file);

  ~SqliteEventStore ();

  bool GetCursor (const std::string& account,
                  std::string& signature) override;
  void SetCursor (const std::string& account,
                  const std::string& signature) override;
  bool InsertEvent (const std::string& signature, unsigned position,
                    const Event& ev) override;
  std::vector<StoredEvent> GetEvents () override;

};

} // namespace anchorx

#endif // ANCHORX_SQLITESTORE_HPP
