// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "sqlitestore.hpp"

#include "private/database.hpp"

#include <glog/logging.h>

namespace anchorx
{

SqliteEventStore::SqliteEventStore (const std::string& file)
  : db(std::make_unique<Database> (file))
{
  SetupSchema ();
}

SqliteEventStore::~SqliteEventStore () = default;

void
SqliteEventStore::SetupSchema ()
{
  std::lock_guard<std::mutex> lock(mut);

  db->Execute (R"(
    CREATE TABLE IF NOT EXISTS `cursors` (
      `account` TEXT NOT NULL PRIMARY KEY,
      `signature` TEXT NOT NULL
    );

    CREATE TABLE IF NOT EXISTS `events` (
      `id` INTEGER PRIMARY KEY AUTOINCREMENT,
      `signature` TEXT NOT NULL,
      `position` INTEGER NOT NULL,
      `kind` TEXT NOT NULL,
      `data` TEXT NOT NULL,
      UNIQUE (`signature`, `position`)
    );
    CREATE INDEX IF NOT EXISTS `events_by_kind` ON `events` (`kind`);
  )");
}

bool
SqliteEventStore::GetCursor (const std::string& account,
                             std::string& signature)
{
  std::lock_guard<std::mutex> lock(mut);

  auto stmt = db->Prepare (R"(
    SELECT `signature`
      FROM `cursors`
      WHERE `account` = ?1
  )");
  stmt.Bind (1, account);

  if (!stmt.Step ())
    return false;

  signature = stmt.Get<std::string> (0);
  CHECK (!stmt.Step ());
  return true;
}

void
SqliteEventStore::SetCursor (const std::string& account,
                             const std::string& signature)
{
  std::lock_guard<std::mutex> lock(mut);

  auto stmt = db->Prepare (R"(
    INSERT OR REPLACE INTO `cursors`
      (`account`, `signature`) VALUES (?1, ?2)
  )");
  stmt.Bind (1, account);
  stmt.Bind (2, signature);
  stmt.Execute ();
}

bool
SqliteEventStore::InsertEvent (const std::string& signature,
                               const unsigned position, const Event& ev)
{
  std::lock_guard<std::mutex> lock(mut);

  auto stmt = db->Prepare (R"(
    INSERT OR IGNORE INTO `events`
      (`signature`, `position`, `kind`, `data`)
      VALUES (?1, ?2, ?3, ?4)
  )");
  stmt.Bind (1, signature);
  stmt.Bind (2, position);
  stmt.Bind (3, ev.GetKind ());
  stmt.Bind (4, ev.ToJson ());
  stmt.Execute ();

  if (db->RowsModified () == 0)
    {
      VLOG (1)
          << "Event " << position << " of " << signature
          << " is already stored";
      return false;
    }

  return true;
}

std::vector<StoredEvent>
SqliteEventStore::GetEvents ()
{
  std::lock_guard<std::mutex> lock(mut);

  auto stmt = db->Prepare (R"(
    SELECT `signature`, `position`, `kind`, `data`
      FROM `events`
      ORDER BY `id`
  )");

  std::vector<StoredEvent> res;
  while (stmt.Step ())
    {
      StoredEvent entry;
      entry.signature = stmt.Get<std::string> (0);
      entry.position = stmt.Get<int64_t> (1);
      entry.kind = stmt.Get<std::string> (2);
      entry.data = stmt.Get<Json::Value> (3);
      res.push_back (std::move (entry));
    }

  return res;
}

} // namespace anchorx
