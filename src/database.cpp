// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "private/database.hpp"

#include "errors.hpp"
#include "private/jsonutils.hpp"

#include <json/json.h>

#include <glog/logging.h>

#include <limits>
#include <mutex>
#include <sstream>

namespace anchorx
{

namespace
{

/**
 * Error callback for SQLite, which routes its messages to glog.
 */
void
SQLiteErrorLogger (void* arg, const int errCode, const char* msg)
{
  LOG (WARNING) << "SQLite error (code " << errCode << "): " << msg;
}

/**
 * Sets up the global SQLite configuration.  Must be done before the
 * first connection is opened.
 */
void
ConfigureSQLite ()
{
  LOG (INFO)
      << "Using SQLite version " << SQLITE_VERSION
      << " (library version: " << sqlite3_libversion () << ")";
  CHECK_EQ (SQLITE_VERSION_NUMBER, sqlite3_libversion_number ())
      << "Mismatch between header and library SQLite versions";

  const int rc
      = sqlite3_config (SQLITE_CONFIG_LOG, &SQLiteErrorLogger, nullptr);
  if (rc != SQLITE_OK)
    LOG (WARNING) << "Failed to set up SQLite error handler: " << rc;

  CHECK_EQ (sqlite3_config (SQLITE_CONFIG_MULTITHREAD), SQLITE_OK)
      << "Failed to enable multi-threaded mode for SQLite";
}

} // anonymous namespace

Database::Database (const std::string& f)
  : file(f)
{
  static std::once_flag configured;
  std::call_once (configured, &ConfigureSQLite);

  const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
  const int rc = sqlite3_open_v2 (file.c_str (), &db, flags, nullptr);
  if (rc != SQLITE_OK)
    {
      std::string msg = "failed to open " + file;
      if (db != nullptr)
        {
          msg += ": ";
          msg += sqlite3_errmsg (db);
          sqlite3_close (db);
        }
      throw StorageError (msg);
    }

  CHECK (db != nullptr);
  LOG (INFO) << "Opened SQLite database: " << file;
}

Database::~Database ()
{
  statements.clear ();

  CHECK (db != nullptr);
  if (sqlite3_close (db) != SQLITE_OK)
    LOG (ERROR) << "Failed to close SQLite database " << file;
}

void
Database::Fail (const std::string& what) const
{
  std::ostringstream msg;
  msg << what << " (" << file << "): " << sqlite3_errmsg (db);
  throw StorageError (msg.str ());
}

void
Database::Execute (const std::string& sql)
{
  char* err = nullptr;
  const int rc = sqlite3_exec (db, sql.c_str (), nullptr, nullptr, &err);
  if (rc != SQLITE_OK)
    {
      const std::string msg = (err != nullptr ? err : "unknown error");
      sqlite3_free (err);
      throw StorageError ("failed to execute SQL on " + file + ": " + msg);
    }
}

Database::Statement
Database::Prepare (const std::string& sql)
{
  const auto mit = statements.find (sql);
  if (mit != statements.end ())
    return Statement (*this, *mit->second);

  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2 (db, sql.c_str (), sql.size () + 1, &stmt, nullptr)
        != SQLITE_OK)
    Fail ("failed to prepare statement");

  auto entry = std::make_unique<CachedStatement> (stmt);
  Statement res(*this, *entry);

  VLOG (2) << "Prepared new SQL statement:\n" << sql;
  statements.emplace (sql, std::move (entry));

  return res;
}

unsigned
Database::RowsModified () const
{
  const int res = sqlite3_changes (db);
  CHECK_GE (res, 0);
  return res;
}

/* ************************************************************************** */

Database::CachedStatement::~CachedStatement ()
{
  CHECK (!used) << "Cached statement is still in use";
  /* The return value reflects the last evaluation, not the finalisation.  */
  sqlite3_finalize (stmt);
}

Database::Statement::Statement (const Database& d, CachedStatement& s)
  : db(&d), entry(&s)
{
  CHECK (!entry->used) << "Cached statement is already in use";
  entry->used = true;
}

Database::Statement::Statement (Statement&& o)
{
  *this = std::move (o);
}

Database::Statement&
Database::Statement::operator= (Statement&& o)
{
  Clear ();

  db = o.db;
  entry = o.entry;
  o.entry = nullptr;

  return *this;
}

Database::Statement::~Statement ()
{
  Clear ();
}

void
Database::Statement::Clear ()
{
  if (entry == nullptr)
    return;

  CHECK (entry->used);
  sqlite3_clear_bindings (entry->stmt);
  sqlite3_reset (entry->stmt);
  entry->used = false;
  entry = nullptr;
}

sqlite3_stmt*
Database::Statement::operator* () const
{
  CHECK (entry != nullptr) << "Statement is empty";
  return entry->stmt;
}

void
Database::Statement::Execute ()
{
  if (Step ())
    db->Fail ("statement unexpectedly returned rows");
}

bool
Database::Statement::Step ()
{
  const int rc = sqlite3_step (**this);
  if (rc == SQLITE_ROW)
    return true;
  if (rc != SQLITE_DONE)
    db->Fail ("failed to step statement");
  return false;
}

template <>
  void
  Database::Statement::Bind<int64_t> (const int ind, const int64_t& val)
{
  if (sqlite3_bind_int64 (**this, ind, val) != SQLITE_OK)
    db->Fail ("failed to bind integer");
}

template <>
  void
  Database::Statement::Bind<unsigned> (const int ind, const unsigned& val)
{
  Bind<int64_t> (ind, val);
}

template <>
  void
  Database::Statement::Bind<std::string> (const int ind,
                                          const std::string& val)
{
  if (sqlite3_bind_text (**this, ind, val.data (), val.size (),
                         SQLITE_TRANSIENT) != SQLITE_OK)
    db->Fail ("failed to bind text");
}

template <>
  void
  Database::Statement::Bind<Json::Value> (const int ind, const Json::Value& val)
{
  Bind (ind, StoreJson (val));
}

template <>
  int64_t
  Database::Statement::Get<int64_t> (const int ind) const
{
  return sqlite3_column_int64 (**this, ind);
}

template <>
  std::string
  Database::Statement::Get<std::string> (const int ind) const
{
  const int len = sqlite3_column_bytes (**this, ind);
  if (len == 0)
    return std::string ();

  const unsigned char* str = sqlite3_column_text (**this, ind);
  CHECK (str != nullptr);
  return std::string (reinterpret_cast<const char*> (str), len);
}

template <>
  Json::Value
  Database::Statement::Get<Json::Value> (const int ind) const
{
  return LoadJson (Get<std::string> (ind));
}

} // namespace anchorx
