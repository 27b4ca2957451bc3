// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ANCHORX_DATABASE_HPP
#define ANCHORX_DATABASE_HPP

#include <sqlite3.h>

#include <map>
#include <memory>
#include <string>

namespace anchorx
{

/**
 * Thin wrapper around an SQLite connection with a cache of prepared
 * statements.  All SQLite failures are reported as StorageError.  The
 * connection is opened in multi-thread mode, so callers have to
 * synchronise access to an instance themselves.
 */
class Database
{

private:

  class CachedStatement;

  /** The underlying SQLite handle.  */
  sqlite3* db = nullptr;

  /** The file name, for error messages.  */
  const std::string file;

  /** Prepared statements by their SQL.  */
  std::map<std::string, std::unique_ptr<CachedStatement>> statements;

  /**
   * Throws a StorageError for the given failure, including the last
   * error message of the connection.
   */
  void Fail (const std::string& what) const;

public:

  class Statement;

  /**
   * Opens (and creates if necessary) the database file.  Throws
   * StorageError if that fails.
   */
  explicit Database (const std::string& f);

  ~Database ();

  Database () = delete;
  Database (const Database&) = delete;
  void operator= (const Database&) = delete;

  /**
   * Runs SQL statements directly (e.g. to set up the schema).
   */
  void Execute (const std::string& sql);

  /**
   * Returns a prepared statement for the given SQL from the cache,
   * preparing it first if needed.  Each statement can only be in use
   * once at a time.
   */
  Statement Prepare (const std::string& sql);

  /**
   * Returns the number of rows modified by the most recent statement.
   */
  unsigned RowsModified () const;

};

/**
 * A prepared statement in the cache, together with the flag marking it
 * as in use.
 */
class Database::CachedStatement
{

private:

  sqlite3_stmt* const stmt;
  bool used = false;

  friend class Database;
  friend class Database::Statement;

public:

  explicit CachedStatement (sqlite3_stmt* s)
    : stmt(s)
  {}

  CachedStatement (const CachedStatement&) = delete;
  void operator= (const CachedStatement&) = delete;

  ~CachedStatement ();

};

/**
 * RAII handle for using one of the cached statements.  When it goes
 * out of scope, the statement is reset and can be reused.
 */
class Database::Statement
{

private:

  /** The database this is for, used for error reporting.  */
  const Database* db = nullptr;

  /** The cache entry in use.  */
  CachedStatement* entry = nullptr;

  Statement (const Database& d, CachedStatement& s);

  /**
   * Releases the cache entry (if any).
   */
  void Clear ();

  sqlite3_stmt* operator* () const;

  friend class Database;

public:

  Statement () = default;
  Statement (Statement&& o);
  Statement& operator= (Statement&& o);
  ~Statement ();

  Statement (const Statement&) = delete;
  void operator= (const Statement&) = delete;

  /**
   * Executes a statement that does not return rows.
   */
  void Execute ();

  /**
   * Steps the statement.  Returns true if a row is available and false
   * once it is done.
   */
  bool Step ();

  template <typename T>
    void Bind (int ind, const T& val);

  template <typename T>
    T Get (int ind) const;

};

} // namespace anchorx

#endif // ANCHORX_DATABASE_HPP
