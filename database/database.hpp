/*
    GSP for the SERP-TES elastic supply protocol
    Copyright (C) 2026  Autonomous Worlds Ltd

    This program is free software: you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation, either version 3 of the License, or
    (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with this program.  If not, see <https://www.gnu.org/licenses/>.
*/

#ifndef DATABASE_DATABASE_HPP
#define DATABASE_DATABASE_HPP

#include <xayagame/sqlitegame.hpp>
#include <xayagame/sqlitestorage.hpp>

#include <sqlite3.h>

#include <array>
#include <string>
#include <type_traits>

namespace tes
{

/**
 * Basic class that is used to provide connectivity to the database
 * and related services provided by SQLiteGame (e.g. AutoId's and prepared
 * statements).
 *
 * The class is abstract, so that we can implement it both based on TesLogic
 * (SQLiteGame subclass) and directly for unit tests without the need to
 * have a SQLiteGame.
 */
class Database
{

private:

  /** Underlying SQLiteDatabase from libxayagame.  */
  xaya::SQLiteDatabase* db = nullptr;

protected:

  Database () = default;

  /**
   * Sets the underlying SQLite database.  This must be called by subclasses
   * before using the Database instance in any form.
   */
  void SetDatabase (xaya::SQLiteDatabase& d);

public:

  using IdT = xaya::SQLiteGame::IdT;

  template <typename T>
    class Result;
  struct ResultType;
  class Statement;

  Database (const Database&) = delete;
  void operator= (const Database&) = delete;

  virtual ~Database () = default;

  /**
   * Returns the next ID that should be used as key into "log" tables
   * (like the elasticity records).  Those are written during the state
   * transition but never read by it, so the IDs are not consensus relevant.
   */
  virtual IdT GetLogId () = 0;

  /**
   * Prepares an SQL statement and returns the wrapper object.
   */
  Statement Prepare (const std::string& sql);

  /**
   * Gives access to the underlying libxayagame Database instance.
   */
  xaya::SQLiteDatabase&
  operator* ()
  {
    return *db;
  }

};

/**
 * Wrapper class around an SQLite prepared statement.  It allows binding
 * of parameters including std::string and protocol buffers (to BLOBs).
 */
class Database::Statement
{

private:

  /** The Database this corresponds to.  */
  Database* db;

  /** The underlying SQLite prepared statement.  */
  xaya::SQLiteDatabase::Statement stmt;

  /** Set to true when Execute has been called.  */
  bool executed = false;
  /** Set to true when Query has been called.  */
  bool queried = false;

  /**
   * Constructs an instance based on the given libxayagame statement.
   * This is called by Database::Prepare and not used directly.
   */
  explicit Statement (Database& d, xaya::SQLiteDatabase::Statement&& s)
    : db(&d), stmt(std::move (s))
  {}

  friend class Database;

public:

  /* The object is movable but not copyable.  This is used to make code
     like the following work:

       Statement s = db.Prepare (...);
  */

  Statement (const Statement&) = delete;
  Statement& operator= (const Statement&) = delete;

  Statement (Statement&&) = default;
  Statement& operator= (Statement&&) = default;

  /**
   * Binds a parameter to the given data.  Strings are bound with an internal
   * copy made in SQLite.
   */
  template <typename T>
    void Bind (unsigned ind, const T& val);

  /**
   * Binds a null value to a parameter.
   */
  inline void
  BindNull (const unsigned ind)
  {
    stmt.BindNull (ind);
  }

  /**
   * Binds a protocol buffer to a BLOB parameter, serialising it.
   */
  template <typename Proto>
    void BindProto (unsigned ind, const Proto& msg);

  /**
   * Resets the statement so it can be used again with fresh bindings
   * and fresh execution from start.  This can be used after calling Execute,
   * but not after Query.
   */
  void Reset ();

  /**
   * Executes the statement without expecting any results.  This is used for
   * statements other than SELECT.
   */
  void Execute ();

  /**
   * Executes the statement as SELECT and returns a handle for the resulting
   * database rows.  This transfers the libxayagame statement out into the
   * result handle, and leaves this instance unusable (not even Reset can
   * be used on it anymore).
   */
  template <typename T>
    Result<T> Query ();

};

/**
 * Type specifying a kind of database result (e.g. is this a row of the
 * currency-state table?).  This class (or rather, subclasses of it) are used
 * as template parameter for Result<T>.  It should not be instantiated.
 *
 * Subclasses must define the columns that they accept using the
 * RESULT_COLUMN macro.
 */
struct Database::ResultType
{

  /**
   * Type used for IDs of columns.  Each column accessed in a result of
   * a certain type must have an ID, which is mapped to its string name
   * in the database query.  Then lookups of the column are done by that
   * ID, which is faster than looking up strings in a map.
   */
  using ColumnId = unsigned;

  /**
   * Maximum number of columns we support (namely in the range
   * 0..MAX_ID-1).
   */
  static constexpr ColumnId MAX_ID = 32;

  /**
   * Define a new column supported by this result set.  It must define
   * the SQL column name, a unique ColumnId number, and the type.
   */
#define RESULT_COLUMN(type, name, id) \
  struct name \
  { \
    using Type = type; \
    static constexpr ColumnId ID = id; \
    static constexpr const char* NAME = #name; \
    static_assert (ID < MAX_ID, "Column ID is too large"); \
  }

  ResultType () = delete;
  ResultType (const ResultType&) = delete;

};

/**
 * Wrapper around sqlite3_stmt, but taking care of reading results of a
 * query rather than binding values.  Results are "typed", where the type
 * indicates what kind of row this is (e.g. from the price-quotes table or
 * from the elasticity log).
 */
template <typename T>
  class Database::Result
{

private:

  static_assert (std::is_base_of<ResultType, T>::value,
                 "Result type has an invalid type");

  /** Values used as SQLite column "index" when the column is not present.  */
  static constexpr int MISSING_COLUMN = -1;

  /** The database this corresponds to.  */
  Database* db;

  /** The underlying libxayagame statement.  */
  xaya::SQLiteDatabase::Statement stmt;

  /** Map of ColumnId values to the indices in the SQLite statement.  */
  mutable std::array<int, ResultType::MAX_ID> columnInd;

  /**
   * Constructs an instance based on the given statement handle.  This is called
   * by Statement::Query and not used directly.
   */
  explicit Result (Database& d, xaya::SQLiteDatabase::Statement&& s);

  /**
   * Returns the index for a column defined in the result type.  Fills it in
   * in columnInd if it is not yet set there (assuming the column's name
   * can be found in the SQLite result).
   */
  template <typename Col>
    int ColumnIndex () const;

  friend class Statement;

public:

  /* The object is movable but not copyable.  This is used to make code
     like the following work:

       Result r = stmt.Query ();
  */

  Result (const Result<T>&) = delete;
  Result& operator= (const Result<T>&) = delete;

  Result (Result<T>&&) = default;
  Result& operator= (Result<T>&&) = default;

  /**
   * Tries to step to the next result.  Returns false if there is none.
   */
  inline bool
  Step ()
  {
    return stmt.Step ();
  }

  /**
   * Checks if the given column is null.
   */
  template <typename Col>
    bool IsNull () const;

  /**
   * Extracts the column of the given type.
   */
  template <typename Col>
    typename Col::Type Get () const;

  /**
   * Extracts and parses a protocol buffer from the column of the given type.
   */
  template <typename Col>
    typename Col::Type GetProto () const;

  /**
   * Returns the underlying database handle.
   */
  Database&
  GetDatabase ()
  {
    return *db;
  }

};

} // namespace tes

#include "database.tpp"

#endif // DATABASE_DATABASE_HPP
