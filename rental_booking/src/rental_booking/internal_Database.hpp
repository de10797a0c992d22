/*
 * Copyright (C) 2021 Open Source Robotics Foundation
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 *
*/

#ifndef SRC__RENTAL_BOOKING__INTERNAL_DATABASE_HPP
#define SRC__RENTAL_BOOKING__INTERNAL_DATABASE_HPP

#include <rental_booking/Database.hpp>
#include <rental_booking/Date.hpp>
#include <rental_booking/Error.hpp>

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace rental_booking {

//==============================================================================
/// Build the message of an error that happened inside `operation`, in the form
/// "[rental_booking::operation] details".
std::string describe(const std::string& operation, const std::string& details);

//==============================================================================
struct ConnectionCloser
{
  void operator()(sqlite3* connection) const;
};

//==============================================================================
struct StatementFinalizer
{
  void operator()(sqlite3_stmt* statement) const;
};

//==============================================================================
/// A prepared SQLite statement. Parameter indices start at 1 and column
/// indices start at 0, as they do in SQLite itself.
class Statement
{
public:

  Statement(sqlite3* connection, std::string sql, std::string operation);

  Statement& bind_int(int index, int64_t value);
  Statement& bind_id(int index, uint64_t value);
  Statement& bind_double(int index, double value);
  Statement& bind_text(int index, const std::string& value);
  Statement& bind_null(int index);
  Statement& bind_date(int index, const Date& value);
  Statement& bind_optional_text(
    int index, const std::optional<std::string>& value);
  Statement& bind_optional_date(int index, const std::optional<Date>& value);

  /// Advance to the next row.
  ///
  /// \return true if a row is available, false when the statement is done.
  bool step();

  /// Step a statement that produces no rows.
  void run();

  int64_t column_int(int column) const;
  uint64_t column_id(int column) const;
  double column_double(int column) const;
  bool column_is_null(int column) const;
  std::string column_text(int column) const;
  std::optional<std::string> column_optional_text(int column) const;
  Date column_date(int column) const;
  std::optional<Date> column_optional_date(int column) const;

private:
  void _check_bind(int result, int index);

  sqlite3* _connection;
  std::unique_ptr<sqlite3_stmt, StatementFinalizer> _statement;
  std::string _sql;
  std::string _operation;
};

//==============================================================================
using Binding = std::variant<int64_t, double, std::string>;

/// Bind each value to consecutive parameters starting at 1.
void bind_all(Statement& statement, const std::vector<Binding>& bindings);

//==============================================================================
class Database::Implementation
{
public:

  Implementation(Configuration config);

  /// Execute one or more statements that produce no results. The caller must
  /// hold the mutex.
  void exec(const std::string& sql, const std::string& operation);

  const Logger& logger() const;

  static Implementation& get(Database& database);

  Configuration config;
  std::unique_ptr<sqlite3, ConnectionCloser> connection;

  /// Held for the whole lifetime of every Transaction on this connection.
  std::mutex mutex;

private:
  void _initialize_schema();
};

//==============================================================================
/// Exclusive use of a Database's connection for the duration of one SQLite
/// transaction. A Transaction that is destroyed without being committed is
/// rolled back.
///
/// Write transactions begin IMMEDIATE: they take the store's write lock before
/// the first statement runs, so that everything a write transaction reads
/// stays current until it commits, even when other connections or processes
/// share the file.
class Transaction
{
public:

  enum class Mode : uint8_t
  {
    Read,
    Write
  };

  Transaction(
    Database::Implementation& database,
    Mode mode,
    std::string operation);

  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;

  ~Transaction();

  Statement prepare(const std::string& sql) const;

  /// Number of rows modified by the most recent statement.
  int changes() const;

  /// The rowid of the most recent INSERT.
  uint64_t last_insert_id() const;

  void commit();

  const std::string& operation() const;

private:
  Database::Implementation& _database;
  std::unique_lock<std::mutex> _lock;
  std::string _operation;
  bool _open;
};

} // namespace rental_booking

#endif // SRC__RENTAL_BOOKING__INTERNAL_DATABASE_HPP
