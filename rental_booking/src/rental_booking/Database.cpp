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

#include "internal_Database.hpp"

#include <limits>

namespace rental_booking {

namespace {

//==============================================================================
// Every statement is idempotent so that several connections can race to
// initialize the same file.
const char* const Schema = R"sql(
CREATE TABLE IF NOT EXISTS users (
  user_id     INTEGER PRIMARY KEY AUTOINCREMENT,
  email       TEXT NOT NULL UNIQUE,
  full_name   TEXT NOT NULL,
  role        TEXT NOT NULL CHECK (role IN ('customer','admin')),
  created_at  DATETIME NOT NULL DEFAULT (datetime('now'))
);

CREATE TABLE IF NOT EXISTS cars (
  car_id        INTEGER PRIMARY KEY AUTOINCREMENT,
  make          TEXT NOT NULL,
  model         TEXT NOT NULL,
  year          INTEGER NOT NULL,
  color         TEXT NOT NULL,
  mileage       INTEGER NOT NULL CHECK (mileage >= 0),
  daily_rate    REAL NOT NULL CHECK (daily_rate >= 0),
  available_now INTEGER NOT NULL DEFAULT 1 CHECK (available_now IN (0, 1)),
  min_rent_days INTEGER NOT NULL DEFAULT 1 CHECK (min_rent_days >= 1),
  max_rent_days INTEGER NOT NULL DEFAULT 30,
  CHECK (max_rent_days >= min_rent_days)
);

CREATE TABLE IF NOT EXISTS bookings (
  booking_id  INTEGER PRIMARY KEY AUTOINCREMENT,
  user_id     INTEGER NOT NULL REFERENCES users(user_id) ON DELETE RESTRICT,
  car_id      INTEGER NOT NULL REFERENCES cars(car_id) ON DELETE RESTRICT,
  start_date  DATE NOT NULL,
  end_date    DATE NOT NULL,
  rental_days INTEGER NOT NULL CHECK (rental_days > 0),
  daily_rate  REAL NOT NULL CHECK (daily_rate >= 0),
  total_fee   REAL NOT NULL,
  status      TEXT NOT NULL CHECK (status IN ('pending','approved','rejected')),
  created_at  DATETIME NOT NULL DEFAULT (datetime('now')),
  CHECK (julianday(end_date) > julianday(start_date))
);

CREATE TABLE IF NOT EXISTS booking_charges (
  charge_id   INTEGER PRIMARY KEY AUTOINCREMENT,
  booking_id  INTEGER NOT NULL REFERENCES bookings(booking_id) ON DELETE CASCADE,
  code        TEXT NOT NULL,
  amount      REAL NOT NULL
);

CREATE TABLE IF NOT EXISTS maintenance (
  maint_id    INTEGER PRIMARY KEY AUTOINCREMENT,
  car_id      INTEGER NOT NULL REFERENCES cars(car_id) ON DELETE RESTRICT,
  type        TEXT NOT NULL,
  cost        REAL NOT NULL DEFAULT 0 CHECK (cost >= 0),
  start_date  DATE NOT NULL,
  end_date    DATE,
  notes       TEXT,
  CHECK (end_date IS NULL OR julianday(end_date) >= julianday(start_date))
);

CREATE INDEX IF NOT EXISTS idx_users_email ON users(email);
CREATE INDEX IF NOT EXISTS idx_bk_user ON bookings(user_id);
CREATE INDEX IF NOT EXISTS idx_bk_car_dates_pa
  ON bookings(car_id, start_date, end_date)
  WHERE status IN ('pending','approved');
CREATE INDEX IF NOT EXISTS idx_charges_booking ON booking_charges(booking_id);
CREATE INDEX IF NOT EXISTS idx_m_car_dates
  ON maintenance(car_id, start_date, end_date);

CREATE TRIGGER IF NOT EXISTS bookings_created_pending
BEFORE INSERT ON bookings
WHEN NEW.status <> 'pending'
BEGIN
  SELECT RAISE(ABORT, 'bookings must be created pending');
END;

CREATE TRIGGER IF NOT EXISTS bookings_status_terminal
BEFORE UPDATE OF status ON bookings
WHEN OLD.status <> 'pending' AND NEW.status <> OLD.status
BEGIN
  SELECT RAISE(ABORT, 'approved and rejected bookings cannot change status');
END;

CREATE TRIGGER IF NOT EXISTS bookings_frozen_dates
BEFORE UPDATE OF car_id, start_date, end_date ON bookings
BEGIN
  SELECT RAISE(ABORT, 'the vehicle and dates of a booking cannot change');
END;

CREATE TRIGGER IF NOT EXISTS bookings_approved_exclusive
BEFORE UPDATE OF status ON bookings
WHEN NEW.status = 'approved'
BEGIN
  SELECT RAISE(ABORT, 'approved bookings of a vehicle cannot overlap')
  WHERE EXISTS (
    SELECT 1 FROM bookings AS other
    WHERE other.car_id = NEW.car_id
      AND other.status = 'approved'
      AND other.booking_id <> NEW.booking_id
      AND other.start_date < NEW.end_date
      AND NEW.start_date < other.end_date
  );
END;
)sql";

} // anonymous namespace

//==============================================================================
std::string describe(const std::string& operation, const std::string& details)
{
  return "[rental_booking::" + operation + "] " + details;
}

//==============================================================================
void ConnectionCloser::operator()(sqlite3* connection) const
{
  sqlite3_close_v2(connection);
}

//==============================================================================
void StatementFinalizer::operator()(sqlite3_stmt* statement) const
{
  sqlite3_finalize(statement);
}

//==============================================================================
Statement::Statement(
  sqlite3* connection,
  std::string sql,
  std::string operation)
: _connection(connection),
  _sql(std::move(sql)),
  _operation(std::move(operation))
{
  sqlite3_stmt* raw = nullptr;
  const int result =
    sqlite3_prepare_v2(_connection, _sql.c_str(), -1, &raw, nullptr);
  _statement.reset(raw);

  if (result != SQLITE_OK)
  {
    // *INDENT-OFF*
    throw storage_error(
      describe(_operation, "Failed to prepare statement: "
        + std::string(sqlite3_errmsg(_connection)) + " -- " + _sql),
      sqlite3_extended_errcode(_connection));
    // *INDENT-ON*
  }
}

//==============================================================================
void Statement::_check_bind(const int result, const int index)
{
  if (result == SQLITE_OK)
    return;

  // *INDENT-OFF*
  throw storage_error(
    describe(_operation, "Failed to bind parameter ["
      + std::to_string(index) + "]: " + sqlite3_errmsg(_connection)),
    sqlite3_extended_errcode(_connection));
  // *INDENT-ON*
}

//==============================================================================
Statement& Statement::bind_int(const int index, const int64_t value)
{
  _check_bind(sqlite3_bind_int64(_statement.get(), index, value), index);
  return *this;
}

//==============================================================================
Statement& Statement::bind_id(const int index, const uint64_t value)
{
  if (value > static_cast<uint64_t>(std::numeric_limits<sqlite3_int64>::max()))
  {
    throw storage_error(
      describe(_operation, "Identifier [" + std::to_string(value)
        + "] is out of range"), SQLITE_RANGE);
  }

  return bind_int(index, static_cast<int64_t>(value));
}

//==============================================================================
Statement& Statement::bind_double(const int index, const double value)
{
  _check_bind(sqlite3_bind_double(_statement.get(), index, value), index);
  return *this;
}

//==============================================================================
Statement& Statement::bind_text(const int index, const std::string& value)
{
  _check_bind(
    sqlite3_bind_text(
      _statement.get(), index, value.c_str(),
      static_cast<int>(value.size()), SQLITE_TRANSIENT),
    index);
  return *this;
}

//==============================================================================
Statement& Statement::bind_null(const int index)
{
  _check_bind(sqlite3_bind_null(_statement.get(), index), index);
  return *this;
}

//==============================================================================
Statement& Statement::bind_date(const int index, const Date& value)
{
  return bind_text(index, value.to_string());
}

//==============================================================================
Statement& Statement::bind_optional_text(
  const int index,
  const std::optional<std::string>& value)
{
  if (value.has_value())
    return bind_text(index, *value);

  return bind_null(index);
}

//==============================================================================
Statement& Statement::bind_optional_date(
  const int index,
  const std::optional<Date>& value)
{
  if (value.has_value())
    return bind_date(index, *value);

  return bind_null(index);
}

//==============================================================================
bool Statement::step()
{
  const int result = sqlite3_step(_statement.get());
  if (result == SQLITE_ROW)
    return true;

  if (result == SQLITE_DONE)
    return false;

  // *INDENT-OFF*
  throw storage_error(
    describe(_operation, std::string(sqlite3_errmsg(_connection))
      + " -- " + _sql),
    sqlite3_extended_errcode(_connection));
  // *INDENT-ON*
}

//==============================================================================
void Statement::run()
{
  while (step())
  {
    // Statements that are run for their side effects may still produce rows,
    // e.g. PRAGMA. Those rows are not needed.
  }
}

//==============================================================================
int64_t Statement::column_int(const int column) const
{
  return sqlite3_column_int64(_statement.get(), column);
}

//==============================================================================
uint64_t Statement::column_id(const int column) const
{
  return static_cast<uint64_t>(column_int(column));
}

//==============================================================================
double Statement::column_double(const int column) const
{
  return sqlite3_column_double(_statement.get(), column);
}

//==============================================================================
bool Statement::column_is_null(const int column) const
{
  return sqlite3_column_type(_statement.get(), column) == SQLITE_NULL;
}

//==============================================================================
std::string Statement::column_text(const int column) const
{
  const unsigned char* text = sqlite3_column_text(_statement.get(), column);
  if (!text)
    return std::string();

  const int size = sqlite3_column_bytes(_statement.get(), column);
  return std::string(reinterpret_cast<const char*>(text),
      static_cast<std::size_t>(size));
}

//==============================================================================
std::optional<std::string> Statement::column_optional_text(
  const int column) const
{
  if (column_is_null(column))
    return std::nullopt;

  return column_text(column);
}

//==============================================================================
Date Statement::column_date(const int column) const
{
  return Date::parse(column_text(column));
}

//==============================================================================
std::optional<Date> Statement::column_optional_date(const int column) const
{
  if (column_is_null(column))
    return std::nullopt;

  return column_date(column);
}

//==============================================================================
void bind_all(Statement& statement, const std::vector<Binding>& bindings)
{
  int index = 1;
  for (const auto& binding : bindings)
  {
    if (const auto* i = std::get_if<int64_t>(&binding))
      statement.bind_int(index, *i);
    else if (const auto* d = std::get_if<double>(&binding))
      statement.bind_double(index, *d);
    else
      statement.bind_text(index, std::get<std::string>(binding));

    ++index;
  }
}

//==============================================================================
Database::Implementation::Implementation(Configuration config_)
: config(std::move(config_))
{
  const std::string& path = config.database_path();

  sqlite3* raw = nullptr;
  const int result = sqlite3_open_v2(
    path.c_str(), &raw,
    SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
    nullptr);
  connection.reset(raw);

  if (result != SQLITE_OK)
  {
    const std::string details = connection ?
      sqlite3_errmsg(connection.get()) : sqlite3_errstr(result);

    // *INDENT-OFF*
    throw storage_error(
      describe("Database", "Unable to open [" + path + "]: " + details),
      result);
    // *INDENT-ON*
  }

  sqlite3_extended_result_codes(connection.get(), 1);
  sqlite3_busy_timeout(
    connection.get(), static_cast<int>(config.busy_timeout().count()));

  exec("PRAGMA foreign_keys = ON;", "Database");

  const bool in_memory = path.empty() || path == ":memory:";
  if (config.write_ahead_log() && !in_memory)
    exec("PRAGMA journal_mode = WAL;", "Database");

  if (config.create_schema())
    _initialize_schema();

  logger().debug(describe("Database", "Opened [" + path + "]"));
}

//==============================================================================
void Database::Implementation::exec(
  const std::string& sql,
  const std::string& operation)
{
  char* raw_message = nullptr;
  const int result =
    sqlite3_exec(connection.get(), sql.c_str(), nullptr, nullptr, &raw_message);

  if (result == SQLITE_OK)
    return;

  std::string message = raw_message ?
    raw_message : sqlite3_errmsg(connection.get());
  sqlite3_free(raw_message);

  throw storage_error(
    describe(operation, message),
    sqlite3_extended_errcode(connection.get()));
}

//==============================================================================
const Logger& Database::Implementation::logger() const
{
  return *config.logger();
}

//==============================================================================
Database::Implementation& Database::Implementation::get(Database& database)
{
  return *database._pimpl;
}

//==============================================================================
void Database::Implementation::_initialize_schema()
{
  exec("BEGIN IMMEDIATE;", "Database");
  try
  {
    exec(Schema, "Database");
    exec("COMMIT;", "Database");
  }
  catch (const storage_error&)
  {
    sqlite3_exec(connection.get(), "ROLLBACK;", nullptr, nullptr, nullptr);
    throw;
  }
}

//==============================================================================
Transaction::Transaction(
  Database::Implementation& database,
  const Mode mode,
  std::string operation)
: _database(database),
  _lock(database.mutex),
  _operation(std::move(operation)),
  _open(false)
{
  _database.exec(
    mode == Mode::Write ? "BEGIN IMMEDIATE;" : "BEGIN DEFERRED;",
    _operation);
  _open = true;
}

//==============================================================================
Transaction::~Transaction()
{
  if (!_open)
    return;

  char* raw_message = nullptr;
  const int result = sqlite3_exec(
    _database.connection.get(), "ROLLBACK;", nullptr, nullptr, &raw_message);

  if (result != SQLITE_OK)
  {
    // A destructor cannot report this to the caller, and SQLite rolls the
    // transaction back on its own when the connection is closed.
    _database.logger().error(
      describe(_operation, std::string("Rollback failed: ")
        + (raw_message ? raw_message : sqlite3_errstr(result))));
  }

  sqlite3_free(raw_message);
}

//==============================================================================
Statement Transaction::prepare(const std::string& sql) const
{
  return Statement(_database.connection.get(), sql, _operation);
}

//==============================================================================
int Transaction::changes() const
{
  return sqlite3_changes(_database.connection.get());
}

//==============================================================================
uint64_t Transaction::last_insert_id() const
{
  return static_cast<uint64_t>(
    sqlite3_last_insert_rowid(_database.connection.get()));
}

//==============================================================================
void Transaction::commit()
{
  _database.exec("COMMIT;", _operation);
  _open = false;
}

//==============================================================================
const std::string& Transaction::operation() const
{
  return _operation;
}

//==============================================================================
Database::Database(Configuration config)
: _pimpl(rmf_utils::make_unique_impl<Implementation>(std::move(config)))
{
  // Do nothing
}

//==============================================================================
const Configuration& Database::configuration() const
{
  return _pimpl->config;
}

//==============================================================================
const Logger& Database::logger() const
{
  return _pimpl->logger();
}

//==============================================================================
bool Database::purge_booking(const Actor& actor, const BookingId booking)
{
  const std::string operation = "Database::purge_booking";
  actor.require(Action::PurgeRecords, operation);

  bool purged = false;
  {
    Transaction transaction(*_pimpl, Transaction::Mode::Write, operation);
    transaction.prepare("DELETE FROM bookings WHERE booking_id = ?;")
    .bind_id(1, booking)
    .run();

    purged = transaction.changes() > 0;
    transaction.commit();
  }

  if (purged)
  {
    _pimpl->logger().info(
      describe(operation, "Purged booking [" + std::to_string(booking)
        + "] and its charges"));
  }

  return purged;
}

} // namespace rental_booking
