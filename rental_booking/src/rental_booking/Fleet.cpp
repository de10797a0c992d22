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

#include "internal_Fleet.hpp"
#include "internal_Vehicle.hpp"

#include <stdexcept>

namespace rental_booking {

namespace {

//==============================================================================
// Escape the LIKE wildcards so that the caller's text is matched literally.
std::string like_pattern(const std::string& text)
{
  std::string pattern = "%";
  for (const char c : text)
  {
    if (c == '%' || c == '_' || c == '\\')
      pattern.push_back('\\');

    pattern.push_back(c);
  }

  pattern.push_back('%');
  return pattern;
}

} // anonymous namespace

//==============================================================================
void Fleet::Query::Implementation::append_filters(
  std::string& sql,
  std::vector<Binding>& bindings) const
{
  if (make)
  {
    sql += " AND make LIKE ? ESCAPE '\\'";
    bindings.emplace_back(like_pattern(*make));
  }

  if (model)
  {
    sql += " AND model LIKE ? ESCAPE '\\'";
    bindings.emplace_back(like_pattern(*model));
  }

  if (year_min)
  {
    sql += " AND year >= ?";
    bindings.emplace_back(static_cast<int64_t>(*year_min));
  }

  if (year_max)
  {
    sql += " AND year <= ?";
    bindings.emplace_back(static_cast<int64_t>(*year_max));
  }

  if (max_daily_rate)
  {
    sql += " AND daily_rate <= ?";
    bindings.emplace_back(*max_daily_rate);
  }

  if (available_now)
  {
    sql += " AND available_now = ?";
    bindings.emplace_back(static_cast<int64_t>(*available_now ? 1 : 0));
  }
}

//==============================================================================
Fleet::Query::Query()
: _pimpl(rmf_utils::make_impl<Implementation>())
{
  // Do nothing
}

//==============================================================================
auto Fleet::Query::make(std::string text) -> Query&
{
  _pimpl->make = std::move(text);
  return *this;
}

//==============================================================================
const std::optional<std::string>& Fleet::Query::make() const
{
  return _pimpl->make;
}

//==============================================================================
auto Fleet::Query::model(std::string text) -> Query&
{
  _pimpl->model = std::move(text);
  return *this;
}

//==============================================================================
const std::optional<std::string>& Fleet::Query::model() const
{
  return _pimpl->model;
}

//==============================================================================
auto Fleet::Query::year_min(const int year) -> Query&
{
  _pimpl->year_min = year;
  return *this;
}

//==============================================================================
std::optional<int> Fleet::Query::year_min() const
{
  return _pimpl->year_min;
}

//==============================================================================
auto Fleet::Query::year_max(const int year) -> Query&
{
  _pimpl->year_max = year;
  return *this;
}

//==============================================================================
std::optional<int> Fleet::Query::year_max() const
{
  return _pimpl->year_max;
}

//==============================================================================
auto Fleet::Query::max_daily_rate(const double rate) -> Query&
{
  _pimpl->max_daily_rate = rate;
  return *this;
}

//==============================================================================
std::optional<double> Fleet::Query::max_daily_rate() const
{
  return _pimpl->max_daily_rate;
}

//==============================================================================
auto Fleet::Query::available_now(const bool available) -> Query&
{
  _pimpl->available_now = available;
  return *this;
}

//==============================================================================
std::optional<bool> Fleet::Query::available_now() const
{
  return _pimpl->available_now;
}

//==============================================================================
auto Fleet::Query::min_days(const int64_t days) -> Query&
{
  _pimpl->min_days = days;
  return *this;
}

//==============================================================================
std::optional<int64_t> Fleet::Query::min_days() const
{
  return _pimpl->min_days;
}

//==============================================================================
auto Fleet::Query::max_days(const int64_t days) -> Query&
{
  _pimpl->max_days = days;
  return *this;
}

//==============================================================================
std::optional<int64_t> Fleet::Query::max_days() const
{
  return _pimpl->max_days;
}

//==============================================================================
Database::Implementation& Fleet::Implementation::storage() const
{
  return Database::Implementation::get(*database);
}

//==============================================================================
std::optional<Vehicle> Fleet::Implementation::find(
  const Transaction& transaction,
  const VehicleId id)
{
  auto statement = transaction.prepare(
    std::string("SELECT ") + Vehicle::Implementation::Columns
    + " FROM cars WHERE car_id = ?;");
  statement.bind_id(1, id);

  if (!statement.step())
    return std::nullopt;

  return Vehicle::Implementation::read(statement);
}

//==============================================================================
Vehicle Fleet::Implementation::get(
  const Transaction& transaction,
  const VehicleId id)
{
  auto vehicle = find(transaction, id);
  if (!vehicle)
  {
    throw not_found_error(
      describe(transaction.operation(), "No vehicle with id ["
        + std::to_string(id) + "]"));
  }

  return *std::move(vehicle);
}

//==============================================================================
std::vector<VehicleId> Fleet::Implementation::candidate_ids(
  const Transaction& transaction,
  const DateRange& range,
  const Query& query)
{
  const auto duration = range.duration_days();
  if (!duration)
  {
    throw invalid_range_error(
      describe(transaction.operation(), "Cannot search for vehicles over the "
        "indefinite range " + range.to_string()));
  }

  const int64_t days = *duration;
  if ((query.min_days() && days < *query.min_days())
    || (query.max_days() && *query.max_days() < days))
  {
    return {};
  }

  std::string sql =
    "SELECT car_id FROM cars WHERE available_now = 1"
    " AND min_rent_days <= ? AND max_rent_days >= ?";
  std::vector<Binding> bindings = {days, days};
  Query::Implementation::get(query).append_filters(sql, bindings);
  sql += " ORDER BY car_id;";

  auto statement = transaction.prepare(sql);
  bind_all(statement, bindings);

  std::vector<VehicleId> ids;
  while (statement.step())
    ids.push_back(statement.column_id(0));

  return ids;
}

//==============================================================================
void Fleet::Implementation::write(
  const Transaction& transaction,
  const Vehicle& vehicle)
{
  Vehicle::Implementation::validate(vehicle, transaction.operation());

  transaction.prepare(
    "UPDATE cars SET mileage = ?, daily_rate = ?, available_now = ?, "
    "min_rent_days = ?, max_rent_days = ? WHERE car_id = ?;")
  .bind_int(1, static_cast<int64_t>(vehicle.mileage()))
  .bind_double(2, vehicle.daily_rate())
  .bind_int(3, vehicle.available_now() ? 1 : 0)
  .bind_int(4, vehicle.min_rent_days())
  .bind_int(5, vehicle.max_rent_days())
  .bind_id(6, vehicle.id().value())
  .run();

  if (transaction.changes() == 0)
  {
    throw not_found_error(
      describe(transaction.operation(), "No vehicle with id ["
        + std::to_string(vehicle.id().value()) + "]"));
  }
}

//==============================================================================
Vehicle Fleet::Implementation::modify(
  const Actor& actor,
  const VehicleId id,
  const std::string& operation,
  const std::function<void(Vehicle&)>& change)
{
  actor.require(Action::ManageFleet, operation);

  Transaction transaction(storage(), Transaction::Mode::Write, operation);
  Vehicle vehicle = get(transaction, id);
  change(vehicle);
  write(transaction, vehicle);
  transaction.commit();

  return vehicle;
}

//==============================================================================
Fleet::Fleet(std::shared_ptr<Database> database)
: _pimpl(rmf_utils::make_impl<Implementation>(
      Implementation{std::move(database)}))
{
  // Do nothing
}

//==============================================================================
Vehicle Fleet::add(const Actor& actor, const Vehicle& vehicle)
{
  const std::string operation = "Fleet::add";
  actor.require(Action::ManageFleet, operation);
  Vehicle::Implementation::validate(vehicle, operation);

  VehicleId id = 0;
  std::optional<Vehicle> stored;
  {
    Transaction transaction(
      _pimpl->storage(), Transaction::Mode::Write, operation);

    transaction.prepare(
      "INSERT INTO cars (make, model, year, color, mileage, daily_rate, "
      "available_now, min_rent_days, max_rent_days) "
      "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?);")
    .bind_text(1, vehicle.make())
    .bind_text(2, vehicle.model())
    .bind_int(3, vehicle.year())
    .bind_text(4, vehicle.color())
    .bind_int(5, static_cast<int64_t>(vehicle.mileage()))
    .bind_double(6, vehicle.daily_rate())
    .bind_int(7, vehicle.available_now() ? 1 : 0)
    .bind_int(8, vehicle.min_rent_days())
    .bind_int(9, vehicle.max_rent_days())
    .run();

    id = transaction.last_insert_id();
    stored = Implementation::get(transaction, id);
    transaction.commit();
  }

  _pimpl->database->logger().info(
    describe(operation, "Added vehicle [" + std::to_string(id) + "] "
      + stored->label()));

  return *std::move(stored);
}

//==============================================================================
Vehicle Fleet::get(const VehicleId id) const
{
  Transaction transaction(
    _pimpl->storage(), Transaction::Mode::Read, "Fleet::get");
  return Implementation::get(transaction, id);
}

//==============================================================================
std::optional<Vehicle> Fleet::find(const VehicleId id) const
{
  Transaction transaction(
    _pimpl->storage(), Transaction::Mode::Read, "Fleet::find");
  return Implementation::find(transaction, id);
}

//==============================================================================
std::vector<Vehicle> Fleet::list(const Query& query) const
{
  Transaction transaction(
    _pimpl->storage(), Transaction::Mode::Read, "Fleet::list");

  std::string sql = std::string("SELECT ") + Vehicle::Implementation::Columns
    + " FROM cars WHERE 1 = 1";
  std::vector<Binding> bindings;
  Query::Implementation::get(query).append_filters(sql, bindings);
  sql += " ORDER BY car_id;";

  auto statement = transaction.prepare(sql);
  bind_all(statement, bindings);

  std::vector<Vehicle> vehicles;
  while (statement.step())
    vehicles.push_back(Vehicle::Implementation::read(statement));

  return vehicles;
}

//==============================================================================
Vehicle Fleet::update(const Actor& actor, const Vehicle& vehicle)
{
  const std::string operation = "Fleet::update";
  if (!vehicle.id())
  {
    throw std::invalid_argument(
      describe(operation, "The vehicle [" + vehicle.label()
        + "] has not been added to the fleet"));
  }

  return _pimpl->modify(actor, *vehicle.id(), operation,
      [&vehicle](Vehicle& stored)
      {
        stored
        .set_mileage(vehicle.mileage())
        .set_daily_rate(vehicle.daily_rate())
        .set_available_now(vehicle.available_now())
        .set_rental_days(vehicle.min_rent_days(), vehicle.max_rent_days());
      });
}

//==============================================================================
Vehicle Fleet::set_daily_rate(
  const Actor& actor,
  const VehicleId id,
  const double rate)
{
  return _pimpl->modify(actor, id, "Fleet::set_daily_rate",
      [rate](Vehicle& vehicle) { vehicle.set_daily_rate(rate); });
}

//==============================================================================
Vehicle Fleet::set_available_now(
  const Actor& actor,
  const VehicleId id,
  const bool available)
{
  const std::string operation = "Fleet::set_available_now";
  Vehicle vehicle = _pimpl->modify(actor, id, operation,
      [available](Vehicle& v) { v.set_available_now(available); });

  _pimpl->database->logger().info(
    describe(operation, "Vehicle [" + std::to_string(id) + "] is "
      + (available ? "back on the market" : "off the market")));

  return vehicle;
}

//==============================================================================
Vehicle Fleet::set_rental_days(
  const Actor& actor,
  const VehicleId id,
  const int64_t min_days,
  const int64_t max_days)
{
  return _pimpl->modify(actor, id, "Fleet::set_rental_days",
      [min_days, max_days](Vehicle& vehicle)
      {
        vehicle.set_rental_days(min_days, max_days);
      });
}

//==============================================================================
Vehicle Fleet::set_mileage(
  const Actor& actor,
  const VehicleId id,
  const uint64_t mileage)
{
  return _pimpl->modify(actor, id, "Fleet::set_mileage",
      [mileage](Vehicle& vehicle) { vehicle.set_mileage(mileage); });
}

//==============================================================================
void Fleet::remove(const Actor& actor, const VehicleId id)
{
  const std::string operation = "Fleet::remove";
  actor.require(Action::ManageFleet, operation);

  std::string label;
  {
    Transaction transaction(
      _pimpl->storage(), Transaction::Mode::Write, operation);
    label = Implementation::get(transaction, id).label();

    auto references = transaction.prepare(
      "SELECT (SELECT COUNT(*) FROM bookings WHERE car_id = ?1), "
      "(SELECT COUNT(*) FROM maintenance WHERE car_id = ?1);");
    references.bind_id(1, id);
    if (!references.step())
    {
      throw storage_error(
        describe(operation, "Unable to count the records of vehicle ["
          + std::to_string(id) + "]"), SQLITE_ERROR);
    }

    const int64_t bookings = references.column_int(0);
    const int64_t windows = references.column_int(1);
    if (bookings > 0 || windows > 0)
    {
      throw invalid_state_error(
        describe(operation, "Vehicle [" + std::to_string(id) + "] "
          + label + " is referenced by " + std::to_string(bookings)
          + " booking(s) and " + std::to_string(windows)
          + " maintenance window(s)"));
    }

    transaction.prepare("DELETE FROM cars WHERE car_id = ?;")
    .bind_id(1, id)
    .run();
    transaction.commit();
  }

  _pimpl->database->logger().info(
    describe(operation, "Removed vehicle [" + std::to_string(id) + "] "
      + label));
}

//==============================================================================
std::vector<Vehicle> Fleet::candidates_for(
  const DateRange& range,
  const Query& query) const
{
  Transaction transaction(
    _pimpl->storage(), Transaction::Mode::Read, "Fleet::candidates_for");

  std::vector<Vehicle> vehicles;
  for (const VehicleId id :
    Implementation::candidate_ids(transaction, range, query))
  {
    vehicles.push_back(Implementation::get(transaction, id));
  }

  return vehicles;
}

//==============================================================================
std::vector<VehicleId> Fleet::candidate_ids_for(
  const DateRange& range,
  const Query& query) const
{
  Transaction transaction(
    _pimpl->storage(), Transaction::Mode::Read, "Fleet::candidate_ids_for");
  return Implementation::candidate_ids(transaction, range, query);
}

} // namespace rental_booking
