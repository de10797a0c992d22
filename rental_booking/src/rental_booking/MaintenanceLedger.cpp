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

#include "internal_AvailabilityEngine.hpp"
#include "internal_Fleet.hpp"
#include "internal_MaintenanceLedger.hpp"
#include "internal_MaintenanceWindow.hpp"

#include <cmath>
#include <stdexcept>

namespace rental_booking {

//==============================================================================
MaintenanceLedger::Query::Query()
: _pimpl(rmf_utils::make_impl<Implementation>())
{
  // Do nothing
}

//==============================================================================
auto MaintenanceLedger::Query::open(const bool only_open) -> Query&
{
  _pimpl->open = only_open;
  return *this;
}

//==============================================================================
std::optional<bool> MaintenanceLedger::Query::open() const
{
  return _pimpl->open;
}

//==============================================================================
auto MaintenanceLedger::Query::vehicle(const VehicleId vehicle) -> Query&
{
  _pimpl->vehicle = vehicle;
  return *this;
}

//==============================================================================
std::optional<VehicleId> MaintenanceLedger::Query::vehicle() const
{
  return _pimpl->vehicle;
}

//==============================================================================
auto MaintenanceLedger::Query::order(const Order order) -> Query&
{
  _pimpl->order = order;
  return *this;
}

//==============================================================================
auto MaintenanceLedger::Query::order() const -> Order
{
  return _pimpl->order;
}

//==============================================================================
std::optional<MaintenanceWindow> MaintenanceLedger::Implementation::find(
  const Transaction& transaction,
  const MaintenanceId id)
{
  auto statement = transaction.prepare(
    std::string("SELECT ") + MaintenanceWindow::Implementation::Columns
    + " FROM maintenance WHERE maint_id = ?;");
  statement.bind_id(1, id);

  if (!statement.step())
    return std::nullopt;

  return MaintenanceWindow::Implementation::read(statement);
}

//==============================================================================
MaintenanceWindow MaintenanceLedger::Implementation::get(
  const Transaction& transaction,
  const MaintenanceId id)
{
  auto window = find(transaction, id);
  if (!window)
  {
    throw not_found_error(
      describe(transaction.operation(), "No maintenance window with id ["
        + std::to_string(id) + "]"));
  }

  return *std::move(window);
}

//==============================================================================
MaintenanceLedger::MaintenanceLedger(std::shared_ptr<Database> database)
: _pimpl(rmf_utils::make_impl<Implementation>(
      Implementation{std::move(database)}))
{
  // Do nothing
}

//==============================================================================
auto MaintenanceLedger::open(
  const Actor& actor,
  const VehicleId vehicle,
  std::string type,
  const Date start,
  const double cost,
  std::optional<std::string> notes,
  const std::optional<Date> end) -> Opened
{
  const std::string operation = "MaintenanceLedger::open";
  actor.require(Action::ManageMaintenance, operation);

  if (type.empty())
  {
    throw std::invalid_argument(
      describe(operation, "A maintenance window needs a type"));
  }

  if (!std::isfinite(cost) || cost < 0.0)
  {
    throw std::invalid_argument(
      describe(operation, "Invalid maintenance cost ["
        + std::to_string(cost) + "]"));
  }

  if (end && *end < start)
  {
    throw invalid_range_error(
      describe(operation, "The window cannot end on [" + end->to_string()
        + "] before it starts on [" + start.to_string() + "]"));
  }

  const DateRange blocked = end ?
    DateRange::inclusive(start, *end) : DateRange::indefinite(start);

  std::vector<BookingId> overlapping;
  std::optional<MaintenanceWindow> window;
  {
    Transaction transaction(
      _pimpl->storage(), Transaction::Mode::Write, operation);
    Fleet::Implementation::get(transaction, vehicle);

    for (const Conflict& conflict :
      AvailabilityEngine::Implementation::find_conflicts(
        transaction, vehicle, blocked))
    {
      if (conflict.source == Conflict::Source::Booking)
        overlapping.push_back(conflict.id);
    }

    transaction.prepare(
      "INSERT INTO maintenance (car_id, type, cost, start_date, end_date, notes) "
      "VALUES (?, ?, ?, ?, ?, ?);")
    .bind_id(1, vehicle)
    .bind_text(2, type)
    .bind_double(3, cost)
    .bind_date(4, start)
    .bind_optional_date(5, end)
    .bind_optional_text(6, notes)
    .run();

    window = Implementation::get(transaction, transaction.last_insert_id());
    transaction.commit();
  }

  const Logger& logger = _pimpl->database->logger();
  logger.info(
    describe(operation, "Vehicle [" + std::to_string(vehicle) + "] is in the "
      "workshop for [" + type + "] over " + blocked.to_string()));

  if (!overlapping.empty())
  {
    std::string ids;
    for (const BookingId id : overlapping)
      ids += (ids.empty() ? "" : ", ") + std::to_string(id);

    logger.warn(
      describe(operation, "Maintenance window ["
        + std::to_string(window->id()) + "] overlaps approved booking(s) ["
        + ids + "] of vehicle [" + std::to_string(vehicle)
        + "]; they have not been cancelled"));
  }

  return Opened{*std::move(window), std::move(overlapping)};
}

//==============================================================================
MaintenanceWindow MaintenanceLedger::close(
  const Actor& actor,
  const MaintenanceId id,
  const std::optional<Date> end,
  std::optional<std::string> notes)
{
  const std::string operation = "MaintenanceLedger::close";
  actor.require(Action::ManageMaintenance, operation);

  Date last;
  std::optional<MaintenanceWindow> closed;
  {
    Transaction transaction(
      _pimpl->storage(), Transaction::Mode::Write, operation);
    const MaintenanceWindow window = Implementation::get(transaction, id);

    if (!window.is_open())
    {
      throw invalid_state_error(
        describe(operation, "Maintenance window [" + std::to_string(id)
          + "] was already closed on [" + window.end_date()->to_string() + "]"));
    }

    last = end.value_or(Date::today());
    if (last < window.start_date())
    {
      throw invalid_range_error(
        describe(operation, "Maintenance window [" + std::to_string(id)
          + "] cannot end on [" + last.to_string() + "] before it starts on ["
          + window.start_date().to_string() + "]"));
    }

    transaction.prepare(
      "UPDATE maintenance SET end_date = ?, notes = COALESCE(?, notes) "
      "WHERE maint_id = ?;")
    .bind_date(1, last)
    .bind_optional_text(2, notes)
    .bind_id(3, id)
    .run();

    closed = Implementation::get(transaction, id);
    transaction.commit();
  }

  _pimpl->database->logger().info(
    describe(operation, "Closed maintenance window [" + std::to_string(id)
      + "] of vehicle [" + std::to_string(closed->vehicle()) + "] on ["
      + last.to_string() + "]"));

  return *std::move(closed);
}

//==============================================================================
MaintenanceWindow MaintenanceLedger::get(const MaintenanceId id) const
{
  Transaction transaction(
    _pimpl->storage(), Transaction::Mode::Read, "MaintenanceLedger::get");
  return Implementation::get(transaction, id);
}

//==============================================================================
std::optional<MaintenanceWindow> MaintenanceLedger::find(
  const MaintenanceId id) const
{
  Transaction transaction(
    _pimpl->storage(), Transaction::Mode::Read, "MaintenanceLedger::find");
  return Implementation::find(transaction, id);
}

//==============================================================================
std::vector<MaintenanceWindow> MaintenanceLedger::list(
  const Query& query) const
{
  const auto& filters = Query::Implementation::get(query);

  Transaction transaction(
    _pimpl->storage(), Transaction::Mode::Read, "MaintenanceLedger::list");

  std::string sql = std::string("SELECT ")
    + MaintenanceWindow::Implementation::Columns
    + " FROM maintenance WHERE 1 = 1";

  if (filters.open)
    sql += *filters.open ? " AND end_date IS NULL" : " AND end_date IS NOT NULL";

  if (filters.vehicle)
    sql += " AND car_id = ?";

  if (filters.order == Query::Order::StartAscending)
    sql += " ORDER BY start_date ASC, maint_id ASC;";
  else
    sql += " ORDER BY start_date DESC, maint_id DESC;";

  auto statement = transaction.prepare(sql);
  if (filters.vehicle)
    statement.bind_id(1, *filters.vehicle);

  std::vector<MaintenanceWindow> windows;
  while (statement.step())
    windows.push_back(MaintenanceWindow::Implementation::read(statement));

  return windows;
}

//==============================================================================
std::vector<MaintenanceWindow> MaintenanceLedger::open_windows_for(
  const VehicleId vehicle,
  const DateRange& range) const
{
  Transaction transaction(
    _pimpl->storage(), Transaction::Mode::Read,
    "MaintenanceLedger::open_windows_for");

  std::string sql = std::string("SELECT ")
    + MaintenanceWindow::Implementation::Columns
    + " FROM maintenance WHERE car_id = ?"
    " AND (end_date IS NULL OR end_date >= ?)";
  std::vector<Binding> bindings = {
    static_cast<int64_t>(vehicle), range.start().to_string()};

  if (const auto finish = range.finish())
  {
    sql += " AND start_date < ?";
    bindings.emplace_back(finish->to_string());
  }

  sql += " ORDER BY start_date, maint_id;";

  auto statement = transaction.prepare(sql);
  bind_all(statement, bindings);

  std::vector<MaintenanceWindow> windows;
  while (statement.step())
    windows.push_back(MaintenanceWindow::Implementation::read(statement));

  return windows;
}

} // namespace rental_booking
