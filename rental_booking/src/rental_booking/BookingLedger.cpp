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
#include "internal_Booking.hpp"
#include "internal_BookingLedger.hpp"
#include "internal_Fleet.hpp"
#include "internal_Users.hpp"

#include <cmath>
#include <stdexcept>

namespace rental_booking {

namespace {

//==============================================================================
void validate_charge(
  const std::string& code,
  const double amount,
  const std::string& operation)
{
  if (code.empty())
  {
    throw std::invalid_argument(
      describe(operation, "A charge needs a code"));
  }

  if (!std::isfinite(amount) || amount < 0.0)
  {
    throw std::invalid_argument(
      describe(operation, "Invalid amount [" + std::to_string(amount)
        + "] for charge [" + code + "]"));
  }
}

//==============================================================================
ChargeId insert_charge(
  const Transaction& transaction,
  const BookingId booking,
  const std::string& code,
  const double amount)
{
  transaction.prepare(
    "INSERT INTO booking_charges (booking_id, code, amount) VALUES (?, ?, ?);")
  .bind_id(1, booking)
  .bind_text(2, code)
  .bind_double(3, amount)
  .run();

  return transaction.last_insert_id();
}

//==============================================================================
std::string describe_conflicts(const std::vector<Conflict>& conflicts)
{
  std::string text;
  for (const auto& conflict : conflicts)
    text += (text.empty() ? "" : "; ") + conflict.to_string();

  return text;
}

} // anonymous namespace

//==============================================================================
bool BookingLedger::Created::available() const
{
  return conflicts.empty();
}

//==============================================================================
BookingLedger::Query::Query()
: _pimpl(rmf_utils::make_impl<Implementation>())
{
  // Do nothing
}

//==============================================================================
auto BookingLedger::Query::status(const Booking::Status status) -> Query&
{
  _pimpl->status = status;
  return *this;
}

//==============================================================================
std::optional<Booking::Status> BookingLedger::Query::status() const
{
  return _pimpl->status;
}

//==============================================================================
auto BookingLedger::Query::vehicle(const VehicleId vehicle) -> Query&
{
  _pimpl->vehicle = vehicle;
  return *this;
}

//==============================================================================
std::optional<VehicleId> BookingLedger::Query::vehicle() const
{
  return _pimpl->vehicle;
}

//==============================================================================
auto BookingLedger::Query::user(const UserId user) -> Query&
{
  _pimpl->user = user;
  return *this;
}

//==============================================================================
std::optional<UserId> BookingLedger::Query::user() const
{
  return _pimpl->user;
}

//==============================================================================
std::optional<Booking> BookingLedger::Implementation::find(
  const Transaction& transaction,
  const BookingId id)
{
  auto statement = transaction.prepare(
    std::string("SELECT ") + Booking::Implementation::Columns
    + " FROM bookings WHERE booking_id = ?;");
  statement.bind_id(1, id);

  if (!statement.step())
    return std::nullopt;

  return Booking::Implementation::read(statement);
}

//==============================================================================
Booking BookingLedger::Implementation::get(
  const Transaction& transaction,
  const BookingId id)
{
  auto booking = find(transaction, id);
  if (!booking)
  {
    throw not_found_error(
      describe(transaction.operation(), "No booking with id ["
        + std::to_string(id) + "]"));
  }

  return *std::move(booking);
}

//==============================================================================
double BookingLedger::Implementation::compute_fee(
  const Transaction& transaction,
  const BookingId id)
{
  auto statement = transaction.prepare(
    "SELECT b.rental_days, b.daily_rate, "
    "(SELECT COALESCE(SUM(c.amount), 0) FROM booking_charges AS c "
    "WHERE c.booking_id = b.booking_id) "
    "FROM bookings AS b WHERE b.booking_id = ?;");
  statement.bind_id(1, id);

  if (!statement.step())
  {
    throw not_found_error(
      describe(transaction.operation(), "No booking with id ["
        + std::to_string(id) + "]"));
  }

  const double base =
    static_cast<double>(statement.column_int(0)) * statement.column_double(1);
  return round_to_cents(base + statement.column_double(2));
}

//==============================================================================
double BookingLedger::Implementation::store_fee(
  const Transaction& transaction,
  const BookingId id)
{
  const double fee = compute_fee(transaction, id);
  transaction.prepare("UPDATE bookings SET total_fee = ? WHERE booking_id = ?;")
  .bind_double(1, fee)
  .bind_id(2, id)
  .run();

  return fee;
}

//==============================================================================
void BookingLedger::Implementation::authorize_read(
  const Actor& actor,
  const UserId owner,
  const std::string& operation)
{
  actor.require(Action::ViewOwnBookings, operation);
  actor.require_owner_or(owner, Action::ViewAllBookings, operation);
}

//==============================================================================
std::vector<Booking> BookingLedger::Implementation::select(
  const Transaction& transaction,
  const std::string& conditions,
  const std::vector<Binding>& bindings,
  const std::string& order)
{
  auto statement = transaction.prepare(
    std::string("SELECT ") + Booking::Implementation::Columns
    + " FROM bookings WHERE " + conditions + " ORDER BY " + order + ";");
  bind_all(statement, bindings);

  std::vector<Booking> bookings;
  while (statement.step())
    bookings.push_back(Booking::Implementation::read(statement));

  return bookings;
}

//==============================================================================
void BookingLedger::Implementation::check_rentable(
  const Vehicle& vehicle,
  const DateRange& range,
  const int64_t days,
  const std::string& operation)
{
  const std::string id = std::to_string(vehicle.id().value());
  if (!vehicle.available_now())
  {
    throw vehicle_unavailable_error(
      describe(operation, "Vehicle [" + id + "] " + vehicle.label()
        + " is not available for rental"));
  }

  if (!vehicle.permits_rental_days(days))
  {
    throw invalid_range_error(
      describe(operation, "Vehicle [" + id + "] can be rented for "
        + std::to_string(vehicle.min_rent_days()) + " to "
        + std::to_string(vehicle.max_rent_days()) + " days, but "
        + range.to_string() + " is " + std::to_string(days) + " days long"));
  }
}

//==============================================================================
Booking BookingLedger::Implementation::insert(
  const Transaction& transaction,
  const UserId user,
  const Vehicle& vehicle,
  const DateRange& range,
  const int64_t days,
  const std::vector<Extra>& extras)
{
  transaction.prepare(
    "INSERT INTO bookings (user_id, car_id, start_date, end_date, "
    "rental_days, daily_rate, total_fee, status) "
    "VALUES (?, ?, ?, ?, ?, ?, ?, 'pending');")
  .bind_id(1, user)
  .bind_id(2, vehicle.id().value())
  .bind_date(3, range.start())
  .bind_date(4, *range.finish())
  .bind_int(5, days)
  .bind_double(6, vehicle.daily_rate())
  .bind_double(7, round_to_cents(
    static_cast<double>(days) * vehicle.daily_rate()))
  .run();

  const BookingId id = transaction.last_insert_id();
  for (const auto& extra : extras)
    insert_charge(transaction, id, extra.code, extra.amount);

  if (!extras.empty())
    store_fee(transaction, id);

  return get(transaction, id);
}

//==============================================================================
Booking BookingLedger::Implementation::decide(
  const Actor& actor,
  const BookingId id,
  const Booking::Status status,
  const std::string& operation)
{
  actor.require(
    status == Booking::Status::Approved ?
    Action::ApproveBooking : Action::RejectBooking,
    operation);

  std::optional<Booking> result;
  std::vector<Conflict> conflicts;
  {
    // IMMEDIATE: no other connection can approve anything between the
    // conflict check and the commit.
    Transaction transaction(storage(), Transaction::Mode::Write, operation);
    const Booking booking = get(transaction, id);

    if (!booking.is_pending())
    {
      throw invalid_state_error(
        describe(operation, "Booking [" + std::to_string(id) + "] is already "
          + to_string(booking.status())));
    }

    if (status == Booking::Status::Approved)
    {
      conflicts = AvailabilityEngine::Implementation::find_conflicts(
        transaction, booking.vehicle(), booking.range(), booking.id());
    }

    if (conflicts.empty())
    {
      try
      {
        transaction.prepare(
          "UPDATE bookings SET status = ? WHERE booking_id = ?;")
        .bind_text(1, to_string(status))
        .bind_id(2, id)
        .run();
      }
      catch (const storage_error& e)
      {
        if (status != Booking::Status::Approved || !e.is_constraint_violation())
          throw;

        throw conflict_error(
          describe(operation, "The store refused to approve booking ["
            + std::to_string(id) + "]: " + e.what()), {});
      }

      result = get(transaction, id);
      transaction.commit();
    }
    else
    {
      result = booking;
    }
  }

  const Booking& decided = *result;
  if (!conflicts.empty())
  {
    const std::string message = describe(operation, "Booking ["
        + std::to_string(id) + "] " + decided.range().to_string()
        + " of vehicle [" + std::to_string(decided.vehicle())
        + "] overlaps " + describe_conflicts(conflicts));

    database->logger().info(message);
    throw conflict_error(message, std::move(conflicts));
  }

  database->logger().info(
    describe(operation, "Booking [" + std::to_string(id) + "] of vehicle ["
      + std::to_string(decided.vehicle()) + "] for "
      + decided.range().to_string() + " is now " + to_string(status)));

  return decided;
}

//==============================================================================
BookingLedger::BookingLedger(std::shared_ptr<Database> database)
: _pimpl(rmf_utils::make_impl<Implementation>(
      Implementation{std::move(database)}))
{
  // Do nothing
}

//==============================================================================
auto BookingLedger::create(
  const Actor& actor,
  const UserId user,
  const VehicleId vehicle_id,
  const DateRange& range,
  const std::vector<Extra>& extras) -> Created
{
  const std::string operation = "BookingLedger::create";
  actor.require(Action::CreateBooking, operation);
  actor.require_owner_or(user, Action::CreateBookingOnBehalf, operation);

  const auto duration = range.duration_days();
  if (!duration)
  {
    throw invalid_range_error(
      describe(operation, "A booking needs a return date, but the range "
        + range.to_string() + " has none"));
  }

  const int64_t days = *duration;
  for (const auto& extra : extras)
    validate_charge(extra.code, extra.amount, operation);

  std::optional<Booking> booking;
  std::optional<Vehicle> vehicle;
  std::vector<Conflict> conflicts;
  {
    Transaction transaction(
      _pimpl->storage(), Transaction::Mode::Write, operation);

    Users::Implementation::get(transaction, user);
    vehicle = Fleet::Implementation::get(transaction, vehicle_id);
    Implementation::check_rentable(*vehicle, range, days, operation);

    // Informational only. Pending bookings are never blocked.
    conflicts = AvailabilityEngine::Implementation::find_conflicts(
      transaction, vehicle_id, range);

    booking = Implementation::insert(
      transaction, user, *vehicle, range, days, extras);
    transaction.commit();
  }

  const BookingId id = booking->id();
  const Logger& logger = _pimpl->database->logger();
  logger.info(
    describe(operation, "User [" + std::to_string(user) + "] requested "
      + vehicle->label() + " [" + std::to_string(vehicle_id) + "] for "
      + range.to_string() + " as booking [" + std::to_string(id) + "]"));

  if (!conflicts.empty())
  {
    logger.warn(
      describe(operation, "Booking [" + std::to_string(id)
        + "] currently overlaps " + describe_conflicts(conflicts)));
  }

  return Created{*std::move(booking), std::move(conflicts)};
}

//==============================================================================
Booking BookingLedger::approve(const Actor& actor, const BookingId booking)
{
  return _pimpl->decide(
    actor, booking, Booking::Status::Approved, "BookingLedger::approve");
}

//==============================================================================
Booking BookingLedger::reject(
  const Actor& actor,
  const BookingId booking,
  std::optional<std::string> reason)
{
  const std::string operation = "BookingLedger::reject";
  Booking rejected =
    _pimpl->decide(actor, booking, Booking::Status::Rejected, operation);

  if (reason)
  {
    _pimpl->database->logger().info(
      describe(operation, "Booking [" + std::to_string(booking)
        + "] was rejected because: " + *reason));
  }

  return rejected;
}

//==============================================================================
BookingCharge BookingLedger::add_charge(
  const Actor& actor,
  const BookingId booking_id,
  std::string code,
  const double amount)
{
  const std::string operation = "BookingLedger::add_charge";
  actor.require(Action::AddCharge, operation);
  validate_charge(code, amount, operation);

  ChargeId id = 0;
  double fee = 0.0;
  {
    Transaction transaction(
      _pimpl->storage(), Transaction::Mode::Write, operation);
    const Booking booking = Implementation::get(transaction, booking_id);

    if (booking.status() == Booking::Status::Rejected)
    {
      throw invalid_state_error(
        describe(operation, "Booking [" + std::to_string(booking_id)
          + "] was rejected and cannot take charges"));
    }

    id = insert_charge(transaction, booking_id, code, amount);
    fee = Implementation::store_fee(transaction, booking_id);
    transaction.commit();
  }

  _pimpl->database->logger().info(
    describe(operation, "Charged [" + code + "] " + std::to_string(amount)
      + " to booking [" + std::to_string(booking_id) + "]; total fee is now "
      + std::to_string(fee)));

  return BookingCharge{id, booking_id, std::move(code), amount};
}

//==============================================================================
std::vector<BookingCharge> BookingLedger::charges(
  const Actor& actor,
  const BookingId booking_id) const
{
  const std::string operation = "BookingLedger::charges";
  Transaction transaction(
    _pimpl->storage(), Transaction::Mode::Read, operation);

  const Booking booking = Implementation::get(transaction, booking_id);
  Implementation::authorize_read(actor, booking.user(), operation);

  auto statement = transaction.prepare(
    "SELECT charge_id, booking_id, code, amount FROM booking_charges "
    "WHERE booking_id = ? ORDER BY charge_id;");
  statement.bind_id(1, booking_id);

  std::vector<BookingCharge> charges;
  while (statement.step())
  {
    charges.push_back(
      BookingCharge{
        statement.column_id(0),
        statement.column_id(1),
        statement.column_text(2),
        statement.column_double(3)
      });
  }

  return charges;
}

//==============================================================================
double BookingLedger::recalculate_fee(
  const Actor& actor,
  const BookingId booking_id)
{
  const std::string operation = "BookingLedger::recalculate_fee";
  actor.require(Action::AddCharge, operation);

  double cached = 0.0;
  double fee = 0.0;
  {
    Transaction transaction(
      _pimpl->storage(), Transaction::Mode::Write, operation);
    cached = Implementation::get(transaction, booking_id).total_fee();
    fee = Implementation::store_fee(transaction, booking_id);
    transaction.commit();
  }

  if (fee != cached)
  {
    _pimpl->database->logger().info(
      describe(operation, "Total fee of booking ["
        + std::to_string(booking_id) + "] corrected from "
        + std::to_string(cached) + " to " + std::to_string(fee)));
  }

  return fee;
}

//==============================================================================
Booking BookingLedger::get(const Actor& actor, const BookingId booking_id) const
{
  const std::string operation = "BookingLedger::get";
  Transaction transaction(
    _pimpl->storage(), Transaction::Mode::Read, operation);

  Booking booking = Implementation::get(transaction, booking_id);
  Implementation::authorize_read(actor, booking.user(), operation);
  return booking;
}

//==============================================================================
std::vector<Booking> BookingLedger::list_for_user(
  const Actor& actor,
  const UserId user) const
{
  const std::string operation = "BookingLedger::list_for_user";
  Implementation::authorize_read(actor, user, operation);

  Transaction transaction(
    _pimpl->storage(), Transaction::Mode::Read, operation);
  return Implementation::select(
    transaction, "user_id = ?", {static_cast<int64_t>(user)},
    "created_at DESC, booking_id DESC");
}

//==============================================================================
std::vector<Booking> BookingLedger::list_pending(const Actor& actor) const
{
  const std::string operation = "BookingLedger::list_pending";
  actor.require(Action::ViewAllBookings, operation);

  Transaction transaction(
    _pimpl->storage(), Transaction::Mode::Read, operation);
  return Implementation::select(
    transaction, "status = 'pending'", {}, "created_at ASC, booking_id ASC");
}

//==============================================================================
std::vector<Booking> BookingLedger::list(
  const Actor& actor,
  const Query& query) const
{
  const std::string operation = "BookingLedger::list";
  const auto& filters = Query::Implementation::get(query);

  if (!actor.can(Action::ViewAllBookings))
  {
    if (!filters.user)
    {
      throw permission_error(
        describe(operation, "User [" + std::to_string(actor.user())
          + "] may only list their own bookings"));
    }

    Implementation::authorize_read(actor, *filters.user, operation);
  }

  std::string conditions = "1 = 1";
  std::vector<Binding> bindings;

  if (filters.status)
  {
    conditions += " AND status = ?";
    bindings.emplace_back(to_string(*filters.status));
  }

  if (filters.vehicle)
  {
    conditions += " AND car_id = ?";
    bindings.emplace_back(static_cast<int64_t>(*filters.vehicle));
  }

  if (filters.user)
  {
    conditions += " AND user_id = ?";
    bindings.emplace_back(static_cast<int64_t>(*filters.user));
  }

  Transaction transaction(
    _pimpl->storage(), Transaction::Mode::Read, operation);
  return Implementation::select(transaction, conditions, bindings, "booking_id");
}

} // namespace rental_booking
