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

#ifndef SRC__RENTAL_BOOKING__INTERNAL_BOOKINGLEDGER_HPP
#define SRC__RENTAL_BOOKING__INTERNAL_BOOKINGLEDGER_HPP

#include <rental_booking/BookingLedger.hpp>
#include <rental_booking/Vehicle.hpp>

#include "internal_Database.hpp"

namespace rental_booking {

//==============================================================================
class BookingLedger::Query::Implementation
{
public:

  std::optional<Booking::Status> status;
  std::optional<VehicleId> vehicle;
  std::optional<UserId> user;

  static const Implementation& get(const Query& query)
  {
    return *query._pimpl;
  }
};

//==============================================================================
class BookingLedger::Implementation
{
public:

  std::shared_ptr<Database> database;

  Database::Implementation& storage() const
  {
    return Database::Implementation::get(*database);
  }

  static std::optional<Booking> find(
    const Transaction& transaction,
    BookingId id);

  /// \throws not_found_error
  static Booking get(const Transaction& transaction, BookingId id);

  /// rental_days * daily_rate plus every charge, rounded to cents.
  static double compute_fee(const Transaction& transaction, BookingId id);

  /// Compute the fee and store it in the booking row.
  static double store_fee(const Transaction& transaction, BookingId id);

  /// Throw unless `vehicle` is on the market and may be rented for `days`.
  static void check_rentable(
    const Vehicle& vehicle,
    const DateRange& range,
    int64_t days,
    const std::string& operation);

  /// Insert a pending booking with its extras and return it as stored.
  static Booking insert(
    const Transaction& transaction,
    UserId user,
    const Vehicle& vehicle,
    const DateRange& range,
    int64_t days,
    const std::vector<Extra>& extras);

  /// Throw unless the actor may read bookings that belong to `owner`.
  static void authorize_read(
    const Actor& actor,
    UserId owner,
    const std::string& operation);

  /// Run a query over bookings and read every row.
  static std::vector<Booking> select(
    const Transaction& transaction,
    const std::string& conditions,
    const std::vector<Binding>& bindings,
    const std::string& order);

  /// Move a pending booking to a terminal status.
  Booking decide(
    const Actor& actor,
    BookingId id,
    Booking::Status status,
    const std::string& operation);
};

} // namespace rental_booking

#endif // SRC__RENTAL_BOOKING__INTERNAL_BOOKINGLEDGER_HPP
