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

#ifndef RENTAL_BOOKING__BOOKING_HPP
#define RENTAL_BOOKING__BOOKING_HPP

#include <rental_booking/Date.hpp>
#include <rental_booking/Identifiers.hpp>

#include <rmf_utils/impl_ptr.hpp>

#include <optional>
#include <string>

namespace rental_booking {

//==============================================================================
/// A line item added to a booking's fee, e.g. a late fee or a child seat.
struct BookingCharge
{
  ChargeId id;
  BookingId booking;
  std::string code;
  double amount;
};

//==============================================================================
/// A request to rent one vehicle for a range of dates.
///
/// Bookings are created pending. An administrator moves them to approved or
/// rejected exactly once; neither of those states can be left again.
class Booking
{
public:

  enum class Status : uint8_t
  {
    Pending,
    Approved,
    Rejected
  };

  BookingId id() const;
  UserId user() const;
  VehicleId vehicle() const;

  /// The rental period, from the pick-up date up to (not including) the
  /// return date.
  const DateRange& range() const;

  Date start_date() const;
  Date end_date() const;

  /// The number of days charged, always equal to the length of range().
  int64_t rental_days() const;

  /// The vehicle's daily rate at the time the booking was created.
  double daily_rate() const;

  /// The base fee, rental_days() * daily_rate(), rounded to cents.
  double base_fee() const;

  /// The base fee plus every charge, rounded to cents.
  double total_fee() const;

  Status status() const;

  bool is_pending() const;

  /// The time the booking was created, as `YYYY-MM-DD HH:MM:SS` UTC.
  const std::string& created_at() const;

  class Implementation;
private:
  Booking();
  rmf_utils::impl_ptr<Implementation> _pimpl;
};

/// "pending", "approved" or "rejected"
std::string to_string(Booking::Status status);

/// Inverse of to_string(Booking::Status)
std::optional<Booking::Status> status_from_string(const std::string& name);

/// Round a currency amount to whole cents.
double round_to_cents(double amount);

} // namespace rental_booking

#endif // RENTAL_BOOKING__BOOKING_HPP
