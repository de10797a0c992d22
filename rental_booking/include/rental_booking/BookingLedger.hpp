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

#ifndef RENTAL_BOOKING__BOOKINGLEDGER_HPP
#define RENTAL_BOOKING__BOOKINGLEDGER_HPP

#include <rental_booking/AvailabilityEngine.hpp>
#include <rental_booking/Booking.hpp>
#include <rental_booking/Conflict.hpp>
#include <rental_booking/Database.hpp>
#include <rental_booking/Role.hpp>

#include <rmf_utils/impl_ptr.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace rental_booking {

//==============================================================================
/// Creates bookings and moves them through their status machine.
///
/// Pending bookings may overlap each other freely. Exclusivity is enforced
/// only when a booking is approved: approve() re-checks the booking against
/// every approved booking and maintenance window of the vehicle inside a
/// single write transaction, so when two overlapping requests are approved
/// concurrently only the first one to commit succeeds.
class BookingLedger
{
public:

  //============================================================================
  /// An extra charge requested at creation time.
  struct Extra
  {
    std::string code;
    double amount;
  };

  //============================================================================
  /// The result of creating a booking.
  struct Created
  {
    /// The new pending booking
    Booking booking;

    /// What the booking overlaps at the moment it was created. This is
    /// informational only: approval is where conflicts are enforced, and the
    /// situation may change before then.
    std::vector<Conflict> conflicts;

    /// True if nothing overlapped the booking when it was created.
    bool available() const;
  };

  //============================================================================
  class Query
  {
  public:

    Query();

    /// Only bookings with this status
    Query& status(Booking::Status status);
    std::optional<Booking::Status> status() const;

    /// Only bookings of this vehicle
    Query& vehicle(VehicleId vehicle);
    std::optional<VehicleId> vehicle() const;

    /// Only bookings of this user
    Query& user(UserId user);
    std::optional<UserId> user() const;

    class Implementation;
  private:
    rmf_utils::impl_ptr<Implementation> _pimpl;
  };

  /// Constructor
  BookingLedger(std::shared_ptr<Database> database);

  /// Create a pending booking.
  ///
  /// The rental days, the daily rate and the total fee are computed here from
  /// the stored vehicle; no caller-supplied fee is accepted.
  ///
  /// \param[in] actor
  ///   A customer may only book for themself. An administrator may book on
  ///   behalf of any user.
  ///
  /// \param[in] user
  ///   The user the booking is for
  ///
  /// \param[in] vehicle
  ///   The vehicle to rent
  ///
  /// \param[in] range
  ///   Pick-up date up to (not including) the return date
  ///
  /// \param[in] extras
  ///   Charges to attach to the booking right away
  ///
  /// \throws permission_error if the actor may not create this booking.
  /// \throws not_found_error if the user or the vehicle does not exist.
  /// \throws vehicle_unavailable_error if the vehicle is off the market.
  /// \throws invalid_range_error if the range is indefinite or its length is
  /// outside of the vehicle's rental-day bounds.
  Created create(
    const Actor& actor,
    UserId user,
    VehicleId vehicle,
    const DateRange& range,
    const std::vector<Extra>& extras = {});

  /// Approve a pending booking.
  ///
  /// \throws permission_error if the actor may not approve bookings.
  /// \throws not_found_error if there is no such booking.
  /// \throws invalid_state_error if the booking is not pending.
  /// \throws conflict_error if the booking overlaps an approved booking or a
  /// maintenance window of the same vehicle. The booking stays pending.
  Booking approve(const Actor& actor, BookingId booking);

  /// Reject a pending booking.
  ///
  /// \param[in] reason
  ///   Recorded in the log, if given
  ///
  /// \throws permission_error if the actor may not reject bookings.
  /// \throws not_found_error if there is no such booking.
  /// \throws invalid_state_error if the booking is not pending.
  Booking reject(
    const Actor& actor,
    BookingId booking,
    std::optional<std::string> reason = std::nullopt);

  /// Append a charge to a booking and refresh its total fee.
  ///
  /// \throws permission_error if the actor may not add charges.
  /// \throws not_found_error if there is no such booking.
  /// \throws invalid_state_error if the booking was rejected.
  /// \throws std::invalid_argument if the code is empty or the amount is
  /// negative or not finite.
  BookingCharge add_charge(
    const Actor& actor,
    BookingId booking,
    std::string code,
    double amount);

  /// The charges of a booking, in the order they were added.
  std::vector<BookingCharge> charges(
    const Actor& actor,
    BookingId booking) const;

  /// Recompute a booking's total fee from its rental days, its daily rate and
  /// its charges, and store the result.
  double recalculate_fee(const Actor& actor, BookingId booking);

  /// \throws not_found_error if there is no such booking.
  /// \throws permission_error if a customer asks for someone else's booking.
  Booking get(const Actor& actor, BookingId booking) const;

  /// The bookings of one user, newest first.
  std::vector<Booking> list_for_user(const Actor& actor, UserId user) const;

  /// Every pending booking, oldest first.
  std::vector<Booking> list_pending(const Actor& actor) const;

  /// Every booking that matches the query, ordered by id. Customers must
  /// restrict the query to themselves.
  std::vector<Booking> list(
    const Actor& actor,
    const Query& query = Query()) const;

  class Implementation;
private:
  rmf_utils::impl_ptr<Implementation> _pimpl;
};

} // namespace rental_booking

#endif // RENTAL_BOOKING__BOOKINGLEDGER_HPP
