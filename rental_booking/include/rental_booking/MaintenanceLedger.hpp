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

#ifndef RENTAL_BOOKING__MAINTENANCELEDGER_HPP
#define RENTAL_BOOKING__MAINTENANCELEDGER_HPP

#include <rental_booking/Database.hpp>
#include <rental_booking/MaintenanceWindow.hpp>
#include <rental_booking/Role.hpp>

#include <rmf_utils/impl_ptr.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace rental_booking {

//==============================================================================
/// Records when vehicles are in the workshop.
class MaintenanceLedger
{
public:

  //============================================================================
  /// The result of opening a maintenance window.
  struct Opened
  {
    /// The window that was recorded
    MaintenanceWindow window;

    /// Approved bookings of the same vehicle that the new window overlaps.
    /// These bookings are not cancelled; an administrator needs to decide what
    /// to do about them before the window begins.
    std::vector<BookingId> overlapping_bookings;
  };

  //============================================================================
  class Query
  {
  public:

    enum class Order : uint8_t
    {
      StartAscending,
      StartDescending
    };

    Query();

    /// Only open windows (true), only closed windows (false). Unset lists
    /// both.
    Query& open(bool only_open);
    std::optional<bool> open() const;

    /// Only windows of this vehicle.
    Query& vehicle(VehicleId vehicle);
    std::optional<VehicleId> vehicle() const;

    /// Sort order. Newest first by default.
    Query& order(Order order);
    Order order() const;

    class Implementation;
  private:
    rmf_utils::impl_ptr<Implementation> _pimpl;
  };

  /// Constructor
  MaintenanceLedger(std::shared_ptr<Database> database);

  /// Record a maintenance window.
  ///
  /// \param[in] actor
  ///   Must be allowed to manage maintenance
  ///
  /// \param[in] vehicle
  ///   The vehicle going into the workshop
  ///
  /// \param[in] type
  ///   The kind of work
  ///
  /// \param[in] start
  ///   The first day the vehicle is unavailable
  ///
  /// \param[in] cost
  ///   Cost of the work, zero if unknown
  ///
  /// \param[in] notes
  ///   Free text
  ///
  /// \param[in] end
  ///   The last day the vehicle is unavailable, if it is already known.
  ///   Leave this unset to open the window indefinitely.
  ///
  /// \throws not_found_error if the vehicle does not exist.
  /// \throws invalid_range_error if `end` is before `start`.
  /// \throws std::invalid_argument if the type is empty or the cost is
  /// negative.
  Opened open(
    const Actor& actor,
    VehicleId vehicle,
    std::string type,
    Date start,
    double cost = 0.0,
    std::optional<std::string> notes = std::nullopt,
    std::optional<Date> end = std::nullopt);

  /// Close an open window.
  ///
  /// \param[in] end
  ///   The last day the vehicle was in the workshop. Today if unset.
  ///
  /// \param[in] notes
  ///   Replaces the window's notes if set.
  ///
  /// \throws not_found_error if there is no such window.
  /// \throws invalid_state_error if the window is already closed.
  /// \throws invalid_range_error if `end` is before the window's start.
  MaintenanceWindow close(
    const Actor& actor,
    MaintenanceId id,
    std::optional<Date> end = std::nullopt,
    std::optional<std::string> notes = std::nullopt);

  /// \throws not_found_error if there is no such window.
  MaintenanceWindow get(MaintenanceId id) const;

  std::optional<MaintenanceWindow> find(MaintenanceId id) const;

  std::vector<MaintenanceWindow> list(const Query& query = Query()) const;

  /// The windows of `vehicle` that overlap `range`, i.e. that start before the
  /// range finishes and are either open or end on or after the range's start.
  /// Ordered by start date.
  std::vector<MaintenanceWindow> open_windows_for(
    VehicleId vehicle,
    const DateRange& range) const;

  class Implementation;
private:
  rmf_utils::impl_ptr<Implementation> _pimpl;
};

} // namespace rental_booking

#endif // RENTAL_BOOKING__MAINTENANCELEDGER_HPP
