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

#ifndef RENTAL_BOOKING__MAINTENANCEWINDOW_HPP
#define RENTAL_BOOKING__MAINTENANCEWINDOW_HPP

#include <rental_booking/Date.hpp>
#include <rental_booking/Identifiers.hpp>

#include <rmf_utils/impl_ptr.hpp>

#include <optional>
#include <string>

namespace rental_booking {

//==============================================================================
/// A period during which a vehicle is in the workshop. A window without an end
/// date is open and blocks the vehicle until it is closed.
class MaintenanceWindow
{
public:

  MaintenanceId id() const;
  VehicleId vehicle() const;

  /// The kind of work, e.g. "service", "repair" or "WOF".
  const std::string& type() const;

  double cost() const;

  /// The first day the vehicle is in the workshop.
  Date start_date() const;

  /// The last day the vehicle is in the workshop, or std::nullopt if the
  /// window is still open.
  const std::optional<Date>& end_date() const;

  const std::optional<std::string>& notes() const;

  /// True if the window has no end date.
  bool is_open() const;

  /// The dates that the window blocks. Indefinite if the window is open.
  DateRange range() const;

  class Implementation;
private:
  MaintenanceWindow();
  rmf_utils::impl_ptr<Implementation> _pimpl;
};

} // namespace rental_booking

#endif // RENTAL_BOOKING__MAINTENANCEWINDOW_HPP
