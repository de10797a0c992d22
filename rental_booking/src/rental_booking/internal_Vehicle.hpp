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

#ifndef SRC__RENTAL_BOOKING__INTERNAL_VEHICLE_HPP
#define SRC__RENTAL_BOOKING__INTERNAL_VEHICLE_HPP

#include <rental_booking/Vehicle.hpp>

#include "internal_Database.hpp"

namespace rental_booking {

//==============================================================================
class Vehicle::Implementation
{
public:

  std::optional<VehicleId> id;
  std::string make;
  std::string model;
  int year;
  std::string color;
  uint64_t mileage;
  double daily_rate;
  bool available_now;
  int64_t min_rent_days;
  int64_t max_rent_days;

  /// The columns that read() expects, in order.
  static const char* const Columns;

  /// Read a vehicle from the current row of a statement that selected
  /// Columns.
  static Vehicle read(const Statement& row);

  /// Throw if the fields cannot be stored.
  static void validate(const Vehicle& vehicle, const std::string& operation);
};

} // namespace rental_booking

#endif // SRC__RENTAL_BOOKING__INTERNAL_VEHICLE_HPP
