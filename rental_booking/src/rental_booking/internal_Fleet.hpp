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

#ifndef SRC__RENTAL_BOOKING__INTERNAL_FLEET_HPP
#define SRC__RENTAL_BOOKING__INTERNAL_FLEET_HPP

#include <rental_booking/Fleet.hpp>

#include "internal_Database.hpp"

#include <functional>

namespace rental_booking {

//==============================================================================
class Fleet::Query::Implementation
{
public:

  std::optional<std::string> make;
  std::optional<std::string> model;
  std::optional<int> year_min;
  std::optional<int> year_max;
  std::optional<double> max_daily_rate;
  std::optional<bool> available_now;
  std::optional<int64_t> min_days;
  std::optional<int64_t> max_days;

  /// Append the SQL conditions of the vehicle filters, each prefixed with
  /// " AND ", and their bindings. The day filters are not included.
  void append_filters(std::string& sql, std::vector<Binding>& bindings) const;

  static const Implementation& get(const Query& query)
  {
    return *query._pimpl;
  }
};

//==============================================================================
class Fleet::Implementation
{
public:

  std::shared_ptr<Database> database;

  Database::Implementation& storage() const;

  /// Load a vehicle within an open transaction.
  static std::optional<Vehicle> find(
    const Transaction& transaction,
    VehicleId id);

  /// Same as find() but throws not_found_error.
  static Vehicle get(const Transaction& transaction, VehicleId id);

  /// The ids of the vehicles that could be rented for a finite range,
  /// considering only their own constraints and the query's filters.
  static std::vector<VehicleId> candidate_ids(
    const Transaction& transaction,
    const DateRange& range,
    const Query& query);

  /// Load a vehicle, apply `change` to it and write it back, all within one
  /// write transaction.
  Vehicle modify(
    const Actor& actor,
    VehicleId id,
    const std::string& operation,
    const std::function<void(Vehicle&)>& change);

  static void write(const Transaction& transaction, const Vehicle& vehicle);
};

} // namespace rental_booking

#endif // SRC__RENTAL_BOOKING__INTERNAL_FLEET_HPP
