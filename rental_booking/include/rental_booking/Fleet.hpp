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

#ifndef RENTAL_BOOKING__FLEET_HPP
#define RENTAL_BOOKING__FLEET_HPP

#include <rental_booking/Database.hpp>
#include <rental_booking/Date.hpp>
#include <rental_booking/Role.hpp>
#include <rental_booking/Vehicle.hpp>

#include <rmf_utils/impl_ptr.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace rental_booking {

//==============================================================================
/// The store of vehicle records.
class Fleet
{
public:

  //============================================================================
  /// Filters for listing vehicles. Every filter is optional; an empty Query
  /// matches every vehicle.
  class Query
  {
  public:

    Query();

    /// Only vehicles whose make contains this text, ignoring case.
    Query& make(std::string text);
    const std::optional<std::string>& make() const;

    /// Only vehicles whose model contains this text, ignoring case.
    Query& model(std::string text);
    const std::optional<std::string>& model() const;

    /// Only vehicles of this model year or newer.
    Query& year_min(int year);
    std::optional<int> year_min() const;

    /// Only vehicles of this model year or older.
    Query& year_max(int year);
    std::optional<int> year_max() const;

    /// Only vehicles that cost at most this much per day.
    Query& max_daily_rate(double rate);
    std::optional<double> max_daily_rate() const;

    /// Only vehicles whose availability flag has this value.
    Query& available_now(bool available);
    std::optional<bool> available_now() const;

    /// When searching by date range, only ranges of at least this many days
    /// are acceptable to the caller.
    Query& min_days(int64_t days);
    std::optional<int64_t> min_days() const;

    /// When searching by date range, only ranges of at most this many days are
    /// acceptable to the caller.
    Query& max_days(int64_t days);
    std::optional<int64_t> max_days() const;

    class Implementation;
  private:
    rmf_utils::impl_ptr<Implementation> _pimpl;
  };

  /// Constructor
  Fleet(std::shared_ptr<Database> database);

  /// Add a vehicle to the fleet.
  ///
  /// \return the stored vehicle, which now has an id.
  ///
  /// \throws permission_error if the actor may not manage the fleet.
  /// \throws invalid_range_error if the rental-day bounds are invalid.
  /// \throws std::invalid_argument if the make or model is empty or the rate
  /// is negative.
  Vehicle add(const Actor& actor, const Vehicle& vehicle);

  /// Get a vehicle.
  ///
  /// \throws not_found_error if there is no such vehicle.
  Vehicle get(VehicleId id) const;

  /// Find a vehicle, if it exists.
  std::optional<Vehicle> find(VehicleId id) const;

  /// List the vehicles that match the query, ordered by id. The min_days and
  /// max_days filters have no effect here.
  std::vector<Vehicle> list(const Query& query = Query()) const;

  /// Write the mutable fields (mileage, daily rate, availability flag and
  /// rental-day bounds) of a stored vehicle.
  ///
  /// \throws std::invalid_argument if the vehicle has no id.
  /// \throws not_found_error if there is no vehicle with that id.
  Vehicle update(const Actor& actor, const Vehicle& vehicle);

  /// Change a vehicle's daily rate. Bookings that already exist keep the rate
  /// they were created with.
  Vehicle set_daily_rate(const Actor& actor, VehicleId id, double rate);

  /// Take a vehicle off the market, or put it back.
  Vehicle set_available_now(const Actor& actor, VehicleId id, bool available);

  /// Change the minimum and maximum number of rental days.
  Vehicle set_rental_days(
    const Actor& actor,
    VehicleId id,
    int64_t min_days,
    int64_t max_days);

  /// Record a new odometer reading.
  Vehicle set_mileage(const Actor& actor, VehicleId id, uint64_t mileage);

  /// Delete a vehicle.
  ///
  /// \throws not_found_error if there is no such vehicle.
  /// \throws invalid_state_error if any booking or maintenance window refers
  /// to the vehicle.
  void remove(const Actor& actor, VehicleId id);

  /// The vehicles that could be rented for `range` as far as their own static
  /// constraints are concerned: the availability flag is set and the range's
  /// duration lies within the vehicle's rental-day bounds. The query's
  /// filters are applied as well. Bookings and maintenance are not considered
  /// here; see AvailabilityEngine::search(). Ordered by id.
  ///
  /// \throws invalid_range_error if the range is indefinite.
  std::vector<Vehicle> candidates_for(
    const DateRange& range,
    const Query& query = Query()) const;

  /// Same as candidates_for() but only returns the ids.
  std::vector<VehicleId> candidate_ids_for(
    const DateRange& range,
    const Query& query = Query()) const;

  class Implementation;
private:
  rmf_utils::impl_ptr<Implementation> _pimpl;
};

} // namespace rental_booking

#endif // RENTAL_BOOKING__FLEET_HPP
