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

#ifndef RENTAL_BOOKING__VEHICLE_HPP
#define RENTAL_BOOKING__VEHICLE_HPP

#include <rental_booking/Identifiers.hpp>

#include <rmf_utils/impl_ptr.hpp>

#include <optional>
#include <string>

namespace rental_booking {

//==============================================================================
/// A vehicle in the rental fleet together with its static rental constraints.
///
/// A Vehicle that has not been added to a Fleet has no id. The identity fields
/// (make, model, year, color) are fixed once the vehicle is stored; the rate,
/// mileage, availability flag and rental-day bounds may be changed by an
/// administrator through the Fleet.
class Vehicle
{
public:

  static constexpr int64_t DefaultMinRentDays = 1;
  static constexpr int64_t DefaultMaxRentDays = 30;

  /// Constructor
  ///
  /// \param[in] make
  ///   Manufacturer, e.g. "Toyota"
  ///
  /// \param[in] model
  ///   Model name, e.g. "Corolla"
  ///
  /// \param[in] year
  ///   Model year
  ///
  /// \param[in] color
  ///   Paint color
  ///
  /// \param[in] mileage
  ///   Odometer reading
  ///
  /// \param[in] daily_rate
  ///   Price per rental day
  Vehicle(
    std::string make,
    std::string model,
    int year,
    std::string color,
    uint64_t mileage,
    double daily_rate);

  /// The id assigned by the Fleet, or std::nullopt if this vehicle has not
  /// been stored.
  std::optional<VehicleId> id() const;

  const std::string& make() const;
  const std::string& model() const;
  int year() const;
  const std::string& color() const;

  uint64_t mileage() const;
  Vehicle& set_mileage(uint64_t mileage);

  double daily_rate() const;
  Vehicle& set_daily_rate(double rate);

  /// The administrator's override. A vehicle that is not available now cannot
  /// be booked for any dates.
  bool available_now() const;
  Vehicle& set_available_now(bool available);

  int64_t min_rent_days() const;
  int64_t max_rent_days() const;
  Vehicle& set_rental_days(int64_t min_days, int64_t max_days);

  /// True if a rental of `days` days respects this vehicle's bounds.
  bool permits_rental_days(int64_t days) const;

  /// "year make model", e.g. "2020 Toyota Corolla"
  std::string label() const;

  class Implementation;
private:
  rmf_utils::impl_ptr<Implementation> _pimpl;
};

} // namespace rental_booking

#endif // RENTAL_BOOKING__VEHICLE_HPP
