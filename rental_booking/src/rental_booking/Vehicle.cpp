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

#include "internal_Vehicle.hpp"

#include <cmath>
#include <stdexcept>

namespace rental_booking {

//==============================================================================
const char* const Vehicle::Implementation::Columns =
  "car_id, make, model, year, color, mileage, daily_rate, available_now, "
  "min_rent_days, max_rent_days";

//==============================================================================
Vehicle Vehicle::Implementation::read(const Statement& row)
{
  Vehicle vehicle(
    row.column_text(1),
    row.column_text(2),
    static_cast<int>(row.column_int(3)),
    row.column_text(4),
    static_cast<uint64_t>(row.column_int(5)),
    row.column_double(6));

  vehicle._pimpl->id = row.column_id(0);
  vehicle._pimpl->available_now = row.column_int(7) != 0;
  vehicle._pimpl->min_rent_days = row.column_int(8);
  vehicle._pimpl->max_rent_days = row.column_int(9);
  return vehicle;
}

//==============================================================================
void Vehicle::Implementation::validate(
  const Vehicle& vehicle,
  const std::string& operation)
{
  if (vehicle.make().empty() || vehicle.model().empty())
  {
    throw std::invalid_argument(
      describe(operation, "A vehicle needs a make and a model"));
  }

  const double rate = vehicle.daily_rate();
  if (!std::isfinite(rate) || rate < 0.0)
  {
    throw std::invalid_argument(
      describe(operation, "Invalid daily rate [" + std::to_string(rate)
        + "] for [" + vehicle.label() + "]"));
  }

  if (vehicle.min_rent_days() < 1
    || vehicle.max_rent_days() < vehicle.min_rent_days())
  {
    throw invalid_range_error(
      describe(operation, "Invalid rental-day bounds ["
        + std::to_string(vehicle.min_rent_days()) + ", "
        + std::to_string(vehicle.max_rent_days()) + "] for ["
        + vehicle.label() + "]"));
  }
}

//==============================================================================
Vehicle::Vehicle(
  std::string make,
  std::string model,
  const int year,
  std::string color,
  const uint64_t mileage,
  const double daily_rate)
: _pimpl(rmf_utils::make_impl<Implementation>(
      Implementation{
        std::nullopt,
        std::move(make),
        std::move(model),
        year,
        std::move(color),
        mileage,
        daily_rate,
        true,
        DefaultMinRentDays,
        DefaultMaxRentDays
      }))
{
  // Do nothing
}

//==============================================================================
std::optional<VehicleId> Vehicle::id() const
{
  return _pimpl->id;
}

//==============================================================================
const std::string& Vehicle::make() const
{
  return _pimpl->make;
}

//==============================================================================
const std::string& Vehicle::model() const
{
  return _pimpl->model;
}

//==============================================================================
int Vehicle::year() const
{
  return _pimpl->year;
}

//==============================================================================
const std::string& Vehicle::color() const
{
  return _pimpl->color;
}

//==============================================================================
uint64_t Vehicle::mileage() const
{
  return _pimpl->mileage;
}

//==============================================================================
Vehicle& Vehicle::set_mileage(const uint64_t mileage)
{
  _pimpl->mileage = mileage;
  return *this;
}

//==============================================================================
double Vehicle::daily_rate() const
{
  return _pimpl->daily_rate;
}

//==============================================================================
Vehicle& Vehicle::set_daily_rate(const double rate)
{
  _pimpl->daily_rate = rate;
  return *this;
}

//==============================================================================
bool Vehicle::available_now() const
{
  return _pimpl->available_now;
}

//==============================================================================
Vehicle& Vehicle::set_available_now(const bool available)
{
  _pimpl->available_now = available;
  return *this;
}

//==============================================================================
int64_t Vehicle::min_rent_days() const
{
  return _pimpl->min_rent_days;
}

//==============================================================================
int64_t Vehicle::max_rent_days() const
{
  return _pimpl->max_rent_days;
}

//==============================================================================
Vehicle& Vehicle::set_rental_days(const int64_t min_days, const int64_t max_days)
{
  _pimpl->min_rent_days = min_days;
  _pimpl->max_rent_days = max_days;
  return *this;
}

//==============================================================================
bool Vehicle::permits_rental_days(const int64_t days) const
{
  return _pimpl->min_rent_days <= days && days <= _pimpl->max_rent_days;
}

//==============================================================================
std::string Vehicle::label() const
{
  return std::to_string(_pimpl->year) + " " + _pimpl->make + " "
    + _pimpl->model;
}

} // namespace rental_booking
