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

#ifndef RENTAL_BOOKING__CONFLICT_HPP
#define RENTAL_BOOKING__CONFLICT_HPP

#include <rental_booking/Date.hpp>
#include <rental_booking/Identifiers.hpp>

#include <string>

namespace rental_booking {

//==============================================================================
/// A record that occupies a vehicle during a range of dates which overlaps the
/// range that was asked about.
struct Conflict
{
  enum class Source : uint8_t
  {
    /// An approved booking. `id` is a BookingId.
    Booking,

    /// A maintenance window. `id` is a MaintenanceId.
    Maintenance
  };

  Source source;
  uint64_t id;
  DateRange range;

  std::string to_string() const;
};

} // namespace rental_booking

#endif // RENTAL_BOOKING__CONFLICT_HPP
