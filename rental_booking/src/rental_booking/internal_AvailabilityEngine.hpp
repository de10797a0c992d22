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

#ifndef SRC__RENTAL_BOOKING__INTERNAL_AVAILABILITYENGINE_HPP
#define SRC__RENTAL_BOOKING__INTERNAL_AVAILABILITYENGINE_HPP

#include <rental_booking/AvailabilityEngine.hpp>

#include "internal_Database.hpp"

namespace rental_booking {

//==============================================================================
class AvailabilityEngine::Implementation
{
public:

  std::shared_ptr<Database> database;

  /// Every approved booking (other than `exclude`) and every maintenance
  /// window of `vehicle` that overlaps `range`. Bookings come first, and each
  /// group is ordered by start date.
  ///
  /// This is the only conflict check. It runs inside whatever transaction the
  /// caller has open, so inside a write transaction its answer stays valid
  /// until that transaction commits. The vehicle is not looked up here.
  static std::vector<Conflict> find_conflicts(
    const Transaction& transaction,
    VehicleId vehicle,
    const DateRange& range,
    std::optional<BookingId> exclude = std::nullopt);
};

//==============================================================================
class AvailabilityEngine::SearchView::Implementation
{
public:

  std::shared_ptr<Database> database;
  DateRange range;
  Fleet::Query filters;

  static SearchView make(
    std::shared_ptr<Database> database,
    DateRange range,
    Fleet::Query filters);
};

//==============================================================================
class AvailabilityEngine::SearchView::IterImpl
{
public:

  std::shared_ptr<Database> database;
  DateRange range;

  /// Shared by every copy of an iterator from the same pass.
  std::shared_ptr<const std::vector<VehicleId>> candidates;

  /// Index of the next candidate to check.
  std::size_t next = 0;

  /// The vehicle the iterator is on, or nothing when the pass is finished.
  std::optional<Vehicle> current;

  /// Move to the next candidate that is free for the range.
  void advance();

  const Vehicle& dereference() const;
  void increment();
  bool equals(const IterImpl& other) const;
};

} // namespace rental_booking

#endif // SRC__RENTAL_BOOKING__INTERNAL_AVAILABILITYENGINE_HPP
