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

#ifndef RENTAL_BOOKING__AVAILABILITYENGINE_HPP
#define RENTAL_BOOKING__AVAILABILITYENGINE_HPP

#include <rental_booking/Conflict.hpp>
#include <rental_booking/Database.hpp>
#include <rental_booking/Date.hpp>
#include <rental_booking/Fleet.hpp>
#include <rental_booking/Vehicle.hpp>
#include <rental_booking/detail/forward_iterator.hpp>

#include <rmf_utils/impl_ptr.hpp>

#include <memory>
#include <optional>
#include <vector>

namespace rental_booking {

//==============================================================================
/// Answers whether vehicles are free for a range of dates.
///
/// A vehicle is free for a range when none of its approved bookings and none
/// of its maintenance windows overlap the range. Pending and rejected bookings
/// never make a vehicle unavailable.
///
/// The same conflict check backs the informational check that runs when a
/// booking is created and the authoritative check that runs when a booking is
/// approved.
class AvailabilityEngine
{
public:

  template<typename E, typename I, typename F>
  using base_iterator = rental_booking::detail::forward_iterator<E, I, F>;

  //============================================================================
  /// A lazy sequence of the vehicles that are free for a range, ordered by
  /// vehicle id.
  ///
  /// Nothing is read from the store until begin() is called. Each call to
  /// begin() runs the candidate query again, so a view can be iterated more
  /// than once and each pass sees the store as it is at that time. Each
  /// vehicle's availability is checked when the iterator reaches it.
  class SearchView
  {
  public:

    class IterImpl;
    using const_iterator = base_iterator<const Vehicle, IterImpl, SearchView>;
    using iterator = const_iterator;

    /// Start a new pass over the free vehicles.
    const_iterator begin() const;

    /// The iterator that every finished pass reaches.
    const_iterator end() const;

    /// The range that is being searched.
    const DateRange& range() const;

    /// Run a full pass and collect the vehicles.
    std::vector<Vehicle> collect() const;

    class Implementation;
  private:
    SearchView();
    rmf_utils::impl_ptr<Implementation> _pimpl;
  };

  /// Constructor
  AvailabilityEngine(std::shared_ptr<Database> database);

  /// Every approved booking and maintenance window of `vehicle` that overlaps
  /// `range`, bookings first, each group ordered by start date.
  ///
  /// \param[in] vehicle
  ///   The vehicle to check
  ///
  /// \param[in] range
  ///   The dates being asked about
  ///
  /// \param[in] exclude
  ///   A booking to leave out of the check, typically the one being approved
  ///
  /// \throws not_found_error if the vehicle does not exist.
  std::vector<Conflict> conflicts(
    VehicleId vehicle,
    const DateRange& range,
    std::optional<BookingId> exclude = std::nullopt) const;

  /// True if no approved booking and no maintenance window of `vehicle`
  /// overlaps `range`.
  ///
  /// \throws not_found_error if the vehicle does not exist.
  bool is_available(VehicleId vehicle, const DateRange& range) const;

  /// The vehicles that can be booked for `range` and that are free for it.
  /// Candidates come from Fleet::candidates_for(), so vehicles that are off
  /// the market or whose rental-day bounds exclude the range's length are not
  /// included.
  ///
  /// \throws invalid_range_error if the range is indefinite.
  SearchView search(
    const DateRange& range,
    const Fleet::Query& filters = Fleet::Query()) const;

  class Implementation;
private:
  rmf_utils::impl_ptr<Implementation> _pimpl;
};

namespace detail {

extern template class forward_iterator<
    const Vehicle,
    AvailabilityEngine::SearchView::IterImpl,
    AvailabilityEngine::SearchView
>;

} // namespace detail
} // namespace rental_booking

#endif // RENTAL_BOOKING__AVAILABILITYENGINE_HPP
