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

#include "internal_AvailabilityEngine.hpp"
#include "internal_Fleet.hpp"
#include "detail/internal_forward_iterator.hpp"

namespace rental_booking {

//==============================================================================
std::vector<Conflict> AvailabilityEngine::Implementation::find_conflicts(
  const Transaction& transaction,
  const VehicleId vehicle,
  const DateRange& range,
  const std::optional<BookingId> exclude)
{
  const auto finish = range.finish();
  std::vector<Conflict> conflicts;

  // The queries narrow the candidates down using the indexes, and the final
  // decision is always made by DateRange::overlaps.
  std::string booking_sql =
    "SELECT booking_id, start_date, end_date FROM bookings"
    " WHERE car_id = ? AND status = 'approved' AND end_date > ?";
  std::vector<Binding> booking_bindings = {
    static_cast<int64_t>(vehicle), range.start().to_string()};

  if (finish)
  {
    booking_sql += " AND start_date < ?";
    booking_bindings.emplace_back(finish->to_string());
  }

  if (exclude)
  {
    booking_sql += " AND booking_id <> ?";
    booking_bindings.emplace_back(static_cast<int64_t>(*exclude));
  }

  booking_sql += " ORDER BY start_date, booking_id;";

  auto bookings = transaction.prepare(booking_sql);
  bind_all(bookings, booking_bindings);
  while (bookings.step())
  {
    const DateRange booked =
      DateRange::make(bookings.column_date(1), bookings.column_date(2));

    if (overlaps(booked, range))
    {
      conflicts.push_back(
        Conflict{Conflict::Source::Booking, bookings.column_id(0), booked});
    }
  }

  std::string maintenance_sql =
    "SELECT maint_id, start_date, end_date FROM maintenance WHERE car_id = ?";
  std::vector<Binding> maintenance_bindings = {static_cast<int64_t>(vehicle)};

  if (finish)
  {
    maintenance_sql += " AND start_date < ?";
    maintenance_bindings.emplace_back(finish->to_string());
  }

  maintenance_sql += " ORDER BY start_date, maint_id;";

  auto windows = transaction.prepare(maintenance_sql);
  bind_all(windows, maintenance_bindings);
  while (windows.step())
  {
    const Date start = windows.column_date(1);
    const auto last = windows.column_optional_date(2);
    const DateRange blocked = last ?
      DateRange::inclusive(start, *last) : DateRange::indefinite(start);

    if (overlaps(blocked, range))
    {
      conflicts.push_back(
        Conflict{Conflict::Source::Maintenance, windows.column_id(0), blocked});
    }
  }

  return conflicts;
}

//==============================================================================
AvailabilityEngine::SearchView
AvailabilityEngine::SearchView::Implementation::make(
  std::shared_ptr<Database> database,
  DateRange range,
  Fleet::Query filters)
{
  SearchView view;
  view._pimpl = rmf_utils::make_impl<Implementation>(
    Implementation{std::move(database), range, std::move(filters)});

  return view;
}

//==============================================================================
void AvailabilityEngine::SearchView::IterImpl::advance()
{
  current.reset();
  if (!candidates)
    return;

  const int64_t days = duration_days(range);
  while (next < candidates->size())
  {
    const VehicleId id = (*candidates)[next++];

    std::optional<Vehicle> vehicle;
    std::vector<Conflict> conflicts;
    {
      Transaction transaction(
        Database::Implementation::get(*database),
        Transaction::Mode::Read, "AvailabilityEngine::search");

      // The vehicle may have changed since the candidates were listed.
      vehicle = Fleet::Implementation::find(transaction, id);
      if (!vehicle || !vehicle->available_now()
        || !vehicle->permits_rental_days(days))
      {
        continue;
      }

      conflicts = AvailabilityEngine::Implementation::find_conflicts(
        transaction, id, range);
    }

    if (conflicts.empty())
    {
      current = std::move(vehicle);
      return;
    }

    database->logger().debug(
      describe("AvailabilityEngine::search", "Skipping vehicle ["
        + std::to_string(id) + "]: " + conflicts.front().to_string()));
  }
}

//==============================================================================
const Vehicle& AvailabilityEngine::SearchView::IterImpl::dereference() const
{
  return *current;
}

//==============================================================================
void AvailabilityEngine::SearchView::IterImpl::increment()
{
  advance();
}

//==============================================================================
bool AvailabilityEngine::SearchView::IterImpl::equals(
  const IterImpl& other) const
{
  if (!current || !other.current)
    return !current && !other.current;

  return candidates == other.candidates && next == other.next;
}

//==============================================================================
auto AvailabilityEngine::SearchView::begin() const -> const_iterator
{
  std::vector<VehicleId> ids;
  {
    Transaction transaction(
      Database::Implementation::get(*_pimpl->database),
      Transaction::Mode::Read, "AvailabilityEngine::search");

    ids = Fleet::Implementation::candidate_ids(
      transaction, _pimpl->range, _pimpl->filters);
  }

  IterImpl impl{
    _pimpl->database,
    _pimpl->range,
    std::make_shared<const std::vector<VehicleId>>(std::move(ids)),
    0,
    std::nullopt
  };
  impl.advance();

  return const_iterator{std::move(impl)};
}

//==============================================================================
auto AvailabilityEngine::SearchView::end() const -> const_iterator
{
  return const_iterator{
    IterImpl{_pimpl->database, _pimpl->range, nullptr, 0, std::nullopt}};
}

//==============================================================================
const DateRange& AvailabilityEngine::SearchView::range() const
{
  return _pimpl->range;
}

//==============================================================================
std::vector<Vehicle> AvailabilityEngine::SearchView::collect() const
{
  std::vector<Vehicle> vehicles;
  for (const Vehicle& vehicle : *this)
    vehicles.push_back(vehicle);

  return vehicles;
}

//==============================================================================
AvailabilityEngine::SearchView::SearchView()
{
  // Do nothing
}

//==============================================================================
AvailabilityEngine::AvailabilityEngine(std::shared_ptr<Database> database)
: _pimpl(rmf_utils::make_impl<Implementation>(
      Implementation{std::move(database)}))
{
  // Do nothing
}

//==============================================================================
std::vector<Conflict> AvailabilityEngine::conflicts(
  const VehicleId vehicle,
  const DateRange& range,
  const std::optional<BookingId> exclude) const
{
  Transaction transaction(
    Database::Implementation::get(*_pimpl->database),
    Transaction::Mode::Read, "AvailabilityEngine::conflicts");

  Fleet::Implementation::get(transaction, vehicle);
  return Implementation::find_conflicts(transaction, vehicle, range, exclude);
}

//==============================================================================
bool AvailabilityEngine::is_available(
  const VehicleId vehicle,
  const DateRange& range) const
{
  return conflicts(vehicle, range).empty();
}

//==============================================================================
auto AvailabilityEngine::search(
  const DateRange& range,
  const Fleet::Query& filters) const -> SearchView
{
  if (range.is_indefinite())
  {
    throw invalid_range_error(
      describe("AvailabilityEngine::search", "Cannot search over the "
        "indefinite range " + range.to_string()));
  }

  return SearchView::Implementation::make(_pimpl->database, range, filters);
}

namespace detail {

template class forward_iterator<
    const Vehicle,
    AvailabilityEngine::SearchView::IterImpl,
    AvailabilityEngine::SearchView
>;

} // namespace detail
} // namespace rental_booking
