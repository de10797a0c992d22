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

#include "utils_Fixture.hpp"

#include <rental_booking/Error.hpp>

using namespace rental_booking;

SCENARIO("Availability around a booking and an open maintenance window")
{
  Fixture f;

  const Booking booked = f.approved(f.corolla, range("2025-01-05", "2025-01-10"));
  const auto window = f.maintenance.open(
    f.admin, f.corolla, "repair", date("2025-01-08")).window;

  CHECK(f.availability.is_available(f.corolla, range("2025-01-01", "2025-01-04")));
  CHECK(f.availability.is_available(f.corolla, range("2025-01-01", "2025-01-05")));
  CHECK_FALSE(
    f.availability.is_available(f.corolla, range("2025-01-09", "2025-01-12")));
  CHECK_FALSE(
    f.availability.is_available(f.corolla, range("2030-01-01", "2030-01-02")));

  THEN("Conflicts list bookings first, then maintenance")
  {
    const auto conflicts =
      f.availability.conflicts(f.corolla, range("2025-01-09", "2025-01-12"));
    REQUIRE(conflicts.size() == 2);
    CHECK(conflicts[0].source == Conflict::Source::Booking);
    CHECK(conflicts[0].id == booked.id());
    CHECK(conflicts[1].source == Conflict::Source::Maintenance);
    CHECK(conflicts[1].id == window.id());
    CHECK(conflicts[1].range.is_indefinite());
  }

  THEN("A booking can be left out of the check")
  {
    const auto conflicts = f.availability.conflicts(
      f.corolla, range("2025-01-05", "2025-01-07"), booked.id());
    CHECK(conflicts.empty());
  }

  THEN("Other vehicles are unaffected")
  {
    CHECK(f.availability.is_available(f.hilux, range("2025-01-09", "2025-01-12")));
  }

  THEN("Unknown vehicles are reported")
  {
    CHECK_THROWS_AS(
      f.availability.is_available(999, range("2025-01-01", "2025-01-04")),
      not_found_error);
  }

  WHEN("The maintenance window is closed")
  {
    f.maintenance.close(f.admin, window.id(), date("2025-01-08"));
    CHECK(f.availability.is_available(
        f.corolla, range("2025-01-10", "2025-01-12")));
    CHECK_FALSE(f.availability.is_available(
        f.corolla, range("2025-01-09", "2025-01-12")));
  }
}

SCENARIO("Pending and rejected bookings never block availability")
{
  Fixture f;

  const auto pending = f.bookings.create(
    f.alice, f.alice.user(), f.hilux, range("2025-01-05", "2025-01-10"));
  const auto rejected = f.bookings.create(
    f.bob, f.bob.user(), f.hilux, range("2025-01-05", "2025-01-10"));
  f.bookings.reject(f.admin, rejected.booking.id());

  CHECK(f.availability.is_available(f.hilux, range("2025-01-05", "2025-01-10")));
  CHECK(f.availability.conflicts(
      f.hilux, pending.booking.range()).empty());
}

SCENARIO("Searching for free vehicles")
{
  Fixture f;

  const auto dates = range("2025-01-05", "2025-01-10");

  const auto ids = [](const AvailabilityEngine::SearchView& view)
    {
      std::vector<VehicleId> out;
      for (const auto& vehicle : view)
        out.push_back(*vehicle.id());
      return out;
    };

  GIVEN("An idle fleet")
  {
    const auto view = f.availability.search(dates);
    CHECK(view.range() == dates);
    CHECK(ids(view) == std::vector<VehicleId>{f.corolla, f.civic, f.hilux});
  }

  GIVEN("A booked vehicle, a vehicle in the workshop and one off the market")
  {
    const auto extra = f.add_vehicle(
      Vehicle("Mazda", "3", 2022, "red", 1000, 45.0));
    const auto spare = f.add_vehicle(
      Vehicle("Suzuki", "Swift", 2018, "green", 88000, 35.0));

    f.approved(f.corolla, range("2025-01-08", "2025-01-09"));
    f.maintenance.open(f.admin, f.civic, "service", date("2025-01-01"), 0.0,
      std::nullopt, date("2025-01-05"));
    f.fleet.set_available_now(f.admin, extra, false);

    THEN("Only the free vehicles are listed, ordered by id")
    {
      CHECK(ids(f.availability.search(dates)) ==
        std::vector<VehicleId>{f.hilux, spare});
    }

    THEN("Filters are applied")
    {
      CHECK(ids(f.availability.search(dates, Fleet::Query().make("suz"))) ==
        std::vector<VehicleId>{spare});
      CHECK(ids(f.availability.search(
          dates, Fleet::Query().max_daily_rate(40.0))) ==
        std::vector<VehicleId>{spare});
    }
  }

  GIVEN("A range outside a vehicle's rental-day bounds")
  {
    CHECK(ids(f.availability.search(range("2025-01-05", "2025-01-07"))) ==
      std::vector<VehicleId>{f.corolla, f.hilux});
  }

  GIVEN("A view that is iterated more than once")
  {
    const auto view = f.availability.search(dates);
    const auto first_pass = view.collect();
    CHECK(first_pass.size() == 3);

    f.approved(f.hilux, dates);

    THEN("Each pass sees the current state of the store")
    {
      CHECK(ids(view) == std::vector<VehicleId>{f.corolla, f.civic});
    }
  }

  GIVEN("A lazy pass")
  {
    const auto view = f.availability.search(dates);
    auto it = view.begin();
    REQUIRE(it != view.end());
    CHECK(*it->id() == f.corolla);

    // Booking the next candidate after the pass began still removes it,
    // because availability is checked as the iterator advances.
    f.approved(f.civic, dates);

    ++it;
    REQUIRE(it != view.end());
    CHECK(it->id() == f.hilux);

    auto copy = it++;
    CHECK(copy->id() == f.hilux);
    CHECK(it == view.end());
    CHECK(copy != it);
  }

  GIVEN("An indefinite range")
  {
    CHECK_THROWS_AS(
      f.availability.search(DateRange::indefinite(date("2025-01-01"))),
      invalid_range_error);
  }
}
