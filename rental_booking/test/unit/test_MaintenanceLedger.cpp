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

#include <stdexcept>

using namespace rental_booking;

SCENARIO("Opening and closing maintenance windows")
{
  Fixture f;

  GIVEN("An open-ended window")
  {
    const auto opened = f.maintenance.open(
      f.admin, f.corolla, "repair", date("2025-02-01"), 320.0,
      std::string("cracked windscreen"));

    const MaintenanceWindow& w = opened.window;
    CHECK(w.vehicle() == f.corolla);
    CHECK(w.type() == "repair");
    CHECK(w.cost() == Approx(320.0));
    CHECK(w.start_date() == date("2025-02-01"));
    CHECK(w.is_open());
    CHECK_FALSE(w.end_date());
    REQUIRE(w.notes());
    CHECK(*w.notes() == "cracked windscreen");
    CHECK(w.range() == DateRange::indefinite(date("2025-02-01")));
    CHECK(opened.overlapping_bookings.empty());

    WHEN("It is closed")
    {
      const auto closed = f.maintenance.close(
        f.admin, w.id(), date("2025-02-03"), std::string("replaced"));

      THEN("The end date is the last day in the workshop")
      {
        CHECK_FALSE(closed.is_open());
        REQUIRE(closed.end_date());
        CHECK(*closed.end_date() == date("2025-02-03"));
        CHECK(closed.range() == range("2025-02-01", "2025-02-04"));
        CHECK(*closed.notes() == "replaced");
        CHECK(f.maintenance.get(w.id()).end_date() == date("2025-02-03"));
      }

      THEN("It cannot be closed again")
      {
        CHECK_THROWS_AS(
          f.maintenance.close(f.admin, w.id(), date("2025-02-05")),
          invalid_state_error);
      }
    }

    WHEN("It is closed without new notes")
    {
      const auto closed =
        f.maintenance.close(f.admin, w.id(), date("2025-02-01"));
      CHECK(*closed.notes() == "cracked windscreen");
      CHECK(closed.range().duration_days() == 1);
    }

    WHEN("It is closed before it started")
    {
      CHECK_THROWS_AS(
        f.maintenance.close(f.admin, w.id(), date("2025-01-31")),
        invalid_range_error);
      CHECK(f.maintenance.get(w.id()).is_open());
    }

    WHEN("It is closed without an end date")
    {
      const auto closed = f.maintenance.close(f.admin, w.id());
      CHECK(closed.end_date() == Date::today());
    }
  }

  GIVEN("Invalid requests")
  {
    CHECK_THROWS_AS(
      f.maintenance.open(f.admin, 999, "service", date("2025-02-01")),
      not_found_error);
    CHECK_THROWS_AS(
      f.maintenance.open(f.admin, f.corolla, "service", date("2025-02-01"),
        0.0, std::nullopt, date("2025-01-31")),
      invalid_range_error);
    CHECK_THROWS_AS(
      f.maintenance.open(f.admin, f.corolla, "", date("2025-02-01")),
      std::invalid_argument);
    CHECK_THROWS_AS(
      f.maintenance.open(f.admin, f.corolla, "service", date("2025-02-01"),
        -1.0),
      std::invalid_argument);
    CHECK_THROWS_AS(
      f.maintenance.open(f.alice, f.corolla, "service", date("2025-02-01")),
      permission_error);
    CHECK_THROWS_AS(f.maintenance.get(999), not_found_error);
    CHECK_THROWS_AS(f.maintenance.close(f.admin, 999), not_found_error);
    CHECK(f.maintenance.list().empty());
  }

  GIVEN("A customer")
  {
    const auto id = f.maintenance.open(
      f.admin, f.corolla, "service", date("2025-02-01")).window.id();
    CHECK_THROWS_AS(
      f.maintenance.close(f.alice, id, date("2025-02-02")), permission_error);
    CHECK(f.maintenance.find(id)->is_open());
  }
}

SCENARIO("Maintenance that overlaps approved bookings")
{
  Fixture f;

  const Booking booked = f.approved(f.corolla, range("2025-01-05", "2025-01-10"));
  const auto pending = f.bookings.create(
    f.bob, f.bob.user(), f.corolla, range("2025-01-08", "2025-01-09"));

  WHEN("A window starts during the booking")
  {
    f.log.clear();
    const auto opened = f.maintenance.open(
      f.admin, f.corolla, "WOF", date("2025-01-08"));

    THEN("The booking is reported but not cancelled")
    {
      CHECK(opened.overlapping_bookings == std::vector<BookingId>{booked.id()});
      CHECK(f.bookings.get(f.admin, booked.id()).status()
        == Booking::Status::Approved);
      CHECK(f.log.contains(Logger::Level::Warning, std::to_string(booked.id())));
    }

    THEN("Pending bookings are not reported")
    {
      REQUIRE(opened.overlapping_bookings.size() == 1);
      CHECK(opened.overlapping_bookings.front() != pending.booking.id());
    }
  }

  WHEN("A window ends the day before the booking starts")
  {
    const auto opened = f.maintenance.open(
      f.admin, f.corolla, "service", date("2025-01-01"), 0.0, std::nullopt,
      date("2025-01-04"));
    CHECK(opened.overlapping_bookings.empty());
  }

  WHEN("A window ends on the day the booking starts")
  {
    const auto opened = f.maintenance.open(
      f.admin, f.corolla, "service", date("2025-01-01"), 0.0, std::nullopt,
      date("2025-01-05"));
    CHECK(opened.overlapping_bookings.size() == 1);
  }
}

SCENARIO("Listing maintenance windows")
{
  Fixture f;

  const auto w1 = f.maintenance.open(
    f.admin, f.corolla, "service", date("2025-01-10"), 120.0, std::nullopt,
    date("2025-01-11")).window.id();
  const auto w2 = f.maintenance.open(
    f.admin, f.civic, "repair", date("2025-03-01")).window.id();
  const auto w3 = f.maintenance.open(
    f.admin, f.corolla, "WOF", date("2025-02-01")).window.id();

  const auto ids = [](const std::vector<MaintenanceWindow>& windows)
    {
      std::vector<MaintenanceId> out;
      for (const auto& w : windows)
        out.push_back(w.id());
      return out;
    };

  CHECK(ids(f.maintenance.list()) == std::vector<MaintenanceId>{w2, w3, w1});

  CHECK(ids(f.maintenance.list(MaintenanceLedger::Query().order(
      MaintenanceLedger::Query::Order::StartAscending))) ==
    std::vector<MaintenanceId>{w1, w3, w2});

  CHECK(ids(f.maintenance.list(MaintenanceLedger::Query().open(true))) ==
    std::vector<MaintenanceId>{w2, w3});

  CHECK(ids(f.maintenance.list(MaintenanceLedger::Query().open(false))) ==
    std::vector<MaintenanceId>{w1});

  CHECK(ids(f.maintenance.list(MaintenanceLedger::Query().vehicle(f.corolla)))
    == std::vector<MaintenanceId>{w3, w1});

  CHECK(ids(f.maintenance.list(
      MaintenanceLedger::Query().vehicle(f.corolla).open(true))) ==
    std::vector<MaintenanceId>{w3});

  WHEN("Asking which windows affect a range")
  {
    CHECK(ids(f.maintenance.open_windows_for(
        f.corolla, range("2025-01-01", "2025-01-10"))).empty());
    CHECK(ids(f.maintenance.open_windows_for(
        f.corolla, range("2025-01-11", "2025-01-12"))) ==
      std::vector<MaintenanceId>{w1});
    CHECK(ids(f.maintenance.open_windows_for(
        f.corolla, range("2025-01-12", "2025-02-01"))).empty());
    CHECK(ids(f.maintenance.open_windows_for(
        f.corolla, range("2025-01-01", "2026-01-01"))) ==
      std::vector<MaintenanceId>{w1, w3});
    CHECK(ids(f.maintenance.open_windows_for(
        f.corolla, DateRange::indefinite(date("2025-06-01")))) ==
      std::vector<MaintenanceId>{w3});
  }
}

SCENARIO("Maintenance through the last day of the calendar")
{
  Fixture f;
  const Date last_day = date("9999-12-31");

  GIVEN("A window that is closed on the last day")
  {
    const auto id = f.maintenance.open(
      f.admin, f.corolla, "restoration", date("2025-01-08")).window.id();
    const auto closed = f.maintenance.close(f.admin, id, last_day);

    THEN("It blocks the vehicle from its start onwards")
    {
      CHECK(*closed.end_date() == last_day);
      CHECK(closed.range().is_indefinite());
      CHECK(f.availability.is_available(
          f.corolla, range("2025-01-01", "2025-01-04")));
      CHECK_FALSE(f.availability.is_available(
          f.corolla, range("2030-06-01", "2030-06-05")));

      const auto free = f.availability.search(
        range("2030-06-01", "2030-06-05")).collect();
      for (const Vehicle& v : free)
        CHECK(v.id() != f.corolla);
      CHECK(free.size() == 2);
    }

    THEN("Bookings can still be requested but not approved")
    {
      const auto created = f.bookings.create(
        f.alice, f.alice.user(), f.corolla, range("2030-06-01", "2030-06-05"));
      REQUIRE(created.conflicts.size() == 1);
      CHECK(created.conflicts.front().id == id);
      CHECK_THROWS_AS(
        f.bookings.approve(f.admin, created.booking.id()), conflict_error);
    }
  }

  GIVEN("A window that is opened with the last day as its end")
  {
    const auto opened = f.maintenance.open(
      f.admin, f.hilux, "storage", date("2025-03-01"), 0.0, std::nullopt,
      last_day);

    CHECK(opened.window.range().is_indefinite());
    CHECK_FALSE(f.availability.is_available(
        f.hilux, range("2026-01-01", "2026-01-02")));
    CHECK(f.maintenance.open_windows_for(
        f.hilux, range("2026-01-01", "2026-01-02")).size() == 1);
  }
}
