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

#include <limits>
#include <stdexcept>

using namespace rental_booking;

SCENARIO("Adding and reading vehicles")
{
  Fixture f;

  const Vehicle corolla = f.fleet.get(f.corolla);
  REQUIRE(corolla.id());
  CHECK(*corolla.id() == f.corolla);
  CHECK(corolla.make() == "Toyota");
  CHECK(corolla.model() == "Corolla");
  CHECK(corolla.year() == 2020);
  CHECK(corolla.color() == "white");
  CHECK(corolla.mileage() == 42000);
  CHECK(corolla.daily_rate() == Approx(50.0));
  CHECK(corolla.available_now());
  CHECK(corolla.min_rent_days() == Vehicle::DefaultMinRentDays);
  CHECK(corolla.max_rent_days() == Vehicle::DefaultMaxRentDays);
  CHECK(corolla.label() == "2020 Toyota Corolla");

  const Vehicle civic = f.fleet.get(f.civic);
  CHECK(civic.min_rent_days() == 3);
  CHECK(civic.max_rent_days() == 14);
  CHECK_FALSE(civic.permits_rental_days(2));
  CHECK(civic.permits_rental_days(3));
  CHECK(civic.permits_rental_days(14));
  CHECK_FALSE(civic.permits_rental_days(15));

  CHECK_FALSE(f.fleet.find(999));
  CHECK_THROWS_AS(f.fleet.get(999), not_found_error);

  WHEN("A vehicle is invalid")
  {
    CHECK_THROWS_AS(
      f.fleet.add(f.admin, Vehicle("", "Model", 2020, "red", 0, 10.0)),
      std::invalid_argument);
    CHECK_THROWS_AS(
      f.fleet.add(f.admin, Vehicle("Make", "Model", 2020, "red", 0, -1.0)),
      std::invalid_argument);
    CHECK_THROWS_AS(
      f.fleet.add(f.admin, Vehicle("Make", "Model", 2020, "red", 0,
        std::numeric_limits<double>::quiet_NaN())),
      std::invalid_argument);
    CHECK_THROWS_AS(
      f.fleet.add(f.admin, Vehicle("Make", "Model", 2020, "red", 0, 10.0)
        .set_rental_days(0, 5)),
      invalid_range_error);
    CHECK_THROWS_AS(
      f.fleet.add(f.admin, Vehicle("Make", "Model", 2020, "red", 0, 10.0)
        .set_rental_days(5, 4)),
      invalid_range_error);
    CHECK(f.fleet.list().size() == 3);
  }

  WHEN("A customer tries to change the fleet")
  {
    CHECK_THROWS_AS(
      f.fleet.add(f.alice, Vehicle("Mazda", "3", 2022, "red", 0, 45.0)),
      permission_error);
    CHECK_THROWS_AS(f.fleet.set_daily_rate(f.alice, f.corolla, 1.0),
      permission_error);
    CHECK_THROWS_AS(f.fleet.remove(f.alice, f.corolla), permission_error);
    CHECK(f.fleet.get(f.corolla).daily_rate() == Approx(50.0));
  }
}

SCENARIO("Listing vehicles with filters")
{
  Fixture f;

  const auto ids = [](const std::vector<Vehicle>& vehicles)
    {
      std::vector<VehicleId> out;
      for (const auto& v : vehicles)
        out.push_back(*v.id());
      return out;
    };

  CHECK(ids(f.fleet.list()) ==
    std::vector<VehicleId>{f.corolla, f.civic, f.hilux});

  CHECK(ids(f.fleet.list(Fleet::Query().make("toy"))) ==
    std::vector<VehicleId>{f.corolla, f.hilux});

  CHECK(ids(f.fleet.list(Fleet::Query().model("CIVIC"))) ==
    std::vector<VehicleId>{f.civic});

  CHECK(ids(f.fleet.list(Fleet::Query().year_min(2020))) ==
    std::vector<VehicleId>{f.corolla, f.hilux});

  CHECK(ids(f.fleet.list(Fleet::Query().year_min(2020).year_max(2020))) ==
    std::vector<VehicleId>{f.corolla});

  CHECK(ids(f.fleet.list(Fleet::Query().max_daily_rate(60.0))) ==
    std::vector<VehicleId>{f.corolla, f.civic});

  CHECK(f.fleet.list(Fleet::Query().make("%")).empty());

  f.fleet.set_available_now(f.admin, f.hilux, false);
  CHECK(ids(f.fleet.list(Fleet::Query().available_now(false))) ==
    std::vector<VehicleId>{f.hilux});
  CHECK(ids(f.fleet.list(Fleet::Query().available_now(true))) ==
    std::vector<VehicleId>{f.corolla, f.civic});
}

SCENARIO("Administrators change the mutable fields of a vehicle")
{
  Fixture f;

  WHEN("Targeted setters are used")
  {
    CHECK(f.fleet.set_daily_rate(f.admin, f.corolla, 55.5).daily_rate()
      == Approx(55.5));
    CHECK(f.fleet.set_mileage(f.admin, f.corolla, 43000).mileage() == 43000);
    CHECK_FALSE(
      f.fleet.set_available_now(f.admin, f.corolla, false).available_now());
    CHECK(f.log.contains(Logger::Level::Info, "off the market"));

    const Vehicle v = f.fleet.set_rental_days(f.admin, f.corolla, 2, 10);
    CHECK(v.min_rent_days() == 2);
    CHECK(v.max_rent_days() == 10);

    CHECK_THROWS_AS(
      f.fleet.set_rental_days(f.admin, f.corolla, 10, 2),
      invalid_range_error);
    CHECK_THROWS_AS(
      f.fleet.set_daily_rate(f.admin, f.corolla, -5.0),
      std::invalid_argument);
    CHECK_THROWS_AS(
      f.fleet.set_daily_rate(f.admin, 999, 5.0), not_found_error);

    const Vehicle stored = f.fleet.get(f.corolla);
    CHECK(stored.daily_rate() == Approx(55.5));
    CHECK(stored.min_rent_days() == 2);
  }

  WHEN("A whole vehicle is updated")
  {
    Vehicle v = f.fleet.get(f.hilux);
    v.set_daily_rate(99.0).set_mileage(16000).set_rental_days(2, 7);
    f.fleet.update(f.admin, v);

    const Vehicle stored = f.fleet.get(f.hilux);
    CHECK(stored.daily_rate() == Approx(99.0));
    CHECK(stored.mileage() == 16000);
    CHECK(stored.min_rent_days() == 2);
    CHECK(stored.max_rent_days() == 7);
    CHECK(stored.make() == "Toyota");
  }

  WHEN("A vehicle that was never stored is updated")
  {
    CHECK_THROWS_AS(
      f.fleet.update(f.admin, Vehicle("Kia", "Rio", 2018, "grey", 0, 30.0)),
      std::invalid_argument);
  }
}

SCENARIO("Removing vehicles")
{
  Fixture f;

  WHEN("Nothing refers to the vehicle")
  {
    f.fleet.remove(f.admin, f.hilux);
    CHECK_FALSE(f.fleet.find(f.hilux));
    CHECK_THROWS_AS(f.fleet.remove(f.admin, f.hilux), not_found_error);
  }

  WHEN("A booking refers to the vehicle")
  {
    f.bookings.create(f.alice, f.alice.user(), f.hilux,
      range("2025-03-01", "2025-03-04"));
    CHECK_THROWS_AS(f.fleet.remove(f.admin, f.hilux), invalid_state_error);
    CHECK(f.fleet.find(f.hilux));
  }

  WHEN("A maintenance window refers to the vehicle")
  {
    f.maintenance.open(f.admin, f.hilux, "service", date("2025-03-01"));
    CHECK_THROWS_AS(f.fleet.remove(f.admin, f.hilux), invalid_state_error);
  }
}

SCENARIO("Candidates for a range of dates")
{
  Fixture f;

  const auto ids = [](const std::vector<Vehicle>& vehicles)
    {
      std::vector<VehicleId> out;
      for (const auto& v : vehicles)
        out.push_back(*v.id());
      return out;
    };

  WHEN("The range is shorter than the civic allows")
  {
    const auto two_days = range("2025-01-01", "2025-01-03");
    CHECK(ids(f.fleet.candidates_for(two_days)) ==
      std::vector<VehicleId>{f.corolla, f.hilux});
    CHECK(f.fleet.candidate_ids_for(two_days) ==
      std::vector<VehicleId>{f.corolla, f.hilux});
  }

  WHEN("The range suits every vehicle")
  {
    const auto five_days = range("2025-01-01", "2025-01-06");
    CHECK(f.fleet.candidate_ids_for(five_days) ==
      std::vector<VehicleId>{f.corolla, f.civic, f.hilux});

    THEN("Filters narrow the candidates")
    {
      CHECK(f.fleet.candidate_ids_for(
          five_days, Fleet::Query().make("honda")) ==
        std::vector<VehicleId>{f.civic});
      CHECK(f.fleet.candidate_ids_for(
          five_days, Fleet::Query().max_daily_rate(50.0)) ==
        std::vector<VehicleId>{f.corolla});
    }

    THEN("The caller's own day limits can exclude the range")
    {
      CHECK(f.fleet.candidate_ids_for(
          five_days, Fleet::Query().max_days(4)).empty());
      CHECK(f.fleet.candidate_ids_for(
          five_days, Fleet::Query().min_days(6)).empty());
      CHECK(f.fleet.candidate_ids_for(
          five_days, Fleet::Query().min_days(5).max_days(5)).size() == 3);
    }
  }

  WHEN("A vehicle is off the market")
  {
    f.fleet.set_available_now(f.admin, f.corolla, false);
    CHECK(f.fleet.candidate_ids_for(range("2025-01-01", "2025-01-06")) ==
      std::vector<VehicleId>{f.civic, f.hilux});
  }

  WHEN("The range is longer than every vehicle allows")
  {
    CHECK(f.fleet.candidate_ids_for(
        range("2025-01-01", "2025-03-01")).empty());
  }

  WHEN("The range is indefinite")
  {
    CHECK_THROWS_AS(
      f.fleet.candidates_for(DateRange::indefinite(date("2025-01-01"))),
      invalid_range_error);
  }
}
