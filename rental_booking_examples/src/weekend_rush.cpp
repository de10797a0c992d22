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

#include <rental_booking/AvailabilityEngine.hpp>
#include <rental_booking/BookingLedger.hpp>
#include <rental_booking/Error.hpp>
#include <rental_booking/Fleet.hpp>
#include <rental_booking/MaintenanceLedger.hpp>
#include <rental_booking/Users.hpp>

#include <iostream>

using namespace rental_booking;

//==============================================================================
struct Scenario
{
  std::shared_ptr<Database> database;
  Users users;
  Fleet fleet;
  MaintenanceLedger maintenance;
  BookingLedger bookings;
  AvailabilityEngine availability;

  Scenario(std::shared_ptr<Database> db)
  : database(db),
    users(db),
    fleet(db),
    maintenance(db),
    bookings(db),
    availability(db)
  {
    // Do nothing
  }
};

//==============================================================================
void print_search(const Scenario& scenario, const DateRange& range)
{
  std::cout << "Free vehicles for " << range << ":";
  bool any = false;
  for (const Vehicle& vehicle : scenario.availability.search(range))
  {
    std::cout << "\n  #" << *vehicle.id() << " " << vehicle.label()
              << " at $" << vehicle.daily_rate() << "/day";
    any = true;
  }

  if (!any)
    std::cout << " none";

  std::cout << std::endl;
}

//==============================================================================
void print_booking(const Booking& booking)
{
  std::cout << "  booking #" << booking.id() << " vehicle #"
            << booking.vehicle() << " " << booking.range() << " "
            << to_string(booking.status()) << " $" << booking.total_fee()
            << std::endl;
}

//==============================================================================
int main(int argc, char* argv[])
{
  Configuration config(argc > 1 ? argv[1] : ":memory:");
  config.logger()->set_threshold(Logger::Level::Warning);

  Scenario s(std::make_shared<Database>(config));

  const Actor admin = Actor::admin(
    s.users.add("desk@rentals.example", "Front Desk", Role::Admin).id());
  const Actor sam = Actor::customer(
    s.users.add("sam@example.com", "Sam", Role::Customer).id());
  const Actor kim = Actor::customer(
    s.users.add("kim@example.com", "Kim", Role::Customer).id());

  const VehicleId yaris = s.fleet.add(
    admin, Vehicle("Toyota", "Yaris", 2021, "red", 23000, 45.0)).id().value();
  const VehicleId outlander = s.fleet.add(
    admin, Vehicle("Mitsubishi", "Outlander", 2022, "silver", 18000, 89.0)
    .set_rental_days(2, 21)).id().value();
  s.fleet.add(
    admin, Vehicle("Nissan", "Leaf", 2019, "white", 51000, 39.0));

  const auto weekend = DateRange::make(
    Date::parse("2025-03-07"), Date::parse("2025-03-10"));

  print_search(s, weekend);

  // Two customers ask for the same car for overlapping dates.
  const auto by_sam = s.bookings.create(sam, sam.user(), yaris, weekend);
  const auto by_kim = s.bookings.create(
    kim, kim.user(), yaris,
    DateRange::make(Date::parse("2025-03-08"), Date::parse("2025-03-11")),
    {{"child_seat", 12.0}});

  std::cout << "\nPending requests:" << std::endl;
  for (const auto& booking : s.bookings.list_pending(admin))
    print_booking(booking);

  s.bookings.approve(admin, by_sam.booking.id());
  try
  {
    s.bookings.approve(admin, by_kim.booking.id());
  }
  catch (const conflict_error& e)
  {
    std::cout << "\nCould not approve Kim's request:";
    for (const auto& conflict : e.conflicts())
      std::cout << "\n  overlaps " << conflict.to_string();
    std::cout << std::endl;

    s.bookings.reject(admin, by_kim.booking.id(), std::string("car taken"));

    const auto retry = s.bookings.create(
      kim, kim.user(), outlander,
      DateRange::make(Date::parse("2025-03-08"), Date::parse("2025-03-11")),
      {{"child_seat", 12.0}});
    s.bookings.approve(admin, retry.booking.id());
  }

  // The Leaf goes in for a service that has no known end date yet.
  const auto leaf = s.fleet.list(Fleet::Query().model("leaf")).front();
  s.maintenance.open(
    admin, leaf.id().value(), "service", Date::parse("2025-03-06"));

  std::cout << std::endl;
  print_search(s, weekend);

  std::cout << "\nAll bookings:" << std::endl;
  for (const auto& booking : s.bookings.list(admin))
    print_booking(booking);

  return 0;
}
