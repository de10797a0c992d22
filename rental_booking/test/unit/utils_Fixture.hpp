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

#ifndef RENTAL_BOOKING__TEST__UNIT__UTILS_FIXTURE_HPP
#define RENTAL_BOOKING__TEST__UNIT__UTILS_FIXTURE_HPP

#include <rental_booking/AvailabilityEngine.hpp>
#include <rental_booking/BookingLedger.hpp>
#include <rental_booking/Database.hpp>
#include <rental_booking/Fleet.hpp>
#include <rental_booking/MaintenanceLedger.hpp>
#include <rental_booking/Users.hpp>

#include <rmf_utils/catch.hpp>

#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <vector>

//==============================================================================
inline rental_booking::Date date(const std::string& text)
{
  return rental_booking::Date::parse(text);
}

//==============================================================================
inline rental_booking::DateRange range(
  const std::string& start,
  const std::string& finish)
{
  return rental_booking::DateRange::make(date(start), date(finish));
}

//==============================================================================
/// Collects everything that is logged so tests can inspect it.
class LogCapture
{
public:

  struct Entry
  {
    rental_booking::Logger::Level level;
    std::string message;
  };

  LogCapture()
  : _state(std::make_shared<State>())
  {
    // Do nothing
  }

  std::shared_ptr<rental_booking::Logger> logger() const
  {
    auto state = _state;
    return std::make_shared<rental_booking::Logger>(
      [state](rental_booking::Logger::Level level, const std::string& message)
      {
        std::lock_guard<std::mutex> lock(state->mutex);
        state->entries.push_back(Entry{level, message});
      },
      rental_booking::Logger::Level::Debug);
  }

  std::vector<Entry> entries() const
  {
    std::lock_guard<std::mutex> lock(_state->mutex);
    return _state->entries;
  }

  /// True if a message at `level` contains `fragment`.
  bool contains(
    rental_booking::Logger::Level level,
    const std::string& fragment) const
  {
    for (const auto& entry : entries())
    {
      if (entry.level == level
        && entry.message.find(fragment) != std::string::npos)
        return true;
    }

    return false;
  }

  void clear()
  {
    std::lock_guard<std::mutex> lock(_state->mutex);
    _state->entries.clear();
  }

private:
  struct State
  {
    std::mutex mutex;
    std::vector<Entry> entries;
  };

  std::shared_ptr<State> _state;
};

//==============================================================================
/// A database file that is deleted, together with its journal files, when the
/// object goes out of scope.
class TemporaryDatabaseFile
{
public:

  TemporaryDatabaseFile(const std::string& tag)
  {
    std::random_device rd;
    const auto stamp =
      std::chrono::steady_clock::now().time_since_epoch().count();

    _path = (std::filesystem::temp_directory_path()
      / ("rental_booking_" + tag + "_" + std::to_string(stamp) + "_"
      + std::to_string(rd()) + ".sqlite3")).string();
  }

  ~TemporaryDatabaseFile()
  {
    std::error_code ec;
    for (const char* suffix : {"", "-wal", "-shm", "-journal"})
      std::filesystem::remove(_path + suffix, ec);
  }

  const std::string& path() const
  {
    return _path;
  }

private:
  std::string _path;
};

//==============================================================================
/// An in-memory database with an administrator, two customers and three
/// vehicles:
///   corolla: $50/day, 1 to 30 days
///   civic:   $60/day, 3 to 14 days
///   hilux:   $95/day, 1 to 30 days
struct Fixture
{
  LogCapture log;
  std::shared_ptr<rental_booking::Database> database;

  rental_booking::Users users;
  rental_booking::Fleet fleet;
  rental_booking::MaintenanceLedger maintenance;
  rental_booking::BookingLedger bookings;
  rental_booking::AvailabilityEngine availability;

  rental_booking::Actor admin;
  rental_booking::Actor alice;
  rental_booking::Actor bob;

  rental_booking::VehicleId corolla;
  rental_booking::VehicleId civic;
  rental_booking::VehicleId hilux;

  Fixture(rental_booking::Configuration config = rental_booking::Configuration())
  : database(std::make_shared<rental_booking::Database>(
        config.set_logger(log.logger()))),
    users(database),
    fleet(database),
    maintenance(database),
    bookings(database),
    availability(database),
    admin(rental_booking::Actor::admin(
        users.add("admin@rentals.example", "Ada Admin",
        rental_booking::Role::Admin).id())),
    alice(rental_booking::Actor::customer(
        users.add("alice@example.com", "Alice Example",
        rental_booking::Role::Customer).id())),
    bob(rental_booking::Actor::customer(
        users.add("bob@example.com", "Bob Example",
        rental_booking::Role::Customer).id())),
    corolla(add_vehicle(
        rental_booking::Vehicle("Toyota", "Corolla", 2020, "white", 42000, 50.0))),
    civic(add_vehicle(
        rental_booking::Vehicle("Honda", "Civic", 2019, "blue", 61000, 60.0)
        .set_rental_days(3, 14))),
    hilux(add_vehicle(
        rental_booking::Vehicle("Toyota", "Hilux", 2021, "black", 15000, 95.0)))
  {
    log.clear();
  }

  rental_booking::VehicleId add_vehicle(const rental_booking::Vehicle& vehicle)
  {
    return fleet.add(admin, vehicle).id().value();
  }

  /// Create a booking for alice and approve it.
  rental_booking::Booking approved(
    rental_booking::VehicleId vehicle,
    const rental_booking::DateRange& dates)
  {
    const auto created = bookings.create(alice, alice.user(), vehicle, dates);
    return bookings.approve(admin, created.booking.id());
  }
};

#endif // RENTAL_BOOKING__TEST__UNIT__UTILS_FIXTURE_HPP
