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

#include <atomic>
#include <thread>

using namespace rental_booking;

SCENARIO("Concurrent approvals of overlapping requests")
{
  const std::size_t N = 8;

  TemporaryDatabaseFile file("concurrent");
  Fixture f(Configuration(file.path()));

  // Every request overlaps every other one on 2025-01-10.
  std::vector<BookingId> requests;
  for (std::size_t i = 0; i < N; ++i)
  {
    const auto start = date("2025-01-03") + static_cast<int64_t>(i);
    requests.push_back(
      f.bookings.create(
        f.admin, f.alice.user(), f.corolla,
        DateRange::make(start, date("2025-01-11"))).booking.id());
  }

  GIVEN("One connection per thread")
  {
    std::vector<std::shared_ptr<Database>> connections;
    for (std::size_t i = 0; i < N; ++i)
    {
      connections.push_back(
        std::make_shared<Database>(
          Configuration(file.path())
          .set_busy_timeout(std::chrono::seconds(30))
          .set_logger(nullptr)));
    }

    std::atomic_size_t approved(0);
    std::atomic_size_t conflicted(0);
    std::atomic_size_t other(0);
    std::atomic_bool go(false);

    std::vector<std::thread> threads;
    for (std::size_t i = 0; i < N; ++i)
    {
      threads.emplace_back(
        [&, i]()
        {
          BookingLedger ledger(connections[i]);
          while (!go)
            std::this_thread::yield();

          try
          {
            ledger.approve(f.admin, requests[i]);
            ++approved;
          }
          catch (const conflict_error&)
          {
            ++conflicted;
          }
          catch (const rental_booking::error&)
          {
            ++other;
          }
        });
    }

    go = true;
    for (auto& t : threads)
      t.join();

    THEN("Exactly one approval succeeds and the rest conflict")
    {
      CHECK(approved.load() == 1);
      CHECK(conflicted.load() == N - 1);
      CHECK(other.load() == 0);

      const auto approved_bookings = f.bookings.list(
        f.admin, BookingLedger::Query().status(Booking::Status::Approved));
      CHECK(approved_bookings.size() == 1);
      CHECK(f.bookings.list_pending(f.admin).size() == N - 1);
    }
  }

  GIVEN("One connection shared by every thread")
  {
    std::atomic_size_t approved(0);
    std::atomic_size_t conflicted(0);
    std::atomic_size_t other(0);

    std::vector<std::thread> threads;
    for (std::size_t i = 0; i < N; ++i)
    {
      threads.emplace_back(
        [&, i]()
        {
          try
          {
            f.bookings.approve(f.admin, requests[i]);
            ++approved;
          }
          catch (const conflict_error&)
          {
            ++conflicted;
          }
          catch (const rental_booking::error&)
          {
            ++other;
          }
        });
    }

    for (auto& t : threads)
      t.join();

    CHECK(approved.load() == 1);
    CHECK(conflicted.load() == N - 1);
    CHECK(other.load() == 0);
  }
}
