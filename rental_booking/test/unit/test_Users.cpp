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

SCENARIO("Registering users")
{
  Fixture f;

  GIVEN("The seeded users")
  {
    const auto all = f.users.list();
    REQUIRE(all.size() == 3);
    CHECK(all[0].role() == Role::Admin);
    CHECK(all[1].email() == "alice@example.com");
    CHECK(f.users.list(Role::Customer).size() == 2);
    CHECK(f.users.list(Role::Admin).size() == 1);
    CHECK_FALSE(all[1].created_at().empty());
  }

  WHEN("An email differs only by case and padding")
  {
    CHECK_THROWS_AS(
      f.users.add("  ALICE@Example.com ", "Alice Again", Role::Customer),
      std::invalid_argument);

    const auto found = f.users.find_by_email("Alice@EXAMPLE.com");
    REQUIRE(found);
    CHECK(found->id() == f.alice.user());
  }

  WHEN("A new user is registered with mixed case")
  {
    const User carol = f.users.add("Carol@Example.com", "Carol", Role::Customer);
    CHECK(carol.email() == "carol@example.com");
    CHECK(f.users.get(carol.id()).full_name() == "Carol");
    CHECK(f.log.contains(Logger::Level::Info, "carol@example.com"));
  }

  WHEN("Required fields are missing")
  {
    CHECK_THROWS_AS(
      f.users.add("", "Nobody", Role::Customer), std::invalid_argument);
    CHECK_THROWS_AS(
      f.users.add("x@example.com", "", Role::Customer), std::invalid_argument);
  }

  WHEN("An administrator registers a user on someone's behalf")
  {
    CHECK_NOTHROW(
      f.users.add(f.admin, "dave@example.com", "Dave", Role::Customer));
    CHECK_THROWS_AS(
      f.users.add(f.alice, "eve@example.com", "Eve", Role::Admin),
      permission_error);
    CHECK_FALSE(f.users.find_by_email("eve@example.com"));
  }

  WHEN("Looking up a user that does not exist")
  {
    CHECK_FALSE(f.users.find(999));
    CHECK_THROWS_AS(f.users.get(999), not_found_error);
  }
}
