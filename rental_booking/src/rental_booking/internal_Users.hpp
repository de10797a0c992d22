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

#ifndef SRC__RENTAL_BOOKING__INTERNAL_USERS_HPP
#define SRC__RENTAL_BOOKING__INTERNAL_USERS_HPP

#include <rental_booking/Users.hpp>

#include "internal_Database.hpp"

namespace rental_booking {

//==============================================================================
class User::Implementation
{
public:

  UserId id;
  std::string email;
  std::string full_name;
  Role role;
  std::string created_at;

  static const char* const Columns;

  static User read(const Statement& row);
};

//==============================================================================
class Users::Implementation
{
public:

  std::shared_ptr<Database> database;

  static std::optional<User> find(const Transaction& transaction, UserId id);

  /// \throws not_found_error
  static User get(const Transaction& transaction, UserId id);

  User add(
    const std::string& operation,
    std::string email,
    std::string full_name,
    Role role);
};

} // namespace rental_booking

#endif // SRC__RENTAL_BOOKING__INTERNAL_USERS_HPP
