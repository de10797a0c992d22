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

#ifndef RENTAL_BOOKING__USERS_HPP
#define RENTAL_BOOKING__USERS_HPP

#include <rental_booking/Database.hpp>
#include <rental_booking/Role.hpp>

#include <rmf_utils/impl_ptr.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace rental_booking {

//==============================================================================
/// A person who can hold bookings. Credentials are managed by the
/// authentication collaborator and are not part of this record.
class User
{
public:

  UserId id() const;
  const std::string& email() const;
  const std::string& full_name() const;
  Role role() const;

  /// The time the user was registered, as `YYYY-MM-DD HH:MM:SS` UTC.
  const std::string& created_at() const;

  class Implementation;
private:
  User();
  rmf_utils::impl_ptr<Implementation> _pimpl;
};

//==============================================================================
/// The directory of users that bookings refer to.
class Users
{
public:

  Users(std::shared_ptr<Database> database);

  /// Register a user. Emails are compared case-insensitively and stored in
  /// lower case.
  ///
  /// \throws std::invalid_argument if the email or name is empty, or if the
  /// email is already registered.
  User add(std::string email, std::string full_name, Role role);

  /// Register a user on behalf of an administrator.
  ///
  /// \throws permission_error if the actor may not manage users.
  User add(
    const Actor& actor,
    std::string email,
    std::string full_name,
    Role role);

  /// \throws not_found_error if there is no such user.
  User get(UserId id) const;

  std::optional<User> find(UserId id) const;

  std::optional<User> find_by_email(const std::string& email) const;

  /// List users ordered by id, optionally only those with the given role.
  std::vector<User> list(std::optional<Role> role = std::nullopt) const;

  class Implementation;
private:
  rmf_utils::impl_ptr<Implementation> _pimpl;
};

} // namespace rental_booking

#endif // RENTAL_BOOKING__USERS_HPP
