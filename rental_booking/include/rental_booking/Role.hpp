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

#ifndef RENTAL_BOOKING__ROLE_HPP
#define RENTAL_BOOKING__ROLE_HPP

#include <rental_booking/Identifiers.hpp>

#include <optional>
#include <string>

namespace rental_booking {

//==============================================================================
enum class Role : uint8_t
{
  Customer,
  Admin
};

/// The name of the role as it is stored: "customer" or "admin".
std::string to_string(Role role);

/// Inverse of to_string(Role). Returns std::nullopt for unknown names.
std::optional<Role> role_from_string(const std::string& name);

//==============================================================================
/// The closed set of operations that are gated by role.
enum class Action : uint8_t
{
  CreateBooking,
  CreateBookingOnBehalf,
  ViewOwnBookings,
  ViewAllBookings,
  ApproveBooking,
  RejectBooking,
  AddCharge,
  ManageFleet,
  ManageMaintenance,
  ManageUsers,
  PurgeRecords
};

std::string to_string(Action action);

/// The capability table: true if `role` is allowed to perform `action`.
bool permits(Role role, Action action);

//==============================================================================
/// The authenticated identity on whose behalf an operation is performed. The
/// authentication collaborator constructs this after verifying credentials;
/// the booking library trusts it as given.
class Actor
{
public:

  Actor(UserId user, Role role);

  /// Convenience constructors
  static Actor customer(UserId user);
  static Actor admin(UserId user);

  UserId user() const;
  Role role() const;

  /// True if this actor's role grants `action`.
  bool can(Action action) const;

  /// Throw a permission_error unless this actor's role grants `action`.
  ///
  /// \param[in] action
  ///   The action being attempted
  ///
  /// \param[in] operation
  ///   The name of the operation, used in the error message
  void require(Action action, const std::string& operation) const;

  /// Throw a permission_error unless this actor may touch records that belong
  /// to `owner`. Actors that hold `elevated` may touch anyone's records;
  /// everyone else may only touch their own.
  void require_owner_or(
    UserId owner,
    Action elevated,
    const std::string& operation) const;

private:
  UserId _user;
  Role _role;
};

} // namespace rental_booking

#endif // RENTAL_BOOKING__ROLE_HPP
