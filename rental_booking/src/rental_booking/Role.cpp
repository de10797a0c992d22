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

#include <rental_booking/Error.hpp>
#include <rental_booking/Role.hpp>

#include <array>

namespace rental_booking {

namespace {

//==============================================================================
struct Capability
{
  Action action;
  bool customer;
  bool admin;
};

//==============================================================================
const std::array<Capability, 11> CapabilityTable =
{{
  {Action::CreateBooking,         true,  true},
  {Action::CreateBookingOnBehalf, false, true},
  {Action::ViewOwnBookings,       true,  true},
  {Action::ViewAllBookings,       false, true},
  {Action::ApproveBooking,        false, true},
  {Action::RejectBooking,         false, true},
  {Action::AddCharge,             false, true},
  {Action::ManageFleet,           false, true},
  {Action::ManageMaintenance,     false, true},
  {Action::ManageUsers,           false, true},
  {Action::PurgeRecords,          false, true}
}};

} // anonymous namespace

//==============================================================================
std::string to_string(const Role role)
{
  switch (role)
  {
    case Role::Customer: return "customer";
    case Role::Admin: return "admin";
  }

  return "unknown";
}

//==============================================================================
std::optional<Role> role_from_string(const std::string& name)
{
  if (name == "customer")
    return Role::Customer;

  if (name == "admin")
    return Role::Admin;

  return std::nullopt;
}

//==============================================================================
std::string to_string(const Action action)
{
  switch (action)
  {
    case Action::CreateBooking: return "create booking";
    case Action::CreateBookingOnBehalf: return "create booking on behalf";
    case Action::ViewOwnBookings: return "view own bookings";
    case Action::ViewAllBookings: return "view all bookings";
    case Action::ApproveBooking: return "approve booking";
    case Action::RejectBooking: return "reject booking";
    case Action::AddCharge: return "add charge";
    case Action::ManageFleet: return "manage fleet";
    case Action::ManageMaintenance: return "manage maintenance";
    case Action::ManageUsers: return "manage users";
    case Action::PurgeRecords: return "purge records";
  }

  return "unknown";
}

//==============================================================================
bool permits(const Role role, const Action action)
{
  for (const auto& capability : CapabilityTable)
  {
    if (capability.action != action)
      continue;

    return role == Role::Admin ? capability.admin : capability.customer;
  }

  return false;
}

//==============================================================================
Actor::Actor(const UserId user, const Role role)
: _user(user),
  _role(role)
{
  // Do nothing
}

//==============================================================================
Actor Actor::customer(const UserId user)
{
  return Actor(user, Role::Customer);
}

//==============================================================================
Actor Actor::admin(const UserId user)
{
  return Actor(user, Role::Admin);
}

//==============================================================================
UserId Actor::user() const
{
  return _user;
}

//==============================================================================
Role Actor::role() const
{
  return _role;
}

//==============================================================================
bool Actor::can(const Action action) const
{
  return permits(_role, action);
}

//==============================================================================
void Actor::require(const Action action, const std::string& operation) const
{
  if (can(action))
    return;

  throw permission_error(
    "[rental_booking::" + operation + "] User [" + std::to_string(_user)
    + "] with role [" + to_string(_role) + "] may not "
    + to_string(action));
}

//==============================================================================
void Actor::require_owner_or(
  const UserId owner,
  const Action elevated,
  const std::string& operation) const
{
  if (owner == _user || can(elevated))
    return;

  throw permission_error(
    "[rental_booking::" + operation + "] User [" + std::to_string(_user)
    + "] may not touch records of user [" + std::to_string(owner) + "]");
}

} // namespace rental_booking
