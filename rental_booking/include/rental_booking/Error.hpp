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

#ifndef RENTAL_BOOKING__ERROR_HPP
#define RENTAL_BOOKING__ERROR_HPP

#include <rental_booking/Conflict.hpp>

#include <rmf_utils/impl_ptr.hpp>

#include <exception>
#include <string>
#include <vector>

namespace rental_booking {

//==============================================================================
enum class ErrorKind : uint8_t
{
  NotFound,
  InvalidRange,
  VehicleUnavailable,
  InvalidState,
  Conflict,
  PermissionDenied,
  Storage
};

//==============================================================================
/// Base class of every error that the booking library reports. Catch this to
/// handle all of them, or catch one of the derived classes to handle a single
/// kind.
class error : public std::exception
{
public:

  const char* what() const noexcept override;

  /// The kind of failure.
  ErrorKind kind() const;

  class Implementation;
protected:
  error(ErrorKind kind, std::string what);
  rmf_utils::impl_ptr<Implementation> _pimpl;
};

//==============================================================================
/// A vehicle, booking, user or maintenance window does not exist.
class not_found_error : public error
{
public:
  explicit not_found_error(std::string what);
};

//==============================================================================
/// A date range is empty or inverted, or a rental duration falls outside of
/// what a vehicle permits.
class invalid_range_error : public error
{
public:
  explicit invalid_range_error(std::string what);
};

//==============================================================================
/// An administrator has taken the vehicle off the market.
class vehicle_unavailable_error : public error
{
public:
  explicit vehicle_unavailable_error(std::string what);
};

//==============================================================================
/// The record is not in the state that the operation requires, e.g. approving
/// a booking that is no longer pending.
class invalid_state_error : public error
{
public:
  explicit invalid_state_error(std::string what);
};

//==============================================================================
/// Approving a booking would make it overlap an approved booking or a
/// maintenance window of the same vehicle.
class conflict_error : public error
{
public:
  conflict_error(std::string what, std::vector<Conflict> conflicts);

  /// The records that the booking overlaps. This may be empty if the conflict
  /// was detected by the storage layer rather than by the conflict check.
  const std::vector<Conflict>& conflicts() const;
};

//==============================================================================
/// The acting user's role does not grant the operation, or the operation
/// touches another customer's records.
class permission_error : public error
{
public:
  explicit permission_error(std::string what);
};

//==============================================================================
/// The persistent store failed.
class storage_error : public error
{
public:
  storage_error(std::string what, int result_code);

  /// The extended SQLite result code of the failure.
  int result_code() const;

  /// True if the store refused the change because it violates a constraint or
  /// a trigger.
  bool is_constraint_violation() const;

  /// True if the store gave up waiting for a lock.
  bool is_busy() const;
};

} // namespace rental_booking

#endif // RENTAL_BOOKING__ERROR_HPP
