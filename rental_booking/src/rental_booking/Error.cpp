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

#include <sqlite3.h>

namespace rental_booking {

//==============================================================================
class error::Implementation
{
public:

  ErrorKind kind;
  std::string what;
  std::vector<Conflict> conflicts;
  int result_code = 0;

};

//==============================================================================
error::error(const ErrorKind kind, std::string what)
: _pimpl(rmf_utils::make_impl<Implementation>(
      Implementation{kind, std::move(what), {}, 0}))
{
  // Do nothing
}

//==============================================================================
const char* error::what() const noexcept
{
  return _pimpl->what.c_str();
}

//==============================================================================
ErrorKind error::kind() const
{
  return _pimpl->kind;
}

//==============================================================================
not_found_error::not_found_error(std::string what)
: error(ErrorKind::NotFound, std::move(what))
{
  // Do nothing
}

//==============================================================================
invalid_range_error::invalid_range_error(std::string what)
: error(ErrorKind::InvalidRange, std::move(what))
{
  // Do nothing
}

//==============================================================================
vehicle_unavailable_error::vehicle_unavailable_error(std::string what)
: error(ErrorKind::VehicleUnavailable, std::move(what))
{
  // Do nothing
}

//==============================================================================
invalid_state_error::invalid_state_error(std::string what)
: error(ErrorKind::InvalidState, std::move(what))
{
  // Do nothing
}

//==============================================================================
conflict_error::conflict_error(
  std::string what,
  std::vector<Conflict> conflicts)
: error(ErrorKind::Conflict, std::move(what))
{
  _pimpl->conflicts = std::move(conflicts);
}

//==============================================================================
const std::vector<Conflict>& conflict_error::conflicts() const
{
  return _pimpl->conflicts;
}

//==============================================================================
permission_error::permission_error(std::string what)
: error(ErrorKind::PermissionDenied, std::move(what))
{
  // Do nothing
}

//==============================================================================
storage_error::storage_error(std::string what, const int result_code)
: error(ErrorKind::Storage, std::move(what))
{
  _pimpl->result_code = result_code;
}

//==============================================================================
int storage_error::result_code() const
{
  return _pimpl->result_code;
}

//==============================================================================
bool storage_error::is_constraint_violation() const
{
  return (_pimpl->result_code & 0xff) == SQLITE_CONSTRAINT;
}

//==============================================================================
bool storage_error::is_busy() const
{
  const int primary = _pimpl->result_code & 0xff;
  return primary == SQLITE_BUSY || primary == SQLITE_LOCKED;
}

} // namespace rental_booking
