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

#include "internal_MaintenanceWindow.hpp"

namespace rental_booking {

//==============================================================================
const char* const MaintenanceWindow::Implementation::Columns =
  "maint_id, car_id, type, cost, start_date, end_date, notes";

//==============================================================================
MaintenanceWindow MaintenanceWindow::Implementation::read(const Statement& row)
{
  MaintenanceWindow window;
  window._pimpl = rmf_utils::make_impl<Implementation>(
    Implementation{
      row.column_id(0),
      row.column_id(1),
      row.column_text(2),
      row.column_double(3),
      row.column_date(4),
      row.column_optional_date(5),
      row.column_optional_text(6)
    });

  return window;
}

//==============================================================================
MaintenanceWindow::MaintenanceWindow()
{
  // Do nothing
}

//==============================================================================
MaintenanceId MaintenanceWindow::id() const
{
  return _pimpl->id;
}

//==============================================================================
VehicleId MaintenanceWindow::vehicle() const
{
  return _pimpl->vehicle;
}

//==============================================================================
const std::string& MaintenanceWindow::type() const
{
  return _pimpl->type;
}

//==============================================================================
double MaintenanceWindow::cost() const
{
  return _pimpl->cost;
}

//==============================================================================
Date MaintenanceWindow::start_date() const
{
  return _pimpl->start_date;
}

//==============================================================================
const std::optional<Date>& MaintenanceWindow::end_date() const
{
  return _pimpl->end_date;
}

//==============================================================================
const std::optional<std::string>& MaintenanceWindow::notes() const
{
  return _pimpl->notes;
}

//==============================================================================
bool MaintenanceWindow::is_open() const
{
  return !_pimpl->end_date.has_value();
}

//==============================================================================
DateRange MaintenanceWindow::range() const
{
  if (_pimpl->end_date)
    return DateRange::inclusive(_pimpl->start_date, *_pimpl->end_date);

  return DateRange::indefinite(_pimpl->start_date);
}

} // namespace rental_booking
