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

#ifndef SRC__RENTAL_BOOKING__INTERNAL_MAINTENANCEWINDOW_HPP
#define SRC__RENTAL_BOOKING__INTERNAL_MAINTENANCEWINDOW_HPP

#include <rental_booking/MaintenanceWindow.hpp>

#include "internal_Database.hpp"

namespace rental_booking {

//==============================================================================
class MaintenanceWindow::Implementation
{
public:

  MaintenanceId id;
  VehicleId vehicle;
  std::string type;
  double cost;
  Date start_date;
  std::optional<Date> end_date;
  std::optional<std::string> notes;

  static const char* const Columns;

  static MaintenanceWindow read(const Statement& row);
};

} // namespace rental_booking

#endif // SRC__RENTAL_BOOKING__INTERNAL_MAINTENANCEWINDOW_HPP
