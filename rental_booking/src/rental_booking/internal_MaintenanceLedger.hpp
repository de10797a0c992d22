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

#ifndef SRC__RENTAL_BOOKING__INTERNAL_MAINTENANCELEDGER_HPP
#define SRC__RENTAL_BOOKING__INTERNAL_MAINTENANCELEDGER_HPP

#include <rental_booking/MaintenanceLedger.hpp>

#include "internal_Database.hpp"

namespace rental_booking {

//==============================================================================
class MaintenanceLedger::Query::Implementation
{
public:

  std::optional<bool> open;
  std::optional<VehicleId> vehicle;
  Order order = Order::StartDescending;

  static const Implementation& get(const Query& query)
  {
    return *query._pimpl;
  }
};

//==============================================================================
class MaintenanceLedger::Implementation
{
public:

  std::shared_ptr<Database> database;

  Database::Implementation& storage() const
  {
    return Database::Implementation::get(*database);
  }

  static std::optional<MaintenanceWindow> find(
    const Transaction& transaction,
    MaintenanceId id);

  /// \throws not_found_error
  static MaintenanceWindow get(
    const Transaction& transaction,
    MaintenanceId id);
};

} // namespace rental_booking

#endif // SRC__RENTAL_BOOKING__INTERNAL_MAINTENANCELEDGER_HPP
