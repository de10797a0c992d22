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

#ifndef RENTAL_BOOKING__DATABASE_HPP
#define RENTAL_BOOKING__DATABASE_HPP

#include <rental_booking/Configuration.hpp>
#include <rental_booking/Identifiers.hpp>
#include <rental_booking/Role.hpp>

#include <rmf_utils/impl_ptr.hpp>

namespace rental_booking {

//==============================================================================
/// A connection to the persistent store that holds users, vehicles, bookings,
/// booking charges and maintenance windows.
///
/// Each Database owns exactly one SQLite connection. Its operations are
/// serialized internally, so one instance may be shared between threads.
/// Several Database instances (in one process or in many) may open the same
/// file; the guarantees about approved bookings are enforced by the store's
/// transactions, not by this object.
///
/// The Fleet, Users, MaintenanceLedger, BookingLedger and AvailabilityEngine
/// classes all operate on a shared Database.
class Database
{
public:

  /// Open (and, if configured, initialize) the store.
  ///
  /// \throws storage_error if the file cannot be opened or the schema cannot
  /// be created.
  Database(Configuration config = Configuration());

  /// The configuration that this database was opened with.
  const Configuration& configuration() const;

  /// The logger that every component working on this database reports
  /// through.
  const Logger& logger() const;

  /// Permanently delete a booking together with its charges. This is not part
  /// of the normal booking lifecycle, which never deletes bookings; it exists
  /// for data-retention housekeeping.
  ///
  /// \return true if a booking was deleted.
  bool purge_booking(const Actor& actor, BookingId booking);

  class Implementation;
private:
  rmf_utils::unique_impl_ptr<Implementation> _pimpl;
};

} // namespace rental_booking

#endif // RENTAL_BOOKING__DATABASE_HPP
