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

#ifndef RENTAL_BOOKING__CONFIGURATION_HPP
#define RENTAL_BOOKING__CONFIGURATION_HPP

#include <rental_booking/Logger.hpp>

#include <rmf_utils/impl_ptr.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace rental_booking {

//==============================================================================
/// Options for opening a Database.
class Configuration
{
public:

  /// Constructor
  ///
  /// \param[in] database_path
  ///   The SQLite file to open. The special name ":memory:" opens a private
  ///   in-memory database that disappears when the Database is destroyed.
  Configuration(std::string database_path = ":memory:");

  /// Set the path of the SQLite file.
  Configuration& set_database_path(std::string path);

  /// Get the path of the SQLite file.
  const std::string& database_path() const;

  /// Set how long a connection waits for another connection's write lock
  /// before the operation fails with a storage_error. The default is five
  /// seconds.
  Configuration& set_busy_timeout(std::chrono::milliseconds timeout);

  /// Get the busy timeout.
  std::chrono::milliseconds busy_timeout() const;

  /// Use write-ahead logging for file databases so that readers do not block
  /// the writer. This has no effect on in-memory databases. On by default.
  Configuration& set_write_ahead_log(bool enabled);

  /// Get whether write-ahead logging is requested.
  bool write_ahead_log() const;

  /// Create any missing tables, indexes and triggers when the database is
  /// opened. On by default.
  Configuration& set_create_schema(bool enabled);

  /// Get whether the schema is created on open.
  bool create_schema() const;

  /// Set the logger that the database and every ledger report through. If
  /// this is never set, a logger that writes to standard error is used.
  /// Passing nullptr installs a logger that discards everything.
  Configuration& set_logger(std::shared_ptr<Logger> logger);

  /// Get the logger.
  const std::shared_ptr<Logger>& logger() const;

  class Implementation;
private:
  rmf_utils::impl_ptr<Implementation> _pimpl;
};

} // namespace rental_booking

#endif // RENTAL_BOOKING__CONFIGURATION_HPP
