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

#ifndef RENTAL_BOOKING__LOGGER_HPP
#define RENTAL_BOOKING__LOGGER_HPP

#include <rmf_utils/impl_ptr.hpp>

#include <functional>
#include <memory>
#include <string>

namespace rental_booking {

//==============================================================================
/// Leveled, thread-safe diagnostic output. Messages below the threshold are
/// dropped; everything else is handed to the sink.
class Logger
{
public:

  enum class Level : uint8_t
  {
    Debug = 0,
    Info,
    Warning,
    Error
  };

  /// Sinks are called after the operation that logs has committed and released
  /// its database, so a sink may read from the same database. A sink must not
  /// throw.
  using Sink = std::function<void(Level level, const std::string& message)>;

  /// Construct a logger that writes to standard error with a threshold of
  /// Info.
  Logger();

  /// Construct a logger with a custom sink.
  Logger(Sink sink, Level threshold = Level::Info);

  /// Replace the sink. Passing an empty sink silences the logger.
  Logger& set_sink(Sink sink);

  /// Messages below this level are dropped.
  Logger& set_threshold(Level threshold);

  /// Get the current threshold.
  Level threshold() const;

  void log(Level level, const std::string& message) const;

  void debug(const std::string& message) const;
  void info(const std::string& message) const;
  void warn(const std::string& message) const;
  void error(const std::string& message) const;

  /// The default sink: writes `[level] message` lines to standard error.
  static Sink stderr_sink();

  class Implementation;
private:
  rmf_utils::unique_impl_ptr<Implementation> _pimpl;
};

std::string to_string(Logger::Level level);

} // namespace rental_booking

#endif // RENTAL_BOOKING__LOGGER_HPP
