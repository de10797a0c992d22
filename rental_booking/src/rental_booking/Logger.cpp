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

#include <rental_booking/Logger.hpp>

#include <iostream>
#include <mutex>

namespace rental_booking {

//==============================================================================
class Logger::Implementation
{
public:

  Sink sink;
  Level threshold;

  // Guards the sink and the threshold, and keeps the lines of concurrent
  // callers from interleaving.
  mutable std::mutex mutex;

  Implementation(Sink sink_, Level threshold_)
  : sink(std::move(sink_)),
    threshold(threshold_)
  {
    // Do nothing
  }
};

//==============================================================================
Logger::Logger()
: _pimpl(rmf_utils::make_unique_impl<Implementation>(
      stderr_sink(), Level::Info))
{
  // Do nothing
}

//==============================================================================
Logger::Logger(Sink sink, const Level threshold)
: _pimpl(rmf_utils::make_unique_impl<Implementation>(
      std::move(sink), threshold))
{
  // Do nothing
}

//==============================================================================
Logger& Logger::set_sink(Sink sink)
{
  std::lock_guard<std::mutex> lock(_pimpl->mutex);
  _pimpl->sink = std::move(sink);
  return *this;
}

//==============================================================================
Logger& Logger::set_threshold(const Level threshold)
{
  std::lock_guard<std::mutex> lock(_pimpl->mutex);
  _pimpl->threshold = threshold;
  return *this;
}

//==============================================================================
Logger::Level Logger::threshold() const
{
  std::lock_guard<std::mutex> lock(_pimpl->mutex);
  return _pimpl->threshold;
}

//==============================================================================
void Logger::log(const Level level, const std::string& message) const
{
  std::lock_guard<std::mutex> lock(_pimpl->mutex);
  if (level < _pimpl->threshold || !_pimpl->sink)
    return;

  _pimpl->sink(level, message);
}

//==============================================================================
void Logger::debug(const std::string& message) const
{
  log(Level::Debug, message);
}

//==============================================================================
void Logger::info(const std::string& message) const
{
  log(Level::Info, message);
}

//==============================================================================
void Logger::warn(const std::string& message) const
{
  log(Level::Warning, message);
}

//==============================================================================
void Logger::error(const std::string& message) const
{
  log(Level::Error, message);
}

//==============================================================================
Logger::Sink Logger::stderr_sink()
{
  return [](const Level level, const std::string& message)
    {
      std::cerr << "[" << to_string(level) << "] " << message << std::endl;
    };
}

//==============================================================================
std::string to_string(const Logger::Level level)
{
  switch (level)
  {
    case Logger::Level::Debug: return "debug";
    case Logger::Level::Info: return "info";
    case Logger::Level::Warning: return "warning";
    case Logger::Level::Error: return "error";
  }

  return "unknown";
}

} // namespace rental_booking
