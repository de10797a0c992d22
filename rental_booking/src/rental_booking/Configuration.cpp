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

#include <rental_booking/Configuration.hpp>

namespace rental_booking {

//==============================================================================
class Configuration::Implementation
{
public:

  std::string database_path;
  std::chrono::milliseconds busy_timeout;
  bool write_ahead_log;
  bool create_schema;
  std::shared_ptr<Logger> logger;

};

//==============================================================================
Configuration::Configuration(std::string database_path)
: _pimpl(rmf_utils::make_impl<Implementation>(
      Implementation{
        std::move(database_path),
        std::chrono::seconds(5),
        true,
        true,
        std::make_shared<Logger>()
      }))
{
  // Do nothing
}

//==============================================================================
Configuration& Configuration::set_database_path(std::string path)
{
  _pimpl->database_path = std::move(path);
  return *this;
}

//==============================================================================
const std::string& Configuration::database_path() const
{
  return _pimpl->database_path;
}

//==============================================================================
Configuration& Configuration::set_busy_timeout(
  const std::chrono::milliseconds timeout)
{
  _pimpl->busy_timeout = timeout;
  return *this;
}

//==============================================================================
std::chrono::milliseconds Configuration::busy_timeout() const
{
  return _pimpl->busy_timeout;
}

//==============================================================================
Configuration& Configuration::set_write_ahead_log(const bool enabled)
{
  _pimpl->write_ahead_log = enabled;
  return *this;
}

//==============================================================================
bool Configuration::write_ahead_log() const
{
  return _pimpl->write_ahead_log;
}

//==============================================================================
Configuration& Configuration::set_create_schema(const bool enabled)
{
  _pimpl->create_schema = enabled;
  return *this;
}

//==============================================================================
bool Configuration::create_schema() const
{
  return _pimpl->create_schema;
}

//==============================================================================
Configuration& Configuration::set_logger(std::shared_ptr<Logger> logger)
{
  if (!logger)
    logger = std::make_shared<Logger>(Logger::Sink());

  _pimpl->logger = std::move(logger);
  return *this;
}

//==============================================================================
const std::shared_ptr<Logger>& Configuration::logger() const
{
  return _pimpl->logger;
}

} // namespace rental_booking
