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
#include <rental_booking/Logger.hpp>

#include <rmf_utils/catch.hpp>

#include <thread>
#include <vector>

using rental_booking::Logger;

SCENARIO("Messages below the threshold are dropped")
{
  std::vector<std::pair<Logger::Level, std::string>> received;
  Logger logger(
    [&received](Logger::Level level, const std::string& message)
    {
      received.emplace_back(level, message);
    });

  CHECK(logger.threshold() == Logger::Level::Info);

  logger.debug("hidden");
  logger.info("shown");
  logger.warn("careful");
  logger.error("broken");

  REQUIRE(received.size() == 3);
  CHECK(received[0].first == Logger::Level::Info);
  CHECK(received[0].second == "shown");
  CHECK(received[1].first == Logger::Level::Warning);
  CHECK(received[2].first == Logger::Level::Error);

  WHEN("The threshold is lowered")
  {
    logger.set_threshold(Logger::Level::Debug);
    logger.debug("visible now");
    CHECK(received.back().second == "visible now");
  }

  WHEN("The sink is removed")
  {
    logger.set_sink(Logger::Sink());
    logger.error("nobody hears this");
    CHECK(received.size() == 3);
  }
}

SCENARIO("Concurrent callers do not lose messages")
{
  std::size_t count = 0;
  Logger logger([&count](Logger::Level, const std::string&) { ++count; });

  std::vector<std::thread> threads;
  for (int i = 0; i < 4; ++i)
  {
    threads.emplace_back([&logger]()
      {
        for (int j = 0; j < 250; ++j)
          logger.info("tick");
      });
  }

  for (auto& t : threads)
    t.join();

  CHECK(count == 1000);
}

SCENARIO("Configuration defaults")
{
  const rental_booking::Configuration config;
  CHECK(config.database_path() == ":memory:");
  CHECK(config.busy_timeout() == std::chrono::seconds(5));
  CHECK(config.write_ahead_log());
  CHECK(config.create_schema());
  REQUIRE(config.logger());
  CHECK(config.logger()->threshold() == Logger::Level::Info);

  rental_booking::Configuration changed("rentals.sqlite3");
  changed
  .set_busy_timeout(std::chrono::milliseconds(250))
  .set_write_ahead_log(false)
  .set_logger(nullptr);

  CHECK(changed.database_path() == "rentals.sqlite3");
  CHECK(changed.busy_timeout() == std::chrono::milliseconds(250));
  CHECK_FALSE(changed.write_ahead_log());
  REQUIRE(changed.logger());
  CHECK_NOTHROW(changed.logger()->error("discarded"));
  CHECK(to_string(Logger::Level::Warning) == "warning");
}
