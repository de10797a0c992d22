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

#ifndef SRC__RENTAL_BOOKING__INTERNAL_BOOKING_HPP
#define SRC__RENTAL_BOOKING__INTERNAL_BOOKING_HPP

#include <rental_booking/Booking.hpp>

#include "internal_Database.hpp"

namespace rental_booking {

//==============================================================================
class Booking::Implementation
{
public:

  BookingId id;
  UserId user;
  VehicleId vehicle;
  DateRange range;
  int64_t rental_days;
  double daily_rate;
  double total_fee;
  Status status;
  std::string created_at;

  static const char* const Columns;

  static Booking read(const Statement& row);
};

} // namespace rental_booking

#endif // SRC__RENTAL_BOOKING__INTERNAL_BOOKING_HPP
