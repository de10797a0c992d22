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

#ifndef RENTAL_BOOKING__IDENTIFIERS_HPP
#define RENTAL_BOOKING__IDENTIFIERS_HPP

#include <cstdint>

namespace rental_booking {

/// Row identifiers handed out by the persistent store. A value of zero is
/// never assigned to a stored record.
using UserId = uint64_t;
using VehicleId = uint64_t;
using BookingId = uint64_t;
using ChargeId = uint64_t;
using MaintenanceId = uint64_t;

} // namespace rental_booking

#endif // RENTAL_BOOKING__IDENTIFIERS_HPP
