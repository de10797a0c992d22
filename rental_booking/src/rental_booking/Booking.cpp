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

#include "internal_Booking.hpp"

#include <cmath>

namespace rental_booking {

//==============================================================================
const char* const Booking::Implementation::Columns =
  "booking_id, user_id, car_id, start_date, end_date, rental_days, "
  "daily_rate, total_fee, status, created_at";

//==============================================================================
Booking Booking::Implementation::read(const Statement& row)
{
  const std::string status_name = row.column_text(8);
  const auto status = status_from_string(status_name);
  if (!status)
  {
    throw storage_error(
      describe("BookingLedger", "Stored booking ["
        + std::to_string(row.column_id(0)) + "] has an unknown status ["
        + status_name + "]"), SQLITE_MISMATCH);
  }

  Booking booking;
  booking._pimpl = rmf_utils::make_impl<Implementation>(
    Implementation{
      row.column_id(0),
      row.column_id(1),
      row.column_id(2),
      DateRange::make(row.column_date(3), row.column_date(4)),
      row.column_int(5),
      row.column_double(6),
      row.column_double(7),
      *status,
      row.column_text(9)
    });

  return booking;
}

//==============================================================================
Booking::Booking()
{
  // Do nothing
}

//==============================================================================
BookingId Booking::id() const
{
  return _pimpl->id;
}

//==============================================================================
UserId Booking::user() const
{
  return _pimpl->user;
}

//==============================================================================
VehicleId Booking::vehicle() const
{
  return _pimpl->vehicle;
}

//==============================================================================
const DateRange& Booking::range() const
{
  return _pimpl->range;
}

//==============================================================================
Date Booking::start_date() const
{
  return _pimpl->range.start();
}

//==============================================================================
Date Booking::end_date() const
{
  return *_pimpl->range.finish();
}

//==============================================================================
int64_t Booking::rental_days() const
{
  return _pimpl->rental_days;
}

//==============================================================================
double Booking::daily_rate() const
{
  return _pimpl->daily_rate;
}

//==============================================================================
double Booking::base_fee() const
{
  return round_to_cents(
    static_cast<double>(_pimpl->rental_days) * _pimpl->daily_rate);
}

//==============================================================================
double Booking::total_fee() const
{
  return _pimpl->total_fee;
}

//==============================================================================
auto Booking::status() const -> Status
{
  return _pimpl->status;
}

//==============================================================================
bool Booking::is_pending() const
{
  return _pimpl->status == Status::Pending;
}

//==============================================================================
const std::string& Booking::created_at() const
{
  return _pimpl->created_at;
}

//==============================================================================
std::string to_string(const Booking::Status status)
{
  switch (status)
  {
    case Booking::Status::Pending: return "pending";
    case Booking::Status::Approved: return "approved";
    case Booking::Status::Rejected: return "rejected";
  }

  return "unknown";
}

//==============================================================================
std::optional<Booking::Status> status_from_string(const std::string& name)
{
  if (name == "pending")
    return Booking::Status::Pending;

  if (name == "approved")
    return Booking::Status::Approved;

  if (name == "rejected")
    return Booking::Status::Rejected;

  return std::nullopt;
}

//==============================================================================
double round_to_cents(const double amount)
{
  return std::round(amount * 100.0) / 100.0;
}

} // namespace rental_booking
