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

#include <rental_booking/Date.hpp>
#include <rental_booking/Error.hpp>

#include <cstdio>
#include <ctime>
#include <stdexcept>

namespace rental_booking {

namespace {

//==============================================================================
// The civil calendar conversions follow Howard Hinnant's chrono-compatible
// low-level date algorithms.
int64_t days_from_civil(int64_t y, const unsigned int m, const unsigned int d)
{
  y -= m <= 2;
  const int64_t era = (y >= 0 ? y : y - 399) / 400;
  const auto yoe = static_cast<unsigned int>(y - era * 400);
  const unsigned int doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
  const unsigned int doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

//==============================================================================
struct Civil
{
  int year;
  unsigned int month;
  unsigned int day;
};

//==============================================================================
Civil civil_from_days(int64_t z)
{
  z += 719468;
  const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const auto doe = static_cast<unsigned int>(z - era * 146097);
  const unsigned int yoe = (doe - doe/1460 + doe/36524 - doe/146096) / 365;
  const int64_t y = static_cast<int64_t>(yoe) + era * 400;
  const unsigned int doy = doe - (365*yoe + yoe/4 - yoe/100);
  const unsigned int mp = (5*doy + 2)/153;
  const unsigned int d = doy - (153*mp + 2)/5 + 1;
  const unsigned int m = mp < 10 ? mp + 3 : mp - 9;
  return Civil{static_cast<int>(y + (m <= 2)), m, d};
}

//==============================================================================
bool is_leap(const int year)
{
  return year % 4 == 0 && (year % 100 != 0 || year % 400 == 0);
}

//==============================================================================
unsigned int last_day_of_month(const int year, const unsigned int month)
{
  static const unsigned int days[] =
  {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};

  if (month == 2 && is_leap(year))
    return 29;

  return days[month - 1];
}

const int MinYear = 1;
const int MaxYear = 9999;
const int64_t MinDays = days_from_civil(MinYear, 1, 1);
const int64_t MaxDays = days_from_civil(MaxYear, 12, 31);

//==============================================================================
int64_t checked(const int64_t days, const char* operation)
{
  if (days < MinDays || MaxDays < days)
  {
    throw std::invalid_argument(
      std::string("[rental_booking::Date::") + operation + "] Day ["
      + std::to_string(days) + "] lies outside of the years 1 through 9999");
  }

  return days;
}

//==============================================================================
bool digits(const std::string& text, std::size_t from, std::size_t to)
{
  for (std::size_t i = from; i < to; ++i)
  {
    if (text[i] < '0' || '9' < text[i])
      return false;
  }

  return true;
}

} // anonymous namespace

//==============================================================================
Date::Date()
: _days(0)
{
  // Do nothing
}

//==============================================================================
Date::Date(const int year, const unsigned int month, const unsigned int day)
{
  if (year < MinYear || MaxYear < year || month < 1 || 12 < month
    || day < 1 || last_day_of_month(year, month) < day)
  {
    throw std::invalid_argument(
      "[rental_booking::Date] There is no date with year ["
      + std::to_string(year) + "], month [" + std::to_string(month)
      + "] and day [" + std::to_string(day) + "]");
  }

  _days = days_from_civil(year, month, day);
}

//==============================================================================
Date::Date(const int64_t days)
: _days(days)
{
  // Do nothing
}

//==============================================================================
Date Date::parse(const std::string& text)
{
  if (text.size() != 10 || text[4] != '-' || text[7] != '-'
    || !digits(text, 0, 4) || !digits(text, 5, 7) || !digits(text, 8, 10))
  {
    throw std::invalid_argument(
      "[rental_booking::Date::parse] Expected a date of the form YYYY-MM-DD "
      "but received [" + text + "]");
  }

  const int year = std::stoi(text.substr(0, 4));
  const auto month = static_cast<unsigned int>(std::stoi(text.substr(5, 2)));
  const auto day = static_cast<unsigned int>(std::stoi(text.substr(8, 2)));
  return Date(year, month, day);
}

//==============================================================================
Date Date::from_days_since_epoch(const int64_t days)
{
  return Date(checked(days, "from_days_since_epoch"));
}

//==============================================================================
Date Date::today()
{
  const std::time_t now = std::time(nullptr);
  std::tm local;
  if (!localtime_r(&now, &local))
  {
    throw std::runtime_error(
      "[rental_booking::Date::today] Unable to read the local calendar");
  }

  return Date(
    local.tm_year + 1900,
    static_cast<unsigned int>(local.tm_mon + 1),
    static_cast<unsigned int>(local.tm_mday));
}

//==============================================================================
int Date::year() const
{
  return civil_from_days(_days).year;
}

//==============================================================================
unsigned int Date::month() const
{
  return civil_from_days(_days).month;
}

//==============================================================================
unsigned int Date::day() const
{
  return civil_from_days(_days).day;
}

//==============================================================================
int64_t Date::days_since_epoch() const
{
  return _days;
}

//==============================================================================
std::string Date::to_string() const
{
  const Civil c = civil_from_days(_days);
  char buffer[16];
  std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02u", c.year, c.month,
    c.day);
  return buffer;
}

//==============================================================================
Date Date::operator+(const int64_t days) const
{
  return Date(checked(_days + days, "operator+"));
}

//==============================================================================
Date Date::operator-(const int64_t days) const
{
  return Date(checked(_days - days, "operator-"));
}

//==============================================================================
Date& Date::operator+=(const int64_t days)
{
  _days = checked(_days + days, "operator+=");
  return *this;
}

//==============================================================================
int64_t Date::operator-(const Date& other) const
{
  return _days - other._days;
}

//==============================================================================
bool Date::operator==(const Date& other) const
{
  return _days == other._days;
}

//==============================================================================
bool Date::operator!=(const Date& other) const
{
  return _days != other._days;
}

//==============================================================================
bool Date::operator<(const Date& other) const
{
  return _days < other._days;
}

//==============================================================================
bool Date::operator<=(const Date& other) const
{
  return _days <= other._days;
}

//==============================================================================
bool Date::operator>(const Date& other) const
{
  return _days > other._days;
}

//==============================================================================
bool Date::operator>=(const Date& other) const
{
  return _days >= other._days;
}

//==============================================================================
std::ostream& operator<<(std::ostream& os, const Date& date)
{
  os << date.to_string();
  return os;
}

//==============================================================================
DateRange::DateRange(Date start, std::optional<Date> finish)
: _start(start),
  _finish(finish)
{
  // Do nothing
}

//==============================================================================
DateRange DateRange::make(Date start, Date finish)
{
  if (finish <= start)
  {
    throw invalid_range_error(
      "[rental_booking::DateRange::make] The end date [" + finish.to_string()
      + "] must come after the start date [" + start.to_string() + "]");
  }

  return DateRange(start, finish);
}

//==============================================================================
DateRange DateRange::inclusive(Date first, Date last)
{
  if (last < first)
  {
    throw invalid_range_error(
      "[rental_booking::DateRange::inclusive] The last date ["
      + last.to_string() + "] comes before the first date ["
      + first.to_string() + "]");
  }

  // The day after the last day of the calendar cannot be represented, and no
  // date comes after it anyway.
  if (last.days_since_epoch() == MaxDays)
    return DateRange(first, std::nullopt);

  return DateRange(first, last + 1);
}

//==============================================================================
DateRange DateRange::indefinite(Date start)
{
  return DateRange(start, std::nullopt);
}

//==============================================================================
Date DateRange::start() const
{
  return _start;
}

//==============================================================================
std::optional<Date> DateRange::finish() const
{
  return _finish;
}

//==============================================================================
bool DateRange::is_indefinite() const
{
  return !_finish.has_value();
}

//==============================================================================
std::optional<int64_t> DateRange::duration_days() const
{
  if (!_finish)
    return std::nullopt;

  return *_finish - _start;
}

//==============================================================================
bool DateRange::contains(const Date date) const
{
  if (date < _start)
    return false;

  return !_finish || date < *_finish;
}

//==============================================================================
bool DateRange::overlaps(const DateRange& other) const
{
  // A missing finish date lies after every date.
  const bool this_starts_first = !other._finish || _start < *other._finish;
  const bool other_starts_first = !_finish || other._start < *_finish;
  return this_starts_first && other_starts_first;
}

//==============================================================================
bool DateRange::operator==(const DateRange& other) const
{
  return _start == other._start && _finish == other._finish;
}

//==============================================================================
bool DateRange::operator!=(const DateRange& other) const
{
  return !(*this == other);
}

//==============================================================================
std::string DateRange::to_string() const
{
  return "[" + _start.to_string() + ", "
    + (_finish ? _finish->to_string() : std::string("...")) + ")";
}

//==============================================================================
std::ostream& operator<<(std::ostream& os, const DateRange& range)
{
  os << range.to_string();
  return os;
}

//==============================================================================
bool overlaps(const DateRange& a, const DateRange& b)
{
  return a.overlaps(b);
}

//==============================================================================
int64_t duration_days(const DateRange& range)
{
  const auto duration = range.duration_days();
  if (!duration)
  {
    throw invalid_range_error(
      "[rental_booking::duration_days] The range " + range.to_string()
      + " has no end");
  }

  return *duration;
}

//==============================================================================
std::string Conflict::to_string() const
{
  const std::string name =
    source == Source::Booking ? "booking" : "maintenance window";
  return name + " #" + std::to_string(id) + " " + range.to_string();
}

} // namespace rental_booking
