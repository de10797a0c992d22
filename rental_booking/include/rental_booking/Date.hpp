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

#ifndef RENTAL_BOOKING__DATE_HPP
#define RENTAL_BOOKING__DATE_HPP

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

namespace rental_booking {

//==============================================================================
/// A calendar date in the proleptic Gregorian calendar, limited to the years
/// 1 through 9999 so that its ISO-8601 text form sorts the same way the dates
/// do.
class Date
{
public:

  /// Construct 1970-01-01.
  Date();

  /// Construct a date from its calendar fields.
  ///
  /// \throws std::invalid_argument if the fields do not name a real date.
  Date(int year, unsigned int month, unsigned int day);

  /// Parse a `YYYY-MM-DD` string.
  ///
  /// \throws std::invalid_argument if the text is malformed or names a date
  /// that does not exist.
  static Date parse(const std::string& text);

  /// Construct the date that lies `days` days after 1970-01-01.
  static Date from_days_since_epoch(int64_t days);

  /// The current date on the local calendar.
  static Date today();

  int year() const;
  unsigned int month() const;
  unsigned int day() const;

  /// The number of days between 1970-01-01 and this date.
  int64_t days_since_epoch() const;

  /// Format as `YYYY-MM-DD`.
  std::string to_string() const;

  Date operator+(int64_t days) const;
  Date operator-(int64_t days) const;
  Date& operator+=(int64_t days);

  /// Signed number of days from `other` to this date.
  int64_t operator-(const Date& other) const;

  bool operator==(const Date& other) const;
  bool operator!=(const Date& other) const;
  bool operator<(const Date& other) const;
  bool operator<=(const Date& other) const;
  bool operator>(const Date& other) const;
  bool operator>=(const Date& other) const;

private:
  explicit Date(int64_t days);
  int64_t _days;
};

std::ostream& operator<<(std::ostream& os, const Date& date);

//==============================================================================
/// A half-open interval of calendar dates, [start, finish). A range may also
/// be indefinite, in which case it begins at its start date and never ends.
///
/// Booking ranges are always finite: the finish date is the day the vehicle is
/// returned, so a booking finishing on day D does not overlap a booking that
/// starts on day D.
class DateRange
{
public:

  /// Make the range [start, finish).
  ///
  /// \throws invalid_range_error if `finish <= start`.
  static DateRange make(Date start, Date finish);

  /// Make the range that covers every date from `first` through `last`,
  /// including `last`. This is how maintenance windows with a known end date
  /// are represented.
  ///
  /// When `last` is 9999-12-31 the range is indefinite, since no later date
  /// exists.
  ///
  /// \throws invalid_range_error if `last < first`.
  static DateRange inclusive(Date first, Date last);

  /// Make the range that begins at `start` and never ends.
  static DateRange indefinite(Date start);

  /// The first date covered by the range.
  Date start() const;

  /// The first date that is no longer covered by the range, or std::nullopt
  /// if the range is indefinite.
  std::optional<Date> finish() const;

  /// True if the range has no finish date.
  bool is_indefinite() const;

  /// The number of days covered by the range, or std::nullopt if the range is
  /// indefinite.
  std::optional<int64_t> duration_days() const;

  /// True if `date` lies within the range.
  bool contains(Date date) const;

  /// True if the two ranges share at least one date.
  bool overlaps(const DateRange& other) const;

  bool operator==(const DateRange& other) const;
  bool operator!=(const DateRange& other) const;

  /// Format as `[start, finish)` or `[start, ...)`.
  std::string to_string() const;

private:
  DateRange(Date start, std::optional<Date> finish);
  Date _start;
  std::optional<Date> _finish;
};

std::ostream& operator<<(std::ostream& os, const DateRange& range);

//==============================================================================
/// True if the two ranges share at least one date. Symmetric.
bool overlaps(const DateRange& a, const DateRange& b);

//==============================================================================
/// The number of days covered by a finite range.
///
/// \throws invalid_range_error if the range is indefinite.
int64_t duration_days(const DateRange& range);

} // namespace rental_booking

#endif // RENTAL_BOOKING__DATE_HPP
