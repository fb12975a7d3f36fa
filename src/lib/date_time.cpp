#include <jb/date_time.hpp>

#include "time_parse.hpp"

#include <stdexcept>

namespace jb {

  namespace {

    struct parsed_date_time {
      date_time::form form = date_time::form::naive;
      int32_t year = 1970;
      uint8_t month = 1;
      uint8_t day = 1;
      uint8_t hour = 0;
      uint8_t minute = 0;
      uint8_t second = 0;
      uint16_t fraction = 0;
      int16_t offset_minutes = 0;
    };

    parsed_date_time
    parse_date_time_str(std::string_view str) {
      if (str.size() < 19) {
        throw std::invalid_argument("date_time: string too short");
      }

      parsed_date_time result;
      std::size_t pos = 0;

      bool neg_year = false;
      if (str[pos] == '-') {
        neg_year = true;
        ++pos;
      }
      std::size_t year_start = pos;
      int64_t year = 0;
      while (pos < str.size() && detail::is_digit(str[pos])) {
        year = year * 10 + (str[pos] - '0');
        if (year > 999999) {
          throw std::invalid_argument("date_time: year out of range");
        }
        ++pos;
      }
      std::size_t year_digits = pos - year_start;
      if (year_digits < 4) {
        throw std::invalid_argument("date_time: expected 4-digit year");
      }
      result.year = static_cast<int32_t>(neg_year ? -year : year);

      if (pos >= str.size() || str[pos] != '-') {
        throw std::invalid_argument("date_time: expected '-' after year");
      }
      ++pos;

      int month = detail::parse_two_digits(str, pos, "month");
      if (month < 1 || month > 12) {
        throw std::invalid_argument("date_time: invalid month");
      }
      result.month = static_cast<uint8_t>(month);

      if (pos >= str.size() || str[pos] != '-') {
        throw std::invalid_argument("date_time: expected '-' after month");
      }
      ++pos;

      int day = detail::parse_two_digits(str, pos, "day");
      if (day < 1 || day > detail::days_in_month(result.year, result.month)) {
        throw std::invalid_argument("date_time: invalid day");
      }
      result.day = static_cast<uint8_t>(day);

      if (pos >= str.size() ||
          (str[pos] != 'T' && str[pos] != 't' && str[pos] != ' ')) {
        throw std::invalid_argument("date_time: expected 'T'");
      }
      char separator = str[pos];
      ++pos;

      int hour = detail::parse_two_digits(str, pos, "hour");
      if (pos >= str.size() || str[pos] != ':') {
        throw std::invalid_argument("date_time: expected ':'");
      }
      ++pos;
      int minute = detail::parse_two_digits(str, pos, "minute");
      if (pos >= str.size() || str[pos] != ':') {
        throw std::invalid_argument("date_time: expected ':'");
      }
      ++pos;
      int second = detail::parse_two_digits(str, pos, "second");

      if (hour > 23 || minute > 59 || second > 59) {
        throw std::invalid_argument("date_time: time out of range");
      }
      result.hour = static_cast<uint8_t>(hour);
      result.minute = static_cast<uint8_t>(minute);
      result.second = static_cast<uint8_t>(second);

      auto frac = detail::parse_fractional_seconds(str.substr(pos));
      pos += frac.consumed;

      auto rest = str.substr(pos);
      if (rest.empty()) {
        if (separator != 'T') {
          throw std::invalid_argument("date_time: expected 'T'");
        }
        result.form = date_time::form::naive;
        result.fraction = static_cast<uint16_t>(frac.nanos / 100000);
        return result;
      }

      auto tz = detail::parse_timezone(rest);
      if (!tz.offset_minutes.has_value() || tz.consumed != rest.size()) {
        throw std::invalid_argument("date_time: trailing characters");
      }
      if (neg_year || year_digits != 4) {
        throw std::invalid_argument(
            "date_time: offset form requires a 4-digit year");
      }
      result.form = date_time::form::offset;
      result.offset_minutes = *tz.offset_minutes;
      return result;
    }

  } // namespace

  date_time::date_time(std::string_view str) {
    auto parsed = parse_date_time_str(str);
    form_ = parsed.form;
    year_ = parsed.year;
    month_ = parsed.month;
    day_ = parsed.day;
    hour_ = parsed.hour;
    minute_ = parsed.minute;
    second_ = parsed.second;
    fraction_ = parsed.fraction;
    offset_minutes_ = parsed.offset_minutes;
  }

  std::string
  date_time::to_string() const {
    std::string result;
    detail::append_padded(result, year_, 4);
    result += '-';
    detail::append_padded(result, month_, 2);
    result += '-';
    detail::append_padded(result, day_, 2);
    result += 'T';
    detail::append_padded(result, hour_, 2);
    result += ':';
    detail::append_padded(result, minute_, 2);
    result += ':';
    detail::append_padded(result, second_, 2);

    if (form_ == form::naive) {
      result += '.';
      detail::append_padded(result, fraction_, 4);
    } else {
      detail::format_timezone(result, offset_minutes_);
    }
    return result;
  }

  int32_t
  date_time::year() const {
    return year_;
  }

  uint8_t
  date_time::month() const {
    return month_;
  }

  uint8_t
  date_time::day() const {
    return day_;
  }

  uint8_t
  date_time::hour() const {
    return hour_;
  }

  uint8_t
  date_time::minute() const {
    return minute_;
  }

  uint8_t
  date_time::second() const {
    return second_;
  }

  uint16_t
  date_time::millisecond() const {
    return static_cast<uint16_t>(fraction_ / 10);
  }

  std::optional<int16_t>
  date_time::offset_minutes() const {
    if (form_ == form::offset) return offset_minutes_;
    return std::nullopt;
  }

} // namespace jb
