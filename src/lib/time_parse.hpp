#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace jb::detail {

  inline bool
  is_digit(char c) {
    return c >= '0' && c <= '9';
  }

  inline bool
  is_leap_year(int32_t year) {
    if (year < 0) { year = -(year + 1); }
    return (year % 4 == 0 && year % 100 != 0) || (year % 400 == 0);
  }

  inline uint8_t
  days_in_month(int32_t year, uint8_t month) {
    static constexpr uint8_t table[] = {0,  31, 28, 31, 30, 31, 30,
                                        31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) {
      throw std::invalid_argument("days_in_month: invalid month");
    }
    if (month == 2 && is_leap_year(year)) { return 29; }
    return table[month];
  }

  // Exactly two digits at pos; advances pos.
  inline int
  parse_two_digits(std::string_view str, std::size_t& pos,
                   const char* what) {
    if (pos + 1 >= str.size() || !is_digit(str[pos]) ||
        !is_digit(str[pos + 1])) {
      throw std::invalid_argument(std::string("date_time: expected 2-digit ") +
                                  what);
    }
    int value = (str[pos] - '0') * 10 + (str[pos + 1] - '0');
    pos += 2;
    return value;
  }

  struct tz_result {
    std::optional<int16_t> offset_minutes;
    std::size_t consumed;
  };

  // RFC3339 offset: Z, z or +hh:mm / -hh:mm.
  inline tz_result
  parse_timezone(std::string_view str) {
    if (str.empty()) { return {std::nullopt, 0}; }

    if (str[0] == 'Z' || str[0] == 'z') { return {int16_t{0}, 1}; }

    if (str[0] == '+' || str[0] == '-') {
      if (str.size() < 6 || str[3] != ':' || !is_digit(str[1]) ||
          !is_digit(str[2]) || !is_digit(str[4]) || !is_digit(str[5])) {
        throw std::invalid_argument("invalid timezone format");
      }
      bool neg = str[0] == '-';
      int hours = (str[1] - '0') * 10 + (str[2] - '0');
      int mins = (str[4] - '0') * 10 + (str[5] - '0');

      if (hours > 23 || mins > 59) {
        throw std::invalid_argument("timezone offset out of range");
      }

      int16_t offset = static_cast<int16_t>(hours * 60 + mins);
      if (neg) { offset = static_cast<int16_t>(-offset); }
      return {offset, 6};
    }

    return {std::nullopt, 0};
  }

  inline void
  format_timezone(std::string& out, int16_t offset) {
    if (offset == 0) {
      out += 'Z';
      return;
    }
    out += (offset < 0) ? '-' : '+';
    if (offset < 0) { offset = static_cast<int16_t>(-offset); }
    int h = offset / 60;
    int m = offset % 60;
    out += static_cast<char>('0' + h / 10);
    out += static_cast<char>('0' + h % 10);
    out += ':';
    out += static_cast<char>('0' + m / 10);
    out += static_cast<char>('0' + m % 10);
  }

  struct frac_result {
    int32_t nanos;
    std::size_t consumed;
  };

  inline frac_result
  parse_fractional_seconds(std::string_view str) {
    if (str.empty() || str[0] != '.') { return {0, 0}; }
    std::size_t pos = 1;
    int32_t nanos = 0;
    int digits = 0;
    while (pos < str.size() && is_digit(str[pos])) {
      if (digits < 9) {
        nanos = nanos * 10 + (str[pos] - '0');
        ++digits;
      }
      ++pos;
    }
    if (pos == 1) {
      throw std::invalid_argument("date_time: expected digits after '.'");
    }
    while (digits < 9) {
      nanos *= 10;
      ++digits;
    }
    return {nanos, pos};
  }

  inline void
  append_padded(std::string& out, int64_t value, int width) {
    if (value < 0) {
      out += '-';
      value = -value;
    }
    std::string digits = std::to_string(value);
    if (static_cast<int>(digits.size()) < width)
      out.append(static_cast<std::size_t>(width) - digits.size(), '0');
    out += digits;
  }

} // namespace jb::detail
