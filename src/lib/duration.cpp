#include <jb/duration.hpp>

#include <limits>
#include <stdexcept>

namespace jb {

  namespace {

    uint64_t
    parse_digits(std::string_view str, std::size_t& pos) {
      uint64_t value = 0;
      std::size_t start = pos;
      while (pos < str.size() && str[pos] >= '0' && str[pos] <= '9') {
        auto digit = static_cast<uint64_t>(str[pos] - '0');
        if (value > (std::numeric_limits<uint64_t>::max() - digit) / 10) {
          throw std::invalid_argument("duration: component out of range");
        }
        value = value * 10 + digit;
        ++pos;
      }
      if (pos == start) {
        throw std::invalid_argument("duration: expected digit");
      }
      return value;
    }

    // Reads "<n><designator>" pairs in designator order. Each slot in
    // designators may appear at most once, and only after earlier ones.
    bool
    parse_section(std::string_view str, std::size_t& pos,
                  std::string_view designators, uint64_t* const slots[]) {
      std::size_t next = 0;
      bool found = false;
      while (pos < str.size() && str[pos] >= '0' && str[pos] <= '9') {
        uint64_t value = parse_digits(str, pos);
        if (pos >= str.size()) {
          throw std::invalid_argument("duration: expected designator");
        }
        auto index = designators.find(str[pos], next);
        if (index == std::string_view::npos) {
          throw std::invalid_argument("duration: unexpected designator");
        }
        *slots[index] = value;
        next = index + 1;
        found = true;
        ++pos;
      }
      return found;
    }

  } // namespace

  duration::duration(std::string_view str) {
    if (str.empty()) {
      throw std::invalid_argument("duration: empty string");
    }

    std::size_t pos = 0;

    // Canonical XSD puts the sign before 'P'; the wire form puts it after.
    if (str[pos] == '-') {
      negative_ = true;
      ++pos;
    }

    if (pos >= str.size() || str[pos] != 'P') {
      throw std::invalid_argument("duration: expected 'P'");
    }
    ++pos;

    if (!negative_ && pos < str.size() && str[pos] == '-') {
      negative_ = true;
      ++pos;
    }

    if (pos >= str.size()) {
      throw std::invalid_argument("duration: expected component after 'P'");
    }

    uint64_t* const date_slots[] = {&years_, &months_, &days_};
    bool found_any = parse_section(str, pos, "YMD", date_slots);

    if (pos < str.size() && str[pos] == 'T') {
      ++pos;
      uint64_t* const time_slots[] = {&hours_, &minutes_, &seconds_};
      if (!parse_section(str, pos, "HMS", time_slots)) {
        throw std::invalid_argument("duration: no time components after 'T'");
      }
      found_any = true;
    }

    if (pos != str.size()) {
      throw std::invalid_argument("duration: unexpected character");
    }

    if (!found_any) {
      throw std::invalid_argument("duration: no components found");
    }

    if (is_zero()) negative_ = false;
  }

  std::string
  duration::to_string() const {
    std::string result = "P";
    if (negative_) { result += '-'; }

    auto component = [&result](uint64_t value, char designator) {
      if (value == 0) return;
      result += std::to_string(value);
      result += designator;
    };

    component(years_, 'Y');
    component(months_, 'M');
    component(days_, 'D');

    if (hours_ != 0 || minutes_ != 0 || seconds_ != 0) {
      result += 'T';
      component(hours_, 'H');
      component(minutes_, 'M');
      component(seconds_, 'S');
    } else if (is_zero()) {
      result += "T0S";
    }

    return result;
  }

  bool
  duration::is_zero() const {
    return years_ == 0 && months_ == 0 && days_ == 0 && hours_ == 0 &&
           minutes_ == 0 && seconds_ == 0;
  }

  bool
  duration::is_negative() const {
    return negative_;
  }

  uint64_t
  duration::years() const {
    return years_;
  }

  uint64_t
  duration::months() const {
    return months_;
  }

  uint64_t
  duration::days() const {
    return days_;
  }

  uint64_t
  duration::hours() const {
    return hours_;
  }

  uint64_t
  duration::minutes() const {
    return minutes_;
  }

  uint64_t
  duration::seconds() const {
    return seconds_;
  }

  duration
  duration::operator-() const {
    duration result = *this;
    if (!is_zero()) result.negative_ = !negative_;
    return result;
  }

} // namespace jb
