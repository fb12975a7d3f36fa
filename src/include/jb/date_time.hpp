#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace jb {

  // xsd:dateTime as it appears on the wire: either RFC3339 with an explicit
  // offset, or a naive local time. The parsed form governs re-encoding.
  class date_time {
  public:
    enum class form { naive, offset };

  private:
    form form_ = form::naive;
    int32_t year_ = 1970;
    uint8_t month_ = 1;
    uint8_t day_ = 1;
    uint8_t hour_ = 0;
    uint8_t minute_ = 0;
    uint8_t second_ = 0;
    // Fractional seconds in units of 100 microseconds.
    uint16_t fraction_ = 0;
    int16_t offset_minutes_ = 0;

  public:
    date_time() = default;
    explicit date_time(std::string_view str);

    std::string
    to_string() const;

    form
    kind() const {
      return form_;
    }

    bool
    has_offset() const {
      return form_ == form::offset;
    }

    int32_t
    year() const;
    uint8_t
    month() const;
    uint8_t
    day() const;
    uint8_t
    hour() const;
    uint8_t
    minute() const;
    uint8_t
    second() const;
    // Naive values keep four fractional digits; offset values keep seconds.
    uint16_t
    millisecond() const;
    uint16_t
    ten_thousandths() const {
      return fraction_;
    }
    std::optional<int16_t>
    offset_minutes() const;

    bool
    operator==(const date_time& other) const = default;

    friend std::ostream&
    operator<<(std::ostream& os, const date_time& dt) {
      return os << dt.to_string();
    }
  };

} // namespace jb

template <>
struct std::hash<jb::date_time> {
  std::size_t
  operator()(const jb::date_time& dt) const noexcept {
    return std::hash<std::string>{}(dt.to_string());
  }
};
