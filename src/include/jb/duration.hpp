#pragma once

#include <cstdint>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

namespace jb {

  // xsd:duration with its components kept as written (PT90M stays 90
  // minutes). The sign applies to the whole value.
  class duration {
    bool negative_ = false;
    uint64_t years_ = 0;
    uint64_t months_ = 0;
    uint64_t days_ = 0;
    uint64_t hours_ = 0;
    uint64_t minutes_ = 0;
    uint64_t seconds_ = 0;

  public:
    duration() = default;
    explicit duration(std::string_view str);

    std::string
    to_string() const;
    bool
    is_zero() const;
    bool
    is_negative() const;

    uint64_t
    years() const;
    uint64_t
    months() const;
    uint64_t
    days() const;
    uint64_t
    hours() const;
    uint64_t
    minutes() const;
    uint64_t
    seconds() const;

    duration
    operator-() const;

    bool
    operator==(const duration& other) const = default;

    friend std::ostream&
    operator<<(std::ostream& os, const duration& d) {
      return os << d.to_string();
    }
  };

} // namespace jb

template <>
struct std::hash<jb::duration> {
  std::size_t
  operator()(const jb::duration& d) const noexcept {
    return std::hash<std::string>{}(d.to_string());
  }
};
