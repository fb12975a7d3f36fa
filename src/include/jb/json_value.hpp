#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace jb {

  enum class json_kind { null, boolean, integer, floating, string, array, object };

  std::string_view
  to_string(json_kind kind);

  // Generic JSON tree. Object members keep document order and duplicate
  // keys, so decoders can see every occurrence of a key.
  class json_value {
  public:
    using array = std::vector<json_value>;
    using member = std::pair<std::string, json_value>;
    using object = std::vector<member>;

  private:
    // The trailing uint64 holds only integers above INT64_MAX.
    std::variant<std::nullptr_t, bool, std::int64_t, double, std::string,
                 array, object, std::uint64_t>
        value_;

  public:
    json_value() = default;
    json_value(std::nullptr_t) {}
    json_value(bool value) : value_(value) {}
    json_value(int value) : value_(std::int64_t{value}) {}
    json_value(std::int64_t value) : value_(value) {}
    json_value(std::uint64_t value);
    json_value(double value) : value_(value) {}
    json_value(const char* value) : value_(std::string(value)) {}
    json_value(std::string value) : value_(std::move(value)) {}
    json_value(array value) : value_(std::move(value)) {}
    json_value(object value) : value_(std::move(value)) {}

    json_kind
    kind() const {
      if (std::holds_alternative<std::uint64_t>(value_))
        return json_kind::integer;
      return static_cast<json_kind>(value_.index());
    }

    bool
    is_null() const {
      return kind() == json_kind::null;
    }

    bool
    is_bool() const {
      return kind() == json_kind::boolean;
    }

    bool
    is_integer() const {
      return kind() == json_kind::integer;
    }

    // An integer too large for int64.
    bool
    is_unsigned() const {
      return std::holds_alternative<std::uint64_t>(value_);
    }

    bool
    is_number() const {
      return kind() == json_kind::integer || kind() == json_kind::floating;
    }

    bool
    is_string() const {
      return kind() == json_kind::string;
    }

    bool
    is_array() const {
      return kind() == json_kind::array;
    }

    bool
    is_object() const {
      return kind() == json_kind::object;
    }

    // Accessors throw decode_error (type mismatch) on the wrong kind.
    bool
    as_bool() const;

    std::int64_t
    as_integer() const;

    // Rejects negative numbers.
    std::uint64_t
    as_unsigned() const;

    double
    as_double() const;

    const std::string&
    as_string() const;

    const array&
    as_array() const;

    array&
    as_array();

    const object&
    as_object() const;

    object&
    as_object();

    // First member with the given key, or nullptr.
    const json_value*
    find(std::string_view key) const;

    bool
    operator==(const json_value&) const;

    friend std::ostream&
    operator<<(std::ostream& os, const json_value& value);
  };

  using json_array = json_value::array;
  using json_object = json_value::object;

  // Out-of-line: json_value must be complete before the variant of
  // vectors of json_value can be compared.
  inline bool
  json_value::operator==(const json_value& other) const {
    return value_ == other.value_;
  }

} // namespace jb
