#include <jb/errors.hpp>
#include <jb/json_value.hpp>
#include <jb/json_writer.hpp>

#include <cmath>
#include <limits>

namespace jb {

  std::string_view
  to_string(json_kind kind) {
    switch (kind) {
      case json_kind::null: return "null";
      case json_kind::boolean: return "boolean";
      case json_kind::integer: return "integer";
      case json_kind::floating: return "number";
      case json_kind::string: return "string";
      case json_kind::array: return "array";
      case json_kind::object: return "object";
    }
    return "unknown";
  }

  json_value::json_value(std::uint64_t value) {
    if (value <= static_cast<std::uint64_t>(
                     std::numeric_limits<std::int64_t>::max()))
      value_ = static_cast<std::int64_t>(value);
    else
      value_ = value;
  }

  bool
  json_value::as_bool() const {
    if (auto* b = std::get_if<bool>(&value_)) return *b;
    throw decode_error::type_mismatch("boolean", to_string(kind()));
  }

  std::int64_t
  json_value::as_integer() const {
    if (auto* i = std::get_if<std::int64_t>(&value_)) return *i;
    // [-2^63, 2^63) is exactly representable; NaN fails both tests.
    if (auto* d = std::get_if<double>(&value_)) {
      if (*d >= -9223372036854775808.0 && *d < 9223372036854775808.0 &&
          std::trunc(*d) == *d)
        return static_cast<std::int64_t>(*d);
      throw decode_error::type_mismatch("integer",
                                        "non-integral or out of range number");
    }
    if (is_unsigned())
      throw decode_error::type_mismatch("integer", "integer out of range");
    throw decode_error::type_mismatch("integer", to_string(kind()));
  }

  std::uint64_t
  json_value::as_unsigned() const {
    if (auto* u = std::get_if<std::uint64_t>(&value_)) return *u;
    if (auto* i = std::get_if<std::int64_t>(&value_)) {
      if (*i >= 0) return static_cast<std::uint64_t>(*i);
      throw decode_error::type_mismatch("non-negative integer",
                                        "negative integer");
    }
    if (auto* d = std::get_if<double>(&value_)) {
      if (*d >= 0.0 && *d < 18446744073709551616.0 && std::trunc(*d) == *d)
        return static_cast<std::uint64_t>(*d);
      throw decode_error::type_mismatch("non-negative integer",
                                        "non-integral or out of range number");
    }
    throw decode_error::type_mismatch("non-negative integer",
                                      to_string(kind()));
  }

  double
  json_value::as_double() const {
    if (auto* d = std::get_if<double>(&value_)) return *d;
    if (auto* i = std::get_if<std::int64_t>(&value_))
      return static_cast<double>(*i);
    if (auto* u = std::get_if<std::uint64_t>(&value_))
      return static_cast<double>(*u);
    throw decode_error::type_mismatch("number", to_string(kind()));
  }

  const std::string&
  json_value::as_string() const {
    if (auto* s = std::get_if<std::string>(&value_)) return *s;
    throw decode_error::type_mismatch("string", to_string(kind()));
  }

  const json_value::array&
  json_value::as_array() const {
    if (auto* a = std::get_if<array>(&value_)) return *a;
    throw decode_error::type_mismatch("array", to_string(kind()));
  }

  json_value::array&
  json_value::as_array() {
    if (auto* a = std::get_if<array>(&value_)) return *a;
    throw decode_error::type_mismatch("array", to_string(kind()));
  }

  const json_value::object&
  json_value::as_object() const {
    if (auto* o = std::get_if<object>(&value_)) return *o;
    throw decode_error::type_mismatch("object", to_string(kind()));
  }

  json_value::object&
  json_value::as_object() {
    if (auto* o = std::get_if<object>(&value_)) return *o;
    throw decode_error::type_mismatch("object", to_string(kind()));
  }

  const json_value*
  json_value::find(std::string_view key) const {
    auto* members = std::get_if<object>(&value_);
    if (!members) return nullptr;
    for (const auto& [name, value] : *members) {
      if (name == key) return &value;
    }
    return nullptr;
  }

  std::ostream&
  operator<<(std::ostream& os, const json_value& value) {
    write_json(os, value);
    return os;
  }

} // namespace jb
