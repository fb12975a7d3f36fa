#pragma once

#include <jb/date_time.hpp>
#include <jb/duration.hpp>
#include <jb/errors.hpp>
#include <jb/json_value.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace jb {

  // Decode/encode customization point. Generated types are picked up
  // through ADL: from_json(const json_value&, T&) and to_json(const T&).
  template <typename T>
  struct json_codec {
    static T
    decode(const json_value& json) {
      T value{};
      from_json(json, value);
      return value;
    }

    static json_value
    encode(const T& value) {
      return to_json(value);
    }
  };

  template <typename T>
  T
  decode(const json_value& json) {
    return json_codec<T>::decode(json);
  }

  template <typename T>
  json_value
  encode(const T& value) {
    return json_codec<T>::encode(value);
  }

  template <>
  struct json_codec<json_value> {
    static json_value
    decode(const json_value& json) {
      return json;
    }

    static json_value
    encode(const json_value& value) {
      return value;
    }
  };

  template <>
  struct json_codec<std::string> {
    static std::string
    decode(const json_value& json) {
      return json.as_string();
    }

    static json_value
    encode(const std::string& value) {
      return json_value(value);
    }
  };

  template <>
  struct json_codec<bool> {
    static bool
    decode(const json_value& json) {
      return json.as_bool();
    }

    static json_value
    encode(bool value) {
      return json_value(value);
    }
  };

  template <>
  struct json_codec<std::int64_t> {
    static std::int64_t
    decode(const json_value& json) {
      return json.as_integer();
    }

    static json_value
    encode(std::int64_t value) {
      return json_value(value);
    }
  };

  template <>
  struct json_codec<std::uint64_t> {
    static std::uint64_t
    decode(const json_value& json) {
      return json.as_unsigned();
    }

    static json_value
    encode(std::uint64_t value) {
      return json_value(value);
    }
  };

  template <>
  struct json_codec<double> {
    static double
    decode(const json_value& json) {
      return json.as_double();
    }

    static json_value
    encode(double value) {
      return json_value(value);
    }
  };

  template <>
  struct json_codec<date_time> {
    static date_time
    decode(const json_value& json) {
      const auto& text = json.as_string();
      try {
        return date_time(text);
      } catch (const std::invalid_argument& e) {
        throw decode_error::malformed_scalar("dateTime", text, e.what());
      }
    }

    static json_value
    encode(const date_time& value) {
      return json_value(value.to_string());
    }
  };

  template <>
  struct json_codec<duration> {
    static duration
    decode(const json_value& json) {
      const auto& text = json.as_string();
      try {
        return duration(text);
      } catch (const std::invalid_argument& e) {
        throw decode_error::malformed_scalar("duration", text, e.what());
      }
    }

    static json_value
    encode(const duration& value) {
      return json_value(value.to_string());
    }
  };

  // null decodes to an empty optional.
  template <typename T>
  struct json_codec<std::optional<T>> {
    static std::optional<T>
    decode(const json_value& json) {
      if (json.is_null()) return std::nullopt;
      return jb::decode<T>(json);
    }

    static json_value
    encode(const std::optional<T>& value) {
      if (!value) return json_value(nullptr);
      return jb::encode(*value);
    }
  };

  template <typename T>
  struct json_codec<std::vector<T>> {
    static std::vector<T>
    decode(const json_value& json) {
      std::vector<T> result;
      for (const auto& element : json.as_array())
        result.push_back(jb::decode<T>(element));
      return result;
    }

    static json_value
    encode(const std::vector<T>& value) {
      json_array result;
      result.reserve(value.size());
      for (const auto& element : value)
        result.push_back(jb::encode(element));
      return json_value(std::move(result));
    }
  };

  // Language maps and other string-keyed objects. Later duplicate keys win.
  template <typename T>
  struct json_codec<std::map<std::string, T>> {
    static std::map<std::string, T>
    decode(const json_value& json) {
      std::map<std::string, T> result;
      for (const auto& [key, member] : json.as_object())
        result.insert_or_assign(key, jb::decode<T>(member));
      return result;
    }

    static json_value
    encode(const std::map<std::string, T>& value) {
      json_object result;
      result.reserve(value.size());
      for (const auto& [key, member] : value)
        result.emplace_back(key, jb::encode(member));
      return json_value(std::move(result));
    }
  };

} // namespace jb
