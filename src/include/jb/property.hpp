#pragma once

#include <jb/codec.hpp>

#include <cstddef>
#include <initializer_list>
#include <utility>
#include <vector>

namespace jb {

  // Zero or more values of a normal-kind property. On the wire an empty
  // property is omitted, a single value is written bare, and two or more
  // values are written as an array.
  template <typename T>
  class property {
    std::vector<T> values_;

  public:
    using value_type = T;
    using iterator = typename std::vector<T>::iterator;
    using const_iterator = typename std::vector<T>::const_iterator;

    property() = default;

    property(std::initializer_list<T> values) : values_(values) {}

    explicit property(std::vector<T> values) : values_(std::move(values)) {}

    std::size_t
    size() const {
      return values_.size();
    }

    bool
    empty() const {
      return values_.empty();
    }

    const T&
    operator[](std::size_t index) const {
      return values_[index];
    }

    T&
    operator[](std::size_t index) {
      return values_[index];
    }

    const T&
    front() const {
      return values_.front();
    }

    iterator
    begin() {
      return values_.begin();
    }

    iterator
    end() {
      return values_.end();
    }

    const_iterator
    begin() const {
      return values_.begin();
    }

    const_iterator
    end() const {
      return values_.end();
    }

    void
    push_back(T value) {
      values_.push_back(std::move(value));
    }

    const std::vector<T>&
    values() const {
      return values_;
    }

    // Appends the values of a later occurrence of the same key.
    void
    merge(property other) {
      values_.reserve(values_.size() + other.values_.size());
      for (auto& value : other.values_)
        values_.push_back(std::move(value));
    }

    bool
    operator==(const property&) const = default;
  };

  template <typename T>
  struct json_codec<property<T>> {
    static property<T>
    decode(const json_value& json) {
      if (json.is_null()) return {};
      if (!json.is_array()) return property<T>{jb::decode<T>(json)};

      // An array is a list of values, unless only the whole array decodes.
      std::vector<T> values;
      try {
        for (const auto& element : json.as_array())
          values.push_back(jb::decode<T>(element));
      } catch (const decode_error& element_error) {
        try {
          return property<T>{jb::decode<T>(json)};
        } catch (const decode_error&) {
          throw element_error;
        }
      }
      return property<T>(std::move(values));
    }

    static json_value
    encode(const property<T>& value) {
      if (value.empty()) return json_value(nullptr);
      if (value.size() == 1) return jb::encode(value.front());
      json_array result;
      result.reserve(value.size());
      for (const auto& element : value)
        result.push_back(jb::encode(element));
      return json_value(std::move(result));
    }
  };

} // namespace jb
