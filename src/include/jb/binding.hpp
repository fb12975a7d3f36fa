#pragma once

// Runtime support for generated bindings.

#include <jb/boxed.hpp>
#include <jb/codec.hpp>
#include <jb/context.hpp>
#include <jb/either.hpp>
#include <jb/errors.hpp>
#include <jb/json_value.hpp>
#include <jb/lang_container.hpp>
#include <jb/property.hpp>
#include <jb/property_kind.hpp>
#include <jb/remotable.hpp>

#include <cstddef>
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace jb {

  // Wire key -> field slot. Built once per generated type and only read
  // afterwards.
  class key_table {
    std::unordered_map<std::string, std::size_t> slots_;

  public:
    static constexpr std::size_t npos = static_cast<std::size_t>(-1);

    key_table(std::initializer_list<std::pair<std::string_view, std::size_t>>
                  entries);

    std::size_t
    find(std::string_view key) const;

    std::size_t
    size() const {
      return slots_.size();
    }
  };

  // Members of a JSON object being decoded as type_name.
  const json_object&
  members_of(const json_value& json, std::string_view type_name);

  // The fixed discriminant key of polymorphic objects.
  inline constexpr std::string_view discriminant_key = "type";

  // Candidate discriminant values, in order: the "type" string, or each
  // string of a "type" array.
  std::vector<std::string>
  discriminants(const json_value& json);

  // Adds "type": type_name as the first member unless one is present.
  json_value
  tagged(json_value json, std::string_view type_name);

  // Merge capability: combines the value of a later occurrence of a key
  // into the value decoded so far.
  template <typename T>
  void
  merge(property<T>& into, property<T> from) {
    into.merge(std::move(from));
  }

  template <typename T>
  void
  merge(std::map<std::string, T>& into, std::map<std::string, T> from) {
    for (auto& [key, value] : from)
      into.insert_or_assign(key, std::move(value));
  }

  template <typename T>
  void
  merge(lang_container<T>& into, lang_container<T> from) {
    into.merge(std::move(from));
  }

  template <typename T>
  void
  merge(std::optional<T>& into, std::optional<T> from) {
    if (from) into = std::move(from);
  }

  // Accumulates the occurrences of one logical field while an object is
  // scanned. Normal fields merge repeated keys; required and functional
  // fields reject them. A null member of an optional field counts as absent.
  template <property_kind Kind, typename T>
  class field_slot {
    std::string_view name_;
    std::optional<T> value_;

  public:
    explicit field_slot(std::string_view name) : name_(name) {}

    void
    accept(const json_value& json) {
      if constexpr (Kind != property_kind::required) {
        if (json.is_null()) return;
      }
      if constexpr (Kind == property_kind::normal) {
        auto value = jb::decode<T>(json);
        if (value_)
          merge(*value_, std::move(value));
        else
          value_ = std::move(value);
      } else {
        if (value_) throw decode_error::duplicate_field(name_);
        value_ = jb::decode<T>(json);
      }
    }

    bool
    present() const {
      return value_.has_value();
    }

    T
    take_required() {
      if (!value_) throw decode_error::missing_required_field(name_);
      return std::move(*value_);
    }

    std::optional<T>
    take() {
      return std::move(value_);
    }

    T
    take_or_default() {
      if (!value_) return T{};
      return std::move(*value_);
    }
  };

  // A required language container needs a default value or at least one
  // language entry.
  template <typename T>
  void
  require_lang_container(const lang_container<T>& value,
                         std::string_view name) {
    if (value.empty()) throw decode_error::missing_required_field(name);
  }

  template <typename T>
  bool
  is_absent(const T&) {
    return false;
  }

  template <typename T>
  bool
  is_absent(const property<T>& value) {
    return value.empty();
  }

  template <typename T>
  bool
  is_absent(const std::map<std::string, T>& value) {
    return value.empty();
  }

  template <typename T>
  bool
  is_absent(const std::optional<T>& value) {
    return !value || is_absent(*value);
  }

  // Required members are always written; the others are left out when
  // absent or empty.
  template <property_kind Kind, typename T>
  void
  write_member(json_object& members, std::string_view tag, const T& value) {
    if constexpr (Kind != property_kind::required) {
      if (is_absent(value)) return;
    }
    members.emplace_back(std::string(tag), jb::encode(value));
  }

  // Identifier held by an "id" field of any cardinality.
  inline std::optional<std::string>
  id_of(const std::string& id) {
    return id;
  }

  inline std::optional<std::string>
  id_of(const std::optional<std::string>& id) {
    return id;
  }

  inline std::optional<std::string>
  id_of(const property<std::string>& id) {
    if (id.empty()) return std::nullopt;
    return id.front();
  }

} // namespace jb
