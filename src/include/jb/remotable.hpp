#pragma once

#include <jb/boxed.hpp>
#include <jb/codec.hpp>
#include <jb/either.hpp>

#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace jb {

  // A value embedded in the document, or a reference to one that is not.
  // Decoding tries the inline form first and falls back to an identifier
  // string.
  template <typename T>
  class remotable {
    std::variant<T, std::string> value_;

  public:
    remotable() = default;

    remotable(T value) : value_(std::in_place_index<0>, std::move(value)) {}

    static remotable
    reference_to(std::string iri) {
      remotable result;
      result.value_.template emplace<1>(std::move(iri));
      return result;
    }

    bool
    is_reference() const {
      return value_.index() == 1;
    }

    bool
    is_inline() const {
      return value_.index() == 0;
    }

    const std::string&
    reference() const {
      return std::get<1>(value_);
    }

    const T&
    get() const {
      return std::get<0>(value_);
    }

    T&
    get() {
      return std::get<0>(value_);
    }

    bool
    operator==(const remotable&) const = default;
  };

  template <typename T>
  struct json_codec<remotable<T>> {
    static remotable<T>
    decode(const json_value& json) {
      std::string inline_error;
      try {
        return remotable<T>(jb::decode<T>(json));
      } catch (const decode_error& e) {
        inline_error = e.what();
      }
      if (!json.is_string()) {
        throw decode_error::no_alternative(
            inline_error,
            decode_error::type_mismatch("identifier string",
                                        to_string(json.kind()))
                .what());
      }
      return remotable<T>::reference_to(json.as_string());
    }

    static json_value
    encode(const remotable<T>& value) {
      if (value.is_reference()) return json_value(value.reference());
      return jb::encode(value.get());
    }
  };

  // Identifier of a value: the reference itself, or the "id" of the inlined
  // object. Generated types provide their own overloads, found by ADL.
  inline std::optional<std::string>
  object_id(const std::string& iri) {
    return iri;
  }

  inline std::optional<std::string>
  object_id(const json_value& json) {
    if (auto* id = json.find("id"); id && id->is_string())
      return id->as_string();
    if (json.is_string()) return json.as_string();
    return std::nullopt;
  }

  template <typename T>
  std::optional<std::string>
  object_id(const boxed<T>& value) {
    return object_id(value.get());
  }

  template <typename L, typename R>
  std::optional<std::string>
  object_id(const either<L, R>& value) {
    if (value.is_left()) return object_id(value.left());
    return object_id(value.right());
  }

  template <typename T>
  std::optional<std::string>
  object_id(const remotable<T>& value) {
    if (value.is_reference()) return value.reference();
    return object_id(value.get());
  }

} // namespace jb
