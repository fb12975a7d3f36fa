#pragma once

#include <jb/codec.hpp>

#include <string>
#include <utility>
#include <variant>

namespace jb {

  // Ordered sum type. Decoding tries L first and only then R, so a value
  // that is valid as both always comes back as L.
  template <typename L, typename R>
  class either {
    std::variant<L, R> value_;

  public:
    either() = default;

    static either
    from_left(L value) {
      either result;
      result.value_.template emplace<0>(std::move(value));
      return result;
    }

    static either
    from_right(R value) {
      either result;
      result.value_.template emplace<1>(std::move(value));
      return result;
    }

    bool
    is_left() const {
      return value_.index() == 0;
    }

    bool
    is_right() const {
      return value_.index() == 1;
    }

    const L&
    left() const {
      return std::get<0>(value_);
    }

    const R&
    right() const {
      return std::get<1>(value_);
    }

    const std::variant<L, R>&
    value() const {
      return value_;
    }

    bool
    operator==(const either&) const = default;
  };

  template <typename L, typename R>
  struct json_codec<either<L, R>> {
    static either<L, R>
    decode(const json_value& json) {
      std::string left_error;
      try {
        return either<L, R>::from_left(jb::decode<L>(json));
      } catch (const decode_error& e) {
        left_error = e.what();
      }
      try {
        return either<L, R>::from_right(jb::decode<R>(json));
      } catch (const decode_error& e) {
        throw decode_error::no_alternative(left_error, e.what());
      }
    }

    static json_value
    encode(const either<L, R>& value) {
      if (value.is_left()) return jb::encode(value.left());
      return jb::encode(value.right());
    }
  };

} // namespace jb
