#pragma once

#include <jb/codec.hpp>

#include <ostream>
#include <string>
#include <string_view>

namespace jb {

  // Measurement unit of a Place radius or altitude: one of the named
  // units, or an IRI naming some other unit. Defaults to metres.
  class unit {
  public:
    enum class kind { cm, feet, inches, km, m, miles, iri };

  private:
    kind kind_ = kind::m;
    std::string iri_;

  public:
    unit() = default;
    explicit unit(std::string_view text);

    kind
    which() const {
      return kind_;
    }

    // Empty unless which() == kind::iri.
    const std::string&
    iri() const {
      return iri_;
    }

    std::string
    to_string() const;

    bool
    operator==(const unit&) const = default;

    friend std::ostream&
    operator<<(std::ostream& os, const unit& u) {
      return os << u.to_string();
    }
  };

  // null decodes to the default unit.
  template <>
  struct json_codec<unit> {
    static unit
    decode(const json_value& json) {
      if (json.is_null()) return unit();
      const auto& text = json.as_string();
      try {
        return unit(text);
      } catch (const std::invalid_argument& e) {
        throw decode_error::malformed_scalar("unit", text, e.what());
      }
    }

    static json_value
    encode(const unit& value) {
      return json_value(value.to_string());
    }
  };

} // namespace jb
