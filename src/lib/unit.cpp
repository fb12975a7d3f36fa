#include <jb/unit.hpp>

#include <stdexcept>

namespace jb {

  namespace {

    // scheme ":" with scheme = ALPHA *( ALPHA / DIGIT / "+" / "-" / "." )
    bool
    has_scheme(std::string_view text) {
      auto colon = text.find(':');
      if (colon == std::string_view::npos || colon == 0) return false;
      auto alpha = [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
      };
      if (!alpha(text[0])) return false;
      for (std::size_t i = 1; i < colon; ++i) {
        char c = text[i];
        if (!alpha(c) && !(c >= '0' && c <= '9') && c != '+' && c != '-' &&
            c != '.')
          return false;
      }
      return true;
    }

  } // namespace

  unit::unit(std::string_view text) {
    if (text == "cm")
      kind_ = kind::cm;
    else if (text == "feet")
      kind_ = kind::feet;
    else if (text == "inches")
      kind_ = kind::inches;
    else if (text == "km")
      kind_ = kind::km;
    else if (text == "m")
      kind_ = kind::m;
    else if (text == "miles")
      kind_ = kind::miles;
    else if (has_scheme(text)) {
      kind_ = kind::iri;
      iri_ = std::string(text);
    } else {
      throw std::invalid_argument("unit: expected a unit name or an IRI");
    }
  }

  std::string
  unit::to_string() const {
    switch (kind_) {
      case kind::cm: return "cm";
      case kind::feet: return "feet";
      case kind::inches: return "inches";
      case kind::km: return "km";
      case kind::m: return "m";
      case kind::miles: return "miles";
      case kind::iri: return iri_;
    }
    return "m";
  }

} // namespace jb
