#include <jb/property_kind.hpp>

namespace jb {

  std::string_view
  to_string(property_kind kind) {
    switch (kind) {
      case property_kind::required: return "Required";
      case property_kind::functional: return "Functional";
      case property_kind::normal: return "Normal";
    }
    return "";
  }

  std::optional<property_kind>
  property_kind_from_string(std::string_view name) {
    if (name == "Required") return property_kind::required;
    if (name == "Functional") return property_kind::functional;
    if (name == "Normal") return property_kind::normal;
    return std::nullopt;
  }

} // namespace jb
