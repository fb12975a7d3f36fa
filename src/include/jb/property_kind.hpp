#pragma once

#include <optional>
#include <string_view>

namespace jb {

  // Cardinality of a vocabulary property.
  //   required   - exactly one value, absence is an error
  //   functional - zero or one value
  //   normal     - zero or more values, repeated keys merge
  enum class property_kind { required, functional, normal };

  std::string_view
  to_string(property_kind kind);

  std::optional<property_kind>
  property_kind_from_string(std::string_view name);

} // namespace jb
