#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace jb {

  // A property value type as written in a vocabulary: a name with optional
  // angle-bracketed arguments, e.g. "Remotable<Variants<Object>>".
  struct type_expr {
    std::string name;
    std::vector<type_expr> args;

    bool
    operator==(const type_expr&) const = default;
  };

  // Throws std::invalid_argument on unbalanced brackets, empty names or
  // trailing text.
  type_expr
  parse_type_expr(std::string_view text);

  std::string
  to_string(const type_expr& expr);

} // namespace jb
