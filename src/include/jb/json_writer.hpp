#pragma once

#include <jb/json_value.hpp>

#include <ostream>
#include <string>

namespace jb {

  // A negative indent writes compact JSON; otherwise members and elements
  // go on their own lines, indented by that many spaces per level.
  void
  write_json(std::ostream& os, const json_value& value, int indent = -1);

  std::string
  to_json_string(const json_value& value, int indent = -1);

} // namespace jb
