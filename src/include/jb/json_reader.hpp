#pragma once

#include <jb/json_value.hpp>

#include <string_view>

namespace jb {

  // Parses one complete JSON document; trailing content, comments and
  // trailing commas are errors. Duplicate object keys are kept in
  // document order. Throws parse_error on malformed text.
  json_value
  parse_json(std::string_view text);

} // namespace jb
