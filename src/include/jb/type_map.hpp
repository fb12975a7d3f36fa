#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>

namespace jb {

  struct type_mapping {
    std::string cpp_type;
    // Space separated include paths, e.g. "<string>" or "<jb/unit.hpp>".
    std::string cpp_header;
  };

  // Built-in vocabulary type names and the C++ types they generate.
  class type_map {
    std::unordered_map<std::string, type_mapping> entries_;

  public:
    type_map() = default;

    static type_map
    defaults();

    // A YAML mapping of name -> {cpp_type, cpp_header}.
    static type_map
    load(std::string_view yaml_text);

    // Throws std::runtime_error when overrides names an unknown type.
    void
    merge(const type_map& overrides);

    const type_mapping*
    find(const std::string& name) const;

    void
    set(std::string name, type_mapping mapping);

    std::size_t
    size() const;

    bool
    contains(const std::string& name) const;
  };

} // namespace jb
