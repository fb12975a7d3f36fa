#pragma once

#include <jb/cpp_code.hpp>
#include <jb/naming.hpp>
#include <jb/type_map.hpp>
#include <jb/vocabulary.hpp>

#include <vector>

namespace jb {

  // Generates binding types for a vocabulary: one struct per type holding
  // its effective properties, one <type>_variants envelope per type over
  // the type and its subtypes, and the from_json/to_json, object_id and
  // as_<type> functions for both.
  class codegen {
    const vocabulary& vocab_;
    const type_map& types_;
    codegen_options options_;

  public:
    codegen(const vocabulary& vocab, const type_map& types,
            codegen_options options = {});

    // Throws schema_error when the vocabulary cannot be bound.
    std::vector<cpp_file>
    generate() const;
  };

} // namespace jb
