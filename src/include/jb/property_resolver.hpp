#pragma once

#include <jb/vocabulary.hpp>

#include <set>
#include <string>
#include <unordered_map>

namespace jb {

  // Effective property sets. A type's properties are those of its
  // supertypes (post-order, in declared order) followed by its own, which
  // replace inherited ones of the same name, minus except_properties.
  // Preferred names then become canonical tags; the replaced tags stay
  // accepted as aliases. Results are memoized.
  class property_resolver {
    const vocabulary& vocab_;
    std::unordered_map<std::string, property_list> resolved_;
    std::set<std::string> in_progress_;

  public:
    explicit property_resolver(const vocabulary& vocab) : vocab_(vocab) {}

    // Throws schema_error: unknown_supertype, kind_mismatch or
    // cyclic_inheritance.
    const property_list&
    resolve(const std::string& type_name);
  };

  // Applies one preferred name to a property definition.
  property_def
  apply_preferred_name(const std::string& type_name,
                       const std::string& property_name, property_def def,
                       const preferred_name& preferred);

} // namespace jb
