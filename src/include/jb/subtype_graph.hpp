#pragma once

#include <jb/vocabulary.hpp>

#include <string>
#include <unordered_map>
#include <vector>

namespace jb {

  // For every type T, T followed by all types that transitively extend it
  // (breadth first, in vocabulary order).
  class subtype_graph {
    std::unordered_map<std::string, std::vector<std::string>> subtypes_;

  public:
    explicit subtype_graph(const vocabulary& vocab);

    const std::vector<std::string>&
    subtypes(const std::string& type_name) const;
  };

} // namespace jb
