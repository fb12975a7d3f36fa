#include <jb/errors.hpp>
#include <jb/subtype_graph.hpp>

#include <cstddef>
#include <set>

namespace jb {

  subtype_graph::subtype_graph(const vocabulary& vocab) {
    std::unordered_map<std::string, std::vector<std::string>> children;
    for (const auto& type : vocab.types()) {
      for (const auto& super : type.extends())
        children[super].push_back(type.name());
    }

    for (const auto& type : vocab.types()) {
      std::vector<std::string> closure{type.name()};
      std::set<std::string> seen{type.name()};
      for (std::size_t i = 0; i < closure.size(); ++i) {
        auto it = children.find(closure[i]);
        if (it == children.end()) continue;
        for (const auto& child : it->second) {
          if (seen.insert(child).second) closure.push_back(child);
        }
      }
      subtypes_.emplace(type.name(), std::move(closure));
    }
  }

  const std::vector<std::string>&
  subtype_graph::subtypes(const std::string& type_name) const {
    auto it = subtypes_.find(type_name);
    if (it == subtypes_.end())
      throw schema_error::malformed(type_name, "no such type");
    return it->second;
  }

} // namespace jb
