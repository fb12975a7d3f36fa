#include <jb/type_map.hpp>

#include <yaml-cpp/yaml.h>

#include <stdexcept>
#include <string>
#include <utility>

namespace jb {

  type_map
  type_map::defaults() {
    type_map map;

    // String types
    map.set("String", {"std::string", "<string>"});
    map.set("string", {"std::string", "<string>"});
    map.set("Url", {"std::string", "<string>"});
    map.set("anyURI", {"std::string", "<string>"});
    map.set("LangString", {"std::string", "<string>"});

    // Built-in types (no header needed)
    map.set("bool", {"bool", ""});
    map.set("boolean", {"bool", ""});
    map.set("f64", {"double", ""});
    map.set("double", {"double", ""});
    map.set("float", {"double", ""});

    // Integer types
    map.set("u64", {"std::uint64_t", "<cstdint>"});
    map.set("i64", {"std::int64_t", "<cstdint>"});
    map.set("integer", {"std::int64_t", "<cstdint>"});
    map.set("nonNegativeInteger", {"std::uint64_t", "<cstdint>"});

    // Date/time types
    map.set("DateTime", {"jb::date_time", "<jb/date_time.hpp>"});
    map.set("dateTime", {"jb::date_time", "<jb/date_time.hpp>"});
    map.set("Duration", {"jb::duration", "<jb/duration.hpp>"});
    map.set("duration", {"jb::duration", "<jb/duration.hpp>"});

    // Untyped JSON
    map.set("Value", {"jb::json_value", "<jb/json_value.hpp>"});
    map.set("json", {"jb::json_value", "<jb/json_value.hpp>"});

    // Units of measurement
    map.set("Unit", {"jb::unit", "<jb/unit.hpp>"});

    return map;
  }

  type_map
  type_map::load(std::string_view yaml_text) {
    YAML::Node root;
    try {
      root = YAML::Load(std::string(yaml_text));
    } catch (const YAML::Exception& e) {
      throw std::runtime_error("type_map::load: " + std::string(e.what()));
    }

    type_map result;
    if (!root || root.IsNull()) return result;
    if (!root.IsMap())
      throw std::runtime_error("type_map::load: expected a mapping");

    for (const auto& entry : root) {
      auto name = entry.first.as<std::string>();
      const auto& mapping = entry.second;
      if (!mapping.IsMap() || !mapping["cpp_type"])
        throw std::runtime_error("type_map::load: '" + name +
                                 "' needs a cpp_type");
      auto cpp_type = mapping["cpp_type"].as<std::string>();
      std::string cpp_header;
      if (mapping["cpp_header"])
        cpp_header = mapping["cpp_header"].as<std::string>();
      result.set(std::move(name),
                 {std::move(cpp_type), std::move(cpp_header)});
    }

    return result;
  }

  void
  type_map::merge(const type_map& overrides) {
    for (const auto& [name, mapping] : overrides.entries_) {
      if (entries_.find(name) == entries_.end()) {
        throw std::runtime_error(
            "type_map::merge: cannot override unknown type '" + name + "'");
      }
      entries_[name] = mapping;
    }
  }

  const type_mapping*
  type_map::find(const std::string& name) const {
    auto it = entries_.find(name);
    if (it == entries_.end()) return nullptr;
    return &it->second;
  }

  void
  type_map::set(std::string name, type_mapping mapping) {
    entries_.insert_or_assign(std::move(name), std::move(mapping));
  }

  std::size_t
  type_map::size() const {
    return entries_.size();
  }

  bool
  type_map::contains(const std::string& name) const {
    return entries_.count(name) != 0;
  }

} // namespace jb
