#include <jb/binding.hpp>

namespace jb {

  key_table::key_table(
      std::initializer_list<std::pair<std::string_view, std::size_t>> entries) {
    slots_.reserve(entries.size());
    for (const auto& [key, slot] : entries)
      slots_.emplace(std::string(key), slot);
  }

  std::size_t
  key_table::find(std::string_view key) const {
    auto it = slots_.find(std::string(key));
    if (it == slots_.end()) return npos;
    return it->second;
  }

  const json_object&
  members_of(const json_value& json, std::string_view type_name) {
    if (!json.is_object()) {
      throw decode_error::type_mismatch(std::string(type_name) + " object",
                                        to_string(json.kind()));
    }
    return json.as_object();
  }

  std::vector<std::string>
  discriminants(const json_value& json) {
    std::vector<std::string> result;
    const auto* tag = json.find(discriminant_key);
    if (!tag) return result;
    if (tag->is_string()) {
      result.push_back(tag->as_string());
    } else if (tag->is_array()) {
      for (const auto& entry : tag->as_array()) {
        if (entry.is_string()) result.push_back(entry.as_string());
      }
    }
    return result;
  }

  json_value
  tagged(json_value json, std::string_view type_name) {
    if (!json.is_object() || json.find(discriminant_key)) return json;
    auto& members = json.as_object();
    members.emplace(members.begin(), std::string(discriminant_key),
                    json_value(std::string(type_name)));
    return json;
  }

} // namespace jb
