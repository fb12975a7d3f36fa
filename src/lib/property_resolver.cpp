#include <jb/errors.hpp>
#include <jb/property_resolver.hpp>

#include <algorithm>

namespace jb {

  namespace {

    void
    insert_property(property_list& properties, const std::string& name,
                    const property_def& def) {
      for (auto& [existing_name, existing] : properties) {
        if (existing_name == name) {
          existing = def;
          return;
        }
      }
      properties.emplace_back(name, def);
    }

  } // namespace

  property_def
  apply_preferred_name(const std::string& type_name,
                       const std::string& property_name, property_def def,
                       const preferred_name& preferred) {
    auto old_tag = tag_of(property_name, def);

    if (auto* simple = std::get_if<simple_property>(&def)) {
      auto* name = std::get_if<simple_preferred_name>(&preferred);
      if (!name) throw schema_error::kind_mismatch(type_name, property_name);
      simple->aliases.insert(old_tag);
      simple->aliases.erase(name->tag);
      simple->tag = name->tag;
      return def;
    }

    auto& lang = std::get<lang_container_property>(def);
    auto* name = std::get_if<lang_preferred_name>(&preferred);
    if (!name) throw schema_error::kind_mismatch(type_name, property_name);
    lang.aliases.insert(old_tag);
    lang.aliases.erase(name->tag);
    lang.container_aliases.insert(lang.container_tag);
    lang.container_aliases.erase(name->container_tag);
    lang.tag = name->tag;
    lang.container_tag = name->container_tag;
    return def;
  }

  const property_list&
  property_resolver::resolve(const std::string& type_name) {
    if (auto it = resolved_.find(type_name); it != resolved_.end())
      return it->second;

    const auto* type = vocab_.find(type_name);
    if (!type) throw schema_error::malformed(type_name, "no such type");
    if (!in_progress_.insert(type_name).second)
      throw schema_error::cyclic_inheritance(type_name);

    property_list properties;
    for (const auto& super : type->extends()) {
      if (!vocab_.find(super))
        throw schema_error::unknown_supertype(type_name, super);
      for (const auto& [name, def] : resolve(super))
        insert_property(properties, name, def);
    }
    for (const auto& [name, def] : type->properties())
      insert_property(properties, name, def);

    const auto& except = type->except_properties();
    properties.erase(std::remove_if(properties.begin(), properties.end(),
                                    [&except](const auto& entry) {
                                      return except.count(entry.first) > 0;
                                    }),
                     properties.end());

    for (auto& [name, def] : properties) {
      auto preferred = type->preferred_names().find(name);
      if (preferred != type->preferred_names().end())
        def = apply_preferred_name(type_name, name, std::move(def),
                                   preferred->second);
    }

    in_progress_.erase(type_name);
    return resolved_.emplace(type_name, std::move(properties)).first->second;
  }

} // namespace jb
