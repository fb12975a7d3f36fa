#include <jb/errors.hpp>
#include <jb/vocabulary_loader.hpp>

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <sstream>
#include <string>

namespace jb {

  namespace {

    std::string
    scalar(const YAML::Node& node, const std::string& type_name,
           const std::string& what) {
      if (!node.IsScalar())
        throw schema_error::malformed(type_name, what + " must be a string");
      return node.Scalar();
    }

    std::string
    optional_scalar(const YAML::Node& parent, const char* key,
                    const std::string& type_name, const std::string& what) {
      auto node = parent[key];
      if (!node || node.IsNull()) return {};
      return scalar(node, type_name, what + "." + key);
    }

    // A sequence of strings; a single string counts as a one-element list.
    std::vector<std::string>
    string_list(const YAML::Node& node, const std::string& type_name,
                const std::string& what) {
      std::vector<std::string> result;
      if (!node || node.IsNull()) return result;
      if (node.IsScalar()) {
        result.push_back(node.Scalar());
        return result;
      }
      if (!node.IsSequence())
        throw schema_error::malformed(type_name,
                                      what + " must be a list of strings");
      for (const auto& item : node)
        result.push_back(scalar(item, type_name, what));
      return result;
    }

    std::set<std::string>
    string_set(const YAML::Node& node, const std::string& type_name,
               const std::string& what) {
      auto items = string_list(node, type_name, what);
      return std::set<std::string>(items.begin(), items.end());
    }

    // Externally tagged choice: a mapping with exactly one key.
    std::pair<std::string, YAML::Node>
    tagged_choice(const YAML::Node& node, const std::string& type_name,
                  const std::string& what) {
      if (!node.IsMap() || node.size() != 1)
        throw schema_error::malformed(
            type_name, what + " must be a mapping with a single variant key");
      auto it = node.begin();
      return {scalar(it->first, type_name, what), it->second};
    }

    property_kind
    parse_kind(const YAML::Node& node, const std::string& type_name,
               const std::string& what) {
      auto kind_node = node["kind"];
      if (!kind_node || kind_node.IsNull()) return property_kind::normal;
      auto name = scalar(kind_node, type_name, what + ".kind");
      auto kind = property_kind_from_string(name);
      if (!kind)
        throw schema_error::malformed(type_name, what + ": unknown kind '" +
                                                     name + "'");
      return *kind;
    }

    property_def
    parse_property(const std::string& name, const YAML::Node& node,
                   const std::string& type_name) {
      auto what = "property '" + name + "'";
      const auto [variant, body] = tagged_choice(node, type_name, what);
      if (!body.IsMap())
        throw schema_error::malformed(type_name, what + " must be a mapping");

      auto type_node = body["type"];
      if (!type_node)
        throw schema_error::malformed(type_name, what + " has no type");
      auto value_type = scalar(type_node, type_name, what + ".type");

      std::optional<std::string> tag;
      if (auto tag_node = body["tag"]; tag_node && !tag_node.IsNull())
        tag = scalar(tag_node, type_name, what + ".tag");

      if (variant == "Simple") {
        simple_property def;
        def.tag = std::move(tag);
        def.value_type = std::move(value_type);
        def.aliases = string_set(body["aka"], type_name, what + ".aka");
        def.uri = optional_scalar(body, "uri", type_name, what);
        def.doc = optional_scalar(body, "doc", type_name, what);
        def.kind = parse_kind(body, type_name, what);
        return def;
      }

      if (variant == "LangContainer") {
        lang_container_property def;
        def.tag = std::move(tag);
        def.value_type = std::move(value_type);
        auto container = body["container_tag"];
        if (!container)
          throw schema_error::malformed(type_name,
                                        what + " has no container_tag");
        def.container_tag =
            scalar(container, type_name, what + ".container_tag");
        def.aliases = string_set(body["aka"], type_name, what + ".aka");
        def.container_aliases = string_set(body["container_aka"], type_name,
                                           what + ".container_aka");
        def.uri = optional_scalar(body, "uri", type_name, what);
        def.doc = optional_scalar(body, "doc", type_name, what);
        def.kind = parse_kind(body, type_name, what);
        return def;
      }

      throw schema_error::malformed(type_name, what + ": unknown variant '" +
                                                   variant + "'");
    }

    preferred_name
    parse_preferred_name(const std::string& name, const YAML::Node& node,
                         const std::string& type_name) {
      auto what = "preferred name of '" + name + "'";
      if (node.IsScalar()) return simple_preferred_name{node.Scalar()};

      const auto [variant, body] = tagged_choice(node, type_name, what);
      if (variant == "Simple")
        return simple_preferred_name{scalar(body, type_name, what)};
      if (variant == "LangContainer") {
        if (!body.IsMap() || !body["default"] || !body["container"])
          throw schema_error::malformed(
              type_name, what + " needs 'default' and 'container'");
        return lang_preferred_name{
            scalar(body["default"], type_name, what + ".default"),
            scalar(body["container"], type_name, what + ".container")};
      }
      throw schema_error::malformed(type_name, what + ": unknown variant '" +
                                                   variant + "'");
    }

    type_def
    parse_type(const std::string& name, const YAML::Node& node) {
      if (!node.IsMap())
        throw schema_error::malformed(name, "definition must be a mapping");

      auto uri = optional_scalar(node, "uri", name, "type");
      auto doc = optional_scalar(node, "doc", name, "type");

      std::vector<std::string> extends;
      for (auto& super : string_list(node["extends"], name, "extends")) {
        bool seen = false;
        for (const auto& existing : extends)
          seen = seen || existing == super;
        if (!seen) extends.push_back(std::move(super));
      }

      property_list properties;
      if (auto props = node["properties"]; props && !props.IsNull()) {
        if (!props.IsMap())
          throw schema_error::malformed(name, "properties must be a mapping");
        for (const auto& entry : props) {
          auto property_name = scalar(entry.first, name, "property name");
          properties.emplace_back(
              property_name, parse_property(property_name, entry.second, name));
        }
      }

      auto except =
          string_set(node["except_properties"], name, "except_properties");

      std::map<std::string, preferred_name> preferred;
      if (auto names = node["preferred_property_name"];
          names && !names.IsNull()) {
        if (!names.IsMap())
          throw schema_error::malformed(
              name, "preferred_property_name must be a mapping");
        for (const auto& entry : names) {
          auto property_name = scalar(entry.first, name, "property name");
          preferred.emplace(property_name,
                            parse_preferred_name(property_name, entry.second,
                                                 name));
        }
      }

      return type_def(name, std::move(uri), std::move(extends),
                      std::move(properties), std::move(except),
                      std::move(preferred), std::move(doc));
    }

  } // namespace

  void
  load_vocabulary(vocabulary& vocab, std::string_view text) {
    YAML::Node root;
    try {
      root = YAML::Load(std::string(text));
    } catch (const YAML::Exception& e) {
      throw schema_error::malformed({}, "line " +
                                            std::to_string(e.mark.line + 1) +
                                            ": " + e.msg);
    }
    if (root.IsNull()) return;
    if (!root.IsMap())
      throw schema_error::malformed(
          {}, "document must map type names to definitions");

    for (const auto& entry : root) {
      auto name = scalar(entry.first, {}, "type name");
      vocab.add(parse_type(name, entry.second));
    }
  }

  void
  load_vocabulary_file(vocabulary& vocab, const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in)
      throw std::runtime_error("vocabulary: cannot open " + path.string());
    std::ostringstream buffer;
    buffer << in.rdbuf();
    load_vocabulary(vocab, buffer.str());
  }

} // namespace jb
