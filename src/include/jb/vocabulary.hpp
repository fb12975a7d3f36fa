#pragma once

#include <jb/property_kind.hpp>

#include <map>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace jb {

  // A property carried on a single wire key (tag, or the property name when
  // no tag is given).
  struct simple_property {
    std::optional<std::string> tag;
    std::string value_type;
    std::set<std::string> aliases;
    std::string uri;
    std::string doc;
    property_kind kind = property_kind::normal;

    bool
    operator==(const simple_property&) const = default;
  };

  // A property with a language-neutral key and a language-map key.
  struct lang_container_property {
    std::optional<std::string> tag;
    std::string value_type;
    std::string container_tag;
    std::set<std::string> aliases;
    std::set<std::string> container_aliases;
    std::string uri;
    std::string doc;
    property_kind kind = property_kind::normal;

    bool
    operator==(const lang_container_property&) const = default;
  };

  using property_def = std::variant<simple_property, lang_container_property>;

  property_kind
  kind_of(const property_def& def);

  const std::string&
  value_type_of(const property_def& def);

  // Canonical tag of a property: its tag, or its name.
  std::string
  tag_of(const std::string& name, const property_def& def);

  struct simple_preferred_name {
    std::string tag;

    bool
    operator==(const simple_preferred_name&) const = default;
  };

  struct lang_preferred_name {
    std::string tag;
    std::string container_tag;

    bool
    operator==(const lang_preferred_name&) const = default;
  };

  // Per-type override of a property's wire tag(s). Its shape must match
  // the shape of the property it renames.
  using preferred_name =
      std::variant<simple_preferred_name, lang_preferred_name>;

  using property_list = std::vector<std::pair<std::string, property_def>>;

  class type_def {
    std::string name_;
    std::string uri_;
    std::string doc_;
    std::vector<std::string> extends_;
    property_list properties_;
    std::set<std::string> except_properties_;
    std::map<std::string, preferred_name> preferred_names_;

  public:
    type_def() = default;

    type_def(std::string name, std::string uri,
             std::vector<std::string> extends = {},
             property_list properties = {},
             std::set<std::string> except_properties = {},
             std::map<std::string, preferred_name> preferred_names = {},
             std::string doc = {})
        : name_(std::move(name)), uri_(std::move(uri)), doc_(std::move(doc)),
          extends_(std::move(extends)), properties_(std::move(properties)),
          except_properties_(std::move(except_properties)),
          preferred_names_(std::move(preferred_names)) {}

    const std::string&
    name() const {
      return name_;
    }

    const std::string&
    uri() const {
      return uri_;
    }

    const std::string&
    doc() const {
      return doc_;
    }

    // Declared supertypes, in document order.
    const std::vector<std::string>&
    extends() const {
      return extends_;
    }

    // Own properties, in document order.
    const property_list&
    properties() const {
      return properties_;
    }

    const std::set<std::string>&
    except_properties() const {
      return except_properties_;
    }

    const std::map<std::string, preferred_name>&
    preferred_names() const {
      return preferred_names_;
    }

    const property_def*
    find_property(const std::string& name) const;

    bool
    operator==(const type_def&) const = default;
  };

  // The set of types of one or more vocabulary documents. Immutable once
  // resolved.
  class vocabulary {
    std::vector<type_def> types_;
    std::unordered_map<std::string, std::size_t> index_;
    bool resolved_ = false;

  public:
    vocabulary() = default;

    // Throws schema_error (malformed) on a duplicate type name.
    void
    add(type_def type);

    // Checks that every supertype exists and that inheritance is acyclic.
    void
    resolve();

    bool
    resolved() const {
      return resolved_;
    }

    const type_def*
    find(const std::string& name) const;

    const type_def&
    get(const std::string& name) const;

    // Types in the order they were added.
    const std::vector<type_def>&
    types() const {
      return types_;
    }
  };

} // namespace jb
