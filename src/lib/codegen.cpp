#include <jb/codegen.hpp>
#include <jb/errors.hpp>
#include <jb/naming.hpp>
#include <jb/property_resolver.hpp>
#include <jb/subtype_graph.hpp>
#include <jb/type_expr.hpp>

#include <cstddef>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace jb {

  codegen::codegen(const vocabulary& vocab, const type_map& types,
                   codegen_options options)
      : vocab_(vocab), types_(types), options_(std::move(options)) {}

  namespace {

    std::string
    quote(std::string_view text) {
      std::string result = "\"";
      for (char c : text) {
        switch (c) {
          case '"':
            result += "\\\"";
            break;
          case '\\':
            result += "\\\\";
            break;
          case '\n':
            result += "\\n";
            break;
          default:
            result += c;
        }
      }
      result += '"';
      return result;
    }

    std::string
    kind_constant(property_kind kind) {
      switch (kind) {
        case property_kind::required:
          return "jb::property_kind::required";
        case property_kind::functional:
          return "jb::property_kind::functional";
        case property_kind::normal:
          return "jb::property_kind::normal";
      }
      return "jb::property_kind::normal";
    }

    bool
    is_arithmetic(const std::string& cpp_type) {
      static const std::set<std::string> arithmetic = {
          "bool", "double", "float", "int", "long", "std::int64_t",
          "std::uint64_t", "int64_t", "uint64_t", "std::int32_t", "int32_t"};
      return arithmetic.count(cpp_type) > 0;
    }

    struct type_resolver {
      const vocabulary& vocab;
      const type_map& types;
      const std::string& ns;
      std::set<std::string>& headers;

      std::string
      struct_name(const std::string& type_name) const {
        return struct_name_for(type_name);
      }

      // Fully qualified, so a type named like the namespace cannot hide it.
      std::string
      qualify(const std::string& cpp_name) const {
        return "::" + ns + "::" + cpp_name;
      }

      std::string
      resolve(const type_expr& expr, const std::string& owner,
              const std::string& property) const {
        auto fail = [&](const std::string& what) {
          return schema_error::malformed(
              owner, "property '" + property + "': " + what + " in '" +
                         to_string(expr) + "'");
        };
        auto arity = [&](std::size_t n) {
          if (expr.args.size() != n)
            throw fail(expr.name + " takes " + std::to_string(n) +
                       " argument(s)");
        };

        if (expr.args.empty()) {
          // Vocabulary types shadow built-in names
          if (vocab.find(expr.name))
            return "jb::boxed<" + qualify(struct_name(expr.name)) + ">";
          if (auto* mapping = types.find(expr.name)) {
            add_headers(mapping->cpp_header);
            return mapping->cpp_type;
          }
          // Anything else names a C++ type supplied by the user
          return expr.name;
        }

        if (expr.name == "Or") {
          arity(2);
          return "jb::either<" + resolve(expr.args[0], owner, property) +
                 ", " + resolve(expr.args[1], owner, property) + ">";
        }
        if (expr.name == "Remotable") {
          arity(1);
          return "jb::remotable<" + resolve(expr.args[0], owner, property) +
                 ">";
        }
        if (expr.name == "Untypable") {
          arity(1);
          return "jb::either<" + resolve(expr.args[0], owner, property) +
                 ", jb::json_value>";
        }
        if (expr.name == "Vec") {
          arity(1);
          headers.insert("<vector>");
          return "std::vector<" + resolve(expr.args[0], owner, property) +
                 ">";
        }
        if (expr.name == "Variants") {
          arity(1);
          const auto& target = expr.args[0];
          if (!target.args.empty() || !vocab.find(target.name))
            throw fail("Variants needs a vocabulary type");
          return "jb::boxed<" +
                 qualify(envelope_name_for(struct_name(target.name))) + ">";
        }
        throw fail("unknown type constructor '" + expr.name + "'");
      }

      void
      add_headers(const std::string& list) const {
        std::istringstream items(list);
        std::string header;
        while (items >> header)
          headers.insert(header);
      }
    };

    // How one effective property is laid out in a generated struct.
    struct field_plan {
      std::string property;
      std::string member;
      property_kind kind = property_kind::normal;
      bool lang = false;
      std::string value_type;
      std::string element_type;
      std::string field_type;
      std::vector<std::string> keys;
      std::vector<std::string> container_keys;
      std::string tag;
      std::string container_tag;
      std::string doc;
    };

    struct type_plan {
      const type_def* type = nullptr;
      std::string cpp_name;
      std::string qualified;
      std::string envelope;
      std::vector<field_plan> fields;
      std::vector<std::string> subtypes;
    };

    std::vector<std::string>
    wire_keys(const std::string& tag, const std::set<std::string>& aliases) {
      std::vector<std::string> keys{tag};
      for (const auto& alias : aliases) {
        if (alias != tag) keys.push_back(alias);
      }
      return keys;
    }

    field_plan
    plan_field(const std::string& owner_cpp_name, const std::string& owner,
               const std::string& name, const property_def& def,
               const type_resolver& resolver) {
      field_plan field;
      field.property = name;
      field.member = member_name_for(name, owner_cpp_name);
      field.kind = kind_of(def);
      field.tag = tag_of(name, def);

      type_expr expr;
      try {
        expr = parse_type_expr(value_type_of(def));
      } catch (const std::invalid_argument& e) {
        throw schema_error::malformed(
            owner, "property '" + name + "': " + std::string(e.what()));
      }
      field.value_type = resolver.resolve(expr, owner, name);

      if (const auto* simple = std::get_if<simple_property>(&def)) {
        field.doc = simple->doc;
        field.keys = wire_keys(field.tag, simple->aliases);
        field.element_type = field.kind == property_kind::normal
                                 ? "jb::property<" + field.value_type + ">"
                                 : field.value_type;
        field.field_type = field.kind == property_kind::functional
                               ? "std::optional<" + field.value_type + ">"
                               : field.element_type;
        return field;
      }

      const auto& lang = std::get<lang_container_property>(def);
      field.lang = true;
      field.doc = lang.doc;
      field.container_tag = lang.container_tag;
      field.keys = wire_keys(field.tag, lang.aliases);
      field.container_keys = wire_keys(lang.container_tag,
                                       lang.container_aliases);
      field.element_type = field.kind == property_kind::normal
                               ? "jb::property<" + field.value_type + ">"
                               : field.value_type;
      field.field_type = "jb::lang_container<" + field.element_type + ">";
      return field;
    }

    // Kind used for each half of a language container. Only the pair as a
    // whole can be required.
    property_kind
    lang_half_kind(property_kind kind) {
      return kind == property_kind::normal ? property_kind::normal
                                           : property_kind::functional;
    }

    cpp_struct
    translate_type(const type_plan& plan) {
      cpp_struct s;
      s.name = plan.cpp_name;
      s.doc = plan.type->doc();
      for (const auto& field : plan.fields) {
        cpp_field f;
        f.type = field.field_type;
        f.name = field.member;
        f.doc = field.doc;
        if (!field.lang && field.kind == property_kind::required &&
            is_arithmetic(field.field_type))
          f.default_value = "{}";
        s.fields.push_back(std::move(f));
      }
      return s;
    }

    cpp_struct
    translate_envelope(const type_plan& plan,
                       const std::unordered_map<std::string, const type_plan*>&
                           plans) {
      std::string alternatives;
      for (const auto& sub : plan.subtypes) {
        if (!alternatives.empty()) alternatives += ", ";
        alternatives += plans.at(sub)->qualified;
      }

      cpp_struct s;
      s.name = envelope_name_for(plan.cpp_name);
      s.doc = "Any of " + plan.type->name() + " and its subtypes.";
      s.fields.push_back({"std::variant<" + alternatives + ">", "value", {}, {}});
      return s;
    }

    cpp_function
    generate_read_function(const type_plan& plan) {
      const auto& name = plan.type->name();
      std::string body;

      if (plan.fields.empty()) {
        body += "  jb::members_of(json, " + quote(name) + ");\n";
        return {"void", "from_json",
                "const jb::json_value& json, " + plan.qualified + "&", body};
      }

      body += "  static const jb::key_table keys{\n";
      std::size_t slot = 0;
      for (const auto& field : plan.fields) {
        for (const auto& key : field.keys)
          body += "      {" + quote(key) + ", " + std::to_string(slot) + "},\n";
        ++slot;
        if (field.lang) {
          for (const auto& key : field.container_keys)
            body += "      {" + quote(key) + ", " + std::to_string(slot) +
                    "},\n";
          ++slot;
        }
      }
      body += "  };\n";

      for (const auto& field : plan.fields) {
        if (!field.lang) {
          std::string slot_type =
              field.kind == property_kind::normal ? field.element_type
                                                  : field.value_type;
          body += "  jb::field_slot<" + kind_constant(field.kind) + ", " +
                  slot_type + "> " + field.member + "_slot(" +
                  quote(field.tag) + ");\n";
        } else {
          auto half = kind_constant(lang_half_kind(field.kind));
          body += "  jb::field_slot<" + half + ", " + field.element_type +
                  "> " + field.member + "_slot(" + quote(field.tag) + ");\n";
          body += "  jb::field_slot<" + half + ", std::map<std::string, " +
                  field.element_type + ">> " + field.member + "_map_slot(" +
                  quote(field.container_tag) + ");\n";
        }
      }

      body += "  for (const auto& [key, member] : jb::members_of(json, " +
              quote(name) + ")) {\n";
      body += "    switch (keys.find(key)) {\n";
      slot = 0;
      for (const auto& field : plan.fields) {
        body += "      case " + std::to_string(slot++) + ":\n";
        body += "        " + field.member + "_slot.accept(member);\n";
        body += "        break;\n";
        if (field.lang) {
          body += "      case " + std::to_string(slot++) + ":\n";
          body += "        " + field.member + "_map_slot.accept(member);\n";
          body += "        break;\n";
        }
      }
      body += "      default:\n";
      body += "        break;\n";
      body += "    }\n";
      body += "  }\n";

      for (const auto& field : plan.fields) {
        const auto target = "value." + field.member;
        if (field.lang) {
          body += "  " + target + " = {" + field.member + "_slot.take(), " +
                  field.member + "_map_slot.take_or_default()};\n";
          if (field.kind == property_kind::required)
            body += "  jb::require_lang_container(" + target + ", " +
                    quote(field.tag) + ");\n";
          continue;
        }
        switch (field.kind) {
          case property_kind::required:
            body += "  " + target + " = " + field.member +
                    "_slot.take_required();\n";
            break;
          case property_kind::functional:
            body += "  " + target + " = " + field.member + "_slot.take();\n";
            break;
          case property_kind::normal:
            body += "  " + target + " = " + field.member +
                    "_slot.take_or_default();\n";
            break;
        }
      }

      return {"void", "from_json",
              "const jb::json_value& json, " + plan.qualified + "& value",
              body};
    }

    cpp_function
    generate_write_function(const type_plan& plan) {
      std::string body;
      body += "  jb::json_object json;\n";
      for (const auto& field : plan.fields) {
        const auto source = "value." + field.member;
        if (field.lang) {
          auto half = kind_constant(lang_half_kind(field.kind));
          body += "  jb::write_member<" + half + ">(json, " +
                  quote(field.tag) + ", " + source + ".default_value);\n";
          body += "  jb::write_member<" + half + ">(json, " +
                  quote(field.container_tag) + ", " + source + ".per_lang);\n";
        } else {
          body += "  jb::write_member<" + kind_constant(field.kind) +
                  ">(json, " + quote(field.tag) + ", " + source + ");\n";
        }
      }
      body += "  return json;\n";

      std::string parameters = "const " + plan.qualified + "&";
      if (!plan.fields.empty()) parameters += " value";
      return {"jb::json_value", "to_json", parameters, body};
    }

    const field_plan*
    id_field(const type_plan& plan) {
      for (const auto& field : plan.fields) {
        if (field.property == "id" && !field.lang &&
            field.value_type == "std::string")
          return &field;
      }
      return nullptr;
    }

    cpp_function
    generate_id_function(const type_plan& plan) {
      const auto* id = id_field(plan);
      if (!id) {
        return {"std::optional<std::string>", "object_id",
                "const " + plan.qualified + "&", "  return std::nullopt;\n"};
      }
      return {"std::optional<std::string>", "object_id",
              "const " + plan.qualified + "& value",
              "  return jb::id_of(value." + id->member + ");\n"};
    }

    cpp_function
    generate_envelope_read_function(
        const type_plan& plan,
        const std::unordered_map<std::string, const type_plan*>& plans) {
      std::string body;
      body += "  static const jb::key_table variants{\n";
      std::string expected;
      for (std::size_t i = 0; i < plan.subtypes.size(); ++i) {
        const auto& sub = *plans.at(plan.subtypes[i])->type;
        body += "      {" + quote(sub.name()) + ", " + std::to_string(i) +
                "},\n";
        if (!sub.uri().empty() && sub.uri() != sub.name())
          body += "      {" + quote(sub.uri()) + ", " + std::to_string(i) +
                  "},\n";
        if (!expected.empty()) expected += ", ";
        expected += quote(sub.name());
      }
      body += "  };\n";
      body += "  auto tags = jb::discriminants(json);\n";
      body += "  for (const auto& tag : tags) {\n";
      body += "    switch (variants.find(tag)) {\n";
      for (std::size_t i = 0; i < plan.subtypes.size(); ++i) {
        body += "      case " + std::to_string(i) + ":\n";
        body += "        value.value = jb::decode<" +
                plans.at(plan.subtypes[i])->qualified + ">(json);\n";
        body += "        return;\n";
      }
      body += "      default:\n";
      body += "        break;\n";
      body += "    }\n";
      body += "  }\n";
      body += "  try {\n";
      body += "    value.value = jb::decode<" + plan.qualified + ">(json);\n";
      body += "  } catch (const jb::decode_error&) {\n";
      body += "    throw jb::decode_error::unknown_discriminant(\n";
      body += "        tags.empty() ? \"\" : tags.front(), {" + expected +
              "});\n";
      body += "  }\n";
      cpp_function fn{"void", "from_json",
                      "const jb::json_value& json, " + plan.envelope +
                          "& value",
                      body};
      fn.doc = "Decodes the first \"type\" entry that names one of " +
               expected + "; otherwise decodes " +
               quote(plan.type->name()) + " itself.";
      return fn;
    }

    // The field that reads the discriminant member, if the type has one.
    const field_plan*
    discriminator_field(const type_plan& plan) {
      for (const auto& field : plan.fields) {
        for (const auto& key : field.keys) {
          if (key == "type") return &field;
        }
      }
      return nullptr;
    }

    cpp_function
    generate_envelope_write_function(
        const type_plan& plan,
        const std::unordered_map<std::string, const type_plan*>& plans) {
      std::string body;
      body += "  switch (value.value.index()) {\n";
      for (std::size_t i = 0; i < plan.subtypes.size(); ++i) {
        const auto& sub = *plans.at(plan.subtypes[i]);
        auto alternative = "std::get<" + std::to_string(i) + ">(value.value)";
        body += "    case " + std::to_string(i) + ":\n";
        // The base decodes without a tag.
        if (i == 0) {
          body += "      return jb::encode(" + alternative + ");\n";
          continue;
        }
        auto tag = "jb::tagged(jb::encode(" + alternative + "), " +
                   quote(sub.type->name()) + ")";
        const auto* discriminator = discriminator_field(sub);
        if (!discriminator) {
          body += "      return " + tag + ";\n";
          continue;
        }
        // A decoded value already holds its tag in this field; only a
        // value built in code may lack one.
        std::string absent;
        if (discriminator->lang) {
          absent = "jb::is_absent(" + alternative + "." +
                   discriminator->member + ".default_value) && " +
                   alternative + "." + discriminator->member +
                   ".per_lang.empty()";
        } else {
          absent = "jb::is_absent(" + alternative + "." +
                   discriminator->member + ")";
        }
        body += "      if (" + absent + ") return " + tag + ";\n";
        body += "      return jb::encode(" + alternative + ");\n";
      }
      body += "  }\n";
      body += "  return jb::json_value();\n";
      return {"jb::json_value", "to_json",
              "const " + plan.envelope + "& value", body};
    }

    cpp_function
    generate_envelope_id_function(const type_plan& plan,
                                  const std::string& ns) {
      return {"std::optional<std::string>", "object_id",
              "const " + plan.envelope + "& value",
              "  return std::visit(\n"
              "      [](const auto& alternative) {\n"
              "        return ::" +
                  ns + "::object_id(alternative);\n"
              "      },\n"
              "      value.value);\n"};
    }

    // as_<base>(sub): fields the subtype holds with the same name and type
    // are copied; the rest keep their defaults.
    cpp_function
    generate_upcast_function(const type_plan& base, const type_plan& sub) {
      auto name = upcast_name_for(base.cpp_name);
      if (&base == &sub) {
        return {base.qualified, name, "const " + base.qualified + "& value",
                "  return value;\n"};
      }

      std::string body;
      body += "  " + base.qualified + " result{};\n";
      bool copied = false;
      for (const auto& field : base.fields) {
        for (const auto& other : sub.fields) {
          if (other.member == field.member &&
              other.field_type == field.field_type) {
            body += "  result." + field.member + " = value." + field.member +
                    ";\n";
            copied = true;
            break;
          }
        }
      }
      body += "  return result;\n";

      std::string parameters = "const " + sub.qualified + "&";
      if (copied) parameters += " value";
      cpp_function fn{base.qualified, name, parameters, body};
      fn.doc = "Keeps the fields " + base.type->name() + " shares with " +
               sub.type->name() + ".";
      return fn;
    }

    cpp_function
    generate_envelope_upcast_function(const type_plan& plan,
                                      const std::string& ns) {
      return {plan.qualified, upcast_name_for(plan.cpp_name),
              "const " + plan.envelope + "& value",
              "  return std::visit(\n"
              "      [](const auto& alternative) {\n"
              "        return ::" +
                  ns + "::" + upcast_name_for(plan.cpp_name) +
                  "(alternative);\n"
                  "      },\n"
                  "      value.value);\n"};
    }

    std::vector<cpp_include>
    compute_includes(const std::set<std::string>& type_headers,
                     file_kind kind, const std::string& header_filename) {
      std::vector<cpp_include> includes;
      if (kind == file_kind::source) {
        includes.push_back({"\"" + header_filename + "\""});
        return includes;
      }

      std::set<std::string> system = {"<map>", "<optional>", "<string>",
                                      "<variant>"};
      std::set<std::string> local;
      for (const auto& header : type_headers) {
        if (header.rfind("<jb/", 0) == 0 || header.front() == '"')
          local.insert(header);
        else
          system.insert(header);
      }

      // Runtime headers are included like system headers; keep them after
      // the standard library ones.
      includes.push_back({"<jb/binding.hpp>"});
      for (const auto& header : local) {
        if (header != "<jb/binding.hpp>") includes.push_back({header});
      }
      for (const auto& header : system)
        includes.push_back({header});
      return includes;
    }

  } // namespace

  std::vector<cpp_file>
  codegen::generate() const {
    const std::string& ns = options_.cpp_namespace;
    std::set<std::string> type_headers;
    type_resolver resolver{vocab_, types_, ns, type_headers};

    property_resolver properties(vocab_);
    subtype_graph graph(vocab_);

    std::vector<type_plan> plans;
    plans.reserve(vocab_.types().size());
    for (const auto& type : vocab_.types()) {
      type_plan plan;
      plan.type = &type;
      plan.cpp_name = struct_name_for(type.name());
      plan.qualified = resolver.qualify(plan.cpp_name);
      plan.envelope = resolver.qualify(envelope_name_for(plan.cpp_name));
      for (const auto& [name, def] : properties.resolve(type.name()))
        plan.fields.push_back(
            plan_field(plan.cpp_name, type.name(), name, def, resolver));
      plan.subtypes = graph.subtypes(type.name());
      plans.push_back(std::move(plan));
    }

    // Distinct vocabulary names can still collapse to one C++ name
    // ("Note" and "note", or "Note" and "NoteVariants").
    std::unordered_map<std::string, std::string> claimed;
    for (const auto& plan : plans) {
      for (const auto& cpp_name :
           {plan.cpp_name, envelope_name_for(plan.cpp_name)}) {
        auto [it, inserted] = claimed.emplace(cpp_name, plan.type->name());
        if (!inserted)
          throw schema_error::malformed(
              plan.type->name(), "C++ name '" + cpp_name +
                                     "' is already used by type '" +
                                     it->second + "'");
      }
    }

    std::unordered_map<std::string, const type_plan*> by_name;
    for (const auto& plan : plans)
      by_name.emplace(plan.type->name(), &plan);

    std::vector<cpp_decl> declarations;

    for (const auto& plan : plans) {
      declarations.push_back(cpp_forward_decl{plan.cpp_name});
      declarations.push_back(
          cpp_forward_decl{envelope_name_for(plan.cpp_name)});
    }
    for (const auto& plan : plans)
      declarations.push_back(translate_type(plan));
    for (const auto& plan : plans)
      declarations.push_back(translate_envelope(plan, by_name));

    std::vector<cpp_function> functions;
    for (const auto& plan : plans) {
      functions.push_back(generate_read_function(plan));
      functions.push_back(generate_write_function(plan));
      functions.push_back(generate_id_function(plan));
    }
    for (const auto& plan : plans) {
      functions.push_back(generate_envelope_read_function(plan, by_name));
      functions.push_back(generate_envelope_write_function(plan, by_name));
      functions.push_back(generate_envelope_id_function(plan, ns));
    }
    for (const auto& plan : plans) {
      for (const auto& sub : plan.subtypes)
        functions.push_back(generate_upcast_function(plan, *by_name.at(sub)));
      functions.push_back(generate_envelope_upcast_function(plan, ns));
    }

    if (options_.mode == output_mode::split) {
      for (auto& fn : functions)
        fn.is_inline = false;
    } else {
      // Definitions refer to each other in both directions; declare them
      // all up front.
      for (const auto& fn : functions) {
        auto prototype = fn;
        prototype.body.clear();
        prototype.declaration_only = true;
        declarations.push_back(std::move(prototype));
      }
    }
    for (auto& fn : functions)
      declarations.push_back(std::move(fn));

    std::string header_filename = options_.file_stem + ".hpp";

    cpp_namespace header_ns;
    header_ns.name = ns;
    header_ns.declarations = std::move(declarations);

    std::vector<cpp_file> files;

    std::string banner = "Generated by jb";
    for (std::size_t i = 0; i < options_.sources.size(); ++i)
      banner += (i == 0 ? " from " : ", ") + options_.sources[i];
    banner += ". Do not edit.";

    cpp_file header;
    header.filename = header_filename;
    header.banner = banner;
    header.kind = file_kind::header;
    header.includes =
        compute_includes(type_headers, file_kind::header, header_filename);
    header.namespaces.push_back(header_ns);

    if (options_.mode == output_mode::split) {
      cpp_file source;
      source.filename = options_.file_stem + ".cpp";
      source.banner = banner;
      source.kind = file_kind::source;
      source.includes =
          compute_includes(type_headers, file_kind::source, header_filename);
      source.namespaces.push_back(std::move(header_ns));
      files.push_back(std::move(header));
      files.push_back(std::move(source));
    } else {
      files.push_back(std::move(header));
    }

    return files;
  }

} // namespace jb
