#pragma once

#include <string>
#include <variant>
#include <vector>

namespace jb {

  struct cpp_include {
    std::string path;

    bool
    operator==(const cpp_include&) const = default;
  };

  struct cpp_field {
    std::string type;
    std::string name;
    std::string default_value;
    std::string doc;

    bool
    operator==(const cpp_field&) const = default;
  };

  struct cpp_struct {
    std::string name;
    std::vector<cpp_field> fields;
    bool generate_equality = true;
    std::string doc;

    bool
    operator==(const cpp_struct&) const = default;
  };

  struct cpp_forward_decl {
    std::string name;

    bool
    operator==(const cpp_forward_decl&) const = default;
  };

  struct cpp_function {
    std::string return_type;
    std::string name;
    std::string parameters;
    std::string body;
    bool is_inline = true;
    // A prototype only; lets mutually recursive definitions that follow
    // see each other.
    bool declaration_only = false;
    std::string doc;

    bool
    operator==(const cpp_function&) const = default;
  };

  using cpp_decl = std::variant<cpp_struct, cpp_forward_decl, cpp_function>;

  struct cpp_namespace {
    std::string name;
    std::vector<cpp_decl> declarations;

    bool
    operator==(const cpp_namespace&) const = default;
  };

  enum class file_kind { header, source };

  struct cpp_file {
    std::string filename;
    // Comment placed above everything else, e.g. provenance.
    std::string banner;
    std::vector<cpp_include> includes;
    std::vector<cpp_namespace> namespaces;
    file_kind kind = file_kind::header;

    bool
    operator==(const cpp_file&) const = default;
  };

} // namespace jb
