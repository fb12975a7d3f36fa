#include <jb/naming.hpp>

#include <unordered_set>

namespace jb {

  namespace {

    bool
    is_upper(char c) {
      return c >= 'A' && c <= 'Z';
    }

    bool
    is_lower(char c) {
      return c >= 'a' && c <= 'z';
    }

    bool
    is_digit(char c) {
      return c >= '0' && c <= '9';
    }

    char
    to_lower(char c) {
      if (is_upper(c)) return static_cast<char>(c - 'A' + 'a');
      return c;
    }

    const std::unordered_set<std::string>&
    cpp_keywords() {
      static const std::unordered_set<std::string> keywords = {
          "alignas",       "alignof",     "and",
          "and_eq",        "asm",         "auto",
          "bitand",        "bitor",       "bool",
          "break",         "case",        "catch",
          "char",          "char8_t",     "char16_t",
          "char32_t",      "class",       "compl",
          "concept",       "const",       "consteval",
          "constexpr",     "constinit",   "const_cast",
          "continue",      "co_await",    "co_return",
          "co_yield",      "decltype",    "default",
          "delete",        "do",          "double",
          "dynamic_cast",  "else",        "enum",
          "explicit",      "export",      "extern",
          "false",         "float",       "for",
          "friend",        "goto",        "if",
          "inline",        "int",         "long",
          "mutable",       "namespace",   "new",
          "noexcept",      "not",         "not_eq",
          "nullptr",       "operator",    "or",
          "or_eq",         "private",     "protected",
          "public",        "register",    "reinterpret_cast",
          "requires",      "return",      "short",
          "signed",        "sizeof",      "static",
          "static_assert", "static_cast", "struct",
          "switch",        "template",    "this",
          "thread_local",  "throw",       "true",
          "try",           "typedef",     "typeid",
          "typename",      "union",       "unsigned",
          "using",         "virtual",     "void",
          "volatile",      "wchar_t",     "while",
          "xor",           "xor_eq",
      };
      return keywords;
    }

    // Generated code names these namespaces from inside its own namespace,
    // so no generated struct or member may be called the same.
    bool
    hides_namespace(const std::string& name) {
      return name == "jb" || name == "std";
    }

  } // namespace

  std::string
  to_snake_case(std::string_view name) {
    if (name.empty()) return {};

    std::string result;
    result.reserve(name.size() + 4);

    for (std::size_t i = 0; i < name.size(); ++i) {
      char c = name[i];

      // Anything that cannot appear in an identifier becomes '_'
      if (!is_upper(c) && !is_lower(c) && !is_digit(c) && c != '_') {
        if (result.empty() || result.back() != '_') result += '_';
        continue;
      }

      if (is_upper(c)) {
        // Insert underscore before:
        // - an uppercase letter preceded by a lowercase letter (camelCase)
        // - an uppercase letter that starts a new word after an abbreviation
        //   run (e.g. the 'P' in "HTMLParser")
        if (!result.empty() && result.back() != '_') {
          bool prev_lower = is_lower(name[i - 1]);
          bool prev_upper = is_upper(name[i - 1]);
          bool next_lower = (i + 1 < name.size()) && is_lower(name[i + 1]);

          if (prev_lower || (prev_upper && next_lower)) result += '_';
        }
        result += to_lower(c);
      } else {
        result += c;
      }
    }

    return result;
  }

  std::string
  to_cpp_identifier(std::string_view name) {
    std::string result = to_snake_case(name);
    if (result.empty()) return "_";

    // Prefix with underscore if starts with a digit
    if (is_digit(result[0]))
      result.insert(result.begin(), '_');

    // Append underscore if it's a C++ keyword
    if (cpp_keywords().count(result) || hides_namespace(result)) result += '_';

    return result;
  }

  std::string
  struct_name_for(std::string_view type_name) {
    return to_cpp_identifier(type_name);
  }

  std::string
  envelope_name_for(std::string_view struct_name) {
    return std::string(struct_name) + "_variants";
  }

  std::string
  upcast_name_for(std::string_view struct_name) {
    return "as_" + std::string(struct_name);
  }

  std::string
  member_name_for(std::string_view property_name,
                  std::string_view struct_name) {
    auto result = to_cpp_identifier(property_name);
    // A member cannot share the name of its enclosing struct
    if (result == struct_name) result += '_';
    return result;
  }

  std::string
  cpp_namespace_for(std::string_view file_stem) {
    std::string result = to_snake_case(file_stem);
    while (result.size() > 1 && result.back() == '_')
      result.pop_back();
    return to_cpp_identifier(result);
  }

} // namespace jb
