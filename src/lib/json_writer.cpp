#include <jb/json_writer.hpp>

#include <charconv>
#include <cmath>
#include <sstream>

namespace jb {

  namespace {

    void
    write_escaped(std::ostream& os, const std::string& text) {
      static constexpr char hex[] = "0123456789abcdef";
      os << '"';
      for (char c : text) {
        switch (c) {
          case '"': os << "\\\""; break;
          case '\\': os << "\\\\"; break;
          case '\b': os << "\\b"; break;
          case '\f': os << "\\f"; break;
          case '\n': os << "\\n"; break;
          case '\r': os << "\\r"; break;
          case '\t': os << "\\t"; break;
          default:
            if (static_cast<unsigned char>(c) < 0x20) {
              auto u = static_cast<unsigned char>(c);
              os << "\\u00" << hex[u >> 4] << hex[u & 0x0f];
            } else {
              os << c;
            }
        }
      }
      os << '"';
    }

    void
    write_double(std::ostream& os, double value) {
      if (!std::isfinite(value)) {
        os << "null";
        return;
      }
      char buffer[32];
      auto [end, ec] = std::to_chars(buffer, buffer + sizeof(buffer), value);
      std::string_view text(buffer, static_cast<std::size_t>(end - buffer));
      os << text;
      // Keep doubles distinguishable from integers on re-read.
      if (text.find_first_of(".eE") == std::string_view::npos) os << ".0";
    }

    void
    newline(std::ostream& os, int indent, int depth) {
      if (indent < 0) return;
      os << '\n';
      for (int i = 0; i < indent * depth; ++i)
        os << ' ';
    }

    void
    write_value(std::ostream& os, const json_value& value, int indent,
                int depth) {
      switch (value.kind()) {
        case json_kind::null: os << "null"; break;
        case json_kind::boolean: os << (value.as_bool() ? "true" : "false"); break;
        case json_kind::integer:
          if (value.is_unsigned())
            os << value.as_unsigned();
          else
            os << value.as_integer();
          break;
        case json_kind::floating: write_double(os, value.as_double()); break;
        case json_kind::string: write_escaped(os, value.as_string()); break;
        case json_kind::array: {
          const auto& elements = value.as_array();
          os << '[';
          bool first = true;
          for (const auto& element : elements) {
            if (!first) os << ',';
            first = false;
            newline(os, indent, depth + 1);
            write_value(os, element, indent, depth + 1);
          }
          if (!elements.empty()) newline(os, indent, depth);
          os << ']';
          break;
        }
        case json_kind::object: {
          const auto& members = value.as_object();
          os << '{';
          bool first = true;
          for (const auto& [key, member] : members) {
            if (!first) os << ',';
            first = false;
            newline(os, indent, depth + 1);
            write_escaped(os, key);
            os << (indent < 0 ? ":" : ": ");
            write_value(os, member, indent, depth + 1);
          }
          if (!members.empty()) newline(os, indent, depth);
          os << '}';
          break;
        }
      }
    }

  } // namespace

  void
  write_json(std::ostream& os, const json_value& value, int indent) {
    write_value(os, value, indent, 0);
  }

  std::string
  to_json_string(const json_value& value, int indent) {
    std::ostringstream os;
    write_json(os, value, indent);
    return os.str();
  }

} // namespace jb
