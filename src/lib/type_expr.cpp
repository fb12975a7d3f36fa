#include <jb/type_expr.hpp>

#include <cstddef>
#include <stdexcept>

namespace jb {

  namespace {

    bool
    is_space(char c) {
      return c == ' ' || c == '\t' || c == '\n' || c == '\r';
    }

    bool
    is_name_char(char c) {
      return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
             (c >= '0' && c <= '9') || c == '_' || c == ':' || c == '.';
    }

    class expr_parser {
      std::string_view text_;
      std::size_t pos_ = 0;

      void
      skip_space() {
        while (pos_ < text_.size() && is_space(text_[pos_]))
          ++pos_;
      }

      [[noreturn]] void
      fail(const std::string& what) const {
        throw std::invalid_argument("type expression '" + std::string(text_) +
                                    "': " + what + " at offset " +
                                    std::to_string(pos_));
      }

    public:
      explicit expr_parser(std::string_view text) : text_(text) {}

      type_expr
      parse() {
        auto expr = parse_expr();
        skip_space();
        if (pos_ != text_.size()) fail("unexpected character");
        return expr;
      }

      type_expr
      parse_expr() {
        skip_space();
        std::size_t start = pos_;
        while (pos_ < text_.size() && is_name_char(text_[pos_]))
          ++pos_;
        if (pos_ == start) fail("expected a type name");

        type_expr expr;
        expr.name = std::string(text_.substr(start, pos_ - start));

        skip_space();
        if (pos_ < text_.size() && text_[pos_] == '<') {
          ++pos_;
          expr.args.push_back(parse_expr());
          skip_space();
          while (pos_ < text_.size() && text_[pos_] == ',') {
            ++pos_;
            expr.args.push_back(parse_expr());
            skip_space();
          }
          if (pos_ >= text_.size() || text_[pos_] != '>') fail("expected '>'");
          ++pos_;
        }
        return expr;
      }
    };

  } // namespace

  type_expr
  parse_type_expr(std::string_view text) {
    return expr_parser(text).parse();
  }

  std::string
  to_string(const type_expr& expr) {
    std::string result = expr.name;
    if (expr.args.empty()) return result;
    result += '<';
    for (std::size_t i = 0; i < expr.args.size(); ++i) {
      if (i > 0) result += ", ";
      result += to_string(expr.args[i]);
    }
    result += '>';
    return result;
  }

} // namespace jb
