#include <jb/errors.hpp>
#include <jb/json_reader.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace jb {

  namespace {

    using sax_base = nlohmann::json_sax<nlohmann::json>;

    // Builds a json_value tree from the SAX events of one document. Keys
    // arrive one event at a time, so repeated keys stay separate members.
    class tree_builder : public sax_base {
      struct frame {
        json_value value;
        std::optional<std::string> pending_key;
      };

      std::vector<frame> stack_;
      std::optional<json_value> root_;

      bool
      add(json_value value) {
        if (stack_.empty()) {
          root_ = std::move(value);
          return true;
        }
        auto& top = stack_.back();
        if (top.value.is_array()) {
          top.value.as_array().push_back(std::move(value));
        } else {
          top.value.as_object().emplace_back(std::move(*top.pending_key),
                                             std::move(value));
          top.pending_key.reset();
        }
        return true;
      }

      bool
      close() {
        auto value = std::move(stack_.back().value);
        stack_.pop_back();
        return add(std::move(value));
      }

    public:
      std::size_t error_position = 0;
      std::string error_message;

      std::optional<json_value>
      take() {
        return std::move(root_);
      }

      bool
      null() override {
        return add(json_value(nullptr));
      }

      bool
      boolean(bool value) override {
        return add(json_value(value));
      }

      bool
      number_integer(number_integer_t value) override {
        return add(json_value(static_cast<std::int64_t>(value)));
      }

      bool
      number_unsigned(number_unsigned_t value) override {
        return add(json_value(static_cast<std::uint64_t>(value)));
      }

      bool
      number_float(number_float_t value, const string_t&) override {
        return add(json_value(static_cast<double>(value)));
      }

      bool
      string(string_t& value) override {
        return add(json_value(std::move(value)));
      }

      bool
      binary(binary_t&) override {
        error_message = "binary values are not JSON";
        return false;
      }

      bool
      start_object(std::size_t) override {
        stack_.push_back({json_value(json_object{}), std::nullopt});
        return true;
      }

      bool
      key(string_t& value) override {
        stack_.back().pending_key = std::move(value);
        return true;
      }

      bool
      end_object() override {
        return close();
      }

      bool
      start_array(std::size_t) override {
        stack_.push_back({json_value(json_array{}), std::nullopt});
        return true;
      }

      bool
      end_array() override {
        return close();
      }

      bool
      parse_error(std::size_t position, const std::string&,
                  const nlohmann::json::exception& ex) override {
        error_position = position;
        error_message = ex.what();
        return false;
      }
    };

    // 1-based line and column of the character before byte offset
    // `position`, the one the parser stopped at.
    std::pair<std::size_t, std::size_t>
    line_and_column(std::string_view text, std::size_t position) {
      auto end = std::min(position > 0 ? position - 1 : 0, text.size());
      std::size_t line = 1;
      std::size_t line_start = 0;
      for (std::size_t i = 0; i < end; ++i) {
        if (text[i] == '\n') {
          ++line;
          line_start = i + 1;
        }
      }
      return {line, end - line_start + 1};
    }

  } // namespace

  json_value
  parse_json(std::string_view text) {
    tree_builder builder;
    // Strict: the whole input is one document, no comments.
    bool ok = nlohmann::json::sax_parse(text.begin(), text.end(), &builder,
                                        nlohmann::json::input_format_t::json,
                                        true, false);
    auto root = builder.take();
    if (!ok || !root) {
      auto [line, column] = line_and_column(text, builder.error_position);
      throw parse_error("json: " + (builder.error_message.empty()
                                        ? std::string("empty document")
                                        : builder.error_message),
                        line, column);
    }
    return std::move(*root);
  }

} // namespace jb
