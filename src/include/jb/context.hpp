#pragma once

#include <jb/codec.hpp>
#include <jb/json_value.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace jb {

  // JSON-LD "@context": an ordered list of context identifiers plus one
  // merged map of inline term definitions. Only the shape is kept; terms
  // are never expanded.
  class context {
    std::vector<std::string> identifiers_;
    json_object terms_;

  public:
    context() = default;

    void
    add_identifier(std::string iri);

    // Last definition of a term wins; a term keeps its first position.
    void
    define(std::string term, json_value definition);

    const std::vector<std::string>&
    identifiers() const {
      return identifiers_;
    }

    const json_object&
    terms() const {
      return terms_;
    }

    const json_value*
    find_term(std::string_view term) const;

    bool
    empty() const {
      return identifiers_.empty() && terms_.empty();
    }

    bool
    operator==(const context&) const = default;
  };

  context
  decode_context(const json_value& json);

  // Inline terms only: a bare object. One identifier: a bare string.
  // Several identifiers: an array. Both: identifiers then one object.
  json_value
  encode_context(const context& value);

  template <>
  struct json_codec<context> {
    static context
    decode(const json_value& json) {
      return decode_context(json);
    }

    static json_value
    encode(const context& value) {
      return encode_context(value);
    }
  };

  // A document: an optional "@context" next to the flattened body of T.
  template <typename T>
  struct with_context {
    std::optional<jb::context> context;
    T body;

    bool
    operator==(const with_context&) const = default;
  };

  template <typename T>
  struct json_codec<with_context<T>> {
    static with_context<T>
    decode(const json_value& json) {
      with_context<T> result;
      if (const auto* ctx = json.find("@context"))
        result.context = decode_context(*ctx);
      result.body = jb::decode<T>(json);
      return result;
    }

    static json_value
    encode(const with_context<T>& value) {
      auto body = jb::encode(value.body);
      if (!value.context || !body.is_object()) return body;
      auto& members = body.as_object();
      members.emplace(members.begin(), "@context",
                      encode_context(*value.context));
      return body;
    }
  };

} // namespace jb
