#include <jb/context.hpp>
#include <jb/errors.hpp>

#include <utility>

namespace jb {

  void
  context::add_identifier(std::string iri) {
    identifiers_.push_back(std::move(iri));
  }

  void
  context::define(std::string term, json_value definition) {
    for (auto& [name, existing] : terms_) {
      if (name == term) {
        existing = std::move(definition);
        return;
      }
    }
    terms_.emplace_back(std::move(term), std::move(definition));
  }

  const json_value*
  context::find_term(std::string_view term) const {
    for (const auto& [name, definition] : terms_) {
      if (name == term) return &definition;
    }
    return nullptr;
  }

  namespace {

    void
    add_entry(context& result, const json_value& entry) {
      if (entry.is_string()) {
        result.add_identifier(entry.as_string());
      } else if (entry.is_object()) {
        for (const auto& [term, definition] : entry.as_object())
          result.define(term, definition);
      } else {
        throw decode_error::type_mismatch("context identifier or object",
                                          to_string(entry.kind()));
      }
    }

  } // namespace

  context
  decode_context(const json_value& json) {
    context result;
    if (json.is_array()) {
      for (const auto& entry : json.as_array())
        add_entry(result, entry);
    } else {
      add_entry(result, json);
    }
    return result;
  }

  json_value
  encode_context(const context& value) {
    const auto& identifiers = value.identifiers();
    const auto& terms = value.terms();

    if (identifiers.empty() && !terms.empty()) return json_value(terms);
    if (identifiers.size() == 1 && terms.empty())
      return json_value(identifiers.front());

    json_array result;
    result.reserve(identifiers.size() + 1);
    for (const auto& iri : identifiers)
      result.emplace_back(iri);
    if (!terms.empty()) result.emplace_back(terms);
    return json_value(std::move(result));
  }

} // namespace jb
