#pragma once

#include <jb/codec.hpp>

#include <map>
#include <optional>
#include <string>

namespace jb {

  // A property split over two wire keys: the language-neutral value and a
  // map from language code to value (e.g. "name" and "nameMap").
  template <typename T>
  struct lang_container {
    std::optional<T> default_value;
    std::map<std::string, T> per_lang;

    bool
    empty() const {
      return !default_value.has_value() && per_lang.empty();
    }

    // Later occurrences replace the default value and win per language.
    void
    merge(lang_container other) {
      if (other.default_value) default_value = std::move(other.default_value);
      for (auto& [lang, value] : other.per_lang)
        per_lang.insert_or_assign(lang, std::move(value));
    }

    bool
    operator==(const lang_container&) const = default;
  };

} // namespace jb
