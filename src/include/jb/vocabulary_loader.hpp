#pragma once

#include <jb/vocabulary.hpp>

#include <filesystem>
#include <string_view>

namespace jb {

  // Reads a vocabulary document (YAML or JSON): a mapping from type name to
  // type definition. Types are added to vocab in document order. Throws
  // schema_error (malformed) on structural problems.
  void
  load_vocabulary(vocabulary& vocab, std::string_view text);

  void
  load_vocabulary_file(vocabulary& vocab, const std::filesystem::path& path);

} // namespace jb
