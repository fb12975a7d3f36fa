#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace jb {

  enum class output_mode { header_only, split };

  struct codegen_options {
    // Namespace of the generated types; may be nested ("a::b").
    std::string cpp_namespace = "vocab";
    // Base name of the generated file(s).
    std::string file_stem = "vocab";
    output_mode mode = output_mode::header_only;
    // Vocabulary file names recorded in the banner of each generated file.
    std::vector<std::string> sources;
  };

  std::string
  to_snake_case(std::string_view name);

  // snake_case identifier; keywords and the names "jb" and "std" get a
  // trailing '_', a leading digit gets a leading '_'.
  std::string
  to_cpp_identifier(std::string_view name);

  std::string
  struct_name_for(std::string_view type_name);

  // "note" -> "note_variants"
  std::string
  envelope_name_for(std::string_view struct_name);

  // "object" -> "as_object"
  std::string
  upcast_name_for(std::string_view struct_name);

  std::string
  member_name_for(std::string_view property_name,
                  std::string_view struct_name);

  // Derives a namespace name from a file stem ("activity-streams" ->
  // "activity_streams").
  std::string
  cpp_namespace_for(std::string_view file_stem);

} // namespace jb
