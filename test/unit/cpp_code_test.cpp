#include <jb/cpp_code.hpp>
#include <jb/cpp_writer.hpp>

#include <catch2/catch.hpp>

#include <string>

using namespace jb;

static const cpp_writer writer;

TEST_CASE("empty file produces pragma once", "[cpp_writer]") {
  cpp_file file;
  file.filename = "empty.hpp";

  auto result = writer.write(file);
  CHECK(result == "#pragma once\n");
}

TEST_CASE("banner comes before everything else", "[cpp_writer]") {
  cpp_file file;
  file.filename = "activity.hpp";
  file.banner = "Generated by jb from activity.yml. Do not edit.";
  file.includes.push_back({"<string>"});

  auto result = writer.write(file);
  CHECK(result == "// Generated by jb from activity.yml. Do not edit.\n"
                  "\n"
                  "#pragma once\n"
                  "\n"
                  "#include <string>\n");

  file.kind = file_kind::source;
  CHECK(writer.write(file).rfind("// Generated by jb", 0) == 0);
}

TEST_CASE("system include", "[cpp_writer]") {
  cpp_file file;
  file.filename = "test.hpp";
  file.includes.push_back({"<string>"});

  auto result = writer.write(file);
  CHECK(result == "#pragma once\n\n#include <string>\n");
}

TEST_CASE("local include", "[cpp_writer]") {
  cpp_file file;
  file.filename = "test.cpp";
  file.kind = file_kind::source;
  file.includes.push_back({"\"activity.hpp\""});

  auto result = writer.write(file);
  CHECK(result == "\n#include \"activity.hpp\"\n");
}

TEST_CASE("empty struct", "[cpp_writer]") {
  cpp_file file;
  file.filename = "test.hpp";
  file.namespaces.push_back({"ns", {cpp_struct{"unit_marker", {}, false}}});

  auto result = writer.write(file);
  auto expected = R"(#pragma once

namespace ns {

struct unit_marker {};

} // namespace ns
)";
  CHECK(result == expected);
}

TEST_CASE("struct with defaulted equality", "[cpp_writer]") {
  cpp_file file;
  file.filename = "test.hpp";
  cpp_struct s;
  s.name = "link";
  s.fields.push_back({"std::string", "href", ""});
  s.fields.push_back({"std::optional<std::int64_t>", "height", ""});
  file.namespaces.push_back({"ns", {std::move(s)}});

  auto result = writer.write(file);
  auto expected = R"(#pragma once

namespace ns {

struct link {
  std::string href;
  std::optional<std::int64_t> height;

  bool operator==(const link&) const = default;
};

} // namespace ns
)";
  CHECK(result == expected);
}

TEST_CASE("envelope struct with no fields but equality", "[cpp_writer]") {
  cpp_file file;
  file.filename = "test.hpp";
  file.namespaces.push_back({"ns", {cpp_struct{"marker", {}, true}}});

  auto result = writer.write(file);
  CHECK(result.find("struct marker {\n  bool operator==(const marker&) const "
                    "= default;\n};") != std::string::npos);
}

TEST_CASE("struct and field docs become comments", "[cpp_writer]") {
  cpp_file file;
  file.filename = "test.hpp";
  cpp_struct s;
  s.name = "note";
  s.generate_equality = false;
  s.doc = "A short written work.\n\nUsually a single paragraph.";
  s.fields.push_back({"std::optional<std::string>", "content", "",
                      "The content of the note.  "});
  file.namespaces.push_back({"ns", {std::move(s)}});

  auto result = writer.write(file);
  auto expected = R"(#pragma once

namespace ns {

// A short written work.
//
// Usually a single paragraph.
struct note {
  // The content of the note.
  std::optional<std::string> content;
};

} // namespace ns
)";
  CHECK(result == expected);
}

TEST_CASE("forward declaration", "[cpp_writer]") {
  cpp_file file;
  file.filename = "test.hpp";
  file.namespaces.push_back({"ns", {cpp_forward_decl{"object_variants"}}});

  auto result = writer.write(file);
  auto expected = R"(#pragma once

namespace ns {

struct object_variants;

} // namespace ns
)";
  CHECK(result == expected);
}

TEST_CASE("nested namespaces", "[cpp_writer]") {
  cpp_file file;
  file.filename = "test.hpp";
  file.namespaces.push_back({"as::core", {cpp_forward_decl{"object"}}});

  auto result = writer.write(file);
  CHECK(result.find("namespace as::core {") != std::string::npos);
  CHECK(result.find("} // namespace as::core") != std::string::npos);
}

TEST_CASE("field with default value", "[cpp_writer]") {
  cpp_file file;
  file.filename = "test.hpp";
  cpp_struct s;
  s.name = "place";
  s.generate_equality = false;
  s.fields.push_back({"double", "radius", "{}"});
  s.fields.push_back({"bool", "closed", "false"});
  file.namespaces.push_back({"ns", {std::move(s)}});

  auto result = writer.write(file);
  CHECK(result.find("double radius = {};") != std::string::npos);
  CHECK(result.find("bool closed = false;") != std::string::npos);
}

TEST_CASE("system includes come before local includes", "[cpp_writer]") {
  cpp_file file;
  file.filename = "test.hpp";
  file.includes.push_back({"\"activity.hpp\""});
  file.includes.push_back({"<string>"});
  file.includes.push_back({"<jb/binding.hpp>"});

  auto result = writer.write(file);
  auto system_pos = result.find("#include <string>");
  auto binding_pos = result.find("#include <jb/binding.hpp>");
  auto local_pos = result.find("#include \"activity.hpp\"");
  CHECK(system_pos < binding_pos);
  CHECK(binding_pos < local_pos);
}

// ---------------------------------------------------------------------------
// functions
// ---------------------------------------------------------------------------

TEST_CASE("inline function in a header", "[cpp_writer]") {
  cpp_file file;
  file.filename = "test.hpp";
  cpp_function fn;
  fn.return_type = "jb::json_value";
  fn.name = "to_json";
  fn.parameters = "const link& value";
  fn.body = "  return {};\n";
  file.namespaces.push_back({"ns", {std::move(fn)}});

  auto result = writer.write(file);
  CHECK(result.find("inline jb::json_value to_json(const link& value) {\n"
                    "  return {};\n}\n") != std::string::npos);
}

TEST_CASE("non-inline function in a header is a declaration",
          "[cpp_writer]") {
  cpp_file file;
  file.filename = "test.hpp";
  cpp_function fn;
  fn.return_type = "void";
  fn.name = "from_json";
  fn.parameters = "const jb::json_value& json, link& value";
  fn.body = "  (void)json;\n";
  fn.is_inline = false;
  file.namespaces.push_back({"ns", {std::move(fn)}});

  auto result = writer.write(file);
  CHECK(result.find("void from_json(const jb::json_value& json, link& "
                    "value);") != std::string::npos);
  CHECK(result.find("(void)json") == std::string::npos);
  CHECK(result.find("inline") == std::string::npos);
}

TEST_CASE("function docs go with the definition", "[cpp_writer]") {
  cpp_function fn;
  fn.return_type = "::ns::object";
  fn.name = "as_object";
  fn.parameters = "const ::ns::note& value";
  fn.body = "  return {};\n";
  fn.doc = "Keeps the fields Object shares with Note.";

  cpp_function proto = fn;
  proto.body.clear();
  proto.declaration_only = true;

  cpp_file file;
  file.filename = "test.hpp";
  file.namespaces.push_back({"ns", {proto, fn}});

  auto result = writer.write(file);
  auto doc = std::string("// Keeps the fields Object shares with Note.\n");
  auto first = result.find(doc);
  REQUIRE(first != std::string::npos);
  CHECK(result.find(doc, first + 1) == std::string::npos);
  CHECK(result.find(doc + "inline ::ns::object as_object(") != std::string::npos);
}

TEST_CASE("declaration-only function", "[cpp_writer]") {
  cpp_function proto;
  proto.return_type = "jb::json_value";
  proto.name = "to_json";
  proto.parameters = "const note& value";
  proto.declaration_only = true;

  SECTION("inline prototype in a header") {
    cpp_file file;
    file.filename = "test.hpp";
    file.namespaces.push_back({"ns", {proto}});
    auto result = writer.write(file);
    CHECK(result.find("inline jb::json_value to_json(const note& value);") !=
          std::string::npos);
    CHECK(result.find(") {") == std::string::npos);
  }

  SECTION("non-inline prototype in a header") {
    proto.is_inline = false;
    cpp_file file;
    file.filename = "test.hpp";
    file.namespaces.push_back({"ns", {proto}});
    auto result = writer.write(file);
    CHECK(result.find("\njb::json_value to_json(const note& value);") !=
          std::string::npos);
  }

  SECTION("skipped in a source file") {
    proto.is_inline = false;
    cpp_file file;
    file.filename = "test.cpp";
    file.kind = file_kind::source;
    file.namespaces.push_back({"ns", {proto}});
    auto result = writer.write(file);
    CHECK(result.find("to_json") == std::string::npos);
  }
}

// ---------------------------------------------------------------------------
// source files
// ---------------------------------------------------------------------------

TEST_CASE("source file renders non-inline definitions only", "[cpp_writer]") {
  cpp_file file;
  file.filename = "test.cpp";
  file.kind = file_kind::source;

  cpp_struct s;
  s.name = "point";
  s.fields.push_back({"double", "x", ""});

  cpp_function helper;
  helper.return_type = "void";
  helper.name = "helper";
  helper.body = "";

  cpp_function compute;
  compute.return_type = "int";
  compute.name = "compute";
  compute.parameters = "int a, int b";
  compute.body = "  return a + b;\n";
  compute.is_inline = false;

  file.namespaces.push_back(
      {"ns", {std::move(s), cpp_forward_decl{"point"}, std::move(helper),
              std::move(compute)}});

  auto result = writer.write(file);
  CHECK(result.find("#pragma once") == std::string::npos);
  CHECK(result.find("struct") == std::string::npos);
  CHECK(result.find("helper") == std::string::npos);
  CHECK(result.find("int compute(int a, int b) {\n  return a + b;\n}\n") !=
        std::string::npos);
  CHECK(result.find("inline") == std::string::npos);
}

TEST_CASE("write options override the file kind", "[cpp_writer]") {
  cpp_file file;
  file.filename = "test.hpp";
  cpp_function fn;
  fn.return_type = "void";
  fn.name = "setup";
  fn.body = "";
  fn.is_inline = false;
  file.namespaces.push_back({"ns", {std::move(fn)}});

  CHECK(writer.write(file).find("void setup();") != std::string::npos);
  CHECK(writer.write(file, write_options{file_kind::source})
            .find("void setup() {\n}\n") != std::string::npos);
}
