#include <catch2/catch.hpp>

#define STRINGIFY_HELPER(x) #x
#define STRINGIFY(x) STRINGIFY_HELPER(x)

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;

static const std::string jb_cli = STRINGIFY(JB_CLI);
static const std::string vocab_dir = STRINGIFY(JB_VOCAB_DIR);
static const std::string activity_yml = vocab_dir + "/activity.yml";

// Portable exit code extraction: WEXITSTATUS on POSIX, raw value on Windows
static int
exit_code(int status) {
#ifdef _WIN32
  return status;
#else
  if (WIFEXITED(status)) return WEXITSTATUS(status);
  return -1;
#endif
}

static std::string
slurp(const fs::path& path) {
  std::ifstream in(path);
  return std::string{std::istreambuf_iterator<char>(in),
                     std::istreambuf_iterator<char>()};
}

static int
run_cli(const std::string& args) {
  std::string cmd = jb_cli + " " + args + " >/dev/null 2>/dev/null";
  return exit_code(std::system(cmd.c_str()));
}

static int
run_cli_stderr(const std::string& args, std::string& stderr_output) {
  auto tmp = fs::temp_directory_path() / "jb_cli_stderr.txt";
  std::string cmd = jb_cli + " " + args + " >/dev/null 2>" + tmp.string();
  int rc = exit_code(std::system(cmd.c_str()));
  stderr_output = slurp(tmp);
  fs::remove(tmp);
  return rc;
}

static int
run_cli_stdout(const std::string& args, std::string& stdout_output) {
  auto tmp = fs::temp_directory_path() / "jb_cli_stdout.txt";
  std::string cmd = jb_cli + " " + args + " >" + tmp.string() + " 2>/dev/null";
  int rc = exit_code(std::system(cmd.c_str()));
  stdout_output = slurp(tmp);
  fs::remove(tmp);
  return rc;
}

static std::string
make_tmp_dir(const std::string& name) {
  auto dir = fs::temp_directory_path() / ("jb_cli_" + name);
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir.string();
}

static std::string
write_tmp_file(const std::string& dir, const std::string& name,
               const std::string& content) {
  auto path = fs::path(dir) / name;
  std::ofstream out(path);
  out << content;
  return path.string();
}

static void
cleanup_dir(const std::string& path) {
  fs::remove_all(path);
}

// ---------------------------------------------------------------------------
// usage
// ---------------------------------------------------------------------------

TEST_CASE("--help exits 0 and produces output", "[cli]") {
  std::string err;
  int rc = run_cli_stderr("--help", err);
  CHECK(rc == 0);
  CHECK(err.find("Usage") != std::string::npos);
}

TEST_CASE("--version exits 0 and names the tool", "[cli]") {
  std::string err;
  int rc = run_cli_stderr("--version", err);
  CHECK(rc == 0);
  CHECK(err.rfind("jb ", 0) == 0);
}

TEST_CASE("no arguments exits 1", "[cli]") {
  CHECK(run_cli("") == 1);
}

TEST_CASE("unknown option exits 1", "[cli]") {
  CHECK(run_cli("--frobnicate " + activity_yml) == 1);
}

TEST_CASE("missing option argument exits 1", "[cli]") {
  CHECK(run_cli(activity_yml + " -o") == 1);
}

TEST_CASE("--header-only --split is an error", "[cli]") {
  CHECK(run_cli("--header-only --split " + activity_yml) == 1);
}

// ---------------------------------------------------------------------------
// input errors
// ---------------------------------------------------------------------------

TEST_CASE("nonexistent vocabulary file exits 2", "[cli]") {
  CHECK(run_cli("nonexistent.yml") == 2);
}

TEST_CASE("nonexistent type map file exits 2", "[cli]") {
  std::string out_dir = make_tmp_dir("tmap_missing");
  int rc = run_cli("-t nonexistent.yml -o " + out_dir + " " + activity_yml);
  cleanup_dir(out_dir);
  CHECK(rc == 2);
}

TEST_CASE("malformed vocabulary exits 3", "[cli]") {
  std::string dir = make_tmp_dir("malformed");
  auto file = write_tmp_file(dir, "bad.yml", "Object: [1, 2]\n");
  std::string err;
  int rc = run_cli_stderr(file, err);
  cleanup_dir(dir);
  CHECK(rc == 3);
  CHECK(err.find("jb: ") == 0);
}

TEST_CASE("unknown supertype exits 3", "[cli]") {
  std::string dir = make_tmp_dir("unknown_super");
  auto file = write_tmp_file(dir, "bad.yml", "Note: {extends: Object}\n");
  std::string err;
  int rc = run_cli_stderr(file, err);
  cleanup_dir(dir);
  CHECK(rc == 3);
  CHECK(err.find("Object") != std::string::npos);
}

TEST_CASE("preferred name of the wrong shape exits 4", "[cli]") {
  std::string dir = make_tmp_dir("kind_mismatch");
  auto file = write_tmp_file(dir, "bad.yml", R"(
Object:
  properties:
    name: {LangContainer: {type: String, container_tag: nameMap}}
Image:
  extends: Object
  preferred_property_name:
    name: caption
)");
  int rc = run_cli("--list-outputs " + file);
  cleanup_dir(dir);
  CHECK(rc == 4);
}

TEST_CASE("bad type expression exits 4", "[cli]") {
  std::string dir = make_tmp_dir("bad_type");
  auto file = write_tmp_file(
      dir, "bad.yml", "A: {properties: {p: {Simple: {type: \"Maybe<String>\"}}}}\n");
  int rc = run_cli("--list-outputs " + file);
  cleanup_dir(dir);
  CHECK(rc == 4);
}

TEST_CASE("type map naming an unknown type exits 3", "[cli]") {
  std::string dir = make_tmp_dir("tmap_unknown");
  auto map = write_tmp_file(dir, "types.yml",
                            "Decimal: {cpp_type: long double}\n");
  int rc = run_cli("-t " + map + " --list-outputs " + activity_yml);
  cleanup_dir(dir);
  CHECK(rc == 3);
}

// ---------------------------------------------------------------------------
// generation
// ---------------------------------------------------------------------------

TEST_CASE("--list-outputs prints filenames without generating", "[cli]") {
  std::string out;
  CHECK(run_cli_stdout("--list-outputs " + activity_yml, out) == 0);
  CHECK(out == "activity.hpp\n");

  CHECK(run_cli_stdout("--split --list-outputs " + activity_yml, out) == 0);
  CHECK(out == "activity.hpp\nactivity.cpp\n");
}

TEST_CASE("header-only generation writes one header", "[cli]") {
  std::string out_dir = make_tmp_dir("header_only");
  int rc = run_cli("-o " + out_dir + " " + activity_yml);
  REQUIRE(rc == 0);

  auto header = fs::path(out_dir) / "activity.hpp";
  REQUIRE(fs::exists(header));
  CHECK_FALSE(fs::exists(fs::path(out_dir) / "activity.cpp"));

  auto content = slurp(header);
  CHECK(content.rfind("// Generated by jb from activity.yml. Do not edit.\n"
                      "\n#pragma once\n",
                      0) == 0);
  CHECK(content.find("#include <jb/binding.hpp>") != std::string::npos);
  CHECK(content.find("namespace activity {") != std::string::npos);
  CHECK(content.find("struct object_variants {") != std::string::npos);
  CHECK(content.find("inline") != std::string::npos);

  cleanup_dir(out_dir);
}

TEST_CASE("split generation writes a header and a source", "[cli]") {
  std::string out_dir = make_tmp_dir("split");
  int rc = run_cli("--split -n as::core -o " + out_dir + " " + activity_yml);
  REQUIRE(rc == 0);

  auto header = slurp(fs::path(out_dir) / "activity.hpp");
  auto source = slurp(fs::path(out_dir) / "activity.cpp");
  CHECK(header.find("namespace as::core {") != std::string::npos);
  CHECK(source.find("#include \"activity.hpp\"") != std::string::npos);
  CHECK(source.find("#pragma once") == std::string::npos);
  CHECK(source.find("::as::core::note& value) {") != std::string::npos);

  cleanup_dir(out_dir);
}

TEST_CASE("namespace defaults to the file name", "[cli]") {
  std::string dir = make_tmp_dir("ns_default");
  auto file = write_tmp_file(dir, "Social-Web.yml",
                             "Object: {properties: {id: {Simple: {type: Url}}}}\n");
  int rc = run_cli("-o " + dir + " " + file);
  REQUIRE(rc == 0);

  auto header = fs::path(dir) / "social_web.hpp";
  REQUIRE(fs::exists(header));
  CHECK(slurp(header).find("namespace social_web {") != std::string::npos);

  cleanup_dir(dir);
}

TEST_CASE("type map overrides the generated C++ type", "[cli]") {
  std::string dir = make_tmp_dir("tmap_override");
  auto map = write_tmp_file(dir, "types.yml", R"(
Url:
  cpp_type: my::iri
  cpp_header: <my/iri.hpp>
)");
  int rc = run_cli("-t " + map + " -o " + dir + " " + activity_yml);
  REQUIRE(rc == 0);

  auto content = slurp(fs::path(dir) / "activity.hpp");
  CHECK(content.find("#include <my/iri.hpp>") != std::string::npos);
  CHECK(content.find("std::optional<my::iri> id;") != std::string::npos);

  cleanup_dir(dir);
}

TEST_CASE("several vocabulary files form one vocabulary", "[cli]") {
  std::string dir = make_tmp_dir("multi");
  auto base = write_tmp_file(dir, "base.yml",
                             "Object: {properties: {id: {Simple: {type: Url}}}}\n");
  auto ext = write_tmp_file(dir, "ext.yml", "Emoji: {extends: Object}\n");
  int rc = run_cli("-o " + dir + " " + base + " " + ext);
  REQUIRE(rc == 0);

  auto content = slurp(fs::path(dir) / "base.hpp");
  CHECK(content.find("struct emoji {") != std::string::npos);
  CHECK(content.find("std::variant<::base::object, ::base::emoji>") !=
        std::string::npos);

  cleanup_dir(dir);
}

TEST_CASE("output to a missing directory creates it", "[cli]") {
  auto base = fs::temp_directory_path() / "jb_cli_mkdir";
  auto nested = base / "sub" / "dir";
  fs::remove_all(base);

  int rc = run_cli("-o " + nested.string() + " " + activity_yml);
  CHECK(rc == 0);
  CHECK(fs::exists(nested / "activity.hpp"));

  fs::remove_all(base);
}
