#include <jb/codegen.hpp>
#include <jb/cpp_writer.hpp>
#include <jb/errors.hpp>
#include <jb/naming.hpp>
#include <jb/type_map.hpp>
#include <jb/vocabulary.hpp>
#include <jb/vocabulary_loader.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static constexpr int exit_success = 0;
static constexpr int exit_usage = 1;
static constexpr int exit_io = 2;
static constexpr int exit_schema = 3;
static constexpr int exit_codegen = 4;

struct cli_options {
  std::vector<std::string> vocabulary_files;
  std::string output_dir = ".";
  std::string type_map_file;
  std::string cpp_namespace;
  jb::output_mode mode = jb::output_mode::header_only;
  bool show_help = false;
  bool show_version = false;
  bool list_outputs = false;
  bool verbose = false;
};

static void
print_usage(std::ostream& os) {
  os << "Usage: jb [options] <vocabulary.yml> [vocabulary2.yml ...]\n"
     << "\n"
     << "Options:\n"
     << "  -o, --output-dir <dir>  Output directory (default: current "
        "directory)\n"
     << "  -n, --namespace <ns>    C++ namespace of the generated code\n"
     << "                          (default: derived from the first file "
        "name)\n"
     << "  -t, --type-map <file>   Type map override file (YAML)\n"
     << "  --header-only           Generate a single header (default)\n"
     << "  --split                 Generate a header and a source file\n"
     << "  --list-outputs          Print expected output filenames and exit\n"
     << "  --verbose               Report progress on stderr\n"
     << "  -h, --help              Show this help message\n"
     << "  -v, --version           Show version information\n";
}

static void
print_version(std::ostream& os) {
  os << "jb " << JB_VERSION << "\n";
}

static cli_options
parse_args(int argc, char* argv[]) {
  cli_options opts;

  bool saw_header_only = false;
  bool saw_split = false;

  auto value_of = [&](int& i, const std::string& flag) -> std::string {
    if (i + 1 >= argc) {
      std::cerr << "jb: " << flag << " requires an argument\n";
      std::exit(exit_usage);
    }
    return argv[++i];
  };

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      opts.show_help = true;
      return opts;
    }

    if (arg == "-v" || arg == "--version") {
      opts.show_version = true;
      return opts;
    }

    if (arg == "--header-only") {
      saw_header_only = true;
      continue;
    }

    if (arg == "--split") {
      saw_split = true;
      continue;
    }

    if (arg == "--list-outputs") {
      opts.list_outputs = true;
      continue;
    }

    if (arg == "--verbose") {
      opts.verbose = true;
      continue;
    }

    if (arg == "-o" || arg == "--output-dir") {
      opts.output_dir = value_of(i, arg);
      continue;
    }

    if (arg == "-t" || arg == "--type-map") {
      opts.type_map_file = value_of(i, arg);
      continue;
    }

    if (arg == "-n" || arg == "--namespace") {
      opts.cpp_namespace = value_of(i, arg);
      if (opts.cpp_namespace.empty()) {
        std::cerr << "jb: " << arg << " needs a non-empty namespace\n";
        std::exit(exit_usage);
      }
      continue;
    }

    if (arg[0] == '-') {
      std::cerr << "jb: unknown option: " << arg << "\n";
      std::exit(exit_usage);
    }

    opts.vocabulary_files.push_back(arg);
  }

  if (saw_header_only && saw_split) {
    std::cerr << "jb: --header-only and --split are mutually exclusive\n";
    std::exit(exit_usage);
  }

  if (saw_split) opts.mode = jb::output_mode::split;

  return opts;
}

static std::string
read_file(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    std::cerr << "jb: cannot open file: " << path << "\n";
    std::exit(exit_io);
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

static int
run(const cli_options& opts) {
  // Load all vocabulary documents into one vocabulary
  jb::vocabulary vocab;
  for (const auto& file : opts.vocabulary_files) {
    std::string text = read_file(file);
    if (opts.verbose) std::cerr << "jb: loading " << file << "\n";
    try {
      jb::load_vocabulary(vocab, text);
    } catch (const jb::schema_error& e) {
      std::cerr << "jb: error in vocabulary " << file << ": " << e.what()
                << "\n";
      return exit_schema;
    }
  }

  try {
    vocab.resolve();
  } catch (const jb::schema_error& e) {
    std::cerr << "jb: vocabulary resolution error: " << e.what() << "\n";
    return exit_schema;
  }
  if (opts.verbose)
    std::cerr << "jb: " << vocab.types().size() << " type(s)\n";

  // Load type map
  auto types = jb::type_map::defaults();
  if (!opts.type_map_file.empty()) {
    std::string yaml = read_file(opts.type_map_file);
    try {
      types.merge(jb::type_map::load(yaml));
    } catch (const std::runtime_error& e) {
      std::cerr << "jb: error loading type map " << opts.type_map_file << ": "
                << e.what() << "\n";
      return exit_schema;
    }
  }

  jb::codegen_options codegen_opts;
  auto stem = fs::path(opts.vocabulary_files.front()).stem().string();
  codegen_opts.file_stem = jb::to_snake_case(stem);
  codegen_opts.cpp_namespace = opts.cpp_namespace.empty()
                                   ? jb::cpp_namespace_for(stem)
                                   : opts.cpp_namespace;
  codegen_opts.mode = opts.mode;
  for (const auto& file : opts.vocabulary_files)
    codegen_opts.sources.push_back(fs::path(file).filename().string());

  std::vector<jb::cpp_file> files;
  try {
    jb::codegen gen(vocab, types, codegen_opts);
    files = gen.generate();
  } catch (const jb::schema_error& e) {
    std::cerr << "jb: code generation error: " << e.what() << "\n";
    return exit_codegen;
  }

  // --list-outputs: print filenames and exit
  if (opts.list_outputs) {
    for (const auto& file : files)
      std::cout << file.filename << "\n";
    return exit_success;
  }

  std::error_code ec;
  fs::create_directories(opts.output_dir, ec);
  if (ec) {
    std::cerr << "jb: cannot create directory " << opts.output_dir << ": "
              << ec.message() << "\n";
    return exit_io;
  }

  jb::cpp_writer writer;
  for (const auto& file : files) {
    auto path = fs::path(opts.output_dir) / file.filename;
    std::ofstream out(path);
    if (!out) {
      std::cerr << "jb: cannot write file: " << path.string() << "\n";
      return exit_io;
    }
    out << writer.write(file);
    if (opts.verbose) std::cerr << "jb: wrote " << path.string() << "\n";
  }

  return exit_success;
}

int
main(int argc, char* argv[]) {
  cli_options opts = parse_args(argc, argv);

  if (opts.show_help) {
    print_usage(std::cerr);
    return exit_success;
  }

  if (opts.show_version) {
    print_version(std::cerr);
    return exit_success;
  }

  if (opts.vocabulary_files.empty()) {
    std::cerr << "jb: no input files\n";
    print_usage(std::cerr);
    return exit_usage;
  }

  return run(opts);
}
