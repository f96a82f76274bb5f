#include <sid/codegen.hpp>
#include <sid/cpp_writer.hpp>
#include <sid/extract.hpp>
#include <sid/manifest.hpp>
#include <sid/naming.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <map>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

namespace fs = std::filesystem;

static constexpr int exit_success = 0;
static constexpr int exit_usage = 1;
static constexpr int exit_io = 2;
static constexpr int exit_parse = 3;
static constexpr int exit_codegen = 4;

struct cli_options {
  std::vector<std::string> manifest_files;
  std::string output_dir = ".";
  std::string header_name;
  std::unordered_map<std::string, std::string> namespace_map;
  sid::output_mode mode = sid::output_mode::file_per_type;
  bool show_help = false;
  bool show_version = false;
  bool list_outputs = false;
};

static void
print_usage(std::ostream& os) {
  os << "Usage: sid [options] <manifest.xml|manifest.json> [...]\n"
     << "\n"
     << "Options:\n"
     << "  -o <dir>          Output directory (default: current directory)\n"
     << "  -n <ns=cppns>     Namespace mapping (declared namespace = C++ "
        "namespace)\n"
     << "  --header-only     Generate one combined header\n"
     << "  --header <name>   File name of the combined header (default: "
        "strong_ids.g.hpp)\n"
     << "  --list-outputs    Print expected output filenames and exit\n"
     << "  -h, --help        Show this help message\n"
     << "  --version         Show version information\n";
}

static void
print_version(std::ostream& os) {
  os << "sid " << SID_VERSION << "\n";
}

static cli_options
parse_args(int argc, char* argv[]) {
  cli_options opts;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      opts.show_help = true;
      return opts;
    }

    if (arg == "--version") {
      opts.show_version = true;
      return opts;
    }

    if (arg == "--header-only") {
      opts.mode = sid::output_mode::header_only;
      continue;
    }

    if (arg == "--list-outputs") {
      opts.list_outputs = true;
      continue;
    }

    if (arg == "-o") {
      if (i + 1 >= argc) {
        std::cerr << "sid: -o requires an argument\n";
        std::exit(exit_usage);
      }
      opts.output_dir = argv[++i];
      continue;
    }

    if (arg == "--header") {
      if (i + 1 >= argc) {
        std::cerr << "sid: --header requires an argument\n";
        std::exit(exit_usage);
      }
      opts.header_name = argv[++i];
      continue;
    }

    if (arg == "-n") {
      if (i + 1 >= argc) {
        std::cerr << "sid: -n requires an argument\n";
        std::exit(exit_usage);
      }
      std::string mapping = argv[++i];
      auto eq = mapping.find('=');
      if (eq == std::string::npos || eq == 0) {
        std::cerr << "sid: -n argument must be namespace=cppnamespace\n";
        std::exit(exit_usage);
      }
      opts.namespace_map[mapping.substr(0, eq)] = mapping.substr(eq + 1);
      continue;
    }

    if (arg[0] == '-') {
      std::cerr << "sid: unknown option: " << arg << "\n";
      std::exit(exit_usage);
    }

    opts.manifest_files.push_back(arg);
  }

  if (!opts.header_name.empty() && opts.mode != sid::output_mode::header_only) {
    std::cerr << "sid: --header requires --header-only\n";
    std::exit(exit_usage);
  }

  return opts;
}

static std::string
read_file(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    std::cerr << "sid: cannot open file: " << path << "\n";
    std::exit(exit_io);
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

static int
run(const cli_options& opts) {
  // Load declarations from every manifest
  std::vector<sid::declaration> declarations;
  for (const auto& file : opts.manifest_files) {
    std::string content = read_file(file);
    try {
      auto decls = sid::parse_manifest(content, sid::manifest_format_for(file));
      declarations.insert(declarations.end(),
                          std::make_move_iterator(decls.begin()),
                          std::make_move_iterator(decls.end()));
    } catch (const std::exception& e) {
      std::cerr << "sid: error parsing manifest " << file << ": " << e.what()
                << "\n";
      return exit_parse;
    }
  }

  // Non-applicable declarations drop out here without a diagnostic
  auto descriptors = sid::extract_all(declarations);

  // Output keys must be unique across manifests
  std::map<std::string, std::size_t> seen;
  for (const auto& desc : descriptors) {
    if (++seen[desc.fully_qualified_name] > 1) {
      std::cerr << "sid: duplicate declaration of " << desc.fully_qualified_name
                << "\n";
      return exit_parse;
    }
  }

  sid::codegen_options codegen_opts;
  codegen_opts.namespace_map = opts.namespace_map;
  codegen_opts.mode = opts.mode;
  if (!opts.header_name.empty()) codegen_opts.header_name = opts.header_name;

  // Generate code
  std::vector<sid::cpp_file> files;
  try {
    sid::codegen gen(codegen_opts);
    files = gen.generate(descriptors);
  } catch (const std::exception& e) {
    std::cerr << "sid: code generation error: " << e.what() << "\n";
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
    std::cerr << "sid: cannot create directory: " << opts.output_dir << ": "
              << ec.message() << "\n";
    return exit_io;
  }

  // Write output files
  sid::cpp_writer writer;
  for (const auto& file : files) {
    auto path = fs::path(opts.output_dir) / file.filename;
    std::ofstream out(path);
    if (!out) {
      std::cerr << "sid: cannot write file: " << path.string() << "\n";
      return exit_io;
    }
    out << writer.write(file);
  }

  return exit_success;
}

int
main(int argc, char* argv[]) {
  auto opts = parse_args(argc, argv);

  if (opts.show_help) {
    print_usage(std::cerr);
    return exit_success;
  }

  if (opts.show_version) {
    print_version(std::cerr);
    return exit_success;
  }

  if (opts.manifest_files.empty()) {
    std::cerr << "sid: no input files\n";
    print_usage(std::cerr);
    return exit_usage;
  }

  return run(opts);
}
