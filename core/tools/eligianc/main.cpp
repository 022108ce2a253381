// eligianc - Eligian Compiler Command Line Interface
//
// Usage:
//   eligianc build [tree.json | --project] [-o output] [--source file.eligian]
//   eligianc check [tree.json | --project] [--source file.eligian]
//   eligianc init <project-name>
//
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "eligian/basic/diagnostic_printer.hpp"
#include "eligian/driver/compiler.hpp"
#include "eligian/project/project_config.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "Eligian Compiler v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  build [tree.json]        Build a file or project\n"
            << "  check [tree.json]        Validate without writing output\n"
            << "  init <project-name>      Initialize a new project\n\n"
            << "Options:\n"
            << "  -o, --output <path>      Output directory\n"
            << "  --source <file>          The .eligian source the tree was parsed from\n"
            << "  --project                Build project from eligian.yaml\n"
            << "  --strict                 Treat warnings as errors\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n";
}

/// Document text for source excerpts; empty when unavailable
std::string read_text(const std::string & path)
{
  std::ifstream file(path);
  if (!file.is_open()) {
    return {};
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

void print_diagnostics(
  const eligian::DiagnosticBag & diagnostics, const std::string & source_path,
  const std::string & default_filename)
{
  // Detect if terminal supports colors (simple check for TTY)
  const bool use_color = isatty(fileno(stderr)) != 0;
  eligian::DiagnosticPrinter printer(std::cerr, use_color);

  const eligian::SourceFile source = source_path.empty()
                                       ? eligian::SourceFile(default_filename, "")
                                       : eligian::SourceFile(source_path, read_text(source_path));
  printer.print_all(diagnostics, source);
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::string input_file;
  std::string output_path;
  std::string source_path;
  bool use_project = false;
  bool strict = false;
  bool verbose = false;
  bool show_help = false;
};

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;

  if (argc < 2) {
    args.show_help = true;
    return args;
  }

  args.command = argv[1];

  if (args.command == "-h" || args.command == "--help") {
    args.show_help = true;
    return args;
  }

  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-o" || arg == "--output") {
      if (i + 1 < argc) {
        args.output_path = argv[++i];
      }
    } else if (arg == "--source") {
      if (i + 1 < argc) {
        args.source_path = argv[++i];
      }
    } else if (arg == "--project") {
      args.use_project = true;
    } else if (arg == "--strict") {
      args.strict = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (arg[0] != '-' && args.input_file.empty()) {
      args.input_file = arg;
    }
  }

  return args;
}

// ============================================================================
// Commands
// ============================================================================

/// Shared by build and check; returns the exit status
int run_compile(const CommandArgs & args, eligian::CompileMode mode)
{
  const bool building = mode == eligian::CompileMode::Build;

  eligian::CompileOptions options;
  options.mode = mode;
  options.verbose = args.verbose;
  options.strict = args.strict;
  if (!args.output_path.empty()) {
    options.output_dir = args.output_path;
  }

  eligian::CompileResult result;

  if (args.use_project || args.input_file.empty()) {
    // Project mode: find eligian.yaml
    auto config_path = eligian::find_project_config(fs::current_path());
    if (!config_path) {
      std::cerr << "error: no " << eligian::k_project_config_file_name
                << " found in current directory or parents\n";
      return 1;
    }

    const auto config_result = eligian::load_project_config(*config_path);
    if (!config_result.success) {
      std::cerr << "error: " << config_result.error << "\n";
      return 1;
    }

    if (args.verbose) {
      std::cerr << (building ? "Building" : "Checking")
                << " project: " << config_result.config.package.name << "\n";
    }

    result = eligian::Compiler::compile_project(config_result.config, options);
  } else {
    // Single file mode
    const fs::path input_path = fs::absolute(args.input_file);

    if (!fs::exists(input_path)) {
      std::cerr << "error: file not found: " << input_path.string() << "\n";
      return 1;
    }

    if (!args.source_path.empty()) {
      options.source_path = fs::absolute(args.source_path).string();
    }

    if (args.verbose) {
      std::cerr << (building ? "Building: " : "Checking: ") << input_path.string() << "\n";
    }

    result = eligian::Compiler::compile_file(input_path, options);
  }

  if (!result.diagnostics.empty()) {
    print_diagnostics(
      result.diagnostics, args.source_path,
      args.input_file.empty() ? "project" : args.input_file);
  }

  if (!result.success) {
    return 1;
  }

  if (building) {
    for (const auto & file : result.generated_files) {
      std::cerr << "Generated: " << file.string() << "\n";
    }
  } else {
    std::cout << (args.input_file.empty() ? "project" : args.input_file) << ": OK\n";
  }

  return 0;
}

int cmd_init(const CommandArgs & args)
{
  if (args.input_file.empty()) {
    std::cerr << "error: project name required\n";
    std::cerr << "usage: eligianc init <project-name>\n";
    return 1;
  }

  const fs::path project_dir = fs::current_path() / args.input_file;

  if (fs::exists(project_dir)) {
    std::cerr << "error: directory already exists: " << project_dir.string() << "\n";
    return 1;
  }

  try {
    fs::create_directories(project_dir / "src");

    std::ofstream config(project_dir / eligian::k_project_config_file_name);
    config << "package:\n"
           << "  name: '" << args.input_file << "'\n"
           << "  version: '0.1.0'\n\n"
           << "compiler:\n"
           << "  entry_points:\n"
           << "    - './src/main.eligian.json'\n"
           << "  output_dir: './dist'\n"
           << "  indent: 2\n"
           << "  strict: false\n";
    config.close();

    std::ofstream main(project_dir / "src" / "main.eligian");
    main << "styles \"./main.css\"\n\n"
         << "timeline \"main\" in \"#app\" using raf {\n"
         << "  at 0s..5s [ selectElement(\"#title\") addClass(\"visible\") ]\n"
         << "          [ selectElement(\"#title\") removeClass(\"visible\") ]\n"
         << "}\n";
    main.close();

    std::ofstream css(project_dir / "src" / "main.css");
    css << "#app { position: relative; }\n"
        << "#title { opacity: 0; }\n"
        << ".visible { opacity: 1; }\n";
    css.close();

    std::cout << "Initialized new Eligian project in " << project_dir.string() << "\n";
    std::cout << "\nNext steps:\n"
              << "  cd " << args.input_file << "\n"
              << "  parse src/main.eligian into src/main.eligian.json\n"
              << "  eligianc build\n";

    return 0;
  } catch (const fs::filesystem_error & e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  if (args.command == "build") {
    return run_compile(args, eligian::CompileMode::Build);
  }

  if (args.command == "check") {
    return run_compile(args, eligian::CompileMode::Check);
  }

  if (args.command == "init") {
    return cmd_init(args);
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  print_usage(argv[0]);
  return 1;
}
