// flowsema - Semantic validation command line interface
//
// Usage:
//   flowsema check [unit.json...] [--project] [--format text|json]
//   flowsema codes
//
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "flowsema/basic/diagnostic_json.hpp"
#include "flowsema/basic/diagnostic_printer.hpp"
#include "flowsema/driver/analyzer_driver.hpp"
#include "flowsema/project/project_config.hpp"

namespace fs = std::filesystem;
using namespace flowsema;

namespace
{

void print_usage(const char * program_name)
{
  std::cerr << "flowsema v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  check [unit.json...]     Validate typed compilation units\n"
            << "  codes                    List diagnostic codes and default severities\n\n"
            << "Options:\n"
            << "  --project                Analyse the inputs listed in flowsema.yaml\n"
            << "  --format <text|json>     Diagnostic output format\n"
            << "  --color <auto|always|never>\n"
            << "  --werror                 Treat warnings as errors\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n";
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::vector<std::string> input_files;
  std::optional<OutputFormat> format;
  std::optional<ColorMode> color;
  bool use_project = false;
  bool werror = false;
  bool verbose = false;
  bool show_help = false;
  std::string error;
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
    const std::string arg = argv[i];

    if (arg == "--format") {
      if (i + 1 >= argc || !(args.format = parse_output_format(argv[++i]))) {
        args.error = "--format expects 'text' or 'json'";
      }
    } else if (arg == "--color") {
      if (i + 1 >= argc || !(args.color = parse_color_mode(argv[++i]))) {
        args.error = "--color expects 'auto', 'always' or 'never'";
      }
    } else if (arg == "--project") {
      args.use_project = true;
    } else if (arg == "--werror") {
      args.werror = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (!arg.empty() && arg[0] != '-') {
      args.input_files.push_back(arg);
    } else {
      args.error = "unknown option '" + arg + "'";
    }
  }

  return args;
}

// ============================================================================
// Output
// ============================================================================

bool use_color(ColorMode mode)
{
  switch (mode) {
    case ColorMode::Always:
      return true;
    case ColorMode::Never:
      return false;
    case ColorMode::Auto:
      break;
  }
  return isatty(fileno(stderr)) != 0;
}

void print_result(const AnalyzeResult & result, OutputFormat format, ColorMode color)
{
  if (format == OutputFormat::Json) {
    std::cout << to_json(result.diagnostics, result.sources).dump(2) << "\n";
    return;
  }

  DiagnosticPrinter printer(std::cerr, use_color(color));
  printer.print_all(result.diagnostics, result.sources);
  if (!result.diagnostics.empty()) {
    printer.print_summary(result.diagnostics);
  }
}

// ============================================================================
// Commands
// ============================================================================

int cmd_check(const CommandArgs & args)
{
  AnalyzeOptions options;
  options.warnings_as_errors = args.werror;
  options.verbose = args.verbose;

  OutputFormat format = args.format.value_or(OutputFormat::Text);
  ColorMode color = args.color.value_or(ColorMode::Auto);

  AnalyzeResult result;

  if (args.use_project || args.input_files.empty()) {
    auto config_path = find_project_config(fs::current_path());
    if (!config_path) {
      std::cerr << "error: no " << k_project_config_file_name
                << " found in current directory or parents\n";
      return 1;
    }

    const auto config_result = load_project_config(*config_path);
    if (!config_result.success) {
      std::cerr << "error: " << config_result.error << "\n";
      return 1;
    }

    const ProjectConfig & config = config_result.config;
    format = args.format.value_or(config.output.format);
    color = args.color.value_or(config.output.color);

    if (args.verbose) {
      std::cerr << "Checking project: " << config.package.name << "\n";
    }

    result = AnalyzerDriver::analyze_project(config, options);
  } else {
    std::vector<fs::path> files;
    for (const auto & input : args.input_files) {
      files.push_back(fs::absolute(input));
    }
    result = AnalyzerDriver::analyze_files(files, AnalyzerConfig{}, options);
  }

  print_result(result, format, color);

  if (format == OutputFormat::Text && result.success) {
    std::cout << result.units_analyzed << (result.units_analyzed == 1 ? " unit" : " units")
              << ": OK\n";
  }
  return result.success ? 0 : 1;
}

int cmd_codes()
{
#define DIAGNOSTIC(Name, Id, Sev, Msg) \
  std::cout << Id << " (" << to_string(Severity::Sev) << ")\n";
#include "flowsema/basic/diagnostic_codes.def"
  return 0;
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  if (!args.error.empty()) {
    std::cerr << "error: " << args.error << "\n";
    return 1;
  }

  if (args.command == "check") {
    return cmd_check(args);
  }

  if (args.command == "codes") {
    return cmd_codes();
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  print_usage(argv[0]);
  return 1;
}
