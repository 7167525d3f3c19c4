// assert_lint - Command line interface
//
// Usage:
//   assert_lint check [unit.json...] [--project] [options]
//   assert_lint dump <unit.json>
//
#include <fmt/core.h>
#include <fmt/ostream.h>

#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <limits>
#include <nlohmann/json.hpp>
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

#include "assert_lint/ast/json_visitor.hpp"
#include "assert_lint/basic/diagnostic_printer.hpp"
#include "assert_lint/driver/analyzer.hpp"
#include "assert_lint/frontend/unit_loader.hpp"
#include "assert_lint/project/project_config.hpp"

namespace fs = std::filesystem;

namespace
{

// Exit codes
constexpr int k_exit_clean = 0;
constexpr int k_exit_findings = 1;
constexpr int k_exit_error = 2;

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "assert_lint v0.1.0 - find test methods without assertions\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  check [unit.json...]              Check analysis units\n"
            << "  dump <unit.json>                  Print the loaded AST as JSON\n\n"
            << "Options:\n"
            << "  --project                         Check the sources listed in assert_lint.yaml\n"
            << "  --custom-assertion-methods <str>  Extra assertion methods (Type#method,...)\n"
            << "  -j, --jobs <n>                    Worker threads (0 = one per core)\n"
            << "  --format <text|json>              Diagnostic output format\n"
            << "  --no-color                        Disable colored output\n"
            << "  -v, --verbose                     Verbose output\n"
            << "  -h, --help                        Show this help message\n";
}

// ============================================================================
// Argument Parsing
// ============================================================================

enum class OutputFormat {
  Text,
  Json,
};

struct CommandArgs
{
  std::string command;
  std::vector<std::string> input_files;
  std::optional<std::string> custom_assertion_methods;
  std::optional<unsigned> jobs;
  OutputFormat format = OutputFormat::Text;
  bool use_project = false;
  bool no_color = false;
  bool verbose = false;
  bool show_help = false;
  std::string error;  ///< Usage error, if any
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

    if (arg == "--custom-assertion-methods") {
      if (i + 1 >= argc) {
        args.error = "--custom-assertion-methods requires a value";
        break;
      }
      args.custom_assertion_methods = argv[++i];
    } else if (arg == "-j" || arg == "--jobs") {
      if (i + 1 >= argc) {
        args.error = arg + " requires a value";
        break;
      }
      const std::string value = argv[++i];
      char * end = nullptr;
      errno = 0;
      const long n = std::strtol(value.c_str(), &end, 10);
      if (
        value.empty() || *end != '\0' || errno == ERANGE || n < 0 ||
        static_cast<unsigned long>(n) > std::numeric_limits<unsigned>::max()) {
        args.error = "invalid job count: " + value;
        break;
      }
      args.jobs = static_cast<unsigned>(n);
    } else if (arg == "--format") {
      const std::string value = i + 1 < argc ? argv[++i] : "";
      if (value == "text") {
        args.format = OutputFormat::Text;
      } else if (value == "json") {
        args.format = OutputFormat::Json;
      } else {
        args.error = "invalid format '" + value + "' (must be 'text' or 'json')";
        break;
      }
    } else if (arg == "--project") {
      args.use_project = true;
    } else if (arg == "--no-color") {
      args.no_color = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (!arg.empty() && arg[0] != '-') {
      args.input_files.push_back(arg);
    } else {
      args.error = "unknown option '" + arg + "'";
      break;
    }
  }

  return args;
}

// ============================================================================
// Reporting
// ============================================================================

void report_text(const assert_lint::AnalyzeResult & result, const std::string & run_origin, bool use_color)
{
  assert_lint::DiagnosticPrinter printer(std::cerr, use_color);

  const assert_lint::SourceFile origin(run_origin);
  printer.print_all(result.run_diagnostics, origin);

  for (const auto & unit : result.units) {
    printer.print_all(unit.diagnostics, unit.source);
  }

  fmt::print(
    std::cerr, "{} unit(s) checked, {} test(s) without assertions, {} error(s)\n",
    result.units.size(), result.finding_count, result.error_count);
}

void report_json(const assert_lint::AnalyzeResult & result, const std::string & run_origin)
{
  nlohmann::json out = nlohmann::json::array();

  const assert_lint::SourceFile origin(run_origin);
  for (const auto & diag : result.run_diagnostics) {
    out.push_back(assert_lint::diagnostic_to_json(diag, origin));
  }
  for (const auto & unit : result.units) {
    for (const auto & diag : unit.diagnostics) {
      out.push_back(assert_lint::diagnostic_to_json(diag, unit.source));
    }
  }

  std::cout << out.dump(2) << "\n";
}

int exit_code_for(const assert_lint::AnalyzeResult & result)
{
  if (!result.success) {
    return k_exit_error;
  }
  return result.finding_count > 0 ? k_exit_findings : k_exit_clean;
}

// ============================================================================
// Commands
// ============================================================================

int cmd_check(const CommandArgs & args)
{
  assert_lint::AnalyzeOptions options;
  std::vector<fs::path> files;
  std::string run_origin = "<command line>";

  if (args.use_project || args.input_files.empty()) {
    auto config_path = assert_lint::find_project_config(fs::current_path());
    if (!config_path) {
      std::cerr << "error: no " << assert_lint::k_project_config_file_name
                << " found in current directory or parents\n";
      return k_exit_error;
    }

    auto config_result = assert_lint::load_project_config(*config_path);
    if (!config_result.success) {
      std::cerr << "error: " << config_result.error << "\n";
      return k_exit_error;
    }

    if (args.verbose) {
      std::cerr << "Using project: " << config_path->string() << "\n";
    }

    options = assert_lint::make_analyze_options(config_result.config);
    files = config_result.config.sources;
    run_origin = config_path->string();
  }

  for (const auto & f : args.input_files) {
    files.emplace_back(f);
  }

  // Command line overrides the project configuration.
  if (args.custom_assertion_methods) {
    options.custom_assertion_methods = *args.custom_assertion_methods;
  }
  if (args.jobs) {
    options.jobs = *args.jobs;
  }

  if (files.empty()) {
    std::cerr << "error: no analysis units to check\n";
    return k_exit_error;
  }

  const auto result = assert_lint::Analyzer::analyze_files(files, options);

  if (args.verbose) {
    for (const auto & unit : result.units) {
      fmt::print(
        std::cerr, "Checked: {} ({})\n", unit.path.string(),
        unit.loaded ? fmt::format("{} finding(s)", unit.finding_count) : std::string("not loaded"));
    }
  }

  if (args.format == OutputFormat::Json) {
    report_json(result, run_origin);
  } else {
    // Detect if terminal supports colors (simple check for TTY)
    const bool use_color = !args.no_color && isatty(fileno(stderr)) != 0;
    report_text(result, run_origin, use_color);
  }

  return exit_code_for(result);
}

int cmd_dump(const CommandArgs & args)
{
  if (args.input_files.size() != 1) {
    std::cerr << "error: exactly one unit file required\n";
    std::cerr << "usage: assert_lint dump <unit.json>\n";
    return k_exit_error;
  }

  try {
    const auto unit = assert_lint::load_unit_from_file(args.input_files.front());
    nlohmann::json out{
      {"file", unit.source.path().string()},
      {"types", unit.symbols.type_count()},
      {"methods", unit.symbols.method_count()},
      {"ast", assert_lint::to_json(unit.root)}};
    std::cout << out.dump(2) << "\n";
    return k_exit_clean;
  } catch (const assert_lint::UnitLoadError & e) {
    std::cerr << "error: " << e.what() << "\n";
    return k_exit_error;
  }
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return k_exit_clean;
  }

  if (!args.error.empty()) {
    std::cerr << "error: " << args.error << "\n";
    print_usage(argv[0]);
    return k_exit_error;
  }

  if (args.command == "check") {
    return cmd_check(args);
  }

  if (args.command == "dump") {
    return cmd_dump(args);
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  print_usage(argv[0]);
  return k_exit_error;
}
