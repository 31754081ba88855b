// gstat - gradual statics command line interface
//
// Usage:
//   gstat check <term.json> [--config gstat.yaml] [--json] [--no-color] [-v]
//   gstat type <term.json> <id> [--config gstat.yaml]
//
// Exit status: 0 when no error was reported, 1 when the term has static
// errors, 2 on usage, configuration or input errors.
//
#include <fmt/core.h>

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "gradual/basic/casting.hpp"
#include "gradual/basic/diagnostic_printer.hpp"
#include "gradual/basic/internal_error.hpp"
#include "gradual/project/session_config.hpp"
#include "gradual/sema/info_json.hpp"
#include "gradual/sema/info_map.hpp"
#include "gradual/sema/session.hpp"
#include "gradual/sema/statics_diagnostics.hpp"
#include "gradual/sema/type_utils.hpp"
#include "gradual/term/term_json.hpp"
#include "gradual/term/term_printer.hpp"
#include "gradual/term/term_utils.hpp"

namespace fs = std::filesystem;

namespace
{

constexpr int k_exit_ok = 0;
constexpr int k_exit_errors = 1;
constexpr int k_exit_usage = 2;

void print_usage(const char * program_name)
{
  std::cerr << "gstat - gradual statics v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  check <term.json>        Report static errors of a term\n"
            << "  type <term.json> <id>    Show the statics of one node\n\n"
            << "Options:\n"
            << "  --config <path>          Use this gstat.yaml instead of searching for one\n"
            << "  --json                   Print the info map as JSON\n"
            << "  --no-color               Disable colored diagnostics\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n";
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::vector<std::string> positionals;
  std::string config_path;
  bool json = false;
  bool no_color = false;
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

    if (arg == "--config") {
      if (i + 1 < argc) {
        args.config_path = argv[++i];
      } else {
        args.error = "--config requires a path";
      }
    } else if (arg == "--json") {
      args.json = true;
    } else if (arg == "--no-color") {
      args.no_color = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (!arg.empty() && arg[0] == '-') {
      args.error = "unknown option '" + arg + "'";
    } else {
      args.positionals.push_back(arg);
    }
  }

  return args;
}

// ============================================================================
// Shared steps
// ============================================================================

/// Explicit --config, else gstat.yaml found upward from the input, else defaults
bool load_config(const CommandArgs & args, const fs::path & input, gradual::SessionConfig & out)
{
  std::optional<fs::path> config_path;
  if (!args.config_path.empty()) {
    config_path = fs::path(args.config_path);
  } else {
    config_path = gradual::find_session_config(fs::absolute(input).parent_path());
  }

  if (!config_path) {
    out = gradual::SessionConfig{};
    return true;
  }

  const auto result = gradual::load_session_config(*config_path);
  if (!result.success) {
    std::cerr << "error: " << config_path->string() << ": " << result.error << "\n";
    return false;
  }
  if (args.verbose) {
    fmt::print(stderr, "Using configuration: {}\n", config_path->string());
  }
  out = result.config;
  return true;
}

gradual::ColorOutput color_output(const CommandArgs & args, const gradual::SessionConfig & config)
{
  if (args.no_color) return gradual::ColorOutput::Never;
  switch (config.output.color) {
    case gradual::ColorMode::Always:
      return gradual::ColorOutput::Always;
    case gradual::ColorMode::Never:
      return gradual::ColorOutput::Never;
    case gradual::ColorMode::Auto:
      break;
  }
  return isatty(fileno(stderr)) != 0 ? gradual::ColorOutput::Auto : gradual::ColorOutput::Never;
}

// ============================================================================
// Commands
// ============================================================================

int cmd_check(const CommandArgs & args)
{
  if (args.positionals.size() != 1) {
    std::cerr << "error: expected one term file\n"
              << "usage: gstat check <term.json> [--config gstat.yaml] [--json] [--no-color] [-v]\n";
    return k_exit_usage;
  }
  const fs::path input = args.positionals.front();

  gradual::SessionConfig config;
  if (!load_config(args, input, config)) {
    return k_exit_usage;
  }

  gradual::TermContext terms;
  const auto loaded = gradual::load_term_file(input, terms);
  if (!loaded.success) {
    std::cerr << "error: " << loaded.error << "\n";
    return k_exit_usage;
  }

  gradual::StaticsSession session(gradual::session_options(config));
  const auto map = session.compute(loaded.term);

  if (args.verbose) {
    fmt::print(
      stderr, "Checked {}: {} nodes, {} ids\n", input.string(), gradual::term_size(loaded.term),
      map->size());
  }

  gradual::DiagnosticBag diagnostics;
  gradual::collect_diagnostics(*map, diagnostics, gradual::collect_options(config));

  if (args.json || config.output.format == gradual::OutputFormat::Json) {
    std::cout << gradual::to_json(*map).dump(2) << "\n";
  } else {
    gradual::DiagnosticPrinter printer(std::cerr, color_output(args, config));
    printer.print_all(diagnostics, gradual::terms(*map));
    if (!diagnostics.empty()) {
      printer.print_summary(diagnostics);
    }
    if (!diagnostics.has_errors()) {
      std::cout << input.string() << ": OK\n";
    }
  }

  return diagnostics.has_errors() ? k_exit_errors : k_exit_ok;
}

int cmd_type(const CommandArgs & args)
{
  if (args.positionals.size() != 2) {
    std::cerr << "error: expected a term file and a node id\n"
              << "usage: gstat type <term.json> <id>\n";
    return k_exit_usage;
  }
  const fs::path input = args.positionals[0];

  uint64_t raw_id = 0;
  try {
    size_t used = 0;
    raw_id = std::stoull(args.positionals[1], &used);
    if (used != args.positionals[1].size()) throw std::invalid_argument("trailing characters");
  } catch (const std::exception &) {
    std::cerr << "error: invalid node id '" << args.positionals[1] << "'\n";
    return k_exit_usage;
  }
  const gradual::Id id{raw_id};

  gradual::SessionConfig config;
  if (!load_config(args, input, config)) {
    return k_exit_usage;
  }

  gradual::TermContext terms;
  const auto loaded = gradual::load_term_file(input, terms);
  if (!loaded.success) {
    std::cerr << "error: " << loaded.error << "\n";
    return k_exit_usage;
  }

  gradual::StaticsSession session(gradual::session_options(config));
  const auto map = session.compute(loaded.term);

  const gradual::Info * info = map->find(id);
  if (!info) {
    std::cerr << "error: no node with id " << raw_id << "\n";
    return k_exit_usage;
  }

  if (args.json) {
    std::cout << gradual::to_json(*map, id).dump(2) << "\n";
    return k_exit_ok;
  }

  fmt::print("node #{} ({}, {})\n", raw_id, info->cls(), gradual::to_string(info->get_kind()));
  fmt::print("  term: {}\n", gradual::print_term(info->term, 72));

  switch (info->get_kind()) {
    case gradual::InfoKind::Exp:
      fmt::print("  type: {}\n", gradual::to_string(gradual::exp_type_after_fix(*map, id)));
      fmt::print("  self: {}\n", gradual::to_string(gradual::exp_self_type(*map, id)));
      fmt::print("  mode: {}\n", gradual::to_string(gradual::exp_mode(*map, id)));
      break;
    case gradual::InfoKind::Pat:
      fmt::print("  type: {}\n", gradual::to_string(gradual::pat_type_after_fix(*map, id)));
      fmt::print("  self: {}\n", gradual::to_string(gradual::pat_self_type(*map, id)));
      fmt::print("  mode: {}\n", gradual::to_string(gradual::pat_mode(*map, id)));
      break;
    case gradual::InfoKind::Typ:
      fmt::print(
        "  type: {}\n", gradual::to_string(gradual::cast<gradual::InfoTyp>(info)->ty));
      break;
    default:
      break;
  }
  if (gradual::is_error(*info)) {
    fmt::print("  error: yes\n");
  }
  return k_exit_ok;
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return k_exit_ok;
  }

  if (!args.error.empty()) {
    std::cerr << "error: " << args.error << "\n";
    print_usage(argv[0]);
    return k_exit_usage;
  }

  try {
    if (args.command == "check") {
      return cmd_check(args);
    }

    if (args.command == "type") {
      return cmd_type(args);
    }
  } catch (const gradual::InternalError & e) {
    std::cerr << "internal error: " << e.what() << "\n";
    return k_exit_usage;
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  print_usage(argv[0]);
  return k_exit_usage;
}
