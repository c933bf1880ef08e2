#pragma once

#include <optional>
#include <string>
#include <variant>

namespace tilegrid {

// ===== Command Structs =====
struct HelpCommand {}; // --help or -h

struct VersionCommand {};

struct DemoCommand {};

struct RunCommand {
  std::string script_path;
};

struct InitConfigCommand {
  std::optional<std::string> filepath; // Empty = use default (tilegrid.toml in cwd)
};

// Variant holding all possible commands
using Command = std::variant<HelpCommand, VersionCommand, DemoCommand, RunCommand,
                             InitConfigCommand>;

// ===== CLI Options =====
enum class LogLevel { Trace, Debug, Info, Warn, Err, Off };

struct CliOptions {
  std::optional<LogLevel> log_level;      // --logmode <level>
  std::optional<std::string> config_path; // --config <filepath>
};

// ===== Parsed Arguments =====
struct ParsedArgs {
  CliOptions options;
  std::optional<Command> command; // nullopt if no command specified
};

// ===== Parser Result =====
struct ParseResult {
  bool success;
  std::string error; // Set if success == false
  ParsedArgs args;
};

// Parse command-line arguments
ParseResult parse_args(int argc, const char* const argv[]);

// Print usage information to stdout
void print_usage();

} // namespace tilegrid
