#include "argument_parser.h"

#include <iostream>

namespace tilegrid {

namespace {

std::optional<LogLevel> parse_log_level(const std::string& level) {
  if (level == "trace") return LogLevel::Trace;
  if (level == "debug") return LogLevel::Debug;
  if (level == "info") return LogLevel::Info;
  if (level == "warn") return LogLevel::Warn;
  if (level == "err") return LogLevel::Err;
  if (level == "off") return LogLevel::Off;
  return std::nullopt;
}

ParseResult make_error(const std::string& error) {
  ParseResult result;
  result.success = false;
  result.error = error;
  return result;
}

ParseResult make_success(ParsedArgs args) {
  ParseResult result;
  result.success = true;
  result.args = std::move(args);
  return result;
}

}  // namespace

ParseResult parse_args(int argc, const char* const argv[]) {
  ParsedArgs args;
  int i = 1;

  // Parse options first (--option value)
  while (i < argc) {
    std::string arg = argv[i];

    // Check for help flags
    if (arg == "--help" || arg == "-h") {
      args.command = HelpCommand{};
      return make_success(args);
    }

    if (arg == "--version" || arg == "-v") {
      args.command = VersionCommand{};
      return make_success(args);
    }

    // Check if it's an option (starts with --)
    if (arg.rfind("--", 0) == 0) {
      std::string option_name = arg.substr(2);

      if (option_name == "logmode") {
        if (i + 1 >= argc) {
          return make_error("--logmode requires a value");
        }
        ++i;
        std::string value = argv[i];
        auto level = parse_log_level(value);
        if (!level) {
          return make_error("Invalid log level: " + value +
                            ". Valid values: trace, debug, info, warn, err, off");
        }
        args.options.log_level = level;
      } else if (option_name == "config") {
        if (i + 1 >= argc) {
          return make_error("--config requires a filepath");
        }
        ++i;
        args.options.config_path = argv[i];
      } else {
        return make_error("Unknown option: --" + option_name);
      }
      ++i;
      continue;
    }

    // Not an option, must be a command
    break;
  }

  // Parse command if present
  if (i < argc) {
    std::string cmd = argv[i];
    ++i;

    if (cmd == "help") {
      args.command = HelpCommand{};
    } else if (cmd == "version") {
      args.command = VersionCommand{};
    } else if (cmd == "demo") {
      args.command = DemoCommand{};
    } else if (cmd == "run") {
      if (i >= argc) {
        return make_error("run requires a script filepath");
      }
      args.command = RunCommand{argv[i]};
      ++i;
    } else if (cmd == "init-config") {
      InitConfigCommand init_cmd;
      if (i < argc && argv[i][0] != '-') {
        // Optional filepath argument provided
        init_cmd.filepath = argv[i];
        ++i;
      }
      args.command = init_cmd;
    } else {
      return make_error("Unknown command: " + cmd);
    }
  }

  if (i < argc) {
    return make_error("Unexpected argument: " + std::string(argv[i]));
  }

  return make_success(args);
}

void print_usage() {
  std::cout << "Usage: tilegrid [options] [command] [command-args]\n"
            << "\n"
            << "Options:\n"
            << "  --help, -h              Show this help message\n"
            << "  --version, -v           Show the version\n"
            << "  --logmode <level>       Set log level (trace, debug, info, warn, err, off)\n"
            << "  --config <filepath>     Load configuration from a TOML file\n"
            << "\n"
            << "Commands:\n"
            << "  demo                    Walk through placing, removing and resizing items\n"
            << "  run <script>            Execute a layout script, one operation per line:\n"
            << "                            place <item> <row> <col> [<row_span> <col_span>]\n"
            << "                            remove <item>\n"
            << "                            move <item> <row> <col>\n"
            << "                            resize <item> <north|south|east|west> <units>\n"
            << "                            print\n"
            << "  init-config [filepath]  Create default configuration TOML file\n"
            << "                          (defaults to tilegrid.toml in the current directory)\n"
            << "  version                 Show the version\n"
            << "\n"
            << "Examples:\n"
            << "  tilegrid demo\n"
            << "  tilegrid --logmode debug run layout.txt\n"
            << "  tilegrid init-config config.toml\n"
            << "  tilegrid --config config.toml run layout.txt\n";
}

}  // namespace tilegrid
