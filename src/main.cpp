#ifdef DOCTEST_CONFIG_DISABLE

#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <variant>

#include "argument_parser.h"
#include "engine.h"
#include "options.h"
#include "script.h"
#include "utility.h"
#include "version.h"

namespace {

std::filesystem::path get_default_config_path() {
  return std::filesystem::current_path() / "tilegrid.toml";
}

} // namespace

using namespace tilegrid;

void apply_log_level(LogLevel level) {
  switch (level) {
  case LogLevel::Trace:
    spdlog::set_level(spdlog::level::trace);
    break;
  case LogLevel::Debug:
    spdlog::set_level(spdlog::level::debug);
    break;
  case LogLevel::Info:
    spdlog::set_level(spdlog::level::info);
    break;
  case LogLevel::Warn:
    spdlog::set_level(spdlog::level::warn);
    break;
  case LogLevel::Err:
    spdlog::set_level(spdlog::level::err);
    break;
  case LogLevel::Off:
    spdlog::set_level(spdlog::level::off);
    break;
  }
}

void print_rect(const char* label, const std::optional<layout::TileRect>& rect) {
  std::cout << label << ": " << (rect ? layout::to_string(*rect) : std::string("none")) << "\n";
}

// Six-by-four walkthrough: unit items on the first rows, a 2x2 item below,
// one item placed and removed again, then a resize.
int run_demo(Engine& engine) {
  layout::ItemId next_item = 1;
  int rows = engine.row_count();
  int columns = engine.column_count();

  for (int r = 0; r < rows - 2; ++r) {
    for (int c = 0; c < columns; ++c) {
      auto placed = engine.place(next_item++, r, c);
      if (!placed.success) {
        spdlog::error("demo: {}", placed.error_message);
        return 1;
      }
    }
  }

  layout::ItemId big_item = next_item++;
  if (rows >= 2 && columns >= 3) {
    auto placed = engine.place(big_item, rows - 2, 1, 2, 2);
    if (!placed.success) {
      spdlog::error("demo: {}", placed.error_message);
    }
  }

  layout::ItemId last_item = next_item++;
  auto placed = engine.place(last_item, rows - 1, 0);
  if (placed.success) {
    auto removed = engine.remove(last_item);
    if (!removed.success) {
      spdlog::error("demo: {}", removed.error_message);
    }
  }

  std::cout << "row count: " << engine.row_count() << "\n";
  std::cout << "column count: " << engine.column_count() << "\n";
  print_rect("tile rect", engine.tile_rect(rows - 1, 1));
  std::cout << "row minimum height: " << engine.row_minimum_height() << "\n";
  std::cout << "column minimum width: " << engine.column_minimum_width() << "\n";
  std::cout << "vertical spacing: " << engine.vertical_spacing() << "\n";
  std::cout << "horizontal spacing: " << engine.horizontal_spacing() << "\n";
  std::cout << "\n" << layout::format_layout(engine.tile_layout) << "\n";

  auto resized = engine.resize(big_item, layout::Direction::West, 3);
  if (resized.success) {
    std::cout << "resize west by 3: granted " << resized.granted << " -> "
              << layout::to_string(resized.rect) << "\n";
    std::cout << "\n" << layout::format_layout(engine.tile_layout);
  }

  return engine.validate() ? 0 : 1;
}

int run_script_file(Engine& engine, const RunCommand& cmd) {
  auto parsed = parse_script_file(cmd.script_path);
  if (!parsed.success) {
    spdlog::error("{}", parsed.error);
    return 1;
  }
  auto run = run_script(engine, parsed.lines, std::cout);
  spdlog::info("Executed {} steps, {} failed", run.executed, run.failed);
  return run.failed == 0 ? 0 : 1;
}

int main(int argc, char* argv[]) {
  // Flush spdlog on info-level messages to ensure immediate output
  spdlog::flush_on(spdlog::level::info);

  // Parse command-line arguments
  auto result = parse_args(argc, argv);
  if (!result.success) {
    spdlog::error("{}", result.error);
    print_usage();
    return 1;
  }

  // Apply log level if specified
  if (result.args.options.log_level) {
    apply_log_level(*result.args.options.log_level);
  }

  spdlog::debug("tilegrid v{}", get_version_string());

  // Determine config path to load
  auto global_options = get_default_global_options();
  std::filesystem::path config_path;
  bool config_explicitly_specified = false;

  if (result.args.options.config_path) {
    config_path = *result.args.options.config_path;
    config_explicitly_specified = true;
  } else {
    config_path = get_default_config_path();
  }

  // Load config
  if (config_explicitly_specified || std::filesystem::exists(config_path)) {
    auto loaded = read_options_toml(config_path);
    if (loaded.success) {
      global_options = loaded.options;
      spdlog::info("Loaded config from: {}", config_path.string());
    } else {
      if (config_explicitly_specified) {
        // Explicit config path failed - error out
        spdlog::error("Failed to load config: {}", loaded.error);
        return 1;
      }
      // Default config failed to load - just use defaults silently
      spdlog::debug("Default config not loaded: {}", loaded.error);
    }
  }

  if (!result.args.command) {
    print_usage();
    return 0;
  }

  try {
    Engine engine(global_options);
    return std::visit(
        overloaded{
            [](const HelpCommand&) {
              print_usage();
              return 0;
            },
            [](const VersionCommand&) {
              std::cout << "tilegrid v" << get_version_string() << std::endl;
              return 0;
            },
            [&](const DemoCommand&) { return run_demo(engine); },
            [&](const RunCommand& cmd) { return run_script_file(engine, cmd); },
            [&](const InitConfigCommand& cmd) {
              auto target_path = cmd.filepath ? std::filesystem::path(*cmd.filepath)
                                              : get_default_config_path();
              auto write_result = write_options_toml(get_default_global_options(), target_path);
              if (!write_result.success) {
                spdlog::error("Failed to write config: {}", write_result.error);
                return 1;
              }
              spdlog::info("Config written to: {}", target_path.string());
              return 0;
            },
        },
        *result.args.command);
  } catch (const std::invalid_argument& e) {
    spdlog::error("Invalid grid configuration: {}", e.what());
    return 1;
  }
}

#endif
