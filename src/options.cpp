#include "options.h"

#include <spdlog/spdlog.h>

#include <fstream>
#include <optional>
#include <toml++/toml.hpp>

namespace tilegrid {

namespace {

toml::array color_to_array(const Color& c) {
  toml::array arr;
  arr.push_back(static_cast<int64_t>(c.r));
  arr.push_back(static_cast<int64_t>(c.g));
  arr.push_back(static_cast<int64_t>(c.b));
  return arr;
}

std::optional<Color> parse_color(const toml::array* arr) {
  if (!arr || arr->size() != 3) {
    return std::nullopt;
  }
  auto r = (*arr)[0].as_integer();
  auto g = (*arr)[1].as_integer();
  auto b = (*arr)[2].as_integer();
  if (!r || !g || !b) {
    return std::nullopt;
  }
  auto rv = r->get(), gv = g->get(), bv = b->get();
  if (rv < 0 || rv > 255 || gv < 0 || gv > 255 || bv < 0 || bv > 255) {
    return std::nullopt;
  }
  return Color{static_cast<uint8_t>(rv), static_cast<uint8_t>(gv), static_cast<uint8_t>(bv)};
}

// Read an integer key into target, keeping the current value if absent
void read_int(const toml::table& table, const char* key, int& target) {
  if (auto value = table[key].as_integer()) {
    target = static_cast<int>(value->get());
  }
}

void read_bool(const toml::table& table, const char* key, bool& target) {
  if (auto value = table[key].as_boolean()) {
    target = value->get();
  }
}

void read_color(const toml::table& table, const char* key, Color& target) {
  if (auto color = parse_color(table[key].as_array())) {
    target = *color;
  } else if (table[key]) {
    spdlog::error("Invalid palette.{}: expected [r, g, b] with values 0-255. Using default.", key);
  }
}

// Replace non-positive values with the default
void require_positive(int& value, int fallback, const char* name) {
  if (value <= 0) {
    spdlog::error("Invalid {} value ({}): must be positive. Using default.", name, value);
    value = fallback;
  }
}

void require_non_negative(int& value, int fallback, const char* name) {
  if (value < 0) {
    spdlog::error("Invalid {} value ({}): must be non-negative. Using default.", name, value);
    value = fallback;
  }
}

} // anonymous namespace

GlobalOptions get_default_global_options() {
  return GlobalOptions{};
}

WriteResult write_options_toml(const GlobalOptions& options,
                               const std::filesystem::path& filepath) {
  try {
    toml::table root;

    toml::table grid;
    grid.insert("rows", options.gridOptions.rows);
    grid.insert("columns", options.gridOptions.columns);
    root.insert("grid", grid);

    toml::table display;
    display.insert("vertical_span", options.displayOptions.vertical_span);
    display.insert("horizontal_span", options.displayOptions.horizontal_span);
    display.insert("vertical_spacing", options.displayOptions.vertical_spacing);
    display.insert("horizontal_spacing", options.displayOptions.horizontal_spacing);
    root.insert("display", display);

    toml::table behavior;
    behavior.insert("drag_and_drop", options.behaviorOptions.drag_and_drop);
    behavior.insert("resizable", options.behaviorOptions.resizable);
    root.insert("behavior", behavior);

    toml::table palette;
    palette.insert("idle", color_to_array(options.paletteOptions.idle));
    palette.insert("resize", color_to_array(options.paletteOptions.resize));
    palette.insert("drag_and_drop", color_to_array(options.paletteOptions.drag_and_drop));
    root.insert("palette", palette);

    std::ofstream file(filepath);
    if (!file) {
      return WriteResult{false, "Failed to open file for writing: " + filepath.string()};
    }
    file << root;
    return WriteResult{true, ""};
  } catch (const std::exception& e) {
    return WriteResult{false, std::string("Error writing TOML: ") + e.what()};
  }
}

ReadResult read_options_toml(const std::filesystem::path& filepath) {
  try {
    auto tbl = toml::parse_file(filepath.string());
    GlobalOptions options = get_default_global_options();

    if (auto grid = tbl["grid"].as_table()) {
      read_int(*grid, "rows", options.gridOptions.rows);
      read_int(*grid, "columns", options.gridOptions.columns);
    }
    require_positive(options.gridOptions.rows, kDefaultRowCount, "grid.rows");
    require_positive(options.gridOptions.columns, kDefaultColumnCount, "grid.columns");

    if (auto display = tbl["display"].as_table()) {
      read_int(*display, "vertical_span", options.displayOptions.vertical_span);
      read_int(*display, "horizontal_span", options.displayOptions.horizontal_span);
      read_int(*display, "vertical_spacing", options.displayOptions.vertical_spacing);
      read_int(*display, "horizontal_spacing", options.displayOptions.horizontal_spacing);
    }
    require_positive(options.displayOptions.vertical_span, kDefaultVerticalSpan,
                     "display.vertical_span");
    require_positive(options.displayOptions.horizontal_span, kDefaultHorizontalSpan,
                     "display.horizontal_span");
    require_non_negative(options.displayOptions.vertical_spacing, kDefaultVerticalSpacing,
                         "display.vertical_spacing");
    require_non_negative(options.displayOptions.horizontal_spacing, kDefaultHorizontalSpacing,
                         "display.horizontal_spacing");

    if (auto behavior = tbl["behavior"].as_table()) {
      read_bool(*behavior, "drag_and_drop", options.behaviorOptions.drag_and_drop);
      read_bool(*behavior, "resizable", options.behaviorOptions.resizable);
    }

    if (auto palette = tbl["palette"].as_table()) {
      read_color(*palette, "idle", options.paletteOptions.idle);
      read_color(*palette, "resize", options.paletteOptions.resize);
      read_color(*palette, "drag_and_drop", options.paletteOptions.drag_and_drop);
    }

    return ReadResult{true, "", options};
  } catch (const toml::parse_error& e) {
    return ReadResult{false, std::string("TOML parse error: ") + e.what(), {}};
  } catch (const std::exception& e) {
    return ReadResult{false, std::string("Error reading TOML: ") + e.what(), {}};
  }
}

} // namespace tilegrid
