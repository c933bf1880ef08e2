#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace tilegrid {

// Default grid dimensions
constexpr int kDefaultRowCount = 6;
constexpr int kDefaultColumnCount = 4;

// Default unit cell size and spacing (pixels, forwarded to the renderer)
constexpr int kDefaultVerticalSpan = 100;
constexpr int kDefaultHorizontalSpan = 150;
constexpr int kDefaultVerticalSpacing = 5;
constexpr int kDefaultHorizontalSpacing = 5;

struct Color {
  uint8_t r = 0;
  uint8_t g = 0;
  uint8_t b = 0;

  bool operator==(const Color&) const = default;
};

// Grid dimensions in cells, fixed for the lifetime of a layout
struct GridOptions {
  int rows = kDefaultRowCount;
  int columns = kDefaultColumnCount;
};

// Unit cell size and spacing. Stored and reported, never interpreted by the layout.
struct DisplayOptions {
  int vertical_span = kDefaultVerticalSpan;     // unit cell height
  int horizontal_span = kDefaultHorizontalSpan; // unit cell width
  int vertical_spacing = kDefaultVerticalSpacing;
  int horizontal_spacing = kDefaultHorizontalSpacing;
};

// Which interactive operations are accepted
struct BehaviorOptions {
  bool drag_and_drop = true;
  bool resizable = true;
};

// Colours of empty tiles per interaction state, forwarded to the renderer
struct PaletteOptions {
  Color idle{240, 240, 240};
  Color resize{211, 211, 211};
  Color drag_and_drop{211, 211, 211};
};

// Global options container
struct GlobalOptions {
  GridOptions gridOptions;
  DisplayOptions displayOptions;
  BehaviorOptions behaviorOptions;
  PaletteOptions paletteOptions;
};

// Get default global options
GlobalOptions get_default_global_options();

// Result type for TOML operations
struct WriteResult {
  bool success;
  std::string error; // Set if success == false
};

struct ReadResult {
  bool success;
  std::string error;     // Set if success == false
  GlobalOptions options; // Valid if success == true
};

// Write GlobalOptions to a TOML file
WriteResult write_options_toml(const GlobalOptions& options, const std::filesystem::path& filepath);

// Read GlobalOptions from a TOML file. Missing keys keep their defaults,
// invalid values are logged and replaced by their defaults.
ReadResult read_options_toml(const std::filesystem::path& filepath);

} // namespace tilegrid
