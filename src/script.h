#pragma once

#include <filesystem>
#include <iosfwd>
#include <string>
#include <variant>
#include <vector>

#include "engine.h"
#include "tile.h"

namespace tilegrid {

// ===== Script Steps =====
// place <item> <row> <col> [<row_span> <col_span>]
struct PlaceStep {
  layout::ItemId item = 0;
  int row = 0;
  int column = 0;
  int row_span = 1;
  int column_span = 1;
};

// remove <item>
struct RemoveStep {
  layout::ItemId item = 0;
};

// move <item> <row> <col>
struct MoveStep {
  layout::ItemId item = 0;
  int row = 0;
  int column = 0;
};

// resize <item> <north|south|east|west> <units>
struct ResizeStep {
  layout::ItemId item = 0;
  layout::Direction direction = layout::Direction::East;
  int units = 0;
};

// print
struct PrintStep {};

using ScriptStep = std::variant<PlaceStep, RemoveStep, MoveStep, ResizeStep, PrintStep>;

struct ScriptLine {
  int line_number = 0;
  ScriptStep step;
};

struct ScriptParseResult {
  bool success;
  std::string error; // Set if success == false, names the offending line
  std::vector<ScriptLine> lines;
};

struct ScriptRunResult {
  int executed = 0;
  int failed = 0;
};

// Parse a script. Blank lines and text after '#' are ignored.
ScriptParseResult parse_script(std::istream& input);

ScriptParseResult parse_script_file(const std::filesystem::path& filepath);

// Execute every step against the engine. Failures are reported to out and do
// not stop the script.
ScriptRunResult run_script(Engine& engine, const std::vector<ScriptLine>& lines, std::ostream& out);

} // namespace tilegrid
