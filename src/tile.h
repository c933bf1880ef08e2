#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace tilegrid::layout {

// Stable identifier of a tile inside one grid. Never reused.
using TileId = size_t;

// Opaque handle of an item placed on the grid (owned by the host)
using ItemId = size_t;

// A cell coordinate
struct CellPos {
  int row = 0;
  int column = 0;

  bool operator==(const CellPos&) const = default;
};

// Rectangle in grid units. Origin is always the upper-left cell.
struct TileRect {
  int row = 0;
  int column = 0;
  int row_span = 1;
  int column_span = 1;

  bool operator==(const TileRect&) const = default;
};

// One rectangular region of the grid, filled or empty
struct Tile {
  TileRect rect;
  bool filled = false;
};

// Edge of a tile that moves during a resize
enum class Direction { North, South, East, West };

enum class ErrorKind {
  OutOfBounds,
  AreaOccupied,
  DuplicateItem,
  UnknownItem,
  InvalidSpan,
  OperationDisabled,
};

// ============================================================================
// Rect Helpers
// ============================================================================

[[nodiscard]] bool contains(const TileRect& rect, int row, int column);

// Number of unit cells covered by the rect
[[nodiscard]] int area(const TileRect& rect);

// Row-major list of the cells covered by the rect
[[nodiscard]] std::vector<CellPos> cells_of(const TileRect& rect);

// ============================================================================
// Direction Helpers
// ============================================================================

// Convert a (dx, dy) unit vector to a Direction.
// Exactly one component must be non-zero and equal to -1 or +1.
[[nodiscard]] std::optional<Direction> direction_from_vector(int dx, int dy);

// True for North/South
[[nodiscard]] bool is_vertical(Direction dir);

// -1 for North/West, +1 for South/East
[[nodiscard]] int axis_sign(Direction dir);

// Convert a signed grid-coordinate delta of the moving edge into resize units
// (positive = grow, negative = shrink).
[[nodiscard]] int edge_delta_to_units(Direction dir, int coordinate_delta);

[[nodiscard]] std::string to_string(const TileRect& rect);

} // namespace tilegrid::layout
