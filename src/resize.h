#pragma once

#include <optional>
#include <string>
#include <vector>

#include "grid_index.h"
#include "tile.h"
#include "tile_layout.h"

namespace tilegrid::layout {

// What a resize request resolves to, computed without touching the grid.
// granted == 0 means the request is a no-op.
struct ResizePlan {
  Direction direction = Direction::East;
  int requested = 0; // units asked for, positive = grow
  int granted = 0;   // units actually applied (always >= 0)
  bool grow = true;
  TileRect rect;               // resulting geometry
  std::vector<CellPos> cells;  // cells absorbed (grow) or released (shrink)
};

// Emitted when a hosted tile changes size
struct TileResized {
  ItemId item;
  TileRect rect;
};

struct ResizeResult {
  bool success = false;
  std::optional<ErrorKind> error; // Set if success == false
  std::string error_message;
  int granted = 0;
  TileRect rect;
  std::optional<TileResized> event; // Empty for no-ops and unhosted tiles
};

// Resolve moving the `dir` edge of a tile by `units` cells.
// units > 0 pushes the edge outward: clamped at the grid boundary, then
// stopped at the first strip holding a filled cell.
// units < 0 pulls the edge inward: the strips next to that edge are released,
// never below a span of 1.
// Returns nullopt if the tile id is unknown.
[[nodiscard]] std::optional<ResizePlan> plan_resize(const GridIndex& grid, TileId tile,
                                                    Direction dir, int units);

// Apply a plan produced by plan_resize() on the same grid state.
// Returns false if the grid rejected the change.
[[nodiscard]] bool apply_resize(GridIndex& grid, TileId tile, const ResizePlan& plan);

// Resize the tile owning (row, column). Works on unfilled tiles as well;
// an event is only produced for a tile hosting an item.
// Fails with OutOfBounds.
[[nodiscard]] ResizeResult resize_tile_at(TileLayout& layout, int row, int column, Direction dir,
                                          int units);

// Resize the tile hosting an item. Fails with UnknownItem.
[[nodiscard]] ResizeResult resize_item(TileLayout& layout, ItemId item, Direction dir, int units);

} // namespace tilegrid::layout
