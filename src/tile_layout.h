#pragma once

#include <optional>
#include <string>
#include <vector>

#include "grid_index.h"
#include "item_registry.h"
#include "tile.h"

namespace tilegrid::layout {

// A grid partition together with the items placed on it
struct TileLayout {
  GridIndex grid;
  ItemRegistry registry;

  // Throws std::invalid_argument if either dimension is not positive
  TileLayout(int row_count, int column_count) : grid(row_count, column_count) {
  }
};

// Result of place/remove. rect is the placed (or freed) area.
struct OperationResult {
  bool success = false;
  std::optional<ErrorKind> error; // Set if success == false
  std::string error_message;
  TileRect rect;
};

// Emitted when an item changes position
struct TileMoved {
  ItemId item;
  TileRect rect;
};

struct MoveResult {
  bool success = false;
  std::optional<ErrorKind> error;
  std::string error_message;
  TileRect rect;
  std::optional<TileMoved> event; // Empty if the item did not change position
};

// ============================================================================
// Queries
// ============================================================================

// True if the rect lies inside the grid and no covered cell belongs to a
// filled tile. False for non-positive spans or a negative origin.
[[nodiscard]] bool is_area_empty(const TileLayout& layout, int row, int column, int row_span,
                                 int column_span);

// Rect of the tile owning the cell. nullopt if out of bounds.
[[nodiscard]] std::optional<TileRect> tile_rect(const TileLayout& layout, int row, int column);

// Rect of the tile hosting the item. nullopt if the item is not placed.
[[nodiscard]] std::optional<TileRect> item_rect(const TileLayout& layout, ItemId item);

// Item hosted by the tile owning the cell
[[nodiscard]] std::optional<ItemId> item_at(const TileLayout& layout, int row, int column);

// ============================================================================
// Operations
// ============================================================================

// Place an item over [row, row + row_span) x [column, column + column_span).
// The covered cells are merged into a single filled tile anchored at (row, column).
// Fails with DuplicateItem, InvalidSpan, OutOfBounds or AreaOccupied.
[[nodiscard]] OperationResult place_item(TileLayout& layout, ItemId item, int row, int column,
                                         int row_span = 1, int column_span = 1);

// Remove an item and split its tile back into unfilled unit tiles.
// Fails with UnknownItem.
[[nodiscard]] OperationResult remove_item(TileLayout& layout, ItemId item);

// Move an item so its tile is anchored at (row, column), keeping its spans.
// The target may overlap the item's current area. Fails with UnknownItem,
// OutOfBounds or AreaOccupied.
[[nodiscard]] MoveResult move_item(TileLayout& layout, ItemId item, int row, int column);

// Split every listed cell into an unfilled unit tile and return the unit tile
// now at (row, column). Tiles touched by the listed cells are split entirely,
// and items hosted by them are unbound.
// Returns nullopt (and changes nothing) if (row, column) is not listed or a
// listed cell is out of bounds.
std::optional<TileId> hard_split(TileLayout& layout, int row, int column,
                                 const std::vector<CellPos>& cells_to_split);

// ============================================================================
// Utilities
// ============================================================================

// Check the grid partition and the item bindings
[[nodiscard]] bool validate_layout(const TileLayout& layout);

// Text rendering of the grid: one column per cell, item handle or '.'
[[nodiscard]] std::string format_layout(const TileLayout& layout);

// Debug: log every tile and binding at debug level
void debug_print_layout(const TileLayout& layout);

} // namespace tilegrid::layout
