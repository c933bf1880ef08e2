#pragma once

#include <functional>
#include <optional>
#include <vector>

#include "options.h"
#include "resize.h"
#include "tile_layout.h"

namespace tilegrid {

// Pixel size of a tile rect, derived from the unit spans and spacing
struct PixelSize {
  int width = 0;
  int height = 0;
};

// Engine owns one tile layout plus its configuration and event listeners.
// All members are public for easy access.
struct Engine {
  GlobalOptions options;
  layout::TileLayout tile_layout{kDefaultRowCount, kDefaultColumnCount};

  // Called after an item's tile changed size or position
  std::function<void(const layout::TileResized&)> on_tile_resized;
  std::function<void(const layout::TileMoved&)> on_tile_moved;

  Engine() = default;
  explicit Engine(const GlobalOptions& options);

  // Replace the whole layout with an empty grid built from options.
  // Throws std::invalid_argument for non-positive grid dimensions.
  void init(const GlobalOptions& new_options);

  // Grid geometry

  [[nodiscard]] int row_count() const {
    return tile_layout.grid.row_count();
  }

  [[nodiscard]] int column_count() const {
    return tile_layout.grid.column_count();
  }

  [[nodiscard]] int row_minimum_height() const {
    return options.displayOptions.vertical_span;
  }

  [[nodiscard]] int column_minimum_width() const {
    return options.displayOptions.horizontal_span;
  }

  [[nodiscard]] int vertical_spacing() const {
    return options.displayOptions.vertical_spacing;
  }

  [[nodiscard]] int horizontal_spacing() const {
    return options.displayOptions.horizontal_spacing;
  }

  // Display setters. Invalid values are logged and ignored.
  void set_vertical_spacing(int spacing);
  void set_horizontal_spacing(int spacing);
  void set_vertical_span(int span);
  void set_horizontal_span(int span);

  [[nodiscard]] PixelSize pixel_size(const layout::TileRect& rect) const;

  // Behavior flags
  void accept_drag_and_drop(bool value);
  void accept_resizing(bool value);

  // Queries

  [[nodiscard]] bool is_area_empty(int row, int column, int row_span, int column_span) const;
  [[nodiscard]] std::optional<layout::TileRect> tile_rect(int row, int column) const;
  [[nodiscard]] std::optional<layout::TileRect> item_rect(layout::ItemId item) const;
  [[nodiscard]] const std::vector<layout::ItemId>& items() const;

  // Operations

  [[nodiscard]] layout::OperationResult place(layout::ItemId item, int row, int column,
                                              int row_span = 1, int column_span = 1);
  [[nodiscard]] layout::OperationResult remove(layout::ItemId item);

  // Drop an item at a new origin. Fails with OperationDisabled when drag and
  // drop is off.
  [[nodiscard]] layout::MoveResult move(layout::ItemId item, int row, int column);

  // Move one edge of an item's tile. units > 0 grows, units < 0 shrinks.
  // Fails with OperationDisabled when resizing is off.
  [[nodiscard]] layout::ResizeResult resize(layout::ItemId item, layout::Direction dir,
                                            int units);
  [[nodiscard]] layout::ResizeResult resize_at(int row, int column, layout::Direction dir,
                                               int units);

  std::optional<layout::TileId> hard_split(int row, int column,
                                           const std::vector<layout::CellPos>& cells);

  // Check the partition invariant and bindings
  [[nodiscard]] bool validate() const;
};

} // namespace tilegrid
