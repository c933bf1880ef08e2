#include "tile_layout.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <magic_enum/magic_enum.hpp>
#include <sstream>

namespace tilegrid::layout {

namespace {

template <typename Result>
Result make_error(ErrorKind kind, std::string message) {
  spdlog::debug("{}: {}", magic_enum::enum_name(kind), message);
  Result result;
  result.success = false;
  result.error = kind;
  result.error_message = std::move(message);
  return result;
}

// Make sure the tile at (row, column) is a unit tile so it can anchor a merge.
// Only called for unfilled cells.
TileId prepare_anchor(GridIndex& grid, int row, int column) {
  TileId owner = *grid.owner_of(row, column);
  const TileRect rect = grid.tile(owner)->rect;
  if (rect != TileRect{row, column, 1, 1}) {
    grid.split_out(cells_of(rect));
    owner = *grid.owner_of(row, column);
  }
  return owner;
}

// Collapse an empty area into one tile anchored at its origin
std::optional<TileId> merge_area(GridIndex& grid, const TileRect& rect) {
  TileId anchor = prepare_anchor(grid, rect.row, rect.column);
  if (area(rect) == 1) {
    return anchor;
  }

  std::vector<CellPos> cells = cells_of(rect);
  cells.erase(cells.begin()); // the anchor cell
  if (!grid.merge_into(anchor, rect, cells)) {
    return std::nullopt;
  }
  return anchor;
}

bool area_free_for(const GridIndex& grid, const TileRect& rect, std::optional<TileId> self) {
  for (const auto& cell : cells_of(rect)) {
    TileId owner = *grid.owner_of(cell.row, cell.column);
    if (self.has_value() && owner == *self) {
      continue;
    }
    if (grid.tile(owner)->filled) {
      return false;
    }
  }
  return true;
}

} // namespace

// ============================================================================
// Queries
// ============================================================================

bool is_area_empty(const TileLayout& layout, int row, int column, int row_span,
                   int column_span) {
  TileRect rect{row, column, row_span, column_span};
  if (!layout.grid.in_bounds(rect)) {
    return false;
  }
  return area_free_for(layout.grid, rect, std::nullopt);
}

std::optional<TileRect> tile_rect(const TileLayout& layout, int row, int column) {
  auto owner = layout.grid.owner_of(row, column);
  if (!owner.has_value()) {
    return std::nullopt;
  }
  return layout.grid.tile(*owner)->rect;
}

std::optional<TileRect> item_rect(const TileLayout& layout, ItemId item) {
  auto tile_id = layout.registry.tile_of(item);
  if (!tile_id.has_value()) {
    return std::nullopt;
  }
  const Tile* tile = layout.grid.tile(*tile_id);
  if (tile == nullptr) {
    return std::nullopt;
  }
  return tile->rect;
}

std::optional<ItemId> item_at(const TileLayout& layout, int row, int column) {
  auto owner = layout.grid.owner_of(row, column);
  if (!owner.has_value()) {
    return std::nullopt;
  }
  return layout.registry.item_of(*owner);
}

// ============================================================================
// Operations
// ============================================================================

OperationResult place_item(TileLayout& layout, ItemId item, int row, int column, int row_span,
                           int column_span) {
  TileRect rect{row, column, row_span, column_span};

  if (layout.registry.contains(item)) {
    return make_error<OperationResult>(ErrorKind::DuplicateItem,
                                       "item " + std::to_string(item) + " is already placed");
  }
  if (row_span < 1 || column_span < 1) {
    return make_error<OperationResult>(ErrorKind::InvalidSpan,
                                       "span must be at least 1x1, got " + to_string(rect));
  }
  if (!layout.grid.in_bounds(rect)) {
    return make_error<OperationResult>(ErrorKind::OutOfBounds,
                                       "area " + to_string(rect) + " leaves the grid");
  }
  if (!area_free_for(layout.grid, rect, std::nullopt)) {
    return make_error<OperationResult>(ErrorKind::AreaOccupied,
                                       "area " + to_string(rect) + " overlaps a filled tile");
  }

  auto anchor = merge_area(layout.grid, rect);
  if (!anchor.has_value()) {
    spdlog::error("place_item: failed to merge area {} for item {}", to_string(rect), item);
    return make_error<OperationResult>(ErrorKind::AreaOccupied,
                                       "area " + to_string(rect) + " could not be merged");
  }

  layout.grid.set_filled(*anchor, true);
  if (!layout.registry.bind(item, *anchor)) {
    spdlog::error("place_item: tile {} already hosts an item", *anchor);
  }

  spdlog::info("Placed item {} at {}", item, to_string(rect));
  OperationResult result;
  result.success = true;
  result.rect = rect;
  return result;
}

OperationResult remove_item(TileLayout& layout, ItemId item) {
  auto rect = item_rect(layout, item);
  if (!rect.has_value()) {
    return make_error<OperationResult>(ErrorKind::UnknownItem,
                                       "item " + std::to_string(item) + " is not placed");
  }

  layout.registry.unbind(item);
  hard_split(layout, rect->row, rect->column, cells_of(*rect));

  spdlog::info("Removed item {} from {}", item, to_string(*rect));
  OperationResult result;
  result.success = true;
  result.rect = *rect;
  return result;
}

MoveResult move_item(TileLayout& layout, ItemId item, int row, int column) {
  auto tile_id = layout.registry.tile_of(item);
  if (!tile_id.has_value()) {
    return make_error<MoveResult>(ErrorKind::UnknownItem,
                                  "item " + std::to_string(item) + " is not placed");
  }

  const TileRect old_rect = layout.grid.tile(*tile_id)->rect;
  TileRect target{row, column, old_rect.row_span, old_rect.column_span};

  if (!layout.grid.in_bounds(target)) {
    return make_error<MoveResult>(ErrorKind::OutOfBounds,
                                  "area " + to_string(target) + " leaves the grid");
  }
  if (!area_free_for(layout.grid, target, tile_id)) {
    return make_error<MoveResult>(ErrorKind::AreaOccupied,
                                  "area " + to_string(target) + " overlaps a filled tile");
  }

  MoveResult result;
  result.success = true;
  result.rect = target;
  if (target == old_rect) {
    return result;
  }

  layout.grid.split_out(cells_of(old_rect));
  auto anchor = merge_area(layout.grid, target);
  if (!anchor.has_value()) {
    spdlog::error("move_item: failed to merge area {} for item {}", to_string(target), item);
    layout.registry.unbind(item);
    return make_error<MoveResult>(ErrorKind::AreaOccupied,
                                  "area " + to_string(target) + " could not be merged");
  }

  layout.grid.set_filled(*anchor, true);
  if (!layout.registry.rebind(item, *anchor)) {
    spdlog::error("move_item: tile {} already hosts an item", *anchor);
  }

  spdlog::info("Moved item {} from {} to {}", item, to_string(old_rect), to_string(target));
  result.event = TileMoved{item, target};
  return result;
}

std::optional<TileId> hard_split(TileLayout& layout, int row, int column,
                                 const std::vector<CellPos>& cells_to_split) {
  auto listed = std::find(cells_to_split.begin(), cells_to_split.end(), CellPos{row, column});
  if (listed == cells_to_split.end()) {
    spdlog::debug("hard_split: ({}, {}) is not among the cells to split", row, column);
    return std::nullopt;
  }

  std::vector<TileId> touched;
  for (const auto& cell : cells_to_split) {
    auto owner = layout.grid.owner_of(cell.row, cell.column);
    if (!owner.has_value()) {
      spdlog::debug("hard_split: cell ({}, {}) is out of bounds", cell.row, cell.column);
      return std::nullopt;
    }
    if (std::find(touched.begin(), touched.end(), *owner) == touched.end()) {
      touched.push_back(*owner);
    }
  }

  // Whole tiles are split so no tile is left with a stale rect
  std::vector<CellPos> to_split;
  for (TileId id : touched) {
    auto cells = cells_of(layout.grid.tile(id)->rect);
    to_split.insert(to_split.end(), cells.begin(), cells.end());

    if (auto hosted = layout.registry.item_of(id)) {
      spdlog::warn("hard_split: unbinding item {} from split tile {}", *hosted, id);
      layout.registry.unbind(*hosted);
    }
  }

  layout.grid.split_out(to_split);
  return layout.grid.owner_of(row, column);
}

// ============================================================================
// Utilities
// ============================================================================

bool validate_layout(const TileLayout& layout) {
  bool ok = layout.grid.validate();

  for (ItemId item : layout.registry.items()) {
    auto tile_id = layout.registry.tile_of(item);
    const Tile* tile = tile_id.has_value() ? layout.grid.tile(*tile_id) : nullptr;
    if (tile == nullptr) {
      spdlog::error("[validate] item {} is bound to a discarded tile", item);
      ok = false;
    } else if (!tile->filled) {
      spdlog::error("[validate] item {} is bound to unfilled tile {}", item, *tile_id);
      ok = false;
    }
  }

  for (TileId id : layout.grid.tile_ids()) {
    if (layout.grid.tile(id)->filled && !layout.registry.item_of(id).has_value()) {
      spdlog::error("[validate] filled tile {} hosts no item", id);
      ok = false;
    }
  }

  return ok;
}

std::string format_layout(const TileLayout& layout) {
  size_t width = 1;
  for (ItemId item : layout.registry.items()) {
    width = std::max(width, std::to_string(item).size());
  }

  std::ostringstream out;
  for (int r = 0; r < layout.grid.row_count(); ++r) {
    for (int c = 0; c < layout.grid.column_count(); ++c) {
      auto item = item_at(layout, r, c);
      std::string label = item.has_value() ? std::to_string(*item) : ".";
      if (c > 0) {
        out << ' ';
      }
      out << std::string(width - label.size(), ' ') << label;
    }
    out << '\n';
  }
  return out.str();
}

void debug_print_layout(const TileLayout& layout) {
  spdlog::debug("===== Layout =====");
  spdlog::debug("grid = {}x{}, tiles = {}, items = {}", layout.grid.row_count(),
                layout.grid.column_count(), layout.grid.tile_count(), layout.registry.size());

  for (TileId id : layout.grid.tile_ids()) {
    const Tile* tile = layout.grid.tile(id);
    if (tile->rect.row_span == 1 && tile->rect.column_span == 1 && !tile->filled) {
      continue;
    }
    auto item = layout.registry.item_of(id);
    std::string item_str = item.has_value() ? std::to_string(*item) : "null";
    spdlog::debug("  [{}] rect={}, filled={}, item={}", id, to_string(tile->rect), tile->filled,
                  item_str);
  }

  spdlog::debug("===== End Layout =====");
}

} // namespace tilegrid::layout
