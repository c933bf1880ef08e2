#include "resize.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <magic_enum/magic_enum.hpp>

namespace tilegrid::layout {

namespace {

// Strip of cells parallel to the `dir` edge of the rect.
// offset >= 0 lies outside the rect (0 = adjacent to the edge),
// offset < 0 lies inside (-1 = the edge strip itself).
std::vector<CellPos> strip_at(const TileRect& rect, Direction dir, int offset) {
  std::vector<CellPos> strip;
  switch (dir) {
  case Direction::North: {
    int row = rect.row - 1 - offset;
    for (int c = 0; c < rect.column_span; ++c) {
      strip.push_back({row, rect.column + c});
    }
    break;
  }
  case Direction::South: {
    int row = rect.row + rect.row_span + offset;
    for (int c = 0; c < rect.column_span; ++c) {
      strip.push_back({row, rect.column + c});
    }
    break;
  }
  case Direction::West: {
    int column = rect.column - 1 - offset;
    for (int r = 0; r < rect.row_span; ++r) {
      strip.push_back({rect.row + r, column});
    }
    break;
  }
  case Direction::East: {
    int column = rect.column + rect.column_span + offset;
    for (int r = 0; r < rect.row_span; ++r) {
      strip.push_back({rect.row + r, column});
    }
    break;
  }
  }
  return strip;
}

// Number of strips between the `dir` edge and the grid boundary
int room_towards(const GridIndex& grid, const TileRect& rect, Direction dir) {
  switch (dir) {
  case Direction::North:
    return rect.row;
  case Direction::South:
    return grid.row_count() - rect.row - rect.row_span;
  case Direction::West:
    return rect.column;
  case Direction::East:
    return grid.column_count() - rect.column - rect.column_span;
  }
  return 0;
}

int span_along(const TileRect& rect, Direction dir) {
  return is_vertical(dir) ? rect.row_span : rect.column_span;
}

// Move the `dir` edge outward by delta (inward if negative).
// The origin stays the upper-left corner.
TileRect moved_rect(TileRect rect, Direction dir, int delta) {
  switch (dir) {
  case Direction::North:
    rect.row -= delta;
    rect.row_span += delta;
    break;
  case Direction::South:
    rect.row_span += delta;
    break;
  case Direction::West:
    rect.column -= delta;
    rect.column_span += delta;
    break;
  case Direction::East:
    rect.column_span += delta;
    break;
  }
  return rect;
}

ResizeResult resize_tile(TileLayout& layout, TileId tile, Direction dir, int units) {
  ResizeResult result;
  auto plan = plan_resize(layout.grid, tile, dir, units);
  if (!plan.has_value()) {
    result.error = ErrorKind::UnknownItem;
    result.error_message = "tile " + std::to_string(tile) + " does not exist";
    return result;
  }

  result.success = true;
  result.rect = layout.grid.tile(tile)->rect;
  if (plan->granted == 0) {
    spdlog::debug("Resize of tile {} {} by {}: nothing to grant", tile,
                  magic_enum::enum_name(dir), units);
    return result;
  }

  if (!apply_resize(layout.grid, tile, *plan)) {
    spdlog::error("Resize of tile {} {} by {} was rejected by the grid", tile,
                  magic_enum::enum_name(dir), units);
    result.success = false;
    result.error = ErrorKind::AreaOccupied;
    result.error_message = "resize to " + to_string(plan->rect) + " could not be applied";
    return result;
  }

  result.granted = plan->granted;
  result.rect = plan->rect;

  auto item = layout.registry.item_of(tile);
  if (item.has_value()) {
    result.event = TileResized{*item, plan->rect};
    spdlog::info("Resized item {} {} {} by {} (requested {}) -> {}", *item,
                 plan->grow ? "grow" : "shrink", magic_enum::enum_name(dir), plan->granted,
                 units, to_string(plan->rect));
  } else {
    spdlog::debug("Resized empty tile {} {} by {} -> {}", tile, magic_enum::enum_name(dir),
                  plan->granted, to_string(plan->rect));
  }
  return result;
}

} // namespace

std::optional<ResizePlan> plan_resize(const GridIndex& grid, TileId tile, Direction dir,
                                      int units) {
  const Tile* current = grid.tile(tile);
  if (current == nullptr) {
    return std::nullopt;
  }
  const TileRect rect = current->rect;

  ResizePlan plan;
  plan.direction = dir;
  plan.requested = units;
  plan.grow = units > 0;

  if (units > 0) {
    int clamped = std::min(units, room_towards(grid, rect, dir));
    for (int offset = 0; offset < clamped; ++offset) {
      auto strip = strip_at(rect, dir, offset);
      bool blocked = std::any_of(strip.begin(), strip.end(), [&](const CellPos& cell) {
        return grid.is_filled(cell.row, cell.column).value_or(true);
      });
      if (blocked) {
        break;
      }
      plan.cells.insert(plan.cells.end(), strip.begin(), strip.end());
      ++plan.granted;
    }
  } else if (units < 0) {
    int shed = std::min(-units, span_along(rect, dir) - 1);
    for (int k = 0; k < shed; ++k) {
      auto strip = strip_at(rect, dir, -1 - k);
      plan.cells.insert(plan.cells.end(), strip.begin(), strip.end());
    }
    plan.granted = shed;
  }

  plan.rect = moved_rect(rect, dir, plan.grow ? plan.granted : -plan.granted);
  return plan;
}

bool apply_resize(GridIndex& grid, TileId tile, const ResizePlan& plan) {
  if (plan.granted == 0) {
    return true;
  }
  if (plan.grow) {
    return grid.merge_into(tile, plan.rect, plan.cells);
  }
  grid.split_out(plan.cells);
  return grid.reshape(tile, plan.rect);
}

ResizeResult resize_tile_at(TileLayout& layout, int row, int column, Direction dir, int units) {
  auto owner = layout.grid.owner_of(row, column);
  if (!owner.has_value()) {
    ResizeResult result;
    result.error = ErrorKind::OutOfBounds;
    result.error_message =
        "cell (" + std::to_string(row) + ", " + std::to_string(column) + ") is outside the grid";
    spdlog::debug("resize_tile_at: {}", result.error_message);
    return result;
  }
  return resize_tile(layout, *owner, dir, units);
}

ResizeResult resize_item(TileLayout& layout, ItemId item, Direction dir, int units) {
  auto tile = layout.registry.tile_of(item);
  if (!tile.has_value()) {
    ResizeResult result;
    result.error = ErrorKind::UnknownItem;
    result.error_message = "item " + std::to_string(item) + " is not placed";
    spdlog::debug("resize_item: {}", result.error_message);
    return result;
  }
  return resize_tile(layout, *tile, dir, units);
}

} // namespace tilegrid::layout
