#include "tile.h"

#include <spdlog/fmt/fmt.h>

namespace tilegrid::layout {

bool contains(const TileRect& rect, int row, int column) {
  return row >= rect.row && row < rect.row + rect.row_span && column >= rect.column &&
         column < rect.column + rect.column_span;
}

int area(const TileRect& rect) {
  return rect.row_span * rect.column_span;
}

std::vector<CellPos> cells_of(const TileRect& rect) {
  std::vector<CellPos> cells;
  if (rect.row_span <= 0 || rect.column_span <= 0) {
    return cells;
  }
  cells.reserve(static_cast<size_t>(area(rect)));
  for (int r = 0; r < rect.row_span; ++r) {
    for (int c = 0; c < rect.column_span; ++c) {
      cells.push_back({rect.row + r, rect.column + c});
    }
  }
  return cells;
}

std::optional<Direction> direction_from_vector(int dx, int dy) {
  if (dx != 0 && dy != 0) {
    return std::nullopt;
  }
  if (dx == 1) {
    return Direction::East;
  }
  if (dx == -1) {
    return Direction::West;
  }
  if (dy == 1) {
    return Direction::South;
  }
  if (dy == -1) {
    return Direction::North;
  }
  return std::nullopt;
}

bool is_vertical(Direction dir) {
  return dir == Direction::North || dir == Direction::South;
}

int axis_sign(Direction dir) {
  switch (dir) {
  case Direction::North:
  case Direction::West:
    return -1;
  case Direction::South:
  case Direction::East:
    return 1;
  }
  return 1;
}

int edge_delta_to_units(Direction dir, int coordinate_delta) {
  return coordinate_delta * axis_sign(dir);
}

std::string to_string(const TileRect& rect) {
  return fmt::format("({}, {}) {}x{}", rect.row, rect.column, rect.row_span, rect.column_span);
}

} // namespace tilegrid::layout
