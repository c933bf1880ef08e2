#include "grid_index.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>
#include <string>

namespace tilegrid::layout {

GridIndex::GridIndex(int row_count, int column_count)
    : row_count_(row_count), column_count_(column_count) {
  if (row_count <= 0 || column_count <= 0) {
    throw std::invalid_argument("grid dimensions must be positive, got " +
                                std::to_string(row_count) + "x" + std::to_string(column_count));
  }

  cell_owner_.resize(static_cast<size_t>(row_count) * static_cast<size_t>(column_count));
  tiles_.reserve(cell_owner_.size());
  for (int r = 0; r < row_count_; ++r) {
    for (int c = 0; c < column_count_; ++c) {
      TileId id = create_unit_tile(r, c);
      cell_owner_[cell_index(r, c)] = id;
      tiles_[id].cell_count = 1;
    }
  }
}

bool GridIndex::in_bounds(int row, int column) const {
  return row >= 0 && row < row_count_ && column >= 0 && column < column_count_;
}

bool GridIndex::in_bounds(const TileRect& rect) const {
  return rect.row_span > 0 && rect.column_span > 0 && rect.row >= 0 && rect.column >= 0 &&
         rect.row + rect.row_span <= row_count_ && rect.column + rect.column_span <= column_count_;
}

std::optional<bool> GridIndex::is_filled(int row, int column) const {
  auto owner = owner_of(row, column);
  if (!owner.has_value()) {
    return std::nullopt;
  }
  return tiles_.at(*owner).tile.filled;
}

std::optional<TileId> GridIndex::owner_of(int row, int column) const {
  if (!in_bounds(row, column)) {
    return std::nullopt;
  }
  return cell_owner_[cell_index(row, column)];
}

const Tile* GridIndex::tile(TileId id) const {
  auto it = tiles_.find(id);
  if (it == tiles_.end()) {
    return nullptr;
  }
  return &it->second.tile;
}

void GridIndex::set_filled(TileId id, bool filled) {
  auto it = tiles_.find(id);
  if (it != tiles_.end()) {
    it->second.tile.filled = filled;
  }
}

bool GridIndex::merge_into(TileId anchor, const TileRect& new_rect,
                           const std::vector<CellPos>& cells_to_absorb) {
  auto anchor_it = tiles_.find(anchor);
  if (anchor_it == tiles_.end()) {
    spdlog::error("[merge_into] unknown anchor tile {}", anchor);
    return false;
  }
  if (!in_bounds(new_rect)) {
    spdlog::error("[merge_into] rect {} is outside the {}x{} grid", to_string(new_rect),
                  row_count_, column_count_);
    return false;
  }

  // The anchor keeps all of its cells
  const TileRect old_rect = anchor_it->second.tile.rect;
  for (const auto& cell : cells_of(old_rect)) {
    if (!contains(new_rect, cell.row, cell.column)) {
      spdlog::error("[merge_into] rect {} drops cell ({}, {}) of anchor {}", to_string(new_rect),
                    cell.row, cell.column, anchor);
      return false;
    }
  }

  std::vector<char> absorbed(cell_owner_.size(), 0);
  std::vector<TileId> absorbed_owners;
  for (const auto& cell : cells_to_absorb) {
    if (!in_bounds(cell.row, cell.column) || !contains(new_rect, cell.row, cell.column)) {
      spdlog::error("[merge_into] cell ({}, {}) is outside rect {}", cell.row, cell.column,
                    to_string(new_rect));
      return false;
    }
    TileId owner = cell_owner_[cell_index(cell.row, cell.column)];
    if (owner == anchor) {
      continue;
    }
    if (tiles_.at(owner).tile.filled) {
      spdlog::error("[merge_into] cell ({}, {}) belongs to filled tile {}", cell.row, cell.column,
                    owner);
      return false;
    }
    absorbed[cell_index(cell.row, cell.column)] = 1;
    if (std::find(absorbed_owners.begin(), absorbed_owners.end(), owner) ==
        absorbed_owners.end()) {
      absorbed_owners.push_back(owner);
    }
  }

  for (const auto& cell : cells_of(new_rect)) {
    size_t idx = cell_index(cell.row, cell.column);
    if (cell_owner_[idx] != anchor && !absorbed[idx]) {
      spdlog::error("[merge_into] cell ({}, {}) of rect {} is not absorbed", cell.row, cell.column,
                    to_string(new_rect));
      return false;
    }
  }

  // Validation done, mutate from here on
  for (TileId owner : absorbed_owners) {
    const TileRect& owner_rect = tiles_.at(owner).tile.rect;
    bool fully_inside = contains(new_rect, owner_rect.row, owner_rect.column) &&
                        contains(new_rect, owner_rect.row + owner_rect.row_span - 1,
                                 owner_rect.column + owner_rect.column_span - 1);
    if (!fully_inside) {
      spdlog::debug("[merge_into] dissolving partially absorbed tile {} {}", owner,
                    to_string(owner_rect));
      dissolve(owner);
    }
  }

  for (const auto& cell : cells_to_absorb) {
    assign(cell.row, cell.column, anchor);
  }
  tiles_.at(anchor).tile.rect = new_rect;
  return true;
}

void GridIndex::split_out(const std::vector<CellPos>& unit_cells) {
  for (const auto& cell : unit_cells) {
    if (!in_bounds(cell.row, cell.column)) {
      spdlog::warn("[split_out] ignoring out-of-bounds cell ({}, {})", cell.row, cell.column);
      continue;
    }
    TileId id = create_unit_tile(cell.row, cell.column);
    assign(cell.row, cell.column, id);
  }
}

bool GridIndex::reshape(TileId id, const TileRect& rect) {
  auto it = tiles_.find(id);
  if (it == tiles_.end() || !in_bounds(rect)) {
    return false;
  }
  if (it->second.cell_count != area(rect)) {
    return false;
  }
  for (const auto& cell : cells_of(rect)) {
    if (cell_owner_[cell_index(cell.row, cell.column)] != id) {
      return false;
    }
  }
  it->second.tile.rect = rect;
  return true;
}

std::vector<TileId> GridIndex::tile_ids() const {
  std::vector<TileId> ids;
  ids.reserve(tiles_.size());
  for (int r = 0; r < row_count_; ++r) {
    for (int c = 0; c < column_count_; ++c) {
      TileId id = cell_owner_[cell_index(r, c)];
      const TileRect& rect = tiles_.at(id).tile.rect;
      if (rect.row == r && rect.column == c) {
        ids.push_back(id);
      }
    }
  }
  return ids;
}

bool GridIndex::validate() const {
  bool ok = true;

  for (int r = 0; r < row_count_; ++r) {
    for (int c = 0; c < column_count_; ++c) {
      TileId id = cell_owner_[cell_index(r, c)];
      auto it = tiles_.find(id);
      if (it == tiles_.end()) {
        spdlog::error("[validate] cell ({}, {}) points to discarded tile {}", r, c, id);
        ok = false;
        continue;
      }
      if (!contains(it->second.tile.rect, r, c)) {
        spdlog::error("[validate] cell ({}, {}) is outside its tile {} {}", r, c, id,
                      to_string(it->second.tile.rect));
        ok = false;
      }
    }
  }

  for (const auto& [id, entry] : tiles_) {
    const TileRect& rect = entry.tile.rect;
    if (!in_bounds(rect)) {
      spdlog::error("[validate] tile {} {} leaves the grid", id, to_string(rect));
      ok = false;
      continue;
    }
    if (entry.cell_count != area(rect)) {
      spdlog::error("[validate] tile {} {} owns {} cells, expected {}", id, to_string(rect),
                    entry.cell_count, area(rect));
      ok = false;
    }
    for (const auto& cell : cells_of(rect)) {
      if (cell_owner_[cell_index(cell.row, cell.column)] != id) {
        spdlog::error("[validate] tile {} overlaps cell ({}, {}) owned by tile {}", id, cell.row,
                      cell.column, cell_owner_[cell_index(cell.row, cell.column)]);
        ok = false;
      }
    }
  }

  return ok;
}

TileId GridIndex::create_unit_tile(int row, int column) {
  TileId id = next_tile_id_++;
  Entry entry;
  entry.tile.rect = TileRect{row, column, 1, 1};
  tiles_.emplace(id, entry);
  return id;
}

void GridIndex::assign(int row, int column, TileId id) {
  size_t idx = cell_index(row, column);
  TileId old = cell_owner_[idx];
  if (old == id) {
    return;
  }
  cell_owner_[idx] = id;
  tiles_.at(id).cell_count++;

  auto old_it = tiles_.find(old);
  if (old_it != tiles_.end() && --old_it->second.cell_count <= 0) {
    tiles_.erase(old_it);
  }
}

void GridIndex::dissolve(TileId id) {
  auto it = tiles_.find(id);
  if (it == tiles_.end()) {
    return;
  }
  split_out(cells_of(it->second.tile.rect));
}

} // namespace tilegrid::layout
