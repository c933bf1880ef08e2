#pragma once

#include <optional>
#include <unordered_map>
#include <vector>

#include "tile.h"

namespace tilegrid::layout {

// Maps every cell of a row_count x column_count grid to the tile covering it.
//
// The grid is always an exact partition: every cell points to exactly one live
// tile, the tile's rect covers that cell, and the rects of live tiles are
// disjoint. merge_into() and split_out() (with reshape() to fix up a partially
// split tile) are the only structural mutators.
class GridIndex {
public:
  // Allocates one unfilled unit tile per cell.
  // Throws std::invalid_argument if either dimension is not positive.
  GridIndex(int row_count, int column_count);

  [[nodiscard]] int row_count() const {
    return row_count_;
  }

  [[nodiscard]] int column_count() const {
    return column_count_;
  }

  [[nodiscard]] bool in_bounds(int row, int column) const;

  // True if the rect has positive spans and lies entirely inside the grid
  [[nodiscard]] bool in_bounds(const TileRect& rect) const;

  // Fill state of the tile owning the cell. nullopt if out of bounds.
  [[nodiscard]] std::optional<bool> is_filled(int row, int column) const;

  // Tile owning the cell. nullopt if out of bounds.
  [[nodiscard]] std::optional<TileId> owner_of(int row, int column) const;

  // Live tile by id, nullptr if the id was discarded
  [[nodiscard]] const Tile* tile(TileId id) const;

  void set_filled(TileId id, bool filled);

  // Reassign the anchor's own cells plus cells_to_absorb to the anchor, which
  // takes the new geometry. Unfilled tiles that are only partly absorbed are
  // first dissolved into unit tiles.
  // Returns false without mutating anything if the anchor is unknown, the rect
  // leaves the grid, an absorbed cell belongs to another filled tile, or the
  // rect is not exactly anchor cells + absorbed cells.
  [[nodiscard]] bool merge_into(TileId anchor, const TileRect& new_rect,
                                const std::vector<CellPos>& cells_to_absorb);

  // Give each listed cell a fresh unfilled 1x1 tile. Tiles left without any
  // cell are discarded. A tile keeping some of its cells must be reshape()d.
  // Out-of-bounds cells are ignored.
  void split_out(const std::vector<CellPos>& unit_cells);

  // Set the geometry of a tile whose cell set changed through split_out().
  // Returns false if the cells pointing to the tile are not exactly the rect.
  [[nodiscard]] bool reshape(TileId id, const TileRect& rect);

  // Ids of all live tiles in row-major order of their origin
  [[nodiscard]] std::vector<TileId> tile_ids() const;

  [[nodiscard]] size_t tile_count() const {
    return tiles_.size();
  }

  // Check the partition invariant. Logs every anomaly found.
  [[nodiscard]] bool validate() const;

private:
  struct Entry {
    Tile tile;
    int cell_count = 0; // cells currently pointing to this tile
  };

  [[nodiscard]] size_t cell_index(int row, int column) const {
    return static_cast<size_t>(row) * static_cast<size_t>(column_count_) +
           static_cast<size_t>(column);
  }

  TileId create_unit_tile(int row, int column);
  void assign(int row, int column, TileId id);
  void dissolve(TileId id);

  int row_count_ = 0;
  int column_count_ = 0;
  std::vector<TileId> cell_owner_; // row-major
  std::unordered_map<TileId, Entry> tiles_;
  TileId next_tile_id_ = 0;
};

} // namespace tilegrid::layout
