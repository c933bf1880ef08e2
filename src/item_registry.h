#pragma once

#include <optional>
#include <unordered_map>
#include <vector>

#include "tile.h"

namespace tilegrid::layout {

// Bidirectional association between placed items and their tiles.
// An item appears at most once; a tile hosts at most one item.
class ItemRegistry {
public:
  // Returns false if the item or the tile is already bound
  [[nodiscard]] bool bind(ItemId item, TileId tile);

  // Remove the item and return the tile it was bound to
  std::optional<TileId> unbind(ItemId item);

  // Point an existing binding at another tile. Returns false if the item is
  // unknown or the tile already hosts another item.
  [[nodiscard]] bool rebind(ItemId item, TileId tile);

  [[nodiscard]] std::optional<TileId> tile_of(ItemId item) const;
  [[nodiscard]] std::optional<ItemId> item_of(TileId tile) const;

  [[nodiscard]] bool contains(ItemId item) const {
    return tile_by_item_.find(item) != tile_by_item_.end();
  }

  // Items in binding order
  [[nodiscard]] const std::vector<ItemId>& items() const {
    return order_;
  }

  [[nodiscard]] size_t size() const {
    return order_.size();
  }

  void clear();

private:
  std::unordered_map<ItemId, TileId> tile_by_item_;
  std::unordered_map<TileId, ItemId> item_by_tile_;
  std::vector<ItemId> order_;
};

} // namespace tilegrid::layout
