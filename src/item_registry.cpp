#include "item_registry.h"

#include <algorithm>

namespace tilegrid::layout {

bool ItemRegistry::bind(ItemId item, TileId tile) {
  if (contains(item) || item_by_tile_.find(tile) != item_by_tile_.end()) {
    return false;
  }
  tile_by_item_[item] = tile;
  item_by_tile_[tile] = item;
  order_.push_back(item);
  return true;
}

std::optional<TileId> ItemRegistry::unbind(ItemId item) {
  auto it = tile_by_item_.find(item);
  if (it == tile_by_item_.end()) {
    return std::nullopt;
  }
  TileId tile = it->second;
  tile_by_item_.erase(it);
  item_by_tile_.erase(tile);
  order_.erase(std::remove(order_.begin(), order_.end(), item), order_.end());
  return tile;
}

bool ItemRegistry::rebind(ItemId item, TileId tile) {
  auto it = tile_by_item_.find(item);
  if (it == tile_by_item_.end()) {
    return false;
  }
  auto hosted = item_by_tile_.find(tile);
  if (hosted != item_by_tile_.end() && hosted->second != item) {
    return false;
  }
  item_by_tile_.erase(it->second);
  it->second = tile;
  item_by_tile_[tile] = item;
  return true;
}

std::optional<TileId> ItemRegistry::tile_of(ItemId item) const {
  auto it = tile_by_item_.find(item);
  if (it == tile_by_item_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<ItemId> ItemRegistry::item_of(TileId tile) const {
  auto it = item_by_tile_.find(tile);
  if (it == item_by_tile_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void ItemRegistry::clear() {
  tile_by_item_.clear();
  item_by_tile_.clear();
  order_.clear();
}

} // namespace tilegrid::layout
