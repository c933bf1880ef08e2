#ifndef DOCTEST_CONFIG_DISABLE

#include <doctest/doctest.h>

#include "tile_layout.h"

using namespace tilegrid::layout;

namespace {

// Every cell of rect must be owned by its own unfilled unit tile
void check_unit_cells(const TileLayout& layout, const TileRect& rect) {
  for (const auto& cell : cells_of(rect)) {
    auto owner_rect = tile_rect(layout, cell.row, cell.column);
    REQUIRE(owner_rect.has_value());
    CHECK(*owner_rect == TileRect{cell.row, cell.column, 1, 1});
    CHECK(layout.grid.is_filled(cell.row, cell.column) == false);
  }
}

} // namespace

// ============================================================================
// Placement
// ============================================================================

TEST_SUITE("place_item") {
  TEST_CASE("single cell placement") {
    TileLayout layout(6, 4);

    auto result = place_item(layout, 1, 0, 0);

    REQUIRE(result.success);
    CHECK(result.rect == TileRect{0, 0, 1, 1});
    CHECK(item_rect(layout, 1) == TileRect{0, 0, 1, 1});
    CHECK(item_at(layout, 0, 0) == ItemId{1});
    CHECK(layout.grid.is_filled(0, 0) == true);
    CHECK(validate_layout(layout));
  }

  TEST_CASE("multi cell placement merges the area into one tile") {
    TileLayout layout(6, 4);

    auto result = place_item(layout, 5, 4, 1, 2, 2);

    REQUIRE(result.success);
    for (const auto& cell : cells_of(TileRect{4, 1, 2, 2})) {
      CHECK(tile_rect(layout, cell.row, cell.column) == TileRect{4, 1, 2, 2});
      CHECK(item_at(layout, cell.row, cell.column) == ItemId{5});
    }
    CHECK(layout.grid.tile_count() == 24 - 3);
    CHECK(validate_layout(layout));
  }

  TEST_CASE("placing the same item twice fails") {
    TileLayout layout(3, 3);
    REQUIRE(place_item(layout, 1, 0, 0).success);

    auto result = place_item(layout, 1, 2, 2);

    CHECK_FALSE(result.success);
    CHECK(result.error == ErrorKind::DuplicateItem);
    CHECK(item_rect(layout, 1) == TileRect{0, 0, 1, 1});
    CHECK(layout.grid.is_filled(2, 2) == false);
  }

  TEST_CASE("overlapping a filled tile fails without changes") {
    TileLayout layout(3, 3);
    REQUIRE(place_item(layout, 1, 1, 1).success);

    auto result = place_item(layout, 2, 0, 0, 2, 2);

    CHECK_FALSE(result.success);
    CHECK(result.error == ErrorKind::AreaOccupied);
    CHECK_FALSE(item_rect(layout, 2).has_value());
    check_unit_cells(layout, TileRect{0, 0, 1, 2});
    CHECK(validate_layout(layout));
  }

  TEST_CASE("leaving the grid fails with OutOfBounds") {
    TileLayout layout(3, 3);

    CHECK(place_item(layout, 1, 2, 2, 2, 1).error == ErrorKind::OutOfBounds);
    CHECK(place_item(layout, 1, -1, 0).error == ErrorKind::OutOfBounds);
    CHECK(place_item(layout, 1, 0, 3).error == ErrorKind::OutOfBounds);
    CHECK(layout.registry.size() == 0);
  }

  TEST_CASE("non-positive spans fail with InvalidSpan") {
    TileLayout layout(3, 3);

    CHECK(place_item(layout, 1, 0, 0, 0, 1).error == ErrorKind::InvalidSpan);
    CHECK(place_item(layout, 1, 0, 0, 1, -2).error == ErrorKind::InvalidSpan);
  }

  TEST_CASE("placing over an empty compound tile splits it first") {
    TileLayout layout(2, 3);
    TileId empty = *layout.grid.owner_of(0, 0);
    REQUIRE(layout.grid.merge_into(empty, TileRect{0, 0, 1, 3}, {{0, 1}, {0, 2}}));

    auto result = place_item(layout, 1, 0, 1);

    REQUIRE(result.success);
    CHECK(item_rect(layout, 1) == TileRect{0, 1, 1, 1});
    CHECK(tile_rect(layout, 0, 0) == TileRect{0, 0, 1, 1});
    CHECK(tile_rect(layout, 0, 2) == TileRect{0, 2, 1, 1});
    CHECK(validate_layout(layout));
  }
}

// ============================================================================
// Queries
// ============================================================================

TEST_SUITE("layout queries") {
  TEST_CASE("is_area_empty") {
    TileLayout layout(6, 4);
    REQUIRE(place_item(layout, 1, 0, 0).success);

    CHECK(is_area_empty(layout, 4, 1, 2, 2));
    CHECK(is_area_empty(layout, 0, 1, 1, 3));
    CHECK_FALSE(is_area_empty(layout, 0, 0, 1, 1));
    CHECK_FALSE(is_area_empty(layout, 0, 0, 2, 2));
  }

  TEST_CASE("is_area_empty is false outside the grid and for empty spans") {
    TileLayout layout(6, 4);

    CHECK_FALSE(is_area_empty(layout, 5, 3, 2, 1));
    CHECK_FALSE(is_area_empty(layout, -1, 0, 1, 1));
    CHECK_FALSE(is_area_empty(layout, 0, 0, 0, 1));
  }

  TEST_CASE("tile_rect is nullopt out of bounds") {
    TileLayout layout(2, 2);

    CHECK(tile_rect(layout, 1, 1) == TileRect{1, 1, 1, 1});
    CHECK_FALSE(tile_rect(layout, 2, 0).has_value());
    CHECK_FALSE(tile_rect(layout, 0, -1).has_value());
  }

  TEST_CASE("item lookups for unknown items") {
    TileLayout layout(2, 2);

    CHECK_FALSE(item_rect(layout, 42).has_value());
    CHECK_FALSE(item_at(layout, 0, 0).has_value());
    CHECK_FALSE(item_at(layout, 5, 5).has_value());
  }
}

// ============================================================================
// Removal
// ============================================================================

TEST_SUITE("remove_item") {
  TEST_CASE("removal restores unit tiles") {
    TileLayout layout(6, 4);
    REQUIRE(place_item(layout, 2, 4, 1, 2, 2).success);

    auto result = remove_item(layout, 2);

    REQUIRE(result.success);
    CHECK(result.rect == TileRect{4, 1, 2, 2});
    CHECK_FALSE(item_rect(layout, 2).has_value());
    check_unit_cells(layout, TileRect{4, 1, 2, 2});
    CHECK(layout.grid.tile_count() == 24);
    CHECK(validate_layout(layout));
  }

  TEST_CASE("removing an unknown item fails") {
    TileLayout layout(2, 2);

    auto result = remove_item(layout, 9);

    CHECK_FALSE(result.success);
    CHECK(result.error == ErrorKind::UnknownItem);
  }

  TEST_CASE("removed item can be placed again") {
    TileLayout layout(3, 3);
    REQUIRE(place_item(layout, 1, 0, 0, 2, 2).success);
    REQUIRE(remove_item(layout, 1).success);

    auto result = place_item(layout, 1, 1, 1, 2, 2);

    CHECK(result.success);
    CHECK(item_rect(layout, 1) == TileRect{1, 1, 2, 2});
    CHECK(validate_layout(layout));
  }

  TEST_CASE("overlapping placement after a 2x2 item, then removal") {
    TileLayout layout(6, 4);
    REQUIRE(place_item(layout, 1, 0, 0).success);
    CHECK_FALSE(is_area_empty(layout, 0, 0, 1, 1));
    CHECK(is_area_empty(layout, 0, 1, 1, 1));

    REQUIRE(place_item(layout, 2, 4, 1, 2, 2).success);
    auto overlap = place_item(layout, 3, 4, 2);
    CHECK_FALSE(overlap.success);
    CHECK(overlap.error == ErrorKind::AreaOccupied);

    REQUIRE(remove_item(layout, 2).success);
    CHECK(is_area_empty(layout, 4, 1, 2, 2));
    check_unit_cells(layout, TileRect{4, 1, 2, 2});
    CHECK(validate_layout(layout));
  }

  TEST_CASE("six by four walkthrough") {
    TileLayout layout(6, 4);
    REQUIRE(place_item(layout, 1, 0, 0).success);
    REQUIRE(place_item(layout, 2, 4, 1, 2, 2).success);

    CHECK_FALSE(is_area_empty(layout, 5, 2, 1, 1));
    CHECK(is_area_empty(layout, 5, 0, 1, 1));

    REQUIRE(place_item(layout, 3, 5, 0).success);
    REQUIRE(remove_item(layout, 3).success);
    CHECK(tile_rect(layout, 5, 0) == TileRect{5, 0, 1, 1});
    CHECK(tile_rect(layout, 5, 1) == TileRect{4, 1, 2, 2});

    REQUIRE(remove_item(layout, 2).success);
    check_unit_cells(layout, TileRect{4, 1, 2, 2});
    CHECK(layout.registry.items() == std::vector<ItemId>{1});
    CHECK(validate_layout(layout));
  }
}

// ============================================================================
// Move
// ============================================================================

TEST_SUITE("move_item") {
  TEST_CASE("move to a free area keeps the spans") {
    TileLayout layout(4, 4);
    REQUIRE(place_item(layout, 1, 0, 0, 2, 1).success);

    auto result = move_item(layout, 1, 2, 3);

    REQUIRE(result.success);
    CHECK(result.rect == TileRect{2, 3, 2, 1});
    REQUIRE(result.event.has_value());
    CHECK(result.event->item == 1);
    CHECK(result.event->rect == TileRect{2, 3, 2, 1});
    CHECK(item_rect(layout, 1) == TileRect{2, 3, 2, 1});
    check_unit_cells(layout, TileRect{0, 0, 2, 1});
    CHECK(validate_layout(layout));
  }

  TEST_CASE("move may overlap the item's own area") {
    TileLayout layout(2, 4);
    REQUIRE(place_item(layout, 1, 0, 0, 1, 2).success);

    auto result = move_item(layout, 1, 0, 1);

    REQUIRE(result.success);
    CHECK(item_rect(layout, 1) == TileRect{0, 1, 1, 2});
    check_unit_cells(layout, TileRect{0, 0, 1, 1});
    CHECK(validate_layout(layout));
  }

  TEST_CASE("move onto the current origin is a no-op") {
    TileLayout layout(2, 2);
    REQUIRE(place_item(layout, 1, 1, 1).success);

    auto result = move_item(layout, 1, 1, 1);

    CHECK(result.success);
    CHECK_FALSE(result.event.has_value());
    CHECK(item_rect(layout, 1) == TileRect{1, 1, 1, 1});
  }

  TEST_CASE("move failures leave the item in place") {
    TileLayout layout(3, 3);
    REQUIRE(place_item(layout, 1, 0, 0, 1, 2).success);
    REQUIRE(place_item(layout, 2, 2, 2).success);

    CHECK(move_item(layout, 1, 2, 1).error == ErrorKind::AreaOccupied);
    CHECK(move_item(layout, 1, 0, 2).error == ErrorKind::OutOfBounds);
    CHECK(move_item(layout, 7, 0, 0).error == ErrorKind::UnknownItem);
    CHECK(item_rect(layout, 1) == TileRect{0, 0, 1, 2});
    CHECK(validate_layout(layout));
  }
}

// ============================================================================
// Hard Split
// ============================================================================

TEST_SUITE("hard_split") {
  TEST_CASE("splitting an empty compound tile") {
    TileLayout layout(3, 3);
    TileId empty = *layout.grid.owner_of(0, 0);
    REQUIRE(layout.grid.merge_into(empty, TileRect{0, 0, 2, 2}, {{0, 1}, {1, 0}, {1, 1}}));

    auto unit = hard_split(layout, 1, 1, {{1, 1}});

    REQUIRE(unit.has_value());
    CHECK(layout.grid.owner_of(1, 1) == unit);
    check_unit_cells(layout, TileRect{0, 0, 2, 2});
    CHECK(validate_layout(layout));
  }

  TEST_CASE("splitting a hosted tile unbinds its item") {
    TileLayout layout(3, 3);
    REQUIRE(place_item(layout, 1, 0, 0, 2, 2).success);

    auto unit = hard_split(layout, 0, 0, {{0, 0}});

    REQUIRE(unit.has_value());
    CHECK_FALSE(item_rect(layout, 1).has_value());
    CHECK(layout.registry.size() == 0);
    check_unit_cells(layout, TileRect{0, 0, 2, 2});
    CHECK(validate_layout(layout));
  }

  TEST_CASE("rejected when the result cell is not listed or a cell is outside") {
    TileLayout layout(2, 2);
    REQUIRE(place_item(layout, 1, 0, 0, 1, 2).success);

    CHECK_FALSE(hard_split(layout, 1, 1, {{0, 0}}).has_value());
    CHECK_FALSE(hard_split(layout, 0, 0, {{0, 0}, {2, 0}}).has_value());
    CHECK(item_rect(layout, 1) == TileRect{0, 0, 1, 2});
  }
}

// ============================================================================
// Formatting
// ============================================================================

TEST_SUITE("format_layout") {
  TEST_CASE("empty grid renders dots") {
    TileLayout layout(2, 3);

    CHECK(format_layout(layout) == ". . .\n. . .\n");
  }

  TEST_CASE("labels are right aligned to the widest item") {
    TileLayout layout(2, 3);
    REQUIRE(place_item(layout, 1, 0, 0, 1, 2).success);
    REQUIRE(place_item(layout, 12, 1, 2).success);

    CHECK(format_layout(layout) == " 1  1  .\n .  . 12\n");
  }
}

#endif // !DOCTEST_CONFIG_DISABLE
