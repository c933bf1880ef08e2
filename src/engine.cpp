#include "engine.h"

#include <magic_enum/magic_enum.hpp>

#include "spdlog/spdlog.h"
#include "utility.h"

namespace tilegrid {

namespace {

template <typename Result>
Result disabled_operation(const char* what) {
  Result result;
  result.error = layout::ErrorKind::OperationDisabled;
  result.error_message = std::string(what) + " is disabled";
  spdlog::debug("{}", result.error_message);
  return result;
}

} // namespace

Engine::Engine(const GlobalOptions& initial_options)
    : options(initial_options),
      tile_layout(initial_options.gridOptions.rows, initial_options.gridOptions.columns) {
}

void Engine::init(const GlobalOptions& new_options) {
  tile_layout = layout::TileLayout(new_options.gridOptions.rows, new_options.gridOptions.columns);
  options = new_options;
  spdlog::debug("Engine initialized with a {}x{} grid", row_count(), column_count());
}

void Engine::set_vertical_spacing(int spacing) {
  if (spacing < 0) {
    spdlog::warn("Ignoring negative vertical spacing {}", spacing);
    return;
  }
  options.displayOptions.vertical_spacing = spacing;
}

void Engine::set_horizontal_spacing(int spacing) {
  if (spacing < 0) {
    spdlog::warn("Ignoring negative horizontal spacing {}", spacing);
    return;
  }
  options.displayOptions.horizontal_spacing = spacing;
}

void Engine::set_vertical_span(int span) {
  if (span <= 0) {
    spdlog::warn("Ignoring non-positive vertical span {}", span);
    return;
  }
  options.displayOptions.vertical_span = span;
}

void Engine::set_horizontal_span(int span) {
  if (span <= 0) {
    spdlog::warn("Ignoring non-positive horizontal span {}", span);
    return;
  }
  options.displayOptions.horizontal_span = span;
}

PixelSize Engine::pixel_size(const layout::TileRect& rect) const {
  const auto& display = options.displayOptions;
  PixelSize size;
  size.width = rect.column_span * display.horizontal_span +
               (rect.column_span - 1) * display.horizontal_spacing;
  size.height =
      rect.row_span * display.vertical_span + (rect.row_span - 1) * display.vertical_spacing;
  return size;
}

void Engine::accept_drag_and_drop(bool value) {
  options.behaviorOptions.drag_and_drop = value;
}

void Engine::accept_resizing(bool value) {
  options.behaviorOptions.resizable = value;
}

bool Engine::is_area_empty(int row, int column, int row_span, int column_span) const {
  return layout::is_area_empty(tile_layout, row, column, row_span, column_span);
}

std::optional<layout::TileRect> Engine::tile_rect(int row, int column) const {
  return layout::tile_rect(tile_layout, row, column);
}

std::optional<layout::TileRect> Engine::item_rect(layout::ItemId item) const {
  return layout::item_rect(tile_layout, item);
}

const std::vector<layout::ItemId>& Engine::items() const {
  return tile_layout.registry.items();
}

layout::OperationResult Engine::place(layout::ItemId item, int row, int column, int row_span,
                                      int column_span) {
  return timed("place", [&] {
    return layout::place_item(tile_layout, item, row, column, row_span, column_span);
  });
}

layout::OperationResult Engine::remove(layout::ItemId item) {
  return timed("remove", [&] { return layout::remove_item(tile_layout, item); });
}

layout::MoveResult Engine::move(layout::ItemId item, int row, int column) {
  if (!options.behaviorOptions.drag_and_drop) {
    return disabled_operation<layout::MoveResult>("drag and drop");
  }

  auto result = timed("move", [&] { return layout::move_item(tile_layout, item, row, column); });
  if (result.event.has_value() && on_tile_moved) {
    on_tile_moved(*result.event);
  }
  return result;
}

layout::ResizeResult Engine::resize(layout::ItemId item, layout::Direction dir, int units) {
  if (!options.behaviorOptions.resizable) {
    return disabled_operation<layout::ResizeResult>("resizing");
  }

  spdlog::debug("Resize item {} {} by {}", item, magic_enum::enum_name(dir), units);
  auto result =
      timed("resize", [&] { return layout::resize_item(tile_layout, item, dir, units); });
  if (result.event.has_value() && on_tile_resized) {
    on_tile_resized(*result.event);
  }
  return result;
}

layout::ResizeResult Engine::resize_at(int row, int column, layout::Direction dir, int units) {
  if (!options.behaviorOptions.resizable) {
    return disabled_operation<layout::ResizeResult>("resizing");
  }

  auto result = timed("resize_at", [&] {
    return layout::resize_tile_at(tile_layout, row, column, dir, units);
  });
  if (result.event.has_value() && on_tile_resized) {
    on_tile_resized(*result.event);
  }
  return result;
}

std::optional<layout::TileId> Engine::hard_split(int row, int column,
                                                 const std::vector<layout::CellPos>& cells) {
  return layout::hard_split(tile_layout, row, column, cells);
}

bool Engine::validate() const {
  return layout::validate_layout(tile_layout);
}

} // namespace tilegrid
