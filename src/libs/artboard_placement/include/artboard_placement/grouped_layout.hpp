#pragma once

#include <artboard_model/types.hpp>
#include <artboard_placement/layout_constants.hpp>
#include <artboard_placement/types.hpp>
#include <cstddef>
#include <string>
#include <vector>

namespace artboard_placement {

struct GridOptions {
    int columns = layout::grid_columns;
    double gap = layout::gap;
    double group_gap = layout::group_gap;
    std::vector<std::string> type_order = layout::default_type_order();
};

struct GridPlacement {
    std::size_t index = 0; // into the input size list
    Position position;
    double width = 0;      // including bleed
    double height = 0;
};

// Groups sizes by type (type_order first, unknown types after in first-seen order), sorts
// each group landscape-first by aspect ratio, and lays groups out as rows of `columns`
// items separated by group_gap. Result is in generation order.
std::vector<GridPlacement> place_grouped(const std::vector<artboard_model::SizeSpec>& sizes,
    const GridOptions& options, Position start, double resolution);

} // namespace artboard_placement
