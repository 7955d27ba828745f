#pragma once

#include <string>
#include <vector>

namespace artboard_placement {

// Shared layout defaults for generated artboards. All values in document pixels.

namespace layout {

constexpr double gap = 100.0;
constexpr double max_row_width = 8000.0;

// Row break when the new item's height differs from the row's tallest item by more than
// this fraction of their average height.
constexpr double height_divergence_ratio = 0.5;

// Upper bound on forced row breaks for a single placement before the packer gives up.
constexpr int max_forced_row_breaks = 64;

// Start point when the document has no artboards yet.
constexpr double default_start_x = 2500.0;
constexpr double default_start_y = 0.0;

// Grouped grid layout.
constexpr int grid_columns = 4;
constexpr double group_gap = 300.0;

inline const std::vector<std::string>& default_type_order() {
    static const std::vector<std::string> order = {
        "social", "display", "video", "email", "print", "web", "other"};
    return order;
}

// Average of two heights; the divergence test compares against half of it.
inline constexpr double height_average(double a, double b) {
    return (a + b) * 0.5;
}

} // namespace layout
} // namespace artboard_placement
