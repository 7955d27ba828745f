#pragma once

#include <artboard_placement/layout_constants.hpp>
#include <artboard_placement/types.hpp>
#include <cstddef>
#include <utility>
#include <vector>

namespace artboard_placement {

struct PackerOptions {
    double start_x = 0;
    double start_y = 0;
    double max_row_width = layout::max_row_width;
    double gap = layout::gap;
    double height_divergence_ratio = layout::height_divergence_ratio;
};

// Index pairs (i < j) of the rectangles that overlap, in index order.
std::vector<std::pair<std::size_t, std::size_t>> overlapping_pairs(
    const std::vector<PlacedArtboard>& artboards);

// Row-based packer. Single forward pass in request order, no backtracking.
// Positions come from next_position(); only register_placement() changes the layout.
class LayoutPacker {
public:
    explicit LayoutPacker(const PackerOptions& options);

    // Throws artboard_model::LayoutError if no clear row can be found.
    Position next_position(double width, double height);
    void register_placement(const PlacedArtboard& artboard);

    const std::vector<PlacedArtboard>& placed() const { return placed_; }
    const PackerOptions& options() const { return options_; }
    double current_x() const { return current_x_; }
    double current_row_y() const { return current_row_y_; }
    double current_row_max_height() const { return current_row_max_height_; }
    double global_max_bottom() const { return global_max_bottom_; }

    // Number of overlapping pairs among placed artboards. Always 0 unless a caller
    // registered a rectangle the packer did not hand out.
    std::size_t overlap_count() const;

private:
    bool row_has_content() const { return current_x_ > options_.start_x; }
    bool exceeds_row_width(double width) const;
    bool diverges_from_row(double height) const;
    bool intersects_placed(const PlacedArtboard& candidate) const;
    void start_new_row();

    PackerOptions options_;
    std::vector<PlacedArtboard> placed_;
    double current_x_ = 0;
    double current_row_y_ = 0;
    double current_row_max_height_ = 0;
    double global_max_bottom_ = 0;
};

} // namespace artboard_placement
