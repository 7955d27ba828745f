#include <artboard_placement/layout_packer.hpp>
#include <artboard_model/errors.hpp>
#include <algorithm>
#include <cmath>
#include <string>

namespace artboard_placement {

LayoutPacker::LayoutPacker(const PackerOptions& options)
    : options_(options)
    , current_x_(options.start_x)
    , current_row_y_(options.start_y)
    , current_row_max_height_(0)
    , global_max_bottom_(options.start_y)
{
}

bool LayoutPacker::exceeds_row_width(double width) const {
    return current_x_ + width > options_.start_x + options_.max_row_width;
}

bool LayoutPacker::diverges_from_row(double height) const {
    const double average = layout::height_average(height, current_row_max_height_);
    return std::abs(height - current_row_max_height_) > options_.height_divergence_ratio * average;
}

bool LayoutPacker::intersects_placed(const PlacedArtboard& candidate) const {
    return std::any_of(placed_.begin(), placed_.end(),
        [&](const PlacedArtboard& p) { return overlaps(candidate, p); });
}

void LayoutPacker::start_new_row() {
    current_row_y_ = global_max_bottom_ + options_.gap;
    current_x_ = options_.start_x;
    current_row_max_height_ = 0;
}

Position LayoutPacker::next_position(double width, double height) {
    if (row_has_content() && exceeds_row_width(width))
        start_new_row();
    else if (row_has_content() && diverges_from_row(height))
        start_new_row();

    PlacedArtboard candidate{current_x_, current_row_y_, width, height};

    // Fallback only; the row-break triggers above normally keep candidates clear.
    int forced_breaks = 0;
    while (intersects_placed(candidate)) {
        if (++forced_breaks > layout::max_forced_row_breaks) {
            throw artboard_model::LayoutError("no clear row for " + std::to_string(width) + "x"
                + std::to_string(height) + " after " + std::to_string(layout::max_forced_row_breaks)
                + " row breaks");
        }
        start_new_row();
        candidate = PlacedArtboard{current_x_, current_row_y_, width, height};
    }

    return Position{candidate.x, candidate.y};
}

void LayoutPacker::register_placement(const PlacedArtboard& artboard) {
    placed_.push_back(artboard);
    current_x_ = artboard.x + artboard.width + options_.gap;
    current_row_max_height_ = std::max(current_row_max_height_, artboard.height);
    global_max_bottom_ = std::max(global_max_bottom_, artboard.y + artboard.height);
}

std::size_t LayoutPacker::overlap_count() const {
    return overlapping_pairs(placed_).size();
}

std::vector<std::pair<std::size_t, std::size_t>> overlapping_pairs(
    const std::vector<PlacedArtboard>& artboards)
{
    std::vector<std::pair<std::size_t, std::size_t>> pairs;
    for (std::size_t i = 0; i < artboards.size(); ++i) {
        for (std::size_t j = i + 1; j < artboards.size(); ++j) {
            if (overlaps(artboards[i], artboards[j])) pairs.emplace_back(i, j);
        }
    }
    return pairs;
}

} // namespace artboard_placement
