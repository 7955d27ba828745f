#pragma once

#include <cstddef>

namespace artboard_placement {

// A canvas the packer has placed. Created once, never mutated, lives for one batch.
struct PlacedArtboard {
    double x = 0;
    double y = 0;
    double width = 0;
    double height = 0;

    double right() const { return x + width; }
    double bottom() const { return y + height; }
};

struct Position {
    double x = 0;
    double y = 0;
};

// Open-interval test: rectangles that only share an edge do not overlap.
inline bool overlaps(const PlacedArtboard& a, const PlacedArtboard& b) {
    return a.x < b.right() && b.x < a.right() && a.y < b.bottom() && b.y < a.bottom();
}

} // namespace artboard_placement
