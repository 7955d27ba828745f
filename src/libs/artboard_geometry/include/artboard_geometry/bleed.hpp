#pragma once

#include <artboard_geometry/scale.hpp>
#include <artboard_model/types.hpp>
#include <array>

namespace artboard_geometry {

using artboard_model::Color;

struct BleedSize {
    double width = 0;
    double height = 0;
    double bleed_px = 0;
};

// Bleed is applied symmetrically on all four sides.
BleedSize size_with_bleed(const artboard_model::SizeSpec& spec, double resolution = default_resolution);

// Boundary where the visible content is trimmed.
Bounds trim_bounds(const Bounds& artboard, double bleed_px);

// All values in pixels.
struct CropMarkSettings {
    double length = 75.0;
    double weight = 1.0;
    double offset = 18.75;
    Color color{0, 0, 0};
};

CropMarkSettings crop_mark_settings(const artboard_model::PrintSettings& print,
    double resolution = default_resolution);

enum class Corner { TopLeft, TopRight, BottomLeft, BottomRight };

struct CropMark {
    Corner corner = Corner::TopLeft;
    bool horizontal = true;
    Point start; // end nearest the trim corner, offset away from it
    Point end;
    double weight = 1.0;
    Color color;

    // Rectangle that strokes the segment with its weight, centred on the segment line.
    Bounds rect() const;
};

// Eight marks: for each corner one horizontal and one vertical segment, in the order
// top-left, top-right, bottom-left, bottom-right (horizontal first).
std::array<CropMark, 8> crop_mark_geometry(const Bounds& trim, const CropMarkSettings& settings);

} // namespace artboard_geometry
