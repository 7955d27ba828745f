#pragma once

#include <artboard_model/types.hpp>
#include <optional>

namespace artboard_geometry {

using artboard_model::Anchor;
using artboard_model::Bounds;
using artboard_model::Point;
using artboard_model::ScaleMode;
using artboard_model::Size;
using artboard_model::Unit;

constexpr double default_resolution = 300.0;
constexpr double millimeters_per_inch = 25.4;

// No rounding; callers round only where a host command needs whole pixels.
double units_to_pixels(double value, Unit unit, double resolution = default_resolution);

// Multiplicative factor (1.0 = unchanged). Throws std::invalid_argument when the source
// has a non-positive dimension.
double scale_factor(const Size& source, const Size& target, ScaleMode mode);

inline double scale_percent(const Size& source, const Size& target, ScaleMode mode) {
    return scale_factor(source, target, mode) * 100.0;
}

// Offset of a layer from an artboard edge as a fraction of the artboard dimension.
struct RelativePosition {
    double x_percent = 0;
    double y_percent = 0;
};

// Captured on the source artboard. For right/bottom anchors the fraction is measured from
// the right/bottom edge so the element keeps its distance from its own corner.
RelativePosition relative_position(const Bounds& layer, const Bounds& artboard,
    Anchor anchor = Anchor::TopLeft);

// Top-left of a layer of layer_size inside a target of target_size, in target-local space.
Point anchor_position(Anchor anchor, const Size& layer_size, const Size& target_size,
    const std::optional<RelativePosition>& relative = std::nullopt);

// Translation that puts the layer centre, after scaling by factor about its own centre, at
// the same proportional offset from the target centre as it had from the source centre.
Point proportional_offset(const Bounds& layer, const Bounds& source_artboard,
    const Bounds& target_artboard, double factor);

} // namespace artboard_geometry
