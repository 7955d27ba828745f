#include <artboard_geometry/scale.hpp>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace artboard_geometry {

double units_to_pixels(double value, Unit unit, double resolution) {
    switch (unit) {
    case Unit::Inches:
        return value * resolution;
    case Unit::Millimeters:
        return (value / millimeters_per_inch) * resolution;
    case Unit::Pixels:
        return value;
    }
    return value;
}

double scale_factor(const Size& source, const Size& target, ScaleMode mode) {
    if (source.width <= 0 || source.height <= 0)
        throw std::invalid_argument("scale_factor: source size must be positive");

    const double width_scale = target.width / source.width;
    const double height_scale = target.height / source.height;
    switch (mode) {
    case ScaleMode::Cover:
        return std::max(width_scale, height_scale);
    case ScaleMode::Contain:
        return std::min(width_scale, height_scale);
    case ScaleMode::Relative:
        return std::hypot(target.width, target.height) / std::hypot(source.width, source.height);
    }
    return 1.0;
}

RelativePosition relative_position(const Bounds& layer, const Bounds& artboard, Anchor anchor) {
    RelativePosition rel;
    if (artboard.width <= 0 || artboard.height <= 0) return rel;

    const bool from_right = anchor == Anchor::TopRight || anchor == Anchor::BottomRight;
    const bool from_bottom = anchor == Anchor::BottomLeft || anchor == Anchor::BottomRight;
    const double dx = from_right ? artboard.right - layer.right : layer.left - artboard.left;
    const double dy = from_bottom ? artboard.bottom - layer.bottom : layer.top - artboard.top;
    rel.x_percent = dx / artboard.width;
    rel.y_percent = dy / artboard.height;
    return rel;
}

Point anchor_position(Anchor anchor, const Size& layer_size, const Size& target_size,
    const std::optional<RelativePosition>& relative)
{
    const double inset_x = relative ? relative->x_percent * target_size.width : 0.0;
    const double inset_y = relative ? relative->y_percent * target_size.height : 0.0;

    switch (anchor) {
    case Anchor::Center:
        return Point{(target_size.width - layer_size.width) / 2,
            (target_size.height - layer_size.height) / 2};
    case Anchor::TopLeft:
        return Point{inset_x, inset_y};
    case Anchor::TopRight:
        return Point{target_size.width - layer_size.width - inset_x, inset_y};
    case Anchor::BottomLeft:
        return Point{inset_x, target_size.height - layer_size.height - inset_y};
    case Anchor::BottomRight:
        return Point{target_size.width - layer_size.width - inset_x,
            target_size.height - layer_size.height - inset_y};
    }
    return Point{};
}

Point proportional_offset(const Bounds& layer, const Bounds& source_artboard,
    const Bounds& target_artboard, double factor)
{
    const Point layer_center = layer.center();
    const Point source_center = source_artboard.center();
    const Point target_center = target_artboard.center();

    const double target_layer_x = target_center.x + (layer_center.x - source_center.x) * factor;
    const double target_layer_y = target_center.y + (layer_center.y - source_center.y) * factor;
    return Point{target_layer_x - layer_center.x, target_layer_y - layer_center.y};
}

} // namespace artboard_geometry
