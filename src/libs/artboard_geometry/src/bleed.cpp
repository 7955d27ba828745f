#include <artboard_geometry/bleed.hpp>
#include <algorithm>

namespace artboard_geometry {

BleedSize size_with_bleed(const artboard_model::SizeSpec& spec, double resolution) {
    BleedSize out{spec.width, spec.height, 0.0};
    if (!spec.requires_bleed || spec.bleed <= 0) return out;

    out.bleed_px = units_to_pixels(spec.bleed, spec.bleed_unit, resolution);
    out.width += 2 * out.bleed_px;
    out.height += 2 * out.bleed_px;
    return out;
}

Bounds trim_bounds(const Bounds& artboard, double bleed_px) {
    return Bounds::from_edges(artboard.left + bleed_px, artboard.top + bleed_px,
        artboard.right - bleed_px, artboard.bottom - bleed_px);
}

CropMarkSettings crop_mark_settings(const artboard_model::PrintSettings& print, double resolution) {
    CropMarkSettings s;
    s.length = units_to_pixels(print.crop_mark_length, print.unit, resolution);
    s.offset = units_to_pixels(print.crop_mark_offset, print.unit, resolution);
    s.weight = print.crop_mark_weight;
    s.color = print.crop_mark_color;
    return s;
}

Bounds CropMark::rect() const {
    const double half = weight * 0.5;
    if (horizontal) {
        const double l = std::min(start.x, end.x);
        const double r = std::max(start.x, end.x);
        return Bounds::from_edges(l, start.y - half, r, start.y + half);
    }
    const double t = std::min(start.y, end.y);
    const double b = std::max(start.y, end.y);
    return Bounds::from_edges(start.x - half, t, start.x + half, b);
}

std::array<CropMark, 8> crop_mark_geometry(const Bounds& trim, const CropMarkSettings& settings) {
    const double off = settings.offset;
    const double len = settings.length;
    const double l = trim.left;
    const double t = trim.top;
    const double r = trim.right;
    const double b = trim.bottom;

    auto mark = [&](Corner corner, bool horizontal, Point start, Point end) {
        CropMark m;
        m.corner = corner;
        m.horizontal = horizontal;
        m.start = start;
        m.end = end;
        m.weight = settings.weight;
        m.color = settings.color;
        return m;
    };

    return {
        mark(Corner::TopLeft, true, {l - off, t}, {l - off - len, t}),
        mark(Corner::TopLeft, false, {l, t - off}, {l, t - off - len}),
        mark(Corner::TopRight, true, {r + off, t}, {r + off + len, t}),
        mark(Corner::TopRight, false, {r, t - off}, {r, t - off - len}),
        mark(Corner::BottomLeft, true, {l - off, b}, {l - off - len, b}),
        mark(Corner::BottomLeft, false, {l, b + off}, {l, b + off + len}),
        mark(Corner::BottomRight, true, {r + off, b}, {r + off + len, b}),
        mark(Corner::BottomRight, false, {r, b + off}, {r, b + off + len}),
    };
}

} // namespace artboard_geometry
