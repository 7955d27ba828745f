#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace artboard_model {

enum class Unit { Inches, Millimeters, Pixels };

enum class Orientation { Landscape, Portrait, Square };

enum class ScaleMode { Cover, Contain, Relative };

enum class Anchor { Center, TopLeft, TopRight, BottomLeft, BottomRight };

struct Point {
    double x = 0;
    double y = 0;
};

struct Size {
    double width = 0;
    double height = 0;
};

struct Color {
    int r = 0;
    int g = 0;
    int b = 0;
};

// Axis-aligned; right = left + width, bottom = top + height.
struct Bounds {
    double left = 0;
    double top = 0;
    double right = 0;
    double bottom = 0;
    double width = 0;
    double height = 0;

    static Bounds from_xywh(double x, double y, double w, double h) {
        return Bounds{x, y, x + w, y + h, w, h};
    }
    static Bounds from_edges(double l, double t, double r, double b) {
        return Bounds{l, t, r, b, r - l, b - t};
    }

    Point center() const { return Point{left + width * 0.5, top + height * 0.5}; }
    Size size() const { return Size{width, height}; }
};

struct SizeSpec {
    double width = 0;
    double height = 0;
    std::string name;
    std::string type = "other";
    bool requires_bleed = false;
    double bleed = 0.125;
    Unit bleed_unit = Unit::Inches;
};

struct SourceEntry {
    // Name of a pre-existing top-level canvas; empty = unconfigured.
    std::string artboard_ref;
    // role id -> layer name inside the source canvas
    std::unordered_map<std::string, std::string> layer_role_assignments;

    bool configured() const { return !artboard_ref.empty(); }
};

struct SourceConfig {
    SourceEntry landscape;
    SourceEntry portrait;
    SourceEntry square;

    const SourceEntry& entry(Orientation o) const {
        switch (o) {
        case Orientation::Landscape: return landscape;
        case Orientation::Portrait: return portrait;
        case Orientation::Square: return square;
        }
        return square;
    }
    SourceEntry& entry(Orientation o) {
        return const_cast<SourceEntry&>(static_cast<const SourceConfig&>(*this).entry(o));
    }
};

constexpr Orientation all_orientations[] = {
    Orientation::Landscape, Orientation::Portrait, Orientation::Square };

struct PrintSettings {
    double bleed = 0.125;
    Unit unit = Unit::Inches;
    double crop_mark_length = 0.25;
    double crop_mark_weight = 1.0; // pixels
    double crop_mark_offset = 0.0625;
    Color crop_mark_color{0, 0, 0};
};

struct GenerationResult {
    std::string name;
    double width = 0;           // including bleed
    double height = 0;
    double original_width = 0;  // as requested
    double original_height = 0;
    double bleed_px = 0;
    bool requires_bleed = false;
    Point position;             // top-left of the created canvas
};

// A skipped or failed size. phase is empty for skips and configuration rejections.
struct BatchEntry {
    std::size_t index = 0;
    std::string name;
    std::string phase;
    std::string reason;
};

struct BatchResult {
    std::vector<GenerationResult> created;
    std::vector<BatchEntry> skipped;
    std::vector<BatchEntry> failed;
};

inline const char* to_string(Orientation o) {
    switch (o) {
    case Orientation::Landscape: return "landscape";
    case Orientation::Portrait: return "portrait";
    case Orientation::Square: return "square";
    }
    return "square";
}

inline const char* to_string(Unit u) {
    switch (u) {
    case Unit::Inches: return "inches";
    case Unit::Millimeters: return "millimeters";
    case Unit::Pixels: return "pixels";
    }
    return "pixels";
}

inline const char* to_string(ScaleMode m) {
    switch (m) {
    case ScaleMode::Cover: return "cover";
    case ScaleMode::Contain: return "contain";
    case ScaleMode::Relative: return "relative";
    }
    return "cover";
}

inline std::optional<Unit> unit_from_string(const std::string& s) {
    if (s == "inches" || s == "in") return Unit::Inches;
    if (s == "millimeters" || s == "mm") return Unit::Millimeters;
    if (s == "pixels" || s == "px") return Unit::Pixels;
    return std::nullopt;
}

inline std::optional<Orientation> orientation_from_string(const std::string& s) {
    if (s == "landscape") return Orientation::Landscape;
    if (s == "portrait") return Orientation::Portrait;
    if (s == "square") return Orientation::Square;
    return std::nullopt;
}

} // namespace artboard_model
