#pragma once

#include <artboard_model/types.hpp>
#include <cstddef>
#include <string>
#include <vector>

namespace artboard_geometry {

using artboard_model::Orientation;

// Shared by every component that classifies a size. A size must land in exactly one bucket.
constexpr double portrait_max_ratio = 0.85;
constexpr double square_max_ratio = 1.15;

Orientation resolve_source_type(double aspect_ratio);

// Classified on the requested width/height, never on the bleed-adjusted size.
Orientation resolve_source_type(const artboard_model::SizeSpec& size);

bool can_generate(const artboard_model::SizeSpec& size, const artboard_model::SourceConfig& sources);

struct MissingSource {
    Orientation orientation = Orientation::Square;
    std::size_t size_count = 0;
    std::vector<std::string> examples; // up to three size names
};

std::vector<MissingSource> missing_orientations(const std::vector<artboard_model::SizeSpec>& sizes,
    const artboard_model::SourceConfig& sources);

// "missing portrait source needed for 2 sizes (e.g. Story, Pin)"
std::string describe(const MissingSource& missing);

} // namespace artboard_geometry
