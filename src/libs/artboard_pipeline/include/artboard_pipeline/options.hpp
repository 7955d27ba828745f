#pragma once

#include <artboard_geometry/scale.hpp>
#include <artboard_model/types.hpp>
#include <artboard_placement/grouped_layout.hpp>
#include <artboard_placement/layout_constants.hpp>
#include <artboard_placement/types.hpp>
#include <string>
#include <vector>

namespace artboard_pipeline {

enum class LayoutMode { Packed, Grouped };

inline const char* to_string(LayoutMode mode) {
    return mode == LayoutMode::Grouped ? "grouped" : "packed";
}

// Caller-supplied batch options. Passed by value into every run; the engine keeps no
// module-level configuration.
struct GenerationOptions {
    double gap = artboard_placement::layout::gap;
    double max_row_width = artboard_placement::layout::max_row_width;
    std::vector<std::string> layer_names = {"Overlay", "TEXT", "BKG"};
    double resolution = artboard_geometry::default_resolution;
    artboard_model::PrintSettings print;

    LayoutMode layout_mode = LayoutMode::Packed;
    artboard_placement::GridOptions grid;
    // Used when the document has no top-level artboards.
    artboard_placement::Position default_start{
        artboard_placement::layout::default_start_x, artboard_placement::layout::default_start_y};

    // Per-layer scale/anchor correction after the uniform cover scale.
    bool apply_layer_roles = false;
    // Record sizes without a configured source (or with invalid dimensions) instead of
    // rejecting the batch.
    bool skip_unconfigured = false;

    std::string history_name = "Generate Artboards";
};

} // namespace artboard_pipeline
