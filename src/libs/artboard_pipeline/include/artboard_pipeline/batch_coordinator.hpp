#pragma once

#include <artboard_host/host_document.hpp>
#include <artboard_model/types.hpp>
#include <artboard_pipeline/options.hpp>
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace artboard_pipeline {

// Called once per requested size, skips included. index is 1-based.
using ProgressCallback = std::function<void(std::size_t index, std::size_t total, const std::string& name)>;

// Sizes whose bleed-adjusted dimensions are within this many pixels of a source are
// considered the source's own size.
constexpr double source_match_tolerance = 1.0;

// Generates one artboard per size inside a single history step.
//
// Throws ConfigurationError before touching the host when a needed orientation has no source
// (or a size is invalid) unless options.skip_unconfigured is set. Source and host failures
// are recorded per size and the batch continues. LayoutError propagates.
artboard_model::BatchResult generate_batch(artboard_host::HostDocument& host,
    const std::vector<artboard_model::SizeSpec>& sizes,
    const artboard_model::SourceConfig& sources,
    const GenerationOptions& options = {},
    const ProgressCallback& on_progress = {});

// Top-left for the first generated artboard: right of every top-level artboard, level with
// the highest one.
artboard_placement::Position start_position(const std::vector<artboard_host::CanvasRef>& canvases,
    const GenerationOptions& options);

} // namespace artboard_pipeline
