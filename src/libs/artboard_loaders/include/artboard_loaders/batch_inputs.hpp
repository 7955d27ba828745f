#pragma once

#include <artboard_host/memory_document.hpp>
#include <artboard_loaders/json_loader.hpp>
#include <artboard_model/types.hpp>
#include <optional>
#include <string>
#include <vector>

namespace artboard_loaders {

struct BatchInputs {
    artboard_host::MemoryDocument document;
    std::vector<artboard_model::SizeSpec> sizes;
    GenerationConfig config;
};

struct BatchInputPaths {
    std::string document; // empty: built-in demo document with its sources
    std::string sizes;    // empty: built-in presets
    std::string config;   // empty: defaults (demo sources when the document is the demo)
};

// Loads what one batch run needs. Empty when any given file fails to load.
std::optional<BatchInputs> load_batch_inputs(const BatchInputPaths& paths);

} // namespace artboard_loaders
