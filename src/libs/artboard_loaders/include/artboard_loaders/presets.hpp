#pragma once

#include <artboard_host/memory_document.hpp>
#include <artboard_model/types.hpp>
#include <vector>

namespace artboard_loaders {

// Built-in size list: social, video and one print size with bleed.
std::vector<artboard_model::SizeSpec> default_size_presets();

// Document with one landscape, one portrait and one square source artboard, each holding
// a background, an overlay, a text block and a corner logo.
artboard_host::MemoryDocument generate_demo_document();

// Sources of generate_demo_document(), with explicit layer roles.
artboard_model::SourceConfig demo_source_config();

} // namespace artboard_loaders
