#pragma once

#include <artboard_host/memory_document.hpp>
#include <optional>
#include <unordered_set>

struct ImDrawList;

namespace artboard_render {

struct RenderOptions {
    bool show_content = true;   // outlines of the layers inside each artboard
    bool show_guides = true;
    bool show_labels = true;
};

// Draws every top-level artboard of the document in world coordinates mapped through
// offset/zoom. Artboards listed in highlighted get an accent border.
void render_document(ImDrawList* draw_list,
    const artboard_host::MemoryDocument& document,
    float offset_x, float offset_y, float zoom,
    const RenderOptions& options = {},
    const std::unordered_set<artboard_host::LayerId>& highlighted = {});

// Top-most artboard containing the world point.
std::optional<artboard_host::LayerId> artboard_at(const artboard_host::MemoryDocument& document,
    double world_x, double world_y);

} // namespace artboard_render
