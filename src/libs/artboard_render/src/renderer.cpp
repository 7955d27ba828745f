#include <artboard_render/renderer.hpp>
#include "imgui.h"
#include <algorithm>
#include <cmath>
#include <string>

namespace artboard_render {

namespace {

using artboard_host::Layer;
using artboard_host::MemoryDocument;

ImVec2 world_to_screen(double wx, double wy, float offset_x, float offset_y, float zoom) {
    return ImVec2((float)wx * zoom + offset_x, (float)wy * zoom + offset_y);
}

void draw_content(ImDrawList* dl, const MemoryDocument& doc, const Layer& layer,
    float offset_x, float offset_y, float zoom, int depth)
{
    const unsigned int outline = IM_COL32(140, 170, 210, 110);
    for (auto child_id : layer.children) {
        const Layer* child = doc.layer(child_id);
        if (!child) continue;
        const ImVec2 min_pt = world_to_screen(child->bounds.left, child->bounds.top, offset_x, offset_y, zoom);
        const ImVec2 max_pt = world_to_screen(child->bounds.right, child->bounds.bottom, offset_x, offset_y, zoom);
        if (child->fill) {
            // Crop marks are thinner than a screen pixel when zoomed out.
            ImVec2 a = min_pt;
            ImVec2 b = max_pt;
            if (b.x - a.x < 1.0f) b.x = a.x + 1.0f;
            if (b.y - a.y < 1.0f) b.y = a.y + 1.0f;
            dl->AddRectFilled(a, b, IM_COL32(child->fill->r, child->fill->g, child->fill->b, 255));
        } else {
            dl->AddRect(min_pt, max_pt, outline, 0.0f, 0, 1.0f);
        }
        if (depth < 4) draw_content(dl, doc, *child, offset_x, offset_y, zoom, depth + 1);
    }
}

} // namespace

void render_document(ImDrawList* draw_list,
    const MemoryDocument& document,
    float offset_x, float offset_y, float zoom,
    const RenderOptions& options,
    const std::unordered_set<artboard_host::LayerId>& highlighted)
{
    if (!draw_list) return;

    const unsigned int artboard_fill = IM_COL32(235, 235, 235, 255);
    const unsigned int artboard_border = IM_COL32(100, 100, 105, 255);
    const unsigned int accent_border = IM_COL32(255, 170, 40, 255);
    const unsigned int guide_color = IM_COL32(0, 200, 220, 200);
    const unsigned int text_color = IM_COL32(220, 220, 220, 255);
    const float line_thickness = 2.0f;

    for (auto id : document.top_level()) {
        const Layer* ab = document.layer(id);
        if (!ab || !ab->is_artboard) continue;

        const ImVec2 min_pt = world_to_screen(ab->bounds.left, ab->bounds.top, offset_x, offset_y, zoom);
        const ImVec2 max_pt = world_to_screen(ab->bounds.right, ab->bounds.bottom, offset_x, offset_y, zoom);
        draw_list->AddRectFilled(min_pt, max_pt, artboard_fill);

        if (options.show_content)
            draw_content(draw_list, document, *ab, offset_x, offset_y, zoom, 0);

        if (options.show_guides) {
            for (const auto& g : ab->guides) {
                if (g.horizontal) {
                    const float y = (float)g.position * zoom + offset_y;
                    draw_list->AddLine(ImVec2(min_pt.x, y), ImVec2(max_pt.x, y), guide_color, 1.0f);
                } else {
                    const float x = (float)g.position * zoom + offset_x;
                    draw_list->AddLine(ImVec2(x, min_pt.y), ImVec2(x, max_pt.y), guide_color, 1.0f);
                }
            }
        }

        const bool accent = highlighted.count(id) > 0;
        draw_list->AddRect(min_pt, max_pt, accent ? accent_border : artboard_border, 0.0f, 0, line_thickness);

        if (options.show_labels) {
            const std::string label = ab->name + "  " + std::to_string((long long)std::llround(ab->bounds.width))
                + "x" + std::to_string((long long)std::llround(ab->bounds.height));
            const ImVec2 text_size = ImGui::CalcTextSize(label.c_str());
            draw_list->AddText(ImVec2(min_pt.x, min_pt.y - text_size.y - 4.0f), text_color, label.c_str());
        }
    }
}

std::optional<artboard_host::LayerId> artboard_at(const MemoryDocument& document, double world_x, double world_y) {
    const auto& ids = document.top_level();
    for (auto it = ids.rbegin(); it != ids.rend(); ++it) {
        const Layer* ab = document.layer(*it);
        if (!ab || !ab->is_artboard) continue;
        if (world_x >= ab->bounds.left && world_x <= ab->bounds.right &&
            world_y >= ab->bounds.top && world_y <= ab->bounds.bottom)
            return ab->id;
    }
    return std::nullopt;
}

} // namespace artboard_render
