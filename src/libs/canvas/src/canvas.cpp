#include <canvas/canvas.hpp>
#include <artboard_log/logger.hpp>
#include <artboard_placement/layout_packer.hpp>
#include <spdlog/spdlog.h>
#include "imgui.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <string>
#include <vector>

namespace {

constexpr float min_zoom = 0.005f;
constexpr float max_zoom = 4.0f;
constexpr float fit_margin = 40.0f;

float clamp_zoom(float z) {
    return std::clamp(z, min_zoom, max_zoom);
}

std::string pair_label(const artboard_host::Layer& a, const artboard_host::Layer& b) {
    return a.name + "#" + std::to_string(a.id) + "|" + b.name + "#" + std::to_string(b.id);
}

artboard_placement::PlacedArtboard to_placed(const artboard_model::Bounds& b) {
    return artboard_placement::PlacedArtboard{b.left, b.top, b.width, b.height};
}

} // namespace

namespace canvas {

ArtboardCanvas::ArtboardCanvas() = default;

ArtboardCanvas::~ArtboardCanvas() = default;

void ArtboardCanvas::set_document(const artboard_host::MemoryDocument* document) {
    document_ = document;
    active_overlap_pairs_.clear();
    hovered_.reset();
}

const artboard_host::MemoryDocument* ArtboardCanvas::document() const {
    return document_;
}

void ArtboardCanvas::pan(float dx, float dy) {
    offset_x_ += dx;
    offset_y_ += dy;
}

void ArtboardCanvas::zoom_at(float screen_x, float screen_y, float zoom_delta) {
    const float new_zoom = clamp_zoom(zoom_ * zoom_delta);
    const float factor = new_zoom / zoom_;
    offset_x_ = screen_x - (screen_x - offset_x_) * factor;
    offset_y_ = screen_y - (screen_y - offset_y_) * factor;
    zoom_ = new_zoom;
}

void ArtboardCanvas::zoom_at_center(float zoom_delta) {
    zoom_ = clamp_zoom(zoom_ * zoom_delta);
}

void ArtboardCanvas::fit_to_document(float region_width, float region_height) {
    if (!document_ || region_width <= 0 || region_height <= 0) return;

    double left = std::numeric_limits<double>::max();
    double top = std::numeric_limits<double>::max();
    double right = std::numeric_limits<double>::lowest();
    double bottom = std::numeric_limits<double>::lowest();
    bool any = false;
    for (auto id : document_->top_level()) {
        const auto* ab = document_->layer(id);
        if (!ab || !ab->is_artboard) continue;
        any = true;
        left = std::min(left, ab->bounds.left);
        top = std::min(top, ab->bounds.top);
        right = std::max(right, ab->bounds.right);
        bottom = std::max(bottom, ab->bounds.bottom);
    }
    if (!any || right <= left || bottom <= top) return;

    const float usable_w = std::max(1.0f, region_width - 2 * fit_margin);
    const float usable_h = std::max(1.0f, region_height - 2 * fit_margin);
    zoom_ = clamp_zoom(std::min(usable_w / (float)(right - left), usable_h / (float)(bottom - top)));

    const ImVec2 origin = ImGui::GetCursorScreenPos();
    offset_x_ = origin.x + fit_margin - (float)left * zoom_;
    offset_y_ = origin.y + fit_margin - (float)top * zoom_;
}

void ArtboardCanvas::screen_to_world(float screen_x, float screen_y, double& world_x, double& world_y) const {
    world_x = (screen_x - offset_x_) / zoom_;
    world_y = (screen_y - offset_y_) / zoom_;
}

void ArtboardCanvas::world_to_screen(double world_x, double world_y, float& screen_x, float& screen_y) const {
    screen_x = (float)world_x * zoom_ + offset_x_;
    screen_y = (float)world_y * zoom_ + offset_y_;
}

void ArtboardCanvas::draw_grid(ImVec2 region_min, ImVec2 region_max) {
    ImDrawList* dl = ImGui::GetWindowDrawList();
    if (!dl) return;

    const unsigned int grid_color = IM_COL32(60, 60, 65, 255);
    const float grid_thickness = 1.0f;

    double left_world, top_world, right_world, bottom_world;
    screen_to_world(region_min.x, region_min.y, left_world, top_world);
    screen_to_world(region_max.x, region_max.y, right_world, bottom_world);

    // Coarsen the grid until lines are at least 8 screen pixels apart.
    double step = grid_step_;
    while (step * zoom_ < 8.0) step *= 2;

    const double start_x = std::floor(left_world / step) * step;
    const double start_y = std::floor(top_world / step) * step;

    for (double wx = start_x; wx <= right_world + step; wx += step) {
        float sx1, sy1, sx2, sy2;
        world_to_screen(wx, top_world, sx1, sy1);
        world_to_screen(wx, bottom_world, sx2, sy2);
        dl->AddLine(ImVec2(sx1, sy1), ImVec2(sx2, sy2), grid_color, grid_thickness);
    }
    for (double wy = start_y; wy <= bottom_world + step; wy += step) {
        float sx1, sy1, sx2, sy2;
        world_to_screen(left_world, wy, sx1, sy1);
        world_to_screen(right_world, wy, sx2, sy2);
        dl->AddLine(ImVec2(sx1, sy1), ImVec2(sx2, sy2), grid_color, grid_thickness);
    }
}

void ArtboardCanvas::handle_input(float region_width, float region_height) {
    ImGuiIO& io = ImGui::GetIO();
    ImVec2 mouse = io.MousePos;
    ImVec2 win_min = ImGui::GetWindowPos();
    ImVec2 win_max = ImVec2(win_min.x + region_width, win_min.y + region_height);

    bool in_region = mouse.x >= win_min.x && mouse.x <= win_max.x &&
                     mouse.y >= win_min.y && mouse.y <= win_max.y;

    hovered_.reset();
    if (in_region && document_) {
        double wx = 0.0;
        double wy = 0.0;
        screen_to_world(mouse.x, mouse.y, wx, wy);
        hovered_ = artboard_render::artboard_at(*document_, wx, wy);
    }

    if (ImGui::IsMouseClicked(0) && in_region) {
        dragging_ = true;
        drag_start_x_ = mouse.x;
        drag_start_y_ = mouse.y;
        drag_start_offset_x_ = offset_x_;
        drag_start_offset_y_ = offset_y_;
    }
    if (ImGui::IsMouseReleased(0))
        dragging_ = false;

    if (dragging_) {
        offset_x_ = drag_start_offset_x_ + (mouse.x - drag_start_x_);
        offset_y_ = drag_start_offset_y_ + (mouse.y - drag_start_y_);
    }

    if (in_region && io.MouseWheel != 0.0f) {
        float factor = io.MouseWheel > 0 ? 1.2f : 1.0f / 1.2f;
        zoom_at(mouse.x, mouse.y, factor);
    }
}

bool ArtboardCanvas::update_and_draw(float region_width, float region_height) {
    if (region_width <= 0 || region_height <= 0) return false;

    handle_input(region_width, region_height);

    ImVec2 region_min = ImGui::GetCursorScreenPos();
    ImVec2 region_max = ImVec2(region_min.x + region_width, region_min.y + region_height);

    ImDrawList* draw_list = ImGui::GetWindowDrawList();
    if (!draw_list) return true;

    draw_grid(region_min, region_max);

    if (document_) {
        log_visual_overlaps();
        artboard_render::render_document(draw_list, *document_, offset_x_, offset_y_, zoom_,
            render_options_, highlighted_);
    }
    return true;
}

void ArtboardCanvas::log_visual_overlaps() {
    auto logger = artboard_log::logger();

    std::vector<const artboard_host::Layer*> artboards;
    std::vector<artboard_placement::PlacedArtboard> rects;
    for (auto id : document_->top_level()) {
        const auto* ab = document_->layer(id);
        if (!ab || !ab->is_artboard) continue;
        artboards.push_back(ab);
        rects.push_back(to_placed(ab->bounds));
    }

    std::set<std::pair<artboard_host::LayerId, artboard_host::LayerId>> current_pairs;
    for (const auto& [i, j] : artboard_placement::overlapping_pairs(rects)) {
        const auto& a = *artboards[i];
        const auto& b = *artboards[j];
        const std::pair<artboard_host::LayerId, artboard_host::LayerId> key = std::minmax(a.id, b.id);
        current_pairs.insert(key);
        if (active_overlap_pairs_.find(key) == active_overlap_pairs_.end()) {
            logger->warn(
                "overlap_detected pair={} a_rect=({}, {}, {}, {}) b_rect=({}, {}, {}, {})",
                pair_label(a, b), a.bounds.left, a.bounds.top, a.bounds.width, a.bounds.height,
                b.bounds.left, b.bounds.top, b.bounds.width, b.bounds.height);
        }
    }

    for (const auto& [a, b] : active_overlap_pairs_) {
        if (current_pairs.find({a, b}) == current_pairs.end())
            logger->info("overlap_resolved pair={}|{}", a, b);
    }
    active_overlap_pairs_ = std::move(current_pairs);
}

} // namespace canvas
