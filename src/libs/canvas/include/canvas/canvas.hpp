#pragma once

#include <artboard_host/memory_document.hpp>
#include <artboard_render/renderer.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <set>
#include <unordered_set>
#include <utility>

struct ImVec2;

namespace canvas {

class ArtboardCanvas {
public:
    ArtboardCanvas();
    ~ArtboardCanvas();

    void set_document(const artboard_host::MemoryDocument* document);
    const artboard_host::MemoryDocument* document() const;

    // Artboards drawn with an accent border (the ones a batch created).
    void set_highlighted(std::unordered_set<artboard_host::LayerId> ids) { highlighted_ = std::move(ids); }

    artboard_render::RenderOptions& render_options() { return render_options_; }

    void set_grid_step(float step) { grid_step_ = step; }
    float grid_step() const { return grid_step_; }

    void pan(float dx, float dy);
    void zoom_at(float screen_x, float screen_y, float zoom_delta);
    void zoom_at_center(float zoom_delta);

    // Zooms and pans so every artboard fits the region with a margin.
    void fit_to_document(float region_width, float region_height);

    void screen_to_world(float screen_x, float screen_y, double& world_x, double& world_y) const;
    void world_to_screen(double world_x, double world_y, float& screen_x, float& screen_y) const;

    void set_offset(float ox, float oy) { offset_x_ = ox; offset_y_ = oy; }
    void set_zoom(float z) { zoom_ = z; }
    float offset_x() const { return offset_x_; }
    float offset_y() const { return offset_y_; }
    float zoom() const { return zoom_; }

    // Pairs of top-level artboards overlapping in the last drawn frame.
    std::size_t current_overlap_count() const { return active_overlap_pairs_.size(); }
    const std::optional<artboard_host::LayerId>& hovered() const { return hovered_; }

    bool update_and_draw(float region_width, float region_height);

private:
    const artboard_host::MemoryDocument* document_ = nullptr;
    std::unordered_set<artboard_host::LayerId> highlighted_;
    artboard_render::RenderOptions render_options_;
    std::optional<artboard_host::LayerId> hovered_;
    float offset_x_ = 0;
    float offset_y_ = 0;
    float zoom_ = 0.05f;
    float grid_step_ = 500.0f;
    bool dragging_ = false;
    float drag_start_x_ = 0;
    float drag_start_y_ = 0;
    float drag_start_offset_x_ = 0;
    float drag_start_offset_y_ = 0;
    std::set<std::pair<artboard_host::LayerId, artboard_host::LayerId>> active_overlap_pairs_;

    void draw_grid(ImVec2 region_min, ImVec2 region_max);
    void handle_input(float region_width, float region_height);
    void log_visual_overlaps();
};

} // namespace canvas
