#pragma once

#include <artboard_model/types.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace artboard_host {

using artboard_model::Bounds;
using artboard_model::Color;
using artboard_model::Point;

using LayerId = std::int64_t;

// Snapshot of one host item. Ids stay valid for the lifetime of the document.
struct CanvasRef {
    LayerId id = 0;
    std::string name;
    bool is_artboard = false;
    Bounds bounds;
    std::optional<LayerId> parent_id; // empty for top-level items
};

// Horizontal centres along x, Vertical centres along y.
enum class AlignAxis { Horizontal, Vertical };

inline const char* to_string(AlignAxis axis) {
    return axis == AlignAxis::Horizontal ? "horizontal" : "vertical";
}

// Interface of the host design application. Every call blocks until the host has applied
// the effect and throws artboard_model::HostOperationError when the host rejects it.
class HostDocument {
public:
    virtual ~HostDocument() = default;

    virtual std::vector<CanvasRef> list_top_level_canvases() const = 0;
    virtual std::vector<CanvasRef> list_children(LayerId id) const = 0;
    virtual std::optional<CanvasRef> find_layer(LayerId id) const = 0;

    // The new item is reported through active_selection(), not returned. Hosts may report
    // a descendant of the duplicate rather than the duplicate itself.
    virtual void duplicate(LayerId id) = 0;
    virtual std::vector<CanvasRef> active_selection() const = 0;

    virtual void resize(LayerId id, const Bounds& bounds) = 0;
    virtual void rename(LayerId id, const std::string& name) = 0;

    // Aligns the union of the items to the centre of their enclosing canvas.
    virtual void select_and_align(const std::vector<LayerId>& ids, AlignAxis axis) = 0;
    // Uniform scale about the centre of the items' union. 100 = unchanged.
    virtual void scale(const std::vector<LayerId>& ids, double percent) = 0;
    virtual void move(const std::vector<LayerId>& ids, const Point& delta) = 0;

    virtual void add_margin_guides(LayerId id, double margin_px) = 0;
    virtual void draw_rectangle(LayerId id, const Bounds& bounds, const Color& color) = 0;

    virtual void suspend_history(const std::string& name) = 0;
    virtual void resume_history() = 0;
};

} // namespace artboard_host
