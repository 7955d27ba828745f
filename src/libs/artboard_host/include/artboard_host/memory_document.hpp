#pragma once

#include <artboard_host/host_document.hpp>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace artboard_host {

enum class HostOp {
    ListTopLevel,
    ListChildren,
    Duplicate,
    ActiveSelection,
    Resize,
    Rename,
    Align,
    Scale,
    Move,
    AddGuides,
    DrawRectangle,
    SuspendHistory,
    ResumeHistory
};

const char* to_string(HostOp op);

struct Guide {
    bool horizontal = false; // horizontal guides sit at a y coordinate
    double position = 0;
};

struct Layer {
    LayerId id = 0;
    std::string name;
    bool is_artboard = false;
    Bounds bounds;
    std::optional<LayerId> parent;
    std::vector<LayerId> children;   // front to back
    std::optional<Color> fill;       // set for rectangles drawn through draw_rectangle()
    std::vector<Guide> guides;       // artboards only
};

// Complete in-memory host. Coordinates are document pixels; moving or scaling an item
// carries its descendants along.
class MemoryDocument : public HostDocument {
public:
    explicit MemoryDocument(std::string name = "Untitled", double resolution = 300.0);

    // Building
    LayerId add_artboard(const std::string& name, const Bounds& bounds);
    LayerId add_layer(LayerId parent, const std::string& name, const Bounds& bounds);
    void set_fill(LayerId id, const Color& color);
    void add_guide(LayerId artboard, const Guide& guide);

    const std::string& name() const { return name_; }
    void set_name(const std::string& name) { name_ = name; }
    double resolution() const { return resolution_; }
    void set_resolution(double resolution) { resolution_ = resolution; }

    const std::vector<LayerId>& top_level() const { return top_level_; }
    const Layer* layer(LayerId id) const;
    std::optional<LayerId> find_top_level(const std::string& name) const;
    std::size_t layer_count() const { return layers_.size(); }

    // Photoshop reports the top child of a duplicated artboard as the active layer.
    void set_select_child_after_duplicate(bool enabled) { select_child_after_duplicate_ = enabled; }

    // Failure injection: the call_number-th next call of op (1-based) throws.
    void fail_on(HostOp op, std::size_t call_number = 1);
    void clear_failures() { failures_.clear(); }

    const std::vector<std::string>& journal() const { return journal_; }
    std::size_t call_count(HostOp op) const;

    int suspend_count() const { return suspend_count_; }
    int resume_count() const { return resume_count_; }
    bool history_suspended() const { return history_depth_ > 0; }
    const std::vector<std::string>& history_names() const { return history_names_; }

    // HostDocument
    std::vector<CanvasRef> list_top_level_canvases() const override;
    std::vector<CanvasRef> list_children(LayerId id) const override;
    std::optional<CanvasRef> find_layer(LayerId id) const override;

    void duplicate(LayerId id) override;
    std::vector<CanvasRef> active_selection() const override;

    void resize(LayerId id, const Bounds& bounds) override;
    void rename(LayerId id, const std::string& name) override;

    void select_and_align(const std::vector<LayerId>& ids, AlignAxis axis) override;
    void scale(const std::vector<LayerId>& ids, double percent) override;
    void move(const std::vector<LayerId>& ids, const Point& delta) override;

    void add_margin_guides(LayerId id, double margin_px) override;
    void draw_rectangle(LayerId id, const Bounds& bounds, const Color& color) override;

    void suspend_history(const std::string& name) override;
    void resume_history() override;

private:
    struct FailureRule {
        HostOp op;
        std::size_t remaining; // calls left until the failing one
    };

    // Counts the call, journals it and throws if a failure rule fires.
    void record(HostOp op, const std::string& detail) const;

    Layer& require(LayerId id, HostOp op);
    const Layer& require(LayerId id, HostOp op) const;
    CanvasRef ref_of(const Layer& layer) const;

    LayerId next_id() { return next_id_++; }
    LayerId copy_subtree(LayerId source, std::optional<LayerId> parent);
    void translate_subtree(LayerId id, double dx, double dy);
    void scale_subtree(LayerId id, const Point& origin, double factor);
    Bounds union_of(const std::vector<LayerId>& ids, HostOp op) const;

    std::string name_;
    double resolution_;
    std::map<LayerId, Layer> layers_;
    std::vector<LayerId> top_level_;
    std::vector<LayerId> selection_;
    LayerId next_id_ = 1;
    bool select_child_after_duplicate_ = false;

    mutable std::vector<FailureRule> failures_;
    mutable std::vector<std::string> journal_;
    mutable std::map<HostOp, std::size_t> calls_;

    int suspend_count_ = 0;
    int resume_count_ = 0;
    int history_depth_ = 0;
    std::vector<std::string> history_names_;
};

} // namespace artboard_host
