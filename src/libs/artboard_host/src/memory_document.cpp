#include <artboard_host/memory_document.hpp>
#include <artboard_model/errors.hpp>
#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

namespace artboard_host {

using artboard_model::HostOperationError;

const char* to_string(HostOp op) {
    switch (op) {
    case HostOp::ListTopLevel: return "list_top_level";
    case HostOp::ListChildren: return "list_children";
    case HostOp::Duplicate: return "duplicate";
    case HostOp::ActiveSelection: return "active_selection";
    case HostOp::Resize: return "resize";
    case HostOp::Rename: return "rename";
    case HostOp::Align: return "align";
    case HostOp::Scale: return "scale";
    case HostOp::Move: return "move";
    case HostOp::AddGuides: return "add_guides";
    case HostOp::DrawRectangle: return "draw_rectangle";
    case HostOp::SuspendHistory: return "suspend_history";
    case HostOp::ResumeHistory: return "resume_history";
    }
    return "unknown";
}

MemoryDocument::MemoryDocument(std::string name, double resolution)
    : name_(std::move(name))
    , resolution_(resolution)
{
}

LayerId MemoryDocument::add_artboard(const std::string& name, const Bounds& bounds) {
    Layer l;
    l.id = next_id();
    l.name = name;
    l.is_artboard = true;
    l.bounds = bounds;
    top_level_.push_back(l.id);
    const LayerId id = l.id;
    layers_.emplace(id, std::move(l));
    return id;
}

LayerId MemoryDocument::add_layer(LayerId parent, const std::string& name, const Bounds& bounds) {
    Layer& p = require(parent, HostOp::ListChildren);
    Layer l;
    l.id = next_id();
    l.name = name;
    l.bounds = bounds;
    l.parent = parent;
    p.children.push_back(l.id);
    const LayerId id = l.id;
    layers_.emplace(id, std::move(l));
    return id;
}

void MemoryDocument::set_fill(LayerId id, const Color& color) {
    layers_.at(id).fill = color;
}

void MemoryDocument::add_guide(LayerId artboard, const Guide& guide) {
    layers_.at(artboard).guides.push_back(guide);
}

const Layer* MemoryDocument::layer(LayerId id) const {
    auto it = layers_.find(id);
    return it == layers_.end() ? nullptr : &it->second;
}

std::optional<LayerId> MemoryDocument::find_top_level(const std::string& name) const {
    for (LayerId id : top_level_) {
        if (layers_.at(id).name == name) return id;
    }
    return std::nullopt;
}

void MemoryDocument::fail_on(HostOp op, std::size_t call_number) {
    failures_.push_back(FailureRule{op, std::max<std::size_t>(call_number, 1)});
}

std::size_t MemoryDocument::call_count(HostOp op) const {
    auto it = calls_.find(op);
    return it == calls_.end() ? 0 : it->second;
}

void MemoryDocument::record(HostOp op, const std::string& detail) const {
    ++calls_[op];
    journal_.push_back(detail.empty() ? std::string(to_string(op))
                                      : std::string(to_string(op)) + " " + detail);

    for (auto it = failures_.begin(); it != failures_.end(); ++it) {
        if (it->op != op) continue;
        if (--it->remaining == 0) {
            failures_.erase(it);
            throw HostOperationError(to_string(op), "host rejected the command");
        }
    }
}

Layer& MemoryDocument::require(LayerId id, HostOp op) {
    auto it = layers_.find(id);
    if (it == layers_.end())
        throw HostOperationError(to_string(op), "no layer with id " + std::to_string(id));
    return it->second;
}

const Layer& MemoryDocument::require(LayerId id, HostOp op) const {
    auto it = layers_.find(id);
    if (it == layers_.end())
        throw HostOperationError(to_string(op), "no layer with id " + std::to_string(id));
    return it->second;
}

CanvasRef MemoryDocument::ref_of(const Layer& layer) const {
    return CanvasRef{layer.id, layer.name, layer.is_artboard, layer.bounds, layer.parent};
}

std::vector<CanvasRef> MemoryDocument::list_top_level_canvases() const {
    record(HostOp::ListTopLevel, "");
    std::vector<CanvasRef> out;
    out.reserve(top_level_.size());
    for (LayerId id : top_level_) out.push_back(ref_of(layers_.at(id)));
    return out;
}

std::vector<CanvasRef> MemoryDocument::list_children(LayerId id) const {
    record(HostOp::ListChildren, std::to_string(id));
    const Layer& l = require(id, HostOp::ListChildren);
    std::vector<CanvasRef> out;
    out.reserve(l.children.size());
    for (LayerId child : l.children) out.push_back(ref_of(layers_.at(child)));
    return out;
}

std::optional<CanvasRef> MemoryDocument::find_layer(LayerId id) const {
    const Layer* l = layer(id);
    if (!l) return std::nullopt;
    return ref_of(*l);
}

LayerId MemoryDocument::copy_subtree(LayerId source, std::optional<LayerId> parent) {
    const Layer original = layers_.at(source);
    Layer copy;
    copy.id = next_id();
    copy.name = original.name + " copy";
    copy.is_artboard = original.is_artboard;
    copy.bounds = original.bounds;
    copy.parent = parent;
    copy.fill = original.fill;
    copy.guides = original.guides;
    const LayerId id = copy.id;
    layers_.emplace(id, std::move(copy));

    for (LayerId child : original.children) {
        const LayerId child_copy = copy_subtree(child, id);
        layers_.at(id).children.push_back(child_copy);
    }
    return id;
}

void MemoryDocument::duplicate(LayerId id) {
    record(HostOp::Duplicate, std::to_string(id));
    const Layer& source = require(id, HostOp::Duplicate);
    const std::optional<LayerId> parent = source.parent;

    const LayerId copy = copy_subtree(id, parent);

    std::vector<LayerId>& siblings = parent ? layers_.at(*parent).children : top_level_;
    auto pos = std::find(siblings.begin(), siblings.end(), id);
    siblings.insert(pos == siblings.end() ? pos : pos + 1, copy);

    const Layer& c = layers_.at(copy);
    if (select_child_after_duplicate_ && !c.children.empty())
        selection_ = {c.children.front()};
    else
        selection_ = {copy};
}

std::vector<CanvasRef> MemoryDocument::active_selection() const {
    record(HostOp::ActiveSelection, "");
    std::vector<CanvasRef> out;
    for (LayerId id : selection_) {
        if (const Layer* l = layer(id)) out.push_back(ref_of(*l));
    }
    return out;
}

void MemoryDocument::translate_subtree(LayerId id, double dx, double dy) {
    Layer& l = layers_.at(id);
    l.bounds = Bounds::from_xywh(l.bounds.left + dx, l.bounds.top + dy, l.bounds.width, l.bounds.height);
    for (Guide& g : l.guides) g.position += g.horizontal ? dy : dx;
    for (LayerId child : l.children) translate_subtree(child, dx, dy);
}

void MemoryDocument::scale_subtree(LayerId id, const Point& origin, double factor) {
    Layer& l = layers_.at(id);
    l.bounds = Bounds::from_edges(
        origin.x + (l.bounds.left - origin.x) * factor,
        origin.y + (l.bounds.top - origin.y) * factor,
        origin.x + (l.bounds.right - origin.x) * factor,
        origin.y + (l.bounds.bottom - origin.y) * factor);
    for (LayerId child : l.children) scale_subtree(child, origin, factor);
}

void MemoryDocument::resize(LayerId id, const Bounds& bounds) {
    record(HostOp::Resize, std::to_string(id) + " " + std::to_string(bounds.width) + "x"
        + std::to_string(bounds.height) + " at " + std::to_string(bounds.left) + ","
        + std::to_string(bounds.top));
    Layer& l = require(id, HostOp::Resize);
    if (!(bounds.width > 0) || !(bounds.height > 0))
        throw HostOperationError(to_string(HostOp::Resize), "non-positive size");

    // Artboard content keeps its offset from the artboard's top-left corner.
    const double dx = bounds.left - l.bounds.left;
    const double dy = bounds.top - l.bounds.top;
    for (LayerId child : l.children) translate_subtree(child, dx, dy);
    l.bounds = Bounds::from_xywh(bounds.left, bounds.top, bounds.width, bounds.height);
}

void MemoryDocument::rename(LayerId id, const std::string& name) {
    record(HostOp::Rename, std::to_string(id) + " \"" + name + "\"");
    require(id, HostOp::Rename).name = name;
}

Bounds MemoryDocument::union_of(const std::vector<LayerId>& ids, HostOp op) const {
    if (ids.empty()) throw HostOperationError(to_string(op), "empty selection");
    double left = std::numeric_limits<double>::max();
    double top = std::numeric_limits<double>::max();
    double right = std::numeric_limits<double>::lowest();
    double bottom = std::numeric_limits<double>::lowest();
    for (LayerId id : ids) {
        const Bounds& b = require(id, op).bounds;
        left = std::min(left, b.left);
        top = std::min(top, b.top);
        right = std::max(right, b.right);
        bottom = std::max(bottom, b.bottom);
    }
    return Bounds::from_edges(left, top, right, bottom);
}

void MemoryDocument::select_and_align(const std::vector<LayerId>& ids, AlignAxis axis) {
    record(HostOp::Align, std::string(artboard_host::to_string(axis)) + " "
        + std::to_string(ids.size()) + " items");
    const Bounds items = union_of(ids, HostOp::Align);

    // Enclosing canvas of the first item.
    const Layer* canvas = &require(ids.front(), HostOp::Align);
    if (!canvas->parent)
        throw HostOperationError(to_string(HostOp::Align), "selection has no enclosing canvas");
    while (canvas->parent) canvas = &layers_.at(*canvas->parent);

    const Point target = canvas->bounds.center();
    const Point current = items.center();
    const double dx = axis == AlignAxis::Horizontal ? target.x - current.x : 0.0;
    const double dy = axis == AlignAxis::Vertical ? target.y - current.y : 0.0;
    for (LayerId id : ids) translate_subtree(id, dx, dy);
    selection_ = ids;
}

void MemoryDocument::scale(const std::vector<LayerId>& ids, double percent) {
    record(HostOp::Scale, std::to_string(percent) + "% " + std::to_string(ids.size()) + " items");
    if (!std::isfinite(percent) || percent <= 0)
        throw HostOperationError(to_string(HostOp::Scale), "invalid percentage");
    const Point origin = union_of(ids, HostOp::Scale).center();
    for (LayerId id : ids) scale_subtree(id, origin, percent / 100.0);
}

void MemoryDocument::move(const std::vector<LayerId>& ids, const Point& delta) {
    record(HostOp::Move, std::to_string(delta.x) + "," + std::to_string(delta.y) + " "
        + std::to_string(ids.size()) + " items");
    for (LayerId id : ids) require(id, HostOp::Move);
    for (LayerId id : ids) translate_subtree(id, delta.x, delta.y);
}

void MemoryDocument::add_margin_guides(LayerId id, double margin_px) {
    record(HostOp::AddGuides, std::to_string(id) + " " + std::to_string(margin_px));
    Layer& l = require(id, HostOp::AddGuides);
    if (!l.is_artboard)
        throw HostOperationError(to_string(HostOp::AddGuides), l.name + " is not an artboard");
    l.guides.push_back(Guide{false, l.bounds.left + margin_px});
    l.guides.push_back(Guide{false, l.bounds.right - margin_px});
    l.guides.push_back(Guide{true, l.bounds.top + margin_px});
    l.guides.push_back(Guide{true, l.bounds.bottom - margin_px});
}

void MemoryDocument::draw_rectangle(LayerId id, const Bounds& bounds, const Color& color) {
    record(HostOp::DrawRectangle, std::to_string(id));
    Layer& p = require(id, HostOp::DrawRectangle);
    Layer rect;
    rect.id = next_id();
    rect.name = "Crop Mark";
    rect.bounds = bounds;
    rect.parent = id;
    rect.fill = color;
    p.children.push_back(rect.id);
    const LayerId rect_id = rect.id;
    layers_.emplace(rect_id, std::move(rect));
}

void MemoryDocument::suspend_history(const std::string& name) {
    record(HostOp::SuspendHistory, "\"" + name + "\"");
    ++suspend_count_;
    ++history_depth_;
    history_names_.push_back(name);
}

void MemoryDocument::resume_history() {
    record(HostOp::ResumeHistory, "");
    if (history_depth_ == 0)
        throw HostOperationError(to_string(HostOp::ResumeHistory), "history is not suspended");
    ++resume_count_;
    --history_depth_;
}

} // namespace artboard_host
