#include <artboard_pipeline/generation_pipeline.hpp>
#include <artboard_geometry/bleed.hpp>
#include <artboard_geometry/layer_roles.hpp>
#include <artboard_geometry/scale.hpp>
#include <artboard_log/logger.hpp>
#include <artboard_model/errors.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <regex>

namespace artboard_pipeline {

using artboard_host::AlignAxis;
using artboard_host::CanvasRef;
using artboard_host::LayerId;
using artboard_model::Bounds;
using artboard_model::HostOperationError;
using artboard_model::Point;

namespace {

// Moves below this are not worth a host round trip.
constexpr double min_move = 0.01;

std::vector<LayerId> ids_of(const std::vector<CanvasRef>& items) {
    std::vector<LayerId> ids;
    ids.reserve(items.size());
    for (const auto& item : items) ids.push_back(item.id);
    return ids;
}

void align_center(artboard_host::HostDocument& host, const std::vector<LayerId>& ids) {
    host.select_and_align(ids, AlignAxis::Horizontal);
    host.select_and_align(ids, AlignAxis::Vertical);
}

// Assigned role first, then the configured layer names.
std::optional<artboard_geometry::LayerRole> role_of(const std::string& layer_name,
    const artboard_model::SourceEntry& source, const std::vector<std::string>& layer_names)
{
    for (auto role : artboard_geometry::all_layer_roles) {
        auto it = source.layer_role_assignments.find(artboard_geometry::role_id(role));
        if (it != source.layer_role_assignments.end() && it->second == layer_name) return role;
    }
    for (const auto& configured : layer_names) {
        if (artboard_geometry::contains_ignore_case(layer_name, configured))
            return artboard_geometry::role_for_layer_name(configured);
    }
    return std::nullopt;
}

} // namespace

const char* to_string(GenerationPhase phase) {
    switch (phase) {
    case GenerationPhase::Idle: return "idle";
    case GenerationPhase::ResolveAndDuplicate: return "resolve_duplicate";
    case GenerationPhase::ResizeAndRename: return "resize_rename";
    case GenerationPhase::TransformContents: return "transform_contents";
    case GenerationPhase::BleedFinishing: return "bleed_finishing";
    case GenerationPhase::Done: return "done";
    }
    return "idle";
}

std::string strip_copy_suffix(const std::string& name) {
    static const std::regex numbered(R"( copy ?\d*$)", std::regex::ECMAScript | std::regex::icase);
    static const std::regex plain(R"( copy$)", std::regex::ECMAScript | std::regex::icase);
    return std::regex_replace(std::regex_replace(name, numbered, ""), plain, "");
}

GenerationPipeline::GenerationPipeline(artboard_host::HostDocument& host, const GenerationOptions& options)
    : host_(host)
    , options_(options)
{
}

artboard_model::GenerationResult GenerationPipeline::run(const artboard_model::SizeSpec& size,
    const artboard_model::SourceEntry& source, const artboard_placement::Position& position)
{
    occupied_.reset();
    source_children_.clear();

    resolve_and_duplicate(source);
    resize_and_rename(size, position);
    transform_contents(source);
    if (requires_bleed_ && bleed_px_ > 0)
        finish_bleed();
    phase_ = GenerationPhase::Done;

    artboard_model::GenerationResult result;
    result.name = size.name;
    result.width = target_.width;
    result.height = target_.height;
    result.original_width = size.width;
    result.original_height = size.height;
    result.bleed_px = bleed_px_;
    result.requires_bleed = size.requires_bleed;
    result.position = Point{target_.left, target_.top};
    return result;
}

void GenerationPipeline::resolve_and_duplicate(const artboard_model::SourceEntry& source) {
    phase_ = GenerationPhase::ResolveAndDuplicate;

    const auto canvases = host_.list_top_level_canvases();
    auto it = std::find_if(canvases.begin(), canvases.end(), [&](const CanvasRef& c) {
        return c.is_artboard && c.name == source.artboard_ref;
    });
    if (source.artboard_ref.empty() || it == canvases.end())
        throw artboard_model::SourceNotFoundError(source.artboard_ref);

    source_ = *it;
    if (source_.bounds.width <= 0 || source_.bounds.height <= 0)
        throw HostOperationError("list_top_level", "source \"" + source_.name + "\" has empty bounds");

    source_children_ = host_.list_children(source_.id);
    host_.duplicate(source_.id);
    duplicate_id_ = resolve_after_duplicate(source_.id);

    artboard_log::logger()->debug("duplicated \"{}\" ({} items) -> id {}",
        source_.name, source_children_.size(), duplicate_id_);
}

LayerId GenerationPipeline::resolve_after_duplicate(LayerId source_id) const {
    const auto selection = host_.active_selection();
    if (selection.empty())
        throw HostOperationError("duplicate", "nothing active after duplicating");

    CanvasRef current = selection.front();
    int depth = 0;
    while (current.parent_id) {
        if (++depth > max_parent_depth)
            throw HostOperationError("duplicate", "no top-level canvas within "
                + std::to_string(max_parent_depth) + " parents of the active item");
        auto parent = host_.find_layer(*current.parent_id);
        if (!parent)
            throw HostOperationError("duplicate", "parent " + std::to_string(*current.parent_id)
                + " of the active item does not exist");
        current = *parent;
    }

    if (current.id == source_id)
        throw HostOperationError("duplicate", "active canvas is still the source");
    return current.id;
}

void GenerationPipeline::resize_and_rename(const artboard_model::SizeSpec& size,
    const artboard_placement::Position& position)
{
    phase_ = GenerationPhase::ResizeAndRename;

    const artboard_geometry::BleedSize actual = artboard_geometry::size_with_bleed(size, options_.resolution);
    requires_bleed_ = size.requires_bleed;
    bleed_px_ = actual.bleed_px;

    const Bounds bounds = Bounds::from_xywh(position.x, position.y, actual.width, actual.height);
    host_.resize(duplicate_id_, bounds);
    occupied_ = artboard_placement::PlacedArtboard{bounds.left, bounds.top, bounds.width, bounds.height};
    host_.rename(duplicate_id_, size.name);

    auto resized = host_.find_layer(duplicate_id_);
    target_ = resized ? resized->bounds : bounds;

    artboard_log::logger()->debug("\"{}\" resized to {}x{} at ({}, {})",
        size.name, target_.width, target_.height, target_.left, target_.top);
}

void GenerationPipeline::transform_contents(const artboard_model::SourceEntry& source) {
    phase_ = GenerationPhase::TransformContents;

    // Ids can change after the resize; always re-read.
    const auto items = host_.list_children(duplicate_id_);
    if (items.empty()) {
        artboard_log::logger()->debug("\"{}\" has no content to transform", source_.name);
        return;
    }

    const std::vector<LayerId> ids = ids_of(items);
    const double factor = artboard_geometry::scale_factor(source_.bounds.size(), target_.size(),
        artboard_model::ScaleMode::Cover);

    align_center(host_, ids);
    host_.scale(ids, factor * 100.0);
    align_center(host_, ids);

    for (const auto& item : items) {
        const std::string stripped = strip_copy_suffix(item.name);
        if (stripped != item.name) host_.rename(item.id, stripped);
    }

    if (options_.apply_layer_roles)
        apply_layer_roles(source, host_.list_children(duplicate_id_), factor);
}

void GenerationPipeline::apply_layer_roles(const artboard_model::SourceEntry& source,
    const std::vector<CanvasRef>& items, double cover_factor)
{
    const bool match_by_index = items.size() == source_children_.size();

    // Without explicit assignments, roles come from the source layer names.
    artboard_model::SourceEntry roles = source;
    if (roles.layer_role_assignments.empty()) {
        std::vector<std::string> names;
        names.reserve(source_children_.size());
        for (const auto& child : source_children_)
            names.push_back(strip_copy_suffix(child.name));
        roles.layer_role_assignments = artboard_geometry::auto_detect_layer_roles(names);
    }

    for (std::size_t i = 0; i < items.size(); ++i) {
        const CanvasRef& item = items[i];
        const auto role = role_of(item.name, roles, options_.layer_names);
        if (!role) continue;

        const artboard_geometry::RoleConfig config = artboard_geometry::role_config(*role);
        const double wanted = artboard_geometry::scale_factor(source_.bounds.size(), target_.size(),
            config.scale_mode);
        const double correction = wanted / cover_factor;
        if (std::abs(correction - 1.0) > 1e-9)
            host_.scale({item.id}, correction * 100.0);

        auto current = host_.find_layer(item.id);
        if (!current)
            throw HostOperationError("scale", "layer \"" + item.name + "\" vanished");

        const CanvasRef* original = nullptr;
        if (match_by_index) {
            original = &source_children_[i];
        } else {
            auto it = std::find_if(source_children_.begin(), source_children_.end(),
                [&](const CanvasRef& c) { return strip_copy_suffix(c.name) == item.name; });
            if (it != source_children_.end()) original = &*it;
        }

        Point delta;
        if (config.anchor == artboard_model::Anchor::Center) {
            if (!original) continue;
            const Point offset = artboard_geometry::proportional_offset(original->bounds,
                source_.bounds, target_, wanted);
            const Point from = original->bounds.center();
            const Point now = current->bounds.center();
            delta = Point{from.x + offset.x - now.x, from.y + offset.y - now.y};
        } else {
            std::optional<artboard_geometry::RelativePosition> relative;
            if (original)
                relative = artboard_geometry::relative_position(original->bounds, source_.bounds, config.anchor);
            const Point local = artboard_geometry::anchor_position(config.anchor,
                current->bounds.size(), target_.size(), relative);
            delta = Point{target_.left + local.x - current->bounds.left,
                target_.top + local.y - current->bounds.top};
        }

        if (std::abs(delta.x) > min_move || std::abs(delta.y) > min_move)
            host_.move({item.id}, delta);

        artboard_log::logger()->debug("layer \"{}\" as {}: {}%", item.name,
            artboard_geometry::role_id(*role), wanted * 100.0);
    }
}

void GenerationPipeline::finish_bleed() {
    phase_ = GenerationPhase::BleedFinishing;

    host_.add_margin_guides(duplicate_id_, bleed_px_);

    const Bounds trim = artboard_geometry::trim_bounds(target_, bleed_px_);
    const auto settings = artboard_geometry::crop_mark_settings(options_.print, options_.resolution);
    for (const auto& mark : artboard_geometry::crop_mark_geometry(trim, settings))
        host_.draw_rectangle(duplicate_id_, mark.rect(), mark.color);

    artboard_log::logger()->debug("bleed {}px with crop marks around {}x{} trim",
        bleed_px_, trim.width, trim.height);
}

} // namespace artboard_pipeline
