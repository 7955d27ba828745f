#pragma once

#include <artboard_model/types.hpp>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace artboard_geometry {

enum class LayerRole {
    Background,
    Title,
    Overlays,
    CornerTopLeft,
    CornerTopRight,
    CornerBottomLeft,
    CornerBottomRight
};

constexpr LayerRole all_layer_roles[] = {
    LayerRole::Background, LayerRole::Title, LayerRole::Overlays,
    LayerRole::CornerTopLeft, LayerRole::CornerTopRight,
    LayerRole::CornerBottomLeft, LayerRole::CornerBottomRight };

struct RoleConfig {
    artboard_model::ScaleMode scale_mode = artboard_model::ScaleMode::Contain;
    artboard_model::Anchor anchor = artboard_model::Anchor::Center;
};

RoleConfig role_config(LayerRole role);

// Ids used in configuration files: "background", "title", "overlays", "cornerTopLeft", ...
const char* role_id(LayerRole role);
std::optional<LayerRole> role_from_id(const std::string& id);

// Lower-case substrings that identify a role from a layer name.
const std::vector<std::string>& role_name_patterns(LayerRole role);

// Role of a configured layer name ("Overlay", "TEXT", "BKG" and their partial matches),
// falling back to pattern detection.
std::optional<LayerRole> role_for_layer_name(const std::string& layer_name);

// First layer matching each role's patterns, in layer order. Result maps role id -> layer name.
std::unordered_map<std::string, std::string> auto_detect_layer_roles(
    const std::vector<std::string>& layer_names);

// Case-insensitive substring test.
bool contains_ignore_case(const std::string& haystack, const std::string& needle);

} // namespace artboard_geometry
