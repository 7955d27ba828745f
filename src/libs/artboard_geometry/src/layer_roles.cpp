#include <artboard_geometry/layer_roles.hpp>
#include <algorithm>
#include <cctype>

namespace artboard_geometry {

using artboard_model::Anchor;
using artboard_model::ScaleMode;

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

RoleConfig role_config(LayerRole role) {
    switch (role) {
    case LayerRole::Background: return {ScaleMode::Cover, Anchor::Center};
    case LayerRole::Title: return {ScaleMode::Contain, Anchor::Center};
    case LayerRole::Overlays: return {ScaleMode::Cover, Anchor::Center};
    case LayerRole::CornerTopLeft: return {ScaleMode::Relative, Anchor::TopLeft};
    case LayerRole::CornerTopRight: return {ScaleMode::Relative, Anchor::TopRight};
    case LayerRole::CornerBottomLeft: return {ScaleMode::Relative, Anchor::BottomLeft};
    case LayerRole::CornerBottomRight: return {ScaleMode::Relative, Anchor::BottomRight};
    }
    return {};
}

const char* role_id(LayerRole role) {
    switch (role) {
    case LayerRole::Background: return "background";
    case LayerRole::Title: return "title";
    case LayerRole::Overlays: return "overlays";
    case LayerRole::CornerTopLeft: return "cornerTopLeft";
    case LayerRole::CornerTopRight: return "cornerTopRight";
    case LayerRole::CornerBottomLeft: return "cornerBottomLeft";
    case LayerRole::CornerBottomRight: return "cornerBottomRight";
    }
    return "background";
}

std::optional<LayerRole> role_from_id(const std::string& id) {
    for (LayerRole role : all_layer_roles) {
        if (id == role_id(role)) return role;
    }
    return std::nullopt;
}

const std::vector<std::string>& role_name_patterns(LayerRole role) {
    static const std::vector<std::string> background = {"bkg", "background", "bg", "back"};
    static const std::vector<std::string> title = {
        "text", "title", "headline", "heading", "copy", "txt", "main"};
    static const std::vector<std::string> overlays = {
        "adjust", "overlay", "overlays", "effects", "gradient", "vignette"};
    static const std::vector<std::string> top_left = {
        "corner-tl", "corner_tl", "top-left", "top_left", "tl", "logo-tl"};
    static const std::vector<std::string> top_right = {
        "corner-tr", "corner_tr", "top-right", "top_right", "tr", "logo-tr", "logo"};
    static const std::vector<std::string> bottom_left = {
        "corner-bl", "corner_bl", "bottom-left", "bottom_left", "bl", "logo-bl"};
    static const std::vector<std::string> bottom_right = {
        "corner-br", "corner_br", "bottom-right", "bottom_right", "br", "logo-br", "cta", "button"};

    switch (role) {
    case LayerRole::Background: return background;
    case LayerRole::Title: return title;
    case LayerRole::Overlays: return overlays;
    case LayerRole::CornerTopLeft: return top_left;
    case LayerRole::CornerTopRight: return top_right;
    case LayerRole::CornerBottomLeft: return bottom_left;
    case LayerRole::CornerBottomRight: return bottom_right;
    }
    return background;
}

bool contains_ignore_case(const std::string& haystack, const std::string& needle) {
    return to_lower(haystack).find(to_lower(needle)) != std::string::npos;
}

std::optional<LayerRole> role_for_layer_name(const std::string& layer_name) {
    if (layer_name == "Overlay") return LayerRole::Overlays;
    if (layer_name == "TEXT") return LayerRole::Title;
    if (layer_name == "BKG") return LayerRole::Background;

    const std::string lower = to_lower(layer_name);
    if (lower.find("overlay") != std::string::npos) return LayerRole::Overlays;
    if (lower.find("text") != std::string::npos || lower.find("title") != std::string::npos)
        return LayerRole::Title;
    if (lower.find("bkg") != std::string::npos || lower.find("background") != std::string::npos)
        return LayerRole::Background;

    for (LayerRole role : all_layer_roles) {
        for (const auto& pattern : role_name_patterns(role)) {
            if (lower.find(pattern) != std::string::npos) return role;
        }
    }
    return std::nullopt;
}

std::unordered_map<std::string, std::string> auto_detect_layer_roles(
    const std::vector<std::string>& layer_names)
{
    std::unordered_map<std::string, std::string> detected;
    for (LayerRole role : all_layer_roles) {
        const auto& patterns = role_name_patterns(role);
        for (const auto& name : layer_names) {
            const std::string lower = to_lower(name);
            const bool matches = std::any_of(patterns.begin(), patterns.end(),
                [&](const std::string& p) { return lower.find(p) != std::string::npos; });
            if (matches) {
                detected[role_id(role)] = name;
                break;
            }
        }
    }
    return detected;
}

} // namespace artboard_geometry
