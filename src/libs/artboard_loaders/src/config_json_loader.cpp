#include <artboard_loaders/json_loader.hpp>
#include <artboard_geometry/layer_roles.hpp>
#include <artboard_log/logger.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <limits>

namespace artboard_loaders {

namespace {

double number_or(const nlohmann::json& j, const char* key, double fallback) {
    return j.contains(key) && j[key].is_number() ? j[key].get<double>() : fallback;
}

bool bool_or(const nlohmann::json& j, const char* key, bool fallback) {
    return j.contains(key) && j[key].is_boolean() ? j[key].get<bool>() : fallback;
}

std::string string_or(const nlohmann::json& j, const char* key, const std::string& fallback) {
    return j.contains(key) && j[key].is_string() ? j[key].get<std::string>() : fallback;
}

artboard_model::SourceEntry parse_source(const nlohmann::json& s, const char* orientation) {
    artboard_model::SourceEntry entry;
    // A bare string is shorthand for {"artboard": "..."}.
    if (s.is_string()) {
        entry.artboard_ref = s.get<std::string>();
        return entry;
    }
    if (!s.is_object()) return entry;

    entry.artboard_ref = string_or(s, "artboard", "");
    if (s.contains("layerRoles") && s["layerRoles"].is_object()) {
        for (const auto& [role, layer] : s["layerRoles"].items()) {
            if (!artboard_geometry::role_from_id(role)) {
                artboard_log::logger()->warn("sources.{}.layerRoles: unknown role \"{}\"", orientation, role);
                continue;
            }
            if (layer.is_string() && !layer.get<std::string>().empty())
                entry.layer_role_assignments[role] = layer.get<std::string>();
        }
    }
    return entry;
}

bool parse_options(const nlohmann::json& o, artboard_pipeline::GenerationOptions& options) {
    auto log = artboard_log::logger();

    options.gap = number_or(o, "gap", options.gap);
    options.max_row_width = number_or(o, "maxRowWidth", options.max_row_width);
    options.resolution = number_or(o, "resolution", options.resolution);
    options.apply_layer_roles = bool_or(o, "applyLayerRoles", options.apply_layer_roles);
    options.skip_unconfigured = bool_or(o, "skipUnconfigured", options.skip_unconfigured);
    options.history_name = string_or(o, "historyName", options.history_name);

    if (options.gap < 0 || !(options.max_row_width > 0) || !(options.resolution > 0)) {
        log->warn("options: gap must be >= 0, maxRowWidth and resolution > 0");
        return false;
    }

    if (o.contains("layerNames") && o["layerNames"].is_array()) {
        options.layer_names.clear();
        for (const auto& n : o["layerNames"])
            if (n.is_string()) options.layer_names.push_back(n.get<std::string>());
    }

    if (o.contains("layoutMode") && o["layoutMode"].is_string()) {
        const std::string mode = o["layoutMode"].get<std::string>();
        if (mode == "packed") {
            options.layout_mode = artboard_pipeline::LayoutMode::Packed;
        } else if (mode == "grouped") {
            options.layout_mode = artboard_pipeline::LayoutMode::Grouped;
        } else {
            log->warn("options.layoutMode: unknown mode \"{}\"", mode);
            return false;
        }
    }

    if (o.contains("defaultStart") && o["defaultStart"].is_object()) {
        options.default_start.x = number_or(o["defaultStart"], "x", options.default_start.x);
        options.default_start.y = number_or(o["defaultStart"], "y", options.default_start.y);
    }

    if (o.contains("grid") && o["grid"].is_object()) {
        const auto& g = o["grid"];
        const double columns = number_or(g, "columns", options.grid.columns);
        if (!(columns >= 1) || columns > std::numeric_limits<int>::max()) {
            log->warn("options.grid.columns must be between 1 and {}", std::numeric_limits<int>::max());
            return false;
        }
        options.grid.columns = static_cast<int>(columns);
        options.grid.gap = number_or(g, "gap", options.grid.gap);
        options.grid.group_gap = number_or(g, "groupGap", options.grid.group_gap);
        if (g.contains("typeOrder") && g["typeOrder"].is_array()) {
            options.grid.type_order.clear();
            for (const auto& t : g["typeOrder"])
                if (t.is_string()) options.grid.type_order.push_back(t.get<std::string>());
        }
        if (options.grid.gap < 0 || options.grid.group_gap < 0) {
            log->warn("options.grid: gap and groupGap must be >= 0");
            return false;
        }
    }
    return true;
}

bool parse_print(const nlohmann::json& p, artboard_model::PrintSettings& print) {
    print.bleed = number_or(p, "bleed", print.bleed);
    if (p.contains("bleedUnit") && p["bleedUnit"].is_string()) {
        auto unit = artboard_model::unit_from_string(p["bleedUnit"].get<std::string>());
        if (!unit) {
            artboard_log::logger()->warn("print.bleedUnit: unknown unit \"{}\"", p["bleedUnit"].get<std::string>());
            return false;
        }
        print.unit = *unit;
    }
    print.crop_mark_length = number_or(p, "cropMarkLength", print.crop_mark_length);
    print.crop_mark_weight = number_or(p, "cropMarkWeight", print.crop_mark_weight);
    print.crop_mark_offset = number_or(p, "cropMarkOffset", print.crop_mark_offset);
    if (p.contains("cropMarkColor") && p["cropMarkColor"].is_object()) {
        const auto& c = p["cropMarkColor"];
        print.crop_mark_color.r = static_cast<int>(number_or(c, "r", print.crop_mark_color.r));
        print.crop_mark_color.g = static_cast<int>(number_or(c, "g", print.crop_mark_color.g));
        print.crop_mark_color.b = static_cast<int>(number_or(c, "b", print.crop_mark_color.b));
    }
    return true;
}

std::optional<GenerationConfig> parse_config(const nlohmann::json& j) {
    if (!j.is_object()) {
        artboard_log::logger()->warn("config: expected an object");
        return std::nullopt;
    }

    GenerationConfig config;
    if (j.contains("sources") && j["sources"].is_object()) {
        for (auto o : artboard_model::all_orientations) {
            const char* key = artboard_model::to_string(o);
            if (j["sources"].contains(key))
                config.sources.entry(o) = parse_source(j["sources"][key], key);
        }
    }
    if (j.contains("options") && j["options"].is_object() && !parse_options(j["options"], config.options))
        return std::nullopt;
    if (j.contains("print") && j["print"].is_object() && !parse_print(j["print"], config.options.print))
        return std::nullopt;
    if (j.contains("logging") && j["logging"].is_object()) {
        artboard_log::LogSettings settings;
        settings.level = string_or(j["logging"], "level", settings.level);
        settings.file = string_or(j["logging"], "file", settings.file);
        settings.pattern = string_or(j["logging"], "pattern", settings.pattern);
        config.logging = settings;
    }
    return config;
}

} // namespace

std::optional<GenerationConfig> load_config_from_json(std::istream& in) {
    try {
        nlohmann::json j = nlohmann::json::parse(in);
        return parse_config(j);
    } catch (const nlohmann::json::exception& e) {
        artboard_log::logger()->warn("config: {}", e.what());
        return std::nullopt;
    }
}

std::optional<GenerationConfig> load_config_from_json_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        artboard_log::logger()->warn("cannot open config file {}", path);
        return std::nullopt;
    }
    return load_config_from_json(f);
}

} // namespace artboard_loaders
