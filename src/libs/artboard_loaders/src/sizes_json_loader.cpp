#include <artboard_loaders/json_loader.hpp>
#include <artboard_log/logger.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fstream>

namespace artboard_loaders {

namespace {

std::optional<artboard_model::SizeSpec> parse_size(const nlohmann::json& s, std::size_t index) {
    auto log = artboard_log::logger();
    if (!s.is_object()) {
        log->warn("sizes[{}]: expected an object", index);
        return std::nullopt;
    }
    if (!s.contains("width") || !s["width"].is_number() || !s.contains("height") || !s["height"].is_number()) {
        log->warn("sizes[{}]: width and height must be numbers", index);
        return std::nullopt;
    }

    artboard_model::SizeSpec size;
    size.width = s["width"].get<double>();
    size.height = s["height"].get<double>();
    if (!(size.width > 0) || !(size.height > 0)) {
        log->warn("sizes[{}]: width and height must be positive", index);
        return std::nullopt;
    }

    const bool has_type = s.contains("type") && s["type"].is_string() && !s["type"].get<std::string>().empty();
    size.type = has_type ? s["type"].get<std::string>() : "other";
    size.name = s.contains("name") && s["name"].is_string() ? s["name"].get<std::string>() : "";
    if (size.name.empty())
        size.name = (has_type ? size.type : std::string("size")) + "_" + s["width"].dump() + "x" + s["height"].dump();

    size.requires_bleed = s.contains("requiresBleed") && s["requiresBleed"].is_boolean()
        ? s["requiresBleed"].get<bool>() : false;
    if (s.contains("bleed") && s["bleed"].is_number() && s["bleed"].get<double>() > 0)
        size.bleed = s["bleed"].get<double>();
    if (s.contains("bleedUnit") && s["bleedUnit"].is_string()) {
        const std::string unit = s["bleedUnit"].get<std::string>();
        auto parsed = artboard_model::unit_from_string(unit);
        if (!parsed) {
            log->warn("sizes[{}] ({}): unknown bleed unit \"{}\"", index, size.name, unit);
            return std::nullopt;
        }
        size.bleed_unit = *parsed;
    }
    return size;
}

std::optional<std::vector<artboard_model::SizeSpec>> parse_sizes(const nlohmann::json& j) {
    const nlohmann::json* list = &j;
    if (j.is_object() && j.contains("sizes")) list = &j["sizes"];
    if (!list->is_array()) {
        artboard_log::logger()->warn("sizes: expected an array of sizes");
        return std::nullopt;
    }

    std::vector<artboard_model::SizeSpec> out;
    out.reserve(list->size());
    for (std::size_t i = 0; i < list->size(); ++i) {
        auto size = parse_size((*list)[i], i);
        if (!size) return std::nullopt;
        out.push_back(std::move(*size));
    }
    return out;
}

} // namespace

std::optional<std::vector<artboard_model::SizeSpec>> load_sizes_from_json(std::istream& in) {
    try {
        nlohmann::json j = nlohmann::json::parse(in);
        return parse_sizes(j);
    } catch (const nlohmann::json::exception& e) {
        artboard_log::logger()->warn("sizes: {}", e.what());
        return std::nullopt;
    }
}

std::optional<std::vector<artboard_model::SizeSpec>> load_sizes_from_json_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        artboard_log::logger()->warn("cannot open sizes file {}", path);
        return std::nullopt;
    }
    return load_sizes_from_json(f);
}

} // namespace artboard_loaders
