#include <artboard_loaders/json_loader.hpp>
#include <artboard_log/logger.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fstream>

namespace artboard_loaders {

namespace {

using artboard_host::LayerId;
using artboard_host::MemoryDocument;

std::optional<artboard_model::Bounds> parse_bounds(const nlohmann::json& b) {
    if (!b.is_object()) return std::nullopt;
    for (const char* key : {"left", "top", "width", "height"}) {
        if (!b.contains(key) || !b[key].is_number()) return std::nullopt;
    }
    const double w = b["width"].get<double>();
    const double h = b["height"].get<double>();
    if (w < 0 || h < 0) return std::nullopt;
    return artboard_model::Bounds::from_xywh(b["left"].get<double>(), b["top"].get<double>(), w, h);
}

std::optional<artboard_model::Color> parse_color(const nlohmann::json& c) {
    if (!c.is_object()) return std::nullopt;
    artboard_model::Color color;
    color.r = c.contains("r") && c["r"].is_number() ? c["r"].get<int>() : 0;
    color.g = c.contains("g") && c["g"].is_number() ? c["g"].get<int>() : 0;
    color.b = c.contains("b") && c["b"].is_number() ? c["b"].get<int>() : 0;
    return color;
}

bool parse_layers(const nlohmann::json& layers, MemoryDocument& doc, LayerId parent, const std::string& path) {
    if (!layers.is_array()) {
        artboard_log::logger()->warn("{}: expected an array", path);
        return false;
    }
    for (std::size_t i = 0; i < layers.size(); ++i) {
        const auto& l = layers[i];
        const std::string here = path + "[" + std::to_string(i) + "]";
        auto bounds = l.is_object() && l.contains("bounds") ? parse_bounds(l["bounds"]) : std::nullopt;
        if (!bounds) {
            artboard_log::logger()->warn("{}: missing or invalid bounds", here);
            return false;
        }
        const std::string name = l.contains("name") && l["name"].is_string() ? l["name"].get<std::string>() : "Layer";
        const LayerId id = doc.add_layer(parent, name, *bounds);
        if (l.contains("fill")) {
            if (auto fill = parse_color(l["fill"])) doc.set_fill(id, *fill);
        }
        if (l.contains("layers") && !parse_layers(l["layers"], doc, id, here + ".layers"))
            return false;
    }
    return true;
}

std::optional<MemoryDocument> parse_document(const nlohmann::json& j) {
    auto log = artboard_log::logger();
    if (!j.is_object() || !j.contains("artboards") || !j["artboards"].is_array()) {
        log->warn("document: expected an object with an \"artboards\" array");
        return std::nullopt;
    }

    MemoryDocument doc(
        j.contains("name") && j["name"].is_string() ? j["name"].get<std::string>() : "Untitled",
        j.contains("resolution") && j["resolution"].is_number() ? j["resolution"].get<double>() : 300.0);
    if (!(doc.resolution() > 0)) {
        log->warn("document: resolution must be positive");
        return std::nullopt;
    }
    if (j.contains("selectChildAfterDuplicate") && j["selectChildAfterDuplicate"].is_boolean())
        doc.set_select_child_after_duplicate(j["selectChildAfterDuplicate"].get<bool>());

    const auto& artboards = j["artboards"];
    for (std::size_t i = 0; i < artboards.size(); ++i) {
        const auto& a = artboards[i];
        const std::string here = "artboards[" + std::to_string(i) + "]";
        if (!a.is_object() || !a.contains("name") || !a["name"].is_string()) {
            log->warn("{}: missing name", here);
            return std::nullopt;
        }
        auto bounds = a.contains("bounds") ? parse_bounds(a["bounds"]) : std::nullopt;
        if (!bounds || !(bounds->width > 0) || !(bounds->height > 0)) {
            log->warn("{} ({}): missing or invalid bounds", here, a["name"].get<std::string>());
            return std::nullopt;
        }
        const LayerId id = doc.add_artboard(a["name"].get<std::string>(), *bounds);

        if (a.contains("guides") && a["guides"].is_array()) {
            for (const auto& g : a["guides"]) {
                if (!g.is_object() || !g.contains("position") || !g["position"].is_number()) continue;
                artboard_host::Guide guide;
                guide.horizontal = g.contains("horizontal") && g["horizontal"].is_boolean() && g["horizontal"].get<bool>();
                guide.position = g["position"].get<double>();
                doc.add_guide(id, guide);
            }
        }
        if (a.contains("layers") && !parse_layers(a["layers"], doc, id, here + ".layers"))
            return std::nullopt;
    }
    return doc;
}

} // namespace

std::optional<MemoryDocument> load_document_from_json(std::istream& in) {
    try {
        nlohmann::json j = nlohmann::json::parse(in);
        return parse_document(j);
    } catch (const nlohmann::json::exception& e) {
        artboard_log::logger()->warn("document: {}", e.what());
        return std::nullopt;
    }
}

std::optional<MemoryDocument> load_document_from_json_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        artboard_log::logger()->warn("cannot open document file {}", path);
        return std::nullopt;
    }
    return load_document_from_json(f);
}

} // namespace artboard_loaders
