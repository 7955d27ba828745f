#include <artboard_loaders/json_writer.hpp>
#include <artboard_log/logger.hpp>
#include <spdlog/spdlog.h>
#include <fstream>

namespace artboard_loaders {

namespace {

nlohmann::json bounds_to_json(const artboard_model::Bounds& b) {
    return {{"left", b.left}, {"top", b.top}, {"width", b.width}, {"height", b.height}};
}

nlohmann::json layer_to_json(const artboard_host::MemoryDocument& doc, const artboard_host::Layer& layer) {
    nlohmann::json j;
    j["name"] = layer.name;
    j["bounds"] = bounds_to_json(layer.bounds);
    if (layer.fill)
        j["fill"] = {{"r", layer.fill->r}, {"g", layer.fill->g}, {"b", layer.fill->b}};
    if (!layer.guides.empty()) {
        j["guides"] = nlohmann::json::array();
        for (const auto& g : layer.guides)
            j["guides"].push_back({{"horizontal", g.horizontal}, {"position", g.position}});
    }
    if (!layer.children.empty()) {
        j["layers"] = nlohmann::json::array();
        for (auto child : layer.children) {
            if (const auto* c = doc.layer(child)) j["layers"].push_back(layer_to_json(doc, *c));
        }
    }
    return j;
}

bool write_json_file(const nlohmann::json& j, const std::string& path) {
    std::ofstream f(path);
    if (!f) {
        artboard_log::logger()->error("cannot write {}", path);
        return false;
    }
    f << j.dump(2) << '\n';
    return static_cast<bool>(f);
}

} // namespace

nlohmann::json document_to_json(const artboard_host::MemoryDocument& document) {
    nlohmann::json j;
    j["name"] = document.name();
    j["resolution"] = document.resolution();
    j["artboards"] = nlohmann::json::array();
    for (auto id : document.top_level()) {
        const auto* layer = document.layer(id);
        if (layer && layer->is_artboard) j["artboards"].push_back(layer_to_json(document, *layer));
    }
    return j;
}

bool write_document_json_file(const artboard_host::MemoryDocument& document, const std::string& path) {
    return write_json_file(document_to_json(document), path);
}

nlohmann::json batch_result_to_json(const artboard_model::BatchResult& result) {
    nlohmann::json j;
    j["created"] = nlohmann::json::array();
    for (const auto& r : result.created) {
        j["created"].push_back({
            {"name", r.name},
            {"width", r.width},
            {"height", r.height},
            {"originalWidth", r.original_width},
            {"originalHeight", r.original_height},
            {"bleedPx", r.bleed_px},
            {"requiresBleed", r.requires_bleed},
            {"position", {{"x", r.position.x}, {"y", r.position.y}}},
        });
    }
    auto entries = [](const std::vector<artboard_model::BatchEntry>& list) {
        nlohmann::json out = nlohmann::json::array();
        for (const auto& e : list) {
            nlohmann::json item = {{"index", e.index}, {"name", e.name}, {"reason", e.reason}};
            if (!e.phase.empty()) item["phase"] = e.phase;
            out.push_back(std::move(item));
        }
        return out;
    };
    j["skipped"] = entries(result.skipped);
    j["failed"] = entries(result.failed);
    return j;
}

bool write_batch_result_json_file(const artboard_model::BatchResult& result, const std::string& path) {
    return write_json_file(batch_result_to_json(result), path);
}

} // namespace artboard_loaders
