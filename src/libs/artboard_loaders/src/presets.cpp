#include <artboard_loaders/presets.hpp>
#include <algorithm>

namespace artboard_loaders {

namespace {

const char* const landscape_source = "Source Landscape";
const char* const portrait_source = "Source Portrait";
const char* const square_source = "Source Square";

} // namespace

std::vector<artboard_model::SizeSpec> default_size_presets() {
    auto size = [](double w, double h, const char* name, const char* type) {
        artboard_model::SizeSpec s;
        s.width = w;
        s.height = h;
        s.name = name;
        s.type = type;
        return s;
    };

    std::vector<artboard_model::SizeSpec> out = {
        size(1080, 1350, "4x5 Social", "social"),
        size(1920, 1080, "High Definition", "video"),
        size(1080, 1440, "Instagram Post", "social"),
        size(1080, 1080, "Square", "social"),
        size(1080, 1920, "Story", "social"),
    };

    // 300 DPI print size with an eighth-inch bleed.
    auto postcard = size(1800, 1200, "Small Vertical Postcard", "print");
    postcard.requires_bleed = true;
    postcard.bleed = 0.125;
    postcard.bleed_unit = artboard_model::Unit::Inches;
    out.push_back(postcard);
    return out;
}

artboard_host::MemoryDocument generate_demo_document() {
    artboard_host::MemoryDocument doc("Artboard demo", 300.0);

    auto add_source = [&](const char* name, double x, double w, double h) {
        using artboard_model::Bounds;
        const auto id = doc.add_artboard(name, Bounds::from_xywh(x, 0, w, h));
        doc.add_layer(id, "BKG", Bounds::from_xywh(x, 0, w, h));
        doc.add_layer(id, "Overlay", Bounds::from_xywh(x, 0, w, h));
        doc.add_layer(id, "TEXT", Bounds::from_xywh(x + w * 0.2, h * 0.4, w * 0.6, h * 0.2));
        const double logo = std::min(w, h) * 0.12;
        doc.add_layer(id, "logo", Bounds::from_xywh(x + w - logo - w * 0.05, h * 0.05, logo, logo));
    };

    add_source(landscape_source, 0, 1920, 1080);
    add_source(portrait_source, 2020, 1080, 1920);
    add_source(square_source, 3200, 1080, 1080);
    return doc;
}

artboard_model::SourceConfig demo_source_config() {
    auto entry = [](const char* ref) {
        artboard_model::SourceEntry e;
        e.artboard_ref = ref;
        e.layer_role_assignments = {
            {"background", "BKG"},
            {"overlays", "Overlay"},
            {"title", "TEXT"},
            {"cornerTopRight", "logo"},
        };
        return e;
    };

    artboard_model::SourceConfig config;
    config.landscape = entry(landscape_source);
    config.portrait = entry(portrait_source);
    config.square = entry(square_source);
    return config;
}

} // namespace artboard_loaders
