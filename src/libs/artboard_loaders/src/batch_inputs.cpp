#include <artboard_loaders/batch_inputs.hpp>
#include <artboard_loaders/presets.hpp>
#include <artboard_log/logger.hpp>
#include <spdlog/spdlog.h>

namespace artboard_loaders {

std::optional<BatchInputs> load_batch_inputs(const BatchInputPaths& paths) {
    auto log = artboard_log::logger();

    std::optional<artboard_host::MemoryDocument> document;
    if (paths.document.empty()) {
        document = generate_demo_document();
        log->info("using built-in demo document");
    } else {
        document = load_document_from_json_file(paths.document);
        if (!document) return std::nullopt;
    }

    std::vector<artboard_model::SizeSpec> sizes;
    if (paths.sizes.empty()) {
        sizes = default_size_presets();
    } else {
        auto loaded = load_sizes_from_json_file(paths.sizes);
        if (!loaded) return std::nullopt;
        sizes = std::move(*loaded);
    }

    GenerationConfig config;
    if (!paths.config.empty()) {
        auto loaded = load_config_from_json_file(paths.config);
        if (!loaded) return std::nullopt;
        config = std::move(*loaded);
    } else if (paths.document.empty()) {
        config.sources = demo_source_config();
    }

    return BatchInputs{std::move(*document), std::move(sizes), std::move(config)};
}

} // namespace artboard_loaders
