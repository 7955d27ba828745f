#pragma once

#include <artboard_host/memory_document.hpp>
#include <artboard_log/logger.hpp>
#include <artboard_model/types.hpp>
#include <artboard_pipeline/options.hpp>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace artboard_loaders {

// Everything a generation config file can carry. Keys missing from the file keep the
// defaults of the corresponding structs.
struct GenerationConfig {
    artboard_model::SourceConfig sources;
    artboard_pipeline::GenerationOptions options;
    std::optional<artboard_log::LogSettings> logging;
};

// Malformed input yields std::nullopt and a warning on the artboard logger naming the
// offending entry.

std::optional<std::vector<artboard_model::SizeSpec>> load_sizes_from_json(std::istream& in);
std::optional<std::vector<artboard_model::SizeSpec>> load_sizes_from_json_file(const std::string& path);

std::optional<GenerationConfig> load_config_from_json(std::istream& in);
std::optional<GenerationConfig> load_config_from_json_file(const std::string& path);

std::optional<artboard_host::MemoryDocument> load_document_from_json(std::istream& in);
std::optional<artboard_host::MemoryDocument> load_document_from_json_file(const std::string& path);

} // namespace artboard_loaders
