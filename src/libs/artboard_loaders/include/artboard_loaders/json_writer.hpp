#pragma once

#include <artboard_host/memory_document.hpp>
#include <artboard_model/types.hpp>
#include <nlohmann/json.hpp>
#include <string>

namespace artboard_loaders {

// Same layout load_document_from_json() reads, plus guides and crop mark fills.
nlohmann::json document_to_json(const artboard_host::MemoryDocument& document);
bool write_document_json_file(const artboard_host::MemoryDocument& document, const std::string& path);

nlohmann::json batch_result_to_json(const artboard_model::BatchResult& result);
bool write_batch_result_json_file(const artboard_model::BatchResult& result, const std::string& path);

} // namespace artboard_loaders
