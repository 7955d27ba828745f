#include <artboard_geometry/orientation.hpp>
#include <utility>

namespace artboard_geometry {

namespace {

const std::size_t max_examples = 3;

} // namespace

Orientation resolve_source_type(double aspect_ratio) {
    if (aspect_ratio < portrait_max_ratio) return Orientation::Portrait;
    if (aspect_ratio > square_max_ratio) return Orientation::Landscape;
    return Orientation::Square;
}

Orientation resolve_source_type(const artboard_model::SizeSpec& size) {
    return resolve_source_type(size.width / size.height);
}

bool can_generate(const artboard_model::SizeSpec& size, const artboard_model::SourceConfig& sources) {
    return sources.entry(resolve_source_type(size)).configured();
}

std::vector<MissingSource> missing_orientations(const std::vector<artboard_model::SizeSpec>& sizes,
    const artboard_model::SourceConfig& sources)
{
    std::vector<MissingSource> out;
    for (Orientation o : artboard_model::all_orientations) {
        if (sources.entry(o).configured()) continue;
        MissingSource missing;
        missing.orientation = o;
        for (const auto& s : sizes) {
            if (s.width <= 0 || s.height <= 0) continue;
            if (resolve_source_type(s) != o) continue;
            ++missing.size_count;
            if (missing.examples.size() < max_examples)
                missing.examples.push_back(s.name);
        }
        if (missing.size_count > 0)
            out.push_back(std::move(missing));
    }
    return out;
}

std::string describe(const MissingSource& missing) {
    std::string text = "missing ";
    text += artboard_model::to_string(missing.orientation);
    text += " source needed for " + std::to_string(missing.size_count);
    text += missing.size_count == 1 ? " size" : " sizes";
    if (!missing.examples.empty()) {
        text += " (e.g. ";
        for (std::size_t i = 0; i < missing.examples.size(); ++i) {
            if (i > 0) text += ", ";
            text += missing.examples[i];
        }
        if (missing.size_count > missing.examples.size()) text += "...";
        text += ")";
    }
    return text;
}

} // namespace artboard_geometry
