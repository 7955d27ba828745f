#include <artboard_pipeline/batch_coordinator.hpp>
#include <artboard_geometry/bleed.hpp>
#include <artboard_geometry/orientation.hpp>
#include <artboard_host/history_transaction.hpp>
#include <artboard_log/logger.hpp>
#include <artboard_model/errors.hpp>
#include <artboard_pipeline/generation_pipeline.hpp>
#include <artboard_placement/grouped_layout.hpp>
#include <artboard_placement/layout_packer.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <cmath>
#include <exception>
#include <limits>
#include <optional>

namespace artboard_pipeline {

using artboard_model::BatchEntry;
using artboard_model::Bounds;
using artboard_model::Orientation;
using artboard_model::SizeSpec;
using artboard_placement::Position;

namespace {

enum class Disposition { Generate, Rejected, Unconfigured, Skipped };

struct Plan {
    Disposition disposition = Disposition::Generate;
    Orientation orientation = Orientation::Square;
    std::string reason;
};

bool valid_size(const SizeSpec& s) {
    return std::isfinite(s.width) && std::isfinite(s.height) && s.width > 0 && s.height > 0;
}

std::string dimensions(double w, double h) {
    return std::to_string(static_cast<long long>(std::llround(w))) + "x"
        + std::to_string(static_cast<long long>(std::llround(h)));
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

std::size_t slot(Orientation o) {
    return static_cast<std::size_t>(o);
}

// Validation runs before any host call.
std::vector<Plan> plan_batch(const std::vector<SizeSpec>& sizes, const artboard_model::SourceConfig& sources,
    const GenerationOptions& options)
{
    std::vector<Plan> plan(sizes.size());
    std::vector<std::string> problems;

    for (std::size_t i = 0; i < sizes.size(); ++i) {
        if (!valid_size(sizes[i])) {
            plan[i].disposition = Disposition::Rejected;
            plan[i].reason = "invalid size " + std::to_string(sizes[i].width) + "x"
                + std::to_string(sizes[i].height);
            problems.push_back("size " + std::to_string(i) + " (" + sizes[i].name + "): " + plan[i].reason);
            continue;
        }
        plan[i].orientation = artboard_geometry::resolve_source_type(sizes[i]);
        if (!sources.entry(plan[i].orientation).configured()) {
            plan[i].disposition = Disposition::Unconfigured;
            plan[i].reason = std::string("no ") + artboard_model::to_string(plan[i].orientation)
                + " source configured";
        }
    }

    for (const auto& missing : artboard_geometry::missing_orientations(sizes, sources))
        problems.push_back(artboard_geometry::describe(missing));

    if (!problems.empty() && !options.skip_unconfigured)
        throw artboard_model::ConfigurationError(join(problems, "; "));
    return plan;
}

} // namespace

Position start_position(const std::vector<artboard_host::CanvasRef>& canvases, const GenerationOptions& options) {
    bool any = false;
    double right = std::numeric_limits<double>::lowest();
    double top = std::numeric_limits<double>::max();
    for (const auto& c : canvases) {
        if (!c.is_artboard) continue;
        any = true;
        right = std::max(right, c.bounds.right);
        top = std::min(top, c.bounds.top);
    }
    if (!any) return options.default_start;
    return Position{right + options.gap, top};
}

artboard_model::BatchResult generate_batch(artboard_host::HostDocument& host,
    const std::vector<SizeSpec>& sizes,
    const artboard_model::SourceConfig& sources,
    const GenerationOptions& options,
    const ProgressCallback& on_progress)
{
    auto log = artboard_log::logger();
    artboard_model::BatchResult result;
    std::vector<Plan> plan = plan_batch(sizes, sources, options);
    if (sizes.empty()) return result;

    artboard_host::HistoryTransaction history(host, options.history_name);

    // Source bounds, fetched once for the whole batch.
    const auto canvases = host.list_top_level_canvases();
    std::array<std::optional<Bounds>, 3> source_bounds;
    for (Orientation o : artboard_model::all_orientations) {
        const auto& entry = sources.entry(o);
        if (!entry.configured()) continue;
        auto it = std::find_if(canvases.begin(), canvases.end(), [&](const artboard_host::CanvasRef& c) {
            return c.is_artboard && c.name == entry.artboard_ref;
        });
        if (it != canvases.end())
            source_bounds[slot(o)] = it->bounds;
        else
            log->warn("{} source \"{}\" is not in the document", artboard_model::to_string(o), entry.artboard_ref);
    }

    // At most one skip per orientation.
    std::array<bool, 3> skipped_once{};
    for (std::size_t i = 0; i < sizes.size(); ++i) {
        if (plan[i].disposition != Disposition::Generate) continue;
        const std::size_t s = slot(plan[i].orientation);
        if (skipped_once[s] || !source_bounds[s]) continue;

        const auto actual = artboard_geometry::size_with_bleed(sizes[i], options.resolution);
        const Bounds& b = *source_bounds[s];
        if (std::abs(actual.width - b.width) <= source_match_tolerance
            && std::abs(actual.height - b.height) <= source_match_tolerance) {
            plan[i].disposition = Disposition::Skipped;
            plan[i].reason = "matches source \"" + sources.entry(plan[i].orientation).artboard_ref
                + "\" (" + dimensions(b.width, b.height) + ")";
            skipped_once[s] = true;
        }
    }

    const std::size_t total = sizes.size();
    std::size_t attempted = 0;
    auto report = [&](std::size_t i) {
        ++attempted;
        if (on_progress) on_progress(attempted, total, sizes[i].name);
    };

    auto record_unplanned = [&](std::size_t i) {
        BatchEntry entry{i, sizes[i].name, "", plan[i].reason};
        if (plan[i].disposition == Disposition::Rejected) {
            log->error("\"{}\" rejected: {}", sizes[i].name, plan[i].reason);
            result.failed.push_back(std::move(entry));
        } else {
            log->warn("\"{}\" skipped: {}", sizes[i].name, plan[i].reason);
            result.skipped.push_back(std::move(entry));
        }
        report(i);
    };

    auto generate = [&](std::size_t i, const Position& position) {
        GenerationPipeline pipeline(host, options);
        auto record_failure = [&](const std::exception& e) {
            const char* phase = to_string(pipeline.current_phase());
            log->error("\"{}\" failed during {}: {}", sizes[i].name, phase, e.what());
            result.failed.push_back(BatchEntry{i, sizes[i].name, phase, e.what()});
        };

        try {
            result.created.push_back(pipeline.run(sizes[i], sources.entry(plan[i].orientation), position));
            const auto& created = result.created.back();
            log->info("created \"{}\" {} at ({}, {})", created.name,
                dimensions(created.width, created.height), created.position.x, created.position.y);
        } catch (const artboard_model::SourceNotFoundError& e) {
            record_failure(e);
        } catch (const artboard_model::HostOperationError& e) {
            record_failure(e);
        } catch (const std::exception& e) {
            record_failure(e);
        }
        report(i);
        return pipeline.occupied();
    };

    const Position start = start_position(canvases, options);
    log->debug("batch of {} sizes starting at ({}, {}), {} layout", total, start.x, start.y,
        to_string(options.layout_mode));

    if (options.layout_mode == LayoutMode::Packed) {
        artboard_placement::PackerOptions packer_options;
        packer_options.start_x = start.x;
        packer_options.start_y = start.y;
        packer_options.max_row_width = options.max_row_width;
        packer_options.gap = options.gap;
        artboard_placement::LayoutPacker packer(packer_options);

        for (std::size_t i = 0; i < sizes.size(); ++i) {
            if (plan[i].disposition != Disposition::Generate) {
                record_unplanned(i);
                continue;
            }
            const auto actual = artboard_geometry::size_with_bleed(sizes[i], options.resolution);
            const Position position = packer.next_position(actual.width, actual.height);
            if (auto occupied = generate(i, position))
                packer.register_placement(*occupied);
        }
    } else {
        std::vector<SizeSpec> to_place;
        std::vector<std::size_t> request_index;
        for (std::size_t i = 0; i < sizes.size(); ++i) {
            if (plan[i].disposition != Disposition::Generate) {
                record_unplanned(i);
                continue;
            }
            to_place.push_back(sizes[i]);
            request_index.push_back(i);
        }
        for (const auto& placement : artboard_placement::place_grouped(to_place, options.grid, start,
                 options.resolution))
            generate(request_index[placement.index], placement.position);
    }

    log->info("batch done: {} created, {} skipped, {} failed",
        result.created.size(), result.skipped.size(), result.failed.size());
    return result;
}

} // namespace artboard_pipeline
