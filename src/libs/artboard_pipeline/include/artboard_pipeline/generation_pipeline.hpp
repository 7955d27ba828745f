#pragma once

#include <artboard_host/host_document.hpp>
#include <artboard_model/types.hpp>
#include <artboard_pipeline/options.hpp>
#include <artboard_placement/types.hpp>
#include <optional>
#include <string>
#include <vector>

namespace artboard_pipeline {

enum class GenerationPhase {
    Idle,
    ResolveAndDuplicate,
    ResizeAndRename,
    TransformContents,
    BleedFinishing,
    Done
};

const char* to_string(GenerationPhase phase);

// Upper bound on parent hops when looking for the duplicate's top-level canvas.
constexpr int max_parent_depth = 10;

// Removes the " copy", " copy N" or " copyN" suffixes (any case) added by the host's duplicate
// command: one numbered or plain suffix, then one more plain " copy".
std::string strip_copy_suffix(const std::string& name);

// Produces one artboard from one source canvas. One instance per size; phases run in order
// and each waits for the host to confirm the previous one.
//
// Errors are not caught here: SourceNotFoundError and HostOperationError leave the pipeline
// in the phase that failed, and whatever the host already did stays in the document.
class GenerationPipeline {
public:
    GenerationPipeline(artboard_host::HostDocument& host, const GenerationOptions& options);

    artboard_model::GenerationResult run(const artboard_model::SizeSpec& size,
        const artboard_model::SourceEntry& source, const artboard_placement::Position& position);

    GenerationPhase current_phase() const { return phase_; }

    // Space taken in the document once the duplicate has been resized, even when a later
    // phase failed.
    const std::optional<artboard_placement::PlacedArtboard>& occupied() const { return occupied_; }

    // The canvas created by the last duplicate(): first active item, walked up to its
    // top-level ancestor. Throws HostOperationError when it cannot be identified.
    artboard_host::LayerId resolve_after_duplicate(artboard_host::LayerId source_id) const;

private:
    void resolve_and_duplicate(const artboard_model::SourceEntry& source);
    void resize_and_rename(const artboard_model::SizeSpec& size,
        const artboard_placement::Position& position);
    void transform_contents(const artboard_model::SourceEntry& source);
    void apply_layer_roles(const artboard_model::SourceEntry& source,
        const std::vector<artboard_host::CanvasRef>& items, double cover_factor);
    void finish_bleed();

    artboard_host::HostDocument& host_;
    GenerationOptions options_;
    GenerationPhase phase_ = GenerationPhase::Idle;
    std::optional<artboard_placement::PlacedArtboard> occupied_;

    artboard_host::CanvasRef source_;
    std::vector<artboard_host::CanvasRef> source_children_;
    artboard_host::LayerId duplicate_id_ = 0;
    artboard_model::Bounds target_;
    double bleed_px_ = 0;
    bool requires_bleed_ = false;
};

} // namespace artboard_pipeline
