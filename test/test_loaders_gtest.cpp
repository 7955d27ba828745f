#include <gtest/gtest.h>
#include <artboard_loaders/batch_inputs.hpp>
#include <artboard_loaders/json_loader.hpp>
#include <artboard_loaders/json_writer.hpp>
#include <artboard_loaders/presets.hpp>
#include <artboard_pipeline/batch_coordinator.hpp>
#include <sstream>

using namespace artboard_loaders;
using artboard_model::Unit;

namespace {

template <typename Loader>
auto load(Loader loader, const std::string& text) {
    std::istringstream in(text);
    return loader(in);
}

} // namespace

TEST(SizesLoaderTest, DefaultsAndNaming) {
    auto sizes = load(load_sizes_from_json, R"([
        {"width": 1080, "height": 1350, "name": "Feed", "type": "social"},
        {"width": 728, "height": 90, "type": "display"},
        {"width": 300, "height": 600},
        {"width": 1800, "height": 1200, "requiresBleed": true, "bleedUnit": "mm", "bleed": 3}
    ])");
    ASSERT_TRUE(sizes.has_value());
    ASSERT_EQ(sizes->size(), 4u);

    EXPECT_EQ((*sizes)[0].name, "Feed");
    EXPECT_EQ((*sizes)[0].type, "social");
    EXPECT_FALSE((*sizes)[0].requires_bleed);
    EXPECT_DOUBLE_EQ((*sizes)[0].bleed, 0.125);

    EXPECT_EQ((*sizes)[1].name, "display_728x90");
    EXPECT_EQ((*sizes)[2].name, "size_300x600");
    EXPECT_EQ((*sizes)[2].type, "other");

    EXPECT_TRUE((*sizes)[3].requires_bleed);
    EXPECT_DOUBLE_EQ((*sizes)[3].bleed, 3);
    EXPECT_EQ((*sizes)[3].bleed_unit, Unit::Millimeters);
}

TEST(SizesLoaderTest, AcceptsWrappedList) {
    auto sizes = load(load_sizes_from_json, R"({"sizes": [{"width": 10, "height": 20, "bleed": 0}]})");
    ASSERT_TRUE(sizes.has_value());
    ASSERT_EQ(sizes->size(), 1u);
    EXPECT_DOUBLE_EQ((*sizes)[0].bleed, 0.125);
}

TEST(SizesLoaderTest, RejectsBadEntries) {
    EXPECT_FALSE(load(load_sizes_from_json, R"([{"width": 0, "height": 100}])").has_value());
    EXPECT_FALSE(load(load_sizes_from_json, R"([{"width": "wide", "height": 100}])").has_value());
    EXPECT_FALSE(load(load_sizes_from_json, R"([{"height": 100}])").has_value());
    EXPECT_FALSE(load(load_sizes_from_json, R"([{"width": 1, "height": 1, "bleedUnit": "cubits"}])").has_value());
    EXPECT_FALSE(load(load_sizes_from_json, R"({"width": 1})").has_value());
    EXPECT_FALSE(load(load_sizes_from_json, "[{").has_value());
}

TEST(ConfigLoaderTest, SourcesOptionsPrintLogging) {
    auto config = load(load_config_from_json, R"({
        "sources": {
            "landscape": {"artboard": "Wide", "layerRoles": {"background": "BKG", "footer": "x"}},
            "portrait": "Tall"
        },
        "options": {
            "gap": 40,
            "maxRowWidth": 6000,
            "resolution": 150,
            "applyLayerRoles": true,
            "skipUnconfigured": true,
            "historyName": "Campaign",
            "layerNames": ["Hero", "Copy"],
            "layoutMode": "grouped",
            "defaultStart": {"x": 100, "y": 200},
            "grid": {"columns": 3, "gap": 20, "groupGap": 500, "typeOrder": ["print", "social"]}
        },
        "print": {"bleedUnit": "mm", "cropMarkLength": 5, "cropMarkOffset": 2, "cropMarkWeight": 0.5,
                  "cropMarkColor": {"r": 255}},
        "logging": {"level": "debug", "file": "artgen.log"}
    })");
    ASSERT_TRUE(config.has_value());

    EXPECT_EQ(config->sources.landscape.artboard_ref, "Wide");
    EXPECT_EQ(config->sources.landscape.layer_role_assignments.size(), 1u);
    EXPECT_EQ(config->sources.landscape.layer_role_assignments.at("background"), "BKG");
    EXPECT_EQ(config->sources.portrait.artboard_ref, "Tall");
    EXPECT_FALSE(config->sources.square.configured());

    const auto& o = config->options;
    EXPECT_DOUBLE_EQ(o.gap, 40);
    EXPECT_DOUBLE_EQ(o.max_row_width, 6000);
    EXPECT_DOUBLE_EQ(o.resolution, 150);
    EXPECT_TRUE(o.apply_layer_roles);
    EXPECT_TRUE(o.skip_unconfigured);
    EXPECT_EQ(o.history_name, "Campaign");
    EXPECT_EQ(o.layer_names, (std::vector<std::string>{"Hero", "Copy"}));
    EXPECT_EQ(o.layout_mode, artboard_pipeline::LayoutMode::Grouped);
    EXPECT_DOUBLE_EQ(o.default_start.x, 100);
    EXPECT_EQ(o.grid.columns, 3);
    EXPECT_DOUBLE_EQ(o.grid.group_gap, 500);
    EXPECT_EQ(o.grid.type_order.front(), "print");

    EXPECT_EQ(o.print.unit, Unit::Millimeters);
    EXPECT_DOUBLE_EQ(o.print.crop_mark_length, 5);
    EXPECT_DOUBLE_EQ(o.print.crop_mark_weight, 0.5);
    EXPECT_EQ(o.print.crop_mark_color.r, 255);
    EXPECT_EQ(o.print.crop_mark_color.g, 0);

    ASSERT_TRUE(config->logging.has_value());
    EXPECT_EQ(config->logging->level, "debug");
    EXPECT_EQ(config->logging->file, "artgen.log");
}

TEST(ConfigLoaderTest, EmptyObjectKeepsDefaults) {
    auto config = load(load_config_from_json, "{}");
    ASSERT_TRUE(config.has_value());
    EXPECT_DOUBLE_EQ(config->options.gap, 100);
    EXPECT_DOUBLE_EQ(config->options.max_row_width, 8000);
    EXPECT_EQ(config->options.layout_mode, artboard_pipeline::LayoutMode::Packed);
    EXPECT_FALSE(config->options.apply_layer_roles);
    EXPECT_FALSE(config->logging.has_value());
}

TEST(ConfigLoaderTest, RejectsBadOptions) {
    EXPECT_FALSE(load(load_config_from_json, R"({"options": {"gap": -1}})").has_value());
    EXPECT_FALSE(load(load_config_from_json, R"({"options": {"maxRowWidth": 0}})").has_value());
    EXPECT_FALSE(load(load_config_from_json, R"({"options": {"layoutMode": "spiral"}})").has_value());
    EXPECT_FALSE(load(load_config_from_json, R"({"options": {"grid": {"columns": 0}}})").has_value());
    EXPECT_FALSE(load(load_config_from_json, R"({"options": {"grid": {"columns": 1e12}}})").has_value());
    EXPECT_FALSE(load(load_config_from_json, R"({"options": {"grid": {"gap": -600}}})").has_value());
    EXPECT_FALSE(load(load_config_from_json, R"({"options": {"grid": {"groupGap": -1}}})").has_value());
    EXPECT_FALSE(load(load_config_from_json, R"({"print": {"bleedUnit": "feet"}})").has_value());
    EXPECT_FALSE(load(load_config_from_json, "[]").has_value());
}

TEST(DocumentLoaderTest, ReadsArtboardsLayersAndGuides) {
    auto doc = load(load_document_from_json, R"({
        "name": "Campaign",
        "resolution": 150,
        "selectChildAfterDuplicate": true,
        "artboards": [
            {"name": "Wide", "bounds": {"left": 0, "top": 0, "width": 1920, "height": 1080},
             "guides": [{"horizontal": true, "position": 540}],
             "layers": [
                {"name": "BKG", "bounds": {"left": 0, "top": 0, "width": 1920, "height": 1080},
                 "fill": {"r": 10, "g": 20, "b": 30}},
                {"name": "Group", "bounds": {"left": 100, "top": 100, "width": 400, "height": 200},
                 "layers": [{"name": "TEXT", "bounds": {"left": 120, "top": 120, "width": 300, "height": 80}}]}
             ]}
        ]
    })");
    ASSERT_TRUE(doc.has_value());
    EXPECT_EQ(doc->name(), "Campaign");
    EXPECT_DOUBLE_EQ(doc->resolution(), 150);
    ASSERT_EQ(doc->top_level().size(), 1u);

    const auto* wide = doc->layer(doc->top_level()[0]);
    ASSERT_NE(wide, nullptr);
    EXPECT_TRUE(wide->is_artboard);
    ASSERT_EQ(wide->guides.size(), 1u);
    EXPECT_TRUE(wide->guides[0].horizontal);
    ASSERT_EQ(wide->children.size(), 2u);

    const auto* bkg = doc->layer(wide->children[0]);
    ASSERT_TRUE(bkg->fill.has_value());
    EXPECT_EQ(bkg->fill->b, 30);

    const auto* group = doc->layer(wide->children[1]);
    ASSERT_EQ(group->children.size(), 1u);
    EXPECT_EQ(doc->layer(group->children[0])->name, "TEXT");
    EXPECT_EQ(doc->layer_count(), 4u);
}

TEST(DocumentLoaderTest, RejectsBrokenDocuments) {
    EXPECT_FALSE(load(load_document_from_json, R"({"name": "x"})").has_value());
    EXPECT_FALSE(load(load_document_from_json,
        R"({"artboards": [{"name": "A", "bounds": {"left": 0, "top": 0, "width": 0, "height": 10}}]})").has_value());
    EXPECT_FALSE(load(load_document_from_json,
        R"({"artboards": [{"bounds": {"left": 0, "top": 0, "width": 10, "height": 10}}]})").has_value());
    EXPECT_FALSE(load(load_document_from_json,
        R"({"artboards": [{"name": "A", "bounds": {"left": 0, "top": 0, "width": 10, "height": 10},
            "layers": [{"name": "no bounds"}]}]})").has_value());
}

TEST(JsonWriterTest, DocumentRoundTripAfterBatch) {
    auto doc = generate_demo_document();
    artboard_pipeline::generate_batch(doc, default_size_presets(), demo_source_config());

    const nlohmann::json written = document_to_json(doc);
    EXPECT_EQ(written["name"].get<std::string>(), "Artboard demo");
    ASSERT_EQ(written["artboards"].size(), 6u);

    std::istringstream in(written.dump());
    auto reread = load_document_from_json(in);
    ASSERT_TRUE(reread.has_value());
    EXPECT_EQ(reread->layer_count(), doc.layer_count());

    const auto* postcard = reread->layer(*reread->find_top_level("Small Vertical Postcard"));
    ASSERT_NE(postcard, nullptr);
    EXPECT_EQ(postcard->guides.size(), 4u);
    EXPECT_DOUBLE_EQ(postcard->bounds.width, 1875);
}

TEST(JsonWriterTest, BatchResultShape) {
    artboard_model::BatchResult result;
    artboard_model::GenerationResult created;
    created.name = "Post";
    created.width = 1080;
    created.height = 1350;
    created.original_width = 1080;
    created.original_height = 1350;
    created.position = {4380, 0};
    result.created.push_back(created);
    result.skipped.push_back({1, "Square", "", "matches source \"Source Square\" (1080x1080)"});
    result.failed.push_back({2, "Story", "resize_rename", "resize: host rejected the command"});

    const nlohmann::json j = batch_result_to_json(result);
    EXPECT_EQ(j["created"][0]["name"].get<std::string>(), "Post");
    EXPECT_DOUBLE_EQ(j["created"][0]["position"]["x"].get<double>(), 4380.0);
    EXPECT_FALSE(j["created"][0]["requiresBleed"].get<bool>());
    EXPECT_EQ(j["skipped"][0]["index"].get<std::size_t>(), 1u);
    EXPECT_FALSE(j["skipped"][0].contains("phase"));
    EXPECT_EQ(j["failed"][0]["phase"].get<std::string>(), "resize_rename");
}

TEST(PresetsTest, DemoDocumentAndSources) {
    const auto presets = default_size_presets();
    ASSERT_EQ(presets.size(), 6u);
    EXPECT_TRUE(presets.back().requires_bleed);

    const auto doc = generate_demo_document();
    EXPECT_EQ(doc.top_level().size(), 3u);
    EXPECT_EQ(doc.layer_count(), 3u * 5u);

    const auto sources = demo_source_config();
    for (auto o : artboard_model::all_orientations) {
        ASSERT_TRUE(sources.entry(o).configured());
        EXPECT_TRUE(doc.find_top_level(sources.entry(o).artboard_ref).has_value());
        EXPECT_EQ(sources.entry(o).layer_role_assignments.at("cornerTopRight"), "logo");
    }
}

TEST(BatchInputsTest, ExampleFiles) {
    BatchInputPaths paths;
    paths.document = "data/example_document.json";
    paths.sizes = "data/example_sizes.json";
    paths.config = "data/example_config.json";
    auto inputs = load_batch_inputs(paths);
    ASSERT_TRUE(inputs.has_value());
    EXPECT_FALSE(inputs->sizes.empty());
    EXPECT_TRUE(inputs->config.sources.landscape.configured());

    const auto result = artboard_pipeline::generate_batch(inputs->document, inputs->sizes,
        inputs->config.sources, inputs->config.options);
    EXPECT_TRUE(result.failed.empty());
    EXPECT_FALSE(result.created.empty());
}

TEST(BatchInputsTest, BuiltInDemoWhenNoPaths) {
    auto inputs = load_batch_inputs(BatchInputPaths{});
    ASSERT_TRUE(inputs.has_value());
    EXPECT_EQ(inputs->document.name(), "Artboard demo");
    EXPECT_EQ(inputs->sizes.size(), 6u);
    EXPECT_EQ(inputs->config.sources.square.artboard_ref, "Source Square");
}

TEST(BatchInputsTest, MissingFileFails) {
    BatchInputPaths paths;
    paths.sizes = "data/does_not_exist.json";
    EXPECT_FALSE(load_batch_inputs(paths).has_value());
}
