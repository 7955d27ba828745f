#include <gtest/gtest.h>
#include <artboard_geometry/bleed.hpp>
#include <artboard_geometry/orientation.hpp>

using namespace artboard_geometry;
using artboard_model::Bounds;
using artboard_model::SizeSpec;
using artboard_model::SourceConfig;

namespace {

SizeSpec make_size(double w, double h, const char* name = "size") {
    SizeSpec s;
    s.width = w;
    s.height = h;
    s.name = name;
    return s;
}

SizeSpec make_print(double w, double h, double bleed, Unit unit) {
    SizeSpec s = make_size(w, h, "print");
    s.requires_bleed = true;
    s.bleed = bleed;
    s.bleed_unit = unit;
    return s;
}

} // namespace

TEST(OrientationTest, Thresholds) {
    EXPECT_EQ(resolve_source_type(0.5), Orientation::Portrait);
    EXPECT_EQ(resolve_source_type(0.8499), Orientation::Portrait);
    EXPECT_EQ(resolve_source_type(0.85), Orientation::Square);
    EXPECT_EQ(resolve_source_type(1.0), Orientation::Square);
    EXPECT_EQ(resolve_source_type(1.15), Orientation::Square);
    EXPECT_EQ(resolve_source_type(1.1501), Orientation::Landscape);
    EXPECT_EQ(resolve_source_type(16.0 / 9.0), Orientation::Landscape);
}

TEST(OrientationTest, ClassifiesRequestedSizeNotBleedSize) {
    // 1000x1160 (0.862) is square; with an inch of bleed on each side it would read 0.869.
    SizeSpec s = make_print(1000, 1160, 1.0, Unit::Inches);
    EXPECT_EQ(resolve_source_type(s), Orientation::Square);
    EXPECT_EQ(resolve_source_type(make_size(1080, 1350)), Orientation::Portrait);
    EXPECT_EQ(resolve_source_type(make_size(1920, 1080)), Orientation::Landscape);
}

TEST(OrientationTest, CanGenerateNeedsConfiguredSource) {
    SourceConfig sources;
    sources.landscape.artboard_ref = "Wide";
    EXPECT_TRUE(can_generate(make_size(1920, 1080), sources));
    EXPECT_FALSE(can_generate(make_size(1080, 1920), sources));
    EXPECT_FALSE(can_generate(make_size(1080, 1080), sources));
}

TEST(OrientationTest, MissingOrientationsWithExamples) {
    SourceConfig sources;
    sources.square.artboard_ref = "Square";
    const std::vector<SizeSpec> sizes = {
        make_size(1080, 1920, "Story"),
        make_size(1080, 1080, "Square"),
        make_size(160, 600, "Skyscraper"),
        make_size(1080, 1350, "Portrait post"),
        make_size(300, 600, "Half page"),
        make_size(1920, 1080, "HD"),
    };

    const auto missing = missing_orientations(sizes, sources);
    ASSERT_EQ(missing.size(), 2u);
    EXPECT_EQ(missing[0].orientation, Orientation::Landscape);
    EXPECT_EQ(missing[0].size_count, 1u);
    EXPECT_EQ(missing[1].orientation, Orientation::Portrait);
    EXPECT_EQ(missing[1].size_count, 4u);
    ASSERT_EQ(missing[1].examples.size(), 3u);
    EXPECT_EQ(missing[1].examples[0], "Story");

    EXPECT_EQ(describe(missing[0]), "missing landscape source needed for 1 size (e.g. HD)");
    EXPECT_EQ(describe(missing[1]),
        "missing portrait source needed for 4 sizes (e.g. Story, Skyscraper, Portrait post...)");
}

TEST(BleedTest, EighthInchAt300Dpi) {
    const BleedSize b = size_with_bleed(make_print(1000, 1000, 0.125, Unit::Inches), 300);
    EXPECT_DOUBLE_EQ(b.bleed_px, 37.5);
    EXPECT_DOUBLE_EQ(b.width, 1075);
    EXPECT_DOUBLE_EQ(b.height, 1075);
}

TEST(BleedTest, NoBleedUnlessRequired) {
    SizeSpec s = make_size(800, 600);
    s.bleed = 0.5;
    const BleedSize b = size_with_bleed(s);
    EXPECT_DOUBLE_EQ(b.bleed_px, 0);
    EXPECT_DOUBLE_EQ(b.width, 800);
    EXPECT_DOUBLE_EQ(b.height, 600);
}

TEST(BleedTest, BleedSubtractsBackToRequested) {
    const SizeSpec specs[] = {
        make_print(1800, 1200, 0.125, Unit::Inches),
        make_print(2480, 3508, 3, Unit::Millimeters),
        make_print(500, 700, 12, Unit::Pixels),
    };
    for (const auto& s : specs) {
        const BleedSize b = size_with_bleed(s, 300);
        EXPECT_NEAR(b.width - 2 * b.bleed_px, s.width, 1e-9);
        EXPECT_NEAR(b.height - 2 * b.bleed_px, s.height, 1e-9);
    }
}

TEST(BleedTest, TrimBounds) {
    const Bounds trim = trim_bounds(Bounds::from_xywh(100, 200, 1075, 1075), 37.5);
    EXPECT_DOUBLE_EQ(trim.left, 137.5);
    EXPECT_DOUBLE_EQ(trim.top, 237.5);
    EXPECT_DOUBLE_EQ(trim.width, 1000);
    EXPECT_DOUBLE_EQ(trim.height, 1000);
}

TEST(CropMarkTest, SettingsFromPrintDefaults) {
    const CropMarkSettings s = crop_mark_settings(artboard_model::PrintSettings{}, 300);
    EXPECT_DOUBLE_EQ(s.length, 75);
    EXPECT_DOUBLE_EQ(s.offset, 18.75);
    EXPECT_DOUBLE_EQ(s.weight, 1);
}

TEST(CropMarkTest, EightMarksOutsideTrim) {
    const Bounds trim = Bounds::from_xywh(0, 0, 1000, 500);
    CropMarkSettings settings;
    settings.length = 75;
    settings.offset = 18.75;
    settings.weight = 2;
    const auto marks = crop_mark_geometry(trim, settings);
    ASSERT_EQ(marks.size(), 8u);

    // Top-left horizontal: runs left from x = -18.75 to x = -93.75 on y = 0.
    EXPECT_EQ(marks[0].corner, Corner::TopLeft);
    EXPECT_TRUE(marks[0].horizontal);
    EXPECT_DOUBLE_EQ(marks[0].start.x, -18.75);
    EXPECT_DOUBLE_EQ(marks[0].end.x, -93.75);
    EXPECT_DOUBLE_EQ(marks[0].start.y, 0);

    // Bottom-right vertical: runs down from y = 518.75 on x = 1000.
    EXPECT_EQ(marks[7].corner, Corner::BottomRight);
    EXPECT_FALSE(marks[7].horizontal);
    EXPECT_DOUBLE_EQ(marks[7].start.y, 518.75);
    EXPECT_DOUBLE_EQ(marks[7].end.y, 593.75);
    EXPECT_DOUBLE_EQ(marks[7].start.x, 1000);

    for (const auto& m : marks) {
        const Bounds r = m.rect();
        // No mark enters the trim area.
        const bool outside = r.right <= trim.left || r.left >= trim.right
            || r.bottom <= trim.top || r.top >= trim.bottom;
        EXPECT_TRUE(outside);
        EXPECT_DOUBLE_EQ(m.horizontal ? r.height : r.width, 2);
        EXPECT_DOUBLE_EQ(m.horizontal ? r.width : r.height, 75);
    }
}
