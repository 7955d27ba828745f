#include <gtest/gtest.h>
#include <artboard_model/errors.hpp>
#include <artboard_placement/layout_packer.hpp>
#include <random>

using namespace artboard_placement;

namespace {

PackerOptions options_at(double x, double y, double max_row_width, double gap) {
    PackerOptions o;
    o.start_x = x;
    o.start_y = y;
    o.max_row_width = max_row_width;
    o.gap = gap;
    return o;
}

Position place(LayoutPacker& packer, double w, double h) {
    const Position p = packer.next_position(w, h);
    packer.register_placement(PlacedArtboard{p.x, p.y, w, h});
    return p;
}

} // namespace

TEST(LayoutPackerTest, InitialState) {
    LayoutPacker packer(options_at(2500, 40, 8000, 100));
    EXPECT_DOUBLE_EQ(packer.current_x(), 2500);
    EXPECT_DOUBLE_EQ(packer.current_row_y(), 40);
    EXPECT_DOUBLE_EQ(packer.current_row_max_height(), 0);
    EXPECT_DOUBLE_EQ(packer.global_max_bottom(), 40);
    EXPECT_TRUE(packer.placed().empty());

    const Position first = packer.next_position(1920, 1080);
    EXPECT_DOUBLE_EQ(first.x, 2500);
    EXPECT_DOUBLE_EQ(first.y, 40);
}

TEST(LayoutPackerTest, NextPositionDoesNotMutate) {
    LayoutPacker packer(options_at(0, 0, 1000, 0));
    const Position a = packer.next_position(500, 500);
    const Position b = packer.next_position(500, 500);
    EXPECT_DOUBLE_EQ(a.x, b.x);
    EXPECT_DOUBLE_EQ(a.y, b.y);
    EXPECT_TRUE(packer.placed().empty());
}

TEST(LayoutPackerTest, RowWidthBreak) {
    LayoutPacker packer(options_at(0, 0, 1000, 0));

    Position p = place(packer, 500, 500);
    EXPECT_DOUBLE_EQ(p.x, 0);
    EXPECT_DOUBLE_EQ(p.y, 0);

    p = place(packer, 500, 500);
    EXPECT_DOUBLE_EQ(p.x, 500);
    EXPECT_DOUBLE_EQ(p.y, 0);

    p = place(packer, 1200, 500);
    EXPECT_DOUBLE_EQ(p.x, 0);
    EXPECT_DOUBLE_EQ(p.y, 500);

    EXPECT_EQ(packer.overlap_count(), 0u);
}

TEST(LayoutPackerTest, HeightDivergenceBreak) {
    LayoutPacker packer(options_at(0, 0, 8000, 100));
    place(packer, 500, 500);

    // |500 - 480| is well inside half of the average height: same row.
    Position p = place(packer, 300, 480);
    EXPECT_DOUBLE_EQ(p.x, 600);
    EXPECT_DOUBLE_EQ(p.y, 0);

    // |1200 - 500| = 700 > 0.5 * 850: new row below the tallest item.
    p = place(packer, 200, 1200);
    EXPECT_DOUBLE_EQ(p.x, 0);
    EXPECT_DOUBLE_EQ(p.y, 600);
}

TEST(LayoutPackerTest, DivergenceRatioIsTunable) {
    PackerOptions o = options_at(0, 0, 8000, 100);
    o.height_divergence_ratio = 1.0;
    LayoutPacker packer(o);
    place(packer, 500, 500);
    const Position p = place(packer, 200, 1200);
    EXPECT_DOUBLE_EQ(p.x, 600);
    EXPECT_DOUBLE_EQ(p.y, 0);
}

TEST(LayoutPackerTest, OversizedItemGetsItsOwnRow) {
    LayoutPacker packer(options_at(0, 0, 1000, 50));

    Position p = place(packer, 3000, 400);
    EXPECT_DOUBLE_EQ(p.x, 0);
    EXPECT_DOUBLE_EQ(p.y, 0);

    p = place(packer, 400, 400);
    EXPECT_DOUBLE_EQ(p.x, 0);
    EXPECT_DOUBLE_EQ(p.y, 450);

    p = place(packer, 2000, 400);
    EXPECT_DOUBLE_EQ(p.x, 0);
    EXPECT_DOUBLE_EQ(p.y, 900);
}

TEST(LayoutPackerTest, NewRowStartsBelowEveryEarlierRow) {
    LayoutPacker packer(options_at(0, 0, 2000, 10));
    place(packer, 900, 900);
    place(packer, 900, 700);
    const Position p = place(packer, 900, 800); // row is full
    EXPECT_DOUBLE_EQ(p.y, 910);
    EXPECT_DOUBLE_EQ(packer.global_max_bottom(), 1710);
}

TEST(LayoutPackerTest, RegisteredPlacementAdvancesCursor) {
    LayoutPacker packer(options_at(0, 0, 8000, 100));
    packer.register_placement(PlacedArtboard{0, 0, 100, 100});
    const Position p = packer.next_position(100, 100);
    EXPECT_DOUBLE_EQ(p.x, 200);
    EXPECT_DOUBLE_EQ(p.y, 0);
}

TEST(LayoutPackerTest, RandomBatchesNeverOverlap) {
    std::mt19937 rng(20240611);
    std::uniform_real_distribution<double> side(50.0, 3000.0);
    std::uniform_real_distribution<double> gap(0.0, 200.0);

    for (int batch = 0; batch < 20; ++batch) {
        LayoutPacker packer(options_at(2500, 0, 8000, gap(rng)));
        for (int i = 0; i < 60; ++i) {
            const double w = side(rng);
            const double h = side(rng);
            const Position p = place(packer, w, h);
            EXPECT_GE(p.x, 2500);
            EXPECT_GE(p.y, 0);
        }
        EXPECT_EQ(packer.overlap_count(), 0u);
    }
}

TEST(OverlapTest, SharedEdgeIsNotOverlap) {
    EXPECT_FALSE(overlaps(PlacedArtboard{0, 0, 100, 100}, PlacedArtboard{100, 0, 100, 100}));
    EXPECT_FALSE(overlaps(PlacedArtboard{0, 0, 100, 100}, PlacedArtboard{0, 100, 100, 100}));
    EXPECT_TRUE(overlaps(PlacedArtboard{0, 0, 100, 100}, PlacedArtboard{99, 99, 10, 10}));
}

TEST(OverlapTest, PairsCountedPerRectangle) {
    // Two identical rectangles and a third covering both: every pair is distinct.
    const std::vector<PlacedArtboard> rects = {
        PlacedArtboard{0, 0, 100, 100},
        PlacedArtboard{0, 0, 100, 100},
        PlacedArtboard{50, 50, 100, 100},
        PlacedArtboard{300, 0, 100, 100},
    };
    const auto pairs = overlapping_pairs(rects);
    ASSERT_EQ(pairs.size(), 3u);
    EXPECT_EQ(pairs[0], std::make_pair(std::size_t{0}, std::size_t{1}));
    EXPECT_EQ(pairs[1], std::make_pair(std::size_t{0}, std::size_t{2}));
    EXPECT_EQ(pairs[2], std::make_pair(std::size_t{1}, std::size_t{2}));
}
