#include <gtest/gtest.h>
#include <artboard_placement/grouped_layout.hpp>

using namespace artboard_placement;
using artboard_model::SizeSpec;

namespace {

SizeSpec typed(double w, double h, const char* type, const char* name) {
    SizeSpec s;
    s.width = w;
    s.height = h;
    s.type = type;
    s.name = name;
    return s;
}

GridOptions grid(int columns, double gap, double group_gap) {
    GridOptions o;
    o.columns = columns;
    o.gap = gap;
    o.group_gap = group_gap;
    return o;
}

} // namespace

TEST(GroupedLayoutTest, EmptyInput) {
    EXPECT_TRUE(place_grouped({}, GridOptions{}, Position{0, 0}, 300).empty());
}

TEST(GroupedLayoutTest, GroupsFollowTypeOrder) {
    const std::vector<SizeSpec> sizes = {
        typed(1920, 1080, "video", "HD"),
        typed(1080, 1080, "social", "Square"),
        typed(600, 200, "banner", "Leaderboard"),
        typed(300, 250, "display", "Rectangle"),
    };
    const auto placed = place_grouped(sizes, grid(4, 100, 300), Position{0, 0}, 300);
    ASSERT_EQ(placed.size(), 4u);
    // social, display, video, then the unknown type in first-seen order.
    EXPECT_EQ(placed[0].index, 1u);
    EXPECT_EQ(placed[1].index, 3u);
    EXPECT_EQ(placed[2].index, 0u);
    EXPECT_EQ(placed[3].index, 2u);

    EXPECT_DOUBLE_EQ(placed[0].position.y, 0);
    EXPECT_DOUBLE_EQ(placed[1].position.y, 1080 + 300);
    EXPECT_DOUBLE_EQ(placed[2].position.y, 1080 + 300 + 250 + 300);
    EXPECT_DOUBLE_EQ(placed[3].position.y, 1080 + 300 + 250 + 300 + 1080 + 300);
    for (const auto& p : placed) EXPECT_DOUBLE_EQ(p.position.x, 0);
}

TEST(GroupedLayoutTest, LandscapeFirstWithinGroup) {
    const std::vector<SizeSpec> sizes = {
        typed(1080, 1920, "social", "Story"),
        typed(1080, 1080, "social", "Square"),
        typed(1200, 628, "social", "Link"),
    };
    const auto placed = place_grouped(sizes, grid(4, 50, 300), Position{100, 10}, 300);
    ASSERT_EQ(placed.size(), 3u);
    EXPECT_EQ(placed[0].index, 2u);
    EXPECT_EQ(placed[1].index, 1u);
    EXPECT_EQ(placed[2].index, 0u);

    EXPECT_DOUBLE_EQ(placed[0].position.x, 100);
    EXPECT_DOUBLE_EQ(placed[1].position.x, 100 + 1200 + 50);
    EXPECT_DOUBLE_EQ(placed[2].position.x, 100 + 1200 + 50 + 1080 + 50);
    for (const auto& p : placed) EXPECT_DOUBLE_EQ(p.position.y, 10);
}

TEST(GroupedLayoutTest, WrapsAfterColumns) {
    std::vector<SizeSpec> sizes;
    for (int i = 0; i < 5; ++i) sizes.push_back(typed(100, 100 + i * 10, "web", "w"));
    const auto placed = place_grouped(sizes, grid(2, 20, 300), Position{0, 0}, 300);
    ASSERT_EQ(placed.size(), 5u);

    // Aspect ratios decrease with height, so input order is kept.
    EXPECT_DOUBLE_EQ(placed[0].position.y, 0);
    EXPECT_DOUBLE_EQ(placed[1].position.y, 0);
    EXPECT_DOUBLE_EQ(placed[2].position.x, 0);
    EXPECT_DOUBLE_EQ(placed[2].position.y, 110 + 20);
    EXPECT_DOUBLE_EQ(placed[4].position.y, 110 + 20 + 130 + 20);
}

TEST(GroupedLayoutTest, BleedIsPartOfTheFootprint) {
    SizeSpec print = typed(1800, 1200, "print", "Postcard");
    print.requires_bleed = true;
    print.bleed = 0.125;
    const auto placed = place_grouped({print, typed(600, 1000, "print", "Flyer")},
        grid(4, 100, 300), Position{0, 0}, 300);
    ASSERT_EQ(placed.size(), 2u);
    EXPECT_EQ(placed[0].index, 0u);
    EXPECT_DOUBLE_EQ(placed[0].width, 1875);
    EXPECT_DOUBLE_EQ(placed[0].height, 1275);
    EXPECT_DOUBLE_EQ(placed[1].position.x, 1875 + 100);
}

TEST(GroupedLayoutTest, NoOverlaps) {
    std::vector<SizeSpec> sizes;
    const char* types[] = {"social", "display", "video", "print", "custom"};
    for (int i = 0; i < 30; ++i)
        sizes.push_back(typed(200 + (i * 137) % 1800, 200 + (i * 71) % 1900, types[i % 5], "s"));
    const auto placed = place_grouped(sizes, grid(3, 60, 300), Position{2500, 0}, 300);
    ASSERT_EQ(placed.size(), sizes.size());
    for (std::size_t i = 0; i < placed.size(); ++i) {
        for (std::size_t j = i + 1; j < placed.size(); ++j) {
            const PlacedArtboard a{placed[i].position.x, placed[i].position.y, placed[i].width, placed[i].height};
            const PlacedArtboard b{placed[j].position.x, placed[j].position.y, placed[j].width, placed[j].height};
            EXPECT_FALSE(overlaps(a, b)) << i << " vs " << j;
        }
    }
}
