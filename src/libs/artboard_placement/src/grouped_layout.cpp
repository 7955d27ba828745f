#include <artboard_placement/grouped_layout.hpp>
#include <artboard_geometry/bleed.hpp>
#include <algorithm>
#include <unordered_map>

namespace artboard_placement {

namespace {

std::vector<std::string> group_order(const std::vector<artboard_model::SizeSpec>& sizes,
    const std::vector<std::string>& type_order)
{
    std::vector<std::string> order = type_order;
    for (const auto& s : sizes) {
        const std::string type = s.type.empty() ? "other" : s.type;
        if (std::find(order.begin(), order.end(), type) == order.end())
            order.push_back(type);
    }
    return order;
}

} // namespace

std::vector<GridPlacement> place_grouped(const std::vector<artboard_model::SizeSpec>& sizes,
    const GridOptions& options, Position start, double resolution)
{
    std::vector<GridPlacement> out;
    if (sizes.empty()) return out;

    std::unordered_map<std::string, std::vector<std::size_t>> groups;
    for (std::size_t i = 0; i < sizes.size(); ++i)
        groups[sizes[i].type.empty() ? "other" : sizes[i].type].push_back(i);

    const int columns = std::max(1, options.columns);
    double current_y = start.y;

    for (const auto& type : group_order(sizes, options.type_order)) {
        auto it = groups.find(type);
        if (it == groups.end() || it->second.empty()) continue;

        auto& members = it->second;
        std::stable_sort(members.begin(), members.end(), [&](std::size_t a, std::size_t b) {
            return sizes[a].width / sizes[a].height > sizes[b].width / sizes[b].height;
        });

        double current_x = start.x;
        double row_height = 0;
        int column = 0;

        for (std::size_t idx : members) {
            const artboard_geometry::BleedSize actual =
                artboard_geometry::size_with_bleed(sizes[idx], resolution);

            if (column >= columns) {
                current_x = start.x;
                current_y += row_height + options.gap;
                row_height = 0;
                column = 0;
            }

            GridPlacement placement;
            placement.index = idx;
            placement.position = Position{current_x, current_y};
            placement.width = actual.width;
            placement.height = actual.height;
            out.push_back(placement);

            current_x += actual.width + options.gap;
            row_height = std::max(row_height, actual.height);
            ++column;
        }

        current_y += row_height + options.group_gap;
    }

    return out;
}

} // namespace artboard_placement
