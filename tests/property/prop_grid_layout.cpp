#include <catch2/catch_test_macros.hpp>
#include <rapidcheck.h>
#include "layout/grid_layout.hpp"
#include <algorithm>
#include <map>

using namespace offgrid;
using namespace offgrid::layout;

namespace {

// Packs widgets of the given sizes with first-fit, so the result is valid.
std::vector<Widget> packed_layout(const std::vector<GridSize>& sizes, const GridBounds& bounds) {
    std::vector<Widget> widgets;
    for (size_t i = 0; i < sizes.size(); ++i) {
        auto found = find_next_available_position(widgets, sizes[i], bounds);
        RC_ASSERT(found.is_ok());
        if (!found.unwrap()) continue;
        Widget w;
        w.id = "w" + std::to_string(i);
        w.position = *found.unwrap();
        w.size = sizes[i];
        widgets.push_back(w);
    }
    return widgets;
}

rc::Gen<GridSize> small_size() {
    return rc::gen::build<GridSize>(
        rc::gen::set(&GridSize::width, rc::gen::inRange(1, 5)),
        rc::gen::set(&GridSize::height, rc::gen::inRange(1, 5)));
}

} // namespace

TEST_CASE("Property: first-fit returns a free in-bounds slot", "[property][layout]") {
    rc::check("placed widget fits and overlaps nothing",
        []() {
            const int columns = *rc::gen::inRange(4, 13);
            const auto bounds = GridBounds::with_columns(columns);
            const auto sizes = *rc::gen::container<std::vector<GridSize>>(small_size());
            const auto existing = packed_layout(sizes, bounds);
            const auto size = *small_size();

            auto found = find_next_available_position(existing, size, bounds);
            RC_ASSERT(found.is_ok());
            if (!found.unwrap()) {
                // Only when the widget is wider than the grid.
                RC_ASSERT(size.width > columns);
                return;
            }
            const auto position = *found.unwrap();
            RC_ASSERT(is_within_bounds(position, size, bounds));
            for (const auto& w : existing) {
                RC_ASSERT(!overlaps(position, size, w.position, w.size));
            }
        });
}

TEST_CASE("Property: packed layouts are valid", "[property][layout]") {
    rc::check("sequential first-fit never overlaps",
        []() {
            const auto bounds = GridBounds::with_columns(*rc::gen::inRange(4, 13));
            const auto sizes = *rc::gen::container<std::vector<GridSize>>(small_size());
            RC_ASSERT(is_valid_layout(packed_layout(sizes, bounds), bounds));
        });
}

TEST_CASE("Property: compact keeps widgets and moves them only up or left", "[property][layout]") {
    rc::check("compact output is valid with the same area",
        []() {
            const auto bounds = GridBounds::with_columns(*rc::gen::inRange(4, 13));
            const auto sizes = *rc::gen::container<std::vector<GridSize>>(small_size());
            auto widgets = packed_layout(sizes, bounds);

            // Scatter downwards to leave gaps for compact to close.
            const int shift = *rc::gen::inRange(0, 6);
            for (auto& w : widgets) {
                w.position.y += shift;
            }

            auto compacted = compact(widgets, bounds);
            RC_ASSERT(compacted.is_ok());
            const auto& out = compacted.unwrap();

            RC_ASSERT(out.size() == widgets.size());
            RC_ASSERT(total_area(out) == total_area(widgets));
            RC_ASSERT(is_valid_layout(out, bounds));

            std::map<std::string, GridPosition> before;
            for (const auto& w : widgets) before[w.id] = w.position;
            for (const auto& w : out) {
                const auto original = before.at(w.id);
                RC_ASSERT(w.position.y <= original.y);
                if (w.position.y == original.y) {
                    RC_ASSERT(w.position.x <= original.x);
                }
            }
        });
}

TEST_CASE("Property: constrain_to_bounds output fits the target grid", "[property][layout]") {
    rc::check("every widget is kept in bounds or omitted",
        []() {
            const auto source = GridBounds::with_columns(12);
            const auto sizes = *rc::gen::container<std::vector<GridSize>>(small_size());
            const auto widgets = packed_layout(sizes, source);
            const auto target = GridBounds::fixed(*rc::gen::inRange(1, 7), *rc::gen::inRange(1, 7));

            auto constrained = constrain_to_bounds(widgets, target);
            RC_ASSERT(constrained.is_ok());
            const auto& result = constrained.unwrap();

            RC_ASSERT(result.widgets.size() + result.omitted.size() == widgets.size());
            RC_ASSERT(is_valid_layout(result.widgets, target));
            RC_ASSERT(total_area(result.widgets) <= target.capacity());
        });
}
