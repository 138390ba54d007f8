#include "layout/responsive.hpp"
#include "layout/grid_layout.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace offgrid::layout {

namespace {

int scale_dimension(int value, int from_columns, int to_columns) {
    const double scaled = static_cast<double>(value) / from_columns * to_columns;
    return static_cast<int>(std::lround(scaled));
}

bool fits(const Widget& candidate, const std::vector<Widget>& placed, const GridBounds& bounds) {
    if (!is_within_bounds(candidate, bounds)) return false;
    return std::none_of(placed.begin(), placed.end(),
                        [&](const Widget& p) { return overlaps(p, candidate); });
}

} // namespace

Breakpoint breakpoint_for_width(int width_px) noexcept {
    for (const auto& info : BREAKPOINTS) {
        if (width_px >= info.min_width_px) return info.breakpoint;
    }
    return Breakpoint::Small;
}

int columns_for(Breakpoint breakpoint) noexcept {
    for (const auto& info : BREAKPOINTS) {
        if (info.breakpoint == breakpoint) return info.columns;
    }
    return REFERENCE_COLUMNS;
}

std::string_view to_string(Breakpoint breakpoint) noexcept {
    for (const auto& info : BREAKPOINTS) {
        if (info.breakpoint == breakpoint) return info.name;
    }
    return "lg";
}

Result<std::vector<Widget>> scale_layout(const std::vector<Widget>& widgets,
                                         int from_columns,
                                         int to_columns) {
    if (from_columns <= 0 || to_columns <= 0) {
        return Result<std::vector<Widget>>::err(
            Error::invalid_argument("Column counts must be positive"));
    }
    for (const auto& w : widgets) {
        auto valid = validate_size(w.size);
        if (valid.is_err()) {
            return Result<std::vector<Widget>>::err(valid.unwrap_err());
        }
    }
    if (from_columns == to_columns) {
        return Result<std::vector<Widget>>::ok(widgets);
    }

    std::vector<size_t> order(widgets.size());
    std::iota(order.begin(), order.end(), size_t{0});
    std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        const auto& pa = widgets[a].position;
        const auto& pb = widgets[b].position;
        if (pa.y != pb.y) return pa.y < pb.y;
        return pa.x < pb.x;
    });

    std::vector<Widget> scaled = widgets;

    // Widths per row.
    size_t row_begin = 0;
    while (row_begin < order.size()) {
        size_t row_end = row_begin;
        const int row_y = widgets[order[row_begin]].position.y;
        while (row_end < order.size() && widgets[order[row_end]].position.y == row_y) {
            ++row_end;
        }

        const auto& first = widgets[order[row_begin]];
        const auto& last = widgets[order[row_end - 1]];
        const bool row_fills_width = first.left() == 0 && last.right() == from_columns;

        int current_x = 0;
        for (size_t i = row_begin; i < row_end; ++i) {
            const auto& source = widgets[order[i]];
            auto& target = scaled[order[i]];
            const bool last_in_row = (i + 1 == row_end);
            const int remaining = to_columns - current_x;

            int new_width = std::max(1, scale_dimension(source.size.width, from_columns, to_columns));
            if (row_fills_width && last_in_row) {
                new_width = remaining;
            } else {
                new_width = std::min(new_width, remaining);
            }
            if (source.right() == from_columns && !row_fills_width) {
                new_width = remaining;
            }

            if (new_width < 1) {
                // Row already full; collision resolution below moves it.
                target.position.x = 0;
                target.size.width = std::clamp(
                    scale_dimension(source.size.width, from_columns, to_columns), 1, to_columns);
                continue;
            }

            target.position.x = current_x;
            target.size.width = new_width;
            current_x += new_width;
        }
        row_begin = row_end;
    }

    const auto bounds = GridBounds::with_columns(to_columns);
    std::vector<Widget> placed;
    placed.reserve(scaled.size());

    for (size_t idx : order) {
        auto& widget = scaled[idx];
        if (!fits(widget, placed, bounds)) {
            bool moved = false;
            for (int x = 0; x + widget.size.width <= to_columns; ++x) {
                Widget candidate = widget;
                candidate.position.x = x;
                if (fits(candidate, placed, bounds)) {
                    widget.position.x = x;
                    moved = true;
                    break;
                }
            }
            if (!moved) {
                auto found = find_next_available_position(placed, widget.size, bounds);
                if (found.is_err()) {
                    return Result<std::vector<Widget>>::err(found.unwrap_err());
                }
                if (!found.unwrap()) {
                    return Result<std::vector<Widget>>::err(Error::placement_conflict(
                        "Widget " + widget.id + " does not fit in " +
                        std::to_string(to_columns) + " columns"));
                }
                widget.position = *found.unwrap();
            }
        }
        placed.push_back(widget);
    }

    return Result<std::vector<Widget>>::ok(std::move(scaled));
}

Result<std::vector<Widget>> normalize_to_reference(const std::vector<Widget>& widgets,
                                                   Breakpoint source) {
    const int source_columns = columns_for(source);
    if (source_columns == REFERENCE_COLUMNS) {
        return Result<std::vector<Widget>>::ok(widgets);
    }

    std::vector<Widget> normalized = widgets;
    for (auto& w : normalized) {
        auto valid = validate_size(w.size);
        if (valid.is_err()) {
            return Result<std::vector<Widget>>::err(valid.unwrap_err());
        }
        const int width = std::clamp(
            scale_dimension(w.size.width, source_columns, REFERENCE_COLUMNS), 1, REFERENCE_COLUMNS);
        const int x = std::clamp(
            scale_dimension(w.position.x, source_columns, REFERENCE_COLUMNS), 0, REFERENCE_COLUMNS - width);
        w.position.x = x;
        w.size.width = width;
    }
    return Result<std::vector<Widget>>::ok(std::move(normalized));
}

Result<ResponsiveLayouts> generate_responsive_layouts(const std::vector<Widget>& reference) {
    auto medium = scale_layout(reference, REFERENCE_COLUMNS, columns_for(Breakpoint::Medium));
    if (medium.is_err()) {
        return Result<ResponsiveLayouts>::err(medium.unwrap_err());
    }
    auto small = scale_layout(reference, REFERENCE_COLUMNS, columns_for(Breakpoint::Small));
    if (small.is_err()) {
        return Result<ResponsiveLayouts>::err(small.unwrap_err());
    }

    return Result<ResponsiveLayouts>::ok(ResponsiveLayouts{
        .large = reference,
        .medium = std::move(medium).unwrap(),
        .small = std::move(small).unwrap(),
    });
}

} // namespace offgrid::layout
