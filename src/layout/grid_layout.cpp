#include "layout/grid_layout.hpp"
#include <algorithm>
#include <numeric>

namespace offgrid::layout {

namespace {

struct Rect {
    GridPosition position;
    GridSize size;
};

Rect rect_of(const Widget& w) {
    return Rect{w.position, w.size};
}

bool collides(const Rect& candidate, const std::vector<Rect>& obstacles) {
    return std::any_of(obstacles.begin(), obstacles.end(), [&](const Rect& r) {
        return overlaps(candidate.position, candidate.size, r.position, r.size);
    });
}

int max_bottom(const std::vector<Rect>& rects) {
    int bottom = 0;
    for (const auto& r : rects) {
        bottom = std::max(bottom, r.position.y + r.size.height);
    }
    return bottom;
}

int max_right(const std::vector<Rect>& rects) {
    int right = 0;
    for (const auto& r : rects) {
        right = std::max(right, r.position.x + r.size.width);
    }
    return right;
}

std::optional<GridPosition> first_fit(const std::vector<Rect>& obstacles,
                                      GridSize size,
                                      const GridBounds& bounds) {
    if (bounds.columns && size.width > *bounds.columns) return std::nullopt;
    if (bounds.rows && size.height > *bounds.rows) return std::nullopt;

    const int x_max = bounds.columns ? *bounds.columns - size.width : max_right(obstacles);
    const int y_max = bounds.rows ? *bounds.rows - size.height : max_bottom(obstacles);

    for (int y = 0; y <= y_max; ++y) {
        for (int x = 0; x <= x_max; ++x) {
            const Rect candidate{{x, y}, size};
            if (!collides(candidate, obstacles)) {
                return GridPosition{x, y};
            }
        }
    }
    return std::nullopt;
}

Result<void> validate_all(const std::vector<Widget>& widgets) {
    for (const auto& w : widgets) {
        if (!w.size.is_positive()) {
            return Result<void>::err(Error::invalid_geometry(
                "Widget " + w.id + " has non-positive size " +
                std::to_string(w.size.width) + "x" + std::to_string(w.size.height)));
        }
    }
    return Result<void>::ok();
}

} // namespace

bool overlaps(GridPosition pa, GridSize sa, GridPosition pb, GridSize sb) noexcept {
    if (!sa.is_positive() || !sb.is_positive()) return false;
    return !(pa.x + sa.width <= pb.x ||
             pb.x + sb.width <= pa.x ||
             pa.y + sa.height <= pb.y ||
             pb.y + sb.height <= pa.y);
}

bool overlaps(const Widget& a, const Widget& b) noexcept {
    return overlaps(a.position, a.size, b.position, b.size);
}

bool is_within_bounds(GridPosition position, GridSize size, const GridBounds& bounds) noexcept {
    if (!size.is_positive()) return false;
    if (position.x < 0 || position.y < 0) return false;
    if (bounds.columns && position.x + size.width > *bounds.columns) return false;
    if (bounds.rows && position.y + size.height > *bounds.rows) return false;
    return true;
}

bool is_within_bounds(const Widget& widget, const GridBounds& bounds) noexcept {
    return is_within_bounds(widget.position, widget.size, bounds);
}

Result<void> validate_size(GridSize size) {
    if (!size.is_positive()) {
        return Result<void>::err(Error::invalid_geometry(
            "Size must be positive, got " + std::to_string(size.width) + "x" +
            std::to_string(size.height)));
    }
    return Result<void>::ok();
}

bool is_valid_layout(const std::vector<Widget>& widgets, const GridBounds& bounds) noexcept {
    for (size_t i = 0; i < widgets.size(); ++i) {
        if (!is_within_bounds(widgets[i], bounds)) return false;
        for (size_t j = i + 1; j < widgets.size(); ++j) {
            if (overlaps(widgets[i], widgets[j])) return false;
        }
    }
    return true;
}

Result<std::optional<GridPosition>> find_next_available_position(
    const std::vector<Widget>& existing,
    GridSize size,
    const GridBounds& bounds
) {
    auto valid = validate_size(size);
    if (valid.is_err()) {
        return Result<std::optional<GridPosition>>::err(valid.unwrap_err());
    }

    std::vector<Rect> obstacles;
    obstacles.reserve(existing.size());
    for (const auto& w : existing) {
        obstacles.push_back(rect_of(w));
    }
    return Result<std::optional<GridPosition>>::ok(first_fit(obstacles, size, bounds));
}

Result<std::vector<Widget>> compact(std::vector<Widget> widgets, const GridBounds& bounds) {
    auto valid = validate_all(widgets);
    if (valid.is_err()) {
        return Result<std::vector<Widget>>::err(valid.unwrap_err());
    }

    std::vector<size_t> order(widgets.size());
    std::iota(order.begin(), order.end(), size_t{0});
    std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        const auto& pa = widgets[a].position;
        const auto& pb = widgets[b].position;
        if (pa.y != pb.y) return pa.y < pb.y;
        return pa.x < pb.x;
    });

    std::vector<bool> processed(widgets.size(), false);
    std::vector<Rect> placed;
    placed.reserve(widgets.size());

    auto obstacles_for = [&](size_t self) {
        std::vector<Rect> obstacles = placed;
        for (size_t i = 0; i < widgets.size(); ++i) {
            if (i != self && !processed[i]) {
                obstacles.push_back(rect_of(widgets[i]));
            }
        }
        return obstacles;
    };

    for (size_t idx : order) {
        auto& widget = widgets[idx];
        const auto obstacles = obstacles_for(idx);
        const auto origin = widget.position;
        const auto size = widget.size;

        const int x_limit = bounds.columns ? *bounds.columns - size.width : std::max(origin.x, 0);
        const int y_limit = std::max(origin.y, 0);

        std::optional<GridPosition> target;
        for (int y = 0; y <= y_limit && !target; ++y) {
            const int row_x_limit = (y == origin.y) ? std::min(origin.x, x_limit) : x_limit;
            for (int x = 0; x <= row_x_limit; ++x) {
                const Rect candidate{{x, y}, size};
                if (is_within_bounds(candidate.position, size, bounds) &&
                    !collides(candidate, obstacles)) {
                    target = GridPosition{x, y};
                    break;
                }
            }
        }

        // Only reachable when the input already violated the invariants.
        if (!target) {
            target = first_fit(obstacles, size, bounds);
        }
        if (!target) {
            return Result<std::vector<Widget>>::err(Error::placement_conflict(
                "No room for widget " + widget.id + " while compacting"));
        }

        widget.position = *target;
        placed.push_back(rect_of(widget));
        processed[idx] = true;
    }

    return Result<std::vector<Widget>>::ok(std::move(widgets));
}

Result<ConstrainResult> constrain_to_bounds(std::vector<Widget> widgets, const GridBounds& bounds) {
    auto valid = validate_all(widgets);
    if (valid.is_err()) {
        return Result<ConstrainResult>::err(valid.unwrap_err());
    }

    std::vector<bool> accepted(widgets.size(), false);
    std::vector<Widget> placed;

    auto free_of_collisions = [&](const Widget& w) {
        return std::none_of(placed.begin(), placed.end(),
                            [&](const Widget& p) { return overlaps(p, w); });
    };

    for (size_t i = 0; i < widgets.size(); ++i) {
        if (is_within_bounds(widgets[i], bounds) && free_of_collisions(widgets[i])) {
            accepted[i] = true;
            placed.push_back(widgets[i]);
        }
    }

    ConstrainResult result;
    for (size_t i = 0; i < widgets.size(); ++i) {
        if (accepted[i]) continue;
        auto& w = widgets[i];

        GridSize minimum = w.min_size.value_or(GridSize{1, 1});
        minimum.width = std::clamp(minimum.width, 1, w.size.width);
        minimum.height = std::clamp(minimum.height, 1, w.size.height);

        GridSize size = w.size;
        if (bounds.columns) size.width = std::min(size.width, *bounds.columns);
        if (bounds.rows) size.height = std::min(size.height, *bounds.rows);
        if (size.width < minimum.width || size.height < minimum.height) {
            result.omitted.push_back(w.id);
            continue;
        }

        GridPosition pos = w.position;
        pos.x = bounds.columns ? std::clamp(pos.x, 0, *bounds.columns - size.width)
                               : std::max(pos.x, 0);
        pos.y = bounds.rows ? std::clamp(pos.y, 0, *bounds.rows - size.height)
                            : std::max(pos.y, 0);

        w.position = pos;
        w.size = size;
        if (!free_of_collisions(w)) {
            std::optional<GridPosition> relocated;
            for (GridSize attempt : {size, minimum}) {
                auto found = find_next_available_position(placed, attempt, bounds);
                if (found.is_ok() && found.unwrap()) {
                    relocated = *found.unwrap();
                    w.size = attempt;
                    break;
                }
            }
            if (!relocated) {
                result.omitted.push_back(w.id);
                continue;
            }
            w.position = *relocated;
        }

        accepted[i] = true;
        placed.push_back(w);
    }

    for (size_t i = 0; i < widgets.size(); ++i) {
        if (accepted[i]) {
            result.widgets.push_back(std::move(widgets[i]));
        }
    }
    return Result<ConstrainResult>::ok(std::move(result));
}

int64_t total_area(const std::vector<Widget>& widgets) noexcept {
    int64_t total = 0;
    for (const auto& w : widgets) {
        total += w.size.area();
    }
    return total;
}

std::vector<Widget> sort_by_position(std::vector<Widget> widgets) {
    std::stable_sort(widgets.begin(), widgets.end(), [](const Widget& a, const Widget& b) {
        if (a.position.y != b.position.y) return a.position.y < b.position.y;
        return a.position.x < b.position.x;
    });
    return widgets;
}

} // namespace offgrid::layout
