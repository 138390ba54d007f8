#pragma once

#include "core/result.hpp"
#include "core/widget.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace offgrid::layout {

/**
 * Grid layout engine.
 *
 * Stateless functions over a widget list and a bounds descriptor. Nothing
 * here keeps a reference to the widgets it is given.
 *
 * Invariant maintained by every function that produces a layout:
 * - no two widgets intersect on a nonzero area
 * - every widget lies inside the bounds (finite dimensions only)
 */

/**
 * True iff the rectangles intersect on a nonzero area. Widgets that only
 * share an edge do not overlap.
 */
[[nodiscard]] bool overlaps(const Widget& a, const Widget& b) noexcept;

[[nodiscard]] bool overlaps(GridPosition pa, GridSize sa,
                            GridPosition pb, GridSize sb) noexcept;

[[nodiscard]] bool is_within_bounds(const Widget& widget, const GridBounds& bounds) noexcept;

[[nodiscard]] bool is_within_bounds(GridPosition position, GridSize size,
                                    const GridBounds& bounds) noexcept;

/**
 * InvalidGeometry unless both dimensions are positive.
 */
[[nodiscard]] Result<void> validate_size(GridSize size);

/**
 * True when the layout satisfies the overlap and bounds invariants.
 */
[[nodiscard]] bool is_valid_layout(const std::vector<Widget>& widgets,
                                   const GridBounds& bounds) noexcept;

/**
 * First-fit placement: scans origins row by row, left to right, and
 * returns the first one where a widget of `size` stays inside `bounds`
 * and overlaps nothing in `existing`. nullopt when no such origin exists.
 *
 * Unbounded rows extend the scan to the bottom edge of `existing`, so a
 * position is always found there when the width fits.
 */
[[nodiscard]] Result<std::optional<GridPosition>> find_next_available_position(
    const std::vector<Widget>& existing,
    GridSize size,
    const GridBounds& bounds);

/**
 * Re-flow widgets up and to the left. Widgets are processed in row-major
 * order of their current origin; each takes the first row-major origin at
 * or before its own that collides neither with widgets already placed nor
 * with the current rectangles of widgets still waiting. Sizes never change,
 * so total area is preserved. Output keeps the input order.
 */
[[nodiscard]] Result<std::vector<Widget>> compact(std::vector<Widget> widgets,
                                                  const GridBounds& bounds);

struct ConstrainResult {
    std::vector<Widget> widgets;
    std::vector<std::string> omitted;  // ids of widgets that could not fit
};

/**
 * Bring every widget inside `bounds`. Widgets already inside and free of
 * collisions are untouched; the rest are shrunk (down to min_size, 1x1 by
 * default), clamped, and relocated first-fit when they still collide.
 */
[[nodiscard]] Result<ConstrainResult> constrain_to_bounds(std::vector<Widget> widgets,
                                                          const GridBounds& bounds);

/**
 * Sum of width*height.
 */
[[nodiscard]] int64_t total_area(const std::vector<Widget>& widgets) noexcept;

/**
 * Stable sort by (y, x).
 */
[[nodiscard]] std::vector<Widget> sort_by_position(std::vector<Widget> widgets);

} // namespace offgrid::layout
