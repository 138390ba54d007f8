#pragma once

#include "core/result.hpp"
#include "core/widget.hpp"
#include <string_view>
#include <vector>

namespace offgrid::layout {

enum class Breakpoint {
    Large,
    Medium,
    Small
};

struct BreakpointInfo {
    Breakpoint breakpoint;
    std::string_view name;
    int min_width_px;
    int columns;
};

inline constexpr BreakpointInfo BREAKPOINTS[] = {
    {Breakpoint::Large, "lg", 1200, 12},
    {Breakpoint::Medium, "md", 996, 10},
    {Breakpoint::Small, "sm", 0, 6},
};

// Stored layouts are expressed in the large breakpoint's columns.
inline constexpr int REFERENCE_COLUMNS = 12;

[[nodiscard]] Breakpoint breakpoint_for_width(int width_px) noexcept;

[[nodiscard]] int columns_for(Breakpoint breakpoint) noexcept;

[[nodiscard]] std::string_view to_string(Breakpoint breakpoint) noexcept;

/**
 * Adapt a layout to a different column count.
 *
 * Rows (widgets sharing a y) are laid out left to right with widths scaled
 * proportionally; a row that spanned the full source width still spans the
 * full target width, and a widget touching the right edge keeps touching
 * it. Collisions created by scaling are resolved first-fit.
 */
[[nodiscard]] Result<std::vector<Widget>> scale_layout(const std::vector<Widget>& widgets,
                                                       int from_columns,
                                                       int to_columns);

/**
 * Map a layout edited at `source` back onto the reference columns, scaling
 * x and width proportionally.
 */
[[nodiscard]] Result<std::vector<Widget>> normalize_to_reference(const std::vector<Widget>& widgets,
                                                                 Breakpoint source);

struct ResponsiveLayouts {
    std::vector<Widget> large;
    std::vector<Widget> medium;
    std::vector<Widget> small;
};

[[nodiscard]] Result<ResponsiveLayouts> generate_responsive_layouts(
    const std::vector<Widget>& reference);

} // namespace offgrid::layout
