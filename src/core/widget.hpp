#pragma once

#include "core/types.hpp"
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace offgrid {

/**
 * GridPosition - Top-left cell of a widget.
 */
struct GridPosition {
    int x{0};
    int y{0};

    bool operator==(const GridPosition&) const = default;
};

/**
 * GridSize - Widget extent in grid cells.
 */
struct GridSize {
    int width{1};
    int height{1};

    [[nodiscard]] constexpr bool is_positive() const noexcept {
        return width > 0 && height > 0;
    }
    [[nodiscard]] constexpr int64_t area() const noexcept {
        return static_cast<int64_t>(width) * height;
    }

    bool operator==(const GridSize&) const = default;
};

/**
 * GridBounds - Extent of a layout. An empty dimension is unbounded.
 */
struct GridBounds {
    std::optional<int> columns;
    std::optional<int> rows;

    [[nodiscard]] static constexpr GridBounds fixed(int cols, int rows) {
        return GridBounds{cols, rows};
    }
    [[nodiscard]] static constexpr GridBounds with_columns(int cols) {
        return GridBounds{cols, std::nullopt};
    }
    [[nodiscard]] static constexpr GridBounds unbounded() {
        return GridBounds{};
    }

    [[nodiscard]] constexpr bool is_finite() const noexcept {
        return columns.has_value() && rows.has_value();
    }

    /**
     * Number of cells, only meaningful when is_finite().
     */
    [[nodiscard]] constexpr int64_t capacity() const noexcept {
        return is_finite() ? static_cast<int64_t>(*columns) * *rows : 0;
    }
};

/**
 * Widget - A placed dashboard widget.
 *
 * config_json is opaque type-specific configuration. min_size bounds how
 * far constrain_to_bounds may shrink the widget.
 */
struct Widget {
    std::string id;
    std::string type;
    GridPosition position;
    GridSize size;
    std::optional<GridSize> min_size;
    std::string config_json{"{}"};
    Timestamp created_at;
    bool locked{false};

    [[nodiscard]] constexpr int left() const noexcept { return position.x; }
    [[nodiscard]] constexpr int top() const noexcept { return position.y; }
    [[nodiscard]] constexpr int right() const noexcept { return position.x + size.width; }
    [[nodiscard]] constexpr int bottom() const noexcept { return position.y + size.height; }
};

// Size presets offered when adding a widget.

enum class WidgetSizeClass {
    Small,
    Medium,
    Large,
    Wide,
    Tall
};

struct WidgetSizePreset {
    WidgetSizeClass size_class;
    std::string_view name;
    GridSize size;
    GridSize min_size;
};

inline constexpr std::array<WidgetSizePreset, 5> WIDGET_SIZE_PRESETS = {{
    {WidgetSizeClass::Small, "small", {1, 2}, {1, 2}},
    {WidgetSizeClass::Medium, "medium", {2, 3}, {1, 2}},
    {WidgetSizeClass::Large, "large", {2, 4}, {2, 3}},
    {WidgetSizeClass::Wide, "wide", {3, 2}, {2, 2}},
    {WidgetSizeClass::Tall, "tall", {1, 4}, {1, 3}},
}};

[[nodiscard]] constexpr const WidgetSizePreset& size_preset(WidgetSizeClass size_class) {
    for (const auto& preset : WIDGET_SIZE_PRESETS) {
        if (preset.size_class == size_class) return preset;
    }
    return WIDGET_SIZE_PRESETS[1];
}

[[nodiscard]] inline std::optional<WidgetSizePreset> size_preset(std::string_view name) {
    for (const auto& preset : WIDGET_SIZE_PRESETS) {
        if (preset.name == name) return preset;
    }
    return std::nullopt;
}

/**
 * Closest preset for arbitrary layout dimensions.
 */
[[nodiscard]] constexpr WidgetSizeClass size_class_for_dimensions(int w, int h) noexcept {
    if (w == 1 && h <= 2) return WidgetSizeClass::Small;
    if (w == 1 && h >= 4) return WidgetSizeClass::Tall;
    if (w >= 3 && h <= 2) return WidgetSizeClass::Wide;
    if (w >= 2 && h >= 4) return WidgetSizeClass::Large;
    return WidgetSizeClass::Medium;
}

} // namespace offgrid
