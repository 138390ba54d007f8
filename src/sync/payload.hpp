#pragma once

#include "core/result.hpp"
#include "core/widget.hpp"
#include <QJsonObject>
#include <optional>
#include <string>

namespace offgrid::sync {

/**
 * Parse a record payload. An empty string is the empty object; anything
 * that is not a JSON object is InvalidArgument.
 */
[[nodiscard]] Result<QJsonObject> parse_payload(const std::string& json);

[[nodiscard]] std::string serialize_payload(const QJsonObject& object);

/**
 * Field-level merge: every top-level key of `newer` replaces the same key
 * of `older`. Nested objects are replaced whole.
 */
[[nodiscard]] QJsonObject merge_payloads(const QJsonObject& older, const QJsonObject& newer);

[[nodiscard]] Result<std::string> merge_payloads(const std::string& older,
                                                 const std::string& newer);

/**
 * Geometry carried by a widget payload, either nested
 *   {"position": {"x": 0, "y": 0}, "size": {"width": 2, "height": 2}}
 * or in the flat layout form {"x": 0, "y": 0, "w": 2, "h": 2}. A size given
 * as a preset name ("small", "wide", ...) takes the preset's dimensions.
 */
struct PayloadGeometry {
    std::optional<GridPosition> position;
    std::optional<GridSize> size;

    [[nodiscard]] bool empty() const { return !position && !size; }
};

/**
 * InvalidGeometry when a geometry field is present but not an integer.
 */
[[nodiscard]] Result<PayloadGeometry> extract_geometry(const QJsonObject& payload);

[[nodiscard]] QJsonObject geometry_to_json(GridPosition position, GridSize size);

/**
 * merge_payloads for widget records. Position and size merge separately,
 * whichever form each side uses: a newer position keeps the older size and
 * the reverse. The result carries geometry in the nested form.
 */
[[nodiscard]] Result<std::string> merge_widget_payloads(const std::string& older,
                                                        const std::string& newer);

} // namespace offgrid::sync
