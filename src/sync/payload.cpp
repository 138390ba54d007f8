#include "sync/payload.hpp"

#include <QByteArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QJsonValue>
#include <QString>
#include <cmath>
#include <utility>

namespace offgrid::sync {

namespace {

// JSON numbers arrive as doubles; only exact integers are grid coordinates.
Result<std::optional<int>> read_int(const QJsonObject& obj, const QString& key) {
    const auto value = obj.value(key);
    if (value.isUndefined() || value.isNull()) {
        return Result<std::optional<int>>::ok(std::nullopt);
    }
    if (!value.isDouble()) {
        return Result<std::optional<int>>::err(Error::invalid_geometry(
            "Field '" + key.toStdString() + "' is not a number"));
    }
    const double d = value.toDouble();
    if (std::trunc(d) != d || std::abs(d) > 1e9) {
        return Result<std::optional<int>>::err(Error::invalid_geometry(
            "Field '" + key.toStdString() + "' is not an integer"));
    }
    return Result<std::optional<int>>::ok(static_cast<int>(d));
}

Result<std::optional<std::pair<int, int>>> read_pair(const QJsonObject& obj,
                                                     const QString& first,
                                                     const QString& second) {
    using PairResult = Result<std::optional<std::pair<int, int>>>;
    auto a = read_int(obj, first);
    if (a.is_err()) return PairResult::err(a.unwrap_err());
    auto b = read_int(obj, second);
    if (b.is_err()) return PairResult::err(b.unwrap_err());

    const auto& av = a.unwrap();
    const auto& bv = b.unwrap();
    if (!av && !bv) {
        return PairResult::ok(std::nullopt);
    }
    if (!av || !bv) {
        return PairResult::err(Error::invalid_geometry(
            "Expected both '" + first.toStdString() + "' and '" + second.toStdString() + "'"));
    }
    return PairResult::ok(std::make_pair(*av, *bv));
}

} // namespace

Result<QJsonObject> parse_payload(const std::string& json) {
    if (json.empty()) {
        return Result<QJsonObject>::ok(QJsonObject{});
    }

    QJsonParseError err{};
    const auto doc = QJsonDocument::fromJson(
        QByteArray(json.data(), static_cast<qsizetype>(json.size())), &err);
    if (err.error != QJsonParseError::NoError) {
        return Result<QJsonObject>::err(Error::invalid_argument(
            "Payload is not valid JSON: " + err.errorString().toStdString()));
    }
    if (!doc.isObject()) {
        return Result<QJsonObject>::err(Error::invalid_argument("Payload must be a JSON object"));
    }
    return Result<QJsonObject>::ok(doc.object());
}

std::string serialize_payload(const QJsonObject& object) {
    return QJsonDocument(object).toJson(QJsonDocument::Compact).toStdString();
}

QJsonObject merge_payloads(const QJsonObject& older, const QJsonObject& newer) {
    QJsonObject merged = older;
    for (auto it = newer.begin(); it != newer.end(); ++it) {
        merged.insert(it.key(), it.value());
    }
    return merged;
}

Result<std::string> merge_payloads(const std::string& older, const std::string& newer) {
    auto a = parse_payload(older);
    if (a.is_err()) return Result<std::string>::err(a.unwrap_err());
    auto b = parse_payload(newer);
    if (b.is_err()) return Result<std::string>::err(b.unwrap_err());
    return Result<std::string>::ok(serialize_payload(merge_payloads(a.unwrap(), b.unwrap())));
}

Result<PayloadGeometry> extract_geometry(const QJsonObject& payload) {
    PayloadGeometry geometry;

    const auto position = payload.value(QStringLiteral("position"));
    if (position.isObject()) {
        auto xy = read_pair(position.toObject(), QStringLiteral("x"), QStringLiteral("y"));
        if (xy.is_err()) return Result<PayloadGeometry>::err(xy.unwrap_err());
        if (xy.unwrap()) {
            geometry.position = GridPosition{xy.unwrap()->first, xy.unwrap()->second};
        }
    } else if (!position.isUndefined() && !position.isNull()) {
        return Result<PayloadGeometry>::err(Error::invalid_geometry("'position' must be an object"));
    } else {
        auto xy = read_pair(payload, QStringLiteral("x"), QStringLiteral("y"));
        if (xy.is_err()) return Result<PayloadGeometry>::err(xy.unwrap_err());
        if (xy.unwrap()) {
            geometry.position = GridPosition{xy.unwrap()->first, xy.unwrap()->second};
        }
    }

    const auto size = payload.value(QStringLiteral("size"));
    if (size.isObject()) {
        auto wh = read_pair(size.toObject(), QStringLiteral("width"), QStringLiteral("height"));
        if (wh.is_err()) return Result<PayloadGeometry>::err(wh.unwrap_err());
        if (wh.unwrap()) {
            geometry.size = GridSize{wh.unwrap()->first, wh.unwrap()->second};
        }
    } else if (size.isString()) {
        const auto preset = size_preset(size.toString().toStdString());
        if (!preset) {
            return Result<PayloadGeometry>::err(Error::invalid_geometry(
                "Unknown size preset '" + size.toString().toStdString() + "'"));
        }
        geometry.size = preset->size;
    } else if (!size.isUndefined() && !size.isNull()) {
        return Result<PayloadGeometry>::err(Error::invalid_geometry(
            "'size' must be an object or a preset name"));
    } else {
        auto wh = read_pair(payload, QStringLiteral("w"), QStringLiteral("h"));
        if (wh.is_err()) return Result<PayloadGeometry>::err(wh.unwrap_err());
        if (wh.unwrap()) {
            geometry.size = GridSize{wh.unwrap()->first, wh.unwrap()->second};
        }
    }

    return Result<PayloadGeometry>::ok(geometry);
}

QJsonObject geometry_to_json(GridPosition position, GridSize size) {
    return QJsonObject{
        {QStringLiteral("position"), QJsonObject{{QStringLiteral("x"), position.x},
                                                 {QStringLiteral("y"), position.y}}},
        {QStringLiteral("size"), QJsonObject{{QStringLiteral("width"), size.width},
                                             {QStringLiteral("height"), size.height}}},
    };
}

Result<std::string> merge_widget_payloads(const std::string& older, const std::string& newer) {
    auto a = parse_payload(older);
    if (a.is_err()) return Result<std::string>::err(a.unwrap_err());
    auto b = parse_payload(newer);
    if (b.is_err()) return Result<std::string>::err(b.unwrap_err());

    auto older_geometry = extract_geometry(a.unwrap());
    if (older_geometry.is_err()) return Result<std::string>::err(older_geometry.unwrap_err());
    auto newer_geometry = extract_geometry(b.unwrap());
    if (newer_geometry.is_err()) return Result<std::string>::err(newer_geometry.unwrap_err());

    const auto& og = older_geometry.unwrap();
    const auto& ng = newer_geometry.unwrap();
    const auto position = ng.position ? ng.position : og.position;
    const auto size = ng.size ? ng.size : og.size;

    QJsonObject merged = merge_payloads(a.unwrap(), b.unwrap());
    for (const auto* key : {"position", "size", "x", "y", "w", "h"}) {
        merged.remove(QString::fromLatin1(key));
    }
    if (position) {
        merged.insert(QStringLiteral("position"),
                      QJsonObject{{QStringLiteral("x"), position->x},
                                  {QStringLiteral("y"), position->y}});
    }
    if (size) {
        merged.insert(QStringLiteral("size"),
                      QJsonObject{{QStringLiteral("width"), size->width},
                                  {QStringLiteral("height"), size->height}});
    }
    return Result<std::string>::ok(serialize_payload(merged));
}

} // namespace offgrid::sync
