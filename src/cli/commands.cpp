#include "cli/commands.hpp"
#include "sync/payload.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

namespace offgrid::cli {

namespace {

QString qs(std::string_view s) {
    return QString::fromUtf8(s.data(), static_cast<qsizetype>(s.size()));
}

} // namespace

QString format_pending_records(const std::vector<MutationRecord>& records) {
    if (records.empty()) {
        return QStringLiteral("No pending mutations.\n");
    }

    QStringList lines;
    for (const auto& r : records) {
        QString line = QStringLiteral("%1 %2 %3/%4 attempts=%5")
                           .arg(r.id)
                           .arg(qs(to_string(r.operation)), qs(to_string(r.entity_type)),
                                QString::fromStdString(r.entity_id))
                           .arg(r.attempts);
        if (r.last_error) {
            line += QStringLiteral(" error=\"%1\"").arg(QString::fromStdString(*r.last_error));
        }
        line += QLatin1Char(' ') + QString::fromStdString(r.payload_json);
        lines.append(line);
    }
    return lines.join(QLatin1Char('\n')) + QLatin1Char('\n');
}

QString format_pending_records_json(const std::vector<MutationRecord>& records) {
    QJsonArray array;
    for (const auto& r : records) {
        QJsonObject obj{
            {QStringLiteral("id"), static_cast<qint64>(r.id)},
            {QStringLiteral("entityType"), qs(to_string(r.entity_type))},
            {QStringLiteral("entityId"), QString::fromStdString(r.entity_id)},
            {QStringLiteral("operation"), qs(to_string(r.operation))},
            {QStringLiteral("createdAt"), QString::fromStdString(r.created_at.to_iso_string())},
            {QStringLiteral("attempts"), r.attempts},
        };
        auto payload = sync::parse_payload(r.payload_json);
        obj.insert(QStringLiteral("payload"),
                   payload.is_ok() ? QJsonValue(payload.unwrap())
                                   : QJsonValue(QString::fromStdString(r.payload_json)));
        if (r.last_error) {
            obj.insert(QStringLiteral("lastError"), QString::fromStdString(*r.last_error));
        }
        array.append(obj);
    }
    return QString::fromUtf8(QJsonDocument(array).toJson(QJsonDocument::Indented));
}

QString format_sync_result(const sync::SyncResult& result) {
    QString out = QStringLiteral("synced=%1 failed=%2 retrying=%3\n")
                      .arg(result.synced)
                      .arg(result.failed)
                      .arg(result.retrying);
    for (const auto& failure : result.failures) {
        out += QStringLiteral("  #%1 %2/%3: %4\n")
                   .arg(failure.id)
                   .arg(qs(to_string(failure.entity_type)),
                        QString::fromStdString(failure.entity_id),
                        QString::fromStdString(failure.error.describe()));
    }
    return out;
}

Result<MutationRecord> parse_enqueue_args(const QStringList& args) {
    if (args.size() < 3 || args.size() > 4) {
        return Result<MutationRecord>::err(Error::invalid_argument(
            "usage: enqueue <type> <op> <entityId> [payload-json]"));
    }

    const auto type = parse_entity_type(args[0].toStdString());
    if (!type) {
        return Result<MutationRecord>::err(Error::invalid_argument(
            "unknown entity type '" + args[0].toStdString() + "'"));
    }
    const auto op = parse_mutation_op(args[1].toStdString());
    if (!op) {
        return Result<MutationRecord>::err(Error::invalid_argument(
            "unknown operation '" + args[1].toStdString() + "'"));
    }

    const std::string payload = args.size() == 4 ? args[3].toStdString() : std::string("{}");
    auto parsed = sync::parse_payload(payload);
    if (parsed.is_err()) {
        return Result<MutationRecord>::err(parsed.unwrap_err());
    }

    return Result<MutationRecord>::ok(
        make_mutation(*type, args[2].toStdString(), *op, sync::serialize_payload(parsed.unwrap())));
}

Result<GridSize> parse_place_args(const QStringList& args) {
    if (args.size() == 1) {
        const auto preset = size_preset(args[0].toStdString());
        if (!preset) {
            return Result<GridSize>::err(Error::invalid_argument(
                "unknown size preset '" + args[0].toStdString() + "'"));
        }
        return Result<GridSize>::ok(preset->size);
    }
    if (args.size() != 2) {
        return Result<GridSize>::err(Error::invalid_argument("usage: place <w> <h> | place <preset>"));
    }

    bool w_ok = false;
    bool h_ok = false;
    const GridSize size{args[0].toInt(&w_ok), args[1].toInt(&h_ok)};
    if (!w_ok || !h_ok) {
        return Result<GridSize>::err(Error::invalid_argument("width and height must be integers"));
    }
    return Result<GridSize>::ok(size);
}

} // namespace offgrid::cli
