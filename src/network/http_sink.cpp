#include "network/http_sink.hpp"
#include "core/widget.hpp"
#include "support/logging.hpp"
#include "sync/payload.hpp"
#include <QJsonArray>
#include <QJsonDocument>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QString>
#include <utility>

namespace offgrid::network {

namespace {

Result<HttpRequestPlan> rejected(const std::string& message) {
    return Result<HttpRequestPlan>::err(Error{ErrorKind::RejectedSync, message});
}

HttpRequestPlan plan(const char* method, const QString& path,
                     std::optional<QJsonObject> body = std::nullopt) {
    HttpRequestPlan p;
    p.method = QByteArray(method);
    p.path = path;
    p.body = std::move(body);
    return p;
}

HttpRequestPlan plan_with_id_query(const char* method, const QString& path, const QString& id) {
    HttpRequestPlan p = plan(method, path);
    p.query.addQueryItem(QStringLiteral("id"), id);
    return p;
}

QJsonObject with_id(QJsonObject payload, const QString& id) {
    if (!payload.contains(QStringLiteral("id"))) {
        payload.insert(QStringLiteral("id"), id);
    }
    return payload;
}

Result<HttpRequestPlan> collection_reorder(const QString& path, const QJsonObject& payload) {
    if (!payload.value(QStringLiteral("orderedIds")).isArray()) {
        return rejected("Reorder payload requires an 'orderedIds' array");
    }
    return Result<HttpRequestPlan>::ok(plan("PUT", path, payload));
}

// The widgets API takes the size preset name plus a {x, y, w, h} layout.
Result<QJsonObject> widget_body(const QJsonObject& payload, const QString& id) {
    auto geometry = sync::extract_geometry(payload);
    if (geometry.is_err()) {
        return Result<QJsonObject>::err(
            Error{ErrorKind::RejectedSync, geometry.unwrap_err().message});
    }

    QJsonObject body = with_id(payload, id);
    const auto& g = geometry.unwrap();
    if (g.empty()) {
        return Result<QJsonObject>::ok(body);
    }

    QJsonObject layout;
    if (g.position) {
        layout.insert(QStringLiteral("x"), g.position->x);
        layout.insert(QStringLiteral("y"), g.position->y);
    }
    if (g.size) {
        layout.insert(QStringLiteral("w"), g.size->width);
        layout.insert(QStringLiteral("h"), g.size->height);
        const auto preset = size_preset(size_class_for_dimensions(g.size->width, g.size->height));
        body.insert(QStringLiteral("size"), QString::fromUtf8(preset.name.data(),
                                                              static_cast<qsizetype>(preset.name.size())));
    }
    for (const auto* key : {"position", "x", "y", "w", "h"}) {
        body.remove(QString::fromLatin1(key));
    }
    body.insert(QStringLiteral("layout"), layout);
    return Result<QJsonObject>::ok(body);
}

Result<HttpRequestPlan> widget_layouts(const QJsonObject& payload, const QString& id) {
    auto geometry = sync::extract_geometry(payload);
    if (geometry.is_err()) {
        return rejected(geometry.unwrap_err().message);
    }
    const auto& g = geometry.unwrap();
    if (!g.position) {
        return rejected("Widget reorder requires a position");
    }

    QJsonObject entry{
        {QStringLiteral("i"), id},
        {QStringLiteral("x"), g.position->x},
        {QStringLiteral("y"), g.position->y},
    };
    if (g.size) {
        entry.insert(QStringLiteral("w"), g.size->width);
        entry.insert(QStringLiteral("h"), g.size->height);
    }
    return Result<HttpRequestPlan>::ok(plan("PATCH", QStringLiteral("/api/widgets/layouts"),
        QJsonObject{{QStringLiteral("layouts"), QJsonArray{entry}}}));
}

// Association ids come from the payload, or from an entity id "linkId:tagId".
std::optional<std::pair<QString, QString>> link_tag_ids(const QJsonObject& payload,
                                                        const std::string& entity_id) {
    auto link_id = payload.value(QStringLiteral("linkId")).toString();
    auto tag_id = payload.value(QStringLiteral("tagId")).toString();
    if (link_id.isEmpty() || tag_id.isEmpty()) {
        const auto parts = QString::fromStdString(entity_id).split(QLatin1Char(':'));
        if (parts.size() == 2) {
            if (link_id.isEmpty()) link_id = parts[0];
            if (tag_id.isEmpty()) tag_id = parts[1];
        }
    }
    if (link_id.isEmpty() || tag_id.isEmpty()) {
        return std::nullopt;
    }
    return std::make_pair(link_id, tag_id);
}

std::string reply_error_message(const QByteArray& body, int status) {
    const auto doc = QJsonDocument::fromJson(body);
    if (doc.isObject()) {
        const auto error = doc.object().value(QStringLiteral("error")).toString();
        if (!error.isEmpty()) {
            return "HTTP " + std::to_string(status) + ": " + error.toStdString();
        }
    }
    return "HTTP " + std::to_string(status);
}

} // namespace

Result<HttpRequestPlan> build_request(const MutationRecord& record) {
    auto parsed = sync::parse_payload(record.payload_json);
    if (parsed.is_err()) {
        return rejected(parsed.unwrap_err().message);
    }
    const auto payload = parsed.unwrap();
    const auto id = QString::fromStdString(record.entity_id);
    const auto encoded_id = QString::fromLatin1(QUrl::toPercentEncoding(id));

    switch (record.entity_type) {
        case EntityType::Link:
            switch (record.operation) {
                case MutationOp::Create:
                    return Result<HttpRequestPlan>::ok(
                        plan("POST", QStringLiteral("/api/links"), with_id(payload, id)));
                case MutationOp::Update:
                    return Result<HttpRequestPlan>::ok(
                        plan("PATCH", QStringLiteral("/api/links/") + encoded_id, payload));
                case MutationOp::Delete:
                    return Result<HttpRequestPlan>::ok(
                        plan("DELETE", QStringLiteral("/api/links/") + encoded_id));
                case MutationOp::Reorder:
                    return collection_reorder(QStringLiteral("/api/links/reorder"), payload);
            }
            break;

        case EntityType::Category:
            switch (record.operation) {
                case MutationOp::Create:
                    return Result<HttpRequestPlan>::ok(
                        plan("POST", QStringLiteral("/api/categories"), with_id(payload, id)));
                case MutationOp::Update:
                    return Result<HttpRequestPlan>::ok(
                        plan("PATCH", QStringLiteral("/api/categories"), with_id(payload, id)));
                case MutationOp::Delete:
                    return Result<HttpRequestPlan>::ok(
                        plan_with_id_query("DELETE", QStringLiteral("/api/categories"), id));
                case MutationOp::Reorder:
                    return collection_reorder(QStringLiteral("/api/categories/reorder"), payload);
            }
            break;

        case EntityType::Tag:
            switch (record.operation) {
                case MutationOp::Create:
                    return Result<HttpRequestPlan>::ok(
                        plan("POST", QStringLiteral("/api/tags"), with_id(payload, id)));
                case MutationOp::Update:
                    return Result<HttpRequestPlan>::ok(
                        plan("PUT", QStringLiteral("/api/tags"), with_id(payload, id)));
                case MutationOp::Delete:
                    return Result<HttpRequestPlan>::ok(
                        plan_with_id_query("DELETE", QStringLiteral("/api/tags"), id));
                case MutationOp::Reorder:
                    return collection_reorder(QStringLiteral("/api/tags/reorder"), payload);
            }
            break;

        case EntityType::Widget:
            switch (record.operation) {
                case MutationOp::Create:
                case MutationOp::Update: {
                    auto body = widget_body(payload, id);
                    if (body.is_err()) {
                        return Result<HttpRequestPlan>::err(body.unwrap_err());
                    }
                    const char* method = record.operation == MutationOp::Create ? "POST" : "PATCH";
                    return Result<HttpRequestPlan>::ok(
                        plan(method, QStringLiteral("/api/widgets"), std::move(body).unwrap()));
                }
                case MutationOp::Delete:
                    return Result<HttpRequestPlan>::ok(
                        plan_with_id_query("DELETE", QStringLiteral("/api/widgets"), id));
                case MutationOp::Reorder:
                    return widget_layouts(payload, id);
            }
            break;

        case EntityType::LinkTag: {
            const auto ids = link_tag_ids(payload, record.entity_id);
            if (!ids) {
                return rejected("Link-tag mutation requires linkId and tagId");
            }
            if (record.operation == MutationOp::Create) {
                return Result<HttpRequestPlan>::ok(plan("POST", QStringLiteral("/api/tags/link"),
                    QJsonObject{{QStringLiteral("linkId"), ids->first},
                                {QStringLiteral("tagId"), ids->second}}));
            }
            if (record.operation == MutationOp::Delete) {
                HttpRequestPlan p = plan("DELETE", QStringLiteral("/api/tags/link"));
                p.query.addQueryItem(QStringLiteral("linkId"), ids->first);
                p.query.addQueryItem(QStringLiteral("tagId"), ids->second);
                return Result<HttpRequestPlan>::ok(std::move(p));
            }
            break;
        }
    }

    return rejected("No route for " + std::string(to_string(record.operation)) + " of " +
                    std::string(to_string(record.entity_type)));
}

sync::SinkStatus classify_http_status(int status) noexcept {
    if (status >= 200 && status < 300) {
        return sync::SinkStatus::Applied;
    }
    if (status == 408 || status == 425 || status == 429 || (status >= 500 && status < 600)) {
        return sync::SinkStatus::Retryable;
    }
    return sync::SinkStatus::Rejected;
}

QUrl request_url(const QUrl& base, const HttpRequestPlan& plan) {
    QUrl url = base;
    QString path = url.path();
    if (path.endsWith(QLatin1Char('/'))) {
        path.chop(1);
    }
    url.setPath(path + plan.path, QUrl::TolerantMode);
    if (!plan.query.isEmpty()) {
        url.setQuery(plan.query);
    }
    return url;
}

HttpRemoteSink::HttpRemoteSink(QUrl base_url, QObject* parent)
    : QObject(parent)
    , network_(new QNetworkAccessManager(this))
    , base_url_(std::move(base_url))
{
}

HttpRemoteSink::~HttpRemoteSink() = default;

void HttpRemoteSink::apply_mutation(const MutationRecord& record, sync::SinkCompletion completion) {
    auto plan_result = build_request(record);
    if (plan_result.is_err()) {
        qCWarning(offgridNetLog) << "no request for record" << record.id << ":"
                                 << QString::fromStdString(plan_result.unwrap_err().message);
        completion(sync::SinkOutcome::rejected(plan_result.unwrap_err().message));
        return;
    }
    const auto plan = std::move(plan_result).unwrap();

    QNetworkRequest request(request_url(base_url_, plan));
    request.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("application/json"));
    request.setRawHeader("X-Offgrid-Mutation-Id", QByteArray::number(static_cast<qlonglong>(record.id)));
    if (transfer_timeout_.count() > 0) {
        request.setTransferTimeout(static_cast<int>(transfer_timeout_.count()));
    }

    const QByteArray body = plan.body ? QJsonDocument(*plan.body).toJson(QJsonDocument::Compact)
                                      : QByteArray{};
    qCDebug(offgridNetLog) << plan.method << request.url().toString() << "record" << record.id;

    QNetworkReply* reply = network_->sendCustomRequest(request, plan.method, body);
    const bool is_delete = record.operation == MutationOp::Delete;
    connect(reply, &QNetworkReply::finished, this,
            [reply, is_delete, completion = std::move(completion)]() {
        reply->deleteLater();

        const auto status_attr = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);
        if (!status_attr.isValid()) {
            qCInfo(offgridNetLog) << "transport error:" << reply->errorString();
            completion(sync::SinkOutcome::retryable(
                "Network error: " + reply->errorString().toStdString(),
                static_cast<int>(reply->error())));
            return;
        }

        const int status = status_attr.toInt();
        if (is_delete && status == 404) {
            completion(sync::SinkOutcome::applied());
            return;
        }

        switch (classify_http_status(status)) {
            case sync::SinkStatus::Applied:
                completion(sync::SinkOutcome::applied());
                return;
            case sync::SinkStatus::Retryable:
                completion(sync::SinkOutcome::retryable(
                    reply_error_message(reply->readAll(), status), status));
                return;
            case sync::SinkStatus::Rejected:
                completion(sync::SinkOutcome::rejected(
                    reply_error_message(reply->readAll(), status), status));
                return;
        }
    });
}

} // namespace offgrid::network
