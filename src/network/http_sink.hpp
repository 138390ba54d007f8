#pragma once

#include "core/mutation.hpp"
#include "core/result.hpp"
#include "sync/remote_sink.hpp"
#include <QByteArray>
#include <QJsonObject>
#include <QObject>
#include <QUrl>
#include <QUrlQuery>
#include <chrono>
#include <optional>

class QNetworkAccessManager;

namespace offgrid::network {

/**
 * HttpRequestPlan - The REST call that replays one mutation.
 */
struct HttpRequestPlan {
    QByteArray method;
    QString path;
    QUrlQuery query;
    std::optional<QJsonObject> body;
};

/**
 * Map a record onto the dashboard API. Combinations the API has no route
 * for, and payloads missing a required field, are RejectedSync errors.
 */
[[nodiscard]] Result<HttpRequestPlan> build_request(const MutationRecord& record);

/**
 * 2xx applied; 408, 425, 429 and 5xx retryable; everything else rejected.
 */
[[nodiscard]] sync::SinkStatus classify_http_status(int status) noexcept;

[[nodiscard]] QUrl request_url(const QUrl& base, const HttpRequestPlan& plan);

/**
 * HttpRemoteSink - RemoteSink backed by the dashboard REST API.
 *
 * Transport errors are retryable. A delete answered with 404 counts as
 * applied, since the entity is already gone.
 */
class HttpRemoteSink : public QObject, public sync::RemoteSink {
    Q_OBJECT

public:
    explicit HttpRemoteSink(QUrl base_url, QObject* parent = nullptr);
    ~HttpRemoteSink() override;

    void apply_mutation(const MutationRecord& record, sync::SinkCompletion completion) override;

    // 0 disables the transfer timeout.
    void set_transfer_timeout(std::chrono::milliseconds timeout) { transfer_timeout_ = timeout; }

    [[nodiscard]] const QUrl& base_url() const { return base_url_; }

private:
    QNetworkAccessManager* network_;
    QUrl base_url_;
    std::chrono::milliseconds transfer_timeout_{0};
};

} // namespace offgrid::network
