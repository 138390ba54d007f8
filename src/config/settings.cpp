#include "config/settings.hpp"

#include <QDebug>
#include <QDir>
#include <QStandardPaths>
#include <QtGlobal>
#include <chrono>

namespace offgrid::config {

namespace {

int read_int(const QSettings& settings, const char* key, int fallback, int min, int max) {
    const auto name = QString::fromLatin1(key);
    if (!settings.contains(name)) {
        return fallback;
    }
    bool ok = false;
    const int value = settings.value(name).toInt(&ok);
    if (!ok || value < min || value > max) {
        qWarning() << "CONFIG: ignoring" << name << "=" << settings.value(name)
                   << "expected" << min << ".." << max;
        return fallback;
    }
    return value;
}

} // namespace

EngineSettings EngineSettings::load(const QSettings& settings) {
    const EngineSettings defaults;
    EngineSettings s;
    s.queue_path = settings.value(QString::fromLatin1(kSettingsQueuePath)).toString();
    s.request_timeout_ms = read_int(settings, kSettingsRequestTimeout,
                                    defaults.request_timeout_ms, 100, 600000);
    s.max_in_flight = read_int(settings, kSettingsMaxInFlight, defaults.max_in_flight, 1, 64);
    s.max_attempts = read_int(settings, kSettingsMaxAttempts, defaults.max_attempts, 0, 1000);
    s.retry_base_ms = read_int(settings, kSettingsRetryBase, defaults.retry_base_ms, 10, 3600000);
    s.retry_max_ms = read_int(settings, kSettingsRetryMax, defaults.retry_max_ms, 10, 86400000);
    if (s.retry_max_ms < s.retry_base_ms) {
        qWarning() << "CONFIG: retry_max_ms below retry_base_ms, using defaults";
        s.retry_base_ms = defaults.retry_base_ms;
        s.retry_max_ms = defaults.retry_max_ms;
    }
    s.endpoint = settings.value(QString::fromLatin1(kSettingsEndpoint)).toString().trimmed();
    s.layout_columns = read_int(settings, kSettingsLayoutColumns, defaults.layout_columns, 1, 1000);
    s.layout_rows = read_int(settings, kSettingsLayoutRows, defaults.layout_rows, 0, 100000);
    return s;
}

EngineSettings EngineSettings::load() {
    QSettings settings;
    return load(settings);
}

void EngineSettings::save(QSettings& settings) const {
    settings.setValue(QString::fromLatin1(kSettingsQueuePath), queue_path);
    settings.setValue(QString::fromLatin1(kSettingsRequestTimeout), request_timeout_ms);
    settings.setValue(QString::fromLatin1(kSettingsMaxInFlight), max_in_flight);
    settings.setValue(QString::fromLatin1(kSettingsMaxAttempts), max_attempts);
    settings.setValue(QString::fromLatin1(kSettingsRetryBase), retry_base_ms);
    settings.setValue(QString::fromLatin1(kSettingsRetryMax), retry_max_ms);
    settings.setValue(QString::fromLatin1(kSettingsEndpoint), endpoint);
    settings.setValue(QString::fromLatin1(kSettingsLayoutColumns), layout_columns);
    settings.setValue(QString::fromLatin1(kSettingsLayoutRows), layout_rows);
}

QString EngineSettings::resolved_queue_path() const {
    return queue_path.isEmpty() ? default_queue_path() : queue_path;
}

sync::EngineOptions EngineSettings::engine_options() const {
    sync::EngineOptions options;
    options.coordinator.request_timeout = std::chrono::milliseconds(request_timeout_ms);
    options.coordinator.max_in_flight = max_in_flight;
    options.coordinator.max_attempts = max_attempts;
    options.retry.base_delay = std::chrono::milliseconds(retry_base_ms);
    options.retry.max_delay = std::chrono::milliseconds(retry_max_ms);
    return options;
}

GridBounds EngineSettings::grid_bounds() const {
    if (layout_rows > 0) {
        return GridBounds::fixed(layout_columns, layout_rows);
    }
    return GridBounds::with_columns(layout_columns);
}

QString default_queue_path() {
    const auto base = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
    if (base.isEmpty()) {
        return QStringLiteral("offgrid-queue.sqlite");
    }
    return QDir(base).filePath(QStringLiteral("queue.sqlite"));
}

} // namespace offgrid::config
