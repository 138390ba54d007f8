#pragma once

#include "core/widget.hpp"
#include "sync/offline_engine.hpp"
#include <QSettings>
#include <QString>

namespace offgrid::config {

inline constexpr const char* kSettingsQueuePath = "storage/queue_path";
inline constexpr const char* kSettingsRequestTimeout = "sync/request_timeout_ms";
inline constexpr const char* kSettingsMaxInFlight = "sync/max_in_flight";
inline constexpr const char* kSettingsMaxAttempts = "sync/max_attempts";
inline constexpr const char* kSettingsRetryBase = "sync/retry_base_ms";
inline constexpr const char* kSettingsRetryMax = "sync/retry_max_ms";
inline constexpr const char* kSettingsEndpoint = "sync/endpoint";
inline constexpr const char* kSettingsLayoutColumns = "layout/columns";
inline constexpr const char* kSettingsLayoutRows = "layout/rows";

/**
 * EngineSettings - Persisted configuration of the offline engine.
 *
 * Values missing from QSettings, or outside their valid range, fall back to
 * the defaults below.
 */
struct EngineSettings {
    QString queue_path;  // empty: default_queue_path()
    int request_timeout_ms = 15000;
    int max_in_flight = 4;
    int max_attempts = 0;  // 0 = unlimited
    int retry_base_ms = 2000;
    int retry_max_ms = 60000;
    QString endpoint;
    int layout_columns = 12;
    int layout_rows = 0;  // 0 = unbounded

    [[nodiscard]] static EngineSettings load(const QSettings& settings);
    [[nodiscard]] static EngineSettings load();
    void save(QSettings& settings) const;

    [[nodiscard]] QString resolved_queue_path() const;
    [[nodiscard]] sync::EngineOptions engine_options() const;
    [[nodiscard]] GridBounds grid_bounds() const;
};

[[nodiscard]] QString default_queue_path();

} // namespace offgrid::config
