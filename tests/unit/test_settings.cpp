#include <catch2/catch_test_macros.hpp>

#include <QDir>
#include <QFile>
#include <QSettings>

#include "config/settings.hpp"

using namespace offgrid;
using namespace offgrid::config;

namespace {

QString settings_file(const char* name) {
    const auto path = QDir::temp().filePath(QString::fromLatin1(name));
    QFile::remove(path);
    return path;
}

} // namespace

TEST_CASE("EngineSettings: defaults when nothing is stored", "[config]") {
    QSettings settings(settings_file("offgrid_settings_defaults.ini"), QSettings::IniFormat);
    const auto s = EngineSettings::load(settings);

    REQUIRE(s.queue_path.isEmpty());
    REQUIRE(s.request_timeout_ms == 15000);
    REQUIRE(s.max_in_flight == 4);
    REQUIRE(s.max_attempts == 0);
    REQUIRE(s.retry_base_ms == 2000);
    REQUIRE(s.retry_max_ms == 60000);
    REQUIRE(s.endpoint.isEmpty());

    const auto bounds = s.grid_bounds();
    REQUIRE(bounds.columns == std::optional<int>(12));
    REQUIRE_FALSE(bounds.rows.has_value());
    REQUIRE_FALSE(s.resolved_queue_path().isEmpty());
}

TEST_CASE("EngineSettings: save and load round trip", "[config]") {
    QSettings settings(settings_file("offgrid_settings_roundtrip.ini"), QSettings::IniFormat);

    EngineSettings s;
    s.queue_path = QStringLiteral("/tmp/offgrid/queue.sqlite");
    s.request_timeout_ms = 3000;
    s.max_in_flight = 1;
    s.max_attempts = 5;
    s.retry_base_ms = 500;
    s.retry_max_ms = 8000;
    s.endpoint = QStringLiteral("https://dash.example");
    s.layout_columns = 6;
    s.layout_rows = 8;
    s.save(settings);

    const auto loaded = EngineSettings::load(settings);
    REQUIRE(loaded.resolved_queue_path() == QStringLiteral("/tmp/offgrid/queue.sqlite"));
    REQUIRE(loaded.endpoint == QStringLiteral("https://dash.example"));

    const auto options = loaded.engine_options();
    REQUIRE(options.coordinator.request_timeout == std::chrono::milliseconds(3000));
    REQUIRE(options.coordinator.max_in_flight == 1);
    REQUIRE(options.coordinator.max_attempts == 5);
    REQUIRE(options.retry.base_delay == std::chrono::milliseconds(500));
    REQUIRE(options.retry.max_delay == std::chrono::milliseconds(8000));

    const auto bounds = loaded.grid_bounds();
    REQUIRE(bounds.is_finite());
    REQUIRE(bounds.capacity() == 48);
}

TEST_CASE("EngineSettings: out-of-range values fall back", "[config]") {
    QSettings settings(settings_file("offgrid_settings_invalid.ini"), QSettings::IniFormat);
    settings.setValue(QString::fromLatin1(kSettingsMaxInFlight), 0);
    settings.setValue(QString::fromLatin1(kSettingsRequestTimeout), QStringLiteral("soon"));
    settings.setValue(QString::fromLatin1(kSettingsRetryBase), 90000);
    settings.setValue(QString::fromLatin1(kSettingsRetryMax), 1000);
    settings.setValue(QString::fromLatin1(kSettingsEndpoint), QStringLiteral("  https://x.example  "));

    const auto s = EngineSettings::load(settings);
    REQUIRE(s.max_in_flight == 4);
    REQUIRE(s.request_timeout_ms == 15000);
    REQUIRE(s.retry_base_ms == 2000);
    REQUIRE(s.retry_max_ms == 60000);
    REQUIRE(s.endpoint == QStringLiteral("https://x.example"));
}
