#pragma once

#include <chrono>
#include <compare>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace offgrid {

/**
 * Timestamp - Wall-clock instant in milliseconds since the Unix epoch.
 *
 * Stored as INTEGER in SQLite. Used for diagnostics only; queue order
 * comes from record ids, never from timestamps.
 */
class Timestamp {
public:
    using Duration = std::chrono::milliseconds;
    using Clock = std::chrono::system_clock;

    constexpr Timestamp() noexcept : millis_(0) {}
    explicit constexpr Timestamp(int64_t millis) noexcept : millis_(millis) {}

    [[nodiscard]] static Timestamp now() {
        return Timestamp(std::chrono::duration_cast<Duration>(
            Clock::now().time_since_epoch()).count());
    }

    [[nodiscard]] constexpr int64_t millis() const noexcept { return millis_; }

    [[nodiscard]] constexpr bool is_epoch() const noexcept { return millis_ == 0; }

    /**
     * ISO 8601 in UTC with millisecond precision, e.g. 2024-05-01T10:00:00.250Z
     */
    [[nodiscard]] std::string to_iso_string() const {
        const auto seconds = static_cast<std::time_t>(millis_ / 1000);
        std::tm utc{};
#ifdef _WIN32
        gmtime_s(&utc, &seconds);
#else
        gmtime_r(&seconds, &utc);
#endif
        std::ostringstream oss;
        oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S");
        oss << '.' << std::setfill('0') << std::setw(3) << (millis_ % 1000) << 'Z';
        return oss.str();
    }

    auto operator<=>(const Timestamp&) const = default;
    bool operator==(const Timestamp&) const = default;

    Timestamp operator+(Duration d) const { return Timestamp(millis_ + d.count()); }
    Duration operator-(const Timestamp& other) const { return Duration(millis_ - other.millis_); }

private:
    int64_t millis_;
};

} // namespace offgrid
