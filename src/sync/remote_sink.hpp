#pragma once

#include "core/mutation.hpp"
#include <QMetaType>
#include <functional>
#include <string>
#include <string_view>

namespace offgrid::sync {

/**
 * SinkStatus - How the remote store answered one replayed mutation.
 */
enum class SinkStatus {
    Applied,    // persisted remotely
    Retryable,  // transient: network, timeout, rate limited
    Rejected    // permanent: validation, conflict, unknown entity
};

[[nodiscard]] constexpr std::string_view to_string(SinkStatus status) noexcept {
    switch (status) {
        case SinkStatus::Applied: return "applied";
        case SinkStatus::Retryable: return "retryable";
        case SinkStatus::Rejected: return "rejected";
    }
    return "rejected";
}

struct SinkOutcome {
    SinkStatus status{SinkStatus::Applied};
    std::string message;
    int code{0};  // HTTP status or transport error code, 0 when unknown

    [[nodiscard]] static SinkOutcome applied() { return {SinkStatus::Applied, {}, 0}; }
    [[nodiscard]] static SinkOutcome retryable(std::string msg, int code = 0) {
        return {SinkStatus::Retryable, std::move(msg), code};
    }
    [[nodiscard]] static SinkOutcome rejected(std::string msg, int code = 0) {
        return {SinkStatus::Rejected, std::move(msg), code};
    }
};

using SinkCompletion = std::function<void(SinkOutcome)>;

/**
 * RemoteSink - Where queued mutations are replayed.
 *
 * apply_mutation() must invoke `completion` exactly once, either before
 * returning or later on the caller's thread. The same record may be
 * delivered more than once (after a timeout, or when removal failed
 * locally), so implementations must be idempotent per record id.
 */
class RemoteSink {
public:
    virtual ~RemoteSink() = default;

    virtual void apply_mutation(const MutationRecord& record, SinkCompletion completion) = 0;
};

} // namespace offgrid::sync

Q_DECLARE_METATYPE(offgrid::sync::SinkStatus)
