#pragma once

#include "core/mutation.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include <QMetaType>
#include <cstdint>
#include <string>
#include <vector>

namespace offgrid::sync {

enum class SyncOrigin {
    Foreground,  // a drain pass run by this process
    Background   // reported by an out-of-band flush
};

struct SyncFailure {
    int64_t id{0};
    EntityType entity_type{EntityType::Link};
    std::string entity_id;
    Error error;
};

/**
 * SyncResult - Outcome of one sync pass.
 *
 * `failed` counts records removed without reaching the sink (rejected, or
 * retry budget exhausted); `retrying` counts records kept for a later pass.
 */
struct SyncResult {
    int synced{0};
    int failed{0};
    int retrying{0};
    std::vector<SyncFailure> failures;
    SyncOrigin origin{SyncOrigin::Foreground};
    Timestamp finished_at;
};

} // namespace offgrid::sync

Q_DECLARE_METATYPE(offgrid::sync::SyncResult)
