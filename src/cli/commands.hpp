#pragma once

#include "core/mutation.hpp"
#include "core/result.hpp"
#include "core/widget.hpp"
#include "sync/sync_result.hpp"
#include <QString>
#include <QStringList>
#include <vector>

namespace offgrid::cli {

// One line per record: id, operation, entity, attempts, last error, payload.
[[nodiscard]] QString format_pending_records(const std::vector<MutationRecord>& records);

[[nodiscard]] QString format_pending_records_json(const std::vector<MutationRecord>& records);

[[nodiscard]] QString format_sync_result(const sync::SyncResult& result);

/**
 * Parse `enqueue <type> <op> <entityId> [payload-json]` arguments (without
 * the command word).
 */
[[nodiscard]] Result<MutationRecord> parse_enqueue_args(const QStringList& args);

/**
 * Parse `place <w> <h>` or `place <preset>`.
 */
[[nodiscard]] Result<GridSize> parse_place_args(const QStringList& args);

} // namespace offgrid::cli
