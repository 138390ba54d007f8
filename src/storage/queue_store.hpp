#pragma once

#include "storage/database.hpp"
#include "core/mutation.hpp"
#include "core/result.hpp"
#include <cstdint>
#include <optional>
#include <vector>

namespace offgrid::storage {

/**
 * QueueEdit - A set of changes applied to the queue in one transaction.
 *
 * Removals run first, then rewrites of existing rows, then the append.
 */
struct QueueEdit {
    std::vector<int64_t> removals;
    std::vector<MutationRecord> rewrites;
    std::optional<MutationRecord> append;

    [[nodiscard]] bool empty() const {
        return removals.empty() && rewrites.empty() && !append.has_value();
    }
};

/**
 * QueueStore - Durable, ordered storage of pending mutation records.
 *
 * Rows are keyed by an AUTOINCREMENT id that defines replay order. Every
 * write either commits completely or leaves the table untouched.
 */
class QueueStore {
public:
    explicit QueueStore(Database& db) : db_(db) {}

    /**
     * All records ordered by id.
     */
    [[nodiscard]] Result<std::vector<MutationRecord>> load_all();

    [[nodiscard]] Result<std::optional<MutationRecord>> get(int64_t id);

    [[nodiscard]] Result<int64_t> count();

    /**
     * Insert a record and return its assigned id. record.id is ignored.
     */
    [[nodiscard]] Result<int64_t> append(const MutationRecord& record);

    /**
     * Overwrite payload, attempts and error columns of an existing row.
     */
    [[nodiscard]] Result<void> rewrite(const MutationRecord& record);

    /**
     * Delete a row. Deleting an id that is already gone succeeds.
     */
    [[nodiscard]] Result<void> remove(int64_t id);

    [[nodiscard]] Result<void> record_failure(int64_t id,
                                              int attempts,
                                              const std::string& error,
                                              Timestamp at);

    [[nodiscard]] Result<void> clear();

    /**
     * Apply a QueueEdit atomically. Returns the id of the appended record,
     * if the edit carried one.
     */
    [[nodiscard]] Result<std::optional<int64_t>> apply(const QueueEdit& edit);

private:
    Database& db_;

    [[nodiscard]] Result<MutationRecord> row_to_record(Statement& stmt);
    [[nodiscard]] Result<int64_t> insert_row(const MutationRecord& record);
    [[nodiscard]] Result<void> update_row(const MutationRecord& record);
    [[nodiscard]] Result<void> delete_row(int64_t id);
};

} // namespace offgrid::storage
