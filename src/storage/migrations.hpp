#pragma once

#include "storage/database.hpp"
#include "core/result.hpp"
#include <string>
#include <vector>

namespace offgrid::storage {

/**
 * Migration - A versioned schema change of the local queue database.
 */
struct Migration {
    int version;
    std::string name;
    std::string up_sql;
    std::string down_sql;
};

/**
 * All migrations in order.
 */
inline const std::vector<Migration> ALL_MIGRATIONS = {
    {
        .version = 1,
        .name = "pending_mutations",
        .up_sql = R"SQL(
            -- AUTOINCREMENT keeps ids strictly increasing even after the
            -- newest row is deleted, so replay order never repeats an id.
            CREATE TABLE IF NOT EXISTS pending_mutations (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                entity_type TEXT NOT NULL,
                entity_id TEXT NOT NULL,
                operation TEXT NOT NULL,
                payload TEXT NOT NULL DEFAULT '{}',
                created_at INTEGER NOT NULL,
                attempts INTEGER NOT NULL DEFAULT 0,
                last_error TEXT
            );
        )SQL",
        .down_sql = R"SQL(
            DROP TABLE IF EXISTS pending_mutations;
        )SQL"
    },
    {
        .version = 2,
        .name = "entity_lookup_and_attempt_time",
        .up_sql = R"SQL(
            CREATE INDEX IF NOT EXISTS idx_pending_mutations_entity
                ON pending_mutations(entity_type, entity_id);
            ALTER TABLE pending_mutations ADD COLUMN last_attempt_at INTEGER;
        )SQL",
        .down_sql = R"SQL(
            DROP INDEX IF EXISTS idx_pending_mutations_entity;
            ALTER TABLE pending_mutations DROP COLUMN last_attempt_at;
        )SQL"
    },
};

/**
 * MigrationRunner - Applies and reverts schema migrations.
 */
class MigrationRunner {
public:
    explicit MigrationRunner(Database& db) : db_(db) {}

    [[nodiscard]] Result<int> current_version();

    [[nodiscard]] Result<void> migrate();
    [[nodiscard]] Result<void> migrate_to(int target_version);

    [[nodiscard]] Result<void> rollback();
    [[nodiscard]] Result<void> rollback_to(int target_version);

    [[nodiscard]] static int latest_version() {
        return ALL_MIGRATIONS.empty() ? 0 : ALL_MIGRATIONS.back().version;
    }

private:
    Database& db_;

    [[nodiscard]] Result<void> ensure_migrations_table();
    [[nodiscard]] Result<void> set_version(const Migration& m);
    [[nodiscard]] Result<void> run_migration(const Migration& m);
    [[nodiscard]] Result<void> run_rollback(const Migration& m);
};

/**
 * Bring a freshly opened database up to the latest schema.
 */
[[nodiscard]] inline Result<void> initialize_database(Database& db) {
    MigrationRunner runner(db);
    return runner.migrate();
}

} // namespace offgrid::storage
