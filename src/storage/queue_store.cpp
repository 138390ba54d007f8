#include "storage/queue_store.hpp"

namespace offgrid::storage {

namespace {

constexpr const char* kSelectColumns = R"SQL(
    SELECT id, entity_type, entity_id, operation, payload, created_at,
           attempts, last_error, last_attempt_at
    FROM pending_mutations
)SQL";

} // namespace

Result<MutationRecord> QueueStore::row_to_record(Statement& stmt) {
    const auto type_text = stmt.column_text(1);
    const auto op_text = stmt.column_text(3);
    const auto type = parse_entity_type(type_text);
    const auto op = parse_mutation_op(op_text);
    if (!type || !op) {
        return Result<MutationRecord>::err(Error::storage(
            "Corrupt queue row " + std::to_string(stmt.column_int64(0)) +
            ": entity_type='" + type_text + "' operation='" + op_text + "'"));
    }

    MutationRecord record;
    record.id = stmt.column_int64(0);
    record.entity_type = *type;
    record.entity_id = stmt.column_text(2);
    record.operation = *op;
    record.payload_json = stmt.column_text(4);
    record.created_at = Timestamp(stmt.column_int64(5));
    record.attempts = stmt.column_int(6);
    if (!stmt.column_is_null(7)) {
        record.last_error = stmt.column_text(7);
    }
    if (!stmt.column_is_null(8)) {
        record.last_attempt_at = Timestamp(stmt.column_int64(8));
    }
    return Result<MutationRecord>::ok(std::move(record));
}

Result<std::vector<MutationRecord>> QueueStore::load_all() {
    auto stmt_result = db_.prepare(std::string(kSelectColumns) + " ORDER BY id;");
    if (stmt_result.is_err()) {
        return Result<std::vector<MutationRecord>>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    std::vector<MutationRecord> records;
    while (true) {
        auto step_result = stmt.step();
        if (step_result.is_err()) {
            return Result<std::vector<MutationRecord>>::err(step_result.unwrap_err());
        }
        if (!step_result.unwrap()) break;

        auto record = row_to_record(stmt);
        if (record.is_err()) {
            return Result<std::vector<MutationRecord>>::err(record.unwrap_err());
        }
        records.push_back(std::move(record).unwrap());
    }
    return Result<std::vector<MutationRecord>>::ok(std::move(records));
}

Result<std::optional<MutationRecord>> QueueStore::get(int64_t id) {
    auto stmt_result = db_.prepare(std::string(kSelectColumns) + " WHERE id = ?;");
    if (stmt_result.is_err()) {
        return Result<std::optional<MutationRecord>>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto bound = stmt.bind_int64(1, id);
    if (bound.is_err()) {
        return Result<std::optional<MutationRecord>>::err(bound.unwrap_err());
    }

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<std::optional<MutationRecord>>::err(step_result.unwrap_err());
    }
    if (!step_result.unwrap()) {
        return Result<std::optional<MutationRecord>>::ok(std::nullopt);
    }

    auto record = row_to_record(stmt);
    if (record.is_err()) {
        return Result<std::optional<MutationRecord>>::err(record.unwrap_err());
    }
    return Result<std::optional<MutationRecord>>::ok(std::move(record).unwrap());
}

Result<int64_t> QueueStore::count() {
    auto stmt_result = db_.prepare("SELECT COUNT(*) FROM pending_mutations;");
    if (stmt_result.is_err()) {
        return Result<int64_t>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<int64_t>::err(step_result.unwrap_err());
    }
    return Result<int64_t>::ok(stmt.column_int64(0));
}

Result<int64_t> QueueStore::insert_row(const MutationRecord& record) {
    auto stmt_result = db_.prepare(R"SQL(
        INSERT INTO pending_mutations
            (entity_type, entity_id, operation, payload, created_at, attempts, last_error)
        VALUES (?, ?, ?, ?, ?, ?, ?);
    )SQL");
    if (stmt_result.is_err()) {
        return Result<int64_t>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto bound = stmt.bind_text(1, to_string(record.entity_type))
        .and_then([&] { return stmt.bind_text(2, record.entity_id); })
        .and_then([&] { return stmt.bind_text(3, to_string(record.operation)); })
        .and_then([&] { return stmt.bind_text(4, record.payload_json); })
        .and_then([&] { return stmt.bind_int64(5, record.created_at.millis()); })
        .and_then([&] { return stmt.bind_int(6, record.attempts); })
        .and_then([&] {
            return record.last_error ? stmt.bind_text(7, *record.last_error) : stmt.bind_null(7);
        });
    if (bound.is_err()) {
        return Result<int64_t>::err(bound.unwrap_err());
    }

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<int64_t>::err(step_result.unwrap_err());
    }
    return Result<int64_t>::ok(db_.last_insert_rowid());
}

Result<void> QueueStore::update_row(const MutationRecord& record) {
    auto stmt_result = db_.prepare(R"SQL(
        UPDATE pending_mutations
        SET payload = ?, attempts = ?, last_error = ?
        WHERE id = ?;
    )SQL");
    if (stmt_result.is_err()) {
        return Result<void>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto bound = stmt.bind_text(1, record.payload_json)
        .and_then([&] { return stmt.bind_int(2, record.attempts); })
        .and_then([&] {
            return record.last_error ? stmt.bind_text(3, *record.last_error) : stmt.bind_null(3);
        })
        .and_then([&] { return stmt.bind_int64(4, record.id); });
    if (bound.is_err()) {
        return bound;
    }

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<void>::err(step_result.unwrap_err());
    }
    if (db_.changes() == 0) {
        return Result<void>::err(Error{ErrorKind::NotFound,
            "Queue record " + std::to_string(record.id) + " does not exist"});
    }
    return Result<void>::ok();
}

Result<void> QueueStore::delete_row(int64_t id) {
    auto stmt_result = db_.prepare("DELETE FROM pending_mutations WHERE id = ?;");
    if (stmt_result.is_err()) {
        return Result<void>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto bound = stmt.bind_int64(1, id);
    if (bound.is_err()) {
        return bound;
    }

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<void>::err(step_result.unwrap_err());
    }
    return Result<void>::ok();
}

Result<int64_t> QueueStore::append(const MutationRecord& record) {
    return db_.transaction([&]() { return insert_row(record); });
}

Result<void> QueueStore::rewrite(const MutationRecord& record) {
    return update_row(record);
}

Result<void> QueueStore::remove(int64_t id) {
    return delete_row(id);
}

Result<void> QueueStore::record_failure(int64_t id,
                                        int attempts,
                                        const std::string& error,
                                        Timestamp at) {
    auto stmt_result = db_.prepare(R"SQL(
        UPDATE pending_mutations
        SET attempts = ?, last_error = ?, last_attempt_at = ?
        WHERE id = ?;
    )SQL");
    if (stmt_result.is_err()) {
        return Result<void>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto bound = stmt.bind_int(1, attempts)
        .and_then([&] { return stmt.bind_text(2, error); })
        .and_then([&] { return stmt.bind_int64(3, at.millis()); })
        .and_then([&] { return stmt.bind_int64(4, id); });
    if (bound.is_err()) {
        return bound;
    }

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<void>::err(step_result.unwrap_err());
    }
    return Result<void>::ok();
}

Result<void> QueueStore::clear() {
    return db_.execute("DELETE FROM pending_mutations;");
}

Result<std::optional<int64_t>> QueueStore::apply(const QueueEdit& edit) {
    using ApplyResult = Result<std::optional<int64_t>>;
    if (edit.empty()) {
        return ApplyResult::ok(std::nullopt);
    }

    return db_.transaction([&]() -> ApplyResult {
        for (int64_t id : edit.removals) {
            auto removed = delete_row(id);
            if (removed.is_err()) {
                return ApplyResult::err(removed.unwrap_err());
            }
        }
        for (const auto& record : edit.rewrites) {
            auto updated = update_row(record);
            if (updated.is_err()) {
                return ApplyResult::err(updated.unwrap_err());
            }
        }
        if (edit.append) {
            auto inserted = insert_row(*edit.append);
            if (inserted.is_err()) {
                return ApplyResult::err(inserted.unwrap_err());
            }
            return ApplyResult::ok(inserted.unwrap());
        }
        return ApplyResult::ok(std::nullopt);
    });
}

} // namespace offgrid::storage
