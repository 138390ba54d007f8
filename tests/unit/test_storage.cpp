#include <catch2/catch_test_macros.hpp>
#include "storage/database.hpp"
#include "storage/migrations.hpp"
#include "storage/queue_store.hpp"
#include <filesystem>

using namespace offgrid;
using namespace offgrid::storage;

namespace {

MutationRecord record(EntityType type, std::string id, MutationOp op,
                      std::string payload = "{}") {
    return make_mutation(type, std::move(id), op, std::move(payload));
}

} // namespace

TEST_CASE("Database basic operations", "[storage]") {
    auto db_result = Database::open_memory();
    REQUIRE(db_result.is_ok());
    auto db = std::move(db_result).unwrap();

    SECTION("Execute creates table") {
        auto result = db.execute("CREATE TABLE test (id INTEGER PRIMARY KEY);");
        REQUIRE(result.is_ok());
    }

    SECTION("Prepare and step") {
        REQUIRE(db.execute("CREATE TABLE test (id INTEGER, name TEXT);").is_ok());
        REQUIRE(db.execute("INSERT INTO test VALUES (1, 'Alice');").is_ok());
        REQUIRE(db.execute("INSERT INTO test VALUES (2, 'Bob');").is_ok());

        auto stmt = db.prepare("SELECT * FROM test ORDER BY id;").unwrap();

        REQUIRE(stmt.step().unwrap() == true);
        REQUIRE(stmt.column_int(0) == 1);
        REQUIRE(stmt.column_text(1) == "Alice");

        REQUIRE(stmt.step().unwrap() == true);
        REQUIRE(stmt.column_int(0) == 2);
        REQUIRE(stmt.column_text(1) == "Bob");

        REQUIRE(stmt.step().unwrap() == false);
    }

    SECTION("Invalid SQL reports a storage error") {
        auto result = db.execute("CREATE TABL nonsense;");
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().is(ErrorKind::Storage));
        REQUIRE(result.unwrap_err().code != 0);
    }

    SECTION("Transaction commit") {
        REQUIRE(db.execute("CREATE TABLE test (id INTEGER);").is_ok());

        auto result = db.transaction([&]() -> Result<void> {
            return db.execute("INSERT INTO test VALUES (1);")
                .and_then([&] { return db.execute("INSERT INTO test VALUES (2);"); });
        });

        REQUIRE(result.is_ok());

        auto stmt = db.prepare("SELECT COUNT(*) FROM test;").unwrap();
        REQUIRE(stmt.step().unwrap());
        REQUIRE(stmt.column_int(0) == 2);
    }

    SECTION("Transaction rollback on error") {
        REQUIRE(db.execute("CREATE TABLE test (id INTEGER);").is_ok());
        REQUIRE(db.execute("INSERT INTO test VALUES (1);").is_ok());

        auto result = db.transaction([&]() -> Result<void> {
            auto inserted = db.execute("INSERT INTO test VALUES (2);");
            REQUIRE(inserted.is_ok());
            return Result<void>::err(Error{"forced error"});
        });

        REQUIRE(result.is_err());

        auto stmt = db.prepare("SELECT COUNT(*) FROM test;").unwrap();
        REQUIRE(stmt.step().unwrap());
        REQUIRE(stmt.column_int(0) == 1);  // Rollback happened
    }

    SECTION("Closed database refuses work") {
        db.close();
        REQUIRE_FALSE(db.is_open());
        REQUIRE(db.execute("SELECT 1;").is_err());
        REQUIRE(db.prepare("SELECT 1;").is_err());
    }
}

TEST_CASE("Migrations", "[storage]") {
    auto db = Database::open_memory().unwrap();
    MigrationRunner runner(db);

    SECTION("Initial version is 0") {
        auto version = runner.current_version();
        REQUIRE(version.is_ok());
        REQUIRE(version.unwrap() == 0);
    }

    SECTION("Migrate to latest") {
        REQUIRE(runner.migrate().is_ok());
        REQUIRE(runner.current_version().unwrap() == MigrationRunner::latest_version());
    }

    SECTION("Migrate is idempotent") {
        REQUIRE(runner.migrate().is_ok());
        REQUIRE(runner.migrate().is_ok());
        REQUIRE(runner.current_version().unwrap() == MigrationRunner::latest_version());
    }

    SECTION("Rollback removes the newest migration") {
        REQUIRE(runner.migrate().is_ok());
        REQUIRE(runner.rollback().is_ok());
        REQUIRE(runner.current_version().unwrap() == MigrationRunner::latest_version() - 1);

        // Version 1 schema has no last_attempt_at column.
        REQUIRE(db.prepare("SELECT last_attempt_at FROM pending_mutations;").is_err());
        REQUIRE(db.prepare("SELECT attempts FROM pending_mutations;").is_ok());

        REQUIRE(runner.migrate().is_ok());
        REQUIRE(db.prepare("SELECT last_attempt_at FROM pending_mutations;").is_ok());
    }

    SECTION("Rollback to zero drops the queue table") {
        REQUIRE(runner.migrate().is_ok());
        REQUIRE(runner.rollback_to(0).is_ok());
        REQUIRE(runner.current_version().unwrap() == 0);
        REQUIRE(db.prepare("SELECT id FROM pending_mutations;").is_err());
    }
}

TEST_CASE("QueueStore", "[storage][queue]") {
    auto db = Database::open_memory().unwrap();
    REQUIRE(initialize_database(db).is_ok());
    QueueStore store(db);

    SECTION("Append assigns increasing ids and load_all keeps order") {
        const auto a = store.append(record(EntityType::Link, "l1", MutationOp::Create,
                                           R"({"title":"A"})")).unwrap();
        const auto b = store.append(record(EntityType::Tag, "t1", MutationOp::Delete)).unwrap();
        REQUIRE(b > a);

        auto all = store.load_all().unwrap();
        REQUIRE(all.size() == 2);
        REQUIRE(all[0].id == a);
        REQUIRE(all[0].entity_type == EntityType::Link);
        REQUIRE(all[0].operation == MutationOp::Create);
        REQUIRE(all[0].payload_json == R"({"title":"A"})");
        REQUIRE(all[0].attempts == 0);
        REQUIRE_FALSE(all[0].last_error.has_value());
        REQUIRE(all[1].entity_type == EntityType::Tag);
        REQUIRE(store.count().unwrap() == 2);
    }

    SECTION("Ids are never reused") {
        const auto a = store.append(record(EntityType::Link, "l1", MutationOp::Update)).unwrap();
        REQUIRE(store.remove(a).is_ok());
        const auto b = store.append(record(EntityType::Link, "l2", MutationOp::Update)).unwrap();
        REQUIRE(b > a);
    }

    SECTION("Remove is idempotent") {
        const auto a = store.append(record(EntityType::Widget, "w1", MutationOp::Delete)).unwrap();
        REQUIRE(store.remove(a).is_ok());
        REQUIRE(store.remove(a).is_ok());
        REQUIRE(store.count().unwrap() == 0);
        REQUIRE_FALSE(store.get(a).unwrap().has_value());
    }

    SECTION("Rewrite replaces the payload") {
        const auto id = store.append(record(EntityType::Category, "c1", MutationOp::Create,
                                            R"({"name":"Old"})")).unwrap();
        auto stored = *store.get(id).unwrap();
        stored.payload_json = R"({"name":"New"})";
        REQUIRE(store.rewrite(stored).is_ok());
        REQUIRE(store.get(id).unwrap()->payload_json == R"({"name":"New"})");

        stored.id = id + 100;
        auto missing = store.rewrite(stored);
        REQUIRE(missing.is_err());
        REQUIRE(missing.unwrap_err().is(ErrorKind::NotFound));
    }

    SECTION("record_failure stores attempts, error and time") {
        const auto id = store.append(record(EntityType::Link, "l1", MutationOp::Delete)).unwrap();
        REQUIRE(store.record_failure(id, 3, "RetryableSyncError: timeout", Timestamp(1234)).is_ok());

        auto stored = *store.get(id).unwrap();
        REQUIRE(stored.attempts == 3);
        REQUIRE(stored.last_error == std::optional<std::string>("RetryableSyncError: timeout"));
        REQUIRE(stored.last_attempt_at == std::optional<Timestamp>(Timestamp(1234)));
    }

    SECTION("apply commits every part of an edit") {
        const auto a = store.append(record(EntityType::Link, "l1", MutationOp::Update)).unwrap();
        const auto b = store.append(record(EntityType::Link, "l2", MutationOp::Create)).unwrap();

        QueueEdit edit;
        edit.removals.push_back(a);
        auto rewritten = *store.get(b).unwrap();
        rewritten.payload_json = R"({"title":"merged"})";
        edit.rewrites.push_back(rewritten);
        edit.append = record(EntityType::Link, "l1", MutationOp::Delete);

        auto applied = store.apply(edit);
        REQUIRE(applied.is_ok());
        REQUIRE(applied.unwrap().has_value());

        auto all = store.load_all().unwrap();
        REQUIRE(all.size() == 2);
        REQUIRE(all[0].id == b);
        REQUIRE(all[0].payload_json == R"({"title":"merged"})");
        REQUIRE(all[1].id == *applied.unwrap());
        REQUIRE(all[1].operation == MutationOp::Delete);
    }

    SECTION("apply is all or nothing") {
        const auto a = store.append(record(EntityType::Link, "l1", MutationOp::Update)).unwrap();

        QueueEdit edit;
        edit.removals.push_back(a);
        auto ghost = record(EntityType::Link, "ghost", MutationOp::Update);
        ghost.id = a + 42;
        edit.rewrites.push_back(ghost);

        REQUIRE(store.apply(edit).is_err());
        REQUIRE(store.count().unwrap() == 1);
        REQUIRE(store.get(a).unwrap().has_value());
    }

    SECTION("Empty edit is a no-op") {
        auto applied = store.apply(QueueEdit{});
        REQUIRE(applied.is_ok());
        REQUIRE_FALSE(applied.unwrap().has_value());
    }

    SECTION("Corrupt rows are reported, not guessed") {
        REQUIRE(db.execute("INSERT INTO pending_mutations (entity_type, entity_id, operation, created_at) "
                           "VALUES ('project', 'p1', 'create', 0);").is_ok());
        auto all = store.load_all();
        REQUIRE(all.is_err());
        REQUIRE(all.unwrap_err().is(ErrorKind::Storage));
    }

    SECTION("Missing table surfaces as a storage error") {
        REQUIRE(db.execute("DROP TABLE pending_mutations;").is_ok());
        auto appended = store.append(record(EntityType::Link, "l1", MutationOp::Create));
        REQUIRE(appended.is_err());
        REQUIRE(appended.unwrap_err().is(ErrorKind::Storage));
    }
}

TEST_CASE("QueueStore survives reopening the database file", "[storage][queue]") {
    const auto dir = std::filesystem::temp_directory_path() / "offgrid_test_storage";
    std::filesystem::create_directories(dir);
    const auto path = (dir / "queue.sqlite").string();
    std::filesystem::remove(path);

    int64_t id = 0;
    {
        auto db = Database::open(path).unwrap();
        REQUIRE(initialize_database(db).is_ok());
        QueueStore store(db);
        id = store.append(record(EntityType::Widget, "w1", MutationOp::Reorder,
                                 R"({"position":{"x":1,"y":2}})")).unwrap();
    }
    {
        auto db = Database::open(path).unwrap();
        REQUIRE(initialize_database(db).is_ok());
        QueueStore store(db);
        auto all = store.load_all().unwrap();
        REQUIRE(all.size() == 1);
        REQUIRE(all[0].id == id);
        REQUIRE(all[0].operation == MutationOp::Reorder);
        REQUIRE(all[0].entity_id == "w1");
    }

    std::filesystem::remove_all(dir);
}
