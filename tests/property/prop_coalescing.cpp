#include <catch2/catch_test_macros.hpp>
#include <rapidcheck.h>
#include "storage/database.hpp"
#include "storage/migrations.hpp"
#include "storage/queue_store.hpp"
#include "sync/mutation_queue.hpp"
#include <algorithm>
#include <map>

using namespace offgrid;
using namespace offgrid::sync;

namespace {

struct Step {
    int entity = 0;
    MutationOp op = MutationOp::Create;
    int value = 0;
};

rc::Gen<Step> step_gen() {
    return rc::gen::build<Step>(
        rc::gen::set(&Step::entity, rc::gen::inRange(0, 3)),
        rc::gen::set(&Step::op, rc::gen::element(MutationOp::Create, MutationOp::Update,
                                                 MutationOp::Delete, MutationOp::Reorder)),
        rc::gen::set(&Step::value, rc::gen::inRange(0, 100)));
}

std::string payload_for(const Step& step) {
    switch (step.op) {
        case MutationOp::Create:
        case MutationOp::Update:
            return R"({"title":"t)" + std::to_string(step.value) + R"("})";
        case MutationOp::Reorder:
            return R"({"order":)" + std::to_string(step.value) + "}";
        case MutationOp::Delete:
            return "{}";
    }
    return "{}";
}

} // namespace

TEST_CASE("Property: coalesced queue stays minimal and persisted", "[property][queue]") {
    rc::check("queue invariants hold after any edit sequence",
        []() {
            const auto steps = *rc::gen::container<std::vector<Step>>(step_gen());

            auto db = storage::Database::open_memory().unwrap();
            RC_ASSERT(storage::initialize_database(db).is_ok());
            storage::QueueStore store(db);
            MutationQueue queue(store);
            RC_ASSERT(queue.load().is_ok());

            int expected_count = 0;
            for (const auto& step : steps) {
                const std::string id = "link-" + std::to_string(step.entity);
                auto delta = queue.enqueue(
                    make_mutation(EntityType::Link, id, step.op, payload_for(step)));
                RC_ASSERT(delta.is_ok());
                RC_ASSERT(delta.unwrap() <= 1);
                expected_count += delta.unwrap();
            }

            const auto records = queue.drain();
            RC_ASSERT(static_cast<int>(records.size()) == expected_count);
            RC_ASSERT(records.size() <= steps.size());

            // Memory mirrors the table.
            const auto stored = store.load_all().unwrap();
            RC_ASSERT(stored.size() == records.size());
            for (size_t i = 0; i < records.size(); ++i) {
                RC_ASSERT(stored[i].id == records[i].id);
                RC_ASSERT(stored[i].operation == records[i].operation);
                RC_ASSERT(stored[i].payload_json == records[i].payload_json);
                if (i > 0) {
                    RC_ASSERT(records[i - 1].id < records[i].id);
                }
            }

            // Per entity: a delete can only lead, and there is at most one
            // update and one reorder.
            std::map<std::string, std::vector<MutationOp>> by_entity;
            for (const auto& r : records) {
                by_entity[r.entity_id].push_back(r.operation);
            }
            for (const auto& [id, ops] : by_entity) {
                const auto deletes = std::count(ops.begin(), ops.end(), MutationOp::Delete);
                RC_ASSERT(deletes <= 1);
                if (deletes == 1) {
                    RC_ASSERT(ops.front() == MutationOp::Delete);
                }
                RC_ASSERT(std::count(ops.begin(), ops.end(), MutationOp::Update) <= 1);
                RC_ASSERT(std::count(ops.begin(), ops.end(), MutationOp::Reorder) <= 1);
            }
        });
}
