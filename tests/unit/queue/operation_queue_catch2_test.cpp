// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025 docmem contributors

#include <catch2/catch_test_macros.hpp>

#include "../../common/test_helpers_catch2.h"

#include <docmem/queue/operation_queue.h>

#include <filesystem>
#include <memory>
#include <set>
#include <thread>

using namespace docmem;
using namespace docmem::queue;
using namespace std::chrono_literals;

namespace {

struct QueueFixture {
    QueueFixture() {
        root = test::make_temp_dir("docmem_queue_");
        config.lock_duration = 60s;
        queue = openQueue();
    }

    ~QueueFixture() {
        queue.reset();
        std::error_code ec;
        std::filesystem::remove_all(root, ec);
    }

    std::unique_ptr<SqliteOperationQueue> openQueue() {
        auto q = SqliteOperationQueue::open((root / "queue.db").string(), config,
                                            [this]() { return clock.now(); });
        REQUIRE(q.has_value());
        return std::move(q).value();
    }

    static Operation makeOp(const std::string& id, std::vector<std::string> remaining,
                            const std::string& contentId = "idx/doc") {
        Operation op;
        op.id = id;
        op.content_id = contentId;
        op.planned_steps = remaining;
        op.remaining_steps = std::move(remaining);
        return op;
    }

    Operation claimOne() {
        auto claimed = queue->claim(1);
        REQUIRE(claimed.has_value());
        REQUIRE(claimed.value().size() == 1);
        return claimed.value().front();
    }

    size_t claimableCount() {
        auto claimed = queue->claim(100);
        REQUIRE(claimed.has_value());
        return claimed.value().size();
    }

    std::filesystem::path root;
    test::FakeClock clock;
    config::QueueConfig config;
    std::unique_ptr<SqliteOperationQueue> queue;
};

} // namespace

TEST_CASE_METHOD(QueueFixture, "OperationQueue: enqueue is idempotent", "[unit][queue]") {
    auto op = makeOp("op-1", {"extract", "partition"});
    REQUIRE(queue->enqueue(op).has_value());

    auto duplicate = op;
    duplicate.remaining_steps = {"partition"};
    REQUIRE(queue->enqueue(duplicate).has_value());

    auto stored = queue->get("op-1");
    REQUIRE(stored.has_value());
    REQUIRE(stored.value().has_value());
    CHECK(stored.value()->remaining_steps == std::vector<std::string>{"extract", "partition"});
    CHECK(stored.value()->currentStep() == std::optional<std::string>{"extract"});

    auto listed = queue->listByContent("idx/doc");
    REQUIRE(listed.has_value());
    CHECK(listed.value().size() == 1);
}

TEST_CASE_METHOD(QueueFixture, "OperationQueue: enqueue requires ids", "[unit][queue]") {
    auto op = makeOp("", {"extract"});
    auto result = queue->enqueue(op);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == ErrorCode::InvalidArgument);
}

TEST_CASE_METHOD(QueueFixture, "OperationQueue: a claimed operation is locked", "[unit][queue]") {
    REQUIRE(queue->enqueue(makeOp("op-1", {"extract"})).has_value());

    auto op = claimOne();
    CHECK(op.id == "op-1");
    CHECK_FALSE(op.lock_token.empty());
    CHECK(op.isLocked(clock.now(), config.lock_duration));

    CHECK(claimableCount() == 0);

    SECTION("the lock expires after lock_duration") {
        clock.advance(59s);
        CHECK(claimableCount() == 0);
        clock.advance(2s);
        auto reclaimed = claimOne();
        CHECK(reclaimed.id == "op-1");
        CHECK(reclaimed.lock_token != op.lock_token);

        SECTION("the stale claim can no longer complete") {
            auto stale = queue->complete(op.id, op.lock_token, std::nullopt);
            REQUIRE_FALSE(stale.has_value());
            CHECK(stale.error().code == ErrorCode::LockContention);
            CHECK(queue->complete(reclaimed.id, reclaimed.lock_token, std::nullopt).has_value());
        }
    }
}

TEST_CASE_METHOD(QueueFixture, "OperationQueue: concurrent claims never share an operation",
                 "[unit][queue][concurrency]") {
    for (int i = 0; i < 40; ++i) {
        REQUIRE(queue->enqueue(makeOp("op-" + std::to_string(i), {"extract"},
                                      "idx/doc" + std::to_string(i)))
                    .has_value());
    }

    // A second connection to the same database competes with the first
    auto other = openQueue();
    std::vector<std::string> firstIds;
    std::vector<std::string> secondIds;
    auto drainInto = [](SqliteOperationQueue& q, std::vector<std::string>& ids) {
        int busy = 0;
        while (true) {
            auto claimed = q.claim(3);
            if (!claimed) {
                // Lost the write lock to the other connection
                if (++busy > 100)
                    return;
                continue;
            }
            if (claimed.value().empty())
                return;
            for (const auto& op : claimed.value())
                ids.push_back(op.id);
        }
    };
    std::thread a([&]() { drainInto(*queue, firstIds); });
    std::thread b([&]() { drainInto(*other, secondIds); });
    a.join();
    b.join();

    std::set<std::string> unique(firstIds.begin(), firstIds.end());
    unique.insert(secondIds.begin(), secondIds.end());
    CHECK(unique.size() == firstIds.size() + secondIds.size());
    CHECK(unique.size() == 40);
}

TEST_CASE_METHOD(QueueFixture, "OperationQueue: complete enqueues the follow-up atomically",
                 "[unit][queue]") {
    REQUIRE(queue->enqueue(makeOp("op-1", {"extract", "partition"})).has_value());
    auto op = claimOne();

    auto next = makeOp("op-2", {"partition"});
    next.completed_steps = {"extract"};
    REQUIRE(queue->complete(op.id, op.lock_token, next).has_value());

    auto done = queue->get("op-1");
    REQUIRE(done.has_value());
    REQUIRE(done.value().has_value());
    CHECK(done.value()->complete);
    CHECK_FALSE(done.value()->isLocked(clock.now(), config.lock_duration));

    auto follow = claimOne();
    CHECK(follow.id == "op-2");
    CHECK(follow.completed_steps == std::vector<std::string>{"extract"});

    SECTION("completing twice reports the operation as already complete") {
        auto again = queue->complete(op.id, op.lock_token, std::nullopt);
        REQUIRE_FALSE(again.has_value());
        CHECK(again.error().code == ErrorCode::InvalidState);
    }

    SECTION("completed operations can be purged") {
        auto purged = queue->purgeCompleted(std::chrono::system_clock::now() + 1h);
        REQUIRE(purged.has_value());
        CHECK(purged.value() == 1);
        auto gone = queue->get("op-1");
        REQUIRE(gone.has_value());
        CHECK_FALSE(gone.value().has_value());
    }
}

TEST_CASE_METHOD(QueueFixture, "OperationQueue: a cancelled operation enqueues no follow-up",
                 "[unit][queue][cancel]") {
    REQUIRE(queue->enqueue(makeOp("op-1", {"extract", "partition"})).has_value());
    auto op = claimOne();

    // Cancelled while its step was running
    REQUIRE(queue->cancel("idx/doc").value() == 1);

    auto next = makeOp("op-2", {"partition"});
    next.completed_steps = {"extract"};
    REQUIRE(queue->complete(op.id, op.lock_token, next).has_value());

    auto done = queue->get("op-1");
    REQUIRE(done.has_value());
    REQUIRE(done.value().has_value());
    CHECK(done.value()->complete);

    auto follow = queue->get("op-2");
    REQUIRE(follow.has_value());
    CHECK_FALSE(follow.value().has_value());
    CHECK(claimableCount() == 0);
}

TEST_CASE_METHOD(QueueFixture, "OperationQueue: release delays the retry", "[unit][queue]") {
    REQUIRE(queue->enqueue(makeOp("op-1", {"gen_embeddings"})).has_value());
    auto op = claimOne();

    REQUIRE(queue->release(op.id, op.lock_token, "throttled", 2000ms).has_value());

    auto stored = queue->get("op-1");
    REQUIRE(stored.has_value());
    REQUIRE(stored.value().has_value());
    CHECK(stored.value()->failure_count == 1);
    CHECK(stored.value()->last_failure_reason == "throttled");
    CHECK_FALSE(stored.value()->last_attempt_timestamp.has_value());
    CHECK(stored.value()->not_before.has_value());

    CHECK(claimableCount() == 0);
    clock.advance(1500ms);
    CHECK(claimableCount() == 0);
    clock.advance(600ms);
    auto retried = claimOne();
    CHECK(retried.failure_count == 1);

    SECTION("release with a stale token is refused") {
        auto stale = queue->release(op.id, op.lock_token, "again", 0ms);
        REQUIRE_FALSE(stale.has_value());
        CHECK(stale.error().code == ErrorCode::LockContention);
    }
}

TEST_CASE_METHOD(QueueFixture, "OperationQueue: poisoned operations leave the main queue",
                 "[unit][queue][poison]") {
    REQUIRE(queue->enqueue(makeOp("op-1", {"extract"})).has_value());
    auto op = claimOne();

    SECTION("a stale token cannot poison the live claim") {
        clock.advance(config.lock_duration + 1s);
        auto live = claimOne();
        auto stale = queue->toPoison(op.id, op.lock_token, "unsupported content");
        REQUIRE_FALSE(stale.has_value());
        CHECK(stale.error().code == ErrorCode::LockContention);
        CHECK(queue->get("op-1").value().has_value());
        CHECK(queue->listPoisoned().value().empty());
        op = live;
    }

    REQUIRE(queue->toPoison(op.id, op.lock_token, "unsupported content").has_value());

    auto gone = queue->get("op-1");
    REQUIRE(gone.has_value());
    CHECK_FALSE(gone.value().has_value());

    auto poisoned = queue->listPoisoned();
    REQUIRE(poisoned.has_value());
    REQUIRE(poisoned.value().size() == 1);
    CHECK(poisoned.value()[0].queue_name == "docmem-pipeline-poison");
    CHECK(poisoned.value()[0].reason == "unsupported content");
    CHECK(poisoned.value()[0].operation.id == "op-1");
    CHECK(poisoned.value()[0].operation.remaining_steps == std::vector<std::string>{"extract"});

    clock.advance(1h);
    CHECK(claimableCount() == 0);

    auto missing = queue->toPoison("nope", "token", "x");
    REQUIRE_FALSE(missing.has_value());
    CHECK(missing.error().code == ErrorCode::NotFound);
}

TEST_CASE_METHOD(QueueFixture, "OperationQueue: cancel flags outstanding operations",
                 "[unit][queue]") {
    REQUIRE(queue->enqueue(makeOp("op-1", {"extract"}, "idx/a")).has_value());
    REQUIRE(queue->enqueue(makeOp("op-2", {"extract"}, "idx/b")).has_value());

    auto cancelled = queue->cancel("idx/a");
    REQUIRE(cancelled.has_value());
    CHECK(cancelled.value() == 1);

    auto remaining = queue->claim(10);
    REQUIRE(remaining.has_value());
    REQUIRE(remaining.value().size() == 1);
    CHECK(remaining.value()[0].content_id == "idx/b");

    auto stored = queue->get("op-1");
    REQUIRE(stored.has_value());
    REQUIRE(stored.value().has_value());
    CHECK(stored.value()->cancelled);
}

TEST_CASE_METHOD(QueueFixture, "OperationQueue: state survives reopening", "[unit][queue]") {
    REQUIRE(queue->enqueue(makeOp("op-1", {"extract", "partition"})).has_value());
    auto op = claimOne();
    queue.reset();

    // Simulated crash while holding the lock
    queue = openQueue();
    CHECK(claimableCount() == 0);
    clock.advance(config.lock_duration + 1s);
    auto recovered = claimOne();
    CHECK(recovered.id == op.id);
    CHECK(recovered.remaining_steps == std::vector<std::string>{"extract", "partition"});
}

TEST_CASE("QueueConfig: validation", "[unit][queue][config]") {
    config::QueueConfig cfg;
    CHECK(cfg.validate().has_value());

    SECTION("lock duration has a floor") {
        cfg.lock_duration = std::chrono::seconds(config::QueueConfig::kMinLockDurationSeconds - 1);
        CHECK_FALSE(cfg.validate().has_value());
    }
    SECTION("poison suffix must be well formed") {
        cfg.poison_queue_suffix = "bad--suffix";
        CHECK_FALSE(cfg.validate().has_value());
    }
}
