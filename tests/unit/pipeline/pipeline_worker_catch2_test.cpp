// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025 docmem contributors

#include <catch2/catch_test_macros.hpp>

#include "../../common/pipeline_fixture.h"

#include <chrono>
#include <stdexcept>
#include <thread>

using namespace docmem;
using namespace std::chrono_literals;
using docmem::test::make_words;
using docmem::test::PipelineFixture;

namespace {

template <typename Pred> bool waitFor(Pred&& pred, std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred())
            return true;
        std::this_thread::sleep_for(10ms);
    }
    return pred();
}

} // namespace

TEST_CASE_METHOD(PipelineFixture, "PipelineWorker: background lanes finish the pipelines",
                 "[unit][pipeline][worker]") {
    for (int i = 0; i < 4; ++i) {
        REQUIRE(orchestrator
                    ->importDocument(textRequest("doc" + std::to_string(i),
                                                 make_words(40, "d" + std::to_string(i))))
                    .has_value());
    }

    worker->start(2);
    CHECK(worker->isRunning());

    const bool allReady = waitFor(
        [this]() {
            for (int i = 0; i < 4; ++i) {
                if (!ready("doc" + std::to_string(i)))
                    return false;
            }
            return true;
        },
        20s);

    worker->stop();
    worker->join();
    CHECK_FALSE(worker->isRunning());

    REQUIRE(allReady);
    auto stats = worker->stats();
    CHECK(stats.completed == 4);
    CHECK(stats.advanced == 12);
    CHECK(stats.errors == 0);
    CHECK(memoryDb->count("tests").value() == 4);
}

TEST_CASE_METHOD(PipelineFixture, "PipelineWorker: start and stop", "[unit][pipeline][worker]") {
    worker->start(1);

    SECTION("starting twice throws") {
        CHECK_THROWS_AS(worker->start(1), std::runtime_error);
    }

    SECTION("stop is idempotent") {
        worker->stop();
        worker->stop();
        worker->join();
        worker->join();
        CHECK_FALSE(worker->isRunning());
    }

    worker->stop();
    worker->join();
}

TEST_CASE_METHOD(PipelineFixture, "PipelineWorker: drain counts claimed operations",
                 "[unit][pipeline][worker]") {
    auto empty = worker->drain();
    REQUIRE(empty.has_value());
    CHECK(empty.value() == 0);

    REQUIRE(orchestrator->importDocument(textRequest("doc1", make_words(20))).has_value());
    auto drained = worker->drain();
    REQUIRE(drained.has_value());
    CHECK(drained.value() == 4);

    auto stats = worker->stats();
    CHECK(stats.claimed == 4);
    CHECK(stats.advanced == 3);
    CHECK(stats.completed == 1);
    CHECK(ready("doc1"));
}

TEST_CASE_METHOD(PipelineFixture, "PipelineWorker: storage errors count as failed attempts",
                 "[unit][pipeline][worker][retry]") {
    auto store = std::make_shared<test::InterceptingContentStore>(contentStore);
    auto failingOrchestrator = orchestratorOver(store);
    pipeline::PipelineWorker failingWorker(failingOrchestrator, queue, queueConfig);

    REQUIRE(failingOrchestrator->importDocument(textRequest("doc1", make_words(20))).has_value());

    int savesToFail = 0;
    store->beforeSave = [&savesToFail](const pipeline::DataPipeline&) -> Result<void> {
        if (savesToFail == 0)
            return {};
        if (savesToFail > 0)
            --savesToFail;
        return Error{ErrorCode::DatabaseError, "disk I/O error"};
    };

    auto runRounds = [&](int rounds) {
        for (int i = 0; i < rounds; ++i) {
            REQUIRE(failingWorker.drain().has_value());
            clock.advance(10s);
        }
    };

    SECTION("an error that keeps happening is poisoned") {
        savesToFail = -1;
        runRounds(8);

        auto stats = failingWorker.stats();
        CHECK(stats.errors == 4);
        CHECK(stats.retried == 3);
        CHECK(stats.poisoned == 1);
        CHECK(stats.advanced == 0);

        auto poisoned = queue->listPoisoned();
        REQUIRE(poisoned.has_value());
        REQUIRE(poisoned.value().size() == 1);
        CHECK(poisoned.value()[0].reason.find("disk I/O error") != std::string::npos);
        CHECK(poisoned.value()[0].operation.failure_count == 3);
        CHECK_FALSE(ready("doc1"));

        // Nothing is left to claim
        clock.advance(1h);
        CHECK(failingWorker.runOnce().value() == 0);
    }

    SECTION("a transient error is retried with backoff") {
        savesToFail = 2;
        REQUIRE(failingWorker.drain().has_value());

        auto released = queue->listByContent("tests/doc1");
        REQUIRE(released.has_value());
        REQUIRE(released.value().size() == 1);
        CHECK(released.value()[0].failure_count == 1);
        CHECK(released.value()[0].last_failure_reason == "disk I/O error");
        CHECK(released.value()[0].lock_token.empty());

        runRounds(10);
        CHECK(failingWorker.stats().errors == 2);
        CHECK(failingWorker.stats().retried == 2);
        CHECK(failingWorker.stats().poisoned == 0);
        CHECK(ready("doc1"));
    }
}
