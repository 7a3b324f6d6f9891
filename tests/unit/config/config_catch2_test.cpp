// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025 docmem contributors

#include <catch2/catch_test_macros.hpp>

#include "../../common/test_helpers_catch2.h"

#include <docmem/config/config_helpers.h>
#include <docmem/config/docmem_config.h>

#include <filesystem>

using namespace docmem;
using namespace docmem::config;
using docmem::test::ScopedEnvVar;

namespace {

struct ConfigFixture {
    ConfigFixture()
        : root(test::make_temp_dir("docmem_config_")),
          // Keep the developer's environment out of the results
          dataDir("DOCMEM_DATA_DIR", (root / "data").string()),
          retries("DOCMEM_QUEUE_MAX_RETRIES", std::nullopt),
          cacheMode("DOCMEM_EMBEDDING_CACHE_MODE", std::nullopt),
          lock("DOCMEM_QUEUE_LOCK_DURATION_SECONDS", std::nullopt) {}

    ~ConfigFixture() {
        std::error_code ec;
        std::filesystem::remove_all(root, ec);
    }

    std::filesystem::path root;
    ScopedEnvVar dataDir;
    ScopedEnvVar retries;
    ScopedEnvVar cacheMode;
    ScopedEnvVar lock;
};

} // namespace

TEST_CASE_METHOD(ConfigFixture, "DocMemConfig: defaults without a config file",
                 "[unit][config]") {
    auto cfg = DocMemConfig::load(root / "missing.toml");
    REQUIRE(cfg.has_value());
    const auto& c = cfg.value();
    CHECK(c.queue.queue_name == "docmem-pipeline");
    CHECK(c.queue.poll_delay == std::chrono::milliseconds(100));
    CHECK(c.queue.fetch_batch_size == 3);
    CHECK(c.queue.lock_duration == std::chrono::seconds(300));
    CHECK(c.queue.max_retries_before_poison == 20);
    CHECK(c.queue.poisonQueueName() == "docmem-pipeline-poison");
    CHECK(c.embedding.cache_mode == "read_write");
    CHECK(c.worker.threads == 1);
    CHECK(c.storage.data_dir == root / "data");
    CHECK(c.storage.databasePath() == root / "data" / "docmem.db");
}

TEST_CASE_METHOD(ConfigFixture, "DocMemConfig: file values and environment overrides",
                 "[unit][config]") {
    const auto path = test::write_file(root / "config.toml", R"(# docmem test config
[queue]
fetch_batch_size = 7
max_retries_before_poison = 5   # inline comment
poison_queue_suffix = "-dead"

[chunking]
max_tokens_per_paragraph = 500
chunk_header = "Source: {file}"

[embedding]
cache_mode = 'read_only'
)");

    SECTION("the file is applied") {
        auto cfg = DocMemConfig::load(path);
        REQUIRE(cfg.has_value());
        CHECK(cfg.value().queue.fetch_batch_size == 7);
        CHECK(cfg.value().queue.max_retries_before_poison == 5);
        CHECK(cfg.value().queue.poisonQueueName() == "docmem-pipeline-dead");
        CHECK(cfg.value().chunking.max_tokens_per_paragraph == 500);
        CHECK(cfg.value().chunking.chunk_header == "Source: {file}");
        CHECK(cfg.value().embedding.cache_mode == "read_only");
    }

    SECTION("the environment wins over the file") {
        ScopedEnvVar env("DOCMEM_QUEUE_MAX_RETRIES", "9");
        auto cfg = DocMemConfig::load(path);
        REQUIRE(cfg.has_value());
        CHECK(cfg.value().queue.max_retries_before_poison == 9);
        CHECK(cfg.value().queue.fetch_batch_size == 7);
    }

    SECTION("a malformed number is an error") {
        ScopedEnvVar env("DOCMEM_QUEUE_MAX_RETRIES", "lots");
        auto cfg = DocMemConfig::load(path);
        REQUIRE_FALSE(cfg.has_value());
        CHECK(cfg.error().code == ErrorCode::InvalidArgument);
    }

    SECTION("an unknown cache mode is an error") {
        ScopedEnvVar env("DOCMEM_EMBEDDING_CACHE_MODE", "sometimes");
        auto cfg = DocMemConfig::load(path);
        REQUIRE_FALSE(cfg.has_value());
        CHECK(cfg.error().code == ErrorCode::InvalidArgument);
    }

    SECTION("the lock duration floor is enforced") {
        ScopedEnvVar env("DOCMEM_QUEUE_LOCK_DURATION_SECONDS", "5");
        auto cfg = DocMemConfig::load(path);
        REQUIRE_FALSE(cfg.has_value());
    }
}

TEST_CASE("DocMemConfig: poison queue suffix rules", "[unit][config]") {
    CHECK(isValidQueueSuffix("-poison"));
    CHECK(isValidQueueSuffix("-dlq"));
    CHECK(isValidQueueSuffix("x1"));

    CHECK_FALSE(isValidQueueSuffix(""));
    CHECK_FALSE(isValidQueueSuffix("p"));
    CHECK_FALSE(isValidQueueSuffix("-poison-"));
    CHECK_FALSE(isValidQueueSuffix("bad--suffix"));
    CHECK_FALSE(isValidQueueSuffix("-Poison"));
    CHECK_FALSE(isValidQueueSuffix(std::string(31, 'a')));
}

TEST_CASE("DocMemConfig: helpers", "[unit][config]") {
    CHECK(parse_int("42") == 42);
    CHECK_FALSE(parse_int("4x").has_value());
    CHECK(unquote("\"quoted\"") == "quoted");
    CHECK(unquote("'single'") == "single");
}
