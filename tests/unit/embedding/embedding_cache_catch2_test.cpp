// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025 docmem contributors

#include <catch2/catch_test_macros.hpp>

#include "../../common/test_helpers_catch2.h"

#include <docmem/crypto/hasher.h>
#include <docmem/embedding/embedding_cache.h>
#include <docmem/embedding/embedding_generator.h>

#include <cmath>
#include <filesystem>
#include <memory>

using namespace docmem;
using namespace docmem::embedding;

namespace {

struct CacheFixture {
    CacheFixture() { root = test::make_temp_dir("docmem_cache_"); }

    ~CacheFixture() {
        std::error_code ec;
        std::filesystem::remove_all(root, ec);
    }

    std::unique_ptr<SqliteEmbeddingCache> open(CacheMode mode) {
        auto cache = SqliteEmbeddingCache::open((root / "embeddings_cache.db").string(), mode);
        REQUIRE(cache.has_value());
        return std::move(cache).value();
    }

    std::filesystem::path root;
};

/// Counts calls reaching the provider
class CountingGenerator : public IEmbeddingGenerator {
public:
    std::string providerName() const override { return "counting"; }
    std::string modelName() const override { return "counting-4"; }
    int dimensions() const override { return 4; }
    size_t maxBatchSize() const override { return 16; }

    Result<Embedding> generate(std::string_view text) override {
        ++calls;
        return inner.generate(text);
    }

    int calls = 0;
    HashEmbeddingGenerator inner{4, "counting-4"};
};

EmbeddingCacheKey keyFor(std::string_view text) {
    return EmbeddingCacheKey::create("hash", "hash-4", 4, true, text);
}

} // namespace

TEST_CASE("EmbeddingCacheKey: composite key layout", "[unit][embedding][cache]") {
    auto key = EmbeddingCacheKey::create("openai", "text-embedding-3", 1536, false, "hello");
    CHECK(key.text_length == 5);
    CHECK(key.text_sha256 == crypto::SHA256Hasher::hash(std::string_view("hello")));
    CHECK(key.toCompositeKey() == "openai|text-embedding-3|1536|false|5|" + key.text_sha256);

    SECTION("the text itself is never part of the key") {
        auto secret = EmbeddingCacheKey::create("p", "m", 8, true, "top secret phrase");
        CHECK(secret.toCompositeKey().find("secret") == std::string::npos);
    }
}

TEST_CASE("EmbeddingCache: parseCacheMode", "[unit][embedding][cache]") {
    CHECK(parseCacheMode("read_write") == CacheMode::ReadWrite);
    CHECK(parseCacheMode("read_only") == CacheMode::ReadOnly);
    CHECK(parseCacheMode("writeonly") == CacheMode::WriteOnly);
    CHECK_FALSE(parseCacheMode("sometimes").has_value());
}

TEST_CASE_METHOD(CacheFixture, "EmbeddingCache: store and read back", "[unit][embedding][cache]") {
    auto cache = open(CacheMode::ReadWrite);
    const Embedding vec{0.5f, -0.25f, 0.125f, 1.0f};

    REQUIRE(cache->store(keyFor("text"), vec, 7).has_value());

    auto hit = cache->tryGet(keyFor("text"));
    REQUIRE(hit.has_value());
    REQUIRE(hit.value().has_value());
    CHECK(hit.value()->vector == vec);
    REQUIRE(hit.value()->token_count.has_value());
    CHECK(*hit.value()->token_count == 7);

    auto miss = cache->tryGet(keyFor("other text"));
    REQUIRE(miss.has_value());
    CHECK_FALSE(miss.value().has_value());

    SECTION("storing again replaces the entry") {
        const Embedding replaced{1.0f, 0.0f, 0.0f, 0.0f};
        REQUIRE(cache->store(keyFor("text"), replaced, std::nullopt).has_value());
        auto again = cache->tryGet(keyFor("text"));
        REQUIRE(again.has_value());
        REQUIRE(again.value().has_value());
        CHECK(again.value()->vector == replaced);
        CHECK(cache->count().value() == 1);
    }

    SECTION("clear empties the cache") {
        REQUIRE(cache->clear().has_value());
        CHECK(cache->count().value() == 0);
    }
}

TEST_CASE_METHOD(CacheFixture, "EmbeddingCache: entries with a different size are ignored",
                 "[unit][embedding][cache]") {
    auto cache = open(CacheMode::ReadWrite);
    REQUIRE(cache->store(keyFor("text"), Embedding{1.0f, 2.0f}, std::nullopt).has_value());

    auto result = cache->tryGet(keyFor("text"));
    REQUIRE(result.has_value());
    CHECK_FALSE(result.value().has_value());
}

TEST_CASE_METHOD(CacheFixture, "EmbeddingCache: read-only and write-only modes",
                 "[unit][embedding][cache]") {
    const Embedding vec{0.0f, 1.0f, 0.0f, 0.0f};

    SECTION("read-only never writes") {
        auto cache = open(CacheMode::ReadOnly);
        REQUIRE(cache->store(keyFor("text"), vec, std::nullopt).has_value());
        CHECK(cache->count().value() == 0);
    }

    SECTION("write-only never hits") {
        auto cache = open(CacheMode::WriteOnly);
        REQUIRE(cache->store(keyFor("text"), vec, std::nullopt).has_value());
        CHECK(cache->count().value() == 1);
        auto result = cache->tryGet(keyFor("text"));
        REQUIRE(result.has_value());
        CHECK_FALSE(result.value().has_value());
    }

    SECTION("a read-only cache serves what a writer stored") {
        {
            auto writer = open(CacheMode::ReadWrite);
            REQUIRE(writer->store(keyFor("text"), vec, std::nullopt).has_value());
        }
        auto reader = open(CacheMode::ReadOnly);
        auto result = reader->tryGet(keyFor("text"));
        REQUIRE(result.has_value());
        CHECK(result.value().has_value());
    }
}

TEST_CASE("HashEmbeddingGenerator: deterministic unit vectors", "[unit][embedding][generator]") {
    HashEmbeddingGenerator generator(32, "hash-32");

    auto a = generator.generate("the same text");
    auto b = generator.generate("the same text");
    auto c = generator.generate("different text");
    REQUIRE(a.has_value());
    REQUIRE(b.has_value());
    REQUIRE(c.has_value());

    CHECK(a.value().size() == 32);
    CHECK(a.value() == b.value());
    CHECK(a.value() != c.value());

    float norm = 0.0f;
    for (float v : a.value())
        norm += v * v;
    CHECK(std::abs(std::sqrt(norm) - 1.0f) < 1e-4f);

    HashEmbeddingGenerator broken(0);
    auto failed = broken.generate("x");
    REQUIRE_FALSE(failed.has_value());
    CHECK(failed.error().code == ErrorCode::InvalidArgument);
}

TEST_CASE_METHOD(CacheFixture, "CachedEmbeddingGenerator: only misses reach the provider",
                 "[unit][embedding][generator][cache]") {
    auto provider = std::make_shared<CountingGenerator>();
    std::shared_ptr<IEmbeddingCache> cache = open(CacheMode::ReadWrite);
    CachedEmbeddingGenerator generator(provider, cache);

    auto first = generator.generate("alpha");
    auto second = generator.generate("alpha");
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    CHECK(first.value() == second.value());
    CHECK(provider->calls == 1);
    CHECK(generator.cacheHits() == 1);
    CHECK(generator.cacheMisses() == 1);

    SECTION("batches mix cached and fresh vectors in input order") {
        auto batch = generator.generateBatch({"beta", "alpha", "gamma"});
        REQUIRE(batch.has_value());
        REQUIRE(batch.value().size() == 3);
        CHECK(batch.value()[1] == first.value());
        CHECK(batch.value()[0] == provider->inner.generate("beta").value());
        CHECK(provider->calls == 3);
        CHECK(generator.cacheHits() == 2);
        CHECK(generator.cacheMisses() == 3);
    }
}

TEST_CASE_METHOD(CacheFixture, "CachedEmbeddingGenerator: token counts are cached with vectors",
                 "[unit][embedding][generator][cache]") {
    auto provider = std::make_shared<HashEmbeddingGenerator>(4, "hash-4");
    std::shared_ptr<IEmbeddingCache> cache = open(CacheMode::ReadWrite);
    CachedEmbeddingGenerator generator(provider, cache);
    CHECK(generator.countTokens("one two three") == std::optional<int>{3});

    REQUIRE(generator.generate("alpha beta gamma").has_value());
    REQUIRE(generator.generateBatch({"delta epsilon"}).has_value());

    auto single = cache->tryGet(keyFor("alpha beta gamma"));
    REQUIRE(single.has_value());
    REQUIRE(single.value().has_value());
    CHECK(single.value()->token_count == std::optional<int>{3});

    auto batched = cache->tryGet(keyFor("delta epsilon"));
    REQUIRE(batched.has_value());
    REQUIRE(batched.value().has_value());
    CHECK(batched.value()->token_count == std::optional<int>{2});

    SECTION("providers that cannot count store no token count") {
        auto counting = std::make_shared<CountingGenerator>();
        CachedEmbeddingGenerator uncounted(counting, cache);
        REQUIRE(uncounted.generate("zeta").has_value());
        auto entry = cache->tryGet(
            EmbeddingCacheKey::create("counting", "counting-4", 4, true, "zeta"));
        REQUIRE(entry.has_value());
        REQUIRE(entry.value().has_value());
        CHECK_FALSE(entry.value()->token_count.has_value());
    }
}
