// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025 docmem contributors

#pragma once

#include <docmem/core/types.h>
#include <docmem/metadata/database.h>

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace docmem::embedding {

/**
 * @brief Which cache operations are enabled
 */
enum class CacheMode {
    ReadWrite,
    ReadOnly, ///< store() is a no-op
    WriteOnly ///< tryGet() always misses
};

const char* cacheModeToString(CacheMode mode);
std::optional<CacheMode> parseCacheMode(std::string_view value);

/**
 * @brief Content-addressed cache key.
 *
 * Identical text embedded by the same provider and model always produces the
 * same key. Only a SHA-256 of the text is retained, never the text itself.
 */
struct EmbeddingCacheKey {
    std::string provider;
    std::string model;
    int dimensions = 0;
    bool is_normalized = false;
    size_t text_length = 0;
    std::string text_sha256;

    static EmbeddingCacheKey create(std::string provider, std::string model, int dimensions,
                                    bool isNormalized, std::string_view text);

    // provider|model|dimensions|normalized|length|sha256
    std::string toCompositeKey() const;
};

struct CachedEmbedding {
    Embedding vector;
    std::optional<int> token_count;
    TimePoint timestamp;
};

class IEmbeddingCache {
public:
    virtual ~IEmbeddingCache() = default;

    virtual CacheMode mode() const = 0;

    /**
     * @brief Returns the cached vector, or nullopt on miss (always nullopt when write-only)
     */
    virtual Result<std::optional<CachedEmbedding>> tryGet(const EmbeddingCacheKey& key) = 0;

    /**
     * @brief Upserts the vector for @p key (no-op when read-only)
     */
    virtual Result<void> store(const EmbeddingCacheKey& key, const Embedding& vector,
                               std::optional<int> tokenCount) = 0;
};

/**
 * @brief SQLite-backed embedding cache (WAL journaling for concurrent workers)
 */
class SqliteEmbeddingCache : public IEmbeddingCache {
public:
    static Result<std::unique_ptr<SqliteEmbeddingCache>> open(const std::string& path,
                                                              CacheMode mode);

    CacheMode mode() const override { return mode_; }
    Result<std::optional<CachedEmbedding>> tryGet(const EmbeddingCacheKey& key) override;
    Result<void> store(const EmbeddingCacheKey& key, const Embedding& vector,
                       std::optional<int> tokenCount) override;

    Result<int64_t> count();
    Result<void> clear();

private:
    SqliteEmbeddingCache(metadata::Database db, CacheMode mode);
    Result<void> initSchema();

    std::mutex mutex_;
    metadata::Database db_;
    CacheMode mode_;
};

} // namespace docmem::embedding
