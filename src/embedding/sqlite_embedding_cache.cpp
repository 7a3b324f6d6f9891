// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025 docmem contributors

#include <spdlog/spdlog.h>
#include <docmem/core/uuid.h>
#include <docmem/crypto/hasher.h>
#include <docmem/embedding/embedding_cache.h>

#include <cstring>

namespace docmem::embedding {

const char* cacheModeToString(CacheMode mode) {
    switch (mode) {
        case CacheMode::ReadWrite:
            return "read_write";
        case CacheMode::ReadOnly:
            return "read_only";
        case CacheMode::WriteOnly:
            return "write_only";
    }
    return "read_write";
}

std::optional<CacheMode> parseCacheMode(std::string_view value) {
    if (value == "read_write" || value == "readwrite")
        return CacheMode::ReadWrite;
    if (value == "read_only" || value == "readonly")
        return CacheMode::ReadOnly;
    if (value == "write_only" || value == "writeonly")
        return CacheMode::WriteOnly;
    return std::nullopt;
}

EmbeddingCacheKey EmbeddingCacheKey::create(std::string provider, std::string model,
                                            int dimensions, bool isNormalized,
                                            std::string_view text) {
    EmbeddingCacheKey key;
    key.provider = std::move(provider);
    key.model = std::move(model);
    key.dimensions = dimensions;
    key.is_normalized = isNormalized;
    key.text_length = text.size();
    key.text_sha256 = crypto::SHA256Hasher::hash(text);
    return key;
}

std::string EmbeddingCacheKey::toCompositeKey() const {
    return provider + "|" + model + "|" + std::to_string(dimensions) + "|" +
           (is_normalized ? "true" : "false") + "|" + std::to_string(text_length) + "|" +
           text_sha256;
}

SqliteEmbeddingCache::SqliteEmbeddingCache(metadata::Database db, CacheMode mode)
    : db_(std::move(db)), mode_(mode) {}

Result<std::unique_ptr<SqliteEmbeddingCache>> SqliteEmbeddingCache::open(const std::string& path,
                                                                         CacheMode mode) {
    metadata::Database db;
    if (auto r = db.open(path, metadata::ConnectionMode::Create); !r) {
        return r.error();
    }
    if (auto r = db.enableWAL(); !r) {
        spdlog::warn("[EmbeddingCache] Could not enable WAL on {}: {}", path, r.error().message);
    }

    std::unique_ptr<SqliteEmbeddingCache> cache(new SqliteEmbeddingCache(std::move(db), mode));
    if (auto r = cache->initSchema(); !r) {
        return r.error();
    }
    spdlog::debug("[EmbeddingCache] Opened {} (mode={})", path, cacheModeToString(mode));
    return cache;
}

Result<void> SqliteEmbeddingCache::initSchema() {
    return db_.execute("CREATE TABLE IF NOT EXISTS embeddings_cache ("
                       "key TEXT PRIMARY KEY, "
                       "vector BLOB NOT NULL, "
                       "token_count INTEGER NULL, "
                       "timestamp TEXT NOT NULL);"
                       "CREATE INDEX IF NOT EXISTS idx_embeddings_cache_timestamp "
                       "ON embeddings_cache(timestamp);");
}

Result<std::optional<CachedEmbedding>> SqliteEmbeddingCache::tryGet(const EmbeddingCacheKey& key) {
    if (mode_ == CacheMode::WriteOnly) {
        return std::optional<CachedEmbedding>{};
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto stmtResult =
        db_.prepare("SELECT vector, token_count, timestamp FROM embeddings_cache WHERE key = ?");
    if (!stmtResult)
        return stmtResult.error();
    auto stmt = std::move(stmtResult).value();
    if (auto r = stmt.bind(1, key.toCompositeKey()); !r)
        return r.error();

    auto row = stmt.step();
    if (!row)
        return row.error();
    if (!row.value())
        return std::optional<CachedEmbedding>{};

    auto blob = stmt.getBlob(0);
    if (blob.size() % sizeof(float) != 0 ||
        blob.size() / sizeof(float) != static_cast<size_t>(key.dimensions)) {
        spdlog::warn("[EmbeddingCache] Ignoring entry with unexpected size ({} bytes)",
                     blob.size());
        return std::optional<CachedEmbedding>{};
    }

    CachedEmbedding cached;
    cached.vector.resize(blob.size() / sizeof(float));
    std::memcpy(cached.vector.data(), blob.data(), blob.size());
    if (!stmt.isNull(1)) {
        cached.token_count = stmt.getInt(1);
    }
    cached.timestamp = core::parseTimestamp(stmt.getString(2));
    return std::optional<CachedEmbedding>{std::move(cached)};
}

Result<void> SqliteEmbeddingCache::store(const EmbeddingCacheKey& key, const Embedding& vector,
                                         std::optional<int> tokenCount) {
    if (mode_ == CacheMode::ReadOnly) {
        return {};
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto stmtResult = db_.prepare(
        "INSERT INTO embeddings_cache (key, vector, token_count, timestamp) VALUES (?, ?, ?, ?) "
        "ON CONFLICT(key) DO UPDATE SET vector = excluded.vector, "
        "token_count = excluded.token_count, timestamp = excluded.timestamp");
    if (!stmtResult)
        return stmtResult.error();
    auto stmt = std::move(stmtResult).value();

    auto bytes = std::as_bytes(std::span<const float>(vector.data(), vector.size()));
    if (auto r = stmt.bindAll(key.toCompositeKey(), bytes, tokenCount,
                              core::formatTimestamp(std::chrono::system_clock::now()));
        !r) {
        return r.error();
    }
    return stmt.execute();
}

Result<int64_t> SqliteEmbeddingCache::count() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmtResult = db_.prepare("SELECT COUNT(*) FROM embeddings_cache");
    if (!stmtResult)
        return stmtResult.error();
    auto stmt = std::move(stmtResult).value();
    auto row = stmt.step();
    if (!row)
        return row.error();
    return stmt.getInt64(0);
}

Result<void> SqliteEmbeddingCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    return db_.execute("DELETE FROM embeddings_cache");
}

} // namespace docmem::embedding
