// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025 docmem contributors

#pragma once

#include <docmem/core/types.h>
#include <docmem/embedding/embedding_cache.h>

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace docmem::embedding {

/**
 * @brief Embedding provider client.
 *
 * Throttling is reported as ErrorCode::ResourceExhausted and server failures
 * as ErrorCode::NetworkError; both are retryable.
 */
class IEmbeddingGenerator {
public:
    virtual ~IEmbeddingGenerator() = default;

    virtual std::string providerName() const = 0;
    virtual std::string modelName() const = 0;
    virtual int dimensions() const = 0;
    virtual bool isNormalized() const { return true; }
    virtual size_t maxBatchSize() const { return 1; }

    /**
     * @brief Tokens the provider counts for @p text, when it can tell
     */
    virtual std::optional<int> countTokens(std::string_view) const { return std::nullopt; }

    virtual Result<Embedding> generate(std::string_view text) = 0;

    /**
     * @brief Generates one vector per input, in order
     */
    virtual Result<std::vector<Embedding>> generateBatch(const std::vector<std::string>& texts) {
        std::vector<Embedding> out;
        out.reserve(texts.size());
        for (const auto& text : texts) {
            auto r = generate(text);
            if (!r)
                return r.error();
            out.push_back(std::move(r).value());
        }
        return out;
    }
};

/**
 * @brief Deterministic local generator: vectors derived from the text hash.
 *
 * Produces unit-length vectors so identical text always maps to the same
 * embedding. Used when no remote provider is configured.
 */
class HashEmbeddingGenerator : public IEmbeddingGenerator {
public:
    explicit HashEmbeddingGenerator(int dimensions = 384, std::string model = "hash-384");

    std::string providerName() const override { return "hash"; }
    std::string modelName() const override { return model_; }
    int dimensions() const override { return dimensions_; }
    size_t maxBatchSize() const override { return 64; }
    std::optional<int> countTokens(std::string_view text) const override;

    Result<Embedding> generate(std::string_view text) override;

private:
    int dimensions_;
    std::string model_;
};

/**
 * @brief Decorator that consults an IEmbeddingCache before calling the provider.
 *
 * Only cache misses reach the inner generator; their results are stored.
 */
class CachedEmbeddingGenerator : public IEmbeddingGenerator {
public:
    CachedEmbeddingGenerator(std::shared_ptr<IEmbeddingGenerator> inner,
                             std::shared_ptr<IEmbeddingCache> cache);

    std::string providerName() const override { return inner_->providerName(); }
    std::string modelName() const override { return inner_->modelName(); }
    int dimensions() const override { return inner_->dimensions(); }
    bool isNormalized() const override { return inner_->isNormalized(); }
    size_t maxBatchSize() const override { return inner_->maxBatchSize(); }
    std::optional<int> countTokens(std::string_view text) const override {
        return inner_->countTokens(text);
    }

    Result<Embedding> generate(std::string_view text) override;
    Result<std::vector<Embedding>> generateBatch(const std::vector<std::string>& texts) override;

    uint64_t cacheHits() const { return hits_; }
    uint64_t cacheMisses() const { return misses_; }

private:
    EmbeddingCacheKey makeKey(std::string_view text) const;
    std::optional<Embedding> lookup(const EmbeddingCacheKey& key);
    void remember(const EmbeddingCacheKey& key, std::string_view text, const Embedding& vector);

    std::shared_ptr<IEmbeddingGenerator> inner_;
    std::shared_ptr<IEmbeddingCache> cache_;
    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
};

} // namespace docmem::embedding
