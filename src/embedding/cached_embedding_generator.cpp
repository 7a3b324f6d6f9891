// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025 docmem contributors

#include <spdlog/spdlog.h>
#include <docmem/embedding/embedding_generator.h>

namespace docmem::embedding {

CachedEmbeddingGenerator::CachedEmbeddingGenerator(std::shared_ptr<IEmbeddingGenerator> inner,
                                                   std::shared_ptr<IEmbeddingCache> cache)
    : inner_(std::move(inner)), cache_(std::move(cache)) {}

EmbeddingCacheKey CachedEmbeddingGenerator::makeKey(std::string_view text) const {
    return EmbeddingCacheKey::create(inner_->providerName(), inner_->modelName(),
                                     inner_->dimensions(), inner_->isNormalized(), text);
}

std::optional<Embedding> CachedEmbeddingGenerator::lookup(const EmbeddingCacheKey& key) {
    if (!cache_)
        return std::nullopt;
    auto cached = cache_->tryGet(key);
    if (!cached) {
        // A broken cache must not fail ingestion; fall through to the provider
        spdlog::warn("[EmbeddingCache] Lookup failed: {}", cached.error().message);
        return std::nullopt;
    }
    if (!cached.value())
        return std::nullopt;
    return std::move(cached.value()->vector);
}

void CachedEmbeddingGenerator::remember(const EmbeddingCacheKey& key, std::string_view text,
                                        const Embedding& vector) {
    if (!cache_)
        return;
    if (auto r = cache_->store(key, vector, inner_->countTokens(text)); !r) {
        spdlog::warn("[EmbeddingCache] Store failed: {}", r.error().message);
    }
}

Result<Embedding> CachedEmbeddingGenerator::generate(std::string_view text) {
    auto key = makeKey(text);
    if (auto hit = lookup(key)) {
        ++hits_;
        return std::move(*hit);
    }

    ++misses_;
    auto generated = inner_->generate(text);
    if (!generated)
        return generated.error();
    remember(key, text, generated.value());
    return generated;
}

Result<std::vector<Embedding>>
CachedEmbeddingGenerator::generateBatch(const std::vector<std::string>& texts) {
    std::vector<std::optional<Embedding>> slots(texts.size());
    std::vector<EmbeddingCacheKey> keys;
    keys.reserve(texts.size());

    std::vector<std::string> missing;
    std::vector<size_t> missingIndex;
    for (size_t i = 0; i < texts.size(); ++i) {
        keys.push_back(makeKey(texts[i]));
        slots[i] = lookup(keys.back());
        if (slots[i]) {
            ++hits_;
        } else {
            ++misses_;
            missing.push_back(texts[i]);
            missingIndex.push_back(i);
        }
    }

    if (!missing.empty()) {
        auto generated = inner_->generateBatch(missing);
        if (!generated)
            return generated.error();
        auto& vectors = generated.value();
        if (vectors.size() != missing.size()) {
            return Error{ErrorCode::InvalidData,
                         "Provider returned " + std::to_string(vectors.size()) +
                             " embeddings for " + std::to_string(missing.size()) + " inputs"};
        }
        for (size_t j = 0; j < missing.size(); ++j) {
            remember(keys[missingIndex[j]], missing[j], vectors[j]);
            slots[missingIndex[j]] = std::move(vectors[j]);
        }
    }

    std::vector<Embedding> out;
    out.reserve(slots.size());
    for (auto& slot : slots) {
        out.push_back(std::move(*slot));
    }
    return out;
}

} // namespace docmem::embedding
