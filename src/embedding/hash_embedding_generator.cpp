// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025 docmem contributors

#include <spdlog/spdlog.h>
#include <docmem/chunking/text_chunker.h>
#include <docmem/crypto/hasher.h>
#include <docmem/embedding/embedding_generator.h>

#include <cmath>
#include <random>

namespace docmem::embedding {

HashEmbeddingGenerator::HashEmbeddingGenerator(int dimensions, std::string model)
    : dimensions_(dimensions), model_(std::move(model)) {
    spdlog::debug("[HashEmbeddingGenerator] Created with dimension {}", dimensions_);
}

std::optional<int> HashEmbeddingGenerator::countTokens(std::string_view text) const {
    return static_cast<int>(chunking::WhitespaceTokenizer().countTokens(text));
}

Result<Embedding> HashEmbeddingGenerator::generate(std::string_view text) {
    if (dimensions_ <= 0) {
        return Error{ErrorCode::InvalidArgument, "Embedding dimensions must be positive"};
    }

    // Seed from SHA-256 so vectors are stable across platforms and runs
    const auto digest = crypto::SHA256Hasher::hash(text);
    std::seed_seq seq(digest.begin(), digest.end());
    std::mt19937 gen(seq);
    std::normal_distribution<float> dist(0.0f, 1.0f);

    Embedding embedding(static_cast<size_t>(dimensions_));
    for (auto& val : embedding) {
        val = dist(gen);
    }

    // Normalize to unit length
    float norm = 0.0f;
    for (float val : embedding) {
        norm += val * val;
    }
    norm = std::sqrt(norm);
    if (norm > 0) {
        for (float& val : embedding) {
            val /= norm;
        }
    }
    return embedding;
}

} // namespace docmem::embedding
