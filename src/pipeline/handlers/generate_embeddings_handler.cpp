// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025 docmem contributors

#include <spdlog/spdlog.h>
#include <docmem/core/uuid.h>
#include <docmem/crypto/hasher.h>
#include <docmem/pipeline/handlers.h>

#include <algorithm>
#include <thread>

namespace docmem::pipeline {

namespace {

struct PendingPartition {
    FileDetails* file;
    GeneratedFileDetails* partition;
    std::string text;
};

bool isRetryableProviderError(const Error& error) {
    return error.code == ErrorCode::ResourceExhausted || error.code == ErrorCode::NetworkError ||
           error.code == ErrorCode::Timeout;
}

} // namespace

GenerateEmbeddingsHandler::GenerateEmbeddingsHandler(
    std::shared_ptr<storage::IFileStorage> files,
    std::shared_ptr<embedding::IEmbeddingGenerator> generator, EmbeddingStepOptions options)
    : files_(std::move(files)), generator_(std::move(generator)), options_(std::move(options)) {
    if (!options_.sleeper) {
        options_.sleeper = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
}

HandlerResult GenerateEmbeddingsHandler::invoke(DataPipeline& pipeline) {
    if (!generator_) {
        return HandlerResult::permanent("No embedding generator configured");
    }

    std::vector<PendingPartition> pending;
    for (auto& file : pipeline.files) {
        for (auto& [name, partition] : file.generated_files) {
            if (partition.artifact_type != ArtifactType::TextPartition ||
                partition.alreadyProcessedBy(steps::kGenerateEmbeddings)) {
                continue;
            }
            // Output already recorded by an interrupted run
            if (file.generated_files.count(embeddingFileName(name)) > 0) {
                partition.markProcessedBy(steps::kGenerateEmbeddings);
                continue;
            }
            auto text = readGeneratedFile(*files_, pipeline, partition);
            if (!text) {
                return HandlerResult::fromError(text.error());
            }
            pending.push_back(PendingPartition{&file, &partition, std::move(text).value()});
        }
    }

    if (pending.empty()) {
        return HandlerResult::success();
    }

    const size_t batchSize = std::max<size_t>(
        1, std::min<size_t>(static_cast<size_t>(std::max(1, options_.batch_size)),
                            generator_->maxBatchSize()));
    spdlog::debug("[GenerateEmbeddings] {} partitions to embed for {} (batch size {})",
                  pending.size(), pipeline.id(), batchSize);

    for (size_t begin = 0; begin < pending.size(); begin += batchSize) {
        const size_t end = std::min(pending.size(), begin + batchSize);
        std::vector<std::string> texts;
        texts.reserve(end - begin);
        for (size_t i = begin; i < end; ++i) {
            texts.push_back(pending[i].text);
        }

        auto vectors = retry::callWithRetry<std::vector<Embedding>>(
            options_.backoff, options_.max_attempts,
            [&]() -> Result<std::vector<Embedding>> {
                if (texts.size() == 1) {
                    auto single = generator_->generate(texts.front());
                    if (!single)
                        return single.error();
                    return std::vector<Embedding>{std::move(single).value()};
                }
                return generator_->generateBatch(texts);
            },
            isRetryableProviderError, options_.sleeper);
        if (!vectors) {
            spdlog::warn("[GenerateEmbeddings] Provider {} failed for {}: {}",
                         generator_->providerName(), pipeline.id(), vectors.error().message);
            return HandlerResult::fromError(vectors.error());
        }
        if (vectors.value().size() != texts.size()) {
            return HandlerResult::transient("Embedding provider returned " +
                                            std::to_string(vectors.value().size()) +
                                            " vectors for " + std::to_string(texts.size()) +
                                            " inputs");
        }

        for (size_t i = begin; i < end; ++i) {
            auto& item = pending[i];
            const auto& vec = vectors.value()[i - begin];

            json embeddingJson = {
                {"generator_provider", generator_->providerName()},
                {"generator_name", generator_->modelName()},
                {"vector_size", vec.size()},
                {"source_file_name", item.partition->name},
                {"vector", vec},
                {"timestamp", core::formatTimestamp(std::chrono::system_clock::now())}};
            const auto body = embeddingJson.dump();
            const auto name = embeddingFileName(item.partition->name);
            if (auto r = files_->writeFile(pipeline.index, pipeline.document_id, name, body); !r) {
                return HandlerResult::fromError(r.error());
            }

            GeneratedFileDetails out;
            out.id = core::generateUUID();
            out.name = name;
            out.size = static_cast<int64_t>(body.size());
            out.mime_type = extraction::kMimeJson;
            out.tags = item.partition->tags;
            out.parent_id = item.file->id;
            out.source_partition_id = item.partition->id;
            out.content_sha256 = crypto::SHA256Hasher::hash(std::string_view(body));
            out.artifact_type = ArtifactType::TextEmbeddingVector;
            out.partition_number = item.partition->partition_number;
            out.section_number = item.partition->section_number;

            item.partition->markProcessedBy(steps::kGenerateEmbeddings);
            item.file->generated_files[name] = std::move(out);
        }
    }

    for (auto& file : pipeline.files) {
        file.markProcessedBy(steps::kGenerateEmbeddings);
    }
    return HandlerResult::success();
}

} // namespace docmem::pipeline
