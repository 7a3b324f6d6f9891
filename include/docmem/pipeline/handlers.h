// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025 docmem contributors

#pragma once

#include <docmem/chunking/text_chunker.h>
#include <docmem/embedding/embedding_generator.h>
#include <docmem/extraction/content_decoder.h>
#include <docmem/pipeline/constants.h>
#include <docmem/pipeline/handler.h>
#include <docmem/retry/backoff.h>
#include <docmem/storage/content_store.h>
#include <docmem/storage/file_storage.h>
#include <docmem/vector/memory_db.h>

#include <memory>
#include <string>

namespace docmem::pipeline {

/**
 * @brief Decodes uploaded files into "{file}.extract.txt".
 *
 * Pages are kept as form feed separated sections. An unsupported MIME type
 * is a permanent failure.
 */
class TextExtractionHandler : public IPipelineStepHandler {
public:
    TextExtractionHandler(std::shared_ptr<storage::IFileStorage> files,
                          extraction::DecoderRegistry decoders);

    std::string stepName() const override { return steps::kExtract; }
    HandlerResult invoke(DataPipeline& pipeline) override;

private:
    std::shared_ptr<storage::IFileStorage> files_;
    extraction::DecoderRegistry decoders_;
};

/**
 * @brief Splits extracted text into "{file}.partition.{n}.txt" files
 */
class TextPartitioningHandler : public IPipelineStepHandler {
public:
    TextPartitioningHandler(std::shared_ptr<storage::IFileStorage> files,
                            chunking::ChunkerOptions options,
                            std::shared_ptr<const chunking::ITokenizer> tokenizer = nullptr);

    std::string stepName() const override { return steps::kPartition; }
    HandlerResult invoke(DataPipeline& pipeline) override;

private:
    std::shared_ptr<storage::IFileStorage> files_;
    chunking::TextChunker chunker_;
};

struct EmbeddingStepOptions {
    int batch_size = 1;
    int max_attempts = 3;
    retry::BackoffPolicy backoff;
    // Defaults to std::this_thread::sleep_for
    retry::Sleeper sleeper;
};

/**
 * @brief Writes one "{partition}.text_embedding.json" per partition.
 *
 * Provider throttling and server errors are retried in place up to
 * max_attempts, then reported as a transient failure.
 */
class GenerateEmbeddingsHandler : public IPipelineStepHandler {
public:
    GenerateEmbeddingsHandler(std::shared_ptr<storage::IFileStorage> files,
                              std::shared_ptr<embedding::IEmbeddingGenerator> generator,
                              EmbeddingStepOptions options = {});

    std::string stepName() const override { return steps::kGenerateEmbeddings; }
    HandlerResult invoke(DataPipeline& pipeline) override;

private:
    std::shared_ptr<storage::IFileStorage> files_;
    std::shared_ptr<embedding::IEmbeddingGenerator> generator_;
    EmbeddingStepOptions options_;
};

/**
 * @brief Upserts one memory record per embedding, then purges records of
 * previous executions
 */
class SaveRecordsHandler : public IPipelineStepHandler {
public:
    SaveRecordsHandler(std::shared_ptr<storage::IFileStorage> files,
                       std::shared_ptr<vector::IMemoryDb> memoryDb);

    std::string stepName() const override { return steps::kSaveRecords; }
    HandlerResult invoke(DataPipeline& pipeline) override;

private:
    HandlerResult purgePreviousExecutions(DataPipeline& pipeline);

    std::shared_ptr<storage::IFileStorage> files_;
    std::shared_ptr<vector::IMemoryDb> memoryDb_;
};

class DeleteGeneratedFilesHandler : public IPipelineStepHandler {
public:
    explicit DeleteGeneratedFilesHandler(std::shared_ptr<storage::IFileStorage> files);

    std::string stepName() const override { return steps::kDeleteGeneratedFiles; }
    HandlerResult invoke(DataPipeline& pipeline) override;

private:
    std::shared_ptr<storage::IFileStorage> files_;
};

/**
 * @brief Removes a document's memory records, files and content record
 */
class DeleteDocumentHandler : public IPipelineStepHandler {
public:
    DeleteDocumentHandler(std::shared_ptr<storage::IFileStorage> files,
                          std::shared_ptr<vector::IMemoryDb> memoryDb,
                          std::shared_ptr<storage::IContentStore> contentStore);

    std::string stepName() const override { return steps::kDeleteDocument; }
    HandlerResult invoke(DataPipeline& pipeline) override;

private:
    std::shared_ptr<storage::IFileStorage> files_;
    std::shared_ptr<vector::IMemoryDb> memoryDb_;
    std::shared_ptr<storage::IContentStore> contentStore_;
};

/**
 * @brief Removes an index from the memory DB, file storage and content store
 */
class DeleteIndexHandler : public IPipelineStepHandler {
public:
    DeleteIndexHandler(std::shared_ptr<storage::IFileStorage> files,
                       std::shared_ptr<vector::IMemoryDb> memoryDb,
                       std::shared_ptr<storage::IContentStore> contentStore);

    std::string stepName() const override { return steps::kDeleteIndex; }
    HandlerResult invoke(DataPipeline& pipeline) override;

private:
    std::shared_ptr<storage::IFileStorage> files_;
    std::shared_ptr<vector::IMemoryDb> memoryDb_;
    std::shared_ptr<storage::IContentStore> contentStore_;
};

/**
 * @brief Collaborators needed by the built-in handlers
 */
struct HandlerDependencies {
    std::shared_ptr<storage::IFileStorage> files;
    std::shared_ptr<storage::IContentStore> content_store;
    std::shared_ptr<vector::IMemoryDb> memory_db;
    std::shared_ptr<embedding::IEmbeddingGenerator> generator;
    extraction::DecoderRegistry decoders = extraction::DecoderRegistry::withDefaults();
    chunking::ChunkerOptions chunking;
    EmbeddingStepOptions embedding;
};

/**
 * @brief Registers every built-in step handler
 */
Result<void> registerDefaultHandlers(HandlerRegistry& registry, const HandlerDependencies& deps);

// Shared by the handlers: reads a generated file and checks its checksum
Result<std::string> readGeneratedFile(storage::IFileStorage& files, const DataPipeline& pipeline,
                                      const GeneratedFileDetails& file);

} // namespace docmem::pipeline
