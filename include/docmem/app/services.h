// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025 docmem contributors

#pragma once

#include <docmem/config/docmem_config.h>
#include <docmem/core/types.h>
#include <docmem/embedding/embedding_generator.h>
#include <docmem/pipeline/handler.h>
#include <docmem/pipeline/orchestrator.h>
#include <docmem/queue/operation_queue.h>
#include <docmem/storage/content_store.h>
#include <docmem/storage/file_storage.h>
#include <docmem/vector/memory_db.h>

#include <memory>

namespace docmem::app {

/**
 * @brief Everything the executable needs, wired from one configuration
 */
struct Services {
    config::DocMemConfig config;
    std::shared_ptr<queue::SqliteOperationQueue> queue;
    std::shared_ptr<storage::SqliteContentStore> content_store;
    std::shared_ptr<storage::DiskFileStorage> files;
    std::shared_ptr<vector::SqliteMemoryDb> memory_db;
    std::shared_ptr<embedding::IEmbeddingGenerator> generator;
    std::shared_ptr<pipeline::HandlerRegistry> handlers;
    std::shared_ptr<pipeline::PipelineOrchestrator> orchestrator;
};

/**
 * @brief Builds the embedding generator for the configured provider,
 * wrapped with the embedding cache unless cache_mode is "disabled"
 */
Result<std::shared_ptr<embedding::IEmbeddingGenerator>>
makeEmbeddingGenerator(const config::DocMemConfig& config);

/**
 * @brief Opens the stores under config.storage.data_dir and registers the
 * built-in handlers
 */
Result<Services> openServices(const config::DocMemConfig& config);

} // namespace docmem::app
