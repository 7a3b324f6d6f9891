// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025 docmem contributors

#include <spdlog/spdlog.h>
#include <docmem/app/services.h>
#include <docmem/embedding/embedding_cache.h>
#include <docmem/pipeline/handlers.h>

#include <filesystem>

namespace docmem::app {

Result<std::shared_ptr<embedding::IEmbeddingGenerator>>
makeEmbeddingGenerator(const config::DocMemConfig& config) {
    const auto& cfg = config.embedding;
    if (cfg.provider != "hash") {
        return Error{ErrorCode::NotSupported,
                     "Unknown embedding provider '" + cfg.provider + "'"};
    }
    std::shared_ptr<embedding::IEmbeddingGenerator> generator =
        std::make_shared<embedding::HashEmbeddingGenerator>(cfg.dimensions, cfg.model);

    if (cfg.cache_mode == "disabled") {
        return generator;
    }
    auto mode = embedding::parseCacheMode(cfg.cache_mode);
    if (!mode) {
        return Error{ErrorCode::InvalidArgument, "Unknown cache mode '" + cfg.cache_mode + "'"};
    }
    std::error_code ec;
    std::filesystem::create_directories(config.storage.data_dir, ec);
    if (ec) {
        return Error{ErrorCode::IOError, "Cannot create data directory " +
                                             config.storage.data_dir.string() + ": " +
                                             ec.message()};
    }
    auto cache = embedding::SqliteEmbeddingCache::open(
        config.storage.embeddingCachePath().string(), *mode);
    if (!cache) {
        return cache.error();
    }
    std::shared_ptr<embedding::IEmbeddingCache> shared = std::move(cache).value();
    spdlog::debug("[Services] Embedding cache at {} ({})",
                  config.storage.embeddingCachePath().string(), cfg.cache_mode);
    return std::shared_ptr<embedding::IEmbeddingGenerator>(
        std::make_shared<embedding::CachedEmbeddingGenerator>(std::move(generator),
                                                              std::move(shared)));
}

Result<Services> openServices(const config::DocMemConfig& config) {
    std::error_code ec;
    std::filesystem::create_directories(config.storage.data_dir, ec);
    if (ec) {
        return Error{ErrorCode::IOError, "Cannot create data directory " +
                                             config.storage.data_dir.string() + ": " +
                                             ec.message()};
    }

    Services services;
    services.config = config;
    const auto dbPath = config.storage.databasePath().string();

    auto queue = queue::SqliteOperationQueue::open(dbPath, config.queue);
    if (!queue)
        return queue.error();
    services.queue = std::move(queue).value();

    auto contentStore = storage::SqliteContentStore::open(dbPath);
    if (!contentStore)
        return contentStore.error();
    services.content_store = std::move(contentStore).value();

    auto memoryDb = vector::SqliteMemoryDb::open(dbPath);
    if (!memoryDb)
        return memoryDb.error();
    services.memory_db = std::move(memoryDb).value();

    auto generator = makeEmbeddingGenerator(config);
    if (!generator)
        return generator.error();
    services.generator = std::move(generator).value();

    services.files = std::make_shared<storage::DiskFileStorage>(config.storage.filesRoot());
    services.handlers = std::make_shared<pipeline::HandlerRegistry>();

    pipeline::HandlerDependencies deps;
    deps.files = services.files;
    deps.content_store = services.content_store;
    deps.memory_db = services.memory_db;
    deps.generator = services.generator;
    deps.chunking = config.chunking;
    deps.embedding.batch_size = config.embedding.batch_size;
    deps.embedding.max_attempts = config.embedding.max_attempts;
    if (auto r = pipeline::registerDefaultHandlers(*services.handlers, deps); !r) {
        return r.error();
    }

    services.orchestrator = std::make_shared<pipeline::PipelineOrchestrator>(
        services.queue, services.content_store, services.files, services.handlers, config.queue);

    spdlog::debug("[Services] Opened {} with {} handlers", dbPath,
                  services.handlers->stepNames().size());
    return services;
}

} // namespace docmem::app
