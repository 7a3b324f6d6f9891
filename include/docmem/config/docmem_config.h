// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025 docmem contributors

#pragma once

#include <docmem/chunking/text_chunker.h>
#include <docmem/core/types.h>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace docmem::config {

/**
 * @brief Operation queue and poison policy settings ([queue])
 */
struct QueueConfig {
    static constexpr int kMinLockDurationSeconds = 30;

    std::string queue_name = "docmem-pipeline";
    std::chrono::milliseconds poll_delay{100};
    int fetch_batch_size = 3;
    std::chrono::seconds lock_duration{300};
    int max_retries_before_poison = 20;
    std::string poison_queue_suffix = "-poison";

    /**
     * @brief Rejects values that would break locking or poison routing
     */
    Result<void> validate() const;

    std::string poisonQueueName() const { return queue_name + poison_queue_suffix; }
};

/**
 * @brief Embedding provider and cache settings ([embedding])
 */
struct EmbeddingConfig {
    std::string provider = "hash";
    std::string model = "hash-384";
    int dimensions = 384;
    std::string cache_mode = "read_write"; // read_write | read_only | write_only | disabled
    int batch_size = 1;
    int max_attempts = 3;
};

struct StorageConfig {
    std::filesystem::path data_dir;

    std::filesystem::path databasePath() const { return data_dir / "docmem.db"; }
    std::filesystem::path embeddingCachePath() const { return data_dir / "embeddings_cache.db"; }
    std::filesystem::path filesRoot() const { return data_dir / "files"; }
};

struct WorkerConfig {
    int threads = 1;
};

/**
 * @brief Fully resolved configuration.
 *
 * Precedence: DOCMEM_* environment variables, then config.toml, then defaults.
 */
struct DocMemConfig {
    QueueConfig queue;
    chunking::ChunkerOptions chunking;
    EmbeddingConfig embedding;
    StorageConfig storage;
    WorkerConfig worker;

    static Result<DocMemConfig> load(const std::filesystem::path& configPath);

    Result<void> validate() const;
};

/**
 * @brief Checks the poison queue suffix naming rules
 *
 * 2-30 chars of [a-z0-9-], no "--", not ending with '-'.
 */
bool isValidQueueSuffix(const std::string& suffix);

} // namespace docmem::config
