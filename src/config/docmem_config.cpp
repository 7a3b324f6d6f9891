// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025 docmem contributors

#include <spdlog/spdlog.h>
#include <docmem/config/config_helpers.h>
#include <docmem/config/docmem_config.h>

#include <algorithm>
#include <cctype>
#include <regex>

namespace docmem::config {

namespace {

// env → config.toml → keep default
std::string lookup(const std::filesystem::path& configPath, const char* envName,
                   const std::string& section, const std::string& key) {
    if (auto env = get_env(envName)) {
        return *env;
    }
    return parse_config_value(configPath, section, key);
}

Result<void> applyInt(const std::filesystem::path& configPath, const char* envName,
                      const std::string& section, const std::string& key, long long& target) {
    auto raw = lookup(configPath, envName, section, key);
    if (raw.empty()) {
        return {};
    }
    auto parsed = parse_int(raw);
    if (!parsed) {
        return Error{ErrorCode::InvalidArgument,
                     "Invalid integer for " + section + "." + key + ": '" + raw + "'"};
    }
    target = *parsed;
    return {};
}

template <typename T>
Result<void> applyNumber(const std::filesystem::path& configPath, const char* envName,
                         const std::string& section, const std::string& key, T& target) {
    long long value = static_cast<long long>(target);
    if (auto r = applyInt(configPath, envName, section, key, value); !r) {
        return r;
    }
    target = static_cast<T>(value);
    return {};
}

void applyString(const std::filesystem::path& configPath, const char* envName,
                 const std::string& section, const std::string& key, std::string& target) {
    auto raw = lookup(configPath, envName, section, key);
    if (!raw.empty()) {
        target = raw;
    }
}

} // namespace

bool isValidQueueSuffix(const std::string& suffix) {
    static const std::regex kPattern("^[a-z0-9-]{1}(?!.*--)[a-z0-9-]{0,28}[a-z0-9]$");
    return std::regex_match(suffix, kPattern);
}

Result<void> QueueConfig::validate() const {
    if (queue_name.empty()) {
        return Error{ErrorCode::InvalidArgument, "Queue name cannot be empty"};
    }
    if (poll_delay.count() < 1) {
        return Error{ErrorCode::InvalidArgument, "Poll delay must be at least 1 ms"};
    }
    if (fetch_batch_size < 1) {
        return Error{ErrorCode::InvalidArgument, "Fetch batch size must be at least 1"};
    }
    if (lock_duration.count() < kMinLockDurationSeconds) {
        return Error{ErrorCode::InvalidArgument,
                     "Lock duration must be at least " + std::to_string(kMinLockDurationSeconds) +
                         " seconds"};
    }
    if (max_retries_before_poison < 0) {
        return Error{ErrorCode::InvalidArgument, "Max retries before poison cannot be negative"};
    }
    if (!isValidQueueSuffix(poison_queue_suffix)) {
        return Error{ErrorCode::InvalidArgument,
                     "Invalid poison queue suffix '" + poison_queue_suffix +
                         "': use 2-30 chars of [a-z0-9-], no '--', not ending with '-'"};
    }
    return {};
}

Result<void> DocMemConfig::validate() const {
    if (auto r = queue.validate(); !r) {
        return r;
    }
    if (chunking.max_tokens_per_line == 0 || chunking.max_tokens_per_paragraph == 0) {
        return Error{ErrorCode::InvalidArgument, "Chunking limits must be greater than zero"};
    }
    if (chunking.overlap_tokens >= chunking.max_tokens_per_paragraph) {
        return Error{ErrorCode::InvalidArgument,
                     "chunking.overlap_tokens must be less than max_tokens_per_paragraph"};
    }
    if (embedding.dimensions <= 0) {
        return Error{ErrorCode::InvalidArgument, "embedding.dimensions must be positive"};
    }
    if (embedding.batch_size < 1 || embedding.max_attempts < 1) {
        return Error{ErrorCode::InvalidArgument,
                     "embedding.batch_size and embedding.max_attempts must be at least 1"};
    }
    static const char* kModes[] = {"read_write", "read_only", "write_only", "disabled"};
    if (std::find(std::begin(kModes), std::end(kModes), embedding.cache_mode) ==
        std::end(kModes)) {
        return Error{ErrorCode::InvalidArgument,
                     "Unknown embedding.cache_mode '" + embedding.cache_mode + "'"};
    }
    if (worker.threads < 1) {
        return Error{ErrorCode::InvalidArgument, "worker.threads must be at least 1"};
    }
    return {};
}

Result<DocMemConfig> DocMemConfig::load(const std::filesystem::path& configPath) {
    DocMemConfig cfg;
    if (!configPath.empty() && std::filesystem::exists(configPath)) {
        spdlog::debug("[Config] Loading {}", configPath.string());
    }

    // [queue]
    long long pollDelayMs = cfg.queue.poll_delay.count();
    long long lockSeconds = cfg.queue.lock_duration.count();
    for (auto r : {applyInt(configPath, "DOCMEM_QUEUE_POLL_DELAY_MS", "queue", "poll_delay_ms",
                            pollDelayMs),
                   applyNumber(configPath, "DOCMEM_QUEUE_FETCH_BATCH_SIZE", "queue",
                               "fetch_batch_size", cfg.queue.fetch_batch_size),
                   applyInt(configPath, "DOCMEM_QUEUE_LOCK_DURATION_SECONDS", "queue",
                            "lock_duration_seconds", lockSeconds),
                   applyNumber(configPath, "DOCMEM_QUEUE_MAX_RETRIES", "queue",
                               "max_retries_before_poison", cfg.queue.max_retries_before_poison)}) {
        if (!r) {
            return r.error();
        }
    }
    cfg.queue.poll_delay = std::chrono::milliseconds(pollDelayMs);
    cfg.queue.lock_duration = std::chrono::seconds(lockSeconds);
    applyString(configPath, "DOCMEM_QUEUE_NAME", "queue", "name", cfg.queue.queue_name);
    applyString(configPath, "DOCMEM_QUEUE_POISON_SUFFIX", "queue", "poison_queue_suffix",
                cfg.queue.poison_queue_suffix);
    std::transform(cfg.queue.poison_queue_suffix.begin(), cfg.queue.poison_queue_suffix.end(),
                   cfg.queue.poison_queue_suffix.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    // [chunking]
    for (auto r :
         {applyNumber(configPath, "DOCMEM_CHUNK_MAX_TOKENS_PER_LINE", "chunking",
                      "max_tokens_per_line", cfg.chunking.max_tokens_per_line),
          applyNumber(configPath, "DOCMEM_CHUNK_MAX_TOKENS_PER_PARAGRAPH", "chunking",
                      "max_tokens_per_paragraph", cfg.chunking.max_tokens_per_paragraph),
          applyNumber(configPath, "DOCMEM_CHUNK_OVERLAP_TOKENS", "chunking", "overlap_tokens",
                      cfg.chunking.overlap_tokens)}) {
        if (!r) {
            return r.error();
        }
    }
    applyString(configPath, "DOCMEM_CHUNK_HEADER", "chunking", "chunk_header",
                cfg.chunking.chunk_header);

    // [embedding]
    applyString(configPath, "DOCMEM_EMBEDDING_PROVIDER", "embedding", "provider",
                cfg.embedding.provider);
    applyString(configPath, "DOCMEM_EMBEDDING_MODEL", "embedding", "model", cfg.embedding.model);
    applyString(configPath, "DOCMEM_EMBEDDING_CACHE_MODE", "embedding", "cache_mode",
                cfg.embedding.cache_mode);
    for (auto r : {applyNumber(configPath, "DOCMEM_EMBEDDING_DIMENSIONS", "embedding",
                               "dimensions", cfg.embedding.dimensions),
                   applyNumber(configPath, "DOCMEM_EMBEDDING_BATCH_SIZE", "embedding",
                               "batch_size", cfg.embedding.batch_size),
                   applyNumber(configPath, "DOCMEM_EMBEDDING_MAX_ATTEMPTS", "embedding",
                               "max_attempts", cfg.embedding.max_attempts),
                   applyNumber(configPath, "DOCMEM_WORKER_THREADS", "worker", "threads",
                               cfg.worker.threads)}) {
        if (!r) {
            return r.error();
        }
    }

    // [storage]
    std::string dataDir;
    applyString(configPath, "DOCMEM_DATA_DIR", "storage", "data_dir", dataDir);
    cfg.storage.data_dir = dataDir.empty() ? get_data_dir() : expand_tilde(dataDir);

    if (auto r = cfg.validate(); !r) {
        return r.error();
    }
    return cfg;
}

} // namespace docmem::config
