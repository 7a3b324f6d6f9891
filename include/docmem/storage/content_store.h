// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025 docmem contributors

#pragma once

#include <docmem/core/types.h>
#include <docmem/metadata/database.h>
#include <docmem/pipeline/data_pipeline.h>

#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace docmem::storage {

/**
 * @brief Source-of-truth record for one ingested content item.
 *
 * ready flips to true only after the terminal pipeline step succeeds.
 */
struct ContentRecord {
    std::string id;
    std::string content;
    std::string mime_type;
    int64_t byte_size = 0;
    bool ready = false;
    TimePoint content_created_at{};
    TimePoint record_created_at{};
    TimePoint record_updated_at{};
    std::string title;
    std::string description;
    std::string tags_json = "[]";
    std::string metadata_json = "{}";
};

class IContentStore {
public:
    virtual ~IContentStore() = default;

    /**
     * @brief Inserts or replaces the record; record_created_at is kept on update
     */
    virtual Result<void> upsertContent(const ContentRecord& record) = 0;
    virtual Result<std::optional<ContentRecord>> getContent(const std::string& id) = 0;

    /**
     * @brief Sets the ready flag
     * @return true when the stored value changed
     */
    virtual Result<bool> setReady(const std::string& id, bool ready) = 0;
    virtual Result<void> deleteContent(const std::string& id) = 0;

    /**
     * @brief Durable pipeline state, keyed by DataPipeline::id().
     *
     * Saving never clears a cancellation already stored for the same
     * execution.
     */
    virtual Result<void> savePipeline(const pipeline::DataPipeline& pipeline) = 0;
    virtual Result<std::optional<pipeline::DataPipeline>> loadPipeline(const std::string& id) = 0;
    virtual Result<void> deletePipeline(const std::string& id) = 0;

    /**
     * @brief Removes every content record and pipeline of an index
     */
    virtual Result<void> deleteIndex(const std::string& index) = 0;
};

/**
 * @brief SQLite content store (km_content, km_pipelines)
 */
class SqliteContentStore : public IContentStore {
public:
    static Result<std::unique_ptr<SqliteContentStore>> open(const std::string& path);

    Result<void> upsertContent(const ContentRecord& record) override;
    Result<std::optional<ContentRecord>> getContent(const std::string& id) override;
    Result<bool> setReady(const std::string& id, bool ready) override;
    Result<void> deleteContent(const std::string& id) override;

    Result<void> savePipeline(const pipeline::DataPipeline& pipeline) override;
    Result<std::optional<pipeline::DataPipeline>> loadPipeline(const std::string& id) override;
    Result<void> deletePipeline(const std::string& id) override;

    Result<void> deleteIndex(const std::string& index) override;

private:
    explicit SqliteContentStore(metadata::Database db);
    Result<void> initSchema();

    std::mutex mutex_;
    metadata::Database db_;
};

} // namespace docmem::storage
