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
#include <vector>

namespace docmem::vector {

/**
 * @brief One searchable unit: a partition's embedding plus tags and payload
 */
struct MemoryRecord {
    std::string id;
    Embedding vector;
    pipeline::TagCollection tags;
    pipeline::json payload = pipeline::json::object();
};

/**
 * @brief Every listed tag must carry at least one of the given values
 */
using MemoryFilter = pipeline::TagCollection;

/**
 * @brief Vector DB adapter used by the pipeline handlers
 */
class IMemoryDb {
public:
    virtual ~IMemoryDb() = default;

    virtual Result<void> createIndex(const std::string& index, int vectorSize) = 0;
    virtual Result<void> deleteIndex(const std::string& index) = 0;
    virtual Result<std::vector<std::string>> getIndexes() = 0;

    /**
     * @brief Inserts or replaces a record, creating the index on first use
     */
    virtual Result<std::string> upsert(const std::string& index, const MemoryRecord& record) = 0;

    /**
     * @brief Records matching @p filter (all records when empty), ordered by id
     * @param limit 0 for no limit
     */
    virtual Result<std::vector<MemoryRecord>> getList(const std::string& index,
                                                      const MemoryFilter& filter,
                                                      size_t limit = 0,
                                                      bool withEmbeddings = false) = 0;

    /**
     * @brief Deleting a missing record succeeds
     */
    virtual Result<void> remove(const std::string& index, const std::string& recordId) = 0;
};

/**
 * @brief SQLite memory DB (km_memory_indexes, km_memory_records, km_memory_record_tags)
 */
class SqliteMemoryDb : public IMemoryDb {
public:
    static Result<std::unique_ptr<SqliteMemoryDb>> open(const std::string& path);

    Result<void> createIndex(const std::string& index, int vectorSize) override;
    Result<void> deleteIndex(const std::string& index) override;
    Result<std::vector<std::string>> getIndexes() override;
    Result<std::string> upsert(const std::string& index, const MemoryRecord& record) override;
    Result<std::vector<MemoryRecord>> getList(const std::string& index,
                                              const MemoryFilter& filter, size_t limit = 0,
                                              bool withEmbeddings = false) override;
    Result<void> remove(const std::string& index, const std::string& recordId) override;

    Result<int64_t> count(const std::string& index);

private:
    explicit SqliteMemoryDb(metadata::Database db);
    Result<void> initSchema();
    Result<void> ensureIndex(const std::string& index, int vectorSize);

    std::mutex mutex_;
    metadata::Database db_;
};

} // namespace docmem::vector
