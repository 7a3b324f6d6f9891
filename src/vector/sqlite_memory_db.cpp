// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025 docmem contributors

#include <spdlog/spdlog.h>
#include <docmem/core/uuid.h>
#include <docmem/vector/memory_db.h>

#include <cstring>
#include <span>

namespace docmem::vector {

SqliteMemoryDb::SqliteMemoryDb(metadata::Database db) : db_(std::move(db)) {}

Result<std::unique_ptr<SqliteMemoryDb>> SqliteMemoryDb::open(const std::string& path) {
    metadata::Database db;
    if (auto r = db.open(path, metadata::ConnectionMode::Create); !r) {
        return r.error();
    }
    if (auto r = db.enableWAL(); !r) {
        spdlog::warn("[MemoryDb] Could not enable WAL on {}: {}", path, r.error().message);
    }
    std::unique_ptr<SqliteMemoryDb> memoryDb(new SqliteMemoryDb(std::move(db)));
    if (auto r = memoryDb->initSchema(); !r) {
        return r.error();
    }
    return memoryDb;
}

Result<void> SqliteMemoryDb::initSchema() {
    return db_.execute(R"(
        CREATE TABLE IF NOT EXISTS km_memory_indexes (
            name TEXT PRIMARY KEY,
            vector_size INTEGER NOT NULL,
            created_at INTEGER NOT NULL
        );
        CREATE TABLE IF NOT EXISTS km_memory_records (
            index_name TEXT NOT NULL,
            id TEXT NOT NULL,
            vector BLOB,
            tags_json TEXT NOT NULL DEFAULT '{}',
            payload_json TEXT NOT NULL DEFAULT '{}',
            updated_at INTEGER NOT NULL,
            PRIMARY KEY (index_name, id)
        );
        CREATE TABLE IF NOT EXISTS km_memory_record_tags (
            index_name TEXT NOT NULL,
            record_id TEXT NOT NULL,
            tag_name TEXT NOT NULL,
            tag_value TEXT NOT NULL,
            PRIMARY KEY (index_name, record_id, tag_name, tag_value)
        );
        CREATE INDEX IF NOT EXISTS idx_km_memory_record_tags_lookup
            ON km_memory_record_tags(index_name, tag_name, tag_value);
    )");
}

Result<void> SqliteMemoryDb::ensureIndex(const std::string& index, int vectorSize) {
    auto stmtResult = db_.prepare("INSERT INTO km_memory_indexes (name, vector_size, created_at) "
                                  "VALUES (?, ?, ?) ON CONFLICT(name) DO NOTHING");
    if (!stmtResult)
        return stmtResult.error();
    auto stmt = std::move(stmtResult).value();
    if (auto r = stmt.bindAll(index, vectorSize,
                              core::toEpochMillis(std::chrono::system_clock::now()));
        !r)
        return r;
    return stmt.execute();
}

Result<void> SqliteMemoryDb::createIndex(const std::string& index, int vectorSize) {
    if (index.empty()) {
        return Error{ErrorCode::InvalidArgument, "Index name is required"};
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return ensureIndex(index, vectorSize);
}

Result<void> SqliteMemoryDb::deleteIndex(const std::string& index) {
    std::lock_guard<std::mutex> lock(mutex_);
    return db_.transaction([&]() -> Result<void> {
        for (const char* sql : {"DELETE FROM km_memory_record_tags WHERE index_name = ?",
                                "DELETE FROM km_memory_records WHERE index_name = ?",
                                "DELETE FROM km_memory_indexes WHERE name = ?"}) {
            auto stmtResult = db_.prepare(sql);
            if (!stmtResult)
                return stmtResult.error();
            auto stmt = std::move(stmtResult).value();
            if (auto r = stmt.bind(1, index); !r)
                return r;
            if (auto r = stmt.execute(); !r)
                return r;
        }
        spdlog::info("[MemoryDb] Deleted index '{}'", index);
        return {};
    });
}

Result<std::vector<std::string>> SqliteMemoryDb::getIndexes() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmtResult = db_.prepare("SELECT name FROM km_memory_indexes ORDER BY name");
    if (!stmtResult)
        return stmtResult.error();
    auto stmt = std::move(stmtResult).value();
    std::vector<std::string> names;
    while (true) {
        auto row = stmt.step();
        if (!row)
            return row.error();
        if (!row.value())
            break;
        names.push_back(stmt.getString(0));
    }
    return names;
}

Result<std::string> SqliteMemoryDb::upsert(const std::string& index, const MemoryRecord& record) {
    if (index.empty() || record.id.empty()) {
        return Error{ErrorCode::InvalidArgument, "Index name and record id are required"};
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto result = db_.transaction(
        [&]() -> Result<void> {
            if (auto r = ensureIndex(index, static_cast<int>(record.vector.size())); !r)
                return r;

            auto upsertResult = db_.prepare(
                "INSERT INTO km_memory_records (index_name, id, vector, tags_json, payload_json, "
                "updated_at) VALUES (?, ?, ?, ?, ?, ?) "
                "ON CONFLICT(index_name, id) DO UPDATE SET vector = excluded.vector, "
                "tags_json = excluded.tags_json, payload_json = excluded.payload_json, "
                "updated_at = excluded.updated_at");
            if (!upsertResult)
                return upsertResult.error();
            auto stmt = std::move(upsertResult).value();
            const pipeline::json tagsJson = record.tags;
            auto bytes =
                std::as_bytes(std::span<const float>(record.vector.data(), record.vector.size()));
            if (auto r = stmt.bindAll(index, record.id, bytes, tagsJson.dump(),
                                      record.payload.dump(),
                                      core::toEpochMillis(std::chrono::system_clock::now()));
                !r)
                return r;
            if (auto r = stmt.execute(); !r)
                return r;

            auto clearResult = db_.prepare(
                "DELETE FROM km_memory_record_tags WHERE index_name = ? AND record_id = ?");
            if (!clearResult)
                return clearResult.error();
            auto clear = std::move(clearResult).value();
            if (auto r = clear.bindAll(index, record.id); !r)
                return r;
            if (auto r = clear.execute(); !r)
                return r;

            auto tagResult = db_.prepare(
                "INSERT OR IGNORE INTO km_memory_record_tags (index_name, record_id, tag_name, "
                "tag_value) VALUES (?, ?, ?, ?)");
            if (!tagResult)
                return tagResult.error();
            auto tagStmt = std::move(tagResult).value();
            for (const auto& [name, values] : record.tags) {
                for (const auto& value : values) {
                    if (auto r = tagStmt.reset(); !r)
                        return r;
                    if (auto r = tagStmt.bindAll(index, record.id, name, value); !r)
                        return r;
                    if (auto r = tagStmt.execute(); !r)
                        return r;
                }
            }
            return {};
        },
        metadata::TransactionMode::Immediate);
    if (!result)
        return result.error();
    return record.id;
}

Result<std::vector<MemoryRecord>> SqliteMemoryDb::getList(const std::string& index,
                                                          const MemoryFilter& filter,
                                                          size_t limit, bool withEmbeddings) {
    std::string sql = "SELECT r.id, r.vector, r.tags_json, r.payload_json "
                      "FROM km_memory_records r WHERE r.index_name = ?";
    for (const auto& [name, values] : filter) {
        if (values.empty())
            continue;
        sql += " AND EXISTS (SELECT 1 FROM km_memory_record_tags t WHERE t.index_name = "
               "r.index_name AND t.record_id = r.id AND t.tag_name = ? AND t.tag_value IN (";
        for (size_t i = 0; i < values.size(); ++i) {
            sql += i == 0 ? "?" : ", ?";
        }
        sql += "))";
    }
    sql += " ORDER BY r.id";
    if (limit > 0) {
        sql += " LIMIT " + std::to_string(limit);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto stmtResult = db_.prepare(sql);
    if (!stmtResult)
        return stmtResult.error();
    auto stmt = std::move(stmtResult).value();

    int param = 1;
    if (auto r = stmt.bind(param++, index); !r)
        return r.error();
    for (const auto& [name, values] : filter) {
        if (values.empty())
            continue;
        if (auto r = stmt.bind(param++, name); !r)
            return r.error();
        for (const auto& value : values) {
            if (auto r = stmt.bind(param++, value); !r)
                return r.error();
        }
    }

    std::vector<MemoryRecord> records;
    while (true) {
        auto row = stmt.step();
        if (!row)
            return row.error();
        if (!row.value())
            break;

        MemoryRecord record;
        record.id = stmt.getString(0);
        if (withEmbeddings && !stmt.isNull(1)) {
            auto blob = stmt.getBlob(1);
            record.vector.resize(blob.size() / sizeof(float));
            std::memcpy(record.vector.data(), blob.data(),
                        record.vector.size() * sizeof(float));
        }
        auto tagsJson = pipeline::json::parse(stmt.getString(2), nullptr, false);
        if (tagsJson.is_object()) {
            record.tags = tagsJson.get<pipeline::TagCollection>();
        }
        auto payloadJson = pipeline::json::parse(stmt.getString(3), nullptr, false);
        if (!payloadJson.is_discarded()) {
            record.payload = std::move(payloadJson);
        }
        records.push_back(std::move(record));
    }
    return records;
}

Result<void> SqliteMemoryDb::remove(const std::string& index, const std::string& recordId) {
    std::lock_guard<std::mutex> lock(mutex_);
    return db_.transaction([&]() -> Result<void> {
        for (const char* sql :
             {"DELETE FROM km_memory_record_tags WHERE index_name = ? AND record_id = ?",
              "DELETE FROM km_memory_records WHERE index_name = ? AND id = ?"}) {
            auto stmtResult = db_.prepare(sql);
            if (!stmtResult)
                return stmtResult.error();
            auto stmt = std::move(stmtResult).value();
            if (auto r = stmt.bindAll(index, recordId); !r)
                return r;
            if (auto r = stmt.execute(); !r)
                return r;
        }
        return {};
    });
}

Result<int64_t> SqliteMemoryDb::count(const std::string& index) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmtResult = db_.prepare("SELECT COUNT(*) FROM km_memory_records WHERE index_name = ?");
    if (!stmtResult)
        return stmtResult.error();
    auto stmt = std::move(stmtResult).value();
    if (auto r = stmt.bind(1, index); !r)
        return r.error();
    auto row = stmt.step();
    if (!row)
        return row.error();
    return row.value() ? stmt.getInt64(0) : int64_t{0};
}

} // namespace docmem::vector
