// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025 docmem contributors

#include <spdlog/spdlog.h>
#include <docmem/core/uuid.h>
#include <docmem/storage/content_store.h>

namespace docmem::storage {

SqliteContentStore::SqliteContentStore(metadata::Database db) : db_(std::move(db)) {}

Result<std::unique_ptr<SqliteContentStore>> SqliteContentStore::open(const std::string& path) {
    metadata::Database db;
    if (auto r = db.open(path, metadata::ConnectionMode::Create); !r) {
        return r.error();
    }
    if (auto r = db.enableWAL(); !r) {
        spdlog::warn("[ContentStore] Could not enable WAL on {}: {}", path, r.error().message);
    }

    std::unique_ptr<SqliteContentStore> store(new SqliteContentStore(std::move(db)));
    if (auto r = store->initSchema(); !r) {
        return r.error();
    }
    return store;
}

Result<void> SqliteContentStore::initSchema() {
    return db_.execute(R"(
        CREATE TABLE IF NOT EXISTS km_content (
            id TEXT PRIMARY KEY,
            content TEXT NOT NULL DEFAULT '',
            mime_type TEXT NOT NULL DEFAULT '',
            byte_size INTEGER NOT NULL DEFAULT 0,
            ready INTEGER NOT NULL DEFAULT 0,
            content_created_at INTEGER NOT NULL,
            record_created_at INTEGER NOT NULL,
            record_updated_at INTEGER NOT NULL,
            title TEXT NOT NULL DEFAULT '',
            description TEXT NOT NULL DEFAULT '',
            tags_json TEXT NOT NULL DEFAULT '[]',
            metadata_json TEXT NOT NULL DEFAULT '{}'
        );
        CREATE INDEX IF NOT EXISTS idx_km_content_ready ON km_content(ready);
        CREATE TABLE IF NOT EXISTS km_pipelines (
            id TEXT PRIMARY KEY,
            index_name TEXT NOT NULL,
            document_id TEXT NOT NULL,
            execution_id TEXT NOT NULL,
            state_json TEXT NOT NULL,
            updated_at INTEGER NOT NULL
        );
        CREATE INDEX IF NOT EXISTS idx_km_pipelines_index ON km_pipelines(index_name);
    )");
}

Result<void> SqliteContentStore::upsertContent(const ContentRecord& record) {
    if (record.id.empty()) {
        return Error{ErrorCode::InvalidArgument, "Content id is required"};
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto stmtResult = db_.prepare(
        "INSERT INTO km_content (id, content, mime_type, byte_size, ready, content_created_at, "
        "record_created_at, record_updated_at, title, description, tags_json, metadata_json) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?) "
        "ON CONFLICT(id) DO UPDATE SET content = excluded.content, "
        "mime_type = excluded.mime_type, byte_size = excluded.byte_size, "
        "ready = excluded.ready, content_created_at = excluded.content_created_at, "
        "record_updated_at = excluded.record_updated_at, title = excluded.title, "
        "description = excluded.description, tags_json = excluded.tags_json, "
        "metadata_json = excluded.metadata_json");
    if (!stmtResult)
        return stmtResult.error();
    auto stmt = std::move(stmtResult).value();

    const auto now = std::chrono::system_clock::now();
    auto orNow = [&](TimePoint tp) { return core::toEpochMillis(tp == TimePoint{} ? now : tp); };
    if (auto r = stmt.bindAll(record.id, record.content, record.mime_type, record.byte_size,
                              record.ready ? 1 : 0, orNow(record.content_created_at),
                              orNow(record.record_created_at), core::toEpochMillis(now),
                              record.title, record.description, record.tags_json,
                              record.metadata_json);
        !r)
        return r;
    return stmt.execute();
}

Result<std::optional<ContentRecord>> SqliteContentStore::getContent(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmtResult = db_.prepare(
        "SELECT id, content, mime_type, byte_size, ready, content_created_at, record_created_at, "
        "record_updated_at, title, description, tags_json, metadata_json FROM km_content "
        "WHERE id = ?");
    if (!stmtResult)
        return stmtResult.error();
    auto stmt = std::move(stmtResult).value();
    if (auto r = stmt.bind(1, id); !r)
        return r.error();

    auto row = stmt.step();
    if (!row)
        return row.error();
    if (!row.value())
        return std::optional<ContentRecord>{};

    ContentRecord rec;
    rec.id = stmt.getString(0);
    rec.content = stmt.getString(1);
    rec.mime_type = stmt.getString(2);
    rec.byte_size = stmt.getInt64(3);
    rec.ready = stmt.getInt(4) != 0;
    rec.content_created_at = core::fromEpochMillis(stmt.getInt64(5));
    rec.record_created_at = core::fromEpochMillis(stmt.getInt64(6));
    rec.record_updated_at = core::fromEpochMillis(stmt.getInt64(7));
    rec.title = stmt.getString(8);
    rec.description = stmt.getString(9);
    rec.tags_json = stmt.getString(10);
    rec.metadata_json = stmt.getString(11);
    return std::optional<ContentRecord>{std::move(rec)};
}

Result<bool> SqliteContentStore::setReady(const std::string& id, bool ready) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmtResult = db_.prepare("UPDATE km_content SET ready = ?, record_updated_at = ? "
                                  "WHERE id = ? AND ready <> ?");
    if (!stmtResult)
        return stmtResult.error();
    auto stmt = std::move(stmtResult).value();
    const int flag = ready ? 1 : 0;
    if (auto r = stmt.bindAll(flag, core::toEpochMillis(std::chrono::system_clock::now()), id,
                              flag);
        !r)
        return r.error();
    if (auto r = stmt.execute(); !r)
        return r.error();
    return db_.changes() == 1;
}

Result<void> SqliteContentStore::deleteContent(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmtResult = db_.prepare("DELETE FROM km_content WHERE id = ?");
    if (!stmtResult)
        return stmtResult.error();
    auto stmt = std::move(stmtResult).value();
    if (auto r = stmt.bind(1, id); !r)
        return r;
    return stmt.execute();
}

Result<void> SqliteContentStore::savePipeline(const pipeline::DataPipeline& pipeline) {
    std::lock_guard<std::mutex> lock(mutex_);
    return db_.transaction(
        [&]() -> Result<void> {
            pipeline::json state = pipeline;

            // A cancel persisted for the same execution is never undone by a save
            auto currentResult =
                db_.prepare("SELECT execution_id, state_json FROM km_pipelines WHERE id = ?");
            if (!currentResult)
                return currentResult.error();
            auto current = std::move(currentResult).value();
            if (auto r = current.bind(1, pipeline.id()); !r)
                return r;
            auto row = current.step();
            if (!row)
                return row.error();
            if (row.value() && !pipeline.cancelled &&
                current.getString(0) == pipeline.execution_id) {
                auto stored = pipeline::json::parse(current.getString(1), nullptr, false);
                if (stored.is_object() && stored.value("cancelled", false)) {
                    spdlog::debug("[ContentStore] Keeping cancellation of {}", pipeline.id());
                    state["cancelled"] = true;
                }
            }

            auto stmtResult = db_.prepare(
                "INSERT INTO km_pipelines (id, index_name, document_id, execution_id, state_json, "
                "updated_at) VALUES (?, ?, ?, ?, ?, ?) "
                "ON CONFLICT(id) DO UPDATE SET execution_id = excluded.execution_id, "
                "state_json = excluded.state_json, updated_at = excluded.updated_at");
            if (!stmtResult)
                return stmtResult.error();
            auto stmt = std::move(stmtResult).value();
            if (auto r = stmt.bindAll(pipeline.id(), pipeline.index, pipeline.document_id,
                                      pipeline.execution_id, state.dump(),
                                      core::toEpochMillis(std::chrono::system_clock::now()));
                !r)
                return r;
            return stmt.execute();
        },
        metadata::TransactionMode::Immediate);
}

Result<std::optional<pipeline::DataPipeline>>
SqliteContentStore::loadPipeline(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmtResult = db_.prepare("SELECT state_json FROM km_pipelines WHERE id = ?");
    if (!stmtResult)
        return stmtResult.error();
    auto stmt = std::move(stmtResult).value();
    if (auto r = stmt.bind(1, id); !r)
        return r.error();

    auto row = stmt.step();
    if (!row)
        return row.error();
    if (!row.value())
        return std::optional<pipeline::DataPipeline>{};

    auto parsed = pipeline::json::parse(stmt.getString(0), nullptr, false);
    if (parsed.is_discarded()) {
        return Error{ErrorCode::InvalidData, "Corrupt pipeline state for " + id};
    }
    try {
        return std::optional<pipeline::DataPipeline>{parsed.get<pipeline::DataPipeline>()};
    } catch (const pipeline::json::exception& e) {
        return Error{ErrorCode::InvalidData,
                     "Unreadable pipeline state for " + id + ": " + e.what()};
    }
}

Result<void> SqliteContentStore::deletePipeline(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmtResult = db_.prepare("DELETE FROM km_pipelines WHERE id = ?");
    if (!stmtResult)
        return stmtResult.error();
    auto stmt = std::move(stmtResult).value();
    if (auto r = stmt.bind(1, id); !r)
        return r;
    return stmt.execute();
}

Result<void> SqliteContentStore::deleteIndex(const std::string& index) {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string prefix = index + "/";
    return db_.transaction([&]() -> Result<void> {
        auto contentResult = db_.prepare("DELETE FROM km_content WHERE substr(id, 1, ?) = ?");
        if (!contentResult)
            return contentResult.error();
        auto content = std::move(contentResult).value();
        if (auto r = content.bindAll(static_cast<int>(prefix.size()), prefix); !r)
            return r;
        if (auto r = content.execute(); !r)
            return r;

        auto pipelinesResult = db_.prepare("DELETE FROM km_pipelines WHERE index_name = ?");
        if (!pipelinesResult)
            return pipelinesResult.error();
        auto pipelines = std::move(pipelinesResult).value();
        if (auto r = pipelines.bind(1, index); !r)
            return r;
        return pipelines.execute();
    });
}

} // namespace docmem::storage
