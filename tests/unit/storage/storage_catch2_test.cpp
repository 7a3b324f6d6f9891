// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025 docmem contributors

#include <catch2/catch_test_macros.hpp>

#include "../../common/test_helpers_catch2.h"

#include <docmem/pipeline/constants.h>
#include <docmem/storage/content_store.h>
#include <docmem/storage/file_storage.h>
#include <docmem/vector/memory_db.h>

#include <filesystem>
#include <memory>

using namespace docmem;
using namespace docmem::storage;

namespace {

struct StorageFixture {
    StorageFixture() {
        root = test::make_temp_dir("docmem_storage_");
        auto cs = SqliteContentStore::open((root / "docmem.db").string());
        REQUIRE(cs.has_value());
        contentStore = std::move(cs).value();
        auto mdb = vector::SqliteMemoryDb::open((root / "docmem.db").string());
        REQUIRE(mdb.has_value());
        memoryDb = std::move(mdb).value();
        files = std::make_unique<DiskFileStorage>(root / "files");
    }

    ~StorageFixture() {
        contentStore.reset();
        memoryDb.reset();
        std::error_code ec;
        std::filesystem::remove_all(root, ec);
    }

    static pipeline::DataPipeline makePipeline(const std::string& index, const std::string& doc) {
        pipeline::DataPipeline p;
        p.index = index;
        p.document_id = doc;
        p.execution_id = "20250101.000000.abcdef";
        p.then("extract").then("partition");
        p.resetProgress();
        return p;
    }

    static vector::MemoryRecord makeRecord(const std::string& id, const std::string& doc,
                                           const std::string& exec) {
        vector::MemoryRecord record;
        record.id = id;
        record.vector = {0.25f, 0.5f, 0.75f};
        record.tags[pipeline::tags::kDocumentId] = {doc};
        record.tags[pipeline::tags::kExecutionId] = {exec};
        record.tags["user"] = {"alice", "bob"};
        record.payload = {{"text", "partition text of " + id}};
        return record;
    }

    std::filesystem::path root;
    std::unique_ptr<SqliteContentStore> contentStore;
    std::unique_ptr<vector::SqliteMemoryDb> memoryDb;
    std::unique_ptr<DiskFileStorage> files;
};

} // namespace

TEST_CASE_METHOD(StorageFixture, "Database: connection modes", "[unit][storage][database]") {
    const auto path = (root / "modes.db").string();

    metadata::Database existing;
    auto refused = existing.open(path, metadata::ConnectionMode::ReadWrite);
    REQUIRE_FALSE(refused.has_value());
    CHECK(refused.error().code == ErrorCode::DatabaseError);
    CHECK_FALSE(existing.isOpen());
    CHECK_FALSE(std::filesystem::exists(path));

    metadata::Database created;
    REQUIRE(created.open(path, metadata::ConnectionMode::Create).has_value());
    CHECK(created.isOpen());
    created.close();

    REQUIRE(existing.open(path, metadata::ConnectionMode::ReadWrite).has_value());
    CHECK(existing.isOpen());
}

TEST_CASE_METHOD(StorageFixture, "ContentStore: upsert and read back",
                 "[unit][storage][content]") {
    ContentRecord record;
    record.id = "default/doc1";
    record.content = "hello world";
    record.mime_type = "text/plain";
    record.byte_size = 11;
    record.title = "doc1.txt";
    REQUIRE(contentStore->upsertContent(record).has_value());

    auto loaded = contentStore->getContent("default/doc1");
    REQUIRE(loaded.has_value());
    REQUIRE(loaded.value().has_value());
    CHECK(loaded.value()->content == "hello world");
    CHECK(loaded.value()->mime_type == "text/plain");
    CHECK(loaded.value()->byte_size == 11);
    CHECK(loaded.value()->title == "doc1.txt");
    CHECK_FALSE(loaded.value()->ready);

    auto missing = contentStore->getContent("default/none");
    REQUIRE(missing.has_value());
    CHECK_FALSE(missing.value().has_value());

    SECTION("an empty id is rejected") {
        ContentRecord bad;
        auto r = contentStore->upsertContent(bad);
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code == ErrorCode::InvalidArgument);
    }

    SECTION("deleting removes the record") {
        REQUIRE(contentStore->deleteContent("default/doc1").has_value());
        auto gone = contentStore->getContent("default/doc1");
        REQUIRE(gone.has_value());
        CHECK_FALSE(gone.value().has_value());
    }
}

TEST_CASE_METHOD(StorageFixture, "ContentStore: setReady reports changes only once",
                 "[unit][storage][content]") {
    ContentRecord record;
    record.id = "default/doc1";
    REQUIRE(contentStore->upsertContent(record).has_value());

    auto first = contentStore->setReady("default/doc1", true);
    REQUIRE(first.has_value());
    CHECK(first.value());

    auto second = contentStore->setReady("default/doc1", true);
    REQUIRE(second.has_value());
    CHECK_FALSE(second.value());

    auto back = contentStore->setReady("default/doc1", false);
    REQUIRE(back.has_value());
    CHECK(back.value());

    auto unknown = contentStore->setReady("default/missing", true);
    REQUIRE(unknown.has_value());
    CHECK_FALSE(unknown.value());
}

TEST_CASE_METHOD(StorageFixture, "ContentStore: pipeline state round trip",
                 "[unit][storage][content][pipeline]") {
    auto pipeline = makePipeline("default", "doc1");
    pipeline.tags["user"] = {"alice"};
    REQUIRE(pipeline.moveToNextStep().has_value());
    REQUIRE(contentStore->savePipeline(pipeline).has_value());

    auto loaded = contentStore->loadPipeline(pipeline.id());
    REQUIRE(loaded.has_value());
    REQUIRE(loaded.value().has_value());
    CHECK(loaded.value()->execution_id == pipeline.execution_id);
    CHECK(loaded.value()->completed_steps == std::vector<std::string>{"extract"});
    CHECK(loaded.value()->remaining_steps == std::vector<std::string>{"partition"});
    CHECK(loaded.value()->tags.at("user") == std::vector<std::string>{"alice"});

    SECTION("deletePipeline forgets the state") {
        REQUIRE(contentStore->deletePipeline(pipeline.id()).has_value());
        auto gone = contentStore->loadPipeline(pipeline.id());
        REQUIRE(gone.has_value());
        CHECK_FALSE(gone.value().has_value());
    }
}

TEST_CASE_METHOD(StorageFixture, "ContentStore: a stale save keeps a stored cancellation",
                 "[unit][storage][content][pipeline]") {
    auto pipeline = makePipeline("default", "doc1");
    REQUIRE(contentStore->savePipeline(pipeline).has_value());

    auto cancelled = pipeline;
    cancelled.cancelled = true;
    REQUIRE(contentStore->savePipeline(cancelled).has_value());

    // Written from a copy loaded before the cancel
    REQUIRE(pipeline.moveToNextStep().has_value());
    REQUIRE(contentStore->savePipeline(pipeline).has_value());

    auto loaded = contentStore->loadPipeline(pipeline.id()).value().value();
    CHECK(loaded.cancelled);
    CHECK(loaded.completed_steps == std::vector<std::string>{"extract"});

    SECTION("a new execution starts uncancelled") {
        auto next = makePipeline("default", "doc1");
        next.execution_id = "20250102.000000.fedcba";
        REQUIRE(contentStore->savePipeline(next).has_value());
        CHECK_FALSE(contentStore->loadPipeline(next.id()).value().value().cancelled);
    }
}

TEST_CASE_METHOD(StorageFixture, "ContentStore: deleteIndex only touches that index",
                 "[unit][storage][content]") {
    for (const auto* id : {"alpha/doc1", "alpha/doc2", "beta/doc1"}) {
        ContentRecord record;
        record.id = id;
        REQUIRE(contentStore->upsertContent(record).has_value());
    }
    REQUIRE(contentStore->savePipeline(makePipeline("alpha", "doc1")).has_value());
    REQUIRE(contentStore->savePipeline(makePipeline("beta", "doc1")).has_value());

    REQUIRE(contentStore->deleteIndex("alpha").has_value());

    CHECK_FALSE(contentStore->getContent("alpha/doc1").value().has_value());
    CHECK_FALSE(contentStore->getContent("alpha/doc2").value().has_value());
    CHECK(contentStore->getContent("beta/doc1").value().has_value());
    CHECK_FALSE(contentStore->loadPipeline("alpha/doc1").value().has_value());
    CHECK(contentStore->loadPipeline("beta/doc1").value().has_value());
}

TEST_CASE_METHOD(StorageFixture, "FileStorage: write, read, list and delete",
                 "[unit][storage][files]") {
    REQUIRE(files->createDocumentDirectory("default", "doc1").has_value());
    REQUIRE(files->writeFile("default", "doc1", "b.txt", "bravo").has_value());
    REQUIRE(files->writeFile("default", "doc1", "a.txt", "alpha").has_value());

    auto read = files->readFile("default", "doc1", "a.txt");
    REQUIRE(read.has_value());
    CHECK(read.value() == "alpha");

    auto listed = files->listFiles("default", "doc1");
    REQUIRE(listed.has_value());
    CHECK(listed.value() == std::vector<std::string>{"a.txt", "b.txt"});

    SECTION("overwriting replaces the content") {
        REQUIRE(files->writeFile("default", "doc1", "a.txt", "changed").has_value());
        CHECK(files->readFile("default", "doc1", "a.txt").value() == "changed");
        CHECK(files->listFiles("default", "doc1").value().size() == 2);
    }

    SECTION("deleting a missing file succeeds") {
        REQUIRE(files->deleteFile("default", "doc1", "a.txt").has_value());
        REQUIRE(files->deleteFile("default", "doc1", "a.txt").has_value());
        CHECK_FALSE(files->fileExists("default", "doc1", "a.txt").value());
        auto missing = files->readFile("default", "doc1", "a.txt");
        REQUIRE_FALSE(missing.has_value());
        CHECK(missing.error().code == ErrorCode::FileNotFound);
    }

    SECTION("emptying keeps the directory") {
        REQUIRE(files->emptyDocumentDirectory("default", "doc1").has_value());
        auto empty = files->listFiles("default", "doc1");
        REQUIRE(empty.has_value());
        CHECK(empty.value().empty());
        CHECK(std::filesystem::is_directory(files->root() / "default" / "doc1"));
    }

    SECTION("deleting the index removes every document") {
        REQUIRE(files->deleteIndexDirectory("default").has_value());
        CHECK_FALSE(std::filesystem::exists(files->root() / "default"));
    }
}

TEST_CASE_METHOD(StorageFixture, "FileStorage: paths cannot escape the root",
                 "[unit][storage][files]") {
    auto r = files->writeFile("default", "..", "x.txt", "nope");
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error().code == ErrorCode::InvalidArgument);

    auto nested = files->readFile("default", "doc1", "../../etc/passwd");
    REQUIRE_FALSE(nested.has_value());
    CHECK(nested.error().code == ErrorCode::InvalidArgument);
}

TEST_CASE_METHOD(StorageFixture, "MemoryDb: upsert and filter by tags",
                 "[unit][storage][memory]") {
    REQUIRE(memoryDb->upsert("idx", makeRecord("r1", "doc1", "e1")).has_value());
    REQUIRE(memoryDb->upsert("idx", makeRecord("r2", "doc1", "e2")).has_value());
    REQUIRE(memoryDb->upsert("idx", makeRecord("r3", "doc2", "e1")).has_value());

    auto indexes = memoryDb->getIndexes();
    REQUIRE(indexes.has_value());
    CHECK(indexes.value() == std::vector<std::string>{"idx"});

    SECTION("empty filter lists everything ordered by id") {
        auto all = memoryDb->getList("idx", {});
        REQUIRE(all.has_value());
        REQUIRE(all.value().size() == 3);
        CHECK(all.value()[0].id == "r1");
        CHECK(all.value()[2].id == "r3");
        CHECK(all.value()[0].vector.empty());
    }

    SECTION("all listed tags must match, any value per tag") {
        vector::MemoryFilter filter;
        filter[pipeline::tags::kDocumentId] = {"doc1"};
        filter[pipeline::tags::kExecutionId] = {"e1", "e3"};
        auto matched = memoryDb->getList("idx", filter, 0, true);
        REQUIRE(matched.has_value());
        REQUIRE(matched.value().size() == 1);
        CHECK(matched.value()[0].id == "r1");
        CHECK(matched.value()[0].vector == Embedding{0.25f, 0.5f, 0.75f});
        CHECK(matched.value()[0].payload["text"] == "partition text of r1");
        CHECK(matched.value()[0].tags.at("user") == std::vector<std::string>{"alice", "bob"});
    }

    SECTION("limit caps the result") {
        auto limited = memoryDb->getList("idx", {}, 2);
        REQUIRE(limited.has_value());
        CHECK(limited.value().size() == 2);
    }

    SECTION("upsert replaces tags") {
        auto changed = makeRecord("r1", "doc3", "e9");
        REQUIRE(memoryDb->upsert("idx", changed).has_value());
        vector::MemoryFilter filter;
        filter[pipeline::tags::kDocumentId] = {"doc1"};
        CHECK(memoryDb->getList("idx", filter).value().size() == 1);
        CHECK(memoryDb->count("idx").value() == 3);
    }

    SECTION("remove and deleteIndex") {
        REQUIRE(memoryDb->remove("idx", "r2").has_value());
        REQUIRE(memoryDb->remove("idx", "r2").has_value());
        CHECK(memoryDb->count("idx").value() == 2);

        REQUIRE(memoryDb->deleteIndex("idx").has_value());
        CHECK(memoryDb->count("idx").value() == 0);
        CHECK(memoryDb->getIndexes().value().empty());
    }
}
