// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025 docmem contributors

#include <spdlog/spdlog.h>
#include <docmem/core/uuid.h>
#include <docmem/pipeline/handlers.h>

#include <algorithm>

namespace docmem::pipeline {

namespace {

std::string memoryRecordId(const std::string& documentId, const std::string& partitionId) {
    return "d=" + documentId + "//p=" + partitionId;
}

void addTag(TagCollection& collection, const std::string& name, std::string value) {
    auto& values = collection[name];
    if (std::find(values.begin(), values.end(), value) == values.end()) {
        values.push_back(std::move(value));
    }
}

const GeneratedFileDetails* findById(const FileDetails& file, const std::string& id) {
    for (const auto& [name, generated] : file.generated_files) {
        if (generated.id == id)
            return &generated;
    }
    return nullptr;
}

} // namespace

SaveRecordsHandler::SaveRecordsHandler(std::shared_ptr<storage::IFileStorage> files,
                                       std::shared_ptr<vector::IMemoryDb> memoryDb)
    : files_(std::move(files)), memoryDb_(std::move(memoryDb)) {}

HandlerResult SaveRecordsHandler::invoke(DataPipeline& pipeline) {
    if (!memoryDb_) {
        return HandlerResult::permanent("No memory DB configured");
    }

    size_t saved = 0;
    for (auto& file : pipeline.files) {
        for (auto& [name, embeddingFile] : file.generated_files) {
            if (embeddingFile.artifact_type != ArtifactType::TextEmbeddingVector ||
                embeddingFile.alreadyProcessedBy(steps::kSaveRecords)) {
                continue;
            }

            const auto* partition = findById(file, embeddingFile.source_partition_id);
            if (!partition) {
                return HandlerResult::permanent("Partition " + embeddingFile.source_partition_id +
                                                " of " + name + " is missing");
            }

            auto body = readGeneratedFile(*files_, pipeline, embeddingFile);
            if (!body) {
                return HandlerResult::fromError(body.error());
            }
            auto text = readGeneratedFile(*files_, pipeline, *partition);
            if (!text) {
                return HandlerResult::fromError(text.error());
            }

            auto embeddingJson = json::parse(body.value(), nullptr, false);
            if (embeddingJson.is_discarded() || !embeddingJson.contains("vector")) {
                return HandlerResult::permanent("Embedding file " + name + " is not valid JSON");
            }

            vector::MemoryRecord record;
            record.id = memoryRecordId(pipeline.document_id, partition->id);
            record.vector = embeddingJson["vector"].get<Embedding>();

            record.tags = pipeline.tags;
            for (const auto& [tagName, values] : file.tags) {
                for (const auto& value : values) {
                    addTag(record.tags, tagName, value);
                }
            }
            record.tags[tags::kDocumentId] = {pipeline.document_id};
            record.tags[tags::kFileId] = {file.id};
            record.tags[tags::kFilePartition] = {partition->id};
            record.tags[tags::kPartitionNumber] = {std::to_string(partition->partition_number)};
            record.tags[tags::kSectionNumber] = {std::to_string(partition->section_number)};
            record.tags[tags::kFileType] = {file.mime_type};
            record.tags[tags::kExecutionId] = {pipeline.execution_id};

            record.payload = {
                {payload::kText, text.value()},
                {payload::kFileName, file.name},
                {payload::kLastUpdate, core::formatTimestamp(std::chrono::system_clock::now())},
                {payload::kVectorProvider, embeddingJson.value("generator_provider", "")},
                {payload::kVectorGenerator, embeddingJson.value("generator_name", "")}};

            auto upserted = memoryDb_->upsert(pipeline.index, record);
            if (!upserted) {
                return HandlerResult::fromError(upserted.error());
            }
            embeddingFile.markProcessedBy(steps::kSaveRecords);
            ++saved;
        }
        file.markProcessedBy(steps::kSaveRecords);
    }

    if (auto purged = purgePreviousExecutions(pipeline); !purged.succeeded()) {
        return purged;
    }

    spdlog::debug("[SaveRecords] Saved {} memory records for {}", saved, pipeline.id());
    return HandlerResult::success();
}

HandlerResult SaveRecordsHandler::purgePreviousExecutions(DataPipeline& pipeline) {
    if (pipeline.previous_executions_to_purge.empty()) {
        return HandlerResult::success();
    }

    vector::MemoryFilter filter;
    filter[tags::kDocumentId] = {pipeline.document_id};
    filter[tags::kExecutionId] = pipeline.previous_executions_to_purge;

    auto stale = memoryDb_->getList(pipeline.index, filter);
    if (!stale) {
        return HandlerResult::fromError(stale.error());
    }
    for (const auto& record : stale.value()) {
        if (auto r = memoryDb_->remove(pipeline.index, record.id); !r) {
            return HandlerResult::fromError(r.error());
        }
    }
    spdlog::info("[SaveRecords] Purged {} records of {} previous execution(s) of {}",
                 stale.value().size(), pipeline.previous_executions_to_purge.size(),
                 pipeline.id());
    pipeline.previous_executions_to_purge.clear();
    return HandlerResult::success();
}

} // namespace docmem::pipeline
