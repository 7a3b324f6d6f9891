// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025 docmem contributors

#include <spdlog/spdlog.h>
#include <docmem/pipeline/handlers.h>

namespace docmem::pipeline {

DeleteGeneratedFilesHandler::DeleteGeneratedFilesHandler(
    std::shared_ptr<storage::IFileStorage> files)
    : files_(std::move(files)) {}

HandlerResult DeleteGeneratedFilesHandler::invoke(DataPipeline& pipeline) {
    size_t removed = 0;
    for (auto& file : pipeline.files) {
        for (const auto& [name, generated] : file.generated_files) {
            if (auto r = files_->deleteFile(pipeline.index, pipeline.document_id, name); !r) {
                return HandlerResult::fromError(r.error());
            }
            ++removed;
        }
        file.generated_files.clear();
        file.markProcessedBy(steps::kDeleteGeneratedFiles);
    }
    spdlog::debug("[DeleteGeneratedFiles] Removed {} generated files of {}", removed,
                  pipeline.id());
    return HandlerResult::success();
}

DeleteDocumentHandler::DeleteDocumentHandler(std::shared_ptr<storage::IFileStorage> files,
                                             std::shared_ptr<vector::IMemoryDb> memoryDb,
                                             std::shared_ptr<storage::IContentStore> contentStore)
    : files_(std::move(files)),
      memoryDb_(std::move(memoryDb)),
      contentStore_(std::move(contentStore)) {}

HandlerResult DeleteDocumentHandler::invoke(DataPipeline& pipeline) {
    vector::MemoryFilter filter;
    filter[tags::kDocumentId] = {pipeline.document_id};
    auto records = memoryDb_->getList(pipeline.index, filter);
    if (!records) {
        return HandlerResult::fromError(records.error());
    }
    for (const auto& record : records.value()) {
        if (auto r = memoryDb_->remove(pipeline.index, record.id); !r) {
            return HandlerResult::fromError(r.error());
        }
    }

    if (auto r = files_->deleteDocumentDirectory(pipeline.index, pipeline.document_id); !r) {
        return HandlerResult::fromError(r.error());
    }
    if (auto r = contentStore_->deleteContent(pipeline.id()); !r) {
        return HandlerResult::fromError(r.error());
    }

    spdlog::info("[DeleteDocument] Deleted {} ({} memory records)", pipeline.id(),
                 records.value().size());
    return HandlerResult::success();
}

DeleteIndexHandler::DeleteIndexHandler(std::shared_ptr<storage::IFileStorage> files,
                                       std::shared_ptr<vector::IMemoryDb> memoryDb,
                                       std::shared_ptr<storage::IContentStore> contentStore)
    : files_(std::move(files)),
      memoryDb_(std::move(memoryDb)),
      contentStore_(std::move(contentStore)) {}

HandlerResult DeleteIndexHandler::invoke(DataPipeline& pipeline) {
    if (auto r = memoryDb_->deleteIndex(pipeline.index); !r) {
        return HandlerResult::fromError(r.error());
    }
    if (auto r = files_->deleteIndexDirectory(pipeline.index); !r) {
        return HandlerResult::fromError(r.error());
    }
    if (auto r = contentStore_->deleteIndex(pipeline.index); !r) {
        return HandlerResult::fromError(r.error());
    }
    spdlog::info("[DeleteIndex] Deleted index '{}'", pipeline.index);
    return HandlerResult::success();
}

} // namespace docmem::pipeline
