// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025 docmem contributors

#include <docmem/crypto/hasher.h>
#include <docmem/pipeline/handlers.h>

namespace docmem::pipeline {

Result<std::string> readGeneratedFile(storage::IFileStorage& files, const DataPipeline& pipeline,
                                      const GeneratedFileDetails& file) {
    auto content = files.readFile(pipeline.index, pipeline.document_id, file.name);
    if (!content) {
        return content.error();
    }
    if (!file.content_sha256.empty() &&
        crypto::SHA256Hasher::hash(std::string_view(content.value())) != file.content_sha256) {
        return Error{ErrorCode::InvalidData, "Checksum mismatch for " + file.name};
    }
    return content;
}

Result<void> registerDefaultHandlers(HandlerRegistry& registry, const HandlerDependencies& deps) {
    if (!deps.files || !deps.content_store || !deps.memory_db || !deps.generator) {
        return Error{ErrorCode::InvalidArgument, "Handler dependencies are incomplete"};
    }

    std::vector<std::shared_ptr<IPipelineStepHandler>> handlers = {
        std::make_shared<TextExtractionHandler>(deps.files, deps.decoders),
        std::make_shared<TextPartitioningHandler>(deps.files, deps.chunking),
        std::make_shared<GenerateEmbeddingsHandler>(deps.files, deps.generator, deps.embedding),
        std::make_shared<SaveRecordsHandler>(deps.files, deps.memory_db),
        std::make_shared<DeleteGeneratedFilesHandler>(deps.files),
        std::make_shared<DeleteDocumentHandler>(deps.files, deps.memory_db, deps.content_store),
        std::make_shared<DeleteIndexHandler>(deps.files, deps.memory_db, deps.content_store),
    };
    for (auto& handler : handlers) {
        if (auto r = registry.add(std::move(handler)); !r) {
            return r;
        }
    }
    return {};
}

} // namespace docmem::pipeline
