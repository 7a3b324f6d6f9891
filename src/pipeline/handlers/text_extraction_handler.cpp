// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025 docmem contributors

#include <spdlog/spdlog.h>
#include <docmem/core/uuid.h>
#include <docmem/crypto/hasher.h>
#include <docmem/pipeline/handlers.h>

namespace docmem::pipeline {

TextExtractionHandler::TextExtractionHandler(std::shared_ptr<storage::IFileStorage> files,
                                             extraction::DecoderRegistry decoders)
    : files_(std::move(files)), decoders_(std::move(decoders)) {}

HandlerResult TextExtractionHandler::invoke(DataPipeline& pipeline) {
    for (auto& file : pipeline.files) {
        if (file.alreadyProcessedBy(steps::kExtract)) {
            spdlog::debug("[Extract] {} already extracted, skipping", file.name);
            continue;
        }

        auto decoder = decoders_.find(file.mime_type);
        if (!decoder) {
            return HandlerResult::permanent("Unsupported content type '" + file.mime_type +
                                            "' for " + file.name);
        }

        auto raw = files_->readFile(pipeline.index, pipeline.document_id, file.name);
        if (!raw) {
            return HandlerResult::fromError(raw.error());
        }

        auto decoded = decoder->decode(raw.value(), file.mime_type);
        if (!decoded) {
            return HandlerResult::fromError(decoded.error());
        }
        const auto& content = decoded.value();

        std::string text;
        for (size_t i = 0; i < content.sections.size(); ++i) {
            if (i > 0)
                text += '\f';
            text += content.sections[i].text;
        }

        const auto name = file.extractedTextFileName();
        if (auto r = files_->writeFile(pipeline.index, pipeline.document_id, name, text); !r) {
            return HandlerResult::fromError(r.error());
        }

        GeneratedFileDetails extracted;
        extracted.id = core::generateUUID();
        extracted.name = name;
        extracted.size = static_cast<int64_t>(text.size());
        // JSON is indexed as plain text
        extracted.mime_type = content.mime_type == extraction::kMimeMarkdown
                                  ? extraction::kMimeMarkdown
                                  : extraction::kMimePlainText;
        extracted.tags = file.tags;
        extracted.parent_id = file.id;
        extracted.content_sha256 = crypto::SHA256Hasher::hash(std::string_view(text));
        extracted.artifact_type = ArtifactType::ExtractedText;
        extracted.pages_end_sentences = content.pages_end_sentences;
        file.generated_files[name] = std::move(extracted);
        file.markProcessedBy(steps::kExtract);

        spdlog::debug("[Extract] {} -> {} ({} sections, {} bytes)", file.name, name,
                      content.sections.size(), text.size());
    }
    return HandlerResult::success();
}

} // namespace docmem::pipeline
