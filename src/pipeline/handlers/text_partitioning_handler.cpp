// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025 docmem contributors

#include <spdlog/spdlog.h>
#include <docmem/core/uuid.h>
#include <docmem/crypto/hasher.h>
#include <docmem/pipeline/handlers.h>

namespace docmem::pipeline {

TextPartitioningHandler::TextPartitioningHandler(
    std::shared_ptr<storage::IFileStorage> files, chunking::ChunkerOptions options,
    std::shared_ptr<const chunking::ITokenizer> tokenizer)
    : files_(std::move(files)), chunker_(std::move(options), std::move(tokenizer)) {}

HandlerResult TextPartitioningHandler::invoke(DataPipeline& pipeline) {
    for (auto& file : pipeline.files) {
        std::map<std::string, GeneratedFileDetails> newFiles;

        for (auto& [name, extracted] : file.generated_files) {
            if (extracted.artifact_type != ArtifactType::ExtractedText ||
                extracted.alreadyProcessedBy(steps::kPartition)) {
                continue;
            }

            auto text = readGeneratedFile(*files_, pipeline, extracted);
            if (!text) {
                return HandlerResult::fromError(text.error());
            }

            std::vector<chunking::TextSection> sections;
            const std::string& all = text.value();
            int page = 0;
            size_t start = 0;
            while (start <= all.size()) {
                size_t end = all.find('\f', start);
                if (end == std::string::npos)
                    end = all.size();
                sections.push_back(chunking::TextSection{page++, all.substr(start, end - start)});
                start = end + 1;
            }

            const auto format = extracted.mime_type == extraction::kMimeMarkdown
                                    ? chunking::TextFormat::Markdown
                                    : chunking::TextFormat::PlainText;
            auto partitions = chunker_.chunk(sections, format, extracted.pages_end_sentences);
            if (!partitions) {
                return HandlerResult::fromError(partitions.error());
            }

            for (const auto& partition : partitions.value()) {
                const auto partName = file.partitionFileName(partition.number);
                if (auto r = files_->writeFile(pipeline.index, pipeline.document_id, partName,
                                               partition.text);
                    !r) {
                    return HandlerResult::fromError(r.error());
                }

                GeneratedFileDetails part;
                part.id = core::generateUUID();
                part.name = partName;
                part.size = static_cast<int64_t>(partition.text.size());
                part.mime_type = extraction::kMimePlainText;
                part.tags = extracted.tags;
                part.parent_id = file.id;
                part.content_sha256 =
                    crypto::SHA256Hasher::hash(std::string_view(partition.text));
                part.artifact_type = ArtifactType::TextPartition;
                part.partition_number = partition.number;
                part.section_number = partition.section_number;
                part.is_partition = true;
                newFiles[partName] = std::move(part);
            }

            extracted.markProcessedBy(steps::kPartition);
            spdlog::debug("[Partition] {} -> {} partitions", name, partitions.value().size());
        }

        for (auto& [name, details] : newFiles) {
            file.generated_files[name] = std::move(details);
        }
        file.markProcessedBy(steps::kPartition);
    }
    return HandlerResult::success();
}

} // namespace docmem::pipeline
