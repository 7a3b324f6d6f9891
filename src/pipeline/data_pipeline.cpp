// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025 docmem contributors

#include <docmem/core/uuid.h>
#include <docmem/pipeline/constants.h>
#include <docmem/pipeline/data_pipeline.h>

#include <algorithm>
#include <cctype>

namespace docmem::pipeline {

const char* artifactTypeToString(ArtifactType type) {
    switch (type) {
        case ArtifactType::Undefined:
            return "undefined";
        case ArtifactType::TextPartition:
            return "text_partition";
        case ArtifactType::ExtractedText:
            return "extracted_text";
        case ArtifactType::TextEmbeddingVector:
            return "text_embedding_vector";
        case ArtifactType::SyntheticData:
            return "synthetic_data";
        case ArtifactType::ExtractedContent:
            return "extracted_content";
    }
    return "undefined";
}

ArtifactType artifactTypeFromString(std::string_view value) {
    for (auto t : {ArtifactType::TextPartition, ArtifactType::ExtractedText,
                   ArtifactType::TextEmbeddingVector, ArtifactType::SyntheticData,
                   ArtifactType::ExtractedContent}) {
        if (value == artifactTypeToString(t))
            return t;
    }
    return ArtifactType::Undefined;
}

bool FileDetailsBase::alreadyProcessedBy(std::string_view step) const {
    return std::find(processed_by.begin(), processed_by.end(), step) != processed_by.end();
}

void FileDetailsBase::markProcessedBy(std::string_view step) {
    if (!alreadyProcessedBy(step))
        processed_by.emplace_back(step);
}

std::string embeddingFileName(std::string_view partitionFileName) {
    return std::string(partitionFileName) + ".text_embedding.json";
}

std::string DataPipeline::id() const {
    return makePipelineId(index, document_id);
}

std::optional<std::string> DataPipeline::currentStep() const {
    if (remaining_steps.empty())
        return std::nullopt;
    return remaining_steps.front();
}

DataPipeline& DataPipeline::then(std::string step) {
    steps.push_back(step);
    remaining_steps.push_back(std::move(step));
    return *this;
}

void DataPipeline::resetProgress() {
    remaining_steps = steps;
    completed_steps.clear();
}

Result<void> DataPipeline::moveToNextStep() {
    if (remaining_steps.empty()) {
        return Error{ErrorCode::InvalidState, "Pipeline has no remaining steps"};
    }
    completed_steps.push_back(remaining_steps.front());
    remaining_steps.erase(remaining_steps.begin());
    return {};
}

Result<void> DataPipeline::rollbackToPreviousStep() {
    if (completed_steps.empty()) {
        return Error{ErrorCode::InvalidState, "Pipeline has no completed steps"};
    }
    remaining_steps.insert(remaining_steps.begin(), completed_steps.back());
    completed_steps.pop_back();
    return {};
}

Result<void> DataPipeline::validate() const {
    if (index.empty()) {
        return Error{ErrorCode::ValidationError, "The index name is empty"};
    }
    if (document_id.empty()) {
        return Error{ErrorCode::ValidationError, "The document ID is empty"};
    }
    if (steps.empty()) {
        return Error{ErrorCode::ValidationError, "The pipeline has no steps"};
    }
    for (size_t i = 0; i < steps.size(); ++i) {
        if (steps[i].empty()) {
            return Error{ErrorCode::ValidationError, "The pipeline contains an empty step name"};
        }
        if (i > 0 && steps[i] == steps[i - 1]) {
            return Error{ErrorCode::ValidationError,
                         "The pipeline contains two consecutive '" + steps[i] + "' steps"};
        }
    }
    if (!stepsConsistent()) {
        return Error{ErrorCode::ValidationError,
                     "Completed and remaining steps do not match the planned steps"};
    }
    return {};
}

bool DataPipeline::stepsConsistent() const {
    if (completed_steps.size() + remaining_steps.size() != steps.size())
        return false;
    auto mid = std::equal(completed_steps.begin(), completed_steps.end(), steps.begin());
    return mid && std::equal(remaining_steps.begin(), remaining_steps.end(),
                             steps.begin() + static_cast<std::ptrdiff_t>(completed_steps.size()));
}

FileDetails* DataPipeline::findFile(std::string_view fileId) {
    for (auto& f : files) {
        if (f.id == fileId)
            return &f;
    }
    return nullptr;
}

const FileDetails* DataPipeline::findFile(std::string_view fileId) const {
    for (const auto& f : files) {
        if (f.id == fileId)
            return &f;
    }
    return nullptr;
}

PipelineStatus PipelineStatus::from(const DataPipeline& pipeline) {
    PipelineStatus s;
    s.index = pipeline.index;
    s.document_id = pipeline.document_id;
    s.execution_id = pipeline.execution_id;
    s.completed = pipeline.complete();
    s.failed = pipeline.failed;
    s.cancelled = pipeline.cancelled;
    s.empty = pipeline.files.empty();
    s.last_failure_reason = pipeline.last_failure_reason;
    s.steps = pipeline.steps;
    s.remaining_steps = pipeline.remaining_steps;
    s.completed_steps = pipeline.completed_steps;
    s.tags = pipeline.tags;
    s.creation = pipeline.creation;
    s.last_update = pipeline.last_update;
    return s;
}

std::string makePipelineId(std::string_view index, std::string_view documentId) {
    return std::string(index) + "/" + std::string(documentId);
}

std::string normalizeIndexName(std::string_view index) {
    std::string out;
    out.reserve(index.size());
    for (char c : index) {
        auto uc = static_cast<unsigned char>(c);
        if (std::isspace(uc))
            continue;
        out.push_back(static_cast<char>(std::tolower(uc)));
    }
    return out.empty() ? std::string(kDefaultIndex) : out;
}

Result<void> validateDocumentId(std::string_view documentId) {
    if (documentId.empty()) {
        return Error{ErrorCode::ValidationError, "The document ID is empty"};
    }
    for (char c : documentId) {
        auto uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc) && c != '.' && c != '_' && c != '-') {
            return Error{ErrorCode::ValidationError,
                         "The document ID contains invalid chars (allowed: A-Z, a-z, 0-9, '.', "
                         "'_', '-')"};
        }
    }
    return {};
}

Result<void> validateTags(const TagCollection& collection) {
    for (const auto& [key, values] : collection) {
        if (key.empty()) {
            return Error{ErrorCode::ValidationError, "Tag names cannot be empty"};
        }
        if (key.rfind(tags::kReservedPrefix, 0) == 0) {
            return Error{ErrorCode::ValidationError,
                         "Tag '" + key + "' uses the reserved '__' prefix"};
        }
        if (key.find('=') != std::string::npos) {
            return Error{ErrorCode::ValidationError, "Tag names cannot contain '='"};
        }
    }
    return {};
}

namespace {

void baseToJson(json& j, const FileDetailsBase& f) {
    j["id"] = f.id;
    j["name"] = f.name;
    j["size"] = f.size;
    j["mime_type"] = f.mime_type;
    j["tags"] = f.tags;
    j["processed_by"] = f.processed_by;
}

void baseFromJson(const json& j, FileDetailsBase& f) {
    f.id = j.value("id", std::string{});
    f.name = j.value("name", std::string{});
    f.size = j.value("size", int64_t{0});
    f.mime_type = j.value("mime_type", std::string{});
    f.tags = j.value("tags", TagCollection{});
    f.processed_by = j.value("processed_by", std::vector<std::string>{});
}

} // namespace

void to_json(json& j, const GeneratedFileDetails& f) {
    j = json::object();
    baseToJson(j, f);
    j["parent_id"] = f.parent_id;
    j["source_partition_id"] = f.source_partition_id;
    j["content_sha256"] = f.content_sha256;
    j["artifact_type"] = artifactTypeToString(f.artifact_type);
    j["partition_number"] = f.partition_number;
    j["section_number"] = f.section_number;
    j["is_partition"] = f.is_partition;
    j["pages_end_sentences"] = f.pages_end_sentences;
}

void from_json(const json& j, GeneratedFileDetails& f) {
    baseFromJson(j, f);
    f.parent_id = j.value("parent_id", std::string{});
    f.source_partition_id = j.value("source_partition_id", std::string{});
    f.content_sha256 = j.value("content_sha256", std::string{});
    f.artifact_type = artifactTypeFromString(j.value("artifact_type", std::string{}));
    f.partition_number = j.value("partition_number", 0);
    f.section_number = j.value("section_number", 0);
    f.is_partition = j.value("is_partition", false);
    f.pages_end_sentences = j.value("pages_end_sentences", false);
}

void to_json(json& j, const FileDetails& f) {
    j = json::object();
    baseToJson(j, f);
    j["generated_files"] = f.generated_files;
}

void from_json(const json& j, FileDetails& f) {
    baseFromJson(j, f);
    f.generated_files.clear();
    if (j.contains("generated_files")) {
        for (const auto& [name, value] : j.at("generated_files").items()) {
            f.generated_files[name] = value.get<GeneratedFileDetails>();
        }
    }
}

void to_json(json& j, const DataPipeline& p) {
    j = json{{"index", p.index},
             {"document_id", p.document_id},
             {"execution_id", p.execution_id},
             {"steps", p.steps},
             {"remaining_steps", p.remaining_steps},
             {"completed_steps", p.completed_steps},
             {"tags", p.tags},
             {"creation", core::formatTimestamp(p.creation)},
             {"last_update", core::formatTimestamp(p.last_update)},
             {"files", p.files},
             {"previous_executions_to_purge", p.previous_executions_to_purge},
             {"cancelled", p.cancelled},
             {"failed", p.failed},
             {"last_failure_reason", p.last_failure_reason}};
}

void from_json(const json& j, DataPipeline& p) {
    p.index = j.value("index", std::string{});
    p.document_id = j.value("document_id", std::string{});
    p.execution_id = j.value("execution_id", std::string{});
    p.steps = j.value("steps", std::vector<std::string>{});
    p.remaining_steps = j.value("remaining_steps", std::vector<std::string>{});
    p.completed_steps = j.value("completed_steps", std::vector<std::string>{});
    p.tags = j.value("tags", TagCollection{});
    p.creation = core::parseTimestamp(j.value("creation", std::string{}));
    p.last_update = core::parseTimestamp(j.value("last_update", std::string{}));
    p.files = j.value("files", std::vector<FileDetails>{});
    p.previous_executions_to_purge =
        j.value("previous_executions_to_purge", std::vector<std::string>{});
    p.cancelled = j.value("cancelled", false);
    p.failed = j.value("failed", false);
    p.last_failure_reason = j.value("last_failure_reason", std::string{});
}

void to_json(json& j, const PipelineStatus& s) {
    j = json{{"index", s.index},
             {"document_id", s.document_id},
             {"execution_id", s.execution_id},
             {"completed", s.completed},
             {"failed", s.failed},
             {"cancelled", s.cancelled},
             {"empty", s.empty},
             {"last_failure_reason", s.last_failure_reason},
             {"steps", s.steps},
             {"remaining_steps", s.remaining_steps},
             {"completed_steps", s.completed_steps},
             {"tags", s.tags},
             {"creation", core::formatTimestamp(s.creation)},
             {"last_update", core::formatTimestamp(s.last_update)}};
}

} // namespace docmem::pipeline
