// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025 docmem contributors

#pragma once

#include <docmem/core/types.h>

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace docmem::pipeline {

using json = nlohmann::json;

// Multi-valued tags, e.g. {"user": ["alice", "bob"]}
using TagCollection = std::map<std::string, std::vector<std::string>>;

enum class ArtifactType {
    Undefined = 0,
    TextPartition = 1,
    ExtractedText = 2,
    TextEmbeddingVector = 3,
    SyntheticData = 4,
    ExtractedContent = 5
};

const char* artifactTypeToString(ArtifactType type);
ArtifactType artifactTypeFromString(std::string_view value);

/**
 * @brief Fields shared by uploaded and generated files
 */
struct FileDetailsBase {
    std::string id;
    std::string name;
    int64_t size = 0;
    std::string mime_type;
    TagCollection tags;
    // Steps that already handled this file; drives handler idempotency
    std::vector<std::string> processed_by;

    bool alreadyProcessedBy(std::string_view step) const;
    void markProcessedBy(std::string_view step);
};

struct GeneratedFileDetails : FileDetailsBase {
    std::string parent_id;
    std::string source_partition_id;
    std::string content_sha256;
    ArtifactType artifact_type = ArtifactType::Undefined;
    int partition_number = 0;
    int section_number = 0;
    bool is_partition = false;
    bool pages_end_sentences = false;
};

struct FileDetails : FileDetailsBase {
    // Keyed by generated file name
    std::map<std::string, GeneratedFileDetails> generated_files;

    std::string extractedTextFileName() const { return name + ".extract.txt"; }
    std::string partitionFileName(int partitionNumber) const {
        return name + ".partition." + std::to_string(partitionNumber) + ".txt";
    }
};

std::string embeddingFileName(std::string_view partitionFileName);

/**
 * @brief Processing state of one document ingestion.
 *
 * Invariant: steps == completed_steps ++ remaining_steps.
 */
struct DataPipeline {
    std::string index;
    std::string document_id;
    std::string execution_id;

    std::vector<std::string> steps;
    std::vector<std::string> remaining_steps;
    std::vector<std::string> completed_steps;

    TagCollection tags;
    TimePoint creation{};
    TimePoint last_update{};

    std::vector<FileDetails> files;
    std::vector<std::string> previous_executions_to_purge;

    bool cancelled = false;
    bool failed = false;
    std::string last_failure_reason;

    /**
     * @brief Stable id of the pipeline: "{index}/{document_id}"
     */
    std::string id() const;

    [[nodiscard]] bool complete() const { return remaining_steps.empty(); }

    std::optional<std::string> currentStep() const;

    // Appends a planned step
    DataPipeline& then(std::string step);

    /**
     * @brief Resets progress so that every planned step remains
     */
    void resetProgress();

    /**
     * @brief Pops the head of remaining_steps onto completed_steps
     */
    Result<void> moveToNextStep();

    /**
     * @brief Moves the last completed step back to the head of remaining_steps
     */
    Result<void> rollbackToPreviousStep();

    /**
     * @brief Structural checks performed before scheduling
     */
    Result<void> validate() const;

    /**
     * @brief True when steps == completed_steps ++ remaining_steps
     */
    bool stepsConsistent() const;

    FileDetails* findFile(std::string_view fileId);
    const FileDetails* findFile(std::string_view fileId) const;
};

/**
 * @brief Client-facing snapshot of a pipeline
 */
struct PipelineStatus {
    std::string index;
    std::string document_id;
    std::string execution_id;
    bool completed = false;
    bool failed = false;
    bool cancelled = false;
    bool empty = true;
    std::string last_failure_reason;
    std::vector<std::string> steps;
    std::vector<std::string> remaining_steps;
    std::vector<std::string> completed_steps;
    TagCollection tags;
    TimePoint creation{};
    TimePoint last_update{};

    static PipelineStatus from(const DataPipeline& pipeline);
};

// Identifier helpers
std::string makePipelineId(std::string_view index, std::string_view documentId);
std::string normalizeIndexName(std::string_view index);
Result<void> validateDocumentId(std::string_view documentId);
Result<void> validateTags(const TagCollection& tags);

// JSON serialization (found by nlohmann via ADL)
void to_json(json& j, const GeneratedFileDetails& f);
void from_json(const json& j, GeneratedFileDetails& f);
void to_json(json& j, const FileDetails& f);
void from_json(const json& j, FileDetails& f);
void to_json(json& j, const DataPipeline& p);
void from_json(const json& j, DataPipeline& p);
void to_json(json& j, const PipelineStatus& s);

} // namespace docmem::pipeline
