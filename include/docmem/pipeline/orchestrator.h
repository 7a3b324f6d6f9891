// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025 docmem contributors

#pragma once

#include <docmem/config/docmem_config.h>
#include <docmem/core/types.h>
#include <docmem/pipeline/data_pipeline.h>
#include <docmem/pipeline/handler.h>
#include <docmem/queue/operation_queue.h>
#include <docmem/retry/backoff.h>
#include <docmem/storage/content_store.h>
#include <docmem/storage/file_storage.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace docmem::pipeline {

struct UploadedFile {
    std::string name;
    std::string content;
    // Derived from the file name when empty
    std::string mime_type;
};

struct ImportRequest {
    std::string index;
    // Generated when empty
    std::string document_id;
    TagCollection tags;
    std::vector<UploadedFile> files;
    // Defaults to steps::defaultIngestion()
    std::vector<std::string> steps;
};

/**
 * @brief What processOperation() did with a claimed operation
 */
enum class ProcessOutcome {
    Advanced,  ///< Step done, next operation enqueued
    Completed, ///< Last step done, content marked ready
    Retrying,  ///< Transient failure, released with a delay
    Poisoned,  ///< Moved to the poison queue
    Skipped    ///< Cancelled, stale or orphaned; completed without running a step
};

const char* processOutcomeToString(ProcessOutcome outcome);

/**
 * @brief Drives pipelines through their steps.
 *
 * The orchestrator owns every pipeline state transition: it persists the
 * pipeline before completing the operation that advanced it, so a crash in
 * between is detected on redelivery and the step is not run twice.
 */
class PipelineOrchestrator {
public:
    PipelineOrchestrator(std::shared_ptr<queue::IOperationQueue> queue,
                         std::shared_ptr<storage::IContentStore> contentStore,
                         std::shared_ptr<storage::IFileStorage> files,
                         std::shared_ptr<HandlerRegistry> handlers, config::QueueConfig queueConfig,
                         retry::BackoffPolicy backoff = {});

    /**
     * @brief Stores the uploaded files and schedules an ingestion pipeline.
     *
     * Re-importing a document starts a new execution; records of earlier
     * executions are purged by save_records.
     *
     * @return the document id
     */
    Result<std::string> importDocument(ImportRequest request);

    /**
     * @brief Persists a new pipeline and enqueues its first operation.
     *
     * Steps without a registered handler are rejected with
     * ErrorCode::ValidationError.
     *
     * @return the pipeline id ("{index}/{documentId}")
     */
    Result<std::string> schedule(DataPipeline pipeline);

    Result<bool> isDocumentReady(const std::string& index, const std::string& documentId);
    Result<std::optional<PipelineStatus>> readPipelineStatus(const std::string& index,
                                                             const std::string& documentId);

    /**
     * @brief Stops a pipeline; a step already running finishes but no further
     * step is enqueued
     */
    Result<void> cancel(const std::string& index, const std::string& documentId);

    Result<void> deleteDocument(const std::string& index, const std::string& documentId);
    Result<void> deleteIndex(const std::string& index);

    /**
     * @brief Runs the current step of a claimed operation and applies the
     * advance or failure policy
     */
    Result<ProcessOutcome> processOperation(const queue::Operation& operation);

    /**
     * @brief Counts an error returned by processOperation() as a failed
     * attempt: the operation is released with backoff, or poisoned once it
     * has failed more than max_retries_before_poison times
     */
    Result<ProcessOutcome> recordProcessingError(const queue::Operation& operation,
                                                 const Error& error);

    const HandlerRegistry& handlers() const { return *handlers_; }

private:
    Result<void> checkSchedulable(const DataPipeline& pipeline) const;
    queue::Operation makeOperation(const DataPipeline& pipeline) const;

    Result<ProcessOutcome> advance(const queue::Operation& operation, DataPipeline& pipeline);
    Result<ProcessOutcome> finishStep(const queue::Operation& operation, DataPipeline& pipeline);
    Result<ProcessOutcome> handleFailure(const queue::Operation& operation, DataPipeline& pipeline,
                                         const HandlerResult& result);
    Result<ProcessOutcome> poison(const queue::Operation& operation, DataPipeline* pipeline,
                                  const std::string& reason);
    Result<ProcessOutcome> poisonAfterLockAnomaly(const queue::Operation& operation,
                                                  const std::string& detail);
    Result<ProcessOutcome> skip(const queue::Operation& operation, const std::string& why);
    Result<ProcessOutcome> checkLock(const Result<void>& result, const queue::Operation& operation,
                                     ProcessOutcome onSuccess);

    std::shared_ptr<queue::IOperationQueue> queue_;
    std::shared_ptr<storage::IContentStore> contentStore_;
    std::shared_ptr<storage::IFileStorage> files_;
    std::shared_ptr<HandlerRegistry> handlers_;
    config::QueueConfig queueConfig_;
    retry::BackoffPolicy backoff_;
};

} // namespace docmem::pipeline
