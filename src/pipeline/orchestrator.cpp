// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025 docmem contributors

#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>
#include <spdlog/spdlog.h>
#include <docmem/core/uuid.h>
#include <docmem/extraction/content_decoder.h>
#include <docmem/pipeline/constants.h>
#include <docmem/pipeline/orchestrator.h>

#include <algorithm>

namespace docmem::pipeline {

namespace {

// Document id used by index deletion pipelines
constexpr const char* kIndexDeletionDocumentId = "__delete_index";

std::string executionIdOf(const queue::Operation& operation) {
    auto payloadJson = json::parse(operation.payload_json, nullptr, false);
    if (!payloadJson.is_object())
        return {};
    return payloadJson.value("execution_id", "");
}

} // namespace

const char* processOutcomeToString(ProcessOutcome outcome) {
    switch (outcome) {
        case ProcessOutcome::Advanced:
            return "advanced";
        case ProcessOutcome::Completed:
            return "completed";
        case ProcessOutcome::Retrying:
            return "retrying";
        case ProcessOutcome::Poisoned:
            return "poisoned";
        case ProcessOutcome::Skipped:
            return "skipped";
    }
    return "unknown";
}

PipelineOrchestrator::PipelineOrchestrator(std::shared_ptr<queue::IOperationQueue> queue,
                                           std::shared_ptr<storage::IContentStore> contentStore,
                                           std::shared_ptr<storage::IFileStorage> files,
                                           std::shared_ptr<HandlerRegistry> handlers,
                                           config::QueueConfig queueConfig,
                                           retry::BackoffPolicy backoff)
    : queue_(std::move(queue)),
      contentStore_(std::move(contentStore)),
      files_(std::move(files)),
      handlers_(std::move(handlers)),
      queueConfig_(std::move(queueConfig)),
      backoff_(backoff) {}

Result<void> PipelineOrchestrator::checkSchedulable(const DataPipeline& pipeline) const {
    if (auto r = pipeline.validate(); !r) {
        return r;
    }
    if (auto r = validateDocumentId(pipeline.document_id); !r) {
        return r;
    }
    for (const auto& step : pipeline.steps) {
        if (!handlers_->contains(step)) {
            return Error{ErrorCode::ValidationError,
                         "No handler is registered for step '" + step + "'"};
        }
    }
    return {};
}

queue::Operation PipelineOrchestrator::makeOperation(const DataPipeline& pipeline) const {
    queue::Operation op;
    op.content_id = pipeline.id();
    // Unique per position, so a step repeated later in the plan gets its own operation
    op.id = fmt::format("{}:{}:{}", op.content_id, pipeline.execution_id,
                        pipeline.completed_steps.size());
    op.planned_steps = pipeline.steps;
    op.completed_steps = pipeline.completed_steps;
    op.remaining_steps = pipeline.remaining_steps;
    op.timestamp = std::chrono::system_clock::now();
    op.payload_json = json{{"index", pipeline.index},
                           {"document_id", pipeline.document_id},
                           {"execution_id", pipeline.execution_id}}
                          .dump();
    return op;
}

Result<std::string> PipelineOrchestrator::schedule(DataPipeline pipeline) {
    pipeline.index = normalizeIndexName(pipeline.index);
    if (pipeline.execution_id.empty()) {
        pipeline.execution_id = core::generateExecutionId();
    }
    pipeline.resetProgress();
    if (auto r = checkSchedulable(pipeline); !r) {
        spdlog::warn("[Orchestrator] Rejected pipeline {}: {}", pipeline.id(), r.error().message);
        return r.error();
    }

    const auto now = std::chrono::system_clock::now();
    if (pipeline.creation == TimePoint{}) {
        pipeline.creation = now;
    }
    pipeline.last_update = now;

    if (auto r = contentStore_->savePipeline(pipeline); !r) {
        return r.error();
    }
    if (auto r = queue_->enqueue(makeOperation(pipeline)); !r) {
        return r.error();
    }
    spdlog::info("[Orchestrator] Scheduled {} (execution {}, steps: {})", pipeline.id(),
                 pipeline.execution_id, fmt::join(pipeline.steps, ", "));
    return pipeline.id();
}

Result<std::string> PipelineOrchestrator::importDocument(ImportRequest request) {
    if (request.files.empty()) {
        return Error{ErrorCode::InvalidArgument, "Nothing to import: no files were provided"};
    }

    DataPipeline pipeline;
    pipeline.index = normalizeIndexName(request.index);
    pipeline.document_id =
        request.document_id.empty() ? core::generateUUID() : std::move(request.document_id);
    pipeline.tags = std::move(request.tags);
    pipeline.steps = request.steps.empty() ? steps::defaultIngestion() : std::move(request.steps);
    pipeline.execution_id = core::generateExecutionId();
    pipeline.resetProgress();

    if (auto r = validateTags(pipeline.tags); !r) {
        return r.error();
    }
    if (auto r = checkSchedulable(pipeline); !r) {
        return r.error();
    }

    const auto id = pipeline.id();
    auto existing = contentStore_->loadPipeline(id);
    if (!existing) {
        return existing.error();
    }
    if (existing.value()) {
        const auto& previous = *existing.value();
        if (!previous.complete() && !previous.cancelled && !previous.failed) {
            auto cancelled = queue_->cancel(id);
            if (!cancelled) {
                return cancelled.error();
            }
            spdlog::info("[Orchestrator] Re-import of {} cancelled {} pending operation(s)", id,
                         cancelled.value());
        }
        pipeline.previous_executions_to_purge = previous.previous_executions_to_purge;
        if (std::find(pipeline.previous_executions_to_purge.begin(),
                      pipeline.previous_executions_to_purge.end(),
                      previous.execution_id) == pipeline.previous_executions_to_purge.end()) {
            pipeline.previous_executions_to_purge.push_back(previous.execution_id);
        }
        if (auto r = files_->emptyDocumentDirectory(pipeline.index, pipeline.document_id); !r) {
            return r.error();
        }
    } else if (auto r = files_->createDocumentDirectory(pipeline.index, pipeline.document_id);
               !r) {
        return r.error();
    }

    storage::ContentRecord record;
    record.id = id;
    record.title = request.files.front().name;
    record.tags_json = json(pipeline.tags).dump();

    for (auto& upload : request.files) {
        if (upload.name.empty()) {
            return Error{ErrorCode::InvalidArgument, "Uploaded file name is empty"};
        }
        FileDetails file;
        file.id = core::generateUUID();
        file.name = upload.name;
        file.size = static_cast<int64_t>(upload.content.size());
        file.mime_type = upload.mime_type.empty() ? extraction::mimeTypeFromFileName(upload.name)
                                                  : upload.mime_type;
        file.tags = pipeline.tags;

        if (auto r =
                files_->writeFile(pipeline.index, pipeline.document_id, file.name, upload.content);
            !r) {
            return r.error();
        }

        if (record.mime_type.empty()) {
            record.mime_type = file.mime_type;
        }
        if (!record.content.empty()) {
            record.content += "\n";
        }
        record.content += upload.content;
        record.byte_size += file.size;
        pipeline.files.push_back(std::move(file));
    }

    if (auto r = contentStore_->upsertContent(record); !r) {
        return r.error();
    }

    const auto documentId = pipeline.document_id;
    auto scheduled = schedule(std::move(pipeline));
    if (!scheduled) {
        return scheduled.error();
    }
    return documentId;
}

Result<bool> PipelineOrchestrator::isDocumentReady(const std::string& index,
                                                   const std::string& documentId) {
    auto loaded = contentStore_->loadPipeline(makePipelineId(normalizeIndexName(index), documentId));
    if (!loaded) {
        return loaded.error();
    }
    if (!loaded.value()) {
        return false;
    }
    const auto& pipeline = *loaded.value();
    return pipeline.complete() && !pipeline.failed && !pipeline.cancelled &&
           !pipeline.files.empty();
}

Result<std::optional<PipelineStatus>>
PipelineOrchestrator::readPipelineStatus(const std::string& index, const std::string& documentId) {
    auto loaded = contentStore_->loadPipeline(makePipelineId(normalizeIndexName(index), documentId));
    if (!loaded) {
        return loaded.error();
    }
    if (!loaded.value()) {
        return std::optional<PipelineStatus>{};
    }
    return std::optional<PipelineStatus>{PipelineStatus::from(*loaded.value())};
}

Result<void> PipelineOrchestrator::cancel(const std::string& index,
                                          const std::string& documentId) {
    const auto id = makePipelineId(normalizeIndexName(index), documentId);
    auto loaded = contentStore_->loadPipeline(id);
    if (!loaded) {
        return loaded.error();
    }
    if (!loaded.value()) {
        return Error{ErrorCode::NotFound, "Pipeline " + id + " not found"};
    }
    auto pipeline = std::move(*loaded.value());
    if (pipeline.complete()) {
        spdlog::debug("[Orchestrator] {} already complete, nothing to cancel", id);
        return {};
    }

    pipeline.cancelled = true;
    pipeline.last_update = std::chrono::system_clock::now();
    if (auto r = contentStore_->savePipeline(pipeline); !r) {
        return r;
    }
    auto cancelled = queue_->cancel(id);
    if (!cancelled) {
        return cancelled.error();
    }
    spdlog::info("[Orchestrator] Cancelled {} ({} pending operation(s))", id, cancelled.value());
    return {};
}

Result<void> PipelineOrchestrator::deleteDocument(const std::string& index,
                                                  const std::string& documentId) {
    if (auto r = validateDocumentId(documentId); !r) {
        return r;
    }
    const auto normalized = normalizeIndexName(index);
    const auto id = makePipelineId(normalized, documentId);

    auto cancelled = queue_->cancel(id);
    if (!cancelled) {
        return cancelled.error();
    }
    if (auto r = contentStore_->setReady(id, false); !r) {
        return r.error();
    }

    DataPipeline pipeline;
    pipeline.index = normalized;
    pipeline.document_id = documentId;
    pipeline.then(steps::kDeleteDocument);
    auto scheduled = schedule(std::move(pipeline));
    if (!scheduled) {
        return scheduled.error();
    }
    return {};
}

Result<void> PipelineOrchestrator::deleteIndex(const std::string& index) {
    DataPipeline pipeline;
    pipeline.index = normalizeIndexName(index);
    pipeline.document_id = kIndexDeletionDocumentId;
    pipeline.then(steps::kDeleteIndex);
    auto scheduled = schedule(std::move(pipeline));
    if (!scheduled) {
        return scheduled.error();
    }
    return {};
}

Result<ProcessOutcome> PipelineOrchestrator::processOperation(const queue::Operation& operation) {
    const auto step = operation.currentStep();
    if (!step) {
        return skip(operation, "operation has no remaining steps");
    }

    auto loaded = contentStore_->loadPipeline(operation.content_id);
    if (!loaded) {
        if (loaded.error().code == ErrorCode::InvalidData) {
            return poison(operation, nullptr, loaded.error().message);
        }
        return loaded.error();
    }
    if (!loaded.value()) {
        return skip(operation, "pipeline state not found");
    }
    DataPipeline pipeline = std::move(*loaded.value());

    const auto executionId = executionIdOf(operation);
    if (!executionId.empty() && executionId != pipeline.execution_id) {
        return skip(operation, "superseded by execution " + pipeline.execution_id);
    }
    if (pipeline.cancelled || operation.cancelled) {
        return skip(operation, "pipeline cancelled");
    }
    if (pipeline.failed) {
        return skip(operation, "pipeline already failed");
    }

    const size_t done = operation.completed_steps.size();
    if (pipeline.completed_steps.size() > done) {
        if (pipeline.completed_steps[done] == *step) {
            // State was saved but the operation was never completed
            spdlog::warn("[Orchestrator] Step '{}' of {} already persisted, resuming", *step,
                         pipeline.id());
            return finishStep(operation, pipeline);
        }
        return poison(operation, &pipeline,
                      "Pipeline state is ahead of operation " + operation.id);
    }
    if (pipeline.completed_steps.size() < done || pipeline.currentStep() != step) {
        return poison(operation, &pipeline,
                      "Pipeline state does not match operation " + operation.id);
    }

    auto handler = handlers_->find(*step);
    if (!handler) {
        return poison(operation, &pipeline, "No handler is registered for step '" + *step + "'");
    }

    spdlog::debug("[Orchestrator] Running '{}' for {} (attempt {})", *step, pipeline.id(),
                  operation.failure_count + 1);
    HandlerResult result;
    try {
        result = handler->invoke(pipeline);
    } catch (const std::exception& e) {
        result = HandlerResult::transient(std::string("Handler threw: ") + e.what());
    } catch (...) {
        result = HandlerResult::transient("Handler threw a non-standard exception");
    }

    if (!result.succeeded()) {
        return handleFailure(operation, pipeline, result);
    }
    return advance(operation, pipeline);
}

Result<ProcessOutcome> PipelineOrchestrator::advance(const queue::Operation& operation,
                                                     DataPipeline& pipeline) {
    auto latest = contentStore_->loadPipeline(operation.content_id);
    if (!latest) {
        return latest.error();
    }
    if (latest.value()) {
        if (latest.value()->execution_id != pipeline.execution_id) {
            return skip(operation, "superseded by execution " + latest.value()->execution_id);
        }
        // Cancelled while the handler was running
        if (latest.value()->cancelled) {
            pipeline.cancelled = true;
        }
    }

    if (auto r = pipeline.moveToNextStep(); !r) {
        return poison(operation, &pipeline, r.error().message);
    }
    pipeline.last_failure_reason.clear();
    pipeline.last_update = std::chrono::system_clock::now();
    if (auto r = contentStore_->savePipeline(pipeline); !r) {
        return r.error();
    }
    return finishStep(operation, pipeline);
}

Result<ProcessOutcome> PipelineOrchestrator::finishStep(const queue::Operation& operation,
                                                        DataPipeline& pipeline) {
    if (pipeline.cancelled) {
        spdlog::info("[Orchestrator] {} was cancelled, not enqueuing further steps",
                     pipeline.id());
        return checkLock(queue_->complete(operation.id, operation.lock_token, std::nullopt),
                         operation, ProcessOutcome::Skipped);
    }

    if (pipeline.complete()) {
        auto changed = contentStore_->setReady(pipeline.id(), true);
        if (!changed) {
            return changed.error();
        }
        if (changed.value()) {
            spdlog::info("[Orchestrator] {} is ready", pipeline.id());
        }
        return checkLock(queue_->complete(operation.id, operation.lock_token, std::nullopt),
                         operation, ProcessOutcome::Completed);
    }

    auto next = makeOperation(pipeline);
    spdlog::debug("[Orchestrator] {} advanced to '{}'", pipeline.id(),
                  next.currentStep().value_or(""));
    return checkLock(queue_->complete(operation.id, operation.lock_token, next), operation,
                     ProcessOutcome::Advanced);
}

Result<ProcessOutcome> PipelineOrchestrator::handleFailure(const queue::Operation& operation,
                                                           DataPipeline& pipeline,
                                                           const HandlerResult& result) {
    const auto step = operation.currentStep().value_or("");
    if (result.outcome == HandlerOutcome::PermanentFailure) {
        return poison(operation, &pipeline,
                      fmt::format("Step '{}' failed permanently: {}", step, result.message));
    }

    const int failures = operation.failure_count + 1;
    if (failures > queueConfig_.max_retries_before_poison) {
        return poison(operation, &pipeline,
                      fmt::format("Step '{}' failed {} times, last error: {}", step, failures,
                                  result.message));
    }

    auto latest = contentStore_->loadPipeline(operation.content_id);
    if (!latest) {
        return latest.error();
    }
    if (latest.value() && latest.value()->execution_id != pipeline.execution_id) {
        return skip(operation, "superseded by execution " + latest.value()->execution_id);
    }

    // Keep partial progress so the retry skips finished work
    pipeline.last_failure_reason = result.message;
    pipeline.last_update = std::chrono::system_clock::now();
    if (latest.value() && latest.value()->cancelled) {
        pipeline.cancelled = true;
    }
    if (auto r = contentStore_->savePipeline(pipeline); !r) {
        return r.error();
    }

    const auto delay = backoff_.delay(failures);
    spdlog::warn("[Orchestrator] Step '{}' of {} failed (attempt {}/{}), retrying in {} ms: {}",
                 step, pipeline.id(), failures, queueConfig_.max_retries_before_poison + 1,
                 delay.count(), result.message);
    return checkLock(queue_->release(operation.id, operation.lock_token, result.message, delay),
                     operation, ProcessOutcome::Retrying);
}

Result<ProcessOutcome> PipelineOrchestrator::recordProcessingError(
    const queue::Operation& operation, const Error& error) {
    const auto step = operation.currentStep().value_or("");
    const int failures = operation.failure_count + 1;
    if (failures > queueConfig_.max_retries_before_poison) {
        const auto reason = fmt::format("Step '{}' errored {} times, last error: {}", step,
                                        failures, error.message);
        auto loaded = contentStore_->loadPipeline(operation.content_id);
        if (loaded && loaded.value()) {
            return poison(operation, &*loaded.value(), reason);
        }
        return poison(operation, nullptr, reason);
    }

    const auto delay = backoff_.delay(failures);
    spdlog::warn("[Orchestrator] Operation {} errored (attempt {}/{}), retrying in {} ms: {}",
                 operation.id, failures, queueConfig_.max_retries_before_poison + 1,
                 delay.count(), error.message);
    return checkLock(queue_->release(operation.id, operation.lock_token, error.message, delay),
                     operation, ProcessOutcome::Retrying);
}

Result<ProcessOutcome> PipelineOrchestrator::poison(const queue::Operation& operation,
                                                    DataPipeline* pipeline,
                                                    const std::string& reason) {
    if (pipeline) {
        auto latest = contentStore_->loadPipeline(operation.content_id);
        if (!latest) {
            return latest.error();
        }
        if (latest.value()) {
            if (latest.value()->execution_id != pipeline->execution_id) {
                return skip(operation, "superseded by execution " + latest.value()->execution_id);
            }
            if (latest.value()->cancelled) {
                pipeline->cancelled = true;
            }
        }
        pipeline->failed = true;
        pipeline->last_failure_reason = reason;
        pipeline->last_update = std::chrono::system_clock::now();
        if (auto r = contentStore_->savePipeline(*pipeline); !r) {
            spdlog::error("[Orchestrator] Could not record failure of {}: {}", pipeline->id(),
                          r.error().message);
        }
    }
    spdlog::error("[Orchestrator] Moving operation {} to {}: {}", operation.id,
                  queue_->poisonQueueName(), reason);
    return checkLock(queue_->toPoison(operation.id, operation.lock_token, reason), operation,
                     ProcessOutcome::Poisoned);
}

Result<ProcessOutcome> PipelineOrchestrator::poisonAfterLockAnomaly(
    const queue::Operation& operation, const std::string& detail) {
    spdlog::error("[Orchestrator] Lock anomaly on operation {}: {}", operation.id, detail);
    const auto reason = "Lock anomaly: " + detail;

    auto current = queue_->get(operation.id);
    if (!current) {
        return current.error();
    }
    if (!current.value() || current.value()->complete) {
        return ProcessOutcome::Skipped;
    }

    auto loaded = contentStore_->loadPipeline(operation.content_id);
    if (loaded && loaded.value() && loaded.value()->execution_id == executionIdOf(operation)) {
        auto pipeline = std::move(*loaded.value());
        pipeline.failed = true;
        pipeline.last_failure_reason = reason;
        pipeline.last_update = std::chrono::system_clock::now();
        if (auto r = contentStore_->savePipeline(pipeline); !r) {
            spdlog::error("[Orchestrator] Could not record failure of {}: {}", pipeline.id(),
                          r.error().message);
        }
    }

    // Taken under the token of whichever claim holds the operation now
    auto moved = queue_->toPoison(operation.id, current.value()->lock_token, reason);
    if (!moved) {
        if (moved.error().code == ErrorCode::NotFound ||
            moved.error().code == ErrorCode::InvalidState) {
            return ProcessOutcome::Skipped;
        }
        return moved.error();
    }
    return ProcessOutcome::Poisoned;
}

Result<ProcessOutcome> PipelineOrchestrator::skip(const queue::Operation& operation,
                                                  const std::string& why) {
    spdlog::info("[Orchestrator] Skipping operation {}: {}", operation.id, why);
    return checkLock(queue_->complete(operation.id, operation.lock_token, std::nullopt),
                     operation, ProcessOutcome::Skipped);
}

Result<ProcessOutcome> PipelineOrchestrator::checkLock(const Result<void>& result,
                                                       const queue::Operation& operation,
                                                       ProcessOutcome onSuccess) {
    if (result) {
        return onSuccess;
    }
    switch (result.error().code) {
        case ErrorCode::NotFound:
        case ErrorCode::InvalidState:
            // Another claim already finished or poisoned the operation
            spdlog::warn("[Orchestrator] Lost lock on operation {}: {}", operation.id,
                         result.error().message);
            return ProcessOutcome::Skipped;
        case ErrorCode::LockContention:
            return poisonAfterLockAnomaly(operation, result.error().message);
        default:
            return result.error();
    }
}

} // namespace docmem::pipeline
