// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025 docmem contributors

#pragma once

#include <docmem/core/types.h>
#include <docmem/pipeline/data_pipeline.h>

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace docmem::pipeline {

enum class HandlerOutcome {
    Success,
    TransientFailure, ///< Eligible for retry
    PermanentFailure  ///< Routed straight to the poison queue
};

const char* handlerOutcomeToString(HandlerOutcome outcome);

/**
 * @brief Maps provider and storage errors onto handler outcomes
 */
HandlerOutcome classifyError(ErrorCode code);

struct HandlerResult {
    HandlerOutcome outcome = HandlerOutcome::Success;
    std::string message;

    bool succeeded() const { return outcome == HandlerOutcome::Success; }

    static HandlerResult success() { return {}; }
    static HandlerResult transient(std::string message) {
        return {HandlerOutcome::TransientFailure, std::move(message)};
    }
    static HandlerResult permanent(std::string message) {
        return {HandlerOutcome::PermanentFailure, std::move(message)};
    }
    static HandlerResult fromError(const Error& error) {
        return {classifyError(error.code), error.message};
    }
};

/**
 * @brief Named, idempotent implementation of one pipeline step.
 *
 * invoke() mutates the pipeline in place (generated files, processed_by
 * markers). It must tolerate being called again for the same state and skip
 * work whose output already exists.
 */
class IPipelineStepHandler {
public:
    virtual ~IPipelineStepHandler() = default;

    virtual std::string stepName() const = 0;
    virtual HandlerResult invoke(DataPipeline& pipeline) = 0;
};

/**
 * @brief Closed set of handlers, keyed by step name
 */
class HandlerRegistry {
public:
    /**
     * @brief Registers a handler; a second handler for the same step is rejected
     */
    Result<void> add(std::shared_ptr<IPipelineStepHandler> handler);

    std::shared_ptr<IPipelineStepHandler> find(const std::string& step) const;
    bool contains(const std::string& step) const;
    std::vector<std::string> stepNames() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<IPipelineStepHandler>> handlers_;
};

} // namespace docmem::pipeline
