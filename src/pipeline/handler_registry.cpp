// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025 docmem contributors

#include <spdlog/spdlog.h>
#include <docmem/pipeline/handler.h>

namespace docmem::pipeline {

const char* handlerOutcomeToString(HandlerOutcome outcome) {
    switch (outcome) {
        case HandlerOutcome::Success:
            return "success";
        case HandlerOutcome::TransientFailure:
            return "transient_failure";
        case HandlerOutcome::PermanentFailure:
            return "permanent_failure";
    }
    return "unknown";
}

HandlerOutcome classifyError(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success:
            return HandlerOutcome::Success;
        case ErrorCode::ResourceExhausted:
        case ErrorCode::NetworkError:
        case ErrorCode::Timeout:
        case ErrorCode::DatabaseError:
        case ErrorCode::IOError:
        case ErrorCode::LockContention:
            return HandlerOutcome::TransientFailure;
        case ErrorCode::NotSupported:
        case ErrorCode::InvalidData:
        case ErrorCode::ValidationError:
        case ErrorCode::InvalidArgument:
        case ErrorCode::FileNotFound:
            return HandlerOutcome::PermanentFailure;
        default:
            return HandlerOutcome::TransientFailure;
    }
}

Result<void> HandlerRegistry::add(std::shared_ptr<IPipelineStepHandler> handler) {
    if (!handler) {
        return Error{ErrorCode::InvalidArgument, "Handler is null"};
    }
    auto step = handler->stepName();
    if (step.empty()) {
        return Error{ErrorCode::InvalidArgument, "Handler step name is empty"};
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = handlers_.emplace(step, std::move(handler));
    if (!inserted) {
        return Error{ErrorCode::InvalidState, "A handler for '" + step + "' is already registered"};
    }
    spdlog::debug("[HandlerRegistry] Registered handler '{}'", step);
    return {};
}

std::shared_ptr<IPipelineStepHandler> HandlerRegistry::find(const std::string& step) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = handlers_.find(step);
    return it == handlers_.end() ? nullptr : it->second;
}

bool HandlerRegistry::contains(const std::string& step) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handlers_.count(step) > 0;
}

std::vector<std::string> HandlerRegistry::stepNames() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(handlers_.size());
    for (const auto& [name, handler] : handlers_) {
        names.push_back(name);
    }
    return names;
}

} // namespace docmem::pipeline
