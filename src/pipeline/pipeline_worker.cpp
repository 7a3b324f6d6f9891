// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025 docmem contributors

#include <spdlog/spdlog.h>
#include <docmem/pipeline/pipeline_worker.h>

#include <stdexcept>

#include <boost/asio/post.hpp>

namespace docmem::pipeline {

PipelineWorker::PipelineWorker(std::shared_ptr<PipelineOrchestrator> orchestrator,
                               std::shared_ptr<queue::IOperationQueue> queue,
                               config::QueueConfig config)
    : orchestrator_(std::move(orchestrator)), queue_(std::move(queue)), config_(std::move(config)) {}

PipelineWorker::~PipelineWorker() {
    if (running_ || !threads_.empty()) {
        stop();
        join();
    }
}

void PipelineWorker::start(std::size_t numThreads) {
    if (running_) {
        throw std::runtime_error("PipelineWorker already started");
    }
    if (numThreads == 0) {
        numThreads = 1;
    }

    io_.restart();
    workGuard_.emplace(boost::asio::make_work_guard(io_));
    running_ = true;

    lanes_.clear();
    for (std::size_t i = 0; i < numThreads; ++i) {
        auto lane = std::make_unique<Lane>();
        lane->index = i;
        lane->timer = std::make_unique<boost::asio::steady_timer>(io_);
        schedulePoll(*lane, std::chrono::milliseconds(0));
        lanes_.push_back(std::move(lane));
    }

    threads_.reserve(numThreads);
    for (std::size_t i = 0; i < numThreads; ++i) {
        threads_.emplace_back([this, i]() {
            spdlog::trace("[PipelineWorker] Thread {} entering io_context.run()", i);
            io_.run();
            spdlog::trace("[PipelineWorker] Thread {} left io_context.run()", i);
        });
    }
    spdlog::info("[PipelineWorker] Started {} lane(s) on queue '{}' (poll {} ms, batch {})",
                 numThreads, config_.queue_name, config_.poll_delay.count(),
                 config_.fetch_batch_size);
}

void PipelineWorker::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    spdlog::info("[PipelineWorker] Stopping");
    boost::asio::post(io_, [this]() {
        for (auto& lane : lanes_) {
            lane->timer->cancel();
        }
    });
    workGuard_.reset();
}

void PipelineWorker::join() {
    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();
    lanes_.clear();
    spdlog::debug("[PipelineWorker] All threads joined");
}

void PipelineWorker::schedulePoll(Lane& lane, std::chrono::milliseconds delay) {
    lane.timer->expires_after(delay);
    lane.timer->async_wait([this, &lane](const boost::system::error_code& ec) {
        if (ec || !running_) {
            return;
        }
        poll(lane);
    });
}

void PipelineWorker::poll(Lane& lane) {
    auto claimed = runOnce();
    if (!claimed) {
        spdlog::warn("[PipelineWorker] Lane {} failed to claim: {}", lane.index,
                     claimed.error().message);
    }
    if (!running_) {
        return;
    }
    // Keep going while there is work, otherwise back off for poll_delay
    const bool busy = claimed && claimed.value() > 0;
    schedulePoll(lane, busy ? std::chrono::milliseconds(0) : config_.poll_delay);
}

Result<std::size_t> PipelineWorker::runOnce() {
    auto claimed = queue_->claim(static_cast<std::size_t>(config_.fetch_batch_size));
    if (!claimed) {
        return claimed.error();
    }
    {
        std::lock_guard<std::mutex> lock(statsMutex_);
        stats_.claimed += claimed.value().size();
    }
    for (const auto& operation : claimed.value()) {
        process(operation);
    }
    return claimed.value().size();
}

Result<std::size_t> PipelineWorker::drain(std::size_t maxBatches) {
    std::size_t total = 0;
    for (std::size_t i = 0; i < maxBatches; ++i) {
        auto claimed = runOnce();
        if (!claimed) {
            return claimed.error();
        }
        if (claimed.value() == 0) {
            break;
        }
        total += claimed.value();
    }
    return total;
}

void PipelineWorker::process(const queue::Operation& operation) {
    auto outcome = orchestrator_->processOperation(operation);
    if (!outcome) {
        spdlog::error("[PipelineWorker] Operation {} failed: {}", operation.id,
                      outcome.error().message);
        {
            std::lock_guard<std::mutex> lock(statsMutex_);
            ++stats_.errors;
        }
        outcome = orchestrator_->recordProcessingError(operation, outcome.error());
        if (!outcome) {
            // Left locked; it is claimed again once the lock expires
            spdlog::error("[PipelineWorker] Could not record failure of {}: {}", operation.id,
                          outcome.error().message);
            return;
        }
    }

    std::lock_guard<std::mutex> lock(statsMutex_);
    switch (outcome.value()) {
        case ProcessOutcome::Advanced:
            ++stats_.advanced;
            break;
        case ProcessOutcome::Completed:
            ++stats_.completed;
            break;
        case ProcessOutcome::Retrying:
            ++stats_.retried;
            break;
        case ProcessOutcome::Poisoned:
            ++stats_.poisoned;
            break;
        case ProcessOutcome::Skipped:
            ++stats_.skipped;
            break;
    }
    spdlog::debug("[PipelineWorker] Operation {}: {}", operation.id,
                  processOutcomeToString(outcome.value()));
}

WorkerStats PipelineWorker::stats() const {
    std::lock_guard<std::mutex> lock(statsMutex_);
    return stats_;
}

} // namespace docmem::pipeline
