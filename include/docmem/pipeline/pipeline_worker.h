// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025 docmem contributors

#pragma once

#include <docmem/config/docmem_config.h>
#include <docmem/pipeline/orchestrator.h>
#include <docmem/queue/operation_queue.h>

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

namespace docmem::pipeline {

struct WorkerStats {
    uint64_t claimed = 0;
    uint64_t advanced = 0;
    uint64_t completed = 0;
    uint64_t retried = 0;
    uint64_t poisoned = 0;
    uint64_t skipped = 0;
    uint64_t errors = 0;
};

/**
 * @brief Polls the operation queue and feeds claimed operations to the
 * orchestrator.
 *
 * Each worker thread runs one polling lane on a shared io_context: claim a
 * batch, process it, and wait poll_delay on a steady_timer when the queue
 * is empty.
 */
class PipelineWorker {
public:
    PipelineWorker(std::shared_ptr<PipelineOrchestrator> orchestrator,
                   std::shared_ptr<queue::IOperationQueue> queue, config::QueueConfig config);
    ~PipelineWorker();

    PipelineWorker(const PipelineWorker&) = delete;
    PipelineWorker& operator=(const PipelineWorker&) = delete;

    /**
     * @brief Spawns the polling lanes
     * @throws std::runtime_error if already started
     */
    void start(std::size_t numThreads = 1);

    /**
     * @brief Stops polling; operations in progress finish first. Idempotent.
     */
    void stop();

    /**
     * @brief Waits for the worker threads to exit. Idempotent.
     */
    void join();

    [[nodiscard]] bool isRunning() const noexcept { return running_; }

    /**
     * @brief Claims and processes one batch on the calling thread
     * @return number of operations claimed
     */
    Result<std::size_t> runOnce();

    /**
     * @brief Calls runOnce() until nothing is claimable
     * @return total number of operations claimed
     */
    Result<std::size_t> drain(std::size_t maxBatches = 10000);

    WorkerStats stats() const;

private:
    struct Lane {
        std::size_t index = 0;
        std::unique_ptr<boost::asio::steady_timer> timer;
    };

    void schedulePoll(Lane& lane, std::chrono::milliseconds delay);
    void poll(Lane& lane);
    void process(const queue::Operation& operation);

    std::shared_ptr<PipelineOrchestrator> orchestrator_;
    std::shared_ptr<queue::IOperationQueue> queue_;
    config::QueueConfig config_;

    boost::asio::io_context io_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
        workGuard_;
    std::vector<std::unique_ptr<Lane>> lanes_;
    std::vector<std::thread> threads_;
    std::atomic<bool> running_{false};

    mutable std::mutex statsMutex_;
    WorkerStats stats_;
};

} // namespace docmem::pipeline
