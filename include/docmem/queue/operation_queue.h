// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025 docmem contributors

#pragma once

#include <docmem/config/docmem_config.h>
#include <docmem/core/types.h>
#include <docmem/metadata/database.h>

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace docmem::queue {

using Clock = std::function<TimePoint()>;

/**
 * @brief One queued, lockable unit of pipeline advancement.
 *
 * An operation whose last_attempt_timestamp is set while complete is false is
 * locked until the lock duration elapses.
 */
struct Operation {
    std::string id;
    std::string content_id;
    std::vector<std::string> planned_steps;
    std::vector<std::string> completed_steps;
    std::vector<std::string> remaining_steps;
    bool complete = false;
    bool cancelled = false;
    std::string last_failure_reason;
    std::optional<TimePoint> last_attempt_timestamp;
    // Earliest time a retried operation may be claimed again
    std::optional<TimePoint> not_before;
    TimePoint timestamp{};
    int failure_count = 0;
    // Identifies the claim currently holding the lock
    std::string lock_token;
    // Opaque data for the consumer (pipeline coordinates)
    std::string payload_json = "{}";

    std::optional<std::string> currentStep() const;
    bool isLocked(TimePoint now, std::chrono::seconds lockDuration) const;
};

struct PoisonedOperation {
    Operation operation;
    std::string queue_name;
    std::string reason;
    TimePoint poisoned_at{};
};

/**
 * @brief Durable, crash-recoverable work queue with per-operation locks
 */
class IOperationQueue {
public:
    virtual ~IOperationQueue() = default;

    /**
     * @brief Durable write; re-enqueueing an existing id is a no-op
     */
    virtual Result<void> enqueue(const Operation& operation) = 0;

    /**
     * @brief Atomically locks and returns up to batchSize claimable operations.
     *
     * Claimable: not complete, not cancelled, unlocked or lock expired, and
     * past its retry delay.
     */
    virtual Result<std::vector<Operation>> claim(size_t batchSize) = 0;

    /**
     * @brief Marks the operation complete and, in the same transaction,
     * enqueues the follow-up operation unless the operation was cancelled.
     *
     * Fails with ErrorCode::LockContention when the lock is no longer held
     * under @p lockToken.
     */
    virtual Result<void> complete(const std::string& operationId, const std::string& lockToken,
                                  const std::optional<Operation>& next) = 0;

    /**
     * @brief Unlocks after a failed attempt, recording the failure and the
     * earliest retry time
     */
    virtual Result<void> release(const std::string& operationId, const std::string& lockToken,
                                 const std::string& reason, std::chrono::milliseconds delay) = 0;

    /**
     * @brief Moves the operation to the poison queue.
     *
     * Like complete(), fails with ErrorCode::LockContention when the lock is
     * no longer held under @p lockToken.
     */
    virtual Result<void> toPoison(const std::string& operationId, const std::string& lockToken,
                                  const std::string& reason) = 0;

    /**
     * @brief Flags all outstanding operations of a pipeline as cancelled
     * @return number of operations affected
     */
    virtual Result<int> cancel(const std::string& contentId) = 0;

    virtual Result<std::optional<Operation>> get(const std::string& operationId) = 0;
    virtual Result<std::vector<Operation>> listByContent(const std::string& contentId) = 0;
    virtual Result<std::vector<PoisonedOperation>> listPoisoned() = 0;

    /**
     * @brief Deletes completed operations older than @p olderThan
     */
    virtual Result<int> purgeCompleted(TimePoint olderThan) = 0;

    virtual std::string poisonQueueName() const = 0;
};

/**
 * @brief SQLite implementation (km_operations / km_operations_poison).
 *
 * Claims run inside BEGIN IMMEDIATE so concurrent workers, in this or other
 * processes, never lock the same operation twice.
 */
class SqliteOperationQueue : public IOperationQueue {
public:
    static Result<std::unique_ptr<SqliteOperationQueue>> open(const std::string& path,
                                                              config::QueueConfig config,
                                                              Clock clock = nullptr);

    Result<void> enqueue(const Operation& operation) override;
    Result<std::vector<Operation>> claim(size_t batchSize) override;
    Result<void> complete(const std::string& operationId, const std::string& lockToken,
                          const std::optional<Operation>& next) override;
    Result<void> release(const std::string& operationId, const std::string& lockToken,
                         const std::string& reason, std::chrono::milliseconds delay) override;
    Result<void> toPoison(const std::string& operationId, const std::string& lockToken,
                          const std::string& reason) override;
    Result<int> cancel(const std::string& contentId) override;
    Result<std::optional<Operation>> get(const std::string& operationId) override;
    Result<std::vector<Operation>> listByContent(const std::string& contentId) override;
    Result<std::vector<PoisonedOperation>> listPoisoned() override;
    Result<int> purgeCompleted(TimePoint olderThan) override;
    std::string poisonQueueName() const override { return config_.poisonQueueName(); }

    const config::QueueConfig& config() const { return config_; }

private:
    SqliteOperationQueue(metadata::Database db, config::QueueConfig config, Clock clock);

    Result<void> initSchema();
    Result<void> insertOperation(const Operation& operation);
    Result<std::optional<Operation>> loadOperation(const std::string& operationId);
    Result<void> explainLostLock(const std::string& operationId, const std::string& lockToken);

    std::mutex mutex_;
    metadata::Database db_;
    config::QueueConfig config_;
    Clock clock_;
};

} // namespace docmem::queue
