// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025 docmem contributors

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <docmem/core/uuid.h>
#include <docmem/queue/operation_queue.h>

namespace docmem::queue {

using json = nlohmann::json;

namespace {

constexpr const char* kColumns =
    "id, complete, cancelled, content_id, timestamp, last_failure_reason, "
    "last_attempt_timestamp, not_before, lock_token, failure_count, planned_steps_json, "
    "completed_steps_json, remaining_steps_json, payload_json";

std::vector<std::string> parseSteps(const std::string& raw) {
    auto j = json::parse(raw, nullptr, false);
    if (j.is_discarded() || !j.is_array())
        return {};
    return j.get<std::vector<std::string>>();
}

Operation readRow(const metadata::Statement& stmt) {
    Operation op;
    op.id = stmt.getString(0);
    op.complete = stmt.getInt(1) != 0;
    op.cancelled = stmt.getInt(2) != 0;
    op.content_id = stmt.getString(3);
    op.timestamp = core::fromEpochMillis(stmt.getInt64(4));
    op.last_failure_reason = stmt.getString(5);
    if (auto v = stmt.getOptionalInt64(6))
        op.last_attempt_timestamp = core::fromEpochMillis(*v);
    if (auto v = stmt.getOptionalInt64(7))
        op.not_before = core::fromEpochMillis(*v);
    op.lock_token = stmt.getString(8);
    op.failure_count = stmt.getInt(9);
    op.planned_steps = parseSteps(stmt.getString(10));
    op.completed_steps = parseSteps(stmt.getString(11));
    op.remaining_steps = parseSteps(stmt.getString(12));
    op.payload_json = stmt.getString(13);
    return op;
}

json operationToJson(const Operation& op) {
    json j{{"id", op.id},
           {"content_id", op.content_id},
           {"planned_steps", op.planned_steps},
           {"completed_steps", op.completed_steps},
           {"remaining_steps", op.remaining_steps},
           {"complete", op.complete},
           {"cancelled", op.cancelled},
           {"last_failure_reason", op.last_failure_reason},
           {"timestamp", core::toEpochMillis(op.timestamp)},
           {"failure_count", op.failure_count},
           {"payload", op.payload_json}};
    if (op.last_attempt_timestamp)
        j["last_attempt_timestamp"] = core::toEpochMillis(*op.last_attempt_timestamp);
    return j;
}

Operation operationFromJson(const json& j) {
    Operation op;
    op.id = j.value("id", std::string{});
    op.content_id = j.value("content_id", std::string{});
    op.planned_steps = j.value("planned_steps", std::vector<std::string>{});
    op.completed_steps = j.value("completed_steps", std::vector<std::string>{});
    op.remaining_steps = j.value("remaining_steps", std::vector<std::string>{});
    op.complete = j.value("complete", false);
    op.cancelled = j.value("cancelled", false);
    op.last_failure_reason = j.value("last_failure_reason", std::string{});
    op.timestamp = core::fromEpochMillis(j.value("timestamp", int64_t{0}));
    op.failure_count = j.value("failure_count", 0);
    op.payload_json = j.value("payload", std::string{"{}"});
    if (j.contains("last_attempt_timestamp"))
        op.last_attempt_timestamp =
            core::fromEpochMillis(j.at("last_attempt_timestamp").get<int64_t>());
    return op;
}

} // namespace

std::optional<std::string> Operation::currentStep() const {
    if (remaining_steps.empty())
        return std::nullopt;
    return remaining_steps.front();
}

bool Operation::isLocked(TimePoint now, std::chrono::seconds lockDuration) const {
    return !complete && last_attempt_timestamp && *last_attempt_timestamp + lockDuration > now;
}

SqliteOperationQueue::SqliteOperationQueue(metadata::Database db, config::QueueConfig config,
                                           Clock clock)
    : db_(std::move(db)), config_(std::move(config)), clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = [] { return std::chrono::system_clock::now(); };
    }
}

Result<std::unique_ptr<SqliteOperationQueue>>
SqliteOperationQueue::open(const std::string& path, config::QueueConfig config, Clock clock) {
    if (auto r = config.validate(); !r) {
        return r.error();
    }

    metadata::Database db;
    if (auto r = db.open(path, metadata::ConnectionMode::Create); !r) {
        return r.error();
    }
    if (auto r = db.enableWAL(); !r) {
        spdlog::warn("[OperationQueue] Could not enable WAL on {}: {}", path, r.error().message);
    }

    std::unique_ptr<SqliteOperationQueue> queue(
        new SqliteOperationQueue(std::move(db), std::move(config), std::move(clock)));
    if (auto r = queue->initSchema(); !r) {
        return r.error();
    }
    spdlog::debug("[OperationQueue] Opened '{}' at {} (poison queue '{}')",
                  queue->config_.queue_name, path, queue->poisonQueueName());
    return queue;
}

Result<void> SqliteOperationQueue::initSchema() {
    return db_.execute(R"(
        CREATE TABLE IF NOT EXISTS km_operations (
            id TEXT PRIMARY KEY,
            complete INTEGER NOT NULL DEFAULT 0,
            cancelled INTEGER NOT NULL DEFAULT 0,
            content_id TEXT NOT NULL,
            timestamp INTEGER NOT NULL,
            last_failure_reason TEXT NOT NULL DEFAULT '',
            last_attempt_timestamp INTEGER NULL,
            not_before INTEGER NULL,
            lock_token TEXT NULL,
            failure_count INTEGER NOT NULL DEFAULT 0,
            planned_steps_json TEXT NOT NULL DEFAULT '[]',
            completed_steps_json TEXT NOT NULL DEFAULT '[]',
            remaining_steps_json TEXT NOT NULL DEFAULT '[]',
            payload_json TEXT NOT NULL DEFAULT '{}'
        );
        CREATE INDEX IF NOT EXISTS idx_km_operations_content
            ON km_operations(content_id, timestamp);
        CREATE INDEX IF NOT EXISTS idx_km_operations_complete
            ON km_operations(complete, timestamp);
        CREATE INDEX IF NOT EXISTS idx_km_operations_timestamp ON km_operations(timestamp);
        CREATE TABLE IF NOT EXISTS km_operations_poison (
            id TEXT PRIMARY KEY,
            queue_name TEXT NOT NULL,
            content_id TEXT NOT NULL,
            reason TEXT NOT NULL,
            failure_count INTEGER NOT NULL,
            poisoned_at INTEGER NOT NULL,
            operation_json TEXT NOT NULL
        );
    )");
}

Result<void> SqliteOperationQueue::insertOperation(const Operation& op) {
    auto stmtResult = db_.prepare(
        std::string("INSERT INTO km_operations (") + kColumns +
        ") VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?) ON CONFLICT(id) DO NOTHING");
    if (!stmtResult)
        return stmtResult.error();
    auto stmt = std::move(stmtResult).value();

    std::optional<int64_t> lastAttempt;
    if (op.last_attempt_timestamp)
        lastAttempt = core::toEpochMillis(*op.last_attempt_timestamp);
    std::optional<int64_t> notBefore;
    if (op.not_before)
        notBefore = core::toEpochMillis(*op.not_before);
    std::optional<std::string> lockToken;
    if (!op.lock_token.empty())
        lockToken = op.lock_token;
    const auto timestamp =
        op.timestamp == TimePoint{} ? clock_() : op.timestamp;

    auto bound = stmt.bindAll(op.id, op.complete ? 1 : 0, op.cancelled ? 1 : 0, op.content_id,
                              core::toEpochMillis(timestamp), op.last_failure_reason, lastAttempt,
                              notBefore, lockToken, op.failure_count,
                              json(op.planned_steps).dump(), json(op.completed_steps).dump(),
                              json(op.remaining_steps).dump(), op.payload_json);
    if (!bound)
        return bound;
    return stmt.execute();
}

Result<void> SqliteOperationQueue::enqueue(const Operation& operation) {
    if (operation.id.empty() || operation.content_id.empty()) {
        return Error{ErrorCode::InvalidArgument, "Operation id and content id are required"};
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto r = insertOperation(operation);
    if (r) {
        spdlog::debug("[OperationQueue] Enqueued {} (step '{}')", operation.id,
                      operation.currentStep().value_or(""));
    }
    return r;
}

Result<std::vector<Operation>> SqliteOperationQueue::claim(size_t batchSize) {
    std::vector<Operation> claimed;
    if (batchSize == 0) {
        return claimed;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = clock_();
    const int64_t nowMs = core::toEpochMillis(now);
    const int64_t expiredBefore = core::toEpochMillis(now - config_.lock_duration);

    auto result = db_.transaction(
        [&]() -> Result<void> {
            auto selectResult = db_.prepare(
                "SELECT id FROM km_operations WHERE complete = 0 AND cancelled = 0 "
                "AND (last_attempt_timestamp IS NULL OR last_attempt_timestamp <= ?) "
                "AND (not_before IS NULL OR not_before <= ?) "
                "ORDER BY timestamp LIMIT ?");
            if (!selectResult)
                return selectResult.error();
            auto select = std::move(selectResult).value();
            if (auto r = select.bindAll(expiredBefore, nowMs, static_cast<int64_t>(batchSize));
                !r)
                return r;

            std::vector<std::string> candidates;
            while (true) {
                auto row = select.step();
                if (!row)
                    return row.error();
                if (!row.value())
                    break;
                candidates.push_back(select.getString(0));
            }

            for (const auto& id : candidates) {
                auto updateResult = db_.prepare(
                    "UPDATE km_operations SET last_attempt_timestamp = ?, lock_token = ? "
                    "WHERE id = ? AND complete = 0 AND cancelled = 0 "
                    "AND (last_attempt_timestamp IS NULL OR last_attempt_timestamp <= ?)");
                if (!updateResult)
                    return updateResult.error();
                auto update = std::move(updateResult).value();
                const auto token = core::generateUUID();
                if (auto r = update.bindAll(nowMs, token, id, expiredBefore); !r)
                    return r;
                if (auto r = update.execute(); !r)
                    return r;
                if (db_.changes() != 1)
                    continue;

                auto loaded = loadOperation(id);
                if (!loaded)
                    return loaded.error();
                if (loaded.value())
                    claimed.push_back(std::move(*loaded.value()));
            }
            return {};
        },
        metadata::TransactionMode::Immediate);

    if (!result) {
        spdlog::warn("[OperationQueue] Claim failed: {}", result.error().message);
        return result.error();
    }
    if (!claimed.empty()) {
        spdlog::debug("[OperationQueue] Claimed {} operation(s)", claimed.size());
    }
    return claimed;
}

Result<void> SqliteOperationQueue::explainLostLock(const std::string& operationId,
                                                   const std::string& lockToken) {
    auto loaded = loadOperation(operationId);
    if (!loaded)
        return loaded.error();
    if (!loaded.value()) {
        return Error{ErrorCode::NotFound, "Operation " + operationId + " no longer exists"};
    }
    const auto& op = *loaded.value();
    if (op.complete) {
        return Error{ErrorCode::InvalidState, "Operation " + operationId + " is already complete"};
    }
    return Error{ErrorCode::LockContention, "Operation " + operationId +
                                                " is locked by another claim (expected token " +
                                                lockToken + ", found '" + op.lock_token + "')"};
}

Result<void> SqliteOperationQueue::complete(const std::string& operationId,
                                            const std::string& lockToken,
                                            const std::optional<Operation>& next) {
    std::lock_guard<std::mutex> lock(mutex_);
    return db_.transaction(
        [&]() -> Result<void> {
            auto stmtResult = db_.prepare(
                "UPDATE km_operations SET complete = 1, lock_token = NULL, not_before = NULL "
                "WHERE id = ? AND lock_token = ? AND complete = 0");
            if (!stmtResult)
                return stmtResult.error();
            auto stmt = std::move(stmtResult).value();
            if (auto r = stmt.bindAll(operationId, lockToken); !r)
                return r;
            if (auto r = stmt.execute(); !r)
                return r;
            if (db_.changes() != 1)
                return explainLostLock(operationId, lockToken);

            if (!next)
                return {};
            // A cancel that landed while the step ran stops the chain here
            auto flagResult = db_.prepare("SELECT cancelled FROM km_operations WHERE id = ?");
            if (!flagResult)
                return flagResult.error();
            auto flag = std::move(flagResult).value();
            if (auto r = flag.bind(1, operationId); !r)
                return r;
            auto row = flag.step();
            if (!row)
                return row.error();
            if (row.value() && flag.getInt(0) != 0) {
                spdlog::info("[OperationQueue] {} was cancelled, not enqueueing {}", operationId,
                             next->id);
                return {};
            }
            return insertOperation(*next);
        },
        metadata::TransactionMode::Immediate);
}

Result<void> SqliteOperationQueue::release(const std::string& operationId,
                                           const std::string& lockToken,
                                           const std::string& reason,
                                           std::chrono::milliseconds delay) {
    std::lock_guard<std::mutex> lock(mutex_);
    const int64_t notBefore = core::toEpochMillis(clock_() + delay);
    return db_.transaction(
        [&]() -> Result<void> {
            auto stmtResult = db_.prepare(
                "UPDATE km_operations SET last_attempt_timestamp = NULL, lock_token = NULL, "
                "not_before = ?, failure_count = failure_count + 1, last_failure_reason = ? "
                "WHERE id = ? AND lock_token = ? AND complete = 0");
            if (!stmtResult)
                return stmtResult.error();
            auto stmt = std::move(stmtResult).value();
            if (auto r = stmt.bindAll(notBefore, reason, operationId, lockToken); !r)
                return r;
            if (auto r = stmt.execute(); !r)
                return r;
            if (db_.changes() != 1)
                return explainLostLock(operationId, lockToken);
            return {};
        },
        metadata::TransactionMode::Immediate);
}

Result<void> SqliteOperationQueue::toPoison(const std::string& operationId,
                                            const std::string& lockToken,
                                            const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto queueName = poisonQueueName();
    auto result = db_.transaction(
        [&]() -> Result<void> {
            auto loaded = loadOperation(operationId);
            if (!loaded)
                return loaded.error();
            if (!loaded.value() || loaded.value()->complete ||
                loaded.value()->lock_token != lockToken) {
                return explainLostLock(operationId, lockToken);
            }
            auto op = std::move(*loaded.value());
            op.last_failure_reason = reason;

            auto insertResult = db_.prepare(
                "INSERT OR REPLACE INTO km_operations_poison "
                "(id, queue_name, content_id, reason, failure_count, poisoned_at, operation_json) "
                "VALUES (?, ?, ?, ?, ?, ?, ?)");
            if (!insertResult)
                return insertResult.error();
            auto insert = std::move(insertResult).value();
            if (auto r = insert.bindAll(op.id, queueName, op.content_id, reason, op.failure_count,
                                        core::toEpochMillis(clock_()),
                                        operationToJson(op).dump());
                !r)
                return r;
            if (auto r = insert.execute(); !r)
                return r;

            auto deleteResult =
                db_.prepare("DELETE FROM km_operations WHERE id = ? AND lock_token = ?");
            if (!deleteResult)
                return deleteResult.error();
            auto del = std::move(deleteResult).value();
            if (auto r = del.bindAll(operationId, lockToken); !r)
                return r;
            if (auto r = del.execute(); !r)
                return r;
            if (db_.changes() != 1)
                return explainLostLock(operationId, lockToken);
            return {};
        },
        metadata::TransactionMode::Immediate);

    if (result) {
        spdlog::error("[OperationQueue] Operation {} moved to '{}': {}", operationId, queueName,
                      reason);
    }
    return result;
}

Result<int> SqliteOperationQueue::cancel(const std::string& contentId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmtResult = db_.prepare(
        "UPDATE km_operations SET cancelled = 1 WHERE content_id = ? AND complete = 0");
    if (!stmtResult)
        return stmtResult.error();
    auto stmt = std::move(stmtResult).value();
    if (auto r = stmt.bind(1, contentId); !r)
        return r.error();
    if (auto r = stmt.execute(); !r)
        return r.error();
    return db_.changes();
}

Result<std::optional<Operation>> SqliteOperationQueue::loadOperation(const std::string& operationId) {
    auto stmtResult =
        db_.prepare(std::string("SELECT ") + kColumns + " FROM km_operations WHERE id = ?");
    if (!stmtResult)
        return stmtResult.error();
    auto stmt = std::move(stmtResult).value();
    if (auto r = stmt.bind(1, operationId); !r)
        return r.error();
    auto row = stmt.step();
    if (!row)
        return row.error();
    if (!row.value())
        return std::optional<Operation>{};
    return std::optional<Operation>{readRow(stmt)};
}

Result<std::optional<Operation>> SqliteOperationQueue::get(const std::string& operationId) {
    std::lock_guard<std::mutex> lock(mutex_);
    return loadOperation(operationId);
}

Result<std::vector<Operation>> SqliteOperationQueue::listByContent(const std::string& contentId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmtResult = db_.prepare(std::string("SELECT ") + kColumns +
                                  " FROM km_operations WHERE content_id = ? ORDER BY timestamp");
    if (!stmtResult)
        return stmtResult.error();
    auto stmt = std::move(stmtResult).value();
    if (auto r = stmt.bind(1, contentId); !r)
        return r.error();

    std::vector<Operation> ops;
    while (true) {
        auto row = stmt.step();
        if (!row)
            return row.error();
        if (!row.value())
            break;
        ops.push_back(readRow(stmt));
    }
    return ops;
}

Result<std::vector<PoisonedOperation>> SqliteOperationQueue::listPoisoned() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmtResult = db_.prepare("SELECT operation_json, queue_name, reason, poisoned_at "
                                  "FROM km_operations_poison ORDER BY poisoned_at");
    if (!stmtResult)
        return stmtResult.error();
    auto stmt = std::move(stmtResult).value();

    std::vector<PoisonedOperation> out;
    while (true) {
        auto row = stmt.step();
        if (!row)
            return row.error();
        if (!row.value())
            break;
        auto parsed = json::parse(stmt.getString(0), nullptr, false);
        if (parsed.is_discarded()) {
            spdlog::warn("[OperationQueue] Skipping unreadable poisoned operation");
            continue;
        }
        PoisonedOperation p;
        p.operation = operationFromJson(parsed);
        p.queue_name = stmt.getString(1);
        p.reason = stmt.getString(2);
        p.poisoned_at = core::fromEpochMillis(stmt.getInt64(3));
        out.push_back(std::move(p));
    }
    return out;
}

Result<int> SqliteOperationQueue::purgeCompleted(TimePoint olderThan) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmtResult =
        db_.prepare("DELETE FROM km_operations WHERE complete = 1 AND timestamp < ?");
    if (!stmtResult)
        return stmtResult.error();
    auto stmt = std::move(stmtResult).value();
    if (auto r = stmt.bind(1, core::toEpochMillis(olderThan)); !r)
        return r.error();
    if (auto r = stmt.execute(); !r)
        return r.error();
    return db_.changes();
}

} // namespace docmem::queue
