#include "executor/query_executor.hpp"
#include "executor/staged_result_codec.hpp"
#include "core/utils.hpp"
#include <format>

namespace sqlpage {

QueryExecutor::QueryExecutor(
    std::shared_ptr<ConnectionManager> manager,
    std::shared_ptr<ICacheStore> cache,
    const Config& config)
    : manager_(std::move(manager)),
      cache_(std::move(cache)),
      config_(config) {}

Result<ExecutionOutcome> QueryExecutor::execute(const std::string& sql) {
    return run(sql, nullptr);
}

Result<ExecutionOutcome> QueryExecutor::execute(const std::string& sql,
                                                const std::vector<std::string>& params) {
    return run(sql, &params);
}

Result<ExecutionOutcome> QueryExecutor::run(const std::string& sql,
                                            const std::vector<std::string>* params) {
    using Outcome = Result<ExecutionOutcome>;

    utils::Timer timer;
    DbResultSet db_result;
    bool handle_broken = false;
    {
        auto lease = manager_->active_handle();
        if (lease.is_error()) {
            return Outcome::propagate(lease);
        }

        statements_.fetch_add(1, std::memory_order_relaxed);
        utils::log::debug(std::format("Executing query: {}", sql));

        db_result = params ? lease.value()->execute_params(sql, *params)
                           : lease.value()->execute(sql);

        if (!db_result.success) {
            handle_broken = !lease.value().is_valid();
        }
    }

    if (!db_result.success) {
        failures_.fetch_add(1, std::memory_order_relaxed);
        utils::log::error(std::format("Error executing query: {}{}", db_result.error_message,
            db_result.sql_state.empty() ? "" : std::format(" (SQLSTATE {})", db_result.sql_state)));

        // Lease is released above; invalidate() waits on the exec mutex
        if (handle_broken) {
            manager_->invalidate(db_result.error_message);
        }
        return Outcome::error(ErrorKind::EXECUTION_FAILED,
            std::move(db_result.error_message), std::move(db_result.sql_state));
    }

    const size_t row_count = db_result.rows.size();
    utils::log::debug(std::format("Query returned {} rows in {}us",
        row_count, timer.elapsed_us().count()));

    if (row_count > config_.large_result_threshold) {
        return stage(std::move(db_result.fields), std::move(db_result.rows));
    }

    ExecutionOutcome outcome;
    outcome.is_large_result = false;
    outcome.row_count = row_count;
    outcome.fields = std::move(db_result.fields);
    outcome.rows = std::move(db_result.rows);
    outcome.affected_rows = db_result.affected_rows;
    return Outcome::ok(std::move(outcome));
}

Result<ExecutionOutcome> QueryExecutor::stage(std::vector<FieldDescriptor> fields,
                                              std::vector<Row> rows) {
    using Outcome = Result<ExecutionOutcome>;

    ExecutionOutcome outcome;
    outcome.is_large_result = true;
    outcome.identifier = next_identifier();
    outcome.row_count = rows.size();

    StagedResultSet staged{std::move(fields), std::move(rows)};
    const std::string blob = StagedResultCodec::encode(staged);

    auto stored = cache_->set(staged_result_key(outcome.identifier), blob, config_.staged_ttl);
    if (stored.is_error()) {
        utils::log::error(std::format("Failed to stage result {}: {}",
            outcome.identifier, stored.error_message()));
        return Outcome::propagate(stored);
    }

    staged_results_.fetch_add(1, std::memory_order_relaxed);
    utils::log::info(std::format("Staged {} rows as query:{} ({} bytes, {} backend)",
        outcome.row_count, outcome.identifier, blob.size(), cache_->backend_name()));

    outcome.fields = std::move(staged.fields);
    return Outcome::ok(std::move(outcome));
}

std::string QueryExecutor::next_identifier() {
    const int64_t now_ms = utils::unix_millis(utils::now());
    int64_t last = last_identifier_.load(std::memory_order_relaxed);
    int64_t next;
    do {
        next = (now_ms > last) ? now_ms : last + 1;
    } while (!last_identifier_.compare_exchange_weak(last, next, std::memory_order_relaxed));
    return std::to_string(next);
}

QueryExecutor::Stats QueryExecutor::get_stats() const {
    return {
        .statements = statements_.load(std::memory_order_relaxed),
        .failures = failures_.load(std::memory_order_relaxed),
        .staged_results = staged_results_.load(std::memory_order_relaxed),
    };
}

} // namespace sqlpage
