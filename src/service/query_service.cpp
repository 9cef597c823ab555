#include "service/query_service.hpp"
#include "core/utils.hpp"
#include <format>

namespace sqlpage {

namespace {

constexpr const char* kListTablesSql =
    "SELECT table_name FROM information_schema.tables "
    "WHERE table_schema = 'public' ORDER BY table_name";

constexpr const char* kListSchemasSql =
    "SELECT DISTINCT schema_name FROM information_schema.schemata "
    "WHERE schema_name NOT IN ('information_schema', 'pg_catalog', 'pg_toast') "
    "ORDER BY schema_name";

constexpr const char* kCountSchemaTablesSql =
    "SELECT COUNT(*) AS table_count FROM information_schema.tables "
    "WHERE table_schema = $1";

constexpr const char* kListSchemaTablesSql =
    "SELECT table_name FROM information_schema.tables "
    "WHERE table_schema = $1 ORDER BY table_name";

} // anonymous namespace

QueryService::QueryService(
    std::shared_ptr<ConnectionManager> manager,
    std::shared_ptr<QueryExecutor> executor,
    std::shared_ptr<ResultPager> pager)
    : manager_(std::move(manager)),
      executor_(std::move(executor)),
      pager_(std::move(pager)) {}

Status QueryService::ensure_connected() {
    if (manager_->is_connected()) {
        return Status::ok();
    }
    return manager_->connect();
}

Result<ExecutionOutcome> QueryService::get_tables() {
    if (auto connected = ensure_connected(); connected.is_error()) {
        return Result<ExecutionOutcome>::propagate(connected);
    }

    auto outcome = executor_->execute(kListTablesSql);
    if (outcome.is_ok()) {
        utils::log::debug(std::format("Tables fetched: {}", outcome.value().row_count));
    }
    return outcome;
}

Result<SchemaInfo> QueryService::get_schema_info() {
    using Info = Result<SchemaInfo>;

    if (auto connected = ensure_connected(); connected.is_error()) {
        return Info::propagate(connected);
    }

    auto schemas_outcome = executor_->execute(kListSchemasSql);
    if (schemas_outcome.is_error()) {
        return Info::propagate(schemas_outcome);
    }
    auto schemas = first_column(schemas_outcome.value());
    if (schemas.is_error()) {
        return Info::propagate(schemas);
    }

    // The schema listing is internal; drop it once read back
    if (schemas_outcome.value().is_large_result) {
        if (auto evicted = pager_->evict(schemas_outcome.value().identifier); evicted.is_error()) {
            utils::log::warn(std::format("Failed to evict schema listing: {}",
                evicted.error_message()));
        }
    }

    SchemaInfo info;
    info.schemas = std::move(schemas.value());
    info.details.reserve(info.schemas.size());

    for (const auto& schema : info.schemas) {
        const std::vector<std::string> params{schema};

        auto count = executor_->execute(kCountSchemaTablesSql, params);
        if (count.is_error()) {
            return Info::propagate(count);
        }
        const auto& count_rows = count.value().rows;
        if (count_rows.empty() || count_rows.front().empty() || !count_rows.front().front()) {
            return Info::error(ErrorKind::INTERNAL_ERROR,
                std::format("Table count query returned no value for schema {}", schema));
        }
        auto table_count = utils::try_parse_int<size_t>(*count_rows.front().front());
        if (!table_count) {
            return Info::error(ErrorKind::INTERNAL_ERROR,
                std::format("Unexpected table count '{}' for schema {}",
                    *count_rows.front().front(), schema));
        }

        auto tables = executor_->execute(kListSchemaTablesSql, params);
        if (tables.is_error()) {
            return Info::propagate(tables);
        }

        SchemaDetail detail;
        detail.table_count = *table_count;
        if (tables.value().is_large_result) {
            detail.staged_tables_id = tables.value().identifier;
        } else {
            for (const auto& row : tables.value().rows) {
                if (!row.empty() && row.front()) {
                    detail.tables.push_back(*row.front());
                }
            }
        }
        info.details.push_back(std::move(detail));
    }

    return Info::ok(std::move(info));
}

Result<ExecutionOutcome> QueryService::execute_query(const std::string& sql) {
    if (utils::trim(sql).empty()) {
        return Result<ExecutionOutcome>::error(ErrorKind::INVALID_QUERY,
            "SQL query is required");
    }

    if (auto connected = ensure_connected(); connected.is_error()) {
        return Result<ExecutionOutcome>::propagate(connected);
    }
    return executor_->execute(sql);
}

Result<PageResponse> QueryService::get_query_page(const std::string& identifier,
                                                  int64_t page_index) {
    return pager_->get_page(identifier, page_index);
}

Status QueryService::release_query(const std::string& identifier) {
    return pager_->evict(identifier);
}

Status QueryService::disconnect() {
    return manager_->disconnect();
}

HealthStatus QueryService::health_check() {
    return manager_->health_check();
}

Result<std::vector<std::string>> QueryService::first_column(const ExecutionOutcome& outcome) {
    using Column = Result<std::vector<std::string>>;

    std::vector<std::string> values;
    auto collect = [&values](const std::vector<Row>& rows) {
        for (const auto& row : rows) {
            if (!row.empty() && row.front()) {
                values.push_back(*row.front());
            }
        }
    };

    if (!outcome.is_large_result) {
        collect(outcome.rows);
        return Column::ok(std::move(values));
    }

    values.reserve(outcome.row_count);
    for (int64_t page = 0; ; ++page) {
        auto slice = pager_->get_page(outcome.identifier, page);
        if (slice.is_error()) {
            return Column::propagate(slice);
        }
        collect(slice.value().rows);
        if (!slice.value().metadata.has_next_page) {
            break;
        }
    }
    return Column::ok(std::move(values));
}

} // namespace sqlpage
