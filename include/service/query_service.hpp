#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "db/connection_manager.hpp"
#include "executor/query_executor.hpp"
#include "executor/result_pager.hpp"
#include <memory>
#include <string>

namespace sqlpage {

/**
 * @brief Facade composing connection manager, executor and pager
 *
 * Every database operation runs one ensure_connected() guard first; its
 * failure is returned unchanged. Paging and release only touch the cache
 * and skip the guard. No operation turns an error into a default value.
 */
class QueryService {
public:
    QueryService(
        std::shared_ptr<ConnectionManager> manager,
        std::shared_ptr<QueryExecutor> executor,
        std::shared_ptr<ResultPager> pager);

    /**
     * @brief Connect lazily if not connected
     */
    [[nodiscard]] Status ensure_connected();

    /**
     * @brief List tables of the public schema, ordered by name
     */
    [[nodiscard]] Result<ExecutionOutcome> get_tables();

    /**
     * @brief Schemas (system schemas excluded) with their table counts and names
     *
     * Two statements per schema, run sequentially.
     */
    [[nodiscard]] Result<SchemaInfo> get_schema_info();

    /**
     * @brief Run user SQL verbatim
     * @return INVALID_QUERY for empty or blank SQL
     */
    [[nodiscard]] Result<ExecutionOutcome> execute_query(const std::string& sql);

    [[nodiscard]] Result<PageResponse> get_query_page(const std::string& identifier,
                                                      int64_t page_index);

    [[nodiscard]] Status release_query(const std::string& identifier);

    Status disconnect();

    [[nodiscard]] HealthStatus health_check();

    [[nodiscard]] ConnectionState connection_state() const { return manager_->state(); }

private:
    /**
     * @brief First column of an outcome, reading staged pages if necessary
     */
    Result<std::vector<std::string>> first_column(const ExecutionOutcome& outcome);

    std::shared_ptr<ConnectionManager> manager_;
    std::shared_ptr<QueryExecutor> executor_;
    std::shared_ptr<ResultPager> pager_;
};

} // namespace sqlpage
