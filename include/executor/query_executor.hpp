#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "cache/icache_store.hpp"
#include "db/connection_manager.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace sqlpage {

/**
 * @brief Query executor - runs SQL on the managed connection
 *
 * Applies the size policy to every result:
 * - row_count <= threshold: rows returned inline
 * - row_count >  threshold: rows staged in the cache under query:{id},
 *   only the identifier, row count and fields are returned
 *
 * Statements run verbatim (no rewriting, no binding). Driver errors are
 * passed through as EXECUTION_FAILED with the SQLSTATE in error_detail and
 * are never retried here.
 */
class QueryExecutor {
public:
    /**
     * @brief Configuration for query executor
     */
    struct Config {
        size_t large_result_threshold;      // Staged when row count exceeds this
        std::chrono::seconds staged_ttl;    // Lifetime of a staged result

        Config()
            : large_result_threshold(kDefaultLargeResultThreshold),
              staged_ttl(kStagedResultTtl) {}
    };

    /**
     * @brief Construct executor
     * @param manager Owner of the connection handle
     * @param cache Store for staged results
     * @param config Executor configuration
     */
    QueryExecutor(
        std::shared_ptr<ConnectionManager> manager,
        std::shared_ptr<ICacheStore> cache,
        const Config& config = Config()
    );

    /**
     * @brief Execute SQL verbatim on the active connection
     * @return NOT_CONNECTED, EXECUTION_FAILED or CACHE_UNAVAILABLE on failure
     */
    [[nodiscard]] Result<ExecutionOutcome> execute(const std::string& sql);

    /**
     * @brief Execute a fixed statement with positional parameters
     *
     * Only used for built-in introspection statements; user SQL goes
     * through execute(sql).
     */
    [[nodiscard]] Result<ExecutionOutcome> execute(const std::string& sql,
                                                   const std::vector<std::string>& params);

    /**
     * @brief Next staging identifier (decimal epoch milliseconds)
     *
     * Strictly increasing within the process: a call landing in the same
     * millisecond as the previous one gets the previous value + 1.
     */
    [[nodiscard]] std::string next_identifier();

    [[nodiscard]] const Config& config() const { return config_; }

    struct Stats {
        uint64_t statements;
        uint64_t failures;
        uint64_t staged_results;
    };
    [[nodiscard]] Stats get_stats() const;

private:
    Result<ExecutionOutcome> run(const std::string& sql,
                                 const std::vector<std::string>* params);

    /**
     * @brief Serialize rows and fields into the cache
     */
    Result<ExecutionOutcome> stage(std::vector<FieldDescriptor> fields,
                                   std::vector<Row> rows);

    std::shared_ptr<ConnectionManager> manager_;
    std::shared_ptr<ICacheStore> cache_;
    Config config_;

    std::atomic<int64_t> last_identifier_{0};

    std::atomic<uint64_t> statements_{0};
    std::atomic<uint64_t> failures_{0};
    std::atomic<uint64_t> staged_results_{0};
};

} // namespace sqlpage
