#pragma once

#include "core/types.hpp"
#include <string>
#include <vector>
#include <cstdint>
#include <memory>

namespace sqlpage {

/**
 * @brief Result set from a query execution
 *
 * Returned by IDbConnection::execute().
 * Owns the result data (copied from native result handles).
 */
struct DbResultSet {
    bool success = false;
    std::string error_message;
    std::string sql_state;          // Five-character SQLSTATE when the backend reports one

    // For SELECT
    std::vector<FieldDescriptor> fields;
    std::vector<Row> rows;

    // For DML
    uint64_t affected_rows = 0;

    // SELECT vs DML/DDL
    bool has_rows = false;
};

/**
 * @brief Abstract database connection
 *
 * Wraps a single native connection handle (PGconn*).
 * Implementations are not thread-safe; ConnectionManager serializes access
 * through ConnectionLease.
 *
 * Does NOT expose native handles to prevent leaking backend types.
 */
class IDbConnection {
public:
    virtual ~IDbConnection() = default;

    /**
     * @brief Execute a SQL statement verbatim
     * @param sql SQL text
     * @return Result set with rows or affected count
     */
    [[nodiscard]] virtual DbResultSet execute(const std::string& sql) = 0;

    /**
     * @brief Execute a statement with positional parameters ($1, $2, ...)
     */
    [[nodiscard]] virtual DbResultSet execute_params(
        const std::string& sql, const std::vector<std::string>& params) = 0;

    /**
     * @brief Run the liveness probe
     * @param health_check_query SQL to run (e.g., "SELECT 1")
     * @return empty string if usable, otherwise the failure reason
     */
    [[nodiscard]] virtual std::string probe(const std::string& health_check_query) = 0;

    /**
     * @brief Check if connection is in a valid state (connected)
     */
    [[nodiscard]] virtual bool is_connected() const = 0;

    /**
     * @brief Close the connection and release resources
     */
    virtual void close() = 0;
};

} // namespace sqlpage
