#pragma once

#include "db/idb_connection.hpp"
#include "db/iconnection_factory.hpp"
#include <libpq-fe.h>
#include <string>

namespace sqlpage {

/**
 * @brief PostgreSQL connection implementing IDbConnection
 *
 * Wraps PGconn* and provides database-agnostic interface.
 * All libpq calls are encapsulated here.
 */
class PgConnection : public IDbConnection {
public:
    static constexpr const char* kCopyNotSupported = "COPY is not supported";

    /**
     * @brief Construct from existing PGconn* (takes ownership)
     */
    explicit PgConnection(PGconn* conn);

    ~PgConnection() override;

    PgConnection(const PgConnection&) = delete;
    PgConnection& operator=(const PgConnection&) = delete;

    DbResultSet execute(const std::string& sql) override;
    DbResultSet execute_params(const std::string& sql,
                               const std::vector<std::string>& params) override;
    std::string probe(const std::string& health_check_query) override;
    bool is_connected() const override;
    void close() override;

    /**
     * @brief COPY results carry no rows or error text; they are rejected
     * with kCopyNotSupported and SQLSTATE 0A000
     */
    [[nodiscard]] static bool is_copy_status(ExecStatusType status);

private:
    /**
     * @brief Leave COPY mode so the connection can run the next statement
     */
    void end_copy(ExecStatusType status);

    /**
     * @brief Convert a PGresult into DbResultSet (takes ownership, clears res)
     */
    DbResultSet consume_result(PGresult* res);

    /**
     * @brief Process a SELECT result (PGRES_TUPLES_OK)
     */
    DbResultSet process_tuples_result(PGresult* res);

    /**
     * @brief Process a command result (PGRES_COMMAND_OK)
     */
    DbResultSet process_command_result(PGresult* res);

    PGconn* conn_;
};

/**
 * @brief PostgreSQL connection factory
 *
 * Creates PgConnection instances using PQconnectdbParams so that no
 * value needs conninfo quoting.
 */
class PgConnectionFactory : public IConnectionFactory {
public:
    Result<std::unique_ptr<IDbConnection>> create(const ConnectionConfig& config) override;
};

} // namespace sqlpage
