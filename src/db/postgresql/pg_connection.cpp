#include "db/postgresql/pg_connection.hpp"
#include "db/postgresql/pg_type_map.hpp"
#include "core/utils.hpp"
#include <cstring>
#include <format>

namespace sqlpage {

namespace {

// libpq messages end with a newline; callers embed them in JSON and logs
std::string clean_message(const char* msg) {
    if (!msg) return {};
    return utils::trim(msg);
}

DbResultSet make_error(std::string message, std::string sql_state = {}) {
    DbResultSet rs;
    rs.success = false;
    rs.error_message = std::move(message);
    rs.sql_state = std::move(sql_state);
    return rs;
}

} // anonymous namespace

// ============================================================================
// PgConnection
// ============================================================================

PgConnection::PgConnection(PGconn* conn)
    : conn_(conn) {}

PgConnection::~PgConnection() {
    close();
}

DbResultSet PgConnection::execute(const std::string& sql) {
    if (!conn_) {
        return make_error("Connection is null");
    }

    return consume_result(PQexec(conn_, sql.c_str()));
}

DbResultSet PgConnection::execute_params(const std::string& sql,
                                         const std::vector<std::string>& params) {
    if (!conn_) {
        return make_error("Connection is null");
    }

    std::vector<const char*> values;
    values.reserve(params.size());
    for (const auto& p : params) {
        values.push_back(p.c_str());
    }

    PGresult* res = PQexecParams(conn_, sql.c_str(),
        static_cast<int>(values.size()),
        nullptr,            // let the server infer parameter types
        values.data(),
        nullptr, nullptr,   // text format
        0);
    return consume_result(res);
}

std::string PgConnection::probe(const std::string& health_check_query) {
    if (!conn_) {
        return "Connection is null";
    }

    if (PQstatus(conn_) != CONNECTION_OK) {
        return clean_message(PQerrorMessage(conn_));
    }

    PGresult* res = PQexec(conn_, health_check_query.c_str());
    if (!res) {
        return clean_message(PQerrorMessage(conn_));
    }

    const ExecStatusType status = PQresultStatus(res);
    std::string reason;
    if (status != PGRES_TUPLES_OK && status != PGRES_COMMAND_OK) {
        reason = clean_message(PQresultErrorMessage(res));
        if (reason.empty()) reason = PQresStatus(status);
    }
    PQclear(res);
    return reason;
}

bool PgConnection::is_connected() const {
    return conn_ != nullptr && PQstatus(conn_) == CONNECTION_OK;
}

void PgConnection::close() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

DbResultSet PgConnection::consume_result(PGresult* res) {
    if (!res) {
        return make_error(clean_message(PQerrorMessage(conn_)));
    }

    const ExecStatusType status = PQresultStatus(res);

    if (status == PGRES_TUPLES_OK) {
        auto result = process_tuples_result(res);
        PQclear(res);
        return result;
    }

    if (status == PGRES_COMMAND_OK || status == PGRES_EMPTY_QUERY) {
        auto result = process_command_result(res);
        PQclear(res);
        return result;
    }

    if (is_copy_status(status)) {
        PQclear(res);
        end_copy(status);
        return make_error(kCopyNotSupported, "0A000");
    }

    // Error case: keep the server's message and SQLSTATE verbatim
    std::string error = clean_message(PQresultErrorMessage(res));
    if (error.empty()) error = clean_message(PQerrorMessage(conn_));
    const char* state = PQresultErrorField(res, PG_DIAG_SQLSTATE);
    std::string sql_state = state ? state : "";
    PQclear(res);
    return make_error(std::move(error), std::move(sql_state));
}

bool PgConnection::is_copy_status(ExecStatusType status) {
    return status == PGRES_COPY_IN || status == PGRES_COPY_OUT || status == PGRES_COPY_BOTH;
}

void PgConnection::end_copy(ExecStatusType status) {
    if (status == PGRES_COPY_IN) {
        PQputCopyEnd(conn_, kCopyNotSupported);
    } else if (status == PGRES_COPY_OUT) {
        char* buffer = nullptr;
        while (PQgetCopyData(conn_, &buffer, 0) > 0) {
            PQfreemem(buffer);
            buffer = nullptr;
        }
    } else {
        // Replication COPY BOTH has no clean exit; drop the connection
        close();
        return;
    }

    while (PGresult* rest = PQgetResult(conn_)) {
        PQclear(rest);
    }
}

DbResultSet PgConnection::process_tuples_result(PGresult* res) {
    DbResultSet result;
    result.success = true;
    result.has_rows = true;

    const int ncols = PQnfields(res);
    result.fields.reserve(ncols);
    for (int i = 0; i < ncols; i++) {
        const Oid type_oid = PQftype(res, i);
        result.fields.emplace_back(PQfname(res, i),
            PgTypeMap::oid_to_type_name(static_cast<uint32_t>(type_oid)));
    }

    const int nrows = PQntuples(res);
    result.rows.reserve(nrows);

    for (int i = 0; i < nrows; i++) {
        Row row;
        row.reserve(ncols);
        for (int j = 0; j < ncols; j++) {
            if (PQgetisnull(res, i, j)) {
                row.emplace_back(std::nullopt);
            } else {
                row.emplace_back(std::string(PQgetvalue(res, i, j),
                    static_cast<size_t>(PQgetlength(res, i, j))));
            }
        }
        result.rows.push_back(std::move(row));
    }

    return result;
}

DbResultSet PgConnection::process_command_result(PGresult* res) {
    DbResultSet result;
    result.success = true;
    result.has_rows = false;

    const char* affected = PQcmdTuples(res);
    if (affected && std::strlen(affected) > 0) {
        result.affected_rows = utils::try_parse_int<uint64_t>(affected).value_or(0);
    }

    return result;
}

// ============================================================================
// PgConnectionFactory
// ============================================================================

Result<std::unique_ptr<IDbConnection>> PgConnectionFactory::create(
    const ConnectionConfig& config) {

    const std::string port = std::to_string(config.port);
    const std::string timeout = std::to_string(config.connect_timeout.count());

    std::vector<const char*> keywords;
    std::vector<const char*> values;
    auto add = [&](const char* key, const std::string& value) {
        if (!value.empty()) {
            keywords.push_back(key);
            values.push_back(value.c_str());
        }
    };
    add("host", config.host);
    add("port", port);
    add("dbname", config.database);
    add("user", config.user);
    add("password", config.password);
    add("connect_timeout", timeout);
    add("sslmode", config.sslmode);
    add("application_name", config.application_name);
    keywords.push_back(nullptr);
    values.push_back(nullptr);

    PGconn* conn = PQconnectdbParams(keywords.data(), values.data(), 0);

    if (!conn) {
        return Result<std::unique_ptr<IDbConnection>>::error(
            ErrorKind::NOT_CONNECTED, "Failed to allocate PGconn");
    }

    if (PQstatus(conn) != CONNECTION_OK) {
        std::string message = clean_message(PQerrorMessage(conn));
        PQfinish(conn);
        return Result<std::unique_ptr<IDbConnection>>::error(
            ErrorKind::NOT_CONNECTED, std::format("Failed to connect: {}", message));
    }

    return Result<std::unique_ptr<IDbConnection>>::ok(std::make_unique<PgConnection>(conn));
}

} // namespace sqlpage
