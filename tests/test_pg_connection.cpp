#include <catch2/catch_test_macros.hpp>
#include "db/postgresql/pg_connection.hpp"

using namespace sqlpage;

TEST_CASE("PgConnection: COPY statuses are recognised", "[pg]") {
    CHECK(PgConnection::is_copy_status(PGRES_COPY_IN));
    CHECK(PgConnection::is_copy_status(PGRES_COPY_OUT));
    CHECK(PgConnection::is_copy_status(PGRES_COPY_BOTH));

    CHECK_FALSE(PgConnection::is_copy_status(PGRES_TUPLES_OK));
    CHECK_FALSE(PgConnection::is_copy_status(PGRES_COMMAND_OK));
    CHECK_FALSE(PgConnection::is_copy_status(PGRES_FATAL_ERROR));
    CHECK(std::string(PgConnection::kCopyNotSupported) == "COPY is not supported");
}

TEST_CASE("PgConnection: null handle reports an error without calling libpq", "[pg]") {
    PgConnection conn(nullptr);

    CHECK_FALSE(conn.is_connected());

    auto rs = conn.execute("COPY events TO STDOUT");
    CHECK_FALSE(rs.success);
    CHECK(rs.error_message == "Connection is null");

    auto params = conn.execute_params("SELECT $1", {"1"});
    CHECK_FALSE(params.success);

    CHECK(conn.probe("SELECT 1") == "Connection is null");
    conn.close();
}
