#include <catch2/catch_test_macros.hpp>
#include "db/postgresql/pg_type_map.hpp"

using namespace sqlpage;

TEST_CASE("PgTypeMap: built-in OIDs resolve to catalog names", "[pg]") {
    CHECK(PgTypeMap::oid_to_type_name(23) == "int4");
    CHECK(PgTypeMap::oid_to_type_name(25) == "text");
    CHECK(PgTypeMap::oid_to_type_name(1043) == "varchar");
    CHECK(PgTypeMap::oid_to_type_name(1184) == "timestamptz");
    CHECK(PgTypeMap::oid_to_type_name(3802) == "jsonb");
}

TEST_CASE("PgTypeMap: unknown OID is empty", "[pg]") {
    CHECK(PgTypeMap::oid_to_type_name(0).empty());
    CHECK(PgTypeMap::oid_to_type_name(999999).empty());
}
