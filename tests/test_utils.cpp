#include <catch2/catch_test_macros.hpp>
#include "core/utils.hpp"

using namespace sqlpage;

TEST_CASE("Utils: to_lower folds ASCII only", "[utils]") {
    CHECK(utils::to_lower("Memory") == "memory");
    CHECK(utils::to_lower("REDIS_01") == "redis_01");
    CHECK(utils::to_lower("") == "");
    CHECK(utils::to_lower("caf\xC3\x89") == "caf\xC3\x89");
}

TEST_CASE("Utils: trim strips surrounding whitespace", "[utils]") {
    CHECK(utils::trim("  SELECT 1\n") == "SELECT 1");
    CHECK(utils::trim("\t\r\n ").empty());
    CHECK(utils::trim("x") == "x");
}

TEST_CASE("Utils: try_parse_int rejects trailing garbage", "[utils]") {
    CHECK(utils::try_parse_int<uint32_t>("42") == 42u);
    CHECK_FALSE(utils::try_parse_int<uint32_t>("42abc").has_value());
    CHECK_FALSE(utils::try_parse_int<uint32_t>("4294967296").has_value());
    CHECK(utils::try_parse_int<int64_t>("-1") == -1);
}

TEST_CASE("Utils: escape_json escapes quotes and control characters", "[utils]") {
    CHECK(utils::escape_json("a\"b\\c") == R"(a\"b\\c)");
    CHECK(utils::escape_json("line\nnext") == R"(line\nnext)");
    CHECK(utils::escape_json(std::string("\x01", 1)) == R"(\u0001)");
}
