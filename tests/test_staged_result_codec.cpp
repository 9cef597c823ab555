#include <catch2/catch_test_macros.hpp>
#include "executor/staged_result_codec.hpp"

using namespace sqlpage;

TEST_CASE("StagedResultCodec: key uses the query: prefix", "[codec]") {
    CHECK(staged_result_key("1700000000000") == "query:1700000000000");
}

TEST_CASE("StagedResultCodec: encode layout", "[codec]") {
    StagedResultSet staged;
    staged.fields = {FieldDescriptor("id", "int4"), FieldDescriptor("note")};
    staged.rows = {Row{"1", std::nullopt}};

    CHECK(StagedResultCodec::encode(staged) ==
        R"({"version":1,"fields":[{"name":"id","dataType":"int4"},{"name":"note","dataType":""}],"rows":[["1",null]]})");
}

TEST_CASE("StagedResultCodec: decode preserves NULLs, escapes and duplicate names", "[codec]") {
    StagedResultSet staged;
    staged.fields = {FieldDescriptor("id", "int4"), FieldDescriptor("id", "int4"),
                     FieldDescriptor("text", "text")};
    staged.rows = {
        Row{"1", "2", "say \"hi\"\nback\\slash\ttab"},
        Row{"3", std::nullopt, ""},
        Row{"4", "5", "caf\xC3\xA9"},
    };

    auto decoded = StagedResultCodec::decode(StagedResultCodec::encode(staged));
    REQUIRE(decoded.is_ok());
    CHECK(decoded.value().fields == staged.fields);
    REQUIRE(decoded.value().rows.size() == 3);
    CHECK(decoded.value().rows[0][2] == CellValue("say \"hi\"\nback\\slash\ttab"));
    CHECK_FALSE(decoded.value().rows[1][1].has_value());
    CHECK(decoded.value().rows[1][2] == CellValue(""));
    CHECK(decoded.value().rows[2][2] == CellValue("caf\xC3\xA9"));
}

TEST_CASE("StagedResultCodec: missing dataType is accepted", "[codec]") {
    auto decoded = StagedResultCodec::decode(
        R"({"version":1,"fields":[{"name":"a"}],"rows":[["x"]]})");
    REQUIRE(decoded.is_ok());
    CHECK(decoded.value().fields[0].data_type.empty());
}

TEST_CASE("StagedResultCodec: malformed documents are corrupt", "[codec][errors]") {
    const char* documents[] = {
        "",
        "{not json",
        "[]",
        R"({"fields":[],"rows":[]})",
        R"({"version":2,"fields":[],"rows":[]})",
        R"({"version":"1","fields":[],"rows":[]})",
        R"({"version":1,"rows":[]})",
        R"({"version":1,"fields":{},"rows":[]})",
        R"({"version":1,"fields":[],"rows":{}})",
        R"({"version":1,"fields":[{"type":"int4"}],"rows":[]})",
        R"({"version":1,"fields":["a"],"rows":[]})",
        R"({"version":1,"fields":[{"name":"a","dataType":7}],"rows":[]})",
        R"({"version":1,"fields":[{"name":"a"}],"rows":[["1","2"]]})",
        R"({"version":1,"fields":[{"name":"a"}],"rows":[[]]})",
        R"({"version":1,"fields":[{"name":"a"}],"rows":[[1]]})",
        R"({"version":1,"fields":[{"name":"a"}],"rows":[{"a":"1"}]})",
    };

    for (const char* doc : documents) {
        INFO(doc);
        auto decoded = StagedResultCodec::decode(doc);
        REQUIRE(decoded.is_error());
        CHECK(decoded.error_kind() == ErrorKind::STAGED_RESULT_CORRUPT);
    }
}
