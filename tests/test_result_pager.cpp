#include <catch2/catch_test_macros.hpp>
#include "executor/result_pager.hpp"
#include "executor/staged_result_codec.hpp"
#include "mocks/mock_cache_store.hpp"

#include <string>
#include <vector>

using namespace sqlpage;
using namespace sqlpage::testing;

namespace {

StagedResultSet make_staged(size_t n) {
    StagedResultSet staged;
    staged.fields = {FieldDescriptor("id", "int4"), FieldDescriptor("payload", "text")};
    for (size_t i = 1; i <= n; ++i) {
        staged.rows.push_back(Row{std::to_string(i), "p" + std::to_string(i)});
    }
    return staged;
}

void stage(ICacheStore& cache, const std::string& id, size_t n) {
    REQUIRE(cache.set(staged_result_key(id), StagedResultCodec::encode(make_staged(n)),
                      std::chrono::seconds(3600)).is_ok());
}

} // anonymous namespace

TEST_CASE("ResultPager: first page of 1500 rows", "[pager]") {
    auto cache = std::make_shared<MemoryCacheStore>();
    stage(*cache, "1700000000000", 1500);
    ResultPager pager(cache);

    auto page = pager.get_page("1700000000000", 0);
    REQUIRE(page.is_ok());
    const auto& p = page.value();
    REQUIRE(p.rows.size() == 100);
    CHECK(p.rows.front()[0] == CellValue("1"));
    CHECK(p.rows.back()[0] == CellValue("100"));
    CHECK(p.fields.size() == 2);
    CHECK(p.fields[1].name == "payload");

    CHECK(p.metadata.total_rows == 1500);
    CHECK(p.metadata.total_pages == 15);
    CHECK(p.metadata.page_size == 100);
    CHECK(p.metadata.current_page == 0);
    CHECK(p.metadata.has_next_page);
    CHECK_FALSE(p.metadata.has_previous_page);
}

TEST_CASE("ResultPager: last page of 1500 rows", "[pager]") {
    auto cache = std::make_shared<MemoryCacheStore>();
    stage(*cache, "42", 1500);
    ResultPager pager(cache);

    auto page = pager.get_page("42", 14);
    REQUIRE(page.is_ok());
    const auto& p = page.value();
    REQUIRE(p.rows.size() == 100);
    CHECK(p.rows.front()[0] == CellValue("1401"));
    CHECK(p.rows.back()[0] == CellValue("1500"));
    CHECK(p.metadata.current_page == 14);
    CHECK_FALSE(p.metadata.has_next_page);
    CHECK(p.metadata.has_previous_page);
}

TEST_CASE("ResultPager: pages reproduce every row exactly once", "[pager]") {
    for (size_t n : {size_t{1}, size_t{99}, size_t{100}, size_t{101}, size_t{250}, size_t{1001}}) {
        auto cache = std::make_shared<MemoryCacheStore>();
        stage(*cache, "7", n);
        ResultPager pager(cache);

        auto first = pager.get_page("7", 0);
        REQUIRE(first.is_ok());
        const size_t total_pages = first.value().metadata.total_pages;
        CHECK(total_pages == (n + 99) / 100);

        std::vector<std::string> seen;
        for (size_t page = 0; page < total_pages; ++page) {
            auto slice = pager.get_page("7", static_cast<int64_t>(page));
            REQUIRE(slice.is_ok());
            for (const auto& row : slice.value().rows) {
                seen.push_back(*row[0]);
            }
            if (page + 1 == total_pages) {
                const size_t expected_last = (n % 100 == 0) ? 100 : n % 100;
                CHECK(slice.value().rows.size() == expected_last);
                CHECK_FALSE(slice.value().metadata.has_next_page);
            }
        }

        REQUIRE(seen.size() == n);
        for (size_t i = 0; i < n; ++i) {
            CHECK(seen[i] == std::to_string(i + 1));
        }
    }
}

TEST_CASE("ResultPager: page past the end is empty, not an error", "[pager]") {
    auto cache = std::make_shared<MemoryCacheStore>();
    stage(*cache, "42", 1500);
    ResultPager pager(cache);

    auto page = pager.get_page("42", 15);
    REQUIRE(page.is_ok());
    CHECK(page.value().rows.empty());
    CHECK_FALSE(page.value().metadata.has_next_page);
    CHECK(page.value().metadata.has_previous_page);
    CHECK(page.value().metadata.total_rows == 1500);
    CHECK(page.value().fields.size() == 2);
}

TEST_CASE("ResultPager: empty staged result", "[pager]") {
    auto cache = std::make_shared<MemoryCacheStore>();
    stage(*cache, "0", 0);
    ResultPager pager(cache);

    auto page = pager.get_page("0", 0);
    REQUIRE(page.is_ok());
    CHECK(page.value().rows.empty());
    CHECK(page.value().metadata.total_pages == 0);
    CHECK_FALSE(page.value().metadata.has_next_page);
    CHECK_FALSE(page.value().metadata.has_previous_page);
}

TEST_CASE("ResultPager: unknown identifier is RESULT_NOT_FOUND", "[pager][errors]") {
    auto cache = std::make_shared<MemoryCacheStore>();
    ResultPager pager(cache);

    auto page = pager.get_page("nonexistent", 0);
    REQUIRE(page.is_error());
    CHECK(page.error_kind() == ErrorKind::RESULT_NOT_FOUND);

    auto empty = pager.get_page("", 0);
    CHECK(empty.error_kind() == ErrorKind::RESULT_NOT_FOUND);
    CHECK(cache->get_stats().misses == 1);
}

TEST_CASE("ResultPager: negative page index is rejected", "[pager][errors]") {
    auto cache = std::make_shared<MemoryCacheStore>();
    stage(*cache, "42", 10);
    ResultPager pager(cache);

    auto page = pager.get_page("42", -1);
    REQUIRE(page.is_error());
    CHECK(page.error_kind() == ErrorKind::INVALID_PAGE_INDEX);

    auto huge = pager.get_page("42", int64_t{1} << 40);
    CHECK(huge.error_kind() == ErrorKind::INVALID_PAGE_INDEX);
}

TEST_CASE("ResultPager: corrupt blob is STAGED_RESULT_CORRUPT", "[pager][errors]") {
    auto cache = std::make_shared<MemoryCacheStore>();
    REQUIRE(cache->set(staged_result_key("9"), "{not json", std::chrono::seconds(60)).is_ok());
    ResultPager pager(cache);

    auto page = pager.get_page("9", 0);
    REQUIRE(page.is_error());
    CHECK(page.error_kind() == ErrorKind::STAGED_RESULT_CORRUPT);
}

TEST_CASE("ResultPager: cache failure is CACHE_UNAVAILABLE", "[pager][errors]") {
    auto cache = std::make_shared<FlakyCacheStore>();
    cache->fail_get = true;
    ResultPager pager(cache);

    auto page = pager.get_page("42", 0);
    REQUIRE(page.is_error());
    CHECK(page.error_kind() == ErrorKind::CACHE_UNAVAILABLE);
}

TEST_CASE("ResultPager: expired result is RESULT_NOT_FOUND", "[pager]") {
    auto cache = std::make_shared<MemoryCacheStore>();
    REQUIRE(cache->set(staged_result_key("5"), StagedResultCodec::encode(make_staged(3)),
                       std::chrono::seconds(0)).is_ok());
    ResultPager pager(cache);

    CHECK(pager.get_page("5", 0).error_kind() == ErrorKind::RESULT_NOT_FOUND);
}

TEST_CASE("ResultPager: evict removes the staged result", "[pager]") {
    auto cache = std::make_shared<MemoryCacheStore>();
    stage(*cache, "42", 150);
    ResultPager pager(cache);

    REQUIRE(pager.get_page("42", 1).is_ok());
    REQUIRE(pager.evict("42").is_ok());
    CHECK(pager.get_page("42", 0).error_kind() == ErrorKind::RESULT_NOT_FOUND);

    // Idempotent
    CHECK(pager.evict("42").is_ok());
    CHECK(pager.evict("never-staged").is_ok());
}

TEST_CASE("ResultPager: evict reports cache failure", "[pager][errors]") {
    auto cache = std::make_shared<FlakyCacheStore>();
    cache->fail_del = true;
    ResultPager pager(cache);

    CHECK(pager.evict("42").error_kind() == ErrorKind::CACHE_UNAVAILABLE);
}

TEST_CASE("ResultPager: parse_page_index", "[pager]") {
    SECTION("accepts decimal digits") {
        CHECK(ResultPager::parse_page_index("0").value() == 0);
        CHECK(ResultPager::parse_page_index("14").value() == 14);
        CHECK(ResultPager::parse_page_index("4294967295").value() == 4294967295u);
    }

    SECTION("rejects everything else") {
        for (const char* text : {"", "-1", "+1", "abc", "1.5", " 1", "1 ", "0x10", "4294967296"}) {
            auto parsed = ResultPager::parse_page_index(text);
            INFO(text);
            REQUIRE(parsed.is_error());
            CHECK(parsed.error_kind() == ErrorKind::INVALID_PAGE_INDEX);
        }
    }
}
