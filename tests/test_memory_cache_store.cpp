#include <catch2/catch_test_macros.hpp>
#include "cache/memory_cache_store.hpp"

#include <format>
#include <thread>
#include <vector>

using namespace sqlpage;

TEST_CASE("MemoryCacheStore: set then get returns value", "[cache]") {
    MemoryCacheStore store;

    REQUIRE(store.set("query:1", "payload", std::chrono::seconds(60)).is_ok());
    auto value = store.get("query:1");
    REQUIRE(value.is_ok());
    REQUIRE(value.value().has_value());
    CHECK(*value.value() == "payload");
    CHECK(store.get_stats().hits == 1);
}

TEST_CASE("MemoryCacheStore: miss returns nullopt", "[cache]") {
    MemoryCacheStore store;

    auto value = store.get("query:missing");
    REQUIRE(value.is_ok());
    CHECK_FALSE(value.value().has_value());
    CHECK(store.get_stats().misses == 1);
}

TEST_CASE("MemoryCacheStore: set replaces existing value", "[cache]") {
    MemoryCacheStore store;

    REQUIRE(store.set("k", "one", std::chrono::seconds(60)).is_ok());
    REQUIRE(store.set("k", "two", std::chrono::seconds(60)).is_ok());
    CHECK(*store.get("k").value() == "two");
    CHECK(store.get_stats().current_entries == 1);
}

TEST_CASE("MemoryCacheStore: TTL expiry", "[cache]") {
    MemoryCacheStore store;

    REQUIRE(store.set("k", "v", std::chrono::seconds(0)).is_ok());  // Expire immediately
    std::this_thread::sleep_for(std::chrono::milliseconds(10));

    CHECK_FALSE(store.get("k").value().has_value());
    CHECK(store.get_stats().expirations == 1);
    CHECK(store.get_stats().current_entries == 0);
}

TEST_CASE("MemoryCacheStore: del removes entry and tolerates missing keys", "[cache]") {
    MemoryCacheStore store;

    REQUIRE(store.set("k", "v", std::chrono::seconds(60)).is_ok());
    REQUIRE(store.del("k").is_ok());
    CHECK_FALSE(store.get("k").value().has_value());
    CHECK(store.del("k").is_ok());
    CHECK(store.del("never-set").is_ok());
}

TEST_CASE("MemoryCacheStore: LRU eviction at capacity", "[cache]") {
    MemoryCacheStore::Config cfg;
    cfg.max_entries = 2;
    cfg.num_shards = 1;
    MemoryCacheStore store(cfg);

    REQUIRE(store.set("a", "1", std::chrono::seconds(60)).is_ok());
    REQUIRE(store.set("b", "2", std::chrono::seconds(60)).is_ok());
    CHECK(store.get("a").value().has_value());      // a becomes most recently used
    REQUIRE(store.set("c", "3", std::chrono::seconds(60)).is_ok());

    CHECK(store.get("a").value().has_value());
    CHECK_FALSE(store.get("b").value().has_value());
    CHECK(store.get("c").value().has_value());
    CHECK(store.get_stats().evictions == 1);
}

TEST_CASE("MemoryCacheStore: concurrent writers and readers", "[cache][concurrency]") {
    MemoryCacheStore::Config cfg;
    cfg.max_entries = 4096;
    cfg.num_shards = 8;
    MemoryCacheStore store(cfg);

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&store, t] {
            for (int i = 0; i < 200; ++i) {
                const auto key = std::format("query:{}-{}", t, i);
                (void)store.set(key, "v", std::chrono::seconds(60));
                (void)store.get(key);
            }
        });
    }
    for (auto& th : threads) th.join();

    CHECK(store.get_stats().current_entries == 800);
    CHECK(store.get_stats().hits == 800);
}
