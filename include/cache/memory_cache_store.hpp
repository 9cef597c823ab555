#pragma once

#include "cache/icache_store.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace sqlpage {

/**
 * @brief In-process TTL cache store
 *
 * Sharded by key hash; each shard is an LRU list bounded by
 * max_entries / num_shards. Used for single-node deployments without Redis
 * and as the store in tests.
 */
class MemoryCacheStore : public ICacheStore {
public:
    struct Config {
        size_t max_entries = 1024;
        size_t num_shards = 16;
    };

    MemoryCacheStore() : MemoryCacheStore(Config{}) {}
    explicit MemoryCacheStore(const Config& config);

    Status set(const std::string& key, const std::string& value,
               std::chrono::seconds ttl) override;
    Result<std::optional<std::string>> get(const std::string& key) override;
    Status del(const std::string& key) override;
    const char* backend_name() const override { return "memory"; }

    struct Stats {
        uint64_t hits;
        uint64_t misses;
        uint64_t evictions;
        uint64_t expirations;
        size_t current_entries;
    };
    [[nodiscard]] Stats get_stats() const;

private:
    struct CacheEntry {
        std::string key;
        std::string value;
        std::chrono::steady_clock::time_point expires_at;
    };

    class Shard {
    public:
        explicit Shard(size_t max_entries) : max_entries_(max_entries) {}

        std::optional<std::string> get(const std::string& key);
        void put(const std::string& key, std::string value,
                 std::chrono::steady_clock::time_point expires_at);
        bool erase(const std::string& key);
        size_t size() const;

        std::atomic<uint64_t> evictions{0};
        std::atomic<uint64_t> expirations{0};

    private:
        mutable std::mutex mutex_;
        size_t max_entries_;
        std::list<CacheEntry> lru_list_;
        std::unordered_map<std::string, std::list<CacheEntry>::iterator> map_;
    };

    size_t select_shard(const std::string& key) const;

    Config config_;
    std::vector<std::unique_ptr<Shard>> shards_;
    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
};

} // namespace sqlpage
