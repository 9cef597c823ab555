#include "cache/memory_cache_store.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <functional>

namespace sqlpage {

// ============================================================================
// MemoryCacheStore
// ============================================================================

MemoryCacheStore::MemoryCacheStore(const Config& config)
    : config_(config) {
    const size_t num_shards = std::max(config_.num_shards, size_t{1});
    const size_t per_shard = std::max(config_.max_entries / num_shards, size_t{1});
    shards_.reserve(num_shards);
    for (size_t i = 0; i < num_shards; ++i) {
        shards_.push_back(std::make_unique<Shard>(per_shard));
    }
}

size_t MemoryCacheStore::select_shard(const std::string& key) const {
    return std::hash<std::string>{}(key) % shards_.size();
}

Status MemoryCacheStore::set(const std::string& key, const std::string& value,
                             std::chrono::seconds ttl) {
    const auto expires = std::chrono::steady_clock::now() + ttl;
    shards_[select_shard(key)]->put(key, value, expires);
    utils::log::debug(std::format("Stored {} bytes in memory cache for key: {}", value.size(), key));
    return Status::ok();
}

Result<std::optional<std::string>> MemoryCacheStore::get(const std::string& key) {
    auto value = shards_[select_shard(key)]->get(key);
    if (value) {
        hits_.fetch_add(1, std::memory_order_relaxed);
    } else {
        misses_.fetch_add(1, std::memory_order_relaxed);
    }
    return Result<std::optional<std::string>>::ok(std::move(value));
}

Status MemoryCacheStore::del(const std::string& key) {
    shards_[select_shard(key)]->erase(key);
    return Status::ok();
}

MemoryCacheStore::Stats MemoryCacheStore::get_stats() const {
    size_t entries = 0;
    uint64_t evictions = 0;
    uint64_t expirations = 0;
    for (const auto& shard : shards_) {
        entries += shard->size();
        evictions += shard->evictions.load(std::memory_order_relaxed);
        expirations += shard->expirations.load(std::memory_order_relaxed);
    }
    return {
        .hits = hits_.load(std::memory_order_relaxed),
        .misses = misses_.load(std::memory_order_relaxed),
        .evictions = evictions,
        .expirations = expirations,
        .current_entries = entries,
    };
}

// ============================================================================
// Shard
// ============================================================================

std::optional<std::string> MemoryCacheStore::Shard::get(const std::string& key) {
    std::lock_guard lock(mutex_);
    auto it = map_.find(key);
    if (it == map_.end()) return std::nullopt;

    auto& entry = *it->second;

    // TTL check (lazy expiry)
    if (std::chrono::steady_clock::now() >= entry.expires_at) {
        lru_list_.erase(it->second);
        map_.erase(it);
        expirations.fetch_add(1, std::memory_order_relaxed);
        return std::nullopt;
    }

    // Move to front (most recently used)
    lru_list_.splice(lru_list_.begin(), lru_list_, it->second);
    return entry.value;
}

void MemoryCacheStore::Shard::put(
    const std::string& key, std::string value,
    std::chrono::steady_clock::time_point expires_at) {
    std::lock_guard lock(mutex_);

    auto it = map_.find(key);
    if (it != map_.end()) {
        it->second->value = std::move(value);
        it->second->expires_at = expires_at;
        lru_list_.splice(lru_list_.begin(), lru_list_, it->second);
        return;
    }

    // Evict LRU if at capacity
    while (map_.size() >= max_entries_ && !lru_list_.empty()) {
        auto& back = lru_list_.back();
        map_.erase(back.key);
        lru_list_.pop_back();
        evictions.fetch_add(1, std::memory_order_relaxed);
    }

    lru_list_.emplace_front(CacheEntry{key, std::move(value), expires_at});
    map_[key] = lru_list_.begin();
}

bool MemoryCacheStore::Shard::erase(const std::string& key) {
    std::lock_guard lock(mutex_);
    auto it = map_.find(key);
    if (it == map_.end()) return false;
    lru_list_.erase(it->second);
    map_.erase(it);
    return true;
}

size_t MemoryCacheStore::Shard::size() const {
    std::lock_guard lock(mutex_);
    return map_.size();
}

} // namespace sqlpage
