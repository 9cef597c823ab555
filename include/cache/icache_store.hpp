#pragma once

#include "core/error.hpp"
#include <chrono>
#include <optional>
#include <string>

namespace sqlpage {

/**
 * @brief Key-value store with per-entry time-to-live
 *
 * Staged results are written once with set(), read many times with get(),
 * and expire or are removed with del(). No compare-and-swap is required.
 * Implementations are internally synchronized.
 */
class ICacheStore {
public:
    virtual ~ICacheStore() = default;

    /**
     * @brief Store value under key, replacing any existing entry
     * @param ttl Entry lifetime; an entry with ttl <= 0 is never readable
     */
    [[nodiscard]] virtual Status set(const std::string& key, const std::string& value,
                                     std::chrono::seconds ttl) = 0;

    /**
     * @brief Fetch value for key
     * @return nullopt if absent or expired; error only on store failure
     */
    [[nodiscard]] virtual Result<std::optional<std::string>> get(const std::string& key) = 0;

    /**
     * @brief Remove key; removing a missing key succeeds
     */
    [[nodiscard]] virtual Status del(const std::string& key) = 0;

    /**
     * @brief Backend name for logs and health output
     */
    [[nodiscard]] virtual const char* backend_name() const = 0;
};

} // namespace sqlpage
