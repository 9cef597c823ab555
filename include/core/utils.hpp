#pragma once

#include <atomic>
#include <cctype>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <format>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

namespace sqlpage::utils {

// ============================================================================
// Time Utilities
// ============================================================================

inline std::string format_timestamp(const std::chrono::system_clock::time_point& tp) {
    auto time = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()) % 1000;

    std::tm tm_buf;
    ::gmtime_r(&time, &tm_buf);

    char time_buf[32];
    std::strftime(time_buf, sizeof(time_buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);

    return std::format("{}.{:03d}Z", time_buf, static_cast<int>(ms.count()));
}

inline std::chrono::system_clock::time_point now() {
    return std::chrono::system_clock::now();
}

inline int64_t unix_millis(const std::chrono::system_clock::time_point& tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count();
}

// ============================================================================
// Boolean Formatting
// ============================================================================

inline constexpr const char* booltostr(bool x) { return x ? "true" : "false"; }

// ============================================================================
// Numeric Parsing (std::from_chars, no exceptions or locale)
// ============================================================================

// Parse integer, returns std::nullopt on failure or trailing garbage
template<typename T>
    requires std::is_integral_v<T>
[[nodiscard]] inline std::optional<T> try_parse_int(std::string_view sv) {
    T result{};
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), result);
    if (ec != std::errc{} || ptr != sv.data() + sv.size()) return std::nullopt;
    return result;
}

// ============================================================================
// String Utilities
// ============================================================================

inline std::string to_lower(const std::string& str) {
    std::string result = str;
    for (char& c : result) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return result;
}

inline std::string trim(const std::string& str) {
    const auto start = str.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) {
        return "";
    }
    const auto end = str.find_last_not_of(" \t\n\r");
    return str.substr(start, end - start + 1);
}

// ============================================================================
// JSON String Utilities
// ============================================================================

/**
 * @brief Escape a string for safe embedding in a JSON string value.
 * Handles quotes, backslash and all control characters below 0x20.
 */
[[nodiscard]] inline std::string escape_json(std::string_view s) {
    std::string result;
    result.reserve(s.size() + s.size() / 8);
    for (const char c : s) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            case '\b': result += "\\b"; break;
            case '\f': result += "\\f"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    result += std::format("\\u{:04x}", static_cast<unsigned int>(c));
                } else {
                    result += c;
                }
        }
    }
    return result;
}

// ============================================================================
// Performance Timer
// ============================================================================

class Timer {
public:
    Timer() : start_(std::chrono::steady_clock::now()) {}

    void reset() {
        start_ = std::chrono::steady_clock::now();
    }

    template<typename Duration = std::chrono::microseconds>
    Duration elapsed() const {
        const auto end = std::chrono::steady_clock::now();
        return std::chrono::duration_cast<Duration>(end - start_);
    }

    std::chrono::microseconds elapsed_us() const {
        return elapsed<std::chrono::microseconds>();
    }

    std::chrono::milliseconds elapsed_ms() const {
        return elapsed<std::chrono::milliseconds>();
    }

private:
    std::chrono::steady_clock::time_point start_;
};

// ============================================================================
// Logging (thread-safe, stderr, level-tagged)
// ============================================================================

namespace log {

enum class Level { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3 };

namespace detail {
    inline std::mutex& log_mutex() {
        static std::mutex m;
        return m;
    }

    inline std::atomic<int>& min_level() {
        static std::atomic<int> level{static_cast<int>(Level::INFO)};
        return level;
    }

    inline void write(Level level, const std::string& msg) {
        if (static_cast<int>(level) < min_level().load(std::memory_order_relaxed)) {
            return;
        }

        const char* tag = "";
        switch (level) {
            case Level::DEBUG: tag = "DEBUG"; break;
            case Level::INFO:  tag = "INFO "; break;
            case Level::WARN:  tag = "WARN "; break;
            case Level::ERROR: tag = "ERROR"; break;
        }

        const auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf;
        ::localtime_r(&time, &tm_buf);

        char time_buf[16];
        std::strftime(time_buf, sizeof(time_buf), "%H:%M:%S", &tm_buf);

        const auto formatted = std::format("{}.{:03d} [{}] {}\n",
            time_buf, static_cast<int>(ms.count()), tag, msg);

        std::lock_guard<std::mutex> lock(log_mutex());
        std::cerr << formatted;
    }
} // namespace detail

inline void set_level(Level level) {
    detail::min_level().store(static_cast<int>(level), std::memory_order_relaxed);
}

// "debug" | "info" | "warn" | "error"; unknown names keep the current level
inline bool set_level(const std::string& name) {
    const std::string lower = to_lower(name);
    if (lower == "debug") { set_level(Level::DEBUG); return true; }
    if (lower == "info")  { set_level(Level::INFO);  return true; }
    if (lower == "warn" || lower == "warning") { set_level(Level::WARN); return true; }
    if (lower == "error") { set_level(Level::ERROR); return true; }
    return false;
}

inline void debug(const std::string& msg) {
    detail::write(Level::DEBUG, msg);
}

inline void info(const std::string& msg) {
    detail::write(Level::INFO, msg);
}

inline void warn(const std::string& msg) {
    detail::write(Level::WARN, msg);
}

inline void error(const std::string& msg) {
    detail::write(Level::ERROR, msg);
}

} // namespace log

} // namespace sqlpage::utils
