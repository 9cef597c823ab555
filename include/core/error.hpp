#pragma once

#include <optional>
#include <string>
#include <utility>

namespace sqlpage {

/**
 * @brief Machine-stable error kinds reported by every core operation
 *
 * The string form (error_kind_to_string) is part of the transport contract.
 */
enum class ErrorKind {
    NONE,
    CONFIG_INVALID,          // Required connection field missing (never retried)
    CONNECTION_EXHAUSTED,    // Retry budget spent
    NOT_CONNECTED,           // No usable handle, lazy connect failed or in progress
    EXECUTION_FAILED,        // Statement errored; driver message passed through
    RESULT_NOT_FOUND,        // Staged identifier unknown or expired
    INVALID_PAGE_INDEX,
    INVALID_QUERY,
    CACHE_UNAVAILABLE,
    STAGED_RESULT_CORRUPT,
    INTERNAL_ERROR
};

[[nodiscard]] inline const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE: return "NONE";
        case ErrorKind::CONFIG_INVALID: return "CONFIG_INVALID";
        case ErrorKind::CONNECTION_EXHAUSTED: return "CONNECTION_EXHAUSTED";
        case ErrorKind::NOT_CONNECTED: return "NOT_CONNECTED";
        case ErrorKind::EXECUTION_FAILED: return "EXECUTION_FAILED";
        case ErrorKind::RESULT_NOT_FOUND: return "RESULT_NOT_FOUND";
        case ErrorKind::INVALID_PAGE_INDEX: return "INVALID_PAGE_INDEX";
        case ErrorKind::INVALID_QUERY: return "INVALID_QUERY";
        case ErrorKind::CACHE_UNAVAILABLE: return "CACHE_UNAVAILABLE";
        case ErrorKind::STAGED_RESULT_CORRUPT: return "STAGED_RESULT_CORRUPT";
        case ErrorKind::INTERNAL_ERROR: return "INTERNAL_ERROR";
        default: return "INTERNAL_ERROR";
    }
}

/**
 * @brief Result type for operations that can fail
 *
 * `error_detail` carries backend diagnostics that must reach the caller
 * unmodified (SQLSTATE for EXECUTION_FAILED).
 */
template<typename T>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.success_ = true;
        r.value_ = std::move(value);
        return r;
    }

    static Result error(ErrorKind kind, std::string message, std::string detail = {}) {
        Result r;
        r.success_ = false;
        r.error_kind_ = kind;
        r.error_message_ = std::move(message);
        r.error_detail_ = std::move(detail);
        return r;
    }

    // Re-wrap the error of a Result with a different value type
    template<typename U>
    static Result propagate(const Result<U>& other) {
        return error(other.error_kind(), other.error_message(), other.error_detail());
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    ErrorKind error_kind() const { return error_kind_; }
    const std::string& error_message() const { return error_message_; }
    const std::string& error_detail() const { return error_detail_; }

private:
    bool success_ = false;
    std::optional<T> value_;
    ErrorKind error_kind_ = ErrorKind::NONE;
    std::string error_message_;
    std::string error_detail_;
};

template<>
class Result<void> {
public:
    static Result ok() {
        Result r;
        r.success_ = true;
        return r;
    }

    static Result error(ErrorKind kind, std::string message, std::string detail = {}) {
        Result r;
        r.success_ = false;
        r.error_kind_ = kind;
        r.error_message_ = std::move(message);
        r.error_detail_ = std::move(detail);
        return r;
    }

    template<typename U>
    static Result propagate(const Result<U>& other) {
        return error(other.error_kind(), other.error_message(), other.error_detail());
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    ErrorKind error_kind() const { return error_kind_; }
    const std::string& error_message() const { return error_message_; }
    const std::string& error_detail() const { return error_detail_; }

private:
    bool success_ = false;
    ErrorKind error_kind_ = ErrorKind::NONE;
    std::string error_message_;
    std::string error_detail_;
};

using Status = Result<void>;

} // namespace sqlpage
