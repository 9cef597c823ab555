#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace sqlpage::resp {

/**
 * @brief Redis Serialization Protocol (RESP2) framing
 *
 * Commands are sent as arrays of bulk strings; replies are parsed
 * incrementally from a receive buffer.
 */
enum class ReplyType {
    SIMPLE_STRING,   // +OK
    ERROR,           // -ERR ...
    INTEGER,         // :1
    BULK_STRING,     // $5\r\nhello
    NIL,             // $-1 or *-1
    ARRAY            // *2 ...
};

struct Reply {
    ReplyType type = ReplyType::NIL;
    std::string str;                // SIMPLE_STRING, ERROR, BULK_STRING
    int64_t integer = 0;            // INTEGER
    std::vector<Reply> elements;    // ARRAY
};

enum class ParseStatus {
    COMPLETE,
    INCOMPLETE,     // Need more bytes
    MALFORMED,
    TOO_LARGE       // Bulk string header above the caller's limit
};

// Redis' own proto-max-bulk-len default
inline constexpr size_t kDefaultMaxBulkLength = 512 * 1024 * 1024;

/**
 * @brief Encode a command as a RESP array of bulk strings
 */
[[nodiscard]] std::string encode_command(const std::vector<std::string>& args);

/**
 * @brief Parse one reply from the front of buf
 * @param consumed Set to the number of bytes used when COMPLETE
 * @param max_bulk_length Longest bulk string accepted; checked on the
 *        header, before the body is buffered
 */
[[nodiscard]] ParseStatus parse_reply(std::string_view buf, size_t& consumed, Reply& out,
                                      size_t max_bulk_length = kDefaultMaxBulkLength);

} // namespace sqlpage::resp
