#include "cache/redis_cache_store.hpp"
#include "core/utils.hpp"

#include <format>
#include <netdb.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace sqlpage {

namespace {

constexpr size_t kReadChunk = 16384;

// Room for reply framing around the largest accepted value
constexpr size_t kReplyFramingSlack = 64;

Status cache_error(std::string message) {
    return Status::error(ErrorKind::CACHE_UNAVAILABLE, std::move(message));
}

} // anonymous namespace

RedisCacheStore::RedisCacheStore(Config config)
    : config_(std::move(config)) {
    read_buffer_.reserve(kReadChunk);
}

RedisCacheStore::~RedisCacheStore() {
    std::lock_guard lock(mutex_);
    close_locked();
}

// ---- ICacheStore -----------------------------------------------------------

Status RedisCacheStore::set(const std::string& key, const std::string& value,
                            std::chrono::seconds ttl) {
    if (ttl.count() <= 0) {
        return cache_error(std::format("Invalid TTL {}s for key {}", ttl.count(), key));
    }

    if (value.size() > config_.max_value_bytes) {
        return cache_error(std::format("Value for key {} is {} bytes, exceeds the {} byte limit",
            key, value.size(), config_.max_value_bytes));
    }

    utils::log::debug(std::format("Storing {} bytes in Redis for key: {}", value.size(), key));

    auto reply = command({"SETEX", key, std::to_string(ttl.count()), value});
    if (reply.is_error()) {
        return Status::propagate(reply);
    }
    if (reply.value().type != resp::ReplyType::SIMPLE_STRING) {
        return cache_error(std::format("Unexpected SETEX reply for key {}", key));
    }
    return Status::ok();
}

Result<std::optional<std::string>> RedisCacheStore::get(const std::string& key) {
    using GetResult = Result<std::optional<std::string>>;

    auto reply = command({"GET", key});
    if (reply.is_error()) {
        return GetResult::propagate(reply);
    }

    auto& r = reply.value();
    if (r.type == resp::ReplyType::NIL) {
        utils::log::debug(std::format("No data found in Redis for key: {}", key));
        return GetResult::ok(std::nullopt);
    }
    if (r.type != resp::ReplyType::BULK_STRING) {
        return GetResult::error(ErrorKind::CACHE_UNAVAILABLE,
            std::format("Unexpected GET reply for key {}", key));
    }

    utils::log::debug(std::format("Retrieved {} bytes from Redis for key: {}", r.str.size(), key));
    return GetResult::ok(std::move(r.str));
}

Status RedisCacheStore::del(const std::string& key) {
    auto reply = command({"DEL", key});
    if (reply.is_error()) {
        return Status::propagate(reply);
    }
    if (reply.value().type != resp::ReplyType::INTEGER) {
        return cache_error(std::format("Unexpected DEL reply for key {}", key));
    }
    return Status::ok();
}

Status RedisCacheStore::ping() {
    auto reply = command({"PING"});
    if (reply.is_error()) {
        return Status::propagate(reply);
    }
    return Status::ok();
}

// ---- Command layer ---------------------------------------------------------

Result<resp::Reply> RedisCacheStore::command(const std::vector<std::string>& args) {
    std::lock_guard lock(mutex_);

    const bool reused_socket = (fd_ >= 0);
    auto reply = round_trip_locked(args);

    // A pooled socket may have been closed by the server while idle
    if (reply.is_error() && reused_socket && fd_ < 0) {
        utils::log::warn(std::format("Redis {} failed on stale connection, reconnecting: {}",
            args.front(), reply.error_message()));
        reply = round_trip_locked(args);
    }
    return reply;
}

Result<resp::Reply> RedisCacheStore::round_trip_locked(const std::vector<std::string>& args) {
    if (fd_ < 0) {
        auto connected = connect_locked();
        if (connected.is_error()) {
            return Result<resp::Reply>::propagate(connected);
        }
    }

    if (!write_all_locked(resp::encode_command(args))) {
        const std::string reason = std::strerror(errno);
        close_locked();
        return Result<resp::Reply>::error(ErrorKind::CACHE_UNAVAILABLE,
            std::format("Redis write failed: {}", reason));
    }

    auto reply = read_reply_locked();
    if (reply.is_ok() && reply.value().type == resp::ReplyType::ERROR) {
        return Result<resp::Reply>::error(ErrorKind::CACHE_UNAVAILABLE,
            std::format("Redis {} error: {}", args.front(), reply.value().str));
    }
    return reply;
}

Status RedisCacheStore::connect_locked() {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* addrs = nullptr;
    const std::string port = std::to_string(config_.port);
    const int rc = ::getaddrinfo(config_.host.c_str(), port.c_str(), &hints, &addrs);
    if (rc != 0) {
        return cache_error(std::format("Redis host lookup failed for {}: {}",
            config_.host, gai_strerror(rc)));
    }

    timeval tv{};
    tv.tv_sec = static_cast<time_t>(config_.socket_timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((config_.socket_timeout.count() % 1000) * 1000);

    std::string last_error = "no usable address";
    for (addrinfo* ai = addrs; ai != nullptr; ai = ai->ai_next) {
        const int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) {
            last_error = std::strerror(errno);
            continue;
        }
        ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

        if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
            fd_ = fd;
            break;
        }
        last_error = std::strerror(errno);
        ::close(fd);
    }
    ::freeaddrinfo(addrs);

    if (fd_ < 0) {
        return cache_error(std::format("Redis connection to {}:{} failed: {}",
            config_.host, config_.port, last_error));
    }
    read_buffer_.clear();

    if (!config_.password.empty()) {
        if (!write_all_locked(resp::encode_command({"AUTH", config_.password}))) {
            close_locked();
            return cache_error("Redis AUTH write failed");
        }
        auto reply = read_reply_locked();
        if (reply.is_error() || reply.value().type == resp::ReplyType::ERROR) {
            close_locked();
            return cache_error("Redis AUTH rejected");
        }
    }

    if (config_.db_index != 0) {
        if (!write_all_locked(resp::encode_command({"SELECT", std::to_string(config_.db_index)}))) {
            close_locked();
            return cache_error("Redis SELECT write failed");
        }
        auto reply = read_reply_locked();
        if (reply.is_error() || reply.value().type == resp::ReplyType::ERROR) {
            close_locked();
            return cache_error(std::format("Redis SELECT {} rejected", config_.db_index));
        }
    }

    utils::log::info(std::format("Redis connected successfully ({}:{})", config_.host, config_.port));
    return Status::ok();
}

void RedisCacheStore::close_locked() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    read_buffer_.clear();
}

bool RedisCacheStore::write_all_locked(const std::string& data) {
    const char* ptr = data.data();
    size_t sent = 0;
    while (sent < data.size()) {
        const ssize_t n = ::send(fd_, ptr + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n <= 0) {
            if (n < 0 && errno == EINTR) continue;
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}

Result<resp::Reply> RedisCacheStore::read_reply_locked() {
    char chunk[kReadChunk];
    while (true) {
        if (!read_buffer_.empty()) {
            resp::Reply reply;
            size_t consumed = 0;
            const auto status = resp::parse_reply(read_buffer_, consumed, reply,
                                                  config_.max_value_bytes);
            if (status == resp::ParseStatus::COMPLETE) {
                read_buffer_.erase(0, consumed);
                return Result<resp::Reply>::ok(std::move(reply));
            }
            if (status == resp::ParseStatus::MALFORMED) {
                close_locked();
                return Result<resp::Reply>::error(ErrorKind::CACHE_UNAVAILABLE,
                    "Malformed Redis reply");
            }
            if (status == resp::ParseStatus::TOO_LARGE ||
                read_buffer_.size() > config_.max_value_bytes + kReplyFramingSlack) {
                close_locked();
                return Result<resp::Reply>::error(ErrorKind::CACHE_UNAVAILABLE,
                    std::format("Redis reply exceeds the {} byte limit", config_.max_value_bytes));
            }
        }

        const ssize_t n = ::recv(fd_, chunk, sizeof(chunk), 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            const std::string reason = (n == 0) ? "connection closed by server"
                                                : std::strerror(errno);
            close_locked();
            return Result<resp::Reply>::error(ErrorKind::CACHE_UNAVAILABLE,
                std::format("Redis read failed: {}", reason));
        }
        read_buffer_.append(chunk, static_cast<size_t>(n));
    }
}

} // namespace sqlpage
