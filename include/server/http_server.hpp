#pragma once

#include "service/query_service.hpp"
#include <atomic>
#include <memory>
#include <string>

// Forward-declare httplib types (avoids pulling in massive header-only library)
namespace httplib {
struct Request;
struct Response;
class Server;
}

namespace sqlpage {

/**
 * @brief HTTP transport for the query service
 *
 * Thin pass-through: each route parses its input, calls one QueryService
 * operation and renders the Result. Error kinds map to status codes via
 * response::status_for(). No business logic lives here.
 */
class HttpServer {
public:
    HttpServer(
        std::shared_ptr<QueryService> service,
        std::string host = "0.0.0.0",
        int port = 5001,
        size_t thread_pool_size = 4,
        size_t max_sql_length = 102400
    );

    ~HttpServer();

    /**
     * @brief Register routes and block in listen()
     * @throws std::runtime_error if the socket cannot be bound
     */
    void start();

    /**
     * @brief Stop a running listen() (safe from a signal-watcher thread)
     */
    void stop();

    /**
     * @brief Register all routes on svr (used by start() and tests)
     */
    void register_routes(httplib::Server& svr);

    struct HttpStats {
        uint64_t requests;
        uint64_t client_errors;
        uint64_t server_errors;
    };
    [[nodiscard]] HttpStats get_stats() const;

private:
    // ── Handler methods (one per endpoint) ──────────────────────────────
    void handle_test_connection(const httplib::Request& req, httplib::Response& res);
    void handle_tables(const httplib::Request& req, httplib::Response& res);
    void handle_schema_info(const httplib::Request& req, httplib::Response& res);
    void handle_execute(const httplib::Request& req, httplib::Response& res);
    void handle_query_page(const httplib::Request& req, httplib::Response& res);
    void handle_query_release(const httplib::Request& req, httplib::Response& res);
    void handle_disconnect(const httplib::Request& req, httplib::Response& res);
    void handle_liveness(const httplib::Request& req, httplib::Response& res);

    // ── Helpers ─────────────────────────────────────────────────────────
    void send_error(httplib::Response& res, ErrorKind kind, const std::string& message,
                    const std::string& sql_state = {});

    template<typename T>
    void send_error(httplib::Response& res, const Result<T>& result) {
        send_error(res, result.error_kind(), result.error_message(), result.error_detail());
    }

    // ── Members ─────────────────────────────────────────────────────────
    std::shared_ptr<QueryService> service_;
    const std::string host_;
    const int port_;
    const size_t thread_pool_size_;
    const size_t max_sql_length_;

    std::unique_ptr<httplib::Server> server_;

    std::atomic<uint64_t> requests_{0};
    std::atomic<uint64_t> client_errors_{0};
    std::atomic<uint64_t> server_errors_{0};
};

} // namespace sqlpage
