#include "server/http_server.hpp"
#include "server/http_constants.hpp"
#include "server/response_format.hpp"
#include "core/json.hpp"
#include "core/utils.hpp"

// cpp-httplib is header-only; silence its internal deprecation warnings
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <format>
#include <stdexcept>

namespace sqlpage {

HttpServer::HttpServer(
    std::shared_ptr<QueryService> service,
    std::string host,
    int port,
    size_t thread_pool_size,
    size_t max_sql_length)
    : service_(std::move(service)),
      host_(std::move(host)),
      port_(port),
      thread_pool_size_(thread_pool_size),
      max_sql_length_(max_sql_length),
      server_(std::make_unique<httplib::Server>()) {}

HttpServer::~HttpServer() = default;

// ============================================================================
// start(): registers routes, listens
// ============================================================================

void HttpServer::start() {
    auto& svr = *server_;

    const size_t pool_size = thread_pool_size_;
    svr.new_task_queue = [pool_size] {
        return new httplib::ThreadPool(pool_size);
    };

    register_routes(svr);

    utils::log::warn("Statements submitted to /api/db/execute run verbatim; "
                     "expose this service only to trusted clients");
    utils::log::info(std::format("Starting sqlpage server on {}:{} ({} threads)",
        host_, port_, thread_pool_size_));

    if (!svr.listen(host_.c_str(), port_)) {
        throw std::runtime_error(std::format("Failed to start HTTP server on {}:{}", host_, port_));
    }
}

void HttpServer::stop() {
    if (server_->is_running()) {
        server_->stop();
    }
    utils::log::info("Server stopped");
}

HttpServer::HttpStats HttpServer::get_stats() const {
    return {
        requests_.load(std::memory_order_relaxed),
        client_errors_.load(std::memory_order_relaxed),
        server_errors_.load(std::memory_order_relaxed)
    };
}

// ============================================================================
// Route registration
// ============================================================================

void HttpServer::register_routes(httplib::Server& svr) {
    svr.Get(http::kTestConnectionRoute, [this](const httplib::Request& req, httplib::Response& res) {
        handle_test_connection(req, res);
    });
    svr.Get(http::kTablesRoute, [this](const httplib::Request& req, httplib::Response& res) {
        handle_tables(req, res);
    });
    svr.Get(http::kSchemaInfoRoute, [this](const httplib::Request& req, httplib::Response& res) {
        handle_schema_info(req, res);
    });
    svr.Post(http::kExecuteRoute, [this](const httplib::Request& req, httplib::Response& res) {
        handle_execute(req, res);
    });
    svr.Get(http::kQueryPageRoute, [this](const httplib::Request& req, httplib::Response& res) {
        handle_query_page(req, res);
    });
    svr.Delete(http::kQueryReleaseRoute, [this](const httplib::Request& req, httplib::Response& res) {
        handle_query_release(req, res);
    });
    svr.Post(http::kDisconnectRoute, [this](const httplib::Request& req, httplib::Response& res) {
        handle_disconnect(req, res);
    });
    svr.Get(http::kLivenessRoute, [this](const httplib::Request& req, httplib::Response& res) {
        handle_liveness(req, res);
    });

    svr.set_exception_handler([this](const httplib::Request& req, httplib::Response& res,
                                     std::exception_ptr ep) {
        std::string message = "Unknown error";
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            message = e.what();
        } catch (...) {
            // Non-standard exception; reported below as INTERNAL_ERROR
        }
        utils::log::error(std::format("Unhandled exception on {} {}: {}",
            req.method, req.path, message));
        send_error(res, ErrorKind::INTERNAL_ERROR, message);
    });
}

// ============================================================================
// Handlers
// ============================================================================

void HttpServer::handle_test_connection(const httplib::Request&, httplib::Response& res) {
    requests_.fetch_add(1, std::memory_order_relaxed);

    const auto health = service_->health_check();
    if (!health.connected) {
        server_errors_.fetch_add(1, std::memory_order_relaxed);
        res.status = response::status_for(ErrorKind::NOT_CONNECTED);
    }
    res.set_content(response::render_health(health), http::kJsonContentType);
}

void HttpServer::handle_tables(const httplib::Request&, httplib::Response& res) {
    requests_.fetch_add(1, std::memory_order_relaxed);

    auto tables = service_->get_tables();
    if (tables.is_error()) {
        send_error(res, tables);
        return;
    }
    res.set_content(response::render_tables(tables.value()), http::kJsonContentType);
}

void HttpServer::handle_schema_info(const httplib::Request&, httplib::Response& res) {
    requests_.fetch_add(1, std::memory_order_relaxed);

    auto info = service_->get_schema_info();
    if (info.is_error()) {
        send_error(res, info);
        return;
    }
    res.set_content(response::render_schema_info(info.value()), http::kJsonContentType);
}

void HttpServer::handle_execute(const httplib::Request& req, httplib::Response& res) {
    requests_.fetch_add(1, std::memory_order_relaxed);

    JsonValue body;
    try {
        body = JsonValue::parse(req.body);
    } catch (const JsonValue::parse_error&) {
        send_error(res, ErrorKind::INVALID_QUERY, "Invalid JSON body");
        return;
    }

    if (!body.is_object() || !body["query"].is_string()) {
        send_error(res, ErrorKind::INVALID_QUERY, "SQL query is required");
        return;
    }

    const auto sql = body["query"].get<std::string>();
    if (utils::trim(sql).empty()) {
        send_error(res, ErrorKind::INVALID_QUERY, "SQL query is required");
        return;
    }
    if (sql.size() > max_sql_length_) {
        send_error(res, ErrorKind::INVALID_QUERY,
            std::format("SQL too long: max {} bytes", max_sql_length_));
        return;
    }

    auto outcome = service_->execute_query(sql);
    if (outcome.is_error()) {
        send_error(res, outcome);
        return;
    }
    res.set_content(response::render_execution(outcome.value()), http::kJsonContentType);
}

void HttpServer::handle_query_page(const httplib::Request& req, httplib::Response& res) {
    requests_.fetch_add(1, std::memory_order_relaxed);

    const std::string identifier = req.matches[1];
    auto page_index = ResultPager::parse_page_index(req.matches[2].str());
    if (page_index.is_error()) {
        send_error(res, page_index);
        return;
    }

    auto page = service_->get_query_page(identifier, page_index.value());
    if (page.is_error()) {
        send_error(res, page);
        return;
    }
    res.set_content(response::render_page(page.value()), http::kJsonContentType);
}

void HttpServer::handle_query_release(const httplib::Request& req, httplib::Response& res) {
    requests_.fetch_add(1, std::memory_order_relaxed);

    const std::string identifier = req.matches[1];
    auto released = service_->release_query(identifier);
    if (released.is_error()) {
        send_error(res, released);
        return;
    }
    res.set_content(response::render_message(std::format("Query results {} released", identifier)),
        http::kJsonContentType);
}

void HttpServer::handle_disconnect(const httplib::Request&, httplib::Response& res) {
    requests_.fetch_add(1, std::memory_order_relaxed);

    auto disconnected = service_->disconnect();
    if (disconnected.is_error()) {
        send_error(res, disconnected);
        return;
    }
    res.set_content(response::render_message("Successfully disconnected from database"),
        http::kJsonContentType);
}

void HttpServer::handle_liveness(const httplib::Request&, httplib::Response& res) {
    res.set_content(response::render_liveness(utils::format_timestamp(utils::now())),
        http::kJsonContentType);
}

void HttpServer::send_error(httplib::Response& res, ErrorKind kind, const std::string& message,
                            const std::string& sql_state) {
    res.status = response::status_for(kind);
    if (res.status >= 500) {
        server_errors_.fetch_add(1, std::memory_order_relaxed);
    } else {
        client_errors_.fetch_add(1, std::memory_order_relaxed);
    }
    res.set_content(response::render_error(kind, message, sql_state), http::kJsonContentType);
}

} // namespace sqlpage
