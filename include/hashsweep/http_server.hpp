#pragma once

#include "hashsweep/config.hpp"
#include "hashsweep/logging.hpp"

#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <boost/json.hpp>

#include <atomic>
#include <memory>
#include <string>

namespace hashsweep {

namespace http = boost::beast::http;

using HttpRequest = http::request<http::string_body>;
using HttpResponse = http::response<http::string_body>;

/**
 * Browser front-end adapter.
 *
 *   GET  /, /index.html  serve the configured HTML page
 *   POST /api/run        {csv_data, config} -> run one sweep, return matches,
 *                        timing and the log
 *
 * Requests are served one at a time; a sweep already runs its own workers.
 * Result and log paths always come from the server configuration, never
 * from the request.
 */
class HttpServer {
public:
    HttpServer(PipelineConfig server_config, std::shared_ptr<Logger> logger);

    // Accept connections until stop() or SIGINT/SIGTERM.
    void run();

    void stop();

    bool is_running() const { return is_running_.load(std::memory_order_acquire); }

    HttpResponse handle_request(const HttpRequest& req);

private:
    void do_accept();
    void serve_connection(boost::asio::ip::tcp::socket socket);

    HttpResponse handle_index(const HttpRequest& req);
    HttpResponse handle_run(const HttpRequest& req);

    boost::json::object run_pipeline(const boost::json::object& body);
    std::string read_log() const;

    HttpResponse build_json_response(const HttpRequest& req, const boost::json::object& data,
                                     http::status status = http::status::ok);
    HttpResponse build_error_response(const HttpRequest& req, const std::string& error_message,
                                      http::status status);

    PipelineConfig server_config_;
    std::shared_ptr<Logger> logger_;

    boost::asio::io_context ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::atomic<bool> is_running_;
};

} // namespace hashsweep
