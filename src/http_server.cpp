#include "hashsweep/http_server.hpp"
#include "hashsweep/error.hpp"
#include "hashsweep/pipeline.hpp"
#include "hashsweep/receiver.hpp"
#include "hashsweep/timer.hpp"

#include <fstream>
#include <sstream>

namespace hashsweep {

namespace beast = boost::beast;
namespace net = boost::asio;
using tcp = net::ip::tcp;

HttpServer::HttpServer(PipelineConfig server_config, std::shared_ptr<Logger> logger)
    : server_config_(std::move(server_config)),
      logger_(std::move(logger)),
      acceptor_(ioc_),
      is_running_(false) {}

void HttpServer::run() {
    const auto& host = server_config_.server.host;
    const auto port = server_config_.server.port;

    tcp::resolver resolver(ioc_);
    tcp::endpoint endpoint = *resolver.resolve(host, std::to_string(port)).begin();

    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(net::socket_base::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen(net::socket_base::max_listen_connections);

    net::signal_set signals(ioc_, SIGINT, SIGTERM);
    signals.async_wait([this](const beast::error_code& ec, int) {
        if (!ec) {
            logger_->info("Shutdown signal received");
            stop();
        }
    });

    is_running_.store(true, std::memory_order_release);
    logger_->info("HTTP server running at http://" + host + ":" + std::to_string(port));

    do_accept();
    ioc_.run();

    is_running_.store(false, std::memory_order_release);
    logger_->info("HTTP server stopped");
}

void HttpServer::stop() {
    net::post(ioc_, [this]() {
        beast::error_code ec;
        acceptor_.close(ec);
        ioc_.stop();
    });
}

void HttpServer::do_accept() {
    acceptor_.async_accept([this](const beast::error_code& ec, tcp::socket socket) {
        if (ec) {
            if (ec != net::error::operation_aborted) {
                logger_->error("Accept failed: " + ec.message());
            }
            return;
        }
        serve_connection(std::move(socket));
        if (acceptor_.is_open()) {
            do_accept();
        }
    });
}

void HttpServer::serve_connection(tcp::socket socket) {
    beast::flat_buffer buffer;
    beast::error_code ec;

    HttpRequest req;
    http::read(socket, buffer, req, ec);
    if (ec) {
        logger_->warning("Failed to read HTTP request: " + ec.message());
        return;
    }

    HttpResponse res = handle_request(req);
    http::write(socket, res, ec);
    if (ec) {
        logger_->warning("Failed to write HTTP response: " + ec.message());
    }
    socket.shutdown(tcp::socket::shutdown_send, ec);
}

HttpResponse HttpServer::handle_request(const HttpRequest& req) {
    const std::string target(req.target());
    logger_->debug("Handling " + std::string(req.method_string()) + " " + target);

    if (req.method() == http::verb::get && (target == "/" || target == "/index.html")) {
        return handle_index(req);
    }
    if (req.method() == http::verb::post && target == "/api/run") {
        return handle_run(req);
    }

    HttpResponse res{http::status::not_found, req.version()};
    res.keep_alive(false);
    res.prepare_payload();
    return res;
}

HttpResponse HttpServer::handle_index(const HttpRequest& req) {
    std::ifstream file(server_config_.server.html_file, std::ios::binary);
    if (!file) {
        logger_->error("HTML file not found: " + server_config_.server.html_file);
        HttpResponse res{http::status::not_found, req.version()};
        res.keep_alive(false);
        res.prepare_payload();
        return res;
    }

    std::ostringstream content;
    content << file.rdbuf();

    HttpResponse res{http::status::ok, req.version()};
    res.set(http::field::content_type, "text/html");
    res.keep_alive(false);
    res.body() = content.str();
    res.prepare_payload();
    return res;
}

HttpResponse HttpServer::handle_run(const HttpRequest& req) {
    try {
        boost::json::value body = boost::json::parse(req.body());
        if (!body.is_object()) {
            throw ConfigError("Request body must be a JSON object");
        }
        return build_json_response(req, run_pipeline(body.as_object()));
    } catch (const std::exception& e) {
        logger_->error("Failed to handle run request: " + std::string(e.what()));
        return build_error_response(req, e.what(), http::status::internal_server_error);
    }
}

boost::json::object HttpServer::run_pipeline(const boost::json::object& body) {
    std::string csv_data;
    if (auto it = body.find("csv_data"); it != body.end() && it->value().is_string()) {
        csv_data = std::string(it->value().get_string());
    }

    auto config_it = body.find("config");
    if (config_it == body.end() || !config_it->value().is_object()) {
        throw ConfigError("Request is missing the config object");
    }

    PipelineConfig config = config_from_json(config_it->value().as_object());
    config.output.log_path = server_config_.output.log_path;
    config.output.results_path = server_config_.output.results_path;

    ReceiverStatistics receiver_stats;
    std::istringstream csv_stream(csv_data);
    auto candidates = parse_candidates(csv_stream, config.input.csv_delimiter, &receiver_stats, logger_.get());

    Pipeline pipeline(config, logger_);
    Timer timer;
    timer.start();
    PipelineOutcome outcome = pipeline.run(candidates);
    double total_time = timer.stop();

    boost::json::object report = report_to_json(outcome.report);
    boost::json::array results = report["matches"].as_array();

    boost::json::object stats;
    stats["total_items"] = receiver_stats.valid_lines;
    stats["matches_found"] = outcome.report.total_matches;
    stats["total_time"] = total_time;
    stats["rate"] = total_time > 0 ? static_cast<double>(receiver_stats.valid_lines) / total_time : 0.0;

    boost::json::object response;
    response["success"] = outcome.processing_ok;
    response["persisted"] = outcome.persisted;
    response["matches_found"] = outcome.report.total_matches;
    response["results"] = std::move(results);
    response["time"] = total_time;
    response["log"] = read_log();
    response["stats"] = std::move(stats);
    return response;
}

std::string HttpServer::read_log() const {
    logger_->flush();
    std::ifstream file(logger_->options().log_path);
    if (!file) {
        return "";
    }
    std::ostringstream content;
    content << file.rdbuf();
    return content.str();
}

HttpResponse HttpServer::build_json_response(const HttpRequest& req, const boost::json::object& data,
                                             http::status status) {
    HttpResponse res{status, req.version()};
    res.set(http::field::content_type, "application/json");
    res.keep_alive(false);
    res.body() = boost::json::serialize(data);
    res.prepare_payload();
    return res;
}

HttpResponse HttpServer::build_error_response(const HttpRequest& req, const std::string& error_message,
                                              http::status status) {
    return build_json_response(req, boost::json::object{{"success", false}, {"error", error_message}}, status);
}

} // namespace hashsweep
