#include <gtest/gtest.h>

#include "hashsweep/http_server.hpp"
#include "test_support.hpp"

using namespace hashsweep;

class HttpServerTest : public HashsweepTest {
protected:
    void SetUp() override {
        HashsweepTest::SetUp();
        PipelineConfig config;
        config.output.log_path = path("test.log");
        config.output.results_path = path("results.json");
        config.server.html_file = path("index.html");
        server_ = std::make_unique<HttpServer>(config, logger_);
    }

    void TearDown() override {
        server_.reset();
        HashsweepTest::TearDown();
    }

    static HttpRequest make_request(http::verb verb, const std::string& target, const std::string& body = "") {
        HttpRequest req{verb, target, 11};
        req.body() = body;
        req.prepare_payload();
        return req;
    }

    static boost::json::object body_of(const HttpResponse& res) {
        return boost::json::parse(res.body()).as_object();
    }

    std::unique_ptr<HttpServer> server_;
};

TEST_F(HttpServerTest, UnknownRouteIsNotFound) {
    auto res = server_->handle_request(make_request(http::verb::get, "/nope"));
    EXPECT_EQ(res.result(), http::status::not_found);

    res = server_->handle_request(make_request(http::verb::get, "/api/run"));
    EXPECT_EQ(res.result(), http::status::not_found);
}

TEST_F(HttpServerTest, ServesIndexPage) {
    write_file("index.html", "<html>sweep</html>");

    auto res = server_->handle_request(make_request(http::verb::get, "/"));

    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(res[http::field::content_type], "text/html");
    EXPECT_EQ(res.body(), "<html>sweep</html>");
}

TEST_F(HttpServerTest, MissingIndexPageIsNotFound) {
    auto res = server_->handle_request(make_request(http::verb::get, "/index.html"));
    EXPECT_EQ(res.result(), http::status::not_found);
}

TEST_F(HttpServerTest, RunReturnsMatchesAndStats) {
    boost::json::object request{
        {"csv_data", "alice\nbob\ncarol\n"},
        {"config", boost::json::object{
            {"general", boost::json::object{{"worker_count", 2}, {"chunk_size", 2}, {"worker_timeout_ms", 200}}},
            {"hash", boost::json::object{{"algorithm", "SHA256"}, {"target_hash", SHA256_BOB}}},
            {"output", boost::json::object{{"verbose", false}}}
        }}
    };

    auto res = server_->handle_request(
        make_request(http::verb::post, "/api/run", boost::json::serialize(request)));

    ASSERT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(res[http::field::content_type], "application/json");

    auto body = body_of(res);
    EXPECT_TRUE(body.at("success").as_bool());
    EXPECT_EQ(body.at("matches_found").as_int64(), 1);
    EXPECT_EQ(body.at("results").as_array().at(0).at("original").as_string(), "bob");
    EXPECT_EQ(body.at("stats").at("total_items").as_int64(), 3);
    EXPECT_NE(std::string(body.at("log").as_string()).find("FOUND MATCH: bob"), std::string::npos);
    EXPECT_TRUE(std::filesystem::exists(path("results.json")));
}

TEST_F(HttpServerTest, InvalidConfigReturnsError) {
    boost::json::object request{
        {"csv_data", "bob\n"},
        {"config", boost::json::object{
            {"general", boost::json::object{}},
            {"hash", boost::json::object{{"algorithm", "MD5"}, {"target_hash", "00"}}}
        }}
    };

    auto res = server_->handle_request(
        make_request(http::verb::post, "/api/run", boost::json::serialize(request)));

    EXPECT_EQ(res.result(), http::status::internal_server_error);
    auto body = body_of(res);
    EXPECT_FALSE(body.at("success").as_bool());
    EXPECT_NE(std::string(body.at("error").as_string()).find("MD5"), std::string::npos);
}

TEST_F(HttpServerTest, MalformedBodyReturnsError) {
    auto res = server_->handle_request(make_request(http::verb::post, "/api/run", "{not json"));

    EXPECT_EQ(res.result(), http::status::internal_server_error);
    EXPECT_FALSE(body_of(res).at("success").as_bool());

    res = server_->handle_request(make_request(http::verb::post, "/api/run", R"({"csv_data": "bob"})"));
    EXPECT_EQ(res.result(), http::status::internal_server_error);
}
