#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "codebattle/app.hpp"

namespace {

codebattle::AppConfig TestConfig(unsigned short port) {
  codebattle::AppConfig cfg{};
  cfg.port = port;
  cfg.db_host = "localhost";
  cfg.db_port = 3306;
  cfg.db_user = "app";
  cfg.db_password = "app_pass";
  cfg.db_name = "app_db";
  cfg.persistence_enabled = false;
  cfg.snapshot_key = "rooms";
  cfg.log_level = "warn";
  cfg.ws_queue_limit_messages = 64;
  cfg.ws_queue_limit_bytes = 1048576;
  cfg.session_time_budget_seconds = 300;
  cfg.worker_threads = 1;
  return cfg;
}

using Response = boost::beast::http::response<boost::beast::http::string_body>;

void ExpectSuccessEnvelope(const nlohmann::json& body) {
  ASSERT_TRUE(body.is_object());
  EXPECT_TRUE(body.contains("success"));
  EXPECT_TRUE(body["success"].get<bool>());
  ASSERT_TRUE(body.contains("data"));
  EXPECT_TRUE(body["data"].is_object());
  ASSERT_TRUE(body.contains("error"));
  EXPECT_TRUE(body["error"].is_null());
  ASSERT_TRUE(body.contains("meta"));
  EXPECT_TRUE(body["meta"].is_object());
}

void ExpectErrorEnvelope(const nlohmann::json& body, const std::string& code) {
  ASSERT_TRUE(body.is_object());
  EXPECT_TRUE(body.contains("success"));
  EXPECT_FALSE(body["success"].get<bool>());
  ASSERT_TRUE(body.contains("data"));
  EXPECT_TRUE(body["data"].is_null());
  ASSERT_TRUE(body.contains("error"));
  EXPECT_TRUE(body["error"].is_object());
  EXPECT_EQ(body["error"]["code"], code);
}

class HttpEndpointsFixture : public ::testing::Test {
 protected:
  void SetUp() override {
    config_ = TestConfig(18093);
    app_ = std::make_unique<codebattle::ServerApp>(config_);
    server_thread_ = std::thread([this]() { app_->Run(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
  }

  void TearDown() override {
    app_->Stop();
    if (server_thread_.joinable()) {
      server_thread_.join();
    }
  }

  Response Get(const std::string& target) {
    boost::asio::io_context ioc;
    boost::asio::ip::tcp::resolver resolver{ioc};
    boost::beast::tcp_stream stream{ioc};
    auto const results = resolver.resolve("127.0.0.1", std::to_string(config_.port));
    stream.connect(results);

    boost::beast::http::request<boost::beast::http::string_body> req{boost::beast::http::verb::get, target, 11};
    req.set(boost::beast::http::field::host, "localhost");
    req.set(boost::beast::http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    boost::beast::http::write(stream, req);

    boost::beast::flat_buffer buffer;
    Response res;
    boost::beast::http::read(stream, buffer, res);
    boost::beast::error_code ec;
    stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    return res;
  }

  codebattle::AppConfig config_;
  std::unique_ptr<codebattle::ServerApp> app_;
  std::thread server_thread_;
};

}  // namespace

TEST_F(HttpEndpointsFixture, RootServesBanner) {
  auto res = Get("/");
  ASSERT_EQ(res.result(), boost::beast::http::status::ok);
  EXPECT_EQ(res.body(), "CodeBattle WebSocket Server");
  EXPECT_EQ(res[boost::beast::http::field::access_control_allow_origin], "*");
}

TEST_F(HttpEndpointsFixture, HealthReportsOk) {
  auto res = Get("/api/health");
  ASSERT_EQ(res.result(), boost::beast::http::status::ok);
  auto body = nlohmann::json::parse(res.body());
  ExpectSuccessEnvelope(body);
  EXPECT_EQ(body["data"]["status"], "ok");
}

TEST_F(HttpEndpointsFixture, MetricsExposeCounters) {
  auto res = Get("/metrics?verbose=1");
  ASSERT_EQ(res.result(), boost::beast::http::status::ok);
  auto body = nlohmann::json::parse(res.body());
  ExpectSuccessEnvelope(body);
  EXPECT_EQ(body["data"]["connections"]["websocket"], 0);
  EXPECT_EQ(body["data"]["rooms"]["live"], 0);
  EXPECT_TRUE(body["data"]["failures"].contains("persistence"));
}

TEST_F(HttpEndpointsFixture, UnknownPathIsNotFound) {
  auto res = Get("/api/rooms");
  EXPECT_EQ(res.result(), boost::beast::http::status::not_found);
  ExpectErrorEnvelope(nlohmann::json::parse(res.body()), "not_found");
}
