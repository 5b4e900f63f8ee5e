#include <chrono>
#include <cstdint>
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

#include "fanout/app.hpp"
#include "fanout/in_memory_store.hpp"
#include "support/ws_client.hpp"

namespace {

fanout::AppConfig TestConfig(unsigned short port) {
  fanout::AppConfig cfg{};
  cfg.port = port;
  cfg.db_host = "localhost";
  cfg.db_port = 3306;
  cfg.db_user = "app";
  cfg.db_password = "app_pass";
  cfg.db_name = "app_db";
  cfg.store_backend = "memory";
  cfg.log_level = "error";
  cfg.ws_queue_limit_messages = 8;
  cfg.ws_queue_limit_bytes = 65536;
  cfg.ops_token = "ops-secret";
  return cfg;
}

struct SimpleHttpResponse {
  boost::beast::http::status status;
  nlohmann::json body;
};

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

class MetricsOpsFixture : public ::testing::Test {
 protected:
  void SetUp() override {
    config_ = TestConfig(18084);
    auto store = std::make_shared<fanout::InMemorySocialStore>();
    fanout::UserRecord alice;
    alice.profile.id = "alice";
    alice.profile.username = "Alice";
    store->AddUser(alice);
    app_ = std::make_unique<fanout::ServerApp>(config_, store);
    server_thread_ = std::thread([this]() { app_->Run(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
  }

  void TearDown() override {
    app_->Stop();
    if (server_thread_.joinable()) {
      server_thread_.join();
    }
  }

  SimpleHttpResponse Get(const std::string& target, const std::string& extra_header_name = "",
                         const std::string& extra_header_value = "") {
    boost::asio::io_context ioc;
    boost::asio::ip::tcp::resolver resolver{ioc};
    boost::beast::tcp_stream stream{ioc};
    auto const results = resolver.resolve("127.0.0.1", std::to_string(config_.port));
    stream.connect(results);

    boost::beast::http::request<boost::beast::http::string_body> req{boost::beast::http::verb::get, target, 11};
    req.set(boost::beast::http::field::host, "localhost");
    req.set(boost::beast::http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    if (!extra_header_name.empty()) {
      req.set(extra_header_name, extra_header_value);
    }

    boost::beast::http::write(stream, req);

    boost::beast::flat_buffer buffer;
    boost::beast::http::response<boost::beast::http::string_body> res;
    boost::beast::http::read(stream, buffer, res);

    SimpleHttpResponse result{res.result(), nlohmann::json::parse(res.body())};
    boost::beast::error_code ec;
    stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    return result;
  }

  fanout::AppConfig config_;
  std::unique_ptr<fanout::ServerApp> app_;
  std::thread server_thread_;
};

}  // namespace

TEST_F(MetricsOpsFixture, MetricsAndOpsEndpoints) {
  auto first = Get("/metrics");
  ASSERT_EQ(first.status, boost::beast::http::status::ok);
  ExpectSuccessEnvelope(first.body);
  const auto& data = first.body["data"];
  EXPECT_TRUE(data.contains("requests"));
  EXPECT_TRUE(data.contains("connections"));
  EXPECT_TRUE(data.contains("presence"));
  EXPECT_TRUE(data.contains("messages"));
  EXPECT_TRUE(data.contains("reactions"));
  EXPECT_TRUE(data.contains("updates"));
  EXPECT_TRUE(data.contains("broadcasts"));
  auto initial_total = data["requests"]["total"].get<std::uint64_t>();

  auto unauthorized_ops = Get("/ops/status");
  EXPECT_EQ(unauthorized_ops.status, boost::beast::http::status::unauthorized);
  ExpectErrorEnvelope(unauthorized_ops.body, "unauthorized");

  auto authed_ops = Get("/ops/status", "X-Ops-Token", config_.ops_token);
  ASSERT_EQ(authed_ops.status, boost::beast::http::status::ok);
  ExpectSuccessEnvelope(authed_ops.body);
  EXPECT_TRUE(authed_ops.body["data"].contains("activeWebsocket"));
  EXPECT_EQ(authed_ops.body["data"]["storeBackend"], "memory");

  auto health = Get("/api/health");
  ASSERT_EQ(health.status, boost::beast::http::status::ok);
  ExpectSuccessEnvelope(health.body);

  auto missing = Get("/api/unknown");
  EXPECT_EQ(missing.status, boost::beast::http::status::not_found);
  ExpectErrorEnvelope(missing.body, "not_found");

  auto second = Get("/metrics");
  ASSERT_EQ(second.status, boost::beast::http::status::ok);
  ExpectSuccessEnvelope(second.body);
  auto second_total = second.body["data"]["requests"]["total"].get<std::uint64_t>();
  EXPECT_GE(second_total, initial_total + 3);
}

TEST_F(MetricsOpsFixture, MetricsTrackLivePresence) {
  fanout::test_support::WsClient client(config_.port);
  client.Send("userLogin", "alice");
  ASSERT_TRUE(client.WaitFor("onlineUsers").has_value());

  auto metrics = Get("/metrics");
  ASSERT_EQ(metrics.status, boost::beast::http::status::ok);
  EXPECT_EQ(metrics.body["data"]["connections"]["websocket"], 1);
  EXPECT_EQ(metrics.body["data"]["presence"]["online"], 1);

  client.Close();
  ASSERT_TRUE(fanout::test_support::Eventually([&]() {
    auto after = Get("/metrics");
    return after.body["data"]["presence"]["online"] == 0 && after.body["data"]["connections"]["websocket"] == 0;
  }));
}
