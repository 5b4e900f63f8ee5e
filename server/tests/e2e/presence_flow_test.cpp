#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include <boost/beast/websocket.hpp>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "fanout/app.hpp"
#include "fanout/in_memory_store.hpp"
#include "support/ws_client.hpp"

namespace {

using fanout::test_support::Eventually;
using fanout::test_support::WsClient;

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
  cfg.ws_queue_limit_messages = 64;
  cfg.ws_queue_limit_bytes = 1 << 20;
  cfg.ops_token = "ops-secret";
  return cfg;
}

bool ContainsUser(const nlohmann::json& online, const std::string& user_id) {
  for (const auto& entry : online) {
    if (entry["id"] == user_id) {
      return true;
    }
  }
  return false;
}

class ServerFixture : public ::testing::Test {
 protected:
  void StartServer(const fanout::AppConfig& config) {
    config_ = config;
    store_ = std::make_shared<fanout::InMemorySocialStore>();
    Seed("alice", "Alice", true);
    Seed("bob", "Bob", true);
    Seed("carol", "Carol", false);
    app_ = std::make_unique<fanout::ServerApp>(config_, store_);
    server_thread_ = std::thread([this]() { app_->Run(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
  }

  void TearDown() override {
    if (app_) {
      app_->Stop();
    }
    if (server_thread_.joinable()) {
      server_thread_.join();
    }
  }

  void Seed(const std::string& id, const std::string& username, bool show_online_status) {
    fanout::UserRecord record;
    record.profile.id = id;
    record.profile.username = username;
    record.profile.profile_picture = "https://cdn.example.com/" + id + ".png";
    record.show_online_status = show_online_status;
    store_->AddUser(record);
  }

  std::unique_ptr<WsClient> Login(const std::string& user_id) {
    auto client = std::make_unique<WsClient>(config_.port);
    client->Send("userLogin", user_id);
    auto snapshot = client->WaitFor("onlineUsers", [&](const nlohmann::json& p) { return ContainsUser(p, user_id); });
    EXPECT_TRUE(snapshot.has_value()) << user_id;
    return client;
  }

  fanout::AppConfig config_{};
  std::shared_ptr<fanout::InMemorySocialStore> store_;
  std::unique_ptr<fanout::ServerApp> app_;
  std::thread server_thread_;
};

class PresenceFlowFixture : public ServerFixture {
 protected:
  void SetUp() override { StartServer(TestConfig(18085)); }
};

class BackpressureFixture : public ServerFixture {
 protected:
  void SetUp() override {
    auto config = TestConfig(18086);
    config.ws_queue_limit_bytes = 256;
    StartServer(config);
  }
};

}  // namespace

TEST_F(PresenceFlowFixture, LoginIsBroadcastToEveryConnection) {
  WsClient watcher(config_.port);
  ASSERT_TRUE(Eventually([&]() { return app_->GetCoordinator()->ActiveConnections() == 1; }));
  auto alice = Login("alice");

  auto seen = watcher.WaitFor("onlineUsers", [](const nlohmann::json& p) { return ContainsUser(p, "alice"); });
  ASSERT_TRUE(seen.has_value());
  EXPECT_EQ((*seen)["p"].size(), 1u);
  EXPECT_EQ((*seen)["p"][0]["username"], "Alice");

  auto record = store_->FindUser("alice");
  ASSERT_TRUE(record.has_value());
  EXPECT_TRUE(record->is_online);
}

TEST_F(PresenceFlowFixture, HiddenUsersStayOutOfSnapshot) {
  auto alice = Login("alice");
  WsClient carol(config_.port);
  carol.Send("userLogin", "carol");
  auto bob = Login("bob");

  auto snapshot = alice->WaitFor("onlineUsers", [](const nlohmann::json& p) { return ContainsUser(p, "bob"); });
  ASSERT_TRUE(snapshot.has_value());
  EXPECT_TRUE(ContainsUser((*snapshot)["p"], "alice"));
  EXPECT_FALSE(ContainsUser((*snapshot)["p"], "carol"));
  EXPECT_TRUE(Eventually([&]() { return app_->GetRegistry()->IsOnline("carol"); }));
}

TEST_F(PresenceFlowFixture, DirectMessageReachesRecipientAndEchoesToSender) {
  auto alice = Login("alice");
  auto bob = Login("bob");

  alice->Send("sendMessage", {{"recipientId", "bob"}, {"text", "hello bob"}});

  auto received = bob->WaitFor("newMessage");
  ASSERT_TRUE(received.has_value());
  EXPECT_EQ((*received)["p"]["text"], "hello bob");
  EXPECT_EQ((*received)["p"]["sender"]["_id"], "alice");
  EXPECT_EQ((*received)["p"]["sender"]["username"], "Alice");

  auto echoed = alice->WaitFor("messageSent");
  ASSERT_TRUE(echoed.has_value());
  EXPECT_EQ((*echoed)["p"]["_id"], (*received)["p"]["_id"]);
  EXPECT_EQ((*echoed)["p"]["recipient"]["_id"], "bob");

  ASSERT_EQ(store_->Messages().size(), 1u);
}

TEST_F(PresenceFlowFixture, UserRoomReceivesMessagesWithoutLogin) {
  auto alice = Login("alice");
  WsClient bob_room(config_.port);
  bob_room.Send("joinUserRoom", "bob");
  ASSERT_TRUE(Eventually([&]() { return app_->GetCoordinator()->GroupMembers("bob").size() == 1; }));

  alice->Send("sendMessage", {{"recipientId", "bob"}, {"text", "room delivery"}});

  auto received = bob_room.WaitFor("newMessage");
  ASSERT_TRUE(received.has_value());
  EXPECT_EQ((*received)["p"]["text"], "room delivery");
}

TEST_F(PresenceFlowFixture, UpdateAndReactionAreBroadcast) {
  auto alice = Login("alice");
  auto bob = Login("bob");

  alice->Send("createUpdate", {{"title", "Launch"}, {"description", "v2 is out"}});
  auto created = bob->WaitFor("newUpdate");
  ASSERT_TRUE(created.has_value());
  EXPECT_EQ((*created)["p"]["title"], "Launch");
  EXPECT_EQ((*created)["p"]["organizer"]["username"], "Alice");
  const auto update_id = (*created)["p"]["_id"].get<std::string>();

  bob->Send("updateReaction", {{"updateId", update_id}, {"reactionType", "like"}});
  auto liked = alice->WaitFor("updateReaction");
  ASSERT_TRUE(liked.has_value());
  EXPECT_EQ((*liked)["p"]["likes"], 1);
  EXPECT_EQ((*liked)["p"]["dislikes"], 0);

  bob->Send("updateReaction", {{"updateId", update_id}, {"reactionType", "dislike"}});
  auto switched = alice->WaitFor("updateReaction", [](const nlohmann::json& p) { return p["dislikes"] == 1; });
  ASSERT_TRUE(switched.has_value());
  EXPECT_EQ((*switched)["p"]["likes"], 0);
}

TEST_F(PresenceFlowFixture, FailuresAreReportedToOriginOnly) {
  WsClient anonymous(config_.port);
  anonymous.Send("sendMessage", {{"recipientId", "bob"}, {"text", "hi"}});
  auto rejected = anonymous.WaitFor("messageError");
  ASSERT_TRUE(rejected.has_value());
  EXPECT_EQ((*rejected)["p"]["message"], "User not authenticated");

  auto alice = Login("alice");
  alice->Send("updateReaction", {{"updateId", "missing"}, {"reactionType", "like"}});
  auto missing = alice->WaitFor("updateError");
  ASSERT_TRUE(missing.has_value());
  EXPECT_EQ((*missing)["p"]["message"], "Update not found");
  EXPECT_TRUE(store_->Messages().empty());
}

TEST_F(PresenceFlowFixture, MalformedFramesGetBadRequest) {
  WsClient client(config_.port);
  client.SendRaw("not json");
  auto parse_error = client.WaitForError();
  ASSERT_TRUE(parse_error.has_value());
  EXPECT_EQ((*parse_error)["p"]["code"], "bad_request");

  client.Send("teleport", nlohmann::json::object());
  auto unknown = client.WaitForError();
  ASSERT_TRUE(unknown.has_value());
  EXPECT_EQ((*unknown)["p"]["code"], "bad_request");

  // 오류 뒤에도 연결은 계속 사용할 수 있다.
  client.Send("userLogin", "alice");
  auto snapshot = client.WaitFor("onlineUsers");
  ASSERT_TRUE(snapshot.has_value());
  EXPECT_TRUE(ContainsUser((*snapshot)["p"], "alice"));
}

TEST_F(PresenceFlowFixture, ClosingLastConnectionTakesUserOffline) {
  auto bob = Login("bob");
  auto alice_first = Login("alice");
  auto alice_second = Login("alice");
  ASSERT_TRUE(Eventually([&]() { return app_->GetRegistry()->ConnectionsOf("alice").size() == 2; }));

  alice_first->Close();
  ASSERT_TRUE(Eventually([&]() { return app_->GetRegistry()->ConnectionsOf("alice").size() == 1; }));
  EXPECT_TRUE(app_->GetRegistry()->IsOnline("alice"));

  alice_second->Close();
  auto snapshot = bob->WaitFor("onlineUsers", [](const nlohmann::json& p) { return !ContainsUser(p, "alice"); });
  ASSERT_TRUE(snapshot.has_value());
  EXPECT_TRUE(ContainsUser((*snapshot)["p"], "bob"));
  EXPECT_FALSE(app_->GetRegistry()->IsOnline("alice"));

  ASSERT_TRUE(Eventually([&]() {
    auto record = store_->FindUser("alice");
    return record && !record->is_online;
  }));
}

TEST_F(BackpressureFixture, OversizedOutboundQueueClosesConnection) {
  auto alice = Login("alice");

  alice->Send("sendMessage", {{"recipientId", "bob"}, {"text", std::string(400, 'x')}});

  auto frame = alice->WaitFor("messageSent");
  EXPECT_FALSE(frame.has_value());
  EXPECT_FALSE(alice->IsOpen());
  EXPECT_EQ(alice->LastError(), boost::beast::websocket::error::closed);

  ASSERT_TRUE(Eventually([&]() { return !app_->GetRegistry()->IsOnline("alice"); }));
  EXPECT_EQ(store_->Messages().size(), 1u);
}
