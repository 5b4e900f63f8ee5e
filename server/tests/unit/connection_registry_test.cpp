#include <algorithm>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "fanout/connection_registry.hpp"

using fanout::ConnectionId;
using fanout::ConnectionRegistry;

TEST(ConnectionRegistryTest, AssociateIsIdempotent) {
  ConnectionRegistry registry;
  registry.Associate("alice", 1);
  registry.Associate("alice", 1);
  EXPECT_EQ(registry.ConnectionsOf("alice").size(), 1u);
  EXPECT_EQ(registry.OnlineCount(), 1u);
  EXPECT_TRUE(registry.IsOnline("alice"));
}

TEST(ConnectionRegistryTest, UserStaysOnlineUntilLastConnectionLeaves) {
  ConnectionRegistry registry;
  registry.Associate("alice", 1);
  registry.Associate("alice", 2);

  EXPECT_FALSE(registry.Disassociate(1).has_value());
  EXPECT_TRUE(registry.IsOnline("alice"));
  EXPECT_EQ(registry.ConnectionsOf("alice"), std::vector<ConnectionId>{2});

  auto offline = registry.Disassociate(2);
  ASSERT_TRUE(offline.has_value());
  EXPECT_EQ(*offline, "alice");
  EXPECT_FALSE(registry.IsOnline("alice"));
  EXPECT_TRUE(registry.OnlineUserIds().empty());
}

TEST(ConnectionRegistryTest, DisassociateUnknownConnectionChangesNothing) {
  ConnectionRegistry registry;
  registry.Associate("alice", 1);
  EXPECT_FALSE(registry.Disassociate(42).has_value());
  EXPECT_TRUE(registry.IsOnline("alice"));
  EXPECT_EQ(registry.OnlineCount(), 1u);
}

TEST(ConnectionRegistryTest, DisassociateUserRemovesEveryConnection) {
  ConnectionRegistry registry;
  registry.Associate("alice", 1);
  registry.Associate("alice", 2);
  registry.Associate("bob", 3);

  auto removed = registry.DisassociateUser("alice");
  std::sort(removed.begin(), removed.end());
  EXPECT_EQ(removed, (std::vector<ConnectionId>{1, 2}));
  EXPECT_FALSE(registry.IsOnline("alice"));
  EXPECT_FALSE(registry.OwnerOf(1).has_value());
  EXPECT_FALSE(registry.OwnerOf(2).has_value());
  EXPECT_EQ(registry.OwnerOf(3), std::optional<std::string>("bob"));
  EXPECT_TRUE(registry.DisassociateUser("alice").empty());
}

TEST(ConnectionRegistryTest, ReassociatingConnectionMovesOwnership) {
  ConnectionRegistry registry;
  registry.Associate("alice", 1);
  registry.Associate("bob", 1);
  EXPECT_FALSE(registry.IsOnline("alice"));
  EXPECT_TRUE(registry.IsOnline("bob"));
  EXPECT_EQ(registry.OwnerOf(1), std::optional<std::string>("bob"));
}

TEST(ConnectionRegistryTest, OnlineUserIdsAreSorted) {
  ConnectionRegistry registry;
  registry.Associate("carol", 3);
  registry.Associate("alice", 1);
  registry.Associate("bob", 2);
  auto online = registry.OnlineUserIds();
  std::vector<std::string> ids(online.begin(), online.end());
  EXPECT_EQ(ids, (std::vector<std::string>{"alice", "bob", "carol"}));
}

TEST(ConnectionRegistryTest, ConcurrentChurnOnOneUserLeavesConsistentState) {
  ConnectionRegistry registry;
  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&registry, t]() {
      for (ConnectionId i = 0; i < 500; ++i) {
        ConnectionId connection = static_cast<ConnectionId>(t) * 1000 + i + 1;
        registry.Associate("shared", connection);
        registry.Disassociate(connection);
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  EXPECT_FALSE(registry.IsOnline("shared"));
  EXPECT_EQ(registry.OnlineCount(), 0u);
}
