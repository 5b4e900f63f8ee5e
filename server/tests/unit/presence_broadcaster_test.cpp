#include <gtest/gtest.h>

#include "support/core_harness.hpp"

using namespace fanout;
using fanout::test_support::CoreHarness;

TEST(PresenceBroadcasterTest, PublishesOnlyOnlineUsersWhoShowStatus) {
  CoreHarness harness;
  harness.AddUser("alice", "Alice");
  harness.AddUser("bob", "Bob", false);
  harness.AddUser("carol", "Carol");
  harness.registry->Associate("alice", 101);
  harness.registry->Associate("bob", 102);
  auto watcher = harness.Connect();

  ASSERT_TRUE(harness.broadcaster->RefreshAndPublish());
  auto events = watcher.sink->Named("onlineUsers");
  ASSERT_EQ(events.size(), 1u);
  const auto& list = events[0].payload;
  ASSERT_TRUE(list.is_array());
  ASSERT_EQ(list.size(), 1u);
  EXPECT_EQ(list[0]["id"], "alice");
  EXPECT_EQ(list[0]["username"], "Alice");
  EXPECT_EQ(list[0]["profilePicture"], "https://cdn.example.com/alice.png");
  EXPECT_TRUE(list[0]["avatar"].is_null());
  EXPECT_FALSE(list[0]["isVerified"].get<bool>());
  EXPECT_EQ(harness.observability->Snapshot().online_users, 2u);
}

TEST(PresenceBroadcasterTest, EmptyRegistryPublishesEmptyList) {
  CoreHarness harness;
  auto watcher = harness.Connect();
  ASSERT_TRUE(harness.broadcaster->RefreshAndPublish());
  auto events = watcher.sink->Named("onlineUsers");
  ASSERT_EQ(events.size(), 1u);
  EXPECT_TRUE(events[0].payload.is_array());
  EXPECT_TRUE(events[0].payload.empty());
}

TEST(PresenceBroadcasterTest, StoreFailureSkipsBroadcast) {
  CoreHarness harness;
  harness.AddUser("alice", "Alice");
  harness.registry->Associate("alice", 101);
  auto watcher = harness.Connect();
  harness.store->SetFailureInjector([](std::string_view op) { return op == "FindUsersByIdIn"; });

  EXPECT_FALSE(harness.broadcaster->RefreshAndPublish());
  EXPECT_EQ(watcher.sink->Count("onlineUsers"), 0u);
  EXPECT_EQ(harness.observability->Snapshot().broadcasts_skipped, 1u);
  EXPECT_THROW(harness.broadcaster->ComputeSnapshot(), StoreError);
}

TEST(PresenceBroadcasterTest, UsersMissingFromStoreAreLeftOut) {
  CoreHarness harness;
  harness.AddUser("alice", "Alice");
  harness.registry->Associate("alice", 101);
  harness.registry->Associate("ghost", 102);
  auto snapshot = harness.broadcaster->ComputeSnapshot();
  ASSERT_EQ(snapshot.size(), 1u);
  EXPECT_EQ(snapshot[0].id, "alice");
}
