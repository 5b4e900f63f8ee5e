/*
 * 설명: 단위 테스트용 이벤트 기록 싱크와 인메모리 저장소 기반 컴포넌트 조립을 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#pragma once

#include <algorithm>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "fanout/connection_registry.hpp"
#include "fanout/event_router.hpp"
#include "fanout/in_memory_store.hpp"
#include "fanout/message_relay.hpp"
#include "fanout/observability.hpp"
#include "fanout/presence_broadcaster.hpp"
#include "fanout/presence_service.hpp"
#include "fanout/reaction_aggregator.hpp"
#include "fanout/realtime.hpp"
#include "fanout/update_publisher.hpp"

namespace fanout::test_support {

struct RecordedEvent {
  std::string event;
  nlohmann::json payload;
};

class RecordingSink : public EventSink {
 public:
  void SendServerEvent(const std::string& event, const nlohmann::json& payload) override {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.push_back(RecordedEvent{event, payload});
  }

  void SendServerError(const std::string& code, const std::string& message) override {
    std::lock_guard<std::mutex> lock(mutex_);
    errors_.push_back(RecordedEvent{code, {{"message", message}}});
  }

  std::vector<RecordedEvent> Named(const std::string& event) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<RecordedEvent> matched;
    std::copy_if(events_.begin(), events_.end(), std::back_inserter(matched),
                 [&](const RecordedEvent& recorded) { return recorded.event == event; });
    return matched;
  }

  std::size_t Count(const std::string& event) const { return Named(event).size(); }

  std::size_t Total() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
  }

  std::vector<RecordedEvent> Errors() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return errors_;
  }

  void Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.clear();
    errors_.clear();
  }

 private:
  mutable std::mutex mutex_;
  std::vector<RecordedEvent> events_;
  std::vector<RecordedEvent> errors_;
};

struct Client {
  ConnectionContext ctx;
  std::shared_ptr<RecordingSink> sink;
};

// 실제 서버와 같은 순서로 컴포넌트를 조립한다.
struct CoreHarness {
  CoreHarness()
      : observability(std::make_shared<Observability>(LogLevel::kError)),
        store(std::make_shared<InMemorySocialStore>()),
        registry(std::make_shared<ConnectionRegistry>()),
        coordinator(std::make_shared<RealtimeCoordinator>()) {
    coordinator->SetObservability(observability);
    broadcaster = std::make_shared<PresenceBroadcaster>(registry, store, coordinator, observability);
    presence = std::make_shared<PresenceService>(registry, store, broadcaster, observability);
    relay = std::make_shared<MessageRelay>(registry, store, coordinator, observability);
    reactions = std::make_shared<ReactionAggregator>(store, coordinator, observability);
    updates = std::make_shared<UpdatePublisher>(store, coordinator, observability);
    router = std::make_shared<EventRouter>(coordinator, presence, relay, reactions, updates, observability);
  }

  Client Connect() {
    Client client;
    client.sink = std::make_shared<RecordingSink>();
    client.ctx.id = coordinator->Attach(client.sink);
    return client;
  }

  void AddUser(const UserId& id, const std::string& username, bool show_online_status = true) {
    UserRecord record;
    record.profile.id = id;
    record.profile.username = username;
    record.profile.profile_picture = "https://cdn.example.com/" + id + ".png";
    record.show_online_status = show_online_status;
    store->AddUser(record);
  }

  std::shared_ptr<Observability> observability;
  std::shared_ptr<InMemorySocialStore> store;
  std::shared_ptr<ConnectionRegistry> registry;
  std::shared_ptr<RealtimeCoordinator> coordinator;
  std::shared_ptr<PresenceBroadcaster> broadcaster;
  std::shared_ptr<PresenceService> presence;
  std::shared_ptr<MessageRelay> relay;
  std::shared_ptr<ReactionAggregator> reactions;
  std::shared_ptr<UpdatePublisher> updates;
  std::shared_ptr<EventRouter> router;
};

}  // namespace fanout::test_support
