/*
 * 설명: 서버 전체 수명주기와 컴포넌트 조립(레지스트리/저장소/라우터)을 관리한다.
 * 버전: v1.2.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/metrics_ops_test.cpp, server/tests/e2e/presence_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include "fanout/config.hpp"
#include "fanout/connection_registry.hpp"
#include "fanout/event_router.hpp"
#include "fanout/message_relay.hpp"
#include "fanout/observability.hpp"
#include "fanout/presence_broadcaster.hpp"
#include "fanout/presence_service.hpp"
#include "fanout/reaction_aggregator.hpp"
#include "fanout/realtime.hpp"
#include "fanout/social_store.hpp"
#include "fanout/update_publisher.hpp"

namespace fanout {

class Listener;

// STORE_BACKEND 값에 맞는 저장소를 만든다. 알 수 없는 값이면 std::invalid_argument.
std::shared_ptr<SocialStore> MakeStore(const AppConfig& config);

class ServerApp {
 public:
  // store가 비어 있으면 config.store_backend로 생성한다.
  explicit ServerApp(const AppConfig& config, std::shared_ptr<SocialStore> store = nullptr);
  ~ServerApp();

  void Run();
  void Stop();

  boost::asio::io_context& GetContext() { return ioc_; }
  const AppConfig& GetConfig() const { return config_; }
  std::shared_ptr<SocialStore> GetStore() { return store_; }
  std::shared_ptr<ConnectionRegistry> GetRegistry() { return registry_; }
  std::shared_ptr<RealtimeCoordinator> GetCoordinator() { return coordinator_; }
  std::shared_ptr<Observability> GetObservability() { return observability_; }

 private:
  void RunWorkers();

  AppConfig config_;
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  std::shared_ptr<Listener> listener_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<SocialStore> store_;
  std::shared_ptr<ConnectionRegistry> registry_;
  std::shared_ptr<RealtimeCoordinator> coordinator_;
  std::shared_ptr<PresenceBroadcaster> broadcaster_;
  std::shared_ptr<PresenceService> presence_;
  std::shared_ptr<MessageRelay> relay_;
  std::shared_ptr<ReactionAggregator> reactions_;
  std::shared_ptr<UpdatePublisher> updates_;
  std::shared_ptr<EventRouter> router_;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};
};

}  // namespace fanout
