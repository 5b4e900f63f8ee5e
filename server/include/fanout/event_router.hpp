/*
 * 설명: 수신 이벤트 이름을 담당 컴포넌트로 연결하고 핸들러 실패를 원 연결의 오류 이벤트로 돌려준다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/event_router_test.cpp, server/tests/e2e/presence_flow_test.cpp
 */
#pragma once

#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "fanout/errors.hpp"
#include "fanout/message_relay.hpp"
#include "fanout/observability.hpp"
#include "fanout/presence_service.hpp"
#include "fanout/reaction_aggregator.hpp"
#include "fanout/realtime.hpp"
#include "fanout/update_publisher.hpp"

namespace fanout {

class EventRouter {
 public:
  EventRouter(std::shared_ptr<RealtimeCoordinator> coordinator, std::shared_ptr<PresenceService> presence,
              std::shared_ptr<MessageRelay> relay, std::shared_ptr<ReactionAggregator> reactions,
              std::shared_ptr<UpdatePublisher> updates, std::shared_ptr<Observability> observability);

  // 알 수 없는 이벤트나 페이로드 형식 오류면 false. 핸들러 실패는 오류 이벤트로 이미 전달된 상태다.
  bool Dispatch(ConnectionContext& ctx, const std::string& event, const nlohmann::json& payload,
                std::string& error_message);
  void HandleDisconnect(const ConnectionContext& ctx);

 private:
  void HandleSendMessage(const ConnectionContext& ctx, const nlohmann::json& payload);
  void HandleCreateUpdate(const ConnectionContext& ctx, const nlohmann::json& payload);
  void HandleUpdateReaction(const ConnectionContext& ctx, const nlohmann::json& payload);
  void HandleUpdateSettings(const ConnectionContext& ctx, const nlohmann::json& payload);
  void ReportFailure(const ConnectionContext& ctx, const std::string& error_event, const HandlerError& error);

  std::shared_ptr<RealtimeCoordinator> coordinator_;
  std::shared_ptr<PresenceService> presence_;
  std::shared_ptr<MessageRelay> relay_;
  std::shared_ptr<ReactionAggregator> reactions_;
  std::shared_ptr<UpdatePublisher> updates_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace fanout
