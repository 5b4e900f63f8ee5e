/*
 * 설명: 1:1 메시지를 저장한 뒤 수신자 연결 전체에 전달하고 발신자 연결 전체에 전송 확인을 보낸다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/message_relay_test.cpp
 */
#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "fanout/connection_registry.hpp"
#include "fanout/errors.hpp"
#include "fanout/observability.hpp"
#include "fanout/realtime.hpp"
#include "fanout/social_store.hpp"

namespace fanout {

struct SendMessageRequest {
  ConnectionId origin{0};
  std::optional<UserId> sender_id;
  UserId recipient_id;
  std::string text;
};

struct DeliveryReport {
  DirectMessage message;
  nlohmann::json payload;
  std::size_t recipient_deliveries{0};
  std::size_t sender_echoes{0};
  bool enriched{false};
};

class MessageRelay {
 public:
  MessageRelay(std::shared_ptr<ConnectionRegistry> registry, std::shared_ptr<SocialStore> store,
               std::shared_ptr<RealtimeCoordinator> coordinator, std::shared_ptr<Observability> observability);

  bool Send(const SendMessageRequest& request, DeliveryReport& report, HandlerError& error);

 private:
  // 접속 등록된 연결과 사용자 방에 가입한 연결의 합집합.
  std::vector<ConnectionId> TargetsOf(const UserId& user_id) const;

  std::shared_ptr<ConnectionRegistry> registry_;
  std::shared_ptr<SocialStore> store_;
  std::shared_ptr<RealtimeCoordinator> coordinator_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace fanout
