/*
 * 설명: 메시지 저장 → 프로필 보강 → 수신자 전달/발신자 확인 순서로 처리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/message_relay_test.cpp
 */
#include "fanout/message_relay.hpp"

#include <set>

namespace fanout {

MessageRelay::MessageRelay(std::shared_ptr<ConnectionRegistry> registry, std::shared_ptr<SocialStore> store,
                           std::shared_ptr<RealtimeCoordinator> coordinator,
                           std::shared_ptr<Observability> observability)
    : registry_(std::move(registry)), store_(std::move(store)), coordinator_(std::move(coordinator)),
      observability_(std::move(observability)) {}

bool MessageRelay::Send(const SendMessageRequest& request, DeliveryReport& report, HandlerError& error) {
  if (!request.sender_id) {
    observability_->Log(LogContext{"", std::nullopt, request.origin, "message.unauthenticated", 0, LogLevel::kWarn,
                                   "User not authenticated"});
    error = HandlerError{ErrorCode::kUnauthenticated, "User not authenticated"};
    return false;
  }
  if (request.recipient_id.empty() || request.text.empty()) {
    error = HandlerError{ErrorCode::kInvalidPayload, "recipientId와 비어 있지 않은 text가 필요합니다"};
    return false;
  }
  const UserId& sender_id = *request.sender_id;

  // 전달을 시작하기 전에 반드시 저장을 마친다.
  try {
    report.message = store_->CreateMessage(sender_id, request.recipient_id, request.text);
  } catch (const StoreError& ex) {
    observability_->Log(
        LogContext{"", sender_id, request.origin, "message.persist_failed", 0, LogLevel::kError, ex.what()});
    error = HandlerError{ErrorCode::kPersistenceFailure, "Failed to send message"};
    return false;
  }

  std::optional<UserProfile> sender;
  std::optional<UserProfile> recipient;
  try {
    for (const auto& user : store_->FindUsersByIdIn({sender_id, request.recipient_id})) {
      if (user.profile.id == sender_id) {
        sender = user.profile;
      }
      if (user.profile.id == request.recipient_id) {
        recipient = user.profile;
      }
    }
    report.enriched = true;
  } catch (const StoreError& ex) {
    // 메시지는 이미 저장되었으므로 식별자만 담아 전달과 확인을 계속한다.
    observability_->Log(LogContext{"", sender_id, request.origin, "message.enrich_failed", 0, LogLevel::kWarn,
                                   std::string(ToString(ErrorCode::kDeliveryFailed)) + ": " + ex.what()});
    report.enriched = false;
  }

  report.payload = ToMessageJson(report.message, sender, recipient);
  report.recipient_deliveries = coordinator_->SendEventTo(TargetsOf(request.recipient_id), "newMessage", report.payload);
  report.sender_echoes = coordinator_->SendEventTo(TargetsOf(sender_id), "messageSent", report.payload);
  observability_->IncrementMessagesRelayed();
  observability_->Log(LogContext{"", sender_id, request.origin, "message.relayed", 0, LogLevel::kDebug,
                                 "recipient=" + request.recipient_id +
                                     " deliveries=" + std::to_string(report.recipient_deliveries)});
  return true;
}

std::vector<ConnectionId> MessageRelay::TargetsOf(const UserId& user_id) const {
  std::set<ConnectionId> targets;
  for (auto id : registry_->ConnectionsOf(user_id)) {
    targets.insert(id);
  }
  for (auto id : coordinator_->GroupMembers(user_id)) {
    targets.insert(id);
  }
  return {targets.begin(), targets.end()};
}

}  // namespace fanout
