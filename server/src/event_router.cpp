/*
 * 설명: joinUserRoom/sendMessage/createUpdate/updateReaction/userLogin/userLogout/updateSettings 처리를 분기한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/event_router_test.cpp
 */
#include "fanout/event_router.hpp"

namespace fanout {
namespace {
std::string StringField(const nlohmann::json& payload, const char* key) {
  auto it = payload.find(key);
  if (it == payload.end() || !it->is_string()) {
    return {};
  }
  return it->get<std::string>();
}

bool NonEmptyString(const nlohmann::json& payload) {
  return payload.is_string() && !payload.get_ref<const std::string&>().empty();
}
}  // namespace

EventRouter::EventRouter(std::shared_ptr<RealtimeCoordinator> coordinator, std::shared_ptr<PresenceService> presence,
                         std::shared_ptr<MessageRelay> relay, std::shared_ptr<ReactionAggregator> reactions,
                         std::shared_ptr<UpdatePublisher> updates, std::shared_ptr<Observability> observability)
    : coordinator_(std::move(coordinator)), presence_(std::move(presence)), relay_(std::move(relay)),
      reactions_(std::move(reactions)), updates_(std::move(updates)), observability_(std::move(observability)) {}

bool EventRouter::Dispatch(ConnectionContext& ctx, const std::string& event, const nlohmann::json& payload,
                           std::string& error_message) {
  if (event == "joinUserRoom") {
    if (!NonEmptyString(payload)) {
      error_message = "joinUserRoom에는 사용자 ID 문자열이 필요합니다";
      return false;
    }
    coordinator_->JoinGroup(payload.get<std::string>(), ctx.id);
    return true;
  }
  if (event == "userLogin" || event == "userLogout") {
    if (!NonEmptyString(payload)) {
      error_message = event + "에는 사용자 ID 문자열이 필요합니다";
      return false;
    }
    if (event == "userLogin") {
      presence_->Login(ctx, payload.get<std::string>());
    } else {
      presence_->Logout(payload.get<std::string>());
    }
    return true;
  }
  if (event == "sendMessage" || event == "createUpdate" || event == "updateReaction" || event == "updateSettings") {
    if (!payload.is_object()) {
      error_message = event + "에는 객체 payload가 필요합니다";
      return false;
    }
    if (event == "sendMessage") {
      HandleSendMessage(ctx, payload);
    } else if (event == "createUpdate") {
      HandleCreateUpdate(ctx, payload);
    } else if (event == "updateReaction") {
      HandleUpdateReaction(ctx, payload);
    } else {
      HandleUpdateSettings(ctx, payload);
    }
    return true;
  }
  error_message = "알 수 없는 이벤트";
  return false;
}

void EventRouter::HandleDisconnect(const ConnectionContext& ctx) { presence_->Disconnect(ctx); }

void EventRouter::HandleSendMessage(const ConnectionContext& ctx, const nlohmann::json& payload) {
  SendMessageRequest request{ctx.id, ctx.user_id, StringField(payload, "recipientId"), StringField(payload, "text")};
  DeliveryReport report;
  HandlerError error;
  if (!relay_->Send(request, report, error)) {
    ReportFailure(ctx, "messageError", error);
  }
}

void EventRouter::HandleCreateUpdate(const ConnectionContext& ctx, const nlohmann::json& payload) {
  UpdatePost created;
  HandlerError error;
  if (!updates_->CreateUpdate(ctx.user_id, StringField(payload, "title"), StringField(payload, "description"),
                              created, error)) {
    ReportFailure(ctx, "updateError", error);
  }
}

void EventRouter::HandleUpdateReaction(const ConnectionContext& ctx, const nlohmann::json& payload) {
  UpdatePost result;
  HandlerError error;
  if (!reactions_->React(StringField(payload, "updateId"), ctx.user_id, StringField(payload, "reactionType"), result,
                         error)) {
    ReportFailure(ctx, "updateError", error);
  }
}

void EventRouter::HandleUpdateSettings(const ConnectionContext& ctx, const nlohmann::json& payload) {
  UserSettings settings;
  HandlerError error;
  if (!presence_->UpdateSettings(ctx, payload, settings, error)) {
    // 설정 변경에는 대응하는 오류 이벤트가 없어 기록만 남긴다.
    observability_->Log(LogContext{"", ctx.user_id, ctx.id, "settings.rejected", 0, LogLevel::kWarn,
                                   std::string(ToString(error.code)) + ": " + error.message});
  }
}

void EventRouter::ReportFailure(const ConnectionContext& ctx, const std::string& error_event,
                                const HandlerError& error) {
  observability_->Log(LogContext{"", ctx.user_id, ctx.id, error_event, 0, LogLevel::kWarn,
                                 std::string(ToString(error.code)) + ": " + error.message});
  coordinator_->SendEvent(ctx.id, error_event, {{"message", error.message}});
}

}  // namespace fanout
