/*
 * 설명: 접속 상태 변경 이벤트를 사용자 단위로 직렬화해 처리하고 접속 목록을 다시 전파한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/presence_service_test.cpp
 */
#include "fanout/presence_service.hpp"

#include <chrono>

namespace fanout {

PresenceService::PresenceService(std::shared_ptr<ConnectionRegistry> registry, std::shared_ptr<SocialStore> store,
                                 std::shared_ptr<PresenceBroadcaster> broadcaster,
                                 std::shared_ptr<Observability> observability)
    : registry_(std::move(registry)), store_(std::move(store)), broadcaster_(std::move(broadcaster)),
      observability_(std::move(observability)) {}

void PresenceService::Login(ConnectionContext& ctx, const UserId& user_id) {
  if (ctx.user_id && *ctx.user_id != user_id) {
    DetachConnection(ctx.id);
  }
  ctx.user_id = user_id;
  {
    auto guard = user_locks_.Lock(user_id);
    registry_->Associate(user_id, ctx.id);
    PersistStatus(user_id, true);
  }
  observability_->Log(LogContext{"", user_id, ctx.id, "presence.login", 0, LogLevel::kInfo, ""});
  broadcaster_->RefreshAndPublish();
}

void PresenceService::Logout(const UserId& user_id) {
  {
    auto guard = user_locks_.Lock(user_id);
    auto removed = registry_->DisassociateUser(user_id);
    PersistStatus(user_id, false);
    observability_->Log(LogContext{"", user_id, std::nullopt, "presence.logout", 0, LogLevel::kInfo,
                                   "connections=" + std::to_string(removed.size())});
  }
  broadcaster_->RefreshAndPublish();
}

void PresenceService::Disconnect(const ConnectionContext& ctx) {
  if (!DetachConnection(ctx.id)) {
    return;
  }
  broadcaster_->RefreshAndPublish();
}

bool PresenceService::UpdateSettings(const ConnectionContext& ctx, const nlohmann::json& body,
                                     UserSettings& settings, HandlerError& error) {
  if (!ctx.user_id) {
    error = HandlerError{ErrorCode::kUnauthenticated, "User not authenticated"};
    return false;
  }
  SettingsPatch patch;
  std::string parse_error;
  if (!ParseSettingsPatch(body, patch, parse_error)) {
    error = HandlerError{ErrorCode::kInvalidPayload, parse_error};
    return false;
  }
  try {
    settings = store_->UpsertUserSettings(*ctx.user_id, patch);
  } catch (const StoreError& ex) {
    observability_->Log(
        LogContext{"", ctx.user_id, ctx.id, "settings.update_failed", 0, LogLevel::kError, ex.what()});
    error = HandlerError{ErrorCode::kPersistenceFailure, "Failed to update settings"};
    return false;
  }
  if (patch.show_online_status) {
    broadcaster_->RefreshAndPublish();
  }
  return true;
}

bool PresenceService::DetachConnection(ConnectionId connection) {
  auto owner = registry_->OwnerOf(connection);
  if (!owner) {
    return false;
  }
  auto guard = user_locks_.Lock(*owner);
  auto offline = registry_->Disassociate(connection);
  if (!offline) {
    return false;
  }
  PersistStatus(*offline, false);
  observability_->Log(LogContext{"", *offline, connection, "presence.offline", 0, LogLevel::kInfo, ""});
  return true;
}

void PresenceService::PersistStatus(const UserId& user_id, bool is_online) {
  try {
    store_->SetUserOnlineStatus(user_id, is_online, std::chrono::system_clock::now());
  } catch (const StoreError& ex) {
    // 메모리상의 접속 상태는 이미 바뀌었으므로 전파는 계속 진행한다.
    observability_->Log(LogContext{"", user_id, std::nullopt, "presence.persist_failed", 0, LogLevel::kError,
                                   ex.what()});
  }
}

}  // namespace fanout
