/*
 * 설명: 접속 목록 스냅샷을 계산하고 onlineUsers 이벤트로 전파한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/presence_broadcaster_test.cpp
 */
#include "fanout/presence_broadcaster.hpp"

namespace fanout {

PresenceBroadcaster::PresenceBroadcaster(std::shared_ptr<ConnectionRegistry> registry,
                                         std::shared_ptr<SocialStore> store,
                                         std::shared_ptr<RealtimeCoordinator> coordinator,
                                         std::shared_ptr<Observability> observability)
    : registry_(std::move(registry)), store_(std::move(store)), coordinator_(std::move(coordinator)),
      observability_(std::move(observability)) {}

std::vector<UserProfile> PresenceBroadcaster::ComputeSnapshot() {
  auto online = registry_->OnlineUserIds();
  std::vector<UserProfile> visible;
  if (online.empty()) {
    return visible;
  }
  auto users = store_->FindUsersByIdIn(std::vector<UserId>(online.begin(), online.end()));
  for (const auto& user : users) {
    if (user.show_online_status && online.count(user.profile.id) > 0) {
      visible.push_back(user.profile);
    }
  }
  return visible;
}

bool PresenceBroadcaster::RefreshAndPublish() {
  // 스냅샷 계산과 전송을 함께 직렬화해 마지막으로 나간 목록이 가장 최신 상태가 되게 한다.
  std::lock_guard<std::mutex> lock(publish_mutex_);
  observability_->SetOnlineUsers(registry_->OnlineCount());
  std::vector<UserProfile> snapshot;
  try {
    snapshot = ComputeSnapshot();
  } catch (const StoreError& ex) {
    observability_->IncrementBroadcastSkipped();
    observability_->Error("presence.broadcast_skipped", ex.what());
    return false;
  }
  nlohmann::json payload = nlohmann::json::array();
  for (const auto& profile : snapshot) {
    payload.push_back(ToPresenceJson(profile));
  }
  auto delivered = coordinator_->Broadcast("onlineUsers", payload);
  LogContext ctx;
  ctx.name = "presence.broadcast";
  ctx.level = LogLevel::kDebug;
  ctx.detail = "visible=" + std::to_string(snapshot.size()) + " delivered=" + std::to_string(delivered);
  observability_->Log(ctx);
  return true;
}

}  // namespace fanout
