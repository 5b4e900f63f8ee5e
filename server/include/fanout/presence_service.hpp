/*
 * 설명: 로그인/로그아웃/연결 종료/설정 변경을 처리해 접속 상태, 저장된 온라인 여부, 접속 목록 전파를 일치시킨다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/presence_service_test.cpp
 */
#pragma once

#include <memory>

#include <nlohmann/json.hpp>

#include "fanout/connection_registry.hpp"
#include "fanout/errors.hpp"
#include "fanout/keyed_mutex.hpp"
#include "fanout/observability.hpp"
#include "fanout/presence_broadcaster.hpp"
#include "fanout/social_store.hpp"

namespace fanout {

class PresenceService {
 public:
  PresenceService(std::shared_ptr<ConnectionRegistry> registry, std::shared_ptr<SocialStore> store,
                  std::shared_ptr<PresenceBroadcaster> broadcaster, std::shared_ptr<Observability> observability);

  void Login(ConnectionContext& ctx, const UserId& user_id);
  void Logout(const UserId& user_id);
  void Disconnect(const ConnectionContext& ctx);
  bool UpdateSettings(const ConnectionContext& ctx, const nlohmann::json& body, UserSettings& settings,
                      HandlerError& error);

 private:
  // 연결을 소유 사용자에서 떼어내고, 마지막 연결이었다면 오프라인으로 기록한다.
  bool DetachConnection(ConnectionId connection);
  void PersistStatus(const UserId& user_id, bool is_online);

  std::shared_ptr<ConnectionRegistry> registry_;
  std::shared_ptr<SocialStore> store_;
  std::shared_ptr<PresenceBroadcaster> broadcaster_;
  std::shared_ptr<Observability> observability_;
  KeyedMutex user_locks_;
};

}  // namespace fanout
