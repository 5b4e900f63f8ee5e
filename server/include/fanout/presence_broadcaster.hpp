/*
 * 설명: 접속 중이며 공개 설정이 켜진 사용자 목록을 계산해 모든 연결에 전파한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/presence_broadcaster_test.cpp
 */
#pragma once

#include <memory>
#include <mutex>
#include <vector>

#include "fanout/connection_registry.hpp"
#include "fanout/observability.hpp"
#include "fanout/realtime.hpp"
#include "fanout/social_store.hpp"

namespace fanout {

class PresenceBroadcaster {
 public:
  PresenceBroadcaster(std::shared_ptr<ConnectionRegistry> registry, std::shared_ptr<SocialStore> store,
                      std::shared_ptr<RealtimeCoordinator> coordinator, std::shared_ptr<Observability> observability);

  // 저장소 조회에 실패하면 로그만 남기고 이번 전파를 건너뛴 뒤 false를 반환한다.
  bool RefreshAndPublish();

  // 저장소 오류는 StoreError로 전달된다.
  std::vector<UserProfile> ComputeSnapshot();

 private:
  std::shared_ptr<ConnectionRegistry> registry_;
  std::shared_ptr<SocialStore> store_;
  std::shared_ptr<RealtimeCoordinator> coordinator_;
  std::shared_ptr<Observability> observability_;
  std::mutex publish_mutex_;
};

}  // namespace fanout
