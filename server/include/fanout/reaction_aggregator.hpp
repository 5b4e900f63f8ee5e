/*
 * 설명: 업데이트별 사용자 반응(좋아요/싫어요)을 토글/전환하고 집계 카운트를 다시 계산해 전파한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/reaction_transition_test.cpp, server/tests/unit/reaction_aggregator_test.cpp
 */
#pragma once

#include <memory>
#include <optional>
#include <string>

#include "fanout/errors.hpp"
#include "fanout/keyed_mutex.hpp"
#include "fanout/observability.hpp"
#include "fanout/realtime.hpp"
#include "fanout/social_store.hpp"

namespace fanout {

struct ReactionTransition {
  std::optional<ReactionType> previous;
  std::optional<ReactionType> current;
  int likes_delta{0};
  int dislikes_delta{0};
};

// 반응 전이표를 적용한다. 같은 종류는 제거, 다른 종류는 전환, 없으면 추가.
// 카운트는 0 아래로 내려가지 않는다.
ReactionTransition ApplyReaction(UpdatePost& update, const UserId& user_id, ReactionType requested);

class ReactionAggregator {
 public:
  ReactionAggregator(std::shared_ptr<SocialStore> store, std::shared_ptr<RealtimeCoordinator> coordinator,
                     std::shared_ptr<Observability> observability);

  bool React(const std::string& update_id, const std::optional<UserId>& user_id, const std::string& reaction_type,
             UpdatePost& result, HandlerError& error);

  std::size_t ActiveUpdateLocks() const { return update_locks_.ActiveKeys(); }

 private:
  std::shared_ptr<SocialStore> store_;
  std::shared_ptr<RealtimeCoordinator> coordinator_;
  std::shared_ptr<Observability> observability_;
  KeyedMutex update_locks_;
};

}  // namespace fanout
