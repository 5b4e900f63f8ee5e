/*
 * 설명: 반응 전이표 적용과 업데이트 단위 직렬화(load → apply → save → broadcast)를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/reaction_transition_test.cpp, server/tests/unit/reaction_aggregator_test.cpp
 */
#include "fanout/reaction_aggregator.hpp"

#include <algorithm>
#include <chrono>

namespace fanout {

namespace {

int Clamp(int value) { return std::max(value, 0); }

void Bump(UpdatePost& update, ReactionType type, int delta, ReactionTransition& transition) {
  if (type == ReactionType::kLike) {
    update.likes = Clamp(update.likes + delta);
    transition.likes_delta += delta;
  } else {
    update.dislikes = Clamp(update.dislikes + delta);
    transition.dislikes_delta += delta;
  }
}

}  // namespace

ReactionTransition ApplyReaction(UpdatePost& update, const UserId& user_id, ReactionType requested) {
  ReactionTransition transition;
  auto it = std::find_if(update.reactions.begin(), update.reactions.end(),
                         [&](const Reaction& reaction) { return reaction.user_id == user_id; });

  if (it == update.reactions.end()) {
    update.reactions.push_back(Reaction{user_id, requested});
    transition.current = requested;
    Bump(update, requested, +1, transition);
    return transition;
  }

  transition.previous = it->type;
  if (it->type == requested) {
    update.reactions.erase(it);
    Bump(update, requested, -1, transition);
    return transition;
  }

  Bump(update, it->type, -1, transition);
  it->type = requested;
  transition.current = requested;
  Bump(update, requested, +1, transition);
  return transition;
}

ReactionAggregator::ReactionAggregator(std::shared_ptr<SocialStore> store,
                                       std::shared_ptr<RealtimeCoordinator> coordinator,
                                       std::shared_ptr<Observability> observability)
    : store_(std::move(store)), coordinator_(std::move(coordinator)), observability_(std::move(observability)) {}

bool ReactionAggregator::React(const std::string& update_id, const std::optional<UserId>& user_id,
                               const std::string& reaction_type, UpdatePost& result, HandlerError& error) {
  if (!user_id) {
    error = HandlerError{ErrorCode::kUnauthenticated, "User not authenticated"};
    return false;
  }
  auto requested = ParseReactionType(reaction_type);
  if (!requested || update_id.empty()) {
    error = HandlerError{ErrorCode::kInvalidPayload, "updateId와 like 또는 dislike reactionType이 필요합니다"};
    return false;
  }

  const auto started = std::chrono::steady_clock::now();
  ReactionTransition transition;
  {
    auto guard = update_locks_.Lock(update_id);
    try {
      auto loaded = store_->LoadUpdateById(update_id);
      if (!loaded) {
        error = HandlerError{ErrorCode::kNotFound, "Update not found"};
        return false;
      }
      // 저장이 끝나기 전에는 결과를 내보내지 않는다.
      UpdatePost working = std::move(*loaded);
      transition = ApplyReaction(working, *user_id, *requested);
      store_->SaveUpdate(working);
      result = std::move(working);
    } catch (const StoreError& ex) {
      observability_->Log(
          LogContext{"", user_id, std::nullopt, "reaction.persist_failed", 0, LogLevel::kError, ex.what()});
      error = HandlerError{ErrorCode::kPersistenceFailure, "Failed to react to update"};
      return false;
    }
    // 같은 업데이트의 전파 순서가 저장 순서와 같도록 잠금 안에서 보낸다.
    coordinator_->Broadcast("updateReaction", ToUpdateJson(result));
  }

  observability_->IncrementReactionsApplied();
  const auto latency =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started).count();
  observability_->Log(LogContext{"", user_id, std::nullopt, "reaction.applied", static_cast<long>(latency),
                                 LogLevel::kDebug,
                                 "update=" + update_id + " likes=" + std::to_string(result.likes) +
                                     " dislikes=" + std::to_string(result.dislikes) +
                                     " delta=" + std::to_string(transition.likes_delta) + "/" +
                                     std::to_string(transition.dislikes_delta)});
  return true;
}

}  // namespace fanout
