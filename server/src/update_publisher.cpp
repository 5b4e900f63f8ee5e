/*
 * 설명: 업데이트 생성(저장 → 작성자 조회 → newUpdate 전파)을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/update_publisher_test.cpp
 */
#include "fanout/update_publisher.hpp"

namespace fanout {

UpdatePublisher::UpdatePublisher(std::shared_ptr<SocialStore> store, std::shared_ptr<RealtimeCoordinator> coordinator,
                                 std::shared_ptr<Observability> observability)
    : store_(std::move(store)), coordinator_(std::move(coordinator)), observability_(std::move(observability)) {}

bool UpdatePublisher::CreateUpdate(const std::optional<UserId>& organizer_id, const std::string& title,
                                   const std::string& description, UpdatePost& created, HandlerError& error) {
  if (!organizer_id) {
    error = HandlerError{ErrorCode::kUnauthenticated, "User not authenticated"};
    return false;
  }
  if (title.empty()) {
    error = HandlerError{ErrorCode::kInvalidPayload, "title이 필요합니다"};
    return false;
  }

  try {
    created = store_->CreateUpdate(NewUpdateFields{title, description, *organizer_id});
  } catch (const StoreError& ex) {
    observability_->Log(
        LogContext{"", organizer_id, std::nullopt, "update.persist_failed", 0, LogLevel::kError, ex.what()});
    error = HandlerError{ErrorCode::kPersistenceFailure, "Failed to create update"};
    return false;
  }

  std::optional<UserProfile> organizer;
  try {
    auto users = store_->FindUsersByIdIn({*organizer_id});
    if (!users.empty()) {
      organizer = users.front().profile;
    }
  } catch (const StoreError& ex) {
    observability_->Log(LogContext{"", organizer_id, std::nullopt, "update.enrich_failed", 0, LogLevel::kWarn,
                                   std::string(ToString(ErrorCode::kDeliveryFailed)) + ": " + ex.what()});
  }

  coordinator_->Broadcast("newUpdate", ToUpdateJson(created, organizer));
  observability_->IncrementUpdatesPublished();
  observability_->Log(
      LogContext{"", organizer_id, std::nullopt, "update.published", 0, LogLevel::kInfo, "update=" + created.id});
  return true;
}

}  // namespace fanout
