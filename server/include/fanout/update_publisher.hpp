/*
 * 설명: 새 업데이트 게시물을 저장하고 작성자 프로필을 붙여 모든 연결에 전파한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/update_publisher_test.cpp
 */
#pragma once

#include <memory>
#include <optional>
#include <string>

#include "fanout/errors.hpp"
#include "fanout/observability.hpp"
#include "fanout/realtime.hpp"
#include "fanout/social_store.hpp"

namespace fanout {

class UpdatePublisher {
 public:
  UpdatePublisher(std::shared_ptr<SocialStore> store, std::shared_ptr<RealtimeCoordinator> coordinator,
                  std::shared_ptr<Observability> observability);

  bool CreateUpdate(const std::optional<UserId>& organizer_id, const std::string& title,
                    const std::string& description, UpdatePost& created, HandlerError& error);

 private:
  std::shared_ptr<SocialStore> store_;
  std::shared_ptr<RealtimeCoordinator> coordinator_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace fanout
