/*
 * 설명: 사용자/메시지/설정/업데이트 영속 저장소 계약을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/mariadb_store_it_test.cpp, server/tests/unit/presence_broadcaster_test.cpp
 */
#pragma once

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "fanout/social_types.hpp"

namespace fanout {

// 저장소 구현은 모든 실패를 StoreError(또는 파생 타입)로 보고한다.
class StoreError : public std::runtime_error {
 public:
  explicit StoreError(const std::string& message) : std::runtime_error(message) {}
};

class SocialStore {
 public:
  virtual ~SocialStore() = default;

  virtual std::vector<UserRecord> FindUsersByIdIn(const std::vector<UserId>& ids) = 0;
  virtual void SetUserOnlineStatus(const UserId& user_id, bool is_online,
                                   std::chrono::system_clock::time_point last_seen) = 0;
  virtual UserSettings UpsertUserSettings(const UserId& user_id, const SettingsPatch& patch) = 0;
  virtual DirectMessage CreateMessage(const UserId& sender_id, const UserId& recipient_id, const std::string& text) = 0;
  virtual std::optional<UpdatePost> LoadUpdateById(const std::string& update_id) = 0;
  virtual void SaveUpdate(const UpdatePost& update) = 0;
  virtual UpdatePost CreateUpdate(const NewUpdateFields& fields) = 0;
};

}  // namespace fanout
