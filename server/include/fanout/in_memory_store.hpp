/*
 * 설명: 개발 환경과 테스트에서 사용하는 프로세스 내 저장소 구현.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/reaction_aggregator_test.cpp, server/tests/e2e/presence_flow_test.cpp
 */
#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "fanout/social_store.hpp"

namespace fanout {

class InMemorySocialStore : public SocialStore {
 public:
  std::vector<UserRecord> FindUsersByIdIn(const std::vector<UserId>& ids) override;
  void SetUserOnlineStatus(const UserId& user_id, bool is_online,
                           std::chrono::system_clock::time_point last_seen) override;
  UserSettings UpsertUserSettings(const UserId& user_id, const SettingsPatch& patch) override;
  DirectMessage CreateMessage(const UserId& sender_id, const UserId& recipient_id, const std::string& text) override;
  std::optional<UpdatePost> LoadUpdateById(const std::string& update_id) override;
  void SaveUpdate(const UpdatePost& update) override;
  UpdatePost CreateUpdate(const NewUpdateFields& fields) override;

  void AddUser(const UserRecord& user);
  std::optional<UserRecord> FindUser(const UserId& user_id) const;
  std::optional<UserSettings> FindSettings(const UserId& user_id) const;
  std::vector<DirectMessage> Messages() const;

  // 연산 이름을 받아 true를 반환하면 해당 호출이 StoreError로 실패한다.
  void SetFailureInjector(const std::function<bool(std::string_view)>& injector);

 private:
  void MaybeFail(std::string_view operation) const;

  mutable std::mutex mutex_;
  std::map<UserId, UserRecord> users_;
  std::map<UserId, UserSettings> settings_;
  std::vector<DirectMessage> messages_;
  std::map<std::string, UpdatePost> updates_;
  std::size_t next_message_id_{1};
  std::size_t next_update_id_{1};
  std::function<bool(std::string_view)> failure_injector_;
};

}  // namespace fanout
