/*
 * 설명: MariaDB 기반 SocialStore 구현. 스키마는 server/db/schema.sql을 따른다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/mariadb_store_it_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <mariadb/mysql.h>

#include "fanout/db_client.hpp"
#include "fanout/social_store.hpp"

namespace fanout {

class MariaDbSocialStore : public SocialStore {
 public:
  explicit MariaDbSocialStore(std::shared_ptr<MariaDbClient> db_client);

  std::vector<UserRecord> FindUsersByIdIn(const std::vector<UserId>& ids) override;
  void SetUserOnlineStatus(const UserId& user_id, bool is_online,
                           std::chrono::system_clock::time_point last_seen) override;
  UserSettings UpsertUserSettings(const UserId& user_id, const SettingsPatch& patch) override;
  DirectMessage CreateMessage(const UserId& sender_id, const UserId& recipient_id, const std::string& text) override;
  std::optional<UpdatePost> LoadUpdateById(const std::string& update_id) override;
  void SaveUpdate(const UpdatePost& update) override;
  UpdatePost CreateUpdate(const NewUpdateFields& fields) override;

  // 테스트 전용: 사용자 행을 직접 기록하고 전체 테이블을 비운다.
  void UpsertUser(const UserRecord& user);
  void ClearAll();

 private:
  UserRecord BuildUser(const DbRow& row) const;
  std::optional<UpdatePost> LoadUpdateInTx(MYSQL* conn, std::uint64_t id);
  std::string ToTimestamp(std::chrono::system_clock::time_point tp) const;

  std::shared_ptr<MariaDbClient> db_client_;
};

}  // namespace fanout
