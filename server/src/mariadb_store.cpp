/*
 * 설명: 사용자/설정/메시지/업데이트/반응을 MariaDB에 저장하고 조회한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/mariadb_store_it_test.cpp
 */
#include "fanout/mariadb_store.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace fanout {
namespace {
constexpr const char* kUserColumns =
    "id, username, profile_picture, avatar, is_verified, is_premium, show_online_status, is_online, last_seen";

std::string ValueOr(const std::optional<std::string>& value, const std::string& fallback) {
  return value ? *value : fallback;
}

bool ToBool(const std::optional<std::string>& value) { return value && *value != "0"; }

int ToInt(const std::optional<std::string>& value) { return value ? std::stoi(*value) : 0; }

std::optional<std::uint64_t> ParseNumericId(const std::string& value) {
  if (value.empty()) {
    return std::nullopt;
  }
  for (char c : value) {
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
  }
  try {
    return std::stoull(value);
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
}

std::chrono::system_clock::time_point ParseTimestamp(const std::optional<std::string>& text) {
  if (!text) {
    return {};
  }
  std::tm tm{};
  std::istringstream iss(*text);
  iss >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
  if (iss.fail()) {
    return {};
  }
  auto tp = std::chrono::system_clock::from_time_t(timegm(&tm));
  auto dot = text->find('.');
  if (dot != std::string::npos) {
    std::string fraction = text->substr(dot + 1, 6);
    fraction.append(6 - fraction.size(), '0');
    tp += std::chrono::microseconds(std::stol(fraction));
  }
  return tp;
}

std::string SqlBool(bool value) { return value ? "1" : "0"; }
}  // namespace

MariaDbSocialStore::MariaDbSocialStore(std::shared_ptr<MariaDbClient> db_client)
    : db_client_(std::move(db_client)) {}

std::vector<UserRecord> MariaDbSocialStore::FindUsersByIdIn(const std::vector<UserId>& ids) {
  std::vector<UserRecord> users;
  if (ids.empty()) {
    return users;
  }
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "SELECT " << kUserColumns << " FROM users WHERE id IN (";
    for (std::size_t i = 0; i < ids.size(); ++i) {
      if (i > 0) {
        oss << ", ";
      }
      oss << db_client_->Quote(conn, ids[i]);
    }
    oss << ") ORDER BY id;";
    users.clear();
    for (const auto& row : db_client_->Select(conn, oss.str(), "사용자 조회 실패")) {
      users.push_back(BuildUser(row));
    }
  });
  return users;
}

void MariaDbSocialStore::SetUserOnlineStatus(const UserId& user_id, bool is_online,
                                             std::chrono::system_clock::time_point last_seen) {
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "UPDATE users SET is_online=" << SqlBool(is_online) << ", last_seen='" << ToTimestamp(last_seen)
        << "' WHERE id=" << db_client_->Quote(conn, user_id) << ";";
    db_client_->Execute(conn, oss.str(), "접속 상태 갱신 실패");
  });
}

UserSettings MariaDbSocialStore::UpsertUserSettings(const UserId& user_id, const SettingsPatch& patch) {
  UserSettings settings;
  db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
    const std::string quoted_user = db_client_->Quote(conn, user_id);
    const std::string quoted_prefs = db_client_->Quote(conn, patch.preferences.dump());
    const std::string now = ToTimestamp(std::chrono::system_clock::now());
    std::ostringstream upsert;
    upsert << "INSERT INTO user_settings(user_id, show_online_status, show_last_seen, preferences, updated_at) VALUES ("
           << quoted_user << ", " << SqlBool(patch.show_online_status.value_or(true)) << ", "
           << SqlBool(patch.show_last_seen.value_or(true)) << ", " << quoted_prefs << ", '" << now
           << "') ON DUPLICATE KEY UPDATE ";
    if (patch.show_online_status) {
      upsert << "show_online_status=VALUES(show_online_status), ";
    }
    if (patch.show_last_seen) {
      upsert << "show_last_seen=VALUES(show_last_seen), ";
    }
    upsert << "preferences=JSON_MERGE_PATCH(preferences, VALUES(preferences)), updated_at=VALUES(updated_at);";
    db_client_->Execute(conn, upsert.str(), "설정 저장 실패");

    // 접속 목록 조회는 users 행의 공개 여부를 읽으므로 같은 트랜잭션에서 함께 반영한다.
    if (patch.show_online_status) {
      std::ostringstream mirror;
      mirror << "UPDATE users SET show_online_status=" << SqlBool(*patch.show_online_status)
             << " WHERE id=" << quoted_user << ";";
      db_client_->Execute(conn, mirror.str(), "공개 설정 반영 실패");
    }

    std::ostringstream select;
    select << "SELECT user_id, show_online_status, show_last_seen, preferences FROM user_settings WHERE user_id="
           << quoted_user << ";";
    auto rows = db_client_->Select(conn, select.str(), "설정 조회 실패");
    if (rows.empty()) {
      throw DbException("설정 저장 후 행이 없습니다", 0, false);
    }
    const auto& row = rows.front();
    settings.user_id = ValueOr(row[0], user_id);
    settings.show_online_status = ToBool(row[1]);
    settings.show_last_seen = ToBool(row[2]);
    settings.preferences = nlohmann::json::parse(ValueOr(row[3], "{}"), nullptr, false);
    if (settings.preferences.is_discarded() || !settings.preferences.is_object()) {
      settings.preferences = nlohmann::json::object();
    }
    return true;
  });
  return settings;
}

DirectMessage MariaDbSocialStore::CreateMessage(const UserId& sender_id, const UserId& recipient_id,
                                                const std::string& text) {
  DirectMessage message{"", sender_id, recipient_id, text, std::chrono::system_clock::now()};
  db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "INSERT INTO messages(sender_id, recipient_id, text, created_at) VALUES ("
        << db_client_->Quote(conn, sender_id) << ", " << db_client_->Quote(conn, recipient_id) << ", "
        << db_client_->Quote(conn, text) << ", '" << ToTimestamp(message.created_at) << "');";
    db_client_->Execute(conn, oss.str(), "메시지 저장 실패");
    message.id = std::to_string(db_client_->LastInsertId(conn));
    return true;
  });
  return message;
}

std::optional<UpdatePost> MariaDbSocialStore::LoadUpdateById(const std::string& update_id) {
  auto numeric_id = ParseNumericId(update_id);
  if (!numeric_id) {
    return std::nullopt;
  }
  std::optional<UpdatePost> update;
  db_client_->WithConnectionRetry([&](MYSQL* conn) { update = LoadUpdateInTx(conn, *numeric_id); });
  return update;
}

void MariaDbSocialStore::SaveUpdate(const UpdatePost& update) {
  auto numeric_id = ParseNumericId(update.id);
  if (!numeric_id) {
    throw StoreError("업데이트 식별자가 올바르지 않습니다: " + update.id);
  }
  db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
    std::ostringstream lock;
    lock << "SELECT id FROM updates WHERE id=" << *numeric_id << " FOR UPDATE;";
    if (db_client_->Select(conn, lock.str(), "업데이트 잠금 실패").empty()) {
      throw DbException("저장할 업데이트가 없습니다: " + update.id, 0, false);
    }

    std::ostringstream counts;
    counts << "UPDATE updates SET likes=" << update.likes << ", dislikes=" << update.dislikes
           << " WHERE id=" << *numeric_id << ";";
    db_client_->Execute(conn, counts.str(), "반응 집계 저장 실패");

    std::ostringstream clear;
    clear << "DELETE FROM update_reactions WHERE update_id=" << *numeric_id << ";";
    db_client_->Execute(conn, clear.str(), "반응 목록 초기화 실패");

    if (!update.reactions.empty()) {
      std::ostringstream insert;
      insert << "INSERT INTO update_reactions(update_id, user_id, type, position) VALUES ";
      for (std::size_t i = 0; i < update.reactions.size(); ++i) {
        const auto& reaction = update.reactions[i];
        if (i > 0) {
          insert << ", ";
        }
        insert << "(" << *numeric_id << ", " << db_client_->Quote(conn, reaction.user_id) << ", '"
               << ToString(reaction.type) << "', " << i << ")";
      }
      insert << ";";
      db_client_->Execute(conn, insert.str(), "반응 목록 저장 실패");
    }
    return true;
  });
}

UpdatePost MariaDbSocialStore::CreateUpdate(const NewUpdateFields& fields) {
  UpdatePost update;
  update.title = fields.title;
  update.description = fields.description;
  update.organizer_id = fields.organizer_id;
  update.created_at = std::chrono::system_clock::now();
  db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "INSERT INTO updates(title, description, organizer_id, likes, dislikes, created_at) VALUES ("
        << db_client_->Quote(conn, fields.title) << ", " << db_client_->Quote(conn, fields.description) << ", "
        << db_client_->Quote(conn, fields.organizer_id) << ", 0, 0, '" << ToTimestamp(update.created_at) << "');";
    db_client_->Execute(conn, oss.str(), "업데이트 생성 실패");
    update.id = std::to_string(db_client_->LastInsertId(conn));
    return true;
  });
  return update;
}

void MariaDbSocialStore::UpsertUser(const UserRecord& user) {
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    auto optional_text = [&](const std::optional<std::string>& value) {
      return value ? db_client_->Quote(conn, *value) : std::string("NULL");
    };
    std::ostringstream oss;
    oss << "INSERT INTO users(" << kUserColumns << ") VALUES (" << db_client_->Quote(conn, user.profile.id) << ", "
        << db_client_->Quote(conn, user.profile.username) << ", " << optional_text(user.profile.profile_picture)
        << ", " << optional_text(user.profile.avatar) << ", " << SqlBool(user.profile.is_verified) << ", "
        << SqlBool(user.profile.is_premium) << ", " << SqlBool(user.show_online_status) << ", "
        << SqlBool(user.is_online) << ", NULL) ON DUPLICATE KEY UPDATE username=VALUES(username), "
        << "profile_picture=VALUES(profile_picture), avatar=VALUES(avatar), is_verified=VALUES(is_verified), "
        << "is_premium=VALUES(is_premium), show_online_status=VALUES(show_online_status);";
    db_client_->Execute(conn, oss.str(), "사용자 저장 실패");
  });
}

void MariaDbSocialStore::ClearAll() {
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    db_client_->Execute(conn, "DELETE FROM update_reactions;", "반응 삭제 실패");
    db_client_->Execute(conn, "DELETE FROM updates;", "업데이트 삭제 실패");
    db_client_->Execute(conn, "DELETE FROM messages;", "메시지 삭제 실패");
    db_client_->Execute(conn, "DELETE FROM user_settings;", "설정 삭제 실패");
    db_client_->Execute(conn, "DELETE FROM users;", "사용자 삭제 실패");
  });
}

UserRecord MariaDbSocialStore::BuildUser(const DbRow& row) const {
  UserRecord user;
  user.profile.id = ValueOr(row[0], "");
  user.profile.username = ValueOr(row[1], "");
  user.profile.profile_picture = row[2];
  user.profile.avatar = row[3];
  user.profile.is_verified = ToBool(row[4]);
  user.profile.is_premium = ToBool(row[5]);
  user.show_online_status = ToBool(row[6]);
  user.is_online = ToBool(row[7]);
  user.last_seen = ParseTimestamp(row[8]);
  return user;
}

std::optional<UpdatePost> MariaDbSocialStore::LoadUpdateInTx(MYSQL* conn, std::uint64_t id) {
  std::ostringstream select;
  select << "SELECT id, title, description, organizer_id, likes, dislikes, created_at FROM updates WHERE id=" << id
         << ";";
  auto rows = db_client_->Select(conn, select.str(), "업데이트 조회 실패");
  if (rows.empty()) {
    return std::nullopt;
  }
  const auto& row = rows.front();
  UpdatePost update;
  update.id = ValueOr(row[0], "");
  update.title = ValueOr(row[1], "");
  update.description = ValueOr(row[2], "");
  update.organizer_id = ValueOr(row[3], "");
  update.likes = ToInt(row[4]);
  update.dislikes = ToInt(row[5]);
  update.created_at = ParseTimestamp(row[6]);

  std::ostringstream reactions;
  reactions << "SELECT user_id, type FROM update_reactions WHERE update_id=" << id << " ORDER BY position;";
  for (const auto& reaction_row : db_client_->Select(conn, reactions.str(), "반응 조회 실패")) {
    auto type = ParseReactionType(ValueOr(reaction_row[1], ""));
    if (!type) {
      continue;
    }
    update.reactions.push_back(Reaction{ValueOr(reaction_row[0], ""), *type});
  }
  return update;
}

std::string MariaDbSocialStore::ToTimestamp(std::chrono::system_clock::time_point tp) const {
  auto micros = std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()).count() % 1000000;
  if (micros < 0) {
    micros += 1000000;
  }
  auto tt = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  gmtime_r(&tt, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.' << std::setw(6) << std::setfill('0') << micros;
  return oss.str();
}

}  // namespace fanout
