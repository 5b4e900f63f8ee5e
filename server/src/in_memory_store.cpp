/*
 * 설명: 뮤텍스로 보호되는 맵 기반 저장소와 실패 주입을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#include "fanout/in_memory_store.hpp"

#include <set>

namespace fanout {

std::vector<UserRecord> InMemorySocialStore::FindUsersByIdIn(const std::vector<UserId>& ids) {
  std::lock_guard<std::mutex> lock(mutex_);
  MaybeFail("FindUsersByIdIn");
  std::set<UserId> wanted(ids.begin(), ids.end());
  std::vector<UserRecord> found;
  for (const auto& id : wanted) {
    auto it = users_.find(id);
    if (it != users_.end()) {
      found.push_back(it->second);
    }
  }
  return found;
}

void InMemorySocialStore::SetUserOnlineStatus(const UserId& user_id, bool is_online,
                                              std::chrono::system_clock::time_point last_seen) {
  std::lock_guard<std::mutex> lock(mutex_);
  MaybeFail("SetUserOnlineStatus");
  auto it = users_.find(user_id);
  if (it == users_.end()) {
    return;
  }
  it->second.is_online = is_online;
  it->second.last_seen = last_seen;
}

UserSettings InMemorySocialStore::UpsertUserSettings(const UserId& user_id, const SettingsPatch& patch) {
  std::lock_guard<std::mutex> lock(mutex_);
  MaybeFail("UpsertUserSettings");
  auto [it, inserted] = settings_.try_emplace(user_id);
  auto& settings = it->second;
  if (inserted) {
    settings.user_id = user_id;
  }
  if (patch.show_online_status) {
    settings.show_online_status = *patch.show_online_status;
    auto user_it = users_.find(user_id);
    if (user_it != users_.end()) {
      user_it->second.show_online_status = *patch.show_online_status;
    }
  }
  if (patch.show_last_seen) {
    settings.show_last_seen = *patch.show_last_seen;
  }
  settings.preferences.merge_patch(patch.preferences);
  return settings;
}

DirectMessage InMemorySocialStore::CreateMessage(const UserId& sender_id, const UserId& recipient_id,
                                                 const std::string& text) {
  std::lock_guard<std::mutex> lock(mutex_);
  MaybeFail("CreateMessage");
  DirectMessage message{"msg-" + std::to_string(next_message_id_++), sender_id, recipient_id, text,
                        std::chrono::system_clock::now()};
  messages_.push_back(message);
  return message;
}

std::optional<UpdatePost> InMemorySocialStore::LoadUpdateById(const std::string& update_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  MaybeFail("LoadUpdateById");
  auto it = updates_.find(update_id);
  if (it == updates_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void InMemorySocialStore::SaveUpdate(const UpdatePost& update) {
  std::lock_guard<std::mutex> lock(mutex_);
  MaybeFail("SaveUpdate");
  auto it = updates_.find(update.id);
  if (it == updates_.end()) {
    throw StoreError("저장할 업데이트가 없습니다: " + update.id);
  }
  it->second = update;
}

UpdatePost InMemorySocialStore::CreateUpdate(const NewUpdateFields& fields) {
  std::lock_guard<std::mutex> lock(mutex_);
  MaybeFail("CreateUpdate");
  UpdatePost update;
  update.id = "update-" + std::to_string(next_update_id_++);
  update.title = fields.title;
  update.description = fields.description;
  update.organizer_id = fields.organizer_id;
  update.created_at = std::chrono::system_clock::now();
  updates_[update.id] = update;
  return update;
}

void InMemorySocialStore::AddUser(const UserRecord& user) {
  std::lock_guard<std::mutex> lock(mutex_);
  users_[user.profile.id] = user;
}

std::optional<UserRecord> InMemorySocialStore::FindUser(const UserId& user_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = users_.find(user_id);
  if (it == users_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<UserSettings> InMemorySocialStore::FindSettings(const UserId& user_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = settings_.find(user_id);
  if (it == settings_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<DirectMessage> InMemorySocialStore::Messages() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return messages_;
}

void InMemorySocialStore::SetFailureInjector(const std::function<bool(std::string_view)>& injector) {
  std::lock_guard<std::mutex> lock(mutex_);
  failure_injector_ = injector;
}

void InMemorySocialStore::MaybeFail(std::string_view operation) const {
  if (failure_injector_ && failure_injector_(operation)) {
    throw StoreError("주입된 저장소 오류: " + std::string(operation));
  }
}

}  // namespace fanout
