/*
 * 설명: 사용자/메시지/업데이트/반응 도메인 타입과 외부 이벤트 페이로드 변환을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/reaction_transition_test.cpp, server/tests/unit/message_relay_test.cpp
 */
#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace fanout {

using UserId = std::string;

struct UserProfile {
  UserId id;
  std::string username;
  std::optional<std::string> profile_picture;
  std::optional<std::string> avatar;
  bool is_verified{false};
  bool is_premium{false};
};

struct UserRecord {
  UserProfile profile;
  bool show_online_status{true};
  bool is_online{false};
  std::chrono::system_clock::time_point last_seen{};
};

struct DirectMessage {
  std::string id;
  UserId sender_id;
  UserId recipient_id;
  std::string text;
  std::chrono::system_clock::time_point created_at{};
};

enum class ReactionType { kLike, kDislike };

std::optional<ReactionType> ParseReactionType(std::string_view value);
std::string_view ToString(ReactionType type);

struct Reaction {
  UserId user_id;
  ReactionType type{ReactionType::kLike};
};

struct UpdatePost {
  std::string id;
  std::string title;
  std::string description;
  UserId organizer_id;
  int likes{0};
  int dislikes{0};
  std::vector<Reaction> reactions;
  std::chrono::system_clock::time_point created_at{};
};

struct NewUpdateFields {
  std::string title;
  std::string description;
  UserId organizer_id;
};

// 알려진 키는 타입이 지정된 필드로, 나머지는 preferences 객체로 병합된다.
struct SettingsPatch {
  std::optional<bool> show_online_status;
  std::optional<bool> show_last_seen;
  nlohmann::json preferences = nlohmann::json::object();
};

struct UserSettings {
  UserId user_id;
  bool show_online_status{true};
  bool show_last_seen{true};
  nlohmann::json preferences = nlohmann::json::object();
};

bool ParseSettingsPatch(const nlohmann::json& body, SettingsPatch& patch, std::string& error_message);

std::string FormatIsoTimestamp(std::chrono::system_clock::time_point tp);

nlohmann::json ToPresenceJson(const UserProfile& profile);
nlohmann::json ToMessageJson(const DirectMessage& message, const std::optional<UserProfile>& sender,
                             const std::optional<UserProfile>& recipient);
nlohmann::json ToUpdateJson(const UpdatePost& update);
nlohmann::json ToUpdateJson(const UpdatePost& update, const std::optional<UserProfile>& organizer);

}  // namespace fanout
