/*
 * 설명: 도메인 타입을 외부 이벤트 페이로드(JSON)로 변환하고 설정 패치를 해석한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/reaction_transition_test.cpp, server/tests/unit/presence_service_test.cpp
 */
#include "fanout/social_types.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace fanout {
namespace {
nlohmann::json OptionalString(const std::optional<std::string>& value) {
  if (!value) {
    return nullptr;
  }
  return *value;
}

nlohmann::json ParticipantJson(const UserId& id, const std::optional<UserProfile>& profile) {
  if (!profile) {
    return {{"_id", id}};
  }
  return {{"_id", profile->id},
          {"username", profile->username},
          {"profilePicture", OptionalString(profile->profile_picture)},
          {"avatar", OptionalString(profile->avatar)}};
}
}  // namespace

std::optional<ReactionType> ParseReactionType(std::string_view value) {
  if (value == "like") {
    return ReactionType::kLike;
  }
  if (value == "dislike") {
    return ReactionType::kDislike;
  }
  return std::nullopt;
}

std::string_view ToString(ReactionType type) { return type == ReactionType::kLike ? "like" : "dislike"; }

bool ParseSettingsPatch(const nlohmann::json& body, SettingsPatch& patch, std::string& error_message) {
  if (!body.is_object()) {
    error_message = "설정 payload는 객체여야 합니다";
    return false;
  }
  for (const auto& [key, value] : body.items()) {
    if (key == "showOnlineStatus" || key == "showLastSeen") {
      if (!value.is_boolean()) {
        error_message = key + "는 boolean이어야 합니다";
        return false;
      }
      if (key == "showOnlineStatus") {
        patch.show_online_status = value.get<bool>();
      } else {
        patch.show_last_seen = value.get<bool>();
      }
      continue;
    }
    // 소유자 식별자는 연결 정보에서만 결정된다.
    if (key == "user" || key == "_id") {
      continue;
    }
    patch.preferences[key] = value;
  }
  return true;
}

std::string FormatIsoTimestamp(std::chrono::system_clock::time_point tp) {
  auto tt = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  gmtime_r(&tt, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%FT%TZ");
  return oss.str();
}

nlohmann::json ToPresenceJson(const UserProfile& profile) {
  return {{"id", profile.id},
          {"username", profile.username},
          {"profilePicture", OptionalString(profile.profile_picture)},
          {"avatar", OptionalString(profile.avatar)},
          {"isVerified", profile.is_verified},
          {"isPremium", profile.is_premium}};
}

nlohmann::json ToMessageJson(const DirectMessage& message, const std::optional<UserProfile>& sender,
                             const std::optional<UserProfile>& recipient) {
  return {{"_id", message.id},
          {"sender", ParticipantJson(message.sender_id, sender)},
          {"recipient", ParticipantJson(message.recipient_id, recipient)},
          {"text", message.text},
          {"createdAt", FormatIsoTimestamp(message.created_at)}};
}

nlohmann::json ToUpdateJson(const UpdatePost& update) {
  nlohmann::json reactions = nlohmann::json::array();
  for (const auto& reaction : update.reactions) {
    reactions.push_back({{"user", reaction.user_id}, {"type", ToString(reaction.type)}});
  }
  return {{"_id", update.id},
          {"title", update.title},
          {"description", update.description},
          {"organizer", update.organizer_id},
          {"likes", update.likes},
          {"dislikes", update.dislikes},
          {"reactions", reactions},
          {"createdAt", FormatIsoTimestamp(update.created_at)}};
}

nlohmann::json ToUpdateJson(const UpdatePost& update, const std::optional<UserProfile>& organizer) {
  auto json = ToUpdateJson(update);
  if (organizer) {
    json["organizer"] = {{"_id", organizer->id},
                         {"username", organizer->username},
                         {"profilePicture", OptionalString(organizer->profile_picture)}};
  } else {
    json["organizer"] = {{"_id", update.organizer_id}};
  }
  return json;
}

}  // namespace fanout
