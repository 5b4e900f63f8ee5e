/*
 * 설명: JSON 응답 엔벨로프를 생성하고 WebSocket 프레임을 직렬화/해석한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#include "fanout/api_response.hpp"

#include <chrono>

#include "fanout/social_types.hpp"

namespace fanout {

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data) {
  nlohmann::json envelope;
  envelope["success"] = true;
  envelope["data"] = data;
  envelope["error"] = nullptr;
  envelope["meta"] = {{"timestamp", FormatIsoTimestamp(std::chrono::system_clock::now())}};
  return envelope;
}

nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message) {
  nlohmann::json envelope;
  envelope["success"] = false;
  envelope["data"] = nullptr;
  envelope["error"] = {{"code", code}, {"message", message}, {"detail", nullptr}};
  envelope["meta"] = {{"timestamp", FormatIsoTimestamp(std::chrono::system_clock::now())}};
  return envelope;
}

nlohmann::json ToWsJson(const WsEnvelope& env) {
  nlohmann::json j;
  j["t"] = env.type;
  j["seq"] = env.seq;
  if (env.type == "event") {
    j["event"] = env.event;
  } else {
    j["event"] = nullptr;
  }
  j["p"] = env.payload;
  return j;
}

bool ParseInboundFrame(const std::string& text, WsEnvelope& env, std::string& error_message) {
  auto message = nlohmann::json::parse(text, nullptr, false);
  if (message.is_discarded() || !message.is_object()) {
    error_message = "JSON 파싱 오류";
    return false;
  }
  env.seq = 0;
  auto seq_it = message.find("seq");
  if (seq_it != message.end() && seq_it->is_number_unsigned()) {
    env.seq = seq_it->get<std::uint64_t>();
  }
  auto type_it = message.find("t");
  if (type_it == message.end() || !type_it->is_string()) {
    error_message = "잘못된 메시지 형식";
    return false;
  }
  env.type = type_it->get<std::string>();
  if (env.type != "event") {
    error_message = "알 수 없는 메시지 유형";
    return false;
  }
  auto event_it = message.find("event");
  if (event_it == message.end() || !event_it->is_string()) {
    error_message = "event 필드가 필요합니다";
    return false;
  }
  env.event = event_it->get<std::string>();
  auto payload_it = message.find("p");
  env.payload = payload_it == message.end() ? nlohmann::json() : *payload_it;
  return true;
}

}  // namespace fanout
