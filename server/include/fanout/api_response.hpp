/*
 * 설명: REST 응답 엔벨로프와 WebSocket 프레임 엔벨로프 생성/해석을 담당한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace fanout {

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data);
nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message);

struct WsEnvelope {
  std::string type;
  std::string event;
  std::uint64_t seq;
  nlohmann::json payload;
};

nlohmann::json ToWsJson(const WsEnvelope& env);

// 수신 프레임을 해석한다. 실패 시 error_message에 사유를 남기고 false를 반환한다.
bool ParseInboundFrame(const std::string& text, WsEnvelope& env, std::string& error_message);

}  // namespace fanout
