/*
 * 설명: 핸들러 실패 분류와 대상 연결로 전달할 오류 정보를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/event_router_test.cpp
 */
#pragma once

#include <string>
#include <string_view>

namespace fanout {

enum class ErrorCode {
  kUnauthenticated,
  kNotFound,
  kPersistenceFailure,
  kDeliveryFailed,
  kInvalidPayload,
};

std::string_view ToString(ErrorCode code);

struct HandlerError {
  ErrorCode code{ErrorCode::kPersistenceFailure};
  std::string message;
};

}  // namespace fanout
