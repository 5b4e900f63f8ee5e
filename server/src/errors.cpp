/*
 * 설명: 오류 코드의 안정적인 문자열 이름을 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#include "fanout/errors.hpp"

namespace fanout {

std::string_view ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::kUnauthenticated:
      return "unauthenticated";
    case ErrorCode::kNotFound:
      return "not_found";
    case ErrorCode::kPersistenceFailure:
      return "persistence_failure";
    case ErrorCode::kDeliveryFailed:
      return "delivery_failed";
    case ErrorCode::kInvalidPayload:
      return "invalid_payload";
  }
  return "unknown";
}

}  // namespace fanout
