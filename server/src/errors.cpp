/*
 * 설명: 오류 코드와 사용자 메시지 매핑을 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#include "broker/errors.hpp"

namespace broker {

std::string_view ErrorCode(BrokerError error) {
  switch (error) {
    case BrokerError::kMalformedToken:
      return "malformed_token";
    case BrokerError::kInvalidToken:
      return "invalid_token";
    case BrokerError::kInvalidUsername:
      return "invalid_username";
    case BrokerError::kMissingToken:
      return "missing_token";
    case BrokerError::kConflictingToken:
      return "conflicting_token";
    case BrokerError::kNoActiveSession:
      return "no_active_session";
    case BrokerError::kDeliveryFailed:
      return "delivery_failed";
  }
  return "unknown";
}

std::string_view ErrorMessage(BrokerError error) {
  switch (error) {
    case BrokerError::kMalformedToken:
      return "토큰 형식이 올바르지 않습니다";
    case BrokerError::kInvalidToken:
      return "유효하지 않거나 만료된 토큰입니다";
    case BrokerError::kInvalidUsername:
      return "username은 비어 있거나 ':'를 포함할 수 없습니다";
    case BrokerError::kMissingToken:
      return "토큰이 필요합니다";
    case BrokerError::kConflictingToken:
      return "쿼리 토큰과 Authorization 토큰이 서로 다릅니다";
    case BrokerError::kNoActiveSession:
      return "No active MCP connection for user";
    case BrokerError::kDeliveryFailed:
      return "스트림이 이미 닫혀 전달하지 못했습니다. 잠시 후 다시 시도하세요";
  }
  return "알 수 없는 오류";
}

}  // namespace broker
