/*
 * 설명: 브로커 전역 오류 분류와 와이어 코드 변환을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/token_codec_test.cpp, server/tests/unit/message_router_test.cpp
 */
#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace broker {

enum class BrokerError {
  kMalformedToken,
  kInvalidToken,
  kInvalidUsername,
  kMissingToken,
  kConflictingToken,
  kNoActiveSession,
  kDeliveryFailed,
};

// 응답 본문/로그에 쓰이는 snake_case 코드.
std::string_view ErrorCode(BrokerError error);
std::string_view ErrorMessage(BrokerError error);

class TokenFormatError : public std::runtime_error {
 public:
  TokenFormatError(BrokerError code, const std::string& message) : std::runtime_error(message), code(code) {}
  BrokerError code;
};

}  // namespace broker
