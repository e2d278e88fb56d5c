/*
 * 설명: user:<username>:<suffix> 형식의 불투명 토큰을 인코딩/디코딩한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/token_codec_test.cpp
 */
#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "broker/errors.hpp"

namespace broker {

inline constexpr std::string_view kTokenScheme = "user";

struct Token {
  std::string scheme;
  std::string username;
  std::string suffix;
};

bool IsValidUsername(std::string_view username);

// 실패 시 TokenFormatError(kInvalidUsername / kMalformedToken)를 던진다.
std::string EncodeToken(std::string_view username, std::string_view suffix);
Token DecodeToken(std::string_view token);

// 검증 경로용. 형식이 어긋나면 std::nullopt.
std::optional<Token> TryDecodeToken(std::string_view token);

}  // namespace broker
